#pragma once

#include <algorithm>
#include <atomic>
#include <cstddef>
#include <cstdint>
#include <span>
#include <vector>

// Lock-free single-producer single-consumer queue of PCM samples.
// Producer is the audio thread (push). Consumer is the recognizer worker (drain_into).
// When full, push() drops the newest samples and counts them.
class SampleQueue {
public:
    explicit SampleQueue(size_t capacity_samples)
        : buf_(capacity_samples), capacity_(capacity_samples) {}

    // Producer: returns the number of samples queued.
    size_t push(std::span<const int16_t> samples) {
        size_t w = head_.load(std::memory_order_relaxed);
        size_t r = tail_.load(std::memory_order_acquire);

        size_t space = capacity_ - (w - r);
        size_t n = std::min(samples.size(), space);
        if (n < samples.size()) {
            dropped_.fetch_add(samples.size() - n, std::memory_order_relaxed);
        }
        if (n == 0) return 0;

        size_t at = w % capacity_;
        size_t first = std::min(n, capacity_ - at);
        std::copy_n(samples.begin(), first, buf_.begin() + static_cast<ptrdiff_t>(at));
        std::copy_n(samples.begin() + static_cast<ptrdiff_t>(first), n - first, buf_.begin());

        head_.store(w + n, std::memory_order_release);
        return n;
    }

    // Consumer: appends everything queued so far to out. Returns the count moved.
    size_t drain_into(std::vector<int16_t>& out) {
        size_t r = tail_.load(std::memory_order_relaxed);
        size_t w = head_.load(std::memory_order_acquire);

        size_t n = w - r;
        if (n == 0) return 0;

        size_t at = r % capacity_;
        size_t first = std::min(n, capacity_ - at);
        out.insert(out.end(), buf_.begin() + static_cast<ptrdiff_t>(at),
                   buf_.begin() + static_cast<ptrdiff_t>(at + first));
        out.insert(out.end(), buf_.begin(), buf_.begin() + static_cast<ptrdiff_t>(n - first));

        tail_.store(r + n, std::memory_order_release);
        return n;
    }

    size_t size() const {
        return head_.load(std::memory_order_acquire) - tail_.load(std::memory_order_acquire);
    }

    size_t capacity() const { return capacity_; }

    size_t dropped() const { return dropped_.load(std::memory_order_relaxed); }

private:
    std::vector<int16_t> buf_;
    size_t capacity_;
    alignas(64) std::atomic<size_t> head_{0};
    alignas(64) std::atomic<size_t> tail_{0};
    std::atomic<size_t> dropped_{0};
};
