#pragma once

#include "analysis/analysis_client.hpp"
#include "analysis/http_transport.hpp"
#include "platform/audio_engine.hpp"
#include "platform/executor.hpp"
#include "platform/permissions.hpp"
#include "recognition/recognizer.hpp"
#include "storage/expense_storage.hpp"

#include <chrono>
#include <deque>
#include <format>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <nlohmann/json.hpp>
#include <stdexcept>
#include <string>
#include <variant>
#include <vector>

namespace fakes {

// Executor driven by the test: posted tasks run on run_pending(), timers fire
// when advance() moves the virtual clock past them.
class ManualExecutor : public Executor {
public:
    void post(Task task) override {
        std::lock_guard lock(mutex_);
        tasks_.push_back(std::move(task));
    }

    TimerId post_after(std::chrono::milliseconds delay, Task task) override {
        std::lock_guard lock(mutex_);
        TimerId id = next_timer_++;
        timers_.emplace(id, std::pair{now_ + delay, std::move(task)});
        return id;
    }

    void cancel(TimerId id) override {
        std::lock_guard lock(mutex_);
        timers_.erase(id);
    }

    // Runs posted tasks, including ones posted while running. Returns the count.
    size_t run_pending() {
        size_t ran = 0;
        for (;;) {
            Task task;
            {
                std::lock_guard lock(mutex_);
                if (tasks_.empty()) return ran;
                task = std::move(tasks_.front());
                tasks_.pop_front();
            }
            task();
            ++ran;
        }
    }

    // Moves the clock forward, firing due timers in deadline order.
    void advance(std::chrono::milliseconds by) {
        auto target = now_ + by;
        run_pending();
        for (;;) {
            Task task;
            {
                std::lock_guard lock(mutex_);
                auto next = timers_.end();
                for (auto it = timers_.begin(); it != timers_.end(); ++it) {
                    if (it->second.first > target) continue;
                    if (next == timers_.end() || it->second.first < next->second.first) next = it;
                }
                if (next == timers_.end()) break;
                now_ = next->second.first;
                task = std::move(next->second.second);
                timers_.erase(next);
            }
            task();
            run_pending();
        }
        now_ = target;
    }

    size_t pending_tasks() {
        std::lock_guard lock(mutex_);
        return tasks_.size();
    }

    size_t pending_timers() {
        std::lock_guard lock(mutex_);
        return timers_.size();
    }

private:
    std::mutex mutex_;
    std::deque<Task> tasks_;
    std::map<TimerId, std::pair<std::chrono::milliseconds, Task>> timers_;
    std::chrono::milliseconds now_{0};
    TimerId next_timer_ = 1;
};

class FakeAudioEngine : public AudioEngine {
public:
    std::expected<void, std::string> activate_session(const AudioSessionOptions& opts) override {
        ++activations;
        last_options = opts;
        if (fail_activate) return std::unexpected(std::string("session refused"));
        session_active = true;
        return {};
    }

    void deactivate_session() override {
        ++deactivations;
        session_active = false;
    }

    void install_tap(TapCallback tap) override {
        ++taps_installed;
        tap_ = std::move(tap);
    }

    void remove_tap() override {
        ++taps_removed;
        tap_ = nullptr;
    }

    std::expected<void, std::string> start() override {
        ++starts;
        if (fail_start) return std::unexpected(std::string("device busy"));
        running = true;
        return {};
    }

    void stop() override {
        ++stops;
        running = false;
    }

    uint32_t sample_rate() const override { return 16000; }

    // Simulates one audio callback.
    void push(std::span<const int16_t> samples) {
        if (tap_) tap_(samples);
    }

    int live_taps() const { return tap_ ? 1 : 0; }

    bool fail_activate = false;
    bool fail_start = false;
    bool session_active = false;
    bool running = false;
    int activations = 0;
    int deactivations = 0;
    int taps_installed = 0;
    int taps_removed = 0;
    int starts = 0;
    int stops = 0;
    AudioSessionOptions last_options;

private:
    TapCallback tap_;
};

class FakeRequest : public RecognitionRequest {
public:
    explicit FakeRequest(bool partial) : partial_(partial) {}

    void append(std::span<const int16_t> s) override { samples.insert(samples.end(), s.begin(), s.end()); }
    void end_audio() override { ended = true; }
    bool partial_results() const override { return partial_; }

    std::vector<int16_t> samples;
    bool ended = false;

private:
    bool partial_;
};

// Shared between the recognizer (which the test drives) and the task object the
// capture session owns and may destroy.
struct TaskState {
    SpeechRecognizer::ResultHandler handler;
    bool terminal = false;
    bool cancelled = false;

    void emit(SpeechRecognizer::Event event) {
        if (terminal) return;
        bool final_event = std::holds_alternative<RecognitionError>(event) ||
                           std::get<Transcript>(event).is_final;
        if (final_event) terminal = true;
        handler(std::move(event));
    }
};

class FakeTask : public RecognitionTask {
public:
    explicit FakeTask(std::shared_ptr<TaskState> state) : state_(std::move(state)) {}

    void cancel() override {
        state_->cancelled = true;
        state_->emit(RecognitionError{std::string(recognition_error::kRequestDomain),
                                      recognition_error::kRequestCanceled, "canceled"});
    }

private:
    std::shared_ptr<TaskState> state_;
};

class FakeRecognizer : public SpeechRecognizer {
public:
    bool is_available() const override {
        ++availability_checks;
        return available;
    }

    std::shared_ptr<RecognitionRequest> make_request(bool partial_results) override {
        if (fail_request) return nullptr;
        requests.push_back(std::make_shared<FakeRequest>(partial_results));
        return requests.back();
    }

    std::unique_ptr<RecognitionTask> start_task(std::shared_ptr<RecognitionRequest> /*request*/,
                                                ResultHandler handler) override {
        auto state = std::make_shared<TaskState>();
        state->handler = std::move(handler);
        tasks.push_back(state);
        return std::make_unique<FakeTask>(state);
    }

    void send_partial(const std::string& text) { tasks.back()->emit(Transcript{text, false}); }
    void send_final(const std::string& text) { tasks.back()->emit(Transcript{text, true}); }
    void send_error(std::string_view domain, int code, const std::string& message = "failed") {
        tasks.back()->emit(RecognitionError{std::string(domain), code, message});
    }

    FakeRequest& last_request() { return *requests.back(); }

    bool available = true;
    mutable int availability_checks = 0;
    bool fail_request = false;
    std::vector<std::shared_ptr<FakeRequest>> requests;
    std::vector<std::shared_ptr<TaskState>> tasks;
};

class FakePermissions : public PermissionProvider {
public:
    bool microphone_granted() const override { return microphone; }
    bool speech_granted() const override { return speech; }

    bool microphone = true;
    bool speech = true;
};

// Answers each post() with the next scripted outcome.
class ScriptedTransport : public HttpTransport {
public:
    std::expected<HttpResponse, std::string> post(const HttpRequest& request) override {
        requests.push_back(request);
        if (script.empty()) return std::unexpected(std::string("no scripted response"));
        auto next = std::move(script.front());
        script.pop_front();
        return next;
    }

    void respond(long status, std::string body) {
        script.push_back(HttpResponse{status, std::move(body)});
    }
    void respond_completion(const std::string& content) { respond(200, completion(content)); }
    void fail(std::string message) { script.push_back(std::unexpected(std::move(message))); }

    // Chat-completion envelope carrying the given message content.
    static std::string completion(const std::string& content) {
        nlohmann::json body = {
            {"id", "cmpl-1"},
            {"object", "chat.completion"},
            {"choices", {{
                {"index", 0},
                {"message", {{"role", "assistant"}, {"content", content}}},
                {"finish_reason", "stop"},
            }}},
        };
        return body.dump();
    }

    std::deque<std::expected<HttpResponse, std::string>> script;
    std::vector<HttpRequest> requests;
};

class InMemoryStorage : public ExpenseStorage {
public:
    std::expected<int64_t, std::string> save(const ExpenseCandidate& expense) override {
        ++save_calls;
        if (fail_on_title == expense.title() || (fail_after && saved_count >= *fail_after)) {
            return std::unexpected(std::string("disk full"));
        }
        ++saved_count;
        int64_t id = next_id_++;
        auto now = Clock::now();
        records_.emplace(id, ExpenseRecord{id, expense, now, now, true});
        return id;
    }

    std::expected<void, std::string> update(int64_t id, const ExpenseCandidate& expense) override {
        auto it = records_.find(id);
        if (it == records_.end()) return std::unexpected(std::format("no expense with id {}", id));
        it->second.expense = expense;
        it->second.updated_at = Clock::now();
        return {};
    }

    std::expected<void, std::string> remove(int64_t id) override {
        if (records_.erase(id) == 0) return std::unexpected(std::format("no expense with id {}", id));
        return {};
    }

    std::expected<std::optional<ExpenseRecord>, std::string> find(int64_t id) override {
        auto it = records_.find(id);
        if (it == records_.end()) return std::optional<ExpenseRecord>{};
        return std::optional<ExpenseRecord>{it->second};
    }

    std::expected<std::vector<ExpenseRecord>, std::string> fetch_all(int limit) override {
        std::vector<ExpenseRecord> out;
        for (auto it = records_.rbegin(); it != records_.rend() && static_cast<int>(out.size()) < limit; ++it) {
            out.push_back(it->second);
        }
        return out;
    }

    std::expected<std::vector<ExpenseRecord>, std::string>
    fetch_range(Clock::time_point from, Clock::time_point to,
                std::optional<ExpenseCategory> category) override {
        std::vector<ExpenseRecord> out;
        for (auto it = records_.rbegin(); it != records_.rend(); ++it) {
            const auto& e = it->second.expense;
            if (e.date() < from || e.date() > to) continue;
            if (category && e.category() != *category) continue;
            out.push_back(it->second);
        }
        return out;
    }

    std::expected<std::vector<ExpenseRecord>, std::string> search(const std::string& query) override {
        std::vector<ExpenseRecord> out;
        for (auto it = records_.rbegin(); it != records_.rend(); ++it) {
            const auto& e = it->second.expense;
            if (e.title().find(query) != std::string::npos ||
                e.description().find(query) != std::string::npos ||
                e.original_voice_text().find(query) != std::string::npos) {
                out.push_back(it->second);
            }
        }
        return out;
    }

    size_t size() const { return records_.size(); }
    const ExpenseRecord& at(int64_t id) const { return records_.at(id); }

    std::string fail_on_title;
    std::optional<int> fail_after; // saves allowed before failing
    int save_calls = 0;
    int saved_count = 0;

private:
    std::map<int64_t, ExpenseRecord> records_;
    int64_t next_id_ = 1;
};

// Analyzer whose answer is set by the test. Reports the standard progress labels.
class FakeAnalyzer : public ExpenseAnalyzer {
public:
    using Responder = std::function<std::expected<AnalysisResult, AnalysisError>(const AnalysisRequest&)>;

    std::expected<AnalysisResult, AnalysisError>
    analyze(const AnalysisRequest& request, const ProgressCallback& progress) override {
        requests.push_back(request);
        if (progress) {
            progress(analysis_progress::kConnecting);
            progress(analysis_progress::kInterpreting);
            progress(analysis_progress::kExtracting);
        }
        if (throw_message) throw std::runtime_error(*throw_message);
        return responder(request);
    }

    Responder responder;
    std::optional<std::string> throw_message;
    std::vector<AnalysisRequest> requests;
};

inline AnalysisResult make_result(const std::string& text, const std::string& amount,
                                  const std::string& title,
                                  ExpenseCategory category = ExpenseCategory::Food,
                                  double confidence = 0.9) {
    AnalysisResult r;
    r.original_text = text;
    r.extracted_amount = Decimal::parse(amount);
    r.category = category;
    r.title = title;
    r.confidence = confidence;
    r.timestamp = Clock::now();
    return r;
}

inline AlternativeInterpretation make_alternative(const std::string& amount, const std::string& title,
                                                  ExpenseCategory category = ExpenseCategory::Food,
                                                  double confidence = 0.85) {
    AlternativeInterpretation alt;
    alt.amount = Decimal::parse(amount);
    alt.category = category;
    alt.title = title;
    alt.confidence = confidence;
    return alt;
}

inline ExpenseCandidate make_candidate(const std::string& amount, const std::string& title,
                                       ExpenseCategory category = ExpenseCategory::Food) {
    auto c = ExpenseCandidate::create({
        .amount = *Decimal::parse(amount),
        .category = category,
        .title = title,
        .description = {},
        .original_voice_text = "test",
        .confidence = 0.9,
        .tags = {},
        .date = Clock::now(),
    });
    if (!c) throw std::runtime_error(c.error().message);
    return std::move(*c);
}

} // namespace fakes
