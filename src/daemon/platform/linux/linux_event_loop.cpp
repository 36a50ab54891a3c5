#include "platform/linux/linux_event_loop.hpp"

#include "platform/platform_paths.hpp"

#include <algorithm>
#include <cerrno>
#include <cstring>
#include <print>
#include <signal.h>
#include <sys/epoll.h>
#include <sys/eventfd.h>
#include <sys/signalfd.h>
#include <unistd.h>

namespace {

constexpr std::chrono::seconds kAvailabilityProbeInterval{10};

std::optional<UserPreferences> user_preferences(const Config::Preferences& prefs) {
    UserPreferences out;
    out.default_currency = prefs.default_currency;
    out.common_merchants = prefs.common_merchants;
    for (const auto& name : prefs.preferred_categories) {
        if (auto c = parse_category(name)) {
            out.preferred_categories.push_back(*c);
        } else {
            std::println(stderr, "config: ignoring unknown category '{}'", name);
        }
    }
    return out;
}

} // namespace

LinuxEventLoop::LinuxEventLoop(Config config, bool verbose)
    : config_(std::move(config)), verbose_(verbose),
      wake_fd_(eventfd(0, EFD_NONBLOCK | EFD_CLOEXEC)),
      engine_(config_.audio.sample_rate),
      permissions_(config_.recognition.allow_transcription),
      backend_(config_.recognition.url, config_.recognition.api_format,
               config_.recognition.language),
      recognizer_(backend_, {
          .sample_rate = config_.audio.sample_rate,
          .max_samples = config_.audio.max_samples(),
          .partial_interval = std::chrono::milliseconds(config_.recognition.partial_interval_ms),
          .verbose = verbose_,
      }),
      analyzer_(transport_, {
          .api_key = config_.analysis.api_key,
          .base_url = config_.analysis.base_url,
          .model = config_.analysis.model,
          .max_tokens = config_.analysis.max_tokens,
          .temperature = config_.analysis.temperature,
          .timeout = std::chrono::seconds(config_.analysis.timeout_seconds),
          .max_attempts = config_.analysis.max_attempts,
          .verbose = verbose_,
      }),
      capture_(engine_, recognizer_, permissions_, *this, {
          .stop_grace = std::chrono::milliseconds(config_.audio.stop_grace_ms),
          .level_smoothing = config_.audio.level_smoothing,
          .audio = {
              .duck_others = config_.audio.duck_others,
              .target_device = config_.audio.target_device,
          },
          .verbose = verbose_,
      }),
      workflow_(capture_, analyzer_, db_, *this, background_, {
          .error_reset = std::chrono::seconds(config_.workflow.error_reset_seconds),
          .auto_save = config_.workflow.auto_save,
          .preferences = user_preferences(config_.preferences),
          .verbose = verbose_,
      }),
      core_(workflow_, capture_, db_, ipc_server_, verbose_) {}

LinuxEventLoop::~LinuxEventLoop() {
    if (epoll_fd_ >= 0) ::close(epoll_fd_);
    if (signal_fd_ >= 0) ::close(signal_fd_);

    // Late posts from the background thread find no wake fd and are dropped.
    std::lock_guard lock(mutex_);
    if (wake_fd_ >= 0) ::close(wake_fd_);
    wake_fd_ = -1;
}

bool LinuxEventLoop::init() {
    if (wake_fd_ < 0) {
        std::println(stderr, "eventfd failed: {}", std::strerror(errno));
        return false;
    }

    for (const auto& warning : config_.api_key_warnings()) {
        std::println(stderr, "config: {}", warning);
    }
    log("Analysis key " + mask_api_key(config_.analysis.api_key) + ", model " +
        config_.analysis.model);

    auto db_path = config_.database_path();
    if (!db_.open(db_path)) return false;
    log("Expense database at " + db_path);

    // Nothing is queued on the loop yet, so checking inline here stalls nobody.
    bool available = recognizer_.is_available();
    if (available) {
        log("Recognition server reachable at " + backend_.endpoint());
    } else {
        std::println(stderr, "recognition: server not reachable at {} (recording will fail until it is)",
                     backend_.endpoint());
    }
    capture_.on_availability_changed(available);

    // IPC socket
    auto ipc_path = platform::ipc_endpoint();
    if (!ipc_server_.start(ipc_path)) return false;
    log("IPC listening on " + ipc_path);

    // epoll setup
    epoll_fd_ = epoll_create1(EPOLL_CLOEXEC);
    if (epoll_fd_ < 0) {
        std::println(stderr, "epoll_create1 failed: {}", std::strerror(errno));
        return false;
    }

    // Signal handling via signalfd
    sigset_t mask;
    sigemptyset(&mask);
    sigaddset(&mask, SIGINT);
    sigaddset(&mask, SIGTERM);
    sigprocmask(SIG_BLOCK, &mask, nullptr);

    signal_fd_ = signalfd(-1, &mask, SFD_NONBLOCK | SFD_CLOEXEC);
    if (signal_fd_ < 0) {
        std::println(stderr, "signalfd failed: {}", std::strerror(errno));
        return false;
    }

    auto add_fd = [this](int fd, uint32_t events) {
        epoll_event ev{.events = events, .data = {.fd = fd}};
        if (epoll_ctl(epoll_fd_, EPOLL_CTL_ADD, fd, &ev) != 0) {
            std::println(stderr, "epoll_ctl failed: {}", std::strerror(errno));
            return false;
        }
        return true;
    };

    if (!add_fd(signal_fd_, EPOLLIN) || !add_fd(ipc_server_.server_fd(), EPOLLIN) ||
        !add_fd(wake_fd_, EPOLLIN)) {
        return false;
    }

    schedule_availability_probe();

    running_.store(true, std::memory_order_release);
    return true;
}

void LinuxEventLoop::run() {
    constexpr int MAX_EVENTS = 16;
    epoll_event events[MAX_EVENTS];

    while (running_.load(std::memory_order_relaxed)) {
        int n = epoll_wait(epoll_fd_, events, MAX_EVENTS, next_timeout_ms());
        if (n < 0) {
            if (errno == EINTR) continue;
            std::println(stderr, "epoll_wait error: {}", std::strerror(errno));
            break;
        }

        for (int i = 0; i < n; i++) {
            int fd = events[i].data.fd;

            if (fd == signal_fd_) {
                signalfd_siginfo info;
                if (::read(signal_fd_, &info, sizeof(info)) > 0) {
                    log("Received signal, shutting down");
                }
                running_.store(false, std::memory_order_release);
                break;
            }

            if (fd == ipc_server_.server_fd()) {
                int client_fd = ipc_server_.accept_client();
                if (client_fd >= 0) {
                    epoll_event ev{.events = EPOLLIN, .data = {.fd = client_fd}};
                    if (epoll_ctl(epoll_fd_, EPOLL_CTL_ADD, client_fd, &ev) != 0) {
                        ipc_server_.close_client(client_fd);
                    }
                }
                continue;
            }

            if (fd == wake_fd_) {
                uint64_t val;
                while (::read(wake_fd_, &val, sizeof(val)) > 0) {}
                continue;
            }

            handle_client(fd);
        }

        run_posted();
        run_due_timers();
    }

    // Clean shutdown
    core_.shutdown();
}

void LinuxEventLoop::request_stop() {
    running_.store(false, std::memory_order_release);
    wake();
}

void LinuxEventLoop::post(Task task) {
    std::lock_guard lock(mutex_);
    if (wake_fd_ < 0) return;
    tasks_.push_back(std::move(task));
    uint64_t val = 1;
    if (::write(wake_fd_, &val, sizeof(val)) < 0 && errno != EAGAIN) {
        std::println(stderr, "event loop: wake failed: {}", std::strerror(errno));
    }
}

Executor::TimerId LinuxEventLoop::post_after(std::chrono::milliseconds delay, Task task) {
    TimerId id;
    {
        std::lock_guard lock(mutex_);
        id = next_timer_++;
        timers_.emplace(id, std::pair{std::chrono::steady_clock::now() + delay, std::move(task)});
    }
    // The epoll timeout was computed before this timer existed.
    wake();
    return id;
}

void LinuxEventLoop::cancel(TimerId id) {
    std::lock_guard lock(mutex_);
    timers_.erase(id);
}

void LinuxEventLoop::wake() {
    std::lock_guard lock(mutex_);
    if (wake_fd_ < 0) return;
    uint64_t val = 1;
    if (::write(wake_fd_, &val, sizeof(val)) < 0 && errno != EAGAIN) {
        std::println(stderr, "event loop: wake failed: {}", std::strerror(errno));
    }
}

void LinuxEventLoop::run_posted() {
    std::deque<Task> batch;
    {
        std::lock_guard lock(mutex_);
        batch.swap(tasks_);
    }
    for (auto& task : batch) run_task(task);
}

void LinuxEventLoop::run_due_timers() {
    auto now = std::chrono::steady_clock::now();
    for (;;) {
        Task task;
        {
            std::lock_guard lock(mutex_);
            auto it = std::ranges::find_if(timers_, [now](const auto& entry) {
                return entry.second.first <= now;
            });
            if (it == timers_.end()) return;
            task = std::move(it->second.second);
            timers_.erase(it);
        }
        run_task(task);
    }
}

int LinuxEventLoop::next_timeout_ms() {
    std::lock_guard lock(mutex_);
    if (!tasks_.empty()) return 0;
    if (timers_.empty()) return -1;

    auto earliest = std::ranges::min_element(timers_, {}, [](const auto& entry) {
        return entry.second.first;
    })->second.first;
    auto remaining = std::chrono::ceil<std::chrono::milliseconds>(
        earliest - std::chrono::steady_clock::now());
    return static_cast<int>(std::max<int64_t>(remaining.count(), 0));
}

void LinuxEventLoop::run_task(Task& task) {
    try {
        task();
    } catch (const std::exception& e) {
        std::println(stderr, "event loop: task failed: {}", e.what());
    }
}

void LinuxEventLoop::handle_client(int fd) {
    for (;;) {
        nlohmann::json cmd;
        switch (ipc_server_.read_command(fd, cmd)) {
            case IpcServer::ReadStatus::Command: {
                std::string cmd_str = cmd.value("cmd", "");
                auto response = core_.handle_command(cmd_str, cmd);

                if (response.value("status", "") == "pending") {
                    core_.add_waiting_client(fd);
                } else if (!ipc_server_.send_response(fd, response)) {
                    drop_client(fd);
                    return;
                }
                break;
            }
            case IpcServer::ReadStatus::Invalid:
                if (!ipc_server_.send_response(fd, {{"status", "error"}, {"message", "invalid JSON"}})) {
                    drop_client(fd);
                    return;
                }
                break;
            case IpcServer::ReadStatus::Incomplete:
                return;
            case IpcServer::ReadStatus::Closed:
                drop_client(fd);
                return;
        }
    }
}

void LinuxEventLoop::drop_client(int fd) {
    epoll_ctl(epoll_fd_, EPOLL_CTL_DEL, fd, nullptr);
    core_.remove_waiting_client(fd);
    ipc_server_.close_client(fd);
}

void LinuxEventLoop::schedule_availability_probe() {
    post_after(kAvailabilityProbeInterval, [this] {
        // The probe blocks on the network; run it off the loop. The result is
        // tied to the session that was current when it started.
        uint64_t generation = capture_.generation();
        background_.post([this, generation] {
            bool available = recognizer_.is_available();
            post([this, available, generation] {
                capture_.on_availability_changed(available, generation);
            });
        });
        schedule_availability_probe();
    });
}

void LinuxEventLoop::log(const std::string& msg) {
    if (verbose_) {
        std::println(stderr, "[voice-ledger] {}", msg);
    }
}
