#pragma once

#include "analysis/analysis_client.hpp"
#include "analysis/curl_transport.hpp"
#include "capture/audio_capture_session.hpp"
#include "config.hpp"
#include "daemon_core.hpp"
#include "platform/executor.hpp"
#include "platform/linux/linux_permissions.hpp"
#include "platform/linux/pipewire_engine.hpp"
#include "platform/linux/unix_socket_server.hpp"
#include "recognition/whisper_recognizer.hpp"
#include "storage/expense_db.hpp"
#include "whisper/lan_backend.hpp"
#include "worker_thread.hpp"
#include "workflow/recording_workflow.hpp"

#include <atomic>
#include <chrono>
#include <deque>
#include <map>
#include <mutex>

// The daemon's owner thread: an epoll loop over the IPC socket, a signalfd and
// an eventfd that wakes it for posted tasks. Timers are kept here and bound
// the epoll timeout.
class LinuxEventLoop : public Executor {
public:
    explicit LinuxEventLoop(Config config, bool verbose = false);
    ~LinuxEventLoop() override;

    LinuxEventLoop(const LinuxEventLoop&) = delete;
    LinuxEventLoop& operator=(const LinuxEventLoop&) = delete;

    bool init();
    void run();
    void request_stop();

    void post(Task task) override;
    TimerId post_after(std::chrono::milliseconds delay, Task task) override;
    void cancel(TimerId id) override;

private:
    using TimePoint = std::chrono::steady_clock::time_point;

    void wake();
    void run_posted();
    void run_due_timers();
    int next_timeout_ms();
    void handle_client(int fd);
    void drop_client(int fd);
    void schedule_availability_probe();
    void run_task(Task& task);
    void log(const std::string& msg);

    Config config_;
    bool verbose_;

    // Executor state. Declared first so it outlives every component below.
    std::mutex mutex_;
    std::deque<Task> tasks_;
    std::map<TimerId, std::pair<TimePoint, Task>> timers_;
    TimerId next_timer_ = 1;
    int wake_fd_ = -1;

    // Platform implementations
    PipeWireEngine engine_;
    LinuxPermissions permissions_;
    LanBackend backend_;
    WhisperRecognizer recognizer_;
    CurlTransport transport_;
    AnalysisClient analyzer_;
    ExpenseDb db_;
    UnixSocketServer ipc_server_;

    // Portable business logic
    AudioCaptureSession capture_;
    RecordingWorkflow workflow_;
    DaemonCore core_;

    int epoll_fd_ = -1;
    int signal_fd_ = -1;
    std::atomic<bool> running_{false};

    // Declared last: joined before anything it may still post results for.
    WorkerThread background_;
};
