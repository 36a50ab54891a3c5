#pragma once

#include "capture/audio_capture_session.hpp"
#include "platform/ipc_server.hpp"
#include "storage/expense_storage.hpp"
#include "workflow/recording_workflow.hpp"

#include <nlohmann/json.hpp>
#include <string>
#include <vector>

// IPC command handling on top of the workflow and the expense store. Runs on
// the owner thread. Commands that wait for the workflow to settle answer
// {"status": "pending"}; the caller then registers the client with
// add_waiting_client() and the answer is sent once the workflow settles.
class DaemonCore {
public:
    DaemonCore(RecordingWorkflow& workflow, AudioCaptureSession& capture,
               ExpenseStorage& storage, IpcServer& ipc, bool verbose);
    ~DaemonCore();

    DaemonCore(const DaemonCore&) = delete;
    DaemonCore& operator=(const DaemonCore&) = delete;

    nlohmann::json handle_command(const std::string& cmd_str, const nlohmann::json& cmd);

    void add_waiting_client(int fd);
    void remove_waiting_client(int fd);
    size_t waiting_clients() const { return waiting_clients_.size(); }

    // Answers waiting clients and stops any active recording.
    void shutdown();

private:
    nlohmann::json handle_start(const nlohmann::json& cmd);
    nlohmann::json handle_stop(const nlohmann::json& cmd);
    nlohmann::json handle_toggle(const nlohmann::json& cmd);
    nlohmann::json handle_status(const nlohmann::json& cmd);
    nlohmann::json handle_confirm(const nlohmann::json& cmd);
    nlohmann::json handle_confirm_multiple(const nlohmann::json& cmd);
    nlohmann::json handle_cancel(const nlohmann::json& cmd);
    nlohmann::json handle_reset(const nlohmann::json& cmd);
    nlohmann::json handle_history(const nlohmann::json& cmd);
    nlohmann::json handle_search(const nlohmann::json& cmd);
    nlohmann::json handle_range(const nlohmann::json& cmd);
    nlohmann::json handle_update(const nlohmann::json& cmd);
    nlohmann::json handle_delete(const nlohmann::json& cmd);

    void on_workflow_changed(const WorkflowSnapshot& snap);
    nlohmann::json snapshot_json(bool with_diagnostics) const;

    void log(const std::string& msg);

    RecordingWorkflow& workflow_;
    AudioCaptureSession& capture_;
    ExpenseStorage& storage_;
    IpcServer& ipc_;
    bool verbose_;

    std::vector<int> waiting_clients_;
};
