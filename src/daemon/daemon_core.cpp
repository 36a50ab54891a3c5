#include "daemon_core.hpp"

#include "expense/expense_json.hpp"

#include <algorithm>
#include <format>
#include <print>

using json = nlohmann::json;

namespace {

json error(std::string message) {
    return {{"status", "error"}, {"message", std::move(message)}};
}

bool settled(RecordingStep step) {
    switch (step) {
        case RecordingStep::Idle:
        case RecordingStep::ConfirmingExpense:
        case RecordingStep::SelectingMultipleExpenses:
        case RecordingStep::Completed:
        case RecordingStep::Error:
            return true;
        default:
            return false;
    }
}

json records_json(const std::vector<ExpenseRecord>& records) {
    json entries = json::array();
    for (const auto& r : records) entries.push_back(to_json(r));
    return {{"status", "ok"}, {"entries", std::move(entries)}};
}

} // namespace

DaemonCore::DaemonCore(RecordingWorkflow& workflow, AudioCaptureSession& capture,
                       ExpenseStorage& storage, IpcServer& ipc, bool verbose)
    : workflow_(workflow), capture_(capture), storage_(storage), ipc_(ipc), verbose_(verbose) {
    workflow_.add_listener([this](const WorkflowSnapshot& snap) { on_workflow_changed(snap); });
}

DaemonCore::~DaemonCore() = default;

json DaemonCore::handle_command(const std::string& cmd_str, const json& cmd) {
    try {
        if (cmd_str == "start") return handle_start(cmd);
        if (cmd_str == "stop") return handle_stop(cmd);
        if (cmd_str == "toggle") return handle_toggle(cmd);
        if (cmd_str == "status") return handle_status(cmd);
        if (cmd_str == "confirm") return handle_confirm(cmd);
        if (cmd_str == "confirm_multiple") return handle_confirm_multiple(cmd);
        if (cmd_str == "cancel") return handle_cancel(cmd);
        if (cmd_str == "reset") return handle_reset(cmd);
        if (cmd_str == "history") return handle_history(cmd);
        if (cmd_str == "search") return handle_search(cmd);
        if (cmd_str == "range") return handle_range(cmd);
        if (cmd_str == "update") return handle_update(cmd);
        if (cmd_str == "delete") return handle_delete(cmd);
    } catch (const json::exception& e) {
        return error(std::string("invalid arguments: ") + e.what());
    }
    return error("unknown command");
}

json DaemonCore::handle_start(const json& /*cmd*/) {
    if (auto r = workflow_.start(); !r) {
        return error(r.error());
    }
    log("Recording started");
    return {{"status", "ok"}, {"step", to_string(workflow_.step())}};
}

json DaemonCore::handle_stop(const json& cmd) {
    if (workflow_.step() != RecordingStep::Recording) {
        return error("not recording");
    }

    workflow_.stop();
    log("Recording stopped");

    if (cmd.value("wait", false) && !settled(workflow_.step())) {
        return {{"status", "pending"}};
    }
    return snapshot_json(false);
}

json DaemonCore::handle_toggle(const json& cmd) {
    if (workflow_.step() == RecordingStep::Recording) {
        return handle_stop(cmd);
    }
    return handle_start(cmd);
}

json DaemonCore::handle_status(const json& cmd) {
    return snapshot_json(cmd.value("diagnostics", true));
}

json DaemonCore::handle_confirm(const json& cmd) {
    const auto& pending = workflow_.snapshot().candidates;
    auto index = cmd.value("index", 0);
    if (index < 0 || static_cast<size_t>(index) >= pending.size()) {
        return error(pending.empty() ? "no expense awaiting confirmation"
                                     : std::format("index {} out of range", index));
    }

    auto candidate = pending[static_cast<size_t>(index)];
    if (cmd.contains("edits")) {
        auto edited = apply_edits(candidate.fields(), cmd["edits"]);
        if (!edited) return error(edited.error());
        candidate = std::move(*edited);
    }

    auto id = workflow_.confirm(candidate);
    if (!id) return error(id.error());

    log(std::format("Saved expense {}", *id));
    return {{"status", "ok"}, {"id", *id}};
}

json DaemonCore::handle_confirm_multiple(const json& cmd) {
    const auto& pending = workflow_.snapshot().candidates;
    if (pending.empty()) return error("no expense awaiting confirmation");

    std::vector<ExpenseCandidate> selected;
    if (cmd.contains("indices")) {
        for (int index : cmd["indices"].get<std::vector<int>>()) {
            if (index < 0 || static_cast<size_t>(index) >= pending.size()) {
                return error(std::format("index {} out of range", index));
            }
            selected.push_back(pending[static_cast<size_t>(index)]);
        }
    } else {
        selected = pending;
    }

    auto ids = workflow_.confirm_multiple(selected);
    if (!ids) {
        return {
            {"status", "error"},
            {"message", ids.error()},
            {"ids", workflow_.snapshot().saved_ids},
        };
    }

    log(std::format("Saved {} expenses", ids->size()));
    return {{"status", "ok"}, {"ids", *ids}};
}

json DaemonCore::handle_cancel(const json& /*cmd*/) {
    workflow_.cancel();
    return {{"status", "ok"}, {"step", to_string(workflow_.step())}};
}

json DaemonCore::handle_reset(const json& /*cmd*/) {
    workflow_.reset_flow();
    return {{"status", "ok"}, {"step", to_string(workflow_.step())}};
}

json DaemonCore::handle_history(const json& cmd) {
    int limit = std::clamp(cmd.value("limit", 10), 1, 1000);
    auto records = storage_.fetch_all(limit);
    if (!records) return error(records.error());
    return records_json(*records);
}

json DaemonCore::handle_search(const json& cmd) {
    auto query = cmd.value("query", std::string{});
    if (query.empty()) return error("query is required");

    auto records = storage_.search(query);
    if (!records) return error(records.error());
    return records_json(*records);
}

json DaemonCore::handle_range(const json& cmd) {
    if (!cmd.contains("from") || !cmd.contains("to")) {
        return error("from and to are required");
    }
    auto from = Clock::time_point(std::chrono::seconds(cmd["from"].get<int64_t>()));
    auto to = Clock::time_point(std::chrono::seconds(cmd["to"].get<int64_t>()));
    if (to < from) return error("range end is before its start");

    std::optional<ExpenseCategory> category;
    if (cmd.contains("category")) {
        auto name = cmd["category"].get<std::string>();
        category = parse_category(name);
        if (!category) return error("unknown category: " + name);
    }

    auto records = storage_.fetch_range(from, to, category);
    if (!records) return error(records.error());
    return records_json(*records);
}

json DaemonCore::handle_update(const json& cmd) {
    if (!cmd.contains("id")) return error("id is required");
    auto id = cmd["id"].get<int64_t>();

    auto found = storage_.find(id);
    if (!found) return error(found.error());
    if (!*found) return error(std::format("no expense with id {}", id));

    auto edited = apply_edits((*found)->expense.fields(), cmd.value("fields", json::object()));
    if (!edited) return error(edited.error());

    if (auto r = storage_.update(id, *edited); !r) return error(r.error());
    log(std::format("Updated expense {}", id));
    return {{"status", "ok"}, {"expense", to_json(*edited)}};
}

json DaemonCore::handle_delete(const json& cmd) {
    if (!cmd.contains("id")) return error("id is required");
    auto id = cmd["id"].get<int64_t>();

    if (auto r = storage_.remove(id); !r) return error(r.error());
    log(std::format("Deleted expense {}", id));
    return {{"status", "ok"}};
}

void DaemonCore::on_workflow_changed(const WorkflowSnapshot& snap) {
    if (waiting_clients_.empty() || !settled(snap.step)) return;

    auto response = snapshot_json(false);
    for (int fd : waiting_clients_) {
        ipc_.send_response(fd, response);
    }
    waiting_clients_.clear();
}

json DaemonCore::snapshot_json(bool with_diagnostics) const {
    const auto& snap = workflow_.snapshot();

    json candidates = json::array();
    for (size_t i = 0; i < snap.candidates.size(); ++i) {
        auto c = to_json(snap.candidates[i]);
        c["index"] = i;
        candidates.push_back(std::move(c));
    }

    json resp = {
        {"status", "ok"},
        {"step", to_string(snap.step)},
        {"transcript", snap.transcript},
        {"candidates", std::move(candidates)},
        {"ids", snap.saved_ids},
    };
    if (snap.step == RecordingStep::Recording) resp["audio_level"] = snap.audio_level;
    if (!snap.progress.empty()) resp["progress"] = snap.progress;
    if (!snap.error_message.empty()) resp["error"] = snap.error_message;

    if (with_diagnostics) {
        auto res = capture_.resource_status();
        auto health = capture_.health_check();
        resp["capture"] = {
            {"state", to_string(capture_.state().kind)},
            {"resources", {
                {"engine_running", res.engine_running},
                {"tap_installed", res.tap_installed},
                {"recognition_task", res.has_active_task},
                {"recognition_request", res.has_active_request},
                {"audio_session", res.session_active},
                {"consistent", res.healthy()},
            }},
            {"health", to_string(health.level)},
            {"health_message", health.message},
        };
    }
    return resp;
}

void DaemonCore::add_waiting_client(int fd) {
    waiting_clients_.push_back(fd);
}

void DaemonCore::remove_waiting_client(int fd) {
    std::erase(waiting_clients_, fd);
}

void DaemonCore::shutdown() {
    if (workflow_.step() == RecordingStep::Recording) {
        workflow_.reset_flow();
    }
    if (!waiting_clients_.empty()) {
        auto response = error("daemon shutting down");
        for (int fd : waiting_clients_) ipc_.send_response(fd, response);
        waiting_clients_.clear();
    }
}

void DaemonCore::log(const std::string& msg) {
    if (verbose_) {
        std::println(stderr, "[voice-ledger] {}", msg);
    }
}
