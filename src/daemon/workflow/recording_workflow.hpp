#pragma once

#include "analysis/analysis_client.hpp"
#include "capture/audio_capture_session.hpp"
#include "platform/executor.hpp"
#include "storage/expense_storage.hpp"

#include <chrono>
#include <cstdint>
#include <expected>
#include <functional>
#include <optional>
#include <string>
#include <vector>

enum class RecordingStep {
    Idle,
    Recording,
    Processing,
    Analyzing,
    SelectingMultipleExpenses,
    ConfirmingExpense,
    Completed,
    Error,
};

const char* to_string(RecordingStep step);

// Everything the confirmation side needs to render the workflow.
struct WorkflowSnapshot {
    RecordingStep step = RecordingStep::Idle;
    std::string progress;                      // Analyzing only
    std::vector<ExpenseCandidate> candidates;  // primary first, then alternatives
    std::string error_message;                 // Error only
    std::string transcript;
    float audio_level = 0.0f;
    std::vector<int64_t> saved_ids;            // from the last confirmation
};

// Sequences capture -> analysis -> confirmation for one utterance at a time.
// All public calls and every callback run on the owner executor; analysis runs
// on the background executor and its result is posted back, tagged with the
// request id it answers.
class RecordingWorkflow {
public:
    struct Options {
        std::chrono::milliseconds error_reset{5000};
        bool auto_save = false;
        std::optional<UserPreferences> preferences;
        bool verbose = false;
    };

    using Listener = std::function<void(const WorkflowSnapshot&)>;

    RecordingWorkflow(AudioCaptureSession& capture, ExpenseAnalyzer& analyzer,
                      ExpenseStorage& storage, Executor& owner, Executor& background,
                      Options opts);
    ~RecordingWorkflow();

    RecordingWorkflow(const RecordingWorkflow&) = delete;
    RecordingWorkflow& operator=(const RecordingWorkflow&) = delete;

    void add_listener(Listener listener) { listeners_.push_back(std::move(listener)); }

    // Valid from idle, completed and error.
    std::expected<void, std::string> start();
    void stop();

    std::expected<int64_t, std::string> confirm(const ExpenseCandidate& candidate);
    // Saves each valid candidate independently. Already saved ones are kept
    // when a later one fails.
    std::expected<std::vector<int64_t>, std::string>
        confirm_multiple(const std::vector<ExpenseCandidate>& candidates);
    // Discards pending candidates.
    void cancel();
    // Back to idle from anywhere. An outstanding analysis is left to finish and
    // its result is ignored.
    void reset_flow();

    RecordingStep step() const { return snap_.step; }
    const WorkflowSnapshot& snapshot() const { return snap_; }
    const std::optional<AnalysisResult>& last_result() const { return last_result_; }

private:
    struct AnalysisOutcome {
        std::optional<std::expected<AnalysisResult, AnalysisError>> result;
        std::string exception; // set when the analyzer threw
    };

    void on_capture_state(const RecordingState& state);
    void on_recording_finished();
    void begin_analysis(const std::string& text);
    void on_analysis_progress(const std::string& request_id, const std::string& label);
    void on_analysis_finished(const std::string& request_id, AnalysisOutcome outcome);
    void present(const AnalysisResult& result);
    std::expected<int64_t, std::string> save_one(const ExpenseCandidate& candidate);

    bool awaiting_confirmation() const;
    void set_step(RecordingStep step);
    void enter_error(std::string message);
    void clear_session_state();
    void cancel_error_reset();
    void publish();
    void log(const std::string& msg);

    AudioCaptureSession& capture_;
    ExpenseAnalyzer& analyzer_;
    ExpenseStorage& storage_;
    Executor& owner_;
    Executor& background_;
    Options opts_;
    std::vector<Listener> listeners_;

    WorkflowSnapshot snap_;
    std::optional<AnalysisResult> last_result_;
    std::string active_request_id_;
    std::optional<Executor::TimerId> error_timer_;
    uint64_t error_generation_ = 0;
};
