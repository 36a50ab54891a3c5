#include "workflow/recording_workflow.hpp"

#include <exception>
#include <format>
#include <print>

const char* to_string(RecordingStep step) {
    switch (step) {
        case RecordingStep::Idle: return "idle";
        case RecordingStep::Recording: return "recording";
        case RecordingStep::Processing: return "processing";
        case RecordingStep::Analyzing: return "analyzing";
        case RecordingStep::SelectingMultipleExpenses: return "selecting_multiple_expenses";
        case RecordingStep::ConfirmingExpense: return "confirming_expense";
        case RecordingStep::Completed: return "completed";
        case RecordingStep::Error: return "error";
    }
    return "unknown";
}

namespace {

constexpr const char* kInvalidResultMessage =
    "AI could not extract a valid expense, please try again and speak more clearly";

std::string trim(std::string_view s) {
    auto first = s.find_first_not_of(" \t\r\n");
    if (first == std::string_view::npos) return {};
    auto last = s.find_last_not_of(" \t\r\n");
    return std::string(s.substr(first, last - first + 1));
}

std::expected<ExpenseCandidate, ValidationError> primary_candidate(const AnalysisResult& r) {
    return ExpenseCandidate::create({
        .amount = *r.extracted_amount,
        .category = r.category,
        .title = r.title,
        .description = r.description,
        .original_voice_text = r.original_text,
        .confidence = r.confidence,
        .tags = r.tags,
        .date = Clock::now(),
    });
}

std::expected<ExpenseCandidate, ValidationError>
alternative_candidate(const AnalysisResult& r, const AlternativeInterpretation& alt) {
    if (!alt.amount) {
        return std::unexpected(ValidationError{ValidationError::Field::Amount, "amount missing"});
    }
    return ExpenseCandidate::create({
        .amount = *alt.amount,
        .category = alt.category,
        .title = alt.title,
        .description = alt.description,
        .original_voice_text = r.original_text,
        .confidence = alt.confidence,
        .tags = {},
        .date = Clock::now(),
    });
}

} // namespace

RecordingWorkflow::RecordingWorkflow(AudioCaptureSession& capture, ExpenseAnalyzer& analyzer,
                                     ExpenseStorage& storage, Executor& owner,
                                     Executor& background, Options opts)
    : capture_(capture), analyzer_(analyzer), storage_(storage), owner_(owner),
      background_(background), opts_(std::move(opts)) {
    capture_.set_callbacks({
        .on_transcript = [this](const Transcript& t) {
            if (snap_.step != RecordingStep::Recording && snap_.step != RecordingStep::Processing) return;
            snap_.transcript = t.text;
            publish();
        },
        .on_audio_level = [this](float level) {
            snap_.audio_level = level;
            if (snap_.step == RecordingStep::Recording) publish();
        },
        .on_state_changed = [this](const RecordingState& state) { on_capture_state(state); },
    });
}

RecordingWorkflow::~RecordingWorkflow() {
    cancel_error_reset();
    capture_.set_callbacks({});
}

std::expected<void, std::string> RecordingWorkflow::start() {
    switch (snap_.step) {
        case RecordingStep::Idle:
        case RecordingStep::Completed:
        case RecordingStep::Error:
            break;
        default:
            return std::unexpected(std::format("cannot start while {}", to_string(snap_.step)));
    }

    cancel_error_reset();
    clear_session_state();

    std::expected<void, CaptureError> started;
    try {
        started = capture_.start();
    } catch (const std::exception& e) {
        auto msg = std::string("starting recording failed: ") + e.what();
        enter_error(msg);
        return std::unexpected(msg);
    }
    if (!started) {
        std::string msg = to_string(started.error());
        enter_error(msg);
        return std::unexpected(msg);
    }

    set_step(RecordingStep::Recording);
    return {};
}

void RecordingWorkflow::stop() {
    if (snap_.step != RecordingStep::Recording) return;
    set_step(RecordingStep::Processing);
    capture_.stop();
}

void RecordingWorkflow::on_capture_state(const RecordingState& state) {
    // Capture events only drive the workflow while it is waiting on capture.
    if (snap_.step != RecordingStep::Recording && snap_.step != RecordingStep::Processing) {
        log(std::format("ignoring capture state {} in step {}", to_string(state.kind),
                        to_string(snap_.step)));
        return;
    }

    switch (state.kind) {
        case RecordingState::Kind::Processing:
            set_step(RecordingStep::Processing);
            break;
        case RecordingState::Kind::Completed:
            on_recording_finished();
            break;
        case RecordingState::Kind::Error:
            enter_error(state.message);
            break;
        case RecordingState::Kind::Idle:
        case RecordingState::Kind::Recording:
            break;
    }
}

void RecordingWorkflow::on_recording_finished() {
    const auto& recording = capture_.last_recording();
    auto text = recording ? trim(recording->text) : std::string{};
    if (text.empty()) {
        log("empty transcript, back to idle");
        clear_session_state();
        set_step(RecordingStep::Idle);
        return;
    }

    snap_.transcript = text;
    begin_analysis(text);
}

void RecordingWorkflow::begin_analysis(const std::string& text) {
    auto request = AnalysisRequest::make(text, opts_.preferences);
    active_request_id_ = request.request_id;
    snap_.progress = std::string(analysis_progress::kConnecting);
    set_step(RecordingStep::Analyzing);
    log(std::format("analyzing request {}", request.request_id));

    background_.post([this, request = std::move(request)] {
        const auto id = request.request_id;
        auto progress = [this, id](std::string_view label) {
            owner_.post([this, id, label = std::string(label)] { on_analysis_progress(id, label); });
        };

        AnalysisOutcome outcome;
        try {
            outcome.result = analyzer_.analyze(request, progress);
        } catch (const std::exception& e) {
            outcome.exception = std::string("analysis failed: ") + e.what();
        }

        owner_.post([this, id, outcome = std::move(outcome)]() mutable {
            on_analysis_finished(id, std::move(outcome));
        });
    });
}

void RecordingWorkflow::on_analysis_progress(const std::string& request_id, const std::string& label) {
    if (request_id != active_request_id_ || snap_.step != RecordingStep::Analyzing) return;
    snap_.progress = label;
    publish();
}

void RecordingWorkflow::on_analysis_finished(const std::string& request_id, AnalysisOutcome outcome) {
    if (request_id != active_request_id_ || snap_.step != RecordingStep::Analyzing) {
        log(std::format("discarding result of superseded request {}", request_id));
        return;
    }
    active_request_id_.clear();

    if (!outcome.result) {
        enter_error(outcome.exception);
        return;
    }
    if (!*outcome.result) {
        enter_error(outcome.result->error().user_message());
        return;
    }

    last_result_ = std::move(**outcome.result);
    if (!last_result_->is_valid()) {
        log(std::format("analysis result not usable (amount {}, confidence {:.2f})",
                        last_result_->extracted_amount ? last_result_->extracted_amount->to_string() : "none",
                        last_result_->confidence));
        enter_error(kInvalidResultMessage);
        return;
    }
    present(*last_result_);
}

void RecordingWorkflow::present(const AnalysisResult& result) {
    auto primary = primary_candidate(result);
    if (!primary) {
        enter_error("expense is not valid: " + primary.error().message);
        return;
    }

    std::vector<ExpenseCandidate> candidates{std::move(*primary)};
    for (const auto& alt : result.alternatives) {
        auto c = alternative_candidate(result, alt);
        if (!c) {
            log(std::format("skipping alternative \"{}\": {}", alt.title, c.error().message));
            continue;
        }
        candidates.push_back(std::move(*c));
    }

    snap_.progress.clear();
    snap_.candidates = std::move(candidates);

    if (snap_.candidates.size() > 1) {
        set_step(RecordingStep::SelectingMultipleExpenses);
        return;
    }

    set_step(RecordingStep::ConfirmingExpense);
    if (opts_.auto_save) {
        auto candidate = snap_.candidates.front();
        if (auto saved = confirm(candidate); saved) {
            log(std::format("auto-saved expense {}", *saved));
        }
    }
}

std::expected<int64_t, std::string> RecordingWorkflow::confirm(const ExpenseCandidate& candidate) {
    if (!awaiting_confirmation()) {
        return std::unexpected(std::string("no expense awaiting confirmation"));
    }

    auto saved = save_one(candidate);
    if (!saved) {
        enter_error(saved.error());
        return std::unexpected(saved.error());
    }

    snap_.candidates.clear();
    snap_.saved_ids = {*saved};
    set_step(RecordingStep::Completed);
    return *saved;
}

std::expected<std::vector<int64_t>, std::string>
RecordingWorkflow::confirm_multiple(const std::vector<ExpenseCandidate>& candidates) {
    if (!awaiting_confirmation()) {
        return std::unexpected(std::string("no expense awaiting confirmation"));
    }
    if (candidates.empty()) {
        return std::unexpected(std::string("no expenses selected"));
    }

    std::vector<int64_t> ids;
    std::vector<std::string> failures;
    for (const auto& candidate : candidates) {
        auto saved = save_one(candidate);
        if (saved) {
            ids.push_back(*saved);
        } else {
            failures.push_back(std::format("\"{}\": {}", candidate.title(), saved.error()));
        }
    }

    snap_.candidates.clear();
    snap_.saved_ids = ids;

    if (!failures.empty()) {
        std::string msg = std::format("{} of {} expenses not saved: ", failures.size(), candidates.size());
        for (size_t i = 0; i < failures.size(); ++i) {
            if (i > 0) msg += "; ";
            msg += failures[i];
        }
        enter_error(msg);
        return std::unexpected(msg);
    }

    set_step(RecordingStep::Completed);
    return ids;
}

std::expected<int64_t, std::string> RecordingWorkflow::save_one(const ExpenseCandidate& candidate) {
    if (auto ok = candidate.validate(); !ok) {
        return std::unexpected(ok.error().message);
    }
    try {
        auto id = storage_.save(candidate);
        if (!id) return std::unexpected("saving expense failed: " + id.error());
        return *id;
    } catch (const std::exception& e) {
        return std::unexpected(std::string("saving expense failed: ") + e.what());
    }
}

void RecordingWorkflow::cancel() {
    if (!awaiting_confirmation()) {
        reset_flow();
        return;
    }
    log("pending expenses discarded");
    clear_session_state();
    set_step(RecordingStep::Idle);
}

void RecordingWorkflow::reset_flow() {
    cancel_error_reset();
    if (capture_.state().is_recording()) {
        capture_.stop();
    }
    clear_session_state();
    set_step(RecordingStep::Idle);
}

bool RecordingWorkflow::awaiting_confirmation() const {
    return snap_.step == RecordingStep::ConfirmingExpense ||
           snap_.step == RecordingStep::SelectingMultipleExpenses;
}

void RecordingWorkflow::set_step(RecordingStep step) {
    if (step != RecordingStep::Analyzing) snap_.progress.clear();
    if (step != RecordingStep::Error) snap_.error_message.clear();
    if (snap_.step != step) {
        log(std::format("{} -> {}", to_string(snap_.step), to_string(step)));
    }
    snap_.step = step;
    publish();
}

void RecordingWorkflow::enter_error(std::string message) {
    std::println(stderr, "workflow: {}", message);

    // No error path leaves the microphone open.
    if (capture_.state().is_recording()) capture_.stop();
    active_request_id_.clear();

    cancel_error_reset();
    snap_.candidates.clear();
    snap_.error_message = std::move(message);
    snap_.step = RecordingStep::Error;
    snap_.progress.clear();
    publish();

    const uint64_t gen = ++error_generation_;
    error_timer_ = owner_.post_after(opts_.error_reset, [this, gen] {
        error_timer_.reset();
        if (gen != error_generation_ || snap_.step != RecordingStep::Error) return;
        log("error cleared after timeout");
        clear_session_state();
        set_step(RecordingStep::Idle);
    });
}

void RecordingWorkflow::clear_session_state() {
    active_request_id_.clear();
    snap_.progress.clear();
    snap_.candidates.clear();
    snap_.error_message.clear();
    snap_.transcript.clear();
    snap_.audio_level = 0.0f;
    snap_.saved_ids.clear();
}

void RecordingWorkflow::cancel_error_reset() {
    ++error_generation_;
    if (error_timer_) {
        owner_.cancel(*error_timer_);
        error_timer_.reset();
    }
}

void RecordingWorkflow::publish() {
    for (const auto& listener : listeners_) listener(snap_);
}

void RecordingWorkflow::log(const std::string& msg) {
    if (opts_.verbose) {
        std::println(stderr, "[voice-ledger] workflow: {}", msg);
    }
}
