#include <catch2/catch_test_macros.hpp>

#include "recognition/whisper_recognizer.hpp"

#include <condition_variable>
#include <mutex>
#include <optional>
#include <string>
#include <thread>
#include <vector>

using namespace std::chrono_literals;

namespace {

class FakeBackend : public WhisperBackend {
public:
    std::expected<TranscriptResult, BackendError>
    transcribe(std::span<const int16_t> audio, uint32_t sample_rate, std::stop_token) override {
        if (delay.count() > 0) std::this_thread::sleep_for(delay);
        std::lock_guard lock(mutex);
        ++calls;
        last_size = audio.size();
        last_rate = sample_rate;
        if (error) return std::unexpected(*error);
        return TranscriptResult{.text = text, .duration_s = 0.0, .processing_s = 0.0};
    }

    bool available() const override { return reachable; }

    std::mutex mutex;
    std::string text = "你好";
    std::optional<BackendError> error;
    bool reachable = true;
    std::chrono::milliseconds delay{0};
    int calls = 0;
    size_t last_size = 0;
    uint32_t last_rate = 0;
};

// Events arrive on the recognizer's worker thread.
struct EventLog {
    std::mutex mutex;
    std::condition_variable cv;
    std::vector<SpeechRecognizer::Event> events;

    SpeechRecognizer::ResultHandler handler() {
        return [this](SpeechRecognizer::Event e) {
            {
                std::lock_guard lock(mutex);
                events.push_back(std::move(e));
            }
            cv.notify_all();
        };
    }

    bool wait_for(size_t count, std::chrono::milliseconds timeout = 2000ms) {
        std::unique_lock lock(mutex);
        return cv.wait_for(lock, timeout, [&] { return events.size() >= count; });
    }

    SpeechRecognizer::Event last() {
        std::lock_guard lock(mutex);
        return events.back();
    }
};

WhisperRecognizer::Options quiet_options() {
    return {.sample_rate = 16000, .max_samples = 16000 * 10, .partial_interval = 10s, .verbose = false};
}

} // namespace

TEST_CASE("WhisperRecognizer final transcript", "[recognizer]") {
    FakeBackend backend;
    WhisperRecognizer recognizer(backend, quiet_options());
    EventLog log;
    std::vector<int16_t> second(16000, 1200);

    SECTION("TranscribesWholeUtterance") {
        auto request = recognizer.make_request(false);
        auto task = recognizer.start_task(request, log.handler());
        REQUIRE(task);

        request->append(second);
        request->append(second);
        request->end_audio();

        REQUIRE(log.wait_for(1));
        auto event = log.last();
        auto* t = std::get_if<Transcript>(&event);
        REQUIRE(t);
        REQUIRE(t->is_final);
        REQUIRE(t->text == "你好");

        std::lock_guard lock(backend.mutex);
        REQUIRE(backend.last_size == 32000);
        REQUIRE(backend.last_rate == 16000);
    }

    SECTION("NoAudioMeansNoSpeech") {
        auto request = recognizer.make_request(false);
        auto task = recognizer.start_task(request, log.handler());
        request->end_audio();

        REQUIRE(log.wait_for(1));
        auto event = log.last();
        auto* e = std::get_if<RecognitionError>(&event);
        REQUIRE(e);
        REQUIRE(e->domain == recognition_error::kAssistantDomain);
        REQUIRE(e->code == recognition_error::kNoSpeechDetected);
        std::lock_guard lock(backend.mutex);
        REQUIRE(backend.calls == 0);
    }

    SECTION("EmptyTextMeansNoSpeech") {
        backend.text.clear();
        auto request = recognizer.make_request(false);
        auto task = recognizer.start_task(request, log.handler());
        request->append(second);
        request->end_audio();

        REQUIRE(log.wait_for(1));
        auto event = log.last();
        REQUIRE(std::get<RecognitionError>(event).code == recognition_error::kNoSpeechDetected);
    }

    SECTION("UnreachableServer") {
        backend.error = BackendError{.unreachable = true, .cancelled = false, .message = "connection refused"};
        auto request = recognizer.make_request(false);
        auto task = recognizer.start_task(request, log.handler());
        request->append(second);
        request->end_audio();

        REQUIRE(log.wait_for(1));
        auto event = log.last();
        const auto& e = std::get<RecognitionError>(event);
        REQUIRE(e.domain == recognition_error::kBackendDomain);
        REQUIRE(e.code == recognition_error::kBackendUnreachable);
        REQUIRE(e.message == "connection refused");
    }

    SECTION("ServerFailure") {
        backend.error = BackendError{.unreachable = false, .cancelled = false, .message = "HTTP 500"};
        auto request = recognizer.make_request(false);
        auto task = recognizer.start_task(request, log.handler());
        request->append(second);
        request->end_audio();

        REQUIRE(log.wait_for(1));
        auto event = log.last();
        REQUIRE(std::get<RecognitionError>(event).code == recognition_error::kBackendFailed);
    }
}

TEST_CASE("WhisperRecognizer cancellation", "[recognizer]") {
    FakeBackend backend;
    WhisperRecognizer recognizer(backend, quiet_options());
    EventLog log;

    SECTION("CancelBeforeEndReportsCanceled") {
        auto request = recognizer.make_request(false);
        auto task = recognizer.start_task(request, log.handler());
        task->cancel();

        REQUIRE(log.events.size() == 1);
        const auto& e = std::get<RecognitionError>(log.events[0]);
        REQUIRE(e.domain == recognition_error::kRequestDomain);
        REQUIRE(e.code == recognition_error::kRequestCanceled);
    }

    SECTION("CancelAfterFinalIsSilent") {
        auto request = recognizer.make_request(false);
        auto task = recognizer.start_task(request, log.handler());
        std::vector<int16_t> audio(8000, 500);
        request->append(audio);
        request->end_audio();
        REQUIRE(log.wait_for(1));

        task->cancel();
        task->cancel();
        REQUIRE(log.events.size() == 1);
    }

    SECTION("DestroyingTaskJoinsWorker") {
        auto request = recognizer.make_request(false);
        {
            auto task = recognizer.start_task(request, log.handler());
        }
        REQUIRE(log.events.size() == 1);
    }
}

TEST_CASE("WhisperRecognizer partial results", "[recognizer]") {
    FakeBackend backend;
    backend.text = "我今天";
    auto opts = quiet_options();
    opts.partial_interval = 10ms;
    WhisperRecognizer recognizer(backend, opts);
    EventLog log;

    auto request = recognizer.make_request(true);
    REQUIRE(request->partial_results());
    auto task = recognizer.start_task(request, log.handler());

    std::vector<int16_t> half_second(8000, 900);
    request->append(half_second);

    REQUIRE(log.wait_for(1));
    {
        auto event = log.last();
        const auto& t = std::get<Transcript>(event);
        REQUIRE_FALSE(t.is_final);
        REQUIRE(t.text == "我今天");
    }

    {
        std::lock_guard lock(backend.mutex);
        backend.text = "我今天花了25元";
    }
    request->end_audio();

    // Partials only come with new audio, so the next event is the final one.
    REQUIRE(log.wait_for(2));
    auto event = log.last();
    const auto& final_t = std::get<Transcript>(event);
    REQUIRE(final_t.is_final);
    REQUIRE(final_t.text == "我今天花了25元");
}

TEST_CASE("WhisperRecognizer slow final pass", "[recognizer]") {
    FakeBackend backend;
    backend.text = "我今天花了25元买午餐";
    backend.delay = 50ms;
    auto opts = quiet_options();
    opts.partial_interval = 10ms;
    WhisperRecognizer recognizer(backend, opts);
    EventLog log;

    auto request = recognizer.make_request(false);
    auto task = recognizer.start_task(request, log.handler());
    std::vector<int16_t> audio(16000, 700);
    request->append(audio);
    request->end_audio();

    REQUIRE(log.wait_for(1));
    auto event = log.last();
    const auto& t = std::get<Transcript>(event);
    REQUIRE(t.is_final);
    REQUIRE(t.text == "我今天花了25元买午餐");
}

TEST_CASE("WhisperRecognizer misc", "[recognizer]") {
    FakeBackend backend;
    WhisperRecognizer recognizer(backend, quiet_options());

    SECTION("AvailabilityFollowsBackend") {
        REQUIRE(recognizer.is_available());
        backend.reachable = false;
        REQUIRE_FALSE(recognizer.is_available());
    }

    SECTION("ForeignRequestRejected") {
        class OtherRequest : public RecognitionRequest {
        public:
            void append(std::span<const int16_t>) override {}
            void end_audio() override {}
            bool partial_results() const override { return false; }
        };
        EventLog log;
        auto task = recognizer.start_task(std::make_shared<OtherRequest>(), log.handler());
        REQUIRE_FALSE(task);
    }

    SECTION("OverflowIsDropped") {
        auto opts = quiet_options();
        opts.max_samples = 1000;
        WhisperRecognizer small(backend, opts);
        auto request = small.make_request(false);
        auto* buffered = dynamic_cast<BufferedRecognitionRequest*>(request.get());
        REQUIRE(buffered);

        std::vector<int16_t> audio(1500, 1);
        buffered->append(audio);
        REQUIRE(buffered->dropped_samples() > 0);

        buffered->end_audio();
        REQUIRE(buffered->ended());
        buffered->append(audio);
    }
}
