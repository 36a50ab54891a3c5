#include "lan_backend.hpp"
#include "wav_encoder.hpp"

#include <chrono>
#include <curl/curl.h>
#include <nlohmann/json.hpp>

using json = nlohmann::json;

namespace {

size_t write_callback(char* ptr, size_t size, size_t nmemb, void* userdata) {
    auto* resp = static_cast<std::string*>(userdata);
    resp->append(ptr, size * nmemb);
    return size * nmemb;
}

// Non-zero return aborts the transfer with CURLE_ABORTED_BY_CALLBACK.
int progress_callback(void* userdata, curl_off_t, curl_off_t, curl_off_t, curl_off_t) {
    auto* stop = static_cast<std::stop_token*>(userdata);
    return stop->stop_requested() ? 1 : 0;
}

void add_field(curl_mime* mime, const char* name, const std::string& value) {
    auto* part = curl_mime_addpart(mime);
    curl_mime_name(part, name);
    curl_mime_data(part, value.c_str(), CURL_ZERO_TERMINATED);
}

std::string trim(const std::string& s) {
    auto first = s.find_first_not_of(" \t\n\r");
    if (first == std::string::npos) return {};
    auto last = s.find_last_not_of(" \t\n\r");
    return s.substr(first, last - first + 1);
}

} // namespace

LanBackend::LanBackend(std::string url, std::string api_format, std::string language)
    : url_(std::move(url)), api_format_(std::move(api_format)),
      language_(std::move(language)) {
    curl_global_init(CURL_GLOBAL_DEFAULT);
}

LanBackend::~LanBackend() {
    curl_global_cleanup();
}

std::string LanBackend::endpoint() const {
    return api_format_ == "openai" ? url_ + "/v1/audio/transcriptions" : url_ + "/inference";
}

std::expected<TranscriptResult, BackendError>
LanBackend::transcribe(std::span<const int16_t> audio, uint32_t sample_rate,
                       std::stop_token stop) {
    if (audio.empty()) {
        return std::unexpected(BackendError{.message = "empty audio"});
    }

    double duration_s = wav::duration_seconds(audio.size(), sample_rate);
    auto wav_data = wav::encode(audio, sample_rate);

    auto start = std::chrono::steady_clock::now();

    CURL* curl = curl_easy_init();
    if (!curl) {
        return std::unexpected(BackendError{.message = "curl_easy_init failed"});
    }

    curl_mime* mime = curl_mime_init(curl);
    auto* file = curl_mime_addpart(mime);
    curl_mime_name(file, "file");
    curl_mime_data(file, reinterpret_cast<const char*>(wav_data.data()), wav_data.size());
    curl_mime_filename(file, "audio.wav");
    curl_mime_type(file, "audio/wav");

    add_field(mime, "response_format", "json");
    if (api_format_ == "openai") {
        add_field(mime, "model", "whisper-1");
        add_field(mime, "language", language_);
    } else {
        add_field(mime, "temperature", "0.0");
        if (!language_.empty()) add_field(mime, "language", language_);
    }

    std::string response_body;
    auto url = endpoint();

    curl_easy_setopt(curl, CURLOPT_URL, url.c_str());
    curl_easy_setopt(curl, CURLOPT_MIMEPOST, mime);
    curl_easy_setopt(curl, CURLOPT_WRITEFUNCTION, write_callback);
    curl_easy_setopt(curl, CURLOPT_WRITEDATA, &response_body);
    curl_easy_setopt(curl, CURLOPT_TIMEOUT, 120L);
    curl_easy_setopt(curl, CURLOPT_CONNECTTIMEOUT, 10L);
    curl_easy_setopt(curl, CURLOPT_NOPROGRESS, 0L);
    curl_easy_setopt(curl, CURLOPT_XFERINFOFUNCTION, progress_callback);
    curl_easy_setopt(curl, CURLOPT_XFERINFODATA, &stop);

    CURLcode res = curl_easy_perform(curl);

    curl_mime_free(mime);
    curl_easy_cleanup(curl);

    auto end = std::chrono::steady_clock::now();
    double processing_s = std::chrono::duration<double>(end - start).count();

    if (res == CURLE_ABORTED_BY_CALLBACK) {
        return std::unexpected(BackendError{.cancelled = true, .message = "cancelled"});
    }
    if (res != CURLE_OK) {
        bool unreachable = res == CURLE_COULDNT_CONNECT || res == CURLE_COULDNT_RESOLVE_HOST ||
                           res == CURLE_OPERATION_TIMEDOUT;
        return std::unexpected(BackendError{
            .unreachable = unreachable,
            .message = std::string("curl error: ") + curl_easy_strerror(res),
        });
    }

    try {
        auto j = json::parse(response_body);
        if (j.contains("text")) {
            return TranscriptResult{
                .text = trim(j["text"].get<std::string>()),
                .duration_s = duration_s,
                .processing_s = processing_s,
            };
        }
        if (j.contains("error")) {
            auto& err = j["error"];
            auto msg = err.is_string() ? err.get<std::string>() : err.dump();
            return std::unexpected(BackendError{.message = "server error: " + msg});
        }
        return std::unexpected(BackendError{.message = "unexpected response: " + response_body});
    } catch (const json::exception& e) {
        return std::unexpected(BackendError{.message = std::string("JSON parse error: ") + e.what()});
    }
}

bool LanBackend::available() const {
    CURL* curl = curl_easy_init();
    if (!curl) return false;

    curl_easy_setopt(curl, CURLOPT_URL, url_.c_str());
    curl_easy_setopt(curl, CURLOPT_NOBODY, 1L);
    curl_easy_setopt(curl, CURLOPT_TIMEOUT, 2L);
    curl_easy_setopt(curl, CURLOPT_CONNECTTIMEOUT, 2L);

    CURLcode res = curl_easy_perform(curl);
    curl_easy_cleanup(curl);

    // Any HTTP answer, even 404 on the root, means the server is up.
    return res == CURLE_OK;
}
