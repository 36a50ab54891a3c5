#include "recognition/error_classifier.hpp"

#include "recognition/recognizer.hpp"

ErrorDisposition classify(std::string_view domain, int code) {
    using namespace recognition_error;

    if (domain == kRequestDomain && code == kRequestCanceled) {
        return ErrorDisposition::Ignore;
    }
    if (domain == kAssistantDomain &&
        (code == kAssistantInternal || code == kNoSpeechDetected)) {
        return ErrorDisposition::Ignore;
    }
    return ErrorDisposition::Surface;
}

const char* to_string(ErrorDisposition d) {
    return d == ErrorDisposition::Ignore ? "ignore" : "surface";
}
