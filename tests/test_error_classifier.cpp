#include <catch2/catch_test_macros.hpp>

#include "recognition/error_classifier.hpp"
#include "recognition/recognizer.hpp"

#include <string>

using namespace recognition_error;

TEST_CASE("Recognition error classification", "[recognition]") {

    SECTION("OwnCancellationIsIgnored") {
        REQUIRE(classify(kRequestDomain, kRequestCanceled) == ErrorDisposition::Ignore);
    }

    SECTION("AssistantTransientsAreIgnored") {
        REQUIRE(classify(kAssistantDomain, kAssistantInternal) == ErrorDisposition::Ignore);
        REQUIRE(classify(kAssistantDomain, kNoSpeechDetected) == ErrorDisposition::Ignore);
    }

    SECTION("CodesOnlyCountInTheirDomain") {
        REQUIRE(classify(kAssistantDomain, kRequestCanceled) == ErrorDisposition::Surface);
        REQUIRE(classify(kRequestDomain, kNoSpeechDetected) == ErrorDisposition::Surface);
        REQUIRE(classify(kBackendDomain, kRequestCanceled) == ErrorDisposition::Surface);
    }

    SECTION("EverythingElseSurfaces") {
        REQUIRE(classify(kBackendDomain, kBackendUnreachable) == ErrorDisposition::Surface);
        REQUIRE(classify(kBackendDomain, kBackendFailed) == ErrorDisposition::Surface);
        REQUIRE(classify(kAssistantDomain, 1700) == ErrorDisposition::Surface);
        REQUIRE(classify("", 0) == ErrorDisposition::Surface);
    }

    SECTION("Names") {
        REQUIRE(std::string(to_string(ErrorDisposition::Ignore)) == "ignore");
        REQUIRE(std::string(to_string(ErrorDisposition::Surface)) == "surface");
    }
}
