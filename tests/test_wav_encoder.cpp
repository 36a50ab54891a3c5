#include <catch2/catch_test_macros.hpp>

#include "whisper/wav_encoder.hpp"

#include <cstdint>
#include <cstring>
#include <string>
#include <vector>

namespace {

uint16_t u16_at(const std::vector<uint8_t>& b, size_t off) {
    return static_cast<uint16_t>(b[off] | (b[off + 1] << 8));
}

uint32_t u32_at(const std::vector<uint8_t>& b, size_t off) {
    return static_cast<uint32_t>(b[off]) | (static_cast<uint32_t>(b[off + 1]) << 8) |
           (static_cast<uint32_t>(b[off + 2]) << 16) | (static_cast<uint32_t>(b[off + 3]) << 24);
}

std::string tag_at(const std::vector<uint8_t>& b, size_t off) {
    return {reinterpret_cast<const char*>(b.data() + off), 4};
}

} // namespace

TEST_CASE("wav::encode", "[wav]") {
    std::vector<int16_t> utterance = {0, 1200, -1200, 32767, -32768, 7};

    SECTION("ChunkLayout") {
        auto wav = wav::encode(utterance, 16000);
        REQUIRE(wav.size() == wav::kHeaderSize + utterance.size() * 2);
        REQUIRE(tag_at(wav, 0) == "RIFF");
        REQUIRE(tag_at(wav, 8) == "WAVE");
        REQUIRE(tag_at(wav, 12) == "fmt ");
        REQUIRE(tag_at(wav, 36) == "data");
        REQUIRE(u32_at(wav, 4) == wav.size() - 8);
        REQUIRE(u32_at(wav, 40) == utterance.size() * 2);
    }

    SECTION("MonoPcm16") {
        auto wav = wav::encode(utterance, 48000);
        REQUIRE(u16_at(wav, 20) == 1);
        REQUIRE(u16_at(wav, 22) == 1);
        REQUIRE(u32_at(wav, 24) == 48000);
        REQUIRE(u32_at(wav, 28) == 96000);
        REQUIRE(u16_at(wav, 32) == 2);
        REQUIRE(u16_at(wav, 34) == 16);
    }

    SECTION("SamplesLittleEndian") {
        auto wav = wav::encode(utterance, 16000);
        for (size_t i = 0; i < utterance.size(); ++i) {
            REQUIRE(static_cast<int16_t>(u16_at(wav, wav::kHeaderSize + i * 2)) == utterance[i]);
        }
    }

    SECTION("NoAudio") {
        auto wav = wav::encode({}, 16000);
        REQUIRE(wav.size() == wav::kHeaderSize);
        REQUIRE(u32_at(wav, 40) == 0);
    }

    SECTION("Duration") {
        REQUIRE(wav::duration_seconds(16000, 16000) == 1.0);
        REQUIRE(wav::duration_seconds(8000, 16000) == 0.5);
        REQUIRE(wav::duration_seconds(100, 0) == 0.0);
    }
}
