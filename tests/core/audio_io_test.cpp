/// @file audio_io_test.cpp
/// @brief Tests for audio file decoding and WAV writing.

#include "core/audio_io.h"

#include <unistd.h>

#include <catch2/catch_test_macros.hpp>
#include <catch2/matchers/catch_matchers_floating_point.hpp>
#include <cmath>
#include <cstdint>
#include <cstdio>
#include <string>
#include <vector>

#include "util/exception.h"

using namespace chordlive;
using Catch::Matchers::WithinAbs;

namespace {

constexpr double kTwoPi = 6.283185307179586;
constexpr uint16_t kFormatPcm = 1;
constexpr uint16_t kFormatFloat = 3;

void put_u16(std::vector<uint8_t>& out, uint16_t v) {
  out.push_back(static_cast<uint8_t>(v & 0xFF));
  out.push_back(static_cast<uint8_t>(v >> 8));
}

void put_u32(std::vector<uint8_t>& out, uint32_t v) {
  for (int shift = 0; shift < 32; shift += 8) {
    out.push_back(static_cast<uint8_t>((v >> shift) & 0xFF));
  }
}

void put_tag(std::vector<uint8_t>& out, const char* tag) { out.insert(out.end(), tag, tag + 4); }

/// @brief Builds a RIFF/WAVE file around interleaved sample bytes.
std::vector<uint8_t> make_wav(uint16_t format, uint16_t channels, uint16_t bits, int sample_rate,
                              const void* payload, size_t payload_bytes) {
  const uint16_t block_align = static_cast<uint16_t>(channels * bits / 8);

  std::vector<uint8_t> out;
  put_tag(out, "RIFF");
  put_u32(out, static_cast<uint32_t>(36 + payload_bytes));
  put_tag(out, "WAVE");
  put_tag(out, "fmt ");
  put_u32(out, 16);
  put_u16(out, format);
  put_u16(out, channels);
  put_u32(out, static_cast<uint32_t>(sample_rate));
  put_u32(out, static_cast<uint32_t>(sample_rate) * block_align);
  put_u16(out, block_align);
  put_u16(out, bits);
  put_tag(out, "data");
  put_u32(out, static_cast<uint32_t>(payload_bytes));

  const auto* bytes = static_cast<const uint8_t*>(payload);
  out.insert(out.end(), bytes, bytes + payload_bytes);
  return out;
}

std::vector<float> tone(size_t n, double freq, int sr, float amplitude = 0.5f) {
  std::vector<float> out(n);
  for (size_t i = 0; i < n; ++i) {
    out[i] = amplitude * static_cast<float>(std::sin(kTwoPi * freq * i / sr));
  }
  return out;
}

std::string temp_path(const char* name) {
  return "/tmp/chordlive_" + std::to_string(getpid()) + "_" + name;
}

}  // namespace

TEST_CASE("detect_format", "[audio_io]") {
  SECTION("RIFF/WAVE") {
    std::vector<uint8_t> head = {'R', 'I', 'F', 'F', 0, 0, 0, 0, 'W', 'A', 'V', 'E'};
    REQUIRE(detect_format(head.data(), head.size()) == AudioFormat::WAV);
  }

  SECTION("ID3 tagged MP3") {
    std::vector<uint8_t> head = {'I', 'D', '3', 3, 0, 0, 0, 0, 0, 0, 0, 0};
    REQUIRE(detect_format(head.data(), head.size()) == AudioFormat::MP3);
  }

  SECTION("bare MP3 frame") {
    std::vector<uint8_t> head = {0xFF, 0xFB, 0x90, 0x64, 0, 0, 0, 0, 0, 0, 0, 0};
    REQUIRE(detect_format(head.data(), head.size()) == AudioFormat::MP3);
  }

  SECTION("anything else") {
    std::vector<uint8_t> head(12, 0x11);
    REQUIRE(detect_format(head.data(), head.size()) == AudioFormat::Unknown);
    REQUIRE(detect_format(head.data(), 3) == AudioFormat::Unknown);
  }
}

TEST_CASE("load_buffer_wav float samples are exact", "[audio_io]") {
  auto original = tone(1500, 261.63, 22050);
  auto wav = make_wav(kFormatFloat, 1, 32, 22050, original.data(), original.size() * sizeof(float));

  auto [loaded, sr] = load_buffer_wav(wav.data(), wav.size());
  REQUIRE(sr == 22050);
  REQUIRE(loaded == original);
}

TEST_CASE("load_buffer_wav scales 16-bit samples", "[audio_io]") {
  std::vector<int16_t> pcm = {0, 16384, -16384, 32767, -32768};
  auto wav = make_wav(kFormatPcm, 1, 16, 48000, pcm.data(), pcm.size() * sizeof(int16_t));

  auto [loaded, sr] = load_buffer_wav(wav.data(), wav.size());
  REQUIRE(sr == 48000);
  REQUIRE(loaded.size() == pcm.size());
  REQUIRE_THAT(loaded[0], WithinAbs(0.0f, 1e-6f));
  REQUIRE_THAT(loaded[1], WithinAbs(0.5f, 1e-4f));
  REQUIRE_THAT(loaded[2], WithinAbs(-0.5f, 1e-4f));
  REQUIRE_THAT(loaded[3], WithinAbs(1.0f, 1e-4f));
  REQUIRE_THAT(loaded[4], WithinAbs(-1.0f, 1e-4f));
}

TEST_CASE("load_buffer_wav averages channels", "[audio_io]") {
  // Interleaved L/R frames
  std::vector<float> frames;
  for (int i = 0; i < 600; ++i) {
    frames.push_back(0.5f);
    frames.push_back(-0.25f);
  }
  auto wav = make_wav(kFormatFloat, 2, 32, 22050, frames.data(), frames.size() * sizeof(float));

  auto [loaded, sr] = load_buffer_wav(wav.data(), wav.size());
  REQUIRE(sr == 22050);
  REQUIRE(loaded.size() == 600);
  REQUIRE_THAT(loaded.front(), WithinAbs(0.125f, 1e-6f));
  REQUIRE_THAT(loaded.back(), WithinAbs(0.125f, 1e-6f));
}

TEST_CASE("load_buffer dispatches on content", "[audio_io]") {
  auto original = tone(400, 440.0, 16000);
  auto wav = make_wav(kFormatFloat, 1, 32, 16000, original.data(), original.size() * sizeof(float));

  auto [loaded, sr] = load_buffer(wav.data(), wav.size());
  REQUIRE(sr == 16000);
  REQUIRE(loaded.size() == 400);

  std::vector<uint8_t> junk(64, 0x42);
  try {
    load_buffer(junk.data(), junk.size());
    FAIL("expected ChordliveException");
  } catch (const ChordliveException& e) {
    REQUIRE(e.code() == ErrorCode::InvalidFormat);
  }
}

TEST_CASE("load_audio errors", "[audio_io]") {
  SECTION("missing file") {
    try {
      load_audio("/nonexistent/chordlive/missing.wav");
      FAIL("expected ChordliveException");
    } catch (const ChordliveException& e) {
      REQUIRE(e.code() == ErrorCode::FileNotFound);
    }
  }

  SECTION("size limit") {
    std::string path = temp_path("limit.wav");
    save_wav(path, tone(2000, 440.0, 8000), 8000);

    AudioLoadOptions options;
    options.max_file_size = 1000;
    REQUIRE_THROWS_AS(load_audio(path, options), ChordliveException);

    options.max_file_size = 0;
    auto [loaded, sr] = load_audio(path, options);
    std::remove(path.c_str());
    REQUIRE(loaded.size() == 2000);
    REQUIRE(sr == 8000);
  }
}

TEST_CASE("save_wav round trip", "[audio_io]") {
  auto original = tone(4000, 330.0, 16000);
  original.push_back(1.5f);  // clipped on write

  std::string path = temp_path("save_wav.wav");
  save_wav(path, original, 16000);
  auto [loaded, sr] = load_audio(path);
  std::remove(path.c_str());

  REQUIRE(sr == 16000);
  REQUIRE(loaded.size() == original.size());
  for (size_t i = 0; i + 1 < loaded.size(); i += 97) {
    REQUIRE_THAT(loaded[i], WithinAbs(original[i], 2.0f / 32767.0f));
  }
  REQUIRE_THAT(loaded.back(), WithinAbs(1.0f, 1e-3f));
}

TEST_CASE("save_wav rejects bad input", "[audio_io]") {
  REQUIRE_THROWS_AS(save_wav(temp_path("empty.wav"), {}, 22050), ChordliveException);
  REQUIRE_THROWS_AS(save_wav(temp_path("rate.wav"), {0.1f}, 0), ChordliveException);
}
