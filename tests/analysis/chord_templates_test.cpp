/// @file chord_templates_test.cpp
/// @brief Tests for chord templates.

#include "analysis/chord_templates.h"

#include <catch2/catch_test_macros.hpp>
#include <catch2/matchers/catch_matchers_floating_point.hpp>
#include <set>
#include <string>

using namespace chordlive;
using Catch::Matchers::WithinAbs;

TEST_CASE("create_major_template", "[chord_templates]") {
  auto c_major = create_major_template(PitchClass::C);

  REQUIRE(c_major.root == PitchClass::C);
  REQUIRE(c_major.quality == ChordQuality::Major);

  // C major = C, E, G (indices 0, 4, 7)
  REQUIRE_THAT(c_major.pattern[0], WithinAbs(1.0f, 0.001f));  // C
  REQUIRE_THAT(c_major.pattern[4], WithinAbs(1.0f, 0.001f));  // E
  REQUIRE_THAT(c_major.pattern[7], WithinAbs(1.0f, 0.001f));  // G

  // Other notes should be 0
  REQUIRE_THAT(c_major.pattern[1], WithinAbs(0.0f, 0.001f));
  REQUIRE_THAT(c_major.pattern[3], WithinAbs(0.0f, 0.001f));
  REQUIRE(c_major.tone_count() == 3);
}

TEST_CASE("create_minor_template", "[chord_templates]") {
  auto a_minor = create_minor_template(PitchClass::A);

  REQUIRE(a_minor.root == PitchClass::A);
  REQUIRE(a_minor.quality == ChordQuality::Minor);

  // A minor = A, C, E (indices 9, 0, 4)
  REQUIRE_THAT(a_minor.pattern[9], WithinAbs(1.0f, 0.001f));  // A
  REQUIRE_THAT(a_minor.pattern[0], WithinAbs(1.0f, 0.001f));  // C
  REQUIRE_THAT(a_minor.pattern[4], WithinAbs(1.0f, 0.001f));  // E
  REQUIRE(a_minor.tone_count() == 3);
}

TEST_CASE("ChordTemplate to_string", "[chord_templates]") {
  REQUIRE(create_major_template(PitchClass::C).to_string() == "C");
  REQUIRE(create_minor_template(PitchClass::C).to_string() == "Cm");
  REQUIRE(create_major_template(PitchClass::Cs).to_string() == "C#");
  REQUIRE(create_minor_template(PitchClass::Fs).to_string() == "F#m");
  REQUIRE(create_major_template(PitchClass::B).to_string() == "B");
}

TEST_CASE("transpose_template", "[chord_templates]") {
  auto c_major = create_major_template(PitchClass::C);

  SECTION("up a fifth") {
    auto g_major = transpose_template(c_major, 7);
    REQUIRE(g_major.root == PitchClass::G);
    REQUIRE(g_major.pattern == create_major_template(PitchClass::G).pattern);
  }

  SECTION("wraps past B") {
    auto b_major = transpose_template(c_major, -1);
    REQUIRE(b_major.root == PitchClass::B);
    // B major = B, D#, F#
    REQUIRE(b_major.pattern[11] == 1.0f);
    REQUIRE(b_major.pattern[3] == 1.0f);
    REQUIRE(b_major.pattern[6] == 1.0f);
  }

  SECTION("octave is identity") {
    auto same = transpose_template(c_major, 12);
    REQUIRE(same.root == PitchClass::C);
    REQUIRE(same.pattern == c_major.pattern);
  }
}

TEST_CASE("generate_triad_templates", "[chord_templates]") {
  auto templates = generate_triad_templates();

  REQUIRE(templates.size() == 24);

  // Ordered by root, major before minor
  for (int root = 0; root < kNumPitchClasses; ++root) {
    const auto& major = templates[2 * root];
    const auto& minor = templates[2 * root + 1];
    REQUIRE(static_cast<int>(major.root) == root);
    REQUIRE(major.quality == ChordQuality::Major);
    REQUIRE(static_cast<int>(minor.root) == root);
    REQUIRE(minor.quality == ChordQuality::Minor);
  }

  // Every pattern is binary with exactly three tones
  for (const auto& t : templates) {
    int ones = 0;
    for (float v : t.pattern) {
      REQUIRE((v == 0.0f || v == 1.0f));
      if (v == 1.0f) ++ones;
    }
    REQUIRE(ones == 3);
  }

  std::set<std::string> labels;
  for (const auto& t : templates) labels.insert(t.to_string());
  REQUIRE(labels.size() == 24);
}

TEST_CASE("default_chord_bank is shared", "[chord_templates]") {
  const auto& a = default_chord_bank();
  const auto& b = default_chord_bank();

  REQUIRE(&a == &b);
  REQUIRE(a.size() == 24);
  REQUIRE(a.front().to_string() == "C");
  REQUIRE(a.back().to_string() == "Bm");
}

TEST_CASE("chord_quality_to_string", "[chord_templates]") {
  REQUIRE(chord_quality_to_string(ChordQuality::Major).empty());
  REQUIRE(chord_quality_to_string(ChordQuality::Minor) == "m");
  REQUIRE(pitch_class_to_string(PitchClass::Gs) == "G#");
}
