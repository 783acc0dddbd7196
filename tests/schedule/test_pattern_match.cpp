// tests/schedule/test_pattern_match.cpp - Prioritisation pattern matching
//
// Tests: exact names (brackets literal), '*' and '?' globs, character
// classes and ranges, negation, case sensitivity, non-ASCII names and
// classes, malformed patterns.

#include <depwave/core/errors.h>
#include <depwave/schedule/pattern_match.h>

#include <gtest/gtest.h>

#include <string>
#include <vector>

using namespace depwave::schedule;
using depwave::malformed_pattern_error;

// =========================================================================
// glob_pattern
// =========================================================================

TEST(GlobPatternTest, StarMatchesAnySequence) {
    glob_pattern const p("PKG_*");
    EXPECT_TRUE(p.matches("PKG_LOAD"));
    EXPECT_TRUE(p.matches("PKG_"));
    EXPECT_FALSE(p.matches("PKG"));
    EXPECT_FALSE(p.matches("XPKG_LOAD"));
}

TEST(GlobPatternTest, StarInTheMiddle) {
    glob_pattern const p("dbo.*_STG");
    EXPECT_TRUE(p.matches("dbo.ORDERS_STG"));
    EXPECT_TRUE(p.matches("dbo._STG"));
    EXPECT_TRUE(p.matches("dbo.A_STG_STG"));
    EXPECT_FALSE(p.matches("dbo.ORDERS_STG2"));
}

TEST(GlobPatternTest, QuestionMarkMatchesOneChar) {
    glob_pattern const p("T?");
    EXPECT_TRUE(p.matches("T1"));
    EXPECT_FALSE(p.matches("T"));
    EXPECT_FALSE(p.matches("T12"));
}

TEST(GlobPatternTest, CharacterClassesAndRanges) {
    glob_pattern const p("V_[A-C]?*");
    EXPECT_TRUE(p.matches("V_AX"));
    EXPECT_TRUE(p.matches("V_CXYZ"));
    EXPECT_FALSE(p.matches("V_DX"));
    EXPECT_FALSE(p.matches("V_A"));

    glob_pattern const digits("T[0-9][0-9]");
    EXPECT_TRUE(digits.matches("T42"));
    EXPECT_FALSE(digits.matches("T4x"));
}

TEST(GlobPatternTest, NegatedClass) {
    glob_pattern const p("*[!0-9]");
    EXPECT_TRUE(p.matches("ORDERS"));
    EXPECT_FALSE(p.matches("ORDERS2"));
}

TEST(GlobPatternTest, LeadingBracketIsMember) {
    glob_pattern const p("*[]]");
    EXPECT_TRUE(p.matches("[dbo].[Orders]"));
    EXPECT_FALSE(p.matches("Orders"));
}

TEST(GlobPatternTest, CaseSensitive) {
    glob_pattern const p("pkg_*");
    EXPECT_FALSE(p.matches("PKG_LOAD"));
    EXPECT_TRUE(p.matches("pkg_load"));
}

TEST(GlobPatternTest, BacktrackingAcrossStars) {
    glob_pattern const p("*A*B*C");
    EXPECT_TRUE(p.matches("xxAyyBzzC"));
    EXPECT_TRUE(p.matches("ABC"));
    EXPECT_FALSE(p.matches("ACB"));
}

// =========================================================================
// Non-ASCII names (UTF-8)
// =========================================================================

TEST(GlobPatternTest, QuestionMarkMatchesOneNonAsciiCharacter) {
    glob_pattern const p("PKG_?");
    EXPECT_TRUE(p.matches("PKG_\xC3\xA9"));          // PKG_é
    EXPECT_TRUE(p.matches("PKG_\xE2\x82\xAC"));      // PKG_€
    EXPECT_FALSE(p.matches("PKG_\xC3\xA9\xC3\xA9"));

    glob_pattern const two("T??");
    EXPECT_TRUE(two.matches("T\xC3\xA9x"));
    EXPECT_FALSE(two.matches("T\xC3\xA9"));
}

TEST(GlobPatternTest, ClassMemberIsWholeCharacter) {
    glob_pattern const p("V_[\xC3\xA9\xC3\xB1]");    // V_[éñ]
    EXPECT_TRUE(p.matches("V_\xC3\xA9"));
    EXPECT_TRUE(p.matches("V_\xC3\xB1"));
    EXPECT_FALSE(p.matches("V_\xC3\xA0"));           // à shares the lead byte
    EXPECT_FALSE(p.matches("V_\xC3"));

    glob_pattern const negated("V_[!\xC3\xA9]");
    EXPECT_TRUE(negated.matches("V_\xC3\xB1"));
    EXPECT_FALSE(negated.matches("V_\xC3\xA9"));
}

TEST(GlobPatternTest, RangeUpToNonAsciiCharacter) {
    glob_pattern const p("[a-\xC3\xA9]*");           // [a-é]*
    EXPECT_TRUE(p.matches("abc"));
    EXPECT_TRUE(p.matches("\xC3\xA0_LOAD"));         // à is inside a..é
    EXPECT_TRUE(p.matches("\xC3\xA9"));
    EXPECT_FALSE(p.matches("\xC3\xB1"));             // ñ is past é
    EXPECT_FALSE(p.matches("A"));
}

TEST(GlobPatternTest, ReversedNonAsciiRangeNamesWholeCharacters) {
    try {
        glob_pattern const p("[\xC3\xA9-a]*");
        FAIL() << "expected malformed_pattern_error";
    } catch (malformed_pattern_error const& e) {
        EXPECT_NE(std::string(e.what()).find("'\xC3\xA9-a'"), std::string::npos);
    }
}

TEST(GlobPatternTest, InvalidUtf8BytesMatchThemselves) {
    glob_pattern const p("X?Y");
    EXPECT_TRUE(p.matches("X\xFFY"));
    EXPECT_FALSE(p.matches("X\xC3Y\xA9"));
    glob_pattern const literal("X\xFF*");
    EXPECT_TRUE(literal.matches("X\xFF" "abc"));
    EXPECT_FALSE(literal.matches("X\xFE" "abc"));
}

TEST(PriorityPatternsTest, NonAsciiGlob) {
    priority_patterns const p({"PKG_?", "dbo.Caf\xC3\xA9"});
    EXPECT_TRUE(p.matches("PKG_\xC3\xA9"));
    EXPECT_TRUE(p.matches("dbo.Caf\xC3\xA9"));
    EXPECT_FALSE(p.matches("dbo.Cafe"));
}

// =========================================================================
// Malformed patterns
// =========================================================================

TEST(GlobPatternTest, EmptyIsMalformed) {
    EXPECT_THROW(glob_pattern(""), malformed_pattern_error);
}

TEST(GlobPatternTest, UnterminatedClassIsMalformed) {
    try {
        glob_pattern const p("PKG_[AB*");
        FAIL() << "expected malformed_pattern_error";
    } catch (malformed_pattern_error const& e) {
        EXPECT_EQ(e.pattern(), "PKG_[AB*");
    }
}

TEST(GlobPatternTest, ReversedRangeIsMalformed) {
    EXPECT_THROW(glob_pattern("T[9-0]*"), malformed_pattern_error);
}

// =========================================================================
// priority_patterns
// =========================================================================

TEST(PriorityPatternsTest, DefaultIsEmpty) {
    priority_patterns const p;
    EXPECT_TRUE(p.empty());
    EXPECT_FALSE(p.matches("anything"));
}

TEST(PriorityPatternsTest, ExactAndGlob) {
    priority_patterns const p({"PKG_*", "dbo.Orders"});
    EXPECT_FALSE(p.empty());
    EXPECT_TRUE(p.matches("PKG_LOAD"));
    EXPECT_TRUE(p.matches("dbo.Orders"));
    EXPECT_FALSE(p.matches("dbo.Order"));
}

TEST(PriorityPatternsTest, BracketsLiteralWithoutWildcards) {
    // No '*' or '?': exact name, so the brackets are not a class.
    priority_patterns const p({"[dbo].[Orders]"});
    EXPECT_TRUE(p.matches("[dbo].[Orders]"));
    EXPECT_FALSE(p.matches("d"));
}

TEST(PriorityPatternsTest, MalformedSurfacesAtConstruction) {
    EXPECT_THROW(priority_patterns({"OK", "BAD[*"}), malformed_pattern_error);
    EXPECT_THROW(priority_patterns({""}), malformed_pattern_error);
}

TEST(PriorityPatternsTest, HasWildcard) {
    EXPECT_TRUE(has_wildcard("A*"));
    EXPECT_TRUE(has_wildcard("A?"));
    EXPECT_FALSE(has_wildcard("[A]"));
}
