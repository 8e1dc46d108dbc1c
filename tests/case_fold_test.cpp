#include <gtest/gtest.h>
#include <string>
#include "case_fold.hpp"

using dfl::text::fold_case;
using dfl::text::fold_code_point;
using dfl::text::trim;

TEST(CaseFold, LowercasesAscii) {
    EXPECT_EQ(fold_case("SpAm"), "spam");
    EXPECT_EQ(fold_case("Hello, World! 123"), "hello, world! 123");
    EXPECT_EQ(fold_case(""), "");
}

TEST(CaseFold, LeavesSpecialCharactersAlone) {
    EXPECT_EQ(fold_case("@#$%^&*()"), "@#$%^&*()");
    EXPECT_EQ(fold_case("line1\nLINE2\t"), "line1\nline2\t");
}

TEST(CaseFold, LatinSupplement) {
    EXPECT_EQ(fold_case("CAFÉ"), "café");
    EXPECT_EQ(fold_case("ÀÉÎÕÜ"), "àéîõü");
    // Multiplication sign has no lowercase form.
    EXPECT_EQ(fold_case("×"), "×");
    EXPECT_EQ(fold_case("ß"), "ß");
}

TEST(CaseFold, LatinExtendedA) {
    EXPECT_EQ(fold_case("ŁÓDŹ"), "łódź");
    EXPECT_EQ(fold_case("ŠŽČ"), "šžč");
    EXPECT_EQ(fold_code_point(0x0178), char32_t{0x00FF});
}

TEST(CaseFold, DottedCapitalIShrinksToAscii) {
    const auto folded = fold_case("İSTANBUL");
    EXPECT_EQ(folded, "istanbul");
    EXPECT_EQ(folded.size(), std::string("İSTANBUL").size() - 1);
}

TEST(CaseFold, GreekAndCyrillic) {
    EXPECT_EQ(fold_case("ΣΠΑΜ"), "σπαμ");
    EXPECT_EQ(fold_case("СПАМ"), "спам");
    EXPECT_EQ(fold_case("ЁЖИК"), "ёжик");
}

TEST(CaseFold, ArmenianAndFullwidth) {
    EXPECT_EQ(fold_code_point(0x0531), char32_t{0x0561});
    EXPECT_EQ(fold_case("ＳＰＡＭ"), "ｓｐａｍ");
}

TEST(CaseFold, OtherScriptsUnchanged) {
    EXPECT_EQ(fold_case("日本語"), "日本語");
    // Greek Extended is outside the folded ranges.
    EXPECT_EQ(fold_case("Ἀ"), "Ἀ");
    EXPECT_EQ(fold_case("😀 OK"), "😀 ok");
}

TEST(CaseFold, InvalidBytesPassThrough) {
    const std::string broken = "A\xC3" "B\xFF\xE2\x82";
    EXPECT_EQ(fold_case(broken), "a\xC3" "b\xFF\xE2\x82");

    // Overlong encoding of '/' and an encoded surrogate stay as they are.
    const std::string overlong = "\xC0\xAF";
    EXPECT_EQ(fold_case(overlong), overlong);
    const std::string surrogate = "\xED\xA0\x80";
    EXPECT_EQ(fold_case(surrogate), surrogate);
}

TEST(CaseFold, IsIdempotent) {
    const std::string input = "Déjà VU ΣΠΑΜ Москва";
    const auto once = fold_case(input);
    EXPECT_EQ(fold_case(once), once);
}

TEST(Trim, StripsAsciiWhitespace) {
    EXPECT_EQ(trim("  spam \t\n"), "spam");
    EXPECT_EQ(trim("spam"), "spam");
    EXPECT_EQ(trim(" \t\r\n"), "");
    EXPECT_EQ(trim(""), "");
    EXPECT_EQ(trim(" two words "), "two words");
}
