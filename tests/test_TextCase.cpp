#include <gtest/gtest.h>
#include "utils/TextCase.hpp"

using namespace Durak;

TEST(TextCaseTest, DottedCapitalIBecomesPlainI) {
    EXPECT_EQ(TextCase::toLower("İSTANBUL"), "istanbul");
    EXPECT_EQ(TextCase::toLower("İyi"), "iyi");
}

TEST(TextCaseTest, DotlessCapitalIBecomesDotlessI) {
    EXPECT_EQ(TextCase::toLower("ISPARTA"), "ısparta");
    EXPECT_EQ(TextCase::toLower("IĞDIR"), "ığdır");
}

TEST(TextCaseTest, FoldsTurkishSpecificLetters) {
    EXPECT_EQ(TextCase::toLower("ÇĞÖŞÜ"), "çğöşü");
    EXPECT_EQ(TextCase::toLower("ÂÎÛ"), "âîû");
    EXPECT_EQ(TextCase::toLower("Çünkü"), "çünkü");
}

TEST(TextCaseTest, LowercaseInputIsUnchanged) {
    EXPECT_EQ(TextCase::toLower("ve"), "ve");
    EXPECT_EQ(TextCase::toLower("ılık"), "ılık");
    EXPECT_EQ(TextCase::toLower(""), "");
}

TEST(TextCaseTest, FoldsGreekAndCyrillic) {
    EXPECT_EQ(TextCase::toLower("МОСКВА"), "москва");
    EXPECT_EQ(TextCase::toLower("ΑΘΗΝΑ"), "αθηνα");
}

TEST(TextCaseTest, InvalidBytesPassThrough) {
    std::string input = std::string("A") + '\xFF' + "B";
    std::string expected = std::string("a") + '\xFF' + "b";
    EXPECT_EQ(TextCase::toLower(input), expected);
}

TEST(TextCaseTest, NormalizeHonoursCaseSensitivity) {
    EXPECT_EQ(TextCase::normalize("Ve", true), "Ve");
    EXPECT_EQ(TextCase::normalize("Ve", false), "ve");
}

TEST(TextCaseTest, TrimStripsSurroundingWhitespace) {
    EXPECT_EQ(TextCase::trim("  ve\r\n"), "ve");
    EXPECT_EQ(TextCase::trim("\tama bu "), "ama bu");
    EXPECT_TRUE(TextCase::trim("   \t").empty());
}
