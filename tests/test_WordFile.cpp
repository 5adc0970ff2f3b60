#include <gtest/gtest.h>
#include "TestBundle.hpp"
#include "utils/WordFile.hpp"
#include "models/Errors.hpp"

using namespace Durak;
using DurakTest::TempBundle;

TEST(WordFileTest, SkipsCommentsAndBlankLines) {
    TempBundle bundle;
    auto path = bundle.write("custom.txt", "# comment\nServis\n\n   \nveri\n  # indented comment\n");

    EXPECT_EQ(loadStopwords(path), (WordSet{"servis", "veri"}));
}

TEST(WordFileTest, TrimsEntriesAndHandlesCrLf) {
    TempBundle bundle;
    auto path = bundle.write("crlf.txt", "  ve  \r\nama\r\n");

    EXPECT_EQ(loadStopwords(path), (WordSet{"ama", "ve"}));
}

TEST(WordFileTest, FoldsTurkishCase) {
    TempBundle bundle;
    auto path = bundle.write("tr.txt", "İKİ\nIRMAK\n");

    EXPECT_EQ(loadStopwords(path), (WordSet{"iki", "ırmak"}));
}

TEST(WordFileTest, CaseSensitiveKeepsEntriesVerbatim) {
    TempBundle bundle;
    auto path = bundle.write("cs.txt", "Durak\ndurak\n");

    EXPECT_EQ(loadStopwords(path, true), (WordSet{"Durak", "durak"}));
    EXPECT_EQ(loadStopwords(path, false), (WordSet{"durak"}));
}

TEST(WordFileTest, MissingFileThrows) {
    TempBundle bundle;
    auto missing = bundle.path() / "nope.txt";

    try {
        loadStopwords(missing);
        FAIL() << "expected MissingFileError";
    } catch (const MissingFileError& e) {
        EXPECT_EQ(e.filePath(), missing.string());
        EXPECT_NE(std::string(e.what()).find("nope.txt"), std::string::npos);
    }
}
