#include <gtest/gtest.h>

#include <transliterate.h>

using namespace nameguard;

TEST(Transliterate, Accents) {
    EXPECT_EQ(transliterate("École"), "Ecole");
    EXPECT_EQ(transliterate("naïve"), "naive");
    EXPECT_EQ(transliterate("Ångström"), "Angstrom");
    EXPECT_EQ(transliterate("façade"), "facade");
    EXPECT_EQ(transliterate("łódź"), "lodz");
    EXPECT_EQ(transliterate("Šťastný"), "Stastny");
}

TEST(Transliterate, Ligatures) {
    EXPECT_EQ(transliterate("Æther"), "AEther");
    EXPECT_EQ(transliterate("Œuvre"), "OEuvre");
    EXPECT_EQ(transliterate("Ĳssel"), "IJssel");
    EXPECT_EQ(transliterate("Straße"), "Strase");
}

TEST(Transliterate, ExtendedB) {
    EXPECT_EQ(transliterate("ƒ"), "f");
    EXPECT_EQ(transliterate("Ǻǻ"), "Aa");
    EXPECT_EQ(transliterate("ǜ"), "u");
}

TEST(Transliterate, PassThrough) {
    EXPECT_EQ(transliterate(""), "");
    EXPECT_EQ(transliterate("plain_ASCII-123"), "plain_ASCII-123");
    EXPECT_EQ(transliterate("日本"), "日本");
    EXPECT_EQ(transliterate("Имя"), "Имя");
    // Not in the table
    EXPECT_EQ(transliterate("Þorn"), "Þorn");
}

TEST(Transliterate, MalformedUtf8) {
    EXPECT_EQ(transliterate("a\xc3"), "a\xc3");
    EXPECT_EQ(transliterate("\xc3x"), "\xc3x");
    EXPECT_EQ(transliterate("\xa9\xc3\xa9"), "\xa9" "e");
}
