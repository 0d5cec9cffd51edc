#include <gtest/gtest.h>
#include "../src/core/JsonUtil.h"
#include <chrono>
#include <string>

namespace lan_probe {
namespace jsonutil {

TEST(JsonUtilTest, PlainTextUnchanged) {
    EXPECT_EQ(escape(""), "");
    EXPECT_EQ(escape("192.168.1.10 router.lan"), "192.168.1.10 router.lan");
}

TEST(JsonUtilTest, QuotesAndBackslashes) {
    EXPECT_EQ(escape("He said \"hi\""), "He said \\\"hi\\\"");
    EXPECT_EQ(escape("C:\\Windows"), "C:\\\\Windows");
}

TEST(JsonUtilTest, CommonControlCharacters) {
    EXPECT_EQ(escape("a\nb\r\tc"), "a\\nb\\r\\tc");
}

TEST(JsonUtilTest, OtherControlCharactersUseUnicodeForm) {
    EXPECT_EQ(escape(std::string("\x01", 1)), "\\u0001");
    EXPECT_EQ(escape(std::string("\x1b[0m", 4)), "\\u001b[0m");
    EXPECT_EQ(escape("\b\f"), "\\u0008\\u000c");
    EXPECT_EQ(escape(std::string("a\0b", 3)), "a\\u0000b");
}

TEST(JsonUtilTest, Utf8PassesThrough) {
    EXPECT_EQ(escape("caf\xc3\xa9"), "caf\xc3\xa9");
}

TEST(JsonUtilTest, EpochIsEmpty) {
    EXPECT_EQ(time_to_iso(std::chrono::system_clock::time_point{}), "");
}

TEST(JsonUtilTest, IsoFormatInUtc) {
    auto tp = std::chrono::system_clock::time_point(std::chrono::seconds(1700000000));
    EXPECT_EQ(time_to_iso(tp), "2023-11-14T22:13:20Z");
}

}
}
