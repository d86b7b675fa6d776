/*
 * Copyright (C) 2025 James C. Owens
 *
 * This code is licensed under the MIT license. See LICENSE.md in the repository.
 */

#include <gtest/gtest.h>
#include <util.h>

#include <cstdlib>
#include <filesystem>
#include <fstream>

namespace fs = std::filesystem;

// ============================================================================
// StringSplit
// ============================================================================

TEST(StringSplit, BasicSplit)
{
    auto result = StringSplit("a:b:c", ":");
    ASSERT_EQ(result.size(), 3u);
    EXPECT_EQ(result[0], "a");
    EXPECT_EQ(result[1], "b");
    EXPECT_EQ(result[2], "c");
}

TEST(StringSplit, MultiCharDelimiter)
{
    auto result = StringSplit("one::two::three", "::");
    ASSERT_EQ(result.size(), 3u);
    EXPECT_EQ(result[0], "one");
    EXPECT_EQ(result[1], "two");
    EXPECT_EQ(result[2], "three");
}

TEST(StringSplit, NoDelimiterFound)
{
    auto result = StringSplit("nodelimiter", ":");
    ASSERT_EQ(result.size(), 1u);
    EXPECT_EQ(result[0], "nodelimiter");
}

TEST(StringSplit, EmptyString)
{
    auto result = StringSplit("", ":");
    ASSERT_EQ(result.size(), 1u);
    EXPECT_EQ(result[0], "");
}

TEST(StringSplit, TrailingDelimiter)
{
    auto result = StringSplit("a:b:", ":");
    ASSERT_EQ(result.size(), 3u);
    EXPECT_EQ(result[0], "a");
    EXPECT_EQ(result[1], "b");
    EXPECT_EQ(result[2], "");
}

TEST(StringSplit, LeadingDelimiter)
{
    auto result = StringSplit(":a:b", ":");
    ASSERT_EQ(result.size(), 3u);
    EXPECT_EQ(result[0], "");
    EXPECT_EQ(result[1], "a");
    EXPECT_EQ(result[2], "b");
}

TEST(StringSplit, ConsecutiveDelimiters)
{
    auto result = StringSplit("a::b", ":");
    ASSERT_EQ(result.size(), 3u);
    EXPECT_EQ(result[0], "a");
    EXPECT_EQ(result[1], "");
    EXPECT_EQ(result[2], "b");
}

// ============================================================================
// TrimString
// ============================================================================

TEST(TrimString, WhitespaceTrimming)
{
    EXPECT_EQ(TrimString("  hello  "), "hello");
    EXPECT_EQ(TrimString("\t\nhello\r\n"), "hello");
}

TEST(TrimString, NoTrimmingNeeded)
{
    EXPECT_EQ(TrimString("hello"), "hello");
}

TEST(TrimString, CustomPattern)
{
    EXPECT_EQ(TrimString("xxhelloxx", "x"), "hello");
}

TEST(TrimString, EmptyString)
{
    EXPECT_EQ(TrimString(""), "");
}

TEST(TrimString, AllWhitespace)
{
    EXPECT_EQ(TrimString("   \t\n  "), "");
}

TEST(TrimString, InternalWhitespacePreserved)
{
    EXPECT_EQ(TrimString("  hello world  "), "hello world");
}

// ============================================================================
// StripQuotes
// ============================================================================

TEST(StripQuotes, DoubleQuotes)
{
    EXPECT_EQ(StripQuotes("\"hello\""), "hello");
}

TEST(StripQuotes, SingleQuotes)
{
    EXPECT_EQ(StripQuotes("'hello'"), "hello");
}

TEST(StripQuotes, MixedQuotes)
{
    EXPECT_EQ(StripQuotes("\"hello'"), "hello");
    EXPECT_EQ(StripQuotes("'hello\""), "hello");
}

TEST(StripQuotes, NoQuotes)
{
    EXPECT_EQ(StripQuotes("hello"), "hello");
}

TEST(StripQuotes, EmptyString)
{
    EXPECT_EQ(StripQuotes(""), "");
}

TEST(StripQuotes, QuotesOnly)
{
    EXPECT_EQ(StripQuotes("\"\""), "");
    EXPECT_EQ(StripQuotes("''"), "");
}

TEST(StripQuotes, SingleCharacterQuote)
{
    EXPECT_EQ(StripQuotes("\""), "");
    EXPECT_EQ(StripQuotes("'"), "");
}

// ============================================================================
// ToLower
// ============================================================================

TEST(ToLower, CharUppercase)
{
    EXPECT_EQ(ToLower(std::string("A")), "a");
    EXPECT_EQ(ToLower(std::string("Z")), "z");
}

TEST(ToLower, CharLowercase)
{
    EXPECT_EQ(ToLower(std::string("a")), "a");
}

TEST(ToLower, CharNonAlpha)
{
    EXPECT_EQ(ToLower(std::string("1")), "1");
    EXPECT_EQ(ToLower(std::string("!")), "!");
}

TEST(ToLower, StringMixedCase)
{
    EXPECT_EQ(ToLower(std::string("Hello World")), "hello world");
}

TEST(ToLower, StringEmpty)
{
    EXPECT_EQ(ToLower(std::string("")), "");
}

TEST(ToLower, StringAllUpper)
{
    EXPECT_EQ(ToLower(std::string("ABCXYZ")), "abcxyz");
}

// ============================================================================
// GetUnixEpochTime
// ============================================================================

TEST(GetUnixEpochTime, ReasonableValue)
{
    int64_t now = GetUnixEpochTime();

    // Must be after 2024-01-01 (1704067200)
    EXPECT_GT(now, 1704067200);

    // Must not be more than 1 second in the future relative to a second call
    int64_t now2 = GetUnixEpochTime();
    EXPECT_LE(now, now2 + 1);
}

// ============================================================================
// FormatISO8601DateTime
// ============================================================================

TEST(FormatISO8601DateTime, Epoch)
{
    EXPECT_EQ(FormatISO8601DateTime(0), "1970-01-01T00:00:00Z");
}

TEST(FormatISO8601DateTime, KnownTimestamp)
{
    // 2001-09-09T01:46:40Z = 1000000000
    EXPECT_EQ(FormatISO8601DateTime(1000000000), "2001-09-09T01:46:40Z");
}

TEST(FormatISO8601DateTime, AnotherKnownTimestamp)
{
    // 2024-01-01T00:00:00Z = 1704067200
    EXPECT_EQ(FormatISO8601DateTime(1704067200), "2024-01-01T00:00:00Z");
}

// ============================================================================
// ParseStringToInt
// ============================================================================

TEST(ParseStringToInt, ValidInt)
{
    EXPECT_EQ(ParseStringToInt("42"), 42);
}

TEST(ParseStringToInt, Negative)
{
    EXPECT_EQ(ParseStringToInt("-10"), -10);
}

TEST(ParseStringToInt, Zero)
{
    EXPECT_EQ(ParseStringToInt("0"), 0);
}

TEST(ParseStringToInt, InvalidString)
{
    EXPECT_THROW((void)ParseStringToInt("abc"), std::invalid_argument);
}

TEST(ParseStringToInt, EmptyString)
{
    EXPECT_THROW((void)ParseStringToInt(""), std::invalid_argument);
}

TEST(ParseStringToInt, Overflow)
{
    EXPECT_THROW((void)ParseStringToInt("99999999999999999999"), std::out_of_range);
}

TEST(ParseStringToInt, TrailingCharactersRejected)
{
    EXPECT_THROW((void)ParseStringToInt("1h"), std::invalid_argument);
    EXPECT_THROW((void)ParseStringToInt("90m"), std::invalid_argument);
    EXPECT_THROW((void)ParseStringToInt("60 s"), std::invalid_argument);
}

TEST(ParseStringToInt, SurroundingWhitespaceAllowed)
{
    EXPECT_EQ(ParseStringToInt(" 3600 "), 3600);
    EXPECT_EQ(ParseStringToInt("42\n"), 42);
}

// ============================================================================
// ParseStringtoInt64
// ============================================================================

TEST(ParseStringtoInt64, ValidInt64)
{
    EXPECT_EQ(ParseStringtoInt64("1000000000000"), 1000000000000LL);
}

TEST(ParseStringtoInt64, Negative)
{
    EXPECT_EQ(ParseStringtoInt64("-5000000000"), -5000000000LL);
}

TEST(ParseStringtoInt64, Zero)
{
    EXPECT_EQ(ParseStringtoInt64("0"), 0);
}

TEST(ParseStringtoInt64, LargeValue)
{
    EXPECT_EQ(ParseStringtoInt64("9223372036854775807"), INT64_MAX);
}

TEST(ParseStringtoInt64, InvalidString)
{
    EXPECT_THROW((void)ParseStringtoInt64("not_a_number"), std::invalid_argument);
}

TEST(ParseStringtoInt64, Overflow)
{
    EXPECT_THROW((void)ParseStringtoInt64("99999999999999999999999"), std::out_of_range);
}

TEST(ParseStringtoInt64, TrailingCharactersRejected)
{
    EXPECT_THROW((void)ParseStringtoInt64("17000abc"), std::invalid_argument);
    EXPECT_EQ(ParseStringtoInt64("17000\n"), 17000);
}

// ============================================================================
// ParseStringToBool
// ============================================================================

TEST(ParseStringToBool, TrueForms)
{
    EXPECT_EQ(ParseStringToBool("true"), std::optional<bool>(true));
    EXPECT_EQ(ParseStringToBool("TRUE"), std::optional<bool>(true));
    EXPECT_EQ(ParseStringToBool("1"), std::optional<bool>(true));
    EXPECT_EQ(ParseStringToBool(" true "), std::optional<bool>(true));
}

TEST(ParseStringToBool, FalseForms)
{
    EXPECT_EQ(ParseStringToBool("false"), std::optional<bool>(false));
    EXPECT_EQ(ParseStringToBool("False"), std::optional<bool>(false));
    EXPECT_EQ(ParseStringToBool("0"), std::optional<bool>(false));
}

TEST(ParseStringToBool, InvalidValue)
{
    EXPECT_FALSE(ParseStringToBool("yes").has_value());
    EXPECT_FALSE(ParseStringToBool("").has_value());
    EXPECT_FALSE(ParseStringToBool("2").has_value());
}

// ============================================================================
// ReadLastLines
// ============================================================================

class ReadLastLinesTest : public ::testing::Test
{
protected:
    fs::path m_test_dir;
    fs::path m_file_path;

    void SetUp() override
    {
        m_test_dir = fs::temp_directory_path() / "idle_shutdown_test_readlastlines";
        fs::create_directories(m_test_dir);
        m_file_path = m_test_dir / "lines.txt";
    }

    void TearDown() override
    {
        fs::remove_all(m_test_dir);
    }

    void WriteFile(const std::string& content)
    {
        std::ofstream f(m_file_path, std::ios::binary);
        f << content;
        f.close();
    }
};

TEST_F(ReadLastLinesTest, NonExistentFileThrows)
{
    EXPECT_THROW((void)ReadLastLines(m_test_dir / "missing.txt", 10), FileSystemException);
}

TEST_F(ReadLastLinesTest, EmptyFile)
{
    WriteFile("");
    EXPECT_TRUE(ReadLastLines(m_file_path, 10).empty());
}

TEST_F(ReadLastLinesTest, FewerLinesThanRequested)
{
    WriteFile("one\ntwo\nthree\n");

    auto result = ReadLastLines(m_file_path, 10);
    ASSERT_EQ(result.size(), 3u);
    EXPECT_EQ(result[0], "one");
    EXPECT_EQ(result[2], "three");
}

TEST_F(ReadLastLinesTest, LastNLines)
{
    WriteFile("one\ntwo\nthree\nfour\n");

    auto result = ReadLastLines(m_file_path, 2);
    ASSERT_EQ(result.size(), 2u);
    EXPECT_EQ(result[0], "three");
    EXPECT_EQ(result[1], "four");
}

TEST_F(ReadLastLinesTest, NoTrailingNewline)
{
    WriteFile("one\ntwo\nthree");

    auto result = ReadLastLines(m_file_path, 2);
    ASSERT_EQ(result.size(), 2u);
    EXPECT_EQ(result[0], "two");
    EXPECT_EQ(result[1], "three");
}

TEST_F(ReadLastLinesTest, CarriageReturnsStripped)
{
    WriteFile("one\r\ntwo\r\n");

    auto result = ReadLastLines(m_file_path, 5);
    ASSERT_EQ(result.size(), 2u);
    EXPECT_EQ(result[0], "one");
    EXPECT_EQ(result[1], "two");
}

TEST_F(ReadLastLinesTest, SpansMultipleChunks)
{
    std::string content;

    for (int i = 0; i < 2000; ++i) {
        content += "line number " + std::to_string(i) + " with some padding to make it longer\n";
    }

    WriteFile(content);

    auto result = ReadLastLines(m_file_path, 500);
    ASSERT_EQ(result.size(), 500u);
    EXPECT_EQ(result.front(), "line number 1500 with some padding to make it longer");
    EXPECT_EQ(result.back(), "line number 1999 with some padding to make it longer");
}

TEST_F(ReadLastLinesTest, ZeroLinesRequested)
{
    WriteFile("one\ntwo\n");
    EXPECT_TRUE(ReadLastLines(m_file_path, 0).empty());
}

// ============================================================================
// GetEnvVariable
// ============================================================================

TEST(GetEnvVariable, SetVariable)
{
    setenv("IDLE_SHUTDOWN_TEST_VAR", "test_value", 1);
    auto result = GetEnvVariable("IDLE_SHUTDOWN_TEST_VAR");
    ASSERT_TRUE(result.has_value());
    EXPECT_EQ(result.value(), "test_value");
    unsetenv("IDLE_SHUTDOWN_TEST_VAR");
}

TEST(GetEnvVariable, UnsetVariable)
{
    unsetenv("IDLE_SHUTDOWN_NONEXISTENT_VAR");
    auto result = GetEnvVariable("IDLE_SHUTDOWN_NONEXISTENT_VAR");
    EXPECT_FALSE(result.has_value());
}

TEST(GetEnvVariable, EmptyValue)
{
    setenv("IDLE_SHUTDOWN_EMPTY_VAR", "", 1);
    auto result = GetEnvVariable("IDLE_SHUTDOWN_EMPTY_VAR");
    ASSERT_TRUE(result.has_value());
    EXPECT_EQ(result.value(), "");
    unsetenv("IDLE_SHUTDOWN_EMPTY_VAR");
}

// ============================================================================
// Exception classes
// ============================================================================

TEST(IdleShutdownException, ConstructionAndWhat)
{
    IdleShutdownException ex("test error message");
    EXPECT_STREQ(ex.what(), "test error message");
}

TEST(IdleShutdownException, ConstructFromCString)
{
    IdleShutdownException ex("c-string error");
    EXPECT_STREQ(ex.what(), "c-string error");
}

TEST(IdleShutdownException, IsStdException)
{
    IdleShutdownException ex("test");
    const std::exception& base_ref = ex;
    EXPECT_STREQ(base_ref.what(), "test");
}

TEST(FileSystemException, ConstructionAndWhat)
{
    FileSystemException ex("file error", "/tmp/test.txt");
    std::string what_str = ex.what();
    EXPECT_NE(what_str.find("file error"), std::string::npos);
    EXPECT_NE(what_str.find("/tmp/test.txt"), std::string::npos);
}

TEST(FileSystemException, PathAccessor)
{
    FileSystemException ex("error", "/tmp/test.txt");
    EXPECT_EQ(ex.path(), fs::path("/tmp/test.txt"));
}

TEST(StateStoreException, IsFileSystemException)
{
    StateStoreException ex("state error", "/tmp/state.dat");
    const FileSystemException& base_ref = ex;
    EXPECT_EQ(base_ref.path(), fs::path("/tmp/state.dat"));
}

TEST(LockException, IsIdleShutdownException)
{
    LockException ex("lock error", "/tmp/lock.pid");
    const IdleShutdownException& base_ref = ex;
    EXPECT_NE(std::string(base_ref.what()).find("lock error"), std::string::npos);
}
