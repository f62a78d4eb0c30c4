// ==============================================================================
// test_platform_gtest.cpp - Тесты платформенного модуля (GoogleTest)
// ==============================================================================
//
// Пути и кодировки: file_a / file_b попадают в таблицы и сессии в UTF-8,
// поэтому преобразования path <-> UTF-8 должны быть обратимыми.
//
// ==============================================================================

#include <dtf/platform.hpp>
#include <filesystem>
#include <gtest/gtest.h>
#include <string>

namespace dtf::platform::test {

// ==============================================================================
// Преобразование путей UTF-8 <-> path
// ==============================================================================

TEST(PlatformTest, PathToUtf8_BasicPath) {
    // Arrange
    std::filesystem::path p = "data/a.json";

    // Act
    std::string utf8 = path_to_utf8(p);

    // Assert
    EXPECT_EQ(utf8, "data/a.json");
}

TEST(PlatformTest, PathFromUtf8_BasicPath) {
    // Arrange
    std::string utf8 = "data/b.json";

    // Act
    std::filesystem::path p = path_from_utf8(utf8);

    // Assert
    EXPECT_EQ(p.filename(), "b.json");
}

TEST(PlatformTest, PathToUtf8_EmptyPath) {
    EXPECT_TRUE(path_to_utf8(std::filesystem::path{}).empty());
}

TEST(PlatformTest, PathFromUtf8_EmptyString) {
    EXPECT_TRUE(path_from_utf8("").empty());
}

TEST(PlatformTest, PathConversion_RoundtripWithSpaces) {
    const std::string original = "my data/old version.json";
    EXPECT_EQ(path_to_utf8(path_from_utf8(original)), original);
}

TEST(PlatformTest, PathConversion_RoundtripWithCyrillic) {
    // Arrange
    const std::string original = "путь/к/файлу.json";

    // Act
    std::string roundtrip = path_to_utf8(path_from_utf8(original));

    // Assert
    EXPECT_EQ(roundtrip, original);
}

TEST(PlatformTest, PathConversion_RoundtripWithCjk) {
    const std::string original = "folder/文件.json";
    EXPECT_EQ(path_to_utf8(path_from_utf8(original)), original);
}

// ==============================================================================
// TTY detection
// ==============================================================================

TEST(PlatformTest, IsTty_IsConsistent) {
    EXPECT_EQ(is_tty_stdout(), is_tty_stdout());
    EXPECT_EQ(is_tty_stderr(), is_tty_stderr());
}

}  // namespace dtf::platform::test
