// ==============================================================================
// test_reader_gtest.cpp - Тесты загрузки документов (GoogleTest)
// ==============================================================================
//
// - load_document: успешная загрузка, отсутствующий файл, невалидный JSON
// - Ограничение вложенности (TooDeep)
// - Корень любого вида
// - InputError::format
//
// ==============================================================================

#include <dtf/platform.hpp>
#include <dtf/reader.hpp>
#include <dtf/value.hpp>
#include <filesystem>
#include <fstream>
#include <gtest/gtest.h>
#include <string>

#ifdef _WIN32
#include <windows.h>
#else
#include <unistd.h>
#endif

namespace fs = std::filesystem;
using namespace dtf;
using namespace dtf::io;

// ============================================================================
// Test Fixtures
// ============================================================================

/// Временная директория на каждый тест (имя теста + PID)
class ReaderTestFixture : public ::testing::Test {
protected:
    void SetUp() override {
        auto* test_info = ::testing::UnitTest::GetInstance()->current_test_info();
        std::string unique_name = std::string("dtf_reader_") + test_info->test_case_name() + "_" +
                                  test_info->name() + "_" +
                                  std::to_string(
#ifdef _WIN32
                                      GetCurrentProcessId()
#else
                                      getpid()
#endif
                                  );
        temp_dir_ = fs::temp_directory_path() / unique_name;

        std::error_code ec;
        fs::remove_all(temp_dir_, ec);
        fs::create_directories(temp_dir_);
    }

    void TearDown() override {
        std::error_code ec;
        fs::remove_all(temp_dir_, ec);
    }

    fs::path create_temp_file(const std::string& name, const std::string& content) {
        fs::path file_path = temp_dir_ / name;
        std::ofstream file(file_path, std::ios::binary);
        file << content;
        return file_path;
    }

    fs::path temp_dir_;
};

// ============================================================================
// load_document
// ============================================================================

TEST_F(ReaderTestFixture, LoadDocument_ValidObject) {
    auto path = create_temp_file("a.json", R"({"name": "dtf", "list": [1, 2]})");

    auto result = load_document(path);

    ASSERT_TRUE(result.ok) << result.error.format();
    ASSERT_TRUE(result.value.is_object());
    EXPECT_EQ(result.value.to_canonical_string(), R"({"list":[1,2],"name":"dtf"})");
}

TEST_F(ReaderTestFixture, LoadDocument_ScalarRoot) {
    auto path = create_temp_file("scalar.json", "  42\n");

    auto result = load_document(path);

    ASSERT_TRUE(result.ok);
    EXPECT_TRUE(result.value.is_uint());
    EXPECT_EQ(result.value.as_uint(), 42u);
}

TEST_F(ReaderTestFixture, LoadDocument_ArrayRoot) {
    auto path = create_temp_file("array.json", R"([null, "x"])");

    auto result = load_document(path);

    ASSERT_TRUE(result.ok);
    ASSERT_TRUE(result.value.is_array());
    EXPECT_EQ(result.value.as_array().size(), 2u);
}

TEST_F(ReaderTestFixture, LoadDocument_FileNotFound) {
    auto path = temp_dir_ / "missing.json";

    auto result = load_document(path);

    EXPECT_FALSE(result.ok);
    EXPECT_FALSE(static_cast<bool>(result));
    EXPECT_EQ(result.error.kind, InputErrorKind::FileNotFound);
    EXPECT_EQ(result.error.path, platform::path_to_utf8(path));
    EXPECT_EQ(result.error.message, "file does not exist");
}

TEST_F(ReaderTestFixture, LoadDocument_InvalidJson) {
    auto path = create_temp_file("broken.json", R"({"a": )");

    auto result = load_document(path);

    EXPECT_FALSE(result.ok);
    EXPECT_EQ(result.error.kind, InputErrorKind::ParseError);
    EXPECT_EQ(result.error.message.rfind("JSON parse error: ", 0), 0u);
    EXPECT_NE(result.error.message.find(" at offset "), std::string::npos);
}

TEST_F(ReaderTestFixture, LoadDocument_EmptyFileIsParseError) {
    auto path = create_temp_file("empty.json", "");

    auto result = load_document(path);

    EXPECT_FALSE(result.ok);
    EXPECT_EQ(result.error.kind, InputErrorKind::ParseError);
}

TEST_F(ReaderTestFixture, LoadDocument_TrailingContentIsParseError) {
    auto path = create_temp_file("two.json", "{} {}");

    auto result = load_document(path);

    EXPECT_FALSE(result.ok);
    EXPECT_EQ(result.error.kind, InputErrorKind::ParseError);
}

TEST_F(ReaderTestFixture, LoadDocument_TooDeep) {
    auto path = create_temp_file("deep.json", "[[[1]]]");

    auto result = load_document(path, 2);

    EXPECT_FALSE(result.ok);
    EXPECT_EQ(result.error.kind, InputErrorKind::TooDeep);
    EXPECT_EQ(result.error.message, "document nesting depth 3 exceeds the limit of 2");
}

TEST_F(ReaderTestFixture, LoadDocument_ExactDepthAllowed) {
    auto path = create_temp_file("deep.json", R"({"a": [{"b": 1}]})");

    EXPECT_TRUE(load_document(path, 3).ok);
    EXPECT_FALSE(load_document(path, 2).ok);
}

TEST_F(ReaderTestFixture, LoadDocument_DefaultLimitRejectsVeryDeepInput) {
    const std::size_t levels = DEFAULT_MAX_DEPTH + 1;
    std::string text(levels, '[');
    text += std::string(levels, ']');
    auto path = create_temp_file("very_deep.json", text);

    auto result = load_document(path);

    EXPECT_FALSE(result.ok);
    EXPECT_EQ(result.error.kind, InputErrorKind::TooDeep);
}

TEST_F(ReaderTestFixture, ReadFile_ReturnsContent) {
    auto path = create_temp_file("raw.txt", "abc\n");

    std::string content;
    InputError error;
    ASSERT_TRUE(read_file(path, content, error));
    EXPECT_EQ(content, "abc\n");
}

// ============================================================================
// parse_document / InputError
// ============================================================================

TEST(ReaderTest, ParseDocument_UsesSourceInErrors) {
    auto result = parse_document("[1,", "inline.json");

    EXPECT_FALSE(result.ok);
    EXPECT_EQ(result.error.path, "inline.json");
    EXPECT_EQ(result.error.format().rfind("failed to load file 'inline.json' - JSON parse error: ",
                                          0),
              0u);
}

TEST(ReaderTest, ParseDocument_NumbersKeepRepresentation) {
    auto result = parse_document(R"({"i": -1, "u": 1, "d": 1.0})", "inline.json");

    ASSERT_TRUE(result.ok);
    EXPECT_TRUE(result.value.get("i")->is_int());
    EXPECT_TRUE(result.value.get("u")->is_uint());
    EXPECT_TRUE(result.value.get("d")->is_double());
}

TEST(ReaderTest, InputError_Format) {
    InputError error{InputErrorKind::FileNotFound, "file does not exist", "data/a.json"};
    EXPECT_EQ(error.format(), "failed to load file 'data/a.json' - file does not exist");
}

TEST(ReaderTest, InputErrorKind_ToString) {
    EXPECT_STREQ(input_error_kind_to_string(InputErrorKind::FileNotFound), "file not found");
    EXPECT_STREQ(input_error_kind_to_string(InputErrorKind::ParseError), "parse error");
    EXPECT_STREQ(input_error_kind_to_string(InputErrorKind::TooDeep), "too deep");
    EXPECT_STREQ(input_error_kind_to_string(InputErrorKind::InvalidSession), "invalid session");
}
