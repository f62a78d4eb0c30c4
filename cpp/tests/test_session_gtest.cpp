// ==============================================================================
// test_session_gtest.cpp - Тесты сохранённых сессий (GoogleTest)
// ==============================================================================
//
// - serialize_session / parse_session: формат и обратное чтение
// - Выключенные категории: пустые массивы при записи, nullopt после чтения
// - Строгая проверка членов (InvalidSession)
// - Глубокая вложенность: ParseError / TooDeep без переполнения стека
// - write_session / read_session через файловую систему
//
// ==============================================================================

#include <dtf/platform.hpp>
#include <dtf/session.hpp>
#include <cstddef>
#include <filesystem>
#include <fstream>
#include <gtest/gtest.h>
#include <rapidjson/document.h>
#include <string>

#ifdef _WIN32
#include <windows.h>
#else
#include <unistd.h>
#endif

namespace fs = std::filesystem;
using namespace dtf;
using namespace dtf::session;

namespace {

SavedConfig make_config() {
    SavedConfig cfg;
    cfg.check_for_key_diffs = true;
    cfg.check_for_type_diffs = true;
    cfg.check_for_value_diffs = true;
    cfg.check_for_array_diffs = true;
    cfg.file_a = "old.json";
    cfg.file_b = "new.json";
    cfg.array_same_order = true;
    return cfg;
}

DiffCollection make_diffs() {
    DiffCollection diffs;
    diffs.key_diffs = std::vector<KeyDiff>{{"a.b", "old.json", "new.json"}};
    diffs.type_diffs = std::vector<TypeDiff>{{"v", "string", "number"}};
    diffs.value_diffs = std::vector<ValueDiff>{{"s", "\"x\"", "\"y\""}};
    diffs.array_diffs = std::vector<ArrayDiff>{{"l", ArrayDiffDesc::AHas, R"({"k":1})"},
                                               {"l", ArrayDiffDesc::BMisses, R"({"k":1})"}};
    return diffs;
}

const char* const MINIMAL_SESSION = R"({
  "key_diff": [],
  "type_diff": [],
  "value_diff": [],
  "array_diff": [],
  "config": {
    "check_for_key_diffs": true,
    "check_for_type_diffs": false,
    "check_for_value_diffs": false,
    "check_for_array_diffs": false,
    "file_a": "a.json",
    "file_b": "b.json",
    "array_same_order": false
  }
})";

}  // namespace

// ============================================================================
// SavedConfig
// ============================================================================

TEST(SessionTest, SavedConfig_FromContextAndBack) {
    WorkingContext ctx;
    ctx.file_a.name = "x.json";
    ctx.file_b.name = "y.json";
    ctx.config.check_for_value_diffs = true;
    ctx.config.array_same_order = true;
    ctx.config.max_depth = 8;

    const auto cfg = SavedConfig::from_context(ctx);
    EXPECT_EQ(cfg.file_a, "x.json");
    EXPECT_EQ(cfg.file_b, "y.json");
    EXPECT_FALSE(cfg.check_for_key_diffs);
    EXPECT_TRUE(cfg.check_for_value_diffs);
    EXPECT_TRUE(cfg.array_same_order);

    const auto restored = cfg.to_context();
    EXPECT_EQ(restored.file_a.name, "x.json");
    EXPECT_EQ(restored.file_b.name, "y.json");
    EXPECT_TRUE(restored.config.check_for_value_diffs);
    EXPECT_TRUE(restored.config.array_same_order);
    EXPECT_EQ(restored.config.max_depth, DEFAULT_MAX_DEPTH);
}

TEST(SessionTest, SavedContext_ToCollectionMasksDisabledCategories) {
    SavedContext saved;
    saved.key_diff = {{"k", "a.json", "b.json"}};
    saved.value_diff = {{"v", "1", "2"}};
    saved.config.check_for_key_diffs = true;

    const auto diffs = saved.to_collection();
    ASSERT_TRUE(diffs.key_diffs.has_value());
    EXPECT_EQ(diffs.key_diffs->size(), 1u);
    EXPECT_FALSE(diffs.type_diffs.has_value());
    EXPECT_FALSE(diffs.value_diffs.has_value());
    EXPECT_FALSE(diffs.array_diffs.has_value());
}

// ============================================================================
// Сериализация
// ============================================================================

TEST(SessionTest, Serialize_HasAllMembers) {
    const std::string text = serialize_session(make_diffs(), make_config());

    rapidjson::Document doc;
    doc.Parse(text.c_str());
    ASSERT_FALSE(doc.HasParseError());
    ASSERT_TRUE(doc.IsObject());

    for (const char* name : {"key_diff", "type_diff", "value_diff", "array_diff"}) {
        ASSERT_TRUE(doc.HasMember(name)) << name;
        EXPECT_TRUE(doc[name].IsArray()) << name;
    }
    ASSERT_TRUE(doc["config"].IsObject());
    EXPECT_STREQ(doc["config"]["file_a"].GetString(), "old.json");
    EXPECT_TRUE(doc["config"]["array_same_order"].GetBool());
    EXPECT_STREQ(doc["array_diff"][0]["descriptor"].GetString(), "AHas");
    EXPECT_STREQ(doc["array_diff"][1]["descriptor"].GetString(), "BMisses");
}

TEST(SessionTest, Serialize_PrettyPrintedWithTwoSpaces) {
    const std::string text = serialize_session(DiffCollection{}, make_config());
    EXPECT_EQ(text.rfind("{\n  \"key_diff\": []", 0), 0u);
    EXPECT_EQ(text.back(), '\n');
}

TEST(SessionTest, Serialize_AbsentCategoriesBecomeEmptyArrays) {
    DiffCollection diffs;
    diffs.key_diffs = std::vector<KeyDiff>{{"k", "a.json", "b.json"}};

    const std::string text = serialize_session(diffs, make_config());

    rapidjson::Document doc;
    doc.Parse(text.c_str());
    ASSERT_FALSE(doc.HasParseError());
    EXPECT_EQ(doc["key_diff"].Size(), 1u);
    EXPECT_EQ(doc["type_diff"].Size(), 0u);
    EXPECT_EQ(doc["value_diff"].Size(), 0u);
    EXPECT_EQ(doc["array_diff"].Size(), 0u);
}

TEST(SessionTest, Serialize_ThenParse_RestoresEverything) {
    const auto diffs = make_diffs();
    const auto config = make_config();

    auto result = parse_session(serialize_session(diffs, config), "session.json");

    ASSERT_TRUE(result.ok) << result.error.format();
    EXPECT_EQ(result.session.config, config);
    EXPECT_EQ(result.session.key_diff, *diffs.key_diffs);
    EXPECT_EQ(result.session.type_diff, *diffs.type_diffs);
    EXPECT_EQ(result.session.value_diff, *diffs.value_diffs);
    EXPECT_EQ(result.session.array_diff, *diffs.array_diffs);
}

// ============================================================================
// Разбор: ошибки
// ============================================================================

TEST(SessionTest, Parse_Minimal) {
    auto result = parse_session(MINIMAL_SESSION, "s.json");

    ASSERT_TRUE(result.ok) << result.error.format();
    EXPECT_TRUE(result.session.config.check_for_key_diffs);
    EXPECT_FALSE(result.session.config.check_for_type_diffs);
    EXPECT_EQ(result.session.config.file_a, "a.json");
    EXPECT_TRUE(result.session.key_diff.empty());
}

TEST(SessionTest, Parse_InvalidJsonIsParseError) {
    auto result = parse_session("{", "s.json");

    EXPECT_FALSE(result.ok);
    EXPECT_EQ(result.error.kind, io::InputErrorKind::ParseError);
    EXPECT_EQ(result.error.path, "s.json");
}

TEST(SessionTest, Parse_RootMustBeObject) {
    auto result = parse_session("[]", "s.json");

    EXPECT_FALSE(result.ok);
    EXPECT_EQ(result.error.kind, io::InputErrorKind::InvalidSession);
    EXPECT_EQ(result.error.message, "session root must be an object");
}

TEST(SessionTest, Parse_MissingMember) {
    auto result = parse_session(R"({"key_diff": []})", "s.json");

    EXPECT_FALSE(result.ok);
    EXPECT_EQ(result.error.kind, io::InputErrorKind::InvalidSession);
    EXPECT_EQ(result.error.message, "'type_diff' must be an array");
}

TEST(SessionTest, Parse_MissingConfig) {
    auto result = parse_session(
        R"({"key_diff": [], "type_diff": [], "value_diff": [], "array_diff": []})", "s.json");

    EXPECT_FALSE(result.ok);
    EXPECT_EQ(result.error.message, "'config' must be an object");
}

TEST(SessionTest, Parse_WrongItemFieldType) {
    std::string text = MINIMAL_SESSION;
    text.replace(text.find(R"("key_diff": [])"), 14,
                 R"("key_diff": [{"key": 1, "has": "a.json", "misses": "b.json"}])");

    auto result = parse_session(text, "s.json");

    EXPECT_FALSE(result.ok);
    EXPECT_EQ(result.error.kind, io::InputErrorKind::InvalidSession);
    EXPECT_EQ(result.error.message, "'key_diff[0].key' must be a string");
}

TEST(SessionTest, Parse_ItemMustBeObject) {
    std::string text = MINIMAL_SESSION;
    text.replace(text.find(R"("value_diff": [])"), 16, R"("value_diff": ["oops"])");

    auto result = parse_session(text, "s.json");

    EXPECT_FALSE(result.ok);
    EXPECT_EQ(result.error.message, "'value_diff[0]' must be an object");
}

TEST(SessionTest, Parse_UnknownDescriptor) {
    std::string text = MINIMAL_SESSION;
    text.replace(text.find(R"("array_diff": [])"), 16,
                 R"("array_diff": [{"key": "l", "descriptor": "CHas", "value": "1"}])");

    auto result = parse_session(text, "s.json");

    EXPECT_FALSE(result.ok);
    EXPECT_EQ(result.error.message, "'array_diff[0].descriptor' has unknown value 'CHas'");
}

TEST(SessionTest, Parse_ConfigFlagMustBeBoolean) {
    std::string text = MINIMAL_SESSION;
    text.replace(text.find(R"("array_same_order": false)"), 25, R"("array_same_order": "no")");

    auto result = parse_session(text, "s.json");

    EXPECT_FALSE(result.ok);
    EXPECT_EQ(result.error.message, "'config.array_same_order' must be a boolean");
}

TEST(SessionTest, Parse_IdenticalFileNamesRejected) {
    std::string text = MINIMAL_SESSION;
    text.replace(text.find(R"("file_b": "b.json")"), 18, R"("file_b": "a.json")");

    auto result = parse_session(text, "s.json");

    EXPECT_FALSE(result.ok);
    EXPECT_EQ(result.error.kind, io::InputErrorKind::InvalidSession);
    EXPECT_EQ(result.error.message, "'config.file_b' must differ from 'config.file_a'");
}

TEST(SessionTest, Parse_DeeplyNestedIsParseError) {
    // Миллион открывающих скобок без закрытия: ошибка, а не переполнение стека
    const std::string text(1000000, '[');

    auto result = parse_session(text, "s.json");

    EXPECT_FALSE(result.ok);
    EXPECT_EQ(result.error.kind, io::InputErrorKind::ParseError);
    EXPECT_EQ(result.error.path, "s.json");
}

TEST(SessionTest, Parse_DeeplyNestedBalancedIsTooDeep) {
    const std::size_t levels = DEFAULT_MAX_DEPTH + 100;
    std::string text = "{\"key_diff\": ";
    text += std::string(levels, '[');
    text += std::string(levels, ']');
    text += "}";

    auto result = parse_session(text, "s.json");

    EXPECT_FALSE(result.ok);
    EXPECT_EQ(result.error.kind, io::InputErrorKind::TooDeep);
    EXPECT_NE(result.error.message.find(std::to_string(levels + 1)), std::string::npos);
}

// ============================================================================
// Файловая система
// ============================================================================

class SessionFileFixture : public ::testing::Test {
protected:
    void SetUp() override {
        auto* test_info = ::testing::UnitTest::GetInstance()->current_test_info();
        std::string unique_name = std::string("dtf_session_") + test_info->name() + "_" +
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

    fs::path temp_dir_;
};

TEST_F(SessionFileFixture, WriteThenRead) {
    const auto path = temp_dir_ / "session.json";
    const auto diffs = make_diffs();
    const auto config = make_config();

    const auto write_error = write_session(path, diffs, config);
    ASSERT_FALSE(write_error.has_value()) << write_error->format();

    auto result = read_session(path);
    ASSERT_TRUE(result.ok) << result.error.format();
    EXPECT_EQ(result.session.config, config);

    const auto restored = result.session.to_collection();
    EXPECT_EQ(restored.key_diffs, diffs.key_diffs);
    EXPECT_EQ(restored.array_diffs, diffs.array_diffs);
}

TEST_F(SessionFileFixture, WriteOverwritesExistingFile) {
    const auto path = temp_dir_ / "session.json";
    {
        std::ofstream file(path, std::ios::binary);
        file << std::string(4096, 'x');
    }

    ASSERT_FALSE(write_session(path, DiffCollection{}, make_config()).has_value());
    EXPECT_TRUE(read_session(path).ok);
}

TEST_F(SessionFileFixture, WriteToMissingDirectoryFails) {
    const auto path = temp_dir_ / "no_such_dir" / "session.json";

    const auto error = write_session(path, make_diffs(), make_config());

    ASSERT_TRUE(error.has_value());
    EXPECT_EQ(error->path, platform::path_to_utf8(path));
    EXPECT_EQ(error->format(),
              "failed to write file '" + platform::path_to_utf8(path) + "' - " + error->message);
}

TEST_F(SessionFileFixture, ReadMissingFile) {
    auto result = read_session(temp_dir_ / "missing.json");

    EXPECT_FALSE(result.ok);
    EXPECT_EQ(result.error.kind, io::InputErrorKind::FileNotFound);
}
