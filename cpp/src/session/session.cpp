// ==============================================================================
// session.cpp - Сохранённые сессии
// ==============================================================================
//
// Запись: потоковая сериализация RapidJSON PrettyWriter (отступ 2 пробела).
// Чтение: RapidJSON Document + строгая проверка каждого члена; любая
// несовместимость: InputError{InvalidSession} с именем члена.
//
// ==============================================================================

#include <dtf/platform.hpp>
#include <dtf/session.hpp>
#include <fstream>
#include <rapidjson/document.h>
#include <rapidjson/error/en.h>
#include <rapidjson/prettywriter.h>
#include <rapidjson/stringbuffer.h>

namespace dtf::session {

// ============================================================================
// SavedConfig / SavedContext
// ============================================================================

SavedConfig SavedConfig::from_context(const WorkingContext& ctx) {
    SavedConfig cfg;
    cfg.check_for_key_diffs = ctx.config.check_for_key_diffs;
    cfg.check_for_type_diffs = ctx.config.check_for_type_diffs;
    cfg.check_for_value_diffs = ctx.config.check_for_value_diffs;
    cfg.check_for_array_diffs = ctx.config.check_for_array_diffs;
    cfg.file_a = ctx.file_a.name;
    cfg.file_b = ctx.file_b.name;
    cfg.array_same_order = ctx.config.array_same_order;
    return cfg;
}

WorkingContext SavedConfig::to_context() const {
    WorkingContext ctx;
    ctx.file_a.name = file_a;
    ctx.file_b.name = file_b;
    ctx.config.check_for_key_diffs = check_for_key_diffs;
    ctx.config.check_for_type_diffs = check_for_type_diffs;
    ctx.config.check_for_value_diffs = check_for_value_diffs;
    ctx.config.check_for_array_diffs = check_for_array_diffs;
    ctx.config.array_same_order = array_same_order;
    return ctx;
}

bool SavedConfig::operator==(const SavedConfig& other) const {
    return check_for_key_diffs == other.check_for_key_diffs &&
           check_for_type_diffs == other.check_for_type_diffs &&
           check_for_value_diffs == other.check_for_value_diffs &&
           check_for_array_diffs == other.check_for_array_diffs && file_a == other.file_a &&
           file_b == other.file_b && array_same_order == other.array_same_order;
}

DiffCollection SavedContext::to_collection() const {
    DiffCollection result;
    if (config.check_for_key_diffs) {
        result.key_diffs = key_diff;
    }
    if (config.check_for_type_diffs) {
        result.type_diffs = type_diff;
    }
    if (config.check_for_value_diffs) {
        result.value_diffs = value_diff;
    }
    if (config.check_for_array_diffs) {
        result.array_diffs = array_diff;
    }
    return result;
}

std::string OutputError::format() const {
    return "failed to write file '" + path + "' - " + message;
}

// ============================================================================
// Сериализация
// ============================================================================

namespace {

using JsonWriter = rapidjson::PrettyWriter<rapidjson::StringBuffer>;

void write_string(JsonWriter& w, const char* name, const std::string& value) {
    w.Key(name);
    w.String(value.c_str(), static_cast<rapidjson::SizeType>(value.size()));
}

void write_bool(JsonWriter& w, const char* name, bool value) {
    w.Key(name);
    w.Bool(value);
}

template <typename T, typename Fn>
void write_array(JsonWriter& w, const char* name, const std::optional<std::vector<T>>& items,
                 Fn&& write_item) {
    w.Key(name);
    w.StartArray();
    if (items.has_value()) {
        for (const auto& item : *items) {
            w.StartObject();
            write_item(item);
            w.EndObject();
        }
    }
    w.EndArray();
}

}  // namespace

std::string serialize_session(const DiffCollection& diffs, const SavedConfig& config) {
    rapidjson::StringBuffer buffer;
    JsonWriter w(buffer);
    w.SetIndent(' ', 2);

    w.StartObject();

    write_array(w, "key_diff", diffs.key_diffs, [&](const KeyDiff& d) {
        write_string(w, "key", d.key);
        write_string(w, "has", d.has);
        write_string(w, "misses", d.misses);
    });
    write_array(w, "type_diff", diffs.type_diffs, [&](const TypeDiff& d) {
        write_string(w, "key", d.key);
        write_string(w, "type1", d.type1);
        write_string(w, "type2", d.type2);
    });
    write_array(w, "value_diff", diffs.value_diffs, [&](const ValueDiff& d) {
        write_string(w, "key", d.key);
        write_string(w, "value1", d.value1);
        write_string(w, "value2", d.value2);
    });
    write_array(w, "array_diff", diffs.array_diffs, [&](const ArrayDiff& d) {
        write_string(w, "key", d.key);
        write_string(w, "descriptor", array_diff_desc_name(d.descriptor));
        write_string(w, "value", d.value);
    });

    w.Key("config");
    w.StartObject();
    write_bool(w, "check_for_key_diffs", config.check_for_key_diffs);
    write_bool(w, "check_for_type_diffs", config.check_for_type_diffs);
    write_bool(w, "check_for_value_diffs", config.check_for_value_diffs);
    write_bool(w, "check_for_array_diffs", config.check_for_array_diffs);
    write_string(w, "file_a", config.file_a);
    write_string(w, "file_b", config.file_b);
    write_bool(w, "array_same_order", config.array_same_order);
    w.EndObject();

    w.EndObject();

    std::string result(buffer.GetString(), buffer.GetSize());
    result += '\n';
    return result;
}

std::optional<OutputError> write_session(const std::filesystem::path& path,
                                         const DiffCollection& diffs, const SavedConfig& config) {
    const std::string path_str = platform::path_to_utf8(path);

    std::ofstream file(path, std::ios::binary | std::ios::trunc);
    if (!file.is_open()) {
        return OutputError{"could not create file", path_str};
    }

    const std::string content = serialize_session(diffs, config);
    file.write(content.data(), static_cast<std::streamsize>(content.size()));
    file.flush();
    if (!file) {
        return OutputError{"could not write session", path_str};
    }
    return std::nullopt;
}

// ============================================================================
// Разбор
// ============================================================================

namespace {

class SessionParser {
public:
    explicit SessionParser(const std::string& source) : source_(source) {}

    bool parse(const rapidjson::Value& root, SavedContext& out) {
        if (!root.IsObject()) {
            return fail("session root must be an object");
        }

        return read_items(root, "key_diff", out.key_diff,
                          [this](const rapidjson::Value& item, const std::string& where,
                                 KeyDiff& d) {
                              return read_string(item, "key", where, d.key) &&
                                     read_string(item, "has", where, d.has) &&
                                     read_string(item, "misses", where, d.misses);
                          }) &&
               read_items(root, "type_diff", out.type_diff,
                          [this](const rapidjson::Value& item, const std::string& where,
                                 TypeDiff& d) {
                              return read_string(item, "key", where, d.key) &&
                                     read_string(item, "type1", where, d.type1) &&
                                     read_string(item, "type2", where, d.type2);
                          }) &&
               read_items(root, "value_diff", out.value_diff,
                          [this](const rapidjson::Value& item, const std::string& where,
                                 ValueDiff& d) {
                              return read_string(item, "key", where, d.key) &&
                                     read_string(item, "value1", where, d.value1) &&
                                     read_string(item, "value2", where, d.value2);
                          }) &&
               read_items(root, "array_diff", out.array_diff,
                          [this](const rapidjson::Value& item, const std::string& where,
                                 ArrayDiff& d) { return read_array_diff(item, where, d); }) &&
               read_config(root, out.config);
    }

    const io::InputError& error() const { return error_; }

private:
    bool fail(std::string message) {
        error_ = io::InputError{io::InputErrorKind::InvalidSession, std::move(message), source_};
        return false;
    }

    bool read_string(const rapidjson::Value& obj, const char* name, const std::string& where,
                     std::string& out) {
        auto it = obj.FindMember(name);
        if (it == obj.MemberEnd() || !it->value.IsString()) {
            return fail("'" + where + "." + name + "' must be a string");
        }
        out.assign(it->value.GetString(), it->value.GetStringLength());
        return true;
    }

    bool read_bool(const rapidjson::Value& obj, const char* name, const std::string& where,
                   bool& out) {
        auto it = obj.FindMember(name);
        if (it == obj.MemberEnd() || !it->value.IsBool()) {
            return fail("'" + where + "." + name + "' must be a boolean");
        }
        out = it->value.GetBool();
        return true;
    }

    template <typename T, typename Fn>
    bool read_items(const rapidjson::Value& root, const char* name, std::vector<T>& out,
                    Fn&& read_item) {
        auto it = root.FindMember(name);
        if (it == root.MemberEnd() || !it->value.IsArray()) {
            return fail(std::string("'") + name + "' must be an array");
        }

        const auto& arr = it->value;
        out.clear();
        out.reserve(arr.Size());
        for (rapidjson::SizeType i = 0; i < arr.Size(); ++i) {
            const std::string where = std::string(name) + "[" + std::to_string(i) + "]";
            if (!arr[i].IsObject()) {
                return fail("'" + where + "' must be an object");
            }
            T item;
            if (!read_item(arr[i], where, item)) {
                return false;
            }
            out.push_back(std::move(item));
        }
        return true;
    }

    bool read_array_diff(const rapidjson::Value& item, const std::string& where, ArrayDiff& d) {
        std::string descriptor;
        if (!read_string(item, "key", where, d.key) ||
            !read_string(item, "descriptor", where, descriptor) ||
            !read_string(item, "value", where, d.value)) {
            return false;
        }
        auto desc = array_diff_desc_from_name(descriptor);
        if (!desc.has_value()) {
            return fail("'" + where + ".descriptor' has unknown value '" + descriptor + "'");
        }
        d.descriptor = *desc;
        return true;
    }

    bool read_config(const rapidjson::Value& root, SavedConfig& cfg) {
        auto it = root.FindMember("config");
        if (it == root.MemberEnd() || !it->value.IsObject()) {
            return fail("'config' must be an object");
        }
        const auto& obj = it->value;
        const std::string where = "config";
        return read_bool(obj, "check_for_key_diffs", where, cfg.check_for_key_diffs) &&
               read_bool(obj, "check_for_type_diffs", where, cfg.check_for_type_diffs) &&
               read_bool(obj, "check_for_value_diffs", where, cfg.check_for_value_diffs) &&
               read_bool(obj, "check_for_array_diffs", where, cfg.check_for_array_diffs) &&
               read_string(obj, "file_a", where, cfg.file_a) &&
               read_string(obj, "file_b", where, cfg.file_b) &&
               read_bool(obj, "array_same_order", where, cfg.array_same_order) &&
               check_distinct_names(cfg);
    }

    // Маркеры ✓ / × в таблице ключей различают стороны по имени файла
    bool check_distinct_names(const SavedConfig& cfg) {
        if (cfg.file_a == cfg.file_b) {
            return fail("'config.file_b' must differ from 'config.file_a'");
        }
        return true;
    }

    std::string source_;
    io::InputError error_;
};

}  // namespace

SessionResult parse_session(std::string_view text, const std::string& source) {
    SessionResult result;

    rapidjson::Document doc;
    doc.Parse<rapidjson::kParseIterativeFlag>(text.data(), text.size());
    if (doc.HasParseError()) {
        result.error = io::InputError{io::InputErrorKind::ParseError,
                                      std::string("JSON parse error: ") +
                                          rapidjson::GetParseError_En(doc.GetParseError()) +
                                          " at offset " + std::to_string(doc.GetErrorOffset()),
                                      source};
        return result;
    }

    // У корректной сессии вложенность 3
    const std::size_t depth = io::container_depth(doc);
    if (depth > DEFAULT_MAX_DEPTH) {
        result.error = io::InputError{io::InputErrorKind::TooDeep,
                                      "session nesting depth " + std::to_string(depth) +
                                          " exceeds the limit of " +
                                          std::to_string(DEFAULT_MAX_DEPTH),
                                      source};
        return result;
    }

    SessionParser parser(source);
    if (!parser.parse(doc, result.session)) {
        result.error = parser.error();
        return result;
    }

    result.ok = true;
    return result;
}

SessionResult read_session(const std::filesystem::path& path) {
    SessionResult result;

    std::string content;
    if (!io::read_file(path, content, result.error)) {
        return result;
    }

    return parse_session(content, platform::path_to_utf8(path));
}

}  // namespace dtf::session
