// ==============================================================================
// settings.cpp - Файл настроек (YAML)
// ==============================================================================

#include <dtf/platform.hpp>
#include <dtf/settings.hpp>
#include <yaml-cpp/yaml.h>

namespace dtf::settings {

namespace {

io::InputError parse_error(const std::string& message, const std::string& source) {
    return io::InputError{io::InputErrorKind::ParseError, message, source};
}

bool read_bool(const YAML::Node& node, const std::string& key, const std::string& source,
               std::optional<bool>& out, io::InputError& error) {
    try {
        out = node.as<bool>();
        return true;
    } catch (const YAML::BadConversion&) {
        error = parse_error("'" + key + "' must be a boolean", source);
        return false;
    }
}

bool read_positive(const YAML::Node& node, const std::string& key, const std::string& source,
                   std::optional<std::size_t>& out, io::InputError& error,
                   std::size_t limit = 0) {
    long long value = 0;
    try {
        value = node.as<long long>();
    } catch (const YAML::BadConversion&) {
        error = parse_error("'" + key + "' must be an integer", source);
        return false;
    }
    if (value <= 0) {
        error = parse_error("'" + key + "' must be greater than zero", source);
        return false;
    }
    if (limit != 0 && static_cast<unsigned long long>(value) > limit) {
        error = parse_error("'" + key + "' must not exceed " + std::to_string(limit), source);
        return false;
    }
    out = static_cast<std::size_t>(value);
    return true;
}

}  // namespace

SettingsResult parse_settings(std::string_view text, const std::string& source) {
    SettingsResult result;

    YAML::Node root;
    try {
        root = YAML::Load(std::string(text));
    } catch (const YAML::Exception& e) {
        result.error = parse_error(std::string("YAML parse error: ") + e.what(), source);
        return result;
    }

    if (root.IsNull()) {
        result.ok = true;
        return result;
    }
    if (!root.IsMap()) {
        result.error = parse_error("settings must be a mapping", source);
        return result;
    }

    Settings& s = result.settings;
    for (const auto& entry : root) {
        std::string key;
        try {
            key = entry.first.as<std::string>();
        } catch (const YAML::Exception&) {
            result.error = parse_error("settings keys must be scalars", source);
            return result;
        }
        const YAML::Node& value = entry.second;

        bool ok = true;
        if (key == "key_diffs") {
            ok = read_bool(value, key, source, s.key_diffs, result.error);
        } else if (key == "type_diffs") {
            ok = read_bool(value, key, source, s.type_diffs, result.error);
        } else if (key == "value_diffs") {
            ok = read_bool(value, key, source, s.value_diffs, result.error);
        } else if (key == "array_diffs") {
            ok = read_bool(value, key, source, s.array_diffs, result.error);
        } else if (key == "array_same_order") {
            ok = read_bool(value, key, source, s.array_same_order, result.error);
        } else if (key == "max_depth") {
            ok = read_positive(value, key, source, s.max_depth, result.error, MAX_DEPTH_LIMIT);
        } else if (key == "column_width") {
            ok = read_positive(value, key, source, s.column_width, result.error);
        } else {
            s.unknown_keys.push_back(key);
        }

        if (!ok) {
            return result;
        }
    }

    result.ok = true;
    return result;
}

SettingsResult load_settings(const std::filesystem::path& path) {
    SettingsResult result;

    std::string content;
    if (!io::read_file(path, content, result.error)) {
        return result;
    }

    return parse_settings(content, platform::path_to_utf8(path));
}

// ============================================================================
// merge
// ============================================================================

RunSettings merge(const cli::RunCommand& cmd, const Settings& file) {
    RunSettings rs;
    Config& cfg = rs.config;

    cfg.check_for_key_diffs = file.key_diffs.value_or(false) || cmd.key_diffs;
    cfg.check_for_type_diffs = file.type_diffs.value_or(false) || cmd.type_diffs;
    cfg.check_for_value_diffs = file.value_diffs.value_or(false) || cmd.value_diffs;
    cfg.check_for_array_diffs = file.array_diffs.value_or(false) || cmd.array_diffs;
    cfg.array_same_order = file.array_same_order.value_or(false) || cmd.array_same_order;

    if (cmd.max_depth.has_value()) {
        cfg.max_depth = *cmd.max_depth;
    } else if (file.max_depth.has_value()) {
        cfg.max_depth = *file.max_depth;
    }

    if (cmd.column_width.has_value()) {
        rs.column_width = *cmd.column_width;
    } else if (file.column_width.has_value()) {
        rs.column_width = *file.column_width;
    }

    return rs;
}

WorkingContext compare_context(const cli::RunCommand& cmd, const RunSettings& rs) {
    WorkingContext ctx;
    if (cmd.file_a.has_value()) {
        ctx.file_a.name = platform::path_to_utf8(*cmd.file_a);
    }
    if (cmd.file_b.has_value()) {
        ctx.file_b.name = platform::path_to_utf8(*cmd.file_b);
    }
    ctx.config = rs.config;
    return ctx;
}

WorkingContext session_context(const session::SavedConfig& saved, const RunSettings& rs) {
    WorkingContext ctx = saved.to_context();
    ctx.config.max_depth = rs.config.max_depth;
    return ctx;
}

}  // namespace dtf::settings
