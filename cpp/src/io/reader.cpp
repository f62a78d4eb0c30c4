// ==============================================================================
// reader.cpp - Загрузка JSON-документов
// ==============================================================================
//
// Файл читается целиком в память, парсится RapidJSON в итеративном режиме
// (без рекурсии на глубоких документах), затем проверяется вложенность
// и только после этого строится Value.
//
// ==============================================================================

#include <algorithm>
#include <dtf/platform.hpp>
#include <dtf/reader.hpp>
#include <fstream>
#include <rapidjson/document.h>
#include <rapidjson/error/en.h>
#include <sstream>
#include <system_error>
#include <utility>
#include <vector>

namespace dtf::io {

// ============================================================================
// InputError
// ============================================================================

const char* input_error_kind_to_string(InputErrorKind kind) {
    switch (kind) {
    case InputErrorKind::FileNotFound:
        return "file not found";
    case InputErrorKind::IoError:
        return "io error";
    case InputErrorKind::ParseError:
        return "parse error";
    case InputErrorKind::TooDeep:
        return "too deep";
    case InputErrorKind::InvalidSession:
        return "invalid session";
    }
    return "unknown";
}

std::string InputError::format() const {
    return "failed to load file '" + path + "' - " + message;
}

// ============================================================================
// Чтение файла
// ============================================================================

bool read_file(const std::filesystem::path& path, std::string& out, InputError& error) {
    const std::string path_str = platform::path_to_utf8(path);

    std::error_code ec;
    if (!std::filesystem::exists(path, ec)) {
        error = InputError{InputErrorKind::FileNotFound, "file does not exist", path_str};
        return false;
    }

    std::ifstream file(path, std::ios::binary);
    if (!file.is_open()) {
        error = InputError{InputErrorKind::IoError, "could not open file", path_str};
        return false;
    }

    std::stringstream buffer;
    buffer << file.rdbuf();
    if (file.bad()) {
        error = InputError{InputErrorKind::IoError, "could not read file", path_str};
        return false;
    }

    out = buffer.str();
    return true;
}

// ============================================================================
// Проверка вложенности
// ============================================================================

std::size_t container_depth(const rapidjson::Value& root) {
    std::size_t max_seen = 0;
    std::vector<std::pair<const rapidjson::Value*, std::size_t>> stack;
    stack.emplace_back(&root, 0);

    while (!stack.empty()) {
        auto [node, depth] = stack.back();
        stack.pop_back();

        if (node->IsArray()) {
            const std::size_t inner = depth + 1;
            max_seen = std::max(max_seen, inner);
            for (const auto& elem : node->GetArray()) {
                stack.emplace_back(&elem, inner);
            }
        } else if (node->IsObject()) {
            const std::size_t inner = depth + 1;
            max_seen = std::max(max_seen, inner);
            for (const auto& member : node->GetObject()) {
                stack.emplace_back(&member.value, inner);
            }
        }
    }

    return max_seen;
}

// ============================================================================
// Парсинг
// ============================================================================

LoadResult parse_document(std::string_view text, const std::string& source,
                          std::size_t max_depth) {
    LoadResult result;

    rapidjson::Document doc;
    doc.Parse<rapidjson::kParseIterativeFlag>(text.data(), text.size());

    if (doc.HasParseError()) {
        result.error = InputError{InputErrorKind::ParseError,
                                  std::string("JSON parse error: ") +
                                      rapidjson::GetParseError_En(doc.GetParseError()) +
                                      " at offset " + std::to_string(doc.GetErrorOffset()),
                                  source};
        return result;
    }

    const std::size_t depth = container_depth(doc);
    if (depth > max_depth) {
        result.error = InputError{InputErrorKind::TooDeep,
                                  "document nesting depth " + std::to_string(depth) +
                                      " exceeds the limit of " + std::to_string(max_depth),
                                  source};
        return result;
    }

    result.value = Value::from_rapidjson(doc);
    result.ok = true;
    return result;
}

LoadResult load_document(const std::filesystem::path& path, std::size_t max_depth) {
    LoadResult result;

    std::string content;
    if (!read_file(path, content, result.error)) {
        return result;
    }

    return parse_document(content, platform::path_to_utf8(path), max_depth);
}

}  // namespace dtf::io
