// ==============================================================================
// dtf/reader.hpp - Загрузка JSON-документов
// ==============================================================================
//
// Назначение:
// - Чтение файла целиком в память и парсинг RapidJSON
// - Проверка вложенности до конверсии в Value
// - InputError: ошибки источника (чтение/парсинг), общие для
//   документов, сессий и файла настроек
//
// Движок сравнения никогда не читает файловую систему сам: сюда попадают
// пути, наружу выходят готовые Value.
//
// ==============================================================================

#ifndef DTF_READER_HPP
#define DTF_READER_HPP

#include <dtf/diff_types.hpp>
#include <dtf/value.hpp>

#include <cstddef>
#include <filesystem>
#include <rapidjson/document.h>
#include <string>
#include <string_view>

namespace dtf::io {

// ----------------------------------------------------------------------------
// InputError - ошибки источника
// ----------------------------------------------------------------------------

enum class InputErrorKind {
    FileNotFound,    // Файл не найден
    IoError,         // Ошибка ввода-вывода
    ParseError,      // Невалидный JSON/YAML
    TooDeep,         // Вложенность больше лимита
    InvalidSession,  // JSON валиден, но это не сохранённая сессия
};

/// Преобразовать InputErrorKind в строку
const char* input_error_kind_to_string(InputErrorKind kind);

struct InputError {
    InputErrorKind kind = InputErrorKind::IoError;
    std::string message;
    std::string path;

    /// "failed to load file '<path>' - <message>"
    std::string format() const;
};

// ----------------------------------------------------------------------------
// Загрузка
// ----------------------------------------------------------------------------

/// Результат загрузки документа
struct LoadResult {
    bool ok = false;
    Value value;
    InputError error;

    explicit operator bool() const { return ok; }
};

/// Прочитать и распарсить JSON-файл.
///
/// @param path Путь к файлу
/// @param max_depth Максимальная вложенность контейнеров
/// @return LoadResult с документом или ошибкой
///
/// Корнем может быть любое JSON-значение.
LoadResult load_document(const std::filesystem::path& path,
                         std::size_t max_depth = DEFAULT_MAX_DEPTH);

/// Распарсить JSON из строки. `source` используется только в ошибках.
LoadResult parse_document(std::string_view text, const std::string& source,
                          std::size_t max_depth = DEFAULT_MAX_DEPTH);

/// Максимальная вложенность контейнеров (скаляр в корне: 0).
/// Обход явным стеком, без рекурсии: годится для непроверенного дерева.
std::size_t container_depth(const rapidjson::Value& root);

/// Прочитать файл целиком. При ошибке заполняет `error` и возвращает false.
bool read_file(const std::filesystem::path& path, std::string& out, InputError& error);

}  // namespace dtf::io

#endif  // DTF_READER_HPP
