// ==============================================================================
// dtf/session.hpp - Сохранённые сессии (результат прогона в JSON)
// ==============================================================================
//
// Назначение:
// - SavedConfig / SavedContext: четыре последовательности diff'ов и
//   конфигурация прогона (флаги категорий, имена файлов, режим массивов)
// - write_session: сохранить результат вместо вывода таблиц (-w)
// - read_session: показать ранее сохранённый результат без пересчёта (-r)
//
// Формат:
//   {
//     "key_diff":   [{"key", "has", "misses"}],
//     "type_diff":  [{"key", "type1", "type2"}],
//     "value_diff": [{"key", "value1", "value2"}],
//     "array_diff": [{"key", "descriptor", "value"}],
//     "config": {"check_for_key_diffs", "check_for_type_diffs",
//                "check_for_value_diffs", "check_for_array_diffs",
//                "file_a", "file_b", "array_same_order"}
//   }
//
// ==============================================================================

#ifndef DTF_SESSION_HPP
#define DTF_SESSION_HPP

#include <dtf/diff_types.hpp>
#include <dtf/reader.hpp>

#include <filesystem>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace dtf::session {

// ----------------------------------------------------------------------------
// Модель сессии
// ----------------------------------------------------------------------------

struct SavedConfig {
    bool check_for_key_diffs = false;
    bool check_for_type_diffs = false;
    bool check_for_value_diffs = false;
    bool check_for_array_diffs = false;
    std::string file_a;
    std::string file_b;
    bool array_same_order = false;

    /// Снимок рабочего контекста прогона
    static SavedConfig from_context(const WorkingContext& ctx);

    /// Восстановить контекст (max_depth не сохраняется и берётся по умолчанию)
    WorkingContext to_context() const;

    bool operator==(const SavedConfig& other) const;
    bool operator!=(const SavedConfig& other) const { return !(*this == other); }
};

struct SavedContext {
    std::vector<KeyDiff> key_diff;
    std::vector<TypeDiff> type_diff;
    std::vector<ValueDiff> value_diff;
    std::vector<ArrayDiff> array_diff;
    SavedConfig config;

    /// Категории, выключенные в config, становятся nullopt
    DiffCollection to_collection() const;
};

// ----------------------------------------------------------------------------
// Ошибки записи
// ----------------------------------------------------------------------------

struct OutputError {
    std::string message;
    std::string path;

    /// "failed to write file '<path>' - <message>"
    std::string format() const;
};

// ----------------------------------------------------------------------------
// Запись / чтение
// ----------------------------------------------------------------------------

/// Сериализовать сессию в pretty JSON (отсутствующие категории: пустые массивы)
std::string serialize_session(const DiffCollection& diffs, const SavedConfig& config);

/// Записать сессию в файл. nullopt при успехе.
std::optional<OutputError> write_session(const std::filesystem::path& path,
                                         const DiffCollection& diffs, const SavedConfig& config);

/// Результат чтения сессии
struct SessionResult {
    bool ok = false;
    SavedContext session;
    io::InputError error;

    explicit operator bool() const { return ok; }
};

/// Разобрать сессию из JSON-текста. `source` используется только в ошибках.
SessionResult parse_session(std::string_view text, const std::string& source);

/// Прочитать сессию из файла
SessionResult read_session(const std::filesystem::path& path);

}  // namespace dtf::session

#endif  // DTF_SESSION_HPP
