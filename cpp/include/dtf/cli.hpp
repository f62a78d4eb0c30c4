// ==============================================================================
// dtf/cli.hpp - Разбор командной строки
// ==============================================================================
//
// Назначение:
// - Парсинг argv
// - Генерация --help / --version
// - Диагностические ошибки в стиле clap (exit code 2)
//
// Форма вызова:
//   dtf [OPTIONS] -c <FILE_A> <FILE_B>
//   dtf [OPTIONS] -r <SESSION>
//
// ==============================================================================

#ifndef DTF_CLI_HPP
#define DTF_CLI_HPP

#include <cstddef>
#include <filesystem>
#include <optional>
#include <string>
#include <variant>

namespace dtf::cli {

// ----------------------------------------------------------------------------
// Глобальные опции
// ----------------------------------------------------------------------------

struct GlobalOptions {
    int verbose = 0;     // --verbose (repeatable)
    bool quiet = false;  // -q, --quiet
};

// ----------------------------------------------------------------------------
// Команды
// ----------------------------------------------------------------------------

/// Сравнение двух документов либо показ сохранённой сессии
struct RunCommand {
    std::optional<std::filesystem::path> file_a;         // -c <FILE_A> <FILE_B>
    std::optional<std::filesystem::path> file_b;
    std::optional<std::filesystem::path> read_session;   // -r <SESSION>
    std::optional<std::filesystem::path> write_session;  // -w <SESSION>

    bool key_diffs = false;         // -k
    bool type_diffs = false;        // -t
    bool value_diffs = false;       // -v
    bool array_diffs = false;       // -a
    bool array_same_order = false;  // -o

    std::optional<std::filesystem::path> config;  // --config <FILE>
    std::optional<std::size_t> max_depth;         // --max-depth <N>
    std::optional<std::size_t> column_width;      // --column-width <N>

    /// Включена хотя бы одна категория
    bool any_category() const { return key_diffs || type_diffs || value_diffs || array_diffs; }
};

/// help - показать справку
struct HelpCommand {};

/// version - показать версию
struct VersionCommand {};

using Command = std::variant<RunCommand, HelpCommand, VersionCommand>;

// ----------------------------------------------------------------------------
// Диагностика CLI
// ----------------------------------------------------------------------------

struct CliDiagnostic {
    int exit_code = 2;
    std::string stderr_message;
};

// ----------------------------------------------------------------------------
// Результат парсинга
// ----------------------------------------------------------------------------

struct ParseResult {
    bool ok = false;
    GlobalOptions global;
    Command command;
    CliDiagnostic diagnostic;
};

// ----------------------------------------------------------------------------
// API парсинга
// ----------------------------------------------------------------------------

/// Парсить аргументы командной строки
ParseResult parse(int argc, char** argv);

/// Текст --help
std::string render_help();

/// Текст --version
std::string render_version();

/// "error: ..." + Usage + подсказка про --help
std::string render_usage_error(const std::string& error_msg);

/// Ошибка "не выбрана ни одна категория" (повторная проверка после --config)
std::string render_missing_category_error();

// ----------------------------------------------------------------------------
// Константы
// ----------------------------------------------------------------------------

/// Версия программы
constexpr const char* VERSION = "0.1.0";

/// Описание программы
constexpr const char* ABOUT = "Find the difference in your data structures";

}  // namespace dtf::cli

#endif  // DTF_CLI_HPP
