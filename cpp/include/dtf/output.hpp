// ==============================================================================
// dtf/output.hpp - Пользовательский вывод
// ==============================================================================
//
// Назначение:
// - Единственная точка записи в stdout/stderr
// - Сообщения с префиксами [+] [!] [x] [*] [~] и уровнями подробности
// - Цветной вывод (ANSI escape codes, только для TTY)
// - Таблицы с Unicode box-drawing
//
// Только этот модуль и app пишут в stdout/stderr.
//
// ==============================================================================

#ifndef DTF_OUTPUT_HPP
#define DTF_OUTPUT_HPP

#include <cstddef>
#include <cstdio>
#include <string>
#include <string_view>
#include <vector>

namespace dtf::output {

// ----------------------------------------------------------------------------
// Потоки вывода
// ----------------------------------------------------------------------------

enum class Stream { Stdout, Stderr };

// ----------------------------------------------------------------------------
// ANSI цвета для терминала
// ----------------------------------------------------------------------------

enum class Color {
    Default,
    Green,   // Успех, информация
    Yellow,  // Предупреждения
    Red,     // Ошибки
    Cyan,    // Отладка
    Magenta  // Трассировка
};

// ----------------------------------------------------------------------------
// Конфигурация вывода
// ----------------------------------------------------------------------------

struct OutputConfig {
    bool quiet = false;  // -q: подавить informational stderr
    int verbose = 0;     // --verbose: уровень подробности (0..2+)
};

// ----------------------------------------------------------------------------
// Writer - единый слой вывода
// ----------------------------------------------------------------------------

class Writer {
public:
    explicit Writer(const OutputConfig& cfg);
    ~Writer();

    Writer(const Writer&) = delete;
    Writer& operator=(const Writer&) = delete;

    // Базовый вывод
    // -------------------------------------------------------------------------

    /// Записать байты в поток
    void write(Stream s, std::string_view bytes);

    /// Записать строку с переводом строки
    void write_line(Stream s, std::string_view bytes);

    // Сообщения с префиксами
    // -------------------------------------------------------------------------

    /// "[+] <message>" в stderr (если не quiet)
    void info(std::string_view message);

    /// "[!] <message>" в stderr (если не quiet)
    void warn(std::string_view message);

    /// "[x] <message>" в stderr (всегда)
    void error(std::string_view message);

    /// "[*] <message>" в stderr (только при verbose > 0)
    void debug(std::string_view message);

    /// "[~] <message>" в stderr (только при verbose > 1)
    void trace(std::string_view message);

    // Управление
    // -------------------------------------------------------------------------

    /// Сбросить буферы
    void flush();

    /// Можно ли писать ANSI codes в поток (только TTY)
    bool use_color(Stream s) const;

    /// Получить текущую конфигурацию
    const OutputConfig& config() const { return config_; }

private:
    /// Префикс сообщения (цветной на TTY)
    void write_prefix(std::string_view prefix, Color color);

    /// Получить FILE* для потока
    FILE* get_file(Stream s) const;

    OutputConfig config_;
};

// ----------------------------------------------------------------------------
// Table - форматирование таблиц
// ----------------------------------------------------------------------------
//
// ┌──────────────────────────┐
// │     Key Differences      │   <- заголовок таблицы (set_title)
// ├─────┬──────────┬─────────┤
// │ Key │ a.json   │ b.json  │   <- заголовки столбцов
// ├─────┼──────────┼─────────┤
// │ x   │ ✓        │ ×       │
// └─────┴──────────┴─────────┘
//
// Ширина считается в символах: ANSI-последовательности не учитываются,
// кодовая точка UTF-8 занимает одну позицию. Ячейки с '\n' и ячейки
// длиннее max_column_width занимают несколько строк.
//

class Table {
public:
    Table();

    /// Заголовок над таблицей, по центру на всю ширину
    void set_title(std::string title);

    /// Добавить заголовки
    void set_headers(const std::vector<std::string>& headers);

    /// Добавить строку данных
    void add_row(const std::vector<std::string>& cells);

    /// Максимальная ширина содержимого ячейки (0: без ограничения)
    void set_max_column_width(std::size_t width);

    /// Вывести таблицу в строку
    std::string to_string() const;

    /// Получить количество строк (без заголовка)
    std::size_t row_count() const { return rows_.size(); }

private:
    using Lines = std::vector<std::string>;

    /// Разбить ячейки строки на физические строки
    std::vector<Lines> wrap_row(const std::vector<std::string>& cells) const;

    /// Вычислить ширину столбцов
    std::vector<std::size_t> calculate_widths() const;

    /// Горизонтальная линия: T: верх, M: середина, B: низ, N: без стыка
    std::string format_line(const std::vector<std::size_t>& widths, char left, char middle,
                            char right) const;

    /// Одна логическая строка таблицы (может занять несколько физических)
    std::string format_row(const std::vector<std::size_t>& widths,
                           const std::vector<std::string>& cells) const;

    std::string title_;
    std::vector<std::string> headers_;
    std::vector<std::vector<std::string>> rows_;
    std::size_t max_column_width_ = 0;
};

// ----------------------------------------------------------------------------
// Вспомогательные функции
// ----------------------------------------------------------------------------

/// Ширина строки на экране: без ANSI escape, по кодовым точкам UTF-8
std::size_t display_width(std::string_view text);

/// Разбить текст на строки по '\n' и по `width` символов (0: только по '\n')
std::vector<std::string> wrap_text(std::string_view text, std::size_t width);

/// Обернуть текст в цвет
std::string colorize(std::string_view text, Color color);

/// Получить ANSI escape code для цвета
std::string ansi_color_code(Color color);

/// Проверить, поддерживает ли поток цвета (TTY check)
bool supports_color(Stream s);

}  // namespace dtf::output

#endif  // DTF_OUTPUT_HPP
