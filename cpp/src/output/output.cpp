// ==============================================================================
// output.cpp - Пользовательский вывод
// ==============================================================================
//
// Байты первичны: запись через fwrite, без std::endl.
// Только этот модуль и app пишут в stdout/stderr.
//
// ==============================================================================

#include <algorithm>
#include <cstdio>
#include <dtf/output.hpp>
#include <dtf/platform.hpp>

namespace dtf::output {

// ----------------------------------------------------------------------------
// ANSI Escape Codes
// ----------------------------------------------------------------------------

namespace {

// ANSI SGR (Select Graphic Rendition) коды
constexpr const char* ANSI_RESET = "\x1b[0m";
constexpr const char* ANSI_GREEN = "\x1b[32m";
constexpr const char* ANSI_YELLOW = "\x1b[33m";
constexpr const char* ANSI_RED = "\x1b[31m";
constexpr const char* ANSI_CYAN = "\x1b[36m";
constexpr const char* ANSI_MAGENTA = "\x1b[35m";

// Unicode box-drawing characters (UTF-8)
constexpr const char* BOX_V = "\xe2\x94\x82";      // │ U+2502
constexpr const char* BOX_H = "\xe2\x94\x80";      // ─ U+2500
constexpr const char* BOX_TL = "\xe2\x94\x8c";     // ┌ U+250C
constexpr const char* BOX_TR = "\xe2\x94\x90";     // ┐ U+2510
constexpr const char* BOX_BL = "\xe2\x94\x94";     // └ U+2514
constexpr const char* BOX_BR = "\xe2\x94\x98";     // ┘ U+2518
constexpr const char* BOX_LT = "\xe2\x94\x9c";     // ├ U+251C
constexpr const char* BOX_RT = "\xe2\x94\xa4";     // ┤ U+2524
constexpr const char* BOX_TT = "\xe2\x94\xac";     // ┬ U+252C
constexpr const char* BOX_BT = "\xe2\x94\xb4";     // ┴ U+2534
constexpr const char* BOX_CROSS = "\xe2\x94\xbc";  // ┼ U+253C

/// Длина UTF-8 последовательности по ведущему байту (битый байт считается за 1)
std::size_t utf8_sequence_length(unsigned char lead) {
    if (lead < 0x80) {
        return 1;
    }
    if ((lead >> 5) == 0x06) {
        return 2;
    }
    if ((lead >> 4) == 0x0E) {
        return 3;
    }
    if ((lead >> 3) == 0x1E) {
        return 4;
    }
    return 1;
}

/// Длина CSI-последовательности "\x1b[...<final>" с позиции pos, 0 если её там нет
std::size_t ansi_sequence_length(std::string_view text, std::size_t pos) {
    if (pos + 1 >= text.size() || text[pos] != '\x1b' || text[pos + 1] != '[') {
        return 0;
    }
    std::size_t i = pos + 2;
    while (i < text.size()) {
        const auto c = static_cast<unsigned char>(text[i]);
        ++i;
        if (c >= 0x40 && c <= 0x7E) {
            return i - pos;
        }
    }
    return text.size() - pos;
}

/// Длина следующего элемента текста: escape-последовательность или кодовая точка
std::size_t next_unit(std::string_view text, std::size_t pos, bool& visible) {
    std::size_t len = ansi_sequence_length(text, pos);
    if (len > 0) {
        visible = false;
        return len;
    }
    visible = true;
    len = utf8_sequence_length(static_cast<unsigned char>(text[pos]));
    return std::min(len, text.size() - pos);
}

void append_repeated(std::string& out, const char* piece, std::size_t count) {
    for (std::size_t i = 0; i < count; ++i) {
        out += piece;
    }
}

}  // namespace

// ----------------------------------------------------------------------------
// Writer
// ----------------------------------------------------------------------------

Writer::Writer(const OutputConfig& cfg) : config_(cfg) {}

Writer::~Writer() {
    flush();
}

void Writer::write(Stream s, std::string_view bytes) {
    FILE* f = get_file(s);
    if (f != nullptr && !bytes.empty()) {
        std::fwrite(bytes.data(), 1, bytes.size(), f);
    }
}

void Writer::write_line(Stream s, std::string_view bytes) {
    write(s, bytes);
    write(s, "\n");
}

FILE* Writer::get_file(Stream s) const {
    return (s == Stream::Stdout) ? stdout : stderr;
}

void Writer::write_prefix(std::string_view prefix, Color color) {
    if (use_color(Stream::Stderr)) {
        write(Stream::Stderr, ansi_color_code(color));
        write(Stream::Stderr, prefix);
        write(Stream::Stderr, ANSI_RESET);
    } else {
        write(Stream::Stderr, prefix);
    }
}

void Writer::info(std::string_view message) {
    if (config_.quiet) {
        return;
    }
    write_prefix("[+] ", Color::Green);
    write_line(Stream::Stderr, message);
}

void Writer::warn(std::string_view message) {
    if (config_.quiet) {
        return;
    }
    write_prefix("[!] ", Color::Yellow);
    write_line(Stream::Stderr, message);
}

void Writer::error(std::string_view message) {
    // Ошибки печатаются всегда, даже при --quiet
    write_prefix("[x] ", Color::Red);
    write_line(Stream::Stderr, message);
}

void Writer::debug(std::string_view message) {
    if (config_.verbose <= 0) {
        return;
    }
    write_prefix("[*] ", Color::Cyan);
    write_line(Stream::Stderr, message);
}

void Writer::trace(std::string_view message) {
    if (config_.verbose <= 1) {
        return;
    }
    write_prefix("[~] ", Color::Magenta);
    write_line(Stream::Stderr, message);
}

void Writer::flush() {
    std::fflush(stdout);
    std::fflush(stderr);
}

bool Writer::use_color(Stream s) const {
    return supports_color(s);
}

// ----------------------------------------------------------------------------
// Table
// ----------------------------------------------------------------------------

Table::Table() = default;

void Table::set_title(std::string title) {
    title_ = std::move(title);
}

void Table::set_headers(const std::vector<std::string>& headers) {
    headers_ = headers;
}

void Table::add_row(const std::vector<std::string>& cells) {
    rows_.push_back(cells);
}

void Table::set_max_column_width(std::size_t width) {
    max_column_width_ = width;
}

std::vector<Table::Lines> Table::wrap_row(const std::vector<std::string>& cells) const {
    std::vector<Lines> wrapped;
    wrapped.reserve(cells.size());
    for (const auto& cell : cells) {
        wrapped.push_back(wrap_text(cell, max_column_width_));
    }
    return wrapped;
}

std::vector<std::size_t> Table::calculate_widths() const {
    std::size_t num_cols = headers_.size();
    for (const auto& row : rows_) {
        num_cols = std::max(num_cols, row.size());
    }
    if (num_cols == 0 && !title_.empty()) {
        num_cols = 1;
    }

    std::vector<std::size_t> widths(num_cols, 0);

    auto measure = [&](const std::vector<std::string>& cells) {
        const auto wrapped = wrap_row(cells);
        for (std::size_t i = 0; i < wrapped.size(); ++i) {
            for (const auto& line : wrapped[i]) {
                widths[i] = std::max(widths[i], display_width(line));
            }
        }
    };

    measure(headers_);
    for (const auto& row : rows_) {
        measure(row);
    }

    // Заголовок таблицы шире столбцов: расширяем последний столбец
    if (!title_.empty()) {
        std::size_t inner = 0;
        for (std::size_t w : widths) {
            inner += w + 2;
        }
        inner += widths.size() - 1;

        const std::size_t needed = display_width(title_) + 2;
        if (needed > inner) {
            widths.back() += needed - inner;
        }
    }

    return widths;
}

std::string Table::format_line(const std::vector<std::size_t>& widths, char left, char middle,
                               char right) const {
    std::string line;

    if (left == 'T') {
        line += BOX_TL;  // ┌
    } else if (left == 'M') {
        line += BOX_LT;  // ├
    } else if (left == 'B') {
        line += BOX_BL;  // └
    }

    for (std::size_t i = 0; i < widths.size(); ++i) {
        // 1 пробел с каждой стороны + содержимое
        append_repeated(line, BOX_H, widths[i] + 2);

        if (i + 1 < widths.size()) {
            if (middle == 'T') {
                line += BOX_TT;  // ┬
            } else if (middle == 'M') {
                line += BOX_CROSS;  // ┼
            } else if (middle == 'B') {
                line += BOX_BT;  // ┴
            } else {
                line += BOX_H;  // ─
            }
        }
    }

    if (right == 'T') {
        line += BOX_TR;  // ┐
    } else if (right == 'M') {
        line += BOX_RT;  // ┤
    } else if (right == 'B') {
        line += BOX_BR;  // ┘
    }

    line += '\n';
    return line;
}

std::string Table::format_row(const std::vector<std::size_t>& widths,
                              const std::vector<std::string>& cells) const {
    const auto wrapped = wrap_row(cells);

    std::size_t height = 1;
    for (const auto& lines : wrapped) {
        height = std::max(height, lines.size());
    }

    std::string result;
    for (std::size_t line_no = 0; line_no < height; ++line_no) {
        result += BOX_V;  // │
        for (std::size_t i = 0; i < widths.size(); ++i) {
            result += ' ';

            std::string_view piece;
            if (i < wrapped.size() && line_no < wrapped[i].size()) {
                piece = wrapped[i][line_no];
            }
            result += piece;

            const std::size_t used = display_width(piece);
            if (used < widths[i]) {
                result.append(widths[i] - used, ' ');
            }

            result += ' ';
            result += BOX_V;  // │
        }
        result += '\n';
    }
    return result;
}

std::string Table::to_string() const {
    const auto widths = calculate_widths();
    if (widths.empty()) {
        return {};
    }

    const bool has_body = !headers_.empty() || !rows_.empty();
    std::string result;

    if (!title_.empty()) {
        // ┌─────────┐
        result += format_line(widths, 'T', 'N', 'T');

        std::size_t inner = 0;
        for (std::size_t w : widths) {
            inner += w + 2;
        }
        inner += widths.size() - 1;

        const std::size_t title_width = display_width(title_);
        const std::size_t left_pad = (inner - title_width) / 2;
        const std::size_t right_pad = inner - title_width - left_pad;

        result += BOX_V;
        result.append(left_pad, ' ');
        result += title_;
        result.append(right_pad, ' ');
        result += BOX_V;
        result += '\n';

        if (!has_body) {
            result += format_line(widths, 'B', 'N', 'B');
            return result;
        }
        // ├───┬───┤
        result += format_line(widths, 'M', 'T', 'M');
    } else {
        // ┌───┬───┐
        result += format_line(widths, 'T', 'T', 'T');
    }

    if (!headers_.empty()) {
        result += format_row(widths, headers_);
        if (!rows_.empty()) {
            // ├───┼───┤
            result += format_line(widths, 'M', 'M', 'M');
        }
    }

    for (std::size_t i = 0; i < rows_.size(); ++i) {
        result += format_row(widths, rows_[i]);
        if (i + 1 < rows_.size()) {
            result += format_line(widths, 'M', 'M', 'M');
        }
    }

    // └───┴───┘
    result += format_line(widths, 'B', 'B', 'B');
    return result;
}

// ----------------------------------------------------------------------------
// Вспомогательные функции
// ----------------------------------------------------------------------------

std::size_t display_width(std::string_view text) {
    std::size_t width = 0;
    std::size_t pos = 0;
    while (pos < text.size()) {
        bool visible = false;
        pos += next_unit(text, pos, visible);
        if (visible) {
            ++width;
        }
    }
    return width;
}

std::vector<std::string> wrap_text(std::string_view text, std::size_t width) {
    std::vector<std::string> lines;

    std::size_t start = 0;
    while (true) {
        const std::size_t nl = text.find('\n', start);
        const std::string_view line =
            text.substr(start, nl == std::string_view::npos ? std::string_view::npos : nl - start);

        if (width == 0 || display_width(line) <= width) {
            lines.emplace_back(line);
        } else {
            std::string current;
            std::size_t used = 0;
            std::size_t pos = 0;
            while (pos < line.size()) {
                bool visible = false;
                const std::size_t len = next_unit(line, pos, visible);
                if (visible && used == width) {
                    lines.push_back(std::move(current));
                    current.clear();
                    used = 0;
                }
                current.append(line.substr(pos, len));
                if (visible) {
                    ++used;
                }
                pos += len;
            }
            lines.push_back(std::move(current));
        }

        if (nl == std::string_view::npos) {
            break;
        }
        start = nl + 1;
    }

    return lines;
}

std::string colorize(std::string_view text, Color color) {
    if (color == Color::Default) {
        return std::string(text);
    }
    std::string result = ansi_color_code(color);
    result += text;
    result += ANSI_RESET;
    return result;
}

std::string ansi_color_code(Color color) {
    switch (color) {
    case Color::Green:
        return ANSI_GREEN;
    case Color::Yellow:
        return ANSI_YELLOW;
    case Color::Red:
        return ANSI_RED;
    case Color::Cyan:
        return ANSI_CYAN;
    case Color::Magenta:
        return ANSI_MAGENTA;
    case Color::Default:
        break;
    }
    return "";
}

bool supports_color(Stream s) {
    if (s == Stream::Stdout) {
        return platform::is_tty_stdout();
    }
    return platform::is_tty_stderr();
}

}  // namespace dtf::output
