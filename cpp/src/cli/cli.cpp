// ==============================================================================
// cli.cpp - Разбор командной строки
// ==============================================================================
//
// Тексты help/errors повторяют формат clap v4: "error: ...", пустая строка,
// Usage, пустая строка, подсказка про --help. Ошибки разбора дают exit code 2.
//
// ==============================================================================

#include <charconv>
#include <cstring>
#include <dtf/cli.hpp>
#include <dtf/diff_types.hpp>
#include <dtf/platform.hpp>
#include <string>
#include <utility>

namespace dtf::cli {

// ----------------------------------------------------------------------------
// Вспомогательные функции
// ----------------------------------------------------------------------------

namespace {

constexpr const char* USAGE = "Usage: dtf [OPTIONS] <-c <FILE_A> <FILE_B>|-r <SESSION>>";

bool str_eq(const char* a, const char* b) {
    return std::strcmp(a, b) == 0;
}

bool starts_with(const char* str, const char* prefix) {
    return std::strncmp(str, prefix, std::strlen(prefix)) == 0;
}

/// Аргумент похож на опцию ("-x", "--xx"); одиночный "-" опцией не считается
bool looks_like_option(const char* arg) {
    return arg[0] == '-' && arg[1] != '\0';
}

/// Однобуквенный флаг без значения
bool apply_short_flag(char c, RunCommand& run, GlobalOptions& global) {
    switch (c) {
    case 'k':
        run.key_diffs = true;
        return true;
    case 't':
        run.type_diffs = true;
        return true;
    case 'v':
        run.value_diffs = true;
        return true;
    case 'a':
        run.array_diffs = true;
        return true;
    case 'o':
        run.array_same_order = true;
        return true;
    case 'q':
        global.quiet = true;
        return true;
    default:
        return false;
    }
}

/// Положительное целое. При ошибке `reason` содержит причину в формате clap.
bool parse_positive(const char* text, std::size_t& out, std::string& reason) {
    const char* end = text + std::strlen(text);
    if (text == end) {
        reason = "cannot parse integer from empty string";
        return false;
    }

    std::size_t value = 0;
    auto [ptr, ec] = std::from_chars(text, end, value);
    if (ec == std::errc::result_out_of_range) {
        reason = "number too large to fit in target type";
        return false;
    }
    if (ec != std::errc() || ptr != end) {
        reason = "invalid digit found in string";
        return false;
    }
    if (value == 0) {
        reason = "number would be zero for non-zero type";
        return false;
    }

    out = value;
    return true;
}

ParseResult usage_error(ParseResult result, const std::string& message) {
    result.ok = false;
    result.diagnostic.exit_code = 2;
    result.diagnostic.stderr_message = render_usage_error(message);
    return result;
}

ParseResult missing_value(ParseResult result, const char* option) {
    return usage_error(std::move(result), std::string("error: a value is required for '") +
                                              option + "' but none was supplied");
}

ParseResult invalid_number(ParseResult result, const char* option, const char* value,
                           const std::string& reason) {
    return usage_error(std::move(result), std::string("error: invalid value '") + value +
                                              "' for '" + option + "': " + reason);
}

}  // anonymous namespace

// ----------------------------------------------------------------------------
// render_version / render_help
// ----------------------------------------------------------------------------

std::string render_version() {
    return std::string("dtf ") + VERSION + "\n";
}

std::string render_help() {
    return std::string(ABOUT) +
           "\n"
           "\n" +
           USAGE +
           "\n"
           "\n"
           "Options:\n"
           "  -c <FILE_A> <FILE_B>    The files to compare\n"
           "  -r <SESSION>            Render a saved session instead of comparing\n"
           "  -w <SESSION>            Save a session instead of rendering tables\n"
           "  -k                      Check for key differences\n"
           "  -t                      Check for type differences\n"
           "  -v                      Check for value differences\n"
           "  -a                      Check for array differences\n"
           "  -o                      Arrays must have the same order\n"
           "      --config <FILE>     YAML settings file\n"
           "      --max-depth <N>     Maximum nesting depth of the documents [default: 512]\n"
           "      --column-width <N>  Table cell width before wrapping [default: 80]\n"
           "  -q, --quiet             Suppress informational messages\n"
           "      --verbose...        Print debug output (twice for trace)\n"
           "  -h, --help              Print help\n"
           "  -V, --version           Print version\n";
}

// ----------------------------------------------------------------------------
// render_usage_error - сообщение об ошибке парсинга в стиле clap
// ----------------------------------------------------------------------------

std::string render_usage_error(const std::string& error_msg) {
    return error_msg + "\n\n" + USAGE + "\n\nFor more information, try '--help'.\n";
}

std::string render_missing_category_error() {
    return render_usage_error(
        "error: the following required arguments were not provided:\n"
        "  <-k|-t|-v|-a>");
}

// ----------------------------------------------------------------------------
// parse
// ----------------------------------------------------------------------------

ParseResult parse(int argc, char** argv) {
    ParseResult result;
    result.command = HelpCommand{};

    if (argc < 2) {
        // Без аргументов: справка в stderr, exit code 2
        result.diagnostic.exit_code = 2;
        result.diagnostic.stderr_message = render_help();
        return result;
    }

    RunCommand run;

    for (int i = 1; i < argc; ++i) {
        const char* arg = argv[i];

        if (str_eq(arg, "-h") || str_eq(arg, "--help")) {
            result.ok = true;
            result.command = HelpCommand{};
            return result;
        } else if (str_eq(arg, "-V") || str_eq(arg, "--version")) {
            result.ok = true;
            result.command = VersionCommand{};
            return result;
        } else if (str_eq(arg, "-c")) {
            // -c принимает ровно два значения
            int provided = 0;
            while (provided < 2 && i + 1 < argc && !looks_like_option(argv[i + 1])) {
                ++i;
                if (provided == 0) {
                    run.file_a = platform::path_from_utf8(argv[i]);
                } else {
                    run.file_b = platform::path_from_utf8(argv[i]);
                }
                ++provided;
            }
            if (provided == 0) {
                return missing_value(std::move(result), "-c <FILE_A> <FILE_B>");
            }
            if (provided == 1) {
                return usage_error(std::move(result),
                                   "error: 2 values required for '-c <FILE_A> <FILE_B>' but 1 "
                                   "was provided");
            }
            if (*run.file_a == *run.file_b) {
                return usage_error(std::move(result),
                                   "error: '-c <FILE_A> <FILE_B>' needs two different files, '" +
                                       std::string(argv[i]) + "' was given twice");
            }
        } else if (str_eq(arg, "-r") || str_eq(arg, "-w") || str_eq(arg, "--config")) {
            const char* option = str_eq(arg, "-r")   ? "-r <SESSION>"
                                 : str_eq(arg, "-w") ? "-w <SESSION>"
                                                     : "--config <FILE>";
            if (i + 1 >= argc || looks_like_option(argv[i + 1])) {
                return missing_value(std::move(result), option);
            }
            ++i;
            auto path = platform::path_from_utf8(argv[i]);
            if (str_eq(arg, "-r")) {
                run.read_session = std::move(path);
            } else if (str_eq(arg, "-w")) {
                run.write_session = std::move(path);
            } else {
                run.config = std::move(path);
            }
        } else if (starts_with(arg, "--config=")) {
            run.config = platform::path_from_utf8(arg + std::strlen("--config="));
        } else if (str_eq(arg, "--max-depth") || str_eq(arg, "--column-width") ||
                   starts_with(arg, "--max-depth=") || starts_with(arg, "--column-width=")) {
            const bool is_depth = starts_with(arg, "--max-depth");
            const char* option = is_depth ? "--max-depth <N>" : "--column-width <N>";

            const char* value = std::strchr(arg, '=');
            if (value != nullptr) {
                ++value;
            } else {
                if (i + 1 >= argc || looks_like_option(argv[i + 1])) {
                    return missing_value(std::move(result), option);
                }
                value = argv[++i];
            }

            std::size_t number = 0;
            std::string reason;
            if (!parse_positive(value, number, reason)) {
                return invalid_number(std::move(result), option, value, reason);
            }
            if (is_depth && number > MAX_DEPTH_LIMIT) {
                return invalid_number(std::move(result), option, value,
                                      std::string(value) + " is not in 1..=" +
                                          std::to_string(MAX_DEPTH_LIMIT));
            }
            if (is_depth) {
                run.max_depth = number;
            } else {
                run.column_width = number;
            }
        } else if (str_eq(arg, "--quiet")) {
            result.global.quiet = true;
        } else if (str_eq(arg, "--verbose")) {
            result.global.verbose++;
        } else if (arg[0] == '-' && arg[1] != '-' && arg[1] != '\0') {
            // Короткие флаги, в том числе слитные: -ktva
            for (const char* c = arg + 1; *c != '\0'; ++c) {
                if (!apply_short_flag(*c, run, result.global)) {
                    return usage_error(std::move(result),
                                       std::string("error: unexpected argument '") + arg +
                                           "' found");
                }
            }
        } else {
            return usage_error(std::move(result),
                               std::string("error: unexpected argument '") + arg + "' found");
        }
    }

    const bool has_files = run.file_a.has_value();
    const bool has_session = run.read_session.has_value();

    if (has_files && has_session) {
        return usage_error(std::move(result),
                           "error: the argument '-c <FILE_A> <FILE_B>' cannot be used with "
                           "'-r <SESSION>'");
    }
    if (!has_files && !has_session) {
        return usage_error(std::move(result),
                           "error: the following required arguments were not provided:\n"
                           "  <-c <FILE_A> <FILE_B>|-r <SESSION>>");
    }

    // Категории могут прийти из сессии (-r) или из файла настроек (--config)
    if (!run.any_category() && !has_session && !run.config.has_value()) {
        result.diagnostic.exit_code = 2;
        result.diagnostic.stderr_message = render_missing_category_error();
        return result;
    }

    result.ok = true;
    result.command = std::move(run);
    return result;
}

}  // namespace dtf::cli
