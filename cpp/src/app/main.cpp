// ==============================================================================
// main.cpp - Точка входа приложения
// ==============================================================================
//
// Точка входа:
// 1. Парсинг argv (cli)
// 2. Создание Writer (output)
// 3. Сборка конфигурации: умолчания -> --config -> флаги
// 4. Сравнение документов либо чтение сохранённой сессии
// 5. Вывод таблиц либо запись сессии (-w)
// 6. Возврат exit code
//
// Исключения перехватываются только здесь, на границе приложения.
//
// ==============================================================================

#include <dtf/cli.hpp>
#include <dtf/compare.hpp>
#include <dtf/output.hpp>
#include <dtf/platform.hpp>
#include <dtf/reader.hpp>
#include <dtf/render.hpp>
#include <dtf/session.hpp>
#include <dtf/settings.hpp>
#include <cstddef>
#include <exception>
#include <filesystem>
#include <iostream>
#include <string>
#include <type_traits>
#include <utility>
#include <variant>

namespace {

void trace_config(dtf::output::Writer& writer, const dtf::WorkingContext& ctx) {
    const auto flag = [](bool on) { return on ? "on" : "off"; };
    writer.trace(std::string("categories: key=") + flag(ctx.config.check_for_key_diffs) +
                 " type=" + flag(ctx.config.check_for_type_diffs) +
                 " value=" + flag(ctx.config.check_for_value_diffs) +
                 " array=" + flag(ctx.config.check_for_array_diffs));
    writer.trace(std::string("array_same_order=") + flag(ctx.config.array_same_order) +
                 " max_depth=" + std::to_string(ctx.config.max_depth));
}

/// Загрузить документ; ошибка уже выведена, если результат пуст
bool load(const std::filesystem::path& path, std::size_t max_depth, dtf::Value& out,
          dtf::output::Writer& writer) {
    writer.debug("Loading document '" + dtf::platform::path_to_utf8(path) + "'");

    auto loaded = dtf::io::load_document(path, max_depth);
    if (!loaded) {
        writer.error(loaded.error.format());
        return false;
    }
    out = std::move(loaded.value);
    return true;
}

// ----------------------------------------------------------------------------
// Выполнение RunCommand
// ----------------------------------------------------------------------------

int run_command(const dtf::cli::RunCommand& cmd, dtf::output::Writer& writer) {
    using namespace dtf;

    settings::Settings file_settings;
    if (cmd.config.has_value()) {
        writer.debug("Loading settings '" + platform::path_to_utf8(*cmd.config) + "'");
        auto loaded = settings::load_settings(*cmd.config);
        if (!loaded) {
            writer.error(loaded.error.format());
            return 1;
        }
        file_settings = std::move(loaded.settings);
        for (const auto& key : file_settings.unknown_keys) {
            writer.warn("Unknown settings key '" + key + "' ignored");
        }
    }

    const settings::RunSettings rs = settings::merge(cmd, file_settings);

    WorkingContext ctx;
    DiffCollection diffs;

    if (cmd.read_session.has_value()) {
        // Сохранённая конфигурация заменяет категории, имена файлов и режим массивов
        writer.debug("Reading session '" + platform::path_to_utf8(*cmd.read_session) + "'");
        auto loaded = session::read_session(*cmd.read_session);
        if (!loaded) {
            writer.error(loaded.error.format());
            return 1;
        }
        ctx = settings::session_context(loaded.session.config, rs);
        diffs = loaded.session.to_collection();
        trace_config(writer, ctx);
    } else {
        if (!rs.config.any_category()) {
            writer.write(output::Stream::Stderr, cli::render_missing_category_error());
            return 2;
        }

        ctx = settings::compare_context(cmd, rs);
        trace_config(writer, ctx);

        Value a;
        Value b;
        if (!load(*cmd.file_a, ctx.config.max_depth, a, writer) ||
            !load(*cmd.file_b, ctx.config.max_depth, b, writer)) {
            return 1;
        }

        writer.debug("Comparing '" + ctx.file_a.name + "' with '" + ctx.file_b.name + "'");
        diffs = collect_diffs(a, b, ctx);
    }

    if (diffs.key_diffs) {
        writer.debug("Key differences: " + std::to_string(diffs.key_diffs->size()));
    }
    if (diffs.type_diffs) {
        writer.debug("Type differences: " + std::to_string(diffs.type_diffs->size()));
    }
    if (diffs.value_diffs) {
        writer.debug("Value differences: " + std::to_string(diffs.value_diffs->size()));
    }
    if (diffs.array_diffs) {
        writer.debug("Array differences: " + std::to_string(diffs.array_diffs->size()));
    }

    if (cmd.write_session.has_value()) {
        const auto error = session::write_session(*cmd.write_session, diffs,
                                                  session::SavedConfig::from_context(ctx));
        if (error.has_value()) {
            writer.error(error->format());
            return 1;
        }
        writer.info("Session saved to '" + platform::path_to_utf8(*cmd.write_session) + "'");
        return 0;
    }

    render::RenderOptions options;
    options.color = writer.use_color(output::Stream::Stdout);
    options.column_width = rs.column_width;
    render::print_tables(writer, diffs, ctx, options);
    return 0;
}

// ----------------------------------------------------------------------------
// Главная функция выполнения (run)
// ----------------------------------------------------------------------------

int run(int argc, char** argv) {
    using namespace dtf;

    // 1. Парсинг argv
    cli::ParseResult parse_result = cli::parse(argc, argv);

    // 2. Создание Writer
    output::OutputConfig out_cfg;
    out_cfg.quiet = parse_result.global.quiet;
    out_cfg.verbose = parse_result.global.verbose;
    output::Writer writer(out_cfg);

    // 3. Ошибки парсинга печатаются как есть, без префикса [x]
    if (!parse_result.ok) {
        writer.write(output::Stream::Stderr, parse_result.diagnostic.stderr_message);
        return parse_result.diagnostic.exit_code;
    }

    // 4. Dispatch команды
    return std::visit(
        [&](auto&& cmd) -> int {
            using T = std::decay_t<decltype(cmd)>;

            if constexpr (std::is_same_v<T, cli::HelpCommand>) {
                writer.write(output::Stream::Stdout, cli::render_help());
                return 0;
            } else if constexpr (std::is_same_v<T, cli::VersionCommand>) {
                writer.write(output::Stream::Stdout, cli::render_version());
                return 0;
            } else {
                return run_command(cmd, writer);
            }
        },
        parse_result.command);
}

}  // anonymous namespace

// ----------------------------------------------------------------------------
// main
// ----------------------------------------------------------------------------

int main(int argc, char** argv) {
    try {
        return run(argc, argv);
    } catch (const std::exception& e) {
        // Формат ошибки "[x] <err>"
        std::cerr << "[x] " << e.what() << "\n";
        return 1;
    }
}
