// ==============================================================================
// dtf/settings.hpp - Файл настроек (YAML)
// ==============================================================================
//
// Назначение:
// - Загрузка --config <FILE> через yaml-cpp
// - Значения по умолчанию для флагов командной строки
//
// Пример:
//   key_diffs: true
//   value_diffs: true
//   array_same_order: false
//   max_depth: 256
//   column_width: 60
//
// Поле, отсутствующее в файле, остаётся nullopt и не влияет на прогон.
//
// Порядок наложения (merge):
//   умолчания -> файл настроек -> флаги командной строки
// Флаг категории может только включить её. --max-depth / --column-width
// из командной строки перекрывают значения файла. В режиме -r сохранённая
// конфигурация заменяет категории, имена файлов и режим массивов.
//
// ==============================================================================

#ifndef DTF_SETTINGS_HPP
#define DTF_SETTINGS_HPP

#include <dtf/cli.hpp>
#include <dtf/diff_types.hpp>
#include <dtf/reader.hpp>
#include <dtf/render.hpp>
#include <dtf/session.hpp>

#include <cstddef>
#include <filesystem>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace dtf::settings {

struct Settings {
    std::optional<bool> key_diffs;
    std::optional<bool> type_diffs;
    std::optional<bool> value_diffs;
    std::optional<bool> array_diffs;
    std::optional<bool> array_same_order;
    std::optional<std::size_t> max_depth;
    std::optional<std::size_t> column_width;

    /// Ключи, которые не распознаны (для предупреждений)
    std::vector<std::string> unknown_keys;
};

struct SettingsResult {
    bool ok = false;
    Settings settings;
    io::InputError error;

    explicit operator bool() const { return ok; }
};

/// Разобрать YAML-текст. Пустой документ: пустые настройки.
SettingsResult parse_settings(std::string_view text, const std::string& source);

/// Загрузить файл настроек
SettingsResult load_settings(const std::filesystem::path& path);

// ----------------------------------------------------------------------------
// Итоговая конфигурация прогона
// ----------------------------------------------------------------------------

struct RunSettings {
    Config config;
    std::size_t column_width = render::DEFAULT_COLUMN_WIDTH;
};

/// Наложить файл настроек и флаги командной строки на умолчания.
/// Категории проверяются вызывающей стороной по config.any_category().
RunSettings merge(const cli::RunCommand& cmd, const Settings& file);

/// Контекст сравнения -c: имена файлов из путей, конфигурация из merge
WorkingContext compare_context(const cli::RunCommand& cmd, const RunSettings& rs);

/// Контекст -r: всё из сессии, кроме max_depth
WorkingContext session_context(const session::SavedConfig& saved, const RunSettings& rs);

}  // namespace dtf::settings

#endif  // DTF_SETTINGS_HPP
