// ==============================================================================
// dtf/render.hpp - Табличное представление результатов сравнения
// ==============================================================================
//
// Назначение:
// - Таблица на каждую включённую непустую категорию, в порядке
//   key, type, value, array
// - Заголовок таблицы на всю ширину, затем строка "Key | <file_a> | <file_b>"
// - Значения в ячейках выводятся как pretty JSON
//
// Модуль ничего не пишет сам: результат возвращается строкой или
// отдаётся output::Writer.
//
// ==============================================================================

#ifndef DTF_RENDER_HPP
#define DTF_RENDER_HPP

#include <dtf/diff_types.hpp>
#include <dtf/output.hpp>

#include <cstddef>
#include <string>
#include <string_view>
#include <vector>

namespace dtf::render {

constexpr std::size_t DEFAULT_COLUMN_WIDTH = 80;

struct RenderOptions {
    bool color = false;                               // ANSI-цвета для ✓ / ×
    std::size_t column_width = DEFAULT_COLUMN_WIDTH;  // перенос длинных ячеек
};

/// Pretty JSON (отступ 2). Если текст не разбирается как JSON или вложен глубже
/// DEFAULT_MAX_DEPTH, он возвращается как есть.
std::string sanitize_json_str(std::string_view json_str);

output::Table key_diff_table(const std::vector<KeyDiff>& diffs, const WorkingContext& ctx,
                             const RenderOptions& options);

output::Table type_diff_table(const std::vector<TypeDiff>& diffs, const WorkingContext& ctx,
                              const RenderOptions& options);

output::Table value_diff_table(const std::vector<ValueDiff>& diffs, const WorkingContext& ctx,
                               const RenderOptions& options);

output::Table array_diff_table(const std::vector<ArrayDiff>& diffs, const WorkingContext& ctx,
                               const RenderOptions& options);

/// Все таблицы одной строкой; пустая строка, если показывать нечего
std::string render_tables(const DiffCollection& diffs, const WorkingContext& ctx,
                          const RenderOptions& options);

/// Вывести таблицы в stdout, либо "No differences found" через info
void print_tables(output::Writer& w, const DiffCollection& diffs, const WorkingContext& ctx,
                  const RenderOptions& options);

}  // namespace dtf::render

#endif  // DTF_RENDER_HPP
