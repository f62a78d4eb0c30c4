// ==============================================================================
// render.cpp - Табличное представление результатов сравнения
// ==============================================================================

#include <dtf/reader.hpp>
#include <dtf/render.hpp>
#include <rapidjson/document.h>
#include <rapidjson/prettywriter.h>
#include <rapidjson/stringbuffer.h>

namespace dtf::render {

namespace {

constexpr const char* CHECKMARK = "\xe2\x9c\x93";  // ✓ U+2713
constexpr const char* MULTIPLY = "\xc3\x97";       // × U+00D7

constexpr const char* KEY_COLUMN = "Key";

output::Table make_table(const char* title, const WorkingContext& ctx,
                         const RenderOptions& options) {
    output::Table table;
    table.set_title(title);
    table.set_headers({KEY_COLUMN, ctx.file_a.name, ctx.file_b.name});
    table.set_max_column_width(options.column_width);
    return table;
}

std::string marker(bool has, const RenderOptions& options) {
    if (has) {
        return options.color ? output::colorize(CHECKMARK, output::Color::Green) : CHECKMARK;
    }
    return options.color ? output::colorize(MULTIPLY, output::Color::Red) : MULTIPLY;
}

bool is_side_a(ArrayDiffDesc desc) {
    return desc == ArrayDiffDesc::AHas || desc == ArrayDiffDesc::AMisses;
}

bool is_has(ArrayDiffDesc desc) {
    return desc == ArrayDiffDesc::AHas || desc == ArrayDiffDesc::BHas;
}

}  // namespace

std::string sanitize_json_str(std::string_view json_str) {
    constexpr unsigned PARSE_FLAGS = rapidjson::kParseNanAndInfFlag |
                                     rapidjson::kParseFullPrecisionFlag |
                                     rapidjson::kParseIterativeFlag;

    rapidjson::Document doc;
    doc.Parse<PARSE_FLAGS>(json_str.data(), json_str.size());
    if (doc.HasParseError() || io::container_depth(doc) > DEFAULT_MAX_DEPTH) {
        return std::string(json_str);
    }

    rapidjson::StringBuffer buffer;
    rapidjson::PrettyWriter<rapidjson::StringBuffer, rapidjson::UTF8<>, rapidjson::UTF8<>,
                            rapidjson::CrtAllocator, rapidjson::kWriteNanAndInfFlag>
        writer(buffer);
    writer.SetIndent(' ', 2);
    if (!doc.Accept(writer)) {
        return std::string(json_str);
    }
    return std::string(buffer.GetString(), buffer.GetSize());
}

output::Table key_diff_table(const std::vector<KeyDiff>& diffs, const WorkingContext& ctx,
                             const RenderOptions& options) {
    auto table = make_table("Key Differences", ctx, options);
    for (const auto& kd : diffs) {
        table.add_row({kd.key, marker(kd.has == ctx.file_a.name, options),
                       marker(kd.has == ctx.file_b.name, options)});
    }
    return table;
}

output::Table type_diff_table(const std::vector<TypeDiff>& diffs, const WorkingContext& ctx,
                              const RenderOptions& options) {
    auto table = make_table("Type Differences", ctx, options);
    for (const auto& td : diffs) {
        table.add_row({td.key, td.type1, td.type2});
    }
    return table;
}

output::Table value_diff_table(const std::vector<ValueDiff>& diffs, const WorkingContext& ctx,
                               const RenderOptions& options) {
    auto table = make_table("Value Differences", ctx, options);
    for (const auto& vd : diffs) {
        table.add_row({vd.key, sanitize_json_str(vd.value1), sanitize_json_str(vd.value2)});
    }
    return table;
}

output::Table array_diff_table(const std::vector<ArrayDiff>& diffs, const WorkingContext& ctx,
                               const RenderOptions& options) {
    auto table = make_table("Array Differences", ctx, options);
    for (const auto& ad : diffs) {
        std::string cell = is_has(ad.descriptor) ? "+ " : "- ";
        cell += sanitize_json_str(ad.value);

        if (is_side_a(ad.descriptor)) {
            table.add_row({ad.key, cell, ""});
        } else {
            table.add_row({ad.key, "", cell});
        }
    }
    return table;
}

std::string render_tables(const DiffCollection& diffs, const WorkingContext& ctx,
                          const RenderOptions& options) {
    std::string result;

    // Каждая таблица завершается пустой строкой
    auto append = [&result](const output::Table& table) {
        result += table.to_string();
        result += '\n';
    };

    if (diffs.key_diffs && !diffs.key_diffs->empty()) {
        append(key_diff_table(*diffs.key_diffs, ctx, options));
    }
    if (diffs.type_diffs && !diffs.type_diffs->empty()) {
        append(type_diff_table(*diffs.type_diffs, ctx, options));
    }
    if (diffs.value_diffs && !diffs.value_diffs->empty()) {
        append(value_diff_table(*diffs.value_diffs, ctx, options));
    }
    if (diffs.array_diffs && !diffs.array_diffs->empty()) {
        append(array_diff_table(*diffs.array_diffs, ctx, options));
    }

    return result;
}

void print_tables(output::Writer& w, const DiffCollection& diffs, const WorkingContext& ctx,
                  const RenderOptions& options) {
    if (diffs.no_differences()) {
        w.info("No differences found");
        return;
    }
    w.write(output::Stream::Stdout, render_tables(diffs, ctx, options));
    w.flush();
}

}  // namespace dtf::render
