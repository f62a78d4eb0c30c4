// ==============================================================================
// dtf/diff_types.hpp - Типы diff-записей и рабочий контекст сравнения
// ==============================================================================
//
// Назначение:
// - WorkingFile / Config / WorkingContext: неизменяемая идентичность прогона
// - KeyDiff / TypeDiff / ValueDiff / ArrayDiff: классифицированные различия
// - ComparisonResult: четырёхкатегорийный пакет diff'ов одного поля
// - DiffCollection: результат прогона по включённым категориям
//
// Diff-записи создаются только компараторами (compare.hpp) и не
// изменяются после создания.
//
// ==============================================================================

#ifndef DTF_DIFF_TYPES_HPP
#define DTF_DIFF_TYPES_HPP

#include <cstddef>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace dtf {

// ----------------------------------------------------------------------------
// Рабочий контекст
// ----------------------------------------------------------------------------

/// Метка одной стороны сравнения (обычно путь к файлу)
struct WorkingFile {
    std::string name;
};

/// Лимит вложенности по умолчанию (для загрузки и сравнения)
constexpr std::size_t DEFAULT_MAX_DEPTH = 512;

/// Верхняя граница для --max-depth / max_depth: обход Value рекурсивный
constexpr std::size_t MAX_DEPTH_LIMIT = 10000;

/// Параметры сравнения. Неизменяемы во время прогона.
struct Config {
    bool array_same_order = false;  // -o: массивы сравниваются по индексам

    bool check_for_key_diffs = false;    // -k
    bool check_for_type_diffs = false;   // -t
    bool check_for_value_diffs = false;  // -v
    bool check_for_array_diffs = false;  // -a

    std::size_t max_depth = DEFAULT_MAX_DEPTH;

    /// Включена хотя бы одна категория
    bool any_category() const {
        return check_for_key_diffs || check_for_type_diffs || check_for_value_diffs ||
               check_for_array_diffs;
    }
};

/// Идентичность прогона: имена двух сторон + конфигурация.
/// Создаётся один раз и передаётся по const-ссылке через всю рекурсию.
struct WorkingContext {
    WorkingFile file_a;
    WorkingFile file_b;
    Config config;
};

// ----------------------------------------------------------------------------
// Diff-записи
// ----------------------------------------------------------------------------

/// Ключ есть ровно в одном из двух объектов.
/// has/misses: всегда имена file_a/file_b текущего контекста.
struct KeyDiff {
    std::string key;
    std::string has;
    std::string misses;

    bool operator==(const KeyDiff& other) const {
        return key == other.key && has == other.has && misses == other.misses;
    }
    bool operator!=(const KeyDiff& other) const { return !(*this == other); }
};

/// Ключ есть в обоих, но виды значений различаются (type1 != type2)
struct TypeDiff {
    std::string key;
    std::string type1;
    std::string type2;

    bool operator==(const TypeDiff& other) const {
        return key == other.key && type1 == other.type1 && type2 == other.type2;
    }
    bool operator!=(const TypeDiff& other) const { return !(*this == other); }
};

/// Сравнимые значения с различной канонической формой
struct ValueDiff {
    std::string key;
    std::string value1;
    std::string value2;

    bool operator==(const ValueDiff& other) const {
        return key == other.key && value1 == other.value1 && value2 == other.value2;
    }
    bool operator!=(const ValueDiff& other) const { return !(*this == other); }
};

/// Какая сторона содержит / не содержит элемент массива
enum class ArrayDiffDesc { AHas, AMisses, BHas, BMisses };

/// Имя дескриптора: "AHas", "AMisses", "BHas", "BMisses"
const char* array_diff_desc_name(ArrayDiffDesc desc);

/// Разбор имени дескриптора (nullopt для неизвестного)
std::optional<ArrayDiffDesc> array_diff_desc_from_name(std::string_view name);

/// Элемент есть только в одном из массивов.
/// Записи всегда идут парами: AHas+BMisses или BHas+AMisses.
struct ArrayDiff {
    std::string key;
    ArrayDiffDesc descriptor = ArrayDiffDesc::AHas;
    std::string value;

    bool operator==(const ArrayDiff& other) const {
        return key == other.key && descriptor == other.descriptor && value == other.value;
    }
    bool operator!=(const ArrayDiff& other) const { return !(*this == other); }
};

// ----------------------------------------------------------------------------
// Результаты
// ----------------------------------------------------------------------------

/// Пакет diff'ов одного поля (и всего, что вложено в него)
struct ComparisonResult {
    std::vector<KeyDiff> key_diffs;
    std::vector<TypeDiff> type_diffs;
    std::vector<ValueDiff> value_diffs;
    std::vector<ArrayDiff> array_diffs;

    bool empty() const {
        return key_diffs.empty() && type_diffs.empty() && value_diffs.empty() &&
               array_diffs.empty();
    }
};

/// Результат прогона: категория присутствует, только если включена
struct DiffCollection {
    std::optional<std::vector<KeyDiff>> key_diffs;
    std::optional<std::vector<TypeDiff>> type_diffs;
    std::optional<std::vector<ValueDiff>> value_diffs;
    std::optional<std::vector<ArrayDiff>> array_diffs;

    /// Все присутствующие категории пусты
    bool no_differences() const;
};

}  // namespace dtf

#endif  // DTF_DIFF_TYPES_HPP
