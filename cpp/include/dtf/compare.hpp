// ==============================================================================
// dtf/compare.hpp - Рекурсивный движок структурного сравнения
// ==============================================================================
//
// Назначение:
// - compare_field: диспетчер по паре видов (6×6), единственный
//   рекурсивный шаг сравнения
// - компараторы примитивов, объектов и массивов
// - обработчики пары с null и несовпадения видов
// - четыре find_*_diffs: точки входа по категориям
// - collect_diffs: все включённые категории за один обход
//
// Движок синхронный, не имеет разделяемого изменяемого состояния и не
// пишет в stdout/stderr. Документы и WorkingContext только читаются.
//
// Пути полей:
// - корень: пустая строка
// - поле объекта: "parent.key" (в корне просто "key")
// - элемент массива в режиме array_same_order: "parent[i]"
//
// ==============================================================================

#ifndef DTF_COMPARE_HPP
#define DTF_COMPARE_HPP

#include <dtf/diff_types.hpp>
#include <dtf/value.hpp>

#include <cstddef>
#include <stdexcept>
#include <string>
#include <string_view>
#include <vector>

namespace dtf {

// ----------------------------------------------------------------------------
// DepthLimitError
// ----------------------------------------------------------------------------

/// Вложенность превысила Config::max_depth.
/// Документы, загруженные через io::load_document с тем же лимитом,
/// никогда не приводят к этой ошибке.
class DepthLimitError : public std::runtime_error {
public:
    DepthLimitError(const std::string& key, std::size_t max_depth);

    const std::string& key() const { return key_; }

private:
    std::string key_;
};

// ----------------------------------------------------------------------------
// Построение путей
// ----------------------------------------------------------------------------

/// "parent.key", либо "key" для корня
std::string child_key(std::string_view parent, std::string_view key);

/// "parent[index]"
std::string index_key(std::string_view parent, std::size_t index);

// ----------------------------------------------------------------------------
// Диспетчер
// ----------------------------------------------------------------------------

/// Сравнить одно поле: маршрутизация по паре видов (a, b).
///
/// | a            | b            | обработчик                  |
/// |--------------|--------------|-----------------------------|
/// | null         | null         | нет различий                |
/// | примитив X   | примитив X   | compare_primitives          |
/// | array        | array        | compare_arrays              |
/// | object       | object       | compare_objects             |
/// | null         | не null      | handle_one_element_null_*   |
/// | не null      | null         | handle_one_element_null_*   |
/// | разные виды  |              | handle_different_types      |
ComparisonResult compare_field(std::string_view key, const Value& a, const Value& b,
                               const WorkingContext& ctx);

// ----------------------------------------------------------------------------
// Компараторы
// ----------------------------------------------------------------------------

/// Два примитива одного вида (string/number/bool).
/// Пусто при равенстве, иначе один ValueDiff с каноническими формами.
std::vector<ValueDiff> compare_primitives(std::string_view key, const Value& a, const Value& b);

/// Объединение ключей обоих объектов в отсортированном порядке:
/// общие: рекурсия через compare_field, односторонние: KeyDiff.
ComparisonResult compare_objects(std::string_view key, const Value::Object& a,
                                 const Value::Object& b, const WorkingContext& ctx);

/// array_same_order: попарно по индексам; иначе сравнение мультимножеств
/// канонических форм элементов (только ArrayDiff).
ComparisonResult compare_arrays(std::string_view key, const Value::Array& a,
                                const Value::Array& b, const WorkingContext& ctx);

// ----------------------------------------------------------------------------
// Обработчики особых пар
// ----------------------------------------------------------------------------

/// Ровно одна сторона null, другая: примитив: ValueDiff("null", значение)
std::vector<ValueDiff> handle_one_element_null_primitives(std::string_view key, const Value& a,
                                                          const Value& b);

/// Ровно одна сторона null, другая: массив: null считается пустым массивом,
/// каждый элемент другой стороны даёт пару Has/Misses
std::vector<ArrayDiff> handle_one_element_null_arrays(std::string_view key, const Value& a,
                                                      const Value& b);

/// Ровно одна сторона null, другая: объект: null считается пустым объектом,
/// каждый ключ другой стороны даёт KeyDiff
ComparisonResult handle_one_element_null_objects(std::string_view key, const Value& a,
                                                 const Value& b, const WorkingContext& ctx);

/// Оба не null, виды различаются: ровно один TypeDiff
std::vector<TypeDiff> handle_different_types(std::string_view key, const Value& a,
                                             const Value& b);

// ----------------------------------------------------------------------------
// Точки входа по категориям
// ----------------------------------------------------------------------------
//
// Каждая функция обходит оба документа от корня (путь "") и вычисляет
// только свою категорию.
//

std::vector<KeyDiff> find_key_diffs(const Value& a, const Value& b, const WorkingContext& ctx);

std::vector<TypeDiff> find_type_diffs(const Value& a, const Value& b, const WorkingContext& ctx);

std::vector<ValueDiff> find_value_diffs(const Value& a, const Value& b,
                                        const WorkingContext& ctx);

std::vector<ArrayDiff> find_array_diffs(const Value& a, const Value& b,
                                        const WorkingContext& ctx);

/// Все категории, включённые в ctx.config, за один обход.
/// Выключенные категории не вычисляются и остаются nullopt.
DiffCollection collect_diffs(const Value& a, const Value& b, const WorkingContext& ctx);

}  // namespace dtf

#endif  // DTF_COMPARE_HPP
