// ==============================================================================
// compare.cpp - Рекурсивный движок структурного сравнения
// ==============================================================================
//
// Все публичные функции: тонкие обёртки над Comparator. Comparator
// дописывает diff'ы прямо в общий ComparisonResult и пропускает работу
// для выключенных категорий, поэтому четыре find_*_diffs и collect_diffs
// используют один и тот же обход.
//
// ==============================================================================

#include <dtf/compare.hpp>

#include <algorithm>
#include <unordered_map>

namespace dtf {

DepthLimitError::DepthLimitError(const std::string& key, std::size_t max_depth)
    : std::runtime_error("nesting depth limit (" + std::to_string(max_depth) +
                         ") exceeded at '" + key + "'"),
      key_(key) {}

std::string child_key(std::string_view parent, std::string_view key) {
    std::string result;
    if (parent.empty()) {
        result.assign(key);
        return result;
    }
    result.reserve(parent.size() + 1 + key.size());
    result.append(parent);
    result += '.';
    result.append(key);
    return result;
}

std::string index_key(std::string_view parent, std::size_t index) {
    std::string result(parent);
    result += '[';
    result += std::to_string(index);
    result += ']';
    return result;
}

namespace {

const Value NULL_VALUE;
const Value::Object EMPTY_OBJECT;

// ----------------------------------------------------------------------------
// Categories - какие категории вычислять в текущем обходе
// ----------------------------------------------------------------------------

struct Categories {
    bool keys = true;
    bool types = true;
    bool values = true;
    bool arrays = true;

    static Categories all() { return Categories{}; }
    static Categories only_keys() { return Categories{true, false, false, false}; }
    static Categories only_types() { return Categories{false, true, false, false}; }
    static Categories only_values() { return Categories{false, false, true, false}; }
    static Categories only_arrays() { return Categories{false, false, false, true}; }

    static Categories from_config(const Config& cfg) {
        return Categories{cfg.check_for_key_diffs, cfg.check_for_type_diffs,
                          cfg.check_for_value_diffs, cfg.check_for_array_diffs};
    }

    bool any() const { return keys || types || values || arrays; }
};

// ----------------------------------------------------------------------------
// Comparator
// ----------------------------------------------------------------------------

class Comparator {
public:
    Comparator(const WorkingContext& ctx, Categories cats) : ctx_(ctx), cats_(cats) {}

    void field(const std::string& key, const Value& a, const Value& b, std::size_t depth,
               ComparisonResult& out) const;

    void primitives(const std::string& key, const Value& a, const Value& b,
                    ComparisonResult& out) const;
    void objects(const std::string& key, const Value::Object& a, const Value::Object& b,
                 std::size_t depth, ComparisonResult& out) const;
    void arrays(const std::string& key, const Value::Array& a, const Value::Array& b,
                std::size_t depth, ComparisonResult& out) const;

    void null_primitive(const std::string& key, const Value& a, const Value& b,
                        ComparisonResult& out) const;
    void null_array(const std::string& key, const Value& a, const Value& b,
                    ComparisonResult& out) const;
    void null_object(const std::string& key, const Value& a, const Value& b, std::size_t depth,
                     ComparisonResult& out) const;
    void different_types(const std::string& key, const Value& a, const Value& b,
                         ComparisonResult& out) const;

private:
    void arrays_ordered(const std::string& key, const Value::Array& a, const Value::Array& b,
                        std::size_t depth, ComparisonResult& out) const;
    void arrays_unordered(const std::string& key, const Value::Array& a, const Value::Array& b,
                          ComparisonResult& out) const;

    /// Элементы `from`, не покрытые мультимножеством `other`, как пары has/misses
    void array_surplus(const std::string& key, const Value::Array& from,
                       const Value::Array& other, ArrayDiffDesc has, ArrayDiffDesc misses,
                       ComparisonResult& out) const;

    void key_only(std::string key, const WorkingFile& has, const WorkingFile& misses,
                  ComparisonResult& out) const;

    const WorkingContext& ctx_;
    Categories cats_;
};

// Таблица 6×6: внешний switch по виду a, внутренний по виду b.
// Без default: пропущенный вид даст -Wswitch.
void Comparator::field(const std::string& key, const Value& a, const Value& b,
                       std::size_t depth, ComparisonResult& out) const {
    if (depth > ctx_.config.max_depth) {
        throw DepthLimitError(key, ctx_.config.max_depth);
    }

    const ValueKind kb = b.kind();

    switch (a.kind()) {
    case ValueKind::Null:
        switch (kb) {
        case ValueKind::Null:
            return;
        case ValueKind::Bool:
        case ValueKind::Number:
        case ValueKind::String:
            null_primitive(key, a, b, out);
            return;
        case ValueKind::Array:
            null_array(key, a, b, out);
            return;
        case ValueKind::Object:
            null_object(key, a, b, depth, out);
            return;
        }
        return;

    case ValueKind::Bool:
        switch (kb) {
        case ValueKind::Null:
            null_primitive(key, a, b, out);
            return;
        case ValueKind::Bool:
            primitives(key, a, b, out);
            return;
        case ValueKind::Number:
        case ValueKind::String:
        case ValueKind::Array:
        case ValueKind::Object:
            different_types(key, a, b, out);
            return;
        }
        return;

    case ValueKind::Number:
        switch (kb) {
        case ValueKind::Null:
            null_primitive(key, a, b, out);
            return;
        case ValueKind::Number:
            primitives(key, a, b, out);
            return;
        case ValueKind::Bool:
        case ValueKind::String:
        case ValueKind::Array:
        case ValueKind::Object:
            different_types(key, a, b, out);
            return;
        }
        return;

    case ValueKind::String:
        switch (kb) {
        case ValueKind::Null:
            null_primitive(key, a, b, out);
            return;
        case ValueKind::String:
            primitives(key, a, b, out);
            return;
        case ValueKind::Bool:
        case ValueKind::Number:
        case ValueKind::Array:
        case ValueKind::Object:
            different_types(key, a, b, out);
            return;
        }
        return;

    case ValueKind::Array:
        switch (kb) {
        case ValueKind::Null:
            null_array(key, a, b, out);
            return;
        case ValueKind::Array:
            arrays(key, a.as_array(), b.as_array(), depth, out);
            return;
        case ValueKind::Bool:
        case ValueKind::Number:
        case ValueKind::String:
        case ValueKind::Object:
            different_types(key, a, b, out);
            return;
        }
        return;

    case ValueKind::Object:
        switch (kb) {
        case ValueKind::Null:
            null_object(key, a, b, depth, out);
            return;
        case ValueKind::Object:
            objects(key, a.as_object(), b.as_object(), depth, out);
            return;
        case ValueKind::Bool:
        case ValueKind::Number:
        case ValueKind::String:
        case ValueKind::Array:
            different_types(key, a, b, out);
            return;
        }
        return;
    }
}

void Comparator::primitives(const std::string& key, const Value& a, const Value& b,
                            ComparisonResult& out) const {
    if (!cats_.values) {
        return;
    }

    bool equal = false;
    if (a.is_string()) {
        equal = a.as_string() == b.as_string();
    } else if (a.is_bool()) {
        equal = a.as_bool() == b.as_bool();
    } else {
        equal = Value::numbers_equal(a, b);
    }

    if (!equal) {
        out.value_diffs.push_back(ValueDiff{key, a.to_canonical_string(), b.to_canonical_string()});
    }
}

void Comparator::key_only(std::string key, const WorkingFile& has, const WorkingFile& misses,
                          ComparisonResult& out) const {
    out.key_diffs.push_back(KeyDiff{std::move(key), has.name, misses.name});
}

// Слияние двух отсортированных наборов ключей: объединение обходится
// в порядке возрастания ключа.
void Comparator::objects(const std::string& key, const Value::Object& a,
                         const Value::Object& b, std::size_t depth,
                         ComparisonResult& out) const {
    auto ia = a.begin();
    auto ib = b.begin();

    while (ia != a.end() || ib != b.end()) {
        if (ib == b.end() || (ia != a.end() && ia->first < ib->first)) {
            if (cats_.keys) {
                key_only(child_key(key, ia->first), ctx_.file_a, ctx_.file_b, out);
            }
            ++ia;
        } else if (ia == a.end() || ib->first < ia->first) {
            if (cats_.keys) {
                key_only(child_key(key, ib->first), ctx_.file_b, ctx_.file_a, out);
            }
            ++ib;
        } else {
            field(child_key(key, ia->first), ia->second, ib->second, depth + 1, out);
            ++ia;
            ++ib;
        }
    }
}

void Comparator::arrays(const std::string& key, const Value::Array& a, const Value::Array& b,
                        std::size_t depth, ComparisonResult& out) const {
    if (ctx_.config.array_same_order) {
        arrays_ordered(key, a, b, depth, out);
    } else {
        arrays_unordered(key, a, b, out);
    }
}

void Comparator::arrays_ordered(const std::string& key, const Value::Array& a,
                                const Value::Array& b, std::size_t depth,
                                ComparisonResult& out) const {
    const std::size_t n = std::max(a.size(), b.size());

    for (std::size_t i = 0; i < n; ++i) {
        std::string item_key = index_key(key, i);

        if (i < a.size() && i < b.size()) {
            field(item_key, a[i], b[i], depth + 1, out);
        } else if (i < a.size()) {
            // Отсутствующий элемент B считается null; явный null против
            // отсутствующего слота через null-пару не выразить: это KeyDiff
            if (a[i].is_null()) {
                if (cats_.keys) {
                    key_only(std::move(item_key), ctx_.file_a, ctx_.file_b, out);
                }
            } else {
                field(item_key, a[i], NULL_VALUE, depth + 1, out);
            }
        } else {
            if (b[i].is_null()) {
                if (cats_.keys) {
                    key_only(std::move(item_key), ctx_.file_b, ctx_.file_a, out);
                }
            } else {
                field(item_key, NULL_VALUE, b[i], depth + 1, out);
            }
        }
    }
}

void Comparator::array_surplus(const std::string& key, const Value::Array& from,
                               const Value::Array& other, ArrayDiffDesc has,
                               ArrayDiffDesc misses, ComparisonResult& out) const {
    std::unordered_map<std::string, std::size_t> available;
    for (const auto& elem : other) {
        ++available[elem.to_canonical_string()];
    }

    for (const auto& elem : from) {
        std::string text = elem.to_canonical_string();
        auto it = available.find(text);
        if (it != available.end() && it->second > 0) {
            --it->second;
            continue;
        }
        out.array_diffs.push_back(ArrayDiff{key, has, text});
        out.array_diffs.push_back(ArrayDiff{key, misses, std::move(text)});
    }
}

// Мультимножества: n вхождений в A против m в B дают max(n - m, 0) пар
// AHas/BMisses и max(m - n, 0) пар BHas/AMisses.
void Comparator::arrays_unordered(const std::string& key, const Value::Array& a,
                                  const Value::Array& b, ComparisonResult& out) const {
    if (!cats_.arrays) {
        return;
    }
    array_surplus(key, a, b, ArrayDiffDesc::AHas, ArrayDiffDesc::BMisses, out);
    array_surplus(key, b, a, ArrayDiffDesc::BHas, ArrayDiffDesc::AMisses, out);
}

void Comparator::null_primitive(const std::string& key, const Value& a, const Value& b,
                                ComparisonResult& out) const {
    if (!cats_.values) {
        return;
    }
    out.value_diffs.push_back(ValueDiff{key, a.to_canonical_string(), b.to_canonical_string()});
}

void Comparator::null_array(const std::string& key, const Value& a, const Value& b,
                            ComparisonResult& out) const {
    if (!cats_.arrays) {
        return;
    }
    static const Value::Array empty;
    if (a.is_null()) {
        array_surplus(key, b.as_array(), empty, ArrayDiffDesc::BHas, ArrayDiffDesc::AMisses, out);
    } else {
        array_surplus(key, a.as_array(), empty, ArrayDiffDesc::AHas, ArrayDiffDesc::BMisses, out);
    }
}

void Comparator::null_object(const std::string& key, const Value& a, const Value& b,
                             std::size_t depth, ComparisonResult& out) const {
    if (!cats_.keys) {
        return;
    }
    if (a.is_null()) {
        objects(key, EMPTY_OBJECT, b.as_object(), depth, out);
    } else {
        objects(key, a.as_object(), EMPTY_OBJECT, depth, out);
    }
}

void Comparator::different_types(const std::string& key, const Value& a, const Value& b,
                                 ComparisonResult& out) const {
    if (!cats_.types) {
        return;
    }
    out.type_diffs.push_back(
        TypeDiff{key, value_kind_name(a.kind()), value_kind_name(b.kind())});
}

ComparisonResult run(const Value& a, const Value& b, const WorkingContext& ctx,
                     Categories cats) {
    ComparisonResult out;
    if (cats.any()) {
        Comparator(ctx, cats).field(std::string(), a, b, 0, out);
    }
    return out;
}

}  // namespace

// ----------------------------------------------------------------------------
// Публичный API
// ----------------------------------------------------------------------------

ComparisonResult compare_field(std::string_view key, const Value& a, const Value& b,
                               const WorkingContext& ctx) {
    ComparisonResult out;
    Comparator(ctx, Categories::all()).field(std::string(key), a, b, 0, out);
    return out;
}

std::vector<ValueDiff> compare_primitives(std::string_view key, const Value& a, const Value& b) {
    // Контекст не участвует в сравнении примитивов
    static const WorkingContext ctx{};
    ComparisonResult out;
    Comparator(ctx, Categories::only_values()).primitives(std::string(key), a, b, out);
    return std::move(out.value_diffs);
}

ComparisonResult compare_objects(std::string_view key, const Value::Object& a,
                                 const Value::Object& b, const WorkingContext& ctx) {
    ComparisonResult out;
    Comparator(ctx, Categories::all()).objects(std::string(key), a, b, 0, out);
    return out;
}

ComparisonResult compare_arrays(std::string_view key, const Value::Array& a,
                                const Value::Array& b, const WorkingContext& ctx) {
    ComparisonResult out;
    Comparator(ctx, Categories::all()).arrays(std::string(key), a, b, 0, out);
    return out;
}

std::vector<ValueDiff> handle_one_element_null_primitives(std::string_view key, const Value& a,
                                                          const Value& b) {
    static const WorkingContext ctx{};
    ComparisonResult out;
    Comparator(ctx, Categories::only_values()).null_primitive(std::string(key), a, b, out);
    return std::move(out.value_diffs);
}

std::vector<ArrayDiff> handle_one_element_null_arrays(std::string_view key, const Value& a,
                                                      const Value& b) {
    static const WorkingContext ctx{};
    ComparisonResult out;
    Comparator(ctx, Categories::only_arrays()).null_array(std::string(key), a, b, out);
    return std::move(out.array_diffs);
}

ComparisonResult handle_one_element_null_objects(std::string_view key, const Value& a,
                                                 const Value& b, const WorkingContext& ctx) {
    ComparisonResult out;
    Comparator(ctx, Categories::all()).null_object(std::string(key), a, b, 0, out);
    return out;
}

std::vector<TypeDiff> handle_different_types(std::string_view key, const Value& a,
                                             const Value& b) {
    static const WorkingContext ctx{};
    ComparisonResult out;
    Comparator(ctx, Categories::only_types()).different_types(std::string(key), a, b, out);
    return std::move(out.type_diffs);
}

std::vector<KeyDiff> find_key_diffs(const Value& a, const Value& b, const WorkingContext& ctx) {
    return run(a, b, ctx, Categories::only_keys()).key_diffs;
}

std::vector<TypeDiff> find_type_diffs(const Value& a, const Value& b, const WorkingContext& ctx) {
    return run(a, b, ctx, Categories::only_types()).type_diffs;
}

std::vector<ValueDiff> find_value_diffs(const Value& a, const Value& b,
                                        const WorkingContext& ctx) {
    return run(a, b, ctx, Categories::only_values()).value_diffs;
}

std::vector<ArrayDiff> find_array_diffs(const Value& a, const Value& b,
                                        const WorkingContext& ctx) {
    return run(a, b, ctx, Categories::only_arrays()).array_diffs;
}

DiffCollection collect_diffs(const Value& a, const Value& b, const WorkingContext& ctx) {
    const Categories cats = Categories::from_config(ctx.config);
    ComparisonResult all = run(a, b, ctx, cats);

    DiffCollection result;
    if (cats.keys) {
        result.key_diffs = std::move(all.key_diffs);
    }
    if (cats.types) {
        result.type_diffs = std::move(all.type_diffs);
    }
    if (cats.values) {
        result.value_diffs = std::move(all.value_diffs);
    }
    if (cats.arrays) {
        result.array_diffs = std::move(all.array_diffs);
    }
    return result;
}

}  // namespace dtf
