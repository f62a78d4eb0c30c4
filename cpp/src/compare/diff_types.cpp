// ==============================================================================
// diff_types.cpp - Вспомогательные функции diff-записей
// ==============================================================================

#include <dtf/diff_types.hpp>

namespace dtf {

const char* array_diff_desc_name(ArrayDiffDesc desc) {
    switch (desc) {
    case ArrayDiffDesc::AHas:
        return "AHas";
    case ArrayDiffDesc::AMisses:
        return "AMisses";
    case ArrayDiffDesc::BHas:
        return "BHas";
    case ArrayDiffDesc::BMisses:
        return "BMisses";
    }
    return "AHas";
}

std::optional<ArrayDiffDesc> array_diff_desc_from_name(std::string_view name) {
    if (name == "AHas") {
        return ArrayDiffDesc::AHas;
    }
    if (name == "AMisses") {
        return ArrayDiffDesc::AMisses;
    }
    if (name == "BHas") {
        return ArrayDiffDesc::BHas;
    }
    if (name == "BMisses") {
        return ArrayDiffDesc::BMisses;
    }
    return std::nullopt;
}

namespace {

template <typename T>
bool absent_or_empty(const std::optional<std::vector<T>>& v) {
    return !v.has_value() || v->empty();
}

}  // namespace

bool DiffCollection::no_differences() const {
    return absent_or_empty(key_diffs) && absent_or_empty(type_diffs) &&
           absent_or_empty(value_diffs) && absent_or_empty(array_diffs);
}

}  // namespace dtf
