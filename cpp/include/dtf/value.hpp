// ==============================================================================
// dtf/value.hpp - Каноническая модель документа (Value)
// ==============================================================================
//
// Назначение:
// - Каноническое представление распарсенного JSON-документа (Value)
// - Конверсия из RapidJSON Value
// - Явная типизация чисел: UInt64 → Int64 → Double
// - Единственная каноническая сериализация, общая для всех diff-записей
//
// Value неизменяем во время сравнения: документы принадлежат вызывающему,
// движок сравнения только читает их по ссылке.
//
// ==============================================================================

#ifndef DTF_VALUE_HPP
#define DTF_VALUE_HPP

#include <cstdint>
#include <map>
#include <memory>
#include <string>
#include <variant>
#include <vector>

#include <rapidjson/document.h>

// GCC 13 generates false positives for -Wnull-dereference when using
// std::get on std::variant at high optimization levels.
// See: https://gcc.gnu.org/bugzilla/show_bug.cgi?id=108842
#if defined(__GNUC__) && !defined(__clang__)
#pragma GCC diagnostic push
#pragma GCC diagnostic ignored "-Wnull-dereference"
#endif

namespace dtf {

// ----------------------------------------------------------------------------
// ValueKind - вид узла документа
// ----------------------------------------------------------------------------
//
// Закрытое перечисление: диспетчер сравнения делает switch без default,
// поэтому новый вид без обработки даст -Wswitch.
//

enum class ValueKind { Null, Bool, Number, String, Array, Object };

/// Имя вида для TypeDiff: "null", "bool", "number", "string", "array", "object"
const char* value_kind_name(ValueKind kind);

// ----------------------------------------------------------------------------
// Value
// ----------------------------------------------------------------------------

class Value;

/// Тип для массива значений
using ValueArray = std::vector<Value>;

/// Тип для объекта. Ключи упорядочены: обход объединения ключей
/// и каноническая сериализация детерминированы.
using ValueObject = std::map<std::string, Value>;

class Value {
public:
    struct Null {};
    using Bool = bool;
    using Int64 = std::int64_t;
    using UInt64 = std::uint64_t;
    using Double = double;
    using String = std::string;
    using Array = ValueArray;
    using Object = ValueObject;

private:
    std::variant<Null, Bool, Int64, UInt64, Double, String, std::shared_ptr<Array>,
                 std::shared_ptr<Object>>
        data_;

public:
    // -------------------------------------------------------------------------
    // Конструкторы
    // -------------------------------------------------------------------------

    Value() : data_(Null{}) {}
    explicit Value(bool v) : data_(v) {}
    explicit Value(std::int64_t v) : data_(v) {}
    explicit Value(std::uint64_t v) : data_(v) {}
    explicit Value(double v) : data_(v) {}
    explicit Value(std::string v) : data_(std::move(v)) {}
    explicit Value(const char* v) : data_(std::string(v)) {}
    explicit Value(Array v) : data_(std::make_shared<Array>(std::move(v))) {}
    explicit Value(Object v) : data_(std::make_shared<Object>(std::move(v))) {}

    // -------------------------------------------------------------------------
    // Статические фабричные методы
    // -------------------------------------------------------------------------

    static Value make_bool(bool v) { return Value(v); }
    static Value make_int(std::int64_t v) { return Value(v); }
    static Value make_uint(std::uint64_t v) { return Value(v); }
    static Value make_double(double v) { return Value(v); }
    static Value make_string(std::string v) { return Value(std::move(v)); }
    static Value make_array() { return Value(Array{}); }
    static Value make_object() { return Value(Object{}); }

    // -------------------------------------------------------------------------
    // Проверка типа
    // -------------------------------------------------------------------------

    bool is_null() const { return std::holds_alternative<Null>(data_); }
    bool is_bool() const { return std::holds_alternative<Bool>(data_); }
    bool is_int() const { return std::holds_alternative<Int64>(data_); }
    bool is_uint() const { return std::holds_alternative<UInt64>(data_); }
    bool is_double() const { return std::holds_alternative<Double>(data_); }
    bool is_string() const { return std::holds_alternative<String>(data_); }
    bool is_array() const { return std::holds_alternative<std::shared_ptr<Array>>(data_); }
    bool is_object() const { return std::holds_alternative<std::shared_ptr<Object>>(data_); }

    /// Проверка на числовой тип (int, uint или double)
    bool is_number() const { return is_int() || is_uint() || is_double(); }

    /// Вид узла (числа схлопываются в ValueKind::Number)
    ValueKind kind() const;

    // -------------------------------------------------------------------------
    // Доступ к значению (undefined behavior при несовпадении типа)
    // -------------------------------------------------------------------------

    Bool as_bool() const { return std::get<Bool>(data_); }
    Int64 as_int() const { return std::get<Int64>(data_); }
    UInt64 as_uint() const { return std::get<UInt64>(data_); }
    Double as_double() const { return std::get<Double>(data_); }
    const String& as_string() const { return std::get<String>(data_); }
    const Array& as_array() const { return *std::get<std::shared_ptr<Array>>(data_); }
    const Object& as_object() const { return *std::get<std::shared_ptr<Object>>(data_); }

    // -------------------------------------------------------------------------
    // Доступ к полю объекта
    // -------------------------------------------------------------------------

    /// Получить поле объекта по ключу (nullptr если не найдено или не объект)
    const Value* get(const std::string& key) const {
        const auto* ptr = std::get_if<std::shared_ptr<Object>>(&data_);
        if (ptr == nullptr) {
            return nullptr;
        }
        auto it = (*ptr)->find(key);
        return it != (*ptr)->end() ? &it->second : nullptr;
    }

    // -------------------------------------------------------------------------
    // Сравнение чисел
    // -------------------------------------------------------------------------

    /// Точное числовое равенство.
    /// Целые (Int64/UInt64) сравниваются по значению независимо от знаковости;
    /// целое никогда не равно Double (1 != 1.0), Double сравнивается через ==.
    /// Оба аргумента должны быть is_number().
    static bool numbers_equal(const Value& a, const Value& b);

    // -------------------------------------------------------------------------
    // Каноническая сериализация
    // -------------------------------------------------------------------------

    /// Компактный JSON: ключи объектов отсортированы, строки в кавычках,
    /// не конечные Double пишутся как NaN / Infinity / -Infinity, -0.0 как 0.0.
    /// Используется для обеих сторон ValueDiff и значения ArrayDiff.
    std::string to_canonical_string() const;

    // -------------------------------------------------------------------------
    // Конверсия RapidJSON
    // -------------------------------------------------------------------------

    /// Конвертировать из RapidJSON Value (Number: UInt → Int → Double)
    static Value from_rapidjson(const rapidjson::Value& json);

};

}  // namespace dtf

#if defined(__GNUC__) && !defined(__clang__)
#pragma GCC diagnostic pop
#endif

#endif  // DTF_VALUE_HPP
