// ==============================================================================
// value.cpp - Реализация Value (каноническая модель документа)
// ==============================================================================

#include <dtf/value.hpp>
#include <rapidjson/document.h>
#include <rapidjson/stringbuffer.h>
#include <rapidjson/writer.h>

namespace dtf {

namespace {

// Writer канонической формы: NaN/Infinity допускаются, чтобы сериализация
// оставалась тотальной для Value, построенных программно.
using CanonicalWriter =
    rapidjson::Writer<rapidjson::StringBuffer, rapidjson::UTF8<>, rapidjson::UTF8<>,
                      rapidjson::CrtAllocator, rapidjson::kWriteNanAndInfFlag>;

void write_canonical(const Value& v, CanonicalWriter& w) {
    if (v.is_null()) {
        w.Null();
    } else if (v.is_bool()) {
        w.Bool(v.as_bool());
    } else if (v.is_int()) {
        w.Int64(v.as_int());
    } else if (v.is_uint()) {
        w.Uint64(v.as_uint());
    } else if (v.is_double()) {
        // -0.0 и 0.0 равны в numbers_equal: каноническая форма одна
        const double d = v.as_double();
        w.Double(d == 0.0 ? 0.0 : d);
    } else if (v.is_string()) {
        const auto& s = v.as_string();
        w.String(s.c_str(), static_cast<rapidjson::SizeType>(s.size()));
    } else if (v.is_array()) {
        w.StartArray();
        for (const auto& elem : v.as_array()) {
            write_canonical(elem, w);
        }
        w.EndArray();
    } else if (v.is_object()) {
        // std::map: ключи уже отсортированы
        w.StartObject();
        for (const auto& [key, val] : v.as_object()) {
            w.Key(key.c_str(), static_cast<rapidjson::SizeType>(key.size()));
            write_canonical(val, w);
        }
        w.EndObject();
    }
}

}  // namespace

const char* value_kind_name(ValueKind kind) {
    switch (kind) {
    case ValueKind::Null:
        return "null";
    case ValueKind::Bool:
        return "bool";
    case ValueKind::Number:
        return "number";
    case ValueKind::String:
        return "string";
    case ValueKind::Array:
        return "array";
    case ValueKind::Object:
        return "object";
    }
    return "null";
}

ValueKind Value::kind() const {
    if (is_bool()) {
        return ValueKind::Bool;
    }
    if (is_number()) {
        return ValueKind::Number;
    }
    if (is_string()) {
        return ValueKind::String;
    }
    if (is_array()) {
        return ValueKind::Array;
    }
    if (is_object()) {
        return ValueKind::Object;
    }
    return ValueKind::Null;
}

bool Value::numbers_equal(const Value& a, const Value& b) {
    if (a.is_double() || b.is_double()) {
        return a.is_double() && b.is_double() && a.as_double() == b.as_double();
    }

    if (a.is_int() && b.is_int()) {
        return a.as_int() == b.as_int();
    }
    if (a.is_uint() && b.is_uint()) {
        return a.as_uint() == b.as_uint();
    }

    // Int64 против UInt64: равны только неотрицательные
    const Int64 i = a.is_int() ? a.as_int() : b.as_int();
    const UInt64 u = a.is_uint() ? a.as_uint() : b.as_uint();
    return i >= 0 && static_cast<UInt64>(i) == u;
}

std::string Value::to_canonical_string() const {
    rapidjson::StringBuffer buffer;
    CanonicalWriter writer(buffer);
    write_canonical(*this, writer);
    return std::string(buffer.GetString(), buffer.GetSize());
}

// ----------------------------------------------------------------------------
// Value::from_rapidjson - конверсия из RapidJSON
// ----------------------------------------------------------------------------
//
// Порядок приоритета чисел: UInt → Int → Double
//

Value Value::from_rapidjson(const rapidjson::Value& json) {
    if (json.IsNull()) {
        return Value();
    }

    if (json.IsBool()) {
        return Value(json.GetBool());
    }

    if (json.IsNumber()) {
        if (json.IsUint64()) {
            return Value(json.GetUint64());
        }
        if (json.IsInt64()) {
            return Value(json.GetInt64());
        }
        return Value(json.GetDouble());
    }

    if (json.IsString()) {
        return Value(std::string(json.GetString(), json.GetStringLength()));
    }

    if (json.IsArray()) {
        Array arr;
        arr.reserve(json.Size());
        for (rapidjson::SizeType i = 0; i < json.Size(); ++i) {
            arr.push_back(from_rapidjson(json[i]));
        }
        return Value(std::move(arr));
    }

    if (json.IsObject()) {
        Object obj;
        for (auto it = json.MemberBegin(); it != json.MemberEnd(); ++it) {
            std::string key(it->name.GetString(), it->name.GetStringLength());
            // Дублирующийся ключ: побеждает последнее вхождение
            obj[key] = from_rapidjson(it->value);
        }
        return Value(std::move(obj));
    }

    return Value();
}

}  // namespace dtf
