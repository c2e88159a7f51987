// ==============================================================================
// value.cpp - Дерево документа отчёта
// ==============================================================================

#include <algorithm>
#include <cmath>
#include <curator/value.hpp>
#include <limits>
#include <stdexcept>

namespace curator {

// ============================================================================
// Доступ к контейнерам
// ============================================================================

const Value::Array* Value::get_array() const {
    const auto* ptr = std::get_if<std::shared_ptr<Array>>(&data_);
    return ptr != nullptr ? ptr->get() : nullptr;
}

Value::Array* Value::get_array_mut() {
    auto* ptr = std::get_if<std::shared_ptr<Array>>(&data_);
    return ptr != nullptr ? ptr->get() : nullptr;
}

const Value::Object* Value::object() const {
    const auto* ptr = std::get_if<std::shared_ptr<Object>>(&data_);
    return ptr != nullptr ? ptr->get() : nullptr;
}

Value::Object* Value::object_mut() {
    auto* ptr = std::get_if<std::shared_ptr<Object>>(&data_);
    return ptr != nullptr ? ptr->get() : nullptr;
}

void Value::push_back(Value v) {
    if (Array* arr = get_array_mut()) {
        arr->push_back(std::move(v));
    }
}

std::size_t Value::array_size() const {
    const Array* arr = get_array();
    return arr != nullptr ? arr->size() : 0;
}

const Value* Value::at(std::size_t index) const {
    const Array* arr = get_array();
    if (arr == nullptr || index >= arr->size()) {
        return nullptr;
    }
    return &(*arr)[index];
}

Value* Value::find_member(std::string_view key) {
    Object* obj = object_mut();
    if (obj == nullptr) {
        return nullptr;
    }
    auto it = std::find_if(obj->begin(), obj->end(),
                           [key](const Member& m) { return m.first == key; });
    return it != obj->end() ? &it->second : nullptr;
}

void Value::set(const std::string& key, Value v) {
    Object* obj = object_mut();
    if (obj == nullptr) {
        return;
    }
    if (Value* existing = find_member(key)) {
        *existing = std::move(v);
    } else {
        obj->emplace_back(key, std::move(v));
    }
}

bool Value::erase(const std::string& key) {
    Object* obj = object_mut();
    if (obj == nullptr) {
        return false;
    }
    auto it = std::find_if(obj->begin(), obj->end(),
                           [&key](const Member& m) { return m.first == key; });
    if (it == obj->end()) {
        return false;
    }
    obj->erase(it);
    return true;
}

const Value* Value::get(std::string_view key) const {
    const Object* obj = object();
    if (obj == nullptr) {
        return nullptr;
    }
    auto it = std::find_if(obj->begin(), obj->end(),
                           [key](const Member& m) { return m.first == key; });
    return it != obj->end() ? &it->second : nullptr;
}

Value* Value::get_mut(std::string_view key) {
    return find_member(key);
}

std::size_t Value::object_size() const {
    const Object* obj = object();
    return obj != nullptr ? obj->size() : 0;
}

bool Value::to_int64(std::int64_t& out) const {
    switch (kind()) {
        case Kind::Int:
            out = std::get<std::int64_t>(data_);
            return true;
        case Kind::UInt: {
            std::uint64_t u = std::get<std::uint64_t>(data_);
            if (u > static_cast<std::uint64_t>(std::numeric_limits<std::int64_t>::max())) {
                return false;
            }
            out = static_cast<std::int64_t>(u);
            return true;
        }
        case Kind::Double: {
            double d = std::get<double>(data_);
            // 2^63 уже не помещается в int64
            if (!std::isfinite(d) || std::trunc(d) != d || d < -9223372036854775808.0 ||
                d >= 9223372036854775808.0) {
                return false;
            }
            out = static_cast<std::int64_t>(d);
            return true;
        }
        default:
            return false;
    }
}

// ============================================================================
// RapidJSON
// ============================================================================

Value Value::from_rapidjson(const rapidjson::Value& json) {
    switch (json.GetType()) {
        case rapidjson::kNullType:
            return Value();
        case rapidjson::kFalseType:
        case rapidjson::kTrueType:
            return Value(json.GetBool());
        case rapidjson::kNumberType:
            // Неотрицательные целые хранятся как UInt
            if (json.IsUint64()) {
                return Value(json.GetUint64());
            }
            if (json.IsInt64()) {
                return Value(json.GetInt64());
            }
            return Value(json.GetDouble());
        case rapidjson::kStringType:
            return Value(std::string(json.GetString(), json.GetStringLength()));
        case rapidjson::kArrayType: {
            Array arr;
            arr.reserve(json.Size());
            for (const auto& item : json.GetArray()) {
                arr.push_back(from_rapidjson(item));
            }
            return Value(std::move(arr));
        }
        case rapidjson::kObjectType: {
            Value obj = make_object();
            for (const auto& member : json.GetObject()) {
                obj.set(std::string(member.name.GetString(), member.name.GetStringLength()),
                        from_rapidjson(member.value));
            }
            return obj;
        }
    }
    return Value();
}

void Value::to_rapidjson(rapidjson::Value& out, rapidjson::Document::AllocatorType& alloc) const {
    switch (kind()) {
        case Kind::Null:
            out.SetNull();
            break;
        case Kind::Bool:
            out.SetBool(std::get<bool>(data_));
            break;
        case Kind::Int:
            out.SetInt64(std::get<std::int64_t>(data_));
            break;
        case Kind::UInt:
            out.SetUint64(std::get<std::uint64_t>(data_));
            break;
        case Kind::Double: {
            double d = std::get<double>(data_);
            if (!std::isfinite(d)) {
                throw std::runtime_error("could not convert float to JSON: non-finite value");
            }
            out.SetDouble(d);
            break;
        }
        case Kind::String: {
            const auto& s = std::get<std::string>(data_);
            out.SetString(s.c_str(), static_cast<rapidjson::SizeType>(s.size()), alloc);
            break;
        }
        case Kind::Array: {
            const Array& arr = *get_array();
            out.SetArray();
            out.Reserve(static_cast<rapidjson::SizeType>(arr.size()), alloc);
            for (const auto& item : arr) {
                rapidjson::Value v;
                item.to_rapidjson(v, alloc);
                out.PushBack(v, alloc);
            }
            break;
        }
        case Kind::Object: {
            out.SetObject();
            for (const auto& [key, item] : *object()) {
                rapidjson::Value k(key.c_str(), static_cast<rapidjson::SizeType>(key.size()),
                                   alloc);
                rapidjson::Value v;
                item.to_rapidjson(v, alloc);
                out.AddMember(k, v, alloc);
            }
            break;
        }
    }
}

rapidjson::Document Value::to_rapidjson_document() const {
    rapidjson::Document doc;
    to_rapidjson(doc, doc.GetAllocator());
    return doc;
}

// ============================================================================
// lookup
// ============================================================================

const Value* lookup(const Value& root, std::initializer_list<std::string_view> keys) {
    const Value* current = &root;
    for (auto key : keys) {
        current = current->get(key);
        if (current == nullptr) {
            return nullptr;
        }
    }
    return current;
}

Value* lookup_mut(Value& root, std::initializer_list<std::string_view> keys) {
    Value* current = &root;
    for (auto key : keys) {
        current = current->get_mut(key);
        if (current == nullptr) {
            return nullptr;
        }
    }
    return current;
}

}  // namespace curator
