// ==============================================================================
// curator/value.hpp - Дерево документа отчёта (Value)
// ==============================================================================
//
// Назначение:
// - Распарсенный JSON-отчёт песочницы в виде дерева Value
// - Навигация по вложенным полям (lookup) без исключений
// - Мутации на месте для санитизации (set/erase/get_mut)
// - Конверсия из/в RapidJSON
//
// Объект хранит ключи в порядке появления во входном файле: переписанный
// отчёт отличается от исходного только внесёнными правками. Повторный ключ
// заменяет значение, оставаясь на месте первого вхождения.
//
// ==============================================================================

#ifndef CURATOR_VALUE_HPP
#define CURATOR_VALUE_HPP

#include <cstddef>
#include <cstdint>
#include <initializer_list>
#include <memory>
#include <string>
#include <string_view>
#include <utility>
#include <variant>
#include <vector>

#include <rapidjson/document.h>

namespace curator {

class Value {
public:
    using Array = std::vector<Value>;
    using Member = std::pair<std::string, Value>;
    using Object = std::vector<Member>;

    enum class Kind { Null, Bool, Int, UInt, Double, String, Array, Object };

    Value() = default;
    explicit Value(bool v) : data_(v) {}
    explicit Value(std::int64_t v) : data_(v) {}
    explicit Value(std::uint64_t v) : data_(v) {}
    explicit Value(double v) : data_(v) {}
    explicit Value(std::string v) : data_(std::move(v)) {}
    explicit Value(const char* v) : data_(std::string(v)) {}
    explicit Value(Array v) : data_(std::make_shared<Array>(std::move(v))) {}
    explicit Value(Object v) : data_(std::make_shared<Object>(std::move(v))) {}

    static Value make_array() { return Value(Array{}); }
    static Value make_object() { return Value(Object{}); }

    Kind kind() const { return static_cast<Kind>(data_.index()); }

    bool is_null() const { return kind() == Kind::Null; }
    bool is_bool() const { return kind() == Kind::Bool; }
    bool is_int() const { return kind() == Kind::Int; }
    bool is_uint() const { return kind() == Kind::UInt; }
    bool is_double() const { return kind() == Kind::Double; }
    bool is_string() const { return kind() == Kind::String; }
    bool is_array() const { return kind() == Kind::Array; }
    bool is_object() const { return kind() == Kind::Object; }

    /// nullptr если узел другого типа
    const std::string* get_string() const { return std::get_if<std::string>(&data_); }
    const Array* get_array() const;
    Array* get_array_mut();

    /// Целое значение для Int/UInt и Double без дробной части
    /// @return false если значение не целое или вне диапазона int64
    bool to_int64(std::int64_t& out) const;

    // Массив (на узлах другого типа - no-op / 0 / nullptr)
    void push_back(Value v);
    std::size_t array_size() const;
    const Value* at(std::size_t index) const;

    // Объект (на узлах другого типа - no-op / false / nullptr).
    // set() для нового ключа добавляет его в конец.
    void set(const std::string& key, Value v);
    bool erase(const std::string& key);
    const Value* get(std::string_view key) const;
    Value* get_mut(std::string_view key);
    bool has(std::string_view key) const { return get(key) != nullptr; }
    std::size_t object_size() const;

    static Value from_rapidjson(const rapidjson::Value& json);

    /// @throws std::runtime_error для NaN/Inf (RapidJSON Writer их не пишет)
    void to_rapidjson(rapidjson::Value& out, rapidjson::Document::AllocatorType& alloc) const;
    rapidjson::Document to_rapidjson_document() const;

private:
    const Object* object() const;
    Object* object_mut();
    Value* find_member(std::string_view key);

    // Порядок альтернатив совпадает с Kind.
    // Копия Value разделяет массив/объект с оригиналом.
    std::variant<std::monostate, bool, std::int64_t, std::uint64_t, double, std::string,
                 std::shared_ptr<Array>, std::shared_ptr<Object>>
        data_;
};

/// Пройти по цепочке ключей: lookup(report, {"target", "file", "sha512"})
/// @return nullptr если звено отсутствует или не объект
const Value* lookup(const Value& root, std::initializer_list<std::string_view> keys);

Value* lookup_mut(Value& root, std::initializer_list<std::string_view> keys);

}  // namespace curator

#endif  // CURATOR_VALUE_HPP
