#pragma once

/**
 * @file value.hpp
 * @brief Closed six-variant JSON value tree
 *
 * A Value is built by a parser or by hand and is only read by the
 * canonicalizer. Objects keep their members in insertion order and do not
 * deduplicate keys; uniqueness is checked when the tree is canonicalized.
 */

#include <concepts>
#include <cstddef>
#include <initializer_list>
#include <string>
#include <string_view>
#include <type_traits>
#include <utility>
#include <variant>
#include <vector>

namespace canonjson {

template <typename T>
concept CharacterType = std::same_as<T, char> || std::same_as<T, wchar_t> || std::same_as<T, char8_t>
                        || std::same_as<T, char16_t> || std::same_as<T, char32_t>;

/// Arithmetic types that hold a number. `Value('a')` is neither 97 nor `true`.
template <typename T>
concept JsonNumber = std::is_arithmetic_v<T> && !std::same_as<T, bool> && !CharacterType<T>;

class Value
{
public:
    using Array = std::vector<Value>;
    using Member = std::pair<std::string, Value>;
    using Object = std::vector<Member>;
    using Storage = std::variant<std::nullptr_t, bool, double, std::string, Array, Object>;

    /// Variant index order of Storage
    enum class Kind {
        kNull,
        kBoolean,
        kNumber,
        kString,
        kArray,
        kObject
    };

    Value() noexcept = default;
    Value(std::nullptr_t) noexcept {}
    Value(bool b) noexcept : storage_(b) {}

    template <JsonNumber T>
    Value(T number) noexcept
        : storage_(static_cast<double>(number))
    {}

    template <CharacterType T>
    Value(T) = delete;

    Value(const char* text) : storage_(std::string(text)) {}
    Value(std::string_view text) : storage_(std::string(text)) {}
    Value(std::string text) noexcept : storage_(std::move(text)) {}
    Value(Array elements) noexcept : storage_(std::move(elements)) {}
    Value(Object members) noexcept : storage_(std::move(members)) {}

    [[nodiscard]] static Value array(std::initializer_list<Value> elements)
    {
        return Value(Array(elements));
    }

    [[nodiscard]] static Value object(std::initializer_list<Member> members)
    {
        return Value(Object(members));
    }

    [[nodiscard]] Kind kind() const noexcept { return static_cast<Kind>(storage_.index()); }

    [[nodiscard]] bool is_null() const noexcept { return kind() == Kind::kNull; }
    [[nodiscard]] bool is_boolean() const noexcept { return kind() == Kind::kBoolean; }
    [[nodiscard]] bool is_number() const noexcept { return kind() == Kind::kNumber; }
    [[nodiscard]] bool is_string() const noexcept { return kind() == Kind::kString; }
    [[nodiscard]] bool is_array() const noexcept { return kind() == Kind::kArray; }
    [[nodiscard]] bool is_object() const noexcept { return kind() == Kind::kObject; }

    // Accessors throw std::bad_variant_access on a kind mismatch.
    [[nodiscard]] bool as_boolean() const { return std::get<bool>(storage_); }
    [[nodiscard]] double as_number() const { return std::get<double>(storage_); }
    [[nodiscard]] const std::string& as_string() const { return std::get<std::string>(storage_); }
    [[nodiscard]] const Array& as_array() const { return std::get<Array>(storage_); }
    [[nodiscard]] const Object& as_object() const { return std::get<Object>(storage_); }
    [[nodiscard]] Array& as_array() { return std::get<Array>(storage_); }
    [[nodiscard]] Object& as_object() { return std::get<Object>(storage_); }

    [[nodiscard]] const Storage& storage() const noexcept { return storage_; }
    [[nodiscard]] Storage& storage() noexcept { return storage_; }

private:
    Storage storage_;
};

/**
 * @brief Lowercase name of a value kind ("null", "boolean", ...)
 */
[[nodiscard]] std::string_view kind_name(Value::Kind kind) noexcept;

}  // namespace canonjson
