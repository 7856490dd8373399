/**
 * @file json_reader.cpp
 * @brief Build Value trees from JSON text via nlohmann::json SAX events
 */

#include "canonjson/json_reader.hpp"

#include <format>
#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace canonjson::reader {

namespace {

/**
 * @brief SAX consumer that keeps every object member, including repeats
 */
class ValueBuilder final : public nlohmann::json::json_sax_t
{
public:
    explicit ValueBuilder(const ReaderOptions& options)
        : options_(options)
    {}

    bool null() override { return add(Value(nullptr)); }

    bool boolean(bool val) override { return add(Value(val)); }

    bool number_integer(number_integer_t val) override { return add(Value(val)); }

    bool number_unsigned(number_unsigned_t val) override { return add(Value(val)); }

    bool number_float(number_float_t val, const string_t& /*raw*/) override
    {
        return add(Value(val));
    }

    bool string(string_t& val) override { return add(Value(std::move(val))); }

    bool binary(binary_t& /*val*/) override
    {
        error_ = Error::make(ErrorCode::kUnsupportedType, "Binary values are not JSON");
        return false;
    }

    bool start_object(std::size_t /*elements*/) override
    {
        return open(Value(Value::Object{}));
    }

    bool key(string_t& val) override
    {
        stack_.back().key = std::move(val);
        return true;
    }

    bool end_object() override { return close(); }

    bool start_array(std::size_t /*elements*/) override
    {
        return open(Value(Value::Array{}));
    }

    bool end_array() override { return close(); }

    bool parse_error(std::size_t position,
                     const std::string& /*last_token*/,
                     const nlohmann::detail::exception& ex) override
    {
        error_ = Error::make(ErrorCode::kParseError,
                             std::format("Invalid JSON at byte {}: {}", position, ex.what()));
        return false;
    }

    [[nodiscard]] Result<Value> take_result(bool parsed)
    {
        if (error_) {
            return std::unexpected(std::move(*error_));
        }
        if (!parsed || !root_ || !stack_.empty()) {
            return std::unexpected(Error::make(ErrorCode::kParseError, "Incomplete JSON document"));
        }
        return std::move(*root_);
    }

private:
    struct Pending
    {
        Value container;
        std::string key;  ///< Key of the member currently being read
    };

    bool add(Value value)
    {
        if (stack_.empty()) {
            root_ = std::move(value);
            return true;
        }
        auto& top = stack_.back();
        if (top.container.is_array()) {
            top.container.as_array().push_back(std::move(value));
        } else {
            top.container.as_object().emplace_back(std::move(top.key), std::move(value));
        }
        return true;
    }

    bool open(Value container)
    {
        if (stack_.size() + 1 > options_.max_depth) {
            error_ = Error::make(
                ErrorCode::kDepthExceeded,
                std::format("Nesting depth exceeds limit of {}", options_.max_depth));
            return false;
        }
        stack_.push_back(Pending{.container = std::move(container), .key = std::string{}});
        return true;
    }

    bool close()
    {
        Value done = std::move(stack_.back().container);
        stack_.pop_back();
        return add(std::move(done));
    }

    const ReaderOptions& options_;
    std::vector<Pending> stack_;
    std::optional<Value> root_;
    std::optional<Error> error_;
};

[[nodiscard]] Result<Value> convert(const nlohmann::json& j, std::size_t depth, std::size_t max_depth)
{
    switch (j.type()) {
        case nlohmann::json::value_t::null:
            return Value(nullptr);
        case nlohmann::json::value_t::boolean:
            return Value(j.get<bool>());
        case nlohmann::json::value_t::number_integer:
            return Value(j.get<std::int64_t>());
        case nlohmann::json::value_t::number_unsigned:
            return Value(j.get<std::uint64_t>());
        case nlohmann::json::value_t::number_float:
            return Value(j.get<double>());
        case nlohmann::json::value_t::string:
            return Value(j.get<std::string>());
        case nlohmann::json::value_t::array:
        case nlohmann::json::value_t::object:
            break;
        case nlohmann::json::value_t::binary:
        case nlohmann::json::value_t::discarded:
            return std::unexpected(Error::make(
                ErrorCode::kUnsupportedType,
                std::format("Cannot convert nlohmann::json value of type {}", j.type_name())));
    }

    if (depth + 1 > max_depth) {
        return std::unexpected(Error::make(
            ErrorCode::kDepthExceeded,
            std::format("Nesting depth exceeds limit of {}", max_depth)));
    }

    if (j.is_array()) {
        Value::Array elements;
        elements.reserve(j.size());
        for (const auto& elem : j) {
            auto converted = convert(elem, depth + 1, max_depth);
            if (!converted) {
                return std::unexpected(converted.error());
            }
            elements.push_back(std::move(*converted));
        }
        return Value(std::move(elements));
    }

    Value::Object members;
    members.reserve(j.size());
    for (const auto& [key, val] : j.items()) {
        auto converted = convert(val, depth + 1, max_depth);
        if (!converted) {
            return std::unexpected(converted.error());
        }
        members.emplace_back(key, std::move(*converted));
    }
    return Value(std::move(members));
}

}  // namespace

Result<Value> parse_json(std::string_view text, const ReaderOptions& options)
{
    ValueBuilder builder(options);
    bool parsed = false;
    try {
        parsed = nlohmann::json::sax_parse(
            text.begin(), text.end(), &builder, nlohmann::json::input_format_t::json, true);
    } catch (const nlohmann::json::exception& ex) {
        return std::unexpected(Error::make(ErrorCode::kParseError, ex.what()));
    }
    return builder.take_result(parsed);
}

Result<Value> from_json(const nlohmann::json& j)
{
    return convert(j, 0, canonical::kDefaultMaxDepth);
}

bool is_canonical_json(std::string_view text)
{
    auto value = parse_json(text);
    if (!value) {
        return false;
    }
    auto canonical = canonical::canonicalize(*value);
    return canonical && *canonical == text;
}

}  // namespace canonjson::reader
