/**
 * @file canonical_json.cpp
 * @brief Canonical JSON serialization (RFC 8785)
 *
 * The tree is walked with an explicit heap-allocated frame stack, so the
 * nesting limit is a configuration value rather than a property of the
 * native call stack. Every error aborts the walk; no partial output is
 * returned.
 */

#include "canonjson/canonical_json.hpp"

#include "utf8.hpp"

#include <algorithm>
#include <format>
#include <numeric>
#include <ranges>
#include <utility>

namespace canonjson {

std::string_view kind_name(Value::Kind kind) noexcept
{
    switch (kind) {
        case Value::Kind::kNull:
            return "null";
        case Value::Kind::kBoolean:
            return "boolean";
        case Value::Kind::kNumber:
            return "number";
        case Value::Kind::kString:
            return "string";
        case Value::Kind::kArray:
            return "array";
        case Value::Kind::kObject:
            return "object";
    }
    return "unknown";
}

}  // namespace canonjson

namespace canonjson::canonical {

namespace {

/**
 * @brief An array or object whose children are being emitted
 */
struct Frame
{
    const Value* container;
    std::vector<std::size_t> order;  ///< Object members in canonical order
    std::size_t next;                ///< Index of the next child to emit
    std::string segment;             ///< Path segment relative to the parent
};

class Serializer
{
public:
    explicit Serializer(const CanonicalOptions& options)
        : options_(options)
    {}

    [[nodiscard]] Result<std::string> run(const Value& root)
    {
        if (auto result = emit(root, ""); !result) {
            return std::unexpected(result.error());
        }

        while (!stack_.empty()) {
            Frame& top = stack_.back();
            const bool is_object = top.container->is_object();
            const std::size_t size =
                is_object ? top.order.size() : top.container->as_array().size();

            if (top.next == size) {
                out_.push_back(is_object ? '}' : ']');
                stack_.pop_back();
                continue;
            }

            const std::size_t index = top.next++;
            if (index > 0) {
                out_.push_back(',');
            }

            // emit() may push a frame and invalidate `top`
            if (is_object) {
                const auto& [key, child] = top.container->as_object()[top.order[index]];
                std::string segment = "." + key;
                // Keys were validated while ordering the object
                auto quoted = escape_string(key);
                if (!quoted) {
                    return std::unexpected(at_path(quoted.error(), segment));
                }
                out_ += *quoted;
                out_.push_back(':');
                if (auto result = emit(child, std::move(segment)); !result) {
                    return std::unexpected(result.error());
                }
            } else {
                const Value& child = top.container->as_array()[index];
                if (auto result = emit(child, std::format("[{}]", index)); !result) {
                    return std::unexpected(result.error());
                }
            }
        }
        return std::move(out_);
    }

private:
    [[nodiscard]] std::string path(std::string_view leaf) const
    {
        std::string result = "$";
        for (const auto& frame : stack_) {
            result += frame.segment;
        }
        result += leaf;
        return result;
    }

    [[nodiscard]] Error at_path(const Error& error, std::string_view leaf) const
    {
        return Error::make(error.code, std::format("{} at: {}", error.message, path(leaf)));
    }

    [[nodiscard]] VoidResult emit(const Value& value, std::string segment)
    {
        if (value.storage().valueless_by_exception()) {
            return std::unexpected(Error::make(
                ErrorCode::kUnsupportedType,
                std::format("Value holds no JSON variant at: {}", path(segment))));
        }

        switch (value.kind()) {
            case Value::Kind::kNull:
                out_ += "null";
                return {};
            case Value::Kind::kBoolean:
                out_ += value.as_boolean() ? "true" : "false";
                return {};
            case Value::Kind::kNumber: {
                auto text = format_number(value.as_number());
                if (!text) {
                    return std::unexpected(at_path(text.error(), segment));
                }
                out_ += *text;
                return {};
            }
            case Value::Kind::kString: {
                auto text = escape_string(value.as_string());
                if (!text) {
                    return std::unexpected(at_path(text.error(), segment));
                }
                out_ += *text;
                return {};
            }
            case Value::Kind::kArray:
                if (auto result = check_depth(segment); !result) {
                    return result;
                }
                out_.push_back('[');
                stack_.push_back(Frame{.container = &value,
                                       .order = {},
                                       .next = 0,
                                       .segment = std::move(segment)});
                return {};
            case Value::Kind::kObject: {
                if (auto result = check_depth(segment); !result) {
                    return result;
                }
                auto order = member_order(value.as_object(), segment);
                if (!order) {
                    return std::unexpected(order.error());
                }
                out_.push_back('{');
                stack_.push_back(Frame{.container = &value,
                                       .order = std::move(*order),
                                       .next = 0,
                                       .segment = std::move(segment)});
                return {};
            }
        }
        return std::unexpected(Error::make(
            ErrorCode::kUnsupportedType,
            std::format("Unknown value kind at: {}", path(segment))));
    }

    [[nodiscard]] VoidResult check_depth(std::string_view segment) const
    {
        if (stack_.size() + 1 > options_.max_depth) {
            return std::unexpected(Error::make(
                ErrorCode::kDepthExceeded,
                std::format("Nesting depth exceeds limit of {} at: {}",
                            options_.max_depth,
                            path(segment))));
        }
        return {};
    }

    /**
     * @brief Member indices sorted by UTF-16 key; rejects repeated keys
     */
    [[nodiscard]] Result<std::vector<std::size_t>> member_order(const Value::Object& members,
                                                                std::string_view segment) const
    {
        std::vector<std::u16string> keys;
        keys.reserve(members.size());
        for (const auto& [key, _] : members) {
            auto units = utf8::to_utf16(key);
            if (!units) {
                return std::unexpected(Error::make(
                    ErrorCode::kInvalidString,
                    std::format("Object key is not well-formed UTF-8 at: {}", path(segment))));
            }
            keys.push_back(std::move(*units));
        }

        std::vector<std::size_t> order(members.size());
        std::iota(order.begin(), order.end(), 0uz);
        std::ranges::sort(order, [&keys](std::size_t lhs, std::size_t rhs) {
            return keys[lhs] < keys[rhs];
        });

        for (std::size_t i = 1; i < order.size(); ++i) {
            if (keys[order[i - 1]] == keys[order[i]]) {
                return std::unexpected(Error::make(
                    ErrorCode::kDuplicateKey,
                    std::format("Duplicate key \"{}\" at: {}",
                                members[order[i]].first,
                                path(segment))));
            }
        }
        return order;
    }

    const CanonicalOptions& options_;
    std::string out_;
    std::vector<Frame> stack_;
};

}  // namespace

Result<std::string> canonicalize(const Value& value, const CanonicalOptions& options)
{
    Serializer serializer(options);
    return serializer.run(value);
}

Result<std::size_t> canonical_size(const Value& value, const CanonicalOptions& options)
{
    auto canonical = canonicalize(value, options);
    if (!canonical) {
        return std::unexpected(canonical.error());
    }
    return canonical->size();
}

Result<bool> canonically_equal(const Value& lhs, const Value& rhs, const CanonicalOptions& options)
{
    auto lhs_bytes = canonicalize(lhs, options);
    if (!lhs_bytes) {
        return std::unexpected(lhs_bytes.error());
    }
    auto rhs_bytes = canonicalize(rhs, options);
    if (!rhs_bytes) {
        return std::unexpected(rhs_bytes.error());
    }
    return *lhs_bytes == *rhs_bytes;
}

}  // namespace canonjson::canonical
