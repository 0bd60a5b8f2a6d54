// value.cpp - Value type utilities

#include <json_delta/value.h>
#include <json_delta/builders.h>
#include <json_delta/serialization.h>

#include <charconv>   // for std::to_chars

namespace json_delta {

namespace {

std::string format_number(double v) {
    char buf[32];
    auto [end, ec] = std::to_chars(buf, buf + sizeof(buf), v);
    if (ec != std::errc{}) {
        return "nan";
    }
    return std::string(buf, end);
}

} // anonymous namespace

std::string_view type_name(ValueType type) noexcept
{
    switch (type) {
        case ValueType::Null:   return "null";
        case ValueType::Bool:   return "bool";
        case ValueType::Number: return "number";
        case ValueType::String: return "string";
        case ValueType::Array:  return "array";
        case ValueType::Object: return "object";
    }
    return "unknown";
}

std::string value_to_string(const Value& val)
{
    return std::visit([](const auto& arg) -> std::string {
        using T = std::decay_t<decltype(arg)>;
        if constexpr (std::is_same_v<T, std::string>) {
            return "\"" + arg + "\"";
        } else if constexpr (std::is_same_v<T, bool>) {
            return arg ? "true" : "false";
        } else if constexpr (std::is_same_v<T, double>) {
            return format_number(arg);
        } else if constexpr (std::is_same_v<T, ValueMap>) {
            return "{object:" + std::to_string(arg.size()) + "}";
        } else if constexpr (std::is_same_v<T, ValueArray>) {
            return "[array:" + std::to_string(arg.size()) + "]";
        } else {
            return "null";
        }
    }, val.data);
}

std::ostream& operator<<(std::ostream& os, const Value& val)
{
    return os << to_json(val, true);
}

// ============================================================
// Explicit Template Instantiations
//
// Matching 'extern template' declarations are in value.h and builders.h.
// ============================================================

template struct BasicValue<unsafe_memory_policy>;
template class BasicObjectBuilder<unsafe_memory_policy>;
template class BasicArrayBuilder<unsafe_memory_policy>;

template struct BasicValue<thread_safe_memory_policy>;
template class BasicObjectBuilder<thread_safe_memory_policy>;
template class BasicArrayBuilder<thread_safe_memory_policy>;

} // namespace json_delta
