// equality.cpp - RFC 6902 deep equality

#include <json_delta/equality.h>

namespace json_delta {

namespace {

bool boxes_equal(const ValueBox& a, const ValueBox& b) noexcept
{
    // Same box node means same subtree
    if (&a.get() == &b.get()) [[likely]] {
        return true;
    }
    return equals(a.get(), b.get());
}

bool arrays_equal(const ValueArray& a, const ValueArray& b) noexcept
{
    if (a.size() != b.size()) {
        return false;
    }
    for (std::size_t i = 0; i < a.size(); ++i) {
        if (!boxes_equal(a[i], b[i])) {
            return false;
        }
    }
    return true;
}

bool objects_equal(const ValueMap& a, const ValueMap& b) noexcept
{
    if (a.size() != b.size()) {
        return false;
    }
    // Equal sizes plus every key of a present in b means equal key sets
    for (const auto& [key, box] : a) {
        auto* other = b.find(key);
        if (!other || !boxes_equal(box, *other)) {
            return false;
        }
    }
    return true;
}

} // anonymous namespace

bool equals(const Value& a, const Value& b) noexcept
{
    if (a.data.index() != b.data.index()) {
        return false;
    }

    return std::visit([&b](const auto& lhs) -> bool {
        using T = std::decay_t<decltype(lhs)>;
        const auto& rhs = std::get<T>(b.data);

        if constexpr (std::is_same_v<T, ValueArray>) {
            return arrays_equal(lhs, rhs);
        } else if constexpr (std::is_same_v<T, ValueMap>) {
            return objects_equal(lhs, rhs);
        } else if constexpr (std::is_same_v<T, std::monostate>) {
            return true;
        } else {
            // bool, double, std::string
            return lhs == rhs;
        }
    }, a.data);
}

} // namespace json_delta
