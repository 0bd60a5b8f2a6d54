// pointer_lens.cpp - Pointer-addressed lager lenses

#include <json_delta/pointer_lens.h>
#include <json_delta/patch.h>

namespace json_delta {

PointerLens pointer_lens(const Pointer& pointer)
{
    if (pointer.empty()) {
        return zug::identity;
    }

    return lager::lenses::getset(
        // Getter
        [pointer](const Value& whole) -> Value {
            return get_at(pointer, whole).get_or(Value{});
        },
        // Setter: replace semantics, unresolvable target leaves whole as is
        [pointer](Value whole, Value part) -> Value {
            auto result = apply_operation(ReplaceOp{pointer, std::move(part)}, whole);
            if (!result) {
                detail::log_access_error("pointer_lens", "cannot set " + pointer.to_string() +
                                                         ": " + to_string(*result.error));
                return whole;
            }
            return std::move(result.value);
        });
}

PointerLens pointer_lens(const Pointer& outer, const Pointer& inner)
{
    return zug::comp(pointer_lens(outer), pointer_lens(inner));
}

} // namespace json_delta
