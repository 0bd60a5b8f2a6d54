// pointer_lens.h - lager lenses addressed by JSON Pointer

#pragma once

#include <json_delta/api.h>
#include <json_delta/pointer.h>
#include <json_delta/value.h>

#include <lager/lens.hpp>
#include <lager/lenses.hpp>
#include <zug/compose.hpp>

namespace json_delta {

using PointerLens = lager::lens<Value, Value>;

/// Lens focusing the node a pointer names, usable with lager::view,
/// lager::set and lager::over.
///
/// - view: the resolved node, or null when the pointer does not resolve
/// - set:  replaces the node (same as a "replace" patch operation); when
///         the pointer does not resolve the whole is returned unchanged
///
/// The root pointer yields the identity lens.
///
/// @code
///   auto name = pointer_lens(Pointer{"users", "0", "name"});
///   Value renamed = lager::set(name, doc, Value{"Alice"});
///   Value upper = lager::over(name, doc, [](Value v) { return to_upper(v); });
/// @endcode
[[nodiscard]] JSON_DELTA_API PointerLens pointer_lens(const Pointer& pointer);

/// Compose two pointer lenses: the second is resolved inside the first
[[nodiscard]] JSON_DELTA_API PointerLens pointer_lens(const Pointer& outer, const Pointer& inner);

} // namespace json_delta
