// equality.h - RFC 6902 deep equality for Value

#pragma once

#include <json_delta/api.h>
#include <json_delta/value.h>

namespace json_delta {

/// Deep equality as defined by RFC 6902 section 4.6 (the "test" operation):
/// - values of different types are never equal
/// - numbers compare by numeric value
/// - strings, booleans and null compare literally
/// - arrays need the same length and pairwise equal elements
/// - objects need the same key set and pairwise equal members;
///   member order is irrelevant
///
/// Never throws. Subtrees shared between a and b are not descended into.
[[nodiscard]] JSON_DELTA_API bool equals(const Value& a, const Value& b) noexcept;

} // namespace json_delta
