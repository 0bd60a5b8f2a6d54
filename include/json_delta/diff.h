// Copyright (c) 2024 chenmou. All rights reserved.
// Licensed under the MIT License. See LICENSE file in the project root.

/// @file diff.h
/// @brief Structural diff between two Values, producing a JSON Patch.
///
/// For any strategy s and values a, b:
///
///   apply(diff(s, a, b), b) yields a Value equal to a
///
/// Objects are merged key by key (keys visited in ascending order so the
/// output does not depend on hash layout). Arrays are handed to an
/// ArrayDiffStrategy. Anything else is either unchanged or replaced whole.
///
/// Usage:
/// @code
///   LcsArrayDiff lcs;
///   Patch patch = diff(lcs, new_doc, old_doc);
///   assert(apply(patch, old_doc).value == new_doc);
/// @endcode

#pragma once

#include "api.h"
#include "patch.h"
#include "value.h"

#include <string_view>

namespace json_delta {

// ============================================================
// Array strategies
// ============================================================

/// Produces a patch that turns old_array into new_array.
/// Pointers in the result are relative to the array itself ("/0", "/-").
class JSON_DELTA_API ArrayDiffStrategy {
public:
    virtual ~ArrayDiffStrategy() = default;

    [[nodiscard]] virtual Patch diff(const ValueArray& new_array, const ValueArray& old_array) const = 0;
};

/// Pairs elements by position.
/// Common prefix is diffed recursively, surplus old elements are removed
/// from the back, surplus new elements are appended with "/-".
/// Cheap, but an insert near the front rewrites every later element.
class JSON_DELTA_API IndexArrayDiff final : public ArrayDiffStrategy {
public:
    [[nodiscard]] Patch diff(const ValueArray& new_array, const ValueArray& old_array) const override;
};

/// Longest common subsequence under equals().
/// Unmatched elements become removes and inserts at running indices. An
/// unmatched old element that lines up with an unmatched new element is
/// diffed recursively in place instead of being removed and re-added.
/// O(n*m) time and memory.
class JSON_DELTA_API LcsArrayDiff final : public ArrayDiffStrategy {
public:
    [[nodiscard]] Patch diff(const ValueArray& new_array, const ValueArray& old_array) const override;
};

// ============================================================
// Diff
// ============================================================

/// Patch that transforms old_value into new_value
[[nodiscard]] JSON_DELTA_API Patch diff(const ArrayDiffStrategy& strategy,
                                        const Value& new_value,
                                        const Value& old_value);

/// Diff two JSON documents given as text.
/// If either text fails to parse the error is logged and the patch is empty.
[[nodiscard]] JSON_DELTA_API Patch diff_json(const ArrayDiffStrategy& strategy,
                                             std::string_view new_json,
                                             std::string_view old_json);

} // namespace json_delta
