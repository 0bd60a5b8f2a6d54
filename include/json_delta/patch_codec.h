// Copyright (c) 2024 chenmou. All rights reserved.
// Licensed under the MIT License. See LICENSE file in the project root.

/// @file patch_codec.h
/// @brief Conversion between Pointer/Patch and their JSON representation.
///
/// Wire form of a patch (RFC 6902 section 3):
/// @code
///   [
///     { "op": "test",    "path": "/a/b/c", "value": "foo" },
///     { "op": "remove",  "path": "/a/b/c" },
///     { "op": "add",     "path": "/a/b/c", "value": ["foo", "bar"] },
///     { "op": "replace", "path": "/a/b/c", "value": 42 },
///     { "op": "move",    "from": "/a/b/c", "path": "/a/b/d" },
///     { "op": "copy",    "from": "/a/b/d", "path": "/a/b/e" }
///   ]
/// @endcode
///
/// Members not needed by an operation are ignored on decode.

#pragma once

#include "api.h"
#include "patch.h"
#include "pointer.h"
#include "value.h"

#include <string_view>

namespace json_delta {

// ============================================================
// Pointer
// ============================================================

/// Pointer as a JSON string ("" for root)
[[nodiscard]] JSON_DELTA_API Value encode_pointer(const Pointer& pointer);

/// Fails unless value is a string holding a valid pointer
[[nodiscard]] JSON_DELTA_API DecodeResult<Pointer> decode_pointer(const Value& value);

// ============================================================
// Operation / Patch
// ============================================================

[[nodiscard]] JSON_DELTA_API Value encode_operation(const Operation& op);
[[nodiscard]] JSON_DELTA_API DecodeResult<Operation> decode_operation(const Value& value);

/// Patch as a JSON array of operation objects
[[nodiscard]] JSON_DELTA_API Value encode_patch(const Patch& patch);

/// Decode a JSON array of operation objects.
/// The error names the zero-based index of the first bad entry,
/// e.g. "operation 2: missing field 'value'".
[[nodiscard]] JSON_DELTA_API DecodeResult<Patch> decode_patch(const Value& value);

/// from_json() followed by decode_patch()
[[nodiscard]] JSON_DELTA_API DecodeResult<Patch> parse_patch(std::string_view json_text);

} // namespace json_delta
