// Copyright (c) 2024 chenmou. All rights reserved.
// Licensed under the MIT License. See LICENSE file in the project root.

/// @file serialization.h
/// @brief JSON text conversion for Value.
///
/// Usage:
/// @code
///   #include <json_delta/serialization.h>
///
///   std::string error;
///   Value doc = from_json(R"({"a": [1, 2]})", &error);
///   if (!error.empty()) { /* handle parse failure */ }
///
///   std::string text = to_json(doc, true);  // {"a":[1,2]}
/// @endcode
///
/// Limitations:
/// - Numbers are always double precision (integers above 2^53 lose precision)
/// - NaN and infinities have no JSON spelling and are written as null

#pragma once

#include "api.h"
#include "value.h"

#include <string>
#include <string_view>

namespace json_delta {

/// Convert Value to JSON string
/// @param val The Value to convert
/// @param compact If true, produce minimal output; if false, pretty-print with indentation
/// @return JSON string representation
[[nodiscard]] JSON_DELTA_API std::string to_json(const Value& val, bool compact = false);

/// Parse JSON string to Value
/// @param json_str The JSON string to parse
/// @param error_out If provided, receives error message on failure and is
///                  cleared on success
/// @return Parsed Value, or null Value on parse error
[[nodiscard]] JSON_DELTA_API Value from_json(std::string_view json_str, std::string* error_out = nullptr);

} // namespace json_delta
