// Copyright (c) 2024 chenmou. All rights reserved.
// Licensed under the MIT License. See LICENSE file in the project root.

/// @file pointer.h
/// @brief JSON Pointer (RFC 6901) paths and the get/add/remove engine.
///
/// A Pointer is a sequence of unescaped string segments:
///   "/users/0/name"  ->  ["users", "0", "name"]
///   ""               ->  []        (the whole document)
///   "/"              ->  [""]      (key is the empty string)
///   "/a~1b/m~0n"     ->  ["a/b", "m~n"]
///
/// Segments stay strings until they meet a node: against an array a
/// segment must be "-" or a canonical decimal index, against an object it
/// is a key. The node decides, never the segment text.
///
/// All engine functions are pure: they return a new Value (sharing every
/// untouched subtree with the input) or a PointerError, and never modify
/// their arguments.
///
/// RFC 6901: https://datatracker.ietf.org/doc/html/rfc6901

#pragma once

#include "api.h"
#include "value.h"

#include <cstdint>
#include <initializer_list>
#include <optional>
#include <stdexcept>
#include <string>
#include <string_view>
#include <vector>

namespace json_delta {

// ============================================================
// Pointer
// ============================================================

class JSON_DELTA_API Pointer {
public:
    using value_type = std::string;
    using const_iterator = std::vector<std::string>::const_iterator;
    using size_type = std::size_t;

    /// Default constructor - the root pointer
    Pointer() = default;

    Pointer(std::initializer_list<std::string> segments) : segments_(segments) {}

    explicit Pointer(std::vector<std::string> segments) : segments_(std::move(segments)) {}

    [[nodiscard]] const std::vector<std::string>& segments() const noexcept { return segments_; }
    [[nodiscard]] std::size_t size() const noexcept { return segments_.size(); }
    [[nodiscard]] bool empty() const noexcept { return segments_.empty(); }
    [[nodiscard]] bool is_root() const noexcept { return segments_.empty(); }

    [[nodiscard]] const std::string& operator[](std::size_t i) const { return segments_[i]; }
    [[nodiscard]] const std::string& front() const { return segments_.front(); }
    [[nodiscard]] const std::string& back() const { return segments_.back(); }

    [[nodiscard]] const_iterator begin() const noexcept { return segments_.begin(); }
    [[nodiscard]] const_iterator end() const noexcept { return segments_.end(); }

    /// Pointer without its last segment (root stays root)
    [[nodiscard]] Pointer parent() const;

    /// Pointer without its first segment (root stays root)
    [[nodiscard]] Pointer tail() const;

    /// Append a key segment
    [[nodiscard]] Pointer operator/(std::string segment) const;

    /// Append an array index segment
    [[nodiscard]] Pointer operator/(std::size_t index) const;

    /// Prepend a single segment: Pointer{"b"}.prefixed("a") == Pointer{"a", "b"}
    [[nodiscard]] Pointer prefixed(std::string segment) const;

    /// Prepend a whole pointer
    [[nodiscard]] Pointer prefixed(const Pointer& prefix) const;

    /// Encode to the RFC 6901 string form ("" for root)
    [[nodiscard]] std::string to_string() const;

    bool operator==(const Pointer& other) const = default;

private:
    std::vector<std::string> segments_;
};

// ============================================================
// Errors and results
// ============================================================

enum class PointerErrorCode : std::uint8_t {
    FieldNotFound,      // Object has no such key
    BadIndex,           // Segment is not "-" or a canonical array index
    IndexOutOfBounds,   // Index past the end of the array
    TypeMismatch,       // Pointer continues into a scalar
    InvalidPointer,     // Wire text is not a JSON Pointer
};

struct PointerError {
    PointerErrorCode code = PointerErrorCode::FieldNotFound;
    std::string segment;    // key, raw index text, or offending pointer text
    std::size_t index = 0;  // meaningful for IndexOutOfBounds
    std::string message;    // extra detail for TypeMismatch / InvalidPointer

    [[nodiscard]] static PointerError field_not_found(std::string key) {
        return PointerError{PointerErrorCode::FieldNotFound, std::move(key), 0, {}};
    }

    [[nodiscard]] static PointerError bad_index(std::string raw) {
        return PointerError{PointerErrorCode::BadIndex, std::move(raw), 0, {}};
    }

    [[nodiscard]] static PointerError index_out_of_bounds(std::size_t index) {
        return PointerError{PointerErrorCode::IndexOutOfBounds, {}, index, {}};
    }

    [[nodiscard]] static PointerError type_mismatch(std::string segment, ValueType found) {
        return PointerError{PointerErrorCode::TypeMismatch, std::move(segment), 0,
                            "cannot resolve a segment against " + std::string{type_name(found)}};
    }

    [[nodiscard]] static PointerError invalid_pointer(std::string text, std::string reason) {
        return PointerError{PointerErrorCode::InvalidPointer, std::move(text), 0, std::move(reason)};
    }

    bool operator==(const PointerError& other) const = default;
};

/// Human-readable description, e.g. `field not found: "name"`
[[nodiscard]] JSON_DELTA_API std::string to_string(const PointerError& error);

/// Outcome of get_at / add_at / remove_at
struct PointerResult {
    Value value;                        // Resolved or rebuilt value (null on error)
    std::optional<PointerError> error;  // Set when the operation failed

    [[nodiscard]] static PointerResult success(Value v) {
        return PointerResult{std::move(v), std::nullopt};
    }

    [[nodiscard]] static PointerResult failure(PointerError e) {
        return PointerResult{Value{}, std::move(e)};
    }

    explicit operator bool() const noexcept { return !error.has_value(); }
    [[nodiscard]] bool ok() const noexcept { return !error.has_value(); }

    const Value& get() const {
        if (error) {
            throw std::runtime_error("Pointer operation failed: " + to_string(*error));
        }
        return value;
    }

    Value get_or(Value default_val) const {
        return error ? std::move(default_val) : value;
    }
};

/// Outcome of decoding something from text or from a Value
template <typename T>
struct DecodeResult {
    T value{};
    std::optional<std::string> error;

    [[nodiscard]] static DecodeResult success(T v) {
        return DecodeResult{std::move(v), std::nullopt};
    }

    [[nodiscard]] static DecodeResult failure(std::string message) {
        return DecodeResult{T{}, std::move(message)};
    }

    explicit operator bool() const noexcept { return !error.has_value(); }
    [[nodiscard]] bool ok() const noexcept { return !error.has_value(); }

    const T& get() const {
        if (error) {
            throw std::runtime_error("Decode failed: " + *error);
        }
        return value;
    }
};

// ============================================================
// Wire format
// ============================================================

/// Escape one segment: "~" -> "~0", then "/" -> "~1"
[[nodiscard]] JSON_DELTA_API std::string escape_segment(std::string_view segment);

/// Unescape one segment: "~1" -> "/", "~0" -> "~"
[[nodiscard]] JSON_DELTA_API std::string unescape_segment(std::string_view segment);

/// Parse the RFC 6901 string form. Fails unless the text is empty or
/// starts with '/'.
[[nodiscard]] JSON_DELTA_API DecodeResult<Pointer> parse_pointer(std::string_view text);

// ============================================================
// Engine
// ============================================================

/// Resolve pointer against value.
/// Against an array "-" resolves to size(), which is always out of bounds.
[[nodiscard]] JSON_DELTA_API PointerResult get_at(const Pointer& pointer, const Value& value);

/// Insert new_value at pointer.
/// - root pointer: returns new_value
/// - array parent: "-" appends, index i in [0, size] inserts before i
/// - object parent: sets the key, overwriting any existing entry
[[nodiscard]] JSON_DELTA_API PointerResult add_at(const Pointer& pointer, Value new_value, const Value& root);

/// Remove the node at pointer.
/// - root pointer: returns null
/// - array parent: index must be < size, later elements shift left
/// - object parent: key must exist
[[nodiscard]] JSON_DELTA_API PointerResult remove_at(const Pointer& pointer, const Value& root);

/// True when get_at would succeed
[[nodiscard]] JSON_DELTA_API bool exists_at(const Pointer& pointer, const Value& value);

} // namespace json_delta
