// Copyright (c) 2024 chenmou. All rights reserved.
// Licensed under the MIT License. See LICENSE file in the project root.

/// @file patch.h
/// @brief JSON Patch (RFC 6902) operations and the application engine.
///
/// A Patch is an ordered list of operations applied one after another:
///
/// @code
///   Patch patch{
///       TestOp{Pointer{"version"}, Value{1}},
///       ReplaceOp{Pointer{"version"}, Value{2}},
///       AddOp{Pointer{"tags", "-"}, Value{"stable"}},
///   };
///
///   PatchResult result = apply(patch, doc);
///   if (!result) {
///       std::cerr << error_to_string(*result.error) << "\n";
///   }
/// @endcode
///
/// Application stops at the first failing operation. The input document is
/// never modified, so after a failure the caller still holds the original.
///
/// RFC 6902: https://datatracker.ietf.org/doc/html/rfc6902

#pragma once

#include <json_delta/api.h>
#include <json_delta/pointer.h>
#include <json_delta/value.h>

#include <optional>
#include <stdexcept>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

namespace json_delta {

// ============================================================
// Operations
//
// Equality on operations is strict (Value::operator==), so a patch that
// survives encode/decode compares equal to the original.
// ============================================================

/// Insert or overwrite value at path
struct AddOp {
    Pointer path;
    Value value;

    bool operator==(const AddOp& other) const = default;
};

/// Delete the node at path
struct RemoveOp {
    Pointer path;

    bool operator==(const RemoveOp& other) const = default;
};

/// Remove at path, then add value at path
struct ReplaceOp {
    Pointer path;
    Value value;

    bool operator==(const ReplaceOp& other) const = default;
};

/// Read from, remove from, add the read value at path
struct MoveOp {
    Pointer from;
    Pointer path;

    bool operator==(const MoveOp& other) const = default;
};

/// Read from, add the read value at path
struct CopyOp {
    Pointer from;
    Pointer path;

    bool operator==(const CopyOp& other) const = default;
};

/// Check the node at path deep-equals value
struct TestOp {
    Pointer path;
    Value value;

    bool operator==(const TestOp& other) const = default;
};

using Operation = std::variant<AddOp, RemoveOp, ReplaceOp, MoveOp, CopyOp, TestOp>;
using Patch = std::vector<Operation>;

/// "add", "remove", "replace", "move", "copy" or "test"
[[nodiscard]] JSON_DELTA_API std::string_view operation_name(const Operation& op) noexcept;

/// The target pointer ("path" member) of any operation
[[nodiscard]] JSON_DELTA_API const Pointer& path_of(const Operation& op) noexcept;

/// One-line rendering, e.g. `move "/a/0" -> "/b"` or `add "/x" = {"k":1}`
[[nodiscard]] JSON_DELTA_API std::string to_string(const Operation& op);

// ============================================================
// Errors
// ============================================================

/// A test operation found a value that is not deep-equal to the expected one
struct TestFailed {
    Pointer path;
    Value expected;
    Value actual;

    bool operator==(const TestFailed& other) const = default;
};

/// Navigation failures and test mismatches are kept apart: the first
/// usually signals a bad patch, the second an expected conditional outcome.
using PatchError = std::variant<PointerError, TestFailed>;

/// The single error reported by a failed apply()
struct ErrorWithContext {
    std::size_t index = 0;  // zero-based position of the operation in the patch
    Operation operation;    // the operation that failed
    PatchError error;       // why it failed
};

[[nodiscard]] JSON_DELTA_API std::string to_string(const TestFailed& failure);
[[nodiscard]] JSON_DELTA_API std::string to_string(const PatchError& error);

/// e.g. `operation 2 (remove "/a/5") failed: array index out of bounds: 5`
[[nodiscard]] JSON_DELTA_API std::string error_to_string(const ErrorWithContext& error);

// ============================================================
// Results
// ============================================================

struct OperationResult {
    Value value;
    std::optional<PatchError> error;

    [[nodiscard]] static OperationResult success(Value v) {
        return OperationResult{std::move(v), std::nullopt};
    }

    [[nodiscard]] static OperationResult failure(PatchError e) {
        return OperationResult{Value{}, std::move(e)};
    }

    explicit operator bool() const noexcept { return !error.has_value(); }
    [[nodiscard]] bool ok() const noexcept { return !error.has_value(); }

    const Value& get() const {
        if (error) {
            throw std::runtime_error("Operation failed: " + to_string(*error));
        }
        return value;
    }
};

struct PatchResult {
    Value value;                            // Patched document (null on error)
    std::optional<ErrorWithContext> error;  // Set when an operation failed

    [[nodiscard]] static PatchResult success(Value v) {
        return PatchResult{std::move(v), std::nullopt};
    }

    [[nodiscard]] static PatchResult failure(ErrorWithContext e) {
        return PatchResult{Value{}, std::move(e)};
    }

    explicit operator bool() const noexcept { return !error.has_value(); }
    [[nodiscard]] bool ok() const noexcept { return !error.has_value(); }

    const Value& get() const {
        if (error) {
            throw std::runtime_error("Patch failed: " + error_to_string(*error));
        }
        return value;
    }

    Value get_or(Value default_val) const {
        return error ? std::move(default_val) : value;
    }
};

// ============================================================
// Application
// ============================================================

/// Apply one operation to value.
/// Replace stops at a failing remove; move removes before it adds.
[[nodiscard]] JSON_DELTA_API OperationResult apply_operation(const Operation& op, const Value& value);

/// Apply every operation in order, stopping at the first failure.
/// The returned error carries the failing operation's index and a copy
/// of the operation itself.
[[nodiscard]] JSON_DELTA_API PatchResult apply(const Patch& patch, const Value& value);

} // namespace json_delta
