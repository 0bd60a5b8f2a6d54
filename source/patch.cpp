// Copyright (c) 2024 chenmou. All rights reserved.
// Licensed under the MIT License. See LICENSE file in the project root.

/// @file patch.cpp
/// @brief JSON Patch application.

#include <json_delta/patch.h>
#include <json_delta/equality.h>
#include <json_delta/serialization.h>

namespace json_delta {

namespace {

OperationResult from_pointer_result(PointerResult result)
{
    if (!result) {
        return OperationResult::failure(std::move(*result.error));
    }
    return OperationResult::success(std::move(result.value));
}

std::string quoted(const Pointer& pointer)
{
    return "\"" + pointer.to_string() + "\"";
}

} // anonymous namespace

// ============================================================
// Operation helpers
// ============================================================

std::string_view operation_name(const Operation& op) noexcept
{
    return std::visit([](const auto& o) -> std::string_view {
        using T = std::decay_t<decltype(o)>;
        if constexpr (std::is_same_v<T, AddOp>) {
            return "add";
        } else if constexpr (std::is_same_v<T, RemoveOp>) {
            return "remove";
        } else if constexpr (std::is_same_v<T, ReplaceOp>) {
            return "replace";
        } else if constexpr (std::is_same_v<T, MoveOp>) {
            return "move";
        } else if constexpr (std::is_same_v<T, CopyOp>) {
            return "copy";
        } else {
            return "test";
        }
    }, op);
}

const Pointer& path_of(const Operation& op) noexcept
{
    return std::visit([](const auto& o) -> const Pointer& { return o.path; }, op);
}

std::string to_string(const Operation& op)
{
    std::string result{operation_name(op)};
    result += ' ';
    std::visit([&result](const auto& o) {
        using T = std::decay_t<decltype(o)>;
        if constexpr (std::is_same_v<T, MoveOp> || std::is_same_v<T, CopyOp>) {
            result += quoted(o.from) + " -> " + quoted(o.path);
        } else if constexpr (std::is_same_v<T, RemoveOp>) {
            result += quoted(o.path);
        } else {
            result += quoted(o.path) + " = " + to_json(o.value, true);
        }
    }, op);
    return result;
}

// ============================================================
// Error rendering
// ============================================================

std::string to_string(const TestFailed& failure)
{
    return "test failed at " + quoted(failure.path) + ": expected " +
           to_json(failure.expected, true) + ", found " + to_json(failure.actual, true);
}

std::string to_string(const PatchError& error)
{
    return std::visit([](const auto& e) -> std::string {
        return to_string(e);
    }, error);
}

std::string error_to_string(const ErrorWithContext& error)
{
    return "operation " + std::to_string(error.index) + " (" + to_string(error.operation) +
           ") failed: " + to_string(error.error);
}

// ============================================================
// Application
// ============================================================

OperationResult apply_operation(const Operation& op, const Value& value)
{
    return std::visit([&value](const auto& o) -> OperationResult {
        using T = std::decay_t<decltype(o)>;

        if constexpr (std::is_same_v<T, AddOp>) {
            return from_pointer_result(add_at(o.path, o.value, value));
        } else if constexpr (std::is_same_v<T, RemoveOp>) {
            return from_pointer_result(remove_at(o.path, value));
        } else if constexpr (std::is_same_v<T, ReplaceOp>) {
            auto removed = remove_at(o.path, value);
            if (!removed) {
                return OperationResult::failure(std::move(*removed.error));
            }
            return from_pointer_result(add_at(o.path, o.value, removed.value));
        } else if constexpr (std::is_same_v<T, MoveOp>) {
            auto captured = get_at(o.from, value);
            if (!captured) {
                return OperationResult::failure(std::move(*captured.error));
            }
            // Remove first: when path lies after from in the same array,
            // the add sees the shifted indices.
            auto removed = remove_at(o.from, value);
            if (!removed) {
                return OperationResult::failure(std::move(*removed.error));
            }
            return from_pointer_result(add_at(o.path, std::move(captured.value), removed.value));
        } else if constexpr (std::is_same_v<T, CopyOp>) {
            auto captured = get_at(o.from, value);
            if (!captured) {
                return OperationResult::failure(std::move(*captured.error));
            }
            return from_pointer_result(add_at(o.path, std::move(captured.value), value));
        } else {
            auto actual = get_at(o.path, value);
            if (!actual) {
                return OperationResult::failure(std::move(*actual.error));
            }
            if (!equals(actual.value, o.value)) {
                return OperationResult::failure(TestFailed{o.path, o.value, std::move(actual.value)});
            }
            return OperationResult::success(value);
        }
    }, op);
}

PatchResult apply(const Patch& patch, const Value& value)
{
    Value current = value;
    for (std::size_t i = 0; i < patch.size(); ++i) {
        auto step = apply_operation(patch[i], current);
        if (!step) {
            return PatchResult::failure(ErrorWithContext{i, patch[i], std::move(*step.error)});
        }
        current = std::move(step.value);
    }
    return PatchResult::success(std::move(current));
}

} // namespace json_delta
