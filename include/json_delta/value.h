// Copyright (c) 2024 chenmou. All rights reserved.
// Licensed under the MIT License. See LICENSE file in the project root.

/// @file value.h
/// @brief Immutable JSON value type backed by immer's persistent containers.
///
/// A Value is one of:
/// - Null (std::monostate)
/// - Bool
/// - Number (every JSON number is held as a double)
/// - String
/// - Array  (immer::flex_vector of boxed values)
/// - Object (immer::map from string keys to boxed values)
///
/// Children are stored in immer::box so that editing a node rebuilds only
/// the path from the root to that node; every untouched subtree is shared
/// with the original. The type is templated on a memory policy so callers
/// can choose between atomic (Value) and non-atomic (UnsafeValue)
/// reference counting.

#pragma once

#include "json_delta_config.h"
#include "api.h"

#include <immer/box.hpp>
#include <immer/flex_vector.hpp>
#include <immer/flex_vector_transient.hpp>
#include <immer/map.hpp>
#include <immer/map_transient.hpp>
#include <immer/memory_policy.hpp>

#include <concepts>
#include <cstddef>
#include <cstdint>
#include <initializer_list>
#include <iostream>
#include <source_location>
#include <string>
#include <string_view>
#include <type_traits>
#include <utility>
#include <variant>

namespace json_delta {

namespace detail {

inline void log_access_error(
    std::string_view func,
    std::string_view message,
    std::source_location loc = std::source_location::current()) noexcept
{
#if JSON_DELTA_VERBOSE_LOG
    std::cerr << "[" << func << "] " << message
              << " (called from " << loc.file_name()
              << ":" << loc.line() << ")\n";
#else
    (void)func;
    (void)message;
    (void)loc;
#endif
}

inline void log_key_error(
    std::string_view func,
    std::string_view key,
    std::string_view reason,
    std::source_location loc = std::source_location::current()) noexcept
{
#if JSON_DELTA_VERBOSE_LOG
    std::cerr << "[" << func << "] key '" << key << "' " << reason
              << " (called from " << loc.file_name()
              << ":" << loc.line() << ")\n";
#else
    (void)func;
    (void)key;
    (void)reason;
    (void)loc;
#endif
}

inline void log_index_error(
    std::string_view func,
    std::size_t index,
    std::string_view reason,
    std::source_location loc = std::source_location::current()) noexcept
{
#if JSON_DELTA_VERBOSE_LOG
    std::cerr << "[" << func << "] index " << index << " " << reason
              << " (called from " << loc.file_name()
              << ":" << loc.line() << ")\n";
#else
    (void)func;
    (void)index;
    (void)reason;
    (void)loc;
#endif
}

} // namespace detail

/// The six JSON value kinds
enum class ValueType : std::uint8_t {
    Null,
    Bool,
    Number,
    String,
    Array,
    Object,
};

template <typename T>
concept IntegralNumber = std::integral<T> && !std::same_as<T, bool>;

// Forward declaration
template <typename MemoryPolicy>
struct BasicValue;

template <typename MemoryPolicy>
using BasicValueBox = immer::box<BasicValue<MemoryPolicy>, MemoryPolicy>;

template <typename MemoryPolicy>
using BasicValueMap = immer::map<std::string,
                                 BasicValueBox<MemoryPolicy>,
                                 std::hash<std::string>,
                                 std::equal_to<std::string>,
                                 MemoryPolicy>;

/// flex_vector rather than vector: JSON Patch inserts and erases in the
/// middle of arrays, which flex_vector does in O(log n) with sharing.
template <typename MemoryPolicy>
using BasicValueArray = immer::flex_vector<BasicValueBox<MemoryPolicy>, MemoryPolicy>;

template <typename MemoryPolicy = immer::default_memory_policy>
struct BasicValue
{
    using memory_policy = MemoryPolicy;
    using value_box     = BasicValueBox<MemoryPolicy>;
    using value_map     = BasicValueMap<MemoryPolicy>;
    using value_array   = BasicValueArray<MemoryPolicy>;

    std::variant<bool,
                 double,
                 std::string,
                 value_array,
                 value_map,
                 std::monostate>
        data;

    BasicValue() noexcept : data(std::monostate{}) {}
    BasicValue(std::nullptr_t) noexcept : data(std::monostate{}) {}
    BasicValue(bool v) noexcept : data(v) {}
    BasicValue(double v) noexcept : data(v) {}

    template <IntegralNumber T>
    BasicValue(T v) noexcept : data(static_cast<double>(v)) {}

    BasicValue(const std::string& v) : data(v) {}
    BasicValue(std::string&& v) noexcept : data(std::move(v)) {}
    BasicValue(std::string_view v) : data(std::in_place_type<std::string>, v) {}
    BasicValue(const char* v) : data(std::in_place_type<std::string>, v) {}
    BasicValue(value_array v) : data(std::move(v)) {}
    BasicValue(value_map v) : data(std::move(v)) {}

    // Factory functions for container types
    static BasicValue object(std::initializer_list<std::pair<std::string, BasicValue>> init) {
        auto t = value_map{}.transient();
        for (const auto& [key, val] : init) {
            t.set(key, value_box{val});
        }
        return BasicValue{t.persistent()};
    }

    static BasicValue array(std::initializer_list<BasicValue> init) {
        auto t = value_array{}.transient();
        for (const auto& val : init) {
            t.push_back(value_box{val});
        }
        return BasicValue{t.persistent()};
    }

    template <typename T>
    [[nodiscard]] const T* get_if() const { return std::get_if<T>(&data); }

    template <typename T>
    [[nodiscard]] bool is() const { return std::holds_alternative<T>(data); }

    [[nodiscard]] ValueType type() const noexcept {
        switch (data.index()) {
            case 0: return ValueType::Bool;
            case 1: return ValueType::Number;
            case 2: return ValueType::String;
            case 3: return ValueType::Array;
            case 4: return ValueType::Object;
            default: return ValueType::Null;
        }
    }

    [[nodiscard]] bool is_null() const noexcept { return std::holds_alternative<std::monostate>(data); }
    [[nodiscard]] bool is_bool() const noexcept { return is<bool>(); }
    [[nodiscard]] bool is_number() const noexcept { return is<double>(); }
    [[nodiscard]] bool is_string() const noexcept { return is<std::string>(); }
    [[nodiscard]] bool is_array() const noexcept { return is<value_array>(); }
    [[nodiscard]] bool is_object() const noexcept { return is<value_map>(); }
    [[nodiscard]] bool is_container() const noexcept { return is_array() || is_object(); }

    [[nodiscard]] BasicValue at(const std::string& key) const {
        if (auto* m = get_if<value_map>()) {
            if (auto* found = m->find(key)) return found->get();
        }
        detail::log_key_error("Value::at", key, "not found or type mismatch");
        return BasicValue{};
    }

    [[nodiscard]] BasicValue at(std::size_t index) const {
        if (auto* a = get_if<value_array>()) {
            if (index < a->size()) return (*a)[index].get();
        }
        detail::log_index_error("Value::at", index, "out of range or type mismatch");
        return BasicValue{};
    }

    [[nodiscard]] BasicValue at_or(const std::string& key, BasicValue default_val) const {
        if (auto* m = get_if<value_map>()) {
            if (auto* found = m->find(key)) return found->get();
        }
        return default_val;
    }

    [[nodiscard]] bool as_bool(bool default_val = false) const {
        if (auto* p = get_if<bool>()) return *p;
        return default_val;
    }

    [[nodiscard]] double as_number(double default_val = 0.0) const {
        if (auto* p = get_if<double>()) return *p;
        return default_val;
    }

    [[nodiscard]] std::string as_string(std::string default_val = "") const {
        if (auto* p = get_if<std::string>()) return *p;
        return default_val;
    }

    [[nodiscard]] std::string_view as_string_view() const noexcept {
        if (auto* p = get_if<std::string>()) return *p;
        return {};
    }

    [[nodiscard]] value_array as_array(value_array default_val = {}) const {
        if (auto* p = get_if<value_array>()) return *p;
        return default_val;
    }

    [[nodiscard]] value_map as_object(value_map default_val = {}) const {
        if (auto* p = get_if<value_map>()) return *p;
        return default_val;
    }

    [[nodiscard]] bool contains(const std::string& key) const { return count(key) > 0; }

    [[nodiscard]] bool contains(std::size_t index) const {
        if (auto* a = get_if<value_array>()) return index < a->size();
        return false;
    }

    [[nodiscard]] BasicValue set(const std::string& key, BasicValue val) const {
        if (auto* m = get_if<value_map>()) return m->set(key, value_box{std::move(val)});
        detail::log_key_error("Value::set", key, "cannot set on non-object type");
        return *this;
    }

    [[nodiscard]] BasicValue set(std::size_t index, BasicValue val) const {
        if (auto* a = get_if<value_array>()) {
            if (index < a->size()) return a->set(index, value_box{std::move(val)});
        }
        detail::log_index_error("Value::set", index, "out of range or type mismatch");
        return *this;
    }

    [[nodiscard]] std::size_t count(const std::string& key) const {
        if (auto* m = get_if<value_map>()) return m->count(key);
        return 0;
    }

    [[nodiscard]] std::size_t size() const {
        if (auto* m = get_if<value_map>()) return m->size();
        if (auto* a = get_if<value_array>()) return a->size();
        return 0;
    }

    using size_type = std::size_t;
};

// ============================================================
// Memory Policy Definitions
// ============================================================

/// Single-threaded memory policy: non-atomic refcount + no locks
using unsafe_memory_policy = immer::memory_policy<
    immer::unsafe_free_list_heap_policy<immer::cpp_heap>,
    immer::unsafe_refcount_policy,
    immer::no_lock_policy
>;

/// Thread-safe memory policy: atomic refcount + spinlock
using thread_safe_memory_policy = immer::default_memory_policy;

// ============================================================
// Value type aliases
//
//   - Value       : thread-safe refcounting. The engines (pointer,
//                   patch, diff) all work on this type so a document
//                   may be shared read-only between threads.
//   - UnsafeValue : non-atomic refcounting for trees that never
//                   leave one thread.
// ============================================================

using ThreadSafeValue      = BasicValue<thread_safe_memory_policy>;
using ThreadSafeValueBox   = BasicValueBox<thread_safe_memory_policy>;
using ThreadSafeValueMap   = BasicValueMap<thread_safe_memory_policy>;
using ThreadSafeValueArray = BasicValueArray<thread_safe_memory_policy>;

using UnsafeValue      = BasicValue<unsafe_memory_policy>;
using UnsafeValueBox   = BasicValueBox<unsafe_memory_policy>;
using UnsafeValueMap   = BasicValueMap<unsafe_memory_policy>;
using UnsafeValueArray = BasicValueArray<unsafe_memory_policy>;

using Value      = ThreadSafeValue;
using ValueBox   = ThreadSafeValueBox;
using ValueMap   = ThreadSafeValueMap;
using ValueArray = ThreadSafeValueArray;

/// Strict structural equality: same alternative, same contents.
/// Use equals() from equality.h for the RFC 6902 comparison.
template <typename MemoryPolicy>
bool operator==(const BasicValue<MemoryPolicy>& a, const BasicValue<MemoryPolicy>& b)
{
    return a.data == b.data;
}

// ============================================================
// Utility functions
// ============================================================

[[nodiscard]] JSON_DELTA_API std::string_view type_name(ValueType type) noexcept;

// Convert Value to a short human-readable summary ("{object:3}", "\"abc\"", ...)
[[nodiscard]] JSON_DELTA_API std::string value_to_string(const Value& val);

// Writes the compact JSON form of val
JSON_DELTA_API std::ostream& operator<<(std::ostream& os, const Value& val);

// ============================================================
// Extern Template Declarations
//
// The instantiations live in value.cpp.
// ============================================================

extern template struct BasicValue<unsafe_memory_policy>;
extern template struct BasicValue<thread_safe_memory_policy>;

} // namespace json_delta
