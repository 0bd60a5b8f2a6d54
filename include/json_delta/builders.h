// Copyright (c) 2024 chenmou. All rights reserved.
// Licensed under the MIT License. See LICENSE file in the project root.

/// @file builders.h
/// @brief Transient-backed builders for Value objects and arrays.
///
/// Building a container with repeated Value::set copies a path of nodes per
/// insertion. The builders below mutate an immer transient in place and
/// freeze it once, which is what the JSON parser and the patch encoder need.
///
/// @code
///   Value op = ObjectBuilder{}
///       .set("op", "remove")
///       .set("path", "/items/0")
///       .finish();
///
///   Value list = ArrayBuilder{}.push_back(1).push_back("two").finish();
/// @endcode
///
/// A builder must not be used after finish().

#pragma once

#include "value.h"

namespace json_delta {

template <typename MemoryPolicy>
class BasicObjectBuilder {
public:
    using value_type = BasicValue<MemoryPolicy>;
    using map_type = BasicValueMap<MemoryPolicy>;

    BasicObjectBuilder() : members_(map_type{}.transient()) {}

    BasicObjectBuilder(BasicObjectBuilder&&) noexcept = default;
    BasicObjectBuilder& operator=(BasicObjectBuilder&&) noexcept = default;
    BasicObjectBuilder(const BasicObjectBuilder&) = delete;
    BasicObjectBuilder& operator=(const BasicObjectBuilder&) = delete;

    /// Insert or overwrite a member
    BasicObjectBuilder& set(const std::string& key, value_type val) {
        members_.set(key, BasicValueBox<MemoryPolicy>{std::move(val)});
        return *this;
    }

    [[nodiscard]] bool contains(const std::string& key) const { return members_.count(key) > 0; }
    [[nodiscard]] std::size_t size() const { return members_.size(); }

    [[nodiscard]] value_type finish() { return value_type{members_.persistent()}; }

private:
    typename map_type::transient_type members_;
};

template <typename MemoryPolicy>
class BasicArrayBuilder {
public:
    using value_type = BasicValue<MemoryPolicy>;
    using array_type = BasicValueArray<MemoryPolicy>;

    BasicArrayBuilder() : elements_(array_type{}.transient()) {}

    BasicArrayBuilder(BasicArrayBuilder&&) noexcept = default;
    BasicArrayBuilder& operator=(BasicArrayBuilder&&) noexcept = default;
    BasicArrayBuilder(const BasicArrayBuilder&) = delete;
    BasicArrayBuilder& operator=(const BasicArrayBuilder&) = delete;

    BasicArrayBuilder& push_back(value_type val) {
        elements_.push_back(BasicValueBox<MemoryPolicy>{std::move(val)});
        return *this;
    }

    [[nodiscard]] std::size_t size() const { return elements_.size(); }

    [[nodiscard]] value_type finish() { return value_type{elements_.persistent()}; }

private:
    typename array_type::transient_type elements_;
};

using ObjectBuilder = BasicObjectBuilder<thread_safe_memory_policy>;
using ArrayBuilder  = BasicArrayBuilder<thread_safe_memory_policy>;

using UnsafeObjectBuilder = BasicObjectBuilder<unsafe_memory_policy>;
using UnsafeArrayBuilder  = BasicArrayBuilder<unsafe_memory_policy>;

extern template class BasicObjectBuilder<unsafe_memory_policy>;
extern template class BasicArrayBuilder<unsafe_memory_policy>;
extern template class BasicObjectBuilder<thread_safe_memory_policy>;
extern template class BasicArrayBuilder<thread_safe_memory_policy>;

} // namespace json_delta
