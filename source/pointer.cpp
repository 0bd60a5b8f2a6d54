// Copyright (c) 2024 chenmou. All rights reserved.
// Licensed under the MIT License. See LICENSE file in the project root.

/// @file pointer.cpp
/// @brief JSON Pointer parsing and the copy-on-write get/add/remove engine.

#include <json_delta/pointer.h>

#include <algorithm>
#include <charconv>

namespace json_delta {

// ============================================================
// Pointer
// ============================================================

Pointer Pointer::parent() const
{
    if (segments_.empty()) return *this;
    return Pointer{std::vector<std::string>(segments_.begin(), segments_.end() - 1)};
}

Pointer Pointer::tail() const
{
    if (segments_.empty()) return *this;
    return Pointer{std::vector<std::string>(segments_.begin() + 1, segments_.end())};
}

Pointer Pointer::operator/(std::string segment) const
{
    Pointer result = *this;
    result.segments_.push_back(std::move(segment));
    return result;
}

Pointer Pointer::operator/(std::size_t index) const
{
    return *this / std::to_string(index);
}

Pointer Pointer::prefixed(std::string segment) const
{
    std::vector<std::string> segments;
    segments.reserve(segments_.size() + 1);
    segments.push_back(std::move(segment));
    segments.insert(segments.end(), segments_.begin(), segments_.end());
    return Pointer{std::move(segments)};
}

Pointer Pointer::prefixed(const Pointer& prefix) const
{
    std::vector<std::string> segments;
    segments.reserve(prefix.size() + segments_.size());
    segments.insert(segments.end(), prefix.begin(), prefix.end());
    segments.insert(segments.end(), segments_.begin(), segments_.end());
    return Pointer{std::move(segments)};
}

std::string Pointer::to_string() const
{
    std::string result;
    for (const auto& segment : segments_) {
        result += '/';
        result += escape_segment(segment);
    }
    return result;
}

// ============================================================
// Escaping
// ============================================================

std::string escape_segment(std::string_view segment)
{
    std::string result;
    result.reserve(segment.size());
    for (char c : segment) {
        if (c == '~') {
            result += "~0";
        } else if (c == '/') {
            result += "~1";
        } else {
            result += c;
        }
    }
    return result;
}

std::string unescape_segment(std::string_view segment)
{
    // Single left-to-right pass: "~01" decodes to "~1", never to "/"
    std::string result;
    result.reserve(segment.size());

    for (std::size_t i = 0; i < segment.size(); ++i) {
        if (segment[i] == '~' && i + 1 < segment.size()) {
            if (segment[i + 1] == '1') {
                result += '/';
                ++i;
                continue;
            } else if (segment[i + 1] == '0') {
                result += '~';
                ++i;
                continue;
            }
        }
        result += segment[i];
    }

    return result;
}

DecodeResult<Pointer> parse_pointer(std::string_view text)
{
    // Empty pointer refers to root
    if (text.empty()) {
        return DecodeResult<Pointer>::success(Pointer{});
    }

    if (text[0] != '/') {
        detail::log_access_error("parse_pointer",
                                 "invalid pointer, must start with '/': " + std::string{text});
        return DecodeResult<Pointer>::failure("invalid JSON pointer \"" + std::string{text} +
                                              "\": must be empty or start with '/'");
    }

    std::vector<std::string> segments;
    std::size_t start = 1;
    while (true) {
        auto pos = text.find('/', start);
        auto raw = (pos == std::string_view::npos) ? text.substr(start)
                                                   : text.substr(start, pos - start);
        segments.push_back(unescape_segment(raw));
        if (pos == std::string_view::npos) {
            break;
        }
        start = pos + 1;
    }

    return DecodeResult<Pointer>::success(Pointer{std::move(segments)});
}

std::string to_string(const PointerError& error)
{
    switch (error.code) {
        case PointerErrorCode::FieldNotFound:
            return "field not found: \"" + error.segment + "\"";
        case PointerErrorCode::BadIndex:
            return "bad array index: \"" + error.segment + "\"";
        case PointerErrorCode::IndexOutOfBounds:
            return "array index out of bounds: " + std::to_string(error.index);
        case PointerErrorCode::TypeMismatch:
            return "type mismatch at \"" + error.segment + "\": " + error.message;
        case PointerErrorCode::InvalidPointer:
            return "invalid pointer \"" + error.segment + "\": " + error.message;
    }
    return "unknown pointer error";
}

// ============================================================
// Engine
// ============================================================

namespace {

/// Parse an array segment. "-" maps to size (one past the end).
/// Only "0" and digit strings without a leading zero are indices.
std::optional<PointerError> parse_array_index(const std::string& segment, std::size_t size, std::size_t& index)
{
    if (segment == "-") {
        index = size;
        return std::nullopt;
    }

    const bool all_digits = !segment.empty() &&
        std::all_of(segment.begin(), segment.end(), [](char c) { return c >= '0' && c <= '9'; });
    if (!all_digits || (segment.size() > 1 && segment[0] == '0')) {
        return PointerError::bad_index(segment);
    }

    auto [end, ec] = std::from_chars(segment.data(), segment.data() + segment.size(), index);
    if (ec != std::errc{} || end != segment.data() + segment.size()) {
        // Digits that do not fit in size_t cannot name an element
        return PointerError::bad_index(segment);
    }
    return std::nullopt;
}

/// Resolve one segment against node, without rebuilding anything
PointerResult child_at(const Value& node, const std::string& segment)
{
    if (auto* arr = node.get_if<ValueArray>()) {
        std::size_t index = 0;
        if (auto err = parse_array_index(segment, arr->size(), index)) {
            return PointerResult::failure(std::move(*err));
        }
        if (index >= arr->size()) {
            return PointerResult::failure(PointerError::index_out_of_bounds(index));
        }
        return PointerResult::success((*arr)[index].get());
    }
    if (auto* obj = node.get_if<ValueMap>()) {
        if (auto* found = obj->find(segment)) {
            return PointerResult::success(found->get());
        }
        return PointerResult::failure(PointerError::field_not_found(segment));
    }
    return PointerResult::failure(PointerError::type_mismatch(segment, node.type()));
}

PointerResult add_recursive(const Value& node, const Pointer& pointer, std::size_t depth, Value new_value)
{
    const auto& segment = pointer[depth];
    const bool last = depth + 1 == pointer.size();

    if (auto* arr = node.get_if<ValueArray>()) {
        std::size_t index = 0;
        if (auto err = parse_array_index(segment, arr->size(), index)) {
            return PointerResult::failure(std::move(*err));
        }
        if (last) {
            if (index > arr->size()) {
                return PointerResult::failure(PointerError::index_out_of_bounds(index));
            }
            return PointerResult::success(arr->insert(index, ValueBox{std::move(new_value)}));
        }
        if (index >= arr->size()) {
            return PointerResult::failure(PointerError::index_out_of_bounds(index));
        }
        auto child = add_recursive((*arr)[index].get(), pointer, depth + 1, std::move(new_value));
        if (!child) {
            return child;
        }
        return PointerResult::success(arr->set(index, ValueBox{std::move(child.value)}));
    }

    if (auto* obj = node.get_if<ValueMap>()) {
        if (last) {
            return PointerResult::success(obj->set(segment, ValueBox{std::move(new_value)}));
        }
        auto* found = obj->find(segment);
        if (!found) {
            return PointerResult::failure(PointerError::field_not_found(segment));
        }
        auto child = add_recursive(found->get(), pointer, depth + 1, std::move(new_value));
        if (!child) {
            return child;
        }
        return PointerResult::success(obj->set(segment, ValueBox{std::move(child.value)}));
    }

    return PointerResult::failure(PointerError::type_mismatch(segment, node.type()));
}

PointerResult remove_recursive(const Value& node, const Pointer& pointer, std::size_t depth)
{
    const auto& segment = pointer[depth];
    const bool last = depth + 1 == pointer.size();

    if (auto* arr = node.get_if<ValueArray>()) {
        std::size_t index = 0;
        if (auto err = parse_array_index(segment, arr->size(), index)) {
            return PointerResult::failure(std::move(*err));
        }
        if (index >= arr->size()) {
            return PointerResult::failure(PointerError::index_out_of_bounds(index));
        }
        if (last) {
            return PointerResult::success(arr->erase(index));
        }
        auto child = remove_recursive((*arr)[index].get(), pointer, depth + 1);
        if (!child) {
            return child;
        }
        return PointerResult::success(arr->set(index, ValueBox{std::move(child.value)}));
    }

    if (auto* obj = node.get_if<ValueMap>()) {
        auto* found = obj->find(segment);
        if (!found) {
            return PointerResult::failure(PointerError::field_not_found(segment));
        }
        if (last) {
            return PointerResult::success(obj->erase(segment));
        }
        auto child = remove_recursive(found->get(), pointer, depth + 1);
        if (!child) {
            return child;
        }
        return PointerResult::success(obj->set(segment, ValueBox{std::move(child.value)}));
    }

    return PointerResult::failure(PointerError::type_mismatch(segment, node.type()));
}

} // anonymous namespace

PointerResult get_at(const Pointer& pointer, const Value& value)
{
    Value current = value;
    for (const auto& segment : pointer) {
        auto step = child_at(current, segment);
        if (!step) [[unlikely]] {
            return step;
        }
        current = std::move(step.value);
    }
    return PointerResult::success(std::move(current));
}

PointerResult add_at(const Pointer& pointer, Value new_value, const Value& root)
{
    if (pointer.empty()) {
        return PointerResult::success(std::move(new_value));
    }
    return add_recursive(root, pointer, 0, std::move(new_value));
}

PointerResult remove_at(const Pointer& pointer, const Value& root)
{
    if (pointer.empty()) {
        return PointerResult::success(Value{});
    }
    return remove_recursive(root, pointer, 0);
}

bool exists_at(const Pointer& pointer, const Value& value)
{
    return get_at(pointer, value).ok();
}

} // namespace json_delta
