// diff.cpp - Structural diff and array diff strategies

#include <json_delta/diff.h>
#include <json_delta/equality.h>
#include <json_delta/serialization.h>

#include <algorithm>
#include <string>
#include <vector>

namespace json_delta {

namespace {

/// Append sub (relative to a child) to out, rooted at segment
void append_prefixed(Patch& out, Patch sub, const std::string& segment)
{
    for (auto& op : sub) {
        std::visit([&segment](auto& o) {
            using T = std::decay_t<decltype(o)>;
            if constexpr (std::is_same_v<T, MoveOp> || std::is_same_v<T, CopyOp>) {
                o.from = o.from.prefixed(segment);
            }
            o.path = o.path.prefixed(segment);
        }, op);
        out.push_back(std::move(op));
    }
}

std::vector<std::string> sorted_key_union(const ValueMap& a, const ValueMap& b)
{
    std::vector<std::string> keys;
    keys.reserve(a.size() + b.size());
    for (const auto& [k, v] : a) keys.push_back(k);
    for (const auto& [k, v] : b) keys.push_back(k);
    std::sort(keys.begin(), keys.end());
    keys.erase(std::unique(keys.begin(), keys.end()), keys.end());
    return keys;
}

Patch diff_objects(const ArrayDiffStrategy& strategy, const ValueMap& new_map, const ValueMap& old_map)
{
    Patch patch;
    for (const auto& key : sorted_key_union(new_map, old_map)) {
        auto* new_box = new_map.find(key);
        auto* old_box = old_map.find(key);

        if (!old_box) {
            patch.push_back(AddOp{Pointer{key}, new_box->get()});
        } else if (!new_box) {
            patch.push_back(RemoveOp{Pointer{key}});
        } else if (&new_box->get() != &old_box->get()) {
            append_prefixed(patch, diff(strategy, new_box->get(), old_box->get()), key);
        }
    }
    return patch;
}

} // anonymous namespace

// ============================================================
// IndexArrayDiff
// ============================================================

Patch IndexArrayDiff::diff(const ValueArray& new_array, const ValueArray& old_array) const
{
    const std::size_t new_size = new_array.size();
    const std::size_t old_size = old_array.size();
    const std::size_t common_size = std::min(new_size, old_size);

    Patch patch;
    for (std::size_t i = 0; i < common_size; ++i) {
        // Shared box, unchanged
        if (&new_array[i].get() == &old_array[i].get()) [[likely]] {
            continue;
        }
        append_prefixed(patch, json_delta::diff(*this, new_array[i].get(), old_array[i].get()),
                        std::to_string(i));
    }

    // Remove from the back so earlier indices stay valid
    for (std::size_t i = old_size; i > common_size; --i) {
        patch.push_back(RemoveOp{Pointer{std::to_string(i - 1)}});
    }

    for (std::size_t i = common_size; i < new_size; ++i) {
        patch.push_back(AddOp{Pointer{"-"}, new_array[i].get()});
    }
    return patch;
}

// ============================================================
// LcsArrayDiff
// ============================================================

Patch LcsArrayDiff::diff(const ValueArray& new_array, const ValueArray& old_array) const
{
    auto same = [&](std::size_t i, std::size_t j) {
        return &old_array[i].get() == &new_array[j].get() ||
               equals(old_array[i].get(), new_array[j].get());
    };

    // Shared head and tail never reach the table
    std::size_t head = 0;
    const std::size_t common = std::min(old_array.size(), new_array.size());
    while (head < common && same(head, head)) {
        ++head;
    }
    std::size_t tail = 0;
    while (tail < common - head &&
           same(old_array.size() - 1 - tail, new_array.size() - 1 - tail)) {
        ++tail;
    }

    const std::size_t n = old_array.size() - head - tail;
    const std::size_t m = new_array.size() - head - tail;
    auto old_at = [&](std::size_t i) -> const Value& { return old_array[head + i].get(); };
    auto new_at = [&](std::size_t j) -> const Value& { return new_array[head + j].get(); };

    // lcs[i][j] = LCS length of old[i..] and new[j..] within the middle slice
    std::vector<std::vector<std::size_t>> lcs(n + 1, std::vector<std::size_t>(m + 1, 0));
    for (std::size_t i = n; i-- > 0;) {
        for (std::size_t j = m; j-- > 0;) {
            if (equals(old_at(i), new_at(j))) {
                lcs[i][j] = lcs[i + 1][j + 1] + 1;
            } else {
                lcs[i][j] = std::max(lcs[i + 1][j], lcs[i][j + 1]);
            }
        }
    }

    Patch patch;
    std::size_t i = 0;       // next old element
    std::size_t j = 0;       // next new element
    std::size_t pos = head;  // index of old[i] in the partially patched array

    while (i < n || j < m) {
        if (i < n && j < m && equals(old_at(i), new_at(j))) {
            ++i;
            ++j;
            ++pos;
        } else if (i < n && j < m && lcs[i + 1][j + 1] == lcs[i][j]) {
            // Remove + insert at pos: rewrite the element in place
            append_prefixed(patch, json_delta::diff(*this, new_at(j), old_at(i)), std::to_string(pos));
            ++i;
            ++j;
            ++pos;
        } else if (i < n && (j == m || lcs[i + 1][j] >= lcs[i][j + 1])) {
            patch.push_back(RemoveOp{Pointer{std::to_string(pos)}});
            ++i;
        } else {
            patch.push_back(AddOp{Pointer{std::to_string(pos)}, new_at(j)});
            ++j;
            ++pos;
        }
    }
    return patch;
}

// ============================================================
// diff
// ============================================================

Patch diff(const ArrayDiffStrategy& strategy, const Value& new_value, const Value& old_value)
{
    if (&new_value.data == &old_value.data) {
        return {};
    }

    auto* new_arr = new_value.get_if<ValueArray>();
    auto* old_arr = old_value.get_if<ValueArray>();
    if (new_arr && old_arr) {
        return strategy.diff(*new_arr, *old_arr);
    }

    auto* new_map = new_value.get_if<ValueMap>();
    auto* old_map = old_value.get_if<ValueMap>();
    if (new_map && old_map) {
        return diff_objects(strategy, *new_map, *old_map);
    }

    if (equals(new_value, old_value)) {
        return {};
    }
    return Patch{ReplaceOp{Pointer{}, new_value}};
}

Patch diff_json(const ArrayDiffStrategy& strategy, std::string_view new_json, std::string_view old_json)
{
    std::string error;
    Value new_value = from_json(new_json, &error);
    if (!error.empty()) {
        detail::log_access_error("diff_json", "cannot parse new document: " + error);
        return {};
    }
    Value old_value = from_json(old_json, &error);
    if (!error.empty()) {
        detail::log_access_error("diff_json", "cannot parse old document: " + error);
        return {};
    }
    return diff(strategy, new_value, old_value);
}

} // namespace json_delta
