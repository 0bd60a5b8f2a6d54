// patch_codec.cpp - JSON encode/decode for Pointer and Patch

#include <json_delta/patch_codec.h>
#include <json_delta/builders.h>
#include <json_delta/serialization.h>

namespace json_delta {

namespace {

DecodeResult<Pointer> member_pointer(const ValueMap& obj, const std::string& field)
{
    auto* found = obj.find(field);
    if (!found) {
        return DecodeResult<Pointer>::failure("missing field '" + field + "'");
    }
    auto pointer = decode_pointer(found->get());
    if (!pointer) {
        return DecodeResult<Pointer>::failure("field '" + field + "': " + *pointer.error);
    }
    return pointer;
}

DecodeResult<Value> member_value(const ValueMap& obj, const std::string& field)
{
    auto* found = obj.find(field);
    if (!found) {
        return DecodeResult<Value>::failure("missing field '" + field + "'");
    }
    return DecodeResult<Value>::success(found->get());
}

/// Ops shaped {path, value}: add, replace, test
template <typename Op>
DecodeResult<Operation> decode_path_value(const ValueMap& obj)
{
    auto path = member_pointer(obj, "path");
    if (!path) return DecodeResult<Operation>::failure(std::move(*path.error));
    auto value = member_value(obj, "value");
    if (!value) return DecodeResult<Operation>::failure(std::move(*value.error));
    return DecodeResult<Operation>::success(Op{std::move(path.value), std::move(value.value)});
}

/// Ops shaped {from, path}: move, copy
template <typename Op>
DecodeResult<Operation> decode_from_path(const ValueMap& obj)
{
    auto from = member_pointer(obj, "from");
    if (!from) return DecodeResult<Operation>::failure(std::move(*from.error));
    auto path = member_pointer(obj, "path");
    if (!path) return DecodeResult<Operation>::failure(std::move(*path.error));
    return DecodeResult<Operation>::success(Op{std::move(from.value), std::move(path.value)});
}

} // anonymous namespace

// ============================================================
// Pointer
// ============================================================

Value encode_pointer(const Pointer& pointer)
{
    return Value{pointer.to_string()};
}

DecodeResult<Pointer> decode_pointer(const Value& value)
{
    auto* text = value.get_if<std::string>();
    if (!text) {
        detail::log_access_error("decode_pointer",
                                 std::string{"expected string, got "} + std::string{type_name(value.type())});
        return DecodeResult<Pointer>::failure("JSON pointer must be a string, got " +
                                              std::string{type_name(value.type())});
    }
    return parse_pointer(*text);
}

// ============================================================
// Operation
// ============================================================

Value encode_operation(const Operation& op)
{
    ObjectBuilder builder;
    builder.set("op", Value{std::string{operation_name(op)}});
    std::visit([&builder](const auto& o) {
        using T = std::decay_t<decltype(o)>;
        if constexpr (std::is_same_v<T, MoveOp> || std::is_same_v<T, CopyOp>) {
            builder.set("from", encode_pointer(o.from));
            builder.set("path", encode_pointer(o.path));
        } else if constexpr (std::is_same_v<T, RemoveOp>) {
            builder.set("path", encode_pointer(o.path));
        } else {
            builder.set("path", encode_pointer(o.path));
            builder.set("value", o.value);
        }
    }, op);
    return builder.finish();
}

DecodeResult<Operation> decode_operation(const Value& value)
{
    auto* obj = value.get_if<ValueMap>();
    if (!obj) {
        return DecodeResult<Operation>::failure("operation must be an object, got " +
                                                std::string{type_name(value.type())});
    }

    auto* op_field = obj->find("op");
    if (!op_field) {
        return DecodeResult<Operation>::failure("missing field 'op'");
    }
    auto* name = op_field->get().get_if<std::string>();
    if (!name) {
        return DecodeResult<Operation>::failure("field 'op' must be a string");
    }

    if (*name == "add")     return decode_path_value<AddOp>(*obj);
    if (*name == "replace") return decode_path_value<ReplaceOp>(*obj);
    if (*name == "test")    return decode_path_value<TestOp>(*obj);
    if (*name == "move")    return decode_from_path<MoveOp>(*obj);
    if (*name == "copy")    return decode_from_path<CopyOp>(*obj);
    if (*name == "remove") {
        auto path = member_pointer(*obj, "path");
        if (!path) return DecodeResult<Operation>::failure(std::move(*path.error));
        return DecodeResult<Operation>::success(RemoveOp{std::move(path.value)});
    }

    return DecodeResult<Operation>::failure("unknown operation '" + *name + "'");
}

// ============================================================
// Patch
// ============================================================

Value encode_patch(const Patch& patch)
{
    ArrayBuilder builder;
    for (const auto& op : patch) {
        builder.push_back(encode_operation(op));
    }
    return builder.finish();
}

DecodeResult<Patch> decode_patch(const Value& value)
{
    auto* arr = value.get_if<ValueArray>();
    if (!arr) {
        detail::log_access_error("decode_patch",
                                 std::string{"expected array, got "} + std::string{type_name(value.type())});
        return DecodeResult<Patch>::failure("patch must be an array, got " +
                                            std::string{type_name(value.type())});
    }

    Patch patch;
    patch.reserve(arr->size());
    for (std::size_t i = 0; i < arr->size(); ++i) {
        auto op = decode_operation((*arr)[i].get());
        if (!op) [[unlikely]] {
            auto message = "operation " + std::to_string(i) + ": " + *op.error;
            detail::log_access_error("decode_patch", message);
            return DecodeResult<Patch>::failure(std::move(message));
        }
        patch.push_back(std::move(op.value));
    }
    return DecodeResult<Patch>::success(std::move(patch));
}

DecodeResult<Patch> parse_patch(std::string_view json_text)
{
    std::string error;
    Value doc = from_json(json_text, &error);
    if (!error.empty()) {
        detail::log_access_error("parse_patch", "JSON parse error: " + error);
        return DecodeResult<Patch>::failure("invalid JSON: " + error);
    }
    return decode_patch(doc);
}

} // namespace json_delta
