// Copyright (c) 2024 chenmou. All rights reserved.
// Licensed under the MIT License. See LICENSE file in the project root.

#include <render_diff/patch.h>
#include <render_diff/builders.h>
#include <render_diff/serialization.h>

#include <charconv>
#include <iostream>

namespace render_diff {

std::string_view patch_op_name(PatchOperation::Type type)
{
    switch (type) {
        case PatchOperation::Type::Add:     return "add";
        case PatchOperation::Type::Remove:  return "remove";
        case PatchOperation::Type::Replace: return "replace";
    }
    return "unknown";
}

std::optional<PatchOperation::Type> patch_op_from_name(std::string_view name)
{
    if (name == "add") return PatchOperation::Type::Add;
    if (name == "remove") return PatchOperation::Type::Remove;
    if (name == "replace") return PatchOperation::Type::Replace;
    return std::nullopt;
}

// ============================================================
// Wire codec
// ============================================================

Value patch_to_value(const Patch& patch)
{
    VectorBuilder ops;
    for (const auto& op : patch) {
        MapBuilder entry;
        entry.set("op", Value{patch_op_name(op.type)})
             .set("path", op.pointer());
        if (op.type != PatchOperation::Type::Remove) {
            entry.set("value", op.value);
        }
        ops.push_back(entry.finish());
    }
    return ops.finish();
}

std::string patch_to_json(const Patch& patch, bool compact)
{
    return to_json(patch_to_value(patch), compact);
}

std::optional<Patch> patch_from_value(const Value& value, std::string* error_out)
{
    auto fail = [error_out](std::string message) -> std::optional<Patch> {
        if (error_out) *error_out = std::move(message);
        return std::nullopt;
    };

    const auto* ops = value.get_if<ValueVector>();
    if (!ops) {
        return fail("Patch must be an array, got " + std::string{value_type_name(value)});
    }

    Patch patch;
    patch.reserve(ops->size());
    for (std::size_t i = 0; i < ops->size(); ++i) {
        const Value& entry = (*ops)[i].get();
        const std::string where = "operation " + std::to_string(i);

        const Value* op_name = entry.find("op");
        if (!op_name || !op_name->is_string()) {
            return fail(where + ": missing \"op\"");
        }
        auto type = patch_op_from_name(op_name->as_string_view());
        if (!type) {
            return fail(where + ": unsupported op \"" + op_name->as_string() + "\"");
        }

        const Value* pointer = entry.find("path");
        if (!pointer || !pointer->is_string()) {
            return fail(where + ": missing \"path\"");
        }
        std::string pointer_error;
        auto path = try_parse_json_pointer(pointer->as_string_view(), &pointer_error);
        if (!path) {
            return fail(where + ": " + pointer_error);
        }

        if (*type == PatchOperation::Type::Remove) {
            patch.push_back(PatchOperation::remove(std::move(*path)));
            continue;
        }
        const Value* payload = entry.find("value");
        if (!payload) {
            return fail(where + ": missing \"value\"");
        }
        patch.push_back(PatchOperation{*type, std::move(*path), *payload});
    }
    return patch;
}

std::optional<Patch> patch_from_json(const std::string& json, std::string* error_out)
{
    std::string parse_error;
    Value parsed = from_json(json, &parse_error);
    if (!parse_error.empty()) {
        if (error_out) *error_out = std::move(parse_error);
        return std::nullopt;
    }
    return patch_from_value(parsed, error_out);
}

// ============================================================
// Patch application
// ============================================================

namespace {

struct ApplyFailure {
    PathErrorCode code;
    std::string message;
};

/// Where a path element lands once the addressed container is known
struct ResolvedElement {
    PathElement element;
    ApplyFailure failure{PathErrorCode::Success, {}};
    bool ok() const { return failure.code == PathErrorCode::Success; }
};

ResolvedElement resolve_element(const Value& container, const PathElement& elem,
                                std::size_t position, bool allow_append)
{
    if (container.is_map()) {
        if (auto* index = std::get_if<std::size_t>(&elem)) {
            return {std::to_string(*index)};
        }
        return {elem};
    }

    if (const auto* vec = container.get_if<ValueVector>()) {
        if (std::holds_alternative<std::size_t>(elem)) {
            return {elem};
        }
        const auto& token = std::get<std::string>(elem);
        if (token == "-" && allow_append) {
            return {vec->size()};
        }
        std::size_t index = 0;
        if (is_array_index_token(token)) {
            auto [ptr, ec] = std::from_chars(token.data(), token.data() + token.size(), index);
            if (ec == std::errc{}) {
                return {index};
            }
        }
        return {elem, {PathErrorCode::InvalidPointer,
                       path_error_message(PathErrorCode::InvalidPointer, elem, position)}};
    }

    auto code = container.is_null() ? PathErrorCode::NullValue : PathErrorCode::TypeMismatch;
    return {elem, {code, path_error_message(code, elem, position)}};
}

/// Walk @p parent_path, rewriting each element for the container it addresses
PathAccessResult resolve_parent(const Value& root, const Path& parent_path)
{
    PathAccessResult result;
    Value current = root;

    for (std::size_t i = 0; i < parent_path.size(); ++i) {
        auto resolved = resolve_element(current, parent_path[i], i, false);
        if (!resolved.ok()) {
            result.error_code = resolved.failure.code;
            result.error_message = std::move(resolved.failure.message);
            result.failed_at_index = i;
            return result;
        }

        auto step = get_at_path_safe(current, Path{resolved.element});
        if (!step) {
            result.error_code = step.error_code;
            result.error_message = path_error_message(step.error_code, resolved.element, i);
            result.failed_at_index = i;
            return result;
        }

        result.resolved_path.push_back(std::move(resolved.element));
        current = std::move(step.value);
    }

    result.success = true;
    result.value = std::move(current);
    return result;
}

/// Apply one operation to the container addressed by its last path element
std::optional<Value> apply_to_parent(const Value& parent, const PatchOperation& op,
                                     ApplyFailure& failure)
{
    const std::size_t position = op.path.size() - 1;
    const bool is_add = op.type == PatchOperation::Type::Add;
    auto resolved = resolve_element(parent, op.path.back(), position, is_add);
    if (!resolved.ok()) {
        failure = std::move(resolved.failure);
        return std::nullopt;
    }

    if (parent.is_map()) {
        const auto& key = std::get<std::string>(resolved.element);
        if (!is_add && !parent.contains(key)) {
            failure = {PathErrorCode::KeyNotFound,
                       path_error_message(PathErrorCode::KeyNotFound, resolved.element, position)};
            return std::nullopt;
        }
        switch (op.type) {
            case PatchOperation::Type::Add:
            case PatchOperation::Type::Replace:
                return parent.set(key, op.value);
            case PatchOperation::Type::Remove:
                return parent.erase(key);
        }
        return std::nullopt;
    }

    const auto index = std::get<std::size_t>(resolved.element);
    const auto size = parent.size();
    if (is_add ? index > size : index >= size) {
        failure = {PathErrorCode::IndexOutOfRange,
                   path_error_message(PathErrorCode::IndexOutOfRange, resolved.element, position)};
        return std::nullopt;
    }
    switch (op.type) {
        case PatchOperation::Type::Add:
            return parent.insert(index, op.value);
        case PatchOperation::Type::Replace:
            return parent.set(index, op.value);
        case PatchOperation::Type::Remove:
            return parent.erase(index);
    }
    return std::nullopt;
}

} // anonymous namespace

PatchApplyResult apply_patch(const Value& document, const Patch& patch)
{
    PatchApplyResult result;
    result.value = document;

    auto report = [&result](std::size_t index, const PatchOperation& op, ApplyFailure failure) {
        detail::log_access_error("apply_patch",
                                 std::string{patch_op_name(op.type)} + " " + op.pointer() + ": " + failure.message);
        result.errors.push_back(PatchApplyError{index, failure.code, op.pointer(), std::move(failure.message)});
    };

    for (std::size_t i = 0; i < patch.size(); ++i) {
        const auto& op = patch[i];

        if (op.path.empty()) {
            if (op.type == PatchOperation::Type::Remove) {
                report(i, op, {PathErrorCode::EmptyPath, "Cannot remove the document root"});
            } else {
                result.value = op.value;
            }
            continue;
        }

        Path parent_path(op.path.begin(), op.path.end() - 1);
        auto parent = resolve_parent(result.value, parent_path);
        if (!parent) {
            report(i, op, {parent.error_code, std::move(parent.error_message)});
            continue;
        }

        ApplyFailure failure{PathErrorCode::Success, {}};
        auto updated = apply_to_parent(parent.value, op, failure);
        if (!updated) {
            report(i, op, std::move(failure));
            continue;
        }

        result.value = lager::set(value_path_lens(parent.resolved_path), result.value, std::move(*updated));
    }

    return result;
}

void print_patch(const Patch& patch)
{
    if (patch.empty()) {
        std::cout << "  (no changes)\n";
        return;
    }
    for (const auto& op : patch) {
        std::string type_str;
        switch (op.type) {
            case PatchOperation::Type::Add:     type_str = "ADD    "; break;
            case PatchOperation::Type::Remove:  type_str = "REMOVE "; break;
            case PatchOperation::Type::Replace: type_str = "REPLACE"; break;
        }
        const auto pointer = op.pointer();
        std::cout << "  " << type_str << " " << (pointer.empty() ? "\"\"" : pointer);
        if (op.type != PatchOperation::Type::Remove) {
            std::cout << ": " << to_json(op.value, true);
        }
        std::cout << "\n";
    }
}

} // namespace render_diff
