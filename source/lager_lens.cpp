// Copyright (c) 2024 chenmou. All rights reserved.
// Licensed under the MIT License. See LICENSE file in the project root.

// lager_lens.cpp
// Path lenses over Value and checked path access

#include <render_diff/lager_lens.h>

#include <zug/compose.hpp>

namespace render_diff {

namespace {

LagerValueLens member_lens(std::string key)
{
    return lager::lenses::getset(
        [key](const Value& obj) -> Value {
            if (auto* found = obj.find(key)) {
                return *found;
            }
            return Value{};
        },
        [key](Value obj, Value value) -> Value {
            if (obj.find(key) == nullptr) {
                return obj;
            }
            return obj.set(key, std::move(value));
        });
}

LagerValueLens element_lens(std::size_t index)
{
    return lager::lenses::getset(
        [index](const Value& obj) -> Value {
            if (index < obj.size() && obj.get_if<ValueVector>()) {
                return obj.at(index);
            }
            return Value{};
        },
        [index](Value obj, Value value) -> Value {
            if (index < obj.size() && obj.get_if<ValueVector>()) {
                return obj.set(index, std::move(value));
            }
            return obj;
        });
}

/// One traversal step; @p out is only written on success
PathErrorCode step_into(const Value& container, const PathElement& elem, Value& out)
{
    if (container.is_null()) {
        return PathErrorCode::NullValue;
    }
    if (const auto* key = std::get_if<std::string>(&elem)) {
        if (!container.is_map()) {
            return PathErrorCode::TypeMismatch;
        }
        const auto* found = container.find(*key);
        if (found == nullptr) {
            return PathErrorCode::KeyNotFound;
        }
        out = *found;
        return PathErrorCode::Success;
    }

    const auto* vec = container.get_if<ValueVector>();
    if (vec == nullptr) {
        return PathErrorCode::TypeMismatch;
    }
    const auto index = std::get<std::size_t>(elem);
    if (index >= vec->size()) {
        return PathErrorCode::IndexOutOfRange;
    }
    out = (*vec)[index].get();
    return PathErrorCode::Success;
}

} // anonymous namespace

// zug::comp instead of operator|: ADL does not reliably find zug's operator|
// when both operands are lager::lens<> instances.
LagerValueLens value_path_lens(const Path& path)
{
    LagerValueLens lens = zug::identity;
    for (const auto& elem : path) {
        if (const auto* key = std::get_if<std::string>(&elem)) {
            lens = zug::comp(lens, member_lens(*key));
        } else {
            lens = zug::comp(lens, element_lens(std::get<std::size_t>(elem)));
        }
    }
    return lens;
}

std::string path_error_message(PathErrorCode code, const PathElement& elem, std::size_t index)
{
    std::string where;
    if (const auto* key = std::get_if<std::string>(&elem)) {
        where = "key \"" + *key + "\"";
    } else {
        where = "index " + std::to_string(std::get<std::size_t>(elem));
    }
    where += " at path position " + std::to_string(index);

    switch (code) {
        case PathErrorCode::Success:         return "ok";
        case PathErrorCode::KeyNotFound:     return "no member for " + where;
        case PathErrorCode::IndexOutOfRange: return "no element for " + where;
        case PathErrorCode::TypeMismatch:    return "not a container for " + where;
        case PathErrorCode::NullValue:       return "null container for " + where;
        case PathErrorCode::EmptyPath:       return "root cannot be addressed by " + where;
        case PathErrorCode::InvalidPointer:  return "invalid token " + where;
    }
    return "unknown error for " + where;
}

PathAccessResult get_at_path_safe(const Value& root, const Path& path)
{
    PathAccessResult result;
    Value current = root;

    for (std::size_t i = 0; i < path.size(); ++i) {
        Value next;
        auto code = step_into(current, path[i], next);
        if (code != PathErrorCode::Success) {
            result.error_code = code;
            result.error_message = path_error_message(code, path[i], i);
            result.failed_at_index = i;
            detail::log_access_error("get_at_path_safe", result.error_message);
            return result;
        }
        result.resolved_path.push_back(path[i]);
        current = std::move(next);
    }

    result.success = true;
    result.value = std::move(current);
    return result;
}

} // namespace render_diff
