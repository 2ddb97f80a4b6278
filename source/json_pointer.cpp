// json_pointer.cpp
// Implementation of JSON Pointer (RFC 6901) rendering and parsing

#include <render_diff/json_pointer.h>

#include <algorithm>
#include <cctype>
#include <charconv>

namespace render_diff {

std::string escape_pointer_token(std::string_view token)
{
    std::string result;
    result.reserve(token.size());
    for (char c : token) {
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

std::optional<std::string> unescape_pointer_token(std::string_view token, std::string* error_out)
{
    std::string result;
    result.reserve(token.size());

    for (std::size_t i = 0; i < token.size(); ++i) {
        if (token[i] != '~') {
            result += token[i];
            continue;
        }
        if (i + 1 < token.size() && token[i + 1] == '1') {
            result += '/';
        } else if (i + 1 < token.size() && token[i + 1] == '0') {
            result += '~';
        } else {
            if (error_out) {
                *error_out = "Invalid escape '~' at offset " + std::to_string(i) +
                             " in token \"" + std::string{token} + "\"";
            }
            return std::nullopt;
        }
        ++i;
    }

    return result;
}

bool is_array_index_token(std::string_view token)
{
    if (token.empty()) {
        return false;
    }
    if (token.size() > 1 && token[0] == '0') {
        return false;
    }
    return std::all_of(token.begin(), token.end(),
                       [](unsigned char c) { return std::isdigit(c) != 0; });
}

PointerParseResult split_json_pointer(std::string_view pointer)
{
    PointerParseResult result;

    // Empty pointer refers to root
    if (pointer.empty()) {
        result.success = true;
        return result;
    }

    if (pointer[0] != '/') {
        result.error_message = "JSON Pointer must start with '/': \"" + std::string{pointer} + "\"";
        return result;
    }

    std::size_t start = 1;
    while (true) {
        auto pos = pointer.find('/', start);
        std::string_view segment = (pos == std::string_view::npos)
                                   ? pointer.substr(start)
                                   : pointer.substr(start, pos - start);

        auto unescaped = unescape_pointer_token(segment, &result.error_message);
        if (!unescaped) {
            result.tokens.clear();
            return result;
        }
        result.tokens.push_back(std::move(*unescaped));

        if (pos == std::string_view::npos) {
            break;
        }
        start = pos + 1;
    }

    result.success = true;
    return result;
}

std::string path_to_json_pointer(const Path& path)
{
    if (path.empty()) {
        return "";  // Root reference
    }

    std::string result;
    for (const auto& elem : path) {
        result += '/';
        std::visit([&](const auto& v) {
            using T = std::decay_t<decltype(v)>;
            if constexpr (std::is_same_v<T, std::string>) {
                result += escape_pointer_token(v);
            } else {
                result += std::to_string(v);
            }
        }, elem);
    }
    return result;
}

std::optional<Path> try_parse_json_pointer(std::string_view pointer, std::string* error_out)
{
    auto split = split_json_pointer(pointer);
    if (!split) {
        if (error_out) *error_out = split.error_message;
        return std::nullopt;
    }

    Path path;
    path.reserve(split.tokens.size());
    for (auto& token : split.tokens) {
        std::size_t index = 0;
        if (is_array_index_token(token)) {
            auto [ptr, ec] = std::from_chars(token.data(), token.data() + token.size(), index);
            if (ec == std::errc{}) {
                path.push_back(index);
                continue;
            }
            // Too large for an index: keep it as a key
        }
        path.push_back(std::move(token));
    }
    return path;
}

// ============================================================
// Pointer-addressed access
// ============================================================

Value get_by_pointer(const Value& data, std::string_view pointer)
{
    std::string error;
    auto path = try_parse_json_pointer(pointer, &error);
    if (!path) {
        detail::log_access_error("get_by_pointer", error);
        return Value{};
    }
    return lager::view(value_path_lens(*path), data);
}

Value set_by_pointer(const Value& data, std::string_view pointer, Value new_value)
{
    std::string error;
    auto path = try_parse_json_pointer(pointer, &error);
    if (!path) {
        detail::log_access_error("set_by_pointer", error);
        return data;
    }
    return lager::set(value_path_lens(*path), data, std::move(new_value));
}

} // namespace render_diff
