// Copyright (c) 2024 chenmou. All rights reserved.
// Licensed under the MIT License. See LICENSE file in the project root.

#include <render_diff/render_codec.h>
#include <render_diff/serialization.h>

#include <immer/map_transient.hpp>
#include <immer/vector_transient.hpp>

#include <type_traits>

namespace render_diff {

RenderDecodeError::RenderDecodeError(std::string pointer, const std::string& message)
    : std::runtime_error(message + " at \"" + pointer + "\"")
    , pointer_(std::move(pointer))
{}

namespace {

[[noreturn]] void fail(const Path& path, const std::string& message)
{
    throw RenderDecodeError(path_to_json_pointer(path), message);
}

std::string decode_string(const Value& value, const Path& path)
{
    if (auto* s = value.get_if<std::string>()) {
        return *s;
    }
    fail(path, "expected string, got " + std::string{value_type_name(value)});
}

template <typename Fn>
auto decode_array(const Value& value, const Path& path, Fn&& decode)
{
    using T = std::decay_t<std::invoke_result_t<Fn&, const Value&, const Path&>>;

    const auto* items = value.get_if<ValueVector>();
    if (!items) {
        fail(path, "expected array, got " + std::string{value_type_name(value)});
    }
    auto result = immer::vector<T>{}.transient();
    for (std::size_t i = 0; i < items->size(); ++i) {
        result.push_back(decode((*items)[i].get(), append_path(path, i)));
    }
    return result.persistent();
}

template <typename Fn>
auto decode_object_map(const Value& value, const Path& path, Fn&& decode)
{
    using T = std::decay_t<std::invoke_result_t<Fn&, const Value&, const Path&>>;

    const auto* entries = value.get_if<ValueMap>();
    if (!entries) {
        fail(path, "expected object, got " + std::string{value_type_name(value)});
    }
    auto result = immer::map<std::string, T>{}.transient();
    for (const auto& [key, box] : *entries) {
        result.set(key, decode(box.get(), append_path(path, key)));
    }
    return result.persistent();
}

/// Field access on one JSON object; null members count as absent
class ObjectReader {
public:
    ObjectReader(const Value& value, const Path& path)
        : value_(value)
        , path_(path)
    {
        if (!value.is_map()) {
            fail(path, "expected object, got " + std::string{value_type_name(value)});
        }
    }

    [[nodiscard]] Path child(const std::string& key) const { return append_path(path_, key); }

    [[nodiscard]] const Value* find(const std::string& key) const {
        const Value* found = value_.find(key);
        return (found && !found->is_null()) ? found : nullptr;
    }

    [[nodiscard]] const Value& require(const std::string& key) const {
        if (const Value* found = find(key)) {
            return *found;
        }
        fail(child(key), "missing required field \"" + key + "\"");
    }

    [[nodiscard]] std::string string(const std::string& key) const {
        return decode_string(require(key), child(key));
    }

    [[nodiscard]] std::optional<std::string> optional_string(const std::string& key) const {
        if (const Value* found = find(key)) {
            return decode_string(*found, child(key));
        }
        return std::nullopt;
    }

    [[nodiscard]] bool boolean(const std::string& key, bool fallback) const {
        const Value* found = find(key);
        if (!found) {
            return fallback;
        }
        if (auto* b = found->get_if<bool>()) {
            return *b;
        }
        fail(child(key), "expected boolean, got " + std::string{value_type_name(*found)});
    }

    [[nodiscard]] int64_t integer(const std::string& key) const {
        const Value& found = require(key);
        if (auto* i = found.get_if<int64_t>()) {
            return *i;
        }
        fail(child(key), "expected integer, got " + std::string{value_type_name(found)});
    }

    template <typename Fn>
    [[nodiscard]] auto array(const std::string& key, Fn&& decode) const {
        return decode_array(require(key), child(key), std::forward<Fn>(decode));
    }

    template <typename Fn>
    [[nodiscard]] auto optional_array(const std::string& key, Fn&& decode) const
        -> std::optional<decltype(decode_array(std::declval<const Value&>(), std::declval<const Path&>(), decode))>
    {
        if (const Value* found = find(key)) {
            return decode_array(*found, child(key), std::forward<Fn>(decode));
        }
        return std::nullopt;
    }

    template <typename Fn>
    [[nodiscard]] auto object(const std::string& key, Fn&& decode) const {
        return decode(require(key), child(key));
    }

    template <typename Fn>
    [[nodiscard]] auto optional_object(const std::string& key, Fn&& decode) const
        -> std::optional<std::decay_t<std::invoke_result_t<Fn&, const Value&, const Path&>>>
    {
        if (const Value* found = find(key)) {
            return decode(*found, child(key));
        }
        return std::nullopt;
    }

private:
    const Value& value_;
    const Path& path_;
};

// ============================================================
// Declarations
// ============================================================

DeclarationToken decode_declaration_token(const Value& value, const Path& path)
{
    ObjectReader reader{value, path};
    auto kind_name = reader.string("kind");
    auto kind = token_kind_from_name(kind_name);
    if (!kind) {
        fail(reader.child("kind"), "unknown token kind \"" + kind_name + "\"");
    }
    return DeclarationToken{
        reader.string("text"),
        *kind,
        reader.optional_string("identifier"),
        reader.optional_string("preciseIdentifier"),
    };
}

DeclarationRenderSection decode_declaration(const Value& value, const Path& path)
{
    ObjectReader reader{value, path};
    return DeclarationRenderSection{
        reader.array("tokens", decode_declaration_token),
        reader.find("platforms") ? reader.array("platforms", decode_string) : immer::vector<std::string>{},
        reader.optional_array("languages", decode_string),
    };
}

ParameterRenderSection decode_parameter(const Value& value, const Path& path)
{
    ObjectReader reader{value, path};
    return ParameterRenderSection{
        reader.string("name"),
        reader.array("content", decode_inline_content),
    };
}

// ============================================================
// References
// ============================================================

ImageVariant decode_image_variant(const Value& value, const Path& path)
{
    ObjectReader reader{value, path};
    return ImageVariant{
        reader.string("url"),
        reader.find("traits") ? reader.array("traits", decode_string) : immer::vector<std::string>{},
    };
}

// ============================================================
// Metadata
// ============================================================

Module decode_module(const Value& value, const Path& path)
{
    ObjectReader reader{value, path};
    return Module{
        reader.string("name"),
        reader.optional_array("relatedModules", decode_string),
    };
}

PlatformAvailability decode_platform(const Value& value, const Path& path)
{
    ObjectReader reader{value, path};
    return PlatformAvailability{
        reader.string("name"),
        reader.optional_string("introducedAt"),
        reader.boolean("deprecated", false),
        reader.boolean("beta", false),
    };
}

RenderTag decode_tag(const Value& value, const Path& path)
{
    ObjectReader reader{value, path};
    return RenderTag{reader.string("type"), reader.string("text")};
}

ArchiveVersion decode_archive_version(const Value& value, const Path& path)
{
    ObjectReader reader{value, path};
    return ArchiveVersion{reader.string("identifier"), reader.string("displayName")};
}

// ============================================================
// Node
// ============================================================

SemanticVersion decode_semantic_version(const Value& value, const Path& path)
{
    ObjectReader reader{value, path};
    return SemanticVersion{
        reader.integer("major"),
        reader.integer("minor"),
        reader.integer("patch"),
        reader.optional_string("prerelease"),
        reader.optional_string("buildMetadata"),
    };
}

TopicIdentifier decode_topic_identifier(const Value& value, const Path& path)
{
    constexpr std::string_view scheme = "doc://";

    ObjectReader reader{value, path};
    auto url = reader.string("url");
    if (url.compare(0, scheme.size(), scheme) != 0) {
        fail(reader.child("url"), "topic URL must use the doc:// scheme: \"" + url + "\"");
    }
    auto rest = std::string_view{url}.substr(scheme.size());
    auto slash = rest.find('/');
    if (slash == std::string_view::npos) {
        slash = rest.size();
    }
    if (slash == 0) {
        fail(reader.child("url"), "topic URL has no bundle identifier: \"" + url + "\"");
    }
    return TopicIdentifier{
        std::string{rest.substr(0, slash)},
        std::string{rest.substr(slash)},
        reader.string("interfaceLanguage"),
    };
}

RenderNodeKind decode_node_kind(const Value& value, const Path& path)
{
    auto name = decode_string(value, path);
    auto kind = render_node_kind_from_name(name);
    if (!kind) {
        fail(path, "unknown page kind \"" + name + "\"");
    }
    return *kind;
}

RenderReferenceMap decode_references(const Value& value, const Path& path)
{
    return decode_object_map(value, path, decode_render_reference);
}

// ============================================================
// Navigation index
// ============================================================

immer::box<RenderIndexNode> decode_boxed_index_node(const Value& value, const Path& path)
{
    return immer::box<RenderIndexNode>{decode_render_index_node(value, path)};
}

RenderIndexNodeList decode_index_node_list(const Value& value, const Path& path)
{
    return decode_array(value, path, decode_boxed_index_node);
}

RenderIndexChange decode_index_change(const Value& value, const Path& path)
{
    auto name = decode_string(value, path);
    auto change = render_index_change_from_name(name);
    if (!change) {
        fail(path, "unknown index change \"" + name + "\"");
    }
    return *change;
}

immer::map<std::string, RenderIndexChange> decode_version_changes(const Value& value, const Path& path)
{
    return decode_object_map(value, path, decode_index_change);
}

RenderIndexMetadata decode_index_metadata(const Value& value, const Path& path)
{
    ObjectReader reader{value, path};
    return RenderIndexMetadata{reader.object("version", decode_archive_version)};
}

} // anonymous namespace

// ============================================================
// Public decoders
// ============================================================

InlineContent decode_inline_content(const Value& value, const Path& path)
{
    ObjectReader reader{value, path};
    auto type = reader.string("type");

    if (type == "text") {
        return TextInline{reader.string("text")};
    }
    if (type == "codeVoice") {
        return CodeVoiceInline{reader.string("code")};
    }
    if (type == "reference") {
        return ReferenceInline{reader.string("identifier"), reader.boolean("isActive", true)};
    }
    return UnrecognizedKind{std::move(type), value};
}

AnyRenderSection decode_render_section(const Value& value, const Path& path)
{
    ObjectReader reader{value, path};
    auto kind = reader.string("kind");

    if (kind == "content") {
        return ContentRenderSection{
            reader.optional_string("heading"),
            reader.array("content", decode_inline_content),
        };
    }
    if (kind == "declarations") {
        return DeclarationsRenderSection{reader.array("declarations", decode_declaration)};
    }
    if (kind == "taskGroup") {
        return TaskGroupRenderSection{
            reader.optional_string("title"),
            reader.optional_array("abstract", decode_inline_content),
            reader.array("identifiers", decode_string),
            reader.boolean("generated", false),
        };
    }
    if (kind == "parameters") {
        return ParametersRenderSection{reader.array("parameters", decode_parameter)};
    }
    return UnrecognizedKind{std::move(kind), value};
}

AnyRenderReference decode_render_reference(const Value& value, const Path& path)
{
    ObjectReader reader{value, path};
    auto type = reader.string("type");

    if (type == "topic") {
        return TopicRenderReference{
            reader.string("identifier"),
            reader.string("title"),
            reader.string("url"),
            reader.string("kind"),
            reader.optional_string("role"),
            reader.find("abstract") ? reader.array("abstract", decode_inline_content) : InlineContentList{},
        };
    }
    if (type == "image") {
        return ImageRenderReference{
            reader.string("identifier"),
            reader.optional_string("alt"),
            reader.array("variants", decode_image_variant),
        };
    }
    if (type == "link") {
        return LinkRenderReference{
            reader.string("identifier"),
            reader.string("title"),
            reader.string("url"),
        };
    }
    if (type == "unresolvable") {
        return UnresolvedRenderReference{reader.string("identifier"), reader.string("title")};
    }
    return UnrecognizedKind{std::move(type), value};
}

RenderMetadata decode_render_metadata(const Value& value, const Path& path)
{
    ObjectReader reader{value, path};
    return RenderMetadata{
        reader.optional_string("title"),
        reader.optional_string("role"),
        reader.optional_string("roleHeading"),
        reader.optional_string("symbolKind"),
        reader.optional_string("externalID"),
        reader.optional_array("modules", decode_module),
        reader.optional_array("fragments", decode_declaration_token),
        reader.optional_array("navigatorTitle", decode_declaration_token),
        reader.optional_array("platforms", decode_platform),
        reader.optional_array("tags", decode_tag),
        reader.optional_object("version", decode_archive_version),
        reader.boolean("required", false),
    };
}

RenderNode decode_render_node(const Value& value)
{
    const Path root;
    ObjectReader reader{value, root};

    auto sections = [&reader](const std::string& key) {
        return reader.find(key) ? reader.array(key, decode_render_section) : RenderSectionList{};
    };

    return RenderNode{
        reader.object("schemaVersion", decode_semantic_version),
        reader.object("identifier", decode_topic_identifier),
        reader.object("kind", decode_node_kind),
        reader.optional_array("abstract", decode_inline_content),
        reader.find("metadata") ? reader.object("metadata", decode_render_metadata) : RenderMetadata{},
        sections("primaryContentSections"),
        sections("topicSections"),
        sections("seeAlsoSections"),
        reader.find("references") ? reader.object("references", decode_references) : RenderReferenceMap{},
    };
}

std::optional<RenderNode> render_node_from_value(const Value& value, std::string* error_out)
{
    try {
        return decode_render_node(value);
    } catch (const RenderDecodeError& e) {
        detail::log_access_error("render_node_from_value", e.what());
        if (error_out) *error_out = e.what();
        return std::nullopt;
    }
}

std::optional<RenderNode> render_node_from_json(const std::string& json, std::string* error_out)
{
    std::string parse_error;
    Value parsed = from_json(json, &parse_error);
    if (!parse_error.empty()) {
        if (error_out) *error_out = std::move(parse_error);
        return std::nullopt;
    }
    return render_node_from_value(parsed, error_out);
}

std::string render_node_to_json(const RenderNode& node, bool compact)
{
    return to_json(to_value(node), compact);
}

RenderIndexNode decode_render_index_node(const Value& value, const Path& path)
{
    ObjectReader reader{value, path};
    return RenderIndexNode{
        reader.string("title"),
        reader.optional_string("path"),
        reader.optional_string("type"),
        reader.optional_object("children", decode_index_node_list),
        reader.boolean("deprecated", false),
        reader.boolean("external", false),
        reader.boolean("beta", false),
    };
}

RenderIndex decode_render_index(const Value& value)
{
    const Path root;
    ObjectReader reader{value, root};
    return RenderIndex{
        reader.object("schemaVersion", decode_semantic_version),
        reader.object("interfaceLanguages", [](const Value& languages, const Path& path) {
            return decode_object_map(languages, path, decode_index_node_list);
        }),
        reader.optional_object("metadata", decode_index_metadata),
        reader.optional_object("versionDifferences", [](const Value& differences, const Path& path) {
            return decode_object_map(differences, path, decode_version_changes);
        }),
    };
}

std::optional<RenderIndex> render_index_from_json(const std::string& json, std::string* error_out)
{
    std::string parse_error;
    Value parsed = from_json(json, &parse_error);
    if (!parse_error.empty()) {
        if (error_out) *error_out = std::move(parse_error);
        return std::nullopt;
    }
    try {
        return decode_render_index(parsed);
    } catch (const RenderDecodeError& e) {
        detail::log_access_error("render_index_from_json", e.what());
        if (error_out) *error_out = e.what();
        return std::nullopt;
    }
}

std::string render_index_to_json(const RenderIndex& index, bool compact)
{
    return to_json(to_value(index), compact);
}

} // namespace render_diff
