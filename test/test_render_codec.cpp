// test_render_codec.cpp - Tests for decoding render nodes from JSON

#include <catch2/catch_all.hpp>
#include <render_diff/render_codec.h>
#include <render_diff/serialization.h>

#include <string>

using namespace render_diff;

namespace {

// Written in the same shape the encoder produces, so decode + encode is the identity
const char* const sample_page_json = R"({
  "schemaVersion": {"major": 0, "minor": 3, "patch": 0},
  "identifier": {"url": "doc://kit/documentation/kit/widget", "interfaceLanguage": "swift"},
  "kind": "symbol",
  "abstract": [
    {"type": "text", "text": "A reusable "},
    {"type": "reference", "identifier": "doc://kit/documentation/kit/gadget", "isActive": true}
  ],
  "metadata": {
    "title": "Widget",
    "roleHeading": "Structure",
    "symbolKind": "struct",
    "externalID": "s:3Kit6WidgetV",
    "modules": [{"name": "Kit"}],
    "platforms": [{"name": "macOS", "introducedAt": "12.0", "deprecated": false, "beta": false}],
    "required": false
  },
  "primaryContentSections": [
    {"kind": "declarations", "declarations": [
      {"tokens": [
        {"text": "struct", "kind": "keyword"},
        {"text": " ", "kind": "text"},
        {"text": "Widget", "kind": "identifier"}
      ], "platforms": ["macOS"]}
    ]},
    {"kind": "parameters", "parameters": [
      {"name": "size", "content": [{"type": "codeVoice", "code": "CGSize"}]}
    ]},
    {"kind": "video", "src": "intro.mov", "poster": {"url": "intro.png"}}
  ],
  "topicSections": [
    {"kind": "taskGroup", "title": "Sizing", "identifiers": ["doc://kit/documentation/kit/widget/size"], "generated": true}
  ],
  "seeAlsoSections": [],
  "references": {
    "doc://kit/documentation/kit/gadget": {
      "type": "topic", "identifier": "doc://kit/documentation/kit/gadget", "title": "Gadget",
      "url": "/documentation/kit/gadget", "kind": "symbol", "abstract": []
    },
    "widget.png": {
      "type": "image", "identifier": "widget.png", "alt": "A widget",
      "variants": [{"url": "/images/widget@2x.png", "traits": ["2x", "light"]}]
    },
    "doc://kit/documentation/kit/missing": {
      "type": "unresolvable", "identifier": "doc://kit/documentation/kit/missing", "title": "Missing"
    },
    "https://example.com": {
      "type": "link", "identifier": "https://example.com", "title": "Example", "url": "https://example.com"
    }
  }
})";

RenderDecodeError decode_failure(const std::string& json) {
    try {
        (void)decode_render_node(from_json(json));
    } catch (const RenderDecodeError& e) {
        return e;
    }
    FAIL("expected a decode error for " << json);
    return RenderDecodeError{"", ""};
}

} // namespace

TEST_CASE("decode_render_node reads a full page", "[codec]") {
    std::string error;
    auto node = render_node_from_json(sample_page_json, &error);
    REQUIRE(node);
    REQUIRE(error.empty());

    SECTION("identity and metadata") {
        REQUIRE(node->identifier.bundle_identifier == "kit");
        REQUIRE(node->identifier.path == "/documentation/kit/widget");
        REQUIRE(node->identifier.url() == "doc://kit/documentation/kit/widget");
        REQUIRE(node->kind == RenderNodeKind::Symbol);
        REQUIRE(node->schema_version.minor == 3);
        REQUIRE(node->metadata.title == "Widget");
        REQUIRE(node->metadata.platforms->size() == 1);
        REQUIRE((*node->metadata.platforms)[0].introduced_at == "12.0");
        REQUIRE_FALSE(node->metadata.role);
    }

    SECTION("inline content") {
        REQUIRE(node->abstract->size() == 2);
        const auto* reference = (*node->abstract)[1].get_if<ReferenceInline>();
        REQUIRE(reference != nullptr);
        REQUIRE(reference->is_active);
        REQUIRE(plain_text(*node->abstract) == "A reusable ");
    }

    SECTION("sections") {
        REQUIRE(node->primary_content_sections.size() == 3);
        const auto* declarations = node->primary_content_sections[0].get_if<DeclarationsRenderSection>();
        REQUIRE(declarations != nullptr);
        REQUIRE(declarations->declarations[0].tokens[0].kind == TokenKind::Keyword);
        REQUIRE(node->primary_content_sections[1].holds<ParametersRenderSection>());
        REQUIRE(node->topic_sections[0].get_if<TaskGroupRenderSection>()->generated);
    }

    SECTION("unknown section kinds keep their raw value") {
        const auto* video = node->primary_content_sections[2].get_if<UnrecognizedKind>();
        REQUIRE(video != nullptr);
        REQUIRE(video->kind_tag == "video");
        REQUIRE(node->primary_content_sections[2].kind() == "video");
        REQUIRE(video->raw.at("poster").at("url").as_string() == "intro.png");
    }

    SECTION("references of every type") {
        REQUIRE(node->references.size() == 4);
        REQUIRE(node->references.at("widget.png").holds<ImageRenderReference>());
        REQUIRE(node->references.at("https://example.com").holds<LinkRenderReference>());
        REQUIRE(node->references.at("doc://kit/documentation/kit/missing").kind() == "unresolvable");
    }

    SECTION("encoding reproduces the document") {
        REQUIRE(to_value(*node) == from_json(sample_page_json));
        REQUIRE(render_node_from_json(render_node_to_json(*node)) == node);
    }
}

TEST_CASE("decoding fills defaults for absent members", "[codec]") {
    auto node = render_node_from_json(R"({
      "schemaVersion": {"major": 0, "minor": 3, "patch": 0},
      "identifier": {"url": "doc://kit", "interfaceLanguage": "occ"},
      "kind": "article",
      "abstract": null
    })");
    REQUIRE(node);
    REQUIRE(node->identifier.path.empty());
    REQUIRE_FALSE(node->abstract);
    REQUIRE(node->metadata == RenderMetadata{});
    REQUIRE(node->primary_content_sections.empty());
    REQUIRE(node->references.empty());

    auto reference = decode_inline_content(from_json(R"({"type": "reference", "identifier": "doc://kit/a"})"));
    REQUIRE(reference.get_if<ReferenceInline>()->is_active);
}

TEST_CASE("decode errors name the offending node", "[codec][error]") {
    SECTION("missing field") {
        auto error = decode_failure(R"({"schemaVersion": {"major": 0, "minor": 3, "patch": 0},
                                        "identifier": {"url": "doc://kit/a", "interfaceLanguage": "swift"}})");
        REQUIRE(error.pointer() == "/kind");
        REQUIRE(std::string{error.what()}.find("missing required field") != std::string::npos);
    }

    SECTION("wrong scheme") {
        auto error = decode_failure(R"({"schemaVersion": {"major": 0, "minor": 3, "patch": 0},
                                        "identifier": {"url": "https://kit/a", "interfaceLanguage": "swift"},
                                        "kind": "article"})");
        REQUIRE(error.pointer() == "/identifier/url");
    }

    SECTION("unknown token kind deep in a section") {
        auto error = decode_failure(R"({"schemaVersion": {"major": 0, "minor": 3, "patch": 0},
                                        "identifier": {"url": "doc://kit/a", "interfaceLanguage": "swift"},
                                        "kind": "symbol",
                                        "primaryContentSections": [
                                          {"kind": "declarations", "declarations": [
                                            {"tokens": [{"text": "x", "kind": "sparkle"}]}]}]})");
        REQUIRE(error.pointer() == "/primaryContentSections/0/declarations/0/tokens/0/kind");
    }

    SECTION("wrong value type") {
        auto error = decode_failure(R"({"schemaVersion": {"major": 0, "minor": "3", "patch": 0},
                                        "identifier": {"url": "doc://kit/a", "interfaceLanguage": "swift"},
                                        "kind": "article"})");
        REQUIRE(error.pointer() == "/schemaVersion/minor");
        REQUIRE(std::string{error.what()}.find("expected integer, got string") != std::string::npos);
    }

    SECTION("reference keys are escaped in the pointer") {
        REQUIRE_THROWS_AS(decode_render_reference(from_json(R"({"type": "link"})"), make_path("references", "a/b")),
                          RenderDecodeError);
        try {
            (void)decode_render_reference(from_json(R"({"type": "link"})"), make_path("references", "a/b"));
        } catch (const RenderDecodeError& e) {
            REQUIRE(e.pointer() == "/references/a~1b/identifier");
        }
    }

    SECTION("render_node_from_json reports instead of throwing") {
        std::string error;
        REQUIRE_FALSE(render_node_from_json("{not json", &error));
        REQUIRE_FALSE(error.empty());

        error.clear();
        REQUIRE_FALSE(render_node_from_json(R"({"kind": "article"})", &error));
        REQUIRE(error.find("/schemaVersion") != std::string::npos);
    }
}
