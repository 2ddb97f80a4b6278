// Copyright (c) 2024 chenmou. All rights reserved.
// Licensed under the MIT License. See LICENSE file in the project root.

#include <render_diff/render_content.h>

namespace render_diff {

void ReferenceInline::difference_from(const ReferenceInline& previous, const Path& path, PatchCollector& out) const
{
    DifferenceBuilder{previous, *this, path, out}
        .add_difference(&ReferenceInline::identifier, "identifier")
        .add_difference(&ReferenceInline::is_active, "isActive");
}

Value to_value(const TextInline& item)
{
    return ObjectEncoder{}
        .field("type", "text")
        .field("text", item.text)
        .finish();
}

Value to_value(const CodeVoiceInline& item)
{
    return ObjectEncoder{}
        .field("type", "codeVoice")
        .field("code", item.code)
        .finish();
}

Value to_value(const ReferenceInline& item)
{
    return ObjectEncoder{}
        .field("type", "reference")
        .field("identifier", item.identifier)
        .field("isActive", item.is_active)
        .finish();
}

std::string plain_text(const InlineContentList& content)
{
    std::string result;
    for (const auto& item : content) {
        if (auto* text = item.get_if<TextInline>()) {
            result += text->text;
        } else if (auto* code = item.get_if<CodeVoiceInline>()) {
            result += code->code;
        }
    }
    return result;
}

} // namespace render_diff
