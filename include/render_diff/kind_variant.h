// Copyright (c) 2024 chenmou. All rights reserved.
// Licensed under the MIT License. See LICENSE file in the project root.

/// @file kind_variant.h
/// @brief Closed, kind-tagged union of model alternatives.
///
/// A KindVariant holds exactly one of its alternatives. Each alternative
/// reports its wire tag through `kind()`. Two variants are similar when
/// their tags match and the alternatives agree by their own `is_similar`,
/// where they define one; the diff then dispatches on both alternatives with
/// std::visit. A pairing that no alternative handles (an unrecognized
/// kind, or two alternatives sharing a tag) is reported as
/// DiffErrorCode::UnhandledKind and replaced.
///
/// @code
///   using InlineContent = KindVariant<TextInline, CodeVoiceInline, UnrecognizedKind>;
///
///   InlineContent item = TextInline{"Hello"};
///   if (auto* text = item.get_if<TextInline>()) { ... }
/// @endcode

#pragma once

#include <render_diff/diff_collector.h>
#include <render_diff/encode.h>
#include <render_diff/value_diff.h>

#include <concepts>
#include <string>
#include <string_view>
#include <type_traits>
#include <variant>

namespace render_diff {

/// Node whose tag the decoder does not know; keeps the raw encoding
struct UnrecognizedKind {
    std::string kind_tag;
    Value raw;

    [[nodiscard]] std::string_view kind() const noexcept { return kind_tag; }

    bool operator==(const UnrecognizedKind&) const = default;
};

[[nodiscard]] inline Value to_value(const UnrecognizedKind& unknown) { return unknown.raw; }

template <typename K>
concept KindTagged = requires(const K& k) {
    { k.kind() } -> std::convertible_to<std::string_view>;
};

template <KindTagged... Kinds>
class KindVariant {
public:
    using variant_type = std::variant<Kinds...>;

    template <typename K>
    requires (std::is_same_v<std::decay_t<K>, Kinds> || ...)
    KindVariant(K&& alternative)
        : data_(std::forward<K>(alternative))
    {}

    [[nodiscard]] std::string_view kind() const {
        return std::visit([](const auto& k) -> std::string_view { return k.kind(); }, data_);
    }

    /// Same tag, and for alternatives with their own rule, similar by that rule
    [[nodiscard]] bool is_similar(const KindVariant& other) const {
        if (kind() != other.kind()) {
            return false;
        }
        return std::visit([](const auto& mine, const auto& theirs) {
            using M = std::decay_t<decltype(mine)>;
            using T = std::decay_t<decltype(theirs)>;
            if constexpr (std::is_same_v<M, T> && HasSimilarity<M>) {
                return mine.is_similar(theirs);
            } else {
                return true;
            }
        }, data_, other.data_);
    }

    bool operator==(const KindVariant&) const = default;

    template <typename K>
    [[nodiscard]] const K* get_if() const { return std::get_if<K>(&data_); }

    template <typename K>
    [[nodiscard]] bool holds() const { return std::holds_alternative<K>(data_); }

    template <typename Visitor>
    decltype(auto) visit(Visitor&& visitor) const {
        return std::visit(std::forward<Visitor>(visitor), data_);
    }

    [[nodiscard]] const variant_type& data() const noexcept { return data_; }

    void difference_from(const KindVariant& previous, const Path& path, PatchCollector& out) const {
        std::visit([&](const auto& prev, const auto& cur) {
            using P = std::decay_t<decltype(prev)>;
            using C = std::decay_t<decltype(cur)>;

            if constexpr (std::is_same_v<P, C> && !std::is_same_v<C, UnrecognizedKind>) {
                diff_value(prev, cur, path, out);
            } else {
                if constexpr (std::is_same_v<P, C>) {
                    if (prev == cur) {
                        return;
                    }
                }
                out.report_unhandled_kind(prev.kind(), cur.kind(), path);
                out.replace(path, to_value(cur));
            }
        }, previous.data_, data_);
    }

private:
    variant_type data_;
};

template <typename... Kinds>
[[nodiscard]] Value to_value(const KindVariant<Kinds...>& variant)
{
    return variant.visit([](const auto& alternative) { return to_value(alternative); });
}

} // namespace render_diff
