// Tag_Predicates.hpp
//
// Predicates over the tag set of an item to be passed to Tagged_Stack::stream,
// and the adaptor turning a tag set predicate into an item predicate
// for pop/peek/find_first/find_all/remove_all.
//
//   stack.stream(all_tags(Tag{"scope"}, Tag{"user"}));
//   stack.pop(on_tags(any_tag(Tag{"a"}, Tag{"b"})));

#ifndef TAG_PREDICATES_HPP
#define TAG_PREDICATES_HPP

#include <algorithm>
#include <array>
#include <concepts>
#include <functional>
#include <unordered_set>
#include <utility>
#include "Tag.hpp"

namespace TS_Concurrency {
    // the tag set contains the tag
    template <typename Tag_Type>
    auto has_tag(Tag_Type tag) {
        return [tag = std::move(tag)](const std::unordered_set<Tag_Type>& tags) {
            return tags.contains(tag);
        };
    }

    // the tag set contains all of the tags
    template <typename Tag_Type, typename... Tags>
    requires (std::same_as<Tag_Type, Tags> && ...)
    auto all_tags(Tag_Type tag, Tags... tags) {
        return [required = std::array<Tag_Type, sizeof...(Tags) + 1>{ std::move(tag), std::move(tags)... }](
            const std::unordered_set<Tag_Type>& tag_set)
        {
            return std::all_of(
                required.cbegin(),
                required.cend(),
                [&tag_set](const Tag_Type& t) { return tag_set.contains(t); });
        };
    }

    // the tag set contains at least one of the tags
    template <typename Tag_Type, typename... Tags>
    requires (std::same_as<Tag_Type, Tags> && ...)
    auto any_tag(Tag_Type tag, Tags... tags) {
        return [candidates = std::array<Tag_Type, sizeof...(Tags) + 1>{ std::move(tag), std::move(tags)... }](
            const std::unordered_set<Tag_Type>& tag_set)
        {
            return std::any_of(
                candidates.cbegin(),
                candidates.cend(),
                [&tag_set](const Tag_Type& t) { return tag_set.contains(t); });
        };
    }

    // the tag set contains none of the tags
    template <typename Tag_Type, typename... Tags>
    requires (std::same_as<Tag_Type, Tags> && ...)
    auto no_tags(Tag_Type tag, Tags... tags) {
        return [any = any_tag(std::move(tag), std::move(tags)...)](const std::unordered_set<Tag_Type>& tag_set) {
            return !any(tag_set);
        };
    }

    // adapts a tag set predicate to an item predicate
    template <typename Tag_Set_Predicate>
    auto on_tags(Tag_Set_Predicate predicate) {
        return [predicate = std::move(predicate)](const auto& item) {
            return std::invoke(predicate, item.tags());
        };
    }
} // namespace TS_Concurrency

#endif // TAG_PREDICATES_HPP
