// Item.hpp
//
// Description:
//   The element of a Tagged_Stack: a value and a set of tags.
//   Immutable after the construction: only const accessors are provided.
//   Copy/move assignment replaces the whole item and is allowed
//   so that the items can be stored in the standard containers.
//
// Requirements:
// - The value must not be null
//   (raw/smart pointers, std::optional and alike are checked).
// - Tag_Type must be equality-comparable and std::hash-able.
//
// Equality: (value, tags) pairwise.
// Hash    : the hash of the value only, consistent with the equality.

#ifndef ITEM_HPP
#define ITEM_HPP

#include <cstddef>
#include <concepts>
#include <functional>
#include <ostream>
#include <ranges>
#include <stdexcept>
#include <type_traits>
#include <unordered_set>
#include <utility>
#include "Tag.hpp"

namespace TS_Concurrency {
    // null check for the nullable value types
    template <typename T>
    constexpr bool is_null_value(const T& value) noexcept {
        if constexpr (std::is_pointer_v<T> || std::is_null_pointer_v<T>) {
            return value == nullptr;
        } else if constexpr (requires { typename T::element_type; { value == nullptr } -> std::convertible_to<bool>; }) {
            return value == nullptr; // smart pointers
        } else if constexpr (requires { { value.has_value() } -> std::same_as<bool>; }) {
            return !value.has_value(); // std::optional
        } else {
            return false;
        }
    }

    template <typename T, typename Tag_Type = Tag>
    requires std::equality_comparable<Tag_Type>
    class Item {
    public:
        using value_type = T;
        using tag_type = Tag_Type;
        using tag_set_type = std::unordered_set<Tag_Type>;

    private:
        T _value;
        tag_set_type _tags;

    public:
        Item(T value, tag_set_type tags)
            : _value(std::move(value)), _tags(std::move(tags))
        {
            if (is_null_value(_value)) throw std::invalid_argument("the value of an item must not be null");
        }

        explicit Item(T value) : Item(std::move(value), tag_set_type{}) {};

        const T& value() const noexcept { return _value; }
        const tag_set_type& tags() const noexcept { return _tags; }

        bool has_tag(const Tag_Type& tag) const { return _tags.contains(tag); }

        std::size_t hash() const
        requires requires(const T& value) { std::hash<T>{}(value); }
        {
            return std::hash<T>{}(_value);
        }

        friend bool operator==(const Item& lhs, const Item& rhs)
        requires std::equality_comparable<T>
        {
            return &lhs == &rhs || (lhs._value == rhs._value && lhs._tags == rhs._tags);
        }

        friend std::ostream& operator<<(std::ostream& os, const Item& item)
        requires requires(std::ostream& out, const T& value, const Tag_Type& tag) { out << value; out << tag; }
        {
            os << "Item(" << item._value << ";[";
            bool first{ true };
            for (const auto& tag : item._tags) {
                if (!first) os << ", ";
                os << tag;
                first = false;
            }
            return os << "])";
        }
    };

    // builds an item for its value with tags provided one by one
    template <
        typename Tag_Type = Tag,
        typename T,
        typename... Tags>
    requires (std::constructible_from<Tag_Type, Tags&&> && ...)
    Item<std::decay_t<T>, Tag_Type> make_item(T&& value, Tags&&... tags) {
        return Item<std::decay_t<T>, Tag_Type>(
            std::forward<T>(value),
            typename Item<std::decay_t<T>, Tag_Type>::tag_set_type{ Tag_Type(std::forward<Tags>(tags))... });
    }

    // builds an item for its value with the union of the tag collections
    template <
        typename Tag_Type = Tag,
        typename T,
        typename... Tag_Ranges>
    requires (
        sizeof...(Tag_Ranges) > 0 &&
        ((std::ranges::input_range<Tag_Ranges> &&
          std::convertible_to<std::ranges::range_reference_t<Tag_Ranges>, const Tag_Type&>) && ...))
    Item<std::decay_t<T>, Tag_Type> make_item_of(T&& value, const Tag_Ranges&... tag_ranges) {
        typename Item<std::decay_t<T>, Tag_Type>::tag_set_type tags;
        (tags.insert(std::ranges::begin(tag_ranges), std::ranges::end(tag_ranges)), ...);
        return Item<std::decay_t<T>, Tag_Type>(std::forward<T>(value), std::move(tags));
    }
} // namespace TS_Concurrency

template <typename T, typename Tag_Type>
requires requires(const T& value) { std::hash<T>{}(value); }
struct std::hash<TS_Concurrency::Item<T, Tag_Type>> {
    std::size_t operator()(const TS_Concurrency::Item<T, Tag_Type>& item) const {
        return item.hash();
    }
};

#endif // ITEM_HPP
