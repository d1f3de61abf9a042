// Tagged_Stack.hpp
//
// Description:
//   A LIFO stack of items (a value with a set of tags)
//   queried, traversed and modified by predicates over the items.
//   The algorithm is independent of the underlying container,
//   any Sequential_Container of Item<T, Tag_Type> can be supplied:
//     Sequential_Deque                : single thread (see Tagged_Stack_Sequential)
//     deque_LF_linked_hazard_MPMC     : lock-free (see Tagged_Stack_Concurrent)
//
// Semantics:
//   The head of the container is the top of the stack.
//   All predicate based operations traverse from the top to the bottom
//   and the singular ones (pop, peek, find_first) stop at the first match:
//   the most recently pushed matching item wins.
//   pop(predicate) and remove_all(predicate) remove the matching items in place,
//   the relative order of the remaining items is preserved.
//
//   push(value, tags...)   : wraps the value into a new item at the top
//   push(item)             : puts an existing item at the top
//   pop()                  : removes the top item, std::nullopt if empty
//   pop(predicate)         : removes the first matching item, std::nullopt if none
//   peek(), peek(predicate): pop without the removal
//   find_first(predicate)  : same as peek(predicate)
//   find_all(predicate)    : lazy single pass range of the matching items
//   stream(tag_predicate)  : find_all with a predicate over the tag set of the items
//   remove_all(predicate)  : removes all matching items, returns the count
//   size, empty, clear, name
//
// CAUTION:
//   The consistency of the traversals depends on the container.
//   For the lock-free container, find_all/stream/remove_all/size are weakly consistent:
//   a concurrent push/pop may or may not be observed during the traversal.
//
// CAUTION:
//   A range returned by find_all/stream and its iterator refer to the stack
//   and must not outlive it.

#ifndef TAGGED_STACK_HPP
#define TAGGED_STACK_HPP

#include <cstddef>
#include <concepts>
#include <functional>
#include <iterator>
#include <memory>
#include <optional>
#include <stdexcept>
#include <string>
#include <utility>
#include <type_traits>
#include "Tag.hpp"
#include "Item.hpp"
#include "Sequential_Container.hpp"

namespace TS_Concurrency {
    // predicate matching every item
    struct Any_Item {
        template <typename Item_Type>
        constexpr bool operator()(const Item_Type&) const noexcept { return true; }
    };

    // lazy single pass range over the items of a container matching a predicate
    template <typename Container, typename Predicate>
    class Item_Range {
        using base_iterator = decltype(std::declval<const Container&>().begin());
        using base_sentinel = decltype(std::declval<const Container&>().end());

        const Container* _container;
        Predicate _predicate;
        bool _consumed{ false };

    public:
        class iterator {
            base_iterator _it;
            base_sentinel _end;
            Predicate _predicate;

            void skip_mismatches() {
                while (_it != _end && !std::invoke(std::as_const(_predicate), *_it)) ++_it;
            }

        public:
            using value_type = typename Container::value_type;
            using difference_type = std::ptrdiff_t;
            using iterator_concept = std::input_iterator_tag;

            iterator(base_iterator it, base_sentinel end, Predicate predicate)
                : _it(std::move(it)), _end(std::move(end)), _predicate(std::move(predicate))
            {
                skip_mismatches();
            }

            const value_type& operator*() const { return *_it; }
            const value_type* operator->() const { return &*_it; }

            iterator& operator++() {
                ++_it;
                skip_mismatches();
                return *this;
            }
            void operator++(int) { ++*this; }

            friend bool operator==(const iterator& it, std::default_sentinel_t) {
                return !(it._it != it._end);
            }
        };

        Item_Range(const Container& container, Predicate predicate)
            : _container(&container), _predicate(std::move(predicate)) {};

        // the traversal starts on the first call.
        // a range can be traversed once, call find_all/stream again to rescan.
        // the predicate is moved into the iterator: the iterator may outlive the range.
        iterator begin() {
            if (_consumed) throw std::logic_error("an item range can be traversed only once");
            _consumed = true;
            return iterator(_container->begin(), _container->end(), std::move(_predicate));
        }

        std::default_sentinel_t end() const noexcept { return {}; }
    };

    template <
        typename T,
        typename Container,
        typename Tag_Type = Tag>
    requires (
        Sequential_Container<Container> &&
        std::same_as<typename Container::value_type, Item<T, Tag_Type>>)
    class Tagged_Stack {
    public:
        using item_type = Item<T, Tag_Type>;
        using tag_set_type = typename item_type::tag_set_type;
        using container_type = Container;

    private:
        const std::string _name;
        std::unique_ptr<Container> _container;

    public:

        Tagged_Stack(std::string name, std::unique_ptr<Container> container)
            : _name(std::move(name)), _container(std::move(container))
        {
            if (!_container) throw std::invalid_argument("the container of a tagged stack must not be null");
        }

        // Non-copyable/movable for simplicity.
        Tagged_Stack(const Tagged_Stack&) = delete;
        Tagged_Stack& operator=(const Tagged_Stack&) = delete;
        Tagged_Stack(Tagged_Stack&&) = delete;
        Tagged_Stack& operator=(Tagged_Stack&&) = delete;

        const std::string& name() const noexcept { return _name; }

        template <typename... Tags>
        requires (std::constructible_from<Tag_Type, Tags&&> && ...)
        void push(T value, Tags&&... tags) {
            push(item_type(std::move(value), tag_set_type{ Tag_Type(std::forward<Tags>(tags))... }));
        }

        void push(T value, tag_set_type tags) {
            push(item_type(std::move(value), std::move(tags)));
        }

        void push(item_type item) {
            _container->push_front(std::move(item));
        }

        std::optional<item_type> pop() {
            return _container->pop_front();
        }

        // non-contiguous removal of the first matching item.
        // an item removed concurrently by another thread is skipped.
        template <typename Predicate>
        requires std::predicate<const Predicate&, const item_type&>
        std::optional<item_type> pop(const Predicate& predicate) {
            Container& container = *_container;
            for (auto it = container.begin(); it != container.end();) {
                if (!std::invoke(predicate, *it)) {
                    ++it;
                    continue;
                }
                item_type item{ *it };
                if (container.erase(it)) return item;
            }
            return std::nullopt;
        }

        std::optional<item_type> peek() const {
            return find_first(Any_Item{});
        }

        template <typename Predicate>
        requires std::predicate<const Predicate&, const item_type&>
        std::optional<item_type> peek(const Predicate& predicate) const {
            return find_first(predicate);
        }

        template <typename Predicate>
        requires std::predicate<const Predicate&, const item_type&>
        std::optional<item_type> find_first(const Predicate& predicate) const {
            const Container& container = *_container;
            for (auto it = container.begin(); it != container.end(); ++it)
                if (std::invoke(predicate, *it)) return item_type{ *it };
            return std::nullopt;
        }

        template <typename Predicate>
        requires std::predicate<const Predicate&, const item_type&>
        Item_Range<Container, Predicate> find_all(Predicate predicate) const {
            return Item_Range<Container, Predicate>(*_container, std::move(predicate));
        }

        // traversal of the items whose tag set satisfies the predicate
        template <typename Tag_Set_Predicate>
        requires std::predicate<const Tag_Set_Predicate&, const tag_set_type&>
        auto stream(Tag_Set_Predicate predicate) const {
            return find_all(
                [predicate = std::move(predicate)](const item_type& item) {
                    return std::invoke(predicate, item.tags());
                });
        }

        auto stream() const {
            return find_all(Any_Item{});
        }

        // removes all matching items, returns the number of the removed items
        template <typename Predicate>
        requires std::predicate<const Predicate&, const item_type&>
        std::size_t remove_all(const Predicate& predicate) {
            Container& container = *_container;
            std::size_t count{};
            for (auto it = container.begin(); it != container.end();) {
                if (!std::invoke(predicate, *it)) {
                    ++it;
                    continue;
                }
                if (container.erase(it)) ++count;
            }
            return count;
        }

        std::size_t size() const { return std::as_const(*_container).size(); }
        bool empty() const { return std::as_const(*_container).empty(); }
        void clear() { _container->clear(); }
    };
} // namespace TS_Concurrency

#endif // TAGGED_STACK_HPP
