// Sequential_Container.hpp
//
// The capability set Tagged_Stack requires from its underlying container:
//   push_front: insert at the head (top of the stack)
//   pop_front : remove from the head, std::nullopt if empty
//   begin/end : forward traversal from the head
//   erase     : remove the element of an iterator and move the iterator to the next element.
//               returns false if the element was removed concurrently by another thread
//               (the iterator is moved to the next element in both cases).
//   size, empty, clear
//
// Satisfied by:
//   Sequential_Deque (no synchronization)
//   deque_LF_linked_hazard_MPMC (lock-free)

#ifndef SEQUENTIAL_CONTAINER_HPP
#define SEQUENTIAL_CONTAINER_HPP

#include <cstddef>
#include <concepts>
#include <optional>
#include <utility>

namespace TS_Concurrency {
    template <typename C>
    concept Sequential_Container =
        requires(C& container, const C& const_container, typename C::value_type data, typename C::iterator& it) {
            container.push_front(std::move(data));
            { container.pop_front() } -> std::same_as<std::optional<typename C::value_type>>;
            { container.begin() } -> std::same_as<typename C::iterator>;
            { container.begin() != container.end() } -> std::convertible_to<bool>;
            { container.erase(it) } -> std::same_as<bool>;
            { *it } -> std::convertible_to<const typename C::value_type&>;
            ++it;
            { const_container.begin() != const_container.end() } -> std::convertible_to<bool>;
            { *const_container.begin() } -> std::convertible_to<const typename C::value_type&>;
            { const_container.size() } -> std::convertible_to<std::size_t>;
            { const_container.empty() } -> std::convertible_to<bool>;
            container.clear();
        };
} // namespace TS_Concurrency

#endif // SEQUENTIAL_CONTAINER_HPP
