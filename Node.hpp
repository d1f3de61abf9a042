// Node.hpp
//
// Node of the lock-free linked structures.
//
// The least significant bit of _next is the deletion mark:
//   a node with a marked _next is logically removed
//   and its _next is frozen (i.e. no CAS can succeed on a marked _next).
//
// _stamp is assigned by the push operation:
//   the stamp of a node is greater than the stamps of all nodes below it.

#ifndef NODE_HPP
#define NODE_HPP

#include <cstdint>
#include <atomic>
#include <utility>
#include <type_traits>

namespace TS_Concurrency {
    template <typename T>
    struct Node {
        T _data;
        std::uint64_t _stamp{};
        std::atomic<Node*> _next{ nullptr };

        explicit Node(T&& data) noexcept(std::is_nothrow_move_constructible_v<T>)
            : _data(std::move(data)) {};
        explicit Node(const T& data) : _data(data) {};
        ~Node() = default;

        Node(const Node&) = delete;
        Node& operator=(const Node&) = delete;
    };

    static_assert(alignof(Node<char>) >= 2, "the mark bit requires at least 2-byte aligned nodes");

    template <typename T>
    inline bool is_marked(Node<T>* ptr) noexcept {
        return (reinterpret_cast<std::uintptr_t>(ptr) & std::uintptr_t{1}) != 0;
    }

    template <typename T>
    inline Node<T>* marked(Node<T>* ptr) noexcept {
        return reinterpret_cast<Node<T>*>(reinterpret_cast<std::uintptr_t>(ptr) | std::uintptr_t{1});
    }

    template <typename T>
    inline Node<T>* unmarked(Node<T>* ptr) noexcept {
        return reinterpret_cast<Node<T>*>(reinterpret_cast<std::uintptr_t>(ptr) & ~std::uintptr_t{1});
    }
} // namespace TS_Concurrency

#endif // NODE_HPP
