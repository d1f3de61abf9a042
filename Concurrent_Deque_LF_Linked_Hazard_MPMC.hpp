// Concurrent_Deque_LF_Linked_Hazard_MPMC.hpp
//
// Description:
//   The solution for the lock-free/linked/MPMC deque problem with hazard pointers.
//   The deque supports:
//     push_front: insert at the head
//     pop_front : remove from the head
//     forward traversal from the head with the removal of any traversed node
//   which is the sequence required by Tagged_Stack (see Sequential_Container.hpp).
//
//   Removal of a node in the middle of the list requires more than the classical
//   Treiber stack: a concurrent push may link a new node to the node being removed.
//   The list follows the Harris-Michael design:
//     1. Logical removal: mark the _next of the node (the least significant bit).
//        A marked _next is frozen, no node can be linked after a removed node.
//     2. Physical removal: CAS the link of the predecessor from the node to the node's successor.
//        Any traversal which finds a marked node helps to unlink it.
//     3. The thread which unlinks the node retires it to the hazard pointers.
//
// Requirements:
// - T must be copy-constructible:
//   traversing threads may read the data of a node which is being removed,
//   hence the data is copied out of the node rather than moved.
// - Allocator must be always-equal:
//   a retired node may be reclaimed after the deque is destroyed.
//
// Semantics:
//   push_front():
//     Follows the classical algorithm for the push:
//       1. Creates a new node.
//       2. Protects the current head by a hazard ptr and reads its stamp.
//       3. Sets the stamp of the new node to one more than
//          the maximum of the stamp of the head and the greatest stamp assigned so far.
//       4. Sets the next pointer of the new node to the current head.
//       5. Apply CAS on the head: CAS(head, new_node)
//   pop_front():
//       1. Positions a cursor on the first node which is not marked.
//       2. Copies the data under the protection of the hazard ptr.
//       3. Marks the node. Restarts from the head if another thread marked it first.
//       4. Tries to unlink the node.
//       5. Returns the data.
//   Cursor:
//     Three hazard ptrs protect:
//       the owner of the link pointing to the current node (_hp_prev),
//       the current node (_hp_cur),
//       the successor of the current node (_hp_next).
//     A cursor remembers the stamp of the last visited node (_bound).
//     The stamps decrease strictly from the head to the tail.
//     When the cursor loses its position (e.g. its node is removed by another thread)
//     it restarts from the head and skips the nodes with a stamp not lower than _bound.
//     Hence, a traversal never visits the same node twice
//     and never skips a node which is present during the whole traversal.
//     The stamps also increase with the push order:
//     a node pushed after the last visited node was pushed is never visited.
//
// Progress:
//   Lock-free.
//   The traversal based operations (iteration, size, clear) are weakly consistent:
//   each step observes a consistent list but the whole traversal is not a snapshot.
//   A node pushed after the traversal started may or may not be visited.
//
// CAUTION:
//   Each live iterator holds three hazard ptr records of the calling thread.
//   The pool of the records grows on demand (see Hazard_Ptr.hpp),
//   Hazard_Ptr_Record_Count is the size of its blocks.
//   An iterator must not outlive the deque.
//
// CAUTION:
//   use deque_LF_linked_hazard_MPMC alias at the end of this file
//   to get the right specialization of Concurrent_Deque
//   and to achieve the default arguments consistently.

#ifndef CONCURRENT_DEQUE_LF_LINKED_HAZARD_MPMC_HPP
#define CONCURRENT_DEQUE_LF_LINKED_HAZARD_MPMC_HPP

#include <cstddef>
#include <cstdint>
#include <algorithm>
#include <atomic>
#include <iterator>
#include <limits>
#include <optional>
#include <utility>
#include <type_traits>
#include <memory>
#include "Node.hpp"
#include "Concurrent_Deque.hpp"
#include "Hazard_Ptr.hpp"

namespace TS_Concurrency {
    // use deque_LF_linked_hazard_MPMC alias at the end of this file
    // to get the right specialization of Concurrent_Deque
    // and to achieve the default arguments consistently.
    template <
        typename T,
        typename Allocator,
        std::size_t Hazard_Ptr_Record_Count>
    requires (
            std::is_copy_constructible_v<T> &&
            std::is_nothrow_destructible_v<T>)
    class Concurrent_Deque<
        true,
        Enum_Structure_Types::Linked,
        Enum_Concurrency_Models::MPMC,
        T,
        Allocator,
        std::integral_constant<std::uint8_t, static_cast<std::uint8_t>(Enum_Memory_Reclaimers::Hazard_Ptr)>,
        std::integral_constant<std::size_t, Hazard_Ptr_Record_Count>>
    {
        using node_type = Node<T>;
        using allocator_type = typename std::allocator_traits<Allocator>::template rebind_alloc<node_type>;
        using traits = std::allocator_traits<allocator_type>;
        static_assert(
            traits::is_always_equal::value && std::is_default_constructible_v<allocator_type>,
            "the deleter of the retired nodes constructs its own allocator");

        // local aliases
        using _HPO = Hazard_Ptr_Owner<Hazard_Ptr_Record_Count>;

        allocator_type _allocator;
        mutable std::atomic<node_type*> _head{ nullptr };
        std::atomic<std::uint64_t> _max_stamp{};

        // deleter to be supplied to Hazard_Ptr_Owner for deferred reclamation
        static void delete_node(void* ptr) {
            allocator_type allocator{};
            auto* node = static_cast<node_type*>(ptr);
            traits::destroy(allocator, node);
            traits::deallocate(allocator, node, 1);
        }

        template <typename U>
        node_type* create_node(U&& data) {
            node_type* node = traits::allocate(_allocator, 1);
            try {
                traits::construct(_allocator, node, std::forward<U>(data));
            } catch (...) {
                traits::deallocate(_allocator, node, 1);
                throw;
            }
            return node;
        }

        // the state of a traversal
        struct Cursor {
            _HPO _hp_prev;
            _HPO _hp_cur;
            _HPO _hp_next;
            std::atomic<node_type*>* _prev{};
            node_type* _cur{};
            std::uint64_t _bound{ std::numeric_limits<std::uint64_t>::max() };
        };

        // published before the node is linked:
        // a push starting after another push has completed gets a greater stamp
        void raise_max_stamp(std::uint64_t stamp) noexcept {
            std::uint64_t current = _max_stamp.load(std::memory_order_relaxed);
            while (
                current < stamp &&
                !_max_stamp.compare_exchange_weak(
                    current,
                    stamp,
                    std::memory_order_acq_rel,
                    std::memory_order_relaxed));
        }

        // a single attempt to move the cursor from its link (_prev)
        // to the first unmarked node with a stamp lower than _bound.
        // unlinks the marked nodes on the way.
        // returns false if the link of the cursor is not valid anymore.
        bool try_search(Cursor& cursor) const {
            node_type* cur = cursor._prev->load(std::memory_order_acquire);
            if (is_marked(cur)) return false; // the owner of the link is removed

            while (cur) {
                cursor._hp_cur.protect(cur);
                if (cursor._prev->load(std::memory_order_seq_cst) != cur) return false;

                node_type* next = cur->_next.load(std::memory_order_acquire);
                cursor._hp_next.protect(unmarked(next));
                if (cur->_next.load(std::memory_order_seq_cst) != next) return false;

                if (is_marked(next)) {
                    // cur is logically removed: help to unlink
                    node_type* expected = cur;
                    if (
                        !cursor._prev->compare_exchange_strong(
                            expected,
                            unmarked(next),
                            std::memory_order_acq_rel,
                            std::memory_order_acquire))
                        return false;
                    _HPO::reclaim_memory_later(static_cast<void*>(cur), &delete_node);
                    cur = unmarked(next);
                    swap(cursor._hp_cur, cursor._hp_next);
                    continue;
                }

                if (cur->_stamp < cursor._bound) {
                    cursor._cur = cur;
                    cursor._bound = cur->_stamp;
                    return true;
                }

                // visited before: step over
                cursor._prev = &cur->_next;
                swap(cursor._hp_prev, cursor._hp_cur);
                swap(cursor._hp_cur, cursor._hp_next);
                cur = next;
            }

            cursor._cur = nullptr;
            cursor._hp_cur.clear();
            cursor._hp_next.clear();
            return true;
        }

        void search(Cursor& cursor) const {
            while (!try_search(cursor)) {
                // lost the position: restart from the head, _bound keeps the progress
                cursor._prev = &_head;
                cursor._hp_prev.clear();
            }
        }

        // move the cursor below its current node
        void step(Cursor& cursor) const {
            cursor._prev = &cursor._cur->_next;
            swap(cursor._hp_prev, cursor._hp_cur);
            search(cursor);
        }

        // logical removal of the current node followed by an attempt to unlink it.
        // returns false if another thread has removed the node.
        bool remove_current(Cursor& cursor) {
            node_type* cur = cursor._cur;
            node_type* next = cur->_next.load(std::memory_order_acquire);
            do {
                if (is_marked(next)) return false;
            } while (
                !cur->_next.compare_exchange_weak(
                    next,
                    marked(next),
                    std::memory_order_acq_rel,
                    std::memory_order_acquire));

            // unlink, otherwise left to the next traversal passing by
            node_type* expected = cur;
            if (
                cursor._prev->compare_exchange_strong(
                    expected,
                    next,
                    std::memory_order_acq_rel,
                    std::memory_order_relaxed))
                _HPO::reclaim_memory_later(static_cast<void*>(cur), &delete_node);
            return true;
        }

    public:
        using value_type = T;

        // single pass iterator over the deque (top to bottom)
        class iterator {
            friend class Concurrent_Deque;

            const Concurrent_Deque* _deque{};
            std::unique_ptr<Cursor> _cursor;

            iterator(const Concurrent_Deque* deque, std::unique_ptr<Cursor> cursor)
                : _deque(deque), _cursor(std::move(cursor)) {};

        public:
            using value_type = T;
            using difference_type = std::ptrdiff_t;
            using iterator_concept = std::input_iterator_tag;

            iterator() = default;
            iterator(iterator&&) noexcept = default;
            iterator& operator=(iterator&&) noexcept = default;
            iterator(const iterator&) = delete;
            iterator& operator=(const iterator&) = delete;

            const T& operator*() const noexcept { return _cursor->_cur->_data; }
            const T* operator->() const noexcept { return &_cursor->_cur->_data; }

            iterator& operator++() {
                _deque->step(*_cursor);
                return *this;
            }
            void operator++(int) { ++*this; }

            friend bool operator==(const iterator& it, std::default_sentinel_t) noexcept {
                return !it._cursor || !it._cursor->_cur;
            }
        };
        using const_iterator = iterator;

        Concurrent_Deque() = default;
        explicit Concurrent_Deque(const Allocator& allocator) : _allocator(allocator) {};

        ~Concurrent_Deque() {
            // delete the nodes still linked (marked or not)
            node_type* node = _head.load(std::memory_order_acquire);
            while (node) {
                node_type* next = unmarked(node->_next.load(std::memory_order_relaxed));
                delete_node(static_cast<void*>(node));
                node = next;
            }

            // reclaim the nodes retired by this thread
            _HPO::try_reclaim_memory();
        }

        // Non-copyable/movable for simplicity.
        Concurrent_Deque(const Concurrent_Deque&) = delete;
        Concurrent_Deque& operator=(const Concurrent_Deque&) = delete;
        Concurrent_Deque(Concurrent_Deque&&) = delete;
        Concurrent_Deque& operator=(Concurrent_Deque&&) = delete;

        // push function with classic CAS loop
        // the head is protected only to read its stamp
        template <typename U = T>
        void push_front(U&& data) {
            _HPO hazard_ptr_owner;
            node_type* new_head = create_node(std::forward<U>(data));
            node_type* old_head = _head.load(std::memory_order_acquire);
            for (;;) {
                hazard_ptr_owner.protect(old_head);
                if (node_type* temp = _head.load(std::memory_order_seq_cst); temp != old_head) {
                    old_head = temp;
                    continue;
                }
                new_head->_stamp = std::max(
                    old_head ? old_head->_stamp : std::uint64_t{},
                    _max_stamp.load(std::memory_order_acquire)) + 1;
                raise_max_stamp(new_head->_stamp);
                new_head->_next.store(old_head, std::memory_order_relaxed);
                if (
                    _head.compare_exchange_weak(
                        old_head,
                        new_head,
                        std::memory_order_release,
                        std::memory_order_acquire))
                    break;
            }
        }

        // pop function:
        //   position on the first node which is not removed,
        //   copy the data, mark the node, unlink the node.
        std::optional<T> pop_front() {
            for (;;) {
                Cursor cursor;
                cursor._prev = &_head;
                search(cursor);
                if (!cursor._cur) return std::nullopt;

                std::optional<T> data{ cursor._cur->_data };
                if (remove_current(cursor)) return data;
            }
        }

        iterator begin() const {
            auto cursor = std::make_unique<Cursor>();
            cursor->_prev = &_head;
            search(*cursor);
            return iterator(this, std::move(cursor));
        }

        std::default_sentinel_t end() const noexcept { return {}; }

        // removes the node of the iterator and moves the iterator to the next node.
        // returns false if the node has already been removed by another thread.
        bool erase(iterator& it) {
            bool removed = remove_current(*it._cursor);
            search(*it._cursor);
            return removed;
        }

        // weakly consistent: O(n) traversal
        std::size_t size() const {
            std::size_t count{};
            for (auto it = begin(); it != end(); ++it) ++count;
            return count;
        }

        bool empty() const {
            return begin() == end();
        }

        // weakly consistent: the nodes pushed during the call may survive
        void clear() {
            for (auto it = begin(); it != end();) erase(it);
        }
    };

    template <
        typename T,
        typename Allocator = std::allocator<T>,
        std::size_t Hazard_Ptr_Record_Count = HAZARD_PTR_RECORD_COUNT__DEFAULT>
    using deque_LF_linked_hazard_MPMC = Concurrent_Deque<
        true,
        Enum_Structure_Types::Linked,
        Enum_Concurrency_Models::MPMC,
        T,
        Allocator,
        std::integral_constant<std::uint8_t, static_cast<std::uint8_t>(Enum_Memory_Reclaimers::Hazard_Ptr)>,
        std::integral_constant<std::size_t, Hazard_Ptr_Record_Count>>;
} // namespace TS_Concurrency

#endif // CONCURRENT_DEQUE_LF_LINKED_HAZARD_MPMC_HPP
