// Sequential_Deque.hpp
//
// Description:
//   Adapts a standard sequence container with
//   push_front, pop_front and erase (e.g. std::deque, std::list)
//   to Sequential_Container.
//
// CAUTION:
//   No synchronization.
//   Concurrent access from multiple threads is undefined behavior,
//   use deque_LF_linked_hazard_MPMC for the concurrent access.

#ifndef SEQUENTIAL_DEQUE_HPP
#define SEQUENTIAL_DEQUE_HPP

#include <cstddef>
#include <deque>
#include <optional>
#include <utility>
#include <type_traits>

namespace TS_Concurrency {
    template <typename T, typename Base = std::deque<T>>
    requires std::is_same_v<typename Base::value_type, T>
    class Sequential_Deque {
        Base _base;

    public:
        using value_type = T;
        using base_type = Base;
        using iterator = typename Base::iterator;
        using const_iterator = typename Base::const_iterator;

        Sequential_Deque() = default;
        explicit Sequential_Deque(Base base) : _base(std::move(base)) {};

        template <typename U = T>
        void push_front(U&& data) {
            _base.push_front(std::forward<U>(data));
        }

        std::optional<T> pop_front() {
            if (_base.empty()) return std::nullopt;
            std::optional<T> data{ std::move(_base.front()) };
            _base.pop_front();
            return data;
        }

        iterator begin() noexcept { return _base.begin(); }
        iterator end() noexcept { return _base.end(); }
        const_iterator begin() const noexcept { return _base.cbegin(); }
        const_iterator end() const noexcept { return _base.cend(); }

        // always succeeds as there is no concurrent removal
        bool erase(iterator& it) {
            it = _base.erase(it);
            return true;
        }

        std::size_t size() const noexcept { return _base.size(); }
        bool empty() const noexcept { return _base.empty(); }
        void clear() noexcept { _base.clear(); }
    };
} // namespace TS_Concurrency

#endif // SEQUENTIAL_DEQUE_HPP
