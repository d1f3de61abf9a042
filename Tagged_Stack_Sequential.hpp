// Tagged_Stack_Sequential.hpp
//
// Tagged_Stack on a standard sequence (std::deque by default, std::list works too).
//
// CAUTION:
//   No synchronization, single thread use only.
//   Use Tagged_Stack_Concurrent for the concurrent access.

#ifndef TAGGED_STACK_SEQUENTIAL_HPP
#define TAGGED_STACK_SEQUENTIAL_HPP

#include <deque>
#include <memory>
#include <string>
#include <utility>
#include "random_uuid.hpp"
#include "Item.hpp"
#include "Tagged_Stack.hpp"
#include "Sequential_Deque.hpp"

namespace TS_Concurrency {
    template <
        typename T,
        typename Tag_Type = Tag,
        typename Base = std::deque<Item<T, Tag_Type>>>
    class Tagged_Stack_Sequential
        : public Tagged_Stack<T, Sequential_Deque<Item<T, Tag_Type>, Base>, Tag_Type>
    {
        using deque_type = Sequential_Deque<Item<T, Tag_Type>, Base>;
        using base_type = Tagged_Stack<T, deque_type, Tag_Type>;

    public:
        Tagged_Stack_Sequential() : Tagged_Stack_Sequential(random_uuid()) {};
        explicit Tagged_Stack_Sequential(std::string name)
            : base_type(std::move(name), std::make_unique<deque_type>()) {};
    };
} // namespace TS_Concurrency

#endif // TAGGED_STACK_SEQUENTIAL_HPP
