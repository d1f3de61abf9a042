// Tagged_Stack_Concurrent.hpp
//
// Description:
//   Thread safe Tagged_Stack on deque_LF_linked_hazard_MPMC.
//   No locks: push, pop and single item removals are lock-free and atomic
//   with respect to each other.
//   find_all, stream, remove_all and size are weakly consistent
//   (see Concurrent_Deque_LF_Linked_Hazard_MPMC.hpp).
//
//   The default constructor names the stack by a random UUID.
//
// Requirements:
// - T must be copy-constructible (see Concurrent_Deque_LF_Linked_Hazard_MPMC.hpp).
// - Hazard_Ptr_Record_Count is the block size of the hazard ptr record pool:
//   each operation holds up to three hazard ptr records during its execution,
//   the pool is extended by a block when all records are in use.

#ifndef TAGGED_STACK_CONCURRENT_HPP
#define TAGGED_STACK_CONCURRENT_HPP

#include <cstddef>
#include <memory>
#include <string>
#include <utility>
#include "diagnostics.hpp"
#include "random_uuid.hpp"
#include "Item.hpp"
#include "Tagged_Stack.hpp"
#include "Concurrent_Deque_LF_Linked_Hazard_MPMC.hpp"

namespace TS_Concurrency {
    template <
        typename T,
        typename Tag_Type = Tag,
        typename Allocator = std::allocator<Item<T, Tag_Type>>,
        std::size_t Hazard_Ptr_Record_Count = HAZARD_PTR_RECORD_COUNT__DEFAULT>
    class Tagged_Stack_Concurrent
        : public Tagged_Stack<
            T,
            deque_LF_linked_hazard_MPMC<Item<T, Tag_Type>, Allocator, Hazard_Ptr_Record_Count>,
            Tag_Type>
    {
        using deque_type = deque_LF_linked_hazard_MPMC<Item<T, Tag_Type>, Allocator, Hazard_Ptr_Record_Count>;
        using base_type = Tagged_Stack<T, deque_type, Tag_Type>;

        static std::string generate_name() {
            std::string name = random_uuid();
            TS_LOG(Enum_Log_Levels::Debug, "generated the name of a concurrent tagged stack: " + name);
            return name;
        }

    public:
        Tagged_Stack_Concurrent() : Tagged_Stack_Concurrent(generate_name()) {};
        explicit Tagged_Stack_Concurrent(std::string name)
            : base_type(std::move(name), std::make_unique<deque_type>()) {};
        Tagged_Stack_Concurrent(std::string name, const Allocator& allocator)
            : base_type(std::move(name), std::make_unique<deque_type>(allocator)) {};
    };
} // namespace TS_Concurrency

#endif // TAGGED_STACK_CONCURRENT_HPP
