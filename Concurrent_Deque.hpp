// Primary template for Concurrent_Deque.
// Specialized by:
//   - structure type
//   - concurrency model
//   - some additional case dependent arguments
//     Ex: Enum_Structure_Types::Linked requires a memory reclaimer pattern
//         such as the hazard pointers
//
// A specialization satisfies Sequential_Container (see Sequential_Container.hpp):
//   insert at head, remove from head, forward traversal with removal.
#ifndef CONCURRENT_DEQUE_HPP
#define CONCURRENT_DEQUE_HPP

#include <type_traits>
#include "enum_deque_configurations.hpp"

namespace TS_Concurrency {
    template <
        bool Is_LF,
        Enum_Structure_Types Structure_Type,
        Enum_Concurrency_Models Concurrency_Model,
        typename T,
        typename... Args>
    class Concurrent_Deque {};
}

#endif // CONCURRENT_DEQUE_HPP
