// enum_deque_configurations.hpp
//
// The enumerations selecting a Concurrent_Deque specialization.
// See Concurrent_Deque.hpp for the primary template.

#ifndef ENUM_DEQUE_CONFIGURATIONS_HPP
#define ENUM_DEQUE_CONFIGURATIONS_HPP

#include <cstdint>

namespace TS_Concurrency {
    enum class Enum_Structure_Types : std::uint8_t { Linked };

    enum class Enum_Concurrency_Models : std::uint8_t { MPMC };

    enum class Enum_Memory_Reclaimers : std::uint8_t { Hazard_Ptr };
} // namespace TS_Concurrency

#endif // ENUM_DEQUE_CONFIGURATIONS_HPP
