// Hazard_Ptr.hpp
//
// Description:
//   The hazard pointers allows safe destruction of the shared objects
//   during lock-free execution:
//     1. Assign a hazard ptr to the object ptr to prevent destruction of the object by another thread,
//     2. Validate that the object is still reachable from the shared structure,
//     3. Work on the object under the protection of the hazard ptr,
//     4. Remove the protection of the hazard ptr (i.e. clear the hazard ptr).
//   The thread which unlinks an object from the shared structure
//   adds the object ptr to the list of the objects to be reclaimed later.
//
//   The memory reclamation is performed on the deferred list of reclaimers
//   after the number of the reclaimers reaches a threshold value.
//
// Design:
//   Types:
//     Hazard_Ptr_Record:
//       Defines the hazard ptr with two atomic members (safe synchronized access):
//         _owner_thread: the thread owning the record
//         _ptr         : the ptr to be protected by the hazard ptr
//     Memory_Reclaimer:
//       Defines the memory reclamation logic with two members:
//         _ptr    : the ptr for which the pointee will be deleted
//         _deleter: the function which deletes the pointee
//     Hazard_Ptr_Owner:
//       RAII class for hazard ptrs associating a hazard ptr record:
//         _hazard_ptr_record
//       Provides the hazard ptr interface:
//         protect(void *ptr):
//           Publishes the associated hazard ptr record with the input "ptr"
//         clear():
//           Resets the protected ptr of the associated hazard ptr record
//
//       Defines the pool of the hazard ptr records which is shared by all threads:
//         a lock-free list of blocks with HAZARD_PTR_RECORD_COUNT records each.
//         The first block is static (HAZARD_PTR_BLOCKS).
//         A new block is appended when all records of the existing blocks are owned.
//         The blocks are never released.
//
//   A thread may own more than one hazard ptr record at a time.
//   For example, a traversal of a linked list protects
//   the previous, the current and the next nodes at the same time.
//   Hence, each Hazard_Ptr_Owner acquires its own record.
//
//   Each Hazard_Ptr_Owner<N> instantiation has its own pool of records
//   and its own thread_local list of memory reclaimers
//   so that a retired ptr is only checked against the records which may protect it.
//
// Semantics:
//   0. All hazard ptr records in HAZARD_PTR_BLOCKS are initialized with:
//        default constructed thread id and nullptr
//   1. The constructor acquires a hazard ptr record
//      whose owner thread is the default constructed thread id
//      by a CAS on the owner thread.
//      If all records are owned, appends a new block owning its first record
//      by a CAS on the _next of the last block.
//   2. protect publishes the ptr with sequential consistency
//      so that the validation load of the caller cannot be reordered before the publication.
//   3. Static reclaim_memory_later function
//      pushes a new memory reclaimer into the thread_local MEMORY_RECLAIMERS.
//   4. Static try_reclaim_memory function
//      compares the thread local MEMORY_RECLAIMERS with the records of the shared HAZARD_PTR_BLOCKS
//      and reclaims memory for each entry in MEMORY_RECLAIMERS
//      which is not involved in HAZARD_PTR_BLOCKS:
//        RECLAIMERS_WITH_NOT_PROTECTED_PTRS = MEMORY_RECLAIMERS - HAZARD_PTR_BLOCKS
//      This function is called by reclaim_memory_later
//      when the size of MEMORY_RECLAIMERS reaches the threshold value
//      which is set as the half of the total number of the records in the blocks.
//   5. When a thread exits, the reclaimers which are still protected
//      are handed over to a shared lock-free list of orphans (ORPHANS).
//      The next try_reclaim_memory call of any thread adopts the orphans.
//
// CAUTION:
//   The deleter of a Memory_Reclaimer must not depend on the lifetime of the container
//   which retired the ptr as the reclamation may happen after the container is destroyed.
//
// CAUTION:
//   HAZARD_PTR_RECORD_COUNT is the size of a block, not a limit.
//   Set it close to the number of the records in use at a time
//   (e.g. threads x 3 for the traversals of a linked list)
//   as each scan reads all records of all blocks.

#ifndef HAZARD_PTR_HPP
#define HAZARD_PTR_HPP

#include <cstddef>
#include <cstdint>
#include <atomic>
#include <thread>
#include <vector>
#include <unordered_set>
#include <algorithm>
#include <string>
#include <utility>
#include "diagnostics.hpp"

namespace TS_Concurrency {
    inline constexpr std::size_t HAZARD_PTR_RECORD_COUNT__DEFAULT = 128;

    // a record for the hazard ptrs
    struct Hazard_Ptr_Record {
        std::atomic<std::thread::id> _owner_thread{};
        std::atomic<void*> _ptr{ nullptr };
    };

    // deferred memory reclamation wrapper
    struct Memory_Reclaimer {
        void* _ptr{};
        void(*_deleter)(void*){};
    };

    // RAII class for the hazard ptrs
    template <std::size_t HAZARD_PTR_RECORD_COUNT = HAZARD_PTR_RECORD_COUNT__DEFAULT>
    class Hazard_Ptr_Owner {
        static_assert(HAZARD_PTR_RECORD_COUNT > 0, "at least one hazard ptr record is required");

        // a block of records in the lock-free list of the record pool
        struct Hazard_Ptr_Block {
            Hazard_Ptr_Record _records[HAZARD_PTR_RECORD_COUNT];
            std::atomic<Hazard_Ptr_Block*> _next{ nullptr };
        };

        // reclaimers left by the exited threads
        struct Orphan_Batch {
            std::vector<Memory_Reclaimer> _reclaimers;
            Orphan_Batch* _next{};
        };

        // list of Memory_Reclaimers:
        //   a thread_local container is used as,
        //   otherwise, it would require a synchronization (e.g. a lock-free list).
        //   The destructor runs at the thread exit.
        struct Memory_Reclaimer_List {
            std::vector<Memory_Reclaimer> _reclaimers;

            ~Memory_Reclaimer_List() {
                adopt_orphans(_reclaimers);
                if (_reclaimers.empty()) return;
                reclaim_unprotected(_reclaimers);
                if (_reclaimers.empty()) return;

                TS_LOG(
                    Enum_Log_Levels::Debug,
                    "thread exits with " + std::to_string(_reclaimers.size()) +
                    " protected reclaimers, handing them over");
                auto* batch = new Orphan_Batch{ std::move(_reclaimers), nullptr };
                batch->_next = ORPHANS.load(std::memory_order_relaxed);
                while (
                    !ORPHANS.compare_exchange_weak(
                        batch->_next,
                        batch,
                        std::memory_order_release,
                        std::memory_order_relaxed));
            }
        };

        // The list of the hazard ptrs are shared.
        static inline Hazard_Ptr_Block HAZARD_PTR_BLOCKS;
        static inline std::atomic<std::size_t> HAZARD_PTR_RECORD_TOTAL{ HAZARD_PTR_RECORD_COUNT };
        static inline std::atomic<Orphan_Batch*> ORPHANS{ nullptr };
        static inline thread_local Memory_Reclaimer_List MEMORY_RECLAIMERS;

        // The hazard ptr record is managed by the two member functions:
        //   protect and clear
        Hazard_Ptr_Record* _hazard_ptr_record;

        static std::size_t reclaim_threshold() noexcept {
            return std::max<std::size_t>(HAZARD_PTR_RECORD_TOTAL.load(std::memory_order_relaxed) / 2, 1);
        }

        // get an unowned hazard ptr record of a block
        static Hazard_Ptr_Record* try_acquire_hazard_ptr_record(
            Hazard_Ptr_Block& block,
            std::thread::id this_tid) noexcept
        {
            for (auto& hazard_ptr_record : block._records) {
                std::thread::id empty_tid{};
                if (
                    hazard_ptr_record._owner_thread.load(std::memory_order_relaxed) == empty_tid &&
                    hazard_ptr_record._owner_thread.compare_exchange_strong(
                        empty_tid,
                        this_tid,
                        std::memory_order_acq_rel,
                        std::memory_order_relaxed))
                    return &hazard_ptr_record;
            }
            return nullptr;
        }

        // get an unowned hazard ptr record, append a new block if all are owned
        static Hazard_Ptr_Record* acquire_hazard_ptr_record() {
            const auto this_tid = std::this_thread::get_id();
            Hazard_Ptr_Block* last_block{};
            for (
                Hazard_Ptr_Block* block = &HAZARD_PTR_BLOCKS;
                block;
                block = block->_next.load(std::memory_order_acquire))
            {
                if (auto* hazard_ptr_record = try_acquire_hazard_ptr_record(*block, this_tid))
                    return hazard_ptr_record;
                last_block = block;
            }

            auto* new_block = new Hazard_Ptr_Block{};
            new_block->_records[0]._owner_thread.store(this_tid, std::memory_order_relaxed);
            Hazard_Ptr_Block* expected{};
            while (
                !last_block->_next.compare_exchange_strong(
                    expected,
                    new_block,
                    std::memory_order_release,
                    std::memory_order_acquire))
            {
                last_block = expected;
                expected = nullptr;
            }
            const std::size_t total =
                HAZARD_PTR_RECORD_TOTAL.fetch_add(HAZARD_PTR_RECORD_COUNT, std::memory_order_relaxed) +
                HAZARD_PTR_RECORD_COUNT;
            TS_LOG(
                Enum_Log_Levels::Info,
                "all hazard ptr records are in use, the pool is extended to " +
                std::to_string(total) + " records");
            return &new_block->_records[0];
        }

        // a helper function for the special functions.
        // reset the hazard ptr record to the default.
        void reset() noexcept {
            if (!_hazard_ptr_record) return;
            _hazard_ptr_record->_ptr.store(nullptr, std::memory_order_release);
            _hazard_ptr_record->_owner_thread.store(std::thread::id{}, std::memory_order_release);
            _hazard_ptr_record = nullptr;
        }

        // get all pointers protected by the hazard ptrs
        static std::unordered_set<void*> get_ptrs_protected_by_hazard_ptrs() {
            std::thread::id empty_tid{};
            std::unordered_set<void*> ptrs_protected_by_hazard_ptrs;
            ptrs_protected_by_hazard_ptrs.reserve(HAZARD_PTR_RECORD_TOTAL.load(std::memory_order_relaxed));
            for (
                const Hazard_Ptr_Block* block = &HAZARD_PTR_BLOCKS;
                block;
                block = block->_next.load(std::memory_order_acquire))
            {
                for (auto& hazard_ptr_record : block->_records) {
                    if (hazard_ptr_record._owner_thread.load(std::memory_order_acquire) == empty_tid)
                        continue;
                    if (void* ptr = hazard_ptr_record._ptr.load(std::memory_order_seq_cst))
                        ptrs_protected_by_hazard_ptrs.insert(ptr);
                }
            }
            return ptrs_protected_by_hazard_ptrs;
        }

        // move the reclaimers of the exited threads into the input list
        static void adopt_orphans(std::vector<Memory_Reclaimer>& reclaimers) {
            if (!ORPHANS.load(std::memory_order_relaxed)) return;
            Orphan_Batch* batch = ORPHANS.exchange(nullptr, std::memory_order_acquire);
            while (batch) {
                reclaimers.insert(
                    reclaimers.end(),
                    batch->_reclaimers.cbegin(),
                    batch->_reclaimers.cend());
                Orphan_Batch* next = batch->_next;
                delete batch;
                batch = next;
            }
        }

        // reclaim the memory of the ptrs not protected by any hazard ptr.
        // the deleters may retire new ptrs (e.g. a destructor of a nested container)
        // hence the list is detached before running the deleters.
        static void reclaim_unprotected(std::vector<Memory_Reclaimer>& reclaimers) {
            std::atomic_thread_fence(std::memory_order_seq_cst);
            auto ptrs_protected_by_hazard_ptrs = get_ptrs_protected_by_hazard_ptrs();

            std::vector<Memory_Reclaimer> pending;
            pending.swap(reclaimers);
            for (auto& memory_reclaimer : pending) {
                if (ptrs_protected_by_hazard_ptrs.contains(memory_reclaimer._ptr))
                    reclaimers.push_back(memory_reclaimer);
                else
                    memory_reclaimer._deleter(memory_reclaimer._ptr);
            }
        }

    public:

        Hazard_Ptr_Owner() : _hazard_ptr_record(acquire_hazard_ptr_record()) {}
        Hazard_Ptr_Owner(Hazard_Ptr_Owner&& rhs) noexcept
            : _hazard_ptr_record(rhs._hazard_ptr_record)
        {
            rhs._hazard_ptr_record = nullptr;
        }
        Hazard_Ptr_Owner& operator=(Hazard_Ptr_Owner&& rhs) noexcept {
            if (this != &rhs) {
                reset();
                _hazard_ptr_record = rhs._hazard_ptr_record;
                rhs._hazard_ptr_record = nullptr;
            }
            return *this;
        }
        Hazard_Ptr_Owner(const Hazard_Ptr_Owner&) = delete;
        Hazard_Ptr_Owner& operator=(const Hazard_Ptr_Owner&) = delete;
        ~Hazard_Ptr_Owner() { reset(); }

        friend void swap(Hazard_Ptr_Owner& lhs, Hazard_Ptr_Owner& rhs) noexcept {
            std::swap(lhs._hazard_ptr_record, rhs._hazard_ptr_record);
        }

        // get the protected ptr
        void* get() const noexcept {
            return
                _hazard_ptr_record ?
                _hazard_ptr_record->_ptr.load(std::memory_order_acquire) :
                nullptr;
        }

        // protect a ptr with a hazard ptr.
        // the caller must validate the ptr after the call.
        void protect(void* ptr) const noexcept {
            _hazard_ptr_record->_ptr.store(ptr, std::memory_order_seq_cst);
        }

        // remove the hazard ptr protection from the ptr
        void clear() const noexcept {
            _hazard_ptr_record->_ptr.store(nullptr, std::memory_order_release);
        }

        // try to reclaim all memory blocks those are not protected by any hazard ptr
        static void try_reclaim_memory() {
            auto& reclaimers = MEMORY_RECLAIMERS._reclaimers;
            adopt_orphans(reclaimers);
            if (reclaimers.empty()) return;
            reclaim_unprotected(reclaimers);
        }

        // add the ptr into the deferred reclamation list
        static void reclaim_memory_later(void* ptr, void (*deleter)(void*)) {
            MEMORY_RECLAIMERS._reclaimers.push_back(Memory_Reclaimer{ ptr, deleter });
            if (MEMORY_RECLAIMERS._reclaimers.size() >= reclaim_threshold()) try_reclaim_memory();
        }

        // the number of the records in all blocks of the pool
        static std::size_t record_count() noexcept {
            return HAZARD_PTR_RECORD_TOTAL.load(std::memory_order_relaxed);
        }

        // the number of the ptrs retired by this thread and not reclaimed yet
        static std::size_t pending_reclaim_count() noexcept {
            return MEMORY_RECLAIMERS._reclaimers.size();
        }
    };
} // namespace TS_Concurrency

#endif // HAZARD_PTR_HPP
