// random_uuid.hpp
//
// Random (version 4, RFC 4122) UUID string: xxxxxxxx-xxxx-4xxx-yxxx-xxxxxxxxxxxx
// The generator is local to the call, there is no shared state.

#ifndef RANDOM_UUID_HPP
#define RANDOM_UUID_HPP

#include <cstdint>
#include <random>
#include <string>

namespace TS_Concurrency {
    inline std::string random_uuid() {
        std::random_device seed;
        std::mt19937_64 engine{ (static_cast<std::uint64_t>(seed()) << 32) ^ seed() };
        std::uint64_t high = engine();
        std::uint64_t low = engine();

        high = (high & ~std::uint64_t{ 0xF000 }) | std::uint64_t{ 0x4000 };                   // version 4
        low = (low & ~(std::uint64_t{ 0xC } << 60)) | (std::uint64_t{ 0x8 } << 60);           // variant 10xx

        static constexpr char DIGITS[] = "0123456789abcdef";
        std::string uuid;
        uuid.reserve(36);
        auto append = [&uuid](std::uint64_t bits, int nibbles) {
            for (int shift = (nibbles - 1) * 4; shift >= 0; shift -= 4)
                uuid.push_back(DIGITS[(bits >> shift) & 0xF]);
        };
        append(high >> 32, 8);
        uuid.push_back('-');
        append(high >> 16, 4);
        uuid.push_back('-');
        append(high, 4);
        uuid.push_back('-');
        append(low >> 48, 4);
        uuid.push_back('-');
        append(low, 12);
        return uuid;
    }
} // namespace TS_Concurrency

#endif // RANDOM_UUID_HPP
