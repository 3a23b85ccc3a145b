//
// Big-endian helpers for the PNG wire format.
//

#pragma once

#include <cstdint>
#include <cstring>

#include <pngmsg/pngmsg_config.h>

namespace pngmsg {
    // Platform endianness detection using CMake-generated config
#if PNGMSG_BIG_ENDIAN
    constexpr bool is_big_endian = true;
    constexpr bool is_little_endian = false;
#else
    constexpr bool is_big_endian = false;
    constexpr bool is_little_endian = true;
#endif

    inline std::uint32_t swap32(std::uint32_t x) {
        return ((x << 24) | ((x << 8) & 0x00FF0000) |
                ((x >> 8) & 0x0000FF00) | (x >> 24));
    }

    // Host <-> big-endian (network / PNG) order
    inline std::uint32_t swap32be(std::uint32_t x) {
        return is_big_endian ? x : swap32(x);
    }

    // Read a big-endian u32 from unaligned memory
    inline std::uint32_t load_be32(const void* src) {
        std::uint32_t value;
        std::memcpy(&value, src, sizeof(value));
        return swap32be(value);
    }

    // Write a u32 as big-endian to unaligned memory
    inline void store_be32(std::uint32_t value, void* dest) {
        value = swap32be(value);
        std::memcpy(dest, &value, sizeof(value));
    }
}
