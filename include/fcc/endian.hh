//
// Created by igor on 10/08/2025.
//

#pragma once

#include <cstdint>
#include <cstring>

#include <fcc/fcc_config.h>
#include <fcc/compiler.hh>

#if defined(LIBFCC_COMPILER_MSVC)
#include <stdlib.h>
#endif

namespace fcc {
    // Platform endianness detection using CMake-generated config
#if LIBFCC_BIG_ENDIAN
    constexpr bool is_big_endian = true;
    constexpr bool is_little_endian = false;
#else
    constexpr bool is_big_endian = false;
    constexpr bool is_little_endian = true;
#endif

    inline std::uint32_t swap32(std::uint32_t x) {
#if LIBFCC_HAS_BUILTIN_BSWAP
        return __builtin_bswap32(x);
#elif defined(LIBFCC_COMPILER_MSVC)
        return _byteswap_ulong(x);
#else
        return ((x << 24) | ((x << 8) & 0x00FF0000) |
                ((x >> 8) & 0x0000FF00) | (x >> 24));
#endif
    }

    // Converts between native and big-endian order (the operation is its own inverse)
    inline std::uint32_t swap32be(std::uint32_t x) {
        return is_big_endian ? x : swap32(x);
    }

    // Reads 4 bytes, most significant first
    inline std::uint32_t load_be32(const std::uint8_t* src) {
        std::uint32_t v;
        std::memcpy(&v, src, 4);
        return swap32be(v);
    }

    // Writes 4 bytes, most significant first
    inline void store_be32(std::uint32_t value, std::uint8_t* dst) {
        const std::uint32_t v = swap32be(value);
        std::memcpy(dst, &v, 4);
    }
}
