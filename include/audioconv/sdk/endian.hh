// This is copyrighted software. More information is at the end of this file.
#ifndef AUDIOCONV_SDK_ENDIAN_HH
#define AUDIOCONV_SDK_ENDIAN_HH

#include <audioconv/sdk/types.hh>
#include <audioconv/sdk/audioconv_sdk_config.h>

namespace audioconv {

// Platform endianness detection using CMake-generated config
#if AUDIOCONV_BIG_ENDIAN
    constexpr bool is_big_endian = true;
    constexpr bool is_little_endian = false;
#else
    constexpr bool is_big_endian = false;
    constexpr bool is_little_endian = true;
#endif

// Byte swapping functions
inline uint16_t swap16(uint16_t x) {
    return static_cast<uint16_t>((x << 8) | (x >> 8));
}

inline uint32_t swap32(uint32_t x) {
    return ((x << 24) | ((x << 8) & 0x00FF0000) |
            ((x >> 8) & 0x0000FF00) | (x >> 24));
}

// Conditional byte swapping based on platform
inline uint16_t swap16le(uint16_t x) {
    return is_little_endian ? x : swap16(x);
}

inline uint32_t swap32le(uint32_t x) {
    return is_little_endian ? x : swap32(x);
}

/**
 * @brief Store a 16-bit value at @p dst in little-endian byte order
 *
 * Works on unaligned destinations, which RIFF sample data frequently is
 * (24-bit frames).
 */
inline void store_u16le(uint8* dst, uint16_t value) {
    dst[0] = static_cast<uint8>(value & 0xFF);
    dst[1] = static_cast<uint8>((value >> 8) & 0xFF);
}

inline void store_u24le(uint8* dst, uint32_t value) {
    dst[0] = static_cast<uint8>(value & 0xFF);
    dst[1] = static_cast<uint8>((value >> 8) & 0xFF);
    dst[2] = static_cast<uint8>((value >> 16) & 0xFF);
}

inline void store_u32le(uint8* dst, uint32_t value) {
    dst[0] = static_cast<uint8>(value & 0xFF);
    dst[1] = static_cast<uint8>((value >> 8) & 0xFF);
    dst[2] = static_cast<uint8>((value >> 16) & 0xFF);
    dst[3] = static_cast<uint8>((value >> 24) & 0xFF);
}

inline uint16_t load_u16le(const uint8* src) {
    return static_cast<uint16_t>(src[0] | (src[1] << 8));
}

inline uint32_t load_u24le(const uint8* src) {
    return static_cast<uint32_t>(src[0]) |
           (static_cast<uint32_t>(src[1]) << 8) |
           (static_cast<uint32_t>(src[2]) << 16);
}

inline uint32_t load_u32le(const uint8* src) {
    return static_cast<uint32_t>(src[0]) |
           (static_cast<uint32_t>(src[1]) << 8) |
           (static_cast<uint32_t>(src[2]) << 16) |
           (static_cast<uint32_t>(src[3]) << 24);
}

} // namespace audioconv

#endif // AUDIOCONV_SDK_ENDIAN_HH

/*
 * Copyright (C) 2025
 *
 * This file is part of audioconv.
 *
 * audioconv is free software: you can redistribute it and/or modify it under
 * the terms of the GNU Lesser General Public License as published by the Free
 * Software Foundation, either version 3 of the License, or (at your option) any
 * later version.
 *
 * audioconv is distributed in the hope that it will be useful, but WITHOUT ANY
 * WARRANTY; without even the implied warranty of MERCHANTABILITY or FITNESS FOR
 * A PARTICULAR PURPOSE.  See the GNU Lesser General Public License for more
 * details.
 *
 * You should have received a copy of the GNU Lesser General Public License
 * along with audioconv.  If not, see <http://www.gnu.org/licenses/>.
 */
