/**
 * @file types.hh
 * @brief Platform-independent type definitions
 * @ingroup sdk_types
 */

// This is copyrighted software. More information is at the end of this file.
#ifndef AUDIOCONV_SDK_TYPES_HH
#define AUDIOCONV_SDK_TYPES_HH

#include <cstdint>
#include <cstddef>

namespace audioconv {

/**
 * @defgroup sdk_types Type Definitions
 * @ingroup sdk
 * @brief Core type definitions for audio processing
 *
 * audioconv uses specific type aliases for audio-related values so that
 * signatures document their purpose: `sample_rate_t` reads better than a
 * bare `uint32_t` in a resampler signature.
 *
 * @code
 * sample_rate_t rate = 44100;  // CD quality
 * channels_t channels = 2;     // Stereo
 * bit_depth_t bits = 24;       // Studio master
 * @endcode
 *
 * @{
 */

// Basic integer types
using int8 = int8_t;
using int16 = int16_t;
using int32 = int32_t;
using int64 = int64_t;
using uint8 = uint8_t;
using uint16 = uint16_t;
using uint32 = uint32_t;
using uint64 = uint64_t;

/**
 * @typedef sample_rate_t
 * @brief Type for audio sample rates
 *
 * Number of samples per second per channel (Hz). Common values are
 * 8000, 22050, 44100, 48000, 96000 and 192000.
 */
using sample_rate_t = uint32_t;

/**
 * @typedef channels_t
 * @brief Type for audio channel count
 *
 * The conversion pipeline accepts 1, 2, 4, 6 and 8 channels.
 */
using channels_t = uint8_t;

/**
 * @typedef bit_depth_t
 * @brief Type for the number of bits per quantized sample
 *
 * The conversion pipeline accepts 8, 16, 24 and 32.
 */
using bit_depth_t = uint8_t;

/** @} */ // end of sdk_types group

} // namespace audioconv

#endif // AUDIOCONV_SDK_TYPES_HH

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
