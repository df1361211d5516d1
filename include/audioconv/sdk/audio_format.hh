/**
 * @file audio_format.hh
 * @brief Container and sample format descriptions
 * @ingroup sdk_audio_format
 */

// This is copyrighted software. More information is at the end of this file.
#ifndef AUDIOCONV_SDK_AUDIO_FORMAT_HH
#define AUDIOCONV_SDK_AUDIO_FORMAT_HH

#include <audioconv/sdk/types.hh>
#include <audioconv/sdk/export_audioconv_sdk.h>
#include <iosfwd>
#include <optional>
#include <string>

namespace audioconv {

/**
 * @defgroup sdk_audio_format Audio Formats
 * @ingroup sdk
 * @brief Describes what an encoded buffer is
 * @{
 */

/**
 * @enum container_id
 * @brief Byte-level envelope of an encoded buffer
 *
 * Only containers with a registered codec can be converted. `unknown`
 * exists so that a lookup for an unrecognised name can fail cleanly.
 */
enum class container_id : uint8_t {
    unknown = 0,
    wav,     ///< RIFF/WAVE linear PCM (canonical container)
    flac,    ///< Free Lossless Audio Codec
    mp3      ///< MPEG-1 Layer III
};

/**
 * @enum quality_tier
 * @brief Coarse quality classification of a format
 */
enum class quality_tier : uint8_t {
    low,
    medium,
    high,
    lossless
};

/**
 * @struct audio_format
 * @brief Complete description of an encoded audio buffer
 *
 * A value type: once produced (by a decoder or by the caller) it is
 * never mutated.
 *
 * @code
 * audio_format cd{};
 * cd.container = container_id::wav;
 * cd.sample_rate = 44100;
 * cd.bit_depth = 16;
 * cd.channels = 2;
 * @endcode
 */
struct audio_format {
    container_id container = container_id::wav;  ///< Envelope format
    std::optional<std::string> codec;             ///< Codec name inside the container
    sample_rate_t sample_rate = 44100;            ///< Hz, must be positive
    bit_depth_t bit_depth = 16;                   ///< 8, 16, 24 or 32
    channels_t channels = 2;                      ///< 1, 2, 4, 6 or 8
    std::optional<uint32> bitrate;                ///< kbps, lossy formats only
    std::optional<quality_tier> quality;          ///< Declared quality tier
};

[[nodiscard]] inline constexpr bool is_valid_bit_depth(unsigned bits) {
    return bits == 8 || bits == 16 || bits == 24 || bits == 32;
}

[[nodiscard]] inline constexpr bool is_valid_channel_count(unsigned channels) {
    return channels == 1 || channels == 2 || channels == 4 || channels == 6 || channels == 8;
}

/**
 * @brief Number of bytes one sample of the given depth occupies
 */
[[nodiscard]] inline constexpr unsigned bytes_per_sample(bit_depth_t bits) {
    return static_cast<unsigned>(bits) / 8;
}

/**
 * @brief Lower-case container name ("wav", "flac", "mp3", "unknown")
 */
AUDIOCONV_SDK_EXPORT const char* container_name(container_id id);

/**
 * @brief Parse a container name, case-insensitive
 * @return container_id::unknown when the name is not recognised
 */
AUDIOCONV_SDK_EXPORT container_id container_from_name(const std::string& name);

AUDIOCONV_SDK_EXPORT const char* quality_tier_name(quality_tier tier);

/**
 * @brief Classify a format into a quality tier
 *
 * A declared lossless tier passes through. Otherwise a bitrate, when
 * present, decides (>= 256 kbps high, >= 128 kbps medium, else low);
 * without one the bit depth decides (>= 24 high, >= 16 medium, else low).
 */
AUDIOCONV_SDK_EXPORT quality_tier estimate_quality(const audio_format& format);

/**
 * @brief Check that rate, depth and channel count are all acceptable
 * @throws validation_error describing the first offending field
 */
AUDIOCONV_SDK_EXPORT void validate_format(const audio_format& format);

AUDIOCONV_SDK_EXPORT bool operator==(const audio_format& a, const audio_format& b);
AUDIOCONV_SDK_EXPORT bool operator!=(const audio_format& a, const audio_format& b);

/**
 * @brief Prints e.g. "wav 48000Hz 24bit 2ch"
 */
AUDIOCONV_SDK_EXPORT std::ostream& operator<<(std::ostream& os, const audio_format& fmt);
AUDIOCONV_SDK_EXPORT std::ostream& operator<<(std::ostream& os, container_id id);

/** @} */ // end of sdk_audio_format group

} // namespace audioconv

#endif // AUDIOCONV_SDK_AUDIO_FORMAT_HH

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
