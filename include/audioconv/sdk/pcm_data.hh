/**
 * @file pcm_data.hh
 * @brief Planar floating point sample set
 * @ingroup sdk
 */

// This is copyrighted software. More information is at the end of this file.
#pragma once

#include <audioconv/sdk/buffer.hh>
#include <audioconv/sdk/types.hh>
#include <audioconv/sdk/export_audioconv_sdk.h>
#include <vector>

namespace audioconv {
    /**
     * @class pcm_data
     * @brief Ordered list of per-channel sample buffers
     * @ingroup sdk
     *
     * Samples are floats, nominally in [-1.0, 1.0] after decoding. Every
     * channel holds the same number of samples (frames); the constructor
     * enforces it.
     *
     * pcm_data is move-only. Each processing stage takes its input by
     * value and returns a freshly allocated set, so no two stages ever
     * alias the same samples.
     *
     * @code
     * pcm_data stereo(2, 48000);          // one second of silence
     * stereo.channel(0)[0] = 0.5f;
     * pcm_data mono = channel_remapper::convert_channels(std::move(stereo), 1);
     * @endcode
     */
    class AUDIOCONV_SDK_EXPORT pcm_data {
        public:
            pcm_data() = default;

            /**
             * @brief Allocate a zeroed set
             * @param channels Number of channels
             * @param frames Samples per channel
             */
            pcm_data(channels_t channels, std::size_t frames);

            /**
             * @brief Adopt existing channel buffers
             * @throws validation_error if channel lengths differ
             */
            explicit pcm_data(std::vector<buffer<float>> channels);

            pcm_data(pcm_data&&) noexcept = default;
            pcm_data& operator=(pcm_data&&) noexcept = default;
            pcm_data(const pcm_data&) = delete;
            pcm_data& operator=(const pcm_data&) = delete;

            [[nodiscard]] channels_t channel_count() const noexcept;

            /**
             * @brief Samples per channel
             */
            [[nodiscard]] std::size_t frames() const noexcept;

            /**
             * @brief True when there are no channels or no frames
             */
            [[nodiscard]] bool empty() const noexcept;

            buffer<float>& channel(std::size_t index);
            [[nodiscard]] const buffer<float>& channel(std::size_t index) const;

            /**
             * @brief Deep copy, used where a stage must keep its input
             */
            [[nodiscard]] pcm_data clone() const;

            /**
             * @brief Release the channel buffers
             */
            std::vector<buffer<float>> release() &&;

        private:
            std::vector<buffer<float>> m_channels;
    };
}

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
