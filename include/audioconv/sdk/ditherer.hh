// This is copyrighted software. More information is at the end of this file.
#ifndef AUDIOCONV_SDK_DITHERER_HH
#define AUDIOCONV_SDK_DITHERER_HH

#include <audioconv/sdk/buffer.hh>
#include <audioconv/sdk/pcm_data.hh>
#include <audioconv/sdk/types.hh>
#include <audioconv/sdk/export_audioconv_sdk.h>
#include <cstdint>
#include <random>

namespace audioconv {
    /**
     * @class ditherer
     * @brief TPDF dither and requantization to a target bit depth
     * @ingroup sdk
     *
     * Each sample gets triangular noise of one quantization step, is
     * rounded to the grid of `2^(bits-1)` levels per unit and is clamped
     * to [-1, 1]. With noise shaping half of each sample's quantization
     * error is carried into the next sample of the same channel.
     *
     * The noise engine is owned by the instance. Two ditherers built with
     * the same seed produce identical output for identical input.
     */
    class AUDIOCONV_SDK_EXPORT ditherer {
        public:
            /**
             * @brief Seed from std::random_device
             */
            ditherer();
            explicit ditherer(std::uint32_t seed);

            /**
             * @brief Dither one channel
             * @throws validation_error for an unsupported bit depth
             */
            [[nodiscard]] buffer<float> apply(const buffer<float>& samples,
                                              bit_depth_t target_bit_depth,
                                              bool noise_shaping);

            /**
             * @brief Dither every channel; the shaping residual restarts per channel
             */
            [[nodiscard]] pcm_data apply(pcm_data samples,
                                         bit_depth_t target_bit_depth,
                                         bool noise_shaping);

            /**
             * @brief Round and clamp to the target grid without noise
             */
            [[nodiscard]] static buffer<float> requantize(const buffer<float>& samples,
                                                          bit_depth_t target_bit_depth);

            [[nodiscard]] static pcm_data requantize(pcm_data samples,
                                                     bit_depth_t target_bit_depth);

        private:
            std::mt19937 m_engine;
    };
}

#endif // AUDIOCONV_SDK_DITHERER_HH

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
