// This is copyrighted software. More information is at the end of this file.
#ifndef AUDIOCONV_SDK_LOUDNESS_PROCESSOR_HH
#define AUDIOCONV_SDK_LOUDNESS_PROCESSOR_HH

#include <audioconv/sdk/pcm_data.hh>
#include <audioconv/sdk/export_audioconv_sdk.h>

namespace audioconv {
    /**
     * @class loudness_processor
     * @brief Gain adjustment towards a target loudness
     *
     * Loudness here is the RMS level of all samples of all channels in
     * dBFS, minus 23. No K-weighting, no gating.
     */
    class AUDIOCONV_SDK_EXPORT loudness_processor {
        public:
            /**
             * @brief Loudness estimate in LU; -223 for silence
             */
            [[nodiscard]] static double measure(const pcm_data& samples);

            /**
             * @brief Scale all samples so that measure() is close to @p target_lu
             *
             * Samples are hard clipped to [-1, 1] after the gain, so loud
             * targets on dense material end up below target. Silent input
             * is returned as is.
             */
            [[nodiscard]] static pcm_data normalize(pcm_data samples, double target_lu);

            [[nodiscard]] static double rms(const pcm_data& samples);
    };
}

#endif // AUDIOCONV_SDK_LOUDNESS_PROCESSOR_HH

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
