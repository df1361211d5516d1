// This is copyrighted software. More information is at the end of this file.
#ifndef AUDIOCONV_SDK_CHANNEL_REMAPPER_HH
#define AUDIOCONV_SDK_CHANNEL_REMAPPER_HH

#include <audioconv/sdk/pcm_data.hh>
#include <audioconv/sdk/types.hh>
#include <audioconv/sdk/export_audioconv_sdk.h>

namespace audioconv {
    /**
     * @class channel_remapper
     * @brief Changes the number of channels of a sample set
     *
     * | From   | To     | Result                                  |
     * |--------|--------|-----------------------------------------|
     * | n      | n      | input returned unchanged                |
     * | 2      | 1      | per-sample average of left and right    |
     * | 1      | 2      | mono copied to both channels            |
     * | n      | m      | channel k is a copy of source k mod n   |
     *
     * The last row is not a downmix: surround content dropped to fewer
     * channels simply loses the extra channels.
     */
    class AUDIOCONV_SDK_EXPORT channel_remapper {
        public:
            /**
             * @throws validation_error if @p target is zero
             */
            [[nodiscard]] static pcm_data convert_channels(pcm_data samples, channels_t target);

            /**
             * @brief Per-index average of all channels
             */
            [[nodiscard]] static buffer<float> mix_to_mono(const pcm_data& samples);
    };
}

#endif // AUDIOCONV_SDK_CHANNEL_REMAPPER_HH

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
