// This is copyrighted software. More information is at the end of this file.
#include <audioconv/sdk/codec.hh>
#include <audioconv/error.hh>
#include <algorithm>
#include <string>

namespace audioconv {
    bool codec_capabilities::supports_bit_depth(bit_depth_t bits) const {
        return std::find(supported_bit_depths.begin(), supported_bit_depths.end(), bits)
               != supported_bit_depths.end();
    }

    codec::~codec() = default;

    bool codec::is_placeholder() const {
        return false;
    }

    decoded_audio codec::decode(const buffer<uint8>& bytes) const {
        auto stream = io_from_memory(bytes);
        return decode(stream.get());
    }

    void codec::validate_target(const audio_format& format) const {
        const auto caps = get_capabilities();
        const std::string name = get_name();
        if (!caps.supports_bit_depth(format.bit_depth)) {
            throw validation_error(name + " codec does not support " +
                                   std::to_string(format.bit_depth) + "-bit samples");
        }
        if (format.channels > caps.max_channels) {
            throw validation_error(name + " codec supports at most " +
                                   std::to_string(caps.max_channels) + " channels, requested " +
                                   std::to_string(format.channels));
        }
        if (format.sample_rate > caps.max_sample_rate) {
            throw validation_error(name + " codec supports at most " +
                                   std::to_string(caps.max_sample_rate) + " Hz, requested " +
                                   std::to_string(format.sample_rate));
        }
    }
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
