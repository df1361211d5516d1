// This is copyrighted software. More information is at the end of this file.
#include <audioconv/codecs/codec_placeholder.hh>
#include <failsafe/failsafe.hh>
#include <memory>

namespace audioconv {
    codec_placeholder::codec_placeholder(container_id container,
                                         std::string name,
                                         std::vector<std::string> extensions,
                                         codec_capabilities capabilities,
                                         bool lossless)
        : m_container(container),
          m_name(std::move(name)),
          m_extensions(std::move(extensions)),
          m_capabilities(std::move(capabilities)),
          m_lossless(lossless) {
    }

    const char* codec_placeholder::get_name() const {
        return m_name.c_str();
    }

    container_id codec_placeholder::get_container() const {
        return m_container;
    }

    std::vector<std::string> codec_placeholder::get_extensions() const {
        return m_extensions;
    }

    codec_capabilities codec_placeholder::get_capabilities() const {
        return m_capabilities;
    }

    bool codec_placeholder::is_lossless() const {
        return m_lossless;
    }

    bool codec_placeholder::is_placeholder() const {
        return true;
    }

    decoded_audio codec_placeholder::decode(io_stream* stream) const {
        auto out = m_delegate.decode(stream);
        out.format.container = m_container;
        out.format.codec = m_name;
        if (!m_lossless) {
            out.format.quality.reset();
        }
        return out;
    }

    buffer<uint8> codec_placeholder::encode(const pcm_data& samples, const audio_format& format) const {
        validate_target(format);
        LOG_DEBUG("codec_placeholder", m_name, "encoder is a placeholder, writing WAV layout");
        return m_delegate.encode(samples, format);
    }

    std::unique_ptr<codec_placeholder> codec_placeholder::create_flac() {
        codec_capabilities caps;
        caps.max_sample_rate = 192000;
        caps.max_channels = 8;
        caps.supported_bit_depths = {16, 24};
        return std::make_unique<codec_placeholder>(container_id::flac, "flac",
                                                   std::vector<std::string>{".flac"},
                                                   caps, true);
    }

    std::unique_ptr<codec_placeholder> codec_placeholder::create_mp3() {
        codec_capabilities caps;
        caps.max_sample_rate = 48000;
        caps.max_channels = 2;
        caps.supported_bit_depths = {16};
        return std::make_unique<codec_placeholder>(container_id::mp3, "mp3",
                                                   std::vector<std::string>{".mp3"},
                                                   caps, false);
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
