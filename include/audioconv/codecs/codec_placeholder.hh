// This is copyrighted software. More information is at the end of this file.

#pragma once

#include <audioconv/sdk/codec.hh>
#include <audioconv/codecs/codec_wav.hh>
#include <audioconv/codecs/export_audioconv_codecs.h>
#include <memory>
#include <string>
#include <vector>

namespace audioconv {
    /*!
     * \brief Codec entry for a container without a real encoder.
     *
     * Decoding and encoding are delegated to codec_wav, so the bytes it
     * produces are canonical WAV regardless of the container it is
     * registered for. is_placeholder() returns true so that callers can
     * tell.
     */
    class AUDIOCONV_CODECS_EXPORT codec_placeholder : public codec {
        public:
            codec_placeholder(container_id container,
                              std::string name,
                              std::vector<std::string> extensions,
                              codec_capabilities capabilities,
                              bool lossless);

            [[nodiscard]] const char* get_name() const override;
            [[nodiscard]] container_id get_container() const override;
            [[nodiscard]] std::vector<std::string> get_extensions() const override;
            [[nodiscard]] codec_capabilities get_capabilities() const override;
            [[nodiscard]] bool is_lossless() const override;
            [[nodiscard]] bool is_placeholder() const override;

            using codec::decode;
            [[nodiscard]] decoded_audio decode(io_stream* stream) const override;
            [[nodiscard]] buffer<uint8> encode(const pcm_data& samples,
                                               const audio_format& format) const override;

            /*!
             * \brief FLAC entry: up to 192 kHz, 8 channels, 16 or 24 bit.
             */
            static std::unique_ptr<codec_placeholder> create_flac();

            /*!
             * \brief MP3 entry: up to 48 kHz, 2 channels, 16 bit.
             */
            static std::unique_ptr<codec_placeholder> create_mp3();

        private:
            container_id m_container;
            std::string m_name;
            std::vector<std::string> m_extensions;
            codec_capabilities m_capabilities;
            bool m_lossless;
            codec_wav m_delegate;
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
