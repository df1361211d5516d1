// This is copyrighted software. More information is at the end of this file.

#pragma once

#include <audioconv/sdk/codec.hh>
#include <audioconv/sdk/types.hh>
#include <audioconv/codecs/export_audioconv_codecs.h>

namespace audioconv {
    /*!
     * \brief Canonical RIFF/WAVE linear PCM codec.
     *
     * Writes a fixed 44 byte header followed by interleaved little-endian
     * integer samples. Reads the same layout back; chunks between "fmt "
     * and "data" are not skipped.
     */
    class AUDIOCONV_CODECS_EXPORT codec_wav : public codec {
        public:
            static constexpr std::size_t header_size = 44;

            [[nodiscard]] const char* get_name() const override;
            [[nodiscard]] container_id get_container() const override;
            [[nodiscard]] std::vector<std::string> get_extensions() const override;
            [[nodiscard]] codec_capabilities get_capabilities() const override;
            [[nodiscard]] bool is_lossless() const override;

            using codec::decode;
            [[nodiscard]] decoded_audio decode(io_stream* stream) const override;
            [[nodiscard]] buffer<uint8> encode(const pcm_data& samples,
                                               const audio_format& format) const override;

            /*!
             * \brief True if the stream starts with "RIFF" ... "WAVE".
             *
             * The stream position is restored.
             */
            static bool accept(io_stream* stream);
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
