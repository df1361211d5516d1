/**
 * @file codec.hh
 * @brief Abstract codec interface
 * @ingroup sdk_codecs
 */

// This is copyrighted software. More information is at the end of this file.
#ifndef AUDIOCONV_SDK_CODEC_HH
#define AUDIOCONV_SDK_CODEC_HH

#include <audioconv/sdk/audio_format.hh>
#include <audioconv/sdk/buffer.hh>
#include <audioconv/sdk/io_stream.hh>
#include <audioconv/sdk/pcm_data.hh>
#include <audioconv/sdk/types.hh>
#include <audioconv/sdk/export_audioconv_sdk.h>
#include <string>
#include <vector>

namespace audioconv {
    /**
     * @struct codec_capabilities
     * @brief Limits of what a codec can encode
     */
    struct AUDIOCONV_SDK_EXPORT codec_capabilities {
        sample_rate_t max_sample_rate = 192000;
        channels_t max_channels = 8;
        std::vector<bit_depth_t> supported_bit_depths{8, 16, 24, 32};

        [[nodiscard]] bool supports_bit_depth(bit_depth_t bits) const;
    };

    /**
     * @struct decoded_audio
     * @brief Samples together with the format they were stored in
     */
    struct decoded_audio {
        pcm_data samples;
        audio_format format;
    };

    /**
     * @class codec
     * @brief Base class for container encoders and decoders
     * @ingroup sdk_codecs
     *
     * A codec converts between encoded bytes of one container and planar
     * float samples. Codecs hold no per-call state; the registry shares a
     * single instance between concurrent conversions, so decode() and
     * encode() must be safe to call from several threads at once.
     *
     * ## Implementation Guide
     *
     * @code
     * class codec_raw : public codec {
     * public:
     *     const char* get_name() const override { return "raw"; }
     *     container_id get_container() const override { return container_id::unknown; }
     *     std::vector<std::string> get_extensions() const override { return {".raw"}; }
     *     codec_capabilities get_capabilities() const override { return {}; }
     *     bool is_lossless() const override { return true; }
     *
     *     decoded_audio decode(io_stream* stream) const override;
     *     buffer<uint8> encode(const pcm_data& samples,
     *                          const audio_format& format) const override;
     * };
     * @endcode
     *
     * @see codecs_registry
     */
    class AUDIOCONV_SDK_EXPORT codec {
        public:
            codec() = default;
            virtual ~codec();

            codec(const codec&) = delete;
            codec& operator=(const codec&) = delete;

            [[nodiscard]] virtual const char* get_name() const = 0;
            [[nodiscard]] virtual container_id get_container() const = 0;

            /**
             * @brief File extensions, lower case with leading dot
             */
            [[nodiscard]] virtual std::vector<std::string> get_extensions() const = 0;

            [[nodiscard]] virtual codec_capabilities get_capabilities() const = 0;
            [[nodiscard]] virtual bool is_lossless() const = 0;

            /**
             * @brief True when the codec writes another container's byte layout
             *
             * Placeholder codecs let a container be named as a target while
             * producing bytes that are not actually in that container.
             */
            [[nodiscard]] virtual bool is_placeholder() const;

            /**
             * @brief Decode a complete encoded stream
             * @throws decode_error on malformed or truncated input
             */
            [[nodiscard]] virtual decoded_audio decode(io_stream* stream) const = 0;

            /**
             * @brief Decode an in-memory buffer
             */
            [[nodiscard]] decoded_audio decode(const buffer<uint8>& bytes) const;

            /**
             * @brief Encode samples into this codec's byte layout
             * @throws validation_error if the format exceeds get_capabilities()
             * @throws encode_error on an internal fault
             */
            [[nodiscard]] virtual buffer<uint8> encode(const pcm_data& samples,
                                                       const audio_format& format) const = 0;

            /**
             * @brief Check a target format against get_capabilities()
             * @throws validation_error naming the first violated limit
             */
            void validate_target(const audio_format& format) const;
    };
}

#endif // AUDIOCONV_SDK_CODEC_HH

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
