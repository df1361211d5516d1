/**
 * @file audio_analyzer.hh
 * @brief Container detection and format inspection
 */

// This is copyrighted software. More information is at the end of this file.
#ifndef AUDIOCONV_AUDIO_ANALYZER_HH
#define AUDIOCONV_AUDIO_ANALYZER_HH

#include <audioconv/sdk/audio_format.hh>
#include <audioconv/sdk/buffer.hh>
#include <audioconv/sdk/io_stream.hh>
#include <audioconv/export_audioconv.h>

#include <filesystem>
#include <memory>
#include <string>

namespace audioconv {
    class codecs_registry;

    /**
     * @struct audio_info
     * @brief What analyze_audio() learned about an encoded buffer
     */
    struct audio_info {
        audio_format format;
        std::size_t file_size = 0;      ///< Bytes
        double duration = 0.0;          ///< Seconds
        quality_tier estimated_quality = quality_tier::low;
        std::string codec_name;
    };

    /**
     * @brief Identify the container from the leading bytes
     *
     * | Signature                      | Container |
     * |--------------------------------|-----------|
     * | `RIFF`                         | wav       |
     * | `fLaC`                         | flac      |
     * | `ID3` or 11-bit MPEG frame sync| mp3       |
     *
     * @throws unsupported_format_error for anything else, including
     *         buffers shorter than four bytes
     */
    AUDIOCONV_EXPORT container_id detect_container(const buffer<uint8>& bytes);

    /**
     * @brief Detect, decode and describe an encoded buffer
     * @param registry Codecs to decode with; all built-in codecs if null
     * @throws unsupported_format_error if the container is unknown or has no codec
     * @throws decode_error if the codec rejects the bytes
     */
    AUDIOCONV_EXPORT audio_info analyze_audio(const buffer<uint8>& bytes,
                                              std::shared_ptr<const codecs_registry> registry = nullptr);

    /**
     * @brief Read a whole file into memory
     * @throws std::runtime_error if the file cannot be opened
     */
    AUDIOCONV_EXPORT buffer<uint8> load_file(const std::filesystem::path& path);

    /**
     * @brief Write bytes to a file, replacing it
     * @throws std::runtime_error if the file cannot be written completely
     */
    AUDIOCONV_EXPORT void save_file(const std::filesystem::path& path, const buffer<uint8>& bytes);
}

#endif // AUDIOCONV_AUDIO_ANALYZER_HH

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
