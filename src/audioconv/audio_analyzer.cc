// This is copyrighted software. More information is at the end of this file.
#include <audioconv/audio_analyzer.hh>
#include <audioconv/error.hh>
#include <audioconv/codecs/register_codecs.hh>
#include <audioconv/sdk/codec.hh>
#include <audioconv/sdk/codecs_registry.hh>
#include <failsafe/failsafe.hh>

#include <cstring>
#include <fstream>

namespace audioconv {
    container_id detect_container(const buffer<uint8>& bytes) {
        if (bytes.size() < 4) {
            throw unsupported_format_error("Input too short to detect a container");
        }
        const uint8* p = bytes.data();
        if (std::memcmp(p, "RIFF", 4) == 0) {
            return container_id::wav;
        }
        if (std::memcmp(p, "fLaC", 4) == 0) {
            return container_id::flac;
        }
        if (std::memcmp(p, "ID3", 3) == 0) {
            return container_id::mp3;
        }
        const unsigned sync = (static_cast<unsigned>(p[0]) << 8) | p[1];
        if ((sync & 0xFFE0u) == 0xFFE0u) {
            return container_id::mp3;
        }
        throw unsupported_format_error("Unrecognized container signature");
    }

    audio_info analyze_audio(const buffer<uint8>& bytes,
                             std::shared_ptr<const codecs_registry> registry) {
        if (!registry) {
            registry = create_registry_with_all_codecs();
        }
        const auto container = detect_container(bytes);
        const auto entry = registry->find(container);
        if (!entry) {
            throw unsupported_format_error(std::string("No codec registered for ") + container_name(container));
        }

        auto decoded = entry->decode(bytes);

        audio_info info;
        info.format = decoded.format;
        info.file_size = bytes.size();
        info.duration = static_cast<double>(decoded.samples.frames()) / decoded.format.sample_rate;
        info.estimated_quality = estimate_quality(decoded.format);
        info.codec_name = entry->get_name();
        return info;
    }

    buffer<uint8> load_file(const std::filesystem::path& path) {
        auto stream = io_from_file(path);
        if (!stream) {
            THROW_RUNTIME("Cannot open ", path.u8string(), " for reading");
        }
        return read_all(stream.get());
    }

    void save_file(const std::filesystem::path& path, const buffer<uint8>& bytes) {
        std::ofstream out(path, std::ios::binary | std::ios::trunc);
        if (!out) {
            THROW_RUNTIME("Cannot open ", path.u8string(), " for writing");
        }
        out.write(reinterpret_cast<const char*>(bytes.data()), static_cast<std::streamsize>(bytes.size()));
        out.close();
        if (!out) {
            THROW_RUNTIME("Short write to ", path.u8string());
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
