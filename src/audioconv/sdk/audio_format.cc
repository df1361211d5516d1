// This is copyrighted software. More information is at the end of this file.
#include <audioconv/sdk/audio_format.hh>
#include <audioconv/error.hh>
#include <algorithm>
#include <cctype>
#include <ostream>

namespace audioconv {

const char* container_name(container_id id) {
    switch (id) {
        case container_id::wav: return "wav";
        case container_id::flac: return "flac";
        case container_id::mp3: return "mp3";
        case container_id::unknown: break;
    }
    return "unknown";
}

container_id container_from_name(const std::string& name) {
    std::string lower = name;
    std::transform(lower.begin(), lower.end(), lower.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    if (!lower.empty() && lower[0] == '.') {
        lower.erase(0, 1);
    }
    if (lower == "wav" || lower == "wave") {
        return container_id::wav;
    }
    if (lower == "flac") {
        return container_id::flac;
    }
    if (lower == "mp3") {
        return container_id::mp3;
    }
    return container_id::unknown;
}

const char* quality_tier_name(quality_tier tier) {
    switch (tier) {
        case quality_tier::low: return "low";
        case quality_tier::medium: return "medium";
        case quality_tier::high: return "high";
        case quality_tier::lossless: return "lossless";
    }
    return "unknown";
}

quality_tier estimate_quality(const audio_format& format) {
    if (format.quality == quality_tier::lossless) {
        return quality_tier::lossless;
    }
    if (format.bitrate) {
        if (*format.bitrate >= 256) return quality_tier::high;
        if (*format.bitrate >= 128) return quality_tier::medium;
        return quality_tier::low;
    }
    if (format.bit_depth >= 24) return quality_tier::high;
    if (format.bit_depth >= 16) return quality_tier::medium;
    return quality_tier::low;
}

void validate_format(const audio_format& format) {
    if (format.sample_rate == 0) {
        throw validation_error("Sample rate must be positive");
    }
    if (!is_valid_bit_depth(format.bit_depth)) {
        throw validation_error("Unsupported bit depth: " + std::to_string(format.bit_depth));
    }
    if (!is_valid_channel_count(format.channels)) {
        throw validation_error("Unsupported channel count: " + std::to_string(format.channels));
    }
}

bool operator==(const audio_format& a, const audio_format& b) {
    return a.container == b.container &&
           a.codec == b.codec &&
           a.sample_rate == b.sample_rate &&
           a.bit_depth == b.bit_depth &&
           a.channels == b.channels &&
           a.bitrate == b.bitrate &&
           a.quality == b.quality;
}

bool operator!=(const audio_format& a, const audio_format& b) {
    return !(a == b);
}

std::ostream& operator<<(std::ostream& os, container_id id) {
    return os << container_name(id);
}

std::ostream& operator<<(std::ostream& os, const audio_format& fmt) {
    os << fmt.container << ' ' << fmt.sample_rate << "Hz "
       << static_cast<unsigned>(fmt.bit_depth) << "bit "
       << static_cast<unsigned>(fmt.channels) << "ch";
    if (fmt.bitrate) {
        os << ' ' << *fmt.bitrate << "kbps";
    }
    return os;
}

} // namespace audioconv

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
