// This is copyrighted software. More information is at the end of this file.
#include <audioconv/conversion_presets.hh>

namespace audioconv::presets {
    namespace {
        conversion_options stereo_target(container_id container, sample_rate_t rate, bit_depth_t bits,
                                         quality_tier quality) {
            conversion_options opts;
            opts.format.container = container;
            opts.format.sample_rate = rate;
            opts.format.bit_depth = bits;
            opts.format.channels = 2;
            opts.format.quality = quality;
            return opts;
        }

        struct named_preset {
            const char* name;
            conversion_options (*make)();
        };

        constexpr named_preset all_presets[] = {
            {"cd_quality", cd_quality},
            {"high_quality_mp3", high_quality_mp3},
            {"archival_flac", archival_flac},
            {"streaming_optimized", streaming_optimized},
        };
    }

    conversion_options cd_quality() {
        auto opts = stereo_target(container_id::wav, 44100, 16, quality_tier::lossless);
        opts.normalize = true;
        opts.dither = true;
        opts.resampling = resample_quality::sinc;
        return opts;
    }

    conversion_options high_quality_mp3() {
        auto opts = stereo_target(container_id::mp3, 48000, 16, quality_tier::high);
        opts.format.bitrate = 320;
        opts.normalize = true;
        opts.trim_silence = true;
        opts.dither = false;
        opts.resampling = resample_quality::sinc;
        return opts;
    }

    conversion_options archival_flac() {
        auto opts = stereo_target(container_id::flac, 96000, 24, quality_tier::lossless);
        opts.dither = false;
        opts.resampling = resample_quality::sinc;
        return opts;
    }

    conversion_options streaming_optimized() {
        auto opts = stereo_target(container_id::mp3, 44100, 16, quality_tier::medium);
        opts.format.bitrate = 192;
        opts.normalize = true;
        opts.trim_silence = true;
        opts.fade_in = 0.1;
        opts.fade_out = 0.5;
        opts.dither = true;
        opts.resampling = resample_quality::cubic;
        return opts;
    }

    std::optional<conversion_options> find(const std::string& name) {
        for (const auto& p : all_presets) {
            if (name == p.name) {
                return p.make();
            }
        }
        return std::nullopt;
    }

    std::vector<std::string> names() {
        std::vector<std::string> out;
        for (const auto& p : all_presets) {
            out.emplace_back(p.name);
        }
        return out;
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
