/**
 * @file conversion_presets.hh
 * @brief Ready-made conversion options for common delivery targets
 */

// This is copyrighted software. More information is at the end of this file.
#ifndef AUDIOCONV_CONVERSION_PRESETS_HH
#define AUDIOCONV_CONVERSION_PRESETS_HH

#include <audioconv/conversion_pipeline.hh>
#include <audioconv/export_audioconv.h>

#include <optional>
#include <string>
#include <vector>

namespace audioconv::presets {
    /// 44.1 kHz / 16-bit stereo WAV, peak normalized, dithered
    AUDIOCONV_EXPORT conversion_options cd_quality();

    /// 48 kHz stereo MP3 at 320 kbps, normalized, silence trimmed
    AUDIOCONV_EXPORT conversion_options high_quality_mp3();

    /// 96 kHz / 24-bit stereo FLAC, no processing beyond format conversion
    AUDIOCONV_EXPORT conversion_options archival_flac();

    /// 44.1 kHz stereo MP3 at 192 kbps with short fades and cubic resampling
    AUDIOCONV_EXPORT conversion_options streaming_optimized();

    /**
     * @brief Look a preset up by name
     *
     * Names are the function names above ("cd_quality", ...).
     */
    AUDIOCONV_EXPORT std::optional<conversion_options> find(const std::string& name);

    AUDIOCONV_EXPORT std::vector<std::string> names();
}

#endif // AUDIOCONV_CONVERSION_PRESETS_HH


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
