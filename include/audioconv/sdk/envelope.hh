/**
 * @file envelope.hh
 * @brief Time-domain edits: trimming, fades and peak normalization
 * @ingroup sdk
 */

// This is copyrighted software. More information is at the end of this file.
#ifndef AUDIOCONV_SDK_ENVELOPE_HH
#define AUDIOCONV_SDK_ENVELOPE_HH

#include <audioconv/sdk/pcm_data.hh>
#include <audioconv/sdk/types.hh>
#include <audioconv/sdk/export_audioconv_sdk.h>

namespace audioconv {
    /// Linear level below which trim_silence() treats a sample as silent (-60 dBFS).
    inline constexpr float silence_threshold = 0.001f;

    /// Peak level that normalize_peak() scales to.
    inline constexpr double normalize_peak_level = 0.95;

    /**
     * @brief Keep samples [floor(start * rate), floor(end * rate))
     *
     * The end is clamped to the input length. A start at or beyond the
     * end of the input, or an end before the start, yields an empty set
     * with the same number of channels.
     *
     * @throws validation_error if either time is negative
     */
    AUDIOCONV_SDK_EXPORT pcm_data trim(pcm_data samples, double start_seconds,
                                       double end_seconds, sample_rate_t rate);

    /**
     * @brief Strip leading and trailing frames where every channel is at or
     *        below @p threshold
     *
     * Input that is silent throughout is returned unchanged.
     */
    AUDIOCONV_SDK_EXPORT pcm_data trim_silence(pcm_data samples,
                                               float threshold = silence_threshold);

    /**
     * @brief Apply linear fade-in and fade-out ramps
     *
     * Fade-in scales sample i of the first n = floor(fade_in * rate)
     * samples by i / n. Fade-out scales sample i of the last
     * m = floor(fade_out * rate) samples by (len - i) / m. Both ramps are
     * computed from the unfaded input; where they overlap the fade-out
     * gain wins. A duration of zero disables a ramp.
     */
    AUDIOCONV_SDK_EXPORT pcm_data apply_fades(pcm_data samples, double fade_in_seconds,
                                              double fade_out_seconds, sample_rate_t rate);

    /**
     * @brief Scale so that the loudest sample of any channel is at 0.95
     *
     * Silence is returned unchanged.
     */
    AUDIOCONV_SDK_EXPORT pcm_data normalize_peak(pcm_data samples);

    /**
     * @brief Largest absolute sample over all channels
     */
    AUDIOCONV_SDK_EXPORT float peak_level(const pcm_data& samples);
}

#endif // AUDIOCONV_SDK_ENVELOPE_HH

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
