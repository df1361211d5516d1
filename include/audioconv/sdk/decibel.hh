// This is copyrighted software. More information is at the end of this file.
#ifndef AUDIOCONV_SDK_DECIBEL_HH
#define AUDIOCONV_SDK_DECIBEL_HH

#include <algorithm>
#include <cmath>

namespace audioconv {

// Smallest linear magnitude considered, i.e. -200 dBFS.
inline constexpr double min_linear_level = 1e-10;

// Offset that maps RMS dBFS onto an approximate integrated loudness scale.
inline constexpr double loudness_calibration_offset = 23.0;

inline double db_to_linear(double db) {
    return std::pow(10.0, db / 20.0);
}

inline double linear_to_db(double linear) {
    return 20.0 * std::log10(std::max(linear, min_linear_level));
}

/**
 * @brief Approximate loudness units from an RMS level
 *
 * Not a standards-compliant integrated loudness measurement: no
 * K-weighting and no gating, just calibrated RMS.
 */
inline double rms_to_loudness(double rms) {
    return linear_to_db(rms) - loudness_calibration_offset;
}

} // namespace audioconv

#endif // AUDIOCONV_SDK_DECIBEL_HH

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
