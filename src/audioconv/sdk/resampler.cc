// This is copyrighted software. More information is at the end of this file.
#include <audioconv/sdk/resampler.hh>
#include <audioconv/error.hh>

#include <algorithm>
#include <cmath>
#include <cstdint>

namespace {
    constexpr double pi = 3.14159265358979323846;

    float clamped_at(const float src[], std::size_t len, std::int64_t idx) {
        if (idx < 0) {
            return src[0];
        }
        auto i = static_cast<std::size_t>(idx);
        return src[i < len ? i : len - 1];
    }
}

namespace audioconv {
    const char* resample_quality_name(resample_quality quality) {
        switch (quality) {
            case resample_quality::linear: return "linear";
            case resample_quality::cubic: return "cubic";
            case resample_quality::sinc: return "sinc";
        }
        return "unknown";
    }

    resampler::~resampler() = default;

    std::size_t resampler::output_length(std::size_t src_len,
                                         sample_rate_t src_rate,
                                         sample_rate_t dst_rate) {
        if (src_rate == 0) {
            return 0;
        }
        return static_cast<std::size_t>(
            static_cast<std::uint64_t>(src_len) * dst_rate / src_rate);
    }

    buffer<float> resampler::resample(const buffer<float>& src,
                                      sample_rate_t src_rate,
                                      sample_rate_t dst_rate) const {
        if (src_rate == 0 || dst_rate == 0) {
            throw validation_error("Sample rates must be positive");
        }
        if (src_rate == dst_rate) {
            return src.clone();
        }
        buffer<float> out(output_length(src.size(), src_rate, dst_rate));
        if (out.empty() || src.empty()) {
            return out;
        }
        const double step = static_cast<double>(src_rate) / static_cast<double>(dst_rate);
        do_resampling(out.data(), out.size(), src.data(), src.size(), step);
        return out;
    }

    // -------------------------------------------------------------------------
    const char* linear_resampler::get_name() const {
        return "linear";
    }

    void linear_resampler::do_resampling(float dst[], std::size_t dst_len,
                                         const float src[], std::size_t src_len,
                                         double step) const {
        for (std::size_t n = 0; n < dst_len; ++n) {
            const double pos = static_cast<double>(n) * step;
            const auto idx = static_cast<std::size_t>(pos);
            const double frac = pos - static_cast<double>(idx);
            if (idx + 1 < src_len) {
                dst[n] = static_cast<float>(src[idx] * (1.0 - frac) + src[idx + 1] * frac);
            } else {
                dst[n] = src[std::min(idx, src_len - 1)];
            }
        }
    }

    // -------------------------------------------------------------------------
    const char* cubic_resampler::get_name() const {
        return "cubic";
    }

    void cubic_resampler::do_resampling(float dst[], std::size_t dst_len,
                                        const float src[], std::size_t src_len,
                                        double step) const {
        for (std::size_t n = 0; n < dst_len; ++n) {
            const double pos = static_cast<double>(n) * step;
            const auto idx = static_cast<std::int64_t>(pos);
            const double t = pos - static_cast<double>(idx);

            const double p0 = clamped_at(src, src_len, idx - 1);
            const double p1 = clamped_at(src, src_len, idx);
            const double p2 = clamped_at(src, src_len, idx + 1);
            const double p3 = clamped_at(src, src_len, idx + 2);

            // Catmull-Rom
            const double a = -0.5 * p0 + 1.5 * p1 - 1.5 * p2 + 0.5 * p3;
            const double b = p0 - 2.5 * p1 + 2.0 * p2 - 0.5 * p3;
            const double c = -0.5 * p0 + 0.5 * p2;
            const double d = p1;

            dst[n] = static_cast<float>(((a * t + b) * t + c) * t + d);
        }
    }

    // -------------------------------------------------------------------------
    const char* sinc_resampler::get_name() const {
        return "sinc";
    }

    double sinc_resampler::kernel(double x) {
        if (x == 0.0) {
            return 1.0;
        }
        const double px = pi * x;
        const double pxa = px / lanczos_a;
        return (std::sin(px) / px) * (std::sin(pxa) / pxa);
    }

    void sinc_resampler::do_resampling(float dst[], std::size_t dst_len,
                                       const float src[], std::size_t src_len,
                                       double step) const {
        const auto len = static_cast<std::int64_t>(src_len);
        for (std::size_t n = 0; n < dst_len; ++n) {
            const double pos = static_cast<double>(n) * step;
            const auto center = static_cast<std::int64_t>(std::floor(pos));

            double acc = 0.0;
            double weight_sum = 0.0;
            for (std::int64_t j = center - half_width; j <= center + half_width; ++j) {
                if (j < 0 || j >= len) {
                    continue;
                }
                const double w = kernel(pos - static_cast<double>(j));
                acc += src[j] * w;
                weight_sum += w;
            }
            dst[n] = weight_sum != 0.0 ? static_cast<float>(acc / weight_sum) : 0.0f;
        }
    }

    // -------------------------------------------------------------------------
    std::unique_ptr<resampler> create_resampler(resample_quality quality) {
        switch (quality) {
            case resample_quality::linear:
                return std::make_unique<linear_resampler>();
            case resample_quality::cubic:
                return std::make_unique<cubic_resampler>();
            case resample_quality::sinc:
                return std::make_unique<sinc_resampler>();
        }
        throw validation_error("Unknown resample quality");
    }

    buffer<float> resample(const buffer<float>& samples,
                           sample_rate_t input_rate,
                           sample_rate_t output_rate,
                           resample_quality quality) {
        return create_resampler(quality)->resample(samples, input_rate, output_rate);
    }

    pcm_data resample(pcm_data samples,
                      sample_rate_t input_rate,
                      sample_rate_t output_rate,
                      resample_quality quality) {
        if (input_rate == output_rate) {
            return samples;
        }
        auto kernel = create_resampler(quality);
        std::vector<buffer<float>> out;
        out.reserve(samples.channel_count());
        for (std::size_t ch = 0; ch < samples.channel_count(); ++ch) {
            out.push_back(kernel->resample(samples.channel(ch), input_rate, output_rate));
        }
        return pcm_data(std::move(out));
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
