/**
 * @file resampler.hh
 * @brief Sample rate conversion kernels
 * @ingroup sdk_resampling
 */

// This is copyrighted software. More information is at the end of this file.
#ifndef AUDIOCONV_RESAMPLER_HH
#define AUDIOCONV_RESAMPLER_HH

#include <cstddef>
#include <memory>
#include <audioconv/sdk/buffer.hh>
#include <audioconv/sdk/pcm_data.hh>
#include <audioconv/sdk/types.hh>
#include <audioconv/sdk/export_audioconv_sdk.h>

namespace audioconv {
    /**
     * @enum resample_quality
     * @brief Interpolation kernel selection
     */
    enum class resample_quality {
        linear,  ///< Two-point linear interpolation
        cubic,   ///< Four-point Catmull-Rom interpolation
        sinc     ///< Lanczos (a = 4) windowed sinc, 8 taps each side
    };

    AUDIOCONV_SDK_EXPORT const char* resample_quality_name(resample_quality quality);

    /**
     * @class resampler
     * @brief Abstract base class for sample rate converters
     * @ingroup sdk_resampling
     *
     * A resampler converts one channel of samples from one rate to
     * another. The base class owns the parts every kernel shares:
     *
     * - identical rates return an independent copy of the input;
     * - the output length is always floor(len * dst_rate / src_rate);
     * - output sample n is taken at source position n * src_rate / dst_rate.
     *
     * Kernels are deterministic pure functions of their inputs. They hold
     * no state between calls, so one instance may be shared freely.
     *
     * ## Implementation Guide
     *
     * @code
     * class nearest_resampler : public resampler {
     * protected:
     *     void do_resampling(float dst[], std::size_t dst_len,
     *                        const float src[], std::size_t src_len,
     *                        double step) const override {
     *         for (std::size_t n = 0; n < dst_len; ++n) {
     *             auto i = static_cast<std::size_t>(n * step + 0.5);
     *             dst[n] = src[std::min(i, src_len - 1)];
     *         }
     *     }
     * };
     * @endcode
     *
     * @see resample()
     */
    class AUDIOCONV_SDK_EXPORT resampler {
        public:
            resampler() = default;
            virtual ~resampler();

            resampler(const resampler&) = delete;
            auto operator=(const resampler&) -> resampler& = delete;

            /**
             * @brief Human-readable kernel name
             */
            [[nodiscard]] virtual const char* get_name() const = 0;

            /**
             * @brief Resample one channel
             * @param src Input samples
             * @param src_rate Input sample rate in Hz
             * @param dst_rate Output sample rate in Hz
             * @return New buffer of floor(src.size() * dst_rate / src_rate) samples
             * @throws validation_error if either rate is zero
             */
            [[nodiscard]] buffer<float> resample(const buffer<float>& src,
                                                 sample_rate_t src_rate,
                                                 sample_rate_t dst_rate) const;

            /**
             * @brief Output length for a conversion
             */
            [[nodiscard]] static std::size_t output_length(std::size_t src_len,
                                                           sample_rate_t src_rate,
                                                           sample_rate_t dst_rate);

        protected:
            /**
             * @brief Kernel implementation
             * @param[out] dst Output samples, dst_len long
             * @param src Input samples, src_len long (never empty)
             * @param step Source positions advanced per output sample
             */
            virtual void do_resampling(float dst[], std::size_t dst_len,
                                       const float src[], std::size_t src_len,
                                       double step) const = 0;
    };

    class AUDIOCONV_SDK_EXPORT linear_resampler final : public resampler {
        public:
            [[nodiscard]] const char* get_name() const override;
        protected:
            void do_resampling(float dst[], std::size_t dst_len,
                               const float src[], std::size_t src_len,
                               double step) const override;
    };

    class AUDIOCONV_SDK_EXPORT cubic_resampler final : public resampler {
        public:
            [[nodiscard]] const char* get_name() const override;
        protected:
            void do_resampling(float dst[], std::size_t dst_len,
                               const float src[], std::size_t src_len,
                               double step) const override;
    };

    class AUDIOCONV_SDK_EXPORT sinc_resampler final : public resampler {
        public:
            static constexpr int half_width = 8;
            static constexpr double lanczos_a = 4.0;

            [[nodiscard]] const char* get_name() const override;

            /**
             * @brief Kernel weight for a distance of x source samples
             *
             * sinc(x) * sinc(x / a) with the normalised sinc.
             */
            [[nodiscard]] static double kernel(double x);
        protected:
            void do_resampling(float dst[], std::size_t dst_len,
                               const float src[], std::size_t src_len,
                               double step) const override;
    };

    /**
     * @brief Create a kernel for the given quality
     */
    AUDIOCONV_SDK_EXPORT std::unique_ptr<resampler> create_resampler(resample_quality quality);

    /**
     * @brief Resample one channel with the selected kernel
     *
     * @code
     * buffer<float> in{0.0f, 1.0f, 0.0f, -1.0f};
     * auto out = resample(in, 4, 8, resample_quality::linear);
     * // out == {0, 0.5, 1, 0.5, 0, -0.5, -1, -1}
     * @endcode
     */
    AUDIOCONV_SDK_EXPORT buffer<float> resample(const buffer<float>& samples,
                                                sample_rate_t input_rate,
                                                sample_rate_t output_rate,
                                                resample_quality quality);

    /**
     * @brief Resample every channel of a sample set
     */
    AUDIOCONV_SDK_EXPORT pcm_data resample(pcm_data samples,
                                           sample_rate_t input_rate,
                                           sample_rate_t output_rate,
                                           resample_quality quality);
}
#endif

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
