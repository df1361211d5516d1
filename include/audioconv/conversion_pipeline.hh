/**
 * @file conversion_pipeline.hh
 * @brief Decode, process and re-encode audio in one call
 */

// This is copyrighted software. More information is at the end of this file.
#ifndef AUDIOCONV_CONVERSION_PIPELINE_HH
#define AUDIOCONV_CONVERSION_PIPELINE_HH

#include <audioconv/sdk/audio_format.hh>
#include <audioconv/sdk/buffer.hh>
#include <audioconv/sdk/quality_metrics.hh>
#include <audioconv/sdk/resampler.hh>
#include <audioconv/sdk/stage_outcome.hh>
#include <audioconv/export_audioconv.h>

#include <chrono>
#include <cstdint>
#include <functional>
#include <future>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace audioconv {
    class codecs_registry;

    enum class conversion_phase {
        analyzing,
        processing,
        encoding,
        finalizing
    };

    AUDIOCONV_EXPORT const char* conversion_phase_name(conversion_phase phase);

    /**
     * @struct trim_range
     * @brief Section of the input to keep, in seconds
     */
    struct trim_range {
        double start = 0.0;
        double end = 0.0;
    };

    /**
     * @struct conversion_options
     * @brief What to produce and which processing to apply on the way
     *
     * Only `format` is required. Every other member defaults to "leave the
     * audio alone".
     */
    struct conversion_options {
        audio_format format;                               ///< Target format
        bool normalize = false;                            ///< Peak normalize to 0.95
        std::optional<double> fade_in;                     ///< Seconds
        std::optional<double> fade_out;                    ///< Seconds
        std::optional<trim_range> trim;
        bool trim_silence = false;                         ///< Strip leading/trailing -60 dBFS
        bool dither = true;                                ///< TPDF dither when the bit depth changes
        bool noise_shaping = false;
        std::optional<resample_quality> resampling;        ///< Defaults to pipeline_config
        std::optional<double> loudness_normalization;      ///< Target loudness in LU
    };

    /**
     * @struct conversion_progress
     * @brief Milestone notification sent while a conversion runs
     */
    struct conversion_progress {
        conversion_phase phase = conversion_phase::analyzing;
        int percent = 0;
        std::optional<double> time_remaining;              ///< Seconds, extrapolated
        std::string description;
    };

    using progress_callback = std::function<void(const conversion_progress&)>;

    /**
     * @struct conversion_result
     * @brief Outcome of one conversion
     *
     * On failure `output` is empty, `converted_size` and metrics are zero,
     * `format` echoes the requested target, `original_size` is the input
     * size, and `error`, `failure_kind` and `failed_stage` describe what
     * went wrong.
     */
    struct conversion_result {
        bool success = false;
        buffer<uint8> output;
        audio_format format;
        std::size_t original_size = 0;
        std::size_t converted_size = 0;
        double compression_ratio = 0.0;                    ///< original_size / converted_size
        quality_metrics metrics;
        std::chrono::duration<double, std::milli> processing_time{0};

        std::string error;
        error_kind failure_kind = error_kind::none;
        std::string failed_stage;

        std::vector<std::string> warnings;
        bool placeholder_encoding = false;                 ///< Output bytes are WAV, not the target container
    };

    /**
     * @struct pipeline_config
     * @brief Run-time configuration shared by all jobs of a pipeline
     */
    struct pipeline_config {
        /// Codecs to use. create_registry_with_all_codecs() if null.
        std::shared_ptr<const codecs_registry> registry;
        /// Fixed dither seed for reproducible output; random per job otherwise.
        std::optional<std::uint32_t> dither_seed;
        resample_quality default_resample_quality = resample_quality::sinc;
    };

    /**
     * @class conversion_pipeline
     * @brief Runs the fixed chain of conversion stages
     *
     * Stages, in order:
     *
     * 1. validate options, look up input and output codecs
     * 2. decode
     * 3. trim, then trim silence
     * 4. resample to the target rate
     * 5. fade in / fade out
     * 6. peak normalize
     * 7. loudness normalize
     * 8. requantize (dithered or not) if the bit depth changes
     * 9. remap channels
     * 10. encode
     * 11. quality metrics of the decoded input against the final samples
     *
     * The pipeline holds no per-job state. One instance may run any number
     * of conversions concurrently.
     *
     * @code
     * conversion_pipeline pipeline;
     * conversion_options opts;
     * opts.format.sample_rate = 48000;
     * opts.format.bit_depth = 24;
     *
     * auto result = pipeline.convert(wav_bytes, input_format, opts,
     *     [](const conversion_progress& p) {
     *         std::cout << p.percent << "% " << p.description << "\n";
     *     });
     * if (!result.success) {
     *     std::cerr << result.failed_stage << ": " << result.error << "\n";
     * }
     * @endcode
     */
    class AUDIOCONV_EXPORT conversion_pipeline {
        public:
            explicit conversion_pipeline(pipeline_config config = {});

            /**
             * @brief Convert a complete encoded buffer
             *
             * Never throws. Every failure, including one raised by the
             * progress callback, is reported through the result.
             */
            [[nodiscard]] conversion_result convert(const buffer<uint8>& input,
                                                    const audio_format& input_format,
                                                    const conversion_options& options,
                                                    const progress_callback& on_progress = {}) const;

            /**
             * @brief Run convert() on a worker thread
             *
             * The callback is invoked on the worker thread.
             */
            [[nodiscard]] std::future<conversion_result> convert_async(buffer<uint8> input,
                                                                       audio_format input_format,
                                                                       conversion_options options,
                                                                       progress_callback on_progress = {}) const;

            [[nodiscard]] const pipeline_config& get_config() const;

        private:
            pipeline_config m_config;
    };

    /**
     * @brief Check option ranges before any work is done
     * @throws validation_error describing the first bad option
     */
    AUDIOCONV_EXPORT void validate_options(const conversion_options& options);

    /**
     * @brief convert() on a pipeline with the default configuration
     */
    AUDIOCONV_EXPORT conversion_result convert_audio(const buffer<uint8>& input,
                                                     const audio_format& input_format,
                                                     const conversion_options& options,
                                                     const progress_callback& on_progress = {});

    AUDIOCONV_EXPORT std::future<conversion_result> convert_audio_async(buffer<uint8> input,
                                                                        audio_format input_format,
                                                                        conversion_options options,
                                                                        progress_callback on_progress = {});
}

#endif // AUDIOCONV_CONVERSION_PIPELINE_HH

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
