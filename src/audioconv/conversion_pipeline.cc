// This is copyrighted software. More information is at the end of this file.
#include <audioconv/conversion_pipeline.hh>
#include <audioconv/error.hh>
#include <audioconv/codecs/register_codecs.hh>
#include <audioconv/sdk/codec.hh>
#include <audioconv/sdk/codecs_registry.hh>
#include <audioconv/sdk/channel_remapper.hh>
#include <audioconv/sdk/ditherer.hh>
#include <audioconv/sdk/envelope.hh>
#include <audioconv/sdk/loudness_processor.hh>
#include <failsafe/failsafe.hh>

#include <utility>

namespace chrono = std::chrono;

namespace audioconv {
    namespace {
        using clock_type = chrono::steady_clock;

        struct codec_pair {
            std::shared_ptr<const codec> input;
            std::shared_ptr<const codec> output;
        };

        class progress_reporter {
            public:
                progress_reporter(const progress_callback& callback, clock_type::time_point started)
                    : m_callback(callback), m_started(started) {
                }

                void operator()(conversion_phase phase, int percent, const char* description) const {
                    LOG_DEBUG("conversion_pipeline", conversion_phase_name(phase), percent, "%", description);
                    if (!m_callback) {
                        return;
                    }
                    conversion_progress p;
                    p.phase = phase;
                    p.percent = percent;
                    p.description = description;
                    if (percent > 0 && percent < 100) {
                        const chrono::duration<double> elapsed = clock_type::now() - m_started;
                        p.time_remaining = elapsed.count() * (100 - percent) / percent;
                    }
                    m_callback(p);
                }

            private:
                const progress_callback& m_callback;
                clock_type::time_point m_started;
        };

        // Feeds the samples of a successful outcome through one more stage.
        template<typename Fn>
        stage_outcome<pcm_data> next_stage(stage_outcome<pcm_data> in, const char* name, Fn&& fn) {
            return std::move(in).and_then([&](pcm_data samples) {
                return run_stage(name, [&] {
                    return fn(std::move(samples));
                });
            });
        }

        std::shared_ptr<const codecs_registry> registry_or_default(const pipeline_config& config) {
            if (config.registry) {
                return config.registry;
            }
            return create_registry_with_all_codecs();
        }

        codec_pair lookup_codecs(const codecs_registry& registry,
                                 const audio_format& input_format,
                                 const audio_format& output_format) {
            codec_pair codecs{registry.find(input_format.container), registry.find(output_format.container)};
            if (!codecs.input) {
                throw unsupported_format_error(std::string("Unsupported input format: ") +
                                               container_name(input_format.container));
            }
            if (!codecs.output) {
                throw unsupported_format_error(std::string("Unsupported output format: ") +
                                               container_name(output_format.container));
            }
            codecs.output->validate_target(output_format);
            return codecs;
        }

        conversion_result failure(const conversion_error& err,
                                  const conversion_options& options,
                                  std::size_t input_size,
                                  clock_type::time_point started) {
            conversion_result result;
            result.success = false;
            result.format = options.format;
            result.original_size = input_size;
            result.error = err.message;
            result.failure_kind = err.kind;
            result.failed_stage = err.stage;
            result.processing_time = clock_type::now() - started;
            LOG_ERROR("conversion_pipeline", "Conversion failed in stage", err.stage,
                      "(", error_kind_name(err.kind), "):", err.message);
            return result;
        }

        conversion_result run_job(const codecs_registry& registry,
                                  const pipeline_config& config,
                                  const buffer<uint8>& input,
                                  const audio_format& input_format,
                                  const conversion_options& options,
                                  const progress_reporter& report,
                                  clock_type::time_point started) {
            const auto& target = options.format;

            report(conversion_phase::analyzing, 0, "Analyzing input format");

            auto codecs = run_stage("validate", [&] {
                validate_options(options);
                return lookup_codecs(registry, input_format, target);
            });
            if (!codecs) {
                return failure(codecs.error(), options, input.size(), started);
            }
            const auto& input_codec = codecs.value().input;
            const auto& output_codec = codecs.value().output;

            report(conversion_phase::analyzing, 25, "Decoding input audio");

            auto decoded = run_stage("decode", [&] {
                return input_codec->decode(input);
            });
            if (!decoded) {
                return failure(decoded.error(), options, input.size(), started);
            }
            const audio_format source_format = decoded.value().format;
            const pcm_data original = std::move(decoded.value().samples);
            LOG_DEBUG("conversion_pipeline", "Decoded", source_format, "with", original.frames(), "frames");

            std::vector<std::string> warnings;

            report(conversion_phase::processing, 40, "Processing audio data");

            stage_outcome<pcm_data> samples = run_stage("copy", [&] {
                return original.clone();
            });

            if (options.trim) {
                samples = next_stage(std::move(samples), "trim", [&](pcm_data s) {
                    return trim(std::move(s), options.trim->start, options.trim->end,
                                source_format.sample_rate);
                });
            }
            if (options.trim_silence) {
                samples = next_stage(std::move(samples), "trim_silence", [&](pcm_data s) {
                    return trim_silence(std::move(s));
                });
            }

            report(conversion_phase::processing, 50, "Resampling audio");

            if (source_format.sample_rate != target.sample_rate) {
                const auto quality = options.resampling.value_or(config.default_resample_quality);
                samples = next_stage(std::move(samples), "resample", [&](pcm_data s) {
                    return resample(std::move(s), source_format.sample_rate, target.sample_rate, quality);
                });
            }

            report(conversion_phase::processing, 60, "Applying audio effects");

            if (options.fade_in || options.fade_out) {
                samples = next_stage(std::move(samples), "fade", [&](pcm_data s) {
                    return apply_fades(std::move(s), options.fade_in.value_or(0.0),
                                       options.fade_out.value_or(0.0), target.sample_rate);
                });
            }
            if (options.normalize) {
                samples = next_stage(std::move(samples), "normalize", [&](pcm_data s) {
                    return normalize_peak(std::move(s));
                });
            }
            if (options.loudness_normalization) {
                samples = next_stage(std::move(samples), "loudness", [&](pcm_data s) {
                    if (loudness_processor::rms(s) <= 0.0) {
                        warnings.emplace_back("Input is silent; loudness normalization skipped");
                    }
                    return loudness_processor::normalize(std::move(s), *options.loudness_normalization);
                });
            }

            report(conversion_phase::processing, 70, "Converting bit depth");

            if (source_format.bit_depth != target.bit_depth) {
                samples = next_stage(std::move(samples), "requantize", [&](pcm_data s) {
                    if (!options.dither) {
                        return ditherer::requantize(std::move(s), target.bit_depth);
                    }
                    ditherer d = config.dither_seed ? ditherer(*config.dither_seed) : ditherer();
                    return d.apply(std::move(s), target.bit_depth, options.noise_shaping);
                });
            }
            samples = next_stage(std::move(samples), "channels", [&](pcm_data s) {
                if (s.channel_count() == target.channels) {
                    return s;
                }
                return channel_remapper::convert_channels(std::move(s), target.channels);
            });
            if (!samples) {
                return failure(samples.error(), options, input.size(), started);
            }

            report(conversion_phase::encoding, 80, "Encoding output format");

            auto encoded = run_stage("encode", [&] {
                return output_codec->encode(samples.value(), target);
            });
            if (!encoded) {
                return failure(encoded.error(), options, input.size(), started);
            }

            report(conversion_phase::finalizing, 90, "Calculating quality metrics");

            auto metrics = run_stage("metrics", [&] {
                return quality_metrics_calculator::calculate(original, samples.value());
            });
            if (!metrics) {
                return failure(metrics.error(), options, input.size(), started);
            }

            conversion_result result;
            result.success = true;
            result.output = std::move(encoded).value();
            result.format = target;
            if (!result.format.codec) {
                result.format.codec = std::string(output_codec->get_name());
            }
            result.original_size = input.size();
            result.converted_size = result.output.size();
            result.compression_ratio = result.converted_size > 0
                                           ? static_cast<double>(result.original_size) / result.converted_size
                                           : 0.0;
            result.metrics = metrics.value();
            result.warnings = std::move(warnings);

            if (output_codec->is_placeholder()) {
                result.placeholder_encoding = true;
                result.warnings.push_back(std::string(output_codec->get_name()) +
                                          " encoder is a placeholder; output uses the WAV layout");
                LOG_WARN("conversion_pipeline", "Output for", container_name(target.container),
                         "written with the WAV layout");
            }

            report(conversion_phase::finalizing, 100, "Conversion complete");

            result.processing_time = clock_type::now() - started;
            return result;
        }
    }

    const char* conversion_phase_name(conversion_phase phase) {
        switch (phase) {
            case conversion_phase::analyzing: return "analyzing";
            case conversion_phase::processing: return "processing";
            case conversion_phase::encoding: return "encoding";
            case conversion_phase::finalizing: return "finalizing";
        }
        return "unknown";
    }

    void validate_options(const conversion_options& options) {
        validate_format(options.format);
        if (options.fade_in && *options.fade_in < 0.0) {
            throw validation_error("Fade-in duration must not be negative");
        }
        if (options.fade_out && *options.fade_out < 0.0) {
            throw validation_error("Fade-out duration must not be negative");
        }
        if (options.trim) {
            if (options.trim->start < 0.0 || options.trim->end < 0.0) {
                throw validation_error("Trim times must not be negative");
            }
            if (options.trim->end < options.trim->start) {
                throw validation_error("Trim end must not precede trim start");
            }
        }
    }

    conversion_pipeline::conversion_pipeline(pipeline_config config)
        : m_config(std::move(config)) {
        if (!m_config.registry) {
            m_config.registry = registry_or_default(m_config);
        }
    }

    const pipeline_config& conversion_pipeline::get_config() const {
        return m_config;
    }

    conversion_result conversion_pipeline::convert(const buffer<uint8>& input,
                                                   const audio_format& input_format,
                                                   const conversion_options& options,
                                                   const progress_callback& on_progress) const {
        const auto started = clock_type::now();
        LOG_INFO("conversion_pipeline", "Converting", input.size(), "bytes of",
                 container_name(input_format.container), "to", options.format);

        const progress_reporter report(on_progress, started);
        auto outcome = run_stage("pipeline", [&] {
            return run_job(*m_config.registry, m_config, input, input_format, options, report, started);
        });
        if (!outcome) {
            return failure(outcome.error(), options, input.size(), started);
        }

        auto result = std::move(outcome).value();
        if (result.success) {
            LOG_INFO("conversion_pipeline", "Converted to", result.converted_size, "bytes in",
                     result.processing_time.count(), "ms");
        }
        return result;
    }

    std::future<conversion_result> conversion_pipeline::convert_async(buffer<uint8> input,
                                                                      audio_format input_format,
                                                                      conversion_options options,
                                                                      progress_callback on_progress) const {
        return std::async(std::launch::async,
                          [pipeline = *this, input = std::move(input),
                           input_format = std::move(input_format), options = std::move(options),
                           on_progress = std::move(on_progress)]() {
                              return pipeline.convert(input, input_format, options, on_progress);
                          });
    }

    conversion_result convert_audio(const buffer<uint8>& input,
                                    const audio_format& input_format,
                                    const conversion_options& options,
                                    const progress_callback& on_progress) {
        return conversion_pipeline().convert(input, input_format, options, on_progress);
    }

    std::future<conversion_result> convert_audio_async(buffer<uint8> input,
                                                       audio_format input_format,
                                                       conversion_options options,
                                                       progress_callback on_progress) {
        return conversion_pipeline().convert_async(std::move(input), std::move(input_format),
                                                   std::move(options), std::move(on_progress));
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
