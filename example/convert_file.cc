/**
 * @example convert_file.cc
 * @brief Convert an audio file on disk to another format
 *
 * The output container is taken from the output file extension. Anything
 * not given on the command line is kept from the input.
 */

// This is copyrighted software. More information is at the end of this file.
#include <audioconv/audio_analyzer.hh>
#include <audioconv/conversion_pipeline.hh>
#include <audioconv/conversion_presets.hh>
#include <audioconv/error.hh>
#include <audioconv/codecs/register_codecs.hh>
#include <audioconv/sdk/codec.hh>
#include <audioconv/sdk/codecs_registry.hh>
#include <failsafe/failsafe.hh>

#include <cstdlib>
#include <cstring>
#include <filesystem>
#include <iostream>
#include <string>

namespace {
    void usage(const char* prog) {
        std::cerr << "Usage: " << prog << " <input> <output> [options]\n"
                  << "  --preset <name>         start from a preset, later options override it\n"
                  << "  --rate <hz>             target sample rate\n"
                  << "  --bits <8|16|24|32>     target bit depth\n"
                  << "  --channels <n>          target channel count\n"
                  << "  --quality <linear|cubic|sinc>\n"
                  << "  --trim <start> <end>    keep a section, in seconds\n"
                  << "  --trim-silence\n"
                  << "  --fade-in <s>\n"
                  << "  --fade-out <s>\n"
                  << "  --normalize             peak normalize\n"
                  << "  --loudness <lu>         loudness normalize\n"
                  << "  --no-dither\n"
                  << "  --noise-shaping\n"
                  << "  --seed <n>              fixed dither seed\n"
                  << "Presets:";
        for (const auto& name : audioconv::presets::names()) {
            std::cerr << ' ' << name;
        }
        std::cerr << '\n';
    }

    audioconv::resample_quality parse_quality(const std::string& name) {
        if (name == "linear") return audioconv::resample_quality::linear;
        if (name == "cubic") return audioconv::resample_quality::cubic;
        if (name == "sinc") return audioconv::resample_quality::sinc;
        throw audioconv::validation_error("Unknown resample quality: " + name);
    }

    const char* next_arg(int argc, char* argv[], int& i) {
        if (i + 1 >= argc) {
            throw audioconv::validation_error(std::string("Missing value for ") + argv[i]);
        }
        return argv[++i];
    }
}

int main(int argc, char* argv[]) {
    if (argc < 3) {
        usage(argv[0]);
        return 1;
    }

    try {
        const std::filesystem::path input_path = argv[1];
        const std::filesystem::path output_path = argv[2];

        auto registry = audioconv::create_registry_with_all_codecs();
        auto input = audioconv::load_file(input_path);
        auto info = audioconv::analyze_audio(input, registry);
        std::cout << "Input: " << input_path.u8string() << " (" << info.format << ", "
                  << info.duration << " s, " << audioconv::quality_tier_name(info.estimated_quality) << ")\n";

        auto output_codec = registry->find_by_extension(output_path.extension().u8string());
        if (!output_codec) {
            std::cerr << "No codec for output extension '" << output_path.extension().u8string() << "'\n";
            return 1;
        }

        audioconv::conversion_options options;
        options.format = info.format;
        options.format.container = output_codec->get_container();
        options.format.codec.reset();
        options.format.quality.reset();

        audioconv::pipeline_config config;
        config.registry = registry;

        for (int i = 3; i < argc; ++i) {
            const char* arg = argv[i];
            if (std::strcmp(arg, "--preset") == 0) {
                const std::string name = next_arg(argc, argv, i);
                auto preset = audioconv::presets::find(name);
                if (!preset) {
                    throw audioconv::validation_error("Unknown preset: " + name);
                }
                options = *preset;
            } else if (std::strcmp(arg, "--rate") == 0) {
                options.format.sample_rate = static_cast<audioconv::sample_rate_t>(std::atol(next_arg(argc, argv, i)));
            } else if (std::strcmp(arg, "--bits") == 0) {
                options.format.bit_depth = static_cast<audioconv::bit_depth_t>(std::atoi(next_arg(argc, argv, i)));
            } else if (std::strcmp(arg, "--channels") == 0) {
                options.format.channels = static_cast<audioconv::channels_t>(std::atoi(next_arg(argc, argv, i)));
            } else if (std::strcmp(arg, "--quality") == 0) {
                options.resampling = parse_quality(next_arg(argc, argv, i));
            } else if (std::strcmp(arg, "--trim") == 0) {
                audioconv::trim_range range;
                range.start = std::atof(next_arg(argc, argv, i));
                range.end = std::atof(next_arg(argc, argv, i));
                options.trim = range;
            } else if (std::strcmp(arg, "--trim-silence") == 0) {
                options.trim_silence = true;
            } else if (std::strcmp(arg, "--fade-in") == 0) {
                options.fade_in = std::atof(next_arg(argc, argv, i));
            } else if (std::strcmp(arg, "--fade-out") == 0) {
                options.fade_out = std::atof(next_arg(argc, argv, i));
            } else if (std::strcmp(arg, "--normalize") == 0) {
                options.normalize = true;
            } else if (std::strcmp(arg, "--loudness") == 0) {
                options.loudness_normalization = std::atof(next_arg(argc, argv, i));
            } else if (std::strcmp(arg, "--no-dither") == 0) {
                options.dither = false;
            } else if (std::strcmp(arg, "--noise-shaping") == 0) {
                options.noise_shaping = true;
            } else if (std::strcmp(arg, "--seed") == 0) {
                config.dither_seed = static_cast<std::uint32_t>(std::strtoul(next_arg(argc, argv, i), nullptr, 10));
            } else {
                std::cerr << "Unknown option " << arg << "\n";
                usage(argv[0]);
                return 1;
            }
        }

        audioconv::conversion_pipeline pipeline(config);
        auto result = pipeline.convert(input, info.format, options,
                                       [](const audioconv::conversion_progress& p) {
                                           std::cout << "[" << p.percent << "%] " << p.description;
                                           if (p.time_remaining) {
                                               std::cout << " (~" << *p.time_remaining << " s left)";
                                           }
                                           std::cout << "\n";
                                       });
        if (!result.success) {
            std::cerr << "Conversion failed in " << result.failed_stage << " ("
                      << audioconv::error_kind_name(result.failure_kind) << "): " << result.error << "\n";
            return 1;
        }
        for (const auto& w : result.warnings) {
            std::cerr << "Warning: " << w << "\n";
        }

        audioconv::save_file(output_path, result.output);

        std::cout << "Output: " << output_path.u8string() << " (" << result.format << ")\n"
                  << "  size " << result.original_size << " -> " << result.converted_size
                  << " bytes, ratio " << result.compression_ratio << "\n"
                  << "  peak " << result.metrics.peak_level << " dBFS, rms " << result.metrics.rms_level
                  << " dBFS, loudness " << result.metrics.loudness << " LU\n"
                  << "  " << result.processing_time.count() << " ms\n";
    } catch (const audioconv::validation_error& e) {
        std::cerr << "Invalid arguments: " << e.what() << '\n';
        usage(argv[0]);
        return 1;
    } catch (const std::exception& e) {
        LOG_ERROR("convert_file", e.what());
        std::cerr << "Error: " << e.what() << '\n';
        return 1;
    }

    return 0;
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
