//
//  main.cpp
//  TrackForge
//
//  Created by Till Toenshoff on 12/9/25.
//  Copyright © 2025 Till Toenshoff. All rights reserved.
//

#include <filesystem>
#include <iostream>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

#include "logging.hpp"
#include "track_export.hpp"
#include "trackforge.hpp"
#include "trackforge_version.hpp"

namespace {

struct CliOptions {
    trackforge::PipelineOptions pipeline;
    std::vector<std::string> inputs;
    std::string gpx_path;
    std::string json_path;
    std::string ffmpeg = "ffmpeg";
};

uint32_t parse_fps(const std::string &s) {
    size_t used = 0;
    const unsigned long v = std::stoul(s, &used);
    if (used != s.size() || v == 0 || v > 1000) {
        throw std::invalid_argument("--fps expects a whole number between 1 and 1000, got " + s);
    }
    return static_cast<uint32_t>(v);
}

// With several inputs an export path names a directory receiving <video stem><ext>.
std::string export_target(const std::string &path, const std::string &input, size_t input_count,
                          const char *ext) {
    if (path == "-" || input_count == 1) {
        return path;
    }
    std::filesystem::create_directories(path);
    auto name = std::filesystem::path(input).stem();
    name += ext;
    return (std::filesystem::path(path) / name).string();
}

int run_export(const CliOptions &cli) {
    const TimeZone zone = TimeZone::load(cli.pipeline.timezone);
    int failures = 0;
    for (const auto &input : cli.inputs) {
        TF_LOG("info", "Extracting GPS data from " << input << "...");
        const auto res = read_track(input, zone);
        if (res.outcome != TrackOutcome::Ok && res.outcome != TrackOutcome::EmptyTrack) {
            TF_LOG("warn", "File " << input << " skipped: " << res.message);
            ++failures;
            continue;
        }
        if (!cli.gpx_path.empty()) {
            const auto target = export_target(cli.gpx_path, input, cli.inputs.size(), ".gpx");
            if (!write_text_output(target, make_gpx(res.track, input))) {
                ++failures;
            }
        }
        if (!cli.json_path.empty()) {
            const auto target = export_target(cli.json_path, input, cli.inputs.size(), ".json");
            // File names need not be valid UTF-8.
            const auto doc = track_to_json(res.track, input, zone.name())
                                 .dump(2, ' ', false, nlohmann::json::error_handler_t::replace) +
                             "\n";
            if (!write_text_output(target, doc)) {
                ++failures;
            }
        }
    }
    return failures == static_cast<int>(cli.inputs.size()) ? 1 : 0;
}

int run_geotag(const CliOptions &cli) {
    FfmpegFrameExtractor extractor(cli.ffmpeg);
    JsonSidecarWriter writer;
    const auto batch = trackforge::process_batch(cli.inputs, cli.pipeline, extractor, writer);
    for (const auto &[path, status] : batch.files) {
        std::cout << path << ": " << trackforge::file_outcome_name(status.outcome);
        if (status.outcome == trackforge::FileOutcome::Tagged) {
            std::cout << " (" << status.frames_written << " frames)";
        } else if (!status.message.empty()) {
            std::cout << " (" << status.message << ")";
        }
        std::cout << "\n";
    }
    return (batch.failed == batch.files.size() && !batch.files.empty()) ? 1 : 0;
}

void print_usage() {
    std::cerr << "TrackForge " << TRACKFORGE_VERSION_DISPLAY << "\n"
              << "Copyright (c) 2025 Till Toenshoff\n\n"
              << "usage for geotagging frames:\n"
              << "  trackforge <video.mp4>... [--output DIR] [--tz ZONE] [--fps N]\n"
              << "             [--ignore-point LAT,LON,RADIUS]... [--no-filters] [--ffmpeg PATH]\n"
              << "usage for exporting the track:\n"
              << "  trackforge <video.mp4>... [--gpx FILE|-] [--json FILE|-] [--tz ZONE]\n"
              << "Options:\n"
              << "  --output DIR        Destination of the geotagged frames (default: .).\n"
              << "  --tz ZONE           Time zone the camera clock was set to, IANA name,\n"
              << "                      or +HH:MM (default: America/Chicago).\n"
              << "  --fps N             Frames to extract per second of video (default: 1).\n"
              << "  --ignore-point P    Do not write frames within RADIUS meters of LAT,LON.\n"
              << "  --no-filters        Keep night-time, stationary and slow frames.\n"
              << "  --gpx FILE          Write the track as GPX instead of extracting frames.\n"
              << "  --json FILE         Write the track as JSON instead of extracting frames.\n"
              << "  --log-level LEVEL   Set logging verbosity (default: info).\n";
}

}  // namespace

int main(int argc, char **argv) {
    if (argc == 2 && (std::string(argv[1]) == "--version" || std::string(argv[1]) == "-v")) {
        std::cout << "TrackForge " << TRACKFORGE_VERSION_DISPLAY << "\n";
        return 0;
    }

    CliOptions cli;
    try {
        for (int i = 1; i < argc; ++i) {
            std::string arg = argv[i];
            const bool has_value = i + 1 < argc;
            if (arg == "--output" && has_value) {
                cli.pipeline.output_dir = argv[++i];
            } else if (arg == "--tz" && has_value) {
                cli.pipeline.timezone = argv[++i];
            } else if (arg == "--fps" && has_value) {
                cli.pipeline.samples_per_tick = parse_fps(argv[++i]);
            } else if (arg == "--ignore-point" && has_value) {
                const std::string value = argv[++i];
                auto zone = parse_exclusion_zone(value);
                if (!zone) {
                    throw std::invalid_argument(
                        "ignore points should be in the format lat,lon,radius, got " + value);
                }
                cli.pipeline.filters.exclusion_zones.push_back(*zone);
            } else if (arg == "--no-filters") {
                cli.pipeline.filters.enabled = false;
            } else if (arg == "--gpx" && has_value) {
                cli.gpx_path = argv[++i];
            } else if (arg == "--json" && has_value) {
                cli.json_path = argv[++i];
            } else if (arg == "--ffmpeg" && has_value) {
                cli.ffmpeg = argv[++i];
            } else if (arg == "--log-level" && has_value) {
                trackforge::set_log_verbosity(trackforge::parse_log_verbosity(argv[++i]));
            } else if (!arg.empty() && arg[0] == '-' && arg != "-") {
                std::cerr << "Unknown option: " << arg << "\n";
                return 2;
            } else {
                cli.inputs.emplace_back(std::move(arg));
            }
        }
    } catch (const std::exception &e) {
        // std::stoul throws invalid_argument/out_of_range for malformed numbers.
        std::cerr << "Invalid argument: " << e.what() << "\n";
        return 2;
    }

    if (cli.inputs.empty()) {
        print_usage();
        return 2;
    }

    try {
        if (!cli.gpx_path.empty() || !cli.json_path.empty()) {
            return run_export(cli);
        }
        return run_geotag(cli);
    } catch (const TimeZoneError &e) {
        TF_LOG("error", "trackforge: " << e.what());
        return 2;
    } catch (const std::filesystem::filesystem_error &e) {
        TF_LOG("error", "trackforge: " << e.what());
        return 1;
    }
}
