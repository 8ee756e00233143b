//
//  trackforge.cpp
//  TrackForge
//
//  Created by Till Toenshoff on 12/9/25.
//  Copyright © 2025 Till Toenshoff. All rights reserved.
//
#include "trackforge.hpp"
#include "trackforge_version.hpp"

#include <cerrno>
#include <filesystem>
#include <set>
#include <system_error>
#include <utility>

#include "logging.hpp"

namespace trackforge {

std::string version_string() { return TRACKFORGE_VERSION_DISPLAY; }

const char *file_outcome_name(FileOutcome outcome) {
    switch (outcome) {
        case FileOutcome::Tagged:
            return "tagged";
        case FileOutcome::Filtered:
            return "filtered";
        case FileOutcome::NoGpsData:
            return "no GPS data";
        case FileOutcome::EmptyTrack:
            return "empty track";
        case FileOutcome::StructuralError:
            return "structurally invalid container";
        case FileOutcome::OpenFailed:
            return "cannot read file";
        case FileOutcome::ExtractionFailed:
        default:
            return "extraction failed";
    }
}

FileOutcome file_outcome_for(TrackOutcome outcome) {
    switch (outcome) {
        case TrackOutcome::Ok:
            return FileOutcome::Tagged;
        case TrackOutcome::EmptyTrack:
            return FileOutcome::EmptyTrack;
        case TrackOutcome::StructuralError:
            return FileOutcome::StructuralError;
        case TrackOutcome::OpenFailed:
            return FileOutcome::OpenFailed;
        case TrackOutcome::NoGpsData:
        default:
            return FileOutcome::NoGpsData;
    }
}

}  // namespace trackforge

namespace {

using trackforge::FileOutcome;
using trackforge::FileStatus;

FileStatus make_status(FileOutcome outcome, std::string message) {
    FileStatus status;
    status.ok = outcome == FileOutcome::Tagged;
    status.outcome = outcome;
    status.message = std::move(message);
    return status;
}

// Rename, falling back to copy + remove when source and destination are on different devices.
bool move_file(const std::filesystem::path &from, const std::filesystem::path &to,
               std::string *error_out) {
    std::error_code ec;
    std::filesystem::rename(from, to, ec);
    if (!ec) {
        return true;
    }
    TF_LOG("io", "rename " << from.string() << " -> " << to.string() << " failed ("
                           << ec.message() << "), copying");
    ec.clear();
    std::filesystem::copy_file(from, to, std::filesystem::copy_options::overwrite_existing, ec);
    if (ec) {
        if (error_out) *error_out = "cannot write " + to.string() + ": " + ec.message();
        return false;
    }
    std::filesystem::remove(from, ec);
    return true;
}

}  // namespace

namespace trackforge {

FileStatus process_file(const std::string &video_path, const PipelineOptions &options,
                        const TimeZone &zone, FrameExtractor &extractor,
                        MetadataWriter &writer) {
    if (options.samples_per_tick == 0) {
        return make_status(FileOutcome::ExtractionFailed, "samples per tick must be at least 1");
    }

    TF_LOG("info", "Extracting GPS data from " << video_path << "...");
    const auto track = read_track(video_path, zone);
    if (!track.ok()) {
        TF_LOG("info", "File " << video_path << " skipped: " << track.message);
        return make_status(file_outcome_for(track.outcome), track.message);
    }

    const auto chain = make_filter_chain(options.filters);
    if (auto reason = chain.check_track(track.track)) {
        TF_LOG("info", "File " << video_path << " " << *reason << ", so skipping it");
        return make_status(FileOutcome::Filtered, *reason);
    }

    const auto plans = plan_frames(track.track, options.samples_per_tick);

    ScopedTempDir frames_dir("trackforge-frames");
    if (!frames_dir.valid()) {
        return make_status(FileOutcome::ExtractionFailed, "cannot create temporary directory");
    }

    TF_LOG("info", "Generating frames from " << video_path << "...");
    std::string error;
    if (!extractor.extract(video_path, frames_dir.path(), options.samples_per_tick, &error)) {
        TF_LOG("error", "frame extraction failed for " << video_path << ": " << error);
        return make_status(FileOutcome::ExtractionFailed, error);
    }

    const std::filesystem::path output_dir(options.output_dir);
    std::error_code ec;
    std::filesystem::create_directories(output_dir, ec);
    if (ec) {
        return make_status(FileOutcome::ExtractionFailed,
                           "cannot create " + output_dir.string() + ": " + ec.message());
    }

    TF_LOG("info", "Applying GPS data to frames...");
    FileStatus status = make_status(FileOutcome::Tagged, "");
    std::set<std::string> used_stems;
    for (const auto &plan : plans) {
        if (auto stage = chain.check_frame(plan.point)) {
            TF_LOG("filter", "frame " << plan.frame_number << " dropped by " << *stage);
            ++status.frames_filtered;
            continue;
        }
        const auto source = frame_path(frames_dir.path(), plan.frame_number);
        if (!std::filesystem::exists(source, ec)) {
            // The video ended before the GPS index did.
            ++status.frames_missing;
            continue;
        }

        const GeoTag tag = build_geotag(plan.point);
        std::string stem = tag.file_stem;
        for (uint32_t n = 1; !used_stems.insert(stem).second; ++n) {
            stem = tag.file_stem + "-" + std::to_string(n);
        }
        const auto target = output_dir / (stem + ".jpg");
        if (!move_file(source, target, &error) || !writer.write(target, tag, &error)) {
            TF_LOG("error", "output failed for frame " << plan.frame_number << ": " << error);
            status = make_status(FileOutcome::ExtractionFailed, error);
            return status;
        }
        ++status.frames_written;
    }

    if (status.frames_missing > 0) {
        TF_LOG("warn", video_path << ": " << status.frames_missing
                                  << " planned frames were not produced by the extractor");
    }
    TF_LOG("info", video_path << ": wrote " << status.frames_written << " frames, filtered "
                              << status.frames_filtered);
    return status;
}

BatchStatus process_batch(const std::vector<std::string> &video_paths,
                          const PipelineOptions &options, FrameExtractor &extractor,
                          MetadataWriter &writer) {
    const TimeZone zone = TimeZone::load(options.timezone);
    BatchStatus batch;
    for (const auto &path : video_paths) {
        FileStatus status = process_file(path, options, zone, extractor, writer);
        switch (status.outcome) {
            case FileOutcome::Tagged:
                ++batch.tagged;
                break;
            case FileOutcome::Filtered:
            case FileOutcome::NoGpsData:
            case FileOutcome::EmptyTrack:
                ++batch.skipped;
                break;
            case FileOutcome::StructuralError:
            case FileOutcome::OpenFailed:
            case FileOutcome::ExtractionFailed:
            default:
                ++batch.failed;
                TF_LOG("warn", path << ": " << file_outcome_name(status.outcome) << ": "
                                    << status.message);
                break;
        }
        batch.files.emplace_back(path, std::move(status));
    }
    TF_LOG("info", "Done. tagged=" << batch.tagged << " skipped=" << batch.skipped
                                   << " failed=" << batch.failed);
    return batch;
}

}  // namespace trackforge
