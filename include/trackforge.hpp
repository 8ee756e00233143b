//
//  trackforge.hpp
//  TrackForge
//
//  Created by Till Toenshoff on 12/9/25.
//  Copyright © 2025 Till Toenshoff. All rights reserved.
//

#pragma once

#include <cstdint>
#include <string>
#include <vector>

#include "frame_extractor.hpp"
#include "geotag.hpp"
#include "interpolator.hpp"
#include "metadata_writer.hpp"
#include "time_zone.hpp"
#include "track_builder.hpp"
#include "track_filters.hpp"

namespace trackforge {

/// @defgroup api TrackForge Public API
/// Public, supported C++ interfaces for geotagging frames of Novatek dash-cam videos.
/// @{

/**
 * @brief Settings for one geotagging run.
 */
struct PipelineOptions {
    std::string timezone = "America/Chicago";  ///< zone the camera clock was set to
    uint32_t samples_per_tick = 1;             ///< frames extracted per GPS sample (fps)
    std::string output_dir = ".";              ///< destination of the renamed frames
    FilterOptions filters;                     ///< file and frame filter stages
};

enum class FileOutcome {
    Tagged,            ///< frames written (possibly zero after frame filters)
    Filtered,          ///< a track filter stage skipped the file
    NoGpsData,         ///< no vendor GPS box
    EmptyTrack,        ///< GPS box without any fix
    StructuralError,   ///< container is corrupt
    OpenFailed,        ///< file could not be read
    ExtractionFailed,  ///< frame extraction or output failed
};

/**
 * @brief Result object for one input file.
 *
 * `ok` is true for Tagged. Skips (Filtered, NoGpsData, EmptyTrack) carry their reason in
 * `message` so operators can tell files without GPS hardware data from corrupt ones.
 */
struct FileStatus {
    bool ok{false};
    FileOutcome outcome{FileOutcome::NoGpsData};
    std::string message;
    uint32_t frames_written{0};
    uint32_t frames_filtered{0};
    uint32_t frames_missing{0};
};

struct BatchStatus {
    std::vector<std::pair<std::string, FileStatus>> files;
    uint32_t tagged{0};
    uint32_t skipped{0};  ///< Filtered, NoGpsData, EmptyTrack
    uint32_t failed{0};   ///< StructuralError, OpenFailed, ExtractionFailed
};

/// Return the TrackForge version string (e.g. `v0.3`).
std::string version_string();  ///< @ingroup api

/// Human readable outcome name.
const char *file_outcome_name(FileOutcome outcome);  ///< @ingroup api

/// Map a track read outcome onto the file outcome reported to callers.
FileOutcome file_outcome_for(TrackOutcome outcome);  ///< @ingroup api

/**
 * @brief Run the whole pipeline for one video.
 *
 * Reads the track, applies the track filters, extracts frames into a scoped temporary
 * directory, interpolates a geotag per frame, applies the frame filters, moves kept frames
 * to `options.output_dir` as `<file_stem>.jpg` and hands them to `writer`.
 */
FileStatus process_file(const std::string &video_path, const PipelineOptions &options,
                        const TimeZone &zone, FrameExtractor &extractor,
                        MetadataWriter &writer);  ///< @ingroup api

/**
 * @brief Process several videos; a failing file never stops the batch.
 *
 * Throws TimeZoneError when `options.timezone` cannot be resolved.
 */
BatchStatus process_batch(const std::vector<std::string> &video_paths,
                          const PipelineOptions &options, FrameExtractor &extractor,
                          MetadataWriter &writer);  ///< @ingroup api

/// @}

}  // namespace trackforge
