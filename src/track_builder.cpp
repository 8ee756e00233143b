//
//  track_builder.cpp
//  TrackForge
//
//  Created by Till Toenshoff on 12/9/25.
//  Copyright © 2025 Till Toenshoff. All rights reserved.
//

#include "track_builder.hpp"

#include <cerrno>
#include <chrono>
#include <fstream>
#include <sstream>
#include <system_error>

#include "atom_walker.hpp"
#include "logging.hpp"

Track build_track(std::istream &in, const std::vector<GpsIndexEntry> &entries,
                  const TimeZone &zone, TrackStats *stats) {
    Track track;
    track.reserve(entries.size());
    TrackStats local;
    local.entries = static_cast<uint32_t>(entries.size());

    for (const auto &entry : entries) {
        const auto decoded = read_gps_record(in, entry, zone);
        switch (decoded.status) {
            case RecordStatus::Ok:
                ++local.fixes;
                track.emplace_back(decoded.sample);
                break;
            case RecordStatus::NoFix:
                ++local.no_fix;
                track.emplace_back(std::nullopt);
                break;
            case RecordStatus::MalformedRecord:
            default:
                ++local.malformed;
                track.emplace_back(std::nullopt);
                break;
        }
    }
    if (stats) {
        *stats = local;
    }
    return track;
}

TrackResult read_track(std::istream &in, const TimeZone &zone) {
    const auto t_start = std::chrono::steady_clock::now();
    TrackResult result;

    const auto size = stream_size(in);
    if (!size) {
        result.outcome = TrackOutcome::OpenFailed;
        result.message = "source is not seekable";
        return result;
    }

    const auto index = locate_gps_index(in, *size);
    switch (index.status) {
        case GpsIndexStatus::StructuralError:
            result.outcome = TrackOutcome::StructuralError;
            result.message = "structurally invalid container: " + index.error;
            return result;
        case GpsIndexStatus::NoGpsBox:
            result.outcome = TrackOutcome::NoGpsData;
            result.message = "no GPS data";
            return result;
        case GpsIndexStatus::Found:
        default:
            break;
    }

    result.track = build_track(in, index.entries, zone, &result.stats);
    if (result.stats.fixes == 0) {
        result.outcome = TrackOutcome::EmptyTrack;
        result.message = "empty track (" + std::to_string(result.stats.entries) + " entries, no fix)";
    } else {
        result.outcome = TrackOutcome::Ok;
    }

    const auto ms_total = std::chrono::duration_cast<std::chrono::milliseconds>(
                              std::chrono::steady_clock::now() - t_start)
                              .count();
    TF_LOG("parser", "read_track done entries=" << result.stats.entries
                                                << " fixes=" << result.stats.fixes
                                                << " no_fix=" << result.stats.no_fix
                                                << " malformed=" << result.stats.malformed
                                                << " zone=" << zone.name()
                                                << " total_ms=" << ms_total);
    return result;
}

TrackResult read_track(const std::string &path, const TimeZone &zone) {
    std::ifstream in(path, std::ios::binary);
    if (!in) {
        TF_LOG("error", "read_track: cannot open " << path << " errno=" << errno << " ("
                                                   << std::generic_category().message(errno)
                                                   << ")");
        TrackResult result;
        result.outcome = TrackOutcome::OpenFailed;
        result.message = "cannot open " + path;
        return result;
    }
    TF_LOG("parser", "read_track enter path=" << path);
    return read_track(in, zone);
}

TrackResult read_track(const std::vector<uint8_t> &bytes, const TimeZone &zone) {
    std::istringstream in(std::string(bytes.begin(), bytes.end()), std::ios::binary);
    return read_track(in, zone);
}

const char *track_outcome_name(TrackOutcome outcome) {
    switch (outcome) {
        case TrackOutcome::Ok:
            return "ok";
        case TrackOutcome::EmptyTrack:
            return "empty track";
        case TrackOutcome::NoGpsData:
            return "no GPS data";
        case TrackOutcome::StructuralError:
            return "structurally invalid container";
        case TrackOutcome::OpenFailed:
        default:
            return "cannot read file";
    }
}
