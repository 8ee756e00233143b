//
//  gps_locator.hpp
//  TrackForge
//
//  Created by Till Toenshoff on 12/9/25.
//  Copyright © 2025 Till Toenshoff. All rights reserved.
//

#pragma once

#include <cstdint>
#include <istream>
#include <string>
#include <vector>

#include "gps_record.hpp"

// The index table starts this far into the vendor box (box header + vendor header).
inline constexpr uint64_t kGpsIndexTableOffset = 16;
inline constexpr uint64_t kGpsIndexEntrySize = 8;

enum class GpsIndexStatus {
    Found,            // moov/gps box present; entries may still be empty.
    NoGpsBox,         // no moov, or no "gps " box inside it.
    StructuralError,  // box sizes inconsistent while searching.
};

struct GpsIndexResult {
    GpsIndexStatus status = GpsIndexStatus::NoGpsBox;
    // All entries in table order. Oversized entries stay in place so that later entries keep
    // their tick position; the record reader refuses to load them.
    std::vector<GpsIndexEntry> entries;
    uint32_t oversized = 0;
    uint64_t box_offset = 0;
    std::string error;
};

// Locate moov/"gps " in the first `file_size` bytes of `in` and read its index table.
GpsIndexResult locate_gps_index(std::istream &in, uint64_t file_size);
