//
//  gps_locator.cpp
//  TrackForge
//
//  Created by Till Toenshoff on 12/9/25.
//  Copyright © 2025 Till Toenshoff. All rights reserved.
//

#include "gps_locator.hpp"

#include "atom_walker.hpp"
#include "byte_order.hpp"
#include "fourcc_utils.hpp"
#include "logging.hpp"

GpsIndexResult locate_gps_index(std::istream &in, uint64_t file_size) {
    GpsIndexResult result;
    Region file_region;
    file_region.end = file_size;

    const auto found = find_atom_path(in, file_region, {kMoovType, kGpsBoxType});
    if (found.status == AtomPathStatus::StructuralError) {
        result.status = GpsIndexStatus::StructuralError;
        result.error = found.error;
        return result;
    }
    if (found.status == AtomPathStatus::Missing) {
        TF_LOG("parser", "no moov/gps box in " << file_size << " bytes");
        result.status = GpsIndexStatus::NoGpsBox;
        return result;
    }

    result.status = GpsIndexStatus::Found;
    result.box_offset = found.header.offset;
    const uint64_t box_end = found.payload.end;
    uint64_t pos = found.header.offset + kGpsIndexTableOffset;
    TF_LOG("parser", "gps box @" << found.header.offset << " size=" << found.header.size
                                 << " table bytes="
                                 << (box_end > pos ? box_end - pos : 0));

    in.clear();
    in.seekg(static_cast<std::streamoff>(pos), std::ios::beg);
    while (pos + kGpsIndexEntrySize <= box_end) {
        GpsIndexEntry entry;
        entry.offset = read_u32(in);
        entry.size = read_u32(in);
        if (!in) {
            TF_LOG("warn", "gps index truncated at " << pos);
            break;
        }
        if (entry.size > kMaxGpsRecordSize) {
            ++result.oversized;
            TF_LOG("warn", "gps index entry " << result.entries.size() << " claims "
                                              << entry.size << " bytes at offset "
                                              << entry.offset << "; skipping");
        }
        result.entries.push_back(entry);
        pos += kGpsIndexEntrySize;
    }
    TF_LOG("parser", "gps index entries=" << result.entries.size()
                                          << " oversized=" << result.oversized);
    return result;
}
