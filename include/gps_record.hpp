//
//  gps_record.hpp
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

#include "gps_sample.hpp"
#include "time_zone.hpp"

// Entry of the index table inside the vendor "gps " box.
struct GpsIndexEntry {
    uint32_t offset = 0;  // absolute file offset of the record
    uint32_t size = 0;    // record size in bytes
};

inline constexpr uint32_t kMaxGpsRecordSize = 100000;
inline constexpr size_t kGpsRecordHeaderSize = 12;  // size + "free" + "GPS "
inline constexpr size_t kGpsRecordBodyOffset = 16;
inline constexpr size_t kGpsRecordBodySize = 44;
inline constexpr size_t kGpsRecordMinSize = kGpsRecordBodyOffset + kGpsRecordBodySize;
inline constexpr double kKnotsToMetersPerSecond = 0.514444;

enum class RecordStatus {
    Ok,               // sample holds a valid fix.
    NoFix,            // well-formed record, receiver reported no fix.
    MalformedRecord,  // size/type/magic mismatch, short data or impossible calendar fields.
};

struct RecordDecodeResult {
    RecordStatus status = RecordStatus::MalformedRecord;
    GpsSample sample;    // valid only for Ok.
    std::string reason;  // diagnostic text for NoFix/MalformedRecord.

    bool ok() const { return status == RecordStatus::Ok; }
};

// Raw fields of the 44-byte little-endian record body.
struct GpsRecordFields {
    uint32_t hour = 0;
    uint32_t minute = 0;
    uint32_t second = 0;
    uint32_t year = 0;  // years since 2000
    uint32_t month = 0;
    uint32_t day = 0;
    uint8_t active = 0;
    uint8_t lat_hemisphere = 0;
    uint8_t lon_hemisphere = 0;
    uint8_t reserved = 0;
    float latitude = 0.0f;   // DDDMM.MMMM
    float longitude = 0.0f;  // DDDMM.MMMM
    float speed_knots = 0.0f;
    float bearing = 0.0f;
};

// Convert a DDDMM.MMMM reading into signed decimal degrees; 'S' and 'W' negate.
double nmea_to_decimal_degrees(double raw, uint8_t hemisphere);

// Decode a record payload that the index announced with `expected_size` bytes.
RecordDecodeResult decode_gps_record(const std::vector<uint8_t> &payload, uint32_t expected_size,
                                     const TimeZone &zone);

// Seek to the entry, read it and decode it. Short reads become MalformedRecord.
RecordDecodeResult read_gps_record(std::istream &in, const GpsIndexEntry &entry,
                                   const TimeZone &zone);
