//
//  gps_record.cpp
//  TrackForge
//
//  Created by Till Toenshoff on 12/9/25.
//  Copyright © 2025 Till Toenshoff. All rights reserved.
//

#include "gps_record.hpp"

#include <cmath>
#include <optional>

#include "byte_order.hpp"
#include "fourcc_utils.hpp"
#include "logging.hpp"

namespace {

RecordDecodeResult reject(RecordStatus status, std::string reason) {
    RecordDecodeResult result;
    result.status = status;
    result.reason = std::move(reason);
    return result;
}

GpsRecordFields read_fields(const uint8_t *body) {
    GpsRecordFields f;
    f.hour = load_u32_le(body + 0);
    f.minute = load_u32_le(body + 4);
    f.second = load_u32_le(body + 8);
    f.year = load_u32_le(body + 12);
    f.month = load_u32_le(body + 16);
    f.day = load_u32_le(body + 20);
    f.active = body[24];
    f.lat_hemisphere = body[25];
    f.lon_hemisphere = body[26];
    f.reserved = body[27];
    f.latitude = load_f32_le(body + 28);
    f.longitude = load_f32_le(body + 32);
    f.speed_knots = load_f32_le(body + 36);
    f.bearing = load_f32_le(body + 40);
    return f;
}

}  // namespace

double nmea_to_decimal_degrees(double raw, uint8_t hemisphere) {
    const double minutes = std::fmod(raw, 100.0);
    const double degrees = raw - minutes;
    const double decimal = degrees / 100.0 + minutes / 60.0;
    if (hemisphere == 'S' || hemisphere == 'W') {
        return -decimal;
    }
    return decimal;
}

RecordDecodeResult decode_gps_record(const std::vector<uint8_t> &payload, uint32_t expected_size,
                                     const TimeZone &zone) {
    if (payload.size() < kGpsRecordHeaderSize) {
        return reject(RecordStatus::MalformedRecord,
                      "record holds " + std::to_string(payload.size()) + " bytes");
    }
    const uint32_t self_size = load_u32_be(payload.data());
    const uint32_t type = load_u32_be(payload.data() + 4);
    const uint32_t magic = load_u32_be(payload.data() + 8);
    if (self_size != expected_size || type != kFreeType || magic != kGpsRecordMagic) {
        return reject(RecordStatus::MalformedRecord,
                      "expected size " + std::to_string(expected_size) + " '" +
                          fourcc_to_string(kFreeType) + "' '" + fourcc_to_string(kGpsRecordMagic) +
                          "', found size " + std::to_string(self_size) + " '" +
                          fourcc_to_string(type) + "' '" + fourcc_to_string(magic) + "'");
    }
    if (payload.size() < kGpsRecordMinSize) {
        return reject(RecordStatus::MalformedRecord,
                      "record too short for body: " + std::to_string(payload.size()) + " bytes");
    }

    const GpsRecordFields f = read_fields(payload.data() + kGpsRecordBodyOffset);
    if (f.active != 'A') {
        return reject(RecordStatus::NoFix, "status byte 0x" + trackforge::hex_prefix({f.active}));
    }

    // The year field counts from 2000 and only two digits are meaningful.
    std::optional<cctz::civil_second> civil;
    if (f.year <= 99) {
        civil = make_civil_second(2000 + int64_t{f.year}, f.month, f.day, f.hour, f.minute,
                                  f.second);
    }
    if (!civil) {
        return reject(RecordStatus::MalformedRecord,
                      "invalid date " + std::to_string(f.year) + "/" + std::to_string(f.month) +
                          "/" + std::to_string(f.day) + " " + std::to_string(f.hour) + ":" +
                          std::to_string(f.minute) + ":" + std::to_string(f.second));
    }
    if (!std::isfinite(f.latitude) || !std::isfinite(f.longitude) ||
        !std::isfinite(f.speed_knots) || !std::isfinite(f.bearing)) {
        return reject(RecordStatus::MalformedRecord, "non-finite coordinate or motion value");
    }

    RecordDecodeResult result;
    result.status = RecordStatus::Ok;
    result.sample.latitude = nmea_to_decimal_degrees(f.latitude, f.lat_hemisphere);
    result.sample.longitude = nmea_to_decimal_degrees(f.longitude, f.lon_hemisphere);
    result.sample.time = zone.localize(*civil);
    result.sample.speed = static_cast<double>(f.speed_knots) * kKnotsToMetersPerSecond;
    result.sample.bearing = f.bearing;
    return result;
}

RecordDecodeResult read_gps_record(std::istream &in, const GpsIndexEntry &entry,
                                   const TimeZone &zone) {
    if (entry.size > kMaxGpsRecordSize) {
        return reject(RecordStatus::MalformedRecord,
                      "record size " + std::to_string(entry.size) + " exceeds sanity bound");
    }
    in.clear();
    in.seekg(static_cast<std::streamoff>(entry.offset), std::ios::beg);
    std::vector<uint8_t> payload(entry.size);
    in.read(reinterpret_cast<char *>(payload.data()), static_cast<std::streamsize>(entry.size));
    const auto got = static_cast<size_t>(in.gcount());
    if (got != payload.size()) {
        payload.resize(got);
        in.clear();
        if (got < kGpsRecordHeaderSize) {
            return reject(RecordStatus::MalformedRecord,
                          "short read at offset " + std::to_string(entry.offset) + ": " +
                              std::to_string(got) + " of " + std::to_string(entry.size));
        }
    }

    auto result = decode_gps_record(payload, entry.size, zone);
    if (result.status == RecordStatus::MalformedRecord) {
        TF_LOG("record", "record @" << entry.offset << " rejected: " << result.reason
                                    << " head=" << trackforge::hex_prefix(payload));
    }
    return result;
}
