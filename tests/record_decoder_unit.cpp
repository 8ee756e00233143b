// Unit coverage for decoding single GPS records: field layout, validation and no-fix handling.
#include <chrono>
#include <cmath>
#include <iostream>
#include <limits>
#include <sstream>
#include <string>
#include <vector>

#include "civil_time.hpp"
#include "gps_record.hpp"
#include "gps_test_utils.hpp"

using namespace gps_test_utils;

namespace {

bool check(bool cond, const std::string &msg) {
    if (!cond) {
        std::cerr << "[record_decoder_unit] FAIL: " << msg << "\n";
    }
    return cond;
}

bool near(double a, double b, double eps) { return std::fabs(a - b) <= eps; }

RecordDecodeResult decode(const std::vector<uint8_t> &record, const TimeZone &zone = TimeZone()) {
    return decode_gps_record(record, static_cast<uint32_t>(record.size()), zone);
}

bool test_valid_record() {
    RecordFields f;
    f.speed_knots = 10.0f;
    f.bearing = 123.5f;
    const auto res = decode(make_gps_record(f));
    bool ok = check(res.ok(), "valid record decodes: " + res.reason);
    ok &= check(near(res.sample.latitude, 37.2247333, 1e-4), "latitude 3713.4840 N");
    ok &= check(near(res.sample.longitude, 1.765, 1e-4), "longitude 00145.9000 E");
    ok &= check(near(res.sample.speed, 5.14444, 1e-4), "10 knots in m/s");
    ok &= check(near(res.sample.bearing, 123.5, 1e-6), "bearing passed through");
    ok &= check(format_iso8601_utc(res.sample.time.utc) == "2021-06-01T12:00:00.000Z",
                "timestamp read as UTC wall clock");
    ok &= check(res.sample.time.utc_offset_s == 0, "UTC offset recorded");
    return ok;
}

bool test_zone_applied() {
    RecordFields f;
    f.hour = 7;
    const auto res = decode(make_gps_record(f), TimeZone::fixed(-5 * 3600));
    bool ok = check(res.ok(), "record decodes in fixed zone");
    ok &= check(format_iso8601_utc(res.sample.time.utc) == "2021-06-01T12:00:00.000Z",
                "07:00 at UTC-5 is 12:00Z");
    ok &= check(res.sample.time.utc_offset_s == -18000, "offset -5h kept");
    return ok;
}

bool test_hemispheres() {
    RecordFields f;
    f.lat_hemisphere = 'S';
    f.lon_hemisphere = 'W';
    f.latitude = to_nmea(33.8688);
    f.longitude = to_nmea(151.2093);
    const auto res = decode(make_gps_record(f));
    bool ok = check(res.ok(), "southern record decodes");
    ok &= check(near(res.sample.latitude, -33.8688, 1e-4), "S negates latitude");
    ok &= check(near(res.sample.longitude, -151.2093, 1e-4), "W negates longitude");
    return ok;
}

bool test_nmea_conversion() {
    bool ok = check(near(nmea_to_decimal_degrees(3713.4840, 'N'), 37.224733, 1e-6), "DDMM.MMMM");
    ok &= check(near(nmea_to_decimal_degrees(12030.0, 'W'), -120.5, 1e-9), "DDDMM with W");
    ok &= check(nmea_to_decimal_degrees(0.0, 'N') == 0.0, "zero stays zero");
    for (double v : {0.5, 12.25, 45.999, 89.1234, 179.9876}) {
        const double back = nmea_to_decimal_degrees(to_nmea(v), 'N');
        ok &= check(near(back, v, 1e-4), "DDDMM round trip for " + std::to_string(v));
    }
    return ok;
}

bool test_no_fix() {
    RecordFields f;
    f.active = 'V';
    const auto res = decode(make_gps_record(f));
    bool ok = check(res.status == RecordStatus::NoFix, "status V is no fix");
    ok &= check(!res.ok(), "no fix is not ok");

    f.active = 0;
    ok &= check(decode(make_gps_record(f)).status == RecordStatus::NoFix, "zero status byte");
    return ok;
}

bool test_header_mismatches() {
    RecordFields f;
    auto bad_magic = make_gps_record(f);
    bad_magic[8] = 'X';
    bool ok = check(decode(bad_magic).status == RecordStatus::MalformedRecord,
                    "corrupted magic is malformed");

    auto bad_type = make_gps_record(f);
    bad_type[4] = 's';
    bad_type[5] = 'k';
    bad_type[6] = 'i';
    bad_type[7] = 'p';
    ok &= check(decode(bad_type).status == RecordStatus::MalformedRecord, "type must be free");

    const auto record = make_gps_record(f);
    ok &= check(decode_gps_record(record, 128, TimeZone()).status ==
                    RecordStatus::MalformedRecord,
                "self size must match index size");

    const std::vector<uint8_t> tiny = {0x00, 0x00, 0x00, 0x08};
    ok &= check(decode_gps_record(tiny, 8, TimeZone()).status == RecordStatus::MalformedRecord,
                "record shorter than its header");
    return ok;
}

bool test_short_body() {
    RecordFields f;
    auto record = make_gps_record(f);
    record.resize(kGpsRecordMinSize - 1);
    record[3] = static_cast<uint8_t>(record.size());
    const auto res = decode(record);
    bool ok = check(res.status == RecordStatus::MalformedRecord, "59 byte record is malformed");

    record = make_gps_record(f, static_cast<uint32_t>(kGpsRecordMinSize));
    ok &= check(decode(record).ok(), "60 byte record is enough");
    return ok;
}

bool test_invalid_fields() {
    RecordFields f;
    f.month = 13;
    bool ok = check(decode(make_gps_record(f)).status == RecordStatus::MalformedRecord,
                    "month 13 is malformed");
    f = RecordFields();
    f.month = 2;
    f.day = 29;  // 2021 is not a leap year
    ok &= check(decode(make_gps_record(f)).status == RecordStatus::MalformedRecord,
                "Feb 29 2021 is malformed");
    f.year = 20;
    ok &= check(decode(make_gps_record(f)).ok(), "Feb 29 2020 is fine");
    f = RecordFields();
    f.year = 0xFFFFFFFFu;
    ok &= check(decode(make_gps_record(f)).status == RecordStatus::MalformedRecord,
                "year field 0xFFFFFFFF is malformed");
    f.year = 100;
    ok &= check(decode(make_gps_record(f)).status == RecordStatus::MalformedRecord,
                "three digit year field is malformed");
    f.year = 99;
    const auto last = decode(make_gps_record(f));
    ok &= check(last.ok() && format_iso8601_utc(last.sample.time.utc) == "2099-06-01T12:00:00.000Z",
                "year field 99 is 2099");
    const auto normal = decode(make_gps_record(RecordFields()));
    ok &= check(format_sortable_utc(last.sample.time.utc) >
                    format_sortable_utc(normal.sample.time.utc),
                "largest year still sorts after a 2021 stem");
    f = RecordFields();
    f.minute = 60;
    ok &= check(decode(make_gps_record(f)).status == RecordStatus::MalformedRecord,
                "minute 60 is malformed");
    f = RecordFields();
    f.hour = 24;
    ok &= check(decode(make_gps_record(f)).status == RecordStatus::MalformedRecord,
                "hour 24 is malformed");
    f = RecordFields();
    f.latitude = std::numeric_limits<float>::quiet_NaN();
    ok &= check(decode(make_gps_record(f)).status == RecordStatus::MalformedRecord,
                "NaN latitude is malformed");
    f = RecordFields();
    f.speed_knots = std::numeric_limits<float>::infinity();
    ok &= check(decode(make_gps_record(f)).status == RecordStatus::MalformedRecord,
                "infinite speed is malformed");
    return ok;
}

bool test_read_from_stream() {
    RecordFields f;
    std::vector<uint8_t> bytes(32, 0xEE);
    const auto record = make_gps_record(f);
    bytes.insert(bytes.end(), record.begin(), record.end());
    std::istringstream in(std::string(bytes.begin(), bytes.end()), std::ios::binary);

    GpsIndexEntry entry{32, static_cast<uint32_t>(record.size())};
    bool ok = check(read_gps_record(in, entry, TimeZone()).ok(), "record read at offset");

    GpsIndexEntry past_end{static_cast<uint32_t>(bytes.size()), 64};
    ok &= check(read_gps_record(in, past_end, TimeZone()).status ==
                    RecordStatus::MalformedRecord,
                "entry past end of stream");

    GpsIndexEntry oversized{32, kMaxGpsRecordSize + 1};
    ok &= check(read_gps_record(in, oversized, TimeZone()).status ==
                    RecordStatus::MalformedRecord,
                "oversized entry refused");

    // The stream stays usable after failed reads.
    ok &= check(read_gps_record(in, entry, TimeZone()).ok(), "stream usable after failures");
    return ok;
}

}  // namespace

int main() {
    bool ok = true;
    ok &= test_valid_record();
    ok &= test_zone_applied();
    ok &= test_hemispheres();
    ok &= test_nmea_conversion();
    ok &= test_no_fix();
    ok &= test_header_mismatches();
    ok &= test_short_body();
    ok &= test_invalid_fields();
    ok &= test_read_from_stream();
    if (!ok) {
        return 1;
    }
    std::cout << "[record_decoder_unit] all tests passed\n";
    return 0;
}
