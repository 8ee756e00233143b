// End-to-end coverage of read_track: index lookup, record decoding and slot alignment.
#include <cmath>
#include <filesystem>
#include <iostream>
#include <sstream>
#include <string>
#include <vector>

#include "gps_test_utils.hpp"
#include "track_builder.hpp"

using namespace gps_test_utils;

namespace {

bool check(bool cond, const std::string &msg) {
    if (!cond) {
        std::cerr << "[track_builder_unit] FAIL: " << msg << "\n";
    }
    return cond;
}

bool near(double a, double b, double eps) { return std::fabs(a - b) <= eps; }

bool test_fix_then_no_fix() {
    RecordFields fix;
    fix.latitude = 3713.4840f;
    fix.longitude = 145.9000f;
    RecordFields no_fix = fix;
    no_fix.active = 'V';
    const auto file = make_novatek_file({make_gps_record(fix), make_gps_record(no_fix)});

    const auto res = read_track(file.bytes, TimeZone());
    bool ok = check(res.outcome == TrackOutcome::Ok, "track with one fix is ok");
    ok &= check(res.track.size() == 2, "one slot per entry");
    ok &= check(res.track[0].has_value(), "slot 0 holds the fix");
    if (res.track[0]) {
        ok &= check(near(res.track[0]->latitude, 37.2247, 1e-4), "slot 0 latitude");
        ok &= check(near(res.track[0]->longitude, 1.7650, 1e-4), "slot 0 longitude");
    }
    ok &= check(!res.track[1].has_value(), "slot 1 empty");
    ok &= check(res.stats.entries == 2 && res.stats.fixes == 1 && res.stats.no_fix == 1 &&
                    res.stats.malformed == 0,
                "stats count fixes and gaps");
    return ok;
}

bool test_malformed_record_keeps_alignment() {
    RecordFields a;
    a.second = 0;
    RecordFields b;
    b.second = 1;
    RecordFields c;
    c.second = 2;
    auto broken = make_gps_record(b);
    broken[9] = 'X';  // magic
    const auto file = make_novatek_file({make_gps_record(a), broken, make_gps_record(c)});

    const auto res = read_track(file.bytes, TimeZone());
    bool ok = check(res.ok(), "track ok despite malformed record");
    ok &= check(res.track.size() == 3, "malformed record keeps its slot");
    ok &= check(res.track[0] && !res.track[1] && res.track[2], "slot pattern fix/gap/fix");
    ok &= check(res.stats.malformed == 1, "malformed counted");
    if (res.track[2]) {
        ok &= check(format_iso8601_utc(res.track[2]->time.utc) == "2021-06-01T12:00:02.000Z",
                    "slot 2 keeps its own timestamp");
    }
    return ok;
}

bool test_oversized_and_dangling_entries() {
    RecordFields f;
    const auto file = make_novatek_file(
        {make_gps_record(f), make_gps_record(f), make_gps_record(f)},
        [](std::vector<GpsIndexEntry> &entries) {
            entries[0].size = kMaxGpsRecordSize + 5;
            entries[1].offset = 0x7FFFFFF0;
        });
    const auto res = read_track(file.bytes, TimeZone());
    bool ok = check(res.ok(), "last record still decodes");
    ok &= check(res.track.size() == 3, "all entries produce slots");
    ok &= check(!res.track[0] && !res.track[1] && res.track[2], "only slot 2 holds a fix");
    return ok;
}

bool test_all_no_fix_is_empty_track() {
    RecordFields f;
    f.active = 'V';
    const auto file = make_novatek_file({make_gps_record(f), make_gps_record(f)});
    const auto res = read_track(file.bytes, TimeZone());
    bool ok = check(res.outcome == TrackOutcome::EmptyTrack, "no fix at all is an empty track");
    ok &= check(res.track.size() == 2, "empty track keeps its slots");
    ok &= check(!res.message.empty(), "empty track has a message");

    const auto none = make_novatek_file({});
    ok &= check(read_track(none.bytes, TimeZone()).outcome == TrackOutcome::EmptyTrack,
                "gps box without entries is an empty track");
    return ok;
}

bool test_outcomes_for_bad_inputs() {
    std::vector<uint8_t> plain;
    append_atom(plain, fourcc('f', 't', 'y', 'p'), std::vector<uint8_t>(8, 0));
    append_atom(plain, kMoovType, std::vector<uint8_t>(16, 0));
    bool ok = check(read_track(plain, TimeZone()).outcome == TrackOutcome::NoGpsData,
                    "plain mp4 has no GPS data");

    std::vector<uint8_t> broken;
    write_u32_be(broken, 1000);
    write_u32_be(broken, kMoovType);
    broken.resize(40, 0);
    ok &= check(read_track(broken, TimeZone()).outcome == TrackOutcome::StructuralError,
                "truncated moov is a structural error");

    ok &= check(read_track(std::vector<uint8_t>{}, TimeZone()).outcome ==
                    TrackOutcome::NoGpsData,
                "empty input has no GPS data");

    const auto missing = std::filesystem::temp_directory_path() / "trackforge_missing.mp4";
    std::filesystem::remove(missing);
    ok &= check(read_track(missing.string(), TimeZone()).outcome == TrackOutcome::OpenFailed,
                "missing file cannot be opened");
    return ok;
}

bool test_read_from_path() {
    RecordFields f;
    f.active = 'A';
    const auto file = make_novatek_file({make_gps_record(f)});
    const auto path = write_temp_file(file.bytes, "trackforge_track_builder.mp4");
    const auto res = read_track(path.string(), TimeZone::fixed(3600));
    bool ok = check(res.ok(), "track read from file");
    if (res.track.size() == 1 && res.track[0]) {
        ok &= check(format_iso8601_utc(res.track[0]->time.utc) == "2021-06-01T11:00:00.000Z",
                    "zone applied when reading from file");
        ok &= check(res.track[0]->time.utc_offset_s == 3600, "offset recorded");
    } else {
        ok = false;
    }
    std::filesystem::remove(path);
    return ok;
}

}  // namespace

int main() {
    bool ok = true;
    ok &= test_fix_then_no_fix();
    ok &= test_malformed_record_keeps_alignment();
    ok &= test_oversized_and_dangling_entries();
    ok &= test_all_no_fix_is_empty_track();
    ok &= test_outcomes_for_bad_inputs();
    ok &= test_read_from_path();
    if (!ok) {
        return 1;
    }
    std::cout << "[track_builder_unit] all tests passed\n";
    return 0;
}
