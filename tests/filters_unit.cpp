// Unit coverage for geo math and the track/frame filter stages.
#include <chrono>
#include <cmath>
#include <iostream>
#include <string>

#include "civil_time.hpp"
#include "geo_math.hpp"
#include "track_filters.hpp"

namespace {

bool check(bool cond, const std::string &msg) {
    if (!cond) {
        std::cerr << "[filters_unit] FAIL: " << msg << "\n";
    }
    return cond;
}

TimePointMs utc(int y, int mo, int d, int h, int mi) {
    return utc_instant(cctz::civil_second(y, mo, d, h, mi, 0));
}

// Chicago, in daylight at 17:00Z and in darkness at 06:00Z on 2021-06-01.
GpsSample fix(TimePointMs when, double speed, double lat = 41.88, double lon = -87.63) {
    GpsSample s;
    s.latitude = lat;
    s.longitude = lon;
    s.time.utc = when;
    s.time.utc_offset_s = -18000;
    s.speed = speed;
    return s;
}

bool test_parse_exclusion_zone() {
    const auto zone = parse_exclusion_zone("41.88,-87.63,250");
    bool ok = check(zone.has_value(), "valid zone parses");
    if (zone) {
        ok &= check(zone->latitude == 41.88 && zone->longitude == -87.63 &&
                        zone->radius_m == 250.0,
                    "zone fields");
    }
    for (const char *bad : {"1,2", "1,2,3,4", "a,b,c", "91,0,10", "0,181,10", "1,2,-5",
                            "1,2,3x", ""}) {
        ok &= check(!parse_exclusion_zone(bad), std::string("rejects '") + bad + "'");
    }
    return ok;
}

bool test_haversine() {
    const double one_degree = haversine_distance_m(0.0, 0.0, 1.0, 0.0);
    bool ok = check(std::fabs(one_degree - 111195.08) < 1.0, "one degree of latitude");
    const double paris_london = haversine_distance_m(48.8566, 2.3522, 51.5074, -0.1278);
    ok &= check(paris_london > 340000.0 && paris_london < 347000.0, "Paris to London");
    ok &= check(haversine_distance_m(10.0, 20.0, 10.0, 20.0) == 0.0, "same point");
    ok &= check(std::fabs(haversine_distance_m(0.0, 179.9, 0.0, -179.9) -
                          haversine_distance_m(0.0, 0.0, 0.0, 0.2)) < 1e-3,
                "antimeridian wraps");
    return ok;
}

bool test_solar_altitude() {
    const double noon = solar_altitude_deg(0.0, 0.0, utc(2021, 6, 21, 12, 0));
    bool ok = check(std::fabs(noon - 66.56) < 1.0, "equator at June solstice noon");
    const double midnight = solar_altitude_deg(45.0, 0.0, utc(2021, 6, 21, 0, 0));
    ok &= check(midnight < -15.0, "mid-latitude midnight is dark");
    const double chicago_day = solar_altitude_deg(41.88, -87.63, utc(2021, 6, 1, 17, 0));
    ok &= check(chicago_day > 50.0, "Chicago around local noon");
    return ok;
}

bool test_track_stages() {
    const auto day = utc(2021, 6, 1, 17, 0);
    const auto night = utc(2021, 6, 1, 6, 0);

    const auto has_fix = make_has_fix_filter();
    bool ok = check(has_fix.reject(Track(3)).has_value(), "track without fixes rejected");

    const auto daylight = make_daylight_filter(-2.0);
    Track daytime = {fix(day, 10.0)};
    ok &= check(!daylight.reject(daytime), "daytime track accepted");
    Track nighttime = {fix(night, 10.0)};
    ok &= check(daylight.reject(nighttime).has_value(), "night track rejected");
    // The latest fix decides, whatever its slot.
    Track mixed = {fix(day, 10.0), fix(night, 10.0)};
    ok &= check(!daylight.reject(mixed), "latest fix by time decides");
    ok &= check(latest_fix(mixed) && latest_fix(mixed)->time.utc == day, "latest_fix by time");

    const auto movement = make_movement_filter(0.5);
    Track parked = {fix(day, 0.3), std::nullopt, fix(day, 0.5)};
    ok &= check(movement.reject(parked).has_value(), "no fix above 0.5 m/s rejected");
    parked.push_back(fix(day, 0.6));
    ok &= check(!movement.reject(parked), "one moving fix accepted");
    return ok;
}

bool test_frame_stages() {
    const auto day = utc(2021, 6, 1, 17, 0);
    const auto min_speed = make_min_speed_filter(4.0);
    bool ok = check(min_speed.reject(fix(day, 3.9)), "slow frame dropped");
    ok &= check(!min_speed.reject(fix(day, 4.0)), "frame at threshold kept");

    ExclusionZone home;
    home.latitude = 41.88;
    home.longitude = -87.63;
    home.radius_m = 500.0;
    const auto geofence = make_geofence_filter({home});
    ok &= check(geofence.reject(fix(day, 10.0, 41.8809, -87.63)), "100 m from home dropped");
    ok &= check(!geofence.reject(fix(day, 10.0, 41.89, -87.63)), "1.1 km from home kept");
    ok &= check(!make_geofence_filter({}).reject(fix(day, 10.0)), "no zones keeps all");
    return ok;
}

bool test_chain() {
    FilterOptions options;
    auto chain = make_filter_chain(options);
    bool ok = check(chain.track_stages.size() == 3, "default track stages");
    ok &= check(chain.frame_stages.size() == 1, "default frame stages");

    const auto day = utc(2021, 6, 1, 17, 0);
    ok &= check(chain.check_frame(fix(day, 1.0)) == std::string("min-speed"),
                "stage name reported");
    ok &= check(!chain.check_frame(fix(day, 10.0)), "fast frame kept");
    Track night = {fix(utc(2021, 6, 1, 6, 0), 10.0)};
    ok &= check(chain.check_track(night) == std::string("ends when the sun is down"),
                "track reason reported");

    options.exclusion_zones.push_back(ExclusionZone{41.88, -87.63, 500.0});
    ok &= check(make_filter_chain(options).frame_stages.size() == 2, "geofence added");

    options.enabled = false;
    chain = make_filter_chain(options);
    ok &= check(chain.track_stages.size() == 1 && chain.frame_stages.empty(),
                "disabled filters keep only the fix check");
    ok &= check(!chain.check_track(night) && !chain.check_frame(fix(day, 0.0)),
                "disabled chain accepts night and slow frames");
    ok &= check(chain.check_track(Track(2)).has_value(), "fix check still active");
    return ok;
}

}  // namespace

int main() {
    bool ok = true;
    ok &= test_parse_exclusion_zone();
    ok &= test_haversine();
    ok &= test_solar_altitude();
    ok &= test_track_stages();
    ok &= test_frame_stages();
    ok &= test_chain();
    if (!ok) {
        return 1;
    }
    std::cout << "[filters_unit] all tests passed\n";
    return 0;
}
