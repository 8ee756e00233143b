//
//  metadata_writer.cpp
//  TrackForge
//
//  Created by Till Toenshoff on 12/9/25.
//  Copyright © 2025 Till Toenshoff. All rights reserved.
//

#include "metadata_writer.hpp"

#include <fstream>

#include "logging.hpp"

namespace {

nlohmann::json rational_json(const Rational &r) {
    return nlohmann::json::array({r.numerator, r.denominator});
}

nlohmann::json dms_json(const DmsCoordinate &dms) {
    return nlohmann::json::array(
        {rational_json(dms.degrees), rational_json(dms.minutes), rational_json(dms.seconds)});
}

}  // namespace

nlohmann::json geotag_to_json(const GeoTag &tag) {
    nlohmann::json gps;
    gps["GPSVersionID"] = nlohmann::json::array({2, 0, 0, 0});
    gps["GPSLatitudeRef"] = tag.latitude_ref;
    gps["GPSLatitude"] = dms_json(tag.latitude);
    gps["GPSLongitudeRef"] = tag.longitude_ref;
    gps["GPSLongitude"] = dms_json(tag.longitude);
    // Zero bearing is not written.
    if (tag.bearing) {
        gps["GPSImgDirection"] = rational_json(*tag.bearing);
        gps["GPSImgDirectionRef"] = tag.bearing_ref;
    }

    nlohmann::json j;
    j["GPS"] = gps;
    j["Exif"] = {{"DateTimeOriginal", tag.capture_time}};
    j["decimal"] = {{"lat", tag.decimal_latitude},
                    {"lon", tag.decimal_longitude},
                    {"speed", tag.speed}};
    return j;
}

std::filesystem::path JsonSidecarWriter::sidecar_path(const std::filesystem::path &image) {
    auto p = image;
    p += ".json";
    return p;
}

bool JsonSidecarWriter::write(const std::filesystem::path &image, const GeoTag &tag,
                              std::string *error_out) {
    const auto path = sidecar_path(image);
    std::ofstream out(path, std::ios::trunc);
    if (!out.is_open()) {
        if (error_out) *error_out = "cannot open " + path.string();
        return false;
    }
    out << geotag_to_json(tag).dump(2) << "\n";
    if (!out.good()) {
        if (error_out) *error_out = "short write to " + path.string();
        return false;
    }
    TF_LOG("io", "wrote sidecar " << path.string());
    return true;
}
