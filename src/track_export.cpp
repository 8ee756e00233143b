//
//  track_export.cpp
//  TrackForge
//
//  Created by Till Toenshoff on 12/9/25.
//  Copyright © 2025 Till Toenshoff. All rights reserved.
//

#include "track_export.hpp"

#include <cerrno>
#include <cstdio>
#include <fstream>
#include <iostream>
#include <system_error>

#include "logging.hpp"

namespace {

std::string xml_escape(const std::string &in) {
    std::string out;
    out.reserve(in.size());
    for (char c : in) {
        switch (c) {
            case '&':
                out += "&amp;";
                break;
            case '<':
                out += "&lt;";
                break;
            case '>':
                out += "&gt;";
                break;
            case '"':
                out += "&quot;";
                break;
            case '\'':
                out += "&apos;";
                break;
            default:
                out.push_back(c);
        }
    }
    return out;
}

std::string fixed6(double v) {
    char buf[48];
    std::snprintf(buf, sizeof(buf), "%f", v);
    return buf;
}

}  // namespace

std::string make_gpx(const Track &track, const std::string &source_name) {
    const std::string name = xml_escape(source_name);
    std::string gpx;
    gpx += "<?xml version=\"1.0\" encoding=\"UTF-8\"?>\n";
    gpx += "<gpx version=\"1.0\"\n";
    gpx += "\tcreator=\"TrackForge Novatek GPS extractor\"\n";
    gpx += "\txmlns:xsi=\"http://www.w3.org/2001/XMLSchema-instance\"\n";
    gpx += "\txmlns=\"http://www.topografix.com/GPX/1/0\"\n";
    gpx += "\txsi:schemaLocation=\"http://www.topografix.com/GPX/1/0 "
           "http://www.topografix.com/GPX/1/0/gpx.xsd\">\n";
    gpx += "\t<name>" + name + "</name>\n";
    gpx += "\t<trk><name>" + name + "</name><trkseg>\n";
    for (const auto &slot : track) {
        if (!slot) {
            continue;
        }
        gpx += "\t\t<trkpt lat=\"" + fixed6(slot->latitude) + "\" lon=\"" +
               fixed6(slot->longitude) + "\"><time>" + format_iso8601_utc(slot->time.utc) +
               "</time><course>" + fixed6(slot->bearing) + "</course><speed>" +
               fixed6(slot->speed) + "</speed></trkpt>\n";
    }
    gpx += "\t</trkseg></trk>\n";
    gpx += "</gpx>\n";
    return gpx;
}

nlohmann::json track_to_json(const Track &track, const std::string &source_name,
                             const std::string &zone_name) {
    nlohmann::json j;
    j["source"] = source_name;
    j["timezone"] = zone_name;
    j["slots"] = track.size();

    nlohmann::json points = nlohmann::json::array();
    for (size_t i = 0; i < track.size(); ++i) {
        const auto &slot = track[i];
        if (!slot) {
            continue;
        }
        nlohmann::json p;
        p["index"] = i;
        p["lat"] = slot->latitude;
        p["lon"] = slot->longitude;
        p["time"] = format_iso8601_utc(slot->time.utc);
        p["utc_offset_s"] = slot->time.utc_offset_s;
        p["speed"] = slot->speed;
        p["bearing"] = slot->bearing;
        points.push_back(p);
    }
    j["points"] = points;
    return j;
}

bool write_text_output(const std::string &path, const std::string &text) {
    if (path == "-") {
        std::cout << text;
        return static_cast<bool>(std::cout);
    }
    std::ofstream out(path, std::ios::binary | std::ios::trunc);
    if (!out.is_open()) {
        TF_LOG("error", "open failed for " << path << " errno=" << errno << " ("
                                           << std::generic_category().message(errno) << ")");
        return false;
    }
    out << text;
    return out.good();
}
