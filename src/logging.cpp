//
//  logging.cpp
//  TrackForge
//
//  Created by Till Toenshoff on 12/9/25.
//  Copyright © 2025 Till Toenshoff. All rights reserved.
//

#include "logging.hpp"

#include <algorithm>
#include <atomic>
#include <iostream>

namespace trackforge {

namespace {

std::atomic<int> g_verbosity{static_cast<int>(LogVerbosity::Info)};

std::string_view file_basename(std::string_view path) {
    const size_t slash = path.find_last_of("/\\");
    return slash == std::string_view::npos ? path : path.substr(slash + 1);
}

}  // namespace

void set_log_verbosity(LogVerbosity level) {
    g_verbosity.store(static_cast<int>(level), std::memory_order_relaxed);
}

LogVerbosity get_log_verbosity() {
    return static_cast<LogVerbosity>(g_verbosity.load(std::memory_order_relaxed));
}

LogVerbosity parse_log_verbosity(std::string_view name) {
    if (name == "debug") return LogVerbosity::Debug;
    if (name == "info") return LogVerbosity::Info;
    if (name == "warn" || name == "warning") return LogVerbosity::Warn;
    return LogVerbosity::Error;
}

void write_log_line(std::string_view tag, const std::string &message, const char *file,
                    int line) {
    std::ostringstream out;
    out << "trackforge " << tag << ": ";
    if (tag_severity(tag) <= LogVerbosity::Warn && file) {
        out << "(" << file_basename(file) << ":" << line << ") ";
    }
    out << message << "\n";
    std::cerr << out.str();
}

std::string hex_prefix(const std::vector<uint8_t> &data, size_t max_len) {
    static const char kDigits[] = "0123456789abcdef";
    const size_t count = std::min(max_len, data.size());
    std::string out;
    out.reserve(count * 3);
    for (size_t i = 0; i < count; ++i) {
        if (i != 0) {
            out.push_back(' ');
        }
        out.push_back(kDigits[data[i] >> 4]);
        out.push_back(kDigits[data[i] & 0x0F]);
    }
    return out;
}

}  // namespace trackforge
