//
//  logging.hpp
//  TrackForge
//
//  Created by Till Toenshoff on 12/9/25.
//  Copyright © 2025 Till Toenshoff. All rights reserved.
//

#pragma once

#include <cstdint>
#include <sstream>
#include <string>
#include <string_view>
#include <vector>

namespace trackforge {

enum class LogVerbosity { Error = 0, Warn = 1, Info = 2, Debug = 3 };

void set_log_verbosity(LogVerbosity level);
LogVerbosity get_log_verbosity();

// "error", "warn"/"warning", "info" and "debug"; anything else is Error.
LogVerbosity parse_log_verbosity(std::string_view name);

// Tags "error", "warn" and "info" carry their own severity. Component tags such as "parser",
// "record", "tz", "io", "filter" and "pipeline" are debug output.
constexpr LogVerbosity tag_severity(std::string_view tag) {
    if (tag == "error") {
        return LogVerbosity::Error;
    }
    if (tag == "warn" || tag == "warning") {
        return LogVerbosity::Warn;
    }
    return tag == "info" ? LogVerbosity::Info : LogVerbosity::Debug;
}

inline bool log_enabled(std::string_view tag) {
    return static_cast<int>(tag_severity(tag)) <= static_cast<int>(get_log_verbosity());
}

// Writes one line to stderr. Errors and warnings name the source location.
void write_log_line(std::string_view tag, const std::string &message, const char *file,
                    int line);

// Space separated hex bytes of at most the first `max_len` bytes, for record dumps.
inline constexpr size_t kHexPreviewBytes = 16;
std::string hex_prefix(const std::vector<uint8_t> &data, size_t max_len = kHexPreviewBytes);

}  // namespace trackforge

#define TF_LOG(tag, message)                                                        \
    do {                                                                            \
        if (trackforge::log_enabled(tag)) {                                         \
            std::ostringstream _tf_log_ss;                                          \
            _tf_log_ss << message;                                                  \
            trackforge::write_log_line(tag, _tf_log_ss.str(), __FILE__, __LINE__);  \
        }                                                                           \
    } while (0)
