//
//  frame_extractor.cpp
//  TrackForge
//
//  Created by Till Toenshoff on 12/9/25.
//  Copyright © 2025 Till Toenshoff. All rights reserved.
//

#include "frame_extractor.hpp"

#include <sys/wait.h>

#include <atomic>
#include <chrono>
#include <cstdlib>
#include <random>
#include <system_error>
#include <utility>

#include "logging.hpp"

namespace {

constexpr int kMaxTempDirAttempts = 16;

}  // namespace

ScopedTempDir::ScopedTempDir(const std::string &prefix) {
    static std::atomic<uint32_t> counter{0};
    std::error_code ec;
    const auto base = std::filesystem::temp_directory_path(ec);
    if (ec) {
        TF_LOG("error", "no temp directory: " << ec.message());
        return;
    }
    std::random_device rd;
    for (int attempt = 0; attempt < kMaxTempDirAttempts; ++attempt) {
        const auto candidate =
            base / (prefix + "-" + std::to_string(rd()) + "-" + std::to_string(counter++));
        if (std::filesystem::create_directory(candidate, ec) && !ec) {
            path_ = candidate;
            TF_LOG("io", "created temp dir " << path_.string());
            return;
        }
    }
    TF_LOG("error", "failed to create temp dir below " << base.string() << ": " << ec.message());
}

ScopedTempDir::~ScopedTempDir() {
    if (path_.empty()) {
        return;
    }
    std::error_code ec;
    std::filesystem::remove_all(path_, ec);
    if (ec) {
        TF_LOG("warn", "failed to remove " << path_.string() << ": " << ec.message());
    } else {
        TF_LOG("io", "removed temp dir " << path_.string());
    }
}

std::filesystem::path frame_path(const std::filesystem::path &dir, uint32_t frame_number) {
    return dir / ("thumb_" + std::to_string(frame_number) + ".jpg");
}

std::string shell_quote(const std::string &arg) {
    std::string out = "'";
    for (char c : arg) {
        if (c == '\'') {
            out += "'\\''";
        } else {
            out.push_back(c);
        }
    }
    out.push_back('\'');
    return out;
}

FfmpegFrameExtractor::FfmpegFrameExtractor(std::string executable)
    : executable_(std::move(executable)) {}

std::string FfmpegFrameExtractor::command_line(const std::string &video_path,
                                               const std::filesystem::path &dir,
                                               uint32_t fps) const {
    const auto pattern = (dir / "thumb_%d.jpg").string();
    return shell_quote(executable_) + " -hide_banner -loglevel error -i " +
           shell_quote(video_path) + " -qscale:v 1 -qmin 1 -qmax 1 -vf fps=" +
           std::to_string(fps) + " " + shell_quote(pattern) + " < /dev/null";
}

bool FfmpegFrameExtractor::extract(const std::string &video_path,
                                   const std::filesystem::path &dir, uint32_t fps,
                                   std::string *error_out) {
    const auto cmd = command_line(video_path, dir, fps);
    TF_LOG("io", "running " << cmd);
    const auto t_start = std::chrono::steady_clock::now();
    const int rc = std::system(cmd.c_str());
    const auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(
                        std::chrono::steady_clock::now() - t_start)
                        .count();
    if (rc == -1) {
        if (error_out) *error_out = "failed to spawn " + executable_;
        return false;
    }
    if (!WIFEXITED(rc) || WEXITSTATUS(rc) != 0) {
        if (error_out) {
            *error_out = executable_ + " exited with status " +
                         std::to_string(WIFEXITED(rc) ? WEXITSTATUS(rc) : rc);
        }
        return false;
    }
    TF_LOG("io", "frame extraction took " << ms << " ms");
    return true;
}
