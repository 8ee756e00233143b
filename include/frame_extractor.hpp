//
//  frame_extractor.hpp
//  TrackForge
//
//  Created by Till Toenshoff on 12/9/25.
//  Copyright © 2025 Till Toenshoff. All rights reserved.
//

#pragma once

#include <cstdint>
#include <filesystem>
#include <string>

// Uniquely named directory below the system temp directory, removed with everything in it when
// the object goes away.
class ScopedTempDir {
   public:
    explicit ScopedTempDir(const std::string &prefix = "trackforge");
    ~ScopedTempDir();

    ScopedTempDir(const ScopedTempDir &) = delete;
    ScopedTempDir &operator=(const ScopedTempDir &) = delete;

    bool valid() const { return !path_.empty(); }
    const std::filesystem::path &path() const { return path_; }

   private:
    std::filesystem::path path_;
};

// Name of extracted frame `frame_number` (1-based) inside `dir`.
std::filesystem::path frame_path(const std::filesystem::path &dir, uint32_t frame_number);

// Rasterizes a video into JPEG frames named by frame_path(), `fps` frames per second of video.
class FrameExtractor {
   public:
    virtual ~FrameExtractor() = default;
    virtual bool extract(const std::string &video_path, const std::filesystem::path &dir,
                         uint32_t fps, std::string *error_out) = 0;
};

// Runs the external ffmpeg executable.
class FfmpegFrameExtractor : public FrameExtractor {
   public:
    explicit FfmpegFrameExtractor(std::string executable = "ffmpeg");

    bool extract(const std::string &video_path, const std::filesystem::path &dir, uint32_t fps,
                 std::string *error_out) override;

    std::string command_line(const std::string &video_path, const std::filesystem::path &dir,
                             uint32_t fps) const;

   private:
    std::string executable_;
};

// Quote for a POSIX shell.
std::string shell_quote(const std::string &arg);
