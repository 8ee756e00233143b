//
//  metadata_writer.hpp
//  TrackForge
//
//  Created by Till Toenshoff on 12/9/25.
//  Copyright © 2025 Till Toenshoff. All rights reserved.
//

#pragma once

#include <filesystem>
#include <string>

#include <nlohmann/json.hpp>

#include "geotag.hpp"

// Attaches geotag fields to a written frame image.
class MetadataWriter {
   public:
    virtual ~MetadataWriter() = default;
    virtual bool write(const std::filesystem::path &image, const GeoTag &tag,
                       std::string *error_out) = 0;
};

// Writes `<image>.json` next to the frame, holding the EXIF GPS fields as rationals.
class JsonSidecarWriter : public MetadataWriter {
   public:
    bool write(const std::filesystem::path &image, const GeoTag &tag,
               std::string *error_out) override;

    static std::filesystem::path sidecar_path(const std::filesystem::path &image);
};

nlohmann::json geotag_to_json(const GeoTag &tag);
