//
//  atom_walker.hpp
//  TrackForge
//
//  Created by Till Toenshoff on 12/9/25.
//  Copyright © 2025 Till Toenshoff. All rights reserved.
//

#pragma once

#include <cstdint>
#include <istream>
#include <optional>
#include <string>
#include <vector>

inline constexpr uint64_t kAtomHeaderSize = 8;

// Half-open byte range [start, end) of the source stream.
struct Region {
    uint64_t start = 0;
    uint64_t end = 0;

    uint64_t size() const { return end > start ? end - start : 0; }
};

struct AtomHeader {
    uint32_t size = 0;    // total atom size, header included.
    uint32_t type = 0;    // FourCC
    uint64_t offset = 0;  // offset of the header in the source.
};

enum class AtomStepKind {
    Atom,             // header + payload region are valid.
    End,              // region exhausted or zero-size terminator.
    StructuralError,  // header inconsistent with the enclosing region.
};

struct AtomStep {
    AtomStepKind kind = AtomStepKind::End;
    AtomHeader header;
    Region payload;     // [after header, offset + size)
    std::string error;  // set for StructuralError.
};

// Lazy traversal of the atoms directly inside one region. The walker never reads past
// region.end; once it has reported End or StructuralError it performs no further reads.
class AtomWalker {
   public:
    AtomWalker(std::istream &in, Region region);

    AtomStep next();

    bool failed() const { return failed_; }
    // Number of 8-byte headers pulled from the stream so far.
    uint32_t headers_read() const { return headers_read_; }

   private:
    AtomStep finish();
    AtomStep fail(const AtomHeader &header, std::string why);

    std::istream &in_;
    Region region_;
    uint64_t cursor_ = 0;
    uint32_t headers_read_ = 0;
    bool done_ = false;
    bool failed_ = false;
};

enum class AtomPathStatus { Found, Missing, StructuralError };

struct AtomPathResult {
    AtomPathStatus status = AtomPathStatus::Missing;
    AtomHeader header;  // last atom of the path when found.
    Region payload;
    std::string error;
};

// Descend `path` (outermost first), taking the first matching atom on every level. Only the
// named types are entered; siblings are skipped by size.
AtomPathResult find_atom_path(std::istream &in, Region region,
                              const std::vector<uint32_t> &path);

// Determine the stream length, leaving the read position at the start.
std::optional<uint64_t> stream_size(std::istream &in);
