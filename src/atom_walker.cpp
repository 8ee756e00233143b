//
//  atom_walker.cpp
//  TrackForge
//
//  Created by Till Toenshoff on 12/9/25.
//  Copyright © 2025 Till Toenshoff. All rights reserved.
//

#include "atom_walker.hpp"

#include <utility>

#include "byte_order.hpp"
#include "fourcc_utils.hpp"
#include "logging.hpp"

AtomWalker::AtomWalker(std::istream &in, Region region)
    : in_(in), region_(region), cursor_(region.start) {}

AtomStep AtomWalker::finish() {
    done_ = true;
    AtomStep step;
    step.kind = AtomStepKind::End;
    return step;
}

AtomStep AtomWalker::fail(const AtomHeader &header, std::string why) {
    done_ = true;
    failed_ = true;
    TF_LOG("parser", "structural error @" << header.offset << " type="
                                          << fourcc_to_string(header.type) << ": " << why);
    AtomStep step;
    step.kind = AtomStepKind::StructuralError;
    step.header = header;
    step.error = std::move(why);
    return step;
}

AtomStep AtomWalker::next() {
    if (done_) {
        AtomStep step;
        step.kind = AtomStepKind::End;
        return step;
    }
    if (cursor_ + kAtomHeaderSize > region_.end) {
        return finish();
    }

    in_.clear();
    in_.seekg(static_cast<std::streamoff>(cursor_), std::ios::beg);
    AtomHeader header;
    header.offset = cursor_;
    header.size = read_u32(in_);
    header.type = read_u32(in_);
    ++headers_read_;
    if (!in_) {
        return fail(header, "short read of atom header");
    }

    if (header.size == 0) {
        TF_LOG("parser", "zero-size atom @" << header.offset << " terminates region");
        return finish();
    }
    if (header.size < kAtomHeaderSize) {
        return fail(header, "atom size " + std::to_string(header.size) + " below header size");
    }
    const uint64_t remaining = region_.end - cursor_;
    if (header.size > remaining) {
        return fail(header, "atom size " + std::to_string(header.size) + " exceeds remaining " +
                                std::to_string(remaining) + " bytes");
    }

    AtomStep step;
    step.kind = AtomStepKind::Atom;
    step.header = header;
    step.payload.start = cursor_ + kAtomHeaderSize;
    step.payload.end = cursor_ + header.size;
    cursor_ += header.size;
    return step;
}

AtomPathResult find_atom_path(std::istream &in, Region region,
                              const std::vector<uint32_t> &path) {
    AtomPathResult result;
    if (path.empty()) {
        result.payload = region;
        result.status = AtomPathStatus::Found;
        return result;
    }

    // One walker per entered level. A level that runs out is popped and the search resumes
    // with the next sibling of the container that was entered.
    std::vector<AtomWalker> stack;
    stack.emplace_back(in, region);
    while (!stack.empty()) {
        const size_t depth = stack.size() - 1;
        const uint32_t wanted = path[depth];
        AtomStep step = stack.back().next();

        if (step.kind == AtomStepKind::End) {
            stack.pop_back();
            continue;
        }
        if (step.kind == AtomStepKind::StructuralError) {
            result.status = AtomPathStatus::StructuralError;
            result.header = step.header;
            result.error = "looking for " + fourcc_to_string(wanted) + ": " + step.error;
            return result;
        }

        TF_LOG("parser", std::string(depth * 2, ' ') << fourcc_to_string(step.header.type)
                                                     << " size=" << step.header.size
                                                     << " offset=" << step.header.offset);
        if (step.header.type != wanted) {
            continue;
        }
        if (depth + 1 == path.size()) {
            result.status = AtomPathStatus::Found;
            result.header = step.header;
            result.payload = step.payload;
            return result;
        }
        stack.emplace_back(in, step.payload);
    }
    result.status = AtomPathStatus::Missing;
    return result;
}

std::optional<uint64_t> stream_size(std::istream &in) {
    in.clear();
    in.seekg(0, std::ios::end);
    const std::streamoff len = in.tellg();
    in.seekg(0, std::ios::beg);
    if (len < 0 || !in) {
        return std::nullopt;
    }
    return static_cast<uint64_t>(len);
}
