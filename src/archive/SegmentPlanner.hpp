#pragma once

#include <cstdint>
#include <vector>

#include "archive/IndexModel.hpp"
#include "domain/ObjectStore.hpp"

namespace archive {

// Maximal run of byte-contiguous frames, fetched with one ranged GET.
struct Segment {
    std::uint64_t startOffset{0};
    std::uint64_t endOffset{0};  // exclusive
    std::vector<IndexFrame> frames;

    std::uint64_t size() const { return endOffset - startOffset; }
    domain::ByteRange byteRange() const { return domain::ByteRange{startOffset, endOffset - 1}; }
};

// Merges frame i+1 into the segment of frame i iff
// frames[i].fileOffset + frames[i].frameSize == frames[i+1].fileOffset.
// Frames must be in ascending, non-overlapping offset order; otherwise
// std::invalid_argument is thrown. Zero-sized frames are rejected the same way.
std::vector<Segment> planSegments(const std::vector<IndexFrame>& frames);

}  // namespace archive
