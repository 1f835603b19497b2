#pragma once

#include <cstddef>
#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <string_view>

#include "archive/SegmentPlanner.hpp"

namespace codec {
class Lz4FrameReader;
}

namespace archive {

// Extracts the records of one segment from its compressed bytes.
//
// The decompressed cursor starts at the text offset of the segment's first
// frame (0 when the index did not carry one) and only moves forward: bytes
// before a datum are read and dropped, never seeked over. Data must be in
// non-decreasing textOffset order, which is how the index lists them.
//
// Both segmentBytes and segment must outlive the decoder. One decoder per
// segment; not thread-safe.
class FrameDecoder {
public:
    FrameDecoder(std::string_view segmentBytes, const Segment& segment);
    ~FrameDecoder();

    FrameDecoder(const FrameDecoder&) = delete;
    FrameDecoder& operator=(const FrameDecoder&) = delete;

    // Raw bytes of the next datum, or std::nullopt when every datum of the
    // segment was produced. On failure throws domain::DecodeError whose
    // lostRecords() counts the current datum and everything after it; the
    // decoder is then exhausted.
    std::optional<std::string> next();

    std::size_t totalRecords() const noexcept { return total_; }
    std::size_t producedRecords() const noexcept { return produced_; }

private:
    [[noreturn]] void fail(const std::string& reason);

    const Segment& segment_;
    std::unique_ptr<codec::Lz4FrameReader> reader_;
    std::size_t frameIndex_ = 0;
    std::size_t datumIndex_ = 0;
    std::uint64_t bytesRead_ = 0;
    std::size_t total_ = 0;
    std::size_t produced_ = 0;
    bool failed_ = false;
};

}  // namespace archive
