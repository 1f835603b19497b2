#pragma once

#include <cstdint>
#include <string>
#include <vector>

namespace archive {

// Position of one record inside the decompressed text of its file.
struct IndexDatum {
    std::uint64_t textOffset{0};
    std::uint64_t textSize{0};
};

// One LZ4 frame of an archive file. Only data that passed the report filter
// are kept.
struct IndexFrame {
    std::uint64_t fileOffset{0};
    std::uint64_t frameSize{0};
    std::uint64_t textOffset{0};
    std::uint64_t textSize{0};
    std::vector<IndexDatum> data;

    std::uint64_t fileEnd() const { return fileOffset + frameSize; }
};

struct IndexFile {
    std::string filename;
    std::vector<IndexFrame> frames;  // ascending fileOffset

    std::uint64_t compressedBytes() const {
        std::uint64_t total = 0;
        for (const auto& frame : frames) {
            total += frame.frameSize;
        }
        return total;
    }

    std::size_t datumCount() const {
        std::size_t total = 0;
        for (const auto& frame : frames) {
            total += frame.data.size();
        }
        return total;
    }
};

}  // namespace archive
