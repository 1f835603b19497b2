#include <iostream>
#include <stdexcept>
#include <vector>

#include "archive/SegmentPlanner.hpp"

using archive::IndexDatum;
using archive::IndexFrame;
using archive::planSegments;

namespace {

IndexFrame makeFrame(std::uint64_t offset, std::uint64_t size) {
    IndexFrame frame;
    frame.fileOffset = offset;
    frame.frameSize = size;
    frame.data.push_back(IndexDatum{0, 1});
    return frame;
}

}  // namespace

int main() {
    {
        const std::vector<IndexFrame> frames{makeFrame(0, 1000), makeFrame(1000, 500), makeFrame(1500, 20)};
        const auto segments = planSegments(frames);
        if (segments.size() != 1) {
            std::cerr << "Contiguous frames should form one segment, got " << segments.size() << "\n";
            return 1;
        }
        if (segments[0].startOffset != 0 || segments[0].endOffset != 1520 || segments[0].frames.size() != 3) {
            std::cerr << "Unexpected segment [" << segments[0].startOffset << ", " << segments[0].endOffset << ")\n";
            return 1;
        }
        const auto range = segments[0].byteRange();
        if (range.first != 0 || range.last != 1519 || range.size() != 1520) {
            std::cerr << "Byte range should be inclusive 0-1519\n";
            return 1;
        }
    }

    {
        // Three runs separated by gaps.
        const std::vector<IndexFrame> frames{makeFrame(0, 100),   makeFrame(100, 100), makeFrame(300, 50),
                                             makeFrame(400, 10),  makeFrame(410, 90)};
        const auto segments = planSegments(frames);
        if (segments.size() != 3) {
            std::cerr << "Expected 3 segments, got " << segments.size() << "\n";
            return 1;
        }
        const std::uint64_t expected[3][2] = {{0, 200}, {300, 350}, {400, 500}};
        std::uint64_t covered = 0;
        for (std::size_t i = 0; i < segments.size(); ++i) {
            if (segments[i].startOffset != expected[i][0] || segments[i].endOffset != expected[i][1]) {
                std::cerr << "Segment " << i << " is [" << segments[i].startOffset << ", " << segments[i].endOffset
                          << ")\n";
                return 1;
            }
            if (i > 0 && segments[i].startOffset < segments[i - 1].endOffset) {
                std::cerr << "Segments overlap at " << i << "\n";
                return 1;
            }
            covered += segments[i].size();
        }
        std::uint64_t frameBytes = 0;
        for (const auto& frame : frames) {
            frameBytes += frame.frameSize;
        }
        if (covered != frameBytes) {
            std::cerr << "Segments cover " << covered << " bytes, frames hold " << frameBytes << "\n";
            return 1;
        }
    }

    {
        if (!planSegments({}).empty()) {
            std::cerr << "No frames should plan no segments\n";
            return 1;
        }
    }

    {
        bool threw = false;
        try {
            planSegments({makeFrame(100, 100), makeFrame(50, 10)});
        } catch (const std::invalid_argument&) {
            threw = true;
        }
        if (!threw) {
            std::cerr << "Out-of-order frames should be rejected\n";
            return 1;
        }

        threw = false;
        try {
            planSegments({makeFrame(0, 100), makeFrame(50, 100)});
        } catch (const std::invalid_argument&) {
            threw = true;
        }
        if (!threw) {
            std::cerr << "Overlapping frames should be rejected\n";
            return 1;
        }

        threw = false;
        try {
            planSegments({makeFrame(0, 0)});
        } catch (const std::invalid_argument&) {
            threw = true;
        }
        if (!threw) {
            std::cerr << "Zero-sized frames should be rejected\n";
            return 1;
        }
    }

    std::cout << "test_segment_planner passed\n";
    return 0;
}
