#include "archive/SegmentPlanner.hpp"

#include <stdexcept>
#include <string>

namespace archive {

std::vector<Segment> planSegments(const std::vector<IndexFrame>& frames) {
    std::vector<Segment> segments;
    for (const auto& frame : frames) {
        if (frame.frameSize == 0) {
            throw std::invalid_argument("frame at offset " + std::to_string(frame.fileOffset) + " has zero size");
        }
        if (!segments.empty()) {
            auto& current = segments.back();
            if (frame.fileOffset < current.endOffset) {
                throw std::invalid_argument("frame at offset " + std::to_string(frame.fileOffset) +
                                            " precedes the end of the previous frame at " +
                                            std::to_string(current.endOffset));
            }
            if (frame.fileOffset == current.endOffset) {
                current.endOffset = frame.fileEnd();
                current.frames.push_back(frame);
                continue;
            }
        }
        Segment segment;
        segment.startOffset = frame.fileOffset;
        segment.endOffset = frame.fileEnd();
        segment.frames.push_back(frame);
        segments.push_back(std::move(segment));
    }
    return segments;
}

}  // namespace archive
