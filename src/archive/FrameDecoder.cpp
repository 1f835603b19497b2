#include "archive/FrameDecoder.hpp"

#include <sstream>
#include <stdexcept>

#include "codec/Lz4FrameReader.hpp"
#include "domain/Errors.hpp"

namespace archive {

FrameDecoder::FrameDecoder(std::string_view segmentBytes, const Segment& segment) : segment_(segment) {
    for (const auto& frame : segment_.frames) {
        total_ += frame.data.size();
    }
    if (!segment_.frames.empty()) {
        bytesRead_ = segment_.frames.front().textOffset;
    }
    try {
        reader_ = std::make_unique<codec::Lz4FrameReader>(segmentBytes);
    } catch (const std::exception& ex) {
        fail(ex.what());
    }
}

FrameDecoder::~FrameDecoder() = default;

void FrameDecoder::fail(const std::string& reason) {
    failed_ = true;
    const std::size_t lost = total_ - produced_;
    std::ostringstream oss;
    oss << "segment bytes " << segment_.startOffset << "-" << segment_.endOffset << ": " << reason << " ("
        << lost << " of " << total_ << " records lost)";
    throw domain::DecodeError(oss.str(), lost);
}

std::optional<std::string> FrameDecoder::next() {
    if (failed_) {
        return std::nullopt;
    }
    while (frameIndex_ < segment_.frames.size()) {
        const auto& frame = segment_.frames[frameIndex_];
        if (datumIndex_ >= frame.data.size()) {
            ++frameIndex_;
            datumIndex_ = 0;
            continue;
        }

        const auto& datum = frame.data[datumIndex_];
        if (datum.textOffset < bytesRead_) {
            std::ostringstream oss;
            oss << "datum at text offset " << datum.textOffset << " lies behind the decompressed cursor "
                << bytesRead_;
            fail(oss.str());
        }

        std::string record;
        try {
            reader_->skip(datum.textOffset - bytesRead_);
            record.reserve(static_cast<std::size_t>(datum.textSize));
            reader_->readExact(record, static_cast<std::size_t>(datum.textSize));
        } catch (const std::exception& ex) {
            fail(ex.what());
        }

        bytesRead_ = datum.textOffset + datum.textSize;
        ++datumIndex_;
        ++produced_;
        return record;
    }
    return std::nullopt;
}

}  // namespace archive
