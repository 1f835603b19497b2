#include "codec/Lz4FrameReader.hpp"

#include <algorithm>
#include <array>
#include <sstream>
#include <stdexcept>

#include <lz4frame.h>

namespace codec {
namespace {

constexpr std::size_t kSkipChunk = 64 * 1024;

std::runtime_error makeError(const std::string& message) {
    return std::runtime_error("lz4 frame decode: " + message);
}

}  // namespace

Lz4FrameReader::Lz4FrameReader(std::string_view compressed) : input_(compressed) {
    const LZ4F_errorCode_t err = LZ4F_createDecompressionContext(&context_, LZ4F_VERSION);
    if (LZ4F_isError(err)) {
        context_ = nullptr;
        throw makeError(std::string{"failed to create decompression context: "} + LZ4F_getErrorName(err));
    }
}

Lz4FrameReader::~Lz4FrameReader() {
    if (context_) {
        LZ4F_freeDecompressionContext(context_);
    }
}

std::size_t Lz4FrameReader::read(char* out, std::size_t size) {
    std::size_t produced = 0;
    while (produced < size) {
        const std::size_t remaining = input_.size() - inputPos_;
        if (remaining == 0) {
            // A zero hint means the last frame was fully decoded.
            if (frameHint_ != 0) {
                std::ostringstream oss;
                oss << "input truncated after " << inputPos_ << " compressed bytes, expected " << frameHint_
                    << " more";
                throw makeError(oss.str());
            }
            break;
        }

        std::size_t dstSize = size - produced;
        std::size_t srcSize = remaining;
        const std::size_t status =
            LZ4F_decompress(context_, out + produced, &dstSize, input_.data() + inputPos_, &srcSize, nullptr);
        if (LZ4F_isError(status)) {
            std::ostringstream oss;
            oss << "corrupt input at compressed offset " << inputPos_ << " (" << LZ4F_getErrorName(status) << ")";
            throw makeError(oss.str());
        }

        inputPos_ += srcSize;
        produced += dstSize;
        frameHint_ = status;
        if (srcSize == 0 && dstSize == 0) {
            throw makeError("decompressor made no progress");
        }
    }
    totalOut_ += produced;
    return produced;
}

void Lz4FrameReader::readExact(std::string& out, std::size_t size) {
    const std::size_t offset = out.size();
    out.resize(offset + size);
    const std::size_t got = read(out.data() + offset, size);
    if (got != size) {
        out.resize(offset + got);
        std::ostringstream oss;
        oss << "unexpected end of stream: wanted " << size << " bytes, got " << got;
        throw makeError(oss.str());
    }
}

void Lz4FrameReader::skip(std::uint64_t count) {
    std::array<char, kSkipChunk> scratch{};
    while (count > 0) {
        const auto chunk = static_cast<std::size_t>(std::min<std::uint64_t>(count, scratch.size()));
        const std::size_t got = read(scratch.data(), chunk);
        if (got != chunk) {
            std::ostringstream oss;
            oss << "unexpected end of stream while skipping, " << (count - got) << " bytes short";
            throw makeError(oss.str());
        }
        count -= got;
    }
}

}  // namespace codec
