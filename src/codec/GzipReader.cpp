#include "codec/GzipReader.hpp"

#include <algorithm>
#include <cstring>
#include <limits>
#include <stdexcept>

namespace codec {
namespace {

constexpr std::size_t kChunkSize = 64 * 1024;

std::runtime_error makeError(const z_stream& stream, const std::string& what) {
    std::string message = "gzip decode: " + what;
    if (stream.msg != nullptr) {
        message += " (";
        message += stream.msg;
        message += ")";
    }
    return std::runtime_error(message);
}

}  // namespace

GzipReader::GzipReader(std::string_view compressed) : input_(compressed), chunk_(kChunkSize) {
    if (input_.size() > std::numeric_limits<uInt>::max()) {
        throw std::runtime_error("gzip decode: input larger than 4 GiB is not supported");
    }
    stream_.next_in = const_cast<Bytef*>(reinterpret_cast<const Bytef*>(input_.data()));
    stream_.avail_in = static_cast<uInt>(input_.size());
    if (inflateInit2(&stream_, 16 + MAX_WBITS) != Z_OK) {
        throw makeError(stream_, "inflateInit2 failed");
    }
}

GzipReader::~GzipReader() { inflateEnd(&stream_); }

// Decodes the next chunk. Returns false once the stream is exhausted.
bool GzipReader::fill() {
    chunkPos_ = 0;
    chunkLen_ = 0;
    while (chunkLen_ == 0) {
        if (streamEnd_) {
            if (stream_.avail_in == 0) {
                return false;
            }
            // Another gzip member follows.
            if (inflateReset(&stream_) != Z_OK) {
                throw makeError(stream_, "inflateReset failed");
            }
            streamEnd_ = false;
        }
        if (stream_.avail_in == 0) {
            throw makeError(stream_, "unexpected end of compressed input");
        }

        stream_.next_out = reinterpret_cast<Bytef*>(chunk_.data());
        stream_.avail_out = static_cast<uInt>(chunk_.size());
        const int ret = inflate(&stream_, Z_NO_FLUSH);
        if (ret == Z_STREAM_END) {
            streamEnd_ = true;
        } else if (ret != Z_OK) {
            throw makeError(stream_, "inflate failed with code " + std::to_string(ret));
        }
        chunkLen_ = chunk_.size() - stream_.avail_out;
    }
    return true;
}

std::size_t GzipReader::read(char* out, std::size_t size) {
    std::size_t produced = 0;
    while (produced < size) {
        if (chunkPos_ == chunkLen_ && !fill()) {
            break;
        }
        const std::size_t take = std::min(size - produced, chunkLen_ - chunkPos_);
        std::memcpy(out + produced, chunk_.data() + chunkPos_, take);
        chunkPos_ += take;
        produced += take;
    }
    return produced;
}

bool GzipReader::readLine(std::string& line) {
    line.clear();
    bool any = false;
    while (true) {
        if (chunkPos_ == chunkLen_ && !fill()) {
            return any;
        }
        any = true;
        const char* begin = chunk_.data() + chunkPos_;
        const std::size_t available = chunkLen_ - chunkPos_;
        const void* newline = std::memchr(begin, '\n', available);
        if (newline != nullptr) {
            const auto length = static_cast<std::size_t>(static_cast<const char*>(newline) - begin);
            line.append(begin, length);
            chunkPos_ += length + 1;
            return true;
        }
        line.append(begin, available);
        chunkPos_ = chunkLen_;
    }
}

}  // namespace codec
