#pragma once

#include <cstddef>
#include <string>
#include <string_view>
#include <vector>

#include <zlib.h>

namespace codec {

// Streaming gunzip over an in-memory buffer. Concatenated gzip members are
// decoded as one stream.
class GzipReader {
public:
    explicit GzipReader(std::string_view compressed);
    ~GzipReader();

    GzipReader(const GzipReader&) = delete;
    GzipReader& operator=(const GzipReader&) = delete;

    // Returns bytes written; fewer than size only at end of stream.
    // Throws std::runtime_error on corrupt or truncated input.
    std::size_t read(char* out, std::size_t size);

    // Reads the next '\n'-terminated line without the terminator. The final
    // line need not be terminated. Returns false at end of stream.
    bool readLine(std::string& line);

private:
    bool fill();

    z_stream stream_{};
    std::string_view input_;
    bool streamEnd_ = false;
    std::vector<char> chunk_;
    std::size_t chunkPos_ = 0;
    std::size_t chunkLen_ = 0;
};

}  // namespace codec
