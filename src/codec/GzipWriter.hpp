#pragma once

#include <string>
#include <string_view>

#include <zlib.h>

namespace codec {

class GzipWriter {
public:
    // Truncates or creates path. Throws std::runtime_error.
    explicit GzipWriter(const std::string& path);
    ~GzipWriter();

    GzipWriter(const GzipWriter&) = delete;
    GzipWriter& operator=(const GzipWriter&) = delete;

    void write(std::string_view data);
    void writeLine(std::string_view line);

    // Flushes the trailer. Throws std::runtime_error; the destructor closes
    // silently if this was never called.
    void close();

private:
    std::string path_;
    gzFile file_ = nullptr;
};

}  // namespace codec
