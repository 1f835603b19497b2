#include "codec/GzipWriter.hpp"

#include <algorithm>
#include <limits>
#include <stdexcept>

namespace codec {
namespace {

std::string describeError(gzFile file) {
    int errnum = 0;
    const char* message = gzerror(file, &errnum);
    return message != nullptr ? std::string{message} : std::string{"unknown zlib error"};
}

}  // namespace

GzipWriter::GzipWriter(const std::string& path) : path_(path) {
    file_ = gzopen(path.c_str(), "wb");
    if (file_ == nullptr) {
        throw std::runtime_error("Unable to open " + path + " for gzip output");
    }
}

GzipWriter::~GzipWriter() {
    if (file_ != nullptr) {
        gzclose(file_);
    }
}

void GzipWriter::write(std::string_view data) {
    if (file_ == nullptr) {
        throw std::runtime_error("Write to closed gzip file " + path_);
    }
    while (!data.empty()) {
        const auto chunk = static_cast<unsigned>(
            std::min<std::size_t>(data.size(), std::numeric_limits<int>::max()));
        const int written = gzwrite(file_, data.data(), chunk);
        if (written <= 0) {
            throw std::runtime_error("gzwrite to " + path_ + " failed: " + describeError(file_));
        }
        data.remove_prefix(static_cast<std::size_t>(written));
    }
}

void GzipWriter::writeLine(std::string_view line) {
    write(line);
    write("\n");
}

void GzipWriter::close() {
    if (file_ == nullptr) {
        return;
    }
    const int ret = gzclose(file_);
    file_ = nullptr;
    if (ret != Z_OK) {
        throw std::runtime_error("gzclose of " + path_ + " failed with code " + std::to_string(ret));
    }
}

}  // namespace codec
