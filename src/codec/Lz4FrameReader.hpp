#pragma once

#include <cstddef>
#include <cstdint>
#include <string>
#include <string_view>

struct LZ4F_dctx_s;

namespace codec {

// Incremental decompressor over a buffer holding one or more concatenated
// LZ4 frames. Output is produced on demand; nothing is decompressed ahead of
// what read()/skip() ask for beyond lz4's own block buffer.
class Lz4FrameReader {
public:
    explicit Lz4FrameReader(std::string_view compressed);
    ~Lz4FrameReader();

    Lz4FrameReader(const Lz4FrameReader&) = delete;
    Lz4FrameReader& operator=(const Lz4FrameReader&) = delete;

    // Returns the number of bytes written to out; fewer than size only at end
    // of stream. Throws std::runtime_error on corrupt or truncated input.
    std::size_t read(char* out, std::size_t size);

    // Appends exactly size bytes to out or throws std::runtime_error.
    void readExact(std::string& out, std::size_t size);

    // Discards exactly count bytes or throws std::runtime_error.
    void skip(std::uint64_t count);

    std::uint64_t totalOut() const noexcept { return totalOut_; }

private:
    LZ4F_dctx_s* context_ = nullptr;
    std::string_view input_;
    std::size_t inputPos_ = 0;
    std::size_t frameHint_ = 0;
    std::uint64_t totalOut_ = 0;
};

}  // namespace codec
