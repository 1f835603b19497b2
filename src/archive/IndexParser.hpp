#pragma once

#include <cstddef>
#include <functional>
#include <optional>
#include <string>
#include <string_view>

#include "archive/IndexModel.hpp"

namespace archive {

// Legacy report names look like
//   20200801T144129Z-BR-AS28573-web_connectivity-20200801T144133Z_AS28573_...-0.2.0-probe.json.lz4
// Field 1 is the country, field 3 the test type (underscores dropped for the match).
bool filenameMatches(std::string_view filename, std::string_view testType, std::string_view country);

// Produces the next line into the argument; false at end of input.
using LineSource = std::function<bool(std::string&)>;

// Reads the legacy index (one JSON object per line, tagged file, /file,
// report, /report, frame, /frame, datum) and yields every file holding at
// least one datum of a matching report. Single pass; not restartable.
class IndexParser {
public:
    IndexParser(LineSource source, std::string testType, std::string country);

    // Next matching file, or std::nullopt once the input is exhausted.
    // Throws domain::IndexParseError on malformed or out-of-order input.
    std::optional<IndexFile> next();

    std::size_t linesRead() const noexcept { return lineNumber_; }

private:
    LineSource source_;
    std::string testType_;
    std::string country_;

    std::optional<IndexFile> currentFile_;
    std::optional<IndexFrame> currentFrame_;
    bool recording_ = false;
    bool exhausted_ = false;
    std::size_t lineNumber_ = 0;
};

}  // namespace archive
