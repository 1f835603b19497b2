#include "archive/IndexParser.hpp"

#include <utility>
#include <vector>

#include <boost/json.hpp>

#include "domain/Errors.hpp"

namespace archive {
namespace {

std::vector<std::string_view> splitDashes(std::string_view text) {
    std::vector<std::string_view> parts;
    std::size_t start = 0;
    while (true) {
        const auto pos = text.find('-', start);
        if (pos == std::string_view::npos) {
            parts.push_back(text.substr(start));
            break;
        }
        parts.push_back(text.substr(start, pos - start));
        start = pos + 1;
    }
    return parts;
}

std::string stripUnderscores(std::string_view text) {
    std::string result;
    result.reserve(text.size());
    for (char ch : text) {
        if (ch != '_') {
            result.push_back(ch);
        }
    }
    return result;
}

std::uint64_t requireUint(const boost::json::object& entry, std::string_view key, std::size_t line) {
    const auto* value = entry.if_contains(key);
    if (value == nullptr) {
        throw domain::IndexParseError("missing field '" + std::string{key} + "'", line);
    }
    if (value->is_uint64()) {
        return value->as_uint64();
    }
    if (value->is_int64() && value->as_int64() >= 0) {
        return static_cast<std::uint64_t>(value->as_int64());
    }
    throw domain::IndexParseError("field '" + std::string{key} + "' is not a non-negative integer", line);
}

std::uint64_t optionalUint(const boost::json::object& entry, std::string_view key, std::size_t line) {
    if (entry.if_contains(key) == nullptr) {
        return 0;
    }
    return requireUint(entry, key, line);
}

std::string requireString(const boost::json::object& entry, std::string_view key, std::size_t line) {
    const auto* value = entry.if_contains(key);
    if (value == nullptr || !value->is_string()) {
        throw domain::IndexParseError("missing string field '" + std::string{key} + "'", line);
    }
    const auto& str = value->as_string();
    return std::string{str.data(), str.size()};
}

}  // namespace

bool filenameMatches(std::string_view filename, std::string_view testType, std::string_view country) {
    const auto slash = filename.rfind('/');
    const auto basename = slash == std::string_view::npos ? filename : filename.substr(slash + 1);
    const auto parts = splitDashes(basename);
    if (parts.size() < 4) {
        return false;
    }
    return parts[1] == country && stripUnderscores(parts[3]) == testType;
}

IndexParser::IndexParser(LineSource source, std::string testType, std::string country)
    : source_(std::move(source)), testType_(std::move(testType)), country_(std::move(country)) {}

std::optional<IndexFile> IndexParser::next() {
    std::string line;
    while (!exhausted_) {
        if (!source_(line)) {
            exhausted_ = true;
            break;
        }
        ++lineNumber_;
        if (line.empty() || line == "\r") {
            continue;
        }

        boost::json::error_code ec;
        auto parsed = boost::json::parse(line, ec);
        if (ec) {
            throw domain::IndexParseError("invalid JSON: " + ec.message(), lineNumber_);
        }
        if (!parsed.is_object()) {
            throw domain::IndexParseError("entry is not a JSON object", lineNumber_);
        }
        const auto& entry = parsed.as_object();
        const auto type = requireString(entry, "type", lineNumber_);

        if (type == "file") {
            if (currentFile_) {
                throw domain::IndexParseError("'file' before closing '" + currentFile_->filename + "'", lineNumber_);
            }
            currentFile_.emplace();
            currentFile_->filename = requireString(entry, "filename", lineNumber_);
        } else if (type == "/file") {
            if (!currentFile_) {
                throw domain::IndexParseError("'/file' without an open file", lineNumber_);
            }
            auto file = std::move(*currentFile_);
            currentFile_.reset();
            if (!file.frames.empty()) {
                return file;
            }
        } else if (type == "report") {
            recording_ = filenameMatches(requireString(entry, "textname", lineNumber_), testType_, country_);
        } else if (type == "/report") {
            recording_ = false;
        } else if (type == "frame") {
            if (!currentFile_) {
                throw domain::IndexParseError("'frame' outside of a file", lineNumber_);
            }
            if (currentFrame_) {
                throw domain::IndexParseError("'frame' before closing the frame at offset " +
                                                  std::to_string(currentFrame_->fileOffset),
                                              lineNumber_);
            }
            IndexFrame frame;
            frame.fileOffset = requireUint(entry, "file_off", lineNumber_);
            frame.frameSize = requireUint(entry, "file_size", lineNumber_);
            frame.textOffset = optionalUint(entry, "text_off", lineNumber_);
            frame.textSize = optionalUint(entry, "text_size", lineNumber_);
            currentFrame_ = std::move(frame);
        } else if (type == "/frame") {
            if (!currentFrame_ || !currentFile_) {
                throw domain::IndexParseError("'/frame' without an open frame", lineNumber_);
            }
            auto frame = std::move(*currentFrame_);
            currentFrame_.reset();
            if (frame.data.empty()) {
                continue;
            }
            if (frame.frameSize == 0) {
                throw domain::IndexParseError("frame with data has zero file_size", lineNumber_);
            }
            auto& frames = currentFile_->frames;
            if (!frames.empty() && frame.fileOffset < frames.back().fileEnd()) {
                throw domain::IndexParseError("frame at offset " + std::to_string(frame.fileOffset) +
                                                  " overlaps or precedes frame ending at " +
                                                  std::to_string(frames.back().fileEnd()),
                                              lineNumber_);
            }
            frames.push_back(std::move(frame));
        } else if (type == "datum") {
            if (!currentFrame_) {
                throw domain::IndexParseError("'datum' outside of a frame", lineNumber_);
            }
            if (recording_) {
                IndexDatum datum;
                datum.textOffset = requireUint(entry, "text_off", lineNumber_);
                datum.textSize = requireUint(entry, "text_size", lineNumber_);
                currentFrame_->data.push_back(datum);
            }
        }
        // Other entry types carry nothing this reader needs.
    }
    return std::nullopt;
}

}  // namespace archive
