#include "archive/LegacyArchiveBackend.hpp"

#include <deque>
#include <optional>
#include <sstream>
#include <stdexcept>
#include <utility>
#include <vector>

#include "archive/BackendSupport.hpp"
#include "archive/FrameDecoder.hpp"
#include "archive/IndexParser.hpp"
#include "archive/SegmentPlanner.hpp"
#include "codec/GzipReader.hpp"
#include "common/Log.hpp"
#include "domain/Errors.hpp"

namespace archive {

// Walks the day directories and, for each, the files its index yields.
class LegacyArchiveBackend::Listing : public FileEntryStream {
public:
    Listing(LegacyArchiveBackend& backend,
            domain::Date first,
            domain::Date last,
            std::string testType,
            std::string country)
        : backend_(backend),
          first_(first),
          last_(last),
          testType_(std::move(testType)),
          country_(std::move(country)) {}

    std::optional<FileEntry> next() override {
        while (!finished_) {
            if (parser_) {
                if (auto file = nextIndexedFile()) {
                    return makeEntry(std::move(*file));
                }
                continue;
            }
            if (!pendingDirs_.empty()) {
                auto dir = std::move(pendingDirs_.front());
                pendingDirs_.pop_front();
                openDay(dir);
                continue;
            }
            if (!listingDone_) {
                listNextPage();
                continue;
            }
            finished_ = true;
        }
        return std::nullopt;
    }

private:
    std::optional<IndexFile> nextIndexedFile() {
        try {
            if (auto file = parser_->next()) {
                return file;
            }
            LOG_DEBUG("Legacy index " << currentDir_ << " done after " << parser_->linesRead() << " lines");
        } catch (const domain::IndexParseError& ex) {
            LOG_WARN("Skipping " << currentDir_ << " for " << testType_ << "/" << country_
                                 << ": malformed index, " << ex.what());
        } catch (const std::runtime_error& ex) {
            LOG_WARN("Skipping " << currentDir_ << " for " << testType_ << "/" << country_
                                 << ": index not readable, " << ex.what());
        }
        closeDay();
        return std::nullopt;
    }

    void listNextPage() {
        const auto& layout = backend_.layout_;
        domain::ListObjectsRequest request;
        request.bucket = layout.bucket;
        request.prefix = layout.prefix;
        request.delimiter = "/";
        request.startAfter = layout.prefix + first_.toIso();
        request.continuationToken = continuationToken_;

        backend_.counters_.recordList();
        domain::ListObjectsPage page;
        try {
            page = backend_.store_->listObjects(request);
        } catch (const domain::ListingError&) {
            finished_ = true;
            throw;
        }
        for (auto& dir : page.commonPrefixes) {
            pendingDirs_.push_back(std::move(dir));
        }
        continuationToken_ = page.nextContinuationToken;
        listingDone_ = !page.truncated || continuationToken_.empty();
        if (page.truncated && continuationToken_.empty()) {
            LOG_WARN("Truncated listing of " << layout.prefix << " without a continuation token, stopping");
        }
    }

    void openDay(const std::string& dir) {
        const auto dateText = lastComponent(dir);
        const auto date = domain::Date::fromIso(dateText);
        if (!date) {
            LOG_DEBUG("Ignoring legacy prefix " << dir);
            return;
        }
        if (*date > last_ || *date > backend_.layout_.lastDate) {
            finished_ = true;
            return;
        }
        if (*date < first_) {
            return;
        }

        const auto& layout = backend_.layout_;
        const std::string indexKey = dir + layout.indexName;
        backend_.counters_.recordGet();
        try {
            indexBody_ = backend_.store_->getObject(layout.bucket, indexKey);
        } catch (const domain::FetchError& ex) {
            LOG_WARN("Skipping " << dir << " for " << testType_ << "/" << country_ << ": " << ex.what());
            return;
        }
        backend_.counters_.recordBytes(indexBody_.size());
        LOG_DEBUG("Fetched legacy index " << indexKey << " (" << indexBody_.size() << " bytes)");

        currentDir_ = dir;
        currentDate_ = *date;
        try {
            gzip_ = std::make_unique<codec::GzipReader>(indexBody_);
        } catch (const std::runtime_error& ex) {
            LOG_WARN("Skipping " << dir << ": " << ex.what());
            closeDay();
            return;
        }
        parser_ = std::make_unique<IndexParser>(
            [reader = gzip_.get()](std::string& line) { return reader->readLine(line); }, testType_, country_);
    }

    void closeDay() {
        parser_.reset();
        gzip_.reset();
        indexBody_.clear();
        indexBody_.shrink_to_fit();
    }

    FileEntry makeEntry(IndexFile file) {
        auto shared = std::make_shared<const IndexFile>(std::move(file));
        FileLocation location{backend_.layout_.bucket, backend_.layout_.prefix + shared->filename};
        const auto size = shared->compressedBytes();
        auto* backend = &backend_;
        auto key = location.key;
        return FileEntry(testType_, country_, currentDate_, std::move(location), size,
                         [backend, key, shared]() { return backend->openMeasurements(key, shared); });
    }

    LegacyArchiveBackend& backend_;
    const domain::Date first_;
    const domain::Date last_;
    const std::string testType_;
    const std::string country_;

    std::deque<std::string> pendingDirs_;
    std::string continuationToken_;
    bool listingDone_ = false;
    bool finished_ = false;

    std::string currentDir_;
    domain::Date currentDate_{};
    std::string indexBody_;
    std::unique_ptr<codec::GzipReader> gzip_;
    std::unique_ptr<IndexParser> parser_;
};

// Fetches segments one at a time, in offset order, and decodes each with its
// own FrameDecoder.
class LegacyArchiveBackend::Measurements : public MeasurementStream {
public:
    Measurements(LegacyArchiveBackend& backend, std::string key, std::shared_ptr<const IndexFile> file)
        : backend_(backend), key_(std::move(key)), file_(std::move(file)) {
        try {
            segments_ = planSegments(file_->frames);
        } catch (const std::invalid_argument& ex) {
            throw domain::DecodeError(context() + ": " + ex.what(), file_->datumCount());
        }
        LOG_DEBUG("Planned " << segments_.size() << " segments for " << file_->frames.size() << " frames of "
                             << key_);
    }

    std::optional<boost::json::value> next() override {
        while (true) {
            if (decoder_) {
                std::optional<std::string> record;
                try {
                    record = decoder_->next();
                } catch (const domain::DecodeError& ex) {
                    finishSegment();
                    throw domain::DecodeError(context() + ": " + ex.what(), ex.lostRecords());
                }
                if (record) {
                    return parseRecord(*record, context());
                }
                finishSegment();
                continue;
            }
            if (segmentIndex_ >= segments_.size()) {
                return std::nullopt;
            }
            openSegment();
        }
    }

private:
    std::string context() const { return "s3://" + backend_.layout_.bucket + "/" + key_; }

    void openSegment() {
        const auto& segment = segments_[segmentIndex_];
        backend_.counters_.recordGet();
        backend_.counters_.recordBytes(segment.size());
        try {
            body_ = backend_.store_->getObject(backend_.layout_.bucket, key_, segment.byteRange());
        } catch (const domain::FetchError& ex) {
            std::size_t lost = 0;
            for (const auto& frame : segment.frames) {
                lost += frame.data.size();
            }
            ++segmentIndex_;
            throw domain::FetchError(context() + ": " + ex.what(), ex.httpStatus(), lost);
        }
        try {
            decoder_ = std::make_unique<FrameDecoder>(body_, segment);
        } catch (const domain::DecodeError& ex) {
            finishSegment();
            throw domain::DecodeError(context() + ": " + ex.what(), ex.lostRecords());
        }
    }

    void finishSegment() {
        decoder_.reset();
        body_.clear();
        ++segmentIndex_;
    }

    LegacyArchiveBackend& backend_;
    const std::string key_;
    const std::shared_ptr<const IndexFile> file_;
    std::vector<Segment> segments_;
    std::size_t segmentIndex_ = 0;
    std::string body_;
    std::unique_ptr<FrameDecoder> decoder_;
};

LegacyArchiveBackend::LegacyArchiveBackend(std::shared_ptr<domain::IObjectStore> store)
    : LegacyArchiveBackend(std::move(store), Layout{}) {}

LegacyArchiveBackend::LegacyArchiveBackend(std::shared_ptr<domain::IObjectStore> store, Layout layout)
    : store_(std::move(store)), layout_(std::move(layout)) {
    if (!store_) {
        throw std::invalid_argument("LegacyArchiveBackend requires an object store");
    }
}

namespace {

class EmptyListing : public FileEntryStream {
public:
    std::optional<FileEntry> next() override { return std::nullopt; }
};

}  // namespace

std::unique_ptr<FileEntryStream> LegacyArchiveBackend::listFiles(const domain::Date& first,
                                                                 const domain::Date& last,
                                                                 const std::string& testType,
                                                                 const std::string& country) {
    if (first > layout_.lastDate || first > last) {
        return std::make_unique<EmptyListing>();
    }
    return std::make_unique<Listing>(*this, first, last, testType, country);
}

std::unique_ptr<MeasurementStream> LegacyArchiveBackend::openMeasurements(std::string key,
                                                                          std::shared_ptr<const IndexFile> file) {
    return std::make_unique<Measurements>(*this, std::move(key), std::move(file));
}

}  // namespace archive
