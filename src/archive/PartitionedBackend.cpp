#include "archive/PartitionedBackend.hpp"

#include <cstdio>
#include <deque>
#include <optional>
#include <stdexcept>
#include <utility>

#include "archive/BackendSupport.hpp"
#include "codec/GzipReader.hpp"
#include "common/Log.hpp"
#include "domain/Errors.hpp"

namespace archive {

namespace {

constexpr int kHoursPerDay = 24;

std::string hourDir(int hour) {
    char buf[3];
    std::snprintf(buf, sizeof(buf), "%02d", hour);
    return buf;
}

class EmptyListing : public FileEntryStream {
public:
    std::optional<FileEntry> next() override { return std::nullopt; }
};

}  // namespace

// Date directories, then hours 00..23 of each, then the objects under
// <hour>/<country>/[<testType>/].
class PartitionedBackend::Listing : public FileEntryStream {
public:
    Listing(PartitionedBackend& backend,
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
            if (!pendingObjects_.empty()) {
                auto object = std::move(pendingObjects_.front());
                pendingObjects_.pop_front();
                if (auto entry = makeEntry(object)) {
                    return entry;
                }
                continue;
            }
            if (hourPrefix_) {
                listHourPage();
                continue;
            }
            if (dayDir_ && hour_ < kHoursPerDay) {
                startHour();
                continue;
            }
            dayDir_.reset();
            if (!pendingDirs_.empty()) {
                auto dir = std::move(pendingDirs_.front());
                pendingDirs_.pop_front();
                openDay(dir);
                continue;
            }
            if (!datesDone_) {
                listDatePage();
                continue;
            }
            finished_ = true;
        }
        return std::nullopt;
    }

private:
    void listDatePage() {
        const auto& layout = backend_.layout_;
        domain::ListObjectsRequest request;
        request.bucket = layout.bucket;
        request.prefix = layout.prefix;
        request.delimiter = "/";
        request.startAfter = layout.prefix + first_.toCompact();
        request.continuationToken = dateToken_;

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
        dateToken_ = page.nextContinuationToken;
        datesDone_ = !page.truncated || dateToken_.empty();
        if (page.truncated && dateToken_.empty()) {
            LOG_WARN("Truncated listing of " << layout.prefix << " without a continuation token, stopping");
        }
    }

    void openDay(const std::string& dir) {
        const auto date = domain::Date::fromCompact(lastComponent(dir));
        if (!date) {
            LOG_DEBUG("Ignoring partitioned prefix " << dir);
            return;
        }
        if (*date > last_) {
            finished_ = true;
            return;
        }
        if (*date < first_ || *date < backend_.layout_.firstDate) {
            return;
        }
        dayDir_ = dir;
        date_ = *date;
        hour_ = 0;
    }

    void startHour() {
        std::string prefix = *dayDir_ + hourDir(hour_) + "/" + country_ + "/";
        if (!testType_.empty()) {
            prefix += testType_ + "/";
        }
        ++hour_;
        hourPrefix_ = std::move(prefix);
        hourToken_.clear();
    }

    void listHourPage() {
        domain::ListObjectsRequest request;
        request.bucket = backend_.layout_.bucket;
        request.prefix = *hourPrefix_;
        request.continuationToken = hourToken_;

        backend_.counters_.recordList();
        domain::ListObjectsPage page;
        try {
            page = backend_.store_->listObjects(request);
        } catch (const domain::ListingError& ex) {
            LOG_WARN("Skipping " << *hourPrefix_ << " for " << testType_ << "/" << country_ << " on " << date_
                                 << ": " << ex.what());
            hourPrefix_.reset();
            return;
        }
        for (auto& object : page.objects) {
            pendingObjects_.push_back(std::move(object));
        }
        if (page.truncated && !page.nextContinuationToken.empty()) {
            hourToken_ = page.nextContinuationToken;
        } else {
            hourPrefix_.reset();
        }
    }

    std::optional<FileEntry> makeEntry(const domain::ObjectSummary& object) {
        const auto& layout = backend_.layout_;
        if (!endsWith(object.key, layout.suffix)) {
            return std::nullopt;
        }
        std::string testType(parentComponent(object.key));
        auto* backend = &backend_;
        auto key = object.key;
        return FileEntry(std::move(testType), country_, date_, FileLocation{layout.bucket, object.key}, object.size,
                         [backend, key]() { return backend->openMeasurements(key); });
    }

    PartitionedBackend& backend_;
    const domain::Date first_;
    const domain::Date last_;
    const std::string testType_;
    const std::string country_;

    std::deque<std::string> pendingDirs_;
    std::string dateToken_;
    bool datesDone_ = false;
    bool finished_ = false;

    std::optional<std::string> dayDir_;
    domain::Date date_{};
    int hour_ = 0;
    std::optional<std::string> hourPrefix_;
    std::string hourToken_;
    std::deque<domain::ObjectSummary> pendingObjects_;
};

// One whole-object GET on the first pull, then line by line.
class PartitionedBackend::Measurements : public MeasurementStream {
public:
    Measurements(PartitionedBackend& backend, std::string key) : backend_(backend), key_(std::move(key)) {}

    std::optional<boost::json::value> next() override {
        if (done_) {
            return std::nullopt;
        }
        if (!reader_) {
            fetch();
        }
        std::string line;
        while (true) {
            try {
                if (!reader_->readLine(line)) {
                    finish();
                    return std::nullopt;
                }
            } catch (const std::runtime_error& ex) {
                finish();
                throw domain::DecodeError(context() + ": " + ex.what());
            }
            ++lineNumber_;
            if (line.find_first_not_of(" \t\r") == std::string::npos) {
                continue;
            }
            return parseRecord(line, context() + " line " + std::to_string(lineNumber_));
        }
    }

private:
    std::string context() const { return "s3://" + backend_.layout_.bucket + "/" + key_; }

    void fetch() {
        backend_.counters_.recordGet();
        try {
            body_ = backend_.store_->getObject(backend_.layout_.bucket, key_);
        } catch (const domain::FetchError& ex) {
            done_ = true;
            throw domain::FetchError(context() + ": " + ex.what(), ex.httpStatus());
        }
        backend_.counters_.recordBytes(body_.size());
        LOG_DEBUG("Fetched " << context() << " (" << body_.size() << " bytes)");
        try {
            reader_ = std::make_unique<codec::GzipReader>(body_);
        } catch (const std::runtime_error& ex) {
            finish();
            throw domain::DecodeError(context() + ": " + ex.what());
        }
    }

    void finish() {
        done_ = true;
        reader_.reset();
        body_.clear();
    }

    PartitionedBackend& backend_;
    const std::string key_;
    std::string body_;
    std::unique_ptr<codec::GzipReader> reader_;
    std::size_t lineNumber_ = 0;
    bool done_ = false;
};

PartitionedBackend::PartitionedBackend(std::shared_ptr<domain::IObjectStore> store)
    : PartitionedBackend(std::move(store), Layout{}) {}

PartitionedBackend::PartitionedBackend(std::shared_ptr<domain::IObjectStore> store, Layout layout)
    : store_(std::move(store)), layout_(std::move(layout)) {
    if (!store_) {
        throw std::invalid_argument("PartitionedBackend requires an object store");
    }
}

std::unique_ptr<FileEntryStream> PartitionedBackend::listFiles(const domain::Date& first,
                                                               const domain::Date& last,
                                                               const std::string& testType,
                                                               const std::string& country) {
    if (last < layout_.firstDate || first > last) {
        return std::make_unique<EmptyListing>();
    }
    return std::make_unique<Listing>(*this, first, last, testType, country);
}

std::unique_ptr<MeasurementStream> PartitionedBackend::openMeasurements(std::string key) {
    return std::make_unique<Measurements>(*this, std::move(key));
}

}  // namespace archive
