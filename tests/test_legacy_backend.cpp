#include <cstdint>
#include <iostream>
#include <memory>
#include <string>
#include <vector>

#include <boost/json.hpp>

#include "archive/LegacyArchiveBackend.hpp"
#include "common/Log.hpp"
#include "domain/Errors.hpp"
#include "support/ArchiveFixtures.hpp"
#include "support/FakeObjectStore.hpp"

using archive::LegacyArchiveBackend;
using domain::Date;
using testsupport::FakeObjectStore;
using testsupport::IndexBuilder;

namespace {

const std::string kBucket = "ooni-data";
const std::string kPrefix = "autoclaved/jsonl.tar.lz4/";
const std::string kReport =
    "20170101T000000Z-KZ-AS9198-web_connectivity-20170101T000001Z_AS9198_abc-0.2.0-probe";
const std::string kOtherReport =
    "20170101T000000Z-BR-AS28573-web_connectivity-20170101T000001Z_AS28573_def-0.2.0-probe";

std::vector<archive::FileEntry> drain(archive::FileEntryStream& stream) {
    std::vector<archive::FileEntry> entries;
    while (auto entry = stream.next()) {
        entries.push_back(std::move(*entry));
    }
    return entries;
}

std::string probeCc(const boost::json::value& measurement) {
    const auto& cc = measurement.as_object().at("probe_cc").as_string();
    return std::string{cc.data(), cc.size()};
}

}  // namespace

int main() {
    std::vector<std::string> warnings;
    harvest::log::setLevel(harvest::log::Level::Warn);
    harvest::log::setSink([&warnings](harvest::log::Level level, const std::string& message) {
        if (level == harvest::log::Level::Warn) {
            warnings.push_back(message);
        }
    });

    auto store = std::make_shared<FakeObjectStore>();

    const std::string rec1 = R"({"probe_cc":"KZ","test_name":"web_connectivity","input":"http://a.example/"})";
    const std::string rec2 = R"({"probe_cc":"KZ","test_name":"web_connectivity","input":"http://b.example/"})";
    const std::string text1 = rec1 + "\n";
    const std::string text2 = rec2 + "\n";

    // Day 1: the report, two adjacent 1000-byte frames with one datum each.
    const std::string archiveName = "2017-01-01/" + kReport + ".json.lz4";
    store->put(kBucket, kPrefix + archiveName,
               testsupport::padFrame(testsupport::lz4Frame(text1), 1000) +
                   testsupport::padFrame(testsupport::lz4Frame(text2), 1000));

    // Day 1: a second archive whose first segment is unreadable.
    const std::string brokenName = "2017-01-01/web_connectivity.42.tar.lz4";
    const std::string recB = R"({"probe_cc":"KZ","input":"http://z.example/"})";
    store->put(kBucket, kPrefix + brokenName,
               std::string(1000, '\x7f') + std::string(500, '\0') +
                   testsupport::padFrame(testsupport::lz4Frame(recB + "\n"), 1000));

    IndexBuilder day1;
    day1.file(archiveName)
        .report("2017-01-01/" + kReport + ".json")
        .frame(0, 1000, 0, text1.size())
        .datum(0, rec1.size())
        .endFrame()
        .frame(1000, 1000, text1.size(), text2.size())
        .datum(text1.size(), rec2.size())
        .endFrame()
        .endReport()
        .endFile()
        .file(brokenName)
        .report("2017-01-01/" + kOtherReport + ".json")
        .frame(0, 1000, 0, 50)
        .datum(0, 20)
        .endFrame()
        .endReport()
        .report("2017-01-01/" + kReport + "-b.json")
        .frame(0, 1000, 0, 50)
        .datum(0, 20)
        .endFrame()
        .frame(1500, 1000, 9000, recB.size() + 1)
        .datum(9000, recB.size())
        .endFrame()
        .endReport()
        .endFile();
    store->put(kBucket, kPrefix + "2017-01-01/index.json.gz", testsupport::gzipString(day1.text()));

    // Day 2: no index. Day 3: index is not gzip. Day 5: past the range.
    store->put(kBucket, kPrefix + "2017-01-02/web_connectivity.00.tar.lz4", "x");
    store->put(kBucket, kPrefix + "2017-01-03/index.json.gz", "definitely not gzip");
    store->put(kBucket, kPrefix + "2017-01-05/index.json.gz", testsupport::gzipString(day1.text()));
    // Before the range.
    store->put(kBucket, kPrefix + "2016-12-31/index.json.gz", testsupport::gzipString(day1.text()));

    LegacyArchiveBackend backend(store);

    {
        auto stream = backend.listFiles(*Date::fromIso("2017-01-01"), *Date::fromIso("2017-01-03"),
                                        "webconnectivity", "KZ");
        if (!store->lists().empty() || !store->gets().empty()) {
            std::cerr << "listFiles must not issue requests before the stream is pulled\n";
            return 1;
        }
        const auto entries = drain(*stream);
        if (entries.size() != 2) {
            std::cerr << "Expected 2 entries, got " << entries.size() << "\n";
            return 1;
        }
        const auto& entry = entries[0];
        if (entry.location().bucket != kBucket || entry.location().key != kPrefix + archiveName) {
            std::cerr << "Unexpected location " << entry.location().url() << "\n";
            return 1;
        }
        if (entry.country() != "KZ" || entry.testType() != "webconnectivity" ||
            entry.date() != *Date::fromIso("2017-01-01") || entry.sizeBytes() != 2000) {
            std::cerr << "Unexpected entry " << entry.describe() << " size " << entry.sizeBytes() << "\n";
            return 1;
        }

        for (const auto& get : store->gets()) {
            if (get.key.find("2017-01-05") != std::string::npos || get.key.find("2016-12-31") != std::string::npos) {
                std::cerr << "Index outside the range was fetched: " << get.key << "\n";
                return 1;
            }
        }
        const auto costs = backend.costs();
        if (costs.listRequests != 1 || costs.getRequests != 3) {
            std::cerr << "Listing should cost 1 LIST and 3 GETs, got " << costs.listRequests << "/"
                      << costs.getRequests << "\n";
            return 1;
        }
        if (warnings.size() != 2) {
            std::cerr << "Expected a warning per skipped day, got " << warnings.size() << "\n";
            return 1;
        }
        if (store->lists().front().startAfter != kPrefix + "2017-01-01" || store->lists().front().delimiter != "/") {
            std::cerr << "Date listing should start after the first date with delimiter '/'\n";
            return 1;
        }

        store->clearCalls();
        const auto before = backend.costs();
        auto measurements = entry.getMeasurements();
        std::vector<boost::json::value> records;
        while (auto record = measurements->next()) {
            records.push_back(std::move(*record));
        }
        const auto gets = store->gets();
        if (gets.size() != 1 || !gets[0].range || gets[0].range->first != 0 || gets[0].range->last != 1999) {
            std::cerr << "Expected a single ranged GET bytes=0-1999\n";
            return 1;
        }
        if (records.size() != 2 || probeCc(records[0]) != "KZ" ||
            records[1].as_object().at("input").as_string() != "http://b.example/") {
            std::cerr << "Expected the two KZ records in order\n";
            return 1;
        }
        const auto after = backend.costs();
        if (after.getRequests != before.getRequests + 1 || after.bytesDownloaded != before.bytesDownloaded + 2000) {
            std::cerr << "Materializing should add 1 GET and 2000 bytes\n";
            return 1;
        }

        // Every materialization issues its own requests.
        auto again = entry.getMeasurements();
        std::size_t count = 0;
        while (again->next()) {
            ++count;
        }
        if (count != 2 || backend.costs().getRequests != after.getRequests + 1) {
            std::cerr << "Second materialization should repeat the GET\n";
            return 1;
        }

        // The broken archive: first segment fails, the second still decodes.
        store->clearCalls();
        auto partial = entries[1].getMeasurements();
        bool threw = false;
        try {
            partial->next();
        } catch (const domain::DecodeError& ex) {
            threw = ex.lostRecords() == 1 && std::string{ex.what()}.find(brokenName) != std::string::npos;
        }
        if (!threw) {
            std::cerr << "Unreadable segment should raise DecodeError naming the object\n";
            return 1;
        }
        auto survivor = partial->next();
        if (!survivor || survivor->as_object().at("input").as_string() != "http://z.example/") {
            std::cerr << "Stream should continue with the next segment\n";
            return 1;
        }
        if (partial->next()) {
            std::cerr << "Broken archive should hold only one readable record\n";
            return 1;
        }
        if (store->gets().size() != 2 || store->gets()[1].range->first != 1500 ||
            store->gets()[1].range->last != 2499) {
            std::cerr << "Expected two ranged GETs, the second bytes=1500-2499\n";
            return 1;
        }
    }

    {
        // Listing twice yields the same entries.
        auto first = drain(*backend.listFiles(*Date::fromIso("2017-01-01"), *Date::fromIso("2017-01-01"),
                                              "webconnectivity", "KZ"));
        auto second = drain(*backend.listFiles(*Date::fromIso("2017-01-01"), *Date::fromIso("2017-01-01"),
                                               "webconnectivity", "KZ"));
        if (first.size() != 2 || first != second) {
            std::cerr << "Listing should be repeatable\n";
            return 1;
        }
    }

    {
        // Entirely after the cutover: nothing, and no requests.
        store->clearCalls();
        auto stream = backend.listFiles(*Date::fromIso("2021-01-01"), *Date::fromIso("2021-02-01"),
                                        "webconnectivity", "KZ");
        if (stream->next() || !store->lists().empty() || !store->gets().empty()) {
            std::cerr << "Dates after the cutover should yield nothing without requests\n";
            return 1;
        }
    }

    {
        // Failing to list the day directories is not swallowed.
        auto failing = std::make_shared<FakeObjectStore>();
        failing->failList(kPrefix);
        LegacyArchiveBackend broken(failing);
        auto stream = broken.listFiles(*Date::fromIso("2017-01-01"), *Date::fromIso("2017-01-03"),
                                       "webconnectivity", "KZ");
        bool threw = false;
        try {
            stream->next();
        } catch (const domain::ListingError&) {
            threw = true;
        }
        if (!threw) {
            std::cerr << "Top-level listing failure should propagate\n";
            return 1;
        }
        if (stream->next() || failing->lists().size() != 1) {
            std::cerr << "A failed listing should end without repeating the LIST\n";
            return 1;
        }
    }

    {
        // A truncated page without a token ends the listing instead of repeating it.
        auto paged = std::make_shared<FakeObjectStore>(1);
        paged->put(kBucket, kPrefix + "2017-01-01/index.json.gz", testsupport::gzipString(day1.text()));
        paged->put(kBucket, kPrefix + "2017-01-02/index.json.gz", testsupport::gzipString(day1.text()));
        paged->dropContinuationTokens();
        LegacyArchiveBackend truncated(paged);
        const auto entries = drain(*truncated.listFiles(*Date::fromIso("2017-01-01"), *Date::fromIso("2017-01-02"),
                                                        "webconnectivity", "KZ"));
        if (paged->lists().size() != 1 || entries.size() != 2 || entries[1].date() != *Date::fromIso("2017-01-01")) {
            std::cerr << "Listing without continuation tokens should stop after one page\n";
            return 1;
        }
    }

    {
        // Three segments; the ranged GET of the middle one fails.
        const std::string segRecA = R"({"probe_cc":"KZ","n":1})";
        const std::string segRecB = R"({"probe_cc":"KZ","n":2})";
        const std::string segRecC = R"({"probe_cc":"KZ","n":3})";
        const std::string name = "2017-02-01/" + kReport + ".json.lz4";
        const std::string gap(500, '\0');
        auto segmented = std::make_shared<FakeObjectStore>();
        segmented->put(kBucket, kPrefix + name,
                       testsupport::padFrame(testsupport::lz4Frame(segRecA + "\n"), 1000) + gap +
                           testsupport::padFrame(testsupport::lz4Frame(segRecB + "\n"), 1000) + gap +
                           testsupport::padFrame(testsupport::lz4Frame(segRecC + "\n"), 1000));
        IndexBuilder index;
        index.file(name)
            .report("2017-02-01/" + kReport + ".json")
            .frame(0, 1000, 0, segRecA.size() + 1)
            .datum(0, segRecA.size())
            .endFrame()
            .frame(1500, 1000, segRecA.size() + 1, segRecB.size() + 1)
            .datum(segRecA.size() + 1, segRecB.size())
            .endFrame()
            .frame(3000, 1000, segRecA.size() + segRecB.size() + 2, segRecC.size() + 1)
            .datum(segRecA.size() + segRecB.size() + 2, segRecC.size())
            .endFrame()
            .endReport()
            .endFile();
        segmented->put(kBucket, kPrefix + "2017-02-01/index.json.gz", testsupport::gzipString(index.text()));
        segmented->failRange(kPrefix + name, 1500, 503);

        LegacyArchiveBackend backend3(segmented);
        const auto entries = drain(*backend3.listFiles(*Date::fromIso("2017-02-01"), *Date::fromIso("2017-02-01"),
                                                       "webconnectivity", "KZ"));
        if (entries.size() != 1) {
            std::cerr << "Expected the three-segment archive\n";
            return 1;
        }
        auto measurements = entries[0].getMeasurements();
        auto first = measurements->next();
        if (!first || first->at("n").as_int64() != 1) {
            std::cerr << "First segment should decode\n";
            return 1;
        }
        bool threw = false;
        try {
            measurements->next();
        } catch (const domain::FetchError& ex) {
            threw = ex.lostRecords() == 1 && ex.httpStatus() == 503 &&
                    std::string{ex.what()}.find(name) != std::string::npos;
        }
        if (!threw) {
            std::cerr << "Failed ranged GET should raise FetchError counting the segment's record\n";
            return 1;
        }
        auto third = measurements->next();
        if (!third || third->at("n").as_int64() != 3 || measurements->next()) {
            std::cerr << "Stream should continue with the segment after the failed GET\n";
            return 1;
        }
        std::vector<std::uint64_t> starts;
        for (const auto& get : segmented->gets()) {
            if (get.range) {
                starts.push_back(get.range->first);
            }
        }
        if (starts != std::vector<std::uint64_t>{0, 1500, 3000}) {
            std::cerr << "Expected one ranged GET per segment\n";
            return 1;
        }
    }

    harvest::log::setSink(nullptr);
    std::cout << "test_legacy_backend passed\n";
    return 0;
}
