/**
 * @file report_test.cpp
 * @brief Boot-time reporting of the previous fault record.
 * @copyright Copyright (c) 2025 MTA, Inc.
 *
 */

#include "panicram/report.hpp"
#include "panicram/region.hpp"
#include "test_platform.hpp"
#include "test_support.hpp"

#include <algorithm>
#include <vector>

using namespace PanicRam;
using PanicRam::Test::check;
using PanicRam::Test::section;

static void test_report_once() {
    section("Report once per boot");

    std::vector<uint8_t> buffer(128, 0x3C);
    PanicRam::Test::setRegion(buffer.data(), buffer.size());

    SourceLocation location = {"sensor.cpp", 310, 9};
    encodeRecord(Region::region(), &location, TextMessage("ADC stuck"), DetailMode::FULL);

    check(Region::verifyRegion(), "region is large enough for a record");
    check(Report::reportPreviousFault(), "previous fault is reported");
    check(!Report::reportPreviousFault(), "second call in the same boot finds nothing");
}

static void test_report_variants() {
    section("Report variants");

    std::vector<uint8_t> buffer(64, 0);
    ByteView region(buffer.data(), buffer.size());

    encodeRecord(region, nullptr, TextMessage("no location"), DetailMode::FULL);
    std::optional<Record> record = detectAndConsume(region);
    check(record.has_value() && record->filename().empty(), "record without location decodes");
    if (record) {
        Report::printRecord(*record);
    }

    RecordHeader damaged = {};
    damaged.filenameLength = 200;
    damaged.messageLength = 40;
    Record overrunning(damaged, region);
    check(!overrunning.isWellFormed(), "record with overrunning lengths is flagged as damaged");
    check(overrunning.filename().size() == buffer.size() - HEADER_SIZE && overrunning.message().empty(),
          "damaged record text is clamped to the region");
    Report::printRecord(overrunning);

    SourceLocation location = {"m.cpp", 1, 1};
    encodeRecord(region, &location, TextMessage("dropped"), DetailMode::MINIMAL);
    record = detectAndConsume(region);
    check(record.has_value() && record->message().empty(), "minimal record decodes without message");
    if (record) {
        Report::printRecord(*record);
    }
}

static void test_unusable_region() {
    section("Unusable region");

    std::vector<uint8_t> tiny(HEADER_SIZE - 1, 0);
    PanicRam::Test::setRegion(tiny.data(), tiny.size());
    check(!Region::verifyRegion(), "region smaller than a header is flagged");
    check(!Report::reportPreviousFault(), "undersized region reports nothing");

    PanicRam::Test::setRegion(nullptr, 0);
    check(Region::region().empty(), "unmapped region resolves to an empty view");
    check(!Report::reportPreviousFault(), "unmapped region reports nothing");

    std::vector<uint8_t> buffer(64, 0);
    PanicRam::Test::setRegion(buffer.data(), 0);
    check(Region::region().empty(), "zero-length range resolves to an empty view");
    check(!Region::verifyRegion(), "zero-length range is flagged");

    PanicRam::Test::setBounds(buffer.data() + 32, buffer.data());
    ByteView inverted = Region::region();
    check(inverted.empty() && inverted.data() == nullptr, "inverted range resolves to an empty view");
    check(!Report::reportPreviousFault(), "inverted range reports nothing");
    check(buffer[32] == 0 && buffer[0] == 0, "inverted range is never written");
}

int main() {
    std::cout << "=== Report Test ===" << std::endl;

    test_report_once();
    test_report_variants();
    test_unusable_region();

    return PanicRam::Test::finish("Report Test");
}
