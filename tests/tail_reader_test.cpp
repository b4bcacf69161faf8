#include "ledger_fixture.hpp"

#include <algorithm>
#include <limits>
#include <sstream>
#include <string>
#include <utility>
#include <chrono>
#include <optional>
#include <random>
#include <thread>

using namespace std::chrono_literals;
using lt::Record;
using lt::TailErrc;
using lt::TailError;
using lt::TailOptions;
using lt::TailReader;

namespace {

using clock_type = std::chrono::steady_clock;

TailOptions poll_every(int ms) {
    TailOptions opt;
    opt.poll_ms = ms;
    return opt;
}

template <class Fn>
TailErrc error_kind(Fn&& fn) {
    try {
        fn();
    } catch (const TailError& e) {
        return e.kind;
    }
    ADD_FAILURE() << "expected TailError";
    return TailErrc::Io;
}

} // namespace

class TailReaderTest : public LedgerTest {};

// ============================================================================
// Construction
// ============================================================================

TEST_F(TailReaderTest, RejectsZeroRecordLength) {
    touch(path());
    EXPECT_EQ(error_kind([&] { TailReader r(path(), 0); }), TailErrc::Misconfigured);
}

TEST_F(TailReaderTest, MissingFileFailsImmediately) {
    EXPECT_EQ(error_kind([&] { TailReader r(path("nope.bin"), 10); }), TailErrc::NotFound);
}

TEST_F(TailReaderTest, ConstructionEstablishesKnownLength) {
    append_pattern(path(), 25);
    TailReader r(path(), 10);
    EXPECT_EQ(r.known_safe_length(), 25u);
    EXPECT_EQ(r.read_cursor(), 0u);
    EXPECT_EQ(r.length_queries(), 1u);
    EXPECT_EQ(r.poll_interval(), 200ms);
    EXPECT_EQ(r.state(), TailReader::State::Ready);
}

TEST_F(TailReaderTest, StartOffsetBeyondFileIsTruncation) {
    append_pattern(path(), 20);
    EXPECT_EQ(error_kind([&] { TailReader r(path(), 10, 30); }), TailErrc::Truncation);
}

TEST_F(TailReaderTest, RecordLengthOverflowingOffsetIsMisconfigured) {
    append_pattern(path(), 10);
    constexpr auto kHuge = std::numeric_limits<std::size_t>::max() - 4;
    EXPECT_EQ(error_kind([&] { TailReader r(path(), kHuge, 5); }), TailErrc::Misconfigured);
}

TEST_F(TailReaderTest, HugeRecordLengthWaitsInsteadOfAllocating) {
    append_pattern(path(), 10);
    TailReader r(path(), std::numeric_limits<std::size_t>::max() - 5, 0, poll_every(10));

    EXPECT_FALSE(r.next_record_for(30ms).has_value());
    EXPECT_EQ(r.read_cursor(), 0u);
    EXPECT_EQ(r.state(), TailReader::State::Waiting);
}

TEST_F(TailReaderTest, WaitForFileToleratesMissingFile) {
    TailOptions opt = poll_every(10);
    opt.wait_for_file = true;
    TailReader r(path(), 10, 0, opt);
    EXPECT_EQ(r.length_queries(), 0u);

    std::jthread writer([&] {
        std::this_thread::sleep_for(50ms);
        append_pattern(path(), 10);
    });

    EXPECT_EQ(r.next_record(), pattern(0, 10));
    EXPECT_EQ(r.read_cursor(), 10u);
}

// ============================================================================
// Fast path and waiting
// ============================================================================

TEST_F(TailReaderTest, RecordAppearsWithinOnePollInterval) {
    touch(path());
    TailReader r(path(), 10, 0, poll_every(50));

    clock_type::time_point appended;
    std::jthread writer([&] {
        std::this_thread::sleep_for(100ms);
        append_pattern(path(), 10);
        appended = clock_type::now();
    });

    const Record rec = r.next_record();
    const auto returned = clock_type::now();
    writer.join();

    EXPECT_EQ(rec, pattern(0, 10));
    EXPECT_LT(returned - appended, 50ms + 100ms); // one interval plus scheduling slack
}

TEST_F(TailReaderTest, FastPathSkipsLengthQuery) {
    append_pattern(path(), 25);
    TailReader r(path(), 10);
    const auto queries = r.length_queries();

    const auto t0 = clock_type::now();
    EXPECT_EQ(r.next_record(), pattern(0, 10));
    EXPECT_EQ(r.next_record(), pattern(10, 10));
    EXPECT_LT(clock_type::now() - t0, 100ms);

    EXPECT_EQ(r.length_queries(), queries);
    EXPECT_EQ(r.read_cursor(), 20u);
    EXPECT_EQ(r.records_read(), 2u);
}

TEST_F(TailReaderTest, QuerySpacingCountsFromLastQuery) {
    touch(path());
    TailReader r(path(), 10, 0, poll_every(200));
    std::this_thread::sleep_for(220ms);

    // first call queries right away: the construction query is older than 200ms
    const auto before_first = clock_type::now();
    EXPECT_FALSE(r.next_record_for(0ms).has_value());
    EXPECT_EQ(r.length_queries(), 2u);

    std::this_thread::sleep_for(50ms);
    append_pattern(path(), 10);

    // second call waits for the interval measured from the first query
    const Record rec = r.next_record();
    const auto returned = clock_type::now();
    EXPECT_EQ(rec, pattern(0, 10));
    EXPECT_GE(returned - before_first, 200ms);
    EXPECT_EQ(r.length_queries(), 3u);
}

TEST_F(TailReaderTest, DeadlineBeforeNextCheckSkipsQuery) {
    touch(path());
    TailReader r(path(), 10, 0, poll_every(200));
    const auto queries = r.length_queries();

    EXPECT_FALSE(r.next_record_for(50ms).has_value());
    EXPECT_EQ(r.length_queries(), queries);
    EXPECT_EQ(r.state(), TailReader::State::Waiting);
}

TEST_F(TailReaderTest, PartialRecordIsNotReadable) {
    append_pattern(path(), 15);
    TailReader r(path(), 10, 0, poll_every(20));

    EXPECT_EQ(r.next_record(), pattern(0, 10));
    EXPECT_FALSE(r.next_record_for(100ms).has_value());
    EXPECT_EQ(r.read_cursor(), 10u);
    EXPECT_EQ(r.known_safe_length(), 15u);

    std::jthread writer([&] {
        std::this_thread::sleep_for(30ms);
        append_pattern(path(), 5);
    });
    EXPECT_EQ(r.next_record(), pattern(10, 10));
    EXPECT_EQ(r.read_cursor(), 20u);
}

TEST_F(TailReaderTest, StartOffsetSkipsEarlierRecords) {
    append_pattern(path(), 40);
    TailReader r(path(), 10, 20);
    EXPECT_EQ(r.start_offset(), 20u);
    EXPECT_EQ(r.next_record(), pattern(20, 10));
    EXPECT_EQ(r.next_record(), pattern(30, 10));
}

TEST_F(TailReaderTest, IdleWaitStaysWithinQueryBound) {
    touch(path());
    constexpr int kPollMs = 20;
    constexpr auto kIdle = 300ms;
    TailReader r(path(), 10, 0, poll_every(kPollMs));
    const auto before = r.length_queries();

    EXPECT_FALSE(r.next_record_for(kIdle).has_value());

    const auto issued = r.length_queries() - before;
    EXPECT_LE(issued, static_cast<std::size_t>((kIdle.count() + kPollMs - 1) / kPollMs + 1));
    EXPECT_GE(issued, 1u);
}

TEST_F(TailReaderTest, ZeroPollIntervalStillDelivers) {
    touch(path());
    TailReader r(path(), 4, 0, poll_every(0));
    EXPECT_EQ(r.poll_interval(), 0ms);

    std::jthread writer([&] {
        std::this_thread::sleep_for(30ms);
        append_pattern(path(), 8);
    });
    EXPECT_EQ(r.next_record(), pattern(0, 4));
    EXPECT_EQ(r.next_record(), pattern(4, 4));
}

// ============================================================================
// Truncation and lifecycle
// ============================================================================

TEST_F(TailReaderTest, TruncationBelowCursorFails) {
    append_pattern(path(), 20);
    TailReader r(path(), 10, 0, poll_every(10));
    (void)r.next_record();
    (void)r.next_record();

    fs::resize_file(path(), 5);

    EXPECT_EQ(error_kind([&] { (void)r.next_record_for(200ms); }), TailErrc::Truncation);
    EXPECT_EQ(r.state(), TailReader::State::Failed);
    EXPECT_EQ(r.read_cursor(), 20u);

    // terminal: even after the writer catches up
    append_pattern(path(), 40);
    EXPECT_EQ(error_kind([&] { (void)r.next_record(); }), TailErrc::Truncation);
}

TEST_F(TailReaderTest, ShrinkBelowKnownLengthFails) {
    append_pattern(path(), 25);
    TailReader r(path(), 10, 0, poll_every(10));
    (void)r.next_record();
    (void)r.next_record();

    fs::resize_file(path(), 22); // still >= cursor, but below the confirmed 25

    try {
        (void)r.next_record_for(200ms);
        FAIL() << "expected TailError";
    } catch (const TailError& e) {
        EXPECT_EQ(e.kind, TailErrc::Truncation);
        EXPECT_EQ(e.need, 25u);
        EXPECT_EQ(e.have, 22u);
    }
}

TEST_F(TailReaderTest, ShortReadInsideKnownLengthIsTruncation) {
    append_pattern(path(), 30);
    TailReader r(path(), 10);
    EXPECT_EQ(r.next_record(), pattern(0, 10));

    fs::resize_file(path(), 20);

    EXPECT_EQ(r.next_record(), pattern(10, 10));
    EXPECT_EQ(error_kind([&] { (void)r.next_record(); }), TailErrc::Truncation);
    EXPECT_EQ(r.read_cursor(), 20u);
}

TEST_F(TailReaderTest, CloseRejectsFurtherReads) {
    append_pattern(path(), 30);
    TailReader r(path(), 10);
    (void)r.next_record();
    r.close();
    EXPECT_EQ(r.state(), TailReader::State::Closed);

    auto res = r.try_next_record();
    ASSERT_FALSE(res.has_value());
    EXPECT_EQ(res.error().kind, TailErrc::Closed);
}

TEST_F(TailReaderTest, TryNextRecordReturnsValue) {
    append_pattern(path(), 10);
    TailReader r(path(), 10);
    auto res = r.try_next_record();
    ASSERT_TRUE(res.has_value());
    EXPECT_EQ(*res, pattern(0, 10));
}

// ============================================================================
// Randomized writer / reader interleavings
// ============================================================================

class TailReaderInterleavingTest : public LedgerTest,
                                   public ::testing::WithParamInterface<unsigned> {};

TEST_P(TailReaderInterleavingTest, RecordsAreContiguousAndCacheIsMonotonic) {
    constexpr std::size_t kRecLen  = 13;
    constexpr std::size_t kRecords = 200;
    touch(path());
    TailReader r(path(), kRecLen, 0, poll_every(1));

    std::jthread writer([&, seed = GetParam()] {
        std::mt19937 rng(seed);
        std::uniform_int_distribution<std::size_t> chunk(1, 3 * kRecLen);
        std::uniform_int_distribution<int> pause_us(0, 500);
        std::size_t left = kRecLen * kRecords;
        while (left > 0) {
            const std::size_t n = std::min(left, chunk(rng));
            append_pattern(path(), n);
            left -= n;
            std::this_thread::sleep_for(std::chrono::microseconds(pause_us(rng)));
        }
    });

    std::uint64_t last_cursor = r.read_cursor();
    std::uint64_t last_known  = r.known_safe_length();
    for (std::size_t i = 0; i < kRecords; ++i) {
        const Record rec = r.next_record();
        ASSERT_EQ(rec.size(), kRecLen);
        ASSERT_EQ(rec, pattern(i * kRecLen, kRecLen)) << "record " << i;

        ASSERT_EQ(r.read_cursor(), last_cursor + kRecLen);
        ASSERT_GE(r.known_safe_length(), last_known);
        ASSERT_GE(r.known_safe_length(), r.read_cursor());
        last_cursor = r.read_cursor();
        last_known  = r.known_safe_length();
    }
    EXPECT_EQ(r.records_read(), kRecords);
}

INSTANTIATE_TEST_SUITE_P(Seeds, TailReaderInterleavingTest,
                         ::testing::Values(1u, 7u, 42u, 1337u));

// ============================================================================
// Counters
// ============================================================================

TEST_F(TailReaderTest, CounterLinesGoToConfiguredSink) {
    append_pattern(path(), 30);
    std::ostringstream sink;
    TailOptions opt;
    opt.log_rate = 2;
    opt.counter_sink = &sink;
    TailReader r(path(), 10, 0, opt);

    for (int i = 0; i < 3; ++i) (void)r.next_record();

    EXPECT_NE(sink.str().find("COUNTER:{\"name\": \"ledgertail-records\", \"counts\": 3"),
              std::string::npos) << sink.str();
}

TEST_F(TailReaderTest, NullCounterSinkSilencesLines) {
    append_pattern(path(), 30);
    TailOptions opt;
    opt.log_rate = 1;
    opt.counter_sink = nullptr;

    std::vector<std::pair<std::string, std::size_t>> points;
    opt.counter_point = [&](const std::string& name, std::size_t delta) {
        points.emplace_back(name, delta);
    };
    TailReader r(path(), 10, 0, opt);
    for (int i = 0; i < 3; ++i) (void)r.next_record();

    std::size_t record_total = 0;
    for (const auto& [name, delta] : points)
        if (name == "ledgertail-records") record_total += delta;
    // points trail the latest increment by one
    EXPECT_EQ(record_total, 2u);
    EXPECT_EQ(r.records_read(), 3u);
}
