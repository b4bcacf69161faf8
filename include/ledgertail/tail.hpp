#pragma once
#include <chrono>
#include <cstddef>
#include <cstdint>
#include <expected>
#include <functional>
#include <iosfwd>
#include <optional>
#include <string>
#include <vector>

#include "ledgertail/counter.hpp"
#include "ledgertail/error.hpp"
#include "ledgertail/ledger_file.hpp"

namespace lt {

using Record = std::vector<std::byte>;

struct TailOptions {
    int         poll_ms       = 200;   // <= 0: no minimum spacing between length queries
    bool        wait_for_file = false; // tolerate a missing file until it appears
    std::size_t log_rate      = 0;     // Counter log rate, 0 = default
    std::ostream* counter_sink = &std::clog; // COUNTER: lines, nullptr = off
    Counter::PointFn counter_point;          // per-increment count deltas

    int         inactivity_timeout_ms = 0; // tail_records only
};

// Blocking reader over a file of fixed-length records appended by another
// process. Single consumer; not safe for concurrent calls.
//
// The reader trusts known_safe_length() until the next record would cross
// it, then polls the file length no more often than once per poll interval.
class TailReader {
public:
    enum class State { Ready, Waiting, Failed, Closed };

    TailReader(const std::string& path, std::size_t record_length,
               std::uint64_t start_offset = 0, TailOptions opt = {});

    TailReader(const TailReader&) = delete;
    TailReader& operator=(const TailReader&) = delete;

    // Blocks until a full record is present. Throws TailError.
    Record next_record();

    [[nodiscard]] std::expected<Record, TailError> try_next_record();

    // Gives up with nullopt once `timeout` passes without a full record.
    std::optional<Record> next_record_for(std::chrono::milliseconds timeout);

    void close() noexcept;

    [[nodiscard]] std::uint64_t read_cursor()       const noexcept { return cursor_; }
    [[nodiscard]] std::uint64_t known_safe_length() const noexcept { return known_len_; }
    [[nodiscard]] std::uint64_t start_offset()      const noexcept { return start_; }
    [[nodiscard]] std::size_t   record_length()     const noexcept { return rec_len_; }
    [[nodiscard]] std::chrono::milliseconds poll_interval() const noexcept { return poll_; }
    [[nodiscard]] State         state()             const noexcept { return state_; }
    [[nodiscard]] std::size_t   records_read()      const noexcept { return records_.counts(); }
    [[nodiscard]] std::size_t   length_queries()    const noexcept { return queries_.counts(); }
    [[nodiscard]] const std::string& path()         const noexcept { return path_; }

private:
    using clock = std::chrono::steady_clock;

    bool  record_available() const noexcept;
    bool  fill_until(std::optional<clock::time_point> deadline);
    bool  wait_for_next_check(std::optional<clock::time_point> deadline);
    bool  open_file();
    void  query_length();
    Record read_record();
    void  ensure_usable() const;
    [[noreturn]] void fail(TailError err);

    std::string               path_;
    std::optional<LedgerFile> file_;
    std::size_t               rec_len_;
    std::uint64_t             start_;
    std::uint64_t             cursor_;
    std::uint64_t             known_len_ = 0;
    clock::time_point         last_check_{};
    std::chrono::milliseconds poll_;
    bool                      wait_for_file_;
    State                     state_ = State::Ready;
    std::optional<TailError>  failure_;

    Counter records_;
    Counter queries_;
};

const char* to_string(TailReader::State s) noexcept;

// Pull-to-push adapter: forwards records to on_record until it returns
// false, or until no record arrived for `inactivity_timeout` (0 = never).
// Returns the number of records forwarded. TailError propagates.
std::size_t tail_records(TailReader& reader,
                         const std::function<bool(const Record&)>& on_record,
                         std::chrono::milliseconds inactivity_timeout = std::chrono::milliseconds{0});

} // namespace lt
