#include "ledgertail/tail.hpp"

#include <chrono>
#include <limits>
#include <optional>
#include <string>
#include <thread>
#include <utility>

namespace lt {

TailReader::TailReader(const std::string& path, std::size_t record_length,
                       std::uint64_t start_offset, TailOptions opt)
    : path_(path)
    , rec_len_(record_length)
    , start_(start_offset)
    , cursor_(start_offset)
    , poll_(opt.poll_ms > 0 ? std::chrono::milliseconds(opt.poll_ms) : std::chrono::milliseconds(0))
    , wait_for_file_(opt.wait_for_file)
    , records_("ledgertail-records", opt.log_rate, opt.counter_sink, opt.counter_point)
    , queries_("ledgertail-length-queries", opt.log_rate, opt.counter_sink, opt.counter_point)
{
    if (rec_len_ == 0)
        throw TailError{TailErrc::Misconfigured, "record length must be positive: " + path_};
    if (rec_len_ > std::numeric_limits<std::uint64_t>::max() - start_)
        throw TailError{TailErrc::Misconfigured, "record length overflows the file offset: " + path_,
                        start_, rec_len_};

    // establishes known_len_ and last_check_
    query_length();
}

bool TailReader::open_file() {
    try {
        file_.emplace(LedgerFile::open(path_));
        return true;
    } catch (const TailError& e) {
        if (e.kind == TailErrc::NotFound && wait_for_file_) return false;
        throw;
    }
}

void TailReader::query_length() {
    last_check_ = clock::now();
    if (!file_ && !open_file()) return; // not created yet

    queries_.inc(1);
    const std::uint64_t len = file_->size();

    // append-only: the file may never shrink below what we have seen or consumed
    if (len < known_len_ || len < cursor_) {
        fail(TailError{TailErrc::Truncation,
                       "file shrank: " + path_ + " (length " + std::to_string(len)
                           + ", known " + std::to_string(known_len_)
                           + ", cursor " + std::to_string(cursor_) + ")",
                       cursor_, known_len_, len});
    }
    known_len_ = len;
}

bool TailReader::wait_for_next_check(std::optional<clock::time_point> deadline) {
    const auto due = last_check_ + poll_;
    const auto now = clock::now();

    if (due <= now) {
        if (poll_.count() == 0) std::this_thread::yield();
        return true;
    }
    if (deadline && *deadline < due) {
        std::this_thread::sleep_until(*deadline);
        return false;
    }
    std::this_thread::sleep_until(due);
    return true;
}

bool TailReader::record_available() const noexcept {
    return known_len_ >= cursor_ && known_len_ - cursor_ >= rec_len_;
}

bool TailReader::fill_until(std::optional<clock::time_point> deadline) {
    while (!record_available()) {
        state_ = State::Waiting;
        if (!wait_for_next_check(deadline)) return false;
        query_length();
        if (record_available()) break;
        if (deadline && clock::now() >= *deadline) return false;
    }
    state_ = State::Ready;
    return true;
}

Record TailReader::read_record() {
    if (!file_) throw TailError{TailErrc::Closed, "no open file: " + path_, cursor_};
    Record rec(rec_len_);
    const std::size_t n = file_->read_at(cursor_, rec);
    if (n != rec_len_) {
        // bytes confirmed by a length query are gone
        fail(TailError{TailErrc::Truncation, "short read inside known length: " + path_,
                       cursor_, rec_len_, n});
    }
    cursor_ += rec_len_;
    records_.inc(1);
    return rec;
}

void TailReader::ensure_usable() const {
    if (state_ == State::Failed && failure_) throw *failure_;
    if (state_ == State::Closed) throw TailError{TailErrc::Closed, "reader closed: " + path_, cursor_};
}

void TailReader::fail(TailError err) {
    state_ = State::Failed;
    failure_ = err;
    file_.reset();
    throw err;
}

Record TailReader::next_record() {
    ensure_usable();
    fill_until(std::nullopt);
    return read_record();
}

std::expected<Record, TailError> TailReader::try_next_record() {
    try {
        return next_record();
    } catch (const TailError& e) {
        return std::unexpected(e);
    }
}

std::optional<Record> TailReader::next_record_for(std::chrono::milliseconds timeout) {
    ensure_usable();
    if (!fill_until(clock::now() + timeout)) return std::nullopt;
    return read_record();
}

void TailReader::close() noexcept {
    file_.reset();
    state_ = State::Closed;
}

const char* to_string(TailReader::State s) noexcept {
    switch (s) {
        case TailReader::State::Ready:   return "READY";
        case TailReader::State::Waiting: return "WAITING";
        case TailReader::State::Failed:  return "FAILED";
        case TailReader::State::Closed:  return "CLOSED";
    }
    return "UNKNOWN";
}

std::size_t tail_records(TailReader& reader,
                         const std::function<bool(const Record&)>& on_record,
                         std::chrono::milliseconds inactivity_timeout)
{
    const bool use_timeout = inactivity_timeout.count() > 0;
    std::size_t forwarded = 0;

    for (;;) {
        std::optional<Record> rec = use_timeout ? reader.next_record_for(inactivity_timeout)
                                                : std::optional<Record>(reader.next_record());
        if (!rec) return forwarded; // idle for inactivity_timeout
        ++forwarded;
        if (!on_record(*rec)) return forwarded;
    }
}

} // namespace lt
