#pragma once
#include <atomic>
#include <cstddef>
#include <functional>
#include <iostream>
#include <string>
#include <utility>

namespace lt {

inline constexpr std::size_t kDefaultLogRate = 1000;

// Sampled event counter. Every `lograte`-th call to inc() emits one
// COUNTER:{...} line to the sink (nullptr: no lines). Each inc() that wins
// the lastlog exchange also reports a point: the growth of counts since the
// previous point.
class Counter {
public:
    using PointFn = std::function<void(const std::string& name, std::size_t delta)>;

    explicit Counter(std::string name, std::size_t lograte = 0, std::ostream* sink = &std::clog,
                     PointFn point = {})
        : name_(std::move(name)), lograte_(lograte), sink_(sink), point_(std::move(point)) {}

    // LEDGERTAIL_DEFAULT_LOG_RATE, or kDefaultLogRate when unset, invalid or 0.
    static std::size_t default_log_rate();

    void inc(std::size_t events);

    [[nodiscard]] const std::string& name() const noexcept { return name_; }
    [[nodiscard]] std::size_t counts()  const noexcept { return counts_.load(std::memory_order_relaxed); }
    [[nodiscard]] std::size_t times()   const noexcept { return times_.load(std::memory_order_relaxed); }
    [[nodiscard]] std::size_t lastlog() const noexcept { return lastlog_.load(std::memory_order_relaxed); }
    [[nodiscard]] std::size_t lograte() const noexcept { return lograte_.load(std::memory_order_relaxed); }

private:
    std::string              name_;
    std::atomic<std::size_t> counts_{0};
    std::atomic<std::size_t> times_{0};
    std::atomic<std::size_t> lastlog_{0};
    std::atomic<std::size_t> lograte_{0};
    std::ostream*            sink_;
    PointFn                  point_;
};

} // namespace lt
