#include "ledgertail/counter.hpp"

#include <charconv>
#include <chrono>
#include <cstdlib>
#include <cstring>
#include <system_error>

namespace lt {

std::size_t Counter::default_log_rate() {
    const char* env = std::getenv("LEDGERTAIL_DEFAULT_LOG_RATE");
    if (!env) return kDefaultLogRate;
    std::size_t v = 0;
    const char* end = env + std::strlen(env);
    auto [p, ec] = std::from_chars(env, end, v);
    if (ec != std::errc{} || p != end || v == 0) return kDefaultLogRate;
    return v;
}

void Counter::inc(std::size_t events) {
    const std::size_t counts = counts_.fetch_add(events, std::memory_order_relaxed);
    const std::size_t times  = times_.fetch_add(1, std::memory_order_relaxed);

    std::size_t rate = lograte_.load(std::memory_order_relaxed);
    if (rate == 0) {
        rate = default_log_rate();
        lograte_.store(rate, std::memory_order_relaxed);
    }

    if (sink_ && times % rate == 0 && times > 0) {
        const auto now = std::chrono::duration_cast<std::chrono::milliseconds>(
            std::chrono::system_clock::now().time_since_epoch()).count();
        *sink_ << "COUNTER:{\"name\": \"" << name_ << "\", \"counts\": " << counts + events
               << ", \"samples\": " << times << ",  \"now\": " << now
               << ", \"events\": " << events << "}\n";
    }

    // a racing inc() that already moved lastlog skips its point
    std::size_t last = lastlog_.load(std::memory_order_relaxed);
    if (counts >= last && lastlog_.compare_exchange_strong(last, counts, std::memory_order_relaxed)
        && point_)
        point_(name_, counts - last);
}

} // namespace lt
