#pragma once
#include <cstdint>
#include <stdexcept>
#include <string>
#include <string_view>

namespace lt {

enum class TailErrc : uint8_t {
    NotFound,
    Truncation,
    Io,
    Misconfigured,
    Closed
};

[[nodiscard]] constexpr std::string_view to_string(TailErrc e) noexcept {
    switch (e) {
        case TailErrc::NotFound:      return "not found";
        case TailErrc::Truncation:    return "truncation";
        case TailErrc::Io:            return "io";
        case TailErrc::Misconfigured: return "misconfigured";
        case TailErrc::Closed:        return "closed";
    }
    return "unknown";
}

struct TailError : std::runtime_error {
    TailErrc      kind{};
    std::uint64_t offset{};
    std::uint64_t need{};
    std::uint64_t have{};
    explicit TailError(TailErrc k, std::string_view msg,
                       std::uint64_t off=0, std::uint64_t need_=0, std::uint64_t have_=0)
        : std::runtime_error(std::string(msg)), kind(k), offset(off), need(need_), have(have_) {}
};

} // namespace lt
