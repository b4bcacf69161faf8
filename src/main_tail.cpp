#include "ledgertail/tail.hpp"

#include <charconv>
#include <chrono>
#include <cstdint>
#include <cstring>
#include <iomanip>
#include <iostream>
#include <optional>
#include <string>
#include <string_view>
#include <system_error>

namespace {

void usage() {
    std::cerr << "Usage: ledgertail <path> <record_length> [--offset N] [--poll-ms N]\n"
                 "                  [--timeout-ms N] [--max N] [--wait] [--hex] [--no-counters]\n"
                 "COUNTER: lines go to stderr every LEDGERTAIL_DEFAULT_LOG_RATE events;\n"
                 "--no-counters turns them off.\n";
}

template <class T>
std::optional<T> parse_num(std::string_view s) {
    T v{};
    auto [p, ec] = std::from_chars(s.data(), s.data() + s.size(), v);
    if (ec != std::errc{} || p != s.data() + s.size()) return std::nullopt;
    return v;
}

void print_hex(std::uint64_t offset, const lt::Record& rec) {
    std::ios old(nullptr);
    old.copyfmt(std::cout);
    std::cout << std::hex << std::setfill('0') << std::setw(12) << offset << ':';
    for (std::byte b : rec) std::cout << ' ' << std::setw(2) << std::to_integer<int>(b);
    std::cout << '\n';
    std::cout.copyfmt(old);
}

} // namespace

int main(int argc, char** argv) {
    if (argc < 3) {
        usage();
        return 1;
    }

    const std::string path = argv[1];
    const auto record_length = parse_num<std::size_t>(argv[2]);
    if (!record_length || *record_length == 0) {
        std::cerr << "invalid record length: " << argv[2] << "\n";
        return 1;
    }

    std::uint64_t offset = 0;
    std::size_t max_records = 0;
    bool hex = false;
    lt::TailOptions opts;
    opts.inactivity_timeout_ms = 0; // follow forever unless --timeout-ms

    for (int i = 3; i < argc; ++i) {
        const std::string_view arg = argv[i];
        auto value = [&]() -> std::optional<std::string_view> {
            if (i + 1 >= argc) return std::nullopt;
            return std::string_view(argv[++i]);
        };

        if (arg == "--wait") { opts.wait_for_file = true; continue; }
        if (arg == "--hex")  { hex = true; continue; }
        if (arg == "--no-counters") { opts.counter_sink = nullptr; continue; }

        const auto v = value();
        if (!v) {
            usage();
            return 1;
        }
        bool ok = true;
        if (arg == "--offset") {
            auto n = parse_num<std::uint64_t>(*v); ok = n.has_value(); if (ok) offset = *n;
        } else if (arg == "--poll-ms") {
            auto n = parse_num<int>(*v); ok = n.has_value(); if (ok) opts.poll_ms = *n;
        } else if (arg == "--timeout-ms") {
            auto n = parse_num<int>(*v); ok = n.has_value(); if (ok) opts.inactivity_timeout_ms = *n;
        } else if (arg == "--max") {
            auto n = parse_num<std::size_t>(*v); ok = n.has_value(); if (ok) max_records = *n;
        } else {
            ok = false;
        }
        if (!ok) {
            std::cerr << "bad option: " << arg << " " << *v << "\n";
            usage();
            return 1;
        }
    }

    std::size_t total_bytes = 0;
    std::size_t n_records = 0;
    const auto t_start = std::chrono::steady_clock::now();

    std::cout << "Tailing " << path << " (record " << *record_length << " B, offset "
              << offset << ", poll " << opts.poll_ms << " ms)" << std::endl;

    try {
        lt::TailReader reader(path, *record_length, offset, opts);

        lt::tail_records(reader, [&](const lt::Record& rec) {
            const std::uint64_t at = reader.read_cursor() - rec.size();
            total_bytes += rec.size();
            ++n_records;

            if (hex) {
                print_hex(at, rec);
            } else if (n_records % 1000 == 0) {
                auto elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(
                    std::chrono::steady_clock::now() - t_start);
                std::cout << "[Progress] " << n_records << " records, "
                          << total_bytes / 1e6 << " MB, "
                          << "time elapsed: " << elapsed.count() << " ms\r"
                          << std::flush;
            }
            return max_records == 0 || n_records < max_records;
        }, std::chrono::milliseconds(opts.inactivity_timeout_ms));

        const auto elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(
            std::chrono::steady_clock::now() - t_start);

        std::cout << "\n\n=== Tail summary ===\n"
                  << "Records read       : " << n_records << "\n"
                  << "Bytes read         : " << total_bytes << " bytes\n"
                  << "Read cursor        : " << reader.read_cursor() << "\n"
                  << "Known safe length  : " << reader.known_safe_length() << "\n"
                  << "Length queries     : " << reader.length_queries() << "\n"
                  << "Elapsed time       : " << elapsed.count() << " ms\n"
                  << "====================\n";
    } catch (const lt::TailError& e) {
        std::cerr << "\nledgertail: " << lt::to_string(e.kind) << ": " << e.what()
                  << " (records read: " << n_records << ")\n";
        return 2;
    }

    return 0;
}
