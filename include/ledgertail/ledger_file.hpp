#pragma once
#include <cstddef>
#include <cstdint>
#include <span>
#include <string>

#ifdef _WIN32
  #include <fstream>
#endif

namespace lt {

// Read-only handle on an append-only ledger file.
// All failures are reported as TailError (NotFound / Io).
class LedgerFile {
public:
    static LedgerFile open(const std::string& path);
    static bool exists(const std::string& path);

    LedgerFile(LedgerFile&& other) noexcept;
    LedgerFile& operator=(LedgerFile&& other) noexcept;
    LedgerFile(const LedgerFile&) = delete;
    LedgerFile& operator=(const LedgerFile&) = delete;
    ~LedgerFile();

    // Current length in bytes. One call == one length query.
    [[nodiscard]] std::uint64_t size() const;

    // Fills dst from offset; returns fewer bytes only at EOF.
    std::size_t read_at(std::uint64_t offset, std::span<std::byte> dst);

    void close() noexcept;

    [[nodiscard]] bool is_open() const noexcept;
    [[nodiscard]] const std::string& path() const noexcept { return path_; }

private:
    explicit LedgerFile(std::string path);

    std::string path_;
#ifndef _WIN32
    int fd_ = -1;
#else
    std::ifstream in_;
#endif
};

} // namespace lt
