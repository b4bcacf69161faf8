#include "ledgertail/ledger_file.hpp"
#include "ledgertail/error.hpp"

#include <cerrno>
#include <cstring>
#include <filesystem>
#include <system_error>
#include <utility>

#ifndef _WIN32
  #include <sys/stat.h>
  #include <fcntl.h>
  #include <unistd.h>
#endif

namespace lt {
namespace {
    [[noreturn]] void throw_errno(std::string_view what, const std::string& path, int err,
                                  std::uint64_t off = 0) {
        std::string msg(what);
        msg += " failed: " + path + ": " + std::strerror(err);
        if (err == ENOENT) throw TailError{TailErrc::NotFound, msg, off};
        throw TailError{TailErrc::Io, msg, off};
    }
}

LedgerFile::LedgerFile(std::string path) : path_(std::move(path)) {}

LedgerFile::LedgerFile(LedgerFile&& other) noexcept
    : path_(std::move(other.path_))
#ifndef _WIN32
    , fd_(std::exchange(other.fd_, -1))
#else
    , in_(std::move(other.in_))
#endif
{}

LedgerFile& LedgerFile::operator=(LedgerFile&& other) noexcept {
    if (this != &other) {
        close();
        path_ = std::move(other.path_);
#ifndef _WIN32
        fd_ = std::exchange(other.fd_, -1);
#else
        in_ = std::move(other.in_);
#endif
    }
    return *this;
}

LedgerFile::~LedgerFile() { close(); }

bool LedgerFile::exists(const std::string& path) {
    std::error_code ec;
    return std::filesystem::exists(path, ec);
}

#ifndef _WIN32
// -------- POSIX (open/fstat/pread) --------

LedgerFile LedgerFile::open(const std::string& path) {
    LedgerFile f(path);
    int fd;
    do {
        fd = ::open(path.c_str(), O_RDONLY | O_CLOEXEC);
    } while (fd < 0 && errno == EINTR);
    if (fd < 0) throw_errno("open", path, errno);
    f.fd_ = fd;
    return f;
}

std::uint64_t LedgerFile::size() const {
    if (fd_ < 0) throw TailError{TailErrc::Closed, "size on closed file: " + path_};
    struct stat st{};
    if (::fstat(fd_, &st) != 0) throw_errno("fstat", path_, errno);
    // unlinked while open
    if (st.st_nlink == 0) throw TailError{TailErrc::NotFound, "file removed: " + path_};
    return static_cast<std::uint64_t>(st.st_size);
}

std::size_t LedgerFile::read_at(std::uint64_t offset, std::span<std::byte> dst) {
    if (fd_ < 0) throw TailError{TailErrc::Closed, "read on closed file: " + path_, offset};
    std::size_t got = 0;
    while (got < dst.size()) {
        const ssize_t n = ::pread(fd_, dst.data() + got, dst.size() - got,
                                  static_cast<off_t>(offset + got));
        if (n < 0) {
            if (errno == EINTR) continue;
            throw_errno("pread", path_, errno, offset + got);
        }
        if (n == 0) break; // EOF
        got += static_cast<std::size_t>(n);
    }
    return got;
}

void LedgerFile::close() noexcept {
    if (fd_ >= 0) {
        ::close(fd_);
        fd_ = -1;
    }
}

bool LedgerFile::is_open() const noexcept { return fd_ >= 0; }

#else
// -------- portable (ifstream + filesystem) --------

LedgerFile LedgerFile::open(const std::string& path) {
    if (!exists(path)) throw TailError{TailErrc::NotFound, "open failed: " + path};
    LedgerFile f(path);
    f.in_.open(path, std::ios::binary);
    if (!f.in_) throw TailError{TailErrc::Io, "open failed: " + path};
    return f;
}

std::uint64_t LedgerFile::size() const {
    if (!in_.is_open()) throw TailError{TailErrc::Closed, "size on closed file: " + path_};
    std::error_code ec;
    const auto n = std::filesystem::file_size(path_, ec);
    if (ec) {
        if (ec == std::errc::no_such_file_or_directory)
            throw TailError{TailErrc::NotFound, "file removed: " + path_};
        throw TailError{TailErrc::Io, "file_size failed: " + path_ + ": " + ec.message()};
    }
    return static_cast<std::uint64_t>(n);
}

std::size_t LedgerFile::read_at(std::uint64_t offset, std::span<std::byte> dst) {
    if (!in_.is_open()) throw TailError{TailErrc::Closed, "read on closed file: " + path_, offset};
    in_.clear();
    in_.seekg(static_cast<std::streamoff>(offset), std::ios::beg);
    if (!in_) throw TailError{TailErrc::Io, "seek failed: " + path_, offset};
    in_.read(reinterpret_cast<char*>(dst.data()), static_cast<std::streamsize>(dst.size()));
    if (in_.bad()) throw TailError{TailErrc::Io, "read failed: " + path_, offset};
    return static_cast<std::size_t>(in_.gcount());
}

void LedgerFile::close() noexcept {
    if (in_.is_open()) in_.close();
}

bool LedgerFile::is_open() const noexcept { return in_.is_open(); }

#endif

} // namespace lt
