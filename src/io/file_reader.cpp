#include "io/file_reader.hpp"

#include <cerrno>
#include <cstring>
#include <fcntl.h>
#include <sys/stat.h>
#include <unistd.h>

namespace aurix {

Result FileOrStdinReader::Open(std::string path, FileOrStdinReader& out) {
    out.path_ = std::move(path);

    if (out.path_ == "-") {
        out.fd_.Reset(STDIN_FILENO);
        out.size_ = std::nullopt;
        return Result::Ok();
    }

    int fd = ::open(out.path_.c_str(), O_RDONLY | O_CLOEXEC);
    if (fd < 0) {
        const int e = errno;
        return Result::Fail(ErrorKind::InvalidInput, e,
                            "Failed to open input: " + out.path_ + " (" + std::strerror(e) + ")");
    }
    out.fd_.Reset(fd);
    out.size_ = std::nullopt;

    struct stat st{};
    if (::fstat(fd, &st) != 0) {
        const int e = errno;
        out.fd_.Close();
        return Result::Fail(ErrorKind::InvalidInput, e,
                            "Failed to stat input: " + out.path_ + " (" + std::strerror(e) + ")");
    }
    // pipes and character devices stream; only directories are refused
    if (S_ISDIR(st.st_mode)) {
        out.fd_.Close();
        return Result::Fail(ErrorKind::InvalidInput, EISDIR,
                            "Input is a directory, not a HEX image: " + out.path_);
    }
    if (S_ISREG(st.st_mode) && st.st_size > 0)
        out.size_ = static_cast<std::uint64_t>(st.st_size);

    return Result::Ok();
}

std::optional<std::uint64_t> FileOrStdinReader::TotalSize() const { return size_; }

ssize_t FileOrStdinReader::Read(std::span<std::uint8_t> out) {
    while (true) {
        ssize_t n = ::read(fd_.Get(), out.data(), out.size());
        if (n >= 0) {
            return n;
        }
        if (errno == EINTR) {
            continue;
        }
        return -1;
    }
}

} // namespace aurix
