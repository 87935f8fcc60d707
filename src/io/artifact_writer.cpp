// artifact_writer.cpp - Writer for the files handed to the flasher.

#include "io/artifact_writer.hpp"

#include <cerrno>
#include <cstring>
#include <fcntl.h>
#include <unistd.h>

namespace aurix {

Result ArtifactWriter::Open(std::string path, ArtifactWriter& out) {
    out.path_ = std::move(path);

    int fd = ::open(out.path_.c_str(), O_WRONLY | O_CREAT | O_TRUNC | O_CLOEXEC, 0644);
    if (fd < 0) {
        const int e = errno;
        return Result::Fail(e, "Failed to open " + out.path_ + " (" + std::strerror(e) + ")");
    }
    out.fd_.Reset(fd);
    return Result::Ok();
}

Result ArtifactWriter::WriteAll(std::span<const std::uint8_t> in) {
    size_t rem = in.size();
    const std::uint8_t* p = in.data();

    while (rem > 0) {
        ssize_t n = ::write(fd_.Get(), p, rem);
        if (n > 0) {
            p += static_cast<size_t>(n);
            rem -= static_cast<size_t>(n);
            continue;
        }
        if (n == -1 && errno == EINTR) {
            continue;
        }
        const int e = errno;
        return Result::Fail(e, "Write failed (" + std::string(std::strerror(e)) + ")");
    }

    return Result::Ok();
}

Result ArtifactWriter::FsyncNow() {
    if (::fsync(fd_.Get()) == -1) {
        const int e = errno;
        return Result::Fail(e, "fsync failed (" + std::string(std::strerror(e)) + ")");
    }
    return Result::Ok();
}

Result ArtifactWriter::Close() {
    if (!fd_.Valid()) return Result::Ok();
    // Fd::Close() drops the close() status
    const int fd = fd_.Release();
    if (::close(fd) != 0) {
        const int e = errno;
        return Result::Fail(e, "close failed (" + std::string(std::strerror(e)) + ")");
    }
    return Result::Ok();
}

Result WriteArtifactFile(const std::string& path, std::string_view contents) {
    ArtifactWriter w;
    if (auto r = ArtifactWriter::Open(path, w); !r.ok) return r;

    const auto bytes = std::span<const std::uint8_t>(
        reinterpret_cast<const std::uint8_t*>(contents.data()), contents.size());
    if (auto r = w.WriteAll(bytes); !r.ok) return r;
    if (auto r = w.FsyncNow(); !r.ok) return r;
    return w.Close();
}

} // namespace aurix
