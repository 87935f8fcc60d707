#include "image/firmware_loader.hpp"

#include "crypto/sha256.hpp"
#include "io/file_reader.hpp"
#include "io/gzip_reader.hpp"
#include "util/logger.hpp"

#include <algorithm>
#include <cctype>
#include <exception>
#include <memory>
#include <vector>

namespace aurix {

namespace {

bool EndsWithGz(const std::string& s) {
    return s.size() >= 3 && s.compare(s.size() - 3, 3, ".gz") == 0;
}

std::string NormalizeHex(std::string s) {
    std::transform(s.begin(), s.end(), s.begin(), [](unsigned char c) {
        return static_cast<char>(std::tolower(c));
    });
    return s;
}

} // namespace

Result FirmwareLoader::Load(const std::string& path,
                            const std::string& expected_sha256,
                            FirmwareImage& out) {
    out = FirmwareImage{};

    auto file = std::make_unique<FileOrStdinReader>();
    auto open_result = FileOrStdinReader::Open(path, *file);
    if (!open_result.is_ok())
        return open_result;

    // Plain files hand over their size; inflated images grow as they come.
    std::string hex;
    if (auto size = file->TotalSize(); size && !EndsWithGz(path))
        hex.reserve(static_cast<size_t>(*size));

    std::unique_ptr<IReader> reader = std::move(file);
    if (EndsWithGz(path)) {
        try {
            LogDebug("Wrapping GzipReader for %s", path.c_str());
            reader = std::make_unique<GzipReader>(std::move(reader));
        } catch (const std::exception& e) {
            return Result::Fail(ErrorKind::InvalidInput, -1,
                                std::string("Gzip init failed: ") + e.what());
        }
    }

    Sha256Hasher hasher;
    std::vector<std::uint8_t> buf(64 * 1024);

    while (true) {
        const ssize_t n = reader->Read(std::span<std::uint8_t>(buf.data(), buf.size()));
        if (n < 0)
            return Result::Fail(ErrorKind::InvalidInput, -1, "Read failed while loading " + path);
        if (n == 0)
            break;

        const auto chunk = std::span<const std::uint8_t>(buf.data(), static_cast<size_t>(n));
        hasher.Update(chunk);
        hex.append(reinterpret_cast<const char*>(chunk.data()), chunk.size());
    }

    if (hex.empty())
        return Result::Fail(ErrorKind::InvalidInput, -1, "Firmware image is empty: " + path);

    const std::string actual = hasher.FinalHex();
    if (actual.empty())
        return Result::Fail(ErrorKind::InvalidInput, -1, "sha256 compute failed");
    if (!expected_sha256.empty() && NormalizeHex(expected_sha256) != actual) {
        return Result::Fail(ErrorKind::InvalidInput, -1,
                            "sha256 mismatch: expected=" + expected_sha256 + " actual=" + actual);
    }

    LogInfo("Loaded firmware image %s (%zu bytes, sha256=%s)",
            path.c_str(), hex.size(), actual.c_str());

    out.hex = std::move(hex);
    out.sha256 = actual;
    out.source = path;
    return Result::Ok();
}

} // namespace aurix
