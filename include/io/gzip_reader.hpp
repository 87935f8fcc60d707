#pragma once

#include "io/io.hpp"

#include <memory>
#include <vector>
#include <zlib.h>

namespace aurix {

// Inflates a gzip stream pulled from another reader. Throws std::runtime_error
// when zlib cannot be initialised. Read() returns -1 on corrupt or truncated
// input.
class GzipReader final : public IReader {
  public:
    explicit GzipReader(std::unique_ptr<IReader> source);
    ~GzipReader() override;

    GzipReader(const GzipReader&) = delete;
    GzipReader& operator=(const GzipReader&) = delete;

    ssize_t Read(std::span<std::uint8_t> out) override;
    std::optional<std::uint64_t> TotalSize() const override { return std::nullopt; }

  private:
    std::unique_ptr<IReader> source_;
    z_stream strm_{};
    std::vector<std::uint8_t> in_buffer_;
    bool stream_end_ = false;
    bool source_drained_ = false;
};

} // namespace aurix
