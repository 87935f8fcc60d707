#pragma once

#include "io/fd.hpp"
#include "io/io.hpp"
#include "util/result.hpp"

#include <span>
#include <string>
#include <string_view>

namespace aurix {

// Creates (or truncates) a regular file for one workspace artifact.
class ArtifactWriter final : public IWriter {
  public:
    static Result Open(std::string path, ArtifactWriter& out);

    Result WriteAll(std::span<const std::uint8_t> in) override;
    Result FsyncNow() override;
    Result Close();

    const std::string& Path() const { return path_; }

  private:
    std::string path_;
    Fd fd_;
};

// Open + WriteAll + fsync + close. The file is durable once this returns Ok.
Result WriteArtifactFile(const std::string& path, std::string_view contents);

} // namespace aurix
