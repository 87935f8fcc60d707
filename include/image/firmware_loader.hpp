#pragma once

#include "util/result.hpp"

#include <cstdint>
#include <string>

namespace aurix {

// Intel-HEX text as it will be written to the workspace. Contents are not
// parsed.
struct FirmwareImage {
    std::string hex;
    std::string sha256;  // digest of hex, lower-case
    std::string source;  // path it was loaded from, "-" for stdin
};

class FirmwareLoader {
public:
    // Reads path (or stdin for "-"), inflating "*.gz" input. When
    // expected_sha256 is non-empty the digest of the decoded image must match
    // it (case-insensitive).
    static Result Load(const std::string& path,
                       const std::string& expected_sha256,
                       FirmwareImage& out);
};

} // namespace aurix
