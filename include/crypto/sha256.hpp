#pragma once

#include "io/io.hpp"

#include <cstdint>
#include <memory>
#include <span>
#include <string>

namespace aurix {

// Lower-case hex digest, empty string on OpenSSL failure.
std::string Sha256Hex(std::span<const std::uint8_t> data);
std::string Sha256Hex(IReader& reader);

// Incremental digest for data that is consumed while it is hashed.
class Sha256Hasher {
public:
    Sha256Hasher();
    Sha256Hasher(const Sha256Hasher&) = delete;
    Sha256Hasher& operator=(const Sha256Hasher&) = delete;
    Sha256Hasher(Sha256Hasher&&) noexcept;
    Sha256Hasher& operator=(Sha256Hasher&&) noexcept;
    ~Sha256Hasher();

    void Update(std::span<const std::uint8_t> data);
    std::string FinalHex();

private:
    struct Impl;
    std::unique_ptr<Impl> impl_;
};

} // namespace aurix
