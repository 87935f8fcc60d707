#include "crypto/sha256.hpp"

#include <openssl/evp.h>

#include <array>
#include <cstdint>
#include <vector>

namespace aurix {

namespace {

using Digest = std::array<std::uint8_t, 32>;

std::string HexEncode(std::span<const std::uint8_t> bytes) {
    static constexpr char kHex[] = "0123456789abcdef";
    std::string out;
    out.resize(bytes.size() * 2);
    for (size_t i = 0; i < bytes.size(); ++i) {
        out[i * 2] = kHex[(bytes[i] >> 4) & 0xF];
        out[i * 2 + 1] = kHex[bytes[i] & 0xF];
    }
    return out;
}

class EvpCtx final {
public:
    EvpCtx() : ctx_(EVP_MD_CTX_new()) {
        if (ctx_ && EVP_DigestInit_ex(ctx_, EVP_sha256(), nullptr) != 1) {
            EVP_MD_CTX_free(ctx_);
            ctx_ = nullptr;
        }
    }
    EvpCtx(const EvpCtx&) = delete;
    EvpCtx& operator=(const EvpCtx&) = delete;
    ~EvpCtx() {
        if (ctx_) EVP_MD_CTX_free(ctx_);
    }

    bool ok() const { return ctx_ != nullptr; }

    bool Update(std::span<const std::uint8_t> data) {
        if (data.empty()) return true;
        return EVP_DigestUpdate(ctx_, data.data(), data.size()) == 1;
    }

    bool Final(Digest& out) {
        unsigned int len = 0;
        if (EVP_DigestFinal_ex(ctx_, out.data(), &len) != 1) return false;
        return len == out.size();
    }

private:
    EVP_MD_CTX* ctx_ = nullptr;
};

} // namespace

struct Sha256Hasher::Impl {
    EvpCtx ctx;
    bool failed = false;
    bool finalized = false;
};

Sha256Hasher::Sha256Hasher() : impl_(std::make_unique<Impl>()) {}

Sha256Hasher::Sha256Hasher(Sha256Hasher&&) noexcept = default;
Sha256Hasher& Sha256Hasher::operator=(Sha256Hasher&&) noexcept = default;
Sha256Hasher::~Sha256Hasher() = default;

void Sha256Hasher::Update(std::span<const std::uint8_t> data) {
    if (!impl_ || !impl_->ctx.ok() || impl_->failed || impl_->finalized) return;
    if (!impl_->ctx.Update(data)) {
        impl_->failed = true;
    }
}

std::string Sha256Hasher::FinalHex() {
    if (!impl_ || !impl_->ctx.ok() || impl_->failed || impl_->finalized) return {};
    impl_->finalized = true;
    Digest digest{};
    if (!impl_->ctx.Final(digest)) return {};
    return HexEncode(digest);
}

std::string Sha256Hex(std::span<const std::uint8_t> data) {
    Sha256Hasher hasher;
    hasher.Update(data);
    return hasher.FinalHex();
}

std::string Sha256Hex(IReader& reader) {
    Sha256Hasher hasher;
    std::vector<std::uint8_t> buf(64 * 1024);
    while (true) {
        const ssize_t n = reader.Read(std::span<std::uint8_t>(buf.data(), buf.size()));
        if (n == 0) break;
        if (n < 0) return {};
        hasher.Update(std::span<const std::uint8_t>(buf.data(), static_cast<size_t>(n)));
    }
    return hasher.FinalHex();
}

} // namespace aurix
