#pragma once

#include <docsift/core/types.h>

#include <cstddef>
#include <filesystem>
#include <memory>
#include <span>
#include <string>
#include <string_view>

namespace docsift::crypto {

enum class DigestAlgorithm { SHA1, SHA256 };

// Interface for content hashers
class IContentHasher {
public:
    virtual ~IContentHasher() = default;

    // Stream-based hashing
    virtual void init() = 0;
    virtual void update(std::span<const std::byte> data) = 0;
    virtual std::string finalize() = 0;

    // Convenience method for hashing files
    virtual Result<std::string> hashFile(const std::filesystem::path& path) = 0;

    std::string hash(std::string_view text) {
        init();
        update(std::as_bytes(std::span(text.data(), text.size())));
        return finalize();
    }
};

// OpenSSL EVP digest; hex-encoded lowercase output
class EvpHasher : public IContentHasher {
public:
    explicit EvpHasher(DigestAlgorithm algorithm = DigestAlgorithm::SHA256);
    ~EvpHasher();

    // Disable copy, enable move
    EvpHasher(const EvpHasher&) = delete;
    EvpHasher& operator=(const EvpHasher&) = delete;
    EvpHasher(EvpHasher&&) noexcept;
    EvpHasher& operator=(EvpHasher&&) noexcept;

    void init() override;
    void update(std::span<const std::byte> data) override;
    std::string finalize() override;

    Result<std::string> hashFile(const std::filesystem::path& path) override;

private:
    struct Impl;
    std::unique_ptr<Impl> pImpl;
};

// One-shot helpers
std::string sha1Hex(std::string_view text);
std::string sha256Hex(std::string_view text);

std::unique_ptr<IContentHasher> createHasher(DigestAlgorithm algorithm);

} // namespace docsift::crypto
