#include <docsift/crypto/hasher.h>

#include <openssl/evp.h>
#include <spdlog/fmt/fmt.h>
#include <spdlog/spdlog.h>

#include <array>
#include <fstream>
#include <vector>

namespace docsift::crypto {

namespace {
constexpr size_t kFileBufferSize = 1024 * 1024;

const EVP_MD* digestFor(DigestAlgorithm algorithm) {
    switch (algorithm) {
        case DigestAlgorithm::SHA1:
            return EVP_sha1();
        case DigestAlgorithm::SHA256:
            return EVP_sha256();
    }
    return EVP_sha256();
}
} // namespace

struct EvpHasher::Impl {
    EVP_MD_CTX* ctx = nullptr;
    const EVP_MD* md = nullptr;

    explicit Impl(const EVP_MD* digest) : ctx(EVP_MD_CTX_new()), md(digest) {
        if (!ctx) {
            throw std::runtime_error("Failed to create EVP_MD_CTX");
        }
    }

    ~Impl() {
        if (ctx) {
            EVP_MD_CTX_free(ctx);
        }
    }

    Impl(const Impl&) = delete;
    Impl& operator=(const Impl&) = delete;
};

EvpHasher::EvpHasher(DigestAlgorithm algorithm)
    : pImpl(std::make_unique<Impl>(digestFor(algorithm))) {
    init();
}

EvpHasher::~EvpHasher() = default;

EvpHasher::EvpHasher(EvpHasher&&) noexcept = default;
EvpHasher& EvpHasher::operator=(EvpHasher&&) noexcept = default;

void EvpHasher::init() {
    if (EVP_DigestInit_ex(pImpl->ctx, pImpl->md, nullptr) != 1) {
        throw std::runtime_error("Failed to initialize digest");
    }
}

void EvpHasher::update(std::span<const std::byte> data) {
    if (EVP_DigestUpdate(pImpl->ctx, data.data(), data.size()) != 1) {
        throw std::runtime_error("Failed to update digest");
    }
}

std::string EvpHasher::finalize() {
    std::array<unsigned char, EVP_MAX_MD_SIZE> digest{};
    unsigned int digestLen = 0;

    if (EVP_DigestFinal_ex(pImpl->ctx, digest.data(), &digestLen) != 1) {
        throw std::runtime_error("Failed to finalize digest");
    }

    std::string result;
    result.reserve(digestLen * 2);
    for (unsigned int i = 0; i < digestLen; ++i) {
        result += fmt::format("{:02x}", digest[i]);
    }

    // Reset for potential reuse
    init();

    return result;
}

Result<std::string> EvpHasher::hashFile(const std::filesystem::path& path) {
    std::ifstream file(path, std::ios::binary);
    if (!file) {
        return Error{ErrorCode::FileNotFound, fmt::format("Failed to open file: {}", path.string())};
    }

    try {
        init();
        std::vector<std::byte> buffer(kFileBufferSize);
        while (file) {
            file.read(reinterpret_cast<char*>(buffer.data()),
                      static_cast<std::streamsize>(buffer.size()));
            auto bytesRead = file.gcount();
            if (bytesRead > 0) {
                update(std::span{buffer.data(), static_cast<size_t>(bytesRead)});
            }
        }
        return finalize();
    } catch (const std::exception& e) {
        spdlog::error("Failed to hash file {}: {}", path.string(), e.what());
        return Error{ErrorCode::InternalError, e.what()};
    }
}

std::string sha1Hex(std::string_view text) {
    EvpHasher hasher(DigestAlgorithm::SHA1);
    return hasher.hash(text);
}

std::string sha256Hex(std::string_view text) {
    EvpHasher hasher(DigestAlgorithm::SHA256);
    return hasher.hash(text);
}

std::unique_ptr<IContentHasher> createHasher(DigestAlgorithm algorithm) {
    return std::make_unique<EvpHasher>(algorithm);
}

} // namespace docsift::crypto
