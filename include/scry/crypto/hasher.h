#pragma once

#include <concepts>
#include <cstddef>
#include <filesystem>
#include <memory>
#include <span>
#include <string>
#include <string_view>
#include <scry/core/types.h>

namespace scry::crypto {

// Data that exposes contiguous storage (data()+size()) and can be viewed as bytes
template <typename T>
concept ByteSpanConvertible = requires(const T& t) {
    { t.data() } -> std::convertible_to<const void*>;
    { t.size() } -> std::convertible_to<std::size_t>;
};

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

    void update(std::string_view text) { update(std::as_bytes(std::span(text.data(), text.size()))); }

    template <ByteSpanConvertible T> std::string hash(const T& data) {
        init();
        update(std::as_bytes(std::span(data.data(), data.size())));
        return finalize();
    }
};

// SHA-256 implementation
class SHA256Hasher : public IContentHasher {
public:
    SHA256Hasher();
    ~SHA256Hasher();

    // Disable copy, enable move
    SHA256Hasher(const SHA256Hasher&) = delete;
    SHA256Hasher& operator=(const SHA256Hasher&) = delete;
    SHA256Hasher(SHA256Hasher&&) noexcept;
    SHA256Hasher& operator=(SHA256Hasher&&) noexcept;

    using IContentHasher::update;

    void init() override;
    void update(std::span<const std::byte> data) override;
    std::string finalize() override;

    Result<std::string> hashFile(const std::filesystem::path& path) override;

    // Static utility for one-shot hashing
    static std::string hash(std::span<const std::byte> data);
    static std::string hash(std::string_view text);

private:
    struct Impl;
    std::unique_ptr<Impl> pImpl;
};

// Factory function
std::unique_ptr<IContentHasher> createSHA256Hasher();

} // namespace scry::crypto
