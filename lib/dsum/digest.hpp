#pragma once
#include <cstdint>
#include <memory>
#include <span>
#include <string>

namespace dsum {
    // Streaming SHA-256, lowercase hex output.
    struct Digest {
        static constexpr std::size_t HEX_SIZE = 64;

        Digest();
        Digest(Digest&&) noexcept;
        Digest& operator=(Digest&&) noexcept;
        ~Digest() noexcept;

        auto update(std::span<char const> data) -> void;

        auto reset() -> void;

        auto size() const noexcept -> std::uint64_t { return size_; }

        auto hexdigest() const -> std::string;

        static auto of(std::span<char const> data) -> std::string;

    private:
        struct Impl;
        std::unique_ptr<Impl> impl_;
        std::uint64_t size_ = {};
    };
}
