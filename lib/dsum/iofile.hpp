#pragma once
#include <cstdint>
#include <filesystem>
#include <span>
#include <system_error>
#include <utility>

namespace dsum {
    namespace fs = std::filesystem;

    struct IO {
        struct File;

        enum Flags : unsigned;

        virtual ~IO() noexcept = default;

        virtual auto size() const noexcept -> std::size_t = 0;

        virtual auto resize(std::size_t offset, std::size_t count) noexcept -> bool = 0;

        virtual auto read(std::size_t offset, std::span<char> dst) const noexcept -> bool = 0;

        virtual auto write(std::size_t offset, std::span<char const> src) noexcept -> bool = 0;

    private:
        constexpr IO() noexcept = default;
        constexpr IO(IO&& other) noexcept = default;
        constexpr IO(IO const& other) noexcept = delete;
        constexpr IO& operator=(IO const& other) noexcept = delete;
        constexpr IO& operator=(IO&& other) noexcept = default;
    };

    enum IO::Flags : unsigned {
        READ = 0,
        WRITE = 1 << 0,
        TRUNCATE = 1 << 1,
    };

    constexpr auto operator|(IO::Flags lhs, IO::Flags rhs) noexcept -> IO::Flags {
        return (IO::Flags)((unsigned)lhs | (unsigned)rhs);
    }

    constexpr auto operator&(IO::Flags lhs, IO::Flags rhs) noexcept -> IO::Flags {
        return (IO::Flags)((unsigned)lhs & (unsigned)rhs);
    }

    struct IO::File final : IO {
        constexpr File() noexcept = default;

        constexpr File(File&& other) noexcept : impl_(std::exchange(other.impl_, {})) {}

        File& operator=(File&& other) noexcept {
            auto old = std::exchange(impl_, std::exchange(other.impl_, {}));
            close(old);
            return *this;
        }

        File(fs::path const& path, Flags flags);

        ~File() noexcept;

        auto size() const noexcept -> std::size_t override { return impl_.size; }

        auto resize(std::size_t offset, std::size_t count) noexcept -> bool override;

        auto read(std::size_t offset, std::span<char> dst) const noexcept -> bool override;

        auto write(std::size_t offset, std::span<char const> src) noexcept -> bool override;

    private:
        struct Impl {
            std::intptr_t fd = {};
            std::size_t size = {};
            Flags flags = {};
        } impl_ = {};

        static auto close(Impl const& impl) noexcept -> void;
    };
}
