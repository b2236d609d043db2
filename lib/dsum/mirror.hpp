#pragma once
#include <memory>
#include <span>
#include <string>
#include <string_view>

#include "common.hpp"
#include "iofile.hpp"

namespace dsum {
    // Copy of one downloaded file below a local directory, written while it streams.
    // The file is opened on the first write, finish() creates it when the body was empty.
    struct Mirror {
        Mirror(fs::path const& root, std::string_view path);
        Mirror(Mirror const&) = delete;
        Mirror& operator=(Mirror const&) = delete;

        auto reset() -> bool;

        auto write(std::span<char const> data) -> bool;

        auto finish() -> bool;

        auto error() const -> std::string const& { return error_; }

        // Relative, non-empty and free of "." and ".." segments.
        static auto is_safe(std::string_view path) noexcept -> bool;

    private:
        auto open() -> bool;

        fs::path path_;
        std::unique_ptr<IO::File> file_;
        std::size_t offset_ = {};
        std::string error_;
    };
}
