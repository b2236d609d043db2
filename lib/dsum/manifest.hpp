#pragma once
#include <cstdint>
#include <mutex>
#include <string>
#include <string_view>
#include <vector>

#include "common.hpp"

namespace dsum {
    struct FileRecord {
        std::string path = {};
        std::string url = {};
        std::string sha256 = {};
        std::string error = {};
        std::uint64_t size = {};

        auto ok() const noexcept -> bool { return error.empty(); }
    };

    struct Manifest {
        struct Builder;

        struct Summary {
            std::size_t files = {};
            std::size_t failed = {};
            std::uint64_t bytes = {};
        };

        std::vector<FileRecord> records = {};
        bool cancelled = {};

        auto summary() const noexcept -> Summary;

        auto failures() const -> std::vector<FileRecord const*>;

        // path,sha256,error with RFC 4180 quoting.
        auto dump_csv(bool header = true) const -> std::string;

        // One line per record, named args: path, sha256, error, size, url.
        auto dump_format(std::string const& format) const -> std::string;

        static auto csv_escape(std::string_view field) -> std::string;
    };

    // Collects records from any thread, build() orders them by path.
    struct Manifest::Builder {
        auto add(FileRecord record) -> void;

        auto build(bool cancelled = false) -> Manifest;

    private:
        std::mutex mutex_;
        std::vector<FileRecord> records_;
    };
}
