#pragma once
#include <atomic>
#include <cstdint>
#include <optional>
#include <regex>
#include <string>
#include <string_view>

#include "common.hpp"
#include "fetcher.hpp"
#include "listing.hpp"
#include "manifest.hpp"

namespace dsum {
    // Breadth-first crawl from a root listing with a bounded pool of workers.
    // Every canonical URL is dispatched at most once.
    struct Crawler {
        struct Options {
            std::uint32_t workers = 8;
            std::uint32_t max_depth = 0;
            int interval = 100;
            std::optional<std::regex> filter = {};
            std::string mirror = {};
            Listing::Options listing = {};
        };

        struct Stats {
            std::size_t expanded = {};
            std::size_t parse_errors = {};
            std::size_t skipped = {};
        };

        Crawler(Options const& options, Fetcher& fetcher);
        Crawler(Crawler const&) = delete;
        Crawler& operator=(Crawler const&) = delete;

        // Throws on a malformed root or when nothing at all could be fetched.
        // on_record is called once per record, never concurrently, and never blocks other workers
        // from fetching.
        auto run(std::string_view root_url, function_ref<void(FileRecord const& record)> on_record = {}) -> Manifest;

        // Only stores a flag, safe to call from a signal handler.
        auto cancel() noexcept -> void { cancel_ = true; }

        auto stats() const noexcept -> Stats const& { return stats_; }

    private:
        struct State;
        struct FileSink;
        struct Done;

        auto worker(State& state) -> void;
        auto process(State& state, Target const& target) -> Done;
        auto fold(State& state, Target const& target, Done done) -> std::optional<FileRecord>;
        auto admit(State& state, Target target) -> void;
        auto report(State& state, FileRecord record) -> void;

        Options options_;
        Fetcher& fetcher_;
        std::atomic_bool cancel_ = {};
        Stats stats_ = {};
    };
}
