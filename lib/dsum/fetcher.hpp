#pragma once
#include <atomic>
#include <cstdint>
#include <optional>
#include <regex>
#include <span>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

#include "common.hpp"
#include "listing.hpp"

namespace dsum {
    enum class ErrorKind : std::uint8_t {
        Network,
        HttpStatus,
        Parse,
        Digest,
        Cancelled,
    };

    // Receives the bytes of a file as they arrive.
    struct Sink {
        virtual ~Sink() noexcept = default;

        // Discards everything written so far, called before a retry.
        virtual auto reset() -> bool = 0;

        virtual auto write(std::span<char const> data) -> bool = 0;

        virtual auto error() const -> std::string { return "sink write failed"; }
    };

    struct Fetcher {
        struct Rewrite {
            std::regex from;
            std::string to;
        };

        struct Options {
            std::uint32_t retry = 2;
            std::uint32_t retry_delay = 250;
            std::uint32_t timeout = 30000;
            std::uint32_t connect_timeout = 10000;
            std::uint32_t max_redirects = 10;
            std::size_t max_listing = 64 * MiB;
            std::optional<Rewrite> rewrite = {};
            bool verbose = {};
            long buffer = {};
            std::string proxy = {};
            std::string useragent = {};
            std::string cookiefile = {};
            std::string cookielist = {};
            std::size_t low_speed_limit = 64 * KiB;
            std::size_t low_speed_time = 0;
        };

        struct Content {
            std::uint64_t size = {};
        };

        struct Links {
            std::vector<Target> targets = {};
            bool parse_error = {};
        };

        struct Failure {
            ErrorKind kind = {};
            std::string reason = {};
            bool transient = {};
        };

        using Result = std::variant<Content, Links, Failure>;

        enum class Mode {
            Discard,
            Buffer,
            Stream,
        };

        // Callbacks a transport drives. on_head is called exactly once per successful
        // exchange, before any on_data, even when the body is empty. location is the
        // URL that answered, after any redirects.
        struct Transfer {
            function_ref<Mode(long status, std::string_view content_type, std::string_view location)> on_head;
            function_ref<bool(std::span<char const> data)> on_data;
            std::atomic_bool const* cancel;
        };

        struct Outcome {
            enum Code {
                Ok,
                Error,
                Aborted,
                Cancelled,
            } code = Ok;
            std::string reason = {};
            bool transient = {};
        };

        Fetcher(Options const& options);
        Fetcher(Fetcher const&) = delete;
        Fetcher& operator=(Fetcher const&) = delete;
        virtual ~Fetcher() noexcept = default;

        auto options() const noexcept -> Options const& { return options_; }

        auto fetch(Target const& target, Listing const& listing, Sink& sink, std::atomic_bool const* cancel = nullptr)
            -> Result;

        auto request_url(Target const& target) const -> std::string;

        static auto is_html(std::string_view content_type) noexcept -> bool;

    protected:
        virtual auto transfer(std::string const& url, Transfer const& transfer) -> Outcome = 0;

    private:
        auto attempt(Target const& target, Listing const& listing, Sink& sink, std::atomic_bool const* cancel)
            -> Result;

        Options options_;
    };

    constexpr auto to_string(ErrorKind kind) noexcept -> std::string_view {
        switch (kind) {
            case ErrorKind::Network:
                return "network";
            case ErrorKind::HttpStatus:
                return "http";
            case ErrorKind::Parse:
                return "parse";
            case ErrorKind::Digest:
                return "digest";
            case ErrorKind::Cancelled:
                return "cancelled";
        }
        return "unknown";
    }
}
