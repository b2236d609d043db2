#pragma once
#include <cstdint>
#include <string>
#include <string_view>
#include <vector>

#include "common.hpp"
#include "url.hpp"

namespace dsum {
    enum class Role : std::uint8_t {
        Listing,
        File,
    };

    struct Target {
        Url url;
        Role role;
        std::uint32_t depth;
        // Classified by an explicit file selector, never reinterpreted as a listing.
        bool pinned = {};
    };

    // Extracts crawl targets from an HTML directory listing.
    struct Listing {
        struct Options {
            std::string links = "//a[@href]";
            std::string files = {};
        };

        struct Result {
            std::vector<Target> targets = {};
            bool parse_error = {};
        };

        Listing(Scope scope, Options options);
        Listing(Listing const&) = delete;
        Listing& operator=(Listing const&) = delete;

        auto scope() const noexcept -> Scope const& { return scope_; }

        auto options() const noexcept -> Options const& { return options_; }

        auto parse(std::string_view html, Url const& page, std::uint32_t depth) const -> Result;

        auto classify(Url const& page, Url url, std::uint32_t depth, bool pinned) const -> Target;

    private:
        Scope scope_;
        Options options_;
    };

    constexpr auto to_string(Role role) noexcept -> std::string_view {
        return role == Role::Listing ? "listing"sv : "file"sv;
    }
}
