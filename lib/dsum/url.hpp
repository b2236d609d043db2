#pragma once
#include <optional>
#include <string>
#include <string_view>

#include "common.hpp"

namespace dsum {
    // Absolute URL in canonical form. Two Urls naming the same resource compare equal
    // by str(): lowercase scheme and host, no default port, no dot segments, no fragment.
    struct Url {
        std::string scheme = {};
        std::string host = {};
        std::string port = {};
        std::string path = {};
        std::string query = {};

        static auto parse(std::string_view text) -> std::optional<Url>;

        auto resolve(std::string_view ref) const -> std::optional<Url>;

        auto str() const -> std::string;

        auto origin() const -> std::string;

        auto is_dir() const noexcept -> bool { return path.ends_with('/'); }

        auto without_query() const -> Url;

        auto parent_dir() const -> std::string_view;

        auto name() const -> std::string_view;

        auto has_extension() const -> bool;

        auto decoded_path() const -> std::string;

        auto operator==(Url const& other) const noexcept -> bool = default;
    };

    // Crawl boundary derived from the root URL.
    struct Scope {
        explicit Scope(Url root);

        auto root() const noexcept -> Url const& { return root_; }

        auto prefix() const noexcept -> std::string const& { return prefix_; }

        auto contains(Url const& url) const noexcept -> bool;

        auto relative(Url const& url) const -> std::string;

        static auto is_self_or_ancestor(Url const& page, Url const& url) noexcept -> bool;

    private:
        Url root_;
        std::string prefix_;
        std::string base_;
    };
}
