#include "fetcher.hpp"

#include <chrono>
#include <thread>

using namespace dsum;

Fetcher::Fetcher(Options const& options) : options_(options) {}

auto Fetcher::is_html(std::string_view content_type) noexcept -> bool {
    content_type = str_strip(content_type);
    return str_starts_with_ci(content_type, "text/html") || str_starts_with_ci(content_type, "application/xhtml+xml");
}

auto Fetcher::request_url(Target const& target) const -> std::string {
    auto url = target.url.str();
    if (target.role == Role::File && options_.rewrite) {
        url = std::regex_replace(url, options_.rewrite->from, options_.rewrite->to);
    }
    return url;
}

// Redirects may change scheme or path but must stay on the requested host and port.
static auto same_site(std::optional<Url> const& origin, std::string_view location) -> bool {
    auto target = Url::parse(location);
    return origin && target && target->host == origin->host && target->port == origin->port;
}

auto Fetcher::fetch(Target const& target, Listing const& listing, Sink& sink, std::atomic_bool const* cancel)
    -> Result {
    for (std::uint32_t tried = 0;; ++tried) {
        if (tried) {
            auto const deadline = std::chrono::steady_clock::now() + std::chrono::milliseconds(options_.retry_delay);
            while (std::chrono::steady_clock::now() < deadline) {
                if (cancel && *cancel) {
                    return Failure{ErrorKind::Cancelled, "cancelled"};
                }
                std::this_thread::sleep_for(std::chrono::milliseconds(10));
            }
            if (!sink.reset()) {
                return Failure{ErrorKind::Digest, sink.error()};
            }
        }
        auto result = attempt(target, listing, sink, cancel);
        auto failure = std::get_if<Failure>(&result);
        if (!failure || !failure->transient || tried >= options_.retry) {
            return result;
        }
    }
}

auto Fetcher::attempt(Target const& target, Listing const& listing, Sink& sink, std::atomic_bool const* cancel)
    -> Result {
    if (cancel && *cancel) {
        return Failure{ErrorKind::Cancelled, "cancelled"};
    }

    auto const url = request_url(target);
    auto const origin = Url::parse(url);
    auto status = long{};
    auto mode = Mode::Discard;
    auto body = std::string{};
    auto size = std::uint64_t{};
    auto sink_failed = false;
    auto sink_error = std::string{};
    auto too_large = false;
    auto off_site = std::string{};

    auto on_head = [&](long code, std::string_view content_type, std::string_view location) -> Mode {
        status = code;
        if (!location.empty() && location != url && !same_site(origin, location)) {
            off_site = location;
            mode = Mode::Discard;
        } else if (code != 0 && (code < 200 || code >= 300)) {
            mode = Mode::Discard;
        } else if (is_html(content_type) &&
                   (target.role == Role::Listing || (!target.pinned && !target.url.has_extension()))) {
            mode = Mode::Buffer;
        } else {
            mode = Mode::Stream;
        }
        return mode;
    };

    auto on_data = [&](std::span<char const> data) -> bool {
        switch (mode) {
            case Mode::Buffer:
                if (body.size() + data.size() > options_.max_listing) {
                    too_large = true;
                    return false;
                }
                body.append(data.data(), data.size());
                return true;
            case Mode::Stream:
                try {
                    if (!sink.write(data)) {
                        sink_error = sink.error();
                        sink_failed = true;
                        return false;
                    }
                } catch (std::exception const& e) {
                    sink_error = e.what();
                    sink_failed = true;
                    return false;
                }
                size += data.size();
                return true;
            case Mode::Discard:
                return true;
        }
        return false;
    };

    auto const outcome = transfer(url, Transfer{on_head, on_data, cancel});
    switch (outcome.code) {
        case Outcome::Cancelled:
            return Failure{ErrorKind::Cancelled, "cancelled"};
        case Outcome::Aborted:
            if (sink_failed) {
                return Failure{ErrorKind::Digest, std::move(sink_error)};
            }
            if (too_large) {
                return Failure{ErrorKind::Parse, fmt::format("listing larger than {} bytes", options_.max_listing)};
            }
            return Failure{ErrorKind::Network, outcome.reason, outcome.transient};
        case Outcome::Error:
            return Failure{ErrorKind::Network, outcome.reason, outcome.transient};
        case Outcome::Ok:
            break;
    }

    if (!off_site.empty()) {
        return Failure{ErrorKind::Network, fmt::format("redirected off-site to {}", off_site)};
    }
    if (status != 0 && (status < 200 || status >= 300)) {
        return Failure{ErrorKind::HttpStatus, fmt::format("HTTP {}", status), status >= 500 && status <= 599};
    }
    if (mode == Mode::Buffer) {
        // A promoted page is a directory served without its trailing slash.
        auto page = target.url;
        if (!page.is_dir()) {
            page.path += '/';
        }
        auto parsed = listing.parse(body, page, target.depth);
        return Links{std::move(parsed.targets), parsed.parse_error};
    }
    return Content{size};
}
