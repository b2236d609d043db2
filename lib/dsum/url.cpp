#include "url.hpp"

#include <curl/curl.h>

#include <memory>

using namespace dsum;

struct CurlUrlDeleter {
    void operator()(CURLU* handle) const noexcept { curl_url_cleanup(handle); }
};

using CurlUrl = std::unique_ptr<CURLU, CurlUrlDeleter>;

static auto to_lower(std::string str) noexcept -> std::string {
    for (auto& c : str) {
        if (c >= 'A' && c <= 'Z') {
            c = (char)(c - 'A' + 'a');
        }
    }
    return str;
}

// Percent-encodes what libcurl refuses in a URL: whitespace, control and non-ASCII bytes.
// Browsers silently drop tabs and newlines inside attribute values, so do we.
static auto escape_unsafe(std::string_view text) -> std::string {
    static constexpr char HEX[] = "0123456789ABCDEF";
    auto result = std::string{};
    result.reserve(text.size());
    for (unsigned char c : str_strip(text)) {
        if (c == '\t' || c == '\n' || c == '\r') {
            continue;
        }
        if (c <= 0x20 || c >= 0x7F) {
            result.push_back('%');
            result.push_back(HEX[c >> 4]);
            result.push_back(HEX[c & 0xF]);
        } else {
            result.push_back((char)c);
        }
    }
    return result;
}

static constexpr auto unhex(char c) noexcept -> int {
    if (c >= '0' && c <= '9') return c - '0';
    if (c >= 'a' && c <= 'f') return c - 'a' + 10;
    if (c >= 'A' && c <= 'F') return c - 'A' + 10;
    return -1;
}

static constexpr auto is_unreserved(char c) noexcept -> bool {
    return (c >= 'a' && c <= 'z') || (c >= 'A' && c <= 'Z') || (c >= '0' && c <= '9') || c == '-' || c == '.' ||
           c == '_' || c == '~';
}

// Decodes escaped unreserved characters and uppercases the hex digits of the rest,
// so "%7e", "%7E" and "~" name the same path.
static auto normalize_escapes(std::string_view text) -> std::string {
    static constexpr char HEX[] = "0123456789ABCDEF";
    auto result = std::string{};
    result.reserve(text.size());
    for (std::size_t i = 0; i < text.size(); ++i) {
        if (text[i] == '%' && i + 2 < text.size()) {
            auto hi = unhex(text[i + 1]);
            auto lo = unhex(text[i + 2]);
            if (hi >= 0 && lo >= 0) {
                auto c = (char)(hi * 16 + lo);
                if (is_unreserved(c)) {
                    result.push_back(c);
                } else {
                    result.push_back('%');
                    result.push_back(HEX[hi]);
                    result.push_back(HEX[lo]);
                }
                i += 2;
                continue;
            }
        }
        result.push_back(text[i]);
    }
    return result;
}

static auto url_decode(std::string_view text) -> std::string {
    auto result = std::string{};
    result.reserve(text.size());
    for (std::size_t i = 0; i < text.size(); ++i) {
        if (text[i] == '%' && i + 2 < text.size()) {
            auto hi = unhex(text[i + 1]);
            auto lo = unhex(text[i + 2]);
            if (hi >= 0 && lo >= 0) {
                result.push_back((char)(hi * 16 + lo));
                i += 2;
                continue;
            }
        }
        result.push_back(text[i]);
    }
    return result;
}

static auto default_port(std::string_view scheme) noexcept -> std::string_view {
    if (scheme == "http") return "80";
    if (scheme == "https") return "443";
    if (scheme == "ftp") return "21";
    return {};
}

static auto get_part(CURLU* handle, CURLUPart part) -> std::optional<std::string> {
    char* out = nullptr;
    if (curl_url_get(handle, part, &out, 0) != CURLUE_OK || !out) {
        return std::nullopt;
    }
    auto result = std::string(out);
    curl_free(out);
    return result;
}

static auto from_handle(CURLU* handle) -> std::optional<Url> {
    auto url = Url{};
    if (auto scheme = get_part(handle, CURLUPART_SCHEME)) {
        url.scheme = to_lower(std::move(*scheme));
    } else {
        return std::nullopt;
    }
    if (auto host = get_part(handle, CURLUPART_HOST)) {
        url.host = to_lower(std::move(*host));
    } else if (url.scheme != "file") {
        return std::nullopt;
    }
    if (auto port = get_part(handle, CURLUPART_PORT); port && *port != default_port(url.scheme)) {
        url.port = std::move(*port);
    }
    url.path = normalize_escapes(get_part(handle, CURLUPART_PATH).value_or("/"));
    if (url.path.empty()) {
        url.path = "/";
    }
    url.query = get_part(handle, CURLUPART_QUERY).value_or("");
    return url;
}

auto Url::parse(std::string_view text) -> std::optional<Url> {
    auto handle = CurlUrl(curl_url());
    dsum_assert(handle);
    auto escaped = escape_unsafe(text);
    if (escaped.empty()) {
        return std::nullopt;
    }
    if (curl_url_set(handle.get(), CURLUPART_URL, escaped.c_str(), 0) != CURLUE_OK) {
        return std::nullopt;
    }
    return from_handle(handle.get());
}

auto Url::resolve(std::string_view ref) const -> std::optional<Url> {
    auto escaped = escape_unsafe(ref);
    if (escaped.empty() || escaped.front() == '#') {
        return *this;
    }
    if (escaped.front() == '?') {
        auto result = *this;
        result.query = std::string(str_split(std::string_view(escaped).substr(1), '#').first);
        return result;
    }
    auto handle = CurlUrl(curl_url());
    dsum_assert(handle);
    auto base = this->str();
    if (curl_url_set(handle.get(), CURLUPART_URL, base.c_str(), 0) != CURLUE_OK) {
        return std::nullopt;
    }
    if (curl_url_set(handle.get(), CURLUPART_URL, escaped.c_str(), 0) != CURLUE_OK) {
        return std::nullopt;
    }
    return from_handle(handle.get());
}

auto Url::str() const -> std::string {
    auto result = this->origin();
    result += path;
    if (!query.empty()) {
        result += '?';
        result += query;
    }
    return result;
}

auto Url::origin() const -> std::string {
    if (port.empty()) {
        return fmt::format("{}://{}", scheme, host);
    }
    return fmt::format("{}://{}:{}", scheme, host, port);
}

auto Url::without_query() const -> Url {
    auto result = *this;
    result.query.clear();
    return result;
}

auto Url::parent_dir() const -> std::string_view {
    auto view = std::string_view(path);
    if (view.size() > 1 && view.ends_with('/')) {
        view.remove_suffix(1);
    }
    if (auto n = view.rfind('/'); n != std::string_view::npos) {
        return view.substr(0, n + 1);
    }
    return "/";
}

auto Url::name() const -> std::string_view {
    auto view = std::string_view(path);
    if (view.ends_with('/')) {
        view.remove_suffix(1);
    }
    if (auto n = view.rfind('/'); n != std::string_view::npos) {
        return view.substr(n + 1);
    }
    return view;
}

auto Url::has_extension() const -> bool {
    if (is_dir()) {
        return false;
    }
    auto file = name();
    auto n = file.rfind('.');
    return n != std::string_view::npos && n != 0 && n + 1 != file.size();
}

auto Url::decoded_path() const -> std::string { return url_decode(path); }

Scope::Scope(Url root) : root_(std::move(root)) {
    prefix_ = root_.is_dir() ? root_.path : root_.path + '/';
    base_ = std::string(root_.parent_dir());
}

auto Scope::contains(Url const& url) const noexcept -> bool {
    if (url.scheme != root_.scheme || url.host != root_.host || url.port != root_.port) {
        return false;
    }
    return url.path == root_.path || url.path.starts_with(prefix_);
}

auto Scope::relative(Url const& url) const -> std::string {
    auto path = std::string_view(url.path);
    if (path.starts_with(base_)) {
        path.remove_prefix(base_.size());
    }
    auto result = url_decode(path);
    if (!url.query.empty()) {
        result += '?';
        result += url.query;
    }
    if (result.empty()) {
        result = "/";
    }
    return result;
}

auto Scope::is_self_or_ancestor(Url const& page, Url const& url) noexcept -> bool {
    if (url.scheme != page.scheme || url.host != page.host || url.port != page.port) {
        return false;
    }
    auto const& p = page.path;
    auto const& u = url.path;
    if (!p.starts_with(u)) {
        return false;
    }
    return u.size() == p.size() || u.ends_with('/') || p[u.size()] == '/';
}
