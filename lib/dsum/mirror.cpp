#include "mirror.hpp"

using namespace dsum;

Mirror::Mirror(fs::path const& root, std::string_view path) {
    if (!is_safe(path)) {
        error_ = fmt::format("unsafe mirror path: {}", path);
        return;
    }
    path_ = root / fs::path(path);
}

auto Mirror::is_safe(std::string_view path) noexcept -> bool {
    if (path.empty() || path.starts_with('/') || path.ends_with('/') || path.find('\0') != std::string_view::npos) {
        return false;
    }
    while (!path.empty()) {
        auto [segment, rest] = str_split(path, '/');
        if (segment.empty() || segment == "." || segment == "..") {
            return false;
        }
        path = rest;
    }
    return true;
}

auto Mirror::open() -> bool {
    if (file_) {
        return true;
    }
    if (!error_.empty()) {
        return false;
    }
    try {
        file_ = std::make_unique<IO::File>(path_, IO::WRITE | IO::TRUNCATE);
    } catch (std::exception const& e) {
        error_ = fmt::format("mirror {}: {}", path_.generic_string(), e.what());
        error_stack().clear();
        return false;
    }
    return true;
}

auto Mirror::reset() -> bool {
    offset_ = 0;
    if (!file_) {
        return error_.empty();
    }
    if (!file_->resize(0, 0)) {
        error_ = fmt::format("mirror {}: truncate failed", path_.generic_string());
        return false;
    }
    return true;
}

auto Mirror::write(std::span<char const> data) -> bool {
    if (!open()) {
        return false;
    }
    if (!file_->write(offset_, data)) {
        error_ = fmt::format("mirror {}: write failed", path_.generic_string());
        return false;
    }
    offset_ += data.size();
    return true;
}

auto Mirror::finish() -> bool {
    if (!open()) {
        return false;
    }
    file_.reset();
    return true;
}
