#include "common.hpp"

#include <cstdarg>
#include <cstdio>
#include <iostream>

using namespace dsum;

void dsum::throw_error(std::string_view from, char const* msg) {
    // break point goes here
    throw std::runtime_error(fmt::format("{}: {}", from, msg));
}

error_stack_t& dsum::error_stack() noexcept {
    thread_local error_stack_t instance = {};
    return instance;
}

void dsum::push_error_msg(char const* fmt, ...) noexcept {
    va_list args;
    char buffer[4096];
    int result;
    va_start(args, fmt);
    result = vsnprintf(buffer, 4096, fmt, args);
    va_end(args);
    if (result >= 0) {
        error_stack().push_back({buffer, buffer + std::min(result, 4095)});
    }
}

dsum::progress_bar::progress_bar(char const* banner, bool disabled, std::uint64_t done, std::uint64_t total) noexcept
    : banner_(banner), disabled_(disabled), done_(done), total_(total) {
    this->render();
}

dsum::progress_bar::~progress_bar() noexcept {
    if (!disabled_) {
        this->render();
        std::cerr << std::endl;
    }
}

auto dsum::progress_bar::render() const noexcept -> void {
    if (disabled_) {
        return;
    }
    std::cerr << fmt::format("\r{}: {}/{}", banner_, done_, total_) << std::flush;
}

auto dsum::progress_bar::update(std::uint64_t done, std::uint64_t total) noexcept -> void {
    if (done_ == done && total_ == total) {
        return;
    }
    done_ = done;
    total_ = total;
    this->render();
}

auto dsum::clean_path(std::string path) noexcept -> std::string {
    std::replace(path.begin(), path.end(), '\\', '/');
    while (path.size() > 1 && path.ends_with('/')) {
        path.pop_back();
    }
    return path;
}

auto dsum::collect_files(std::vector<std::string> const& inputs,
                         function_ref<bool(fs::path const& path)> filter,
                         bool recursive) -> std::vector<fs::path> {
    auto paths = std::vector<fs::path>{};
    for (auto const& input : inputs) {
        dsum_trace("input = %s", input.c_str());
        dsum_assert(fs::exists(input));
        if (fs::is_regular_file(input)) {
            paths.push_back(input);
        } else if (recursive) {
            for (auto const& entry : fs::recursive_directory_iterator(input)) {
                if (!entry.is_regular_file()) {
                    continue;
                }
                if (filter && !filter(entry.path())) {
                    continue;
                }
                paths.push_back(entry.path());
            }
        } else {
            for (auto const& entry : fs::directory_iterator(input)) {
                if (!entry.is_regular_file()) {
                    continue;
                }
                if (filter && !filter(entry.path())) {
                    continue;
                }
                paths.push_back(entry.path());
            }
        }
    }
    return paths;
}

auto dsum::fs_relative(fs::path const& target, fs::path const& parent) -> std::string {
    auto result = dsum_rethrow(fs::relative(target, parent).generic_string());
    dsum_assert(!result.empty() && !result.starts_with(".."));
    return result;
}
