#pragma once
#include <fmt/args.h>
#include <fmt/format.h>

#include <algorithm>
#include <cstdint>
#include <cstddef>
#include <cctype>
#include <cstring>
#include <filesystem>
#include <functional>
#include <optional>
#include <span>
#include <stdexcept>
#include <string>
#include <string_view>
#include <system_error>
#include <tuple>
#include <type_traits>
#include <vector>

#define dsum_paste_impl(x, y) x##y
#define dsum_paste(x, y) dsum_paste_impl(x, y)

#define dsum_error(msg) ::dsum::throw_error(__PRETTY_FUNCTION__, msg)

#define dsum_assert(...)                                            \
    do {                                                            \
        if (!(__VA_ARGS__)) [[unlikely]] {                          \
            ::dsum::throw_error(__PRETTY_FUNCTION__, #__VA_ARGS__); \
        }                                                           \
    } while (false)

#define dsum_rethrow(...)                                 \
    [&, func = __PRETTY_FUNCTION__]() -> decltype(auto) { \
        try {                                             \
            return __VA_ARGS__;                           \
        } catch (std::exception const&) {                 \
            ::dsum::throw_error(func, #__VA_ARGS__);      \
        }                                                 \
    }()

#define dsum_trace(...)                                \
    ::dsum::ErrorTrace dsum_paste(_trace_, __LINE__) { \
        [&] { ::dsum::push_error_msg(__VA_ARGS__); }   \
    }

#define dsum_assert_easy_curl(...)                                               \
    do {                                                                         \
        if (auto result = __VA_ARGS__; result != CURLE_OK) [[unlikely]] {        \
            ::dsum::throw_error(__PRETTY_FUNCTION__, curl_easy_strerror(result)); \
        }                                                                        \
    } while (false)

namespace dsum {
    static std::size_t KiB = 1024;
    static std::size_t MiB = KiB * 1024;

    namespace fs = std::filesystem;
    using namespace std::literals::string_view_literals;

    [[noreturn]] extern void throw_error(std::string_view from, char const* msg);

    [[noreturn]] inline void throw_error(std::string_view from, std::error_code const& ec) {
        throw_error(from, ec.message().c_str());
    }

    using error_stack_t = std::vector<std::string>;

    extern error_stack_t& error_stack() noexcept;

    extern void push_error_msg(char const* fmt, ...) noexcept;

    template <typename Func>
    struct ErrorTrace : Func {
        inline ErrorTrace(Func&& func) noexcept : Func(std::move(func)) {}
        inline ~ErrorTrace() noexcept {
            if (std::uncaught_exceptions()) {
                Func::operator()();
            }
        }
    };

    struct progress_bar {
        progress_bar(char const* banner, bool disabled, std::uint64_t done, std::uint64_t total) noexcept;
        ~progress_bar() noexcept;

        auto update(std::uint64_t done, std::uint64_t total) noexcept -> void;

    private:
        auto render() const noexcept -> void;

        char const* banner_;
        bool disabled_ = {};
        std::uint64_t done_;
        std::uint64_t total_;
    };

    extern auto clean_path(std::string path) noexcept -> std::string;

    template <auto... M>
    inline auto sort_by(auto beg, auto end) noexcept -> void {
        return std::sort(beg, end, [](auto const& l, auto const& r) {
            return std::tie((l.*M)...) < std::tie((r.*M)...);
        });
    }

    inline auto str_split(std::string_view str, char c) noexcept -> std::pair<std::string_view, std::string_view> {
        if (auto n = str.find(c); n != std::string_view::npos) {
            return {str.substr(0, n), str.substr(n + 1)};
        }
        return {str, {}};
    }

    inline auto str_strip(std::string_view str) noexcept -> std::string_view {
        while (!str.empty() && ::isspace((unsigned char)str.front())) str.remove_prefix(1);
        while (!str.empty() && ::isspace((unsigned char)str.back())) str.remove_suffix(1);
        return str;
    }

    constexpr auto str_starts_with_ci = [](std::string_view str, std::string_view prefix) noexcept -> bool {
        static constexpr auto lower = [](std::uint8_t c) noexcept -> std::uint8_t {
            return (c >= 'A' && c <= 'Z') ? ((c - 'A') + 'a') : c;
        };
        return str.size() >= prefix.size() &&
               std::equal(prefix.begin(), prefix.end(), str.begin(), [](auto l, auto r) {
                   return lower(l) == lower(r);
               });
    };

    template <typename Signature>
    struct function_ref;

    template <typename Ret, typename... Args>
    struct function_ref<Ret(Args...)> {
        constexpr function_ref() noexcept = default;

        template <typename Func>
            requires(std::is_invocable_r_v<Ret, Func, Args...>)
        function_ref(Func* func)
        noexcept
            : invoke_(+[](void* ref, Args... args) -> Ret { return std::invoke(*(Func*)ref, args...); }),
              ref_((void*)func) {}

        template <typename Func>
            requires(std::is_invocable_r_v<Ret, Func, Args...>)
        function_ref(Func&& func)
        noexcept : function_ref(&func) {}

        explicit constexpr operator bool() const noexcept { return ref_; }

        constexpr bool operator!() const noexcept { return !ref_; }

        auto operator()(Args... args) const -> Ret { return invoke_(ref_, args...); }

    private:
        Ret (*invoke_)(void* ref, Args...) = nullptr;
        void* ref_ = nullptr;
    };

    extern auto collect_files(std::vector<std::string> const& inputs,
                              function_ref<bool(fs::path const& path)> filter,
                              bool recursive = false) -> std::vector<fs::path>;

    extern auto fs_relative(fs::path const& target, fs::path const& parent) -> std::string;
}
