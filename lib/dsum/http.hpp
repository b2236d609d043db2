#pragma once
#include <mutex>
#include <string>
#include <vector>

#include "fetcher.hpp"

namespace dsum {
    // libcurl transport. Easy handles are pooled, one per concurrent transfer.
    struct HttpFetcher final : Fetcher {
        HttpFetcher(Options const& options);
        ~HttpFetcher() noexcept override;

    protected:
        auto transfer(std::string const& url, Transfer const& transfer) -> Outcome override;

    private:
        struct Context;

        auto acquire() -> void*;
        auto release(void* handle) noexcept -> void;
        auto setup(void* handle, Context& context) const -> void;

        std::mutex mutex_;
        std::vector<void*> free_;
    };
}
