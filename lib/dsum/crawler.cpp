#include "crawler.hpp"

#include <chrono>
#include <condition_variable>
#include <deque>
#include <memory>
#include <mutex>
#include <thread>
#include <unordered_set>
#include <utility>
#include <vector>

#include "digest.hpp"
#include "mirror.hpp"

using namespace dsum;

struct Crawler::State {
    Listing const& listing;
    function_ref<void(FileRecord const& record)> const& on_record;
    Manifest::Builder builder = {};
    std::mutex mutex = {};
    std::mutex report_mutex = {};
    std::condition_variable cv = {};
    std::deque<Target> queue = {};
    std::unordered_set<std::string> visited = {};
    std::unordered_set<std::string> paths = {};
    std::vector<FileRecord> reports = {};
    bool reporting = {};
    std::size_t in_flight = {};
    std::size_t succeeded = {};
};

struct Crawler::FileSink final : Sink {
    Digest digest = {};
    std::unique_ptr<Mirror> mirror = {};

    auto reset() -> bool override {
        digest.reset();
        return !mirror || mirror->reset();
    }

    auto write(std::span<char const> data) -> bool override {
        digest.update(data);
        return !mirror || mirror->write(data);
    }

    auto error() const -> std::string override { return mirror ? mirror->error() : Sink::error(); }
};

struct Crawler::Done {
    Fetcher::Result result;
    std::string sha256 = {};
};

Crawler::Crawler(Options const& options, Fetcher& fetcher) : options_(options), fetcher_(fetcher) {
    options_.workers = std::clamp(options_.workers, 1u, 64u);
    options_.interval = std::clamp(options_.interval, 1, 30000);
}

auto Crawler::run(std::string_view root_url, function_ref<void(FileRecord const& record)> on_record) -> Manifest {
    dsum_trace("root: %.*s", (int)root_url.size(), root_url.data());
    auto root = Url::parse(root_url);
    if (!root) {
        dsum_error("malformed root url");
    }
    auto scope = Scope(*root);
    dsum_assert(scope.contains(*root));
    auto listing = Listing(scope, options_.listing);

    stats_ = {};
    auto state = State{listing, on_record};
    auto role = root->is_dir() ? Role::Listing : Role::File;
    state.visited.insert(root->str());
    if (role == Role::File) {
        state.paths.insert(scope.relative(*root));
    }
    state.queue.push_back(Target{std::move(*root), role, 0});

    {
        auto workers = std::vector<std::jthread>{};
        for (std::uint32_t i = 0; i != options_.workers; ++i) {
            workers.emplace_back([this, &state] { worker(state); });
        }
    }

    auto manifest = state.builder.build(cancel_);
    if (!manifest.cancelled && state.succeeded == 0) {
        for (auto const* failure : manifest.failures()) {
            push_error_msg("%s: %s", failure->path.c_str(), failure->error.c_str());
        }
        dsum_error("no target could be fetched");
    }
    return manifest;
}

auto Crawler::worker(State& state) -> void {
    auto const interval = std::chrono::milliseconds(options_.interval);
    auto lock = std::unique_lock<std::mutex>(state.mutex);
    for (;;) {
        if (cancel_) {
            break;
        }
        if (state.queue.empty()) {
            if (state.in_flight == 0) {
                break;
            }
            state.cv.wait_for(lock, interval);
            continue;
        }
        auto target = std::move(state.queue.front());
        state.queue.pop_front();
        ++state.in_flight;
        lock.unlock();
        auto result = process(state, target);
        lock.lock();
        --state.in_flight;
        auto record = fold(state, target, std::move(result));
        state.cv.notify_all();
        if (record) {
            lock.unlock();
            report(state, std::move(*record));
            lock.lock();
        }
    }
    state.cv.notify_all();
}

auto Crawler::process(State& state, Target const& target) -> Done {
    auto sink = FileSink{};
    if (target.role == Role::File && !options_.mirror.empty()) {
        try {
            sink.mirror = std::make_unique<Mirror>(options_.mirror, state.listing.scope().relative(target.url));
        } catch (std::exception const& e) {
            error_stack().clear();
            return {Fetcher::Failure{ErrorKind::Digest, e.what()}};
        }
    }
    auto result = Fetcher::Result{};
    try {
        result = fetcher_.fetch(target, state.listing, sink, &cancel_);
    } catch (std::exception const& e) {
        error_stack().clear();
        return {Fetcher::Failure{ErrorKind::Network, e.what()}};
    }
    if (!std::holds_alternative<Fetcher::Content>(result)) {
        return {std::move(result)};
    }
    if (sink.mirror && !sink.mirror->finish()) {
        return {Fetcher::Failure{ErrorKind::Digest, sink.mirror->error()}};
    }
    return {std::move(result), sink.digest.hexdigest()};
}

auto Crawler::admit(State& state, Target target) -> void {
    if (options_.max_depth && target.depth > options_.max_depth) {
        ++stats_.skipped;
        return;
    }
    auto path = std::string{};
    if (target.role == Role::File) {
        path = state.listing.scope().relative(target.url);
        if (options_.filter && !std::regex_search(path, *options_.filter)) {
            ++stats_.skipped;
            return;
        }
    }
    if (!state.visited.insert(target.url.str()).second) {
        return;
    }
    // Distinct urls may still decode to one manifest path, the first one keeps it.
    if (target.role == Role::File && !state.paths.insert(std::move(path)).second) {
        return;
    }
    state.queue.push_back(std::move(target));
}

auto Crawler::fold(State& state, Target const& target, Done done) -> std::optional<FileRecord> {
    auto record = FileRecord{
        .path = state.listing.scope().relative(target.url),
        .url = target.url.str(),
    };
    if (auto links = std::get_if<Fetcher::Links>(&done.result)) {
        ++state.succeeded;
        ++stats_.expanded;
        if (links->parse_error) {
            ++stats_.parse_errors;
        }
        // Links were resolved against the directory form of the page, mark it as expanded too.
        auto page = target.url.without_query();
        if (!page.is_dir()) {
            page.path += '/';
        }
        state.visited.insert(page.str());
        if (cancel_) {
            return std::nullopt;
        }
        for (auto& child : links->targets) {
            admit(state, std::move(child));
        }
        return std::nullopt;
    }
    if (auto content = std::get_if<Fetcher::Content>(&done.result)) {
        ++state.succeeded;
        record.sha256 = std::move(done.sha256);
        record.size = content->size;
    } else if (auto failure = std::get_if<Fetcher::Failure>(&done.result)) {
        if (failure->kind == ErrorKind::Cancelled) {
            record.error = "cancelled";
        } else {
            record.error = fmt::format("{}: {}", to_string(failure->kind), failure->reason);
        }
    }
    return record;
}

// Whichever worker finds no report in progress delivers the pending records,
// the others queue theirs and go back to fetching.
auto Crawler::report(State& state, FileRecord record) -> void {
    auto lock = std::unique_lock<std::mutex>(state.report_mutex);
    state.reports.push_back(std::move(record));
    if (state.reporting) {
        return;
    }
    state.reporting = true;
    while (!state.reports.empty()) {
        auto batch = std::exchange(state.reports, {});
        lock.unlock();
        for (auto& pending : batch) {
            if (state.on_record) {
                state.on_record(pending);
            }
            state.builder.add(std::move(pending));
        }
        lock.lock();
    }
    state.reporting = false;
}
