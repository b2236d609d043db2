#include <argparse.hpp>
#include <dsum/common.hpp>
#include <dsum/http.hpp>
#include <dsum/listing.hpp>
#include <iostream>

using namespace dsum;

struct Main {
    struct CLI {
        std::string url = {};
        std::string format = {};
        Listing::Options listing = {};
        Fetcher::Options fetcher = {};
    } cli = {};

    struct NullSink final : Sink {
        auto reset() -> bool override { return true; }
        auto write(std::span<char const>) -> bool override { return true; }
    };

    auto parse_args(int argc, char** argv) -> void {
        argparse::ArgumentParser program(fs::path(argv[0]).filename().generic_string());
        program.add_description("Lists links found in a single directory listing.");
        program.add_argument("url").help("Listing url.").required();
        program.add_argument("--format")
            .help("Format output, named args: role, path, url, depth, pinned.")
            .default_value(std::string("{role},{path},{url}"));
        program.add_argument("--links").help("XPath selecting links.").default_value(std::string("//a[@href]"));
        program.add_argument("--files").help("XPath selecting links that are always files.").default_value(std::string{});
        program.add_argument("--timeout")
            .help("Transfer timeout in miliseconds, 0 for none.")
            .default_value(std::uint32_t{30000})
            .action([](std::string const& value) -> std::uint32_t { return (std::uint32_t)std::stoul(value); });
        program.add_argument("--curl-verbose").help("Curl: verbose logging.").default_value(false).implicit_value(true);
        program.add_argument("--curl-proxy").help("Curl: proxy.").default_value(std::string{});
        program.add_argument("--curl-useragent").help("Curl: user agent string.").default_value(std::string{});

        program.parse_args(argc, argv);

        cli.url = program.get<std::string>("url");
        cli.format = program.get<std::string>("--format");
        cli.listing = {
            .links = program.get<std::string>("--links"),
            .files = program.get<std::string>("--files"),
        };
        cli.fetcher = {
            .timeout = program.get<std::uint32_t>("--timeout"),
            .verbose = program.get<bool>("--curl-verbose"),
            .proxy = program.get<std::string>("--curl-proxy"),
            .useragent = program.get<std::string>("--curl-useragent"),
        };
    }

    auto run() -> void {
        dsum_trace("Listing url: %s", cli.url.c_str());
        auto url = Url::parse(cli.url);
        if (!url) {
            dsum_error("malformed url");
        }
        auto listing = Listing(Scope(*url), cli.listing);
        auto fetcher = HttpFetcher(cli.fetcher);
        auto sink = NullSink{};
        auto result = fetcher.fetch(Target{*url, Role::Listing, 0}, listing, sink);
        if (auto failure = std::get_if<Fetcher::Failure>(&result)) {
            dsum_error(fmt::format("{}: {}", to_string(failure->kind), failure->reason).c_str());
        }
        auto links = std::get_if<Fetcher::Links>(&result);
        if (!links) {
            dsum_error("not an html listing");
        }
        if (links->parse_error) {
            std::cerr << "Failed to parse listing!" << std::endl;
        }
        for (auto const& target : links->targets) {
            fmt::dynamic_format_arg_store<fmt::format_context> store{};
            store.push_back(fmt::arg("role", to_string(target.role)));
            store.push_back(fmt::arg("path", listing.scope().relative(target.url)));
            store.push_back(fmt::arg("url", target.url.str()));
            store.push_back(fmt::arg("depth", target.depth));
            store.push_back(fmt::arg("pinned", target.pinned));
            std::cout << fmt::vformat(cli.format, store) << std::endl;
        }
    }
};

int main(int argc, char** argv) {
    auto main = Main{};
    try {
        main.parse_args(argc, argv);
        main.run();
    } catch (std::exception const& e) {
        std::cerr << e.what() << std::endl;
        for (auto const& error : error_stack()) {
            std::cerr << error << std::endl;
        }
        error_stack().clear();
        return EXIT_FAILURE;
    }
    return EXIT_SUCCESS;
}
