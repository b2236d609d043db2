#include <argparse.hpp>
#include <atomic>
#include <csignal>
#include <cstdlib>
#include <dsum/common.hpp>
#include <dsum/crawler.hpp>
#include <dsum/http.hpp>
#include <dsum/iofile.hpp>
#include <iostream>

using namespace dsum;

static std::atomic<Crawler*> g_crawler = nullptr;
static std::atomic_int g_interrupts = 0;

struct Main {
    struct CLI {
        std::string url = {};
        std::string output = {};
        std::string format = {};
        bool no_header = {};
        bool no_progress = {};
        Crawler::Options crawler = {};
        Fetcher::Options fetcher = {};
    } cli = {};

    auto parse_args(int argc, char** argv) -> void {
        argparse::ArgumentParser program(fs::path(argv[0]).filename().generic_string());
        program.add_description("Crawls a directory listing and hashes every file it links to.");
        program.add_argument("url").help("Root listing url.").required();
        program.add_argument("-o", "--output").help("Manifest file to write or - for stdout.").default_value(std::string("-"));
        program.add_argument("--format")
            .help("Format output lines instead of csv, named args: path, sha256, error, size, url.")
            .default_value(std::string{});
        program.add_argument("--no-header").help("Do not write the csv header line.").default_value(false).implicit_value(true);
        program.add_argument("--no-progress").help("Do not print progress.").default_value(false).implicit_value(true);

        // Crawl options
        program.add_argument("--mirror").help("Also store downloaded files below this directory.").default_value(std::string{});
        program.add_argument("-p", "--filter-path")
            .help("Filter: manifest path with regex match.")
            .default_value(std::optional<std::regex>{})
            .action([](std::string const& value) -> std::optional<std::regex> {
                if (value.empty()) {
                    return std::nullopt;
                } else {
                    return std::regex{value, std::regex::optimize | std::regex::icase};
                }
            });
        program.add_argument("--max-depth")
            .help("Maximum link depth below the root, 0 for unlimited.")
            .default_value(std::uint32_t{0})
            .action([](std::string const& value) -> std::uint32_t {
                return std::clamp((std::uint32_t)std::stoul(value), 0u, 4096u);
            });
        program.add_argument("--links").help("XPath selecting links.").default_value(std::string("//a[@href]"));
        program.add_argument("--files").help("XPath selecting links that are always files.").default_value(std::string{});
        program.add_argument("--rewrite")
            .help("Rewrite file urls before download: <regex>=<replacement>.")
            .default_value(std::optional<Fetcher::Rewrite>{})
            .action([](std::string const& value) -> std::optional<Fetcher::Rewrite> {
                if (value.empty()) {
                    return std::nullopt;
                }
                auto [from, to] = str_split(value, '=');
                return Fetcher::Rewrite{std::regex{std::string(from)}, std::string(to)};
            });
        program.add_argument("--workers")
            .help("Number of concurrent transfers [1, 64].")
            .default_value(std::uint32_t{8})
            .action([](std::string const& value) -> std::uint32_t {
                return std::clamp((std::uint32_t)std::stoul(value), 1u, 64u);
            });
        program.add_argument("--interval")
            .help("Worker poll interval in miliseconds.")
            .default_value(int{100})
            .action([](std::string const& value) -> int { return std::clamp((int)std::stoul(value), 1, 30000); });

        // Fetch options
        program.add_argument("--retry")
            .help("Number of retries for transient failures.")
            .default_value(std::uint32_t{2})
            .action([](std::string const& value) -> std::uint32_t {
                return std::clamp((std::uint32_t)std::stoul(value), 0u, 8u);
            });
        program.add_argument("--retry-delay")
            .help("Delay between retries in miliseconds.")
            .default_value(std::uint32_t{250})
            .action([](std::string const& value) -> std::uint32_t {
                return std::clamp((std::uint32_t)std::stoul(value), 0u, 60000u);
            });
        program.add_argument("--timeout")
            .help("Transfer timeout in miliseconds, 0 for none.")
            .default_value(std::uint32_t{30000})
            .action([](std::string const& value) -> std::uint32_t { return (std::uint32_t)std::stoul(value); });
        program.add_argument("--connect-timeout")
            .help("Connect timeout in miliseconds, 0 for default.")
            .default_value(std::uint32_t{10000})
            .action([](std::string const& value) -> std::uint32_t { return (std::uint32_t)std::stoul(value); });
        program.add_argument("--max-redirects")
            .help("Maximum redirects to follow.")
            .default_value(std::uint32_t{10})
            .action([](std::string const& value) -> std::uint32_t {
                return std::clamp((std::uint32_t)std::stoul(value), 0u, 64u);
            });
        program.add_argument("--curl-verbose").help("Curl: verbose logging.").default_value(false).implicit_value(true);
        program.add_argument("--curl-buffer")
            .help("Curl buffer size in killobytes [1, 512].")
            .default_value(long{512})
            .action(
                [](std::string const& value) -> long { return std::clamp((long)std::stoul(value), 1l, 512l) * 1024; });
        program.add_argument("--curl-proxy").help("Curl: proxy.").default_value(std::string{});
        program.add_argument("--curl-useragent").help("Curl: user agent string.").default_value(std::string{});
        program.add_argument("--curl-cookiefile")
            .help("Curl cookie file or '-' to disable cookie engine.")
            .default_value(std::string{});
        program.add_argument("--curl-cookielist").help("Curl: cookie list string.").default_value(std::string{});

        program.parse_args(argc, argv);

        cli.url = program.get<std::string>("url");
        cli.output = program.get<std::string>("--output");
        cli.format = program.get<std::string>("--format");
        cli.no_header = program.get<bool>("--no-header");
        cli.no_progress = program.get<bool>("--no-progress");

        cli.crawler = {
            .workers = program.get<std::uint32_t>("--workers"),
            .max_depth = program.get<std::uint32_t>("--max-depth"),
            .interval = program.get<int>("--interval"),
            .filter = program.get<std::optional<std::regex>>("--filter-path"),
            .mirror = program.get<std::string>("--mirror"),
            .listing =
                {
                    .links = program.get<std::string>("--links"),
                    .files = program.get<std::string>("--files"),
                },
        };

        cli.fetcher = {
            .retry = program.get<std::uint32_t>("--retry"),
            .retry_delay = program.get<std::uint32_t>("--retry-delay"),
            .timeout = program.get<std::uint32_t>("--timeout"),
            .connect_timeout = program.get<std::uint32_t>("--connect-timeout"),
            .max_redirects = program.get<std::uint32_t>("--max-redirects"),
            .rewrite = program.get<std::optional<Fetcher::Rewrite>>("--rewrite"),
            .verbose = program.get<bool>("--curl-verbose"),
            .buffer = program.get<long>("--curl-buffer"),
            .proxy = program.get<std::string>("--curl-proxy"),
            .useragent = program.get<std::string>("--curl-useragent"),
            .cookiefile = program.get<std::string>("--curl-cookiefile"),
            .cookielist = program.get<std::string>("--curl-cookielist"),
        };
    }

    auto run() -> int {
        dsum_trace("Root url: %s", cli.url.c_str());
        auto fetcher = HttpFetcher(cli.fetcher);
        auto crawler = Crawler(cli.crawler, fetcher);

        g_crawler = &crawler;
        std::signal(SIGINT, [](int) {
            if (g_interrupts++) {
                std::_Exit(EXIT_FAILURE);
            }
            if (auto crawler = g_crawler.load()) {
                crawler->cancel();
            }
        });
        struct Guard {
            ~Guard() noexcept { g_crawler = nullptr; }
        } guard = {};

        std::cerr << "START: " << cli.url << std::endl;
        auto manifest = crawler.run(cli.url, [&](FileRecord const& record) {
            if (!record.ok()) {
                std::cerr << "FAIL: " << record.path << ": " << record.error << std::endl;
            } else if (!cli.no_progress) {
                std::cerr << "OK: " << record.path << std::endl;
            }
        });

        auto text = std::string{};
        if (cli.format.empty()) {
            text = manifest.dump_csv(!cli.no_header);
        } else {
            text = manifest.dump_format(cli.format);
        }
        if (cli.output == "-") {
            std::cout << text << std::flush;
        } else {
            auto outfile = IO::File(cli.output, IO::WRITE | IO::TRUNCATE);
            dsum_assert(outfile.write(0, text));
        }

        auto const summary = manifest.summary();
        auto const& stats = crawler.stats();
        std::cerr << fmt::format("files: {}, failed: {}, bytes: {}, listings: {}, unparsable: {}, skipped: {}",
                                 summary.files,
                                 summary.failed,
                                 summary.bytes,
                                 stats.expanded,
                                 stats.parse_errors,
                                 stats.skipped)
                  << std::endl;
        if (manifest.cancelled) {
            std::cerr << "CANCELLED" << std::endl;
            return EXIT_FAILURE;
        }
        if (summary.failed) {
            return EXIT_FAILURE;
        }
        std::cerr << "OK!" << std::endl;
        return EXIT_SUCCESS;
    }
};

int main(int argc, char** argv) {
    auto main = Main{};
    try {
        main.parse_args(argc, argv);
        return main.run();
    } catch (std::exception const& e) {
        std::cerr << e.what() << std::endl;
        for (auto const& error : error_stack()) {
            std::cerr << error << std::endl;
        }
        error_stack().clear();
        return EXIT_FAILURE;
    }
}
