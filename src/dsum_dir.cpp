#include <argparse.hpp>
#include <dsum/common.hpp>
#include <dsum/digest.hpp>
#include <dsum/iofile.hpp>
#include <dsum/manifest.hpp>
#include <iostream>
#include <regex>
#include <span>

using namespace dsum;

struct Main {
    struct CLI {
        std::vector<std::string> inputs = {};
        std::string output = {};
        std::string format = {};
        std::optional<std::regex> filter = {};
        std::size_t buffer = {};
        bool no_header = {};
        bool no_progress = {};
    } cli = {};

    auto parse_args(int argc, char** argv) -> void {
        argparse::ArgumentParser program(fs::path(argv[0]).filename().generic_string());
        program.add_description("Hashes local files into a manifest.");
        program.add_argument("input").help("Directories or files to hash.").remaining().required();
        program.add_argument("-o", "--output").help("Manifest file to write or - for stdout.").default_value(std::string("-"));
        program.add_argument("--format")
            .help("Format output lines instead of csv, named args: path, sha256, error, size, url.")
            .default_value(std::string{});
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
        program.add_argument("--buffer")
            .help("Read buffer size in killobytes [1, 65536].")
            .default_value(std::uint32_t{1024})
            .action([](std::string const& value) -> std::uint32_t {
                return std::clamp((std::uint32_t)std::stoul(value), 1u, 65536u);
            });
        program.add_argument("--no-header").help("Do not write the csv header line.").default_value(false).implicit_value(true);
        program.add_argument("--no-progress").help("Do not print progress.").default_value(false).implicit_value(true);

        program.parse_args(argc, argv);

        cli.inputs = program.get<std::vector<std::string>>("input");
        cli.output = program.get<std::string>("--output");
        cli.format = program.get<std::string>("--format");
        cli.filter = program.get<std::optional<std::regex>>("--filter-path");
        cli.buffer = program.get<std::uint32_t>("--buffer") * KiB;
        cli.no_header = program.get<bool>("--no-header");
        cli.no_progress = program.get<bool>("--no-progress");
    }

    auto run() -> void {
        auto builder = Manifest::Builder{};
        auto buffer = std::vector<char>(cli.buffer);
        for (auto const& input : cli.inputs) {
            dsum_trace("input: %s", input.c_str());
            auto root = fs::path(clean_path(dsum_rethrow(fs::absolute(input)).lexically_normal().generic_string()));
            auto parent = root.parent_path();
            std::cerr << "Collecting input ... " << root.generic_string() << std::endl;
            auto paths = collect_files({root.generic_string()}, {}, true);
            for (auto const& path : paths) {
                auto record = FileRecord{
                    .path = fs_relative(path, parent),
                    .url = path.generic_string(),
                };
                if (cli.filter && !std::regex_search(record.path, *cli.filter)) {
                    continue;
                }
                hash_file(record, path, buffer);
                builder.add(std::move(record));
            }
        }

        auto manifest = builder.build();
        auto text = cli.format.empty() ? manifest.dump_csv(!cli.no_header) : manifest.dump_format(cli.format);
        if (cli.output == "-") {
            std::cout << text << std::flush;
        } else {
            auto outfile = IO::File(cli.output, IO::WRITE | IO::TRUNCATE);
            dsum_assert(outfile.write(0, text));
        }
        auto const summary = manifest.summary();
        std::cerr << fmt::format("files: {}, bytes: {}", summary.files, summary.bytes) << std::endl;
    }

    auto hash_file(FileRecord& record, fs::path const& path, std::vector<char>& buffer) -> void {
        dsum_trace("path: %s", record.path.c_str());
        auto infile = IO::File(path, IO::READ);
        auto digest = Digest{};
        auto const total = infile.size();
        {
            auto p = progress_bar(record.path.c_str(), cli.no_progress, 0, total);
            for (std::size_t offset = 0; offset != total;) {
                auto const count = std::min(buffer.size(), total - offset);
                auto const chunk = std::span<char>(buffer.data(), count);
                dsum_assert(infile.read(offset, chunk));
                digest.update(chunk);
                offset += count;
                p.update(offset, total);
            }
        }
        record.sha256 = digest.hexdigest();
        record.size = digest.size();
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
