#include "manifest.hpp"

using namespace dsum;

auto Manifest::summary() const noexcept -> Summary {
    auto result = Summary{};
    for (auto const& record : records) {
        if (record.ok()) {
            ++result.files;
            result.bytes += record.size;
        } else {
            ++result.failed;
        }
    }
    return result;
}

auto Manifest::failures() const -> std::vector<FileRecord const*> {
    auto result = std::vector<FileRecord const*>{};
    for (auto const& record : records) {
        if (!record.ok()) {
            result.push_back(&record);
        }
    }
    return result;
}

auto Manifest::csv_escape(std::string_view field) -> std::string {
    if (field.find_first_of(",\"\r\n") == std::string_view::npos) {
        return std::string(field);
    }
    auto result = std::string{"\""};
    for (auto c : field) {
        if (c == '"') {
            result.push_back('"');
        }
        result.push_back(c);
    }
    result.push_back('"');
    return result;
}

auto Manifest::dump_csv(bool header) const -> std::string {
    auto result = std::string{};
    if (header) {
        result += "path,sha256,error\n";
    }
    for (auto const& record : records) {
        result += fmt::format("{},{},{}\n", csv_escape(record.path), record.sha256, csv_escape(record.error));
    }
    return result;
}

auto Manifest::dump_format(std::string const& format) const -> std::string {
    auto result = std::string{};
    for (auto const& record : records) {
        dsum_trace("path: %s", record.path.c_str());
        fmt::dynamic_format_arg_store<fmt::format_context> store{};
        store.push_back(fmt::arg("path", record.path));
        store.push_back(fmt::arg("sha256", record.sha256));
        store.push_back(fmt::arg("error", record.error));
        store.push_back(fmt::arg("size", record.size));
        store.push_back(fmt::arg("url", record.url));
        result += fmt::vformat(format, store);
        result += '\n';
    }
    return result;
}

auto Manifest::Builder::add(FileRecord record) -> void {
    auto lock = std::lock_guard<std::mutex>(mutex_);
    records_.push_back(std::move(record));
}

auto Manifest::Builder::build(bool cancelled) -> Manifest {
    auto lock = std::lock_guard<std::mutex>(mutex_);
    auto result = Manifest{std::move(records_), cancelled};
    records_.clear();
    sort_by<&FileRecord::path, &FileRecord::url>(result.records.begin(), result.records.end());
    return result;
}
