// bloomdb_index: build per-file column indexes for a directory of CSV files.
//
//   bloomdb_index --input=DIR --output=DIR [--pattern=*.csv] [--error_rate=0.1]
//                 [--threshold=1000] [--delimiter=,]

#include <iostream>
#include <optional>
#include <string>
#include <string_view>

#include "bloomdb/indexer/directory_indexer.hpp"

using namespace bloomdb;

static std::optional<std::string> eat_arg(std::string_view a, std::string_view key) {
    if (a.rfind(key, 0) == 0) return std::string(a.substr(key.size()));
    return std::nullopt;
}

static void usage(const char* argv0) {
    std::cout << "Usage: " << argv0 << " --input=DIR --output=DIR [--pattern=*.csv]"
              << " [--error_rate=P] [--threshold=N] [--delimiter=C]" << std::endl;
}

int main(int argc, char** argv) {
    std::string input, output, pattern = "*.csv";
    index::BuildConfig build{};
    data::CsvOptions csv{};

    try {
        for (int i = 1; i < argc; ++i) {
            std::string a(argv[i]);
            if (a == "--help" || a == "-h") { usage(argv[0]); return 0; }
            else if (auto v = eat_arg(a, "--input=")) input = *v;
            else if (auto v = eat_arg(a, "--output=")) output = *v;
            else if (auto v = eat_arg(a, "--pattern=")) pattern = *v;
            else if (auto v = eat_arg(a, "--error_rate=")) build.error_rate = std::stod(*v);
            else if (auto v = eat_arg(a, "--threshold=")) build.range_filter_threshold = std::stoull(*v);
            else if (auto v = eat_arg(a, "--delimiter=")) { if (v->size() != 1) throw std::invalid_argument("delimiter must be one character"); csv.delimiter = (*v)[0]; }
            else { std::cerr << "unknown argument: " << a << std::endl; usage(argv[0]); return 2; }
        }
    } catch (const std::exception& e) {
        std::cerr << "invalid argument: " << e.what() << std::endl;
        return 2;
    }
    if (input.empty() || output.empty()) { usage(argv[0]); return 2; }

    auto builder = index::ColumnIndexBuilder::create(build);
    if (!builder) { std::cerr << core::describe(builder.error()) << std::endl; return 2; }
    const storage::IndexStore store{storage::IndexStore::options_from_env()};

    auto report = indexer::index_directory(input, pattern, output, *builder, store, csv);
    if (!report) { std::cerr << core::describe(report.error()) << std::endl; return 1; }

    for (const auto& f : report->files) {
        if (f.ok()) {
            std::cout << "ok     " << f.source << " -> " << f.index_location;
            if (!f.column_failures.empty()) std::cout << " (" << f.column_failures.size() << " column(s) skipped)";
            std::cout << "\n";
        } else {
            std::cout << "failed " << f.source << ": " << core::describe(*f.error) << "\n";
        }
    }
    std::cout << report->indexed() << " indexed, " << report->failed() << " failed" << std::endl;
    return report->failed() == 0 ? 0 : 1;
}
