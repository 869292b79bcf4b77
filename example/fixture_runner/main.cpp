// main.cpp
// Fixture runner - applies JSON patch fixture files and reports failures
//
// Usage: fixture_runner [--simplexml] [--no-diff] [--verbose] file.json...
//
// Exit code is 0 when every record of every file passes.

#include <treepatch/fixture.h>

#include <iostream>
#include <string>
#include <vector>

using namespace treepatch;

namespace {

void print_usage(const char* argv0)
{
    std::cerr << "usage: " << argv0 << " [--simplexml] [--no-diff] [--verbose] file.json...\n"
              << "  --simplexml  apply patches in compatibility mode (diff checks off)\n"
              << "  --no-diff    only run the patch checks\n"
              << "  --verbose    print a line per passing record\n";
}

} // anonymous namespace

int main(int argc, char** argv)
{
    FixtureOptions options;
    std::vector<std::string> files;

    for (int i = 1; i < argc; ++i) {
        const std::string arg = argv[i];
        if (arg == "--simplexml") {
            options.mode = Mode::SimpleXml;
        } else if (arg == "--no-diff") {
            options.run_diff = false;
        } else if (arg == "--verbose") {
            options.verbose = true;
        } else if (arg == "--help" || arg == "-h") {
            print_usage(argv[0]);
            return 0;
        } else if (arg.starts_with("--")) {
            std::cerr << "unknown option: " << arg << "\n";
            print_usage(argv[0]);
            return 2;
        } else {
            files.push_back(arg);
        }
    }

    if (files.empty()) {
        print_usage(argv[0]);
        return 2;
    }

    FixtureReport total;
    for (const auto& file : files) {
        auto report = run_fixture_file(file, options);

        for (const auto& note : report.notes) {
            std::cout << note << "\n";
        }
        for (const auto& failure : report.failures) {
            std::cout << failure.source << " #" << failure.record_index;
            if (!failure.comment.empty()) {
                std::cout << " (" << failure.comment << ")";
            }
            std::cout << ": " << failure.message << "\n\n";
        }
        std::cout << file << ": " << report.passed << " passed, " << report.failed << " failed, "
                  << report.skipped << " skipped\n";

        total.merge(report);
    }

    if (files.size() > 1) {
        std::cout << "total: " << total.passed << " passed, " << total.failed << " failed, "
                  << total.skipped << " skipped\n";
    }
    return total.ok() ? 0 : 1;
}
