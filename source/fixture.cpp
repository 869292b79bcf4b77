// fixture.cpp - Fixture record runner

#include <treepatch/fixture.h>
#include <treepatch/equality.h>
#include <treepatch/patch.h>
#include <treepatch/serialization.h>
#include <treepatch/value_diff.h>
#include <treepatch/value_shape.h>

#include <fstream>
#include <optional>
#include <sstream>

namespace treepatch {

namespace {

/// Member present and not null
const Value* field(const Value& record, const char* name)
{
    const Value* found = find_child(record, name);
    return (found && !found->is_null()) ? found : nullptr;
}

/// One-line record summary used in failure messages
std::string describe(const Value& record)
{
    std::string out = "{ ";
    bool first = true;
    for (const char* key : {"comment", "doc", "patch", "expected", "error"}) {
        if (const Value* v = find_child(record, key)) {
            if (!first) out += ", ";
            first = false;
            out += "\"" + std::string{key} + "\": " + to_json(*v, true);
        }
    }
    return out + " }";
}

/// Empty when the patch check passes, otherwise the failure text
std::optional<std::string> check_patch(const Value& record, Mode mode)
{
    const Value& doc = *field(record, "doc");
    const Value& patch_value = *field(record, "patch");
    const Value* expected = field(record, "expected");
    const Value* error = field(record, "error");

    auto result = patch(doc, patch_value, mode);

    if (error) {
        if (result) {
            return "expected error didn't occur: " + describe(record) +
                   "\n  found: " + to_json(result.value, true);
        }
        return std::nullopt;
    }
    if (!result) {
        return "failed with error [" + std::string{error_code_name(result.error_code)} + "] " +
               result.error_message + ": " + describe(record);
    }
    if (expected && !considered_equal(result.value, *expected)) {
        return "unexpected result: " + describe(record) + "\n  found: " + to_json(result.value, true);
    }
    return std::nullopt;
}

std::optional<std::string> check_diff_direction(const Value& from, const Value& to, bool reverse, const char* label)
{
    auto ops = diff(from, to);
    if (reverse) {
        ops = reverse_operations(std::move(ops));
    }
    auto result = patch(from, ops);
    if (result && considered_equal(result.value, to)) {
        return std::nullopt;
    }

    std::string message = std::string{label} + " failed:\n  from:     " + to_json(from, true) +
                          "\n  diff:     " + to_json(operations_to_value(ops), true);
    if (result) {
        message += "\n  found:    " + to_json(result.value, true);
    } else {
        message += "\n  error:    " + result.error_message;
    }
    message += "\n  expected: " + to_json(to, true);
    return message;
}

std::optional<std::string> check_diff(const Value& record)
{
    const Value& doc = *field(record, "doc");
    const Value& expected = *field(record, "expected");

    auto forward = check_diff_direction(doc, expected, false, "diff test");
    auto backward = check_diff_direction(expected, doc, true, "reverse diff test");
    if (forward && backward) {
        return *forward + "\n" + *backward;
    }
    return forward ? forward : backward;
}

} // anonymous namespace

void FixtureReport::merge(const FixtureReport& other)
{
    passed += other.passed;
    failed += other.failed;
    skipped += other.skipped;
    failures.insert(failures.end(), other.failures.begin(), other.failures.end());
    notes.insert(notes.end(), other.notes.begin(), other.notes.end());
}

FixtureReport run_fixture_records(const Value& records, const FixtureOptions& options, const std::string& source)
{
    FixtureReport report;
    const auto list = as_sequence(records);

    for (std::size_t i = 0; i < list.size(); ++i) {
        const Value& record = list[i].get();
        const std::string comment = find_child(record, "comment") ? record.at("comment").as_string() : "";

        if (const Value* disabled = find_child(record, "disabled"); disabled && !is_falsy(*disabled)) {
            ++report.skipped;
            continue;
        }

        // Comment-only records
        if (!field(record, "doc") || !field(record, "patch")) {
            ++report.passed;
            continue;
        }

        std::vector<std::string> problems;
        if (auto problem = check_patch(record, options.mode)) {
            problems.push_back(std::move(*problem));
        }
        if (options.run_diff && options.mode == Mode::Standard &&
            field(record, "expected") && !field(record, "error")) {
            if (auto problem = check_diff(record)) {
                problems.push_back(std::move(*problem));
            }
        }

        if (problems.empty()) {
            ++report.passed;
            if (options.verbose && !comment.empty()) {
                report.notes.push_back("OK: " + comment);
            }
            continue;
        }

        ++report.failed;
        for (auto& problem : problems) {
            report.failures.push_back(FixtureFailure{source, i, comment, std::move(problem)});
        }
    }
    return report;
}

FixtureReport run_fixture_file(const std::string& path, const FixtureOptions& options)
{
    auto file_failure = [&](std::string message) {
        FixtureReport report;
        report.failed = 1;
        report.failures.push_back(FixtureFailure{path, 0, {}, std::move(message)});
        return report;
    };

    std::ifstream in(path, std::ios::binary);
    if (!in) {
        return file_failure("couldn't open fixture file " + path);
    }
    std::stringstream buffer;
    buffer << in.rdbuf();

    std::string error;
    Value records = from_json(buffer.str(), &error);
    if (!error.empty()) {
        return file_failure("error decoding fixture file " + path + ": " + error);
    }
    if (!is_collection(records)) {
        return file_failure("fixture file " + path + " is not an array of records");
    }
    return run_fixture_records(records, options, path);
}

} // namespace treepatch
