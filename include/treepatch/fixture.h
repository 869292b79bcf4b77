// Copyright (c) 2024 chenmou. All rights reserved.
// Licensed under the MIT License. See LICENSE file in the project root.

/// @file fixture.h
/// @brief Data-driven test harness over JSON fixture records.
///
/// A fixture file is a JSON array of records:
///
///   {"comment": "...", "doc": ..., "patch": [...], "expected": ...}
///   {"comment": "...", "doc": ..., "patch": [...], "error": "..."}
///   {"comment": "section header only"}
///
/// - records without "doc" or "patch" pass (comments)
/// - records with a truthy "disabled" are skipped
/// - patch check: with "error" the patch must fail, with "expected" the
///   result must be considered equal to it
/// - diff check (Mode::Standard, records with "doc" and "expected" and no
///   "error"): diff(doc, expected) applied to doc gives expected, and
///   diff(expected, doc) applied to expected in reverse order gives doc

#pragma once

#include <treepatch/api.h>
#include <treepatch/resolver.h>
#include <treepatch/value.h>

#include <string>
#include <vector>

namespace treepatch {

struct FixtureOptions {
    Mode mode = Mode::Standard;
    bool run_diff = true;  // only honoured in Mode::Standard
    bool verbose = false;  // keep a note per passing record
};

struct FixtureFailure {
    std::string source;        // file name, or empty for in-memory records
    std::size_t record_index = 0;
    std::string comment;
    std::string message;
};

struct TREEPATCH_API FixtureReport {
    std::size_t passed = 0;
    std::size_t failed = 0;
    std::size_t skipped = 0;
    std::vector<FixtureFailure> failures;
    std::vector<std::string> notes;  // filled in verbose mode

    [[nodiscard]] bool ok() const noexcept { return failed == 0; }
    [[nodiscard]] std::size_t total() const noexcept { return passed + failed + skipped; }

    void merge(const FixtureReport& other);
};

/// Run every record of a fixture array
[[nodiscard]] TREEPATCH_API FixtureReport run_fixture_records(const Value& records,
                                                              const FixtureOptions& options = {},
                                                              const std::string& source = {});

/// Load a fixture file and run it; an unreadable or malformed file counts
/// as one failure
[[nodiscard]] TREEPATCH_API FixtureReport run_fixture_file(const std::string& path,
                                                           const FixtureOptions& options = {});

} // namespace treepatch
