/*
 * Copyright 2025 TierOne Software
 *
 * Licensed under the Apache License, Version 2.0 (the "License");
 * you may not use this file except in compliance with the License.
 * You may obtain a copy of the License at
 *
 *     http://www.apache.org/licenses/LICENSE-2.0
 *
 * Unless required by applicable law or agreed to in writing, software
 * distributed under the License is distributed on an "AS IS" BASIS,
 * WITHOUT WARRANTIES OR CONDITIONS OF ANY KIND, either express or implied.
 * See the License for the specific language governing permissions and
 * limitations under the License.
 */

#pragma once

#include <safetar/error.hpp>
#include <safetar/manifest.hpp>
#include <safetar/policy.hpp>
#include <expected>
#include <filesystem>
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <vector>

namespace safetar {

// One filesystem object accepted for archiving
struct planned_entry {
    std::filesystem::path absolute;
    std::filesystem::path relative;
    manifest_kind kind = manifest_kind::file;
    uint64_t size = 0;
    std::optional<std::string> link_target;
    std::optional<uint64_t> mtime;
    bool executable = false;

    // "file", "dir" or "symlink"
    [[nodiscard]] std::string_view kind_label() const noexcept;
    [[nodiscard]] manifest_item to_manifest_item() const;
};

// Shell-style exclude globs matched against archive-relative paths.
// `*` and `?` also match '/', so "*.log" excludes logs at any depth.
class exclude_set {
public:
    [[nodiscard]] std::expected<void, error> add(std::string pattern);
    [[nodiscard]] bool matches(std::string_view relative) const;

    [[nodiscard]] bool empty() const noexcept { return patterns_.empty(); }
    [[nodiscard]] size_t size() const noexcept { return patterns_.size(); }

private:
    std::vector<std::string> patterns_;
};

// Build the exclude set from literal patterns plus pattern files (one glob
// per line, blank lines and '#' comments ignored). Missing files are skipped.
[[nodiscard]] std::expected<exclude_set, error> compile_excludes(
    std::span<const std::string> patterns,
    std::span<const std::filesystem::path> pattern_files
);

// Walk one canonical input below `base`, appending accepted entries in
// depth-first order (children sorted by name). A directory input is its own
// root: its descendants are stored relative to it and the input itself is
// not stored. Any policy violation aborts the walk.
[[nodiscard]] std::expected<void, error> walk_input(
    const std::filesystem::path& base,
    const std::filesystem::path& input,
    const exclude_set& excludes,
    const security_policy& policy,
    usage_tracker& usage,
    std::vector<planned_entry>& entries
);

} // namespace safetar
