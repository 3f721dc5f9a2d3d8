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

#include <safetar/walker.hpp>
#include <spdlog/spdlog.h>
#include <fnmatch.h>
#include <algorithm>
#include <chrono>
#include <fstream>

namespace safetar {

namespace {

struct walk_context {
    const std::filesystem::path& allowed_root;
    const exclude_set& excludes;
    const security_policy& policy;
    usage_tracker& usage;
    std::vector<planned_entry>& entries;
    // Canonical directories on the current descent, to stop symlink loops
    std::vector<std::filesystem::path> ancestors;
};

std::optional<uint64_t> to_unix_seconds(const std::filesystem::file_time_type time) {
    const auto since_epoch = std::chrono::file_clock::to_sys(time).time_since_epoch();
    const auto seconds = std::chrono::duration_cast<std::chrono::seconds>(since_epoch).count();
    if (seconds < 0) {
        return std::nullopt;
    }
    return static_cast<uint64_t>(seconds);
}

// Strip `root` from `path` component-wise
std::optional<std::filesystem::path> strip_root(const std::filesystem::path& path, const std::filesystem::path& root) {
    if (!path_starts_with(path, root)) {
        return std::nullopt;
    }
    auto it = path.begin();
    for (const auto& component : root) {
        if (!component.empty()) {
            ++it;
        }
    }
    std::filesystem::path rel;
    for (; it != path.end(); ++it) {
        rel /= *it;
    }
    return rel;
}

std::expected<std::vector<std::filesystem::path>, error> sorted_children(const std::filesystem::path& dir) {
    std::error_code ec;
    std::filesystem::directory_iterator it{dir, ec};
    if (ec) {
        return std::unexpected(io_failure("failed to read directory " + dir.string(), ec));
    }

    std::vector<std::filesystem::path> children;
    for (const std::filesystem::directory_iterator end; it != end; it.increment(ec)) {
        children.push_back(it->path());
    }
    if (ec) {
        return std::unexpected(io_failure("failed to read directory " + dir.string(), ec));
    }

    std::ranges::sort(children);
    return children;
}

std::expected<void, error> visit(walk_context& ctx, const std::filesystem::path& abs_path) {
    auto rel = strip_root(abs_path, ctx.allowed_root);
    if (!rel) {
        return std::unexpected(error{error_code::user_input,
            "input " + abs_path.string() + " escapes base " + ctx.allowed_root.string()});
    }
    const auto rel_text = rel->generic_string();
    if (!is_valid_utf8(rel_text)) {
        return std::unexpected(error{error_code::user_input,
            "path not valid UTF-8: " + abs_path.string()});
    }

    // Excluded directories are pruned along with everything below them
    if (!rel->empty() && ctx.excludes.matches(rel_text)) {
        spdlog::debug("excluding {}", rel_text);
        return {};
    }

    std::error_code ec;
    const auto status = ctx.policy.follow_symlinks()
        ? std::filesystem::status(abs_path, ec)
        : std::filesystem::symlink_status(abs_path, ec);
    if (ec) {
        return std::unexpected(io_failure("failed to stat " + abs_path.string(), ec));
    }

    planned_entry entry;
    if (std::filesystem::is_regular_file(status)) {
        entry.kind = manifest_kind::file;
        entry.size = std::filesystem::file_size(abs_path, ec);
        if (ec) {
            return std::unexpected(io_failure("failed to stat " + abs_path.string(), ec));
        }
        constexpr auto exec_bits = std::filesystem::perms::owner_exec |
                                   std::filesystem::perms::group_exec |
                                   std::filesystem::perms::others_exec;
        entry.executable = (status.permissions() & exec_bits) != std::filesystem::perms::none;
    } else if (std::filesystem::is_directory(status)) {
        entry.kind = manifest_kind::directory;
    } else if (std::filesystem::is_symlink(status)) {
        entry.kind = manifest_kind::symlink;
    } else {
        spdlog::debug("skipping special file {}", abs_path.string());
        return {};
    }

    if (entry.kind != manifest_kind::symlink) {
        if (const auto modified = std::filesystem::last_write_time(abs_path, ec); !ec) {
            entry.mtime = to_unix_seconds(modified);
        }
    }

    if (entry.kind == manifest_kind::symlink) {
        auto target = std::filesystem::read_symlink(abs_path, ec);
        if (ec) {
            return std::unexpected(io_failure("failed to read symlink " + abs_path.string(), ec));
        }
        if (!is_valid_utf8(target.native())) {
            return std::unexpected(error{error_code::user_input,
                "symlink target not UTF-8: " + abs_path.string()});
        }

        // Confine the target at creation time too
        const auto resolved = target.is_absolute() ? target : abs_path.parent_path() / target;
        if (auto confined = ctx.policy.enforce_link_policy(resolved, ctx.allowed_root, link_kind::symlink); !confined) {
            return std::unexpected(confined.error());
        }
        entry.link_target = target.string();
    }

    // The input directory itself is the root and is not stored
    if (!rel->empty()) {
        auto validated = ctx.policy.normalize_and_validate(std::string_view{rel_text}, ctx.allowed_root);
        if (!validated) {
            return std::unexpected(validated.error());
        }
        if (auto observed = ctx.usage.observe(*validated, entry.size); !observed) {
            return std::unexpected(observed.error());
        }

        spdlog::debug("planned {} ({})", rel_text, entry.kind_label());
        entry.absolute = validated->abs();
        entry.relative = *rel;
        ctx.entries.push_back(entry);
    }

    if (entry.kind != manifest_kind::directory) {
        return {};
    }

    auto canonical = std::filesystem::canonical(abs_path, ec);
    if (ec) {
        return std::unexpected(io_failure("failed to resolve " + abs_path.string(), ec));
    }
    if (std::ranges::find(ctx.ancestors, canonical) != ctx.ancestors.end()) {
        return std::unexpected(error{error_code::io_error,
            "filesystem loop detected at " + abs_path.string()});
    }

    auto children = sorted_children(abs_path);
    if (!children) {
        return std::unexpected(children.error());
    }

    ctx.ancestors.push_back(std::move(canonical));
    for (const auto& child : *children) {
        if (auto visited = visit(ctx, child); !visited) {
            return visited;
        }
    }
    ctx.ancestors.pop_back();
    return {};
}

} // anonymous namespace

std::string_view planned_entry::kind_label() const noexcept {
    switch (kind) {
        case manifest_kind::file: return "file";
        case manifest_kind::directory: return "dir";
        case manifest_kind::symlink: return "symlink";
    }
    return "file";
}

manifest_item planned_entry::to_manifest_item() const {
    return manifest_item{relative, absolute, kind, link_target, size, mtime};
}

auto exclude_set::add(std::string pattern) -> std::expected<void, error> {
    if (pattern.empty()) {
        return std::unexpected(error{error_code::user_input, "empty exclude pattern"});
    }

    // fnmatch treats an unterminated class as a literal; reject it instead
    for (size_t i = 0; i < pattern.size(); ++i) {
        if (pattern[i] == '\\') {
            ++i;
        } else if (pattern[i] == '[') {
            const auto close = pattern.find(']', i + 2);
            if (close == std::string::npos) {
                return std::unexpected(error{error_code::user_input,
                    "invalid exclude pattern: " + pattern});
            }
            i = close;
        }
    }

    patterns_.push_back(std::move(pattern));
    return {};
}

bool exclude_set::matches(std::string_view relative) const {
    const std::string subject{relative};
    return std::ranges::any_of(patterns_, [&subject](const std::string& pattern) {
        return ::fnmatch(pattern.c_str(), subject.c_str(), 0) == 0;
    });
}

auto compile_excludes(
    std::span<const std::string> patterns,
    std::span<const std::filesystem::path> pattern_files
) -> std::expected<exclude_set, error> {
    exclude_set excludes;
    for (const auto& pattern : patterns) {
        if (auto added = excludes.add(pattern); !added) {
            return std::unexpected(added.error());
        }
    }

    for (const auto& file : pattern_files) {
        std::error_code ec;
        if (!std::filesystem::exists(file, ec)) {
            spdlog::debug("exclude file {} not found, skipping", file.string());
            continue;
        }

        std::ifstream in{file};
        if (!in) {
            return std::unexpected(error{error_code::io_error,
                "failed to read exclude file " + file.string()});
        }

        std::string line;
        while (std::getline(in, line)) {
            const auto first = line.find_first_not_of(" \t\r");
            if (first == std::string::npos) {
                continue;
            }
            const auto last = line.find_last_not_of(" \t\r");
            auto trimmed = line.substr(first, last - first + 1);
            if (trimmed.starts_with('#')) {
                continue;
            }
            if (auto added = excludes.add(std::move(trimmed)); !added) {
                return std::unexpected(added.error().with_context(file.string()));
            }
        }
    }

    return excludes;
}

auto walk_input(
    const std::filesystem::path &base,
    const std::filesystem::path &input,
    const exclude_set &excludes,
    const security_policy &policy,
    usage_tracker &usage,
    std::vector<planned_entry> &entries
) -> std::expected<void, error> {
    std::error_code ec;
    const bool is_directory = std::filesystem::is_directory(input, ec);
    if (ec) {
        return std::unexpected(io_failure("failed to stat input " + input.string(), ec));
    }

    // Directory inputs are trimmed to themselves, file inputs to the base
    const auto& allowed_root = is_directory ? input : base;
    walk_context ctx{allowed_root, excludes, policy, usage, entries, {}};
    return visit(ctx, input);
}

} // namespace safetar
