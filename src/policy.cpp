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

#include <safetar/policy.hpp>
#include <algorithm>
#include <format>
#include <limits>
#include <vector>

namespace safetar {

namespace {

uint64_t saturating_add(const uint64_t lhs, const uint64_t rhs) noexcept {
    return lhs > std::numeric_limits<uint64_t>::max() - rhs
        ? std::numeric_limits<uint64_t>::max()
        : lhs + rhs;
}

bool has_parent_component(const std::filesystem::path& path) {
    for (const auto& component : path) {
        if (component == "..") {
            return true;
        }
    }
    return false;
}

// Number of normal components; a ".." here means validation was bypassed
std::expected<uint32_t, error> depth_of(const std::filesystem::path& rel) {
    uint32_t depth = 0;
    for (const auto& component : rel) {
        if (component == "..") {
            return std::unexpected(error{error_code::parent_traversal,
                "path contains parent traversal: " + rel.string()});
        }
        if (component.empty() || component == "." || component == "/") {
            continue;
        }
        if (depth == std::numeric_limits<uint32_t>::max()) {
            return std::unexpected(error{error_code::depth_exceeded,
                "directory depth overflow for " + rel.string()});
        }
        ++depth;
    }
    return depth;
}

} // anonymous namespace

std::filesystem::path lexical_clean(const std::filesystem::path& path) {
    std::vector<std::filesystem::path> parts;
    const bool absolute = path.has_root_directory();

    for (const auto& component : path.relative_path()) {
        if (component.empty() || component == ".") {
            continue;
        }
        if (component == "..") {
            if (!parts.empty() && parts.back() != "..") {
                parts.pop_back();
            } else if (!absolute) {
                parts.push_back(component);
            }
            continue;
        }
        parts.push_back(component);
    }

    std::filesystem::path cleaned = absolute ? path.root_path() : std::filesystem::path{};
    for (const auto& part : parts) {
        cleaned /= part;
    }
    if (cleaned.empty()) {
        return ".";
    }
    return cleaned;
}

bool path_starts_with(const std::filesystem::path& path, const std::filesystem::path& prefix) {
    auto it = path.begin();
    for (const auto& component : prefix) {
        // Trailing separators show up as an empty final component
        if (component.empty()) {
            continue;
        }
        if (it == path.end() || *it != component) {
            return false;
        }
        ++it;
    }
    return true;
}

bool is_valid_utf8(std::string_view text) noexcept {
    size_t i = 0;
    while (i < text.size()) {
        const auto lead = static_cast<unsigned char>(text[i]);
        size_t length = 0;
        uint32_t code_point = 0;

        if (lead < 0x80) {
            ++i;
            continue;
        } else if ((lead & 0xE0) == 0xC0) {
            length = 2;
            code_point = lead & 0x1F;
        } else if ((lead & 0xF0) == 0xE0) {
            length = 3;
            code_point = lead & 0x0F;
        } else if ((lead & 0xF8) == 0xF0) {
            length = 4;
            code_point = lead & 0x07;
        } else {
            return false;
        }

        if (i + length > text.size()) {
            return false;
        }
        for (size_t k = 1; k < length; ++k) {
            const auto next = static_cast<unsigned char>(text[i + k]);
            if ((next & 0xC0) != 0x80) {
                return false;
            }
            code_point = (code_point << 6) | (next & 0x3F);
        }

        // Overlong forms, surrogates, and values past U+10FFFF
        if ((length == 2 && code_point < 0x80) ||
            (length == 3 && code_point < 0x800) ||
            (length == 4 && code_point < 0x10000) ||
            (code_point >= 0xD800 && code_point <= 0xDFFF) ||
            code_point > 0x10FFFF) {
            return false;
        }
        i += length;
    }
    return true;
}

security_policy security_policy::with_limits(const policy_limits& limits) const {
    auto copy = *this;
    copy.limits_ = limits;
    return copy;
}

security_policy security_policy::with_max_files(std::optional<uint64_t> value) const {
    auto copy = *this;
    if (value) copy.limits_.max_files = *value;
    return copy;
}

security_policy security_policy::with_max_total_bytes(std::optional<uint64_t> value) const {
    auto copy = *this;
    if (value) copy.limits_.max_total_bytes = *value;
    return copy;
}

security_policy security_policy::with_max_single_file(std::optional<uint64_t> value) const {
    auto copy = *this;
    if (value) copy.limits_.max_single_file = *value;
    return copy;
}

security_policy security_policy::with_max_depth(std::optional<uint32_t> value) const {
    auto copy = *this;
    if (value) copy.limits_.max_depth = *value;
    return copy;
}

security_policy security_policy::with_allow_absolute(const bool allow) const {
    auto copy = *this;
    copy.allow_absolute_ = allow;
    return copy;
}

security_policy security_policy::with_allow_parent_components(const bool allow) const {
    auto copy = *this;
    copy.allow_parent_components_ = allow;
    return copy;
}

security_policy security_policy::with_follow_symlinks(const bool follow) const {
    auto copy = *this;
    copy.follow_symlinks_ = follow;
    return copy;
}

security_policy security_policy::with_allow_symlink_outside_root(const bool allow) const {
    auto copy = *this;
    copy.allow_symlink_outside_root_ = allow;
    return copy;
}

security_policy security_policy::with_allow_hardlink_outside_root(const bool allow) const {
    auto copy = *this;
    copy.allow_hardlink_outside_root_ = allow;
    return copy;
}

auto security_policy::normalize_and_validate(
    const std::string_view path,
    const std::filesystem::path &root
) const -> std::expected<validated_path, error> {
    if (path.empty()) {
        return std::unexpected(error{error_code::empty_path, "path is empty"});
    }

    if (!is_valid_utf8(path)) {
        return std::unexpected(error{error_code::invalid_utf8_path, "path contains invalid UTF-8"});
    }

    const std::filesystem::path raw{path};
    if (raw.is_absolute() && !allow_absolute_) {
        return std::unexpected(error{error_code::absolute_path,
            std::format("absolute path rejected: {}", path)});
    }

    // Reject ".." before cleaning, even when it would cancel out
    if (!allow_parent_components_ && has_parent_component(raw)) {
        return std::unexpected(error{error_code::parent_traversal,
            std::format("path contains parent traversal: {}", path)});
    }

    const auto clean_root = lexical_clean(root);
    const auto cleaned = lexical_clean(raw.is_absolute() ? raw : clean_root / raw);

    if (!allow_parent_components_ && has_parent_component(cleaned)) {
        return std::unexpected(error{error_code::parent_traversal,
            "path contains parent traversal: " + cleaned.string()});
    }

    if (!path_starts_with(cleaned, clean_root)) {
        return std::unexpected(error{error_code::root_escape,
            "path escapes archive root: " + cleaned.string()});
    }

    // Strip the root components to get the relative part
    std::filesystem::path rel;
    auto it = cleaned.begin();
    for (const auto& component : clean_root) {
        if (!component.empty()) {
            ++it;
        }
    }
    for (; it != cleaned.end(); ++it) {
        rel /= *it;
    }

    return validated_path{std::move(rel), cleaned};
}

auto security_policy::enforce_link_policy(
    const std::filesystem::path &target,
    const std::filesystem::path &root,
    const link_kind kind
) const -> std::expected<void, error> {
    if (allows_outside_root(kind)) {
        return {};
    }

    const auto outside = [&target] {
        return std::unexpected(error{error_code::link_outside_root,
            "link target escapes root: " + target.string()});
    };

    if (target.is_absolute()) {
        if (path_starts_with(lexical_clean(target), lexical_clean(root))) {
            return {};
        }
        return outside();
    }

    // Any normalization failure is reported as an escaping link
    auto normalized = normalize_and_validate(target, root);
    if (!normalized) {
        return outside();
    }
    return {};
}

usage_tracker security_policy::usage() const {
    return usage_tracker{limits_};
}

auto usage_tracker::observe(const validated_path &path, const uint64_t size) -> std::expected<void, error> {
    if (size > limits_.max_single_file) {
        return std::unexpected(error{error_code::single_file_too_large,
            std::format("single file too large for {} (limit {}, actual {})",
                        path.rel().string(), limits_.max_single_file, size)});
    }

    auto depth = depth_of(path.rel());
    if (!depth) {
        return std::unexpected(depth.error());
    }
    if (*depth > limits_.max_depth) {
        return std::unexpected(error{error_code::depth_exceeded,
            std::format("directory depth exceeded for {} (limit {}, actual {})",
                        path.rel().string(), limits_.max_depth, *depth)});
    }

    const uint64_t files = saturating_add(files_seen_, 1);
    if (files > limits_.max_files) {
        return std::unexpected(error{error_code::file_count_exceeded,
            std::format("file count exceeded (limit {}, actual {})", limits_.max_files, files)});
    }

    const uint64_t bytes = saturating_add(total_bytes_, size);
    if (bytes > limits_.max_total_bytes) {
        return std::unexpected(error{error_code::total_bytes_exceeded,
            std::format("total bytes exceeded (limit {}, actual {})", limits_.max_total_bytes, bytes)});
    }

    files_seen_ = files;
    total_bytes_ = bytes;
    max_depth_observed_ = std::max(max_depth_observed_, *depth);
    return {};
}

} // namespace safetar
