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

#include <safetar/archive_entry.hpp>
#include <fstream>
#include <filesystem>

namespace safetar {

namespace {

// Never write through a symlink left at the destination, and let a new
// link replace a stale file
std::expected<void, error> clear_destination(const std::filesystem::path& dest_path) {
    std::error_code ec;
    const auto status = std::filesystem::symlink_status(dest_path, ec);
    if (ec || !std::filesystem::exists(status)) {
        return {};
    }
    if (std::filesystem::is_directory(status)) {
        return std::unexpected(error{error_code::io_error,
            "Refusing to replace directory " + dest_path.string()});
    }
    std::filesystem::remove(dest_path, ec);
    if (ec) {
        return std::unexpected(io_failure("failed to replace " + dest_path.string(), ec));
    }
    return {};
}

} // anonymous namespace

auto archive_entry::extract_to_path(const std::filesystem::path &dest_path) const -> std::expected<void, error> {
    std::error_code ec;
    std::filesystem::create_directories(dest_path.parent_path(), ec);
    if (ec) {
        return std::unexpected(io_failure("failed to create parent " + dest_path.parent_path().string(), ec));
    }

    switch (type()) {
        case entry_type::directory: {
            std::filesystem::create_directories(dest_path, ec);
            if (ec) {
                return std::unexpected(io_failure("failed to create directory " + dest_path.string(), ec));
            }
            // Keep extracted directories writable for the entries that follow
            std::filesystem::permissions(dest_path, permissions() | std::filesystem::perms::owner_all, ec);
            return {};
        }

        case entry_type::symbolic_link: {
            if (!link_target()) {
                return std::unexpected(error{error_code::invalid_operation,
                    "Symbolic link has no target: " + path()});
            }
            if (auto cleared = clear_destination(dest_path); !cleared) {
                return cleared;
            }
            std::filesystem::create_symlink(*link_target(), dest_path, ec);
            if (ec) {
                return std::unexpected(io_failure("failed to create symbolic link " + dest_path.string(), ec));
            }
            return {};
        }

        default:
            break;
    }

    if (auto cleared = clear_destination(dest_path); !cleared) {
        return cleared;
    }

    std::ofstream file{dest_path, std::ios::binary | std::ios::trunc};
    if (!file) {
        return std::unexpected(error{error_code::io_error,
            "Failed to create output file: " + dest_path.string()});
    }

    auto written = for_each_chunk([&file](std::span<const std::byte> chunk) {
        file.write(reinterpret_cast<const char*>(chunk.data()),
                   static_cast<std::streamsize>(chunk.size()));
    });
    if (!written) {
        return std::unexpected(written.error());
    }

    file.close();
    if (!file) {
        return std::unexpected(error{error_code::io_error,
            "Failed to write file data: " + dest_path.string()});
    }

    // Set file permissions (best effort)
    std::filesystem::permissions(dest_path, permissions(), ec);

    return {};
}

} // namespace safetar
