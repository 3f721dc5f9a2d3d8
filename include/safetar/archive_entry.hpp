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
#include <safetar/metadata.hpp>
#include <safetar/stream.hpp>
#include <expected>
#include <span>
#include <functional>
#include <filesystem>
#include <concepts>
#include <type_traits>

namespace safetar {

// Returns the next chunk of entry data (at most `max_length` bytes);
// an empty span means the entry data is exhausted
using data_reader_fn = std::function<std::expected<std::span<const std::byte>, error>(size_t max_length)>;

inline constexpr size_t default_chunk_size = 64 * 1024;

class archive_entry {
private:
    file_metadata metadata_;
    data_reader_fn reader_;

public:
    archive_entry(file_metadata metadata, data_reader_fn reader)
        : metadata_(std::move(metadata)), reader_(std::move(reader)) {}

    // Metadata accessors
    [[nodiscard]] const std::string& path() const noexcept { return metadata_.path; }
    [[nodiscard]] entry_type type() const noexcept { return metadata_.type; }
    [[nodiscard]] std::filesystem::perms permissions() const noexcept { return metadata_.permissions; }
    [[nodiscard]] uint32_t owner_id() const noexcept { return metadata_.owner_id; }
    [[nodiscard]] uint32_t group_id() const noexcept { return metadata_.group_id; }
    [[nodiscard]] uint64_t size() const noexcept { return metadata_.size; }
    [[nodiscard]] const std::chrono::system_clock::time_point& modification_time() const noexcept {
        return metadata_.modification_time;
    }
    [[nodiscard]] const std::optional<std::string>& link_target() const noexcept { return metadata_.link_target; }
    [[nodiscard]] const pax_records& pax() const noexcept { return metadata_.pax; }

    // Type checking convenience methods
    [[nodiscard]] bool is_regular_file() const noexcept { return metadata_.is_regular_file(); }
    [[nodiscard]] bool is_directory() const noexcept { return metadata_.is_directory(); }
    [[nodiscard]] bool is_symbolic_link() const noexcept { return metadata_.is_symbolic_link(); }
    [[nodiscard]] bool is_hard_link() const noexcept { return metadata_.is_hard_link(); }

    // Data access; entries are streamed, so data can be read once, front to back
    [[nodiscard]] auto read_data(size_t max_length = default_chunk_size) const
        -> std::expected<std::span<const std::byte>, error> {
        return reader_(max_length);
    }

    // Feed every remaining data chunk to `sink`, returns the byte count
    template<std::invocable<std::span<const std::byte>> Sink>
    [[nodiscard]] auto for_each_chunk(Sink&& sink) const -> std::expected<uint64_t, error> {
        uint64_t total = 0;
        while (true) {
            auto chunk = read_data();
            if (!chunk) {
                return std::unexpected(chunk.error());
            }
            if (chunk->empty()) {
                return total;
            }
            if constexpr (std::same_as<std::invoke_result_t<Sink, std::span<const std::byte>>, std::expected<void, error>>) {
                if (auto sunk = sink(*chunk); !sunk) {
                    return std::unexpected(sunk.error());
                }
            } else {
                sink(*chunk);
            }
            total += chunk->size();
        }
    }

    // Materialize the entry at `dest_path`. Directories and symlinks are
    // created as such; every other type is written as a regular file. The
    // caller is responsible for validating `dest_path` and the link target.
    [[nodiscard]] std::expected<void, error> extract_to_path(const std::filesystem::path& dest_path) const;

    // Get full metadata
    [[nodiscard]] const file_metadata& metadata() const noexcept { return metadata_; }
};

} // namespace safetar
