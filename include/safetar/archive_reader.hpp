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
#include <safetar/stream.hpp>
#include <safetar/archive_entry.hpp>
#include <safetar/header_parser.hpp>
#include <safetar/gnu_tar.hpp>
#include <safetar/pax_parser.hpp>
#include <expected>
#include <memory>
#include <optional>
#include <iterator>
#include <array>
#include <vector>

namespace safetar {

// Sequential reader over an uncompressed tar stream. Entry data is streamed
// straight from the source, so an entry is only readable until the next call
// to next_entry(). The reader must not be moved while entries are alive.
class archive_reader {
private:
    std::unique_ptr<input_stream> stream_;
    uint64_t current_entry_size_ = 0;
    uint64_t current_entry_data_remaining_ = 0;
    std::vector<std::byte> chunk_buffer_;
    bool finished_ = false;
    gnu::gnu_extension_data pending_gnu_extensions_;
    pax_records pending_pax_headers_;

    // Read exactly one 512-byte block
    [[nodiscard]] std::expected<std::array<std::byte, detail::BLOCK_SIZE>, error> read_block();

    // Skip padding to the next 512-byte boundary
    [[nodiscard]] std::expected<void, error> skip_padding(uint64_t data_size);

    // Skip remaining data from the current entry
    [[nodiscard]] std::expected<void, error> skip_current_entry_data();

    // Next chunk of the current entry's data
    [[nodiscard]] std::expected<std::span<const std::byte>, error> read_entry_data(size_t max_length);

    // Consume a GNU 'L'/'K' record or skip another GNU pseudo-entry
    [[nodiscard]] std::expected<bool, error> process_gnu_extension(const file_metadata& meta);

    // Consume a PAX 'x' record or skip a global 'g' record
    [[nodiscard]] std::expected<bool, error> process_pax_header(const file_metadata& meta);

public:
    explicit archive_reader(std::unique_ptr<input_stream> stream)
        : stream_(std::move(stream)) {}

    // Factory methods
    [[nodiscard]] static std::expected<archive_reader, error> from_file(const std::filesystem::path& path);
    [[nodiscard]] static std::expected<archive_reader, error> from_stream(std::unique_ptr<input_stream> stream);

    // Get next entry in archive, std::nullopt once the end marker is reached
    [[nodiscard]] std::expected<std::optional<archive_entry>, error> next_entry();

    // Iterator support; errors end the iteration and are reported by has_error()
    class iterator {
    private:
        archive_reader* reader_ = nullptr;
        std::optional<archive_entry> current_;
        std::optional<error> error_;

    public:
        using iterator_category = std::input_iterator_tag;
        using value_type = archive_entry;
        using difference_type = std::ptrdiff_t;
        using pointer = const archive_entry*;
        using reference = const archive_entry&;

        iterator() = default;
        explicit iterator(archive_reader* reader) : reader_(reader) {
            ++(*this);  // Load the first entry
        }

        [[nodiscard]] const archive_entry& operator*() const { return *current_; }
        [[nodiscard]] const archive_entry* operator->() const { return &*current_; }

        iterator& operator++() {
            if (reader_ && !error_) {
                if (auto result = reader_->next_entry(); result && *result) {
                    current_ = std::move(**result);
                } else {
                    if (!result) {
                        error_ = result.error();
                    }
                    reader_ = nullptr;
                    current_.reset();
                }
            }
            return *this;
        }

        [[nodiscard]] bool operator==(const iterator& other) const {
            return reader_ == other.reader_;
        }

        [[nodiscard]] bool has_error() const noexcept { return error_.has_value(); }
        [[nodiscard]] const std::optional<error>& last_error() const noexcept { return error_; }
    };

    [[nodiscard]] iterator begin() { return iterator{this}; }
    [[nodiscard]] iterator end() const { return {}; }

    // Check if archive processing is complete
    [[nodiscard]] bool finished() const noexcept { return finished_; }
};

} // namespace safetar
