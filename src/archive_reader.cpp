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

#include <safetar/archive_reader.hpp>
#include <spdlog/spdlog.h>
#include <algorithm>

namespace safetar {

namespace {

// PAX records only carry names and small numbers
constexpr uint64_t max_pax_header_size = 1024 * 1024;

} // anonymous namespace

auto archive_reader::from_file(const std::filesystem::path &path) -> std::expected<archive_reader, error> {
    auto stream = file_stream::open(path);
    if (!stream) {
        return std::unexpected(stream.error());
    }

    return archive_reader{std::make_unique<file_stream>(std::move(*stream))};
}

auto archive_reader::from_stream(std::unique_ptr<input_stream> stream) -> std::expected<archive_reader, error> {
    if (!stream) {
        return std::unexpected(error{error_code::invalid_operation, "Null stream provided"});
    }

    return archive_reader{std::move(stream)};
}

auto archive_reader::read_block() -> std::expected<std::array<std::byte, detail::BLOCK_SIZE>, error> {
    std::array<std::byte, detail::BLOCK_SIZE> block{};
    auto result = read_fully(*stream_, block);
    if (!result) {
        return std::unexpected(result.error());
    }

    if (*result != detail::BLOCK_SIZE) {
        if (*result == 0) {
            return std::unexpected(error{error_code::end_of_archive, "Unexpected end of archive"});
        }
        return std::unexpected(error{error_code::corrupt_archive, "Incomplete block read"});
    }

    return block;
}

auto archive_reader::skip_padding(const uint64_t data_size) -> std::expected<void, error> {
    if (const size_t padding = detail::padding_for(data_size); padding > 0) {
        return stream_->skip(padding);
    }
    return {};
}

auto archive_reader::skip_current_entry_data() -> std::expected<void, error> {
    while (current_entry_data_remaining_ > 0) {
        const auto step = static_cast<size_t>(
            std::min<uint64_t>(current_entry_data_remaining_, 1ULL << 30));
        if (auto skip_result = stream_->skip(step); !skip_result) {
            return std::unexpected(skip_result.error());
        }
        current_entry_data_remaining_ -= step;
    }

    // Padding follows the data even when the caller consumed all of it
    if (current_entry_size_ > 0) {
        if (auto padding_result = skip_padding(current_entry_size_); !padding_result) {
            return std::unexpected(padding_result.error());
        }
    }

    current_entry_size_ = 0;
    return {};
}

auto archive_reader::read_entry_data(const size_t max_length) -> std::expected<std::span<const std::byte>, error> {
    const auto to_read = static_cast<size_t>(
        std::min<uint64_t>(max_length, current_entry_data_remaining_));
    if (to_read == 0) {
        return std::span<const std::byte>{};
    }

    chunk_buffer_.resize(to_read);
    auto result = read_fully(*stream_, std::span{chunk_buffer_.data(), to_read});
    if (!result) {
        return std::unexpected(result.error());
    }
    if (*result != to_read) {
        return std::unexpected(error{error_code::corrupt_archive, "Unexpected end of entry data"});
    }

    current_entry_data_remaining_ -= *result;
    return std::span<const std::byte>{chunk_buffer_.data(), *result};
}

auto archive_reader::next_entry() -> std::expected<std::optional<archive_entry>, error> {
    if (finished_) {
        return std::nullopt;
    }

    // Extension records loop here instead of recursing, a hostile archive
    // may chain any number of them
    while (true) {
        // Skip any remaining data from the previous entry
        if (auto skip_result = skip_current_entry_data(); !skip_result) {
            return std::unexpected(skip_result.error());
        }

        auto block_result = read_block();
        if (!block_result) {
            if (block_result.error().code() == error_code::end_of_archive) {
                spdlog::debug("archive ended without an end-of-archive marker");
                finished_ = true;
                return std::nullopt;
            }
            return std::unexpected(block_result.error());
        }

        // A zero block starts the end-of-archive marker; whatever follows it
        // is ignored
        if (detail::is_zero_block(*block_result)) {
            finished_ = true;
            return std::nullopt;
        }

        auto metadata_result = detail::parse_header(*block_result);
        if (!metadata_result) {
            return std::unexpected(metadata_result.error());
        }

        if (metadata_result->is_gnu_pseudo_entry()) {
            auto process_result = process_gnu_extension(*metadata_result);
            if (!process_result) {
                return std::unexpected(process_result.error());
            }
            if (*process_result) {
                continue;
            }
        }

        if (metadata_result->is_pax_record()) {
            auto process_result = process_pax_header(*metadata_result);
            if (!process_result) {
                return std::unexpected(process_result.error());
            }
            if (*process_result) {
                continue;
            }
        }

        auto final_metadata = std::move(*metadata_result);
        gnu::apply_gnu_extensions(final_metadata, pending_gnu_extensions_);
        pending_gnu_extensions_.clear();

        if (!pending_pax_headers_.empty()) {
            auto applied = pax::apply_pax_records(final_metadata, pending_pax_headers_);
            pending_pax_headers_.clear();
            if (!applied) {
                return std::unexpected(applied.error());
            }
        }

        // Data blocks are skipped by the declared size, whatever the type
        current_entry_size_ = final_metadata.size;
        current_entry_data_remaining_ = final_metadata.size;

        data_reader_fn reader = [this](const size_t max_length) {
            return read_entry_data(max_length);
        };

        return archive_entry{std::move(final_metadata), std::move(reader)};
    }
}

auto archive_reader::process_gnu_extension(const file_metadata &meta) -> std::expected<bool, error> {
    if (meta.is_gnu_longname()) {
        auto longname_result = gnu::read_gnu_extension_data(*stream_, meta.size);
        if (!longname_result) {
            return std::unexpected(longname_result.error());
        }

        pending_gnu_extensions_.longname = std::move(*longname_result);
        return true;
    }

    if (meta.is_gnu_longlink()) {
        auto longlink_result = gnu::read_gnu_extension_data(*stream_, meta.size);
        if (!longlink_result) {
            return std::unexpected(longlink_result.error());
        }

        pending_gnu_extensions_.longlink = std::move(*longlink_result);
        return true;
    }

    // Volume headers and multi-volume continuations carry nothing we extract
    current_entry_size_ = meta.size;
    current_entry_data_remaining_ = meta.size;
    spdlog::debug("skipping GNU pseudo-entry of type '{}'", static_cast<char>(meta.type));
    return true;
}

auto archive_reader::process_pax_header(const file_metadata &meta) -> std::expected<bool, error> {
    if (meta.type == entry_type::pax_extended_header) {
        if (meta.size > max_pax_header_size) {
            return std::unexpected(error{error_code::corrupt_archive, "PAX header record too large"});
        }

        std::vector<std::byte> pax_data(static_cast<size_t>(meta.size));
        auto read_result = read_fully(*stream_, std::span{pax_data});
        if (!read_result) {
            return std::unexpected(read_result.error());
        }

        if (*read_result != pax_data.size()) {
            return std::unexpected(error{error_code::corrupt_archive, "Incomplete PAX header data"});
        }

        auto parse_result = pax::parse_pax_headers(std::span<const std::byte>{pax_data});
        if (!parse_result) {
            return std::unexpected(parse_result.error());
        }

        // Store PAX headers for the next entry
        pending_pax_headers_ = std::move(*parse_result);

        if (auto padding_result = skip_padding(meta.size); !padding_result) {
            return std::unexpected(padding_result.error());
        }

        return true;
    }

    if (meta.type == entry_type::pax_global_header) {
        // Global records would apply to every following entry; we ignore them
        current_entry_size_ = meta.size;
        current_entry_data_remaining_ = meta.size;
        spdlog::debug("ignoring PAX global header ({} bytes)", meta.size);
        return true;
    }

    return false;
}

} // namespace safetar
