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
#include <expected>
#include <memory>
#include <span>
#include <string_view>

namespace safetar {

enum class compression : uint8_t {
    none,
    gzip,
    xz,
    zstd
};

// Longest magic number we sniff for
constexpr size_t compression_magic_size = 6;

// Guess the codec from the leading bytes of a stream
[[nodiscard]] compression detect_compression(std::span<const std::byte> header) noexcept;

[[nodiscard]] std::string_view to_string(compression codec) noexcept;

// Command-line codec selection. Exactly one flag picks that codec, no flag
// means none, and conflicting flags fall back to zstd.
struct compression_flags {
    bool gzip = false;
    bool xz = false;
    bool zstd = false;

    [[nodiscard]] compression resolve() const noexcept;
};

// Sniff the codec of `source` and return a stream yielding the decoded bytes
[[nodiscard]] std::expected<std::unique_ptr<input_stream>, error>
wrap_reader(std::unique_ptr<input_stream> source);

// Same, but also report which codec was detected
[[nodiscard]] std::expected<std::unique_ptr<input_stream>, error>
wrap_reader(std::unique_ptr<input_stream> source, compression& detected);

// Return a stream that encodes into `sink`; finish() writes the codec trailer
// and finishes `sink`
[[nodiscard]] std::expected<std::unique_ptr<output_stream>, error>
wrap_writer(std::unique_ptr<output_stream> sink, compression codec);

} // namespace safetar
