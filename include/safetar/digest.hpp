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
#include <expected>
#include <filesystem>
#include <memory>
#include <span>
#include <string>
#include <string_view>

namespace safetar {

// Incremental SHA-256 over OpenSSL's EVP interface
class sha256_hasher {
public:
    sha256_hasher();

    void update(std::span<const std::byte> data);
    void update(std::string_view text);

    // Lowercase hex digest; the hasher cannot be updated afterwards
    [[nodiscard]] std::string finish_hex();

private:
    struct context_deleter {
        void operator()(void* context) const noexcept;
    };

    std::unique_ptr<void, context_deleter> context_;
};

[[nodiscard]] std::string sha256_hex(std::span<const std::byte> data);
[[nodiscard]] std::string sha256_hex(std::string_view text);

// Stream a file through SHA-256 with a fixed-size buffer
[[nodiscard]] std::expected<std::string, error> sha256_file(const std::filesystem::path& path);

} // namespace safetar
