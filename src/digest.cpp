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

#include <safetar/digest.hpp>
#include <safetar/stream.hpp>
#include <openssl/evp.h>
#include <array>
#include <stdexcept>
#include <vector>

namespace safetar {

namespace {

EVP_MD_CTX* as_context(void* context) noexcept {
    return static_cast<EVP_MD_CTX*>(context);
}

} // anonymous namespace

void sha256_hasher::context_deleter::operator()(void* context) const noexcept {
    EVP_MD_CTX_free(as_context(context));
}

sha256_hasher::sha256_hasher() : context_(EVP_MD_CTX_new()) {
    // Only fails when OpenSSL cannot allocate
    if (!context_ || EVP_DigestInit_ex(as_context(context_.get()), EVP_sha256(), nullptr) != 1) {
        throw std::runtime_error("failed to initialise SHA-256 context");
    }
}

void sha256_hasher::update(std::span<const std::byte> data) {
    if (!data.empty()) {
        EVP_DigestUpdate(as_context(context_.get()), data.data(), data.size());
    }
}

void sha256_hasher::update(std::string_view text) {
    update(std::as_bytes(std::span{text.data(), text.size()}));
}

std::string sha256_hasher::finish_hex() {
    std::array<unsigned char, EVP_MAX_MD_SIZE> digest{};
    unsigned int length = 0;
    EVP_DigestFinal_ex(as_context(context_.get()), digest.data(), &length);

    constexpr std::string_view hex_digits = "0123456789abcdef";
    std::string hex;
    hex.reserve(length * 2);
    for (unsigned int i = 0; i < length; ++i) {
        hex.push_back(hex_digits[digest[i] >> 4]);
        hex.push_back(hex_digits[digest[i] & 0x0F]);
    }
    return hex;
}

std::string sha256_hex(std::span<const std::byte> data) {
    sha256_hasher hasher;
    hasher.update(data);
    return hasher.finish_hex();
}

std::string sha256_hex(std::string_view text) {
    sha256_hasher hasher;
    hasher.update(text);
    return hasher.finish_hex();
}

auto sha256_file(const std::filesystem::path &path) -> std::expected<std::string, error> {
    auto stream = file_stream::open(path);
    if (!stream) {
        return std::unexpected(stream.error());
    }

    sha256_hasher hasher;
    std::vector<std::byte> buffer(64 * 1024);
    while (true) {
        auto got = stream->read(buffer);
        if (!got) {
            return std::unexpected(got.error().with_context("failed to hash " + path.string()));
        }
        if (*got == 0) {
            break;
        }
        hasher.update(std::span{buffer.data(), *got});
    }
    return hasher.finish_hex();
}

} // namespace safetar
