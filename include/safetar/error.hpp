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

#include <expected>
#include <string>
#include <string_view>
#include <system_error>

namespace safetar {

enum class error_code {
    // Security policy
    empty_path,
    absolute_path,
    root_escape,
    parent_traversal,
    invalid_utf8_path,
    link_outside_root,
    file_count_exceeded,
    total_bytes_exceeded,
    single_file_too_large,
    depth_exceeded,
    // Manifest verification
    missing_entry,
    manifest_mismatch,
    unexpected_entry,
    // Bad command-line level input
    user_input,
    // Archive format
    invalid_header,
    corrupt_archive,
    unsupported_feature,
    invalid_operation,
    end_of_archive,
    // Filesystem / stream I/O
    io_error
};

// Coarse classes the outer boundary maps to exit codes
enum class error_class {
    policy_violation,
    manifest_violation,
    user_input,
    io_failure
};

class error {
public:
    error(const error_code code, std::string message)
        : code_(code), message_(std::move(message)) {}

    [[nodiscard]] error_code code() const noexcept { return code_; }
    [[nodiscard]] const std::string& message() const noexcept { return message_; }

    // Prefix the message with operation context, keeping the code
    [[nodiscard]] error with_context(std::string_view context) const {
        return error{code_, std::string{context} + ": " + message_};
    }

private:
    error_code code_;
    std::string message_;
};

[[nodiscard]] error_class classify(error_code code) noexcept;

[[nodiscard]] inline error_class classify(const error& err) noexcept {
    return classify(err.code());
}

// 3 for policy/manifest violations, 2 for user input, 1 otherwise
[[nodiscard]] int exit_code_for(const error& err) noexcept;

[[nodiscard]] std::string_view to_string(error_code code) noexcept;

// Wrap an errno / std::error_code failure with operation context
[[nodiscard]] error io_failure(std::string_view what, const std::error_code& ec);

} // namespace safetar
