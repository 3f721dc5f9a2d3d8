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

#include <safetar/error.hpp>

namespace safetar {

error_class classify(const error_code code) noexcept {
    switch (code) {
        case error_code::empty_path:
        case error_code::absolute_path:
        case error_code::root_escape:
        case error_code::parent_traversal:
        case error_code::invalid_utf8_path:
        case error_code::link_outside_root:
        case error_code::file_count_exceeded:
        case error_code::total_bytes_exceeded:
        case error_code::single_file_too_large:
        case error_code::depth_exceeded:
            return error_class::policy_violation;

        case error_code::missing_entry:
        case error_code::manifest_mismatch:
        case error_code::unexpected_entry:
            return error_class::manifest_violation;

        case error_code::user_input:
            return error_class::user_input;

        case error_code::invalid_header:
        case error_code::corrupt_archive:
        case error_code::unsupported_feature:
        case error_code::invalid_operation:
        case error_code::end_of_archive:
        case error_code::io_error:
            return error_class::io_failure;
    }
    return error_class::io_failure;
}

int exit_code_for(const error& err) noexcept {
    switch (classify(err)) {
        case error_class::policy_violation:
        case error_class::manifest_violation:
            return 3;
        case error_class::user_input:
            return 2;
        case error_class::io_failure:
            return 1;
    }
    return 1;
}

std::string_view to_string(const error_code code) noexcept {
    switch (code) {
        case error_code::empty_path: return "empty path";
        case error_code::absolute_path: return "absolute path";
        case error_code::root_escape: return "root escape";
        case error_code::parent_traversal: return "parent traversal";
        case error_code::invalid_utf8_path: return "invalid utf-8 path";
        case error_code::link_outside_root: return "link outside root";
        case error_code::file_count_exceeded: return "file count exceeded";
        case error_code::total_bytes_exceeded: return "total bytes exceeded";
        case error_code::single_file_too_large: return "single file too large";
        case error_code::depth_exceeded: return "depth exceeded";
        case error_code::missing_entry: return "missing entry";
        case error_code::manifest_mismatch: return "manifest mismatch";
        case error_code::unexpected_entry: return "unexpected entry";
        case error_code::user_input: return "user input";
        case error_code::invalid_header: return "invalid header";
        case error_code::corrupt_archive: return "corrupt archive";
        case error_code::unsupported_feature: return "unsupported feature";
        case error_code::invalid_operation: return "invalid operation";
        case error_code::end_of_archive: return "end of archive";
        case error_code::io_error: return "i/o error";
    }
    return "unknown";
}

error io_failure(std::string_view what, const std::error_code& ec) {
    return error{error_code::io_error, std::string{what} + ": " + ec.message()};
}

} // namespace safetar
