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
#include <safetar/compression.hpp>
#include <safetar/archive_reader.hpp>
#include <safetar/archive_writer.hpp>
#include <safetar/archive_entry.hpp>
#include <safetar/policy.hpp>
#include <safetar/manifest.hpp>
#include <safetar/walker.hpp>
#include <safetar/archive.hpp>
