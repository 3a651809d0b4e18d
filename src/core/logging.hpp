/*
 * Copyright 2025 tokengate Contributors
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

// tokengate Logging - Header
// Asynchronous structured logging on top of Quill

#pragma once

#include <quill/Backend.h>
#include <quill/Frontend.h>
#include <quill/Logger.h>
#include <quill/LogMacros.h>
#include <quill/sinks/ConsoleSink.h>
#include <quill/sinks/RotatingFileSink.h>
#include <quill/sinks/RotatingJsonFileSink.h>

#include <string>
#include <string_view>

// Forward declaration to avoid circular dependency
namespace tokengate::control {
struct LogConfig;
}

namespace tokengate::logging {

// Initialize Quill logging backend (called once at startup)
void init_logging_system();

// Create the process logger from config ("stdout" or a log directory)
// Subsequent calls return the logger created first
quill::Logger* init_logger(const tokengate::control::LogConfig& config);

// Shutdown logging system (called at exit)
void shutdown_logging();

// Process logger (returns nullptr before init_logger)
quill::Logger* get_logger();

// Map a config level name to a Quill level (unknown names map to Info)
quill::LogLevel parse_log_level(std::string_view level);

// UUID v4 based correlation ID: {uuid}#{counter}
std::string generate_correlation_id();

// Validate correlation ID format ({8-4-4-4-12 uuid}#{counter})
bool is_valid_uuid(std::string_view uuid);

// Logging macros for structured logging

// Request completion logging
#define TOKENGATE_LOG_REQUEST(logger, method, path, status, duration_us, client_ip, \
                              correlation_id)                                       \
    LOG_INFO(logger,                                                                \
             "Request completed: method={}, path={}, status={}, "                   \
             "duration_us={}, client_ip={}, correlation_id={}",                     \
             method, path, status, duration_us, client_ip, correlation_id)

// Authentication failure (typed reason only, never the token)
#define TOKENGATE_LOG_AUTH_FAILURE(logger, path, reason, detail, correlation_id)        \
    LOG_WARNING(logger,                                                                 \
                "Authentication failed: path={}, reason={}, detail={}, correlation_id={}", \
                path, reason, detail, correlation_id)

}  // namespace tokengate::logging
