#pragma once

#include <optional>
#include <string>
#include <vector>

namespace kit {

// ============================================================================
// Atomic File Operations
// ============================================================================

struct AtomicWriteResult {
    bool ok = false;
    std::string error;
};

// Write content atomically using temp file + fsync + rename + fsync(dir)
AtomicWriteResult atomic_write_file(const std::string& path, const std::string& content);

// Append content to a file opened with O_APPEND and fsync it before returning.
// The file is created if absent; its parent directory must exist.
AtomicWriteResult durable_append_file(const std::string& path, const std::string& content);

// ============================================================================
// Path Utilities
// ============================================================================

std::string get_parent_directory(const std::string& path);

std::string join_path(const std::string& base, const std::string& rel);

bool path_exists(const std::string& path);

bool is_regular_file(const std::string& path);

// Create parent directories recursively
bool create_directories(const std::string& path);

// Read a whole file; nullopt if it cannot be opened
std::optional<std::string> read_file(const std::string& path);

// Resolve an executable name against PATH (names containing '/' are checked as-is)
std::optional<std::string> find_executable(const std::string& name);

// ============================================================================
// Environment
// ============================================================================

std::optional<std::string> get_env(const std::string& name);

// Get current timestamp as RFC3339 string
std::string get_current_timestamp();

} // namespace kit
