#pragma once

#include <optional>
#include <string>
#include <vector>

namespace scfw {

// ============================================================================
// Filesystem
// ============================================================================

// Check if a path exists
bool path_exists(const std::string& path);

// Check if a path is a directory
bool is_directory(const std::string& path);

// Check if a path is a regular file
bool is_regular_file(const std::string& path);

// Check if a path is a regular file the current user may execute
bool is_executable_file(const std::string& path);

// List directory entries (full paths, sorted)
std::vector<std::string> list_directory(const std::string& path);

// Read a whole file; nullopt if it cannot be opened
std::optional<std::string> read_file(const std::string& path);

// Append content to a file, creating it (and its parent directories) if needed
bool append_file(const std::string& path, const std::string& content);

// Replace a file atomically (temp file, fsync, rename), creating parent directories
bool write_file_atomic(const std::string& path, const std::string& content);

// Create directories recursively
bool create_directories(const std::string& path);

// Join path components
std::string join_path(const std::string& base, const std::string& rel);

// ============================================================================
// Executables
// ============================================================================

// Search PATH for an executable with the given name.
// Names containing a '/' are returned as-is if executable.
std::optional<std::string> find_executable(const std::string& name);

// ============================================================================
// Environment
// ============================================================================

// Get an environment variable
std::optional<std::string> get_env(const std::string& name);

// Home directory from HOME, or empty
std::string home_directory();

// Get current timestamp as RFC3339 string
std::string get_current_timestamp();

// Generate a UUID string
std::string generate_uuid();

} // namespace scfw
