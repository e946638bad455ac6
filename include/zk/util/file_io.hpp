#pragma once

#include <zk/result.hpp>
#include <zk/types.hpp>

#include <string>

namespace zk {

/**
 * Read an entire file.
 * @return File content, or IO_ERROR
 */
Result<std::string> read_file(const fs::path& path);

/**
 * Write a file through a temporary sibling and rename it into place,
 * so readers never observe a half-written note.
 */
Result<void> write_file_atomic(const fs::path& path, const std::string& content);

}  // namespace zk
