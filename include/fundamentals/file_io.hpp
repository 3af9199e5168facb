#pragma once

#include <expected>
#include <span>
#include <string>

#include "fundamentals/bytes.hpp"

namespace file_io
{

[[nodiscard]] std::expected<bytes::buffer_t, std::string> read_file(const std::string& path);

// Writes through a temporary sibling and renames over `path`; the result is owner read/write only.
[[nodiscard]] std::expected<void, std::string> write_private_file(const std::string& path, std::span<const uint8_t> data);

} // namespace file_io
