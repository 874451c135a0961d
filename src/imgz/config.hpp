#pragma once

#include <filesystem>
#include <iosfwd>
#include <string_view>

#include <imgz/compression_options.hpp>

namespace imgz
{

// Configuration files hold one "key = value" pair per line. '#' starts a
// comment and string values may be double-quoted. Recognized keys:
//
//   compression_algorithm  "deflate" or "lzw" (required)
//   compression_level      0-9, ignored by lzw
//   max_table_size         256-65536, lzw only
//
// Any malformed input throws configuration_error.
[[nodiscard]] auto load_config(std::filesystem::path const& path)
  -> compression_options;

[[nodiscard]] auto parse_config(std::istream& input,
                                std::string_view source_name)
  -> compression_options;

} // namespace imgz
