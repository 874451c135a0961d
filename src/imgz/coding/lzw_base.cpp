#include <imgz/coding/lzw_base.hpp>

#include <fmt/format.h>

#include <imgz/compression_error.hpp>

namespace imgz::coding::lzw
{

void
validate_table_size(table_size_t const size)
{
  if (size < literal_count or size > max_table_size)
  {
    throw configuration_error{ fmt::format(
      "LZW table size must be between {} and {}, got {}",
      literal_count,
      max_table_size,
      size) };
  }
}

} // namespace imgz::coding::lzw
