#pragma once

#include <cstddef>
#include <cstdint>

namespace imgz::coding::lzw
{

using code_type = std::uint16_t;
using table_size_t = std::size_t;

static constexpr auto code_size_bytes = std::size_t{ 2 };
static constexpr auto literal_count = table_size_t{ 256 };
static constexpr auto max_table_size = table_size_t{ 65536 };
static constexpr auto default_table_size = table_size_t{ 4096 };

// Throws configuration_error unless literal_count <= size <= max_table_size
void validate_table_size(table_size_t size);

} // namespace imgz::coding::lzw
