#pragma once

#include <optional>
#include <string_view>
#include <variant>

#include <range/v3/functional/overload.hpp>

#include <imgz/coding/deflate.hpp>
#include <imgz/coding/lzw_base.hpp>

namespace imgz
{

struct compression_options
{
  struct coding_lzw
  {
    coding::lzw::table_size_t max_table_size = coding::lzw::default_table_size;
  };

  struct coding_deflate
  {
    coding::deflate::level_t level = coding::deflate::default_level;
  };

  std::variant<coding_deflate, coding_lzw> coding = coding_deflate{};
};

// Selects a coding by case-insensitive name ("deflate" or "lzw"). The level
// only applies to deflate. Throws unknown_algorithm_error for other names.
[[nodiscard]] auto make_coding(std::string_view algorithm,
                               std::optional<unsigned> level = std::nullopt)
  -> decltype(compression_options::coding);

[[nodiscard]] auto algorithm_name(compression_options const& options)
  -> std::string_view;

template<typename Configurable>
void
apply_options(compression_options const& options, Configurable& configurable)
{
  std::visit(ranges::overload(
               [&](compression_options::coding_lzw const& lzw)
               { configurable.set_coding_lzw(lzw.max_table_size); },
               [&](compression_options::coding_deflate const& deflate)
               { configurable.set_coding_deflate(deflate.level); }),
             options.coding);
}

} // namespace imgz
