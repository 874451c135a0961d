#include <imgz/compression_options.hpp>

#include <algorithm>
#include <cctype>
#include <string>

#include <fmt/format.h>

#include <imgz/compression_error.hpp>

namespace imgz
{

namespace
{

[[nodiscard]] auto
to_lower(std::string_view const text) -> std::string
{
  auto result = std::string{ text };
  std::ranges::transform(result,
                         result.begin(),
                         [](unsigned char const c)
                         { return static_cast<char>(std::tolower(c)); });

  return result;
}

} // namespace

auto
make_coding(std::string_view const algorithm,
            std::optional<unsigned> const level)
  -> decltype(compression_options::coding)
{
  auto const name = to_lower(algorithm);

  if (name == "deflate")
  {
    auto deflate = compression_options::coding_deflate{};

    if (level)
    {
      if (*level > static_cast<unsigned>(coding::deflate::max_level))
      {
        throw invalid_level_error{ fmt::format(
          "Invalid compression level: {}", *level) };
      }

      deflate.level = static_cast<coding::deflate::level_t>(*level);
    }

    return deflate;
  }

  if (name == "lzw")
  {
    return compression_options::coding_lzw{};
  }

  throw unknown_algorithm_error{ fmt::format(
    "Unknown compression algorithm: {}", algorithm) };
}

auto
algorithm_name(compression_options const& options) -> std::string_view
{
  return std::visit(
    ranges::overload([](compression_options::coding_lzw const&)
                     { return std::string_view{ "lzw" }; },
                     [](compression_options::coding_deflate const&)
                     { return std::string_view{ "deflate" }; }),
    options.coding);
}

} // namespace imgz
