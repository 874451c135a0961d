#include <imgz/config.hpp>

#include <charconv>
#include <fstream>
#include <istream>
#include <optional>
#include <string>
#include <system_error>
#include <utility>
#include <variant>

#include <fmt/format.h>

#include <imgz/coding/lzw_base.hpp>
#include <imgz/compression_error.hpp>

namespace imgz
{

namespace
{

struct raw_config
{
  std::optional<std::string> algorithm;
  std::optional<unsigned> level;
  std::optional<coding::lzw::table_size_t> max_table_size;
};

class line_parser
{
public:
  line_parser(std::string_view const source_name, std::size_t const line_number)
    : source_name_{ source_name }
    , line_number_{ line_number }
  {
  }

  [[noreturn]] void fail(std::string_view const message) const
  {
    throw configuration_error{ fmt::format(
      "{}:{}: {}", source_name_, line_number_, message) };
  }

  template<typename T>
  [[nodiscard]] auto parse_number(std::string_view const key,
                                  std::string_view const value) const -> T
  {
    auto number = T{};
    auto const [end, error] =
      std::from_chars(value.data(), value.data() + value.size(), number);

    if (error != std::errc{} or end != value.data() + value.size())
    {
      fail(fmt::format("'{}' expects an unsigned integer, got '{}'",
                       key,
                       value));
    }

    return number;
  }

  [[nodiscard]] auto unquote(std::string_view value) const -> std::string_view
  {
    if (value.empty() or value.front() != '"')
    {
      return value;
    }

    if (value.size() < 2u or value.back() != '"')
    {
      fail("Unterminated string value");
    }

    return value.substr(1u, value.size() - 2u);
  }

private:
  std::string_view source_name_;
  std::size_t line_number_;
};

[[nodiscard]] auto
trim(std::string_view text) -> std::string_view
{
  constexpr auto whitespace = std::string_view{ " \t\r\n" };

  auto const first = text.find_first_not_of(whitespace);

  if (first == std::string_view::npos)
  {
    return {};
  }

  auto const last = text.find_last_not_of(whitespace);

  return text.substr(first, last - first + 1u);
}

[[nodiscard]] auto
strip_comment(std::string_view const line) -> std::string_view
{
  auto in_string = false;

  for (auto i = std::size_t{ 0 }; i < line.size(); ++i)
  {
    if (line[i] == '"')
    {
      in_string = not in_string;
    }
    else if (line[i] == '#' and not in_string)
    {
      return line.substr(0u, i);
    }
  }

  return line;
}

template<typename T>
void
assign_once(line_parser const& parser,
            std::optional<T>& field,
            std::string_view const key,
            T value)
{
  if (field)
  {
    parser.fail(fmt::format("Duplicate key '{}'", key));
  }

  field = std::move(value);
}

} // namespace

auto
load_config(std::filesystem::path const& path) -> compression_options
{
  auto file = std::ifstream{ path };

  if (not file)
  {
    throw configuration_error{ fmt::format(
      "Failed to open configuration file {}", path.string()) };
  }

  return parse_config(file, path.string());
}

auto
parse_config(std::istream& input, std::string_view const source_name)
  -> compression_options
{
  auto raw = raw_config{};
  auto line = std::string{};
  auto line_number = std::size_t{ 0 };

  while (std::getline(input, line))
  {
    ++line_number;

    auto const parser = line_parser{ source_name, line_number };
    auto const content = trim(strip_comment(line));

    if (content.empty())
    {
      continue;
    }

    auto const separator = content.find('=');

    if (separator == std::string_view::npos)
    {
      parser.fail("Expected 'key = value'");
    }

    auto const key = trim(content.substr(0u, separator));
    auto const value = parser.unquote(trim(content.substr(separator + 1u)));

    if (key.empty() or value.empty())
    {
      parser.fail("Expected 'key = value'");
    }

    if (key == "compression_algorithm")
    {
      assign_once(parser, raw.algorithm, key, std::string{ value });
    }
    else if (key == "compression_level")
    {
      assign_once(
        parser, raw.level, key, parser.parse_number<unsigned>(key, value));
    }
    else if (key == "max_table_size")
    {
      assign_once(
        parser,
        raw.max_table_size,
        key,
        parser.parse_number<coding::lzw::table_size_t>(key, value));
    }
    else
    {
      parser.fail(fmt::format("Unknown key '{}'", key));
    }
  }

  if (input.bad())
  {
    throw configuration_error{ fmt::format("Failed to read {}", source_name) };
  }

  if (not raw.algorithm)
  {
    throw configuration_error{ fmt::format(
      "{}: missing required key 'compression_algorithm'", source_name) };
  }

  auto options = compression_options{};
  options.coding = make_coding(*raw.algorithm, raw.level);

  if (raw.max_table_size)
  {
    auto* const lzw = std::get_if<compression_options::coding_lzw>(&options.coding);

    if (lzw == nullptr)
    {
      throw configuration_error{ fmt::format(
        "{}: 'max_table_size' only applies to the lzw algorithm",
        source_name) };
    }

    coding::lzw::validate_table_size(*raw.max_table_size);
    lzw->max_table_size = *raw.max_table_size;
  }

  return options;
}

} // namespace imgz
