#pragma once

#include <algorithm>
#include <concepts>
#include <cstddef>
#include <iterator>
#include <ranges>
#include <span>
#include <string>
#include <string_view>
#include <vector>

#include <fmt/format.h>

#include <imgz/coding/lzw_base.hpp>
#include <imgz/compression_error.hpp>

namespace imgz::coding::lzw
{

class decoder
{
public:
    explicit decoder(table_size_t const table_size = default_table_size)
        : table_size_{ table_size }
    {
        validate_table_size(table_size_);
    }

    [[nodiscard]] auto table_size() const noexcept -> table_size_t
    {
        return table_size_;
    }

    // Nothing is written to result unless the whole stream decodes.
    template<std::ranges::forward_range R, std::output_iterator<std::byte> O>
    requires std::same_as<std::ranges::range_value_t<R>, std::byte>
    auto operator()(R&& range, O const result) const -> O
    {
        auto const decoded = decode(range);

        return std::ranges::copy(decoded, result).out;
    }

private:
    using table_type = std::vector<std::string>;

    table_size_t table_size_;

    template<std::ranges::forward_range R>
    [[nodiscard]] auto decode(R&& range) const -> std::vector<std::byte>
    {
        auto const length =
            static_cast<std::size_t>(std::ranges::distance(range));

        if (length == 0u)
        {
            throw decode_error{ "Empty LZW code stream" };
        }

        if (length % code_size_bytes != 0u)
        {
            throw decode_error{ fmt::format(
                "LZW code stream length {} is not a multiple of {}",
                length,
                code_size_bytes) };
        }

        auto table = make_table();
        auto output = std::vector<std::byte>{};
        auto it = std::ranges::begin(range);

        auto const first_code = read_code(it);

        if (first_code >= table.size())
        {
            throw decode_error{ fmt::format(
                "Invalid first LZW code {}", first_code) };
        }

        auto previous = table[first_code];
        write_sequence(output, previous);

        for (auto remaining = length / code_size_bytes - 1u; remaining > 0u;
             --remaining)
        {
            auto const code = read_code(it);
            auto entry = std::string{};

            if (code < table.size())
            {
                entry = table[code];
            }
            else if (code == table.size())
            {
                // Encoder emitted the entry it was about to insert
                entry = previous + previous.front();
            }
            else
            {
                throw decode_error{ fmt::format(
                    "Invalid LZW code {} (table size {})",
                    code,
                    table.size()) };
            }

            write_sequence(output, entry);

            if (table.size() < table_size_)
            {
                table.push_back(previous + entry.front());
            }

            previous = std::move(entry);
        }

        return output;
    }

    [[nodiscard]] auto make_table() const -> table_type
    {
        auto table = table_type{};
        table.reserve(table_size_);

        for (auto const literal :
             std::views::iota(table_size_t{ 0 }, literal_count))
        {
            auto const literal_char = static_cast<char>(literal);
            table.emplace_back(std::string_view{ &literal_char, 1u });
        }

        return table;
    }

    template<std::input_iterator I>
    [[nodiscard]] static auto read_code(I& it) -> code_type
    {
        auto const high = std::to_integer<code_type>(*it++);
        auto const low = std::to_integer<code_type>(*it++);

        return static_cast<code_type>((high << 8u) | low);
    }

    static void write_sequence(std::vector<std::byte>& output,
                               std::string_view const sequence)
    {
        std::ranges::copy(std::as_bytes(std::span{ sequence }),
                          std::back_inserter(output));
    }
};

} // namespace imgz::coding::lzw
