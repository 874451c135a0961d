#pragma once

#include <concepts>
#include <cstddef>
#include <iterator>
#include <ranges>
#include <string>
#include <string_view>
#include <utility>

#include <absl/container/flat_hash_map.h>

#include <imgz/coding/lzw_base.hpp>
#include <imgz/compression_error.hpp>

namespace imgz::coding::lzw
{

class encoder
{
public:
    explicit encoder(table_size_t const table_size = default_table_size)
        : table_size_{ table_size }
    {
        validate_table_size(table_size_);
    }

    [[nodiscard]] auto table_size() const noexcept -> table_size_t
    {
        return table_size_;
    }

    template<std::ranges::input_range R, std::output_iterator<std::byte> O>
    requires std::same_as<std::ranges::range_value_t<R>, std::byte>
    auto operator()(R&& range, O const result) const -> O
    {
        return (*this)(
            std::ranges::begin(range), std::ranges::end(range), result);
    }

    // Emits one big-endian 16-bit code per longest dictionary match.
    template<std::input_iterator I,
             std::sentinel_for<I> S,
             std::output_iterator<std::byte> O>
    requires std::same_as<std::iter_value_t<I>, std::byte>
    auto operator()(I first, S const last, O result) const -> O
    {
        auto table = make_table();

        auto match = std::string{};
        auto code = code_type{};

        while (first != last)
        {
            auto const input_byte = static_cast<char>(*first++);
            match.push_back(input_byte);

            if (auto const found = table.find(match); found != table.end())
            {
                code = found->second;
                continue;
            }

            // match without its last byte was the longest known prefix
            result = write_code(result, code);

            if (table.size() < table_size_)
            {
                auto const next_code = static_cast<code_type>(table.size());
                table.emplace(std::move(match), next_code);
            }

            match.assign(1u, input_byte);
            code = lookup(table, match);
        }

        if (not match.empty())
        {
            result = write_code(result, code);
        }

        return result;
    }

private:
    using table_type = absl::flat_hash_map<std::string, code_type>;

    table_size_t table_size_;

    [[nodiscard]] auto make_table() const -> table_type
    {
        auto table = table_type{};
        table.reserve(table_size_);

        for (auto const literal :
             std::views::iota(table_size_t{ 0 }, literal_count))
        {
            auto const literal_char = static_cast<char>(literal);
            table.emplace(std::string_view{ &literal_char, 1u },
                          static_cast<code_type>(literal));
        }

        return table;
    }

    [[nodiscard]] static auto lookup(table_type const& table,
                                     std::string const& sequence)
        -> code_type
    {
        auto const found = table.find(sequence);

        if (found == table.end())
        {
            throw encode_error{ "LZW match missing from the dictionary" };
        }

        return found->second;
    }

    template<std::output_iterator<std::byte> O>
    [[nodiscard]] static auto write_code(O result, code_type const code) -> O
    {
        *result++ = static_cast<std::byte>((code >> 8u) & 0xFFu);
        *result++ = static_cast<std::byte>(code & 0xFFu);

        return result;
    }
};

} // namespace imgz::coding::lzw
