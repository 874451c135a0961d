#pragma once

#include <array>
#include <cmath>
#include <cstddef>
#include <span>

namespace imgz
{

// Shannon entropy of the byte distribution, in bits per byte
[[nodiscard]] inline auto
calculate_entropy(std::span<std::byte const> const data) -> double
{
    if (data.empty())
    {
        return 0.0;
    }

    auto frequencies = std::array<std::size_t, 256u>{};

    for (auto const byte : data)
    {
        ++frequencies[std::to_integer<std::size_t>(byte)];
    }

    auto const length = static_cast<double>(data.size());
    auto entropy = 0.0;

    for (auto const count : frequencies)
    {
        if (count != 0u)
        {
            auto const p = static_cast<double>(count) / length;
            entropy -= p * std::log2(p);
        }
    }

    return entropy;
}

} // namespace imgz
