#include <cstddef>
#include <future>
#include <span>
#include <string_view>
#include <variant>
#include <vector>

#include <catch2/catch.hpp>

#include <imgz/compression_error.hpp>
#include <imgz/compression_options.hpp>
#include <imgz/compressor.hpp>
#include <imgz/utils/entropy.hpp>

using namespace std::literals;

namespace
{

auto
to_bytes(std::string_view const text) -> std::vector<std::byte>
{
    auto const bytes = std::as_bytes(std::span{ text });
    return std::vector<std::byte>(bytes.begin(), bytes.end());
}

auto
make_compressor(imgz::compression_options const& options) -> imgz::compressor
{
    auto compressor = imgz::compressor{};
    imgz::apply_options(options, compressor);
    return compressor;
}

} // namespace

TEST_CASE("Compressor round trip with every coding")
{
    auto options = imgz::compression_options{};

    SECTION("deflate") { options.coding = imgz::make_coding("deflate", 9u); }
    SECTION("lzw") { options.coding = imgz::make_coding("lzw"); }

    auto const compressor = make_compressor(options);
    auto const input = to_bytes("Example data to compress, example data"sv);

    CHECK(compressor.decompress(compressor.compress(input)) == input);
}

TEST_CASE("Compressor describes its coding")
{
    auto compressor = imgz::compressor{};

    compressor.set_coding_lzw();
    CHECK(compressor.describe() == "LZW (max table size: 4096)");

    compressor.set_coding_deflate(3);
    CHECK(compressor.describe() == "Deflate (compression level: 3)");
}

TEST_CASE("Compressor without coding is rejected")
{
    auto const compressor = imgz::compressor{};

    CHECK_THROWS_AS(compressor.compress({}), imgz::configuration_error);
    CHECK_THROWS_AS(compressor.decompress({}), imgz::configuration_error);
}

TEST_CASE("Compressor surfaces decode errors")
{
    auto compressor = imgz::compressor{};
    compressor.set_coding_lzw(512u);

    CHECK_THROWS_AS(compressor.decompress(to_bytes("abc"sv)),
                    imgz::decode_error);
}

TEST_CASE("Compressor is shareable between threads")
{
    auto compressor = imgz::compressor{};
    compressor.set_coding_lzw();

    auto const input = to_bytes("TOBEORNOTTOBEORTOBEORNOT#TOBEORNOT"sv);
    auto const expected = compressor.compress(input);

    auto results = std::vector<std::future<std::vector<std::byte>>>{};

    for (auto i = 0; i < 8; ++i)
    {
        results.push_back(std::async(std::launch::async, [&]
                                                                  { return compressor.compress(input); }));
    }

    for (auto& result : results)
    {
        auto const compressed = result.get();
        CHECK(compressed == expected);
        CHECK(compressor.decompress(compressed) == input);
    }
}

TEST_CASE("Codings are selected by name")
{
    SECTION("case insensitive")
    {
        auto const coding = imgz::make_coding("LZW");
        REQUIRE(std::holds_alternative<imgz::compression_options::coding_lzw>(
            coding));
        CHECK(std::get<imgz::compression_options::coding_lzw>(coding)
                .max_table_size == 4096u);
    }

    SECTION("deflate default level")
    {
        auto const coding = imgz::make_coding("Deflate");
        REQUIRE(std::holds_alternative<imgz::compression_options::coding_deflate>(
            coding));
        CHECK(std::get<imgz::compression_options::coding_deflate>(coding).level ==
                    6);
    }

    SECTION("lzw ignores the level")
    {
        CHECK(std::holds_alternative<imgz::compression_options::coding_lzw>(
            imgz::make_coding("lzw", 42u)));
    }

    SECTION("invalid deflate level")
    {
        CHECK_THROWS_AS(imgz::make_coding("deflate", 10u),
                        imgz::invalid_level_error);
    }

    SECTION("unknown algorithm")
    {
        CHECK_THROWS_AS(imgz::make_coding("brotli"), imgz::unknown_algorithm_error);
    }

    SECTION("name of selected coding")
    {
        auto options = imgz::compression_options{};
        CHECK(imgz::algorithm_name(options) == "deflate");

        options.coding = imgz::compression_options::coding_lzw{};
        CHECK(imgz::algorithm_name(options) == "lzw");
    }
}

TEST_CASE("Entropy of byte distributions")
{
    CHECK(imgz::calculate_entropy({}) == 0.0);
    CHECK(imgz::calculate_entropy(to_bytes("AAAA"sv)) == 0.0);
    CHECK(imgz::calculate_entropy(to_bytes("ABAB"sv)) == Approx(1.0));
    CHECK(imgz::calculate_entropy(to_bytes("ABCD"sv)) == Approx(2.0));
}
