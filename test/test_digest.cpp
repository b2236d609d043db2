#include <catch2/catch.hpp>
#include <dsum/digest.hpp>
#include <string>
#include <string_view>

using namespace dsum;

static constexpr auto EMPTY = "e3b0c44298fc1c149afbf4c8996fb92427ae41e4649b934ca495991b7852b855";
static constexpr auto HELLO = "2cf24dba5fb0a30e26e83b2ac5b9e29e1b161e5c1fa7425e73043362938b9824";
static constexpr auto ABC = "ba7816bf8f01cfea414140de5dae2223b00361a396177a9cb410ff61f20015ad";

static auto span_of(std::string_view text) -> std::span<char const> { return {text.data(), text.size()}; }

TEST_CASE("digest of known inputs", "[digest]") {
    CHECK(Digest::of(span_of("")) == EMPTY);
    CHECK(Digest::of(span_of("hello")) == HELLO);
    CHECK(Digest::of(span_of("abc")) == ABC);
    CHECK(Digest::of(span_of("abc")).size() == Digest::HEX_SIZE);
}

TEST_CASE("digest without input is the empty hash", "[digest]") {
    auto digest = Digest{};
    CHECK(digest.size() == 0);
    CHECK(digest.hexdigest() == EMPTY);
}

TEST_CASE("digest does not depend on chunk boundaries", "[digest]") {
    auto const text = std::string_view("The quick brown fox jumps over the lazy dog");
    auto const expected = Digest::of(span_of(text));
    for (std::size_t split = 0; split <= text.size(); ++split) {
        auto digest = Digest{};
        digest.update(span_of(text.substr(0, split)));
        digest.update(span_of(text.substr(split)));
        CHECK(digest.hexdigest() == expected);
        CHECK(digest.size() == text.size());
    }
    auto bytewise = Digest{};
    for (auto const& c : text) {
        bytewise.update({&c, 1});
    }
    CHECK(bytewise.hexdigest() == expected);
}

TEST_CASE("digest reset discards absorbed data", "[digest]") {
    auto digest = Digest{};
    digest.update(span_of("partial garbage"));
    digest.reset();
    digest.update(span_of("hello"));
    CHECK(digest.hexdigest() == HELLO);
    CHECK(digest.size() == 5);
}

TEST_CASE("digest can be read while absorbing", "[digest]") {
    auto digest = Digest{};
    digest.update(span_of("ab"));
    CHECK(digest.hexdigest() == Digest::of(span_of("ab")));
    digest.update(span_of("c"));
    CHECK(digest.hexdigest() == ABC);
}
