#include <catch2/catch.hpp>
#include <dsum/url.hpp>

using namespace dsum;

static auto parse(std::string_view text) -> Url {
    auto url = Url::parse(text);
    REQUIRE(url);
    return *url;
}

TEST_CASE("url canonical form", "[url]") {
    CHECK(parse("http://Example.TEST/repo/").str() == "http://example.test/repo/");
    CHECK(parse("http://example.test:80/repo/a.txt").str() == "http://example.test/repo/a.txt");
    CHECK(parse("https://example.test:443/").str() == "https://example.test/");
    CHECK(parse("http://example.test:8080/x").str() == "http://example.test:8080/x");
    CHECK(parse("http://example.test").str() == "http://example.test/");
    CHECK(parse("http://example.test/repo/./sub/../a.txt").str() == "http://example.test/repo/a.txt");
    CHECK(parse("http://example.test/repo/a.txt#top").str() == "http://example.test/repo/a.txt");
    CHECK(parse("http://example.test/repo/?C=M;O=A").str() == "http://example.test/repo/?C=M;O=A");
    CHECK(parse("http://example.test/repo/a b.txt").str() == "http://example.test/repo/a%20b.txt");
}

TEST_CASE("url normalizes percent escapes", "[url]") {
    CHECK(parse("http://example.test/repo/%61.txt").str() == "http://example.test/repo/a.txt");
    CHECK(parse("http://example.test/repo/%7e%2D_").str() == "http://example.test/repo/~-_");
    CHECK(parse("http://example.test/repo/a%2fb").str() == "http://example.test/repo/a%2Fb");
    CHECK(parse("http://example.test/repo/a%20b.txt").str() == "http://example.test/repo/a%20b.txt");
    CHECK(parse("http://example.test/repo/100%").str() == "http://example.test/repo/100%");
    CHECK(parse("http://example.test/repo/").resolve("%41.txt")->str() == "http://example.test/repo/A.txt");
}

TEST_CASE("url rejects malformed input", "[url]") {
    CHECK_FALSE(Url::parse(""));
    CHECK_FALSE(Url::parse("   "));
    CHECK_FALSE(Url::parse("not a url"));
    CHECK_FALSE(Url::parse("http://"));
}

TEST_CASE("url resolves references", "[url]") {
    auto const page = parse("http://example.test/repo/sub/");
    CHECK(page.resolve("b.txt")->str() == "http://example.test/repo/sub/b.txt");
    CHECK(page.resolve("../a.txt")->str() == "http://example.test/repo/a.txt");
    CHECK(page.resolve("/other/")->str() == "http://example.test/other/");
    CHECK(page.resolve("//mirror.test/x")->str() == "http://mirror.test/x");
    CHECK(page.resolve("https://example.test/repo/")->str() == "https://example.test/repo/");
    CHECK(page.resolve("?C=N;O=D")->str() == "http://example.test/repo/sub/?C=N;O=D");
    CHECK(page.resolve("#frag")->str() == page.str());
    CHECK(page.resolve("")->str() == page.str());
    CHECK(page.resolve("  b.txt\n")->str() == "http://example.test/repo/sub/b.txt");
}

TEST_CASE("url path helpers", "[url]") {
    auto const file = parse("http://example.test/repo/sub/archive.tar.gz");
    CHECK_FALSE(file.is_dir());
    CHECK(file.name() == "archive.tar.gz");
    CHECK(file.parent_dir() == "/repo/sub/");
    CHECK(file.has_extension());

    auto const dir = parse("http://example.test/repo/sub/");
    CHECK(dir.is_dir());
    CHECK(dir.name() == "sub");
    CHECK(dir.parent_dir() == "/repo/");
    CHECK_FALSE(dir.has_extension());

    CHECK_FALSE(parse("http://example.test/repo/README").has_extension());
    CHECK_FALSE(parse("http://example.test/repo/.hidden").has_extension());
    CHECK(parse("http://example.test/repo/a%20b.txt").decoded_path() == "/repo/a b.txt");
}

TEST_CASE("scope confines to the root subtree", "[url]") {
    auto const scope = Scope(parse("http://example.test/repo/"));
    CHECK(scope.contains(parse("http://example.test/repo/")));
    CHECK(scope.contains(parse("http://example.test/repo/a.txt")));
    CHECK(scope.contains(parse("http://example.test/repo/sub/b.txt")));
    CHECK_FALSE(scope.contains(parse("http://example.test/")));
    CHECK_FALSE(scope.contains(parse("http://example.test/repository/a.txt")));
    CHECK_FALSE(scope.contains(parse("https://example.test/repo/a.txt")));
    CHECK_FALSE(scope.contains(parse("http://example.test:8080/repo/a.txt")));
    CHECK_FALSE(scope.contains(parse("http://other.test/repo/a.txt")));
}

TEST_CASE("scope accepts a root without trailing slash", "[url]") {
    auto const scope = Scope(parse("http://example.test/repo"));
    CHECK(scope.prefix() == "/repo/");
    CHECK(scope.contains(parse("http://example.test/repo")));
    CHECK(scope.contains(parse("http://example.test/repo/a.txt")));
    CHECK_FALSE(scope.contains(parse("http://example.test/repo.txt")));
}

TEST_CASE("scope relative paths", "[url]") {
    auto const scope = Scope(parse("http://example.test/repo/"));
    CHECK(scope.relative(parse("http://example.test/repo/a.txt")) == "repo/a.txt");
    CHECK(scope.relative(parse("http://example.test/repo/sub/b.txt")) == "repo/sub/b.txt");
    CHECK(scope.relative(parse("http://example.test/repo/sub/")) == "repo/sub/");
    CHECK(scope.relative(parse("http://example.test/repo/a%20b.txt")) == "repo/a b.txt");
    CHECK(scope.relative(parse("http://example.test/repo/get?id=1")) == "repo/get?id=1");

    auto const top = Scope(parse("http://example.test/"));
    CHECK(top.relative(parse("http://example.test/a.txt")) == "a.txt");
    CHECK(top.relative(parse("http://example.test/")) == "/");
}

TEST_CASE("self and ancestor links", "[url]") {
    auto const page = parse("http://example.test/repo/sub/");
    CHECK(Scope::is_self_or_ancestor(page, parse("http://example.test/repo/sub/")));
    CHECK(Scope::is_self_or_ancestor(page, parse("http://example.test/repo/sub")));
    CHECK(Scope::is_self_or_ancestor(page, parse("http://example.test/repo/")));
    CHECK(Scope::is_self_or_ancestor(page, parse("http://example.test/")));
    CHECK_FALSE(Scope::is_self_or_ancestor(page, parse("http://example.test/repo/sub/b.txt")));
    CHECK_FALSE(Scope::is_self_or_ancestor(page, parse("http://example.test/repo/su")));
    CHECK_FALSE(Scope::is_self_or_ancestor(page, parse("http://other.test/repo/")));
}
