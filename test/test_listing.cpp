#include <catch2/catch.hpp>
#include <dsum/listing.hpp>

using namespace dsum;

static auto parse(std::string_view text) -> Url {
    auto url = Url::parse(text);
    REQUIRE(url);
    return *url;
}

static auto urls(Listing::Result const& result) -> std::vector<std::string> {
    auto out = std::vector<std::string>{};
    for (auto const& target : result.targets) {
        out.push_back(target.url.str());
    }
    return out;
}

TEST_CASE("listing extracts links in document order", "[listing]") {
    auto const page = parse("http://example.test/repo/");
    auto const listing = Listing(Scope(page), {});
    auto const result = listing.parse(R"(
        <html><head><title>Index of /repo</title></head><body>
        <h1>Index of /repo</h1>
        <pre><a href="?C=N;O=D">Name</a> <a href="?C=M;O=A">Last modified</a>
        <a href="/">Parent Directory</a>
        <a href="sub/">sub/</a>
        <a href="a.txt">a.txt</a>
        <a href="b%20c.txt">b c.txt</a>
        </pre></body></html>
    )",
                                      page,
                                      0);
    CHECK_FALSE(result.parse_error);
    REQUIRE(result.targets.size() == 4);
    CHECK(urls(result) == std::vector<std::string>{
                              "http://example.test/repo/",
                              "http://example.test/repo/sub/",
                              "http://example.test/repo/a.txt",
                              "http://example.test/repo/b%20c.txt",
                          });
    CHECK(result.targets[0].role == Role::Listing);
    CHECK(result.targets[1].role == Role::Listing);
    CHECK(result.targets[2].role == Role::File);
    CHECK(result.targets[3].role == Role::File);
    for (auto const& target : result.targets) {
        CHECK(target.depth == 1);
        CHECK_FALSE(target.pinned);
    }
}

TEST_CASE("listing drops duplicates and links outside the scope", "[listing]") {
    auto const page = parse("http://example.test/repo/sub/");
    auto const listing = Listing(Scope(parse("http://example.test/repo/")), {});
    auto const result = listing.parse(R"(
        <a href="b.txt">b</a>
        <a href="./b.txt">b again</a>
        <a href="http://example.test:80/repo/sub/b.txt#x">b absolute</a>
        <a href="../../elsewhere/c.txt">outside</a>
        <a href="http://other.test/repo/sub/d.txt">other host</a>
        <a href="https://example.test/repo/sub/e.txt">other scheme</a>
        <a href="../">up</a>
        <a href="">empty</a>
        <a href="http://">broken</a>
        <a name="anchor">no href</a>
    )",
                                      page,
                                      3);
    CHECK(urls(result) == std::vector<std::string>{
                              "http://example.test/repo/sub/b.txt",
                              "http://example.test/repo/",
                          });
    CHECK(result.targets[1].role == Role::Listing);
    CHECK(result.targets[0].depth == 4);
}

TEST_CASE("listing of empty input is empty", "[listing]") {
    auto const page = parse("http://example.test/repo/");
    auto const listing = Listing(Scope(page), {});
    auto const result = listing.parse("", page, 0);
    CHECK(result.targets.empty());
    CHECK_FALSE(result.parse_error);
    CHECK(listing.parse("<html><body>no links</body></html>", page, 0).targets.empty());
}

TEST_CASE("listing honors base href", "[listing]") {
    auto const page = parse("http://example.test/repo/view");
    auto const listing = Listing(Scope(parse("http://example.test/repo/")), {});
    auto const result = listing.parse(R"(
        <html><head><base href="/repo/files/"></head>
        <body><a href="a.txt">a</a></body></html>
    )",
                                      page,
                                      0);
    CHECK(urls(result) == std::vector<std::string>{"http://example.test/repo/files/a.txt"});
}

TEST_CASE("listing with file selector pins files", "[listing]") {
    auto const page = parse("http://forge.test/org/repo/src/branch/main/");
    auto const listing = Listing(Scope(page),
                                 {
                                     .links = "//a[contains(@class, 'dir')]",
                                     .files = "//a[contains(@class, 'file')]",
                                 });
    auto const result = listing.parse(R"(
        <table>
        <tr><td><a class="muted dir" href="/org/repo/src/branch/main/docs">docs</a></td></tr>
        <tr><td><a class="muted file" href="/org/repo/src/branch/main/LICENSE">LICENSE</a></td></tr>
        <tr><td><a class="muted file" href="/org/repo/src/branch/main/main.c">main.c</a></td></tr>
        <tr><td><a class="nav" href="/org/repo/src/branch/main/issues">issues</a></td></tr>
        </table>
    )",
                                      page,
                                      0);
    REQUIRE(result.targets.size() == 3);
    CHECK(result.targets[0].url.path == "/org/repo/src/branch/main/docs");
    CHECK(result.targets[0].role == Role::Listing);
    CHECK(result.targets[1].url.path == "/org/repo/src/branch/main/LICENSE");
    CHECK(result.targets[1].role == Role::File);
    CHECK(result.targets[1].pinned);
    CHECK(result.targets[2].role == Role::File);
    CHECK(result.targets[2].pinned);
}

TEST_CASE("listing rejects invalid xpath", "[listing]") {
    auto const scope = Scope(parse("http://example.test/repo/"));
    CHECK_THROWS_AS(Listing(scope, {.links = "//a[@href"}), std::runtime_error);
    CHECK_THROWS_AS(Listing(scope, {.files = "]]"}), std::runtime_error);
    error_stack().clear();
}

TEST_CASE("listing role names", "[listing]") {
    CHECK(to_string(Role::Listing) == "listing");
    CHECK(to_string(Role::File) == "file");
}
