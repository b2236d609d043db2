#include "listing.hpp"

#include <libxml/HTMLparser.h>
#include <libxml/tree.h>
#include <libxml/xpath.h>
#include <libxml/xpathInternals.h>

#include <climits>
#include <memory>
#include <unordered_set>

using namespace dsum;

struct XmlInit {
    XmlInit() noexcept { xmlInitParser(); }
    ~XmlInit() noexcept { xmlCleanupParser(); }
};

struct XmlDocDeleter {
    void operator()(xmlDoc* doc) const noexcept { xmlFreeDoc(doc); }
};

struct XPathContextDeleter {
    void operator()(xmlXPathContext* ctx) const noexcept { xmlXPathFreeContext(ctx); }
};

struct XPathObjectDeleter {
    void operator()(xmlXPathObject* obj) const noexcept { xmlXPathFreeObject(obj); }
};

using XmlDoc = std::unique_ptr<xmlDoc, XmlDocDeleter>;
using XPathContext = std::unique_ptr<xmlXPathContext, XPathContextDeleter>;
using XPathObject = std::unique_ptr<xmlXPathObject, XPathObjectDeleter>;

static auto check_xpath(std::string const& expr) -> void {
    dsum_trace("xpath: %s", expr.c_str());
    auto comp = xmlXPathCompile(BAD_CAST expr.c_str());
    dsum_assert(comp != nullptr);
    xmlXPathFreeCompExpr(comp);
}

static auto eval_nodes(xmlXPathContext* ctx, std::string const& expr) -> XPathObject {
    auto obj = XPathObject(xmlXPathEvalExpression(BAD_CAST expr.c_str(), ctx));
    if (!obj || obj->type != XPATH_NODESET || !obj->nodesetval) {
        return {};
    }
    xmlXPathNodeSetSort(obj->nodesetval);
    return obj;
}

static auto node_href(xmlNode* node) -> std::string {
    xmlChar* value = nullptr;
    switch (node->type) {
        case XML_ELEMENT_NODE:
            value = xmlGetProp(node, BAD_CAST "href");
            break;
        case XML_ATTRIBUTE_NODE:
        case XML_TEXT_NODE:
            value = xmlNodeGetContent(node);
            break;
        default:
            break;
    }
    if (!value) {
        return {};
    }
    auto result = std::string((char const*)value);
    xmlFree(value);
    return result;
}

Listing::Listing(Scope scope, Options options) : scope_(std::move(scope)), options_(std::move(options)) {
    static auto init = XmlInit{};
    check_xpath(options_.links);
    if (!options_.files.empty()) {
        check_xpath(options_.files);
    }
}

auto Listing::classify(Url const& page, Url url, std::uint32_t depth, bool pinned) const -> Target {
    if (pinned) {
        return {std::move(url), Role::File, depth, true};
    }
    if (Scope::is_self_or_ancestor(page, url)) {
        // Sort and view variants of the same page collapse onto the page itself.
        url.query.clear();
        if (!url.is_dir() && url.path.size() < page.path.size()) {
            url.path += '/';
        }
        return {std::move(url), Role::Listing, depth};
    }
    // With a file selector every other selected link is a listing.
    if (url.is_dir() || !options_.files.empty()) {
        return {std::move(url), Role::Listing, depth};
    }
    return {std::move(url), Role::File, depth};
}

auto Listing::parse(std::string_view html, Url const& page, std::uint32_t depth) const -> Result {
    auto result = Result{};
    if (str_strip(html).empty()) {
        return result;
    }
    if (html.size() > INT_MAX) {
        result.parse_error = true;
        return result;
    }

    auto const page_url = page.str();
    auto doc = XmlDoc(htmlReadMemory(html.data(),
                                     (int)html.size(),
                                     page_url.c_str(),
                                     nullptr,
                                     HTML_PARSE_RECOVER | HTML_PARSE_NOERROR | HTML_PARSE_NOWARNING | HTML_PARSE_NONET));
    if (!doc || !xmlDocGetRootElement(doc.get())) {
        result.parse_error = true;
        return result;
    }
    auto ctx = XPathContext(xmlXPathNewContext(doc.get()));
    dsum_assert(ctx);

    auto base = page;
    if (auto bases = eval_nodes(ctx.get(), "//base[@href]"); bases && bases->nodesetval->nodeNr > 0) {
        if (auto resolved = page.resolve(node_href(bases->nodesetval->nodeTab[0]))) {
            base = std::move(*resolved);
        }
    }

    auto pinned = std::unordered_set<xmlNode*>{};
    auto expr = options_.links;
    if (!options_.files.empty()) {
        if (auto files = eval_nodes(ctx.get(), options_.files)) {
            for (int i = 0; i != files->nodesetval->nodeNr; ++i) {
                pinned.insert(files->nodesetval->nodeTab[i]);
            }
        }
        expr = fmt::format("({}) | ({})", options_.links, options_.files);
    }

    auto nodes = eval_nodes(ctx.get(), expr);
    if (!nodes) {
        return result;
    }
    auto seen = std::unordered_set<std::string>{};
    for (int i = 0; i != nodes->nodesetval->nodeNr; ++i) {
        auto node = nodes->nodesetval->nodeTab[i];
        auto href = node_href(node);
        if (str_strip(href).empty()) {
            continue;
        }
        auto url = base.resolve(href);
        if (!url) {
            continue;
        }
        auto target = classify(page, std::move(*url), depth + 1, pinned.contains(node));
        if (!scope_.contains(target.url)) {
            continue;
        }
        if (!seen.insert(target.url.str()).second) {
            continue;
        }
        result.targets.push_back(std::move(target));
    }
    return result;
}
