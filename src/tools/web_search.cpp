#include "web_search.hpp"
#include "web_fetch.hpp"
#include "../diagnostics.hpp"
#include "../util.hpp"
#include <algorithm>

namespace toolgate {

static const char* const kWikidataApi = "https://www.wikidata.org/w/api.php";
static const char* const kWikidataUserAgent = "toolgate/1.0 (Wikidata officeholder)";
static const char* const kWikipediaUserAgent = "toolgate/1.0 (Wikipedia fallback)";
static const char* const kEllipsis = "\xE2\x80\xA6";
static constexpr long kProviderTimeoutSeconds = 10;
static constexpr long kWikipediaTimeoutSeconds = 8;

// ── JSON ────────────────────────────────────────────────────────

void to_json(nlohmann::json& j, const WebSearchResultItem& item) {
    j = nlohmann::json{{"title", item.title}, {"snippet", item.snippet}, {"url", item.url}};
    if (item.page_excerpt) j["page_excerpt"] = *item.page_excerpt;
}

void to_json(nlohmann::json& j, const WebSearchStep& step) {
    j = nlohmann::json{{"name", step.name}, {"ok", step.ok}, {"detail", step.detail}};
}

void to_json(nlohmann::json& j, const WebSearchOutput& out) {
    j = nlohmann::json{
        {"ok", out.ok},
        {"provider", out.provider},
        {"query", out.query},
        {"query_original", out.query_original},
        {"query_rewritten", out.query_rewritten},
        {"recency_days", out.recency_days},
        {"status", out.status},
        {"results", out.results},
        {"result_count", out.result_count()},
        {"steps", out.steps},
    };
    if (out.error) j["error"] = *out.error;
    if (out.suggest_open_browser_search) {
        j["suggest_open_browser_search"] = *out.suggest_open_browser_search;
    }
}

// ── Query analysis ──────────────────────────────────────────────

static bool contains_any(const std::string& haystack, const std::vector<std::string>& needles) {
    return std::any_of(needles.begin(), needles.end(), [&](const std::string& n) {
        return haystack.find(n) != std::string::npos;
    });
}

bool is_time_sensitive_query(const std::string& query) {
    static const std::vector<std::string> patterns = {
        "today", "yesterday", "few days ago", "a few days ago", "latest",
        "current", "this week", "this month", "this year", "recent", "just",
        "super bowl", "superbowl", "winner", "champion", "score", "result",
    };
    return contains_any(to_lower(query), patterns);
}

RewrittenQuery rewrite_web_search_query(const std::string& query, int year,
                                        uint32_t recency_days_default) {
    std::string q = trim(query);
    if (q.empty() || !is_time_sensitive_query(q)) return {q, recency_days_default};
    return {q + " " + std::to_string(year), recency_days_default};
}

bool is_officeholder_query(const std::string& query) {
    static const std::vector<std::string> patterns = {
        "current president of", "who is the president of", "president of the",
        "current prime minister of", "who is the prime minister of", "prime minister of the",
        "current leader of", "who is the leader of", "leader of the",
    };
    return contains_any(to_lower(query), patterns);
}

static std::string canonical_country(const std::string& country) {
    static const std::vector<std::pair<std::vector<std::string>, std::string>> aliases = {
        {{"usa", "us", "u.s.", "u.s.a.", "united states", "america"}, "United States"},
        {{"uk", "u.k.", "united kingdom", "britain", "england"}, "United Kingdom"},
        {{"france"}, "France"},
        {{"germany"}, "Germany"},
        {{"canada"}, "Canada"},
        {{"australia"}, "Australia"},
        {{"india"}, "India"},
        {{"japan"}, "Japan"},
    };
    for (const auto& [names, canonical] : aliases) {
        if (std::find(names.begin(), names.end(), country) != names.end()) return canonical;
    }
    return country;
}

std::optional<OfficeholderQuery> normalize_officeholder_query(const std::string& query) {
    std::string lower = trim(to_lower(query));
    OfficeholderQuery out;
    std::vector<std::string> phrases;
    if (lower.find("prime minister") != std::string::npos) {
        out.property = "P6";
        out.office_label = "prime minister";
        phrases = {"current prime minister of", "who is the prime minister of", "prime minister of the"};
    } else if (lower.find("president") != std::string::npos) {
        out.property = "P35";
        out.office_label = "president";
        phrases = {"current president of", "who is the president of", "president of the"};
    } else if (lower.find("leader") != std::string::npos) {
        out.property = "P35";
        out.office_label = "leader";
        phrases = {"current leader of", "who is the leader of", "leader of the"};
    } else {
        return std::nullopt;
    }

    std::string rest = lower;
    for (const auto& p : phrases) rest = replace_all(rest, p, "");
    rest = trim(rest);
    auto is_punct = [](char c) { return c == '.' || c == '?' || c == ','; };
    while (!rest.empty() && is_punct(rest.front())) rest.erase(rest.begin());
    while (!rest.empty() && is_punct(rest.back())) rest.pop_back();
    rest = trim(rest);
    if (starts_with(rest, "the ")) rest = trim(rest.substr(4));
    if (rest.empty()) return std::nullopt;

    out.country = canonical_country(rest);
    return out;
}

// ── DuckDuckGo ──────────────────────────────────────────────────

std::string make_result_title(const std::string& text) {
    std::string first = trim(text.substr(0, text.find('\n')));
    if (utf8_length(first) > kMaxTitleChars) {
        return utf8_prefix(first, kMaxTitleChars - 3) + kEllipsis;
    }
    return first;
}

static std::optional<WebSearchResultItem> topic_result(const nlohmann::json& obj) {
    if (!obj.is_object()) return std::nullopt;
    auto text = obj.find("Text");
    auto url = obj.find("FirstURL");
    if (text == obj.end() || !text->is_string() || url == obj.end() || !url->is_string()) {
        return std::nullopt;
    }
    std::string t = text->get<std::string>();
    std::string u = url->get<std::string>();
    if (t.empty() || u.empty()) return std::nullopt;
    return WebSearchResultItem{make_result_title(t), t, u, std::nullopt};
}

static std::string string_field(const nlohmann::json& obj, const char* key) {
    auto it = obj.find(key);
    return it != obj.end() && it->is_string() ? it->get<std::string>() : std::string();
}

std::vector<WebSearchResultItem> parse_duckduckgo_results(const nlohmann::json& body,
                                                          size_t max_results) {
    std::vector<WebSearchResultItem> results;
    if (!body.is_object()) return results;

    std::string abstract_text = trim(string_field(body, "Abstract"));
    std::string abstract_url = trim(string_field(body, "AbstractURL"));
    if (!abstract_text.empty() && !abstract_url.empty()) {
        results.push_back({make_result_title(abstract_text), abstract_text, abstract_url, std::nullopt});
    }

    auto topics = body.find("RelatedTopics");
    if (topics == body.end() || !topics->is_array()) return results;

    for (const auto& topic : *topics) {
        if (results.size() >= max_results) break;
        if (!topic.is_object()) continue;
        auto group = topic.find("Topics");
        if (group != topic.end()) {
            if (!group->is_array()) continue;
            for (const auto& item : *group) {
                if (results.size() >= max_results) break;
                if (auto r = topic_result(item)) results.push_back(std::move(*r));
            }
        } else if (auto r = topic_result(topic)) {
            results.push_back(std::move(*r));
        }
    }
    return results;
}

std::string duckduckgo_api_url(const std::string& query) {
    return "https://api.duckduckgo.com/?q=" + url_encode(trim(query)) + "&format=json";
}

static std::vector<Header> duckduckgo_headers() {
    return {{"User-Agent", kBrowserUserAgent}, {"Accept-Language", "en-US,en;q=0.9"}};
}

std::optional<std::string> duckduckgo_first_result_url(HttpClient& http, const std::string& query) {
    if (trim(query).empty()) return std::nullopt;
    HttpResponse res = http.get(duckduckgo_api_url(query), duckduckgo_headers(),
                                kProviderTimeoutSeconds);
    if (!res.ok()) return std::nullopt;
    auto body = nlohmann::json::parse(res.body, nullptr, false);
    if (body.is_discarded()) return std::nullopt;
    auto results = parse_duckduckgo_results(body, 1);
    if (results.empty()) return std::nullopt;
    return results.front().url;
}

// ── Orchestrator ────────────────────────────────────────────────

WebSearchOrchestrator::WebSearchOrchestrator(HttpClient& http, YearProvider year,
                                             uint32_t recency_days_default)
    : http_(http),
      year_(year ? std::move(year) : YearProvider(current_year)),
      recency_days_default_(recency_days_default) {}

static nlohmann::json get_json(HttpClient& http, const std::string& url,
                               const char* user_agent, long timeout) {
    HttpResponse res = http.get(url, {{"User-Agent", user_agent}}, timeout);
    if (!res.ok()) return nlohmann::json(nlohmann::json::value_t::discarded);
    return nlohmann::json::parse(res.body, nullptr, false);
}

std::vector<WebSearchResultItem> WebSearchOrchestrator::officeholder_lookup(const std::string& query) {
    auto office = normalize_officeholder_query(query);
    if (!office) return {};
    const std::string api = kWikidataApi;

    auto search = get_json(http_, api + "?action=wbsearchentities&format=json&language=en"
                                        "&type=item&search=" + url_encode(office->country) +
                                        "&limit=1",
                           kWikidataUserAgent, kProviderTimeoutSeconds);
    if (search.is_discarded() || !search.is_object()) return {};
    auto hits = search.find("search");
    if (hits == search.end() || !hits->is_array() || hits->empty()) return {};
    std::string country_id = string_field((*hits)[0], "id");
    if (country_id.empty()) return {};

    auto country = get_json(http_, api + "?action=wbgetentities&format=json&ids=" +
                                       url_encode(country_id) + "&props=claims&languages=en",
                            kWikidataUserAgent, kProviderTimeoutSeconds);
    if (country.is_discarded()) return {};
    nlohmann::json::json_pointer claim_ptr("/entities/" + country_id + "/claims/" +
                                           office->property + "/0/mainsnak/datavalue/value/id");
    if (!country.contains(claim_ptr) || !country[claim_ptr].is_string()) return {};
    std::string person_id = country[claim_ptr].get<std::string>();

    auto person = get_json(http_, api + "?action=wbgetentities&format=json&ids=" +
                                      url_encode(person_id) +
                                      "&props=labels%7Csitelinks&languages=en",
                           kWikidataUserAgent, kProviderTimeoutSeconds);
    if (person.is_discarded()) return {};

    std::string base = "/entities/" + person_id;
    nlohmann::json::json_pointer label_ptr(base + "/labels/en/value");
    nlohmann::json::json_pointer sitelink_ptr(base + "/sitelinks/enwiki/title");
    std::string name = "Unknown";
    if (person.contains(label_ptr) && person[label_ptr].is_string()) {
        name = person[label_ptr].get<std::string>();
    }
    std::string url = "https://www.wikidata.org/wiki/" + person_id;
    if (person.contains(sitelink_ptr) && person[sitelink_ptr].is_string()) {
        url = "https://en.wikipedia.org/wiki/" +
              replace_all(person[sitelink_ptr].get<std::string>(), " ", "_");
    }

    std::string snippet = "Current " + office->office_label + " of " + office->country +
                          " is " + name + ". Source: " + url;
    return {WebSearchResultItem{make_result_title(name), snippet, url, std::nullopt}};
}

static std::string office_search_term(const OfficeholderQuery& office) {
    if (office.office_label == "president") return "President of " + office.country;
    if (office.office_label == "prime minister") return "Prime Minister of " + office.country;
    return office.office_label + " of " + office.country;
}

std::vector<WebSearchResultItem> WebSearchOrchestrator::encyclopedia_lookup(const std::string& query,
                                                                            bool office_mode) {
    std::string q = trim(query);
    if (q.empty()) return {};

    std::string term = q;
    if (office_mode && is_officeholder_query(q)) {
        if (auto office = normalize_officeholder_query(q)) term = office_search_term(*office);
    }

    auto search = get_json(http_, "https://en.wikipedia.org/w/rest.php/v1/search/page?q=" +
                                      url_encode(term) + "&limit=10",
                           kWikipediaUserAgent, kWikipediaTimeoutSeconds);
    if (search.is_discarded() || !search.is_object()) return {};
    auto pages = search.find("pages");
    if (pages == search.end() || !pages->is_array()) return {};

    std::string title;
    for (const auto& page : *pages) {
        std::string t = page.is_object() ? string_field(page, "title") : std::string();
        if (t.empty()) continue;
        if (office_mode && starts_with(to_lower(t), "list of ")) continue;
        title = t;
        break;
    }
    if (title.empty()) return {};

    std::string slug = replace_all(title, " ", "_");
    auto summary = get_json(http_, "https://en.wikipedia.org/api/rest_v1/page/summary/" +
                                       url_encode(slug),
                            kWikipediaUserAgent, kWikipediaTimeoutSeconds);
    if (summary.is_discarded() || !summary.is_object()) return {};

    return {WebSearchResultItem{make_result_title(title), string_field(summary, "extract"),
                                "https://en.wikipedia.org/wiki/" + slug, std::nullopt}};
}

void WebSearchOrchestrator::attach_page_excerpts(std::vector<WebSearchResultItem>& results) {
    size_t limit = std::min(results.size(), kPageExcerptMaxResults);
    for (size_t i = 0; i < limit; ++i) {
        if (auto excerpt = fetch_text(http_, results[i].url, kPageExcerptMaxChars,
                                      kPageExcerptTimeoutSeconds)) {
            results[i].page_excerpt = std::move(*excerpt);
        }
    }
}

// Runs only when the provider returned nothing. Time-sensitive questions
// that are not about an officeholder skip the encyclopedia: a summary page
// would be stale, so the caller is pointed at a live browser view instead.
void WebSearchOrchestrator::fallback_chain(const std::string& query, WebSearchOutput& out) {
    bool time_sensitive = is_time_sensitive_query(query);
    bool officeholder = is_officeholder_query(query);

    if (time_sensitive && !officeholder) {
        out.suggest_open_browser_search = true;
        out.steps.push_back({"fallback_skipped", false,
                             "time-sensitive query: Wikipedia not used; suggest open_browser_search"});
        return;
    }

    if (officeholder) {
        auto results = officeholder_lookup(query);
        if (!results.empty()) {
            out.results = std::move(results);
            out.provider = "wikidata_officeholder";
            out.steps.push_back({"wikidata_officeholder", true,
                                 std::to_string(out.result_count()) + " result(s)"});
            return;
        }
        results = encyclopedia_lookup(query, true);
        if (!results.empty()) {
            out.results = std::move(results);
            out.provider = "wikipedia_fallback";
            out.steps.push_back({"wikipedia_fallback", true,
                                 std::to_string(out.result_count()) + " result(s), office summary"});
            return;
        }
        out.steps.push_back({"wikidata_officeholder", false, "no results"});
    }

    // Officeholder queries that found nothing still get the plain lookup,
    // but their failure is already recorded above.
    auto results = encyclopedia_lookup(query, false);
    if (!results.empty()) {
        out.results = std::move(results);
        out.provider = "wikipedia_fallback";
        out.steps.push_back({"wikipedia_fallback", true,
                             std::to_string(out.result_count()) + " result(s)"});
    } else if (!officeholder) {
        out.steps.push_back({"wikipedia_fallback", false, "no results"});
    }
}

WebSearchOutput WebSearchOrchestrator::run(const WebSearchRequest& request, DiagnosticTrace& trace) {
    uint32_t max_results = std::clamp<uint32_t>(request.max_results, 1, kMaxSearchResults);
    RewrittenQuery rewritten = rewrite_web_search_query(request.query, year_(),
                                                        recency_days_default_);

    WebSearchOutput out;
    out.query = rewritten.query;
    out.query_original = request.query;
    out.query_rewritten = rewritten.query;
    out.recency_days = rewritten.recency_days;

    trace.info("Step 1: validate config (provider: DuckDuckGo, no API key required)",
               {{"query_original", request.query},
                {"query_rewritten", rewritten.query},
                {"recency_days", rewritten.recency_days},
                {"max_results", max_results},
                {"provider", "duckduckgo"}});
    out.steps.push_back({"validate", true, "config ok"});

    trace.info("Step 2: network check / request start");
    HttpResponse res = http_.get(duckduckgo_api_url(rewritten.query), duckduckgo_headers(),
                                 kProviderTimeoutSeconds);

    if (res.status_code == 0) {
        std::string detail = res.error.empty() ? "no response" : res.error;
        out.steps.push_back({"request", false, detail});
        out.steps.push_back({"done", false, "request failed"});
        out.error = "web_search request failed: " + detail;
        trace.error("Step 2 failed: " + detail);
        trace.info("Step 5: done (with error)");
        return out;
    }

    out.status = res.status_code;
    trace.info("Step 3: response status " + std::to_string(res.status_code),
               {{"status", res.status_code}});
    out.steps.push_back({"request", true, "HTTP " + std::to_string(res.status_code)});

    if (!res.ok()) {
        out.steps.push_back({"parse", false, "HTTP error"});
        out.steps.push_back({"done", false, "status not success"});
        out.error = "HTTP " + std::to_string(res.status_code);
        trace.error("Step 3 failed: provider returned HTTP " + std::to_string(res.status_code),
                    {{"status", res.status_code}});
        trace.info("Step 5: done (with error)");
        return out;
    }

    nlohmann::json body;
    try {
        body = nlohmann::json::parse(res.body);
    } catch (const nlohmann::json::exception& e) {
        out.steps.push_back({"parse", false, e.what()});
        out.steps.push_back({"done", false, "parse failed"});
        out.error = e.what();
        trace.error(std::string("Step 4: parse failed: ") + e.what());
        trace.info("Step 5: done (with error)");
        return out;
    }

    out.results = parse_duckduckgo_results(body, max_results);
    trace.info("Step 4: parse results count " + std::to_string(out.result_count()),
               {{"result_count", out.result_count()}});
    out.steps.push_back({"parse", true, "result_count " + std::to_string(out.result_count())});

    if (out.results.empty()) {
        trace.info("Step 4b: fallback selection (DDG returned 0 results)");
        fallback_chain(request.query, out);
    }

    if (request.include_page_excerpts && !out.results.empty()) {
        attach_page_excerpts(out.results);
        size_t with_excerpts = std::count_if(out.results.begin(), out.results.end(),
            [](const WebSearchResultItem& r) { return r.page_excerpt.has_value(); });
        trace.info("Step 4c: page excerpts fetched for " + std::to_string(with_excerpts) +
                   " result(s)",
                   {{"include_page_excerpts", true}, {"with_excerpts", with_excerpts}});
    }

    out.ok = true;
    trace.info("Step 5: done",
               {{"result_count", out.result_count()},
                {"provider", out.provider},
                {"suggest_open_browser_search", out.suggest_open_browser_search
                     ? nlohmann::json(*out.suggest_open_browser_search) : nlohmann::json(nullptr)}});
    out.steps.push_back({"done", true, std::to_string(out.result_count()) + " result(s)"});
    return out;
}

ToolResult WebSearchOrchestrator::search(const WebSearchRequest& request, DiagnosticTrace& trace) {
    WebSearchOutput out = run(request, trace);
    ToolResult result;
    result.ok = out.ok;
    result.content = nlohmann::json(out).dump();
    result.error = out.error;
    return result;
}

} // namespace toolgate
