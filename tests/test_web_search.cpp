#include <catch2/catch.hpp>
#include "tools/web_search.hpp"
#include "diagnostics.hpp"
#include "mock_http_client.hpp"
#include "util.hpp"

using namespace toolgate;

static const std::string kEllipsis = "\xE2\x80\xA6";

static const char* const kFranceSearch = R"({"search":[{"id":"Q142","label":"France"}]})";
static const char* const kFranceClaims = R"({
    "entities": {"Q142": {"claims": {"P35": [
        {"mainsnak": {"datavalue": {"value": {"id": "Q3052772"}}}}
    ]}}}
})";
static const char* const kMacronLabels = R"({
    "entities": {"Q3052772": {
        "labels": {"en": {"value": "Emmanuel Macron"}},
        "sitelinks": {"enwiki": {"title": "Emmanuel Macron"}}
    }}
})";

static WebSearchOrchestrator make_orchestrator(MockHttpClient& http) {
    return WebSearchOrchestrator(http, [] { return 2025; });
}

static bool has_step(const WebSearchOutput& out, const std::string& name, bool ok) {
    for (const auto& s : out.steps) {
        if (s.name == name && s.ok == ok) return true;
    }
    return false;
}

// ── Query analysis ──────────────────────────────────────────────

TEST_CASE("is_time_sensitive_query: lexicon match", "[web_search]") {
    REQUIRE(is_time_sensitive_query("Who won the Super Bowl"));
    REQUIRE(is_time_sensitive_query("latest rust release"));
    REQUIRE(is_time_sensitive_query("today's weather in Paris"));
    REQUIRE_FALSE(is_time_sensitive_query("history of the printing press"));
}

TEST_CASE("rewrite_web_search_query: appends year to time-sensitive queries", "[web_search]") {
    auto r = rewrite_web_search_query("  latest rust release ", 2025);
    REQUIRE(r.query == "latest rust release 2025");
    REQUIRE(r.recency_days == kDefaultRecencyDays);

    auto plain = rewrite_web_search_query("  printing press  ", 2025, 7);
    REQUIRE(plain.query == "printing press");
    REQUIRE(plain.recency_days == 7);
}

TEST_CASE("is_officeholder_query: phrases", "[web_search]") {
    REQUIRE(is_officeholder_query("Who is the President of France?"));
    REQUIRE(is_officeholder_query("current prime minister of japan"));
    REQUIRE_FALSE(is_officeholder_query("president's day sales"));
}

TEST_CASE("normalize_officeholder_query: office and country", "[web_search]") {
    auto fr = normalize_officeholder_query("Who is the president of France?");
    REQUIRE(fr.has_value());
    REQUIRE(fr->country == "France");
    REQUIRE(fr->property == "P35");
    REQUIRE(fr->office_label == "president");

    auto uk = normalize_officeholder_query("current prime minister of the UK");
    REQUIRE(uk.has_value());
    REQUIRE(uk->country == "United Kingdom");
    REQUIRE(uk->property == "P6");

    auto us = normalize_officeholder_query("who is the leader of usa");
    REQUIRE(us.has_value());
    REQUIRE(us->country == "United States");
    REQUIRE(us->office_label == "leader");

    REQUIRE_FALSE(normalize_officeholder_query("who is the president of").has_value());
    REQUIRE_FALSE(normalize_officeholder_query("weather today").has_value());
}

// ── DuckDuckGo parsing ──────────────────────────────────────────

TEST_CASE("make_result_title: first line, truncated to 120 code points", "[web_search]") {
    REQUIRE(make_result_title("  Rust  \nsecond line") == "Rust");

    std::string long_text(200, 'a');
    std::string title = make_result_title(long_text);
    REQUIRE(utf8_length(title) == kMaxTitleChars);
    REQUIRE(title == std::string(117, 'a') + kEllipsis);

    REQUIRE(make_result_title(std::string(120, 'b')) == std::string(120, 'b'));
}

TEST_CASE("parse_duckduckgo_results: abstract then topics", "[web_search]") {
    auto body = nlohmann::json::parse(R"({
        "Abstract": "Rust is a language.",
        "AbstractURL": "https://en.wikipedia.org/wiki/Rust",
        "RelatedTopics": [
            {"Text": "Cargo - package manager", "FirstURL": "https://duckduckgo.com/Cargo"},
            {"Name": "Group", "Topics": [
                {"Text": "Nested one", "FirstURL": "https://duckduckgo.com/N1"},
                {"Text": "", "FirstURL": "https://duckduckgo.com/empty"},
                {"Text": "No url"}
            ]},
            {"Text": "Last", "FirstURL": "https://duckduckgo.com/Last"}
        ]
    })");

    auto results = parse_duckduckgo_results(body, 10);
    REQUIRE(results.size() == 4);
    REQUIRE(results[0].title == "Rust is a language.");
    REQUIRE(results[0].url == "https://en.wikipedia.org/wiki/Rust");
    REQUIRE(results[1].snippet == "Cargo - package manager");
    REQUIRE(results[2].url == "https://duckduckgo.com/N1");
    REQUIRE(results[3].title == "Last");
    for (const auto& r : results) REQUIRE_FALSE(r.url.empty());
}

TEST_CASE("parse_duckduckgo_results: respects max_results", "[web_search]") {
    auto body = nlohmann::json::parse(R"({
        "RelatedTopics": [
            {"Text": "A", "FirstURL": "https://a"},
            {"Topics": [{"Text": "B", "FirstURL": "https://b"}, {"Text": "C", "FirstURL": "https://c"}]},
            {"Text": "D", "FirstURL": "https://d"}
        ]
    })");

    auto results = parse_duckduckgo_results(body, 2);
    REQUIRE(results.size() == 2);
    REQUIRE(results[1].title == "B");
}

TEST_CASE("parse_duckduckgo_results: abstract without URL skipped", "[web_search]") {
    auto body = nlohmann::json::parse(R"({"Abstract": "text", "AbstractURL": ""})");
    REQUIRE(parse_duckduckgo_results(body, 5).empty());
    REQUIRE(parse_duckduckgo_results(nlohmann::json::array(), 5).empty());
}

TEST_CASE("duckduckgo_api_url: encodes the query", "[web_search]") {
    REQUIRE(duckduckgo_api_url(" rust lang ") ==
            "https://api.duckduckgo.com/?q=rust%20lang&format=json");
}

// ── Orchestrator: provider path ─────────────────────────────────

TEST_CASE("WebSearchOrchestrator: provider results with excerpts", "[web_search]") {
    MockHttpClient http;
    http.route("api.duckduckgo.com", 200, R"({
        "Abstract": "Rust is a language.",
        "AbstractURL": "https://www.rust-lang.org/",
        "RelatedTopics": [{"Text": "Cargo", "FirstURL": "https://doc.rust-lang.org/cargo"}]
    })");
    http.route("www.rust-lang.org", 200, "<p>Fast and reliable.</p>");
    http.route("doc.rust-lang.org", 500, "");
    auto search = make_orchestrator(http);
    DiagnosticTrace trace("web_search");

    auto out = search.run({"rust programming", 5, true}, trace);

    REQUIRE(out.ok);
    REQUIRE(out.provider == "duckduckgo");
    REQUIRE(out.status == 200);
    REQUIRE(out.result_count() == 2);
    REQUIRE(out.results[0].page_excerpt == std::optional<std::string>("Fast and reliable."));
    REQUIRE_FALSE(out.results[1].page_excerpt.has_value());
    REQUIRE_FALSE(out.error.has_value());
    REQUIRE(trace.steps().back().message == "Step 5: done");
    REQUIRE(trace.steps().back().meta["result_count"] == 2);
}

TEST_CASE("WebSearchOrchestrator: time-sensitive query is rewritten", "[web_search]") {
    MockHttpClient http;
    http.route("api.duckduckgo.com", 200,
               R"({"RelatedTopics": [{"Text": "Result", "FirstURL": "https://r.example"}]})");
    auto search = make_orchestrator(http);
    DiagnosticTrace trace("web_search");

    auto out = search.run({"latest rust release", 5, false}, trace);

    REQUIRE(out.query_original == "latest rust release");
    REQUIRE(out.query_rewritten == "latest rust release 2025");
    REQUIRE(out.query == "latest rust release 2025");
    REQUIRE(http.requested("q=latest%20rust%20release%202025"));
    REQUIRE_FALSE(http.requested("r.example"));
}

TEST_CASE("WebSearchOrchestrator: max_results clamped", "[web_search]") {
    MockHttpClient http;
    std::string topics;
    for (int i = 0; i < 15; ++i) {
        if (i) topics += ",";
        topics += R"({"Text": "T)" + std::to_string(i) + R"(", "FirstURL": "https://t)" +
                  std::to_string(i) + R"("})";
    }
    http.route("api.duckduckgo.com", 200, R"({"RelatedTopics": [)" + topics + "]}");
    auto search = make_orchestrator(http);

    DiagnosticTrace t1("web_search");
    REQUIRE(search.run({"topics", 50, false}, t1).result_count() == kMaxSearchResults);
    DiagnosticTrace t2("web_search");
    REQUIRE(search.run({"topics", 0, false}, t2).result_count() == 1);
}

TEST_CASE("WebSearchOrchestrator: excerpts limited to first four results", "[web_search]") {
    MockHttpClient http;
    std::string topics;
    for (int i = 0; i < 6; ++i) {
        if (i) topics += ",";
        topics += R"({"Text": "T)" + std::to_string(i) + R"(", "FirstURL": "https://page)" +
                  std::to_string(i) + R"(.example"})";
    }
    http.route("api.duckduckgo.com", 200, R"({"RelatedTopics": [)" + topics + "]}");
    http.next_response = {200, "<p>excerpt</p>", "", false};
    auto search = make_orchestrator(http);
    DiagnosticTrace trace("web_search");

    auto out = search.run({"pages", 6, true}, trace);

    REQUIRE(out.result_count() == 6);
    for (size_t i = 0; i < 4; ++i) REQUIRE(out.results[i].page_excerpt.has_value());
    REQUIRE_FALSE(out.results[4].page_excerpt.has_value());
    REQUIRE_FALSE(http.requested("page4.example"));
}

// ── Orchestrator: failures ──────────────────────────────────────

TEST_CASE("WebSearchOrchestrator: transport failure", "[web_search]") {
    MockHttpClient http;
    http.next_response = transport_failure("Could not resolve host");
    auto search = make_orchestrator(http);
    DiagnosticTrace trace("web_search");

    auto out = search.run({"anything", 5, true}, trace);

    REQUIRE_FALSE(out.ok);
    REQUIRE(out.status == 0);
    REQUIRE(out.result_count() == 0);
    REQUIRE(out.error.has_value());
    REQUIRE(out.error->find("Could not resolve host") != std::string::npos);
    REQUIRE(has_step(out, "request", false));
    REQUIRE(http.call_count == 1);
}

TEST_CASE("WebSearchOrchestrator: HTTP error status", "[web_search]") {
    MockHttpClient http;
    http.route("api.duckduckgo.com", 500, "oops");
    auto search = make_orchestrator(http);
    DiagnosticTrace trace("web_search");

    auto out = search.run({"anything", 5, true}, trace);

    REQUIRE_FALSE(out.ok);
    REQUIRE(out.status == 500);
    REQUIRE(out.error == std::optional<std::string>("HTTP 500"));
    bool logged = false;
    for (const auto& s : trace.steps()) {
        if (s.level == DiagnosticLevel::Error &&
            s.message == "Step 3 failed: provider returned HTTP 500") logged = true;
    }
    REQUIRE(logged);
}

TEST_CASE("WebSearchOrchestrator: unparseable body", "[web_search]") {
    MockHttpClient http;
    http.route("api.duckduckgo.com", 200, "<html>not json</html>");
    auto search = make_orchestrator(http);
    DiagnosticTrace trace("web_search");

    auto out = search.run({"anything", 5, true}, trace);

    REQUIRE_FALSE(out.ok);
    REQUIRE(out.status == 200);
    REQUIRE(out.error.has_value());
    REQUIRE(has_step(out, "parse", false));
}

// ── Orchestrator: fallback chain ────────────────────────────────

TEST_CASE("WebSearchOrchestrator: officeholder answered from Wikidata", "[web_search]") {
    MockHttpClient http;
    http.route("api.duckduckgo.com", 200, "{}");
    http.route("wbsearchentities", 200, kFranceSearch);
    http.route("ids=Q142", 200, kFranceClaims);
    http.route("ids=Q3052772", 200, kMacronLabels);
    auto search = make_orchestrator(http);
    DiagnosticTrace trace("web_search");

    auto out = search.run({"Who is the president of France?", 5, true}, trace);

    REQUIRE(out.ok);
    REQUIRE(out.provider == "wikidata_officeholder");
    REQUIRE(out.result_count() == 1);
    REQUIRE(out.results[0].title == "Emmanuel Macron");
    REQUIRE(out.results[0].url == "https://en.wikipedia.org/wiki/Emmanuel_Macron");
    REQUIRE(out.results[0].snippet.find("Current president of France is Emmanuel Macron") !=
            std::string::npos);
    REQUIRE(has_step(out, "wikidata_officeholder", true));
    REQUIRE_FALSE(http.requested("en.wikipedia.org/w/rest.php"));
    REQUIRE(http.requested("search=France"));
}

TEST_CASE("WebSearchOrchestrator: officeholder falls back to Wikipedia office page", "[web_search]") {
    MockHttpClient http;
    http.route("api.duckduckgo.com", 200, "{}");
    http.route("wbsearchentities", 200, R"({"search": []})");
    http.route("rest.php/v1/search/page", 200,
               R"({"pages": [{"title": "List of presidents of France"}, {"title": "President of France"}]})");
    http.route("page/summary/President_of_France", 200,
               R"({"extract": "The president of France is the head of state."})");
    auto search = make_orchestrator(http);
    DiagnosticTrace trace("web_search");

    auto out = search.run({"who is the president of France", 5, false}, trace);

    REQUIRE(out.ok);
    REQUIRE(out.provider == "wikipedia_fallback");
    REQUIRE(out.result_count() == 1);
    REQUIRE(out.results[0].title == "President of France");
    REQUIRE(out.results[0].url == "https://en.wikipedia.org/wiki/President_of_France");
    REQUIRE(out.results[0].snippet == "The president of France is the head of state.");
    REQUIRE(http.requested("q=President%20of%20France"));
}

TEST_CASE("WebSearchOrchestrator: officeholder miss falls through to plain Wikipedia search",
          "[web_search]") {
    MockHttpClient http;
    http.route("api.duckduckgo.com", 200, "{}");
    http.route("wbsearchentities", 200, R"({"search": []})");
    http.route("search/page?q=President%20of%20France", 200,
               R"({"pages": [{"title": "List of presidents of France"}]})");
    http.route("search/page?q=who", 200, R"({"pages": [{"title": "Emmanuel Macron"}]})");
    http.route("page/summary/Emmanuel_Macron", 200,
               R"({"extract": "Emmanuel Macron is the president of France."})");
    auto search = make_orchestrator(http);
    DiagnosticTrace trace("web_search");

    auto out = search.run({"who is the president of France", 5, false}, trace);

    REQUIRE(out.ok);
    REQUIRE(out.provider == "wikipedia_fallback");
    REQUIRE(out.result_count() == 1);
    REQUIRE(out.results[0].title == "Emmanuel Macron");
    REQUIRE(out.results[0].url == "https://en.wikipedia.org/wiki/Emmanuel_Macron");
    REQUIRE(has_step(out, "wikidata_officeholder", false));
    REQUIRE(has_step(out, "wikipedia_fallback", true));
    REQUIRE(http.requested("search/page?q=who"));
}

TEST_CASE("WebSearchOrchestrator: officeholder with no answers records one failure step",
          "[web_search]") {
    MockHttpClient http;
    http.route("api.duckduckgo.com", 200, "{}");
    http.route("wbsearchentities", 200, R"({"search": []})");
    http.route("rest.php/v1/search/page", 200, R"({"pages": []})");
    auto search = make_orchestrator(http);
    DiagnosticTrace trace("web_search");

    auto out = search.run({"who is the president of France", 5, false}, trace);

    REQUIRE(out.ok);
    REQUIRE(out.result_count() == 0);
    REQUIRE(has_step(out, "wikidata_officeholder", false));
    REQUIRE_FALSE(has_step(out, "wikipedia_fallback", false));
    REQUIRE(http.requested("search/page?q=who"));
}

TEST_CASE("WebSearchOrchestrator: time-sensitive query skips Wikipedia", "[web_search]") {
    MockHttpClient http;
    http.route("api.duckduckgo.com", 200, "{}");
    auto search = make_orchestrator(http);
    DiagnosticTrace trace("web_search");

    auto out = search.run({"today's weather in Paris", 5, true}, trace);

    REQUIRE(out.ok);
    REQUIRE(out.result_count() == 0);
    REQUIRE(out.suggest_open_browser_search == std::optional<bool>(true));
    REQUIRE(has_step(out, "fallback_skipped", false));
    REQUIRE_FALSE(http.requested("wikipedia.org"));
    REQUIRE_FALSE(http.requested("wikidata.org"));
    REQUIRE(trace.steps().back().meta["suggest_open_browser_search"] == true);
}

TEST_CASE("WebSearchOrchestrator: general query falls back to Wikipedia", "[web_search]") {
    MockHttpClient http;
    http.route("api.duckduckgo.com", 200, R"({"RelatedTopics": []})");
    http.route("rest.php/v1/search/page", 200,
               R"({"pages": [{"title": "Printing press"}]})");
    http.route("page/summary/Printing_press", 200,
               R"({"extract": "A printing press is a mechanical device."})");
    http.route("wiki/Printing_press", 200, "<p>Gutenberg</p>");
    auto search = make_orchestrator(http);
    DiagnosticTrace trace("web_search");

    auto out = search.run({"printing press", 5, true}, trace);

    REQUIRE(out.ok);
    REQUIRE(out.provider == "wikipedia_fallback");
    REQUIRE(out.results[0].snippet == "A printing press is a mechanical device.");
    REQUIRE(out.results[0].page_excerpt == std::optional<std::string>("Gutenberg"));
    REQUIRE_FALSE(out.suggest_open_browser_search.has_value());
}

TEST_CASE("WebSearchOrchestrator: empty fallback still succeeds", "[web_search]") {
    MockHttpClient http;
    http.route("api.duckduckgo.com", 200, "{}");
    http.route("rest.php/v1/search/page", 200, R"({"pages": []})");
    auto search = make_orchestrator(http);
    DiagnosticTrace trace("web_search");

    auto out = search.run({"zzzz qqqq", 5, true}, trace);

    REQUIRE(out.ok);
    REQUIRE(out.result_count() == 0);
    REQUIRE(out.provider == "duckduckgo");
    REQUIRE(has_step(out, "wikipedia_fallback", false));
}

// ── Envelope ────────────────────────────────────────────────────

TEST_CASE("WebSearchOrchestrator::search: content is the output JSON", "[web_search]") {
    MockHttpClient http;
    http.route("api.duckduckgo.com", 200,
               R"({"RelatedTopics": [{"Text": "One", "FirstURL": "https://one.example"}]})");
    auto search = make_orchestrator(http);
    DiagnosticTrace trace("web_search");

    auto result = search.search({"one", 5, false}, trace);

    REQUIRE(result.ok);
    REQUIRE_FALSE(result.error.has_value());
    auto j = nlohmann::json::parse(result.content);
    REQUIRE(j["ok"] == true);
    REQUIRE(j["result_count"] == j["results"].size());
    REQUIRE(j["results"][0]["url"] == "https://one.example");
    REQUIRE_FALSE(j.contains("error"));
    REQUIRE_FALSE(j.contains("suggest_open_browser_search"));
}

TEST_CASE("WebSearchOrchestrator::search: failure sets envelope error", "[web_search]") {
    MockHttpClient http;
    http.next_response = transport_failure("timeout");
    auto search = make_orchestrator(http);
    DiagnosticTrace trace("web_search");

    auto result = search.search({"one", 5, false}, trace);

    REQUIRE_FALSE(result.ok);
    REQUIRE(result.error.has_value());
    auto j = nlohmann::json::parse(result.content);
    REQUIRE(j["ok"] == false);
    REQUIRE(j["status"] == 0);
    REQUIRE(j["result_count"] == 0);
}
