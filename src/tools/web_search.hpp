#pragma once
#include "../http.hpp"
#include "../tool.hpp"
#include <nlohmann/json.hpp>
#include <cstdint>
#include <functional>
#include <optional>
#include <string>
#include <vector>

namespace toolgate {

class DiagnosticTrace;

constexpr uint32_t kDefaultRecencyDays = 30;
constexpr uint32_t kDefaultMaxResults = 5;
constexpr uint32_t kMaxSearchResults = 10;
constexpr size_t kMaxTitleChars = 120;

struct WebSearchResultItem {
    std::string title;   // at most kMaxTitleChars code points
    std::string snippet;
    std::string url;     // never empty
    std::optional<std::string> page_excerpt;
};

// Pipeline progress reported to the caller, separate from diagnostics.
struct WebSearchStep {
    std::string name;
    bool ok = false;
    std::string detail;
};

struct WebSearchOutput {
    bool ok = false;
    std::string provider = "duckduckgo";
    std::string query;            // what was sent to the provider
    std::string query_original;
    std::string query_rewritten;
    uint32_t recency_days = kDefaultRecencyDays;
    long status = 0;              // 0 on transport failure
    std::vector<WebSearchResultItem> results;
    std::optional<std::string> error;
    std::vector<WebSearchStep> steps;
    std::optional<bool> suggest_open_browser_search;

    size_t result_count() const { return results.size(); }
};

void to_json(nlohmann::json& j, const WebSearchResultItem& item);
void to_json(nlohmann::json& j, const WebSearchStep& step);
void to_json(nlohmann::json& j, const WebSearchOutput& out);

// ── Query analysis ──────────────────────────────────────────────

bool is_time_sensitive_query(const std::string& query);

struct RewrittenQuery {
    std::string query;
    uint32_t recency_days = kDefaultRecencyDays;
};

// Time-sensitive queries get " <year>" appended; others are only trimmed.
RewrittenQuery rewrite_web_search_query(const std::string& query, int year,
                                        uint32_t recency_days_default = kDefaultRecencyDays);

bool is_officeholder_query(const std::string& query);

struct OfficeholderQuery {
    std::string country;       // canonical name when aliased
    std::string property;      // P35 head of state, P6 head of government
    std::string office_label;  // "president", "prime minister" or "leader"
};

std::optional<OfficeholderQuery> normalize_officeholder_query(const std::string& query);

// ── DuckDuckGo ──────────────────────────────────────────────────

// First line of `text`, trimmed and cut to kMaxTitleChars with "…".
std::string make_result_title(const std::string& text);

// Abstract first, then RelatedTopics (flat or grouped under "Topics"),
// stopping at max_results. Entries without text or URL are skipped.
std::vector<WebSearchResultItem> parse_duckduckgo_results(const nlohmann::json& body,
                                                          size_t max_results);

std::string duckduckgo_api_url(const std::string& query);

// URL of the provider's top result, or nullopt.
std::optional<std::string> duckduckgo_first_result_url(HttpClient& http, const std::string& query);

// ── Orchestrator ────────────────────────────────────────────────

struct WebSearchRequest {
    std::string query;
    uint32_t max_results = kDefaultMaxResults;  // clamped to 1..kMaxSearchResults
    bool include_page_excerpts = true;
};

using YearProvider = std::function<int()>;

// Provider query, fallback chain and excerpt enrichment. Provider failures
// do not throw: they produce an ok=false output carried in the content.
class WebSearchOrchestrator {
public:
    explicit WebSearchOrchestrator(HttpClient& http, YearProvider year = nullptr,
                                   uint32_t recency_days_default = kDefaultRecencyDays);

    WebSearchOutput run(const WebSearchRequest& request, DiagnosticTrace& trace);

    // run() wrapped in the tool envelope; content is the output JSON.
    ToolResult search(const WebSearchRequest& request, DiagnosticTrace& trace);

    std::vector<WebSearchResultItem> officeholder_lookup(const std::string& query);
    std::vector<WebSearchResultItem> encyclopedia_lookup(const std::string& query, bool office_mode);

private:
    void attach_page_excerpts(std::vector<WebSearchResultItem>& results);
    void fallback_chain(const std::string& query, WebSearchOutput& out);

    HttpClient& http_;
    YearProvider year_;
    uint32_t recency_days_default_;
};

} // namespace toolgate
