#pragma once
#include "../http.hpp"
#include <cstddef>
#include <cstdint>
#include <functional>
#include <optional>
#include <string>

namespace toolgate {

constexpr size_t kFetchMaxBodyBytes = 512 * 1024;
constexpr long kPageExcerptTimeoutSeconds = 8;
constexpr size_t kPageExcerptMaxChars = 2200;
constexpr size_t kPageExcerptMaxResults = 4;
constexpr uint32_t kFetchUrlDefaultChars = 12000;
constexpr uint32_t kFetchUrlMinChars = 500;
constexpr uint32_t kFetchUrlMaxChars = 20000;
constexpr size_t kBrowserFetchMaxChars = 12000;
constexpr long kBrowserFetchTimeoutSeconds = 12;

extern const char* const kBrowserUserAgent;
extern const char* const kPageContentHeading;

// Tags become a single space, script/style bodies are dropped, the common
// entities are decoded and whitespace runs collapse to one space.
std::string strip_html_to_text(const std::string& html);

// GET an absolute http(s) URL and return its stripped text, cut to
// max_chars code points with a trailing "…". nullopt on a bad scheme,
// transport failure, non-2xx status, oversize body or empty text.
std::optional<std::string> fetch_text(HttpClient& http, const std::string& url,
                                      size_t max_chars, long timeout_seconds);

// fetch_url tool. max_chars defaults to 12000 and is clamped to 500..20000.
std::string fetch_url(HttpClient& http, const std::string& url,
                      std::optional<uint32_t> max_chars);

// Launches the user's browser at a URL; throws ToolError on failure.
using BrowserOpener = std::function<void(const std::string& url)>;

// xdg-open on Linux, open on macOS, started detached.
BrowserOpener system_browser_opener();

// Validates, opens and returns the trimmed URL.
std::string open_url_in_browser(const BrowserOpener& opener, const std::string& url);

// Search URL for engine "bing", "google" or anything else (DuckDuckGo).
std::string browser_search_url(const std::string& engine, const std::string& query);

// open_browser_search tool: open `url`, or a search for `query` on `engine`,
// then append the fetched page text under the page-content heading.
std::string open_browser_search(HttpClient& http, const BrowserOpener& opener,
                                const std::optional<std::string>& url,
                                const std::optional<std::string>& query,
                                const std::optional<std::string>& engine);

} // namespace toolgate
