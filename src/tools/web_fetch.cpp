#include "web_fetch.hpp"
#include "process.hpp"
#include "web_search.hpp"
#include "../tool.hpp"
#include "../util.hpp"
#include <algorithm>
#include <cctype>

namespace toolgate {

const char* const kBrowserUserAgent =
    "Mozilla/5.0 (Windows NT 10.0; rv:91.0) Gecko/20100101 Firefox/91.0";
const char* const kPageContentHeading =
    "Page content (use this as context to summarize or answer; user did not paste this):";

// ── HTML to text ────────────────────────────────────────────────

static bool iequals_at(const std::string& s, size_t pos, const char* word) {
    for (size_t i = 0; word[i]; ++i) {
        if (pos + i >= s.size()) return false;
        if (std::tolower(static_cast<unsigned char>(s[pos + i])) != word[i]) return false;
    }
    return true;
}

static size_t find_ci(const std::string& s, const char* needle, size_t from) {
    for (size_t i = from; i < s.size(); ++i) {
        if (iequals_at(s, i, needle)) return i;
    }
    return std::string::npos;
}

// Raw-text element starting at `pos` ('<'), or nullptr.
static const char* raw_text_element(const std::string& html, size_t pos) {
    for (const char* name : {"script", "style"}) {
        size_t len = std::char_traits<char>::length(name);
        if (iequals_at(html, pos + 1, name)) {
            char next = pos + 1 + len < html.size() ? html[pos + 1 + len] : '>';
            if (next == '>' || std::isspace(static_cast<unsigned char>(next)) || next == '/') {
                return name;
            }
        }
    }
    return nullptr;
}

static bool decode_entity(const std::string& html, size_t pos, std::string& out, size_t& consumed) {
    static const std::pair<const char*, const char*> entities[] = {
        {"&amp;", "&"}, {"&lt;", "<"}, {"&gt;", ">"}, {"&quot;", "\""},
        {"&apos;", "'"}, {"&#39;", "'"}, {"&nbsp;", " "},
    };
    for (const auto& e : entities) {
        if (html.compare(pos, std::char_traits<char>::length(e.first), e.first) == 0) {
            out = e.second;
            consumed = std::char_traits<char>::length(e.first);
            return true;
        }
    }
    return false;
}

std::string strip_html_to_text(const std::string& html) {
    std::string out;
    out.reserve(html.size());
    auto push_space = [&out] {
        if (!out.empty() && out.back() != ' ') out.push_back(' ');
    };

    size_t i = 0;
    const size_t n = html.size();
    while (i < n) {
        char c = html[i];
        if (c == '<') {
            push_space();
            if (html.compare(i, 4, "<!--") == 0) {
                size_t end = html.find("-->", i + 4);
                i = end == std::string::npos ? n : end + 3;
                continue;
            }
            if (const char* element = raw_text_element(html, i)) {
                std::string closing = std::string("</") + element;
                size_t end = find_ci(html, closing.c_str(), i + 1);
                if (end == std::string::npos) break;
                i = end;
            }
            size_t close = html.find('>', i);
            i = close == std::string::npos ? n : close + 1;
            continue;
        }
        if (c == '&') {
            std::string decoded;
            size_t consumed = 0;
            if (decode_entity(html, i, decoded, consumed)) {
                if (decoded == " ") push_space();
                else out += decoded;
                i += consumed;
                continue;
            }
        }
        if (std::isspace(static_cast<unsigned char>(c))) {
            push_space();
        } else {
            out.push_back(c);
        }
        ++i;
    }
    return trim(out);
}

// ── Fetch ───────────────────────────────────────────────────────

static bool has_http_scheme(const std::string& url) {
    return starts_with(url, "http://") || starts_with(url, "https://");
}

std::optional<std::string> fetch_text(HttpClient& http, const std::string& url,
                                      size_t max_chars, long timeout_seconds) {
    if (!has_http_scheme(url)) return std::nullopt;

    HttpResponse res = http.get(url, {{"User-Agent", kBrowserUserAgent}},
                                timeout_seconds, kFetchMaxBodyBytes);
    if (!res.ok() || res.truncated || res.body.size() > kFetchMaxBodyBytes) {
        return std::nullopt;
    }

    std::string text = strip_html_to_text(res.body);
    if (text.empty()) return std::nullopt;
    if (utf8_length(text) > max_chars) {
        return trim(utf8_prefix(text, max_chars)) + "\xE2\x80\xA6";
    }
    return text;
}

std::string fetch_url(HttpClient& http, const std::string& url,
                      std::optional<uint32_t> max_chars) {
    std::string target = trim(url);
    if (target.empty()) throw ToolError(ToolErrorKind::InvalidArg, "url required");
    if (!has_http_scheme(target)) {
        throw ToolError(ToolErrorKind::InvalidArg, "url must start with http:// or https://");
    }
    uint32_t limit = std::clamp(max_chars.value_or(kFetchUrlDefaultChars),
                                kFetchUrlMinChars, kFetchUrlMaxChars);

    auto text = fetch_text(http, target, limit, kPageExcerptTimeoutSeconds);
    if (!text) throw ToolError(ToolErrorKind::Network, "fetch failed or returned no text");
    return std::string(kPageContentHeading) + "\n\n" + *text;
}

// ── Browser ─────────────────────────────────────────────────────

BrowserOpener system_browser_opener() {
    return [](const std::string& url) {
#if defined(__APPLE__)
        const char* launcher = "open";
#else
        const char* launcher = "xdg-open";
#endif
        try {
            spawn_detached({launcher, url}, "");
        } catch (const ToolError& e) {
            throw ToolError(ToolErrorKind::CommandFailed, "failed to open browser: " + e.detail());
        }
    };
}

std::string open_url_in_browser(const BrowserOpener& opener, const std::string& url) {
    std::string target = trim(url);
    if (target.empty()) throw ToolError(ToolErrorKind::InvalidArg, "url cannot be empty");
    opener(target);
    return target;
}

std::string browser_search_url(const std::string& engine, const std::string& query) {
    std::string encoded = url_encode(query);
    if (engine == "bing") return "https://www.bing.com/search?q=" + encoded;
    if (engine == "google") return "https://www.google.com/search?q=" + encoded;
    return "https://duckduckgo.com/?q=" + encoded;
}

std::string open_browser_search(HttpClient& http, const BrowserOpener& opener,
                                const std::optional<std::string>& url,
                                const std::optional<std::string>& query,
                                const std::optional<std::string>& engine) {
    std::string out;
    std::optional<std::string> url_to_fetch;

    if (url) {
        std::string target = trim(*url);
        if (target.empty()) {
            throw ToolError(ToolErrorKind::InvalidArg,
                            "open_browser_search requires non-empty url or query");
        }
        out = "Opened browser: " + open_url_in_browser(opener, target);
        url_to_fetch = target;
    } else {
        std::string q = query ? trim(*query) : std::string();
        if (q.empty()) {
            throw ToolError(ToolErrorKind::InvalidArg, "open_browser_search requires url or query");
        }
        std::string eng = to_lower(engine.value_or("duckduckgo"));
        std::string search_url = browser_search_url(eng, q);
        open_url_in_browser(opener, search_url);
        out = "Opened browser: " + search_url;
        if (eng == "duckduckgo") {
            url_to_fetch = duckduckgo_first_result_url(http, q);
        }
    }

    if (url_to_fetch) {
        auto content = fetch_text(http, *url_to_fetch, kBrowserFetchMaxChars,
                                  kBrowserFetchTimeoutSeconds);
        if (content && !trim(*content).empty()) {
            out += "\n\n";
            out += kPageContentHeading;
            out += "\n\n" + *content;
        }
    }
    return out;
}

} // namespace toolgate
