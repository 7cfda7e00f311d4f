#include "../../include/seo_audit/common/UrlUtils.h"

#include <algorithm>
#include <cctype>
#include <cstdint>
#include <sstream>
#include <vector>

namespace seo_audit::common {

static inline bool isAsciiSpace(unsigned char c) {
    return c == ' ' || c == '\t' || c == '\r' || c == '\n';
}

static std::string toLower(std::string value) {
    std::transform(value.begin(), value.end(), value.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return value;
}

static bool isInvisibleCodepoint(uint32_t cp) {
    return cp == 0x200B || cp == 0x200C || cp == 0x200D || cp == 0x2060 || cp == 0xFEFF ||
           cp == 0x200E || cp == 0x200F ||
           (cp >= 0x202A && cp <= 0x202E) ||
           (cp >= 0x2066 && cp <= 0x2069);
}

std::string sanitizeUrl(const std::string& input) {
    if (input.empty()) return input;

    size_t start = 0;
    size_t end = input.size();
    while (start < end && isAsciiSpace(static_cast<unsigned char>(input[start]))) start++;
    while (end > start && isAsciiSpace(static_cast<unsigned char>(input[end - 1]))) end--;

    std::string out;
    out.reserve(end - start);

    for (size_t i = start; i < end;) {
        unsigned char c = static_cast<unsigned char>(input[i]);
        if ((c & 0x80) == 0) {
            if (c < 0x20 || c == 0x7F) { i++; continue; }
            out.push_back(static_cast<char>(c));
            i++;
            continue;
        }

        // Decode just enough UTF-8 to recognise the invisible codepoints
        uint32_t cp = 0;
        size_t adv = 1;
        if ((c & 0xE0) == 0xC0 && i + 1 < end) {
            cp = ((c & 0x1F) << 6) | (static_cast<unsigned char>(input[i + 1]) & 0x3F);
            adv = 2;
        } else if ((c & 0xF0) == 0xE0 && i + 2 < end) {
            cp = ((c & 0x0F) << 12) |
                 ((static_cast<unsigned char>(input[i + 1]) & 0x3F) << 6) |
                 (static_cast<unsigned char>(input[i + 2]) & 0x3F);
            adv = 3;
        } else if ((c & 0xF8) == 0xF0 && i + 3 < end) {
            cp = ((c & 0x07) << 18) |
                 ((static_cast<unsigned char>(input[i + 1]) & 0x3F) << 12) |
                 ((static_cast<unsigned char>(input[i + 2]) & 0x3F) << 6) |
                 (static_cast<unsigned char>(input[i + 3]) & 0x3F);
            adv = 4;
        } else {
            i++;
            continue;
        }

        if (!isInvisibleCodepoint(cp)) {
            out.append(input, i, adv);
        }
        i += adv;
    }

    return out;
}

namespace {

struct UrlParts {
    std::string scheme;
    std::string host;
    std::string port;
    std::string path;
    std::string query;
    bool hasQuery = false;
};

// Splits "scheme://authority/path?query#fragment". Fragment is discarded.
std::optional<UrlParts> splitUrl(const std::string& url) {
    size_t schemeEnd = url.find("://");
    if (schemeEnd == std::string::npos || schemeEnd == 0) {
        return std::nullopt;
    }

    UrlParts parts;
    parts.scheme = toLower(url.substr(0, schemeEnd));

    size_t authorityStart = schemeEnd + 3;
    size_t authorityEnd = url.find_first_of("/?#", authorityStart);
    if (authorityEnd == std::string::npos) {
        authorityEnd = url.size();
    }

    std::string authority = url.substr(authorityStart, authorityEnd - authorityStart);
    size_t at = authority.rfind('@');
    if (at != std::string::npos) {
        authority = authority.substr(at + 1);
    }

    if (!authority.empty() && authority[0] == '[') {
        size_t close = authority.find(']');
        if (close == std::string::npos) {
            return std::nullopt;
        }
        parts.host = authority.substr(0, close + 1);
        if (close + 1 < authority.size() && authority[close + 1] == ':') {
            parts.port = authority.substr(close + 2);
        }
    } else {
        size_t colon = authority.rfind(':');
        if (colon != std::string::npos) {
            parts.host = authority.substr(0, colon);
            parts.port = authority.substr(colon + 1);
        } else {
            parts.host = authority;
        }
    }
    parts.host = toLower(parts.host);

    std::string rest = url.substr(authorityEnd);
    size_t hash = rest.find('#');
    if (hash != std::string::npos) {
        rest = rest.substr(0, hash);
    }

    size_t question = rest.find('?');
    if (question != std::string::npos) {
        parts.path = rest.substr(0, question);
        parts.query = rest.substr(question + 1);
        parts.hasQuery = true;
    } else {
        parts.path = rest;
    }

    return parts;
}

std::string removeDotSegments(const std::string& path) {
    if (path.find('.') == std::string::npos) {
        return path;
    }

    std::vector<std::string> pieces;
    size_t pos = 0;
    while (true) {
        size_t next = path.find('/', pos);
        if (next == std::string::npos) {
            pieces.push_back(path.substr(pos));
            break;
        }
        pieces.push_back(path.substr(pos, next - pos));
        pos = next + 1;
    }

    bool absolute = !path.empty() && path[0] == '/';
    if (absolute) {
        pieces.erase(pieces.begin());
    }

    std::vector<std::string> output;
    for (size_t i = 0; i < pieces.size(); ++i) {
        const bool last = i + 1 == pieces.size();
        if (pieces[i] == ".") {
            if (last) output.emplace_back();
            continue;
        }
        if (pieces[i] == "..") {
            if (!output.empty()) output.pop_back();
            if (last) output.emplace_back();
            continue;
        }
        output.push_back(pieces[i]);
    }

    std::string out = absolute ? "/" : "";
    for (size_t i = 0; i < output.size(); ++i) {
        if (i) out += '/';
        out += output[i];
    }
    return out;
}

bool isAllDigits(const std::string& value) {
    return !value.empty() && std::all_of(value.begin(), value.end(),
                                         [](unsigned char c) { return std::isdigit(c) != 0; });
}

} // namespace

std::optional<std::string> normalizeUrl(const std::string& url) {
    const std::string cleaned = sanitizeUrl(url);
    auto parts = splitUrl(cleaned);
    if (!parts) {
        return std::nullopt;
    }
    if (parts->scheme != "http" && parts->scheme != "https") {
        return std::nullopt;
    }
    if (parts->host.empty()) {
        return std::nullopt;
    }
    if (!parts->port.empty() && !isAllDigits(parts->port)) {
        return std::nullopt;
    }

    bool defaultPort = parts->port.empty() ||
                       (parts->scheme == "http" && parts->port == "80") ||
                       (parts->scheme == "https" && parts->port == "443");

    std::string path = removeDotSegments(parts->path);
    if (path.empty() || path[0] != '/') {
        path = "/" + path;
    }
    while (path.size() > 1 && path.back() == '/') {
        path.pop_back();
    }

    std::string normalized = parts->scheme + "://" + parts->host;
    if (!defaultPort) {
        normalized += ":" + parts->port;
    }
    normalized += path;
    if (parts->hasQuery && !parts->query.empty()) {
        normalized += "?" + parts->query;
    }
    return normalized;
}

bool isNormalizedUrl(const std::string& url) {
    auto normalized = normalizeUrl(url);
    return normalized && *normalized == url;
}

static bool hasScheme(const std::string& href) {
    if (href.empty() || !std::isalpha(static_cast<unsigned char>(href[0]))) {
        return false;
    }
    for (size_t i = 1; i < href.size(); ++i) {
        unsigned char c = static_cast<unsigned char>(href[i]);
        if (c == ':') return true;
        if (!std::isalnum(c) && c != '+' && c != '-' && c != '.') return false;
    }
    return false;
}

std::string resolveUrl(const std::string& baseUrl, const std::string& href) {
    const std::string ref = sanitizeUrl(href);
    const std::string base = sanitizeUrl(baseUrl);

    std::string baseNoFragment = base.substr(0, base.find('#'));
    if (ref.empty()) {
        return baseNoFragment;
    }
    if (hasScheme(ref)) {
        return ref;
    }

    size_t schemeEnd = base.find("://");
    if (schemeEnd == std::string::npos) {
        return ref;
    }

    if (ref.rfind("//", 0) == 0) {
        return base.substr(0, schemeEnd) + ":" + ref;
    }
    if (ref[0] == '#') {
        return baseNoFragment + ref;
    }

    std::string origin = extractOrigin(base);
    std::string basePath = extractPath(base);

    if (ref[0] == '?') {
        return origin + basePath + ref;
    }

    std::string refPath = ref;
    std::string refSuffix;
    size_t suffixStart = ref.find_first_of("?#");
    if (suffixStart != std::string::npos) {
        refPath = ref.substr(0, suffixStart);
        refSuffix = ref.substr(suffixStart);
    }

    if (refPath.empty()) {
        return origin + basePath + refSuffix;
    }
    if (refPath[0] == '/') {
        return origin + removeDotSegments(refPath) + refSuffix;
    }

    std::string directory = basePath.substr(0, basePath.find_last_of('/') + 1);
    if (directory.empty()) {
        directory = "/";
    }
    return origin + removeDotSegments(directory + refPath) + refSuffix;
}

std::string extractHost(const std::string& url) {
    auto parts = splitUrl(sanitizeUrl(url));
    return parts ? parts->host : std::string();
}

std::string extractPath(const std::string& url) {
    auto parts = splitUrl(url);
    if (!parts || parts->path.empty()) {
        return "/";
    }
    return parts->path;
}

std::string extractPathAndQuery(const std::string& url) {
    auto parts = splitUrl(url);
    if (!parts) {
        return "/";
    }
    std::string result = parts->path.empty() ? "/" : parts->path;
    if (parts->hasQuery) {
        result += "?" + parts->query;
    }
    return result;
}

std::string extractOrigin(const std::string& url) {
    size_t schemeEnd = url.find("://");
    if (schemeEnd == std::string::npos) {
        return "";
    }
    size_t authorityEnd = url.find_first_of("/?#", schemeEnd + 3);
    return authorityEnd == std::string::npos ? url : url.substr(0, authorityEnd);
}

static std::string stripWww(const std::string& host) {
    std::string lower = toLower(host);
    if (lower.rfind("www.", 0) == 0) {
        return lower.substr(4);
    }
    return lower;
}

bool isSameSite(const std::string& host, const std::string& targetHost) {
    if (host.empty() || targetHost.empty()) {
        return false;
    }
    return stripWww(host) == stripWww(targetHost);
}

size_t pathDepth(const std::string& url) {
    const std::string path = extractPath(url);
    size_t depth = 0;
    size_t pos = 0;
    while (pos < path.size()) {
        size_t next = path.find('/', pos);
        if (next == std::string::npos) next = path.size();
        if (next > pos) depth++;
        pos = next + 1;
    }
    return depth;
}

bool hasHttpScheme(const std::string& url) {
    std::string lower = toLower(url.substr(0, 8));
    return lower.rfind("http://", 0) == 0 || lower.rfind("https://", 0) == 0;
}

std::string hexDump(const std::string& input) {
    std::ostringstream oss;
    oss.setf(std::ios::hex, std::ios::basefield);
    for (size_t i = 0; i < input.size(); ++i) {
        unsigned int v = static_cast<unsigned char>(input[i]);
        if (i) oss << ' ';
        if (v < 0x10) oss << '0';
        oss << v;
    }
    return oss.str();
}

} // namespace seo_audit::common
