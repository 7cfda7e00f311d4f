#pragma once

#include <string>
#include <optional>

namespace seo_audit::common {

// Remove invisible/formatting Unicode codepoints commonly found in copy/pasted URLs
// and strip ASCII control characters and surrounding ASCII whitespace.
// Specifically removes: U+200B, U+200C, U+200D, U+2060, U+FEFF, bidi marks and bytes < 0x20 or 0x7F.
std::string sanitizeUrl(const std::string& input);

// Canonical identity of an http(s) URL:
//   - scheme and host lowercased, userinfo dropped
//   - default port (80 for http, 443 for https) dropped
//   - fragment dropped, dot segments removed
//   - empty path becomes "/", trailing slash stripped from any other path
//   - query kept byte-for-byte (an empty "?" is dropped)
// Returns std::nullopt for anything that is not an absolute http(s) URL with a host.
std::optional<std::string> normalizeUrl(const std::string& url);

// True when url is already in normalized form.
bool isNormalizedUrl(const std::string& url);

// Resolve href against baseUrl (RFC 3986 reference resolution, simplified).
// Absolute references with any scheme are returned unchanged.
std::string resolveUrl(const std::string& baseUrl, const std::string& href);

// Lowercased host without port, or empty string when the URL has no authority.
std::string extractHost(const std::string& url);

// Path component ("/" when absent), without query or fragment.
std::string extractPath(const std::string& url);

// Path plus "?query" when present. This is what robots rules match against.
std::string extractPathAndQuery(const std::string& url);

// "scheme://host[:port]" of an absolute URL, empty when not absolute.
std::string extractOrigin(const std::string& url);

// Hosts are the same site when equal ignoring case and a leading "www.".
bool isSameSite(const std::string& host, const std::string& targetHost);

// Number of non-empty path segments.
size_t pathDepth(const std::string& url);

bool hasHttpScheme(const std::string& url);

// Produce a compact hex dump of the given string for logging/debugging.
std::string hexDump(const std::string& input);

} // namespace seo_audit::common
