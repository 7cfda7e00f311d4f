#include "PolicyResolver.h"
#include "FailureClassifier.h"
#include "RobotsTxtParser.h"
#include "SitemapParser.h"
#include "../../include/Logger.h"
#include "../../include/seo_audit/common/UrlUtils.h"
#include <algorithm>
#include <unordered_set>

namespace seo_audit::crawler {

PolicyResolver::PolicyResolver(PageFetcher& pageFetcher, const AuditConfig& auditConfig, Clock clockFn)
    : fetcher(pageFetcher)
    , config(auditConfig)
    , clock(clockFn ? std::move(clockFn) : Clock([] { return std::chrono::steady_clock::now(); })) {
}

std::optional<std::chrono::milliseconds> PolicyResolver::documentTimeout() const {
    if (deadline == TimePoint::max()) {
        return config.robotsTimeout;
    }
    TimePoint now = clock();
    if (now >= deadline) {
        return std::nullopt;
    }
    auto remaining = std::chrono::duration_cast<std::chrono::milliseconds>(deadline - now);
    if (remaining.count() <= 0) {
        return std::nullopt;
    }
    return std::min(config.robotsTimeout, remaining);
}

void PolicyResolver::warn(PolicyResolution& resolution, const std::string& message) {
    LOG_WARNING(message);
    resolution.warnings.push_back(message);
}

PolicyResolution PolicyResolver::resolve(const std::string& rootUrl, TimePoint runDeadline) {
    deadline = runDeadline;
    PolicyResolution resolution;
    const std::string origin = common::extractOrigin(rootUrl);
    const std::string targetHost = common::extractHost(rootUrl);

    LOG_INFO("Resolving crawl policy for " + origin);

    resolution.policy = loadPolicy(origin, resolution);
    resolution.crawlDelay = std::max(config.politenessDelay,
                                     resolution.policy.getCrawlDelay().value_or(std::chrono::milliseconds(0)));

    // Root first so sitemap seeds never shadow it
    resolution.seeds.push_back(SeedUrl{rootUrl, DiscoverySource::SEED});
    collectSitemaps(origin, targetHost, resolution.policy.getDeclaredSitemaps(), resolution);

    LOG_INFO("Policy resolved: " + std::to_string(resolution.policy.getRules().size()) + " robots rules, crawl delay " +
             std::to_string(resolution.crawlDelay.count()) + "ms, " +
             std::to_string(resolution.sitemapUrls.size()) + " sitemap URLs from " +
             std::to_string(resolution.sitemapDocuments.size()) + " sitemap documents");
    return resolution;
}

CrawlPolicy PolicyResolver::loadPolicy(const std::string& origin, PolicyResolution& resolution) {
    const std::string robotsUrl = origin + "/robots.txt";
    auto timeout = documentTimeout();
    if (!timeout) {
        warn(resolution, "Wall-clock budget exhausted before robots.txt was fetched, using permissive policy");
        return CrawlPolicy::permissive(config.userAgent);
    }
    PageFetchResult fetched = fetcher.fetchDocument(robotsUrl, *timeout);

    if (!fetched.success) {
        std::string reason = fetched.failure ? FailureClassifier::describe(*fetched.failure) : "unknown error";
        warn(resolution, "robots.txt unavailable at " + robotsUrl + " (" + reason + "), using permissive policy");
        return CrawlPolicy::permissive(config.userAgent);
    }

    RobotsRules rules = RobotsTxtParser::parse(fetched.content, config.userAgent);
    if (rules.groupCount == 0 && rules.sitemaps.empty()) {
        warn(resolution, "robots.txt at " + robotsUrl + " contains no recognised directives");
    }
    if (rules.sitemaps.empty()) {
        warn(resolution, "robots.txt does not declare a Sitemap");
    }

    if (!config.respectRobotsTxt) {
        LOG_INFO("Ignoring robots.txt rules by configuration");
        RobotsRules sitemapsOnly;
        sitemapsOnly.sitemaps = rules.sitemaps;
        return CrawlPolicy(config.userAgent, std::move(sitemapsOnly), true);
    }

    return CrawlPolicy(config.userAgent, std::move(rules), true);
}

void PolicyResolver::collectSitemaps(const std::string& origin,
                                     const std::string& targetHost,
                                     const std::vector<std::string>& declared,
                                     PolicyResolution& resolution) {
    std::vector<SitemapTask> queue;
    const bool probing = declared.empty();

    if (probing) {
        // Every well-known location is tried and the results are merged
        for (const auto& path : SitemapParser::getCommonSitemapPaths()) {
            queue.push_back(SitemapTask{origin + path, true});
        }
    } else {
        for (const auto& url : declared) {
            queue.push_back(SitemapTask{common::resolveUrl(origin + "/", url), false});
        }
    }

    std::unordered_set<std::string> visited;
    size_t position = 0;
    while (position < queue.size()) {
        if (resolution.sitemapDocuments.size() >= config.maxSitemaps) {
            warn(resolution, "Sitemap limit of " + std::to_string(config.maxSitemaps) +
                 " documents reached, " + std::to_string(queue.size() - position) + " not fetched");
            break;
        }
        if (resolution.sitemapUrls.size() >= config.maxSitemapUrls) {
            break;
        }
        if (clock() >= deadline) {
            warn(resolution, "Wall-clock budget exhausted while reading sitemaps, " +
                 std::to_string(queue.size() - position) + " not fetched");
            break;
        }
        SitemapTask task = queue[position++];
        if (!visited.insert(task.url).second) {
            continue;
        }
        processSitemap(task, targetHost, queue, resolution);
    }

    if (probing && resolution.sitemapDocuments.empty()) {
        warn(resolution, "No sitemap found at " + origin);
    }
}

bool PolicyResolver::processSitemap(const SitemapTask& task,
                                    const std::string& targetHost,
                                    std::vector<SitemapTask>& queue,
                                    PolicyResolution& resolution) {
    const std::string& sitemapUrl = task.url;
    auto timeout = documentTimeout();
    if (!timeout) {
        return false;
    }

    PageFetchResult fetched = fetcher.fetchDocument(sitemapUrl, *timeout);
    if (!fetched.success) {
        std::string reason = fetched.failure ? FailureClassifier::describe(*fetched.failure) : "unknown error";
        if (task.probing) {
            LOG_DEBUG("No sitemap at " + sitemapUrl + " (" + reason + ")");
        } else {
            warn(resolution, "Sitemap unavailable at " + sitemapUrl + " (" + reason + ")");
        }
        return false;
    }

    auto data = SitemapParser::parse(fetched.content);
    if (!data) {
        if (task.probing) {
            LOG_DEBUG("Probed " + sitemapUrl + " is not a sitemap");
        } else {
            warn(resolution, "Skipping unparsable sitemap " + sitemapUrl);
        }
        return false;
    }

    resolution.sitemapDocuments.push_back(sitemapUrl);

    if (data->isIndex) {
        for (const auto& nested : data->sitemapUrls) {
            queue.push_back(SitemapTask{common::resolveUrl(sitemapUrl, nested), false});
        }
        return true;
    }

    size_t added = 0;
    for (const auto& entry : data->urls) {
        if (resolution.sitemapUrls.size() >= config.maxSitemapUrls) {
            warn(resolution, "Sitemap URL limit of " + std::to_string(config.maxSitemapUrls) + " reached");
            break;
        }
        auto normalized = common::normalizeUrl(entry.loc);
        if (!normalized) {
            LOG_DEBUG("Ignoring invalid sitemap entry: " + entry.loc);
            continue;
        }
        if (!common::isSameSite(common::extractHost(*normalized), targetHost)) {
            LOG_DEBUG("Ignoring off-site sitemap entry: " + *normalized);
            continue;
        }
        if (resolution.sitemapUrls.insert(*normalized).second) {
            added++;
            if (*normalized != resolution.seeds.front().url) {
                resolution.seeds.push_back(SeedUrl{*normalized, DiscoverySource::SITEMAP});
            }
        }
    }

    LOG_INFO("Sitemap " + sitemapUrl + " contributed " + std::to_string(added) + " URLs");
    return true;
}

} // namespace seo_audit::crawler
