#include "../../include/seo_audit/graph/LinkGraph.h"
#include "../../include/seo_audit/common/UrlUtils.h"
#include "../../include/Logger.h"

#include <algorithm>
#include <cmath>
#include <deque>
#include <stdexcept>

namespace seo_audit::graph {

namespace {

constexpr double kDamping = 0.85;
constexpr double kTolerance = 1.0e-6;
constexpr int kMaxIterations = 100;

} // namespace

std::optional<size_t> LinkGraph::indexOf(const std::string& url) const {
    auto it = index_.find(url);
    if (it == index_.end()) {
        return std::nullopt;
    }
    return it->second;
}

const GraphNode* LinkGraph::find(const std::string& url) const {
    auto index = indexOf(url);
    return index ? &nodes_[*index] : nullptr;
}

std::vector<std::string> LinkGraph::inboundUrls(const std::string& url) const {
    std::vector<std::string> urls;
    auto index = indexOf(url);
    if (!index) {
        return urls;
    }
    for (size_t source : inbound_[*index]) {
        urls.push_back(nodes_[source].url);
    }
    std::sort(urls.begin(), urls.end());
    return urls;
}

std::vector<std::pair<std::string, std::string>> LinkGraph::edges() const {
    std::vector<std::pair<std::string, std::string>> result;
    result.reserve(edgeCount_);
    for (size_t source = 0; source < outbound_.size(); ++source) {
        for (size_t target : outbound_[source]) {
            result.emplace_back(nodes_[source].url, nodes_[target].url);
        }
    }
    std::sort(result.begin(), result.end());
    return result;
}

bool LinkGraph::hasSitemapNodes() const {
    return std::any_of(nodes_.begin(), nodes_.end(), [](const GraphNode& node) { return node.inSitemap; });
}

LinkGraphBuilder::LinkGraphBuilder(std::string targetHost)
    : targetHost_(std::move(targetHost)) {
}

size_t LinkGraphBuilder::ensureNode(const std::string& url) {
    auto it = graph_.index_.find(url);
    if (it != graph_.index_.end()) {
        return it->second;
    }

    size_t index = graph_.nodes_.size();
    GraphNode node;
    node.url = url;
    graph_.nodes_.push_back(std::move(node));
    graph_.index_.emplace(url, index);
    graph_.outbound_.emplace_back();
    graph_.inbound_.emplace_back();
    edgeSets_.emplace_back();
    return index;
}

void LinkGraphBuilder::addSeed(const std::string& url, bool isRoot, bool inSitemap) {
    if (finalized_) {
        throw std::logic_error("LinkGraphBuilder::addSeed after finalize");
    }
    if (!common::isNormalizedUrl(url)) {
        throw std::logic_error("LinkGraphBuilder::addSeed received an unnormalized URL: " + url);
    }

    GraphNode& node = graph_.nodes_[ensureNode(url)];
    node.isRoot = node.isRoot || isRoot;
    node.inSitemap = node.inSitemap || inSitemap;
}

void LinkGraphBuilder::addPage(const crawler::PageRecord& record) {
    if (finalized_) {
        throw std::logic_error("LinkGraphBuilder::addPage after finalize");
    }
    if (!common::isNormalizedUrl(record.url)) {
        throw std::logic_error("LinkGraphBuilder::addPage received an unnormalized URL: " + record.url);
    }
    if (!record.succeeded()) {
        throw std::logic_error("LinkGraphBuilder::addPage received a failed record: " + record.url);
    }

    size_t source = ensureNode(record.url);
    if (graph_.nodes_[source].fetched) {
        throw std::logic_error("LinkGraphBuilder::addPage received a record twice: " + record.url);
    }
    graph_.nodes_[source].fetched = true;

    std::vector<std::string> targets;
    targets.reserve(record.outboundLinks.size() + 1);

    // A redirect links the requested URL to where it landed
    if (record.wasRedirected()) {
        targets.push_back(record.finalUrl);
    }
    targets.insert(targets.end(), record.outboundLinks.begin(), record.outboundLinks.end());

    size_t added = 0;
    for (const auto& link : targets) {
        auto target = common::normalizeUrl(link);
        if (!target || *target == record.url) {
            continue;
        }
        if (!common::isSameSite(common::extractHost(*target), targetHost_)) {
            continue;
        }

        size_t targetIndex = ensureNode(*target);
        if (edgeSets_[source].insert(targetIndex).second) {
            graph_.outbound_[source].push_back(targetIndex);
            graph_.inbound_[targetIndex].push_back(source);
            graph_.edgeCount_++;
            added++;
        }
    }

    LOG_TRACE("Graph: " + record.url + " contributes " + std::to_string(added) + " edges");
}

LinkGraph LinkGraphBuilder::finalize() {
    if (finalized_) {
        throw std::logic_error("LinkGraphBuilder::finalize called twice");
    }
    finalized_ = true;

    size_t maxInDegree = 0;
    for (size_t i = 0; i < graph_.nodes_.size(); ++i) {
        GraphNode& node = graph_.nodes_[i];
        node.inDegree = graph_.inbound_[i].size();
        node.outDegree = graph_.outbound_[i].size();
        maxInDegree = std::max(maxInDegree, node.inDegree);
    }

    for (auto& node : graph_.nodes_) {
        node.authority = maxInDegree > 0 ? static_cast<double>(node.inDegree) / maxInDegree : 0.0;
        if (node.inDegree == 0 && !node.isRoot) {
            graph_.orphans_.push_back(node.url);
        }
    }
    std::sort(graph_.orphans_.begin(), graph_.orphans_.end());

    computeDepths();
    computePageRank();

    LOG_INFO("Link graph finalized: " + std::to_string(graph_.nodes_.size()) + " nodes, " +
             std::to_string(graph_.edgeCount_) + " edges, " +
             std::to_string(graph_.orphans_.size()) + " orphans");

    edgeSets_.clear();
    LinkGraph result = std::move(graph_);
    graph_ = LinkGraph();
    return result;
}

void LinkGraphBuilder::computeDepths() {
    std::deque<size_t> queue;
    for (size_t i = 0; i < graph_.nodes_.size(); ++i) {
        if (graph_.nodes_[i].isRoot) {
            graph_.nodes_[i].depth = 0;
            queue.push_back(i);
        }
    }

    while (!queue.empty()) {
        size_t current = queue.front();
        queue.pop_front();
        for (size_t target : graph_.outbound_[current]) {
            if (graph_.nodes_[target].depth < 0) {
                graph_.nodes_[target].depth = graph_.nodes_[current].depth + 1;
                queue.push_back(target);
            }
        }
    }
}

void LinkGraphBuilder::computePageRank() {
    const size_t n = graph_.nodes_.size();
    if (n == 0) {
        return;
    }

    std::vector<double> rank(n, 1.0 / n);
    std::vector<double> next(n);

    for (int iteration = 0; iteration < kMaxIterations; ++iteration) {
        double danglingMass = 0.0;
        for (size_t i = 0; i < n; ++i) {
            if (graph_.outbound_[i].empty()) {
                danglingMass += rank[i];
            }
        }

        const double base = (1.0 - kDamping) / n + kDamping * danglingMass / n;
        std::fill(next.begin(), next.end(), base);
        for (size_t i = 0; i < n; ++i) {
            const auto& targets = graph_.outbound_[i];
            if (targets.empty()) {
                continue;
            }
            const double share = kDamping * rank[i] / targets.size();
            for (size_t target : targets) {
                next[target] += share;
            }
        }

        double delta = 0.0;
        for (size_t i = 0; i < n; ++i) {
            delta += std::fabs(next[i] - rank[i]);
        }
        rank.swap(next);
        if (delta < n * kTolerance) {
            break;
        }
    }

    for (size_t i = 0; i < n; ++i) {
        graph_.nodes_[i].pageRank = rank[i];
    }
}

} // namespace seo_audit::graph
