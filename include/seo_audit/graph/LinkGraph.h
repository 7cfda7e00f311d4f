#pragma once

#include <optional>
#include <string>
#include <unordered_map>
#include <unordered_set>
#include <utility>
#include <vector>
#include "../crawler/models/PageRecord.h"

namespace seo_audit::graph {

struct GraphNode {
    std::string url;          // normalized
    bool isRoot = false;      // BFS seed
    bool inSitemap = false;   // declared by a sitemap
    bool fetched = false;     // added through addPage

    // Filled by finalize()
    size_t inDegree = 0;
    size_t outDegree = 0;
    int depth = -1;           // -1 when unreachable from the root set
    double authority = 0.0;   // in-degree / max in-degree
    double pageRank = 0.0;
};

// Finalized, read-only link graph. Nodes live in one table indexed by
// position; adjacency lists hold indices into it.
class LinkGraph {
public:
    LinkGraph() = default;

    const std::vector<GraphNode>& nodes() const { return nodes_; }
    size_t nodeCount() const { return nodes_.size(); }
    size_t edgeCount() const { return edgeCount_; }

    std::optional<size_t> indexOf(const std::string& url) const;
    const GraphNode* find(const std::string& url) const;

    const std::vector<size_t>& outbound(size_t index) const { return outbound_.at(index); }
    const std::vector<size_t>& inbound(size_t index) const { return inbound_.at(index); }

    // URLs linking to url, sorted
    std::vector<std::string> inboundUrls(const std::string& url) const;

    // (source, target) pairs sorted by source then target
    std::vector<std::pair<std::string, std::string>> edges() const;

    // Nodes with zero in-degree that are not roots, sorted
    const std::vector<std::string>& orphans() const { return orphans_; }

    bool hasSitemapNodes() const;

private:
    friend class LinkGraphBuilder;

    std::vector<GraphNode> nodes_;
    std::unordered_map<std::string, size_t> index_;
    std::vector<std::vector<size_t>> outbound_;
    std::vector<std::vector<size_t>> inbound_;
    std::vector<std::string> orphans_;
    size_t edgeCount_ = 0;
};

// Incremental builder fed by the crawl coordinator. Every URL handed to it
// must already be normalized; anything else is a logic error.
class LinkGraphBuilder {
public:
    explicit LinkGraphBuilder(std::string targetHost);

    // Register a root (BFS seed) or a sitemap-declared URL
    void addSeed(const std::string& url, bool isRoot, bool inSitemap);

    // Add a successfully fetched internal page and an edge to every internal
    // link target. A redirected page also gets an edge to its final URL.
    // Each page may be added once.
    void addPage(const crawler::PageRecord& record);

    // Compute metrics and hand over the graph. The builder is empty afterwards.
    LinkGraph finalize();

    size_t nodeCount() const { return graph_.nodes_.size(); }

private:
    size_t ensureNode(const std::string& url);

    void computeDepths();
    void computePageRank();

    std::string targetHost_;
    LinkGraph graph_;
    std::vector<std::unordered_set<size_t>> edgeSets_;
    bool finalized_ = false;
};

} // namespace seo_audit::graph
