#pragma once

#include <algorithm>
#include <cstddef>
#include <deque>
#include <functional>
#include <set>
#include <sstream>
#include <string>
#include <unordered_map>
#include <unordered_set>
#include <utility>
#include <vector>

namespace sift {

// ---------------------------------------------------------------------------
// Graph<NodeData>: arena of nodes with a flat edge list
//
// Node ids are dense indices that never change once assigned. Edges are
// (from, to) id pairs stored once; forward and reverse adjacency are derived
// CSR indices rebuilt on demand after edges change.
// ---------------------------------------------------------------------------

template<typename NodeData>
class Graph {
public:
    using NodeId = size_t;

    struct Edge {
        NodeId from;
        NodeId to;
    };

    NodeId add_node(NodeData data) {
        NodeId id = nodes_.size();
        nodes_.push_back(std::move(data));
        dirty_ = true;
        return id;
    }

    // Duplicate edges are ignored.
    bool add_edge(NodeId from, NodeId to) {
        if (!edge_keys_.insert(key(from, to)).second) return false;
        edges_.push_back({from, to});
        dirty_ = true;
        return true;
    }

    bool has_edge(NodeId from, NodeId to) const {
        return edge_keys_.count(key(from, to)) > 0;
    }

    size_t node_count() const { return nodes_.size(); }
    size_t edge_count() const { return edges_.size(); }

    const NodeData& node(NodeId id) const { return nodes_[id]; }
    const std::vector<Edge>& edges() const { return edges_; }

    std::vector<NodeId> successors(NodeId id) const {
        reindex();
        return slice(fwd_offsets_, fwd_targets_, id);
    }

    std::vector<NodeId> predecessors(NodeId id) const {
        reindex();
        return slice(rev_offsets_, rev_targets_, id);
    }

    size_t out_degree(NodeId id) const {
        reindex();
        return fwd_offsets_[id + 1] - fwd_offsets_[id];
    }

    size_t in_degree(NodeId id) const {
        reindex();
        return rev_offsets_[id + 1] - rev_offsets_[id];
    }

    // Breadth-first walk over reverse edges from `seeds`, at most `depth`
    // hops. Seeds are included; depth 0 returns just the seeds.
    std::vector<NodeId> reverse_reachable(const std::vector<NodeId>& seeds,
                                          size_t depth) const {
        reindex();
        std::vector<char> seen(nodes_.size(), 0);
        std::vector<NodeId> out;
        std::deque<std::pair<NodeId, size_t>> queue;
        for (NodeId s : seeds) {
            if (s >= nodes_.size() || seen[s]) continue;
            seen[s] = 1;
            out.push_back(s);
            queue.push_back({s, 0});
        }
        while (!queue.empty()) {
            auto [u, d] = queue.front();
            queue.pop_front();
            if (d >= depth) continue;
            for (size_t i = rev_offsets_[u]; i < rev_offsets_[u + 1]; ++i) {
                NodeId p = rev_targets_[i];
                if (seen[p]) continue;
                seen[p] = 1;
                out.push_back(p);
                queue.push_back({p, d + 1});
            }
        }
        return out;
    }

    // Tree display of forward edges; a repeated node is marked "(*)".
    std::string tree_display(
        NodeId root,
        const std::function<std::string(const NodeData&)>& to_string_fn) const
    {
        reindex();
        std::ostringstream out;
        std::unordered_set<NodeId> visited;
        tree_display_impl(root, "", true, visited, to_string_fn, out);
        return out.str();
    }

private:
    static unsigned long long key(NodeId from, NodeId to) {
        return (static_cast<unsigned long long>(from) << 32) ^ static_cast<unsigned long long>(to);
    }

    static std::vector<NodeId> slice(const std::vector<size_t>& offsets,
                                     const std::vector<NodeId>& targets, NodeId id) {
        return std::vector<NodeId>(targets.begin() + static_cast<long>(offsets[id]),
                                   targets.begin() + static_cast<long>(offsets[id + 1]));
    }

    static void build_csr(size_t n, const std::vector<Edge>& edges, bool reverse,
                          std::vector<size_t>& offsets, std::vector<NodeId>& targets) {
        offsets.assign(n + 1, 0);
        for (const auto& e : edges) offsets[(reverse ? e.to : e.from) + 1]++;
        for (size_t i = 0; i < n; ++i) offsets[i + 1] += offsets[i];
        targets.assign(edges.size(), 0);
        std::vector<size_t> cursor(offsets.begin(), offsets.end() - 1);
        for (const auto& e : edges) {
            NodeId src = reverse ? e.to : e.from;
            targets[cursor[src]++] = reverse ? e.from : e.to;
        }
    }

    void reindex() const {
        if (!dirty_) return;
        build_csr(nodes_.size(), edges_, false, fwd_offsets_, fwd_targets_);
        build_csr(nodes_.size(), edges_, true, rev_offsets_, rev_targets_);
        dirty_ = false;
    }

    void tree_display_impl(
        NodeId u,
        const std::string& prefix,
        bool is_last,
        std::unordered_set<NodeId>& visited,
        const std::function<std::string(const NodeData&)>& to_string_fn,
        std::ostringstream& out) const
    {
        out << prefix;
        if (!prefix.empty()) {
            out << (is_last ? "`-- " : "|-- ");
        }
        out << to_string_fn(nodes_[u]);

        if (!visited.insert(u).second) {
            out << " (*)\n";
            return;
        }
        out << "\n";

        size_t begin = fwd_offsets_[u];
        size_t end = fwd_offsets_[u + 1];
        for (size_t i = begin; i < end; ++i) {
            std::string child_prefix = prefix;
            if (!prefix.empty()) {
                child_prefix += (is_last ? "    " : "|   ");
            } else {
                child_prefix = " ";
            }
            tree_display_impl(fwd_targets_[i], child_prefix, i + 1 == end,
                              visited, to_string_fn, out);
        }
    }

    std::vector<NodeData> nodes_;
    std::vector<Edge> edges_;
    std::unordered_set<unsigned long long> edge_keys_;

    mutable bool dirty_ = false;
    mutable std::vector<size_t> fwd_offsets_{0};
    mutable std::vector<NodeId> fwd_targets_;
    mutable std::vector<size_t> rev_offsets_{0};
    mutable std::vector<NodeId> rev_targets_;
};

// ---------------------------------------------------------------------------
// PathGraph: repo-relative path keyed wrapper
// ---------------------------------------------------------------------------

class PathGraph {
public:
    using NodeId = Graph<std::string>::NodeId;

    NodeId add_node(const std::string& path) {
        auto it = ids_.find(path);
        if (it != ids_.end()) return it->second;
        NodeId id = graph_.add_node(path);
        ids_.emplace(path, id);
        return id;
    }

    bool has_node(const std::string& path) const {
        return ids_.count(path) > 0;
    }

    NodeId node_id(const std::string& path) const {
        return ids_.at(path);
    }

    bool add_edge(const std::string& src, const std::string& dst) {
        NodeId s = add_node(src);
        NodeId d = add_node(dst);
        return graph_.add_edge(s, d);
    }

    bool has_edge(const std::string& src, const std::string& dst) const {
        auto s = ids_.find(src);
        auto d = ids_.find(dst);
        if (s == ids_.end() || d == ids_.end()) return false;
        return graph_.has_edge(s->second, d->second);
    }

    // Files reaching any seed within `depth` reverse hops, seeds included.
    // Seeds absent from the graph are still returned.
    std::set<std::string> impacted(const std::vector<std::string>& seeds, size_t depth) const {
        std::set<std::string> out;
        std::vector<NodeId> start;
        for (const auto& s : seeds) {
            auto it = ids_.find(s);
            if (it == ids_.end()) {
                out.insert(s);
            } else {
                start.push_back(it->second);
            }
        }
        for (NodeId id : graph_.reverse_reachable(start, depth)) {
            out.insert(graph_.node(id));
        }
        return out;
    }

    std::vector<std::string> importers_of(const std::string& path) const {
        return names(path, false);
    }

    std::vector<std::string> imports_of(const std::string& path) const {
        return names(path, true);
    }

    std::string tree_display(const std::string& root) const {
        auto it = ids_.find(root);
        if (it == ids_.end()) return "";
        return graph_.tree_display(it->second,
            [](const std::string& s) { return s; });
    }

    size_t node_count() const { return graph_.node_count(); }
    size_t edge_count() const { return graph_.edge_count(); }


private:
    std::vector<std::string> names(const std::string& path, bool forward) const {
        std::vector<std::string> out;
        auto it = ids_.find(path);
        if (it == ids_.end()) return out;
        auto ids = forward ? graph_.successors(it->second) : graph_.predecessors(it->second);
        for (NodeId id : ids) out.push_back(graph_.node(id));
        std::sort(out.begin(), out.end());
        return out;
    }

    Graph<std::string> graph_;
    std::unordered_map<std::string, NodeId> ids_;
};

} // namespace sift
