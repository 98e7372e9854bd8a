#pragma once

#include <depman/result.hpp>
#include <algorithm>
#include <functional>
#include <sstream>
#include <string>
#include <unordered_set>
#include <variant>
#include <vector>

namespace depman {

// ---------------------------------------------------------------------------
// Graph<NodeData, EdgeData>: directed graph with adjacency list
// ---------------------------------------------------------------------------

template<typename NodeData, typename EdgeData = std::monostate>
class Graph {
public:
    using NodeId = size_t;

    struct Edge {
        NodeId from;
        NodeId to;
        EdgeData data;
    };

    NodeId add_node(NodeData data) {
        NodeId id = nodes_.size();
        nodes_.push_back(std::move(data));
        adj_.push_back({});
        radj_.push_back({});
        return id;
    }

    void add_edge(NodeId from, NodeId to, EdgeData data = {}) {
        adj_[from].push_back({from, to, std::move(data)});
        radj_[to].push_back(from);
    }

    bool has_edge(NodeId from, NodeId to) const {
        for (const auto& e : adj_[from]) {
            if (e.to == to) return true;
        }
        return false;
    }

    size_t node_count() const { return nodes_.size(); }

    const NodeData& node(NodeId id) const { return nodes_[id]; }
    NodeData& node(NodeId id) { return nodes_[id]; }

    const std::vector<Edge>& successors(NodeId id) const { return adj_[id]; }
    const std::vector<NodeId>& predecessors(NodeId id) const { return radj_[id]; }

    // Depth-first post-order: every node comes after all nodes reachable
    // through its out-edges. Roots are taken in insertion order and edges
    // in the order they were added, so the result is deterministic.
    //
    // A back edge (reaching a node that is still in progress) is a cycle;
    // the error message lists the cycle, e.g. "a -> b -> a", using
    // `label` to render nodes.
    Result<std::vector<NodeId>> topological_order(
        std::function<std::string(const NodeData&)> label) const
    {
        enum class Color { White, Gray, Black };
        std::vector<Color> color(nodes_.size(), Color::White);
        std::vector<NodeId> order;
        std::vector<NodeId> stack;
        order.reserve(nodes_.size());

        std::function<Result<std::monostate>(NodeId)> visit =
            [&](NodeId u) -> Result<std::monostate> {
            color[u] = Color::Gray;
            stack.push_back(u);
            for (const auto& e : adj_[u]) {
                if (color[e.to] == Color::Gray) {
                    std::string cycle;
                    auto it = std::find(stack.begin(), stack.end(), e.to);
                    for (; it != stack.end(); ++it) {
                        cycle += label(nodes_[*it]) + " -> ";
                    }
                    cycle += label(nodes_[e.to]);
                    return DepmanError{DepmanError::CyclicDependency,
                        "dependency cycle: " + cycle};
                }
                if (color[e.to] == Color::White) {
                    auto r = visit(e.to);
                    if (r.is_err()) return r;
                }
            }
            stack.pop_back();
            color[u] = Color::Black;
            order.push_back(u);
            return ok_status();
        };

        for (NodeId id = 0; id < nodes_.size(); ++id) {
            if (color[id] != Color::White) continue;
            auto r = visit(id);
            if (r.is_err()) return std::move(r).error();
        }
        return Result<std::vector<NodeId>>::ok(std::move(order));
    }

    // Renders the subgraph reachable from `root` as an indented tree.
    // Nodes already printed are shown again with a "(*)" marker and not
    // expanded a second time.
    std::string tree_display(
        NodeId root,
        std::function<std::string(const NodeData&)> to_string_fn) const
    {
        std::ostringstream out;
        std::unordered_set<NodeId> visited;
        tree_display_impl(root, "", "", visited, to_string_fn, out);
        return out.str();
    }

private:
    std::vector<NodeData> nodes_;
    std::vector<std::vector<Edge>> adj_;
    std::vector<std::vector<NodeId>> radj_;

    void tree_display_impl(
        NodeId u,
        const std::string& indent,
        const std::string& connector,
        std::unordered_set<NodeId>& visited,
        std::function<std::string(const NodeData&)>& to_string_fn,
        std::ostringstream& out) const
    {
        out << indent << connector << to_string_fn(nodes_[u]);
        if (!visited.insert(u).second) {
            out << " (*)\n";
            return;
        }
        out << "\n";

        std::string child_indent = indent;
        if (!connector.empty()) {
            child_indent += (connector == kLastBranch) ? "    " : "│   ";
        }

        const auto& edges = adj_[u];
        for (size_t i = 0; i < edges.size(); ++i) {
            bool last = i + 1 == edges.size();
            tree_display_impl(edges[i].to, child_indent,
                              last ? kLastBranch : kBranch,
                              visited, to_string_fn, out);
        }
    }

    static constexpr const char* kBranch = "├── ";
    static constexpr const char* kLastBranch = "└── ";
};

} // namespace depman
