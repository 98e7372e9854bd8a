#pragma once

#include <depman/graph.hpp>
#include <depman/manifest.hpp>
#include <depman/result.hpp>
#include <string>
#include <unordered_map>
#include <vector>

namespace depman {

// Prerequisite graph of a manifest: one node per dependency (declaration
// order), one edge from each dependency to each of its prerequisites.
class DependencyGraph {
public:
    // UnknownDependency if a prerequisite names nothing in the manifest.
    static Result<DependencyGraph> build(const Manifest& manifest);

    // Prerequisites before dependents; independent entries keep their
    // manifest order. CyclicDependency names the cycle members.
    Result<std::vector<std::string>> order() const;

    // Names of every dependency that transitively requires `name`.
    std::vector<std::string> dependents_of(const std::string& name) const;

    std::string tree_display(const std::string& root) const;

    bool contains(const std::string& name) const { return ids_.count(name) > 0; }
    size_t size() const { return graph_.node_count(); }

private:
    Graph<std::string> graph_;
    std::unordered_map<std::string, Graph<std::string>::NodeId> ids_;
};

// Build + order in one step; both failures are run-fatal.
Result<std::vector<std::string>> order_dependencies(const Manifest& manifest);

} // namespace depman
