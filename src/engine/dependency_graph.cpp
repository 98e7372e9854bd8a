#include <depman/dependency_graph.hpp>
#include <depman/log.hpp>
#include <queue>
#include <unordered_set>

namespace depman {

Result<DependencyGraph> DependencyGraph::build(const Manifest& manifest) {
    DependencyGraph g;
    for (const auto& dep : manifest.dependencies) {
        if (g.ids_.count(dep.name)) {
            return DepmanError{DepmanError::Duplicate,
                "dependency '" + dep.name + "' is defined more than once"};
        }
        g.ids_[dep.name] = g.graph_.add_node(dep.name);
    }

    for (const auto& dep : manifest.dependencies) {
        auto from = g.ids_.at(dep.name);
        for (const auto& prereq : dep.dependencies) {
            auto it = g.ids_.find(prereq);
            if (it == g.ids_.end()) {
                return DepmanError{DepmanError::UnknownDependency,
                    "dependency '" + dep.name + "' requires unknown dependency '" +
                    prereq + "'",
                    "define '" + prereq + "' in the manifest or remove it from " +
                    dep.name + ".dependencies",
                    manifest.source, dep.line};
            }
            if (!g.graph_.has_edge(from, it->second)) {
                g.graph_.add_edge(from, it->second);
            }
        }
    }
    return Result<DependencyGraph>::ok(std::move(g));
}

Result<std::vector<std::string>> DependencyGraph::order() const {
    auto ids = graph_.topological_order([](const std::string& s) { return s; });
    if (ids.is_err()) return std::move(ids).error();

    std::vector<std::string> names;
    names.reserve(ids.value().size());
    std::string joined;
    for (auto id : ids.value()) {
        names.push_back(graph_.node(id));
        if (!joined.empty()) joined += ", ";
        joined += names.back();
    }
    log::debug("install order: %s", joined.c_str());
    return Result<std::vector<std::string>>::ok(std::move(names));
}

std::vector<std::string> DependencyGraph::dependents_of(const std::string& name) const {
    std::vector<std::string> out;
    auto it = ids_.find(name);
    if (it == ids_.end()) return out;

    std::unordered_set<Graph<std::string>::NodeId> seen{it->second};
    std::queue<Graph<std::string>::NodeId> q;
    q.push(it->second);
    while (!q.empty()) {
        auto u = q.front();
        q.pop();
        for (auto pred : graph_.predecessors(u)) {
            if (seen.insert(pred).second) {
                out.push_back(graph_.node(pred));
                q.push(pred);
            }
        }
    }
    return out;
}

std::string DependencyGraph::tree_display(const std::string& root) const {
    auto it = ids_.find(root);
    if (it == ids_.end()) return "";
    return graph_.tree_display(it->second, [](const std::string& s) { return s; });
}

Result<std::vector<std::string>> order_dependencies(const Manifest& manifest) {
    auto graph = DependencyGraph::build(manifest);
    if (graph.is_err()) return std::move(graph).error();
    return graph.value().order();
}

} // namespace depman
