#include <scry/core/format.h>
#include <scry/graph/code_graph.h>

#include <algorithm>

namespace scry::graph {

const char* toString(NodeKind kind) noexcept {
    switch (kind) {
        case NodeKind::Module: return "module";
        case NodeKind::Class: return "class";
        case NodeKind::Function: return "function";
        case NodeKind::Interface: return "interface";
        case NodeKind::Impl: return "impl";
    }
    return "function";
}

std::optional<NodeKind> parseNodeKind(std::string_view text) noexcept {
    if (text == "module")
        return NodeKind::Module;
    if (text == "class")
        return NodeKind::Class;
    if (text == "function")
        return NodeKind::Function;
    if (text == "interface")
        return NodeKind::Interface;
    if (text == "impl")
        return NodeKind::Impl;
    return std::nullopt;
}

std::string moduleId(std::string_view filePath) {
    return scry::format("module:{}", filePath);
}

std::string symbolId(std::string_view filePath, std::string_view name) {
    return scry::format("symbol:{}:{}", filePath, name);
}

std::string CodeNode::id() const {
    return kind == NodeKind::Module ? moduleId(file_path) : symbolId(file_path, name);
}

bool CodeNode::addDependency(std::string_view dependency) {
    if (dependency.empty() ||
        std::find(dependencies.begin(), dependencies.end(), dependency) != dependencies.end()) {
        return false;
    }
    dependencies.emplace_back(dependency);
    return true;
}

bool CodeNode::addDefinition(std::string_view nodeId) {
    if (std::find(definitions.begin(), definitions.end(), nodeId) != definitions.end()) {
        return false;
    }
    definitions.emplace_back(nodeId);
    return true;
}

bool CodeGraph::insert(CodeNode node) {
    auto key = node.id();
    return nodes_.try_emplace(std::move(key), std::move(node)).second;
}

const CodeNode* CodeGraph::find(std::string_view id) const {
    auto it = nodes_.find(std::string(id));
    return it == nodes_.end() ? nullptr : &it->second;
}

std::vector<const CodeNode*> CodeGraph::nodesInFile(std::string_view filePath) const {
    std::vector<const CodeNode*> out;
    for (const auto& [id, node] : nodes_) {
        if (node.file_path == filePath)
            out.push_back(&node);
    }
    std::sort(out.begin(), out.end(), [](const CodeNode* a, const CodeNode* b) {
        return a->start_line != b->start_line ? a->start_line < b->start_line
                                              : a->end_line > b->end_line;
    });
    return out;
}

std::vector<const CodeNode*> CodeGraph::nodesNamed(std::string_view name) const {
    std::vector<const CodeNode*> out;
    for (const auto& [id, node] : nodes_) {
        if (node.name == name)
            out.push_back(&node);
    }
    return out;
}

std::vector<DependencyEdge> CodeGraph::edges() const {
    std::vector<DependencyEdge> out;
    for (const auto& [id, node] : nodes_) {
        for (const auto& dep : node.dependencies) {
            DependencyEdge edge;
            edge.from = id;
            auto target = symbolId(node.file_path, dep);
            if (target != id && nodes_.count(target) > 0) {
                edge.to = std::move(target);
                edge.resolved = true;
            } else {
                edge.to = dep;
            }
            out.push_back(std::move(edge));
        }
    }
    return out;
}

nlohmann::json toJson(const CodeNode& node) {
    return nlohmann::json{{"name", node.name},
                          {"type", toString(node.kind)},
                          {"file_path", node.file_path},
                          {"start_line", node.start_line},
                          {"end_line", node.end_line},
                          {"complexity", node.complexity},
                          {"dependencies", node.dependencies},
                          {"definitions", node.definitions}};
}

nlohmann::json CodeGraph::toJson() const {
    auto out = nlohmann::json::object();
    for (const auto& [id, node] : nodes_) {
        out[id] = graph::toJson(node);
    }
    return out;
}

} // namespace scry::graph
