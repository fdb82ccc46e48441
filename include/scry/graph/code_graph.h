#pragma once

#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include <nlohmann/json.hpp>

namespace scry::graph {

enum class NodeKind { Module, Class, Function, Interface, Impl };

const char* toString(NodeKind kind) noexcept;
std::optional<NodeKind> parseNodeKind(std::string_view text) noexcept;

/**
 * @brief A structural entity (module, class, function, interface, impl block)
 *
 * Identity is (file_path, name): ids are "module:<file>" for the per-file module node and
 * "symbol:<file>:<name>" for everything else.
 */
struct CodeNode {
    std::string name;
    NodeKind kind = NodeKind::Function;
    std::string file_path; // relative to the scan root

    uint32_t start_line = 0; // 1-based, inclusive
    uint32_t end_line = 0;   // 1-based, inclusive
    uint32_t complexity = 0;

    std::vector<std::string> dependencies; // called or imported names, first-seen order
    std::vector<std::string> definitions;  // module nodes: ids of owned symbols

    [[nodiscard]] std::string id() const;

    [[nodiscard]] bool is_valid() const noexcept {
        return !name.empty() && !file_path.empty() && start_line > 0 && end_line >= start_line;
    }

    [[nodiscard]] bool isCallable() const noexcept { return kind == NodeKind::Function; }

    // Returns false when the name was already present
    bool addDependency(std::string_view dependency);
    bool addDefinition(std::string_view nodeId);
};

std::string moduleId(std::string_view filePath);
std::string symbolId(std::string_view filePath, std::string_view name);

struct DependencyEdge {
    std::string from; // node id
    std::string to;   // node id when resolved in the same file, raw name otherwise
    bool resolved = false;
};

/**
 * @brief In-memory code graph: nodes keyed by id plus dependency edges inferred on demand
 */
class CodeGraph {
public:
    using NodeMap = std::map<std::string, CodeNode>;

    // Inserts a node; returns false (and leaves the graph unchanged) when the id exists.
    bool insert(CodeNode node);

    [[nodiscard]] const CodeNode* find(std::string_view id) const;
    [[nodiscard]] bool contains(std::string_view id) const { return find(id) != nullptr; }

    [[nodiscard]] const NodeMap& nodes() const noexcept { return nodes_; }
    [[nodiscard]] size_t size() const noexcept { return nodes_.size(); }
    [[nodiscard]] bool empty() const noexcept { return nodes_.empty(); }

    [[nodiscard]] std::vector<const CodeNode*> nodesInFile(std::string_view filePath) const;
    [[nodiscard]] std::vector<const CodeNode*> nodesNamed(std::string_view name) const;

    // Resolves every dependency name against same-file symbols (local call approximation).
    [[nodiscard]] std::vector<DependencyEdge> edges() const;

    [[nodiscard]] nlohmann::json toJson() const;

private:
    NodeMap nodes_;
};

nlohmann::json toJson(const CodeNode& node);

} // namespace scry::graph
