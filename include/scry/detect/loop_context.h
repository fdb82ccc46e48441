#pragma once

#include <cstddef>
#include <string_view>
#include <vector>

namespace scry::detect {

/**
 * @brief Syntax node kinds of the current traversal path, root first
 *
 * The visitor pushes a node kind when it enters a node and pops it on exit, so the stack always
 * describes the ancestors of the node being visited. Kinds are stored as views and must
 * outlive the stack (tree-sitter node type names are static).
 *
 * Only the `body` field of a for loop is loop context; the iterable and the else clause run
 * once per loop and are not.
 */
class AncestorStack {
public:
    // fieldName is the field the node occupies in its parent, empty when it has none
    void push(std::string_view nodeKind, std::string_view fieldName = {});
    void pop();

    [[nodiscard]] bool empty() const noexcept { return frames_.empty(); }
    [[nodiscard]] size_t depth() const noexcept { return frames_.size(); }

    [[nodiscard]] bool contains(std::string_view nodeKind) const noexcept;

    // true when any ancestor is the body of a for loop
    [[nodiscard]] bool insideLoop() const noexcept;

private:
    struct Frame {
        std::string_view kind;
        bool loopBody;
    };

    std::vector<Frame> frames_;
    size_t loopDepth_ = 0;
};

bool isLoopKind(std::string_view nodeKind) noexcept;

/**
 * @brief Whether `receiver.method(...)` looks like a data-access call
 *
 * method must be one of get, query, execute, find. receiver is the last segment of the callee's
 * object (`db` for `self.db.get`) and must end in db, session, model or objects.
 */
bool isDataAccessCall(std::string_view receiver, std::string_view method) noexcept;

} // namespace scry::detect
