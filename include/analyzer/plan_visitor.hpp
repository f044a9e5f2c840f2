#pragma once

#include "core/types.hpp"

#include <vector>

namespace plansight {

/**
 * @brief Depth-first pre-order walk: node before children, children in
 * execution order.
 *
 * Every per-node rule goes through here so all rules see nodes in the
 * same sequence. Uses an explicit stack; plan depth does not consume
 * call stack.
 */
template<typename Visitor>
void visit_preorder(const PlanNode& root, Visitor&& visit) {
    std::vector<const PlanNode*> stack;
    stack.push_back(&root);
    while (!stack.empty()) {
        const PlanNode* node = stack.back();
        stack.pop_back();
        visit(*node);
        for (auto it = node->children.rbegin(); it != node->children.rend(); ++it) {
            stack.push_back(&*it);
        }
    }
}

// Pre-order search; stops at the first match
template<typename Predicate>
[[nodiscard]] bool any_node(const PlanNode& root, Predicate&& pred) {
    std::vector<const PlanNode*> stack;
    stack.push_back(&root);
    while (!stack.empty()) {
        const PlanNode* node = stack.back();
        stack.pop_back();
        if (pred(*node)) return true;
        for (auto it = node->children.rbegin(); it != node->children.rend(); ++it) {
            stack.push_back(&*it);
        }
    }
    return false;
}

} // namespace plansight
