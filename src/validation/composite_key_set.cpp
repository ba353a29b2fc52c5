#include "validation/composite_key_set.hpp"

namespace schemalint {

bool CompositeKeySet::exists(const Tuple& tuple) const {
    if (tuple.empty()) return false;
    const Node* node = &root_;
    for (const auto& value : tuple) {
        auto it = node->children.find(value);
        if (it == node->children.end()) return false;
        node = it->second.get();
    }
    return true;
}

void CompositeKeySet::insert(const Tuple& tuple) {
    if (tuple.empty()) return;
    Node* node = &root_;
    bool created = false;
    for (const auto& value : tuple) {
        auto& child = node->children[value];
        if (!child) {
            child = std::make_unique<Node>();
            created = true;
        }
        node = child.get();
    }
    if (created) ++size_;
}

} // namespace schemalint
