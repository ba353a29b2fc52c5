#pragma once
#include <cstddef>
#include <memory>
#include <string>
#include <unordered_map>
#include <vector>

namespace schemalint {

// Duplicate detection over tuples of strings, stored as a prefix tree: each
// node maps the literal value at one tuple position to the node for the
// remaining positions. Values are never concatenated, so a value containing
// any separator cannot collide with a neighbouring one.
//
// A tuple is contained when every one of its elements can be followed down
// from the root. The empty tuple is never contained.
class CompositeKeySet {
public:
    using Tuple = std::vector<std::string>;

    CompositeKeySet() = default;
    CompositeKeySet(const CompositeKeySet&) = delete;
    CompositeKeySet& operator=(const CompositeKeySet&) = delete;

    bool exists(const Tuple& tuple) const;

    // Creates any missing nodes along the tuple's path. Inserting an empty
    // tuple is a no-op.
    void insert(const Tuple& tuple);

    // Number of insert() calls that created a new path
    std::size_t size() const { return size_; }

private:
    struct Node {
        std::unordered_map<std::string, std::unique_ptr<Node>> children;
    };

    Node root_;
    std::size_t size_{0};
};

} // namespace schemalint
