#pragma once

#include <cstddef>
#include <expected>
#include <optional>
#include <span>
#include <system_error>
#include <vector>

#include "core/common.hpp"
#include "core/merkle_tree.hpp"

namespace Forest::Core {

struct LocatedProof {
    MerkleTree::Proof proof;
    size_t tree_index; // 产生该证明的树
};

/// Ordered, append-only sequence of same-depth sparse trees.
///
/// Leaves always go to the current (last) tree. When a batch does not fit, the
/// current tree is finalized and a successor seeded with its root takes the rest.
/// Callers serialise writers; start positions are the only ordering guard.
class TreePool {
public:
    [[nodiscard]]
    static auto create(const ForestConfig& config = {}) -> std::expected<TreePool, std::error_code>;

    TreePool(const TreePool&) = delete;
    TreePool& operator=(const TreePool&) = delete;

    TreePool(TreePool&&) noexcept = default;
    TreePool& operator=(TreePool&&) noexcept = default;

    ~TreePool() = default;

    // Returns the index of the tree holding the last inserted leaf.
    // start_position must equal the current tree's length; any other value is
    // NonContiguousInsertion, with one exception: a completely full current tree
    // accepts start_position 0 and opens its successor before inserting.
    [[nodiscard]]
    auto insert_leaves(std::span<const Hash> leaves, size_t start_position)
        -> std::expected<size_t, std::error_code>;

    // Rebuild the interior of the current tree only
    void finalize_tree();

    // With an in-range tree_index only that tree is searched; otherwise all
    // trees are scanned oldest first.
    [[nodiscard]]
    auto generate_proof(const Hash& element, std::optional<size_t> tree_index = std::nullopt) const
        -> std::expected<LocatedProof, std::error_code>;

    [[nodiscard]] std::vector<Hash> roots() const;
    [[nodiscard]] const Hash& root() const { return current_tree().root(); }
    [[nodiscard]] int depth() const { return current_tree().depth(); }

    [[nodiscard]] size_t capacity() const noexcept { return capacity_; }
    [[nodiscard]] size_t current_index() const noexcept { return current_index_; }
    [[nodiscard]] size_t tree_count() const noexcept { return trees_.size(); }
    [[nodiscard]] const MerkleTree::SparseTree& tree(size_t index) const { return trees_.at(index); }

    // Throws std::runtime_error if the current index does not name a tree.
    [[nodiscard]] const MerkleTree::SparseTree& current_tree() const;

private:
    TreePool(int depth, MerkleTree::SparseTree&& first);

    MerkleTree::SparseTree& current_tree_mut();

    // finalize current + open a successor seeded from its root
    void spill();

    int depth_;
    size_t capacity_;
    size_t current_index_ = 0;
    std::vector<MerkleTree::SparseTree> trees_;
};

} // namespace Forest::Core
