#pragma once

#include <cstddef>
#include <cstdint>
#include <cstring>
#include <expected>
#include <optional>
#include <span>
#include <system_error>
#include <unordered_map>
#include <vector>

#include "core/common.hpp"

namespace Forest::Core::MerkleTree {

struct Proof {
    Hash element; // 被证明的叶子
    std::vector<Hash> elements; // 每一层的兄弟节点, leaf -> root
    uint64_t indices = 0; // bit i = 1: 第 i 层路径节点是右孩子
    Hash root; // 生成证明时的 root

    bool operator==(const Proof&) const = default;
};

// zeros[0] = zero leaf, zeros[i] = H(zeros[i-1], zeros[i-1]); exactly `depth` entries.
[[nodiscard]]
std::vector<Hash> zero_levels(int depth);

/// Fixed-depth sparse Merkle tree.
///
/// levels_[0] holds the leaves in insertion order and levels_[depth] holds the root.
/// Interior levels are only recomputed by rebuild_sparse_tree(); after an insertion
/// the tree is dirty() and root()/generate_proof() still describe the last rebuild.
class SparseTree {
public:
    // from_tree: the new tree's root is pinned to from_tree->root() until its own
    // leaves are finalized. Without it the root is the empty tree root.
    [[nodiscard]]
    static auto create(size_t tree_number, int depth, const SparseTree* from_tree = nullptr)
        -> std::expected<SparseTree, std::error_code>;

    // Writes leaves[i] at position start_position + i. No interior recomputation.
    // Positions below length() are overwritten; a gap or a write past capacity()
    // fails before anything is touched.
    [[nodiscard]]
    auto insert_leaves(std::span<const Hash> leaves, size_t start_position)
        -> std::expected<void, std::error_code>;

    // Finalize: recompute every interior level from the leaves.
    void rebuild_sparse_tree();

    // Position of the first leaf equal to element
    [[nodiscard]] std::optional<size_t> find_leaf(const Hash& element) const;

    [[nodiscard]]
    auto generate_proof(const Hash& element) const -> std::expected<Proof, std::error_code>;

    [[nodiscard]] size_t tree_number() const noexcept { return tree_number_; }
    [[nodiscard]] int depth() const noexcept { return depth_; }
    [[nodiscard]] size_t capacity() const noexcept { return capacity_for(depth_); }
    [[nodiscard]] size_t length() const noexcept { return levels_[0].size(); }
    [[nodiscard]] bool dirty() const noexcept { return dirty_; }
    [[nodiscard]] const Hash& root() const { return levels_[depth_][0]; }
    [[nodiscard]] const std::vector<Hash>& zeros() const noexcept { return zeros_; }
    [[nodiscard]] const std::vector<Hash>& level(int i) const { return levels_.at(static_cast<size_t>(i)); }

private:
    SparseTree(size_t tree_number, int depth, std::vector<Hash>&& zeros, const Hash& root);

    void reindex();

    struct NodeHash {
        size_t operator()(const Hash& h) const noexcept
        {
            // 域元素低位分布均匀，直接取末尾字节
            size_t v;
            std::memcpy(&v, h.data() + h.size() - sizeof(v), sizeof(v));
            return v;
        }
    };

    size_t tree_number_;
    int depth_;
    std::vector<Hash> zeros_;
    std::vector<std::vector<Hash>> levels_;
    std::unordered_map<Hash, size_t, NodeHash> leaf_index_;
    bool dirty_ = false;
};

// Stateless: folds proof.elements from proof.element and compares with proof.root.
[[nodiscard]]
bool validate_proof(const Proof& proof);

} // namespace Forest::Core::MerkleTree
