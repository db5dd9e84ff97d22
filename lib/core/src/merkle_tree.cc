#include "core/merkle_tree.hpp"
#include "crypto/node_hash.hpp"
#include <utility>

namespace Forest::Core::MerkleTree {
using Crypto::hash_left_right;

std::vector<Hash> zero_levels(int depth)
{
    std::vector<Hash> levels;
    if (depth < 1) {
        return levels;
    }
    levels.reserve(static_cast<size_t>(depth));

    // 第 0 层是叶子的零值
    levels.push_back(Crypto::zero_value());
    for (int level = 1; level < depth; ++level) {
        levels.push_back(hash_left_right(levels.back(), levels.back()));
    }
    return levels;
}

// --- SparseTree 成员函数实现 ---

SparseTree::SparseTree(size_t tree_number, int depth, std::vector<Hash>&& zeros, const Hash& root)
    : tree_number_(tree_number)
    , depth_(depth)
    , zeros_(std::move(zeros))
    , levels_(static_cast<size_t>(depth) + 1)
{
    levels_[depth_].push_back(root);
}

auto SparseTree::create(size_t tree_number, int depth, const SparseTree* from_tree)
    -> std::expected<SparseTree, std::error_code>
{
    if (auto valid = validate(ForestConfig { .depth = depth }); !valid) {
        return std::unexpected(valid.error());
    }

    auto zeros = zero_levels(depth);
    Hash root = from_tree != nullptr
        ? from_tree->root()
        : hash_left_right(zeros.back(), zeros.back());

    return SparseTree(tree_number, depth, std::move(zeros), root);
}

auto SparseTree::insert_leaves(std::span<const Hash> leaves, size_t start_position)
    -> std::expected<void, std::error_code>
{
    if (leaves.empty()) {
        return {};
    }
    if (start_position >= capacity()) {
        return std::unexpected(make_error_code(Error::InvalidOffset));
    }
    if (start_position > length()) {
        // 稠密存储不允许空洞
        return std::unexpected(make_error_code(Error::NonContiguousInsertion));
    }
    if (leaves.size() > capacity() - start_position) {
        return std::unexpected(make_error_code(Error::InvalidOffset));
    }

    auto& row = levels_[0];
    bool overwrote = false;
    for (size_t i = 0; i < leaves.size(); ++i) {
        size_t pos = start_position + i;
        if (pos < row.size()) {
            row[pos] = leaves[i];
            overwrote = true;
        } else {
            row.push_back(leaves[i]);
            leaf_index_.try_emplace(leaves[i], pos);
        }
    }
    if (overwrote) {
        reindex();
    }

    dirty_ = true;
    return {};
}

void SparseTree::rebuild_sparse_tree()
{
    // An empty tree keeps its (possibly inherited) root.
    if (levels_[0].empty()) {
        dirty_ = false;
        return;
    }

    for (int level = 0; level < depth_; ++level) {
        const auto& current = levels_[level];
        auto& next = levels_[level + 1];
        // clear() 保留容量，重复 finalize 不会反复分配
        next.clear();

        for (size_t pos = 0; pos < current.size(); pos += 2) {
            const Hash& right = pos + 1 < current.size() ? current[pos + 1] : zeros_[level];
            next.push_back(hash_left_right(current[pos], right));
        }
    }
    dirty_ = false;
}

std::optional<size_t> SparseTree::find_leaf(const Hash& element) const
{
    auto it = leaf_index_.find(element);
    if (it == leaf_index_.end()) {
        return std::nullopt;
    }
    return it->second;
}

auto SparseTree::generate_proof(const Hash& element) const -> std::expected<Proof, std::error_code>
{
    auto position = find_leaf(element);
    if (!position) {
        return std::unexpected(make_error_code(Error::NotFound));
    }

    std::vector<Hash> elements;
    elements.reserve(static_cast<size_t>(depth_));

    size_t index = *position;
    for (int level = 0; level < depth_; ++level) {
        const auto& row = levels_[level];
        // index ^ 1 是兄弟节点; 超出已填充范围 (或尚未 finalize 的层) 用零值
        size_t sibling = index ^ 1;
        elements.push_back(sibling < row.size() ? row[sibling] : zeros_[level]);
        index >>= 1;
    }

    return Proof {
        .element = element,
        .elements = std::move(elements),
        .indices = static_cast<uint64_t>(*position),
        .root = root()
    };
}

void SparseTree::reindex()
{
    leaf_index_.clear();
    const auto& row = levels_[0];
    for (size_t pos = 0; pos < row.size(); ++pos) {
        // try_emplace 保留第一次出现的位置
        leaf_index_.try_emplace(row[pos], pos);
    }
}

// --- 非成员函数实现 ---

bool validate_proof(const Proof& proof)
{
    // Path bits above the proof length would be ignored by the fold; reject them.
    if (proof.elements.size() < 64 && (proof.indices >> proof.elements.size()) != 0) {
        return false;
    }

    Hash acc = proof.element;
    for (size_t i = 0; i < proof.elements.size(); ++i) {
        const auto& sib = proof.elements[i];
        if (i < 64 && ((proof.indices >> i) & 1U) != 0) {
            // 当前节点是右孩子: H(sib || acc)
            acc = hash_left_right(sib, acc);
        } else {
            // 当前节点是左孩子: H(acc || sib)
            acc = hash_left_right(acc, sib);
        }
    }

    return acc == proof.root;
}

} // namespace Forest::Core::MerkleTree
