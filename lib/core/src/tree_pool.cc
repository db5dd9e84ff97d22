#include "core/tree_pool.hpp"
#include "core/logging.hpp"
#include <chrono>
#include <stdexcept>
#include <utility>

namespace Forest::Core {
using MerkleTree::SparseTree;

namespace {

    // 校验通过后插入不应失败；失败说明池内部状态已损坏
    void expect_applied(const std::expected<void, std::error_code>& result)
    {
        if (!result) {
            throw std::runtime_error("Validated insertion rejected by tree: " + result.error().message());
        }
    }

} // namespace

TreePool::TreePool(int depth, SparseTree&& first)
    : depth_(depth)
    , capacity_(capacity_for(depth))
{
    trees_.push_back(std::move(first));
}

auto TreePool::create(const ForestConfig& config) -> std::expected<TreePool, std::error_code>
{
    auto first = SparseTree::create(0, config.depth);
    if (!first) {
        return std::unexpected(first.error());
    }
    return TreePool(config.depth, std::move(*first));
}

const SparseTree& TreePool::current_tree() const
{
    if (current_index_ >= trees_.size()) {
        throw std::runtime_error("Current tree is undefined");
    }
    return trees_[current_index_];
}

SparseTree& TreePool::current_tree_mut()
{
    if (current_index_ >= trees_.size()) {
        throw std::runtime_error("Current tree is undefined");
    }
    return trees_[current_index_];
}

auto TreePool::insert_leaves(std::span<const Hash> leaves, size_t start_position)
    -> std::expected<size_t, std::error_code>
{
    if (leaves.empty()) {
        return current_index_;
    }

    // 1. 所有检查都在修改之前完成
    if (start_position >= capacity_) {
        logger()->warn("Invalid start position {} (capacity {})", start_position, capacity_);
        return std::unexpected(make_error_code(Error::InvalidOffset));
    }

    const size_t length = current_tree().length();
    const bool rollover = length == capacity_ && start_position == 0;
    if (!rollover && start_position != length) {
        logger()->warn("Start position {} does not match tree {} length {}",
            start_position, current_index_, length);
        return std::unexpected(make_error_code(Error::NonContiguousInsertion));
    }

    // 2. 当前树恰好已满，先开新树
    if (rollover) {
        spill();
        start_position = 0;
    }

    // 3. 放不下的部分依次溢出到新树
    while (leaves.size() > capacity_ - start_position) {
        const size_t room = capacity_ - start_position;
        expect_applied(current_tree_mut().insert_leaves(leaves.first(room), start_position));
        leaves = leaves.subspan(room);

        spill();
        start_position = 0;
    }

    expect_applied(current_tree_mut().insert_leaves(leaves, start_position));
    return current_index_;
}

void TreePool::finalize_tree()
{
    auto& tree = current_tree_mut();

    auto started = std::chrono::steady_clock::now();
    tree.rebuild_sparse_tree();
    auto elapsed = std::chrono::duration_cast<std::chrono::microseconds>(
        std::chrono::steady_clock::now() - started);

    logger()->debug("Rebuilt sparse tree {} ({} leaves) in {} us",
        tree.tree_number(), tree.length(), elapsed.count());
}

void TreePool::spill()
{
    finalize_tree();

    const size_t next_number = trees_.size();
    // Seeded with the just-finalized root as a placeholder.
    auto next = SparseTree::create(next_number, depth_, &current_tree());
    if (!next) {
        throw std::runtime_error("Cannot create successor tree: " + next.error().message());
    }
    trees_.push_back(std::move(*next));
    current_index_ = next_number;

    logger()->info("Tree {} full, created tree {}", next_number - 1, next_number);
}

auto TreePool::generate_proof(const Hash& element, std::optional<size_t> tree_index) const
    -> std::expected<LocatedProof, std::error_code>
{
    if (tree_index && *tree_index < trees_.size()) {
        auto proof = trees_[*tree_index].generate_proof(element);
        if (!proof) {
            return std::unexpected(proof.error());
        }
        return LocatedProof { .proof = std::move(*proof), .tree_index = *tree_index };
    }

    for (size_t i = 0; i < trees_.size(); ++i) {
        // 单棵树找不到是正常情况，继续扫描
        if (auto proof = trees_[i].generate_proof(element)) {
            return LocatedProof { .proof = std::move(*proof), .tree_index = i };
        }
    }

    return std::unexpected(make_error_code(Error::NotFound));
}

std::vector<Hash> TreePool::roots() const
{
    std::vector<Hash> out;
    out.reserve(trees_.size());
    for (const auto& tree : trees_) {
        out.push_back(tree.root());
    }
    return out;
}

} // namespace Forest::Core
