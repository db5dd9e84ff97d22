#pragma once

#include <cstddef>
#include <expected>
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <system_error>
#include <unordered_set>
#include <utility>
#include <vector>

#include "core/common.hpp"
#include "core/tree_pool.hpp"

namespace Forest::Core {

/// Commitment forest + transaction-identifier forest + nullifier set.
class DualForest {
public:
    [[nodiscard]]
    static auto create(const ForestConfig& config = {}) -> std::expected<DualForest, std::error_code>;

    DualForest(const DualForest&) = delete;
    DualForest& operator=(const DualForest&) = delete;

    DualForest(DualForest&&) noexcept = default;
    DualForest& operator=(DualForest&&) noexcept = default;

    ~DualForest() = default;

    // --- commitments (UTXO) ---
    [[nodiscard]]
    auto insert_commitment_leaves(std::span<const Hash> leaves, size_t start_position)
        -> std::expected<size_t, std::error_code>
    {
        return commitments_.insert_leaves(leaves, start_position);
    }
    void finalize_commitments() { commitments_.finalize_tree(); }

    [[nodiscard]]
    auto prove_commitment(const Hash& element, std::optional<size_t> tree_index = std::nullopt) const
        -> std::expected<LocatedProof, std::error_code>
    {
        return commitments_.generate_proof(element, tree_index);
    }
    [[nodiscard]] std::vector<Hash> commitment_roots() const { return commitments_.roots(); }

    // --- transaction identifiers ---
    [[nodiscard]]
    auto insert_identifier_leaves(std::span<const Hash> leaves, size_t start_position)
        -> std::expected<size_t, std::error_code>
    {
        return identifiers_.insert_leaves(leaves, start_position);
    }
    void finalize_identifiers() { identifiers_.finalize_tree(); }

    [[nodiscard]]
    auto prove_identifier(const Hash& element, std::optional<size_t> tree_index = std::nullopt) const
        -> std::expected<LocatedProof, std::error_code>
    {
        return identifiers_.generate_proof(element, tree_index);
    }
    [[nodiscard]] std::vector<Hash> identifier_roots() const { return identifiers_.roots(); }

    // --- nullifiers ---
    [[nodiscard]]
    auto insert_nullifier(std::string_view nullifier) -> std::expected<void, std::error_code>;

    [[nodiscard]] bool check_nullifier(std::string_view nullifier) const;
    [[nodiscard]] size_t nullifier_count() const noexcept { return nullifiers_.size(); }

    [[nodiscard]] const TreePool& commitments() const noexcept { return commitments_; }
    [[nodiscard]] const TreePool& identifiers() const noexcept { return identifiers_; }
    [[nodiscard]] int depth() const { return commitments_.depth(); }

private:
    DualForest(TreePool&& commitments, TreePool&& identifiers)
        : commitments_(std::move(commitments))
        , identifiers_(std::move(identifiers))
    {
    }

    TreePool commitments_;
    TreePool identifiers_;
    std::unordered_set<std::string> nullifiers_;
};

} // namespace Forest::Core
