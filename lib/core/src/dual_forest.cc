#include "core/dual_forest.hpp"
#include "core/logging.hpp"
#include <utility>

namespace Forest::Core {

auto DualForest::create(const ForestConfig& config) -> std::expected<DualForest, std::error_code>
{
    // 两个森林共用同一深度
    auto commitments = TreePool::create(config);
    if (!commitments) {
        return std::unexpected(commitments.error());
    }
    auto identifiers = TreePool::create(config);
    if (!identifiers) {
        return std::unexpected(identifiers.error());
    }
    return DualForest(std::move(*commitments), std::move(*identifiers));
}

auto DualForest::insert_nullifier(std::string_view nullifier) -> std::expected<void, std::error_code>
{
    auto [it, inserted] = nullifiers_.emplace(nullifier);
    if (!inserted) {
        logger()->warn("Rejected duplicate nullifier ({} recorded)", nullifiers_.size());
        return std::unexpected(make_error_code(Error::DuplicateNullifier));
    }
    return {};
}

bool DualForest::check_nullifier(std::string_view nullifier) const
{
    return nullifiers_.contains(std::string(nullifier));
}

} // namespace Forest::Core
