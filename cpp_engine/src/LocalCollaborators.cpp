#include "LocalCollaborators.h"

#include <cmath>
#include <utility>

namespace scout {

ResultCode LocalLedger::charge(int consumer_id, double amount) {
    if (!std::isfinite(amount) || amount < 0.0) return ResultCode::InvalidState;
    double& bal = balances_[consumer_id];
    if (bal < amount) return ResultCode::InsufficientFunds;
    bal -= amount;
    ++charges_;
    return ResultCode::Ok;
}

void LocalLedger::credit(int consumer_id, double amount) {
    if (!std::isfinite(amount) || amount <= 0.0) return;
    balances_[consumer_id] += amount;
}

double LocalLedger::balance(int consumer_id) const {
    const auto it = balances_.find(consumer_id);
    return (it == balances_.end()) ? 0.0 : it->second;
}

int FixedRatingSource::score(int consumer_id) const {
    const auto it = scores_.find(consumer_id);
    return (it == scores_.end()) ? fallback_ : it->second;
}

ResultCode LocalAcquisition::materialize(const std::string& catalog_key, int consumer_id) {
    if (fail_next_ > 0) {
        --fail_next_;
        return ResultCode::SpawnFailure;
    }
    deliveries_.push_back({catalog_key, consumer_id});
    return ResultCode::Ok;
}

int LocalProfileSource::usageCount(int consumer_id) const {
    const auto it = usage_.find(consumer_id);
    return (it == usage_.end()) ? 0 : it->second;
}

std::vector<double> LocalProfileSource::resourceCeilings(int consumer_id) const {
    const auto it = ceilings_.find(consumer_id);
    return (it == ceilings_.end()) ? std::vector<double>{} : it->second;
}

void LocalProfileSource::setResourceCeilings(int consumer_id, std::vector<double> ceilings) {
    ceilings_[consumer_id] = std::move(ceilings);
}

} // namespace scout
