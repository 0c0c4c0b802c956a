#pragma once

#include "Collaborators.h"

#include <map>
#include <string>
#include <vector>

namespace scout {

// In-process collaborators for the tools, the dashboard and tests.

class LocalLedger final : public Ledger {
public:
    ResultCode charge(int consumer_id, double amount) override;
    void credit(int consumer_id, double amount) override;

    void setBalance(int consumer_id, double amount) { balances_[consumer_id] = amount; }
    double balance(int consumer_id) const;
    int chargeCount() const { return charges_; }

private:
    std::map<int, double> balances_;
    int charges_ = 0;
};

class FixedRatingSource final : public RatingSource {
public:
    explicit FixedRatingSource(int fallback = kNeutralRatingScore) : fallback_(fallback) {}

    int score(int consumer_id) const override;
    void setScore(int consumer_id, int score) { scores_[consumer_id] = score; }

private:
    std::map<int, int> scores_;
    int fallback_;
};

class LocalAcquisition final : public Acquisition {
public:
    struct Delivery {
        std::string catalog_key;
        int consumer_id = 0;
    };

    ResultCode materialize(const std::string& catalog_key, int consumer_id) override;

    // The next `n` materializations fail with SpawnFailure.
    void failNext(int n) { fail_next_ = n; }
    const std::vector<Delivery>& deliveries() const { return deliveries_; }

private:
    std::vector<Delivery> deliveries_;
    int fail_next_ = 0;
};

class LocalProfileSource final : public ConsumerProfileSource {
public:
    int usageCount(int consumer_id) const override;
    std::vector<double> resourceCeilings(int consumer_id) const override;

    void setUsageCount(int consumer_id, int count) { usage_[consumer_id] = count; }
    void addUsage(int consumer_id) { ++usage_[consumer_id]; }
    void setResourceCeilings(int consumer_id, std::vector<double> ceilings);

private:
    std::map<int, int> usage_;
    std::map<int, std::vector<double>> ceilings_;
};

} // namespace scout
