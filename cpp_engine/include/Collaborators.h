#pragma once

#include "ResultCodes.h"

#include <string>
#include <vector>

namespace scout {

// Used when no rating source is wired in.
constexpr int kNeutralRatingScore = 650;

// Money ledger. A logical charge is issued once; refunds go through credit().
class Ledger {
public:
    virtual ~Ledger() = default;
    virtual ResultCode charge(int consumer_id, double amount) = 0;
    virtual void credit(int consumer_id, double amount) = 0;
};

class RatingSource {
public:
    virtual ~RatingSource() = default;
    virtual int score(int consumer_id) const = 0;
};

// Spawns / hands over the acquired good. Safe to retry; callers refund on failure.
class Acquisition {
public:
    virtual ~Acquisition() = default;
    virtual ResultCode materialize(const std::string& catalog_key, int consumer_id) = 0;
};

// Inputs for the discovery gate prerequisites.
class ConsumerProfileSource {
public:
    virtual ~ConsumerProfileSource() = default;
    virtual int usageCount(int consumer_id) const = 0;
    // Reliability ceilings [0,1] of owned resources.
    virtual std::vector<double> resourceCeilings(int consumer_id) const = 0;
};

inline int ratingOrNeutral(const RatingSource* rating, int consumer_id) {
    return rating ? rating->score(consumer_id) : kNeutralRatingScore;
}

} // namespace scout
