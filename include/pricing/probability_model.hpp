#pragma once

#include <memory>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>
#include "common/types.hpp"
#include "config/config.hpp"

namespace fcast {

/**
 * Market maker deriving outcome probabilities from aggregate positions.
 *
 * One instance per market. Instances are not internally synchronized; the
 * market store serializes access through the owning market's lock.
 */
class ProbabilityModel {
public:
    virtual ~ProbabilityModel() = default;

    // Reported probabilities (clamped), one per outcome, in outcome order
    virtual std::vector<Probability> current_probability() const = 0;

    // Unclamped probability of a single outcome
    virtual Probability raw_probability(size_t outcome) const = 0;

    // Apply a stake to an outcome and return the new reported probabilities
    virtual std::vector<Probability> apply_stake(size_t outcome, Amount stake) = 0;

    virtual size_t outcome_count() const = 0;
    virtual double liquidity() const = 0;

    virtual std::unique_ptr<ProbabilityModel> clone() const = 0;

    // State blob, restorable through from_state()
    virtual nlohmann::json state() const = 0;
};

/**
 * Logarithmic market scoring rule where a deposit moves its outcome's
 * accumulator by stake * (1 - p). Buying an already-likely outcome applies
 * little pressure; buying a long shot applies nearly the whole stake.
 *
 *   p_i = exp(q_i / b) / sum_j exp(q_j / b)
 */
class RiskWeightedLmsr final : public ProbabilityModel {
public:
    // Seeding bounds for initial probabilities
    static constexpr double MIN_SEED_PROBABILITY = 0.01;
    static constexpr double MAX_SEED_PROBABILITY = 0.99;

    RiskWeightedLmsr(size_t outcomes, double liquidity, const PricingConfig& config);

    /**
     * Seed accumulators so the model starts at the given probabilities.
     * Values above 1 are read as percentages. Each seed is clamped into
     * [0.01, 0.99]; the last outcome is the reference with q = 0.
     */
    static std::unique_ptr<RiskWeightedLmsr> seeded(const std::vector<double>& probabilities,
                                                    double liquidity,
                                                    const PricingConfig& config);

    static std::unique_ptr<RiskWeightedLmsr> from_state(const nlohmann::json& j,
                                                        const PricingConfig& config);

    std::vector<Probability> current_probability() const override;
    Probability raw_probability(size_t outcome) const override;
    std::vector<Probability> apply_stake(size_t outcome, Amount stake) override;

    size_t outcome_count() const override { return accumulators_.size(); }
    double liquidity() const override { return liquidity_; }

    std::unique_ptr<ProbabilityModel> clone() const override;
    nlohmann::json state() const override;

    const std::vector<double>& accumulators() const { return accumulators_; }

private:
    std::vector<double> accumulators_;
    double liquidity_;
    PricingConfig config_;

    std::vector<Probability> raw_probabilities() const;
    double clamp_accumulator(double q) const;
};

/**
 * Round reported probabilities to integer percentages for display on outcomes.
 */
std::vector<int> to_percentages(const std::vector<Probability>& probabilities);

} // namespace fcast
