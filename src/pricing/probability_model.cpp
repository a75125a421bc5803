#include "pricing/probability_model.hpp"
#include <algorithm>
#include <cmath>
#include <stdexcept>
#include <spdlog/spdlog.h>

namespace fcast {

RiskWeightedLmsr::RiskWeightedLmsr(size_t outcomes, double liquidity, const PricingConfig& config)
    : accumulators_(outcomes, 0.0)
    , liquidity_(liquidity > 0.0 ? liquidity : config.default_liquidity)
    , config_(config)
{
    if (outcomes < 2) {
        throw std::invalid_argument("Probability model needs at least two outcomes");
    }
}

std::unique_ptr<RiskWeightedLmsr> RiskWeightedLmsr::seeded(const std::vector<double>& probabilities,
                                                           double liquidity,
                                                           const PricingConfig& config) {
    auto model = std::make_unique<RiskWeightedLmsr>(probabilities.size(), liquidity, config);

    std::vector<double> seeds;
    seeds.reserve(probabilities.size());
    for (double p : probabilities) {
        if (p > 1.0) p /= 100.0;
        seeds.push_back(std::clamp(p, MIN_SEED_PROBABILITY, MAX_SEED_PROBABILITY));
    }

    // q_i = b * ln(p_i / p_ref). For two outcomes this is b * ln(p / (1 - p)).
    double reference = seeds.back();
    if (seeds.size() == 2) {
        reference = 1.0 - seeds.front();
    }
    for (size_t i = 0; i + 1 < seeds.size(); i++) {
        double q = model->liquidity_ * std::log(seeds[i] / reference);
        model->accumulators_[i] = model->clamp_accumulator(q);
    }
    model->accumulators_.back() = 0.0;

    return model;
}

std::unique_ptr<RiskWeightedLmsr> RiskWeightedLmsr::from_state(const nlohmann::json& j,
                                                               const PricingConfig& config) {
    if (!j.contains("accumulators") || !j.contains("liquidity")) {
        throw std::runtime_error("Model state missing accumulators or liquidity");
    }

    auto q = j.at("accumulators").get<std::vector<double>>();
    double b = j.at("liquidity").get<double>();

    auto model = std::make_unique<RiskWeightedLmsr>(q.size(), b, config);
    for (size_t i = 0; i < q.size(); i++) {
        if (!std::isfinite(q[i])) {
            throw std::runtime_error("Model state has non-finite accumulator");
        }
        model->accumulators_[i] = model->clamp_accumulator(q[i]);
    }
    return model;
}

std::vector<Probability> RiskWeightedLmsr::raw_probabilities() const {
    // Max-shift keeps exp() in range for large accumulators
    double max_q = *std::max_element(accumulators_.begin(), accumulators_.end());

    std::vector<Probability> result(accumulators_.size());
    double denom = 0.0;
    for (size_t i = 0; i < accumulators_.size(); i++) {
        result[i] = std::exp((accumulators_[i] - max_q) / liquidity_);
        denom += result[i];
    }
    for (auto& p : result) {
        p /= denom;
    }
    return result;
}

Probability RiskWeightedLmsr::raw_probability(size_t outcome) const {
    if (outcome >= accumulators_.size()) {
        throw std::out_of_range("Outcome index out of range");
    }
    return raw_probabilities()[outcome];
}

std::vector<Probability> RiskWeightedLmsr::current_probability() const {
    auto probs = raw_probabilities();
    for (auto& p : probs) {
        p = std::clamp(p, config_.min_reported_probability, config_.max_reported_probability);
    }
    return probs;
}

std::vector<Probability> RiskWeightedLmsr::apply_stake(size_t outcome, Amount stake) {
    if (outcome >= accumulators_.size()) {
        throw std::out_of_range("Outcome index out of range");
    }
    if (!(stake > 0.0) || !std::isfinite(stake)) {
        throw std::invalid_argument("Stake must be positive and finite");
    }

    double p = raw_probability(outcome);
    double pressure = stake * (1.0 - p);
    accumulators_[outcome] = clamp_accumulator(accumulators_[outcome] + pressure);

    spdlog::debug("LMSR stake: outcome={} stake={:.2f} p_before={:.4f} pressure={:.4f} q={:.4f}",
                  outcome, stake, p, pressure, accumulators_[outcome]);

    return current_probability();
}

std::unique_ptr<ProbabilityModel> RiskWeightedLmsr::clone() const {
    return std::make_unique<RiskWeightedLmsr>(*this);
}

nlohmann::json RiskWeightedLmsr::state() const {
    return nlohmann::json{
        {"model", "risk_weighted_lmsr"},
        {"liquidity", liquidity_},
        {"accumulators", accumulators_}
    };
}

double RiskWeightedLmsr::clamp_accumulator(double q) const {
    double bound = config_.accumulator_cap * liquidity_;
    return std::clamp(q, -bound, bound);
}

std::vector<int> to_percentages(const std::vector<Probability>& probabilities) {
    std::vector<int> result;
    result.reserve(probabilities.size());
    for (double p : probabilities) {
        result.push_back(static_cast<int>(std::lround(p * 100.0)));
    }
    return result;
}

} // namespace fcast
