#include "market/market_store.hpp"
#include <spdlog/spdlog.h>

namespace fcast {

MarketState MarketState::copy() const {
    MarketState result;
    result.market = market;
    result.model = model ? model->clone() : nullptr;
    result.positions = positions;
    return result;
}

void refresh_outcomes(Market& market, const std::vector<Probability>& probabilities) {
    auto percentages = to_percentages(probabilities);
    for (size_t i = 0; i < market.outcomes.size() && i < percentages.size(); i++) {
        market.outcomes[i].probability = percentages[i];
    }

    Amount total = 0.0;
    for (const auto& o : market.outcomes) {
        total += o.total_stake;
    }
    for (auto& o : market.outcomes) {
        o.stake_share = total > 0.0 ? o.total_stake / total * 100.0
                                    : 100.0 / static_cast<double>(market.outcomes.size());
    }
}

bool MarketStore::insert(MarketState state) {
    std::string id = state.market.id;
    auto slot = std::make_shared<Slot>();
    slot->state = std::move(state);

    std::unique_lock<std::shared_mutex> lock(map_mutex_);
    auto [it, inserted] = slots_.emplace(id, std::move(slot));
    if (inserted) {
        spdlog::debug("MarketStore: added market {} ({} total)", id, slots_.size());
    }
    return inserted;
}

bool MarketStore::contains(const std::string& market_id) const {
    std::shared_lock<std::shared_mutex> lock(map_mutex_);
    return slots_.count(market_id) > 0;
}

size_t MarketStore::size() const {
    std::shared_lock<std::shared_mutex> lock(map_mutex_);
    return slots_.size();
}

std::shared_ptr<MarketStore::Slot> MarketStore::find_slot(const std::string& market_id) const {
    std::shared_lock<std::shared_mutex> lock(map_mutex_);
    auto it = slots_.find(market_id);
    if (it == slots_.end()) {
        return nullptr;
    }
    return it->second;
}

bool MarketStore::with_market(const std::string& market_id,
                              const std::function<void(MarketState&)>& fn) {
    auto slot = find_slot(market_id);
    if (!slot) {
        return false;
    }

    std::lock_guard<std::mutex> lock(slot->mutex);
    fn(slot->state);
    return true;
}

MarketSnapshot MarketStore::make_snapshot(const MarketState& state) {
    MarketSnapshot snap;
    snap.market = state.market;
    snap.positions = state.positions;
    if (state.model) {
        snap.probabilities = state.model->current_probability();
    }
    return snap;
}

std::optional<MarketSnapshot> MarketStore::snapshot(const std::string& market_id) const {
    auto slot = find_slot(market_id);
    if (!slot) {
        return std::nullopt;
    }

    std::lock_guard<std::mutex> lock(slot->mutex);
    return make_snapshot(slot->state);
}

std::vector<MarketSnapshot> MarketStore::snapshot_all() const {
    std::vector<std::shared_ptr<Slot>> slots;
    {
        std::shared_lock<std::shared_mutex> lock(map_mutex_);
        slots.reserve(slots_.size());
        for (const auto& [id, slot] : slots_) {
            slots.push_back(slot);
        }
    }

    // One market lock at a time
    std::vector<MarketSnapshot> result;
    result.reserve(slots.size());
    for (const auto& slot : slots) {
        std::lock_guard<std::mutex> lock(slot->mutex);
        result.push_back(make_snapshot(slot->state));
    }
    return result;
}

} // namespace fcast
