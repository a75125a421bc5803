#pragma once

#include <mutex>
#include <optional>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>
#include "common/types.hpp"

namespace fcast {

enum class SentimentLayer {
    EXPERT,
    INSTITUTIONAL,
    MASS
};

std::string sentiment_layer_to_string(SentimentLayer l);
std::optional<SentimentLayer> sentiment_layer_from_string(const std::string& s);

/**
 * External information event mapped to one or more markets.
 */
struct SignalEvent {
    std::string id;
    std::string type;                  // e.g. "analyst_note", "filing", "social"
    std::string title;
    std::string source;
    WallClock t;
    double confidence{0.0};            // 0-1
    double impact_estimate{0.0};       // 0-1
    std::vector<std::string> mapped_markets;
    std::optional<SentimentLayer> layer;   // Classified from type/source when unset

    bool maps_to(const std::string& market_id) const;
};

void to_json(nlohmann::json& j, const SignalEvent& e);
void from_json(const nlohmann::json& j, SignalEvent& e);

/**
 * Layer of an event: the explicit one if set, otherwise inferred from
 * keywords in its type and source. Unrecognized events count as mass.
 */
SentimentLayer classify_layer(const SignalEvent& event);

class SignalFeed {
public:
    virtual ~SignalFeed() = default;
    virtual std::vector<SignalEvent> events_for_market(const std::string& market_id) const = 0;
};

/**
 * Feed holding published events in memory, in publish order.
 */
class InMemorySignalFeed final : public SignalFeed {
public:
    void publish(SignalEvent event);
    std::vector<SignalEvent> events_for_market(const std::string& market_id) const override;
    size_t size() const;
    void clear();

private:
    mutable std::mutex mutex_;
    std::vector<SignalEvent> events_;
};

} // namespace fcast
