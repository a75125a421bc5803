#include "analytics/signal_feed.hpp"
#include <algorithm>
#include <cctype>
#include <spdlog/spdlog.h>
#include "utils/time_utils.hpp"
#include "utils/uuid.hpp"

namespace fcast {

namespace {

std::string lower(std::string s) {
    std::transform(s.begin(), s.end(), s.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return s;
}

bool contains_any(const std::string& haystack, const std::vector<std::string>& needles) {
    for (const auto& n : needles) {
        if (haystack.find(n) != std::string::npos) return true;
    }
    return false;
}

const std::vector<std::string> EXPERT_KEYWORDS = {
    "expert", "analyst", "research", "forecaster", "academic", "model"
};

const std::vector<std::string> INSTITUTIONAL_KEYWORDS = {
    "institution", "official", "government", "regulator", "central_bank",
    "filing", "press_release", "agency", "court"
};

} // namespace

std::string sentiment_layer_to_string(SentimentLayer l) {
    switch (l) {
        case SentimentLayer::EXPERT: return "expert";
        case SentimentLayer::INSTITUTIONAL: return "institutional";
        case SentimentLayer::MASS: return "mass";
    }
    return "mass";
}

std::optional<SentimentLayer> sentiment_layer_from_string(const std::string& s) {
    if (s == "expert") return SentimentLayer::EXPERT;
    if (s == "institutional") return SentimentLayer::INSTITUTIONAL;
    if (s == "mass") return SentimentLayer::MASS;
    return std::nullopt;
}

bool SignalEvent::maps_to(const std::string& market_id) const {
    return std::find(mapped_markets.begin(), mapped_markets.end(), market_id) != mapped_markets.end();
}

void to_json(nlohmann::json& j, const SignalEvent& e) {
    j = nlohmann::json{
        {"id", e.id},
        {"type", e.type},
        {"title", e.title},
        {"source", e.source},
        {"t", time_utils::to_iso8601(e.t)},
        {"confidence", e.confidence},
        {"impact_estimate", e.impact_estimate},
        {"mapped_markets", e.mapped_markets},
        {"layer", sentiment_layer_to_string(classify_layer(e))}
    };
}

void from_json(const nlohmann::json& j, SignalEvent& e) {
    if (j.contains("id")) j.at("id").get_to(e.id);
    if (j.contains("type")) j.at("type").get_to(e.type);
    if (j.contains("title")) j.at("title").get_to(e.title);
    if (j.contains("source")) j.at("source").get_to(e.source);
    if (j.contains("t")) e.t = time_utils::from_iso8601(j.at("t").get<std::string>());
    if (j.contains("confidence")) j.at("confidence").get_to(e.confidence);
    if (j.contains("impact_estimate")) j.at("impact_estimate").get_to(e.impact_estimate);
    if (j.contains("mapped_markets")) j.at("mapped_markets").get_to(e.mapped_markets);
    if (j.contains("layer")) e.layer = sentiment_layer_from_string(j.at("layer").get<std::string>());
}

SentimentLayer classify_layer(const SignalEvent& event) {
    if (event.layer) {
        return *event.layer;
    }

    std::string text = lower(event.type) + " " + lower(event.source);
    if (contains_any(text, EXPERT_KEYWORDS)) {
        return SentimentLayer::EXPERT;
    }
    if (contains_any(text, INSTITUTIONAL_KEYWORDS)) {
        return SentimentLayer::INSTITUTIONAL;
    }
    return SentimentLayer::MASS;
}

void InMemorySignalFeed::publish(SignalEvent event) {
    if (event.id.empty()) {
        event.id = generate_uuid();
    }
    spdlog::debug("Signal published: {} type={} markets={}",
                  event.id, event.type, event.mapped_markets.size());

    std::lock_guard<std::mutex> lock(mutex_);
    events_.push_back(std::move(event));
}

std::vector<SignalEvent> InMemorySignalFeed::events_for_market(const std::string& market_id) const {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<SignalEvent> result;
    for (const auto& e : events_) {
        if (e.maps_to(market_id)) {
            result.push_back(e);
        }
    }
    return result;
}

size_t InMemorySignalFeed::size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return events_.size();
}

void InMemorySignalFeed::clear() {
    std::lock_guard<std::mutex> lock(mutex_);
    events_.clear();
}

} // namespace fcast
