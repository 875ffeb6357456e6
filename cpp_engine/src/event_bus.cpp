#include "engine/event_bus.hpp"

#include <utility>

#include "utils/logger.hpp"

namespace tollgate::engine {

const char *event_type_name(Event::Type type) {
    switch (type) {
        case Event::Type::Transfer:
            return "Transfer";
        case Event::Type::FeesCredited:
            return "FeesCredited";
        case Event::Type::ConversionStarted:
            return "ConversionStarted";
        case Event::Type::ConversionFinished:
            return "ConversionFinished";
        case Event::Type::ManualConversion:
            return "ManualConversion";
        case Event::Type::ExemptionChanged:
            return "ExemptionChanged";
        case Event::Type::DenyListChanged:
            return "DenyListChanged";
        case Event::Type::RateChanged:
            return "RateChanged";
        case Event::Type::ThresholdChanged:
            return "ThresholdChanged";
        case Event::Type::RecipientChanged:
            return "RecipientChanged";
        case Event::Type::MarketPairChanged:
            return "MarketPairChanged";
        case Event::Type::PairMigrated:
            return "PairMigrated";
        case Event::Type::SwapEnabledChanged:
            return "SwapEnabledChanged";
        case Event::Type::SlippageChanged:
            return "SlippageChanged";
        case Event::Type::Unknown:
            break;
    }
    return "Unknown";
}

EventBus::EventBus(std::size_t capacity) : buffer_(capacity) {}

void EventBus::emit(Event::Type type, std::string payload) {
    Event event;
    event.type = type;
    event.seq = next_seq_++;
    event.payload = std::move(payload);
    if (batching_) {
        pending_.push_back(std::move(event));
    } else {
        publish(std::move(event));
    }
}

std::optional<Event> EventBus::poll() { return buffer_.pop(); }

std::size_t EventBus::capacity() const { return buffer_.capacity(); }

bool EventBus::empty() const { return buffer_.empty(); }

void EventBus::checkpoint() {
    batching_ = true;
    pending_.clear();
    seq_mark_ = next_seq_;
}

void EventBus::rollback() {
    pending_.clear();
    next_seq_ = seq_mark_;
    batching_ = false;
}

void EventBus::release() {
    batching_ = false;
    for (auto &event : pending_) {
        publish(std::move(event));
    }
    pending_.clear();
}

void EventBus::publish(Event event) {
    const std::size_t before = buffer_.dropped();
    buffer_.push(event);
    ++published_;
    if (buffer_.dropped() != before) {
        utils::warn("event buffer full; dropped oldest event");
    }
}

}  // namespace tollgate::engine
