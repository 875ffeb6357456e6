#pragma once

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

#include "engine/journal.hpp"
#include "engine/types.hpp"
#include "utils/ring_buffer.hpp"

namespace tollgate::engine {

/**
 * Events raised during a request are held back until the request commits,
 * then published to the ring buffer in emission order. A rolled-back request
 * publishes nothing.
 */
class EventBus : public Revertible {
  public:
    explicit EventBus(std::size_t capacity = 1024);

    void emit(Event::Type type, std::string payload);
    std::optional<Event> poll();
    std::size_t capacity() const;
    std::size_t pending() const { return pending_.size(); }
    std::size_t dropped() const { return buffer_.dropped(); }
    uint64_t published() const { return published_; }
    bool empty() const;

    void checkpoint() override;
    void rollback() override;
    void release() override;

  private:
    void publish(Event event);

    utils::RingBuffer<Event> buffer_;
    std::vector<Event> pending_;
    bool batching_{false};
    uint64_t next_seq_{1};
    uint64_t seq_mark_{1};
    uint64_t published_{0};
};

}  // namespace tollgate::engine
