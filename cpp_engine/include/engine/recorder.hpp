#pragma once

#include <fstream>
#include <string>

#include "engine/event_bus.hpp"
#include "engine/types.hpp"

namespace tollgate::engine {

// Appends published events to a file, one `seq,type,payload` line each.
class Recorder {
  public:
    explicit Recorder(const std::string &path);
    ~Recorder();

    bool is_open() const { return out_.is_open(); }
    void record(const Event &event);
    std::size_t drain(EventBus &bus);
    void flush();
    std::size_t recorded() const { return recorded_; }

  private:
    std::ofstream out_;
    std::size_t recorded_{0};
};

}  // namespace tollgate::engine
