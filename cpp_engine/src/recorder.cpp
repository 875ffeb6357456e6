#include "engine/recorder.hpp"

namespace tollgate::engine {

Recorder::Recorder(const std::string &path) : out_(path, std::ios::out | std::ios::trunc) {
    if (out_.is_open()) {
        out_ << "seq,type,payload\n";
    }
}

Recorder::~Recorder() { flush(); }

void Recorder::record(const Event &event) {
    if (!out_.is_open()) {
        return;
    }
    out_ << event.seq << "," << event_type_name(event.type) << "," << event.payload << "\n";
    ++recorded_;
}

std::size_t Recorder::drain(EventBus &bus) {
    std::size_t n = 0;
    while (auto event = bus.poll()) {
        record(*event);
        ++n;
    }
    return n;
}

void Recorder::flush() {
    if (out_.is_open()) {
        out_.flush();
    }
}

}  // namespace tollgate::engine
