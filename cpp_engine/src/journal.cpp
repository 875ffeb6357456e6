#include "engine/journal.hpp"

#include <algorithm>

#include "utils/logger.hpp"

namespace tollgate::engine {

void Journal::track(Revertible &component) {
    if (std::find(tracked_.begin(), tracked_.end(), &component) == tracked_.end()) {
        tracked_.push_back(&component);
    }
}

Journal::Scope::Scope(Journal &journal) : journal_(journal), outermost_(journal.depth_ == 0) {
    if (outermost_) {
        for (Revertible *c : journal_.tracked_) {
            c->checkpoint();
        }
    }
    ++journal_.depth_;
}

Journal::Scope::~Scope() {
    --journal_.depth_;
    if (!outermost_) {
        return;
    }
    if (committed_) {
        for (Revertible *c : journal_.tracked_) {
            c->release();
        }
        ++journal_.committed_;
        return;
    }
    for (auto it = journal_.tracked_.rbegin(); it != journal_.tracked_.rend(); ++it) {
        (*it)->rollback();
    }
    ++journal_.reverted_;
    utils::debug("request reverted; " + std::to_string(journal_.tracked_.size()) + " components restored");
}

}  // namespace tollgate::engine
