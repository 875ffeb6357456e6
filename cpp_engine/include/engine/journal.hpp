#pragma once

#include <cstddef>
#include <cstdint>
#include <vector>

namespace tollgate::engine {

// State that can be snapshotted at the start of a request and restored if the
// request fails.
class Revertible {
  public:
    virtual ~Revertible() = default;

    virtual void checkpoint() = 0;
    virtual void rollback() = 0;
    virtual void release() = 0;
};

/**
 * Request-level atomicity. The outermost Scope checkpoints every tracked
 * component; when it is destroyed without commit() (an exception unwound
 * through it) every component is rolled back. Nested scopes, opened by
 * re-entrant calls during a conversion, leave the decision to the outermost.
 */
class Journal {
  public:
    Journal() = default;
    Journal(const Journal &) = delete;
    Journal &operator=(const Journal &) = delete;

    void track(Revertible &component);
    bool in_request() const { return depth_ > 0; }
    std::size_t depth() const { return depth_; }
    uint64_t committed() const { return committed_; }
    uint64_t reverted() const { return reverted_; }

    class Scope {
      public:
        explicit Scope(Journal &journal);
        ~Scope();
        Scope(const Scope &) = delete;
        Scope &operator=(const Scope &) = delete;

        void commit() { committed_ = true; }

      private:
        Journal &journal_;
        bool outermost_{false};
        bool committed_{false};
    };

  private:
    std::vector<Revertible *> tracked_;
    std::size_t depth_{0};
    uint64_t committed_{0};
    uint64_t reverted_{0};
};

}  // namespace tollgate::engine
