// Ratevault - Clock
// Source of the current timestamp (block time in the market's terms)

#pragma once

#include <ratevault/types.hpp>

#include <chrono>

namespace ratevault {

class Clock {
public:
    virtual ~Clock() = default;
    [[nodiscard]] virtual Timestamp now() const = 0;
};

// Wall clock, seconds since epoch
class SystemClock final : public Clock {
public:
    [[nodiscard]] Timestamp now() const override {
        return static_cast<Timestamp>(
            std::chrono::duration_cast<std::chrono::seconds>(
                std::chrono::system_clock::now().time_since_epoch()
            ).count()
        );
    }
};

// Deterministic clock for simulation and tests
class ManualClock final : public Clock {
public:
    explicit ManualClock(Timestamp start = 0) : now_(start) {}

    [[nodiscard]] Timestamp now() const override { return now_; }

    void set(Timestamp t) { now_ = t; }
    void advance(Timestamp seconds) { now_ += seconds; }

private:
    Timestamp now_;
};

}  // namespace ratevault
