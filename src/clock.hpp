#pragma once
#include <stdint.h>
#include <functional>
#include <vector>

// Q-cycle generator. Four phases make one instruction cycle; the callback
// runs when the last phase (Q4) is entered.
struct Clock {
    static constexpr uint32_t INTERNAL_OSCILLATOR = 4'000'000;
    static constexpr unsigned Q_CYCLES = 4;

    Clock(std::function<void()> tick_callback,
          uint32_t frequency = INTERNAL_OSCILLATOR,
          unsigned phases = Q_CYCLES);

    std::vector<bool> quadrature_clocks;
    uint32_t frequency; // phases per second, 0 runs unthrottled
    unsigned phases;
    unsigned phase;
    uint64_t ticks = 0;

    void tick();

    // Ticks until keep_going() returns false
    void run(const std::function<bool()>& keep_going);

private:
    std::function<void()> tick_callback;
};
