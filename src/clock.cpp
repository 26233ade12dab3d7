#include "clock.hpp"

#include <algorithm>
#include <chrono>
#include <stdexcept>
#include <thread>
#include <utility>

Clock::Clock(std::function<void()> tick_callback, uint32_t frequency, unsigned phases)
    : quadrature_clocks(phases, false),
      frequency(frequency),
      phases(phases),
      phase(phases - 1),
      tick_callback(std::move(tick_callback))
{
    if (phases == 0)
        throw std::runtime_error("Clock needs at least one phase");
}

void Clock::tick()
{
    phase = (phase + 1) % phases;
    ticks++;

    std::fill(quadrature_clocks.begin(), quadrature_clocks.end(), false);
    quadrature_clocks[phase] = true;

    if (phase == phases - 1)
        tick_callback();
}

void Clock::run(const std::function<bool()>& keep_going)
{
    using clock = std::chrono::steady_clock;

    if (frequency == 0) {
        while (keep_going())
            tick();
        return;
    }

    auto period = std::chrono::duration_cast<clock::duration>(
        std::chrono::duration<double>(1.0 / frequency));
    auto deadline = clock::now();

    while (keep_going()) {
        tick();
        deadline += period;
        std::this_thread::sleep_until(deadline);
    }
}

#ifdef CLOCKTEST

#include <stdio.h>

static int failures{};

#define CHECK(cond, ...) \
    do { if (!(cond)) { failures++; printf(__VA_ARGS__); putchar('\n'); } } while (0)

static void test_phases()
{
    int calls{};
    Clock clock{[&] { calls++; }};

    for (unsigned i = 0; i < 8; i++) {
        clock.tick();

        unsigned high{};
        for (bool q : clock.quadrature_clocks)
            high += q;
        CHECK(high == 1, "Tick %u: %u phases high", i, high);
        CHECK(clock.phase == i % 4, "Tick %u: phase %u", i, clock.phase);
        CHECK(clock.quadrature_clocks[i % 4], "Tick %u: Q%u not high", i, i % 4 + 1);
    }

    CHECK(calls == 2, "Callback ran %i times in 8 Q-cycles", calls);
}

static void test_run()
{
    int calls{};
    Clock fast{[&] { calls++; }, 0};
    fast.run([&] { return calls < 5; });
    CHECK(calls == 5 && fast.ticks == 20, "Unthrottled run: %i calls, %llu ticks",
        calls, (unsigned long long)fast.ticks);

    // 1 kHz: 8 phases take at least 7 periods
    calls = 0;
    Clock paced{[&] { calls++; }, 1000};
    auto start = std::chrono::steady_clock::now();
    paced.run([&] { return paced.ticks < 8; });
    auto elapsed = std::chrono::steady_clock::now() - start;
    CHECK(elapsed >= std::chrono::milliseconds(7), "Paced run took %lld us",
        (long long)std::chrono::duration_cast<std::chrono::microseconds>(elapsed).count());
    CHECK(calls == 2, "Paced run: %i calls", calls);

    try {
        Clock broken{[] {}, 0, 0};
        CHECK(false, "Zero-phase clock constructed");
    } catch (std::runtime_error&) {
    }
}

int main()
{
    test_phases();
    test_run();

    printf("Clock tests failures %i\n", failures);
    return failures ? 1 : 0;
}

#endif
