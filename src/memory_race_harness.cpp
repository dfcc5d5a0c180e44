/*
 * memory_race_harness.cpp
 *
 * Torn-view harness for memview::memory.
 *
 * Goals:
 *  - QtCore-only (no QtTest/testlib).
 *  - One writer thread republishes a shared view variable without any
 *    synchronization, one reader thread copies it and materializes the copy.
 *  - Count what the reader observes: coherent views, torn views that still fit
 *    the owner, torn views rejected by re-validation.
 *
 * The shared variable is deliberately raced. The numbers show what callers
 * risk when they skip synchronization; nothing here is asserted.
 */

#include <QDebug>
#include <QString>

#include <atomic>
#include <chrono>
#include <cstdint>
#include <thread>

#include "memory_race_harness.h"
#include "memview.hpp"

namespace {

// ------------------------------ knobs ------------------------------

#if defined(NDEBUG)
static constexpr int kWrites = 4'000'000;
#else
static constexpr int kWrites = 600'000;
#endif

static constexpr i32 kOwnerLength = 64;

// Two windows whose mix (index of one, length of the other) overruns the owner.
static constexpr i32 kHeadIndex = 0;
static constexpr i32 kHeadLength = 48;
static constexpr i32 kTailIndex = 40;
static constexpr i32 kTailLength = 24;

struct tally final {
    std::uint64_t coherent = 0u;
    std::uint64_t torn_in_bounds = 0u;
    std::uint64_t torn_rejected = 0u;
    std::uint64_t empty = 0u;
};

// Deliberately a plain variable.
memview::memory<int> g_shared{};

static bool is_published(const memview::memory<int>& v,
                         const memview::memory<int>& head,
                         const memview::memory<int>& tail) noexcept
{
    return v == head || v == tail;
}

} // namespace

int run_memory_race_harness()
{
    memview::native_memory_manager<int> mgr(kOwnerLength);
    {
        const std::span<int> s = mgr.get_span();
        for (std::size_t i = 0; i < s.size(); ++i) {
            s[i] = static_cast<int>(i);
        }
    }

    const memview::memory<int> head(&mgr, kHeadIndex, kHeadLength);
    const memview::memory<int> tail(&mgr, kTailIndex, kTailLength);

    std::atomic<bool> stop{false};
    tally seen{};

    auto writer = [&] {
        for (int i = 0; i < kWrites; ++i) {
            g_shared = (i & 1) ? tail : head;
        }
        stop.store(true, std::memory_order_release);
    };

    auto reader = [&] {
        while (!stop.load(std::memory_order_acquire)) {
            const memview::memory<int> copy = g_shared;
            if (copy.empty()) {
                ++seen.empty;
                continue;
            }
            try {
                const std::span<int> s = copy.span();
                if (is_published(copy, head, tail)) {
                    ++seen.coherent;
                } else if (!s.empty()) {
                    ++seen.torn_in_bounds;
                }
            } catch (const memview::out_of_range_error&) {
                ++seen.torn_rejected;
            }
        }
    };

    const auto t0 = std::chrono::steady_clock::now();
    std::thread tr(reader);
    std::thread tw(writer);
    tw.join();
    tr.join();
    const auto t1 = std::chrono::steady_clock::now();

    const double ms = std::chrono::duration<double, std::milli>(t1 - t0).count();

    qInfo().noquote() << "\n=== memview::memory torn-view harness ===";
    qInfo().noquote() << QString("writes          : %1").arg(kWrites);
    qInfo().noquote() << QString("coherent reads  : %1").arg(seen.coherent);
    qInfo().noquote() << QString("torn, in bounds : %1").arg(seen.torn_in_bounds);
    qInfo().noquote() << QString("torn, rejected  : %1").arg(seen.torn_rejected);
    qInfo().noquote() << QString("empty reads     : %1").arg(seen.empty);
    qInfo().noquote() << QString("elapsed         : %1 ms").arg(ms, 0, 'f', 1);

    if (seen.torn_in_bounds != 0u || seen.torn_rejected != 0u) {
        qWarning().noquote() << "[memory_race_harness] torn views observed: publish views with synchronization";
    }

    return 0;
}
