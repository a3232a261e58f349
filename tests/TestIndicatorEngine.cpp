#include "analytics/IndicatorEngine.h"
#include "TestSupport.h"

#include <algorithm>
#include <cassert>
#include <cmath>
#include <iostream>
#include <limits>

using coinlens::analytics::IndicatorEngine;
using coinlens::analytics::IndicatorSettings;
using coinlens::analytics::IndicatorStatus;
using coinlens::testing::makeHourlySamples;
using coinlens::testing::near;

namespace {
bool hasDigits(double value, int digits) {
    const double scaled = value * std::pow(10.0, digits);
    return std::abs(scaled - std::round(scaled)) < 1e-6;
}
}

int main() {
    IndicatorEngine engine;

    // fewer than 50 valid rows never produce a snapshot
    {
        auto outcome = engine.compute(makeHourlySamples(49));
        assert(outcome.status == IndicatorStatus::INSUFFICIENT_DATA);
        assert(outcome.valid_samples == 49);
        assert(!outcome.ok());

        assert(engine.compute({}).status == IndicatorStatus::INSUFFICIENT_DATA);
        assert(engine.compute(makeHourlySamples(50)).ok());
    }

    // 60 rising closes with rising volume
    {
        auto outcome = engine.compute(makeHourlySamples(60));
        assert(outcome.ok());
        const auto& snap = outcome.snapshot;

        assert(snap.rsi > 50.0);
        assert(snap.price == 159.0);
        assert(std::isfinite(snap.ema_short) && std::isfinite(snap.ema_long));
        assert(hasDigits(snap.ema_short, 2) && hasDigits(snap.ema_long, 2));
        // EMAs start from the first close (an SMA seed would give 149.50 / 134.50)
        assert(near(snap.ema_short, 149.53));
        assert(near(snap.ema_long, 136.81));
        assert(near(snap.macd, 6.867));
        assert(hasDigits(snap.rsi, 2));
        assert(hasDigits(snap.macd, 4));
        assert(snap.macd > 0.0);
        assert(snap.volume_change_short > 0.0);
        // (1590 - 1580) / 1580
        assert(near(snap.volume_change_short, 0.63));
        // (1590 - 1350) / 1350, 24 rows earlier
        assert(near(snap.volume_change_long, 17.78));
        assert(snap.sample_count == 60);
        assert(snap.as_of == coinlens::testing::kStartMs + 59 * coinlens::testing::kHourMs);
        assert(snap.rsi_warm && snap.ema_short_warm && snap.ema_long_warm && snap.macd_warm);
    }

    // previous volume zero -> short delta exactly 0
    {
        auto samples = makeHourlySamples(60);
        samples[58].volume = 0.0;
        auto outcome = engine.compute(samples);
        assert(outcome.ok());
        assert(outcome.snapshot.volume_change_short == 0.0);

        auto silent = engine.compute(makeHourlySamples(60, 100.0, 1.0, 0.0, 0.0));
        assert(silent.ok());
        assert(silent.snapshot.volume_change_short == 0.0);
        assert(silent.snapshot.volume_change_long == 0.0);
    }

    // duplicate timestamps: the earlier row is kept
    {
        auto samples = makeHourlySamples(60);
        auto dup = samples.back();
        dup.close = 999.0;
        samples.push_back(dup);

        auto outcome = engine.compute(samples);
        assert(outcome.ok());
        assert(outcome.snapshot.price == 159.0);
        assert(outcome.valid_samples == 60);
        assert(outcome.dropped_samples == 1);

        auto rows = IndicatorEngine::ingest(samples);
        assert(rows.size() == 60);
    }

    // duplicates do not count towards the sufficiency floor
    {
        auto samples = makeHourlySamples(45);
        auto copies = makeHourlySamples(15);
        samples.insert(samples.end(), copies.begin(), copies.end());
        assert(samples.size() == 60);

        auto outcome = engine.compute(samples);
        assert(outcome.status == IndicatorStatus::INSUFFICIENT_DATA);
        assert(outcome.valid_samples == 45);
    }

    // out-of-order input is sorted before computing
    {
        auto ordered = makeHourlySamples(70, 50.0, 0.5);
        auto shuffled = ordered;
        std::reverse(shuffled.begin(), shuffled.end());
        std::swap(shuffled[3], shuffled[40]);

        auto a = engine.compute(ordered);
        auto b = engine.compute(shuffled);
        assert(a.ok() && b.ok());
        assert(a.snapshot.price == b.snapshot.price);
        assert(a.snapshot.rsi == b.snapshot.rsi);
        assert(a.snapshot.ema_long == b.snapshot.ema_long);
        assert(a.snapshot.macd == b.snapshot.macd);
        assert(b.snapshot.as_of == ordered.back().open_time);
    }

    // malformed rows are dropped, not zero-filled
    {
        auto samples = makeHourlySamples(52);
        samples[10].close = std::numeric_limits<double>::quiet_NaN();
        samples[11].volume = -3.0;
        samples[12].high = std::numeric_limits<double>::infinity();

        auto outcome = engine.compute(samples);
        assert(outcome.status == IndicatorStatus::INSUFFICIENT_DATA);
        assert(outcome.valid_samples == 49);
        assert(outcome.dropped_samples == 3);
    }

    // non-finite intermediate results are a computation error, not a snapshot
    {
        auto samples = makeHourlySamples(60);
        for (std::size_t i = 0; i < samples.size(); ++i) {
            const double price = (i % 2 == 0) ? 0.0 : 1.7e308;
            samples[i].open = samples[i].high = samples[i].low = samples[i].close = price;
        }
        auto outcome = engine.compute(samples);
        assert(outcome.status == IndicatorStatus::COMPUTATION_ERROR);
        assert(!outcome.detail.empty());
    }

    // identical input rounds identically regardless of call order
    {
        auto samples = makeHourlySamples(80, 0.123456, 0.0031, 5.5, 0.37);
        auto first = engine.compute(samples);
        engine.compute(makeHourlySamples(60));
        auto second = engine.compute(samples);
        assert(first.ok() && second.ok());
        assert(first.snapshot.price == second.snapshot.price);
        assert(first.snapshot.rsi == second.snapshot.rsi);
        assert(first.snapshot.macd == second.snapshot.macd);
        assert(first.snapshot.volume_change_long == second.snapshot.volume_change_long);
        assert(hasDigits(first.snapshot.price, 2));
        assert(hasDigits(first.snapshot.macd, 4));
        assert(hasDigits(first.snapshot.volume_change_short, 2));
    }

    // rounding helper
    {
        assert(IndicatorEngine::roundTo(1.23456, 2) == 1.23);
        assert(IndicatorEngine::roundTo(1.23456, 4) == 1.2346);
        assert(IndicatorEngine::roundTo(-0.001, 2) == 0.0);
        assert(!std::signbit(IndicatorEngine::roundTo(-0.001, 2)));
    }

    // warm-up flags with a shorter floor
    {
        IndicatorSettings settings;
        settings.min_samples = 20;
        IndicatorEngine relaxed(settings);

        auto outcome = relaxed.compute(makeHourlySamples(30));
        assert(outcome.ok());
        assert(outcome.snapshot.rsi_warm);
        assert(outcome.snapshot.ema_short_warm);
        assert(!outcome.snapshot.ema_long_warm);
        assert(outcome.snapshot.ema_long == outcome.snapshot.price);
        assert(outcome.snapshot.macd_warm);

        auto tiny = relaxed.compute(makeHourlySamples(20));
        assert(tiny.ok());
        assert(!tiny.snapshot.macd_warm);
        assert(tiny.snapshot.macd == 0.0);
        assert(std::string(coinlens::analytics::toString(tiny.status)) == "OK");
    }

    // JSON view
    {
        auto outcome = engine.compute(makeHourlySamples(60));
        auto j = coinlens::analytics::snapshotToJson(outcome.snapshot);
        assert(j["price"] == 159.0);
        assert(j["sample_count"] == 60);
        assert(j["warm"]["ema_long"] == true);
        assert(j.contains("volume_change_long"));
    }

    std::cout << "[TEST] IndicatorEngine PASSED\n";
    return 0;
}
