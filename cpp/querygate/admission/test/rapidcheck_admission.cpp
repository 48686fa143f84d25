/* Copyright 2026 Man Group Operations Limited
 *
 * Use of this software is governed by the Business Source License 1.1 included in the file licenses/BSL.txt.
 *
 * As of the Change Date specified in that file, in accordance with the Business Source License, use of this software
 * will be governed by the Apache License, version 2.0.
 */

#include <querygate/util/test/rapidcheck.hpp>

#include <querygate/admission/admission_settings.hpp>

#include <algorithm>

using namespace querygate::admission;

namespace {

double fraction(int permille) { return static_cast<double>(permille) / 1000.0; }

AdmissionSettings adaptive_settings(int reduction_permille, int floor) {
    AdmissionSettings settings;
    settings.max_reduction_fraction_ = fraction(reduction_permille);
    settings.limit_floor_ = static_cast<double>(floor);
    return settings;
}

} // namespace

RC_GTEST_PROP(EffectiveLimit, NonIncreasingInLoad, ()) {
    const auto settings = adaptive_settings(*rc::gen::inRange(0, 1001), *rc::gen::inRange(0, 200));
    const auto base = static_cast<double>(*rc::gen::inRange(1, 1000));
    const auto lower = *rc::gen::inRange(0, 1001);
    const auto higher = *rc::gen::inRange(lower, 1001);

    RC_ASSERT(effective_limit(settings, base, fraction(higher)) <= effective_limit(settings, base, fraction(lower)));
}

RC_GTEST_PROP(EffectiveLimit, BoundedByFloorAndBase, ()) {
    const auto settings = adaptive_settings(*rc::gen::inRange(0, 1001), *rc::gen::inRange(0, 200));
    const auto base = static_cast<double>(*rc::gen::inRange(1, 1000));
    // Out of range load factors are clamped
    const auto load = fraction(*rc::gen::inRange(-500, 1500));

    const auto limit = effective_limit(settings, base, load);
    RC_ASSERT(limit <= base);
    RC_ASSERT(limit >= std::min(settings.limit_floor_, base));
    RC_ASSERT(limit >= base * (1.0 - settings.max_reduction_fraction_) - 1e-9);
}

RC_GTEST_PROP(EffectiveLimit, IdleBackendKeepsBase, ()) {
    const auto settings = adaptive_settings(*rc::gen::inRange(0, 1001), *rc::gen::inRange(0, 200));
    const auto base = static_cast<double>(*rc::gen::inRange(1, 1000));
    RC_ASSERT(effective_limit(settings, base, 0.0) == base);
}

RC_GTEST_PROP(EffectiveLimit, FixedWhenNotAdaptive, ()) {
    auto settings = adaptive_settings(*rc::gen::inRange(0, 1001), *rc::gen::inRange(0, 200));
    settings.adaptive_limits_ = false;
    const auto base = static_cast<double>(*rc::gen::inRange(1, 1000));
    RC_ASSERT(effective_limit(settings, base, fraction(*rc::gen::inRange(0, 1001))) == base);
}
