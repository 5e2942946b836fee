/*
 * Copyright (c) 2025 Andrew C. Young <andrew@vaelen.org>
 * SPDX-License-Identifier: MIT
 */

#include <tlekit/generation.hpp>
#include <tlekit/exceptions.hpp>
#include <tlekit/propagator.hpp>
#include <tlekit/scalar.hpp>

#include <cmath>
#include <stdexcept>

#include <spdlog/spdlog.h>

using spdlog::debug;

namespace tlekit {

Tle buildTle(const KeplerianElements &elements, const time_point epoch, const Tle &templateTle) {
    const double meanMotion = elements.getMeanMotion();
    const double dt = secondsSinceEpoch(templateTle, epoch);
    const int revolutionNumber = templateTle.getRevolutionNumberAtEpoch() +
        static_cast<int>(std::floor((normalizeAngle(elements.meanAnomaly, M_PI) + dt * meanMotion) / TWO_PI));
    return templateTle.withElements(epoch, meanMotion, elements.e, elements.i, elements.pa, elements.raan,
                                    elements.meanAnomaly, revolutionNumber);
}

FixedPointTleGenerator::FixedPointTleGenerator(const double epsilon, const int maxIterations, const double scale)
    : epsilon(epsilon), maxIterations(maxIterations), scale(scale) {
    if (!(epsilon > 0.0)) {
        throw std::invalid_argument("Epsilon must be positive");
    }
    if (maxIterations < 1) {
        throw std::invalid_argument("Iteration budget must be positive");
    }
    if (!(scale > 0.0 && scale <= 1.0)) {
        throw std::invalid_argument("Scale must be in (0, 1]");
    }
}

Tle FixedPointTleGenerator::generate(const PV &state, const time_point epoch, const Tle &templateTle) const {
    const EquinoctialElements target = toEquinoctial(state);
    EquinoctialElements current = target;
    Tle tle = buildTle(toKeplerian(current), epoch, templateTle);

    // Convergence thresholds
    const double thresholdA = epsilon * (1.0 + target.a);
    const double thresholdE = epsilon * (1.0 + target.getE());
    const double thresholdH = epsilon * (1.0 + target.getH());
    const double thresholdLv = epsilon * M_PI;

    for (int k = 1; k <= maxIterations; ++k) {
        const EquinoctialElements recovered = toEquinoctial(Propagator(tle).getInitialState());

        const double deltaA = target.a - recovered.a;
        const double deltaEx = target.ex - recovered.ex;
        const double deltaEy = target.ey - recovered.ey;
        const double deltaHx = target.hx - recovered.hx;
        const double deltaHy = target.hy - recovered.hy;
        const double deltaLv = normalizeAngle(target.lv - recovered.lv, 0.0);

        debug("Fixed point iteration {}: da {:.3e} m, dex {:.3e}, dey {:.3e}, dhx {:.3e}, dhy {:.3e}, dlv {:.3e}",
              k, deltaA, deltaEx, deltaEy, deltaHx, deltaHy, deltaLv);

        if (std::fabs(deltaA) < thresholdA &&
            std::fabs(deltaEx) < thresholdE && std::fabs(deltaEy) < thresholdE &&
            std::fabs(deltaHx) < thresholdH && std::fabs(deltaHy) < thresholdH &&
            std::fabs(deltaLv) < thresholdLv) {
            debug("Fixed point converged for satellite {} after {} iterations", tle.getSatelliteNumber(), k);
            return tle;
        }

        current.a += scale * deltaA;
        current.ex += scale * deltaEx;
        current.ey += scale * deltaEy;
        current.hx += scale * deltaHx;
        current.hy += scale * deltaHy;
        current.lv += scale * deltaLv;

        tle = buildTle(toKeplerian(current), epoch, templateTle);
    }

    throw TleGenerationException(fmt::format("Unable to compute TLE for satellite {} after {} iterations",
                                             templateTle.getSatelliteNumber(), maxIterations),
                                 maxIterations);
}

} // namespace tlekit
