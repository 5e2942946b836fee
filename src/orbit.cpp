/*
 * Copyright (c) 2025 Andrew C. Young <andrew@vaelen.org>
 * SPDX-License-Identifier: MIT
 */

#include <tlekit/orbit.hpp>
#include <tlekit/exceptions.hpp>
#include <tlekit/scalar.hpp>

#include <cmath>

#include <spdlog/fmt/fmt.h>

namespace tlekit {

// ============================================================================
// Element Sets
// ============================================================================

double KeplerianElements::getMeanMotion(const double mu) const {
    return keplerianMeanMotion(a, mu);
}

double KeplerianElements::getTrueAnomaly() const {
    return meanToTrueAnomaly(meanAnomaly, e);
}

double EquinoctialElements::getE() const {
    return std::sqrt(ex * ex + ey * ey);
}

double EquinoctialElements::getH() const {
    return std::sqrt(hx * hx + hy * hy);
}

double EquinoctialElements::getLE() const {
    const double epsilon = std::sqrt(1.0 - ex * ex - ey * ey);
    const double cosLv = std::cos(lv);
    const double sinLv = std::sin(lv);
    const double num = ey * cosLv - ex * sinLv;
    const double den = epsilon + 1.0 + ex * cosLv + ey * sinLv;
    return lv + 2.0 * std::atan(num / den);
}

double EquinoctialElements::getLM() const {
    const double lE = getLE();
    return lE - ex * std::sin(lE) + ey * std::cos(lE);
}

// ============================================================================
// Anomalies
// ============================================================================

double meanToEccentricAnomaly(const double meanAnomaly, const double e) {
    const double m = normalizeAngle(meanAnomaly, 0.0);

    // Starting guess good enough for high eccentricities too
    double ecc = (e > 0.8) ? (m < 0.0 ? -M_PI : M_PI) : m + e * std::sin(m);
    for (int k = 0; k < 50; ++k) {
        const double f = ecc - e * std::sin(ecc) - m;
        const double fPrime = 1.0 - e * std::cos(ecc);
        const double delta = f / fPrime;
        ecc -= delta;
        if (std::fabs(delta) < 1.0e-14) {
            break;
        }
    }
    return ecc + (meanAnomaly - m);
}

double eccentricToMeanAnomaly(const double eccentricAnomaly, const double e) {
    return eccentricAnomaly - e * std::sin(eccentricAnomaly);
}

double eccentricToTrueAnomaly(const double eccentricAnomaly, const double e) {
    const double beta = std::sqrt(1.0 - e * e);
    const double trueAnomaly = std::atan2(beta * std::sin(eccentricAnomaly), std::cos(eccentricAnomaly) - e);
    return normalizeAngle(trueAnomaly, eccentricAnomaly);
}

double trueToEccentricAnomaly(const double trueAnomaly, const double e) {
    const double beta = std::sqrt(1.0 - e * e);
    const double eccentricAnomaly = std::atan2(beta * std::sin(trueAnomaly), e + std::cos(trueAnomaly));
    return normalizeAngle(eccentricAnomaly, trueAnomaly);
}

double meanToTrueAnomaly(const double meanAnomaly, const double e) {
    return eccentricToTrueAnomaly(meanToEccentricAnomaly(meanAnomaly, e), e);
}

double trueToMeanAnomaly(const double trueAnomaly, const double e) {
    return eccentricToMeanAnomaly(trueToEccentricAnomaly(trueAnomaly, e), e);
}

double keplerianMeanMotion(const double a, const double mu) {
    return std::sqrt(mu / (a * a * a));
}

// ============================================================================
// Conversions
// ============================================================================

EquinoctialElements toEquinoctial(const PV &pv, const double mu) {
    const Vec3 &p = pv.position;
    const Vec3 &v = pv.velocity;
    const double r = p.magnitude();
    const double v2 = v.dot(v);
    const double rV2OnMu = r * v2 / mu;

    EquinoctialElements eq;
    eq.a = r / (2.0 - rV2OnMu);
    if (!(eq.a > 0.0) || !std::isfinite(eq.a)) {
        throw InvalidOrbitException(fmt::format("State is not on an elliptic orbit (a = {} m)", eq.a));
    }

    // Inclination vector
    const Vec3 momentum = p.cross(v);
    const double hNorm = momentum.magnitude();
    const Vec3 w = {momentum.x / hNorm, momentum.y / hNorm, momentum.z / hNorm};
    const double d = 1.0 / (1.0 + w.z);
    eq.hx = -d * w.y;
    eq.hy = d * w.x;

    // True longitude argument
    const double cLv = (p.x - d * p.z * w.x) / r;
    const double sLv = (p.y - d * p.z * w.y) / r;
    eq.lv = std::atan2(sLv, cLv);

    // Eccentricity vector
    const double eSE = p.dot(v) / std::sqrt(mu * eq.a);
    const double eCE = rV2OnMu - 1.0;
    const double e2 = eCE * eCE + eSE * eSE;
    const double f = eCE - e2;
    const double g = std::sqrt(1.0 - e2) * eSE;
    eq.ex = eq.a * (f * cLv + g * sLv) / r;
    eq.ey = eq.a * (f * sLv - g * cLv) / r;

    return eq;
}

EquinoctialElements toEquinoctial(const KeplerianElements &kep) {
    const double tanHalfI = std::tan(kep.i / 2.0);
    const double lonPerigee = kep.pa + kep.raan;
    return {
        kep.a,
        kep.e * std::cos(lonPerigee),
        kep.e * std::sin(lonPerigee),
        tanHalfI * std::cos(kep.raan),
        tanHalfI * std::sin(kep.raan),
        lonPerigee + kep.getTrueAnomaly()
    };
}

KeplerianElements toKeplerian(const EquinoctialElements &eq) {
    KeplerianElements kep;
    kep.a = eq.a;
    kep.e = eq.getE();
    kep.i = 2.0 * std::atan(eq.getH());
    kep.raan = std::atan2(eq.hy, eq.hx);
    kep.pa = std::atan2(eq.ey, eq.ex) - kep.raan;
    kep.meanAnomaly = trueToMeanAnomaly(eq.lv - kep.pa - kep.raan, kep.e);
    return kep;
}

KeplerianElements toKeplerian(const PV &pv, const double mu) {
    return toKeplerian(toEquinoctial(pv, mu));
}

PV toCartesian(const EquinoctialElements &eq, const double mu) {
    const double lE = eq.getLE();

    // Orbital plane axes
    const double hx2 = eq.hx * eq.hx;
    const double hy2 = eq.hy * eq.hy;
    const double factH = 1.0 / (1.0 + hx2 + hy2);
    const Vec3 u = {(1.0 + hx2 - hy2) * factH, 2.0 * eq.hx * eq.hy * factH, -2.0 * eq.hy * factH};
    const Vec3 v = {u.y, (1.0 - hx2 + hy2) * factH, 2.0 * eq.hx * factH};

    const double exey = eq.ex * eq.ey;
    const double ex2 = eq.ex * eq.ex;
    const double ey2 = eq.ey * eq.ey;
    const double e2 = ex2 + ey2;
    const double beta = 1.0 / (1.0 + std::sqrt(1.0 - e2));

    const double cLe = std::cos(lE);
    const double sLe = std::sin(lE);
    const double exCeyS = eq.ex * cLe + eq.ey * sLe;

    // In-plane coordinates
    const double x = eq.a * ((1.0 - beta * ey2) * cLe + beta * exey * sLe - eq.ex);
    const double y = eq.a * ((1.0 - beta * ex2) * sLe + beta * exey * cLe - eq.ey);
    const double factor = std::sqrt(mu / eq.a) / (1.0 - exCeyS);
    const double xDot = factor * (-sLe + beta * eq.ey * exCeyS);
    const double yDot = factor * (cLe - beta * eq.ex * exCeyS);

    return {u * x + v * y, u * xDot + v * yDot};
}

PV toCartesian(const KeplerianElements &kep, const double mu) {
    return toCartesian(toEquinoctial(kep), mu);
}

} // namespace tlekit
