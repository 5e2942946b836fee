/*
 * Copyright (c) 2025 Andrew C. Young <andrew@vaelen.org>
 * SPDX-License-Identifier: MIT
 *
 * SGP4 Near-Earth Propagation Implementation
 * Based on the Dundee-compliant NORAD SGP4/SDP4 theory (Spacetrack Report #3).
 */

#include <tlekit/sgp4.hpp>

#include <cmath>

#include <spdlog/fmt/fmt.h>

namespace tlekit {

// Recover original mean motion (xn0dp) and semimajor axis (a0dp) from input
template <typename T>
CommonTerms<T> initializeCommons(const MeanElements<T> &elements) {
    const double e = value(elements.e);
    const double n = value(elements.meanMotion);
    if (!std::isfinite(n) || n <= 0.0) {
        throw InvalidOrbitException(fmt::format("Invalid mean motion: {} rad/s", n));
    }
    if (!(e >= 0.0 && e < 1.0)) {
        throw InvalidOrbitException(fmt::format("Eccentricity out of range: {}", e));
    }

    CommonTerms<T> c;

    const T a1 = pow(XKE / (elements.meanMotion * 60.0), TWO_THIRD);
    c.cosi0 = cos(elements.i);
    c.theta2 = c.cosi0 * c.cosi0;
    const T x3thm1 = 3.0 * c.theta2 - 1.0;
    c.e0sq = elements.e * elements.e;
    c.beta02 = 1.0 - c.e0sq;
    c.beta0 = sqrt(c.beta02);
    const T tval = 1.5 * CK2 * x3thm1 / (c.beta0 * c.beta02);
    const T delta1 = tval / (a1 * a1);
    const T a0 = a1 * (1.0 - delta1 * (ONE_THIRD + delta1 * (1.0 + 134.0 / 81.0 * delta1)));
    const T delta0 = tval / (a0 * a0);

    // recover original mean motion and semi-major axis
    c.xn0dp = elements.meanMotion * 60.0 / (delta0 + 1.0);
    c.a0dp = a0 / (1.0 - delta0);

    if (!std::isfinite(value(c.a0dp)) || !std::isfinite(value(c.xn0dp)) || value(c.a0dp) <= 0.0) {
        throw InvalidOrbitException(fmt::format("Cannot recover original semi-major axis (a0 = {})", value(a0)));
    }

    const double perigeeRadius = value(c.a0dp) * (1.0 - e);
    if (perigeeRadius < DECAY_RADIUS) {
        throw InvalidOrbitException(fmt::format("Perigee radius {} Earth radii is below the decay limit of {}",
                                                perigeeRadius, DECAY_RADIUS));
    }

    // Values of s and qms2t are altered for perigee below 156 km
    c.s4 = T(S);
    T q0ms24 = T(QOMS2T);
    c.perige = (c.a0dp * (1.0 - elements.e) - NORMALIZED_EQUATORIAL_RADIUS) * EARTH_RADIUS;
    if (value(c.perige) < 156.0) {
        if (value(c.perige) <= 98.0) {
            c.s4 = T(20.0);
        } else {
            c.s4 = c.perige - 78.0;
        }
        const T tempVal = (120.0 - c.s4) * NORMALIZED_EQUATORIAL_RADIUS / EARTH_RADIUS;
        const T tempValSquared = tempVal * tempVal;
        q0ms24 = tempValSquared * tempValSquared;
        c.s4 = c.s4 / EARTH_RADIUS + NORMALIZED_EQUATORIAL_RADIUS;
    }

    const T pinv = 1.0 / (c.a0dp * c.beta02);
    const T pinvsq = pinv * pinv;
    c.tsi = 1.0 / (c.a0dp - c.s4);
    c.eta = c.a0dp * elements.e * c.tsi;
    c.etasq = c.eta * c.eta;
    c.eeta = elements.e * c.eta;

    const T psisq = abs(1.0 - c.etasq);
    const T tsiSquared = c.tsi * c.tsi;
    c.coef = q0ms24 * tsiSquared * tsiSquared;
    c.coef1 = c.coef / pow(psisq, 3.5);

    // C2 and C1 coefficients computation
    c.c2 = c.coef1 * c.xn0dp *
           (c.a0dp * (1.0 + 1.5 * c.etasq + c.eeta * (4.0 + c.etasq)) +
            0.75 * CK2 * c.tsi / psisq * x3thm1 * (8.0 + 3.0 * c.etasq * (8.0 + c.etasq)));
    c.c1 = elements.bStar * c.c2;
    c.sini0 = sin(elements.i);

    const T x1mth2 = 1.0 - c.theta2;

    // C4 coefficient computation
    c.c4 = 2.0 * c.xn0dp * c.coef1 * c.a0dp * c.beta02 *
           (c.eta * (2.0 + 0.5 * c.etasq) + elements.e * (0.5 + 2.0 * c.etasq) -
            2.0 * CK2 * c.tsi / (c.a0dp * psisq) *
            (-3.0 * x3thm1 * (1.0 - 2.0 * c.eeta + c.etasq * (1.5 - 0.5 * c.eeta)) +
             0.75 * x1mth2 * (2.0 * c.etasq - c.eeta * (1.0 + c.etasq)) * cos(2.0 * elements.pa)));

    const T theta4 = c.theta2 * c.theta2;
    const T temp1 = 3.0 * CK2 * pinvsq * c.xn0dp;
    const T temp2 = temp1 * CK2 * pinvsq;
    const T temp3 = 1.25 * CK4 * pinvsq * pinvsq * c.xn0dp;

    // atmospheric and gravitation coefs :(Mdf and OMEGAdf)
    c.xmdot = c.xn0dp +
              0.5 * temp1 * c.beta0 * x3thm1 +
              0.0625 * temp2 * c.beta0 * (13.0 - 78.0 * c.theta2 + 137.0 * theta4);

    const T x1m5th = 1.0 - 5.0 * c.theta2;

    c.omgdot = -0.5 * temp1 * x1m5th +
               0.0625 * temp2 * (7.0 - 114.0 * c.theta2 + 395.0 * theta4) +
               temp3 * (3.0 - 36.0 * c.theta2 + 49.0 * theta4);

    const T xhdot1 = -temp1 * c.cosi0;

    c.xnodot = xhdot1 + (0.5 * temp2 * (4.0 - 19.0 * c.theta2) + 2.0 * temp3 * (3.0 - 7.0 * c.theta2)) * c.cosi0;
    c.xnodcf = 3.5 * c.beta02 * xhdot1 * c.c1;
    c.t2cof = 1.5 * c.c1;

    return c;
}

template <typename T>
NearEarth<T>::NearEarth(const MeanElements<T> &elements, const CommonTerms<T> &c) {
    // For perigee less than 220 kilometers, the equations are truncated to
    // linear variation in sqrt a and quadratic variation in mean anomaly.
    // Also, the c3 term, the delta omega term, and the delta m term are dropped.
    lessThan220 = value(c.perige) < 220.0;
    if (!lessThan220) {
        const T cosM0 = cos(elements.meanAnomaly);
        const T c1sq = c.c1 * c.c1;
        delM0 = 1.0 + c.eta * cosM0;
        delM0 = delM0 * delM0 * delM0;
        d2 = 4.0 * c.a0dp * c.tsi * c1sq;
        const T temp = d2 * c.tsi * c.c1 / 3.0;
        d3 = (17.0 * c.a0dp + c.s4) * temp;
        d4 = 0.5 * temp * c.a0dp * c.tsi * (221.0 * c.a0dp + 31.0 * c.s4) * c.c1;
        t3cof = d2 + 2.0 * c1sq;
        t4cof = 0.25 * (3.0 * d3 + c.c1 * (12.0 * d2 + 10.0 * c1sq));
        t5cof = 0.2 * (3.0 * d4 + 12.0 * c.c1 * d3 + 6.0 * d2 * d2 + 15.0 * c1sq * (2.0 * d2 + c1sq));
        sinM0 = sin(elements.meanAnomaly);
        if (value(elements.e) < 1e-4) {
            omgcof = T(0.0);
            xmcof = T(0.0);
        } else {
            const T c3 = c.coef * c.tsi * A3OVK2 * c.xn0dp * NORMALIZED_EQUATORIAL_RADIUS * c.sini0 / elements.e;
            xmcof = -TWO_THIRD * c.coef * elements.bStar * NORMALIZED_EQUATORIAL_RADIUS / c.eeta;
            omgcof = elements.bStar * c3 * cos(elements.pa);
        }
    }

    c5 = 2.0 * c.coef1 * c.a0dp * c.beta02 * (1.0 + 2.75 * (c.etasq + c.eeta) + c.eeta * c.etasq);
}

template <typename T>
SecularElements<T> NearEarth<T>::propagate(const MeanElements<T> &elements, const CommonTerms<T> &c,
                                           double tSince) const {
    // Update for secular gravity and atmospheric drag.
    const T xmdf = elements.meanAnomaly + c.xmdot * tSince;
    const T omgadf = elements.pa + c.omgdot * tSince;
    const T xn0ddf = elements.raan + c.xnodot * tSince;

    SecularElements<T> s;
    s.omega = omgadf;
    T xmp = xmdf;
    const double tsq = tSince * tSince;
    s.xnode = xn0ddf + c.xnodcf * tsq;
    T tempa = 1.0 - c.c1 * tSince;
    T tempe = elements.bStar * c.c4 * tSince;
    T templ = c.t2cof * tsq;

    if (!lessThan220) {
        const T delomg = omgcof * tSince;
        T delm = 1.0 + c.eta * cos(xmdf);
        delm = xmcof * (delm * delm * delm - delM0);
        const T temp = delomg + delm;
        xmp = xmdf + temp;
        s.omega = omgadf - temp;
        const double tcube = tsq * tSince;
        const double tfour = tSince * tcube;
        tempa = tempa - d2 * tsq - d3 * tcube - d4 * tfour;
        tempe = tempe + elements.bStar * c5 * (sin(xmp) - sinM0);
        templ = templ + t3cof * tcube + tfour * (t4cof + tSince * t5cof);
    }

    // Past the decay epoch tempa changes sign and a grows again
    s.a = c.a0dp * tempa * tempa;
    if (value(tempa) <= 0.0 || value(s.a) < DECAY_RADIUS) {
        throw SatelliteDecayedException(tSince);
    }

    s.e = elements.e - tempe;

    // A highly arbitrary lower limit on e, of 1e-6
    if (value(s.e) < 1e-6) {
        s.e = T(1e-6);
    }

    s.xl = xmp + s.omega + s.xnode + c.xn0dp * templ;
    s.i = elements.i;
    s.cosi0 = c.cosi0;
    s.sini0 = c.sini0;

    return s;
}

template <typename T>
PVCoordinates<T> computePVCoordinates(const SecularElements<T> &s) {
    const T &a = s.a;
    const T &e = s.e;
    const T &cosi0 = s.cosi0;
    const T &sini0 = s.sini0;

    // Long period periodics
    const T axn = e * cos(s.omega);
    T temp = 1.0 / (a * (1.0 - e * e));
    T xlcofDenominator = 1.0 + cosi0;
    if (std::fabs(value(xlcofDenominator)) < 1.5e-12) {
        xlcofDenominator = T(1.5e-12);
    }
    const T xlcof = 0.125 * A3OVK2 * sini0 * (3.0 + 5.0 * cosi0) / xlcofDenominator;
    const T aycof = 0.25 * A3OVK2 * sini0;
    const T xll = temp * xlcof * axn;
    const T aynl = temp * aycof;
    const T xlt = s.xl + xll;
    const T ayn = e * sin(s.omega) + aynl;
    const T elsq = axn * axn + ayn * ayn;
    const T capu = normalizeAngle(T(xlt - s.xnode), M_PI);
    T epw = capu;
    T ecosE = T(0.0);
    T esinE = T(0.0);
    T sinEPW = T(0.0);
    T cosEPW = T(0.0);

    // Dundee changes: items dependent on cosio get recomputed
    const T cosi0Sq = cosi0 * cosi0;
    const T x3thm1 = 3.0 * cosi0Sq - 1.0;
    const T x1mth2 = 1.0 - cosi0Sq;
    const T x7thm1 = 7.0 * cosi0Sq - 1.0;

    if (value(e) > (1.0 - 1e-6)) {
        throw InvalidOrbitException(fmt::format("Eccentricity too large for propagation model: {}", value(e)));
    }

    // Solve Kepler's Equation
    constexpr double newtonRaphsonEpsilon = 1e-12;
    for (int j = 0; j < 10; j++) {
        bool doSecondOrderNewtonRaphson = true;

        sinEPW = sin(epw);
        cosEPW = cos(epw);
        ecosE = axn * cosEPW + ayn * sinEPW;
        esinE = axn * sinEPW - ayn * cosEPW;
        const T f = capu - epw + esinE;
        if (std::fabs(value(f)) < newtonRaphsonEpsilon) {
            break;
        }
        const T fdot = 1.0 - ecosE;
        T deltaEpw = f / fdot;
        if (j == 0) {
            const T maxNewtonRaphson = 1.25 * abs(e);
            doSecondOrderNewtonRaphson = false;
            if (value(deltaEpw) > value(maxNewtonRaphson)) {
                deltaEpw = maxNewtonRaphson;
            } else if (value(deltaEpw) < -value(maxNewtonRaphson)) {
                deltaEpw = -maxNewtonRaphson;
            } else {
                doSecondOrderNewtonRaphson = true;
            }
        }
        if (doSecondOrderNewtonRaphson) {
            deltaEpw = f / (fdot + 0.5 * esinE * deltaEpw);
        }
        epw += deltaEpw;
    }

    // Short period preliminary quantities
    temp = 1.0 - elsq;
    const T pl = a * temp;
    const T r = a * (1.0 - ecosE);
    T temp2 = a / r;
    const T betal = sqrt(temp);
    temp = esinE / (1.0 + betal);
    const T cosu = temp2 * (cosEPW - axn + ayn * temp);
    const T sinu = temp2 * (sinEPW - ayn - axn * temp);
    const T u = atan2(sinu, cosu);
    const T sin2u = 2.0 * sinu * cosu;
    const T cos2u = 2.0 * cosu * cosu - 1.0;
    const T temp1 = CK2 / pl;
    temp2 = temp1 / pl;

    // Update for short periodics
    const T rk = r * (1.0 - 1.5 * temp2 * betal * x3thm1) + 0.5 * temp1 * x1mth2 * cos2u;
    const T uk = u - 0.25 * temp2 * x7thm1 * sin2u;
    const T xnodek = s.xnode + 1.5 * temp2 * cosi0 * sin2u;
    const T xinck = s.i + 1.5 * temp2 * cosi0 * sini0 * cos2u;

    // Orientation vectors
    const T sinuk = sin(uk);
    const T cosuk = cos(uk);
    const T sinik = sin(xinck);
    const T cosik = cos(xinck);
    const T sinnok = sin(xnodek);
    const T cosnok = cos(xnodek);
    const T xmx = -sinnok * cosik;
    const T xmy = cosnok * cosik;
    const T ux = xmx * sinuk + cosnok * cosuk;
    const T uy = xmy * sinuk + sinnok * cosuk;
    const T uz = sinik * sinuk;

    // Position and velocity
    const T cr = 1000.0 * rk * EARTH_RADIUS;
    PVCoordinates<T> pv;
    pv.position = {cr * ux, cr * uy, cr * uz};

    const T rdot = XKE * sqrt(a) * esinE / r;
    const T rfdot = XKE * sqrt(pl) / r;
    const T xn = XKE / (a * sqrt(a));
    const T rdotk = rdot - xn * temp1 * x1mth2 * sin2u;
    const T rfdotk = rfdot + xn * temp1 * (x1mth2 * cos2u + 1.5 * x3thm1);
    const T vx = xmx * cosuk - cosnok * sinuk;
    const T vy = xmy * cosuk - sinnok * sinuk;
    const T vz = sinik * cosuk;

    constexpr double cv = 1000.0 * EARTH_RADIUS / 60.0;
    pv.velocity = {cv * (rdotk * ux + rfdotk * vx),
                   cv * (rdotk * uy + rfdotk * vy),
                   cv * (rdotk * uz + rfdotk * vz)};

    return pv;
}

// Explicit instantiations for plain and differentiating propagation
template CommonTerms<double> initializeCommons<double>(const MeanElements<double> &);
template CommonTerms<TleGradient> initializeCommons<TleGradient>(const MeanElements<TleGradient> &);
template PVCoordinates<double> computePVCoordinates<double>(const SecularElements<double> &);
template PVCoordinates<TleGradient> computePVCoordinates<TleGradient>(const SecularElements<TleGradient> &);
template class NearEarth<double>;
template class NearEarth<TleGradient>;

} // namespace tlekit
