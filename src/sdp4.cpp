/*
 * Copyright (c) 2025 Andrew C. Young <andrew@vaelen.org>
 * SPDX-License-Identifier: MIT
 *
 * SDP4 Deep-Space Propagation Implementation
 */

#include <tlekit/sdp4.hpp>

#include <cmath>

namespace tlekit {

namespace {

// Lunar-solar constants
constexpr double ZNS = 1.19459e-5;
constexpr double ZES = 0.01675;
constexpr double ZNL = 1.5835218e-4;
constexpr double ZEL = 0.05490;
constexpr double THDT = 4.3752691e-3;
constexpr double C1SS = 2.9864797e-6;
constexpr double C1L = 4.7968065e-7;

// Resonance constants
constexpr double ROOT22 = 1.7891679e-6;
constexpr double ROOT32 = 3.7393792e-7;
constexpr double ROOT44 = 7.3636953e-9;
constexpr double ROOT52 = 1.1428639e-7;
constexpr double ROOT54 = 2.1765803e-9;

constexpr double Q22 = 1.7891679e-6;
constexpr double Q31 = 2.1460748e-6;
constexpr double Q33 = 2.2123015e-7;

// cos and sin of the phase angles 2*FASX2, 4*FASX4, 6*FASX6
constexpr double C_FASX2 = 0.99139134268488593;
constexpr double S_FASX2 = 0.13093206501640101;
constexpr double C_2FASX4 = 0.87051638752972937;
constexpr double S_2FASX4 = -0.49213943048915526;
constexpr double C_3FASX6 = 0.43258117585763334;
constexpr double S_3FASX6 = 0.90159499016666422;

constexpr double C_G22 = 0.87051638752972937;
constexpr double S_G22 = -0.49213943048915526;
constexpr double C_G32 = 0.57972190187001149;
constexpr double S_G32 = 0.81481440616389245;
constexpr double C_G44 = -0.22866241528815548;
constexpr double S_G44 = 0.97350577801807991;
constexpr double C_G52 = 0.49684831179884198;
constexpr double S_G52 = 0.86783740128127729;
constexpr double C_G54 = -0.29695209575316894;
constexpr double S_G54 = -0.95489237761529999;

constexpr double INTEGRATION_STEP = 720.0;   // minutes

// Below 3 degrees the node terms are dropped
constexpr double SMALL_INCLINATION = M_PI / 60.0;

} // namespace

double thetaG(const double jd) {
    constexpr double omegaE = 1.00273790934;   // Earth rotations per sidereal day
    const double ut = std::fmod(jd + 0.5, 1.0);
    const double tCen = (jd - ut - J2000_JD) / 36525.0;
    double gmst = 24110.54841 + tCen * (8640184.812866 + tCen * (0.093104 - tCen * 6.2e-6));
    gmst = std::fmod(gmst + SECONDS_PER_DAY * omegaE * ut, SECONDS_PER_DAY);
    if (gmst < 0.0) {
        gmst += SECONDS_PER_DAY;
    }
    return TWO_PI * gmst / SECONDS_PER_DAY;
}

template <typename T>
DeepSpace<T>::DeepSpace(const MeanElements<T> &elements, const CommonTerms<T> &c, const double epochJd)
    : resonance(Resonance::None),
      smallInclination(value(elements.i) < SMALL_INCLINATION),
      omgdot(c.omgdot) {
    const T sing = sin(elements.pa);
    const T cosg = cos(elements.pa);
    const T sinq = sin(elements.raan);
    const T cosq = cos(elements.raan);
    const T aqnv = 1.0 / c.a0dp;

    const double daysSince1900 = epochJd - JD_1900;

    thgr = thetaG(epochJd);
    xnq = c.xn0dp;
    omegaq = elements.pa;

    // Lunar orbit at epoch
    const double xnodce = 4.5236020 - 9.2422029e-4 * daysSince1900;
    const double stem = std::sin(xnodce);
    const double ctem = std::cos(xnodce);
    const double cMinusGam = 0.228027132 * daysSince1900 - 1.1151842;
    const double gam = 5.8351514 + 0.0019443680 * daysSince1900;

    const double zcosil = 0.91375164 - 0.03568096 * ctem;
    const double zsinil = std::sqrt(1.0 - zcosil * zcosil);
    const double zsinhl = 0.089683511 * stem / zsinil;
    const double zcoshl = std::sqrt(1.0 - zsinhl * zsinhl);
    zmol = normalizeAngle(cMinusGam, M_PI);

    double zx = 0.39785416 * stem / zsinil;
    const double zy = zcoshl * ctem + 0.91744867 * zsinhl * stem;
    zx = std::atan2(zx, zy) + gam - xnodce;
    const double zcosgl = std::cos(zx);
    const double zsingl = std::sin(zx);
    zmos = normalizeAngle(6.2565837 + 0.017201977 * daysSince1900, M_PI);

    // Solar terms come first, then the lunar terms with the Moon's orbit
    double cc = C1SS;
    double ze = ZES;
    double zn = ZNS;
    T zsinh = sinq;
    T zcosh = cosq;
    double zcosi = 0.91744867;
    double zsini = 0.39785416;
    double zsing = -0.98088458;
    double zcosg = 0.1945905;

    T se, si, sl, sgh, sh;

    for (int pass = 0; pass < 2; ++pass) {
        const T a1 = zcosg * zcosh + zsing * zcosi * zsinh;
        const T a3 = -zsing * zcosh + zcosg * zcosi * zsinh;
        const T a7 = -zcosg * zsinh + zsing * zcosi * zcosh;
        const double a8 = zsing * zsini;
        const T a9 = zsing * zsinh + zcosg * zcosi * zcosh;
        const double a10 = zcosg * zsini;
        const T a2 = c.cosi0 * a7 + c.sini0 * a8;
        const T a4 = c.cosi0 * a9 + c.sini0 * a10;
        const T a5 = -c.sini0 * a7 + c.cosi0 * a8;
        const T a6 = -c.sini0 * a9 + c.cosi0 * a10;
        const T x1 = a1 * cosg + a2 * sing;
        const T x2 = a3 * cosg + a4 * sing;
        const T x3 = -a1 * sing + a2 * cosg;
        const T x4 = -a3 * sing + a4 * cosg;
        const T x5 = a5 * sing;
        const T x6 = a6 * sing;
        const T x7 = a5 * cosg;
        const T x8 = a6 * cosg;
        const T z31 = 12.0 * x1 * x1 - 3.0 * x3 * x3;
        const T z32 = 24.0 * x1 * x2 - 6.0 * x3 * x4;
        const T z33 = 12.0 * x2 * x2 - 3.0 * x4 * x4;
        const T z11 = -6.0 * a1 * a5 + c.e0sq * (-24.0 * x1 * x7 - 6.0 * x3 * x5);
        const T z12 = -6.0 * (a1 * a6 + a3 * a5) +
                      c.e0sq * (-24.0 * (x2 * x7 + x1 * x8) - 6.0 * (x3 * x6 + x4 * x5));
        const T z13 = -6.0 * a3 * a6 + c.e0sq * (-24.0 * x2 * x8 - 6.0 * x4 * x6);
        const T z21 = 6.0 * a2 * a5 + c.e0sq * (24.0 * x1 * x5 - 6.0 * x3 * x7);
        const T z22 = 6.0 * (a4 * a5 + a2 * a6) +
                      c.e0sq * (24.0 * (x2 * x5 + x1 * x6) - 6.0 * (x4 * x7 + x3 * x8));
        const T z23 = 6.0 * a4 * a6 + c.e0sq * (24.0 * x2 * x6 - 6.0 * x4 * x8);
        const T s3 = cc / xnq;
        const T s2 = -0.5 * s3 / c.beta0;
        const T s4 = s3 * c.beta0;
        const T s1 = -15.0 * elements.e * s4;
        const T s5 = x1 * x3 + x2 * x4;
        const T s6 = x2 * x3 + x1 * x4;
        const T s7 = x2 * x4 - x1 * x3;
        T z1 = 3.0 * (a1 * a1 + a2 * a2) + z31 * c.e0sq;
        T z2 = 6.0 * (a1 * a3 + a2 * a4) + z32 * c.e0sq;
        T z3 = 3.0 * (a3 * a3 + a4 * a4) + z33 * c.e0sq;

        z1 = z1 + z1 + c.beta02 * z31;
        z2 = z2 + z2 + c.beta02 * z32;
        z3 = z3 + z3 + c.beta02 * z33;
        se = s1 * zn * s5;
        si = s2 * zn * (z11 + z13);
        sl = -zn * s3 * (z1 + z3 - 14.0 - 6.0 * c.e0sq);
        sgh = s4 * zn * (z31 + z33 - 6.0);
        sh = smallInclination ? T(0.0) : T(-zn * s2 * (z21 + z23));

        ee2 = 2.0 * s1 * s6;
        e3 = 2.0 * s1 * s7;
        xi2 = 2.0 * s2 * z12;
        xi3 = 2.0 * s2 * (z13 - z11);
        xl2 = -2.0 * s3 * z2;
        xl3 = -2.0 * s3 * (z3 - z1);
        xl4 = -2.0 * s3 * (-21.0 - 9.0 * c.e0sq) * ze;
        xgh2 = 2.0 * s4 * z32;
        xgh3 = 2.0 * s4 * (z33 - z31);
        xgh4 = -18.0 * s4 * ze;
        xh2 = -2.0 * s2 * z22;
        xh3 = -2.0 * s2 * (z23 - z21);

        if (pass == 0) {
            // Keep the solar terms and switch to the Moon
            sse = se;
            ssi = si;
            ssl = sl;
            ssh = smallInclination ? T(0.0) : T(sh / c.sini0);
            ssg = sgh - c.cosi0 * ssh;
            se2 = ee2;
            si2 = xi2;
            sl2 = xl2;
            sgh2 = xgh2;
            sh2 = xh2;
            se3 = e3;
            si3 = xi3;
            sl3 = xl3;
            sgh3 = xgh3;
            sh3 = xh3;
            sl4 = xl4;
            sgh4 = xgh4;
            zcosg = zcosgl;
            zsing = zsingl;
            zcosi = zcosil;
            zsini = zsinil;
            zcosh = zcoshl * cosq + zsinhl * sinq;
            zsinh = sinq * zcoshl - cosq * zsinhl;
            zn = ZNL;
            cc = C1L;
            ze = ZEL;
        }
    }

    sse += se;
    ssi += si;
    ssl += sl;
    if (smallInclination) {
        ssg += sgh;
    } else {
        ssg += sgh - c.cosi0 / c.sini0 * sh;
        ssh += sh / c.sini0;
    }

    // Resonance initialization
    T bfact(0.0);
    const double n = value(xnq);
    const double e = value(elements.e);

    if (n >= 0.00826 && n <= 0.00924 && e >= 0.5) {
        // 12 hour orbit, 1.893053 to 2.117652 revs/day
        resonance = Resonance::HalfDay;

        const T &ecc = elements.e;
        const T &e0sq = c.e0sq;
        const T &cosi0 = c.cosi0;
        const T &sini0 = c.sini0;
        const T &theta2 = c.theta2;

        const T g201 = -0.306 - (ecc - 0.64) * 0.440;
        const T eoc = ecc * e0sq;
        const T sini2 = sini0 * sini0;
        const T f220 = 0.75 * (1.0 + 2.0 * cosi0 + theta2);
        const T f221 = 1.5 * sini2;
        const T f321 = 1.875 * sini0 * (1.0 - 2.0 * cosi0 - 3.0 * theta2);
        const T f322 = -1.875 * sini0 * (1.0 + 2.0 * cosi0 - 3.0 * theta2);
        const T f441 = 35.0 * sini2 * f220;
        const T f442 = 39.3750 * sini2 * sini2;
        const T f522 = 9.84375 * sini0 * (sini2 * (1.0 - 2.0 * cosi0 - 5.0 * theta2) +
                                          0.33333333 * (-2.0 + 4.0 * cosi0 + 6.0 * theta2));
        const T f523 = sini0 * (4.92187512 * sini2 * (-2.0 - 4.0 * cosi0 + 10.0 * theta2) +
                                6.56250012 * (1.0 + 2.0 * cosi0 - 3.0 * theta2));
        const T f542 = 29.53125 * sini0 * (2.0 - 8.0 * cosi0 + theta2 * (-12.0 + 8.0 * cosi0 + 10.0 * theta2));
        const T f543 = 29.53125 * sini0 * (-2.0 - 8.0 * cosi0 + theta2 * (12.0 + 8.0 * cosi0 - 10.0 * theta2));

        T g211, g310, g322, g410, g422, g520;
        if (e <= 0.65) {
            g211 = 3.616 - 13.247 * ecc + 16.290 * e0sq;
            g310 = -19.302 + 117.390 * ecc - 228.419 * e0sq + 156.591 * eoc;
            g322 = -18.9068 + 109.7927 * ecc - 214.6334 * e0sq + 146.5816 * eoc;
            g410 = -41.122 + 242.694 * ecc - 471.094 * e0sq + 313.953 * eoc;
            g422 = -146.407 + 841.880 * ecc - 1629.014 * e0sq + 1083.435 * eoc;
            g520 = -532.114 + 3017.977 * ecc - 5740.032 * e0sq + 3708.276 * eoc;
        } else {
            g211 = -72.099 + 331.819 * ecc - 508.738 * e0sq + 266.724 * eoc;
            g310 = -346.844 + 1582.851 * ecc - 2415.925 * e0sq + 1246.113 * eoc;
            g322 = -342.585 + 1554.908 * ecc - 2366.899 * e0sq + 1215.972 * eoc;
            g410 = -1052.797 + 4758.686 * ecc - 7193.992 * e0sq + 3651.957 * eoc;
            g422 = -3581.69 + 16178.11 * ecc - 24462.77 * e0sq + 12422.52 * eoc;
            if (e <= 0.715) {
                g520 = 1464.74 - 4664.75 * ecc + 3763.64 * e0sq;
            } else {
                g520 = -5149.66 + 29936.92 * ecc - 54087.36 * e0sq + 31324.56 * eoc;
            }
        }

        T g533, g521, g532;
        if (e < 0.7) {
            g533 = -919.2277 + 4988.61 * ecc - 9064.77 * e0sq + 5542.21 * eoc;
            g521 = -822.71072 + 4568.6173 * ecc - 8491.4146 * e0sq + 5337.524 * eoc;
            g532 = -853.666 + 4690.25 * ecc - 8624.77 * e0sq + 5341.4 * eoc;
        } else {
            g533 = -37995.78 + 161616.52 * ecc - 229838.2 * e0sq + 109377.94 * eoc;
            g521 = -51752.104 + 218913.95 * ecc - 309468.16 * e0sq + 146349.42 * eoc;
            g532 = -40023.88 + 170470.89 * ecc - 242699.48 * e0sq + 115605.82 * eoc;
        }

        T temp1 = 3.0 * xnq * xnq * aqnv * aqnv;
        T temp = temp1 * ROOT22;
        d2201 = temp * f220 * g201;
        d2211 = temp * f221 * g211;
        temp1 *= aqnv;
        temp = temp1 * ROOT32;
        d3210 = temp * f321 * g310;
        d3222 = temp * f322 * g322;
        temp1 *= aqnv;
        temp = 2.0 * temp1 * ROOT44;
        d4410 = temp * f441 * g410;
        d4422 = temp * f442 * g422;
        temp1 *= aqnv;
        temp = temp1 * ROOT52;
        d5220 = temp * f522 * g520;
        d5232 = temp * f523 * g532;
        temp = 2.0 * temp1 * ROOT54;
        d5421 = temp * f542 * g521;
        d5433 = temp * f543 * g533;
        xlamo = elements.meanAnomaly + elements.raan + elements.raan - thgr - thgr;
        bfact = c.xmdot + c.xnodot + c.xnodot - THDT - THDT;
        bfact += ssl + ssh + ssh;
    } else if (n < 0.0052359877 && n > 0.0034906585) {
        // Geosynchronous, 0.8 to 1.2 revs/day
        resonance = Resonance::OneDay;

        const T cosi0Plus1 = 1.0 + c.cosi0;
        const T g200 = 1.0 + c.e0sq * (-2.5 + 0.8125 * c.e0sq);
        const T g300 = 1.0 + c.e0sq * (-6.0 + 6.60937 * c.e0sq);
        const T f311 = 0.9375 * c.sini0 * c.sini0 * (1.0 + 3.0 * c.cosi0) - 0.75 * cosi0Plus1;
        const T g310 = 1.0 + 2.0 * c.e0sq;
        const T f220 = 0.75 * cosi0Plus1 * cosi0Plus1;
        const T f330 = 2.5 * f220 * cosi0Plus1;

        del1 = 3.0 * xnq * xnq * aqnv * aqnv;
        del2 = 2.0 * del1 * f220 * g200 * Q22;
        del3 = 3.0 * del1 * f330 * g300 * Q33 * aqnv;
        del1 = del1 * f311 * g310 * Q31 * aqnv;
        xlamo = elements.meanAnomaly + elements.raan + elements.pa - thgr;
        bfact = c.xmdot + c.omgdot + c.xnodot - THDT;
        bfact = bfact + ssl + ssg + ssh;
    }

    xfact = bfact - xnq;
}

template <typename T>
std::array<T, 2> DeepSpace<T>::secularDerivatives(const T &xli, const double atime) const {
    const T sinLi = sin(xli);
    const T cosLi = cos(xli);
    const T sin2li = 2.0 * sinLi * cosLi;
    const T cos2li = 2.0 * cosLi * cosLi - 1.0;

    if (resonance == Resonance::OneDay) {
        const T sin3li = sin2li * cosLi + cos2li * sinLi;
        const T cos3li = cos2li * cosLi - sin2li * sinLi;
        const T term1a = del1 * (sinLi * C_FASX2 - cosLi * S_FASX2);
        const T term2a = del2 * (sin2li * C_2FASX4 - cos2li * S_2FASX4);
        const T term3a = del3 * (sin3li * C_3FASX6 - cos3li * S_3FASX6);
        const T term1b = del1 * (cosLi * C_FASX2 + sinLi * S_FASX2);
        const T term2b = 2.0 * del2 * (cos2li * C_2FASX4 + sin2li * S_2FASX4);
        const T term3b = 3.0 * del3 * (cos3li * C_3FASX6 + sin3li * S_3FASX6);
        return {term1a + term2a + term3a, term1b + term2b + term3b};
    }

    // 12 hour resonance
    const T xomi = omegaq + omgdot * atime;
    const T sinOmi = sin(xomi);
    const T cosOmi = cos(xomi);
    const T sinLiMOmi = sinLi * cosOmi - sinOmi * cosLi;
    const T sinLiPOmi = sinLi * cosOmi + sinOmi * cosLi;
    const T cosLiMOmi = cosLi * cosOmi + sinOmi * sinLi;
    const T cosLiPOmi = cosLi * cosOmi - sinOmi * sinLi;
    const T sin2omi = 2.0 * sinOmi * cosOmi;
    const T cos2omi = 2.0 * cosOmi * cosOmi - 1.0;
    const T sin2liMOmi = sin2li * cosOmi - sinOmi * cos2li;
    const T sin2liPOmi = sin2li * cosOmi + sinOmi * cos2li;
    const T cos2liMOmi = cos2li * cosOmi + sinOmi * sin2li;
    const T cos2liPOmi = cos2li * cosOmi - sinOmi * sin2li;
    const T sin2liP2omi = sin2li * cos2omi + sin2omi * cos2li;
    const T cos2liP2omi = cos2li * cos2omi - sin2omi * sin2li;
    const T sin2omiPLi = sinLi * cos2omi + sin2omi * cosLi;
    const T cos2omiPLi = cosLi * cos2omi - sin2omi * sinLi;

    const T term1a = d2201 * (sin2omiPLi * C_G22 - cos2omiPLi * S_G22) +
                     d2211 * (sinLi * C_G22 - cosLi * S_G22) +
                     d3210 * (sinLiPOmi * C_G32 - cosLiPOmi * S_G32) +
                     d3222 * (sinLiMOmi * C_G32 - cosLiMOmi * S_G32) +
                     d5220 * (sinLiPOmi * C_G52 - cosLiPOmi * S_G52) +
                     d5232 * (sinLiMOmi * C_G52 - cosLiMOmi * S_G52);
    const T term2a = d4410 * (sin2liP2omi * C_G44 - cos2liP2omi * S_G44) +
                     d4422 * (sin2li * C_G44 - cos2li * S_G44) +
                     d5421 * (sin2liPOmi * C_G54 - cos2liPOmi * S_G54) +
                     d5433 * (sin2liMOmi * C_G54 - cos2liMOmi * S_G54);
    const T term1b = d2201 * (cos2omiPLi * C_G22 + sin2omiPLi * S_G22) +
                     d2211 * (cosLi * C_G22 + sinLi * S_G22) +
                     d3210 * (cosLiPOmi * C_G32 + sinLiPOmi * S_G32) +
                     d3222 * (cosLiMOmi * C_G32 + sinLiMOmi * S_G32) +
                     d5220 * (cosLiPOmi * C_G52 + sinLiPOmi * S_G52) +
                     d5232 * (cosLiMOmi * C_G52 + sinLiMOmi * S_G52);
    const T term2b = 2.0 * (d4410 * (cos2liP2omi * C_G44 + sin2liP2omi * S_G44) +
                            d4422 * (cos2li * C_G44 + sin2li * S_G44) +
                            d5421 * (cos2liPOmi * C_G54 + sin2liPOmi * S_G54) +
                            d5433 * (cos2liMOmi * C_G54 + sin2liMOmi * S_G54));
    return {term1a + term2a, term1b + term2b};
}

template <typename T>
SecularElements<T> DeepSpace<T>::propagate(const MeanElements<T> &elements, const CommonTerms<T> &c,
                                           const double tSince) const {
    // Update for secular gravity and atmospheric drag
    const double tSinceSq = tSince * tSince;
    T omgadf = elements.pa + c.omgdot * tSince;
    T xnode = elements.raan + c.xnodot * tSince + c.xnodcf * tSinceSq;
    T xn = c.xn0dp;
    T xll = elements.meanAnomaly + c.xmdot * tSince;

    // Deep-space secular effects
    xll += ssl * tSince;
    omgadf += ssg * tSince;
    xnode += ssh * tSince;
    T em = elements.e + sse * tSince;
    T xinc = elements.i + ssi * tSince;

    if (resonance != Resonance::None) {
        T xli = xlamo;
        T xni = xnq;
        double atime = 0.0;
        bool lastStep = false;
        while (!lastStep) {
            double delt = tSince - atime;
            if (delt > INTEGRATION_STEP) {
                delt = INTEGRATION_STEP;
            } else if (delt < -INTEGRATION_STEP) {
                delt = -INTEGRATION_STEP;
            } else {
                lastStep = true;
            }

            std::array<T, 2> derivs = secularDerivatives(xli, atime);
            const T xldot = xni + xfact;

            // Second order Taylor step
            xli += delt * xldot;
            xni += delt * derivs[0];
            derivs[1] *= xldot;
            const double halfDeltSq = 0.5 * delt * delt;
            xli += halfDeltSq * derivs[0];
            xni += halfDeltSq * derivs[1];
            atime += delt;
        }
        xn = xni;
        const T temp = -xnode + thgr + tSince * THDT;
        xll = xli + temp + (resonance == Resonance::OneDay ? T(-omgadf) : temp);
    }

    const T tempa = 1.0 - c.c1 * tSince;
    SecularElements<T> s;
    s.a = pow(XKE / xn, TWO_THIRD) * tempa * tempa;
    if (value(tempa) <= 0.0 || !(value(s.a) >= DECAY_RADIUS)) {
        throw SatelliteDecayedException(tSince);
    }
    em -= elements.bStar * c.c4 * tSince;
    xll += c.xn0dp * c.t2cof * tSinceSq;

    // Deep-space periodic effects, solar then lunar
    double zm = zmos + ZNS * tSince;
    double zf = zm + 2.0 * ZES * std::sin(zm);
    double sinzf = std::sin(zf);
    double f2 = 0.5 * sinzf * sinzf - 0.25;
    double f3 = -0.5 * sinzf * std::cos(zf);
    const T ses = se2 * f2 + se3 * f3;
    const T sis = si2 * f2 + si3 * f3;
    const T sls = sl2 * f2 + sl3 * f3 + sl4 * sinzf;
    const T sghs = sgh2 * f2 + sgh3 * f3 + sgh4 * sinzf;
    const T shs = sh2 * f2 + sh3 * f3;

    zm = zmol + ZNL * tSince;
    zf = zm + 2.0 * ZEL * std::sin(zm);
    sinzf = std::sin(zf);
    f2 = 0.5 * sinzf * sinzf - 0.25;
    f3 = -0.5 * sinzf * std::cos(zf);
    const T sel = ee2 * f2 + e3 * f3;
    const T sil = xi2 * f2 + xi3 * f3;
    const T sll = xl2 * f2 + xl3 * f3 + xl4 * sinzf;
    const T sghl = xgh2 * f2 + xgh3 * f3 + xgh4 * sinzf;
    const T sh1 = xh2 * f2 + xh3 * f3;

    const T pe = ses + sel;
    const T pinc = sis + sil;
    const T pl = sls + sll;
    const T pgh = sghs + sghl;
    const T ph = shs + sh1;

    xinc += pinc;
    const T sinis = sin(xinc);
    const T cosis = cos(xinc);

    em += pe;
    xll += pl;
    omgadf += pgh;
    xinc = normalizeAngle(xinc, 0.0);

    if (std::fabs(value(xinc)) >= 0.2) {
        // Apply periodics directly
        const T tempVal = ph / sinis;
        omgadf -= cosis * tempVal;
        xnode += tempVal;
    } else {
        // Apply periodics with Lyddane modification
        const T sinok = sin(xnode);
        const T cosok = cos(xnode);
        const T alfdp = ph * cosok + (pinc * cosis + sinis) * sinok;
        const T betdp = -ph * sinok + (pinc * cosis + sinis) * cosok;
        const T deltaXnode = normalizeAngle(T(atan2(alfdp, betdp) - xnode), 0.0);
        const T dls = -xnode * sinis * pinc;
        omgadf += dls - cosis * deltaXnode;
        xnode += deltaXnode;
    }

    s.e = em;
    s.i = xinc;
    s.omega = omgadf;
    s.xnode = xnode;
    s.xl = xll + omgadf + xnode;

    // Dundee change: cos and sin of the inclination follow the perturbed value
    s.cosi0 = cos(xinc);
    s.sini0 = sin(xinc);

    return s;
}

template class DeepSpace<double>;
template class DeepSpace<TleGradient>;

} // namespace tlekit
