/*
 * Copyright (c) 2025 Andrew C. Young <andrew@vaelen.org>
 * SPDX-License-Identifier: MIT
 *
 * SGP4/SDP4 Satellite Propagation Implementation
 * Based on the Vallado reference implementation from CelesTrak.
 * See: https://celestrak.org/software/vallado-sw.php
 */

#include <groundtrack/sgp4.hpp>

#include <cmath>
#include <string>

namespace groundtrack::sgp4 {

namespace {

constexpr double PI = std::numbers::pi;

// Solar and lunar perturbation constants
constexpr double ZNS = 1.19459e-5;         // Solar mean motion (rad/min)
constexpr double ZES = 0.01675;            // Solar eccentricity
constexpr double ZNL = 1.5835218e-4;       // Lunar mean motion (rad/min)
constexpr double ZEL = 0.05490;            // Lunar eccentricity
constexpr double RPTIM = 4.37526908801129966e-3;  // Earth rotation rate (rad/min)

/**
 * Intermediate values shared by the deep space initialization steps.
 */
struct DeepSpaceCommon {
    double snodm, cnodm, sinim, cosim, sinomm, cosomm;
    double day, em, emsq, gam, rtemsq, nm;
    double s1, s2, s3, s4, s5, s6, s7;
    double ss1, ss2, ss3, ss4, ss5, ss6, ss7;
    double sz1, sz2, sz3, sz11, sz12, sz13, sz21, sz22, sz23, sz31, sz32, sz33;
    double z1, z2, z3, z11, z12, z13, z21, z22, z23, z31, z32, z33;
};

/**
 * Mean elements as they evolve during a single propagation.
 */
struct MeanElements {
    double em;
    double inclm;
    double nodem;
    double argpm;
    double mm;
    double nm;
};

// ============================================================================
// Deep Space Initialization
// ============================================================================

// Lunar and solar terms common to initialization and periodics (dscom)
DeepSpaceCommon deepSpaceCommon(State& state, double epoch, double tc) {
    constexpr double c1ss = 2.9864797e-6;
    constexpr double c1l = 4.7968065e-7;
    constexpr double zsinis = 0.39785416;
    constexpr double zcosis = 0.91744867;
    constexpr double zcosgs = 0.1945905;
    constexpr double zsings = -0.98088458;

    DeepSpaceCommon c{};
    c.nm = state.no_unkozai;
    c.em = state.ecco;
    c.snodm = std::sin(state.nodeo);
    c.cnodm = std::cos(state.nodeo);
    c.sinomm = std::sin(state.argpo);
    c.cosomm = std::cos(state.argpo);
    c.sinim = std::sin(state.inclo);
    c.cosim = std::cos(state.inclo);
    c.emsq = c.em * c.em;
    double betasq = 1.0 - c.emsq;
    c.rtemsq = std::sqrt(betasq);

    state.peo = 0.0;
    state.pinco = 0.0;
    state.plo = 0.0;
    state.pgho = 0.0;
    state.pho = 0.0;

    // Days since 1900 January 0.5
    c.day = epoch + 18261.5 + tc / 1440.0;
    double xnodce = std::fmod(4.5236020 - 9.2422029e-4 * c.day, TWO_PI);
    double stem = std::sin(xnodce);
    double ctem = std::cos(xnodce);
    double zcosil = 0.91375164 - 0.03568096 * ctem;
    double zsinil = std::sqrt(1.0 - zcosil * zcosil);
    double zsinhl = 0.089683511 * stem / zsinil;
    double zcoshl = std::sqrt(1.0 - zsinhl * zsinhl);
    c.gam = 5.8351514 + 0.0019443680 * c.day;
    double zx = 0.39785416 * stem / zsinil;
    double zy = zcoshl * ctem + 0.91744867 * zsinhl * stem;
    zx = std::atan2(zx, zy);
    zx = c.gam + zx - xnodce;
    double zcosgl = std::cos(zx);
    double zsingl = std::sin(zx);

    // Solar terms on the first pass, lunar terms on the second
    double zcosg = zcosgs;
    double zsing = zsings;
    double zcosi = zcosis;
    double zsini = zsinis;
    double zcosh = c.cnodm;
    double zsinh = c.snodm;
    double cc = c1ss;
    double xnoi = 1.0 / c.nm;

    for (int lsflg = 1; lsflg <= 2; ++lsflg) {
        double a1 = zcosg * zcosh + zsing * zcosi * zsinh;
        double a3 = -zsing * zcosh + zcosg * zcosi * zsinh;
        double a7 = -zcosg * zsinh + zsing * zcosi * zcosh;
        double a8 = zsing * zsini;
        double a9 = zsing * zsinh + zcosg * zcosi * zcosh;
        double a10 = zcosg * zsini;
        double a2 = c.cosim * a7 + c.sinim * a8;
        double a4 = c.cosim * a9 + c.sinim * a10;
        double a5 = -c.sinim * a7 + c.cosim * a8;
        double a6 = -c.sinim * a9 + c.cosim * a10;

        double x1 = a1 * c.cosomm + a2 * c.sinomm;
        double x2 = a3 * c.cosomm + a4 * c.sinomm;
        double x3 = -a1 * c.sinomm + a2 * c.cosomm;
        double x4 = -a3 * c.sinomm + a4 * c.cosomm;
        double x5 = a5 * c.sinomm;
        double x6 = a6 * c.sinomm;
        double x7 = a5 * c.cosomm;
        double x8 = a6 * c.cosomm;

        c.z31 = 12.0 * x1 * x1 - 3.0 * x3 * x3;
        c.z32 = 24.0 * x1 * x2 - 6.0 * x3 * x4;
        c.z33 = 12.0 * x2 * x2 - 3.0 * x4 * x4;
        c.z1 = 3.0 * (a1 * a1 + a2 * a2) + c.z31 * c.emsq;
        c.z2 = 6.0 * (a1 * a3 + a2 * a4) + c.z32 * c.emsq;
        c.z3 = 3.0 * (a3 * a3 + a4 * a4) + c.z33 * c.emsq;
        c.z11 = -6.0 * a1 * a5 + c.emsq * (-24.0 * x1 * x7 - 6.0 * x3 * x5);
        c.z12 = -6.0 * (a1 * a6 + a3 * a5) + c.emsq *
                (-24.0 * (x2 * x7 + x1 * x8) - 6.0 * (x3 * x6 + x4 * x5));
        c.z13 = -6.0 * a3 * a6 + c.emsq * (-24.0 * x2 * x8 - 6.0 * x4 * x6);
        c.z21 = 6.0 * a2 * a5 + c.emsq * (24.0 * x1 * x5 - 6.0 * x3 * x7);
        c.z22 = 6.0 * (a4 * a5 + a2 * a6) + c.emsq *
                (24.0 * (x2 * x5 + x1 * x6) - 6.0 * (x4 * x7 + x3 * x8));
        c.z23 = 6.0 * a4 * a6 + c.emsq * (24.0 * x2 * x6 - 6.0 * x4 * x8);
        c.z1 = c.z1 + c.z1 + betasq * c.z31;
        c.z2 = c.z2 + c.z2 + betasq * c.z32;
        c.z3 = c.z3 + c.z3 + betasq * c.z33;
        c.s3 = cc * xnoi;
        c.s2 = -0.5 * c.s3 / c.rtemsq;
        c.s4 = c.s3 * c.rtemsq;
        c.s1 = -15.0 * c.em * c.s4;
        c.s5 = x1 * x3 + x2 * x4;
        c.s6 = x2 * x3 + x1 * x4;
        c.s7 = x2 * x4 - x1 * x3;

        if (lsflg == 1) {
            c.ss1 = c.s1;
            c.ss2 = c.s2;
            c.ss3 = c.s3;
            c.ss4 = c.s4;
            c.ss5 = c.s5;
            c.ss6 = c.s6;
            c.ss7 = c.s7;
            c.sz1 = c.z1;
            c.sz2 = c.z2;
            c.sz3 = c.z3;
            c.sz11 = c.z11;
            c.sz12 = c.z12;
            c.sz13 = c.z13;
            c.sz21 = c.z21;
            c.sz22 = c.z22;
            c.sz23 = c.z23;
            c.sz31 = c.z31;
            c.sz32 = c.z32;
            c.sz33 = c.z33;
            zcosg = zcosgl;
            zsing = zsingl;
            zcosi = zcosil;
            zsini = zsinil;
            zcosh = zcoshl * c.cnodm + zsinhl * c.snodm;
            zsinh = c.snodm * zcoshl - c.cnodm * zsinhl;
            cc = c1l;
        }
    }

    state.zmol = std::fmod(4.7199672 + 0.22997150 * c.day - c.gam, TWO_PI);
    state.zmos = std::fmod(6.2565837 + 0.017201977 * c.day, TWO_PI);

    // Solar periodic coefficients
    state.se2 = 2.0 * c.ss1 * c.ss6;
    state.se3 = 2.0 * c.ss1 * c.ss7;
    state.si2 = 2.0 * c.ss2 * c.sz12;
    state.si3 = 2.0 * c.ss2 * (c.sz13 - c.sz11);
    state.sl2 = -2.0 * c.ss3 * c.sz2;
    state.sl3 = -2.0 * c.ss3 * (c.sz3 - c.sz1);
    state.sl4 = -2.0 * c.ss3 * (-21.0 - 9.0 * c.emsq) * ZES;
    state.sgh2 = 2.0 * c.ss4 * c.sz32;
    state.sgh3 = 2.0 * c.ss4 * (c.sz33 - c.sz31);
    state.sgh4 = -18.0 * c.ss4 * ZES;
    state.sh2 = -2.0 * c.ss2 * c.sz22;
    state.sh3 = -2.0 * c.ss2 * (c.sz23 - c.sz21);

    // Lunar periodic coefficients
    state.ee2 = 2.0 * c.s1 * c.s6;
    state.e3 = 2.0 * c.s1 * c.s7;
    state.xi2 = 2.0 * c.s2 * c.z12;
    state.xi3 = 2.0 * c.s2 * (c.z13 - c.z11);
    state.xl2 = -2.0 * c.s3 * c.z2;
    state.xl3 = -2.0 * c.s3 * (c.z3 - c.z1);
    state.xl4 = -2.0 * c.s3 * (-21.0 - 9.0 * c.emsq) * ZEL;
    state.xgh2 = 2.0 * c.s4 * c.z32;
    state.xgh3 = 2.0 * c.s4 * (c.z33 - c.z31);
    state.xgh4 = -18.0 * c.s4 * ZEL;
    state.xh2 = -2.0 * c.s2 * c.z22;
    state.xh3 = -2.0 * c.s2 * (c.z23 - c.z21);

    return c;
}

// Secular rates and resonance coefficients (dsinit)
void deepSpaceInit(State& state, const DeepSpaceCommon& c, double xpidot) {
    constexpr double q22 = 1.7891679e-6;
    constexpr double q31 = 2.1460748e-6;
    constexpr double q33 = 2.2123015e-7;
    constexpr double root22 = 1.7891679e-6;
    constexpr double root44 = 7.3636953e-9;
    constexpr double root54 = 2.1765803e-9;
    constexpr double root32 = 3.7393792e-7;
    constexpr double root52 = 1.1428639e-7;

    const double nm = c.nm;
    const double em = c.em;
    const double emsq = c.emsq;
    const double sinim = c.sinim;
    const double cosim = c.cosim;
    const double inclm = state.inclo;

    state.irez = 0;
    if (nm < 0.0052359877 && nm > 0.0034906585) {
        state.irez = 1;
    }
    if (nm >= 8.26e-3 && nm <= 9.24e-3 && em >= 0.5) {
        state.irez = 2;
    }

    // Solar secular terms
    double ses = c.ss1 * ZNS * c.ss5;
    double sis = c.ss2 * ZNS * (c.sz11 + c.sz13);
    double sls = -ZNS * c.ss3 * (c.sz1 + c.sz3 - 14.0 - 6.0 * emsq);
    double sghs = c.ss4 * ZNS * (c.sz31 + c.sz33 - 6.0);
    double shs = -ZNS * c.ss2 * (c.sz21 + c.sz23);
    if (inclm < 5.2359877e-2 || inclm > PI - 5.2359877e-2) {
        shs = 0.0;
    }
    if (sinim != 0.0) {
        shs = shs / sinim;
    }
    double sgs = sghs - cosim * shs;

    // Lunar secular terms
    state.dedt = ses + c.s1 * ZNL * c.s5;
    state.didt = sis + c.s2 * ZNL * (c.z11 + c.z13);
    state.dmdt = sls - ZNL * c.s3 * (c.z1 + c.z3 - 14.0 - 6.0 * emsq);
    double sghl = c.s4 * ZNL * (c.z31 + c.z33 - 6.0);
    double shll = -ZNL * c.s2 * (c.z21 + c.z23);
    if (inclm < 5.2359877e-2 || inclm > PI - 5.2359877e-2) {
        shll = 0.0;
    }
    state.domdt = sgs + sghl;
    state.dnodt = shs;
    if (sinim != 0.0) {
        state.domdt = state.domdt - cosim / sinim * shll;
        state.dnodt = state.dnodt + shll / sinim;
    }

    if (state.irez == 0) {
        return;
    }

    double theta = std::fmod(state.gsto, TWO_PI);
    double aonv = std::pow(nm / XKE, X2O3);

    // Geopotential resonance for 12 hour orbits
    if (state.irez == 2) {
        double cosisq = cosim * cosim;
        double e = state.ecco;
        double esq = e * e;
        double eoc = e * esq;
        double g201 = -0.306 - (e - 0.64) * 0.440;
        double g211, g310, g322, g410, g422, g520, g521, g532, g533;

        if (e <= 0.65) {
            g211 = 3.616 - 13.2470 * e + 16.2900 * esq;
            g310 = -19.302 + 117.3900 * e - 228.4190 * esq + 156.5910 * eoc;
            g322 = -18.9068 + 109.7927 * e - 214.6334 * esq + 146.5816 * eoc;
            g410 = -41.122 + 242.6940 * e - 471.0940 * esq + 313.9530 * eoc;
            g422 = -146.407 + 841.8800 * e - 1629.014 * esq + 1083.4350 * eoc;
            g520 = -532.114 + 3017.977 * e - 5740.032 * esq + 3708.2760 * eoc;
        } else {
            g211 = -72.099 + 331.819 * e - 508.738 * esq + 266.724 * eoc;
            g310 = -346.844 + 1582.851 * e - 2415.925 * esq + 1246.113 * eoc;
            g322 = -342.585 + 1554.908 * e - 2366.899 * esq + 1215.972 * eoc;
            g410 = -1052.797 + 4758.686 * e - 7193.992 * esq + 3651.957 * eoc;
            g422 = -3581.690 + 16178.110 * e - 24462.770 * esq + 12422.520 * eoc;
            if (e > 0.715) {
                g520 = -5149.66 + 29936.92 * e - 54087.36 * esq + 31324.56 * eoc;
            } else {
                g520 = 1464.74 - 4664.75 * e + 3763.64 * esq;
            }
        }
        if (e < 0.7) {
            g533 = -919.22770 + 4988.6100 * e - 9064.7700 * esq + 5542.21 * eoc;
            g521 = -822.71072 + 4568.6173 * e - 8491.4146 * esq + 5337.524 * eoc;
            g532 = -853.66600 + 4690.2500 * e - 8624.7700 * esq + 5341.4 * eoc;
        } else {
            g533 = -37995.780 + 161616.52 * e - 229838.20 * esq + 109377.94 * eoc;
            g521 = -51752.104 + 218913.95 * e - 309468.16 * esq + 146349.42 * eoc;
            g532 = -40023.880 + 170470.89 * e - 242699.48 * esq + 115605.82 * eoc;
        }

        double sini2 = sinim * sinim;
        double f220 = 0.75 * (1.0 + 2.0 * cosim + cosisq);
        double f221 = 1.5 * sini2;
        double f321 = 1.875 * sinim * (1.0 - 2.0 * cosim - 3.0 * cosisq);
        double f322 = -1.875 * sinim * (1.0 + 2.0 * cosim - 3.0 * cosisq);
        double f441 = 35.0 * sini2 * f220;
        double f442 = 39.3750 * sini2 * sini2;
        double f522 = 9.84375 * sinim * (sini2 * (1.0 - 2.0 * cosim - 5.0 * cosisq) +
                      0.33333333 * (-2.0 + 4.0 * cosim + 6.0 * cosisq));
        double f523 = sinim * (4.92187512 * sini2 * (-2.0 - 4.0 * cosim + 10.0 * cosisq) +
                      6.56250012 * (1.0 + 2.0 * cosim - 3.0 * cosisq));
        double f542 = 29.53125 * sinim * (2.0 - 8.0 * cosim + cosisq *
                      (-12.0 + 8.0 * cosim + 10.0 * cosisq));
        double f543 = 29.53125 * sinim * (-2.0 - 8.0 * cosim + cosisq *
                      (12.0 + 8.0 * cosim - 10.0 * cosisq));

        double xno2 = nm * nm;
        double ainv2 = aonv * aonv;
        double temp1 = 3.0 * xno2 * ainv2;
        double temp = temp1 * root22;
        state.d2201 = temp * f220 * g201;
        state.d2211 = temp * f221 * g211;
        temp1 = temp1 * aonv;
        temp = temp1 * root32;
        state.d3210 = temp * f321 * g310;
        state.d3222 = temp * f322 * g322;
        temp1 = temp1 * aonv;
        temp = 2.0 * temp1 * root44;
        state.d4410 = temp * f441 * g410;
        state.d4422 = temp * f442 * g422;
        temp1 = temp1 * aonv;
        temp = temp1 * root52;
        state.d5220 = temp * f522 * g520;
        state.d5232 = temp * f523 * g532;
        temp = 2.0 * temp1 * root54;
        state.d5421 = temp * f542 * g521;
        state.d5433 = temp * f543 * g533;
        state.xlamo = std::fmod(state.mo + state.nodeo + state.nodeo - theta - theta, TWO_PI);
        state.xfact = state.mdot + state.dmdt + 2.0 * (state.nodedot + state.dnodt - RPTIM) - state.no_unkozai;
    }

    // Synchronous resonance terms
    if (state.irez == 1) {
        double g200 = 1.0 + emsq * (-2.5 + 0.8125 * emsq);
        double g310 = 1.0 + 2.0 * emsq;
        double g300 = 1.0 + emsq * (-6.0 + 6.60937 * emsq);
        double f220 = 0.75 * (1.0 + cosim) * (1.0 + cosim);
        double f311 = 0.9375 * sinim * sinim * (1.0 + 3.0 * cosim) - 0.75 * (1.0 + cosim);
        double f330 = 1.0 + cosim;
        f330 = 1.875 * f330 * f330 * f330;
        state.del1 = 3.0 * nm * nm * aonv * aonv;
        state.del2 = 2.0 * state.del1 * f220 * g200 * q22;
        state.del3 = 3.0 * state.del1 * f330 * g300 * q33 * aonv;
        state.del1 = state.del1 * f311 * g310 * q31 * aonv;
        state.xlamo = std::fmod(state.mo + state.nodeo + state.argpo - theta, TWO_PI);
        state.xfact = state.mdot + xpidot - RPTIM + state.dmdt + state.domdt + state.dnodt - state.no_unkozai;
    }
}

// ============================================================================
// Deep Space Propagation
// ============================================================================

// Secular effects and resonance integration from epoch (dspace)
void deepSpaceSecular(const State& state, double t, MeanElements& m) {
    constexpr double fasx2 = 0.13130908;
    constexpr double fasx4 = 2.8843198;
    constexpr double fasx6 = 0.37448087;
    constexpr double g22 = 5.7686396;
    constexpr double g32 = 0.95240898;
    constexpr double g44 = 1.8014998;
    constexpr double g52 = 1.0508330;
    constexpr double g54 = 4.4108898;
    constexpr double stepp = 720.0;
    constexpr double stepn = -720.0;
    constexpr double step2 = 259200.0;

    double theta = std::fmod(state.gsto + t * RPTIM, TWO_PI);
    m.em += state.dedt * t;
    m.inclm += state.didt * t;
    m.argpm += state.domdt * t;
    m.nodem += state.dnodt * t;
    m.mm += state.dmdt * t;

    if (state.irez == 0) {
        return;
    }

    // The integrator restarts from epoch on every call
    double atime = 0.0;
    double xni = state.no_unkozai;
    double xli = state.xlamo;
    double delt = t > 0.0 ? stepp : stepn;
    double ft = 0.0;
    double xndt = 0.0, xldot = 0.0, xnddt = 0.0;

    for (;;) {
        if (state.irez != 2) {
            // Near-synchronous resonance terms
            xndt = state.del1 * std::sin(xli - fasx2) +
                   state.del2 * std::sin(2.0 * (xli - fasx4)) +
                   state.del3 * std::sin(3.0 * (xli - fasx6));
            xldot = xni + state.xfact;
            xnddt = state.del1 * std::cos(xli - fasx2) +
                    2.0 * state.del2 * std::cos(2.0 * (xli - fasx4)) +
                    3.0 * state.del3 * std::cos(3.0 * (xli - fasx6));
            xnddt = xnddt * xldot;
        } else {
            // Near half-day resonance terms
            double xomi = state.argpo + state.argpdot * atime;
            double x2omi = xomi + xomi;
            double x2li = xli + xli;
            xndt = state.d2201 * std::sin(x2omi + xli - g22) +
                   state.d2211 * std::sin(xli - g22) +
                   state.d3210 * std::sin(xomi + xli - g32) +
                   state.d3222 * std::sin(-xomi + xli - g32) +
                   state.d4410 * std::sin(x2omi + x2li - g44) +
                   state.d4422 * std::sin(x2li - g44) +
                   state.d5220 * std::sin(xomi + xli - g52) +
                   state.d5232 * std::sin(-xomi + xli - g52) +
                   state.d5421 * std::sin(xomi + x2li - g54) +
                   state.d5433 * std::sin(-xomi + x2li - g54);
            xldot = xni + state.xfact;
            xnddt = state.d2201 * std::cos(x2omi + xli - g22) +
                    state.d2211 * std::cos(xli - g22) +
                    state.d3210 * std::cos(xomi + xli - g32) +
                    state.d3222 * std::cos(-xomi + xli - g32) +
                    state.d5220 * std::cos(xomi + xli - g52) +
                    state.d5232 * std::cos(-xomi + xli - g52) +
                    2.0 * (state.d4410 * std::cos(x2omi + x2li - g44) +
                           state.d4422 * std::cos(x2li - g44) +
                           state.d5421 * std::cos(xomi + x2li - g54) +
                           state.d5433 * std::cos(-xomi + x2li - g54));
            xnddt = xnddt * xldot;
        }

        if (std::fabs(t - atime) < stepp) {
            ft = t - atime;
            break;
        }

        xli = xli + xldot * delt + xndt * step2;
        xni = xni + xndt * delt + xnddt * step2;
        atime = atime + delt;
    }

    m.nm = xni + xndt * ft + xnddt * ft * ft * 0.5;
    double xl = xli + xldot * ft + xndt * ft * ft * 0.5;
    if (state.irez != 1) {
        m.mm = xl - 2.0 * m.nodem + 2.0 * theta;
    } else {
        m.mm = xl - m.nodem - m.argpm + theta;
    }
    double dndt = m.nm - state.no_unkozai;
    m.nm = state.no_unkozai + dndt;
}

// Lunar-solar periodics (dpper)
void deepSpacePeriodics(const State& state, double t,
                        double& ep, double& inclp, double& nodep, double& argpp, double& mp) {
    // Solar
    double zm = state.zmos + ZNS * t;
    double zf = zm + 2.0 * ZES * std::sin(zm);
    double sinzf = std::sin(zf);
    double f2 = 0.5 * sinzf * sinzf - 0.25;
    double f3 = -0.5 * sinzf * std::cos(zf);
    double ses = state.se2 * f2 + state.se3 * f3;
    double sis = state.si2 * f2 + state.si3 * f3;
    double sls = state.sl2 * f2 + state.sl3 * f3 + state.sl4 * sinzf;
    double sghs = state.sgh2 * f2 + state.sgh3 * f3 + state.sgh4 * sinzf;
    double shs = state.sh2 * f2 + state.sh3 * f3;

    // Lunar
    zm = state.zmol + ZNL * t;
    zf = zm + 2.0 * ZEL * std::sin(zm);
    sinzf = std::sin(zf);
    f2 = 0.5 * sinzf * sinzf - 0.25;
    f3 = -0.5 * sinzf * std::cos(zf);
    double sel = state.ee2 * f2 + state.e3 * f3;
    double sil = state.xi2 * f2 + state.xi3 * f3;
    double sll = state.xl2 * f2 + state.xl3 * f3 + state.xl4 * sinzf;
    double sghl = state.xgh2 * f2 + state.xgh3 * f3 + state.xgh4 * sinzf;
    double shll = state.xh2 * f2 + state.xh3 * f3;

    double pe = ses + sel - state.peo;
    double pinc = sis + sil - state.pinco;
    double pl = sls + sll - state.plo;
    double pgh = sghs + sghl - state.pgho;
    double ph = shs + shll - state.pho;

    inclp = inclp + pinc;
    ep = ep + pe;
    double sinip = std::sin(inclp);
    double cosip = std::cos(inclp);

    if (inclp >= 0.2) {
        // Apply periodics directly
        ph = ph / sinip;
        pgh = pgh - cosip * ph;
        argpp = argpp + pgh;
        nodep = nodep + ph;
        mp = mp + pl;
    } else {
        // Apply periodics with the Lyddane modification
        double sinop = std::sin(nodep);
        double cosop = std::cos(nodep);
        double alfdp = sinip * sinop;
        double betdp = sinip * cosop;
        double dalf = ph * cosop + pinc * cosip * sinop;
        double dbet = -ph * sinop + pinc * cosip * cosop;
        alfdp = alfdp + dalf;
        betdp = betdp + dbet;
        nodep = std::fmod(nodep, TWO_PI);
        double xls = mp + argpp + cosip * nodep;
        double dls = pl + pgh - pinc * nodep * sinip;
        xls = xls + dls;
        double xnoh = nodep;
        nodep = std::atan2(alfdp, betdp);
        if (std::fabs(xnoh - nodep) > PI) {
            if (nodep < xnoh) {
                nodep = nodep + TWO_PI;
            } else {
                nodep = nodep - TWO_PI;
            }
        }
        mp = mp + pl;
        argpp = xls - mp - cosip * nodep;
    }
}

} // namespace

// Compute Greenwich Sidereal Time at epoch for SGP4
double gstime(double jdut1) {
    double tut1 = (jdut1 - 2451545.0) / 36525.0;
    double temp = -6.2e-6 * tut1 * tut1 * tut1
                  + 0.093104 * tut1 * tut1
                  + (876600.0 * 3600 + 8640184.812866) * tut1
                  + 67310.54841;
    constexpr double DEG_TO_RAD = PI / 180.0;
    temp = std::fmod(temp * DEG_TO_RAD / 240.0, TWO_PI);
    if (temp < 0.0) temp += TWO_PI;
    return temp;
}

// Initialize SGP4 state from orbital elements
void initialize(State& state, const Elements& elements) {
    state = State{};

    if (!std::isfinite(elements.epoch_jd) || !std::isfinite(elements.bstar) ||
        !std::isfinite(elements.inclination) || !std::isfinite(elements.raan) ||
        !std::isfinite(elements.eccentricity) || !std::isfinite(elements.arg_perigee) ||
        !std::isfinite(elements.mean_anomaly) || !std::isfinite(elements.mean_motion)) {
        throw DegenerateOrbit("non-finite orbital element");
    }
    if (elements.eccentricity < 0.0 || elements.eccentricity >= 1.0) {
        throw DegenerateOrbit("eccentricity " + std::to_string(elements.eccentricity) + " outside [0, 1)");
    }
    if (elements.mean_motion <= 0.0) {
        throw DegenerateOrbit("non-positive mean motion");
    }

    state.ecco = elements.eccentricity;
    state.inclo = elements.inclination;
    state.nodeo = elements.raan;
    state.argpo = elements.arg_perigee;
    state.mo = elements.mean_anomaly;
    state.bstar = elements.bstar;
    state.no_kozai = elements.mean_motion;

    // Compute epoch Julian Date (split for precision)
    state.jdsatepoch = std::floor(elements.epoch_jd);
    state.jdsatepochF = elements.epoch_jd - state.jdsatepoch;
    state.gsto = gstime(elements.epoch_jd);

    constexpr double ss = 78.0 / RADIUS_EARTH_KM + 1.0;
    constexpr double qzms2ttemp = (120.0 - 78.0) / RADIUS_EARTH_KM;
    constexpr double qzms2t = qzms2ttemp * qzms2ttemp * qzms2ttemp * qzms2ttemp;
    constexpr double temp4 = 1.5e-12;

    // Recover original mean motion (no_unkozai) and semimajor axis from input
    double eccsq = state.ecco * state.ecco;
    double omeosq = 1.0 - eccsq;
    double rteosq = std::sqrt(omeosq);
    double cosio = std::cos(state.inclo);
    double cosio2 = cosio * cosio;
    double ak = std::pow(XKE / state.no_kozai, X2O3);
    double d1 = 0.75 * J2 * (3.0 * cosio2 - 1.0) / (rteosq * omeosq);
    double del = d1 / (ak * ak);
    double adel = ak * (1.0 - del * del - del * (1.0 / 3.0 + 134.0 * del * del / 81.0));
    del = d1 / (adel * adel);
    state.no_unkozai = state.no_kozai / (1.0 + del);
    if (!(state.no_unkozai > 0.0)) {
        throw DegenerateOrbit("non-positive recovered mean motion");
    }

    double ao = std::pow(XKE / state.no_unkozai, X2O3);
    if (!(ao > 0.0) || !std::isfinite(ao)) {
        throw DegenerateOrbit("non-positive semi-major axis");
    }
    double sinio = std::sin(state.inclo);
    double po = ao * omeosq;
    double con42 = 1.0 - 5.0 * cosio2;
    state.con41 = -con42 - cosio2 - cosio2;
    double posq = po * po;
    double rp = ao * (1.0 - state.ecco);

    state.a = ao;
    state.alta = ao * (1.0 + state.ecco) - 1.0;
    state.altp = ao * (1.0 - state.ecco) - 1.0;

    // Perigee below the surface
    if (rp < 1.0) {
        throw SatelliteDecayed();
    }

    // Use the simplified drag model for perigee below 220 km
    state.isimp = rp < (220.0 / RADIUS_EARTH_KM + 1.0);

    double sfour = ss;
    double qzms24 = qzms2t;
    double perige = (rp - 1.0) * RADIUS_EARTH_KM;
    if (perige < 156.0) {
        sfour = perige - 78.0;
        if (perige < 98.0) {
            sfour = 20.0;
        }
        double qzms24temp = (120.0 - sfour) / RADIUS_EARTH_KM;
        qzms24 = qzms24temp * qzms24temp * qzms24temp * qzms24temp;
        sfour = sfour / RADIUS_EARTH_KM + 1.0;
    }

    double pinvsq = 1.0 / posq;
    double tsi = 1.0 / (ao - sfour);
    state.eta = ao * state.ecco * tsi;
    double etasq = state.eta * state.eta;
    double eeta = state.ecco * state.eta;
    double psisq = std::fabs(1.0 - etasq);
    double coef = qzms24 * std::pow(tsi, 4.0);
    double coef1 = coef / std::pow(psisq, 3.5);
    double cc2 = coef1 * state.no_unkozai * (ao * (1.0 + 1.5 * etasq + eeta * (4.0 + etasq)) +
                 0.375 * J2 * tsi / psisq * state.con41 * (8.0 + 3.0 * etasq * (8.0 + etasq)));
    state.cc1 = state.bstar * cc2;
    double cc3 = 0.0;
    if (state.ecco > 1.0e-4) {
        cc3 = -2.0 * coef * tsi * J3OJ2 * state.no_unkozai * sinio / state.ecco;
    }
    state.x1mth2 = 1.0 - cosio2;
    state.cc4 = 2.0 * state.no_unkozai * coef1 * ao * omeosq *
                (state.eta * (2.0 + 0.5 * etasq) + state.ecco * (0.5 + 2.0 * etasq) -
                 J2 * tsi / (ao * psisq) *
                 (-3.0 * state.con41 * (1.0 - 2.0 * eeta + etasq * (1.5 - 0.5 * eeta)) +
                  0.75 * state.x1mth2 * (2.0 * etasq - eeta * (1.0 + etasq)) * std::cos(2.0 * state.argpo)));
    state.cc5 = 2.0 * coef1 * ao * omeosq * (1.0 + 2.75 * (etasq + eeta) + eeta * etasq);

    double cosio4 = cosio2 * cosio2;
    double temp1 = 1.5 * J2 * pinvsq * state.no_unkozai;
    double temp2 = 0.5 * temp1 * J2 * pinvsq;
    double temp3 = -0.46875 * J4 * pinvsq * pinvsq * state.no_unkozai;
    state.mdot = state.no_unkozai + 0.5 * temp1 * rteosq * state.con41 +
                 0.0625 * temp2 * rteosq * (13.0 - 78.0 * cosio2 + 137.0 * cosio4);
    state.argpdot = -0.5 * temp1 * con42 + 0.0625 * temp2 * (7.0 - 114.0 * cosio2 + 395.0 * cosio4) +
                    temp3 * (3.0 - 36.0 * cosio2 + 49.0 * cosio4);
    double xhdot1 = -temp1 * cosio;
    state.nodedot = xhdot1 + (0.5 * temp2 * (4.0 - 19.0 * cosio2) +
                    2.0 * temp3 * (3.0 - 7.0 * cosio2)) * cosio;
    double xpidot = state.argpdot + state.nodedot;
    state.omgcof = state.bstar * cc3 * std::cos(state.argpo);
    state.xmcof = 0.0;
    if (state.ecco > 1.0e-4) {
        state.xmcof = -X2O3 * coef * state.bstar / eeta;
    }
    state.nodecf = 3.5 * omeosq * xhdot1 * state.cc1;
    state.t2cof = 1.5 * state.cc1;
    if (std::fabs(cosio + 1.0) > 1.5e-12) {
        state.xlcof = -0.25 * J3OJ2 * sinio * (3.0 + 5.0 * cosio) / (1.0 + cosio);
    } else {
        state.xlcof = -0.25 * J3OJ2 * sinio * (3.0 + 5.0 * cosio) / temp4;
    }
    state.aycof = -0.5 * J3OJ2 * sinio;
    double delmotemp = 1.0 + state.eta * std::cos(state.mo);
    state.delmo = delmotemp * delmotemp * delmotemp;
    state.sinmao = std::sin(state.mo);
    state.x7thm1 = 7.0 * cosio2 - 1.0;

    // Deep space (period >= 225 minutes)
    if (TWO_PI / state.no_unkozai >= 225.0) {
        state.method = 'd';
        state.isimp = true;
        DeepSpaceCommon common = deepSpaceCommon(state, elements.epoch_jd - 2433281.5, 0.0);
        deepSpaceInit(state, common, xpidot);
    }

    if (!state.isimp) {
        double cc1sq = state.cc1 * state.cc1;
        state.d2 = 4.0 * ao * tsi * cc1sq;
        double temp = state.d2 * tsi * state.cc1 / 3.0;
        state.d3 = (17.0 * ao + sfour) * temp;
        state.d4 = 0.5 * temp * ao * tsi * (221.0 * ao + 31.0 * sfour) * state.cc1;
        state.t3cof = state.d2 + 2.0 * cc1sq;
        state.t4cof = 0.25 * (3.0 * state.d3 + state.cc1 * (12.0 * state.d2 + 10.0 * cc1sq));
        state.t5cof = 0.2 * (3.0 * state.d4 + 12.0 * state.cc1 * state.d3 +
                      6.0 * state.d2 * state.d2 + 15.0 * cc1sq * (2.0 * state.d2 + cc1sq));
    }

    // Propagate to epoch once so invalid element sets fail here
    propagate(state, 0.0);
}

// Propagate to a time relative to epoch (minutes)
double solveKepler(double u, double axnl, double aynl, int maxIterations) {
    double eo1 = u;
    double tem5 = 9999.9;
    int iterations = 0;
    while (std::fabs(tem5) >= KEPLER_TOLERANCE) {
        if (iterations++ >= maxIterations) {
            throw PropagationDiverged("Kepler's equation did not converge after " +
                                      std::to_string(maxIterations) + " iterations");
        }
        double sineo1 = std::sin(eo1);
        double coseo1 = std::cos(eo1);
        tem5 = 1.0 - coseo1 * axnl - sineo1 * aynl;
        tem5 = (u - aynl * coseo1 + axnl * sineo1 - eo1) / tem5;
        if (!std::isfinite(tem5)) {
            throw PropagationDiverged("Kepler's equation produced a non-finite step");
        }
        if (std::fabs(tem5) >= 0.95) {
            tem5 = tem5 > 0.0 ? 0.95 : -0.95;
        }
        eo1 = eo1 + tem5;
    }
    return eo1;
}

Result propagate(const State& state, double tsince) {
    constexpr double temp4 = 1.5e-12;
    const double t = tsince;

    // Secular gravity and atmospheric drag
    double xmdf = state.mo + state.mdot * t;
    double argpdf = state.argpo + state.argpdot * t;
    double nodedf = state.nodeo + state.nodedot * t;
    double t2 = t * t;

    MeanElements m{};
    m.argpm = argpdf;
    m.mm = xmdf;
    m.nodem = nodedf + state.nodecf * t2;
    double tempa = 1.0 - state.cc1 * t;
    double tempe = state.bstar * state.cc4 * t;
    double templ = state.t2cof * t2;

    if (!state.isimp) {
        double delomg = state.omgcof * t;
        double delmtemp = 1.0 + state.eta * std::cos(xmdf);
        double delm = state.xmcof * (delmtemp * delmtemp * delmtemp - state.delmo);
        double temp = delomg + delm;
        m.mm = xmdf + temp;
        m.argpm = argpdf - temp;
        double t3 = t2 * t;
        double t4 = t3 * t;
        tempa = tempa - state.d2 * t2 - state.d3 * t3 - state.d4 * t4;
        tempe = tempe + state.bstar * state.cc5 * (std::sin(m.mm) - state.sinmao);
        templ = templ + state.t3cof * t3 + t4 * (state.t4cof + t * state.t5cof);
    }

    m.nm = state.no_unkozai;
    m.em = state.ecco;
    m.inclm = state.inclo;
    if (state.method == 'd') {
        deepSpaceSecular(state, t, m);
    }

    if (m.nm <= 0.0) {
        throw DegenerateOrbit("mean motion fell below zero");
    }

    double am = std::pow(XKE / m.nm, X2O3) * tempa * tempa;
    m.nm = XKE / std::pow(am, 1.5);
    m.em = m.em - tempe;

    if (m.em >= 1.0 || m.em < -0.001) {
        throw DegenerateOrbit("mean eccentricity " + std::to_string(m.em) + " out of range");
    }
    if (m.em < 1.0e-6) {
        m.em = 1.0e-6;
    }

    m.mm = m.mm + state.no_unkozai * templ;
    double xlm = m.mm + m.argpm + m.nodem;
    m.nodem = std::fmod(m.nodem, TWO_PI);
    m.argpm = std::fmod(m.argpm, TWO_PI);
    xlm = std::fmod(xlm, TWO_PI);
    m.mm = std::fmod(xlm - m.argpm - m.nodem, TWO_PI);

    // Lunar-solar periodics
    double ep = m.em;
    double xincp = m.inclm;
    double argpp = m.argpm;
    double nodep = m.nodem;
    double mp = m.mm;
    double sinip = std::sin(xincp);
    double cosip = std::cos(xincp);
    double aycof = state.aycof;
    double xlcof = state.xlcof;

    if (state.method == 'd') {
        deepSpacePeriodics(state, t, ep, xincp, nodep, argpp, mp);
        if (xincp < 0.0) {
            xincp = -xincp;
            nodep = nodep + PI;
            argpp = argpp - PI;
        }
        if (ep < 0.0 || ep > 1.0) {
            throw DegenerateOrbit("perturbed eccentricity " + std::to_string(ep) + " out of range");
        }

        sinip = std::sin(xincp);
        cosip = std::cos(xincp);
        aycof = -0.5 * J3OJ2 * sinip;
        if (std::fabs(cosip + 1.0) > 1.5e-12) {
            xlcof = -0.25 * J3OJ2 * sinip * (3.0 + 5.0 * cosip) / (1.0 + cosip);
        } else {
            xlcof = -0.25 * J3OJ2 * sinip * (3.0 + 5.0 * cosip) / temp4;
        }
    }

    // Long period periodics
    double axnl = ep * std::cos(argpp);
    double temp = 1.0 / (am * (1.0 - ep * ep));
    double aynl = ep * std::sin(argpp) + temp * aycof;
    double xl = mp + argpp + nodep + temp * xlcof * axnl;

    // Solve Kepler's equation
    double eo1 = solveKepler(std::fmod(xl - nodep, TWO_PI), axnl, aynl);
    double sineo1 = std::sin(eo1);
    double coseo1 = std::cos(eo1);

    // Short period preliminary quantities
    double ecose = axnl * coseo1 + aynl * sineo1;
    double esine = axnl * sineo1 - aynl * coseo1;
    double el2 = axnl * axnl + aynl * aynl;
    double pl = am * (1.0 - el2);
    if (pl < 0.0) {
        throw DegenerateOrbit("semi-latus rectum is negative");
    }

    double rl = am * (1.0 - ecose);
    double rdotl = std::sqrt(am) * esine / rl;
    double rvdotl = std::sqrt(pl) / rl;
    double betal = std::sqrt(1.0 - el2);
    temp = esine / (1.0 + betal);
    double sinu = am / rl * (sineo1 - aynl - axnl * temp);
    double cosu = am / rl * (coseo1 - axnl + aynl * temp);
    double su = std::atan2(sinu, cosu);
    double sin2u = (cosu + cosu) * sinu;
    double cos2u = 1.0 - 2.0 * sinu * sinu;
    temp = 1.0 / pl;
    double temp1 = 0.5 * J2 * temp;
    double temp2 = temp1 * temp;

    double con41 = state.con41;
    double x1mth2 = state.x1mth2;
    double x7thm1 = state.x7thm1;
    if (state.method == 'd') {
        double cosisq = cosip * cosip;
        con41 = 3.0 * cosisq - 1.0;
        x1mth2 = 1.0 - cosisq;
        x7thm1 = 7.0 * cosisq - 1.0;
    }

    // Update for short period periodics
    double mrt = rl * (1.0 - 1.5 * temp2 * betal * con41) + 0.5 * temp1 * x1mth2 * cos2u;
    su = su - 0.25 * temp2 * x7thm1 * sin2u;
    double xnode = nodep + 1.5 * temp2 * cosip * sin2u;
    double xinc = xincp + 1.5 * temp2 * cosip * sinip * cos2u;
    double mvt = rdotl - m.nm * temp1 * x1mth2 * sin2u / XKE;
    double rvdot = rvdotl + m.nm * temp1 * (x1mth2 * cos2u + 1.5 * con41) / XKE;

    // Orientation vectors
    double sinsu = std::sin(su);
    double cossu = std::cos(su);
    double snod = std::sin(xnode);
    double cnod = std::cos(xnode);
    double sini = std::sin(xinc);
    double cosi = std::cos(xinc);
    double xmx = -snod * cosi;
    double xmy = cnod * cosi;
    double ux = xmx * sinsu + cnod * cossu;
    double uy = xmy * sinsu + snod * cossu;
    double uz = sini * sinsu;
    double vx = xmx * cossu - cnod * sinsu;
    double vy = xmy * cossu - snod * sinsu;
    double vz = sini * cossu;

    if (mrt < 1.0) {
        throw SatelliteDecayed();
    }

    Result result;
    result.r[0] = mrt * ux * RADIUS_EARTH_KM;
    result.r[1] = mrt * uy * RADIUS_EARTH_KM;
    result.r[2] = mrt * uz * RADIUS_EARTH_KM;
    result.v[0] = (mvt * ux + rvdot * vx) * VKMPERSEC;
    result.v[1] = (mvt * uy + rvdot * vy) * VKMPERSEC;
    result.v[2] = (mvt * uz + rvdot * vz) * VKMPERSEC;
    return result;
}

} // namespace groundtrack::sgp4
