// Copyright (c) 2025-2026, Brandon Lehmann
//
// Redistribution and use in source and binary forms, with or without modification, are
// permitted provided that the following conditions are met:
//
// 1. Redistributions of source code must retain the above copyright notice, this list of
//    conditions and the following disclaimer.
//
// 2. Redistributions in binary form must reproduce the above copyright notice, this list
//    of conditions and the following disclaimer in the documentation and/or other
//    materials provided with the distribution.
//
// 3. Neither the name of the copyright holder nor the names of its contributors may be
//    used to endorse or promote products derived from this software without specific
//    prior written permission.
//
// THIS SOFTWARE IS PROVIDED BY THE COPYRIGHT HOLDERS AND CONTRIBUTORS "AS IS" AND ANY
// EXPRESS OR IMPLIED WARRANTIES, INCLUDING, BUT NOT LIMITED TO, THE IMPLIED WARRANTIES OF
// MERCHANTABILITY AND FITNESS FOR A PARTICULAR PURPOSE ARE DISCLAIMED. IN NO EVENT SHALL
// THE COPYRIGHT HOLDER OR CONTRIBUTORS BE LIABLE FOR ANY DIRECT, INDIRECT, INCIDENTAL,
// SPECIAL, EXEMPLARY, OR CONSEQUENTIAL DAMAGES (INCLUDING, BUT NOT LIMITED TO,
// PROCUREMENT OF SUBSTITUTE GOODS OR SERVICES; LOSS OF USE, DATA, OR PROFITS; OR BUSINESS
// INTERRUPTION) HOWEVER CAUSED AND ON ANY THEORY OF LIABILITY, WHETHER IN CONTRACT,
// STRICT LIABILITY, OR TORT (INCLUDING NEGLIGENCE OR OTHERWISE) ARISING IN ANY WAY OUT OF
// THE USE OF THIS SOFTWARE, EVEN IF ADVISED OF THE POSSIBILITY OF SUCH DAMAGE.

#include "edwards25519.h"

#include <atomic>
#include <cstdint>
#include <cstdlib>
#include <cstring>
#include <iomanip>
#include <iostream>
#include <optional>
#include <sstream>
#include <string>
#include <thread>
#include <vector>

using namespace edwards25519;

/* ======================================================================
 * Test framework
 * ====================================================================== */

static int tests_run = 0;
static int tests_passed = 0;
static int tests_failed = 0;
static bool quiet_mode = false;
static uint64_t global_seed = 0ULL;

static std::string hex(const unsigned char *data, size_t len)
{
    std::ostringstream oss;
    for (size_t i = 0; i < len; ++i)
        oss << std::hex << std::setfill('0') << std::setw(2) << (int)data[i];
    return oss.str();
}

static bool check_bytes(const char *test_name, const unsigned char *expected, const unsigned char *actual, size_t len)
{
    ++tests_run;
    if (std::memcmp(expected, actual, len) == 0)
    {
        ++tests_passed;
        if (!quiet_mode)
            std::cout << "  PASS: " << test_name << std::endl;
        return true;
    }
    else
    {
        ++tests_failed;
        std::cout << "  FAIL: " << test_name << std::endl;
        std::cout << "    expected: " << hex(expected, len) << std::endl;
        std::cout << "    actual:   " << hex(actual, len) << std::endl;
        return false;
    }
}

static bool check_true(const char *test_name, bool condition)
{
    ++tests_run;
    if (condition)
    {
        ++tests_passed;
        if (!quiet_mode)
            std::cout << "  PASS: " << test_name << std::endl;
        return true;
    }
    else
    {
        ++tests_failed;
        std::cout << "  FAIL: " << test_name << std::endl;
        return false;
    }
}

/* ======================================================================
 * PRNG: xoshiro256** with splitmix64 seeding
 * ====================================================================== */

struct xoshiro256ss
{
    uint64_t s[4];

    static uint64_t splitmix64(uint64_t &state)
    {
        uint64_t z = (state += 0x9e3779b97f4a7c15ULL);
        z = (z ^ (z >> 30)) * 0xbf58476d1ce4e5b9ULL;
        z = (z ^ (z >> 27)) * 0x94d049bb133111ebULL;
        return z ^ (z >> 31);
    }

    void seed(uint64_t seed_val)
    {
        uint64_t sm = seed_val;
        s[0] = splitmix64(sm);
        s[1] = splitmix64(sm);
        s[2] = splitmix64(sm);
        s[3] = splitmix64(sm);
    }

    static uint64_t rotl(uint64_t x, int k)
    {
        return (x << k) | (x >> (64 - k));
    }

    uint64_t next()
    {
        const uint64_t result = rotl(s[1] * 5, 7) * 9;
        const uint64_t t = s[1] << 17;
        s[2] ^= s[0];
        s[3] ^= s[1];
        s[1] ^= s[2];
        s[0] ^= s[3];
        s[2] ^= t;
        s[3] = rotl(s[3], 45);
        return result;
    }

    void fill_bytes(uint8_t *buf, size_t len)
    {
        size_t i = 0;
        while (i + 8 <= len)
        {
            uint64_t v = next();
            std::memcpy(buf + i, &v, 8);
            i += 8;
        }
        if (i < len)
        {
            uint64_t v = next();
            std::memcpy(buf + i, &v, len - i);
        }
    }
};

/* ======================================================================
 * Random generation helpers
 * ====================================================================== */

static Scalar random_scalar(xoshiro256ss &rng)
{
    uint8_t wide[64];
    rng.fill_bytes(wide, 64);
    return Scalar::reduce_wide(wide);
}

static EdwardsPoint random_point(xoshiro256ss &rng)
{
    return EdwardsPoint::basepoint().scalar_mul_vartime(random_scalar(rng));
}

static void random_fe(fp_fe out, xoshiro256ss &rng)
{
    uint8_t bytes[32];
    rng.fill_bytes(bytes, 32);
    fp_frombytes(out, bytes);
}

/* Compare two points by serialized bytes */
static bool points_equal(const EdwardsPoint &a, const EdwardsPoint &b)
{
    auto ab = a.to_bytes();
    auto bb = b.to_bytes();
    return std::memcmp(ab.data(), bb.data(), 32) == 0;
}

static EdwardsPoint naive_msm(const std::vector<Scalar> &scalars, const std::vector<EdwardsPoint> &points)
{
    auto acc = EdwardsPoint::identity();
    for (size_t j = 0; j < scalars.size(); j++)
        acc = acc + points[j].scalar_mul_vartime(scalars[j]);
    return acc;
}

/* ======================================================================
 * 1. fuzz_field_arithmetic
 * ====================================================================== */

static void fuzz_field_arithmetic()
{
    std::cout << std::endl << "=== Fuzz: Field Arithmetic ===" << std::endl;
    xoshiro256ss rng;
    rng.seed(global_seed + 1);

    for (int i = 0; i < 200; i++)
    {
        std::string label = "fp[" + std::to_string(i) + "]";

        fp_fe a, b, c, lhs, rhs, t;
        random_fe(a, rng);
        random_fe(b, rng);
        random_fe(c, rng);

        /* a * (b + c) == a*b + a*c */
        fp_add(t, b, c);
        fp_mul(lhs, a, t);
        fp_mul(t, a, b);
        fp_mul(rhs, a, c);
        fp_add(rhs, rhs, t);
        check_true((label + " distributive").c_str(), fp_equal(lhs, rhs) != 0);

        /* (a - b) + b == a */
        fp_sub(t, a, b);
        fp_add(t, t, b);
        check_true((label + " sub/add").c_str(), fp_equal(t, a) != 0);

        /* a * a^-1 == 1 */
        if (fp_isnonzero(a))
        {
            fp_fe one;
            fp_1(one);
            fp_invert(t, a);
            fp_mul(t, t, a);
            check_true((label + " invert").c_str(), fp_equal(t, one) != 0);
        }

        /* tobytes is canonical: frombytes(tobytes(x)) re-encodes identically */
        unsigned char enc1[32], enc2[32];
        fp_tobytes(enc1, a);
        fp_frombytes(t, enc1);
        fp_tobytes(enc2, t);
        check_bytes((label + " encoding stable").c_str(), enc1, enc2, 32);
        check_true((label + " top bit clear").c_str(), (enc1[31] & 0x80) == 0);
    }
}

/* ======================================================================
 * 2. fuzz_sqrt_ratio
 * ====================================================================== */

static void fuzz_sqrt_ratio()
{
    std::cout << std::endl << "=== Fuzz: sqrt_ratio ===" << std::endl;
    xoshiro256ss rng;
    rng.seed(global_seed + 2);

    fp_fe two;
    fp_1(two);
    fp_add(two, two, two);

    for (int i = 0; i < 200; i++)
    {
        std::string label = "sqrt_ratio[" + std::to_string(i) + "]";

        fp_fe x, v, u, r, check;
        random_fe(x, rng);
        random_fe(v, rng);
        if (!fp_isnonzero(v) || !fp_isnonzero(x))
            continue;

        /* u = x^2 * v is a square ratio */
        fp_sq(u, x);
        fp_mul(u, u, v);
        check_true((label + " square found").c_str(), fp_sqrt_ratio(r, u, v) == 0);
        fp_sq(check, r);
        fp_mul(check, check, v);
        check_true((label + " r^2 * v == u").c_str(), fp_equal(check, u) != 0);
        check_true((label + " root non-negative").c_str(), fp_isnegative(r) == 0);

        /* 2 is a non-square mod p, so 2 * x^2 * v / v has no root */
        fp_mul(u, u, two);
        check_true((label + " non-square rejected").c_str(), fp_sqrt_ratio(r, u, v) == -1);

        fp_fe zero;
        fp_0(zero);
        check_true((label + " v == 0 rejected").c_str(), fp_sqrt_ratio(r, u, zero) == -1);
    }
}

/* ======================================================================
 * 3. fuzz_scalar_arithmetic
 * ====================================================================== */

static void fuzz_scalar_arithmetic()
{
    std::cout << std::endl << "=== Fuzz: Scalar Arithmetic ===" << std::endl;
    xoshiro256ss rng;
    rng.seed(global_seed + 3);

    for (int i = 0; i < 250; i++)
    {
        std::string label = "scalar[" + std::to_string(i) + "]";

        auto a = random_scalar(rng);
        auto b = random_scalar(rng);
        auto c = random_scalar(rng);

        check_true((label + " commutative_add").c_str(), a + b == b + a);
        check_true((label + " commutative_mul").c_str(), a * b == b * a);
        check_true((label + " distributive").c_str(), a * (b + c) == a * b + a * c);
        check_true((label + " sub/add").c_str(), (a - b) + b == a);
        check_true((label + " neg").c_str(), (a + (-a)).is_zero());
        check_true((label + " sq").c_str(), a.sq() == a * a);

        auto inv = a.invert();
        check_true((label + " invert").c_str(), inv.has_value() && (*inv * a) == Scalar::one());

        /* canonical round trip */
        auto bytes = a.to_bytes();
        auto decoded = Scalar::from_canonical_bytes(bytes.data());
        check_true((label + " canonical roundtrip").c_str(), decoded.has_value() && *decoded == a);

        /* from_bytes_mod_order agrees with reduce_wide on a zero-extended input */
        uint8_t raw[32], wide[64] = {0};
        rng.fill_bytes(raw, 32);
        std::memcpy(wide, raw, 32);
        check_true(
            (label + " mod_order == reduce_wide").c_str(),
            Scalar::from_bytes_mod_order(raw) == Scalar::reduce_wide(wide));
    }
}

/* ======================================================================
 * 4. fuzz_recoding
 * ====================================================================== */

static void fuzz_recoding()
{
    std::cout << std::endl << "=== Fuzz: Digit Expansions ===" << std::endl;
    xoshiro256ss rng;
    rng.seed(global_seed + 4);

    for (int i = 0; i < 100; i++)
    {
        std::string label = "recode[" + std::to_string(i) + "]";

        auto s = random_scalar(rng);

        /* determinism */
        check_true((label + " radix16 deterministic").c_str(), s.as_radix_16() == s.as_radix_16());
        check_true((label + " naf deterministic").c_str(), s.non_adjacent_form(5) == s.non_adjacent_form(5));

        /* radix-16 evaluated with Horner's rule */
        const auto digits = s.as_radix_16();
        const auto sixteen = Scalar::from_u64(16);
        auto acc = Scalar::zero();
        bool in_range = true;
        for (int k = 63; k >= 0; k--)
        {
            const int d = digits[k];
            in_range = in_range && d >= -7 && d <= 8;
            acc = acc * sixteen + (d >= 0 ? Scalar::from_u64((uint64_t)d) : -Scalar::from_u64((uint64_t)-d));
        }
        check_true((label + " radix16 range").c_str(), in_range);
        check_true((label + " radix16 value").c_str(), acc == s);

        const int w = 2 + (int)(rng.next() % 7);
        const auto naf = s.non_adjacent_form(w);
        const auto two = Scalar::from_u64(2);
        acc = Scalar::zero();
        for (int k = 255; k >= 0; k--)
        {
            const int d = naf[k];
            acc = acc * two + (d >= 0 ? Scalar::from_u64((uint64_t)d) : -Scalar::from_u64((uint64_t)-d));
        }
        check_true((label + " naf value").c_str(), acc == s);
    }
}

/* ======================================================================
 * 5. fuzz_point_arithmetic
 * ====================================================================== */

static void fuzz_point_arithmetic()
{
    std::cout << std::endl << "=== Fuzz: Point Arithmetic ===" << std::endl;
    xoshiro256ss rng;
    rng.seed(global_seed + 5);

    for (int i = 0; i < 200; i++)
    {
        std::string label = "point[" + std::to_string(i) + "]";

        auto P = random_point(rng);
        auto Q = random_point(rng);
        auto R = random_point(rng);

        check_true((label + " on_curve").c_str(), P.is_on_curve());
        check_true((label + " identity").c_str(), points_equal(P + EdwardsPoint::identity(), P));
        check_true((label + " commutative").c_str(), points_equal(P + Q, Q + P));
        check_true((label + " associative").c_str(), points_equal((P + Q) + R, P + (Q + R)));
        check_true((label + " dbl").c_str(), points_equal(P.dbl(), P + P));
        check_true((label + " inverse").c_str(), (P - P).is_identity());
        check_true((label + " sub").c_str(), points_equal((P - Q) + Q, P));
        check_true((label + " equality").c_str(), (P + Q) == (Q + P) && P != P.dbl());
        check_true((label + " sum on_curve").c_str(), (P + Q).is_on_curve());

        /* prime-order points are unaffected by the cofactor apart from the factor 8 */
        check_true(
            (label + " cofactor").c_str(), points_equal(P.mul_by_cofactor(), P.scalar_mul_vartime(Scalar::from_u64(8))));
    }
}

/* ======================================================================
 * 6. fuzz_serialization_roundtrip
 * ====================================================================== */

static void fuzz_serialization_roundtrip()
{
    std::cout << std::endl << "=== Fuzz: Serialization Roundtrip ===" << std::endl;
    xoshiro256ss rng;
    rng.seed(global_seed + 6);

    for (int i = 0; i < 200; i++)
    {
        std::string label = "codec[" + std::to_string(i) + "]";

        auto P = random_point(rng);
        auto bytes = compress(P);
        auto decoded = decompress(bytes);
        check_true((label + " decodes").c_str(), decoded.has_value());
        if (decoded)
        {
            check_true((label + " equal").c_str(), *decoded == P);
            auto again = decoded->to_bytes();
            check_bytes((label + " re-encodes").c_str(), bytes.data(), again.data(), 32);
        }
    }

    /* arbitrary bytes: either decode and re-encode identically, or fail with a known error */
    int decoded_count = 0;
    for (int i = 0; i < 500; i++)
    {
        std::string label = "random_bytes[" + std::to_string(i) + "]";

        CompressedPoint bytes;
        rng.fill_bytes(bytes.data(), 32);

        DecodeError error = DecodeError::InvalidEncoding;
        auto first = EdwardsPoint::from_bytes(bytes.data(), error);
        auto second = EdwardsPoint::from_bytes(bytes.data());
        check_true((label + " deterministic").c_str(), first.has_value() == second.has_value());

        if (first)
        {
            decoded_count++;
            auto again = first->to_bytes();
            check_bytes((label + " canonical re-encode").c_str(), bytes.data(), again.data(), 32);
            check_true((label + " on_curve").c_str(), first->is_on_curve());
        }
        else
        {
            check_true(
                (label + " known error").c_str(),
                error == DecodeError::InvalidEncoding || error == DecodeError::NotOnCurve);
        }
    }

    /* about half of all y-values are on the curve */
    check_true("random_bytes some decoded", decoded_count > 0);
}

/* ======================================================================
 * 7. fuzz_scalarmul_consistency
 * ====================================================================== */

static void fuzz_scalarmul_consistency()
{
    std::cout << std::endl << "=== Fuzz: ScalarMul Consistency ===" << std::endl;
    xoshiro256ss rng;
    rng.seed(global_seed + 7);

    for (int i = 0; i < 150; i++)
    {
        std::string label = "sm[" + std::to_string(i) + "]";

        auto P = random_point(rng);
        auto a = random_scalar(rng);
        auto b = random_scalar(rng);

        /* CT vs vartime */
        check_true((label + " ct==vt").c_str(), points_equal(P.scalar_mul(a), P.scalar_mul_vartime(a)));
        check_true((label + " free==member").c_str(), points_equal(scalar_mul(a, P), P.scalar_mul(a)));
        /* Linearity: P*(a+b) == P*a + P*b */
        auto lhs = P.scalar_mul_vartime(a + b);
        auto rhs = P.scalar_mul(a) + P.scalar_mul(b);
        check_true((label + " linear").c_str(), points_equal(lhs, rhs));
        /* Composition: (a*b)*B == a*(b*B) */
        auto B = EdwardsPoint::basepoint();
        auto lhs2 = B.scalar_mul_vartime(a * b);
        auto rhs2 = B.scalar_mul_vartime(b).scalar_mul_vartime(a);
        check_true((label + " compose").c_str(), points_equal(lhs2, rhs2));
        /* (-a)*P == -(a*P) */
        check_true((label + " negate").c_str(), points_equal(P.scalar_mul(-a), -P.scalar_mul(a)));
        check_true((label + " zero").c_str(), P.scalar_mul(Scalar::zero()).is_identity());
        check_true((label + " one").c_str(), points_equal(P.scalar_mul(Scalar::one()), P));
    }
}

/* ======================================================================
 * 8. fuzz_msm_random
 * ====================================================================== */

static void fuzz_msm_random()
{
    std::cout << std::endl << "=== Fuzz: MSM Random ===" << std::endl;
    xoshiro256ss rng;
    rng.seed(global_seed + 8);

    const int sizes[] = {1, 2, 3, 8, 16, 33, 64};

    for (int n : sizes)
    {
        for (int trial = 0; trial < 4; trial++)
        {
            std::string label = "msm[n=" + std::to_string(n) + ",t=" + std::to_string(trial) + "]";

            std::vector<Scalar> scalars(n);
            std::vector<EdwardsPoint> points(n);
            for (int j = 0; j < n; j++)
            {
                scalars[j] = random_scalar(rng);
                points[j] = random_point(rng);
            }

            auto naive = naive_msm(scalars, points);
            check_true((label + " vartime").c_str(), points_equal(vartime_multiscalar_mul(scalars, points), naive));
            check_true((label + " ct").c_str(), points_equal(multiscalar_mul(scalars, points), naive));
            check_true(
                (label + " pippenger").c_str(),
                points_equal(vartime_multiscalar_mul(MsmAlgorithm::Pippenger, scalars, points), naive));
        }
    }
}

/* ======================================================================
 * 9. fuzz_msm_threshold: Straus and Pippenger around the dispatch boundary
 * ====================================================================== */

static void fuzz_msm_threshold()
{
    std::cout << std::endl << "=== Fuzz: MSM Dispatch Threshold ===" << std::endl;
    xoshiro256ss rng;
    rng.seed(global_seed + 9);

    const int sizes[] = {188, 189, 190, 191, 256, 511, 800};

    for (int n : sizes)
    {
        std::string label = "threshold[n=" + std::to_string(n) + "]";

        std::vector<Scalar> scalars(n);
        std::vector<EdwardsPoint> points(n);
        for (int j = 0; j < n; j++)
        {
            scalars[j] = random_scalar(rng);
            points[j] = random_point(rng);
        }

        auto straus = vartime_multiscalar_mul(MsmAlgorithm::Straus, scalars, points);
        auto pippenger = vartime_multiscalar_mul(MsmAlgorithm::Pippenger, scalars, points);
        auto dispatched = vartime_multiscalar_mul(scalars, points);
        auto ct = multiscalar_mul(scalars, points);

        check_true(
            (label + " selection").c_str(),
            msm_algorithm((size_t)n) == (n < 190 ? MsmAlgorithm::Straus : MsmAlgorithm::Pippenger));
        check_true((label + " straus==pippenger").c_str(), points_equal(straus, pippenger));
        check_true((label + " dispatched").c_str(), points_equal(dispatched, straus));
        check_true((label + " ct==vt").c_str(), points_equal(ct, straus));
    }
}

/* ======================================================================
 * 10. fuzz_msm_sparse: zero scalars, identities, duplicates, cancellation
 * ====================================================================== */

static void fuzz_msm_sparse()
{
    std::cout << std::endl << "=== Fuzz: MSM Sparse ===" << std::endl;
    xoshiro256ss rng;
    rng.seed(global_seed + 10);

    const int sizes[] = {8, 200};

    for (int n : sizes)
    {
        for (int trial = 0; trial < 4; trial++)
        {
            std::string label = "sparse[n=" + std::to_string(n) + ",t=" + std::to_string(trial) + "]";

            std::vector<Scalar> scalars(n);
            std::vector<EdwardsPoint> points(n);
            for (int j = 0; j < n; j++)
            {
                points[j] = (j % 5 == 1) ? EdwardsPoint::identity() : random_point(rng);
                scalars[j] = (j % 3 == 0) ? Scalar::zero() : random_scalar(rng);
            }
            /* duplicate point with a different scalar */
            points[n - 1] = points[n - 2];

            auto naive = naive_msm(scalars, points);
            check_true((label + " vartime").c_str(), points_equal(vartime_multiscalar_mul(scalars, points), naive));
            check_true((label + " ct").c_str(), points_equal(multiscalar_mul(scalars, points), naive));
            check_true(
                (label + " straus").c_str(),
                points_equal(vartime_multiscalar_mul(MsmAlgorithm::Straus, scalars, points), naive));
        }

        /* s*P + s*(-P) cancels */
        std::string label = "cancel[n=" + std::to_string(n) + "]";
        std::vector<Scalar> scalars(n);
        std::vector<EdwardsPoint> points(n);
        for (int j = 0; j + 1 < n; j += 2)
        {
            scalars[j] = scalars[j + 1] = random_scalar(rng);
            points[j] = random_point(rng);
            points[j + 1] = -points[j];
        }
        check_true((label + " vartime").c_str(), vartime_multiscalar_mul(scalars, points).is_identity());
        check_true((label + " ct").c_str(), multiscalar_mul(scalars, points).is_identity());

        /* all scalars zero */
        label = "all_zero[n=" + std::to_string(n) + "]";
        std::vector<Scalar> zeros(n);
        check_true((label + " vartime").c_str(), vartime_multiscalar_mul(zeros, points).is_identity());
        check_true((label + " ct").c_str(), multiscalar_mul(zeros, points).is_identity());

        /* every scalar L - 1 */
        label = "minus_one[n=" + std::to_string(n) + "]";
        std::vector<Scalar> minus_one(n, -Scalar::one());
        auto expected = EdwardsPoint::identity();
        for (int j = 0; j < n; j++)
            expected = expected - points[j];
        check_true((label + " vartime").c_str(), points_equal(vartime_multiscalar_mul(minus_one, points), expected));
        check_true((label + " ct").c_str(), points_equal(multiscalar_mul(minus_one, points), expected));
    }
}

/* ======================================================================
 * 11. fuzz_optional_contract
 * ====================================================================== */

static void fuzz_optional_contract()
{
    std::cout << std::endl << "=== Fuzz: Optional MSM Contract ===" << std::endl;
    xoshiro256ss rng;
    rng.seed(global_seed + 11);

    const int sizes[] = {1, 5, 190};

    for (int n : sizes)
    {
        for (int trial = 0; trial < 4; trial++)
        {
            std::string label = "optional[n=" + std::to_string(n) + ",t=" + std::to_string(trial) + "]";

            std::vector<Scalar> scalars(n);
            std::vector<EdwardsPoint> points(n);
            std::vector<std::optional<EdwardsPoint>> maybe(n);
            for (int j = 0; j < n; j++)
            {
                scalars[j] = random_scalar(rng);
                points[j] = random_point(rng);
                maybe[j] = points[j];
            }

            auto present = optional_multiscalar_mul(scalars, maybe);
            check_true(
                (label + " all present").c_str(),
                present.has_value() && points_equal(*present, vartime_multiscalar_mul(scalars, points)));

            maybe[rng.next() % (uint64_t)n].reset();
            check_true((label + " one absent").c_str(), !optional_multiscalar_mul(scalars, maybe).has_value());
        }
    }
}

/* ======================================================================
 * 12. fuzz_concurrent_calls: independent calls share only read-only constants
 * ====================================================================== */

static void fuzz_concurrent_calls()
{
    std::cout << std::endl << "=== Fuzz: Concurrent Calls ===" << std::endl;
    xoshiro256ss rng;
    rng.seed(global_seed + 12);

    const int num_threads = 4;
    const int rounds = 8;
    const int sizes[num_threads] = {16, 64, 190, 256};

    std::vector<std::vector<Scalar>> scalars(num_threads);
    std::vector<std::vector<EdwardsPoint>> points(num_threads);
    std::vector<CompressedPoint> expected(num_threads);

    for (int t = 0; t < num_threads; t++)
    {
        scalars[t].resize(sizes[t]);
        points[t].resize(sizes[t]);
        for (int j = 0; j < sizes[t]; j++)
        {
            scalars[t][j] = random_scalar(rng);
            points[t][j] = random_point(rng);
        }
        expected[t] = vartime_multiscalar_mul(scalars[t], points[t]).to_bytes();
    }

    std::vector<std::atomic<int>> mismatches(num_threads);
    std::vector<std::thread> workers;
    for (int t = 0; t < num_threads; t++)
    {
        mismatches[t] = 0;
        workers.emplace_back(
            [&, t]()
            {
                for (int r = 0; r < rounds; r++)
                {
                    const auto vt = vartime_multiscalar_mul(scalars[t], points[t]).to_bytes();
                    const auto ct = multiscalar_mul(scalars[t], points[t]).to_bytes();
                    if (vt != expected[t] || ct != expected[t])
                        mismatches[t]++;
                }
            });
    }

    for (auto &w : workers)
        w.join();

    for (int t = 0; t < num_threads; t++)
    {
        std::string label = "thread[" + std::to_string(t) + ",n=" + std::to_string(sizes[t]) + "]";
        check_true(label.c_str(), mismatches[t] == 0);
    }
}

int main(int argc, char *argv[])
{
    uint64_t seed = 0ULL;

    for (int i = 1; i < argc; i++)
    {
        if (std::strcmp(argv[i], "--quiet") == 0)
        {
            quiet_mode = true;
        }
        else if (std::strcmp(argv[i], "--seed") == 0 && i + 1 < argc)
        {
            seed = std::strtoull(argv[++i], nullptr, 0);
        }
        else
        {
            std::cerr << "Usage: " << argv[0] << " [--quiet] [--seed <N>]" << std::endl;
            return 1;
        }
    }

    std::cout << "edwards25519 Fuzz Tests" << std::endl;
    std::cout << "=======================" << std::endl;
    std::cout << "PRNG seed: 0x" << std::hex << seed << std::dec << std::endl;

    global_seed = seed;

    fuzz_field_arithmetic();
    fuzz_sqrt_ratio();
    fuzz_scalar_arithmetic();
    fuzz_recoding();
    fuzz_point_arithmetic();
    fuzz_serialization_roundtrip();
    fuzz_scalarmul_consistency();
    fuzz_msm_random();
    fuzz_msm_threshold();
    fuzz_msm_sparse();
    fuzz_optional_contract();
    fuzz_concurrent_calls();

    std::cout << std::endl << "=======================" << std::endl;
    std::cout << "Total:  " << tests_run << std::endl;
    std::cout << "Passed: " << tests_passed << std::endl;
    std::cout << "Failed: " << tests_failed << std::endl;

    return tests_failed > 0 ? 1 : 0;
}
