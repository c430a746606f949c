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

#include <cstdint>
#include <cstring>
#include <iomanip>
#include <iostream>
#include <optional>
#include <sstream>
#include <stdexcept>
#include <string>
#include <vector>

#include "le_bytes.h"

#include "fp.h"
#include "fp_frombytes.h"
#include "fp_invert.h"
#include "fp_mul.h"
#include "fp_ops.h"
#include "fp_sq.h"
#include "fp_sqrt_ratio.h"
#include "fp_tobytes.h"
#include "fp_utils.h"

#include "sc.h"
#include "sc_frombytes.h"
#include "sc_invert.h"
#include "sc_mul.h"
#include "sc_ops.h"
#include "sc_recode.h"
#include "sc_tobytes.h"

#include "edwards.h"
#include "edwards_add.h"
#include "edwards_constants.h"
#include "edwards_dbl.h"
#include "edwards_frombytes.h"
#include "edwards_msm.h"
#include "edwards_ops.h"
#include "edwards_scalarmult.h"
#include "edwards_tobytes.h"
#include "edwards_validate.h"

#include "edwards25519_msm.h"
#include "edwards25519_point.h"
#include "edwards25519_scalar.h"

using namespace edwards25519;

static int tests_run = 0;
static int tests_passed = 0;
static int tests_failed = 0;

static std::string hex(const unsigned char *data, size_t len)
{
    std::ostringstream oss;
    for (size_t i = 0; i < len; ++i)
        oss << std::hex << std::setfill('0') << std::setw(2) << (int)data[i];
    return oss.str();
}

static bool check_bytes(const char *test_name, const unsigned char *expected,
    const unsigned char *actual, size_t len)
{
    ++tests_run;
    if (std::memcmp(expected, actual, len) == 0)
    {
        ++tests_passed;
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

static bool check_int(const char *test_name, int expected, int actual)
{
    ++tests_run;
    if (expected == actual)
    {
        ++tests_passed;
        std::cout << "  PASS: " << test_name << std::endl;
        return true;
    }
    else
    {
        ++tests_failed;
        std::cout << "  FAIL: " << test_name << std::endl;
        std::cout << "    expected: " << expected << std::endl;
        std::cout << "    actual:   " << actual << std::endl;
        return false;
    }
}

static bool check_true(const char *test_name, bool condition)
{
    ++tests_run;
    if (condition)
    {
        ++tests_passed;
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

static const unsigned char test_a_bytes[32] = {0xef, 0xcd, 0xab, 0x90, 0x78, 0x56, 0x34, 0x12, 0xbe, 0xba, 0xfe,
    0xca, 0xef, 0xbe, 0xad, 0xde, 0x00, 0x00, 0x00, 0x00, 0x00, 0x00, 0x00, 0x00, 0x00, 0x00, 0x00, 0x00, 0x00, 0x00,
    0x00, 0x00};
static const unsigned char test_b_bytes[32] = {0x08, 0x07, 0x06, 0x05, 0x04, 0x03, 0x02, 0x01, 0x0d, 0xf0, 0xad,
    0xba, 0xce, 0xfa, 0xed, 0xfe, 0x00, 0x00, 0x00, 0x00, 0x00, 0x00, 0x00, 0x00, 0x00, 0x00, 0x00, 0x00, 0x00, 0x00,
    0x00, 0x00};
static const unsigned char one_bytes[32] = {0x01};
static const unsigned char zero_bytes[32] = {0};
static const unsigned char p_bytes[32] = {0xed, 0xff, 0xff, 0xff, 0xff, 0xff, 0xff, 0xff, 0xff, 0xff, 0xff, 0xff,
    0xff, 0xff, 0xff, 0xff, 0xff, 0xff, 0xff, 0xff, 0xff, 0xff, 0xff, 0xff, 0xff, 0xff, 0xff, 0xff, 0xff, 0xff, 0xff,
    0x7f};
static const unsigned char identity_compressed[32] = {0x01};

/* F_p known-answer vectors */
static const unsigned char fp_ab_bytes[32] = {0x8b, 0xf8, 0x99, 0xb6, 0x81, 0xc3, 0x9d, 0x32, 0x37, 0x91, 0x83,
    0xab, 0x63, 0xdf, 0xe3, 0x39, 0x5a, 0xbb, 0x62, 0xcf, 0x01, 0xdb, 0x9b, 0x07, 0x40, 0x05, 0x0f, 0x2e, 0x75,
    0x64, 0xbf, 0x5d};
static const unsigned char fp_asq_bytes[32] = {0x34, 0xa5, 0xf2, 0xa2, 0x09, 0x5f, 0x47, 0xa6, 0x80, 0x23, 0x11,
    0x6b, 0x38, 0x72, 0xb0, 0xef, 0x20, 0x65, 0x11, 0xb6, 0xcc, 0x2e, 0x41, 0xd2, 0x18, 0xfa, 0x92, 0x82, 0x13,
    0xcd, 0xb1, 0x41};
static const unsigned char fp_ainv_bytes[32] = {0x3f, 0x3a, 0x94, 0xed, 0xea, 0xf4, 0x00, 0xef, 0x56, 0x09, 0xc0,
    0x94, 0xeb, 0x93, 0x22, 0xcb, 0x71, 0x87, 0x3d, 0x9b, 0x45, 0x9c, 0xde, 0xf4, 0x0a, 0x20, 0x13, 0xc1, 0xfc,
    0x61, 0x66, 0x25};
static const unsigned char fp_amb_bytes[32] = {0xd4, 0xc6, 0xa5, 0x8b, 0x74, 0x53, 0x32, 0x11, 0xb1, 0xca, 0x50,
    0x10, 0x21, 0xc4, 0xbf, 0xdf, 0xff, 0xff, 0xff, 0xff, 0xff, 0xff, 0xff, 0xff, 0xff, 0xff, 0xff, 0xff, 0xff,
    0xff, 0xff, 0x7f};
static const unsigned char fp_bma_bytes[32] = {0x19, 0x39, 0x5a, 0x74, 0x8b, 0xac, 0xcd, 0xee, 0x4e, 0x35, 0xaf,
    0xef, 0xde, 0x3b, 0x40, 0x20, 0x00, 0x00, 0x00, 0x00, 0x00, 0x00, 0x00, 0x00, 0x00, 0x00, 0x00, 0x00, 0x00,
    0x00, 0x00, 0x00};
static const unsigned char fp_nega_bytes[32] = {0xfe, 0x31, 0x54, 0x6f, 0x87, 0xa9, 0xcb, 0xed, 0x41, 0x45, 0x01,
    0x35, 0x10, 0x41, 0x52, 0x21, 0xff, 0xff, 0xff, 0xff, 0xff, 0xff, 0xff, 0xff, 0xff, 0xff, 0xff, 0xff, 0xff,
    0xff, 0xff, 0x7f};
/* the non-negative square root of -1 */
static const unsigned char fp_sqrt_m1_bytes[32] = {0xb0, 0xa0, 0x0e, 0x4a, 0x27, 0x1b, 0xee, 0xc4, 0x78, 0xe4,
    0x2f, 0xad, 0x06, 0x18, 0x43, 0x2f, 0xa7, 0xd7, 0xfb, 0x3d, 0x99, 0x00, 0x4d, 0x2b, 0x0b, 0xdf, 0xc1, 0x4f,
    0x80, 0x24, 0x83, 0x2b};

/* Scalar known-answer vectors. sa < L before reduction is not required; sb >= 2^253. */
static const unsigned char scalar_a_bytes[32] = {0xef, 0xcd, 0xab, 0x90, 0x78, 0x56, 0x34, 0x12, 0xbe, 0xba, 0xfe,
    0xca, 0xef, 0xbe, 0xad, 0xde, 0x01, 0x02, 0x03, 0x04, 0x05, 0x06, 0x07, 0x08, 0x09, 0x0a, 0x0b, 0x0c, 0x0d,
    0x0e, 0x0f, 0x10};
static const unsigned char scalar_b_bytes[32] = {0x08, 0x07, 0x06, 0x05, 0x04, 0x03, 0x02, 0x01, 0x0d, 0xf0, 0xad,
    0xba, 0xce, 0xfa, 0xed, 0xfe, 0x11, 0x12, 0x13, 0x14, 0x15, 0x16, 0x17, 0x18, 0x19, 0x1a, 0x1b, 0x1c, 0x1d,
    0x1e, 0x1f, 0x20};
static const unsigned char scalar_a_reduced[32] = {0x02, 0xfa, 0xb5, 0x33, 0x5e, 0xf3, 0x21, 0xba, 0xe7, 0x1d,
    0x07, 0x28, 0x11, 0xc5, 0xce, 0xc9, 0x01, 0x02, 0x03, 0x04, 0x05, 0x06, 0x07, 0x08, 0x09, 0x0a, 0x0b, 0x0c,
    0x0d, 0x0e, 0x0f, 0x00};
static const unsigned char sc_ab_bytes[32] = {0xff, 0x46, 0xaf, 0xdb, 0xe0, 0x0d, 0x3a, 0xfe, 0x7e, 0x66, 0x22,
    0x7e, 0x1d, 0xc8, 0x87, 0x16, 0x4f, 0x2c, 0xce, 0xa9, 0xf3, 0x59, 0xeb, 0xa7, 0xed, 0x4d, 0x62, 0xa0, 0x53,
    0x57, 0x7f, 0x06};
static const unsigned char sc_apb_bytes[32] = {0x30, 0x59, 0xd0, 0x7e, 0x2d, 0x30, 0xff, 0x0a, 0x48, 0xd4, 0xc5,
    0x9c, 0x22, 0xcc, 0xfe, 0x9e, 0x13, 0x14, 0x16, 0x18, 0x1a, 0x1c, 0x1e, 0x20, 0x22, 0x24, 0x26, 0x28, 0x2a,
    0x2c, 0x2e, 0x00};
static const unsigned char sc_amb_bytes[32] = {0xc1, 0x6e, 0x91, 0x45, 0xa9, 0x19, 0x57, 0xc1, 0x5d, 0x04, 0x40,
    0x56, 0xde, 0xb7, 0x7d, 0x09, 0xf0, 0xef, 0xef, 0xef, 0xef, 0xef, 0xef, 0xef, 0xef, 0xef, 0xef, 0xef, 0xef,
    0xef, 0xef, 0x0f};
static const unsigned char sc_bma_bytes[32] = {0x2c, 0x65, 0x64, 0x17, 0x71, 0x49, 0xbb, 0x96, 0x78, 0x98, 0xb7,
    0x4c, 0x00, 0x42, 0x61, 0x0b, 0x10, 0x10, 0x10, 0x10, 0x10, 0x10, 0x10, 0x10, 0x10, 0x10, 0x10, 0x10, 0x10,
    0x10, 0x10, 0x00};
static const unsigned char sc_ainv_bytes[32] = {0x5b, 0xdc, 0x93, 0xdb, 0x93, 0x4c, 0x28, 0xeb, 0x4b, 0xcb, 0xa5,
    0x18, 0x95, 0x8e, 0xbd, 0x5c, 0xe0, 0x4a, 0xa3, 0xbf, 0xb9, 0x9a, 0xcb, 0xc8, 0xc5, 0xff, 0x6b, 0x75, 0x74,
    0x26, 0xc9, 0x0b};
/* reduce_wide(00 01 02 ... 3f) */
static const unsigned char sc_wide_bytes[32] = {0x7a, 0x3c, 0x62, 0x82, 0xf0, 0x2d, 0x37, 0xa0, 0x50, 0x23, 0xb6,
    0x0d, 0x54, 0x28, 0xe6, 0xcc, 0x59, 0x61, 0xd4, 0xc3, 0x12, 0x21, 0x93, 0x7a, 0xda, 0xe0, 0xb5, 0x74, 0xe4,
    0xd0, 0x72, 0x05};
/* (2^256 - 1) mod L */
static const unsigned char sc_ff_reduced[32] = {0x1c, 0x95, 0x98, 0x8d, 0x74, 0x31, 0xec, 0xd6, 0x70, 0xcf, 0x7d,
    0x73, 0xf4, 0x5b, 0xef, 0xc6, 0xfe, 0xff, 0xff, 0xff, 0xff, 0xff, 0xff, 0xff, 0xff, 0xff, 0xff, 0xff, 0xff,
    0xff, 0xff, 0x0f};
static const unsigned char sc_l_minus_1[32] = {0xec, 0xd3, 0xf5, 0x5c, 0x1a, 0x63, 0x12, 0x58, 0xd6, 0x9c, 0xf7,
    0xa2, 0xde, 0xf9, 0xde, 0x14, 0x00, 0x00, 0x00, 0x00, 0x00, 0x00, 0x00, 0x00, 0x00, 0x00, 0x00, 0x00, 0x00,
    0x00, 0x00, 0x10};

/* Point known-answer vectors */
static const unsigned char edwards_2b_compressed[32] = {0xc9, 0xa3, 0xf8, 0x6a, 0xae, 0x46, 0x5f, 0x0e, 0x56, 0x51,
    0x38, 0x64, 0x51, 0x0f, 0x39, 0x97, 0x56, 0x1f, 0xa2, 0xc9, 0xe8, 0x5e, 0xa2, 0x1d, 0xc2, 0x29, 0x23, 0x09,
    0xf3, 0xcd, 0x60, 0x22};
static const unsigned char edwards_7b_compressed[32] = {0xb8, 0x62, 0x40, 0x9f, 0xb5, 0xc4, 0xc4, 0x12, 0x3d, 0xf2,
    0xab, 0xf7, 0x46, 0x2b, 0x88, 0xf0, 0x41, 0xad, 0x36, 0xdd, 0x68, 0x64, 0xce, 0x87, 0x2f, 0xd5, 0x47, 0x2b,
    0xe3, 0x63, 0xc5, 0xb1};
static const unsigned char edwards_neg_7b_compressed[32] = {0xb8, 0x62, 0x40, 0x9f, 0xb5, 0xc4, 0xc4, 0x12, 0x3d,
    0xf2, 0xab, 0xf7, 0x46, 0x2b, 0x88, 0xf0, 0x41, 0xad, 0x36, 0xdd, 0x68, 0x64, 0xce, 0x87, 0x2f, 0xd5, 0x47,
    0x2b, 0xe3, 0x63, 0xc5, 0x31};
static const unsigned char edwards_neg_b_compressed[32] = {0x58, 0x66, 0x66, 0x66, 0x66, 0x66, 0x66, 0x66, 0x66,
    0x66, 0x66, 0x66, 0x66, 0x66, 0x66, 0x66, 0x66, 0x66, 0x66, 0x66, 0x66, 0x66, 0x66, 0x66, 0x66, 0x66, 0x66,
    0x66, 0x66, 0x66, 0x66, 0xe6};
/* (scalar_a mod L) * B */
static const unsigned char edwards_sab_compressed[32] = {0xe7, 0xe0, 0x73, 0x06, 0x0a, 0x3e, 0x55, 0xa1, 0xc1, 0x66,
    0xb4, 0x2c, 0xaf, 0x33, 0x5b, 0xfa, 0x0f, 0x2c, 0x79, 0x4b, 0xe1, 0xda, 0xde, 0x4f, 0x8d, 0x03, 0x81, 0x14,
    0x4c, 0xa4, 0x2c, 0x95};
/* a*B + b*(7B) with a = scalar_a mod L, b = scalar_b mod L */
static const unsigned char edwards_msm2_compressed[32] = {0xa1, 0xf6, 0xc4, 0xf7, 0x23, 0xe7, 0x88, 0x8b, 0xc4,
    0x2c, 0xaa, 0x43, 0xcf, 0xfa, 0x6b, 0x02, 0xd8, 0x70, 0xed, 0x56, 0x86, 0x75, 0x5f, 0x4e, 0xdd, 0x3d, 0x9c,
    0x5b, 0xbb, 0x16, 0xa5, 0xfc};

static void test_le_bytes()
{
    std::cout << std::endl << "=== Little-endian byte conversion ===" << std::endl;

    static const unsigned char expected[16] = {0xef, 0xcd, 0xab, 0x89, 0x67, 0x45, 0x23, 0x01, 0x10, 0x32, 0x54,
        0x76, 0x98, 0xba, 0xdc, 0xfe};
    unsigned char buf[16];

    le_store_u16(buf, 0xcdefu);
    check_bytes("store u16", expected, buf, 2);
    check_true("load u16", le_load_u16(expected) == 0xcdefu);

    le_store_u32(buf, 0x89abcdefu);
    check_bytes("store u32", expected, buf, 4);
    check_true("load u32", le_load_u32(expected) == 0x89abcdefu);

    le_store_u64(buf, 0x0123456789abcdefULL);
    check_bytes("store u64", expected, buf, 8);
    check_true("load u64", le_load_u64(expected) == 0x0123456789abcdefULL);

#if EDWARDS25519_HAVE_INT128
    const edwards25519_uint128 v =
        ((edwards25519_uint128)0xfedcba9876543210ULL << 64) | (edwards25519_uint128)0x0123456789abcdefULL;
    le_store_u128(buf, v);
    check_bytes("store u128", expected, buf, 16);
    check_true("load u128", le_load_u128(expected) == v);
#endif
}

static void test_fp()
{
    std::cout << std::endl << "=== F_p arithmetic ===" << std::endl;

    fp_fe a, b, r;
    unsigned char buf[32];
    fp_frombytes(a, test_a_bytes);
    fp_frombytes(b, test_b_bytes);

    fp_mul(r, a, b);
    fp_tobytes(buf, r);
    check_bytes("a * b", fp_ab_bytes, buf, 32);

    fp_sq(r, a);
    fp_tobytes(buf, r);
    check_bytes("a^2", fp_asq_bytes, buf, 32);

    fp_invert(r, a);
    fp_tobytes(buf, r);
    check_bytes("a^-1", fp_ainv_bytes, buf, 32);

    fp_mul(r, r, a);
    fp_tobytes(buf, r);
    check_bytes("a * a^-1 == 1", one_bytes, buf, 32);

    fp_sub(r, a, b);
    fp_tobytes(buf, r);
    check_bytes("a - b (wraps)", fp_amb_bytes, buf, 32);

    fp_sub(r, b, a);
    fp_tobytes(buf, r);
    check_bytes("b - a", fp_bma_bytes, buf, 32);

    fp_neg(r, a);
    fp_tobytes(buf, r);
    check_bytes("-a", fp_nega_bytes, buf, 32);

    fp_add(r, r, a);
    fp_tobytes(buf, r);
    check_bytes("-a + a == 0", zero_bytes, buf, 32);

    fp_sq2(r, a);
    fp_fe t;
    fp_sq(t, a);
    fp_add(t, t, t);
    check_int("sq2(a) == 2 * a^2", 1, fp_equal(r, t));

    /* encoding of p is reduced to zero, p + 1 to one */
    fp_frombytes(r, p_bytes);
    fp_tobytes(buf, r);
    check_bytes("frombytes(p) == 0", zero_bytes, buf, 32);
    check_int("frombytes(p) is zero", 0, fp_isnonzero(r));

    unsigned char p_plus_1[32];
    std::memcpy(p_plus_1, p_bytes, 32);
    p_plus_1[0] = 0xee;
    fp_frombytes(r, p_plus_1);
    fp_tobytes(buf, r);
    check_bytes("frombytes(p + 1) == 1", one_bytes, buf, 32);

    unsigned char high_bit[32] = {0x01};
    high_bit[31] = 0x80;
    fp_frombytes(r, high_bit);
    fp_tobytes(buf, r);
    check_bytes("bit 255 ignored", one_bytes, buf, 32);

    fp_1(r);
    check_int("isnegative(1)", 1, fp_isnegative(r));
    fp_neg(r, r);
    check_int("isnegative(-1)", 0, fp_isnegative(r));
}

static void test_fp_sqrt_ratio()
{
    std::cout << std::endl << "=== F_p sqrt_ratio ===" << std::endl;

    fp_fe u, v, x;
    unsigned char buf[32];

    unsigned char four[32] = {0x04};
    unsigned char two[32] = {0x02};
    fp_frombytes(u, four);
    fp_1(v);
    check_int("sqrt(4/1) exists", 0, fp_sqrt_ratio(x, u, v));
    fp_tobytes(buf, x);
    check_bytes("sqrt(4/1) == 2", two, buf, 32);

    fp_frombytes(u, two);
    check_int("sqrt(2/1) does not exist", -1, fp_sqrt_ratio(x, u, v));

    /* -1 is a square since p = 1 mod 4 */
    fp_1(u);
    fp_neg(u, u);
    check_int("sqrt(-1) exists", 0, fp_sqrt_ratio(x, u, v));
    fp_tobytes(buf, x);
    check_bytes("sqrt(-1) == SQRT_M1 (non-negative)", fp_sqrt_m1_bytes, buf, 32);

    /* 9/4 -> 3/2; check x^2 * v == u and the non-negative root */
    unsigned char nine[32] = {0x09};
    fp_frombytes(u, nine);
    fp_frombytes(v, four);
    check_int("sqrt(9/4) exists", 0, fp_sqrt_ratio(x, u, v));
    fp_fe check;
    fp_sq(check, x);
    fp_mul(check, check, v);
    check_int("sqrt(9/4)^2 * 4 == 9", 1, fp_equal(check, u));
    check_int("sqrt(9/4) is non-negative", 0, fp_isnegative(x));

    fp_0(u);
    fp_1(v);
    check_int("sqrt(0/1) exists", 0, fp_sqrt_ratio(x, u, v));
    check_int("sqrt(0/1) == 0", 0, fp_isnonzero(x));

    fp_1(u);
    fp_0(v);
    check_int("v == 0 rejected", -1, fp_sqrt_ratio(x, u, v));

    fp_0(u);
    check_int("u == v == 0 rejected", -1, fp_sqrt_ratio(x, u, v));
}

static void test_scalar()
{
    std::cout << std::endl << "=== Scalar arithmetic mod L ===" << std::endl;

    sc_fe a, b, r;
    unsigned char buf[32];
    sc_frombytes_mod_order(a, scalar_a_bytes);
    sc_frombytes_mod_order(b, scalar_b_bytes);

    sc_tobytes(buf, a);
    check_bytes("a mod L", scalar_a_reduced, buf, 32);

    sc_mul(r, a, b);
    sc_tobytes(buf, r);
    check_bytes("a * b", sc_ab_bytes, buf, 32);

    sc_add(r, a, b);
    sc_tobytes(buf, r);
    check_bytes("a + b", sc_apb_bytes, buf, 32);

    sc_sub(r, a, b);
    sc_tobytes(buf, r);
    check_bytes("a - b", sc_amb_bytes, buf, 32);

    sc_sub(r, b, a);
    sc_tobytes(buf, r);
    check_bytes("b - a (wraps)", sc_bma_bytes, buf, 32);

    sc_invert(r, a);
    sc_tobytes(buf, r);
    check_bytes("a^-1", sc_ainv_bytes, buf, 32);

    sc_mul(r, r, a);
    sc_tobytes(buf, r);
    check_bytes("a * a^-1 == 1", one_bytes, buf, 32);

    sc_neg(r, a);
    sc_add(r, r, a);
    check_int("-a + a == 0", 0, sc_isnonzero(r));

    unsigned char wide[64];
    for (int i = 0; i < 64; i++)
        wide[i] = (unsigned char)i;
    sc_reduce_wide(r, wide);
    sc_tobytes(buf, r);
    check_bytes("reduce_wide(00..3f)", sc_wide_bytes, buf, 32);

    unsigned char ff[32];
    std::memset(ff, 0xff, 32);
    sc_frombytes_mod_order(r, ff);
    sc_tobytes(buf, r);
    check_bytes("(2^256 - 1) mod L", sc_ff_reduced, buf, 32);

    check_int("canonical: L - 1 accepted", 0, sc_frombytes_canonical(r, sc_l_minus_1));
    sc_tobytes(buf, r);
    check_bytes("canonical: L - 1 preserved", sc_l_minus_1, buf, 32);
    check_int("canonical: L rejected", -1, sc_frombytes_canonical(r, EDWARDS_ORDER));
    check_int("canonical: 2^256 - 1 rejected", -1, sc_frombytes_canonical(r, ff));

    sc_frombytes_mod_order(r, EDWARDS_ORDER);
    check_int("L mod L == 0", 0, sc_isnonzero(r));

    /* (L - 1) + 1 wraps to zero */
    sc_frombytes_mod_order(r, sc_l_minus_1);
    sc_fe one;
    sc_1(one);
    sc_add(r, r, one);
    check_int("(L - 1) + 1 == 0", 0, sc_isnonzero(r));

    auto from_api = Scalar::from_u64(0x0102030405060708ULL).to_bytes();
    const unsigned char u64_bytes[32] = {0x08, 0x07, 0x06, 0x05, 0x04, 0x03, 0x02, 0x01};
    check_bytes("Scalar::from_u64", u64_bytes, from_api.data(), 32);
    check_true("Scalar::invert(0) is nullopt", !Scalar::zero().invert().has_value());
    check_true("Scalar::from_canonical_bytes(L) is nullopt", !Scalar::from_canonical_bytes(EDWARDS_ORDER));
}

/* Rebuild sum(d[i] * base^i) with scalar arithmetic */
template<typename Digit>
static Scalar evaluate_digits(const Digit *digits, size_t count, uint64_t base)
{
    const Scalar radix = Scalar::from_u64(base);
    Scalar acc = Scalar::zero();
    for (size_t i = count; i-- > 0;)
    {
        const int d = digits[i];
        const Scalar digit = d >= 0 ? Scalar::from_u64((uint64_t)d) : -Scalar::from_u64((uint64_t)(-d));
        acc = acc * radix + digit;
    }
    return acc;
}

static void test_recode()
{
    std::cout << std::endl << "=== Scalar digit expansions ===" << std::endl;

    const Scalar a = Scalar::from_bytes_mod_order(scalar_a_bytes);
    const Scalar l_minus_1 = *Scalar::from_canonical_bytes(sc_l_minus_1);

    for (const Scalar &s : {a, l_minus_1, Scalar::zero(), Scalar::one()})
    {
        const auto digits = s.as_radix_16();
        bool in_range = true;
        for (int i = 0; i < 64; i++)
            in_range = in_range && digits[i] >= -7 && digits[i] <= 8;
        check_true("radix-16 digits in [-7, 8]", in_range);
        check_true("radix-16 digits evaluate to the scalar", evaluate_digits(digits.data(), 64, 16) == s);
    }

    /* scalar 8 is a single digit; scalar 9 becomes -7 + 1*16 */
    int8_t digits[64];
    unsigned char nine[32] = {0x09};
    sc_as_radix_16(digits, nine);
    check_int("radix-16(9)[0] == -7", -7, digits[0]);
    check_int("radix-16(9)[1] == 1", 1, digits[1]);

    for (int w = 2; w <= 8; w++)
    {
        for (const Scalar &s : {a, l_minus_1})
        {
            const auto naf = s.non_adjacent_form(w);
            bool odd_and_bounded = true;
            bool separated = true;
            int last_nonzero = -1000;
            for (int i = 0; i < 256; i++)
            {
                if (naf[i] == 0)
                    continue;
                odd_and_bounded = odd_and_bounded && (naf[i] & 1) && naf[i] < (1 << (w - 1))
                                  && naf[i] > -(1 << (w - 1));
                separated = separated && (i - last_nonzero >= w);
                last_nonzero = i;
            }

            const std::string label = "NAF w=" + std::to_string(w);
            check_true((label + " digits odd and bounded").c_str(), odd_and_bounded);
            check_true((label + " nonzero digits separated").c_str(), separated);
            check_true((label + " evaluates to the scalar").c_str(), evaluate_digits(naf.data(), 256, 2) == s);
        }
    }

    for (int w = 6; w <= 11; w++)
    {
        const auto windows = l_minus_1.as_radix_2w(w);
        bool in_range = true;
        for (const auto d : windows)
            in_range = in_range && d >= -(1 << (w - 1)) && d < (1 << (w - 1));

        const std::string label = "radix-2^" + std::to_string(w);
        check_int((label + " digit count").c_str(), (256 + w - 1) / w, (int)windows.size());
        check_true((label + " digits in range").c_str(), in_range);
        check_true(
            (label + " evaluates to the scalar").c_str(),
            evaluate_digits(windows.data(), windows.size(), 1ULL << w) == l_minus_1);
    }

    bool threw = false;
    try
    {
        (void)a.non_adjacent_form(9);
    }
    catch (const std::invalid_argument &)
    {
        threw = true;
    }
    check_true("NAF width 9 rejected", threw);
}

static void test_points()
{
    std::cout << std::endl << "=== Point operations ===" << std::endl;

    edwards_extended B, r, t;
    unsigned char buf[32];
    edwards_basepoint(&B);

    edwards_tobytes(buf, &B);
    check_bytes("compress(B)", EDWARDS_BASEPOINT_COMPRESSED, buf, 32);
    check_int("B on curve", 1, edwards_is_on_curve(&B));

    edwards_identity(&r);
    edwards_tobytes(buf, &r);
    check_bytes("compress(identity)", identity_compressed, buf, 32);
    check_int("identity on curve", 1, edwards_is_on_curve(&r));
    check_int("identity is identity", 1, edwards_is_identity(&r));

    edwards_dbl(&r, &B);
    edwards_tobytes(buf, &r);
    check_bytes("2B (dbl)", edwards_2b_compressed, buf, 32);

    edwards_add(&t, &B, &B);
    edwards_tobytes(buf, &t);
    check_bytes("B + B (unified add)", edwards_2b_compressed, buf, 32);
    check_int("dbl(B) == B + B", 1, edwards_equal(&r, &t));

    edwards_identity(&t);
    edwards_add(&r, &B, &t);
    check_int("B + identity == B", 1, edwards_equal(&r, &B));

    edwards_neg(&t, &B);
    edwards_tobytes(buf, &t);
    check_bytes("-B", edwards_neg_b_compressed, buf, 32);
    edwards_add(&r, &B, &t);
    check_int("B + (-B) == identity", 1, edwards_is_identity(&r));

    edwards_sub(&r, &B, &B);
    check_int("B - B == identity", 1, edwards_is_identity(&r));

    /* 7B = 2(2B + B) + B */
    edwards_dbl(&r, &B);
    edwards_add(&r, &r, &B);
    edwards_dbl(&r, &r);
    edwards_add(&r, &r, &B);
    edwards_tobytes(buf, &r);
    check_bytes("7B (add/dbl chain)", edwards_7b_compressed, buf, 32);
    check_int("7B on curve", 1, edwards_is_on_curve(&r));
}

static void test_codec()
{
    std::cout << std::endl << "=== Point compression ===" << std::endl;

    edwards_extended p;
    unsigned char buf[32];

    check_int("decompress(B)", EDWARDS25519_OK, edwards_frombytes(&p, EDWARDS_BASEPOINT_COMPRESSED));
    edwards_tobytes(buf, &p);
    check_bytes("compress(decompress(B))", EDWARDS_BASEPOINT_COMPRESSED, buf, 32);

    check_int("decompress(7B)", EDWARDS25519_OK, edwards_frombytes(&p, edwards_7b_compressed));
    edwards_tobytes(buf, &p);
    check_bytes("compress(decompress(7B))", edwards_7b_compressed, buf, 32);

    check_int("decompress(-7B)", EDWARDS25519_OK, edwards_frombytes(&p, edwards_neg_7b_compressed));
    edwards_tobytes(buf, &p);
    check_bytes("sign bit selects -x", edwards_neg_7b_compressed, buf, 32);

    check_int("decompress(identity)", EDWARDS25519_OK, edwards_frombytes(&p, identity_compressed));
    check_int("decoded identity is identity", 1, edwards_is_identity(&p));

    /* y = p - 1 decodes to (0, -1), the point of order 2 */
    unsigned char y_minus_one[32];
    std::memcpy(y_minus_one, p_bytes, 32);
    y_minus_one[0] = 0xec;
    check_int("decompress(y = -1)", EDWARDS25519_OK, edwards_frombytes(&p, y_minus_one));
    edwards_extended q;
    edwards_dbl(&q, &p);
    check_int("(0, -1) has order 2", 1, edwards_is_identity(&q));
    edwards_mul_by_cofactor(&q, &p);
    check_int("cofactor clears (0, -1)", 1, edwards_is_identity(&q));

    check_int("y == p rejected", EDWARDS25519_ERR_INVALID_ENCODING, edwards_frombytes(&p, p_bytes));

    unsigned char p_plus_1[32];
    std::memcpy(p_plus_1, p_bytes, 32);
    p_plus_1[0] = 0xee;
    check_int("y == p + 1 rejected", EDWARDS25519_ERR_INVALID_ENCODING, edwards_frombytes(&p, p_plus_1));

    unsigned char ff[32];
    std::memset(ff, 0xff, 32);
    check_int("y == 2^255 - 1 rejected", EDWARDS25519_ERR_INVALID_ENCODING, edwards_frombytes(&p, ff));

    unsigned char neg_zero[32] = {0x01};
    neg_zero[31] = 0x80;
    check_int("x == 0 with sign bit rejected", EDWARDS25519_ERR_INVALID_ENCODING, edwards_frombytes(&p, neg_zero));

    unsigned char y2[32] = {0x02};
    check_int("y == 2 is not on the curve", EDWARDS25519_ERR_NOT_ON_CURVE, edwards_frombytes(&p, y2));

    unsigned char y4[32] = {0x04};
    check_int("y == 4 decodes", EDWARDS25519_OK, edwards_frombytes(&p, y4));
    check_int("y == 4 point on curve", 1, edwards_is_on_curve(&p));
    edwards_tobytes(buf, &p);
    check_bytes("y == 4 re-encodes", y4, buf, 32);

    DecodeError error = DecodeError::InvalidEncoding;
    auto decoded = EdwardsPoint::from_bytes(y2, error);
    check_true("API: y == 2 is nullopt", !decoded.has_value());
    check_true("API: y == 2 reports NotOnCurve", error == DecodeError::NotOnCurve);

    CompressedPoint compressed;
    std::memcpy(compressed.data(), p_bytes, 32);
    check_true("API: decompress(p) is nullopt", !decompress(compressed).has_value());
    check_true("API: compress(basepoint)", std::memcmp(compress(EdwardsPoint::basepoint()).data(),
                                                       EDWARDS_BASEPOINT_COMPRESSED, 32) == 0);
}

static void test_scalarmult()
{
    std::cout << std::endl << "=== Scalar multiplication ===" << std::endl;

    edwards_extended B, r;
    unsigned char buf[32];
    edwards_basepoint(&B);

    unsigned char seven[32] = {0x07};
    edwards_scalarmult(&r, seven, &B);
    edwards_tobytes(buf, &r);
    check_bytes("7 * B (ct)", edwards_7b_compressed, buf, 32);

    edwards_scalarmult_vartime(&r, seven, &B);
    edwards_tobytes(buf, &r);
    check_bytes("7 * B (vartime)", edwards_7b_compressed, buf, 32);

    edwards_scalarmult(&r, scalar_a_reduced, &B);
    edwards_tobytes(buf, &r);
    check_bytes("a * B (ct)", edwards_sab_compressed, buf, 32);

    edwards_scalarmult_vartime(&r, scalar_a_reduced, &B);
    edwards_tobytes(buf, &r);
    check_bytes("a * B (vartime)", edwards_sab_compressed, buf, 32);

    edwards_scalarmult(&r, sc_l_minus_1, &B);
    edwards_tobytes(buf, &r);
    check_bytes("(L - 1) * B == -B (ct)", edwards_neg_b_compressed, buf, 32);

    edwards_scalarmult_vartime(&r, sc_l_minus_1, &B);
    edwards_tobytes(buf, &r);
    check_bytes("(L - 1) * B == -B (vartime)", edwards_neg_b_compressed, buf, 32);

    edwards_scalarmult(&r, zero_bytes, &B);
    check_int("0 * B == identity (ct)", 1, edwards_is_identity(&r));

    edwards_scalarmult_vartime(&r, zero_bytes, &B);
    check_int("0 * B == identity (vartime)", 1, edwards_is_identity(&r));

    edwards_scalarmult(&r, one_bytes, &B);
    check_int("1 * B == B (ct)", 1, edwards_equal(&r, &B));

    const EdwardsPoint base = EdwardsPoint::basepoint();
    const Scalar a = Scalar::from_bytes_mod_order(scalar_a_bytes);
    check_true("API: scalar_mul == member scalar_mul", scalar_mul(a, base) == base.scalar_mul(a));
    check_true("API: scalar_mul == scalar_mul_vartime", base.scalar_mul(a) == base.scalar_mul_vartime(a));
}

static void test_msm()
{
    std::cout << std::endl << "=== Multi-scalar multiplication ===" << std::endl;

    check_true("n = 0 selects Straus", edwards_msm_select(0) == EDWARDS_MSM_STRAUS);
    check_true("n = 189 selects Straus", msm_algorithm(189) == MsmAlgorithm::Straus);
    check_true("n = 190 selects Pippenger", msm_algorithm(190) == MsmAlgorithm::Pippenger);
    check_int("window(190)", 6, edwards_pippenger_window_size(190));
    check_int("window(500)", 7, edwards_pippenger_window_size(500));
    check_int("window(800)", 8, edwards_pippenger_window_size(800));
    check_int("window(2592)", 9, edwards_pippenger_window_size(2592));
    check_int("window(7776)", 10, edwards_pippenger_window_size(7776));
    check_int("window(23328)", 11, edwards_pippenger_window_size(23328));

    const EdwardsPoint base = EdwardsPoint::basepoint();
    const Scalar a = Scalar::from_bytes_mod_order(scalar_a_bytes);
    const Scalar b = Scalar::from_bytes_mod_order(scalar_b_bytes);
    const EdwardsPoint seven_b = *EdwardsPoint::from_bytes(edwards_7b_compressed);

    std::vector<Scalar> scalars = {a, b};
    std::vector<EdwardsPoint> points = {base, seven_b};

    check_bytes("a*B + b*7B (ct)", edwards_msm2_compressed, multiscalar_mul(scalars, points).to_bytes().data(), 32);
    check_bytes(
        "a*B + b*7B (vartime)", edwards_msm2_compressed, vartime_multiscalar_mul(scalars, points).to_bytes().data(),
        32);
    check_bytes(
        "a*B + b*7B (Pippenger forced)", edwards_msm2_compressed,
        vartime_multiscalar_mul(MsmAlgorithm::Pippenger, scalars, points).to_bytes().data(), 32);

    check_true("n = 0 (ct) is identity", multiscalar_mul({}, {}).is_identity());
    check_true("n = 0 (vartime) is identity", vartime_multiscalar_mul({}, {}).is_identity());
    check_true("n = 0 (optional) is identity", optional_multiscalar_mul({}, {})->is_identity());

    check_true("n = 1 equals scalar_mul", multiscalar_mul({a}, {base}) == scalar_mul(a, base));
    check_true("n = 1 (vartime) equals scalar_mul", vartime_multiscalar_mul({a}, {base}) == scalar_mul(a, base));

    /* sum(i * (i*B)) for i = 1..n equals (sum i^2) * B */
    const size_t sizes[] = {189, 190};
    const uint64_t sum_of_squares[] = {2268315ULL, 2304415ULL};
    for (size_t k = 0; k < 2; k++)
    {
        const size_t n = sizes[k];
        std::vector<Scalar> ss;
        std::vector<EdwardsPoint> ps;
        EdwardsPoint acc = EdwardsPoint::identity();
        for (size_t i = 1; i <= n; i++)
        {
            acc = acc + base;
            ss.push_back(Scalar::from_u64(i));
            ps.push_back(acc);
        }

        const auto expected = base.scalar_mul_vartime(Scalar::from_u64(sum_of_squares[k])).to_bytes();
        const std::string label = "n = " + std::to_string(n);

        check_bytes(
            (label + " vartime").c_str(), expected.data(), vartime_multiscalar_mul(ss, ps).to_bytes().data(), 32);
        check_bytes((label + " ct").c_str(), expected.data(), multiscalar_mul(ss, ps).to_bytes().data(), 32);
        check_bytes(
            (label + " Straus").c_str(), expected.data(),
            vartime_multiscalar_mul(MsmAlgorithm::Straus, ss, ps).to_bytes().data(), 32);
        check_bytes(
            (label + " Pippenger").c_str(), expected.data(),
            vartime_multiscalar_mul(MsmAlgorithm::Pippenger, ss, ps).to_bytes().data(), 32);
    }
}

static void test_msm_contracts()
{
    std::cout << std::endl << "=== MSM input contracts ===" << std::endl;

    const EdwardsPoint base = EdwardsPoint::basepoint();
    const Scalar a = Scalar::from_bytes_mod_order(scalar_a_bytes);
    const Scalar b = Scalar::from_bytes_mod_order(scalar_b_bytes);

    std::vector<std::optional<EdwardsPoint>> all_present = {base, base.dbl()};
    auto present = optional_multiscalar_mul({a, b}, all_present);
    check_true("optional: all present computes", present.has_value());
    check_true(
        "optional: equals vartime", present.has_value() && *present == vartime_multiscalar_mul({a, b}, {base, base.dbl()}));

    std::vector<std::optional<EdwardsPoint>> one_missing = {base, std::nullopt};
    check_true("optional: missing point yields nullopt", !optional_multiscalar_mul({a, b}, one_missing).has_value());

    std::vector<std::optional<EdwardsPoint>> first_missing = {std::nullopt, base};
    check_true("optional: missing first point yields nullopt",
        !optional_multiscalar_mul({Scalar::zero(), Scalar::zero()}, first_missing).has_value());

    bool threw = false;
    try
    {
        (void)multiscalar_mul({a, b}, {base});
    }
    catch (const std::invalid_argument &)
    {
        threw = true;
    }
    check_true("length mismatch throws (ct)", threw);

    threw = false;
    try
    {
        (void)vartime_multiscalar_mul({a}, {base, base});
    }
    catch (const std::invalid_argument &)
    {
        threw = true;
    }
    check_true("length mismatch throws (vartime)", threw);

    threw = false;
    try
    {
        (void)optional_multiscalar_mul({a}, one_missing);
    }
    catch (const std::invalid_argument &)
    {
        threw = true;
    }
    check_true("length mismatch throws (optional)", threw);

    std::vector<const edwards_extended *> raw_points = {&base.raw(), nullptr};
    unsigned char raw_scalars[64] = {0x01};
    edwards_extended r;
    check_int("core optional: missing point returns -1", -1,
        edwards_msm_vartime_optional(&r, raw_scalars, raw_points.data(), 2));
    check_int("core optional: result is identity", 1, edwards_is_identity(&r));
}

int main()
{
    std::cout << "edwards25519 Unit Tests" << std::endl;
    std::cout << "=======================" << std::endl;

    test_le_bytes();
    test_fp();
    test_fp_sqrt_ratio();
    test_scalar();
    test_recode();
    test_points();
    test_codec();
    test_scalarmult();
    test_msm();
    test_msm_contracts();

    std::cout << std::endl << "=======================" << std::endl;
    std::cout << "Total:  " << tests_run << std::endl;
    std::cout << "Passed: " << tests_passed << std::endl;
    std::cout << "Failed: " << tests_failed << std::endl;

    return tests_failed > 0 ? 1 : 0;
}
