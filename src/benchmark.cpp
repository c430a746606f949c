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
#include "edwards25519_benchmark.h"

#include <cstring>
#include <iostream>
#include <string>
#include <vector>

static const unsigned char test_a_bytes[32] = {0xef, 0xcd, 0xab, 0x90, 0x78, 0x56, 0x34, 0x12, 0xbe, 0xba, 0xfe,
                                               0xca, 0xef, 0xbe, 0xad, 0xde, 0x00, 0x00, 0x00, 0x00, 0x00, 0x00,
                                               0x00, 0x00, 0x00, 0x00, 0x00, 0x00, 0x00, 0x00, 0x00, 0x00};
static const unsigned char test_b_bytes[32] = {0x08, 0x07, 0x06, 0x05, 0x04, 0x03, 0x02, 0x01, 0x0d, 0xf0, 0xad,
                                               0xba, 0xce, 0xfa, 0xed, 0xfe, 0x00, 0x00, 0x00, 0x00, 0x00, 0x00,
                                               0x00, 0x00, 0x00, 0x00, 0x00, 0x00, 0x00, 0x00, 0x00, 0x00};

static const unsigned char test_scalar[32] = {0xef, 0xcd, 0xab, 0x90, 0x78, 0x56, 0x34, 0x12, 0xbe, 0xba, 0xfe,
                                              0xca, 0xef, 0xbe, 0xad, 0xde, 0x01, 0x02, 0x03, 0x04, 0x05, 0x06,
                                              0x07, 0x08, 0x09, 0x0a, 0x0b, 0x0c, 0x0d, 0x0e, 0x0f, 0x00};

/* n scalars derived from test_scalar and n distinct multiples of the basepoint */
static void make_msm_data(
    size_t n,
    const edwards_extended *base,
    std::vector<unsigned char> &scalars,
    std::vector<edwards_extended> &points)
{
    scalars.resize(32 * n);
    points.resize(n);

    edwards_copy(&points[0], base);
    for (size_t i = 0; i < n; i++)
    {
        std::memcpy(scalars.data() + 32 * i, test_scalar, 32);
        scalars[32 * i] = (unsigned char)(i & 0xff);
        scalars[32 * i + 1] = (unsigned char)((i >> 8) & 0xff);
        if (i > 0)
            edwards_add(&points[i], &points[i - 1], base);
    }
}

int main(int argc, char *argv[])
{
    bool bench_all = false;
    for (int i = 1; i < argc; i++)
    {
        if (std::strcmp(argv[i], "--all") == 0)
        {
            bench_all = true;
        }
        else
        {
            std::cerr << "Unknown option: " << argv[i] << std::endl;
            std::cerr << "Usage: edwards25519-benchmark [--all]" << std::endl;
            return 1;
        }
    }

    auto state = benchmark_setup();

    fp_fe fp_a, fp_b, fp_c;
    fp_frombytes(fp_a, test_a_bytes);
    fp_frombytes(fp_b, test_b_bytes);

    sc_fe sc_a, sc_b, sc_c;
    sc_frombytes_mod_order(sc_a, test_a_bytes);
    sc_frombytes_mod_order(sc_b, test_b_bytes);

    edwards_extended B, B2, result;
    edwards_basepoint(&B);
    edwards_dbl(&B2, &B);

    unsigned char point_bytes[32];
    int8_t radix16_digits[64];
    int8_t naf_digits[256];

    std::cout << std::endl;
    benchmark_header();
    std::cout << std::endl;

    std::cout << "--- F_p (2^255 - 19) ---" << std::endl;

    benchmark_long(
        [&]()
        {
            fp_add(fp_c, fp_a, fp_b);
            benchmark_do_not_optimize(fp_c);
        },
        "fp_add");

    benchmark_long(
        [&]()
        {
            fp_sub(fp_c, fp_a, fp_b);
            benchmark_do_not_optimize(fp_c);
        },
        "fp_sub");

    benchmark_long(
        [&]()
        {
            fp_mul(fp_c, fp_a, fp_b);
            benchmark_do_not_optimize(fp_c);
        },
        "fp_mul");

    benchmark_long(
        [&]()
        {
            fp_sq(fp_c, fp_a);
            benchmark_do_not_optimize(fp_c);
        },
        "fp_sq");

    benchmark(
        [&]()
        {
            fp_invert(fp_c, fp_a);
            benchmark_do_not_optimize(fp_c);
        },
        "fp_invert");

    benchmark(
        [&]()
        {
            int ok = fp_sqrt_ratio(fp_c, fp_a, fp_b);
            benchmark_do_not_optimize(ok);
        },
        "fp_sqrt_ratio");

    std::cout << std::endl;
    std::cout << "--- Scalars mod L ---" << std::endl;

    benchmark_long(
        [&]()
        {
            sc_add(sc_c, sc_a, sc_b);
            benchmark_do_not_optimize(sc_c);
        },
        "sc_add");

    benchmark_long(
        [&]()
        {
            sc_mul(sc_c, sc_a, sc_b);
            benchmark_do_not_optimize(sc_c);
        },
        "sc_mul");

    benchmark(
        [&]()
        {
            sc_invert(sc_c, sc_a);
            benchmark_do_not_optimize(sc_c);
        },
        "sc_invert");

    benchmark(
        [&]()
        {
            sc_as_radix_16(radix16_digits, test_scalar);
            benchmark_do_not_optimize(radix16_digits);
        },
        "sc_as_radix_16");

    benchmark(
        [&]()
        {
            sc_non_adjacent_form(naf_digits, test_scalar, EDWARDS_NAF_WIDTH);
            benchmark_do_not_optimize(naf_digits);
        },
        "sc_non_adjacent_form (w=5)");

    std::cout << std::endl;
    std::cout << "--- Points ---" << std::endl;

    benchmark_long(
        [&]()
        {
            edwards_add(&result, &B, &B2);
            benchmark_do_not_optimize(result);
        },
        "edwards_add");

    benchmark_long(
        [&]()
        {
            edwards_dbl(&result, &B);
            benchmark_do_not_optimize(result);
        },
        "edwards_dbl");

    benchmark(
        [&]()
        {
            edwards_tobytes(point_bytes, &B2);
            benchmark_do_not_optimize(point_bytes);
        },
        "edwards_tobytes");

    benchmark(
        [&]()
        {
            int rc = edwards_frombytes(&result, EDWARDS_BASEPOINT_COMPRESSED);
            benchmark_do_not_optimize(rc);
        },
        "edwards_frombytes");

    std::cout << std::endl;
    std::cout << "--- Scalar multiplication ---" << std::endl;

    benchmark(
        [&]()
        {
            edwards_scalarmult(&result, test_scalar, &B);
            benchmark_do_not_optimize(result);
        },
        "edwards_scalarmult",
        5000,
        500);

    benchmark(
        [&]()
        {
            edwards_scalarmult_vartime(&result, test_scalar, &B);
            benchmark_do_not_optimize(result);
        },
        "edwards_scalarmult_vartime",
        5000,
        500);

    std::cout << std::endl;
    std::cout << "--- MSM ---" << std::endl;

    std::vector<size_t> msm_sizes = {2, 16, 64, 189, 190, 256};
    if (bench_all)
    {
        msm_sizes.push_back(512);
        msm_sizes.push_back(1024);
        msm_sizes.push_back(4096);
    }

    std::vector<unsigned char> sc;
    std::vector<edwards_extended> pts;
    for (size_t sz : msm_sizes)
    {
        make_msm_data(sz, &B, sc, pts);
        const size_t iterations = sz >= 512 ? 20 : 200;
        const size_t warmup = sz >= 512 ? 2 : 10;

        benchmark(
            [&]()
            {
                edwards_msm(&result, sc.data(), pts.data(), sz);
                benchmark_do_not_optimize(result);
            },
            "edwards_msm (ct) n=" + std::to_string(sz),
            iterations,
            warmup);

        benchmark(
            [&]()
            {
                edwards_msm_straus_vartime(&result, sc.data(), pts.data(), sz);
                benchmark_do_not_optimize(result);
            },
            "straus_vartime n=" + std::to_string(sz),
            iterations,
            warmup);

        benchmark(
            [&]()
            {
                edwards_msm_pippenger_vartime(&result, sc.data(), pts.data(), sz);
                benchmark_do_not_optimize(result);
            },
            "pippenger_vartime n=" + std::to_string(sz),
            iterations,
            warmup);
    }

    std::cout << std::endl;

    benchmark_teardown(state);

    return 0;
}
