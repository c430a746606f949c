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

/**
 * @file edwards.h
 * @brief Point representations for the twisted Edwards curve -x^2 + y^2 = 1 + d*x^2*y^2
 *        over F_p (edwards25519).
 *
 * - edwards_extended: (X:Y:Z:T) with x = X/Z, y = Y/Z and X*Y = Z*T. The canonical form
 *   every public operation consumes and produces.
 * - edwards_cached: (Y+X, Y-X, Z, 2d*T) of an extended point, the right-hand operand of
 *   addition. Lookup tables hold cached points.
 * - edwards_completed: ((X:Z), (Y:T)) output of the unified formulas before the final
 *   four multiplications back to extended form.
 */

#ifndef EDWARDS25519_EDWARDS_H
#define EDWARDS25519_EDWARDS_H

#include "fp.h"

struct edwards_extended
{
    fp_fe X;
    fp_fe Y;
    fp_fe Z;
    fp_fe T;
};

struct edwards_cached
{
    fp_fe YplusX;
    fp_fe YminusX;
    fp_fe Z;
    fp_fe T2d;
};

struct edwards_completed
{
    fp_fe X;
    fp_fe Y;
    fp_fe Z;
    fp_fe T;
};

#endif // EDWARDS25519_EDWARDS_H
