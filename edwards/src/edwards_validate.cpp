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

#include "edwards_validate.h"

#include "edwards_constants.h"
#include "fp_mul.h"
#include "fp_ops.h"
#include "fp_sq.h"
#include "fp_utils.h"

int edwards_equal(const edwards_extended *p, const edwards_extended *q)
{
    /* X1*Z2 == X2*Z1 and Y1*Z2 == Y2*Z1 */
    fp_fe a, b, c, d;
    fp_mul(a, p->X, q->Z);
    fp_mul(b, q->X, p->Z);
    fp_mul(c, p->Y, q->Z);
    fp_mul(d, q->Y, p->Z);
    return fp_equal(a, b) & fp_equal(c, d);
}

int edwards_is_identity(const edwards_extended *p)
{
    return (fp_isnonzero(p->X) ^ 1) & fp_equal(p->Y, p->Z);
}

int edwards_is_on_curve(const edwards_extended *p)
{
    fp_fe xy, zt, xx, yy, zz, lhs, rhs, t;

    /* X*Y == Z*T */
    fp_mul(xy, p->X, p->Y);
    fp_mul(zt, p->Z, p->T);
    const int segre = fp_equal(xy, zt);

    /* (Y^2 - X^2) * Z^2 == Z^4 + d * X^2 * Y^2 */
    fp_sq(xx, p->X);
    fp_sq(yy, p->Y);
    fp_sq(zz, p->Z);
    fp_sub(lhs, yy, xx);
    fp_mul(lhs, lhs, zz);
    fp_sq(rhs, zz);
    fp_mul(t, xx, yy);
    fp_mul(t, t, EDWARDS_D);
    fp_add(rhs, rhs, t);
    const int on_curve = fp_equal(lhs, rhs);

    return segre & on_curve & fp_isnonzero(p->Z);
}
