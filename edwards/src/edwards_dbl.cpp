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

#include "edwards_dbl.h"

#include "edwards_ops.h"
#include "fp_ops.h"
#include "fp_sq.h"

/*
 * Doubling (a = -1, "dbl-2008-hwcd"):
 *   XX = X^2, YY = Y^2, ZZ2 = 2*Z^2, S = (X + Y)^2
 *   result = (S - (YY + XX) : YY + XX : YY - XX : ZZ2 - (YY - XX)) in completed form
 */
void edwards_dbl_completed(edwards_completed *r, const edwards_extended *p)
{
    fp_fe xx, yy, zz2, x_plus_y, s, yy_plus_xx, yy_minus_xx;

    fp_sq(xx, p->X);
    fp_sq(yy, p->Y);
    fp_sq2(zz2, p->Z);
    fp_add(x_plus_y, p->X, p->Y);
    fp_sq(s, x_plus_y);

    fp_add(yy_plus_xx, yy, xx);
    fp_sub(yy_minus_xx, yy, xx);

    fp_sub(r->X, s, yy_plus_xx);
    fp_copy(r->Y, yy_plus_xx);
    fp_copy(r->Z, yy_minus_xx);
    fp_sub(r->T, zz2, yy_minus_xx);
}

void edwards_dbl(edwards_extended *r, const edwards_extended *p)
{
    edwards_completed c;
    edwards_dbl_completed(&c, p);
    edwards_completed_to_extended(r, &c);
}

void edwards_mul_by_cofactor(edwards_extended *r, const edwards_extended *p)
{
    edwards_dbl(r, p);
    edwards_dbl(r, r);
    edwards_dbl(r, r);
}
