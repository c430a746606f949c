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

#include "edwards_add.h"

#include "edwards_ops.h"
#include "fp_mul.h"
#include "fp_ops.h"

/*
 * Unified addition, p extended and q cached:
 *   PP = (Y1 + X1) * (Y2 + X2)
 *   MM = (Y1 - X1) * (Y2 - X2)
 *   TT = T1 * 2d*T2
 *   ZZ2 = 2 * Z1 * Z2
 *   result = (PP - MM : PP + MM : ZZ2 + TT : ZZ2 - TT) in completed form
 */
void edwards_add_cached(edwards_completed *r, const edwards_extended *p, const edwards_cached *q)
{
    fp_fe y_plus_x, y_minus_x, pp, mm, tt, zz, zz2;

    fp_add(y_plus_x, p->Y, p->X);
    fp_sub(y_minus_x, p->Y, p->X);
    fp_mul(pp, y_plus_x, q->YplusX);
    fp_mul(mm, y_minus_x, q->YminusX);
    fp_mul(tt, p->T, q->T2d);
    fp_mul(zz, p->Z, q->Z);
    fp_add(zz2, zz, zz);

    fp_sub(r->X, pp, mm);
    fp_add(r->Y, pp, mm);
    fp_add(r->Z, zz2, tt);
    fp_sub(r->T, zz2, tt);
}

/* Same as addition with the roles of Y+X / Y-X swapped and the sign of TT flipped */
void edwards_sub_cached(edwards_completed *r, const edwards_extended *p, const edwards_cached *q)
{
    fp_fe y_plus_x, y_minus_x, pm, mp, tt, zz, zz2;

    fp_add(y_plus_x, p->Y, p->X);
    fp_sub(y_minus_x, p->Y, p->X);
    fp_mul(pm, y_plus_x, q->YminusX);
    fp_mul(mp, y_minus_x, q->YplusX);
    fp_mul(tt, p->T, q->T2d);
    fp_mul(zz, p->Z, q->Z);
    fp_add(zz2, zz, zz);

    fp_sub(r->X, pm, mp);
    fp_add(r->Y, pm, mp);
    fp_sub(r->Z, zz2, tt);
    fp_add(r->T, zz2, tt);
}

void edwards_add(edwards_extended *r, const edwards_extended *p, const edwards_extended *q)
{
    edwards_cached qc;
    edwards_completed c;
    edwards_to_cached(&qc, q);
    edwards_add_cached(&c, p, &qc);
    edwards_completed_to_extended(r, &c);
}

void edwards_sub(edwards_extended *r, const edwards_extended *p, const edwards_extended *q)
{
    edwards_cached qc;
    edwards_completed c;
    edwards_to_cached(&qc, q);
    edwards_sub_cached(&c, p, &qc);
    edwards_completed_to_extended(r, &c);
}
