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
 * @file edwards25519_point.h
 * @brief Type-safe C++ wrapper for points of the edwards25519 group.
 *
 * -x^2 + y^2 = 1 + d*x^2*y^2 over F_p (p = 2^255 - 19), stored in extended
 * coordinates (X:Y:Z:T) with x = X/Z, y = Y/Z, x*y = T/Z. The addition and doubling
 * formulas are complete, so no operator needs to special-case the identity or equal
 * operands.
 *
 * Points are encoded as 32 bytes: the canonical y-coordinate with the sign (low bit)
 * of x in bit 255.
 */

#ifndef EDWARDS25519_API_POINT_H
#define EDWARDS25519_API_POINT_H

#include "edwards25519_error.h"
#include "edwards25519_scalar.h"
#include "edwards_add.h"
#include "edwards_dbl.h"
#include "edwards_ops.h"
#include "edwards_validate.h"

#include <array>
#include <cstdint>
#include <iomanip>
#include <optional>
#include <ostream>

namespace edwards25519
{

    typedef std::array<uint8_t, 32> CompressedPoint;

    class EdwardsPoint
    {
      public:
        EdwardsPoint()
        {
            edwards_identity(&ext_);
        }

        EdwardsPoint(const EdwardsPoint &other)
        {
            edwards_copy(&ext_, &other.ext_);
        }

        EdwardsPoint &operator=(const EdwardsPoint &other)
        {
            edwards_copy(&ext_, &other.ext_);
            return *this;
        }

        static EdwardsPoint identity()
        {
            return EdwardsPoint();
        }

        static EdwardsPoint basepoint()
        {
            EdwardsPoint p;
            edwards_basepoint(&p.ext_);
            return p;
        }

        bool is_identity() const
        {
            return edwards_is_identity(&ext_) != 0;
        }

        /// Both extended-coordinate invariants hold (on the curve, and X*Y = Z*T).
        bool is_on_curve() const
        {
            return edwards_is_on_curve(&ext_) != 0;
        }

        bool operator==(const EdwardsPoint &other) const
        {
            return edwards_equal(&ext_, &other.ext_) != 0;
        }

        bool operator!=(const EdwardsPoint &other) const
        {
            return !(*this == other);
        }

        EdwardsPoint operator-() const
        {
            EdwardsPoint r;
            edwards_neg(&r.ext_, &ext_);
            return r;
        }

        EdwardsPoint operator+(const EdwardsPoint &other) const
        {
            EdwardsPoint r;
            edwards_add(&r.ext_, &ext_, &other.ext_);
            return r;
        }

        EdwardsPoint operator-(const EdwardsPoint &other) const
        {
            EdwardsPoint r;
            edwards_sub(&r.ext_, &ext_, &other.ext_);
            return r;
        }

        EdwardsPoint dbl() const
        {
            EdwardsPoint r;
            edwards_dbl(&r.ext_, &ext_);
            return r;
        }

        /// [8]P
        EdwardsPoint mul_by_cofactor() const
        {
            EdwardsPoint r;
            edwards_mul_by_cofactor(&r.ext_, &ext_);
            return r;
        }

        /// Decompress from 32-byte encoding. Returns nullopt if the encoding is rejected.
        static std::optional<EdwardsPoint> from_bytes(const uint8_t bytes[32]);

        /// As above; on failure also reports why through error.
        static std::optional<EdwardsPoint> from_bytes(const uint8_t bytes[32], DecodeError &error);

        /// Compress to 32 bytes (canonical y LE, bit 255 = sign of x).
        CompressedPoint to_bytes() const;

        /// Constant-time scalar multiplication (signed radix-16 windows).
        EdwardsPoint scalar_mul(const Scalar &s) const;

        /// Variable-time scalar multiplication using wNAF w=5. Only use with public scalars.
        EdwardsPoint scalar_mul_vartime(const Scalar &s) const;

        /// Direct access to the underlying extended coordinates.
        const edwards_extended &raw() const
        {
            return ext_;
        }

        edwards_extended &raw()
        {
            return ext_;
        }

      private:
        edwards_extended ext_;
    };

    inline CompressedPoint compress(const EdwardsPoint &p)
    {
        return p.to_bytes();
    }

    inline std::optional<EdwardsPoint> decompress(const CompressedPoint &bytes)
    {
        return EdwardsPoint::from_bytes(bytes.data());
    }

    inline std::ostream &operator<<(std::ostream &os, const EdwardsPoint &p)
    {
        const auto bytes = p.to_bytes();
        const auto flags = os.flags();
        for (size_t i = 0; i < 32; i++)
            os << std::hex << std::setfill('0') << std::setw(2) << static_cast<unsigned>(bytes[i]);
        os.flags(flags);
        return os;
    }

} // namespace edwards25519

#endif // EDWARDS25519_API_POINT_H
