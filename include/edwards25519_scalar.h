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
 * @file edwards25519_scalar.h
 * @brief Type-safe C++ wrapper for scalars mod L, the prime order of the edwards25519 group.
 *
 * L = 2^252 + 27742317777372353535851937790883648493. A Scalar always holds a reduced
 * value; every constructor either reduces its input or rejects it. Arithmetic is
 * constant-time; the digit expansions used by the multiplication engines are returned
 * by value and are never stored on the Scalar.
 */

#ifndef EDWARDS25519_API_SCALAR_H
#define EDWARDS25519_API_SCALAR_H

#include "sc.h"
#include "sc_mul.h"
#include "sc_ops.h"
#include "sc_tobytes.h"

#include <array>
#include <cstdint>
#include <cstring>
#include <iomanip>
#include <optional>
#include <ostream>
#include <vector>

namespace edwards25519
{

    class Scalar
    {
      public:
        Scalar()
        {
            sc_0(fe_);
        }

        Scalar(const Scalar &other)
        {
            std::memcpy(fe_, other.fe_, sizeof(sc_fe));
        }

        Scalar &operator=(const Scalar &other)
        {
            std::memcpy(fe_, other.fe_, sizeof(sc_fe));
            return *this;
        }

        static Scalar zero()
        {
            return Scalar();
        }

        static Scalar one()
        {
            Scalar s;
            sc_1(s.fe_);
            return s;
        }

        static Scalar from_u64(uint64_t value);

        bool is_zero() const
        {
            return sc_isnonzero(fe_) == 0;
        }

        bool operator==(const Scalar &other) const
        {
            return sc_equal(fe_, other.fe_) != 0;
        }

        bool operator!=(const Scalar &other) const
        {
            return !(*this == other);
        }

        Scalar operator+(const Scalar &other) const
        {
            Scalar r;
            sc_add(r.fe_, fe_, other.fe_);
            return r;
        }

        Scalar operator-(const Scalar &other) const
        {
            Scalar r;
            sc_sub(r.fe_, fe_, other.fe_);
            return r;
        }

        Scalar operator*(const Scalar &other) const
        {
            Scalar r;
            sc_mul(r.fe_, fe_, other.fe_);
            return r;
        }

        Scalar operator-() const
        {
            Scalar r;
            sc_neg(r.fe_, fe_);
            return r;
        }

        Scalar sq() const
        {
            Scalar r;
            sc_sq(r.fe_, fe_);
            return r;
        }

        /// Serialize to 32-byte little-endian canonical form.
        std::array<uint8_t, 32> to_bytes() const;

        /// Interpret 32 LE bytes as a 256-bit integer and reduce it mod L.
        static Scalar from_bytes_mod_order(const uint8_t bytes[32]);

        /// Deserialize from 32-byte LE. Returns nullopt if value >= L.
        static std::optional<Scalar> from_canonical_bytes(const uint8_t bytes[32]);

        /// Reduce a 64-byte (512-bit) wide integer mod L. Used for hash-to-scalar.
        static Scalar reduce_wide(const uint8_t bytes[64]);

        /// Modular inverse via Fermat's little theorem (a^{L-2} mod L). Returns nullopt for zero.
        std::optional<Scalar> invert() const;

        /// 64 signed digits in [-7, 8] with value = sum(d[i] * 16^i). Constant time.
        std::array<int8_t, 64> as_radix_16() const;

        /// Width-w NAF, 2 <= w <= 8 (throws std::invalid_argument otherwise). Variable time.
        std::array<int8_t, 256> non_adjacent_form(int w) const;

        /// Signed radix-2^w windows, 6 <= w <= 11 (throws std::invalid_argument otherwise).
        std::vector<int16_t> as_radix_2w(int w) const;

        /// Direct access to the underlying limbs.
        const sc_fe &raw() const
        {
            return fe_;
        }

        sc_fe &raw()
        {
            return fe_;
        }

      private:
        sc_fe fe_;
    };

    inline std::ostream &operator<<(std::ostream &os, const Scalar &s)
    {
        const auto bytes = s.to_bytes();
        const auto flags = os.flags();
        for (size_t i = 0; i < 32; i++)
            os << std::hex << std::setfill('0') << std::setw(2) << static_cast<unsigned>(bytes[i]);
        os.flags(flags);
        return os;
    }

} // namespace edwards25519

#endif // EDWARDS25519_API_SCALAR_H
