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

// api_scalar.cpp: Implementation of the Scalar C++ API methods
// (serialization, canonical and reducing deserialization, inversion, digit expansions).

#include "edwards25519_scalar.h"
#include "edwards25519_secure_erase.h"
#include "sc_frombytes.h"
#include "sc_invert.h"
#include "sc_recode.h"

#include "le_bytes.h"

#include <stdexcept>

namespace edwards25519
{

    Scalar Scalar::from_u64(uint64_t value)
    {
        uint8_t bytes[32] = {0};
        le_store_u64(bytes, value);
        return from_bytes_mod_order(bytes);
    }

    std::array<uint8_t, 32> Scalar::to_bytes() const
    {
        std::array<uint8_t, 32> out;
        sc_tobytes(out.data(), fe_);
        return out;
    }

    Scalar Scalar::from_bytes_mod_order(const uint8_t bytes[32])
    {
        Scalar s;
        sc_frombytes_mod_order(s.fe_, bytes);
        return s;
    }

    std::optional<Scalar> Scalar::from_canonical_bytes(const uint8_t bytes[32])
    {
        Scalar s;
        if (sc_frombytes_canonical(s.fe_, bytes) != 0)
            return std::nullopt;
        return s;
    }

    Scalar Scalar::reduce_wide(const uint8_t bytes[64])
    {
        Scalar r;
        sc_reduce_wide(r.fe_, bytes);
        return r;
    }

    std::optional<Scalar> Scalar::invert() const
    {
        if (is_zero())
            return std::nullopt;

        Scalar r;
        sc_invert(r.fe_, fe_);
        return r;
    }

    std::array<int8_t, 64> Scalar::as_radix_16() const
    {
        auto bytes = to_bytes();
        std::array<int8_t, 64> digits;
        sc_as_radix_16(digits.data(), bytes.data());
        edwards25519_secure_erase(bytes.data(), bytes.size());
        return digits;
    }

    std::array<int8_t, 256> Scalar::non_adjacent_form(int w) const
    {
        if (w < 2 || w > 8)
            throw std::invalid_argument("NAF width must be between 2 and 8");

        const auto bytes = to_bytes();
        std::array<int8_t, 256> naf;
        sc_non_adjacent_form(naf.data(), bytes.data(), w);
        return naf;
    }

    std::vector<int16_t> Scalar::as_radix_2w(int w) const
    {
        if (w < 6 || w > 11)
            throw std::invalid_argument("radix-2^w window must be between 6 and 11");

        const auto bytes = to_bytes();
        std::vector<int16_t> digits(static_cast<size_t>((256 + w - 1) / w));
        sc_as_radix_2w(digits.data(), bytes.data(), w);
        return digits;
    }

} // namespace edwards25519
