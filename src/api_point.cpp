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

// api_point.cpp: Implementation of the EdwardsPoint C++ API methods
// (decompression with error reporting, compression, scalar multiplication).

#include "edwards25519_point.h"
#include "edwards25519_secure_erase.h"
#include "edwards_frombytes.h"
#include "edwards_scalarmult.h"
#include "edwards_tobytes.h"

namespace edwards25519
{

    std::optional<EdwardsPoint> EdwardsPoint::from_bytes(const uint8_t bytes[32])
    {
        EdwardsPoint p;
        if (edwards_frombytes(&p.ext_, bytes) != EDWARDS25519_OK)
            return std::nullopt;
        return p;
    }

    std::optional<EdwardsPoint> EdwardsPoint::from_bytes(const uint8_t bytes[32], DecodeError &error)
    {
        EdwardsPoint p;
        const int status = edwards_frombytes(&p.ext_, bytes);
        if (status != EDWARDS25519_OK)
        {
            error = static_cast<DecodeError>(status);
            return std::nullopt;
        }
        return p;
    }

    CompressedPoint EdwardsPoint::to_bytes() const
    {
        CompressedPoint out;
        edwards_tobytes(out.data(), &ext_);
        return out;
    }

    EdwardsPoint EdwardsPoint::scalar_mul(const Scalar &s) const
    {
        auto sb = s.to_bytes();
        EdwardsPoint r;
        edwards_scalarmult(&r.ext_, sb.data(), &ext_);
        edwards25519_secure_erase(sb.data(), sb.size());
        return r;
    }

    EdwardsPoint EdwardsPoint::scalar_mul_vartime(const Scalar &s) const
    {
        const auto sb = s.to_bytes();
        EdwardsPoint r;
        edwards_scalarmult_vartime(&r.ext_, sb.data(), &ext_);
        return r;
    }

} // namespace edwards25519
