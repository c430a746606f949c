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
 * @file edwards25519_error.h
 * @brief Decoding failures reported by the C++ API, and messages for the core error codes.
 */

#ifndef EDWARDS25519_API_ERROR_H
#define EDWARDS25519_API_ERROR_H

#include "edwards_frombytes.h"

#include <ostream>

namespace edwards25519
{

    /// Why a 32-byte encoding did not decode to a point.
    enum class DecodeError
    {
        /// y >= p, or x = 0 with the sign bit set.
        InvalidEncoding = EDWARDS25519_ERR_INVALID_ENCODING,
        /// No x satisfies the curve equation for the encoded y.
        NotOnCurve = EDWARDS25519_ERR_NOT_ON_CURVE
    };

    /// Static description of a DecodeError.
    const char *to_string(DecodeError error);

    inline std::ostream &operator<<(std::ostream &os, DecodeError error)
    {
        return os << to_string(error);
    }

} // namespace edwards25519

/// Static description of an EDWARDS25519_* status code; never returns nullptr.
const char *edwards25519_strerror(int code);

#endif // EDWARDS25519_API_ERROR_H
