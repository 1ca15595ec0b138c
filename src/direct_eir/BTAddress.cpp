/*
 * Author: Sven Gothel <sgothel@jausoft.com>
 * Copyright (c) 2021 Gothel Software e.K.
 * Copyright (c) 2020 ZAFENA AB
 *
 * Permission is hereby granted, free of charge, to any person obtaining
 * a copy of this software and associated documentation files (the
 * "Software"), to deal in the Software without restriction, including
 * without limitation the rights to use, copy, modify, merge, publish,
 * distribute, sublicense, and/or sell copies of the Software, and to
 * permit persons to whom the Software is furnished to do so, subject to
 * the following conditions:
 *
 * The above copyright notice and this permission notice shall be
 * included in all copies or substantial portions of the Software.
 *
 * THE SOFTWARE IS PROVIDED "AS IS", WITHOUT WARRANTY OF ANY KIND,
 * EXPRESS OR IMPLIED, INCLUDING BUT NOT LIMITED TO THE WARRANTIES OF
 * MERCHANTABILITY, FITNESS FOR A PARTICULAR PURPOSE AND
 * NONINFRINGEMENT. IN NO EVENT SHALL THE AUTHORS OR COPYRIGHT HOLDERS BE
 * LIABLE FOR ANY CLAIM, DAMAGES OR OTHER LIABILITY, WHETHER IN AN ACTION
 * OF CONTRACT, TORT OR OTHERWISE, ARISING FROM, OUT OF OR IN CONNECTION
 * WITH THE SOFTWARE OR THE USE OR OTHER DEALINGS IN THE SOFTWARE.
 */

#include <cstring>
#include <string>
#include <cstdint>
#include <cstdio>

#include <jau/debug.hpp>

#include "BTAddress.hpp"

using namespace direct_eir;

const BDAddress BDAddress::ZERO;

BDAddress::BDAddress(uint8_t const * data_, const jau::nsize_t len) noexcept
: b{ { 0, 0, 0, 0, 0, 0 } }
{
    if( nullptr == data_ || byte_size != len ) {
        ABORT("BDAddress requires %u octets, given %u octets @ %p",
                (unsigned int)byte_size, (unsigned int)len, (void*)data_);
    }
    memcpy(b.data(), data_, byte_size);
}

std::string BDAddress::toString() const noexcept {
    // 6 * ( 2 hex + 1 colon ), last colon replaced by EOS
    char cstr[byte_size * 3];
    const int count = snprintf(cstr, sizeof(cstr), "%2.2x:%2.2x:%2.2x:%2.2x:%2.2x:%2.2x",
                               b[5], b[4], b[3], b[2], b[1], b[0]);
    if( static_cast<int>(sizeof(cstr)) - 1 != count ) {
        ERR_PRINT("BDAddress string not of length %zu but %d", sizeof(cstr) - 1, count);
    }
    return std::string(cstr);
}
