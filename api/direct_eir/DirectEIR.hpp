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

#ifndef DIRECT_EIR_HPP_
#define DIRECT_EIR_HPP_

#include "OctetTypes.hpp"
#include "BTAddress.hpp"
#include "EIRTypes.hpp"
#include "EIREnv.hpp"
#include "EIRDecoder.hpp"

namespace direct_eir {

    /** Library version, e.g. `0.1.0`, as passed by the build system. */
    inline constexpr const char* VERSION = DIRECT_EIR_VERSION;

    /** Library API version, i.e. `major.minor`. */
    inline constexpr const char* VERSION_API = DIRECT_EIR_VERSION_API;

} // namespace direct_eir

#endif /* DIRECT_EIR_HPP_ */
