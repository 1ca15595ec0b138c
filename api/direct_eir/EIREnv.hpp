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

#ifndef EIR_ENV_HPP_
#define EIR_ENV_HPP_

#include <cstdint>

#include <jau/environment.hpp>

namespace direct_eir {

    /**
     * EIR decoder runtime environment, read once from system properties or environment variables.
     */
    class EIREnv : public jau::root_environment {
        private:
            EIREnv() noexcept;

        public:
            /**
             * Debug logging enabled or disabled.
             * <p>
             * Environment variable 'direct_eir.debug', i.e. the root switch of jau::environment::get("direct_eir").
             * </p>
             */
            const bool DEBUG_GLOBAL;

            /**
             * Log every parsed EIR data element with its offset, type and payload.
             * <p>
             * Environment variable is 'direct_eir.debug.data', defaults to false.
             * </p>
             */
            const bool DEBUG_DATA;

        public:
            static EIREnv& get() noexcept {
                /**
                 * Thread safe starting with C++11 6.7:
                 *
                 * If control enters the declaration concurrently while the variable is being initialized,
                 * the concurrent execution shall wait for completion of the initialization.
                 *
                 * (Magic Statics)
                 */
                static EIREnv e;
                return e;
            }
    };

} // namespace direct_eir

#endif /* EIR_ENV_HPP_ */
