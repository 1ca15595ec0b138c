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

#ifndef BT_ADDRESS_HPP_
#define BT_ADDRESS_HPP_

#include <cstring>
#include <string>
#include <cstdint>
#include <array>
#include <functional>

#include <jau/basic_types.hpp>

namespace direct_eir {

    /**
     * Bluetooth device address, BD_ADDR.
     * <pre>
     * BT Core Spec v5.2:  Vol 2, Part B 1.2 Bluetooth device addressing
     * BT Core Spec v5.2:  Vol 6 LE, Part B Link Layer Specification: 1.3 Device Address
     * </pre>
     * <p>
     * An EUI-48 of 6 octets, stored in little endian byte order as received over the air.
     * </p>
     * <p>
     * Its string representation is the reversed octet order, i.e. most significant octet first,
     * in lower case hexadecimal separated by colon, e.g. `c0:10:22:a0:10:00`.
     * </p>
     * <p>
     * Instances are immutable after construction.
     * </p>
     */
    class BDAddress {
        public:
            /** Number of octets of a BDAddress, 6. */
            static constexpr const jau::nsize_t byte_size = 6;

            /** Fixed size octet array in little endian byte order. */
            typedef std::array<uint8_t, byte_size> octets_t;

            /** The all-zero address, equal to a default constructed BDAddress. */
            static const BDAddress ZERO;

        private:
            octets_t b; // little-endian

        public:
            constexpr BDAddress() noexcept : b{ { 0, 0, 0, 0, 0, 0 } } { }

            /** Constructs an address from the given little endian octet array. */
            explicit constexpr BDAddress(const octets_t & bytes) noexcept : b( bytes ) { }

            /**
             * Constructs an address from the given little endian octet sequence.
             * <p>
             * Given `len` must be 6, otherwise the program is aborted,
             * as a sequence of a different length is a violation of the caller's contract.
             * </p>
             * @param data non nullptr memory of `len` octets
             * @param len must be 6
             */
            BDAddress(uint8_t const * data, const jau::nsize_t len) noexcept;

            BDAddress(const BDAddress &o) noexcept = default;
            BDAddress(BDAddress &&o) noexcept = default;
            BDAddress& operator=(const BDAddress &o) noexcept = default;
            BDAddress& operator=(BDAddress &&o) noexcept = default;

            /** Returns a copy of the underlying little endian octets. */
            constexpr octets_t to_octets() const noexcept { return b; }

            /** Returns the underlying little endian octets. */
            inline uint8_t const * data() const noexcept { return b.data(); }

            constexpr jau::nsize_t size() const noexcept { return byte_size; }

            std::size_t hash_code() const noexcept {
                // 31 * x == (x << 5) - x
                std::size_t h = b[0];
                for(jau::nsize_t i=1; i<byte_size; ++i) {
                    h = ( ( h << 5 ) - h ) + b[i];
                }
                return h;
            }

            /** Returns the lower case `xx:xx:xx:xx:xx:xx` representation, most significant octet first. */
            std::string toString() const noexcept;
    };

    inline bool operator==(const BDAddress& lhs, const BDAddress& rhs) noexcept {
        if( &lhs == &rhs ) {
            return true;
        }
        return 0 == memcmp(lhs.data(), rhs.data(), BDAddress::byte_size);
    }
    inline bool operator!=(const BDAddress& lhs, const BDAddress& rhs) noexcept
    { return !(lhs == rhs); }

    inline std::string to_string(const BDAddress& a) noexcept { return a.toString(); }

} // namespace direct_eir

// injecting specialization of std::hash to namespace std of our types above
namespace std
{
    template<> struct hash<direct_eir::BDAddress> {
        std::size_t operator()(direct_eir::BDAddress const& a) const noexcept {
            return a.hash_code();
        }
    };
}

#endif /* BT_ADDRESS_HPP_ */
