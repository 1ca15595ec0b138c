/*
 * Author: Sven Gothel <sgothel@jausoft.com>
 * Copyright (c) 2020 Gothel Software e.K.
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

#ifndef OCTET_TYPES_HPP_
#define OCTET_TYPES_HPP_

#include <cstring>
#include <string>
#include <cstdint>
#include <algorithm>

#include <jau/basic_types.hpp>
#include <jau/octets.hpp>

namespace direct_eir {

    /**
     * Transient read only octet cursor, i.e. non persistent passthrough, owned by caller.
     * <p>
     * The cursor reads sequentially from its current position up to its size,
     * which is the readable size of the passed memory.
     * </p>
     * <p>
     * All multi-octet values are read in little endian byte order,
     * as used for EIR and AD data.
     * </p>
     * <p>
     * Reading beyond the readable size throws an jau::IndexOutOfBoundsException.
     * </p>
     */
    class OctetCursor
    {
        private:
            /** Non-null memory pointer unless size is zero. Actual capacity known by owner. */
            uint8_t const * _data;
            /** Readable size of the memory, may be zero. */
            jau::nsize_t _size;
            /** Read position, never greater than _size. */
            jau::nsize_t _pos;

            static inline void checkPtr(uint8_t const * d, const jau::nsize_t s) {
                if( nullptr == d && 0 < s ) {
                    throw jau::IllegalArgumentException("OctetCursor: nullptr with size "+std::to_string(s)+" > 0", E_FILE_LINE);
                }
            }

        public:
            /**
             * Transient passthrough read-only memory, w/o ownership ..
             * @param source a non nullptr memory, otherwise throws exception. Actual capacity known by owner.
             * @param len readable size of the memory, may be zero
             */
            OctetCursor(uint8_t const * source, const jau::nsize_t len)
            : _data( source ), _size( len ), _pos( 0 ) {
                checkPtr(_data, _size);
            }

            /** Transient passthrough of the given octets, which must outlive this cursor. */
            explicit OctetCursor(const jau::TROOctets & source)
            : OctetCursor(source.get_ptr(), source.size()) {}

            OctetCursor(const OctetCursor &o) noexcept = default;
            OctetCursor(OctetCursor &&o) noexcept = default;
            OctetCursor& operator=(const OctetCursor &o) noexcept = default;
            OctetCursor& operator=(OctetCursor &&o) noexcept = default;

            inline void check_range(const jau::nsize_t count, const char *file, int line) const {
                if( count > _size - _pos ) {
                    throw jau::IndexOutOfBoundsException(_pos, count, _size, file, line);
                }
            }

            inline bool is_range_valid(const jau::nsize_t count) const noexcept {
                return count <= _size - _pos;
            }

            /** Returns the readable size of the underlying memory, may be zero. */
            constexpr jau::nsize_t size() const noexcept { return _size; }

            /** Returns the current read position. */
            constexpr jau::nsize_t position() const noexcept { return _pos; }

            /** Returns the number of octets left to read. */
            constexpr jau::nsize_t remaining() const noexcept { return _size - _pos; }

            constexpr bool has_remaining() const noexcept { return _pos < _size; }

            uint8_t get_uint8() {
                check_range(1, E_FILE_LINE);
                return _data[_pos++];
            }

            int8_t get_int8() {
                check_range(1, E_FILE_LINE);
                return static_cast<int8_t>( _data[_pos++] );
            }

            uint16_t get_uint16() {
                check_range(2, E_FILE_LINE);
                const uint16_t v = jau::get_uint16(_data + _pos, jau::lb_endian::little);
                _pos += 2;
                return v;
            }

            uint32_t get_uint32() {
                check_range(4, E_FILE_LINE);
                const uint32_t v = jau::get_uint32(_data + _pos, jau::lb_endian::little);
                _pos += 4;
                return v;
            }

            /** Returns the memory pointer at the current read position, valid for remaining() octets. */
            inline uint8_t const * get_ptr() const noexcept { return _data + _pos; }

            /** Advances the read position by count octets. */
            void skip(const jau::nsize_t count) {
                check_range(count, E_FILE_LINE);
                _pos += count;
            }

            /** Advances the read position to the end, discarding all remaining octets. */
            void skip_remaining() noexcept { _pos = _size; }

            /**
             * Returns a bounded sub-cursor covering the next `min(count, remaining())` octets
             * and advances this cursor's read position past them.
             * <p>
             * The returned cursor shares this cursor's memory and can never read beyond it,
             * even if `count` exceeds the remaining octets.
             * </p>
             */
            OctetCursor take(const jau::nsize_t count) {
                const jau::nsize_t n = std::min(count, remaining());
                OctetCursor sub(get_ptr(), n);
                _pos += n;
                return sub;
            }

            std::string toString() const noexcept {
                return "OctetCursor[pos "+std::to_string(_pos)+", size "+std::to_string(_size)+", data "+
                        jau::bytesHexString(_data, 0, _size, true /* lsbFirst */)+"]";
            }
    };

} // namespace direct_eir

#endif /* OCTET_TYPES_HPP_ */
