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

#ifndef EIR_DECODER_HPP_
#define EIR_DECODER_HPP_

#include <cstdint>
#include <string>
#include <memory>
#include <system_error>

#include <jau/basic_types.hpp>
#include <jau/octets.hpp>

#include "OctetTypes.hpp"
#include "EIRTypes.hpp"

/**
 * - - - - - - - - - - - - - - -
 *
 * Module EIRDecoder:
 *
 * - BT Core Spec v5.2: Vol 3, Part C Generic Access Profile (GAP): 8 EXTENDED INQUIRY RESPONSE DATA FORMAT
 * - BT Core Spec v5.2: Vol 3, Part C Generic Access Profile (GAP): 11 ADVERTISING AND SCAN RESPONSE DATA FORMAT
 * - BT Core Spec Supplement v9, Part A: Section 1 + 2 Examples, p25..
 *
 * - - - - - - - - - - - - - - -
 */
namespace direct_eir {

    /**
     * Result of decode_eir(), either EIRStatus::SUCCESS with the ordered records
     * or the terminating EIRStatus without any records.
     */
    class EIRDecodeResult
    {
        private:
            EIRStatus status;
            jau::nsize_t data_length;
            EIRRecordList records;

        public:
            /** Successful result owning the given records. */
            explicit EIRDecodeResult(EIRRecordList && records_) noexcept
            : status(EIRStatus::SUCCESS), data_length(0), records(std::move(records_)) {}

            /**
             * Failed result without records.
             * @param status_ the terminating status
             * @param data_length_ the observed data length for EIRStatus::UNEXPECTED_DATA_LENGTH, otherwise zero
             */
            EIRDecodeResult(const EIRStatus status_, const jau::nsize_t data_length_) noexcept
            : status(status_), data_length(data_length_), records() {}

            EIRDecodeResult(const EIRDecodeResult &o) = delete;
            EIRDecodeResult(EIRDecodeResult &&o) = default;
            EIRDecodeResult& operator=(const EIRDecodeResult &o) = delete;
            EIRDecodeResult& operator=(EIRDecodeResult &&o) = default;

            bool isOK() const noexcept { return EIRStatus::SUCCESS == status; }

            EIRStatus getStatus() const noexcept { return status; }

            /** Observed data length for EIRStatus::UNEXPECTED_DATA_LENGTH, otherwise zero. */
            jau::nsize_t getDataLength() const noexcept { return data_length; }

            std::error_code getErrorCode() const noexcept { return make_error_code(status); }

            /** Returns the ordered records, empty if not isOK(). */
            const EIRRecordList& getRecords() const noexcept { return records; }

            /** Releases the ordered records to the caller, leaving this result empty. */
            EIRRecordList releaseRecords() noexcept { return std::move(records); }

            /** Returns the description of the status, including the observed data length if applicable. */
            std::string getDescription() const noexcept;

            std::string toString() const noexcept;
    };

    /**
     * Decodes the 'Extended Inquiry Response' (EIR) or 'Advertising Data' (AD)
     * structure from the given cursor's current position in one pass.
     * <p>
     * Each data element consists of a length octet `L`, a type octet and `L-1` data octets.
     * Decoding stops at the end of the cursor or at the first `L == 0` octet,
     * trailing octets are ignored.
     * </p>
     * <p>
     * Records are returned in order of first appearance of each logical field,
     * all 16-bit UUID lists are merged into one record.
     * Recognized but not yet decoded data types as well as unknown types are skipped.
     * </p>
     * <p>
     * Any violation terminates the whole decode, returning its EIRStatus without records.
     * The decoder never reads beyond the cursor's size, regardless of the declared lengths.
     * </p>
     * @param cursor the source, its position is advanced up to the decoding end
     */
    EIRDecodeResult decode_eir(OctetCursor & cursor);

    /** Decodes the given `data_length` octets at `data`, see decode_eir(OctetCursor&). */
    EIRDecodeResult decode_eir(uint8_t const * data, const jau::nsize_t data_length);

    /** Decodes the given octets, see decode_eir(OctetCursor&). */
    EIRDecodeResult decode_eir(const jau::TROOctets & data);

    /**
     * Returns the given octets decoded as UTF-8 text,
     * where each maximal invalid subsequence is replaced by U+FFFD.
     */
    std::string decode_utf8_lossy(uint8_t const * data, const jau::nsize_t data_length);

} // namespace direct_eir

#endif /* EIR_DECODER_HPP_ */
