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

#ifndef EIR_TYPES_HPP_
#define EIR_TYPES_HPP_

#include <cstring>
#include <string>
#include <memory>
#include <cstdint>
#include <system_error>

#include <jau/basic_types.hpp>
#include <jau/darray.hpp>
#include <jau/octets.hpp>
#include <jau/uuid.hpp>

namespace direct_eir {

    /** \addtogroup DirectEIRAPI
     *
     *  @{
     */

    /**
     * Assigned numbers are used in Generic Access Profile (GAP) for inquiry response,
     * EIR data type values, manufacturer-specific data and advertising data.
     * <p>
     * Type identifier values as defined in "Assigned Numbers - Generic Access Profile"
     * <https://www.bluetooth.com/specifications/assigned-numbers/generic-access-profile/>
     * </p>
     * <p>
     * Also see Bluetooth Core Specification Supplement V9, Part A: 1, p 9 pp
     * for data format definitions.
     * </p>
     * <p>
     * For data segment layout see Bluetooth Core Specification V5.2 [Vol. 3, Part C, 11, p 1392]
     * </p>
     * <p>
     * Only the data types recognized by the EIR decoder are listed,
     * all other values are treated as unknown and skipped.
     * </p>
     */
    enum class GAP_T : uint8_t {
        NONE                    = 0x00,

        /** Flags */
        FLAGS                   = 0x01,
        /** Incomplete List of 16-bit Service Class UUID. (Supplement, Part A, section 1.1)*/
        UUID16_INCOMPLETE       = 0x02,
        /** Complete List of 16-bit Service Class UUID. (Supplement, Part A, section 1.1) */
        UUID16_COMPLETE         = 0x03,
        /** Incomplete List of 32-bit Service Class UUID. (Supplement, Part A, section 1.1) */
        UUID32_INCOMPLETE       = 0x04,
        /** Complete List of 32-bit Service Class UUID. (Supplement, Part A, section 1.1) */
        UUID32_COMPLETE         = 0x05,
        /** Incomplete List of 128-bit Service Class UUID. (Supplement, Part A, section 1.1) */
        UUID128_INCOMPLETE      = 0x06,
        /** Complete List of 128-bit Service Class UUID. (Supplement, Part A, section 1.1) */
        UUID128_COMPLETE        = 0x07,
        /** Shortened local name (Supplement, Part A, section 1.2) */
        NAME_LOCAL_SHORT        = 0x08,
        /** Complete local name (Supplement, Part A, section 1.2) */
        NAME_LOCAL_COMPLETE     = 0x09,
        /** Transmit power level (Supplement, Part A, section 1.5) */
        TX_POWER_LEVEL          = 0x0A,
        /* URI (Supplement, Part A, section 1.18) */
        URI                     = 0x24,

        /** Manufacturer id code and specific opaque data */
        MANUFACTURE_SPECIFIC    = 0xFF
    };
    constexpr uint8_t number(const GAP_T rhs) noexcept { return static_cast<uint8_t>(rhs); }
    std::string to_string(const GAP_T v) noexcept;

    // *************************************************
    // *************************************************
    // *************************************************

    /**
     * GAP Flags values, see Bluetooth Core Specification Supplement V9, Part A: 1.3, p 12 pp
     *
     * @see EIRFlagsRecord
     */
    enum class GAPFlags : uint8_t {
        NONE                   = 0,
        LE_Ltd_Disc            = (1 << 0),
        LE_Gen_Disc            = (1 << 1),
        BREDR_UNSUP            = (1 << 2),
        Dual_SameCtrl          = (1 << 3),
        Dual_SameHost          = (1 << 4)
    };
    constexpr uint8_t number(const GAPFlags rhs) noexcept { return static_cast<uint8_t>(rhs); }
    constexpr GAPFlags operator |(const GAPFlags lhs, const GAPFlags rhs) noexcept {
        return static_cast<GAPFlags> ( number(lhs) | number(rhs) );
    }
    constexpr GAPFlags operator &(const GAPFlags lhs, const GAPFlags rhs) noexcept {
        return static_cast<GAPFlags> ( number(lhs) & number(rhs) );
    }
    constexpr bool operator ==(const GAPFlags lhs, const GAPFlags rhs) noexcept {
        return number(lhs) == number(rhs);
    }
    constexpr bool operator !=(const GAPFlags lhs, const GAPFlags rhs) noexcept {
        return !( lhs == rhs );
    }
    constexpr bool is_set(const GAPFlags mask, const GAPFlags bit) noexcept { return bit == ( mask & bit ); }

    /** Union of all defined GAPFlags bits. */
    inline constexpr const GAPFlags GAPFlags_MASK = GAPFlags::LE_Ltd_Disc | GAPFlags::LE_Gen_Disc |
                                                    GAPFlags::BREDR_UNSUP | GAPFlags::Dual_SameCtrl | GAPFlags::Dual_SameHost;

    /**
     * Returns the GAPFlags of the given raw octet, dropping all undefined bits.
     */
    constexpr GAPFlags to_GAPFlags(const uint8_t v) noexcept {
        return static_cast<GAPFlags>( v & number(GAPFlags_MASK) );
    }
    std::string to_string(const GAPFlags v) noexcept;

    // *************************************************
    // *************************************************
    // *************************************************

    /**
     * Classified result of decoding EIR or AD data.
     * <p>
     * Any value other than EIRStatus::SUCCESS terminates decoding of the whole data buffer.
     * </p>
     * @see decode_eir()
     */
    enum class EIRStatus : uint8_t {
        SUCCESS                 = 0x00,
        /** More than one FLAGS data element. */
        REPEATED_FLAG           = 0x01,
        /** More than one local name data element, short or complete. */
        REPEATED_NAME           = 0x02,
        /** Data element length violates its data type's size constraint. */
        UNEXPECTED_DATA_LENGTH  = 0x03,
        /** Invalid encoded text for data types requiring validated text. */
        INVALID_TEXT            = 0x04
    };
    constexpr uint8_t number(const EIRStatus rhs) noexcept {
        return static_cast<uint8_t>(rhs);
    }
    std::string to_string(const EIRStatus ec) noexcept;

    /** Returns a human readable description of the given EIRStatus. */
    std::string getEIRStatusDescription(const EIRStatus ec) noexcept;

    class EIRStatusCategory : public std::error_category {
        public:
            const char* name() const noexcept override { return "EIR"; }
            std::string message(int condition) const override {
                return "EIR::"+to_string( static_cast<EIRStatus>(condition) );
            }
            static EIRStatusCategory& get() {
                static EIRStatusCategory s;
                return s;
            }
    };
    inline std::error_code make_error_code( EIRStatus e ) noexcept {
      return std::error_code( number(e), EIRStatusCategory::get() );
    }

    // *************************************************
    // *************************************************
    // *************************************************

    class ManufactureSpecificData
    {
        private:
            uint16_t company;
            jau::POctets data;

        public:
            ManufactureSpecificData(uint16_t const company);
            ManufactureSpecificData(uint16_t const company, uint8_t const * const data, jau::nsize_t const data_len);

            ManufactureSpecificData(const ManufactureSpecificData &o) = default;
            ManufactureSpecificData(ManufactureSpecificData &&o) = default;
            ManufactureSpecificData& operator=(const ManufactureSpecificData &o) = default;
            ManufactureSpecificData& operator=(ManufactureSpecificData &&o) = default;

            constexpr uint16_t getCompany() const noexcept { return company; }

            const jau::TROOctets& getData() const noexcept { return data; }

            std::string toString() const noexcept;
    };

    inline bool operator==(const ManufactureSpecificData& lhs, const ManufactureSpecificData& rhs) noexcept
    { return lhs.getCompany() == rhs.getCompany() && lhs.getData() == rhs.getData(); }

    inline bool operator!=(const ManufactureSpecificData& lhs, const ManufactureSpecificData& rhs) noexcept
    { return !(lhs == rhs); }

    // *************************************************
    // *************************************************
    // *************************************************

    /**
     * One decoded logical field of 'Extended Inquiry Response' (EIR) or 'Advertising Data' (AD).
     * <p>
     * The set of record types is closed, see EIRRecord::Type.
     * Each type is represented by one specialization:
     * <pre>
     * Type::FLAGS                -> EIRFlagsRecord
     * Type::UUID16_LIST          -> EIRUUID16Record
     * Type::UUID32_LIST          -> EIRUUID32Record
     * Type::UUID128_LIST         -> EIRUUID128Record
     * Type::NAME                 -> EIRNameRecord
     * Type::TX_POWER_LEVEL       -> EIRTxPowerRecord
     * Type::URI                  -> EIRURIRecord
     * Type::MANUFACTURE_SPECIFIC -> EIRManufacturerRecord
     * </pre>
     * </p>
     * <p>
     * The EIR decoder currently produces FLAGS, UUID16_LIST and NAME only,
     * the other types are reserved for data types recognized but not yet decoded.
     * </p>
     */
    class EIRRecord
    {
        public:
            enum class Type : uint8_t {
                FLAGS                   = 0,
                UUID16_LIST             = 1,
                UUID32_LIST             = 2,
                UUID128_LIST            = 3,
                NAME                    = 4,
                TX_POWER_LEVEL          = 5,
                URI                     = 6,
                MANUFACTURE_SPECIFIC    = 7
            };
            static constexpr uint8_t number(const Type rhs) noexcept {
                return static_cast<uint8_t>(rhs);
            }
            static std::string getTypeString(const Type type) noexcept;

        private:
            Type type;

        protected:
            EIRRecord(const Type type_) noexcept : type(type_) {}

            virtual std::string valueString() const noexcept = 0;

            /** Returns true if this value equals the value of given `o`, which is of the same Type. */
            virtual bool equalValue(const EIRRecord& o) const noexcept = 0;

            EIRRecord(const EIRRecord &o) noexcept = default;
            EIRRecord(EIRRecord &&o) noexcept = default;
            EIRRecord& operator=(const EIRRecord &o) noexcept = default;
            EIRRecord& operator=(EIRRecord &&o) noexcept = default;

        public:
            virtual ~EIRRecord() noexcept {}

            constexpr Type getType() const noexcept { return type; }

            bool operator==(const EIRRecord& o) const noexcept {
                if( this == &o ) {
                    return true;
                }
                return type == o.type && equalValue(o);
            }
            bool operator!=(const EIRRecord& o) const noexcept {
                return !( *this == o );
            }

            std::string toString() const noexcept {
                return getTypeString(type)+"["+valueString()+"]";
            }
    };
    inline std::string to_string(const EIRRecord::Type type) noexcept { return EIRRecord::getTypeString(type); }

    /** Ordered list of decoded EIRRecord, order of first appearance. */
    typedef jau::darray<std::unique_ptr<EIRRecord>> EIRRecordList;

    /**
     * GAP Flags, see Bluetooth Core Specification Supplement V9, Part A: 1.3
     */
    class EIRFlagsRecord : public EIRRecord
    {
        private:
            GAPFlags flags;

        protected:
            std::string valueString() const noexcept override { return to_string(flags); }

            bool equalValue(const EIRRecord& o) const noexcept override {
                return flags == static_cast<const EIRFlagsRecord&>(o).flags;
            }

        public:
            EIRFlagsRecord(const GAPFlags flags_) noexcept
            : EIRRecord(Type::FLAGS), flags(flags_) {}

            constexpr GAPFlags getFlags() const noexcept { return flags; }
    };

    /**
     * List of 16-bit Service Class UUID, see Bluetooth Core Specification Supplement V9, Part A: 1.1
     * <p>
     * Incomplete and complete lists of one data buffer are merged into one instance.
     * </p>
     */
    class EIRUUID16Record : public EIRRecord
    {
        private:
            jau::darray<uint16_t> uuids;

        protected:
            std::string valueString() const noexcept override;

            bool equalValue(const EIRRecord& o) const noexcept override;

        public:
            EIRUUID16Record() noexcept
            : EIRRecord(Type::UUID16_LIST), uuids() {}

            EIRUUID16Record(const jau::darray<uint16_t>& uuids_)
            : EIRRecord(Type::UUID16_LIST), uuids(uuids_) {}

            void add(const uint16_t uuid) { uuids.push_back(uuid); }

            const jau::darray<uint16_t>& getUUIDs() const noexcept { return uuids; }
            jau::nsize_t size() const noexcept { return uuids.size(); }
    };

    /**
     * List of 32-bit Service Class UUID, see Bluetooth Core Specification Supplement V9, Part A: 1.1
     * <p>
     * Reserved, data type GAP_T::UUID32_INCOMPLETE and GAP_T::UUID32_COMPLETE are not yet decoded.
     * </p>
     */
    class EIRUUID32Record : public EIRRecord
    {
        private:
            jau::darray<uint32_t> uuids;

        protected:
            std::string valueString() const noexcept override;

            bool equalValue(const EIRRecord& o) const noexcept override;

        public:
            EIRUUID32Record() noexcept
            : EIRRecord(Type::UUID32_LIST), uuids() {}

            EIRUUID32Record(const jau::darray<uint32_t>& uuids_)
            : EIRRecord(Type::UUID32_LIST), uuids(uuids_) {}

            void add(const uint32_t uuid) { uuids.push_back(uuid); }

            const jau::darray<uint32_t>& getUUIDs() const noexcept { return uuids; }
            jau::nsize_t size() const noexcept { return uuids.size(); }
    };

    /**
     * List of 128-bit Service Class UUID, see Bluetooth Core Specification Supplement V9, Part A: 1.1
     * <p>
     * Reserved, data type GAP_T::UUID128_INCOMPLETE and GAP_T::UUID128_COMPLETE are not yet decoded.
     * </p>
     */
    class EIRUUID128Record : public EIRRecord
    {
        private:
            jau::darray<std::shared_ptr<const jau::uuid_t>> uuids;

        protected:
            std::string valueString() const noexcept override;

            bool equalValue(const EIRRecord& o) const noexcept override;

        public:
            EIRUUID128Record() noexcept
            : EIRRecord(Type::UUID128_LIST), uuids() {}

            void add(const jau::uuid128_t& uuid) { uuids.push_back( std::make_shared<const jau::uuid128_t>(uuid) ); }

            const jau::darray<std::shared_ptr<const jau::uuid_t>>& getUUIDs() const noexcept { return uuids; }
            jau::nsize_t size() const noexcept { return uuids.size(); }
    };

    /**
     * Local name, either shortened or complete, see Bluetooth Core Specification Supplement V9, Part A: 1.2
     * <p>
     * INFO: Bluetooth Core Specification V5.2 [Vol. 3, Part C, 8, p 1341]
     * A remote name request is required to obtain the full name, if not complete.
     * </p>
     */
    class EIRNameRecord : public EIRRecord
    {
        private:
            std::string name;
            bool complete;

        protected:
            std::string valueString() const noexcept override {
                return "'"+name+"', "+( complete ? "complete" : "short" );
            }

            bool equalValue(const EIRRecord& o) const noexcept override {
                const EIRNameRecord& o2 = static_cast<const EIRNameRecord&>(o);
                return complete == o2.complete && name == o2.name;
            }

        public:
            EIRNameRecord(const std::string& name_, const bool complete_)
            : EIRRecord(Type::NAME), name(name_), complete(complete_) {}

            EIRNameRecord(std::string&& name_, const bool complete_) noexcept
            : EIRRecord(Type::NAME), name(std::move(name_)), complete(complete_) {}

            const std::string& getName() const noexcept { return name; }

            /** Returns true if the name is complete, false if shortened. */
            constexpr bool isComplete() const noexcept { return complete; }
    };

    /**
     * Transmit power levels in dBm, see Bluetooth Core Specification Supplement V9, Part A: 1.5
     * <p>
     * Reserved, data type GAP_T::TX_POWER_LEVEL is not yet decoded.
     * </p>
     */
    class EIRTxPowerRecord : public EIRRecord
    {
        private:
            jau::darray<int8_t> levels;

        protected:
            std::string valueString() const noexcept override;

            bool equalValue(const EIRRecord& o) const noexcept override;

        public:
            EIRTxPowerRecord() noexcept
            : EIRRecord(Type::TX_POWER_LEVEL), levels() {}

            void add(const int8_t level) { levels.push_back(level); }

            const jau::darray<int8_t>& getLevels() const noexcept { return levels; }
    };

    /**
     * URIs, see Bluetooth Core Specification Supplement V9, Part A: 1.18
     * <p>
     * Reserved, data type GAP_T::URI is not yet decoded.
     * </p>
     */
    class EIRURIRecord : public EIRRecord
    {
        private:
            jau::darray<std::string> uris;

        protected:
            std::string valueString() const noexcept override;

            bool equalValue(const EIRRecord& o) const noexcept override;

        public:
            EIRURIRecord() noexcept
            : EIRRecord(Type::URI), uris() {}

            void add(const std::string& uri) { uris.push_back(uri); }

            const jau::darray<std::string>& getURIs() const noexcept { return uris; }
    };

    /**
     * Manufacturer specific data, see Bluetooth Core Specification Supplement V9, Part A: 1.4
     * <p>
     * Reserved, data type GAP_T::MANUFACTURE_SPECIFIC is not yet decoded.
     * </p>
     */
    class EIRManufacturerRecord : public EIRRecord
    {
        private:
            jau::darray<ManufactureSpecificData> msds;

        protected:
            std::string valueString() const noexcept override;

            bool equalValue(const EIRRecord& o) const noexcept override;

        public:
            EIRManufacturerRecord() noexcept
            : EIRRecord(Type::MANUFACTURE_SPECIFIC), msds() {}

            void add(const ManufactureSpecificData& msd) { msds.push_back(msd); }

            const jau::darray<ManufactureSpecificData>& getData() const noexcept { return msds; }
    };

    /**@}*/

} // namespace direct_eir

// Injecting specialization of std::is_error_code_enum,
// enabling implicit conversion of EIRStatus to std::error_code.
namespace std
{
    template <>
        struct is_error_code_enum<direct_eir::EIRStatus> : true_type {};
}

#endif /* EIR_TYPES_HPP_ */
