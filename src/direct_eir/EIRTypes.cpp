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
#include <memory>
#include <cstdint>
#include <cstdio>

#include <jau/debug.hpp>
#include <jau/darray.hpp>

#include "EIRTypes.hpp"

using namespace direct_eir;

template<typename T>
static void append_bitstr(std::string& out, T mask, T bit, const std::string& bitstr, bool& comma) {
    if( bit == ( mask & bit ) ) {
        if( comma ) { out.append(", "); }
        out.append(bitstr); comma = true;
    }
}
#define APPEND_BITSTR(U,V,M) append_bitstr(out, M, U::V, #V, comma);

#define CASE2_TO_STRING(U,V) case U::V: return #V;

template<typename T, typename F>
static void append_list(std::string& out, const jau::darray<T>& list, F to_str) {
    bool comma = false;
    for(const T& e : list) {
        if( comma ) { out.append(", "); }
        out.append( to_str(e) ); comma = true;
    }
}

template<typename T>
static bool equal_list(const jau::darray<T>& lhs, const jau::darray<T>& rhs) {
    if( lhs.size() != rhs.size() ) {
        return false;
    }
    for(jau::nsize_t i=0; i<lhs.size(); ++i) {
        if( lhs[i] != rhs[i] ) {
            return false;
        }
    }
    return true;
}

// *************************************************
// *************************************************
// *************************************************

#define GAP_T_ENUM(X) \
    X(GAP_T,NONE) \
    X(GAP_T,FLAGS) \
    X(GAP_T,UUID16_INCOMPLETE) \
    X(GAP_T,UUID16_COMPLETE) \
    X(GAP_T,UUID32_INCOMPLETE) \
    X(GAP_T,UUID32_COMPLETE) \
    X(GAP_T,UUID128_INCOMPLETE) \
    X(GAP_T,UUID128_COMPLETE) \
    X(GAP_T,NAME_LOCAL_SHORT) \
    X(GAP_T,NAME_LOCAL_COMPLETE) \
    X(GAP_T,TX_POWER_LEVEL) \
    X(GAP_T,URI) \
    X(GAP_T,MANUFACTURE_SPECIFIC)

std::string direct_eir::to_string(const GAP_T v) noexcept {
    switch(v) {
        GAP_T_ENUM(CASE2_TO_STRING)
        default: ; // fall through intended
    }
    return "Unknown GAP_T "+jau::to_hexstring(number(v));
}

// *************************************************
// *************************************************
// *************************************************

#define GAPFLAGS_ENUM(X,M) \
    X(GAPFlags,LE_Ltd_Disc,M) \
    X(GAPFlags,LE_Gen_Disc,M) \
    X(GAPFlags,BREDR_UNSUP,M) \
    X(GAPFlags,Dual_SameCtrl,M) \
    X(GAPFlags,Dual_SameHost,M)

std::string direct_eir::to_string(const GAPFlags v) noexcept {
    std::string out("[");
    bool comma = false;
    GAPFLAGS_ENUM(APPEND_BITSTR,v)
    out.append("]");
    return out;
}

// *************************************************
// *************************************************
// *************************************************

#define EIRSTATUS_ENUM(X) \
    X(EIRStatus,SUCCESS) \
    X(EIRStatus,REPEATED_FLAG) \
    X(EIRStatus,REPEATED_NAME) \
    X(EIRStatus,UNEXPECTED_DATA_LENGTH) \
    X(EIRStatus,INVALID_TEXT)

std::string direct_eir::to_string(const EIRStatus ec) noexcept {
    switch(ec) {
        EIRSTATUS_ENUM(CASE2_TO_STRING)
        default: ; // fall through intended
    }
    return "Unknown EIRStatus "+jau::to_hexstring(number(ec));
}

std::string direct_eir::getEIRStatusDescription(const EIRStatus ec) noexcept {
    switch(ec) {
        case EIRStatus::SUCCESS:
            return "Success.";
        case EIRStatus::REPEATED_FLAG:
            return "More than one flag block found.";
        case EIRStatus::REPEATED_NAME:
            return "More than one name block found.";
        case EIRStatus::UNEXPECTED_DATA_LENGTH:
            return "Unexpected data length.";
        case EIRStatus::INVALID_TEXT:
            return "Invalid text encoding.";
    }
    return "Unknown EIRStatus "+jau::to_hexstring(number(ec));
}

// *************************************************
// *************************************************
// *************************************************

ManufactureSpecificData::ManufactureSpecificData(uint16_t const company_)
: company(company_),
  data(jau::lb_endian::little /* intentional zero sized */)
{ }

ManufactureSpecificData::ManufactureSpecificData(uint16_t const company_, uint8_t const * const data_, jau::nsize_t const data_len)
: company(company_),
  data(data_, data_len, jau::lb_endian::little)
{ }

std::string ManufactureSpecificData::toString() const noexcept {
  std::string out("MSD[company ");
  out.append(jau::to_hexstring(company));
  out.append(", data["+data.toString()+"]]");
  return out;
}

// *************************************************
// *************************************************
// *************************************************

#define EIRRECORD_TYPE_ENUM(X) \
    X(EIRRecord::Type,FLAGS) \
    X(EIRRecord::Type,UUID16_LIST) \
    X(EIRRecord::Type,UUID32_LIST) \
    X(EIRRecord::Type,UUID128_LIST) \
    X(EIRRecord::Type,NAME) \
    X(EIRRecord::Type,TX_POWER_LEVEL) \
    X(EIRRecord::Type,URI) \
    X(EIRRecord::Type,MANUFACTURE_SPECIFIC)

std::string EIRRecord::getTypeString(const Type type) noexcept {
    switch(type) {
        EIRRECORD_TYPE_ENUM(CASE2_TO_STRING)
    }
    return "Unknown EIRRecord::Type "+jau::to_hexstring(number(type));
}

std::string EIRUUID16Record::valueString() const noexcept {
    std::string out;
    append_list(out, uuids, [](const uint16_t v) { return jau::to_hexstring(v); });
    return out;
}

bool EIRUUID16Record::equalValue(const EIRRecord& o) const noexcept {
    return equal_list(uuids, static_cast<const EIRUUID16Record&>(o).uuids);
}

std::string EIRUUID32Record::valueString() const noexcept {
    std::string out;
    append_list(out, uuids, [](const uint32_t v) { return jau::to_hexstring(v); });
    return out;
}

bool EIRUUID32Record::equalValue(const EIRRecord& o) const noexcept {
    return equal_list(uuids, static_cast<const EIRUUID32Record&>(o).uuids);
}

std::string EIRUUID128Record::valueString() const noexcept {
    std::string out;
    append_list(out, uuids, [](const std::shared_ptr<const jau::uuid_t>& v) { return v->toString(); });
    return out;
}

bool EIRUUID128Record::equalValue(const EIRRecord& o) const noexcept {
    const jau::darray<std::shared_ptr<const jau::uuid_t>>& o_uuids = static_cast<const EIRUUID128Record&>(o).uuids;
    if( uuids.size() != o_uuids.size() ) {
        return false;
    }
    for(jau::nsize_t i=0; i<uuids.size(); ++i) {
        if( *uuids[i] != *o_uuids[i] ) {
            return false;
        }
    }
    return true;
}

std::string EIRTxPowerRecord::valueString() const noexcept {
    std::string out;
    append_list(out, levels, [](const int8_t v) { return std::to_string(v)+" dBm"; });
    return out;
}

bool EIRTxPowerRecord::equalValue(const EIRRecord& o) const noexcept {
    return equal_list(levels, static_cast<const EIRTxPowerRecord&>(o).levels);
}

std::string EIRURIRecord::valueString() const noexcept {
    std::string out;
    append_list(out, uris, [](const std::string& v) { return "'"+v+"'"; });
    return out;
}

bool EIRURIRecord::equalValue(const EIRRecord& o) const noexcept {
    return equal_list(uris, static_cast<const EIRURIRecord&>(o).uris);
}

std::string EIRManufacturerRecord::valueString() const noexcept {
    std::string out;
    append_list(out, msds, [](const ManufactureSpecificData& v) { return v.toString(); });
    return out;
}

bool EIRManufacturerRecord::equalValue(const EIRRecord& o) const noexcept {
    return equal_list(msds, static_cast<const EIRManufacturerRecord&>(o).msds);
}
