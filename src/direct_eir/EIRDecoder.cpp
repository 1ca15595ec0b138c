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

#include <jau/debug.hpp>
#include <jau/dfa_utf8_decode.hpp>

#include "EIREnv.hpp"
#include "EIRDecoder.hpp"

using namespace direct_eir;

// *************************************************
// *************************************************
// *************************************************

static void append_utf8(std::string& out, const uint32_t codep) {
    if( codep < 0x80 ) {
        out.push_back( static_cast<char>( codep ) );
    } else if( codep < 0x800 ) {
        out.push_back( static_cast<char>( 0xC0 | ( codep >> 6 ) ) );
        out.push_back( static_cast<char>( 0x80 | ( codep & 0x3F ) ) );
    } else if( codep < 0x10000 ) {
        out.push_back( static_cast<char>( 0xE0 | ( codep >> 12 ) ) );
        out.push_back( static_cast<char>( 0x80 | ( ( codep >> 6 ) & 0x3F ) ) );
        out.push_back( static_cast<char>( 0x80 | ( codep & 0x3F ) ) );
    } else {
        out.push_back( static_cast<char>( 0xF0 | ( codep >> 18 ) ) );
        out.push_back( static_cast<char>( 0x80 | ( ( codep >> 12 ) & 0x3F ) ) );
        out.push_back( static_cast<char>( 0x80 | ( ( codep >> 6 ) & 0x3F ) ) );
        out.push_back( static_cast<char>( 0x80 | ( codep & 0x3F ) ) );
    }
}

static constexpr const uint32_t REPLACEMENT_CHARACTER = 0xFFFD;

std::string direct_eir::decode_utf8_lossy(uint8_t const * data, const jau::nsize_t data_length) {
    std::string out;
    out.reserve(data_length);
    uint32_t codep = 0;
    uint32_t state = DFA_UTF8_ACCEPT;
    jau::nsize_t i = 0;
    while( i < data_length ) {
        const uint32_t last_state = state;
        jau::dfa_utf8_decode(state, codep, data[i]);
        if( DFA_UTF8_ACCEPT == state ) {
            append_utf8(out, codep);
            ++i;
        } else if( DFA_UTF8_REJECT == state ) {
            append_utf8(out, REPLACEMENT_CHARACTER);
            state = DFA_UTF8_ACCEPT;
            if( DFA_UTF8_ACCEPT == last_state ) {
                ++i; // invalid lead octet consumed, otherwise re-read as potential lead octet
            }
        } else {
            ++i;
        }
    }
    if( DFA_UTF8_ACCEPT != state ) {
        append_utf8(out, REPLACEMENT_CHARACTER); // truncated sequence
    }
    return out;
}

// *************************************************
// *************************************************
// *************************************************

std::string EIRDecodeResult::getDescription() const noexcept {
    if( EIRStatus::UNEXPECTED_DATA_LENGTH == status ) {
        return "Unexpected data length "+std::to_string(data_length)+".";
    }
    return getEIRStatusDescription(status);
}

std::string EIRDecodeResult::toString() const noexcept {
    std::string out("EIRDecodeResult[");
    out.append(to_string(status));
    if( isOK() ) {
        out.append(", records "+std::to_string(records.size())+"[");
        for(jau::nsize_t i=0; i<records.size(); ++i) {
            if( 0 < i ) {
                out.append(", ");
            }
            out.append(records[i]->toString());
        }
        out.append("]");
    } else {
        out.append(", '"+getDescription()+"'");
    }
    out.append("]");
    return out;
}

// *************************************************
// *************************************************
// *************************************************

static EIRDecodeResult failed(const EIRStatus status, const jau::nsize_t data_length, const jau::nsize_t offset, const GAP_T elem_type) {
    EIRDecodeResult res(status, data_length);
    WORDY_PRINT("EIR: Failed @ offset %zu, type %s: %s", (size_t)offset, to_string(elem_type).c_str(), res.getDescription().c_str());
    return res;
}

EIRDecodeResult direct_eir::decode_eir(OctetCursor & cursor) {
    const EIREnv& env = EIREnv::get();
    EIRRecordList records;
    bool has_flags = false;
    bool has_name = false;
    jau::snsize_t uuid16_idx = -1; // position of the merged 16-bit UUID record in records

    while( cursor.has_remaining() ) {
        const jau::nsize_t offset = cursor.position();
        const uint8_t elem_len = cursor.get_uint8();
        if( 0 == elem_len ) {
            break; // end of significant part
        }
        if( !cursor.has_remaining() ) {
            DBG_PRINT("EIR: Missing type @ offset %zu, len %u, remaining %zu", (size_t)offset, elem_len, (size_t)cursor.remaining());
            break;
        }
        const GAP_T elem_type = static_cast<GAP_T>( cursor.get_uint8() );
        OctetCursor elem = cursor.take( elem_len - 1 );

        COND_PRINT(env.DEBUG_DATA, "EIR: elem @ offset %zu: len %u, type %s, data[%zu] %s",
                (size_t)offset, elem_len, to_string(elem_type).c_str(), (size_t)elem.size(),
                jau::bytesHexString(elem.get_ptr(), 0, elem.size(), true /* lsbFirst */).c_str());

        switch ( elem_type ) {
            case GAP_T::FLAGS: {
                if( has_flags ) {
                    return failed(EIRStatus::REPEATED_FLAG, 0, offset, elem_type);
                }
                if( !elem.has_remaining() ) {
                    return failed(EIRStatus::UNEXPECTED_DATA_LENGTH, 0, offset, elem_type);
                }
                // first octet only, trailing octets are dropped with elem
                records.push_back( std::make_unique<EIRFlagsRecord>( to_GAPFlags( elem.get_uint8() ) ) );
                has_flags = true;
                break;
            }
            case GAP_T::UUID16_INCOMPLETE:
                [[fallthrough]];
            case GAP_T::UUID16_COMPLETE: {
                if( 0 != elem.size() % 2 ) {
                    return failed(EIRStatus::UNEXPECTED_DATA_LENGTH, elem.size(), offset, elem_type);
                }
                if( 0 > uuid16_idx ) {
                    uuid16_idx = static_cast<jau::snsize_t>( records.size() );
                    records.push_back( std::make_unique<EIRUUID16Record>() );
                }
                EIRUUID16Record* list = static_cast<EIRUUID16Record*>( records[static_cast<jau::nsize_t>(uuid16_idx)].get() );
                while( elem.has_remaining() ) {
                    list->add( elem.get_uint16() );
                }
                break;
            }
            case GAP_T::NAME_LOCAL_SHORT:
                [[fallthrough]];
            case GAP_T::NAME_LOCAL_COMPLETE: {
                if( has_name ) {
                    return failed(EIRStatus::REPEATED_NAME, 0, offset, elem_type);
                }
                records.push_back( std::make_unique<EIRNameRecord>(
                        decode_utf8_lossy(elem.get_ptr(), elem.remaining()),
                        GAP_T::NAME_LOCAL_COMPLETE == elem_type ) );
                has_name = true;
                break;
            }
            case GAP_T::UUID32_INCOMPLETE:
                [[fallthrough]];
            case GAP_T::UUID32_COMPLETE:
                [[fallthrough]];
            case GAP_T::UUID128_INCOMPLETE:
                [[fallthrough]];
            case GAP_T::UUID128_COMPLETE:
                [[fallthrough]];
            case GAP_T::TX_POWER_LEVEL:
                [[fallthrough]];
            case GAP_T::URI:
                [[fallthrough]];
            case GAP_T::MANUFACTURE_SPECIFIC:
                DBG_PRINT("EIR: Skipped type %s @ offset %zu, data[%zu]", to_string(elem_type).c_str(), (size_t)offset, (size_t)elem.size());
                break;
            default:
                DBG_PRINT("EIR: Unhandled type %s @ offset %zu, data[%zu]", to_string(elem_type).c_str(), (size_t)offset, (size_t)elem.size());
                break;
        }
        // unconsumed data of elem is dropped, cursor is already at the next element
    }
    return EIRDecodeResult( std::move(records) );
}

EIRDecodeResult direct_eir::decode_eir(uint8_t const * data, const jau::nsize_t data_length) {
    OctetCursor cursor(data, data_length);
    return decode_eir(cursor);
}

EIRDecodeResult direct_eir::decode_eir(const jau::TROOctets & data) {
    OctetCursor cursor(data);
    return decode_eir(cursor);
}
