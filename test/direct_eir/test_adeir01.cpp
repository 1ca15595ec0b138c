#include <iostream>
#include <cassert>
#include <cinttypes>
#include <cstring>
#include <vector>

#define CATCH_CONFIG_RUNNER
// #define CATCH_CONFIG_MAIN
#include <catch2/catch_amalgamated.hpp>
#include <jau/test/catch2_ext.hpp>

#include <direct_eir/EIRDecoder.hpp>

using namespace direct_eir;

static EIRDecodeResult decode(const std::vector<uint8_t>& buffer) {
    EIRDecodeResult res = decode_eir(buffer.data(), buffer.size());
    std::cout << jau::bytesHexString(buffer.data(), 0, buffer.size(), true /* lsb */) << " -> " << res.toString() << std::endl;
    return res;
}

static void require_failure(const EIRDecodeResult& res, const EIRStatus status, const jau::nsize_t data_length) {
    REQUIRE( !res.isOK() );
    REQUIRE( status == res.getStatus() );
    REQUIRE( data_length == res.getDataLength() );
    REQUIRE( 0 == res.getRecords().size() );
}

static const EIRNameRecord& as_name(const EIRDecodeResult& res, const jau::nsize_t i) {
    REQUIRE( EIRRecord::Type::NAME == res.getRecords()[i]->getType() );
    return static_cast<const EIRNameRecord&>( *res.getRecords()[i] );
}

static const EIRUUID16Record& as_uuid16(const EIRDecodeResult& res, const jau::nsize_t i) {
    REQUIRE( EIRRecord::Type::UUID16_LIST == res.getRecords()[i]->getType() );
    return static_cast<const EIRUUID16Record&>( *res.getRecords()[i] );
}

static const EIRFlagsRecord& as_flags(const EIRDecodeResult& res, const jau::nsize_t i) {
    REQUIRE( EIRRecord::Type::FLAGS == res.getRecords()[i]->getType() );
    return static_cast<const EIRFlagsRecord&>( *res.getRecords()[i] );
}

TEST_CASE( "EIR Decode Empty Test 00", "[datatype][AD][EIR]" ) {
    {
        const EIRDecodeResult res = decode( { } );
        REQUIRE( res.isOK() );
        REQUIRE( 0 == res.getRecords().size() );
    }
    {
        const EIRDecodeResult res = decode_eir(nullptr, 0);
        REQUIRE( res.isOK() );
        REQUIRE( 0 == res.getRecords().size() );
    }
    {
        // leading end marker
        const EIRDecodeResult res = decode( { 0x00, 0x02, 0x01, 0x06 } );
        REQUIRE( res.isOK() );
        REQUIRE( 0 == res.getRecords().size() );
    }
}

TEST_CASE( "EIR Decode Name Test 01", "[datatype][AD][EIR][name]" ) {
    {
        const EIRDecodeResult res = decode( { 0x04, 0x09, 'A', 'B', 'C' } );
        REQUIRE( res.isOK() );
        REQUIRE( 1 == res.getRecords().size() );
        REQUIRE( "ABC" == as_name(res, 0).getName() );
        REQUIRE( true == as_name(res, 0).isComplete() );
    }
    {
        const EIRDecodeResult res = decode( { 0x03, 0x09, 'H', 'i' } );
        REQUIRE( res.isOK() );
        REQUIRE( 1 == res.getRecords().size() );
        REQUIRE( "Hi" == as_name(res, 0).getName() );
        REQUIRE( true == as_name(res, 0).isComplete() );
    }
    {
        // declared length 4 exceeds the remaining octets, capped to "Hi"
        const EIRDecodeResult res = decode( { 0x04, 0x09, 'H', 'i' } );
        REQUIRE( res.isOK() );
        REQUIRE( 1 == res.getRecords().size() );
        REQUIRE( "Hi" == as_name(res, 0).getName() );
        REQUIRE( true == as_name(res, 0).isComplete() );
    }
    {
        const EIRDecodeResult res = decode( { 0x05, 0x08, 'T', 'e', 's', 't' } );
        REQUIRE( res.isOK() );
        REQUIRE( 1 == res.getRecords().size() );
        REQUIRE( "Test" == as_name(res, 0).getName() );
        REQUIRE( false == as_name(res, 0).isComplete() );
    }
    {
        // empty name
        const EIRDecodeResult res = decode( { 0x01, 0x09 } );
        REQUIRE( res.isOK() );
        REQUIRE( 1 == res.getRecords().size() );
        REQUIRE( "" == as_name(res, 0).getName() );
    }
    {
        const EIRDecodeResult res = decode( { 0x04, 0x09, 'A', 'B', 'C', 0x04, 0x09, 'D', 'E', 'F' } );
        require_failure(res, EIRStatus::REPEATED_NAME, 0);
    }
    {
        const EIRDecodeResult res = decode( { 0x02, 0x08, 'A', 0x04, 0x09, 'D', 'E', 'F' } );
        require_failure(res, EIRStatus::REPEATED_NAME, 0);
    }
}

TEST_CASE( "EIR Decode Name UTF8 Test 02", "[datatype][AD][EIR][name][utf8]" ) {
    const std::string fffd("\xEF\xBF\xBD");
    {
        // valid multi-octet sequences
        const EIRDecodeResult res = decode( { 0x06, 0x09, 'A', 0xC3, 0xA4, 0xE2, 0x82 } );
        REQUIRE( res.isOK() );
        REQUIRE( ( "A\xC3\xA4" + fffd ) == as_name(res, 0).getName() );
    }
    {
        const EIRDecodeResult res = decode( { 0x04, 0x09, 'A', 0xFF, 'B' } );
        REQUIRE( res.isOK() );
        REQUIRE( 1 == res.getRecords().size() );
        REQUIRE( ( "A" + fffd + "B" ) == as_name(res, 0).getName() );
    }
    {
        const uint8_t d[] = { 'A', 0xE2, 0x82, 0xAC, 'B' };
        REQUIRE( "A\xE2\x82\xAC" "B" == decode_utf8_lossy(d, sizeof(d)) );
    }
    {
        // truncated sequence followed by a valid octet, the valid octet is kept
        const uint8_t d[] = { 0xE2, 0x82, 'B' };
        REQUIRE( ( fffd + "B" ) == decode_utf8_lossy(d, sizeof(d)) );
    }
    {
        // each stray continuation octet is replaced
        const uint8_t d[] = { 0x80, 0x80 };
        REQUIRE( ( fffd + fffd ) == decode_utf8_lossy(d, sizeof(d)) );
    }
    {
        // truncated at the end
        const uint8_t d[] = { 'A', 0xF0, 0x9F, 0x98 };
        REQUIRE( ( "A" + fffd ) == decode_utf8_lossy(d, sizeof(d)) );
    }
    {
        const uint8_t d[] = { 0xF0, 0x9F, 0x98, 0x80 };
        REQUIRE( "\xF0\x9F\x98\x80" == decode_utf8_lossy(d, sizeof(d)) );
    }
}

TEST_CASE( "EIR Decode UUID16 Test 03", "[datatype][AD][EIR][uuid]" ) {
    {
        const EIRDecodeResult res = decode( { 0x05, 0x03, 0x0D, 0x18, 0x0F, 0x18 } );
        REQUIRE( res.isOK() );
        REQUIRE( 1 == res.getRecords().size() );
        const EIRUUID16Record& r = as_uuid16(res, 0);
        REQUIRE( 2 == r.size() );
        REQUIRE( 0x180D == r.getUUIDs()[0] );
        REQUIRE( 0x180F == r.getUUIDs()[1] );
    }
    {
        // odd payload length
        const EIRDecodeResult res = decode( { 0x04, 0x03, 0x0D, 0x18, 0x0F } );
        require_failure(res, EIRStatus::UNEXPECTED_DATA_LENGTH, 3);
        REQUIRE( "Unexpected data length 3." == res.getDescription() );
    }
    {
        // incomplete and complete lists merge into the first position, in encounter order
        const EIRDecodeResult res = decode( { 0x03, 0x02, 0x01, 0x00,
                                              0x04, 0x09, 'A', 'B', 'C',
                                              0x05, 0x03, 0x02, 0x00, 0x01, 0x00 } );
        REQUIRE( res.isOK() );
        REQUIRE( 2 == res.getRecords().size() );
        const EIRUUID16Record& r = as_uuid16(res, 0);
        REQUIRE( 3 == r.size() );
        REQUIRE( 0x0001 == r.getUUIDs()[0] );
        REQUIRE( 0x0002 == r.getUUIDs()[1] );
        REQUIRE( 0x0001 == r.getUUIDs()[2] );
        REQUIRE( "ABC" == as_name(res, 1).getName() );
    }
    {
        // empty list still reserves its position
        const EIRDecodeResult res = decode( { 0x01, 0x03,
                                              0x02, 0x01, 0x06,
                                              0x03, 0x02, 0x34, 0x12 } );
        REQUIRE( res.isOK() );
        REQUIRE( 2 == res.getRecords().size() );
        REQUIRE( 1 == as_uuid16(res, 0).size() );
        REQUIRE( 0x1234 == as_uuid16(res, 0).getUUIDs()[0] );
        REQUIRE( EIRRecord::Type::FLAGS == res.getRecords()[1]->getType() );
    }
    {
        // declared length exceeding the buffer is capped to the octets present
        const EIRDecodeResult res = decode( { 0x09, 0x03, 0x34, 0x12 } );
        REQUIRE( res.isOK() );
        REQUIRE( 1 == as_uuid16(res, 0).size() );
        REQUIRE( 0x1234 == as_uuid16(res, 0).getUUIDs()[0] );
    }
    {
        // error discards already accumulated records
        const EIRDecodeResult res = decode( { 0x02, 0x01, 0x06,
                                              0x03, 0x03, 0x34, 0x12,
                                              0x02, 0x02, 0x01 } );
        require_failure(res, EIRStatus::UNEXPECTED_DATA_LENGTH, 1);
    }
}

TEST_CASE( "EIR Decode Flags Test 04", "[datatype][AD][EIR][flags]" ) {
    {
        const EIRDecodeResult res = decode( { 0x02, 0x01, 0x06 } );
        REQUIRE( res.isOK() );
        REQUIRE( 1 == res.getRecords().size() );
        REQUIRE( ( GAPFlags::LE_Gen_Disc | GAPFlags::BREDR_UNSUP ) == as_flags(res, 0).getFlags() );
    }
    {
        // reserved bits are dropped
        const EIRDecodeResult res = decode( { 0x02, 0x01, 0xFF } );
        REQUIRE( res.isOK() );
        const GAPFlags all = GAPFlags::LE_Ltd_Disc | GAPFlags::LE_Gen_Disc | GAPFlags::BREDR_UNSUP |
                             GAPFlags::Dual_SameCtrl | GAPFlags::Dual_SameHost;
        REQUIRE( all == as_flags(res, 0).getFlags() );
        REQUIRE( 0x1F == static_cast<uint8_t>( as_flags(res, 0).getFlags() ) );
    }
    {
        const EIRDecodeResult res = decode( { 0x02, 0x01, 0x06, 0x02, 0x01, 0x04 } );
        require_failure(res, EIRStatus::REPEATED_FLAG, 0);
    }
    {
        const EIRDecodeResult res = decode( { 0x01, 0x01 } );
        require_failure(res, EIRStatus::UNEXPECTED_DATA_LENGTH, 0);
    }
    {
        // first octet only, trailing octets dropped
        const EIRDecodeResult res = decode( { 0x03, 0x01, 0x06, 0x00, 0x03, 0x09, 'H', 'i' } );
        REQUIRE( res.isOK() );
        REQUIRE( 2 == res.getRecords().size() );
        REQUIRE( ( GAPFlags::LE_Gen_Disc | GAPFlags::BREDR_UNSUP ) == as_flags(res, 0).getFlags() );
        REQUIRE( "Hi" == as_name(res, 1).getName() );
    }
    {
        // declared length beyond the buffer, capped to the present octets
        const EIRDecodeResult res = decode( { 0x05, 0x01, 0x05, 0x0A } );
        REQUIRE( res.isOK() );
        REQUIRE( 1 == res.getRecords().size() );
        REQUIRE( ( GAPFlags::LE_Ltd_Disc | GAPFlags::BREDR_UNSUP ) == as_flags(res, 0).getFlags() );
    }
}

TEST_CASE( "EIR Decode Structure Test 05", "[datatype][AD][EIR]" ) {
    {
        // end marker followed by garbage
        const EIRDecodeResult res = decode( { 0x02, 0x01, 0x06, 0x00, 0xDE, 0xAD, 0xBE, 0xEF } );
        REQUIRE( res.isOK() );
        REQUIRE( 1 == res.getRecords().size() );
        REQUIRE( EIRRecord::Type::FLAGS == res.getRecords()[0]->getType() );
    }
    {
        // order of first appearance
        const EIRDecodeResult res = decode( { 0x04, 0x09, 'A', 'B', 'C',
                                              0x03, 0x03, 0x0D, 0x18,
                                              0x02, 0x01, 0x02 } );
        REQUIRE( res.isOK() );
        REQUIRE( 3 == res.getRecords().size() );
        REQUIRE( EIRRecord::Type::NAME == res.getRecords()[0]->getType() );
        REQUIRE( EIRRecord::Type::UUID16_LIST == res.getRecords()[1]->getType() );
        REQUIRE( EIRRecord::Type::FLAGS == res.getRecords()[2]->getType() );
    }
    {
        // reserved and unknown types are skipped, decoding continues
        const EIRDecodeResult res = decode( { 0x05, 0x05, 0x01, 0x02, 0x03, 0x04,       // UUID32_COMPLETE
                                              0x02, 0x0A, 0xF4,                         // TX_POWER_LEVEL
                                              0x05, 0xFF, 0x01, 0x00, 0xAA, 0xBB,       // MANUFACTURE_SPECIFIC
                                              0x03, 0x24, 0x16, 'x',                    // URI
                                              0x03, 0x19, 0x40, 0x02,                   // unknown: appearance
                                              0x03, 0x07, 0x01, 0x02,                   // UUID128_COMPLETE, short payload
                                              0x02, 0x01, 0x06 } );
        REQUIRE( res.isOK() );
        REQUIRE( 1 == res.getRecords().size() );
        REQUIRE( EIRRecord::Type::FLAGS == res.getRecords()[0]->getType() );
    }
    {
        // missing type octet stops the decode
        const EIRDecodeResult res = decode( { 0x02, 0x01, 0x06, 0x05 } );
        REQUIRE( res.isOK() );
        REQUIRE( 1 == res.getRecords().size() );
    }
    {
        // cursor positions past the decoded structure
        const std::vector<uint8_t> buffer = { 0x02, 0x01, 0x06, 0x03, 0x09, 'H', 'i' };
        OctetCursor cursor(buffer.data(), buffer.size());
        const EIRDecodeResult res = decode_eir(cursor);
        REQUIRE( res.isOK() );
        REQUIRE( 2 == res.getRecords().size() );
        REQUIRE( buffer.size() == cursor.position() );
        REQUIRE( !cursor.has_remaining() );
    }
    {
        const std::vector<uint8_t> buffer = { 0x03, 0x09, 'H', 'i' };
        const jau::POctets data(buffer.data(), buffer.size(), jau::lb_endian::little);
        const EIRDecodeResult res = decode_eir(data);
        REQUIRE( res.isOK() );
        REQUIRE( "Hi" == as_name(res, 0).getName() );
    }
}

TEST_CASE( "EIR Decode Records Test 06", "[datatype][AD][EIR]" ) {
    EIRDecodeResult res = decode( { 0x02, 0x01, 0x06, 0x05, 0x02, 0x0D, 0x18, 0x0F, 0x18, 0x04, 0x09, 'A', 'B', 'C' } );
    REQUIRE( res.isOK() );
    REQUIRE( EIRStatus::SUCCESS == res.getStatus() );
    REQUIRE( !res.getErrorCode() );

    const EIRFlagsRecord flags(GAPFlags::LE_Gen_Disc | GAPFlags::BREDR_UNSUP);
    const EIRUUID16Record uuids( jau::darray<uint16_t>( { 0x180D, 0x180F } ) );
    const EIRNameRecord name("ABC", true);

    EIRRecordList records = res.releaseRecords();
    REQUIRE( 0 == res.getRecords().size() );
    REQUIRE( 3 == records.size() );
    REQUIRE( flags == *records[0] );
    REQUIRE( uuids == *records[1] );
    REQUIRE( name == *records[2] );
    REQUIRE( name != *records[0] );
    REQUIRE( EIRNameRecord("ABC", false) != *records[2] );

    REQUIRE( "FLAGS[[LE_Gen_Disc, BREDR_UNSUP]]" == records[0]->toString() );
    REQUIRE( "NAME['ABC', complete]" == records[2]->toString() );
}
