#include <iostream>
#include <cassert>
#include <cinttypes>
#include <cstring>
#include <memory>
#include <type_traits>

#define CATCH_CONFIG_RUNNER
// #define CATCH_CONFIG_MAIN
#include <catch2/catch_amalgamated.hpp>
#include <jau/test/catch2_ext.hpp>

#include <jau/uuid.hpp>
#include <direct_eir/EIRTypes.hpp>

using namespace direct_eir;

TEST_CASE( "GAPFlags Test 01", "[datatype][flags]" ) {
    const GAPFlags f = GAPFlags::LE_Gen_Disc | GAPFlags::BREDR_UNSUP;
    REQUIRE( 0x06 == static_cast<uint8_t>(f) );
    REQUIRE( is_set(f, GAPFlags::LE_Gen_Disc) );
    REQUIRE( !is_set(f, GAPFlags::LE_Ltd_Disc) );
    REQUIRE( GAPFlags::BREDR_UNSUP == ( f & GAPFlags::BREDR_UNSUP ) );
    REQUIRE( "[LE_Gen_Disc, BREDR_UNSUP]" == to_string(f) );
    REQUIRE( "[]" == to_string(GAPFlags::NONE) );

    REQUIRE( f == to_GAPFlags(0x06) );
    REQUIRE( f == to_GAPFlags(0xE6) );
    REQUIRE( GAPFlags::NONE == to_GAPFlags(0xE0) );
    REQUIRE( 0x1F == static_cast<uint8_t>( to_GAPFlags(0xFF) ) );
    REQUIRE( "[LE_Ltd_Disc, LE_Gen_Disc, BREDR_UNSUP, Dual_SameCtrl, Dual_SameHost]" == to_string( to_GAPFlags(0xFF) ) );
}

TEST_CASE( "GAP_T Test 02", "[datatype][gap]" ) {
    REQUIRE( "FLAGS" == to_string(GAP_T::FLAGS) );
    REQUIRE( "NAME_LOCAL_COMPLETE" == to_string(GAP_T::NAME_LOCAL_COMPLETE) );
    REQUIRE( "URI" == to_string(GAP_T::URI) );
    REQUIRE( 0xFF == number(GAP_T::MANUFACTURE_SPECIFIC) );
    REQUIRE( "MANUFACTURE_SPECIFIC" == to_string(GAP_T::MANUFACTURE_SPECIFIC) );
}

TEST_CASE( "EIRRecord Reserved Types Test 03", "[datatype][EIR]" ) {
    {
        EIRUUID32Record a, b;
        a.add(0xabcd1234);
        b.add(0xabcd1234);
        REQUIRE( EIRRecord::Type::UUID32_LIST == a.getType() );
        REQUIRE( a == b );
        b.add(0x00000001);
        REQUIRE( a != b );
        std::cout << a.toString() << std::endl;
    }
    {
        const jau::uuid128_t u("00001234-5678-100a-8000-00805F9B34FB");
        EIRUUID128Record a, b;
        a.add(u);
        b.add(jau::uuid128_t("00001234-5678-100a-8000-00805F9B34FB"));
        REQUIRE( EIRRecord::Type::UUID128_LIST == a.getType() );
        REQUIRE( 1 == a.getUUIDs().size() );
        REQUIRE( a == b );
        std::cout << a.toString() << std::endl;
    }
    {
        EIRTxPowerRecord a;
        a.add(-12);
        a.add(4);
        REQUIRE( EIRRecord::Type::TX_POWER_LEVEL == a.getType() );
        REQUIRE( -12 == a.getLevels()[0] );
        REQUIRE( "TX_POWER_LEVEL[-12 dBm, 4 dBm]" == a.toString() );
    }
    {
        EIRURIRecord a;
        a.add("//example.org");
        REQUIRE( EIRRecord::Type::URI == a.getType() );
        REQUIRE( "URI['//example.org']" == a.toString() );
    }
    {
        const uint8_t msd_data[] = { 0x01, 0x02 };
        EIRManufacturerRecord a, b;
        a.add( ManufactureSpecificData(0x0001, msd_data, sizeof(msd_data)) );
        b.add( ManufactureSpecificData(0x0001, msd_data, sizeof(msd_data)) );
        REQUIRE( EIRRecord::Type::MANUFACTURE_SPECIFIC == a.getType() );
        REQUIRE( a == b );
        EIRManufacturerRecord c;
        c.add( ManufactureSpecificData(0x0002) );
        REQUIRE( a != c );
        std::cout << a.toString() << std::endl;
    }
    {
        // different types never compare equal
        const EIRUUID16Record u16;
        const EIRUUID32Record u32;
        REQUIRE( u16 != u32 );
        REQUIRE( "UUID16_LIST[]" == u16.toString() );
    }
}

TEST_CASE( "EIRRecord Assignment Test 04", "[datatype][EIR]" ) {
    // base assignment would alter the type of a concrete record
    static_assert( !std::is_copy_assignable<EIRRecord>::value, "EIRRecord copy assignable" );
    static_assert( !std::is_move_assignable<EIRRecord>::value, "EIRRecord move assignable" );
    REQUIRE( !std::is_copy_assignable<EIRRecord>::value );
    REQUIRE( !std::is_move_assignable<EIRRecord>::value );

    REQUIRE( std::is_copy_constructible<EIRNameRecord>::value );
    REQUIRE( std::is_copy_assignable<EIRNameRecord>::value );

    EIRNameRecord a("ABC", true);
    const EIRNameRecord b("DEF", false);
    a = b;
    REQUIRE( EIRRecord::Type::NAME == a.getType() );
    REQUIRE( a == b );
    REQUIRE( "NAME['DEF', short]" == a.toString() );
}
