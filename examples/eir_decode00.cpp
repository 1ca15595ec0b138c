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
#include <cstdlib>
#include <cinttypes>
#include <vector>

#include <jau/debug.hpp>
#include <jau/basic_types.hpp>

#include <direct_eir/DirectEIR.hpp>

using namespace direct_eir;
using namespace jau;

/** \file
 * This _eir_decode00_ C++ example decodes raw EIR or AD data given as hexadecimal strings.
 *
 * ### eir_decode00 Invocation Examples:
 * Using the `eir_decode00` executable from the build directory:
 *
 * * Decode flags, 16-bit UUID list and name
 * ~~~
 * ./eir_decode00 0x02010605020d180f180409414243
 * ~~~
 *
 * * Decode with all debug flags enabled
 * ~~~
 * ./eir_decode00 -dbt_debug true -dbt_verbose true -debug_data 020106
 * ~~~
 */

/**
 * Parses the given hexadecimal string in transmission order, optionally prefixed by `0x`.
 * Returns false if the string has an odd number of digits or contains a non hex character.
 */
static bool parse_hex(const std::string& hexstr, std::vector<uint8_t>& out) {
    const bool has_0x = hexstr.size() >= 2 && hexstr[0] == '0' && ( hexstr[1] == 'x' || hexstr[1] == 'X' );
    const size_t digits = hexstr.size() - ( has_0x ? 2 : 0 );
    if( 0 != digits % 2 ) {
        return false;
    }
    out.clear();
    return digits / 2 == jau::hexStringBytes(out, hexstr, false /* lsbFirst */, true /* checkLeading0x */);
}

static bool decode_one(const std::string& hexstr) {
    std::vector<uint8_t> data;
    if( !parse_hex(hexstr, data) ) {
        fprintf_td(stderr, "Invalid hex string '%s'\n", hexstr.c_str());
        return false;
    }
    const EIRDecodeResult res = decode_eir(data.data(), data.size());
    if( !res.isOK() ) {
        fprintf_td(stderr, "EIR %s: Error %s: %s\n", hexstr.c_str(), to_string(res.getStatus()).c_str(), res.getDescription().c_str());
        return false;
    }
    fprintf_td(stderr, "EIR %s: %zu records\n", hexstr.c_str(), (size_t)res.getRecords().size());
    for(jau::nsize_t i=0; i<res.getRecords().size(); ++i) {
        fprintf_td(stderr, "  [%zu] %s\n", (size_t)i, res.getRecords()[i]->toString().c_str());
    }
    return true;
}

int main(int argc, char *argv[])
{
    std::vector<std::string> inputs;

    fprintf_td(stderr, "Direct-EIR Native Version %s (API %s)\n", direct_eir::VERSION, direct_eir::VERSION_API);

    for(int i=1; i<argc; i++) {
        fprintf(stderr, "arg[%d/%d]: '%s'\n", i, argc, argv[i]);

        if( !strcmp("-dbt_debug", argv[i]) && argc > (i+1) ) {
            setenv("direct_eir.debug", argv[++i], 1 /* overwrite */);
        } else if( !strcmp("-dbt_verbose", argv[i]) && argc > (i+1) ) {
            setenv("direct_eir.verbose", argv[++i], 1 /* overwrite */);
        } else if( !strcmp("-debug_data", argv[i]) ) {
            setenv("direct_eir.debug.data", "true", 1 /* overwrite */);
        } else {
            inputs.push_back( std::string(argv[i]) );
        }
    }
    fprintf_td(stderr, "Run with '[-dbt_debug true|false|<comma_separated_list>] "
                    "[-dbt_verbose true|false] "
                    "[-debug_data] "
                    "(<hex_eir_data>)*'\n");

    const EIREnv& env = EIREnv::get();
    fprintf_td(stderr, "DEBUG %d, DEBUG_DATA %d\n", env.DEBUG_GLOBAL, env.DEBUG_DATA);

    int failed = 0;
    for(const std::string& hexstr : inputs) {
        if( !decode_one(hexstr) ) {
            ++failed;
        }
    }
    fprintf_td(stderr, "Decoded %zu inputs, %d failed\n", inputs.size(), failed);
    return 0 == failed ? 0 : 1;
}
