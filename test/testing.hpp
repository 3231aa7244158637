//----------------------------------------------------------------------------
//
// File:        testing.hpp
// Date:        19-Oct-2026
// Programmer:  Marc Rousseau
//
// Description: Minimal self-checking test support and synthetic captures
//
// Copyright (c) 2026 Marc Rousseau, All Rights Reserved.
//
// This program is free software; you can redistribute it and/or modify
// it under the terms of the GNU General Public License as published by
// the Free Software Foundation; either version 2 of the License, or
// (at your option) any later version.
//
// This program is distributed in the hope that it will be useful,
// but WITHOUT ANY WARRANTY; without even the implied warranty of
// MERCHANTABILITY or FITNESS FOR A PARTICULAR PURPOSE.  See the
// GNU General Public License for more details.
//
// You should have received a copy of the GNU General Public License
// along with this program; if not, write to the Free Software
// Foundation, Inc., 59 Temple Place, Suite 330, Boston, MA  02111-1307, USA.
//
// Revision History:
//
//----------------------------------------------------------------------------

#ifndef TESTING_HPP_
#define TESTING_HPP_

#include <stdio.h>
#include <string.h>
#include <string>
#include <vector>
#include "recerror.hpp"
#include "pulses.hpp"

static int g_TestsFailed;
static int g_ChecksPassed;
static int g_ChecksFailed;

static inline void Check ( bool ok, const char *text, const char *file, int line )
{
    if ( ok == true ) {
        g_ChecksPassed++;
        return;
    }

    fprintf ( stdout, "  [FAIL] %s(%d): %s\n", file, line, text );
    g_ChecksFailed++;
}

#define CHECK(x)        Check (( x ) ? true : false, #x, __FILE__, __LINE__ )

#define CHECK_THROWS(x,kind,stage)                                                  \
    do {                                                                            \
        bool l_ok = false;                                                          \
        try {                                                                       \
            x;                                                                      \
        }                                                                           \
        catch ( const cRecoveryError &error ) {                                     \
            l_ok = (( error.Kind () == kind ) && ( strcmp ( error.Stage (), stage ) == 0 )) ? true : false; \
        }                                                                           \
        Check ( l_ok, #x " throws " #kind " (" stage ")", __FILE__, __LINE__ );     \
    } while ( 0 )

#define RUN_TEST(fn)                                                                \
    do {                                                                            \
        int l_before = g_ChecksFailed;                                              \
        fn ();                                                                      \
        bool l_passed = ( g_ChecksFailed == l_before ) ? true : false;              \
        if ( l_passed == false ) g_TestsFailed++;                                   \
        fprintf ( stdout, "[%s] %s\n", l_passed ? "PASS" : "FAIL", #fn );          \
    } while ( 0 )

static inline int TestSummary ( const char *name )
{
    fprintf ( stdout, "\n%s: %d checks passed, %d failed\n", name, g_ChecksPassed, g_ChecksFailed );

    return ( g_TestsFailed == 0 ) ? 0 : 1;
}

//----------------------------------------------------------------------------
//
//  Synthetic captures
//
//  Every byte is written as a Long/Medium marker followed by 8 bit pairs,
//  least significant bit first:  1 = Medium,Short  0 = Short,Medium
//
//----------------------------------------------------------------------------

const UINT32 PULSE_SHORT    = 48;
const UINT32 PULSE_MEDIUM   = 66;
const UINT32 PULSE_LONG     = 86;

static inline void AppendByteCategories ( UINT8 value, std::vector<eCategory> &categories )
{
    categories.push_back ( CAT_LONG );
    categories.push_back ( CAT_MEDIUM );

    for ( int bit = 0; bit < 8; bit++ ) {
        if ( value & ( 1 << bit )) {
            categories.push_back ( CAT_MEDIUM );
            categories.push_back ( CAT_SHORT );
        } else {
            categories.push_back ( CAT_SHORT );
            categories.push_back ( CAT_MEDIUM );
        }
    }
}

static inline std::vector<UINT32> BytesToPulses ( const std::vector<UINT8> &bytes )
{
    static const UINT32 widths [] = { PULSE_SHORT, PULSE_MEDIUM, PULSE_LONG };

    std::vector<eCategory> categories;
    for ( size_t i = 0; i < bytes.size (); i++ ) {
        AppendByteCategories ( bytes [i], categories );
    }

    std::vector<UINT32> pulses;
    for ( size_t i = 0; i < categories.size (); i++ ) {
        pulses.push_back ( widths [ categories [i]] );
    }

    return pulses;
}

static inline std::vector<UINT8> BuildTap ( const std::vector<UINT32> &pulses, int version = 1 )
{
    std::vector<UINT8> stream;

    for ( size_t i = 0; i < pulses.size (); i++ ) {
        UINT32 pulse = pulses [i];
        if (( pulse > 0 ) && ( pulse < 256 )) {
            stream.push_back (( UINT8 ) pulse );
        } else {
            stream.push_back ( 0 );
            stream.push_back (( UINT8 ) ( pulse & 0xFF ));
            stream.push_back (( UINT8 ) (( pulse >> 8 ) & 0xFF ));
            stream.push_back (( UINT8 ) (( pulse >> 16 ) & 0xFF ));
        }
    }

    std::vector<UINT8> tap ( 20, 0 );
    memcpy ( &tap [0], "C64-TAPE-RAW", 12 );
    tap [12] = ( UINT8 ) version;

    UINT32 length = ( UINT32 ) stream.size ();
    tap [16] = ( UINT8 ) ( length & 0xFF );
    tap [17] = ( UINT8 ) (( length >> 8 ) & 0xFF );
    tap [18] = ( UINT8 ) (( length >> 16 ) & 0xFF );
    tap [19] = ( UINT8 ) (( length >> 24 ) & 0xFF );

    tap.insert ( tap.end (), stream.begin (), stream.end ());

    return tap;
}

struct sTestLine {
    UINT16      Number;
    const char *Text;           // Raw tokenized bytes, 0 terminated
};

// Body of a program (no load address) with correct link pointers
static inline std::vector<UINT8> BuildProgramBody ( UINT16 load, const sTestLine *lines, int count )
{
    std::vector<UINT8> body;

    for ( int i = 0; i < count; i++ ) {
        size_t start = body.size ();
        size_t length = strlen ( lines [i].Text );
        UINT16 next = ( UINT16 ) ( load + start + 4 + length + 1 );
        body.push_back (( UINT8 ) ( next & 0xFF ));
        body.push_back (( UINT8 ) ( next >> 8 ));
        body.push_back (( UINT8 ) ( lines [i].Number & 0xFF ));
        body.push_back (( UINT8 ) ( lines [i].Number >> 8 ));
        body.insert ( body.end (), lines [i].Text, lines [i].Text + length );
        body.push_back ( 0 );
    }

    body.push_back ( 0 );
    body.push_back ( 0 );

    return body;
}

// Load address followed by the body
static inline std::vector<UINT8> BuildProgram ( UINT16 load, const sTestLine *lines, int count )
{
    std::vector<UINT8> prg;
    prg.push_back (( UINT8 ) ( load & 0xFF ));
    prg.push_back (( UINT8 ) ( load >> 8 ));

    std::vector<UINT8> body = BuildProgramBody ( load, lines, count );
    prg.insert ( prg.end (), body.begin (), body.end ());

    return prg;
}

#endif
