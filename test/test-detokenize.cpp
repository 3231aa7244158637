//----------------------------------------------------------------------------
//
// File:        test-detokenize.cpp
// Date:        19-Oct-2026
// Programmer:  Marc Rousseau
//
// Description: BASIC lister and string extraction tests
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

#include "common.hpp"
#include "recerror.hpp"
#include "prgimage.hpp"
#include "detokenize.hpp"
#include "textscan.hpp"
#include "testing.hpp"

static std::string ListBytes ( const UINT8 *data, size_t size, const sListOptions &options = sListOptions ())
{
    cProgramImage image;
    if ( image.Parse ( data, size ) == false ) return "";

    tListing listing;
    ListProgram ( image, options, listing );

    return FormatListing ( listing );
}

static void TestPrintHello ()
{
    static const UINT8 prg [] = {
        0x01, 0x10,
        0x0E, 0x10, 0x0A, 0x00, 0x99, 0x22, 0x48, 0x45, 0x4C, 0x4C, 0x4F, 0x22, 0x00,
        0x00, 0x00
    };

    CHECK ( ListBytes ( prg, sizeof ( prg )) == "10 PRINT\"HELLO\"\n" );
}

static void TestTokenInsideString ()
{
    static const UINT8 body [] = { 0x99, 0x22, 0x41, 0x99, 0x42, 0x22, 0x3A, 0x99 };

    CHECK ( DetokenizeLine ( body, sizeof ( body )) == "PRINT\"A.B\":PRINT" );

    // The string state never carries into the next line
    static const UINT8 open [] = { 0x99, 0x22, 0x41 };
    static const UINT8 next [] = { 0x99 };
    CHECK ( DetokenizeLine ( open, sizeof ( open )) == "PRINT\"A" );
    CHECK ( DetokenizeLine ( next, sizeof ( next )) == "PRINT" );
}

static void TestTokenTable ()
{
    CHECK ( strcmp ( FindToken ( 0x80 ), "END" ) == 0 );
    CHECK ( strcmp ( FindToken ( 0x99 ), "PRINT" ) == 0 );
    CHECK ( strcmp ( FindToken ( 0xAA ), "+" ) == 0 );
    CHECK ( strcmp ( FindToken ( 0xCA ), "MID$" ) == 0 );
    CHECK ( strcmp ( FindToken ( 0xCB ), "GO" ) == 0 );
    CHECK ( FindToken ( 0xCC ) == NULL );
    CHECK ( FindToken ( 0x41 ) == NULL );

    static const UINT8 body [] = { 0xCC, 0x20, 0xFE, 0x20, 0xFF };
    CHECK ( DetokenizeLine ( body, sizeof ( body )) == "{CC} {FE} {PI}" );
}

static void TestPetscii ()
{
    CHECK ( PetsciiToText ( 0xA0 ) == ' ' );
    CHECK ( PetsciiToText ( 0x41 ) == 'A' );
    CHECK ( PetsciiToText ( 0x7E ) == '~' );
    CHECK ( PetsciiToText ( 0x7F ) == '.' );
    CHECK ( PetsciiToText ( 0x0D ) == '.' );
    CHECK ( PetsciiToText ( 0xC1 ) == '.' );

    // Whitespace is collapsed and trimmed
    static const UINT8 body [] = { 0x20, 0x20, 0x99, 0x20, 0x20, 0x22, 0x41, 0xA0, 0x20, 0x42, 0x22, 0x20 };
    CHECK ( DetokenizeLine ( body, sizeof ( body )) == "PRINT \"A B\"" );
}

static void TestEmptyListing ()
{
    static const UINT8 prg [] = { 0x01, 0x10, 0x00, 0x00 };

    CHECK ( ListBytes ( prg, sizeof ( prg )) == "\n" );

    // Too short for a record
    static const UINT8 tiny [] = { 0x01, 0x10, 0x05 };
    CHECK ( ListBytes ( tiny, sizeof ( tiny )) == "\n" );
}

static const sTestLine program [] = {
    { 10, "\x99\"ONE\"" },
    { 20, "\x99\"TWO\"" },
    {  5, "\x99\"THREE\"" }
};

static void TestTerminatorTraversal ()
{
    std::vector<UINT8> prg = BuildProgram ( 0x1001, program, 3 );

    // Corrupt the first link; terminators still find every line
    PutUINT16LE ( &prg [2], 0x2000 );

    CHECK ( ListBytes ( &prg [0], prg.size ()) == "10 PRINT\"ONE\"\n20 PRINT\"TWO\"\n5 PRINT\"THREE\"\n" );
}

static void TestPointerTraversal ()
{
    std::vector<UINT8> prg = BuildProgram ( 0x1001, program, 3 );

    sListOptions options;
    options.Traversal = TRAVERSE_POINTER;

    CHECK ( ListBytes ( &prg [0], prg.size (), options ) == "10 PRINT\"ONE\"\n20 PRINT\"TWO\"\n5 PRINT\"THREE\"\n" );

    // A backward link ends the listing
    std::vector<UINT8> backward = prg;
    PutUINT16LE ( &backward [2], 0x1001 );
    CHECK ( ListBytes ( &backward [0], backward.size (), options ) == "10 PRINT\"ONE\"\n" );

    // So does one that points past the end
    std::vector<UINT8> beyond = prg;
    PutUINT16LE ( &beyond [2], 0x3000 );
    CHECK ( ListBytes ( &beyond [0], beyond.size (), options ) == "10 PRINT\"ONE\"\n" );

    // Forward links are followed even when they skip a line
    std::vector<UINT8> skipping = prg;
    PutUINT16LE ( &skipping [2], GetUINT16LE ( &skipping [ 2 + 11 ] ));
    CHECK ( ListBytes ( &skipping [0], skipping.size (), options ) == "10 PRINT\"ONE\"\n5 PRINT\"THREE\"\n" );
}

static void TestSkipBytes ()
{
    std::vector<UINT8> prg = BuildProgram ( 0x1001, program, 3 );

    // Four bytes of junk in front of the first line
    static const UINT8 junk [] = { 0x12, 0x34, 0x56, 0x78 };
    prg.insert ( prg.begin () + 2, junk, junk + 4 );

    sListOptions options;
    options.SkipBytes = 4;

    CHECK ( ListBytes ( &prg [0], prg.size (), options ) == "10 PRINT\"ONE\"\n20 PRINT\"TWO\"\n5 PRINT\"THREE\"\n" );

    options.SkipBytes = 1000;
    CHECK ( ListBytes ( &prg [0], prg.size (), options ) == "\n" );

    // Skip counts that would wrap around when the record size is added
    options.SkipBytes = ( size_t ) -2;
    CHECK ( ListBytes ( &prg [0], prg.size (), options ) == "\n" );

    options.SkipBytes = ( size_t ) -1;
    options.Traversal = TRAVERSE_POINTER;
    CHECK ( ListBytes ( &prg [0], prg.size (), options ) == "\n" );

    // Exactly at the end of the body
    options.SkipBytes = prg.size () - PRG_HEADER_SIZE;
    CHECK ( ListBytes ( &prg [0], prg.size (), options ) == "\n" );
}

static void TestLineLimit ()
{
    std::vector<UINT8> prg = BuildProgram ( 0x1001, program, 3 );

    sListOptions options;
    options.MaxLines = 2;

    CHECK ( ListBytes ( &prg [0], prg.size (), options ) == "10 PRINT\"ONE\"\n20 PRINT\"TWO\"\n" );
}

static void TestUnterminatedLine ()
{
    static const UINT8 prg [] = {
        0x01, 0x10,
        0x0A, 0x10, 0x0A, 0x00, 0x99, 0x00,
        0x20, 0x10, 0x14, 0x00, 0x99, 0x41
    };

    CHECK ( ListBytes ( prg, sizeof ( prg )) == "10 PRINT\n" );
}

static void TestBytesToText ()
{
    static const UINT8 data [] = { 0x41, 0x0D, 0x0A, 0xA0, 0x7E, 0x7F, 0x00, 0xC1 };

    std::string text = BytesToText ( data, sizeof ( data ));

    CHECK ( text.size () == sizeof ( data ));
    CHECK ( text == std::string ( "A\n\n ~\0\0\0", 8 ));
}

static void TestExtractStrings ()
{
    std::string text = std::string ( "HELLO   WORLD\0\0A\0AB  CD\n-XY\0HELLO   WORLD\0Q.", 44 );

    tStringList strings;
    size_t count = ExtractStrings ( text, 2, strings );

    CHECK ( count == 5 );
    CHECK ( strings.size () == 5 );
    if ( strings.size () != 5 ) return;

    CHECK ( strings [0] == "HELLO WORLD" );
    CHECK ( strings [1] == "AB CD" );
    CHECK ( strings [2] == "XY" );
    CHECK ( strings [3] == "HELLO WORLD" );
    CHECK ( strings [4] == "Q." );

    CHECK ( UniqueStrings ( strings ) == 4 );
    CHECK ( strings [0] == "HELLO WORLD" );
    CHECK ( strings [3] == "Q." );

    tStringList longer;
    CHECK ( ExtractStrings ( text, 6, longer ) == 2 );
}

static void TestLightlyClean ()
{
    CHECK ( LightlyClean ( "SAY \"\"HI\"\"" ) == "SAY \"HI\"" );
    CHECK ( LightlyClean ( "\"\"\"" ) == "\"\"" );
    CHECK ( LightlyClean ( "  A  LONG\t\tWAY \n" ) == "A LONG WAY" );
    CHECK ( LightlyClean ( "GO NORTH.\"" ) == "GO NORTH." );
    CHECK ( LightlyClean ( "WAIT...\"" ) == "WAIT...\"" );
    CHECK ( LightlyClean ( ".\"" ) == "." );
    CHECK ( LightlyClean ( "   " ) == "" );
}

static void TestLocationHeader ()
{
    CHECK ( IsLocationHeader ( "YOU ARE IN A CAVE" ) == true );
    CHECK ( IsLocationHeader ( "You are standing by a road" ) == true );
    CHECK ( IsLocationHeader ( "you have entered the castle" ) == true );
    CHECK ( IsLocationHeader ( "YOU ARE" ) == false );
    CHECK ( IsLocationHeader ( "WHERE ARE YOU ARE " ) == false );
    CHECK ( IsLocationHeader ( "" ) == false );
}

static void TestGroupByLocation ()
{
    tStringList strings;
    strings.push_back ( "PRESS ANY KEY" );
    strings.push_back ( "YOU ARE IN A  CAVE." );
    strings.push_back ( "  " );
    strings.push_back ( "IT IS DARK.\"" );
    strings.push_back ( "you have entered the hall" );
    strings.push_back ( "A LAMP" );

    tStringGroupList groups;
    CHECK ( GroupByLocation ( strings, groups ) == 3 );
    CHECK ( groups.size () == 3 );
    if ( groups.size () != 3 ) return;

    CHECK ( groups [0].Global == true );
    CHECK ( groups [0].Lines.size () == 1 );
    CHECK ( groups [1].Global == false );
    CHECK ( groups [1].Header == "YOU ARE IN A CAVE." );
    CHECK ( groups [1].Lines.size () == 1 );
    CHECK ( groups [2].Header == "you have entered the hall" );
    CHECK ( groups [2].Lines.size () == 1 );

    CHECK ( FormatGroups ( groups ) ==
            "GLOBAL / SYSTEM TEXT\n  PRESS ANY KEY\n\n"
            "YOU ARE IN A CAVE.\n  IT IS DARK.\n\n"
            "you have entered the hall\n  A LAMP\n\n" );

    // No global group when the text starts at a location
    tStringList located;
    located.push_back ( "YOU ARE HOME" );
    located.push_back ( "YOU ARE LOST" );

    tStringGroupList more;
    CHECK ( GroupByLocation ( located, more ) == 2 );
    CHECK (( more.size () == 2 ) && ( more [0].Global == false ) && more [1].Lines.empty ());
}

int main ()
{
    RUN_TEST ( TestPrintHello );
    RUN_TEST ( TestTokenInsideString );
    RUN_TEST ( TestTokenTable );
    RUN_TEST ( TestPetscii );
    RUN_TEST ( TestEmptyListing );
    RUN_TEST ( TestTerminatorTraversal );
    RUN_TEST ( TestPointerTraversal );
    RUN_TEST ( TestSkipBytes );
    RUN_TEST ( TestLineLimit );
    RUN_TEST ( TestUnterminatedLine );
    RUN_TEST ( TestBytesToText );
    RUN_TEST ( TestExtractStrings );
    RUN_TEST ( TestLightlyClean );
    RUN_TEST ( TestLocationHeader );
    RUN_TEST ( TestGroupByLocation );

    return TestSummary ( "test-detokenize" );
}
