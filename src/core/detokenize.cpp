//----------------------------------------------------------------------------
//
// File:        detokenize.cpp
// Date:        19-Oct-2026
// Programmer:  Marc Rousseau
//
// Description: Commodore BASIC V2 program lister
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

#include <stdio.h>
#include <string.h>
#include "common.hpp"
#include "logger.hpp"
#include "prgimage.hpp"
#include "detokenize.hpp"

DBG_REGISTER ( __FILE__ );

struct sToken {
    UINT8       Token;
    const char *Text;
};

static const sToken tokens [] = {

    { 128, "END" },             // 0x80
    { 129, "FOR" },             // 0x81
    { 130, "NEXT" },            // 0x82
    { 131, "DATA" },            // 0x83
    { 132, "INPUT#" },          // 0x84
    { 133, "INPUT" },           // 0x85
    { 134, "DIM" },             // 0x86
    { 135, "READ" },            // 0x87
    { 136, "LET" },             // 0x88
    { 137, "GOTO" },            // 0x89
    { 138, "RUN" },             // 0x8A
    { 139, "IF" },              // 0x8B
    { 140, "RESTORE" },         // 0x8C
    { 141, "GOSUB" },           // 0x8D
    { 142, "RETURN" },          // 0x8E
    { 143, "REM" },             // 0x8F
    { 144, "STOP" },            // 0x90
    { 145, "ON" },              // 0x91
    { 146, "WAIT" },            // 0x92
    { 147, "LOAD" },            // 0x93
    { 148, "SAVE" },            // 0x94
    { 149, "VERIFY" },          // 0x95
    { 150, "DEF" },             // 0x96
    { 151, "POKE" },            // 0x97
    { 152, "PRINT#" },          // 0x98
    { 153, "PRINT" },           // 0x99
    { 154, "CONT" },            // 0x9A
    { 155, "LIST" },            // 0x9B
    { 156, "CLR" },             // 0x9C
    { 157, "CMD" },             // 0x9D
    { 158, "SYS" },             // 0x9E
    { 159, "OPEN" },            // 0x9F
    { 160, "CLOSE" },           // 0xA0
    { 161, "GET" },             // 0xA1
    { 162, "NEW" },             // 0xA2
    { 163, "TAB(" },            // 0xA3
    { 164, "TO" },              // 0xA4
    { 165, "FN" },              // 0xA5
    { 166, "SPC(" },            // 0xA6
    { 167, "THEN" },            // 0xA7
    { 168, "NOT" },             // 0xA8
    { 169, "STEP" },            // 0xA9

    /* --- */

    { 170, "+" },               // 0xAA
    { 171, "-" },               // 0xAB
    { 172, "*" },               // 0xAC
    { 173, "/" },               // 0xAD
    { 174, "^" },               // 0xAE
    { 175, "AND" },             // 0xAF
    { 176, "OR" },              // 0xB0
    { 177, ">" },               // 0xB1
    { 178, "=" },               // 0xB2
    { 179, "<" },               // 0xB3

    /* --- */

    { 180, "SGN" },             // 0xB4
    { 181, "INT" },             // 0xB5
    { 182, "ABS" },             // 0xB6
    { 183, "USR" },             // 0xB7
    { 184, "FRE" },             // 0xB8
    { 185, "POS" },             // 0xB9
    { 186, "SQR" },             // 0xBA
    { 187, "RND" },             // 0xBB
    { 188, "LOG" },             // 0xBC
    { 189, "EXP" },             // 0xBD
    { 190, "COS" },             // 0xBE
    { 191, "SIN" },             // 0xBF
    { 192, "TAN" },             // 0xC0
    { 193, "ATN" },             // 0xC1
    { 194, "PEEK" },            // 0xC2
    { 195, "LEN" },             // 0xC3
    { 196, "STR$" },            // 0xC4
    { 197, "VAL" },             // 0xC5
    { 198, "ASC" },             // 0xC6
    { 199, "CHR$" },            // 0xC7
    { 200, "LEFT$" },           // 0xC8
    { 201, "RIGHT$" },          // 0xC9
    { 202, "MID$" },            // 0xCA
    { 203, "GO" },              // 0xCB

    { 255, "{PI}" }             // 0xFF - the pi character
};

/*

  Sample program (load address $1001)

00000000: 01 10 0E 10  0A 00 99 22  48 45 4C 4C  4F 22 00 00    ......."HELLO"..
00000010: 00                                                    .

Listing:

  10 PRINT"HELLO"

  - Header

00000000: 01 10          -> load address $1001

  - Line records

00000002: 0E 10          -> next line at $100E
00000004: 0A 00          -> line 10
00000006: 99 22 48 45 4C 4C 4F 22 00
0000000F: 00 00          -> end of program

*/

sListOptions::sListOptions () :
    Traversal ( TRAVERSE_TERMINATOR ),
    SkipBytes ( 0 ),
    MaxLines ( MAX_LISTING_LINES )
{
}

const char *FindToken ( UINT8 token )
{
    for ( unsigned i = 0; i < SIZE ( tokens ); i++ ) {
        if ( tokens [i].Token == token ) {
            return tokens [i].Text;
        }
    }

    return NULL;
}

char PetsciiToText ( UINT8 ch )
{
    if ( ch == 0xA0 ) return ' ';                       // Shifted space
    if (( ch >= 32 ) && ( ch <= 126 )) return ( char ) ch;

    return '.';
}

std::string DetokenizeLine ( const UINT8 *body, size_t length )
{
    std::string raw;
    bool inString = false;

    for ( size_t i = 0; i < length; i++ ) {
        UINT8 ch = body [i];
        if ( ch == 0x00 ) break;
        if ( ch == '"' ) {
            inString = ! inString;
            raw += '"';
            continue;
        }
        if (( inString == false ) && ( ch >= 0x80 )) {
            const char *text = FindToken ( ch );
            if ( text != NULL ) {
                raw += text;
            } else {
                char buffer [8];
                sprintf ( buffer, "{%02X}", ch );
                raw += buffer;
            }
            continue;
        }
        raw += PetsciiToText ( ch );
    }

    // Collapse runs of spaces and trim both ends
    std::string text;
    bool pending = false;

    for ( size_t i = 0; i < raw.size (); i++ ) {
        if ( raw [i] == ' ' ) {
            pending = true;
            continue;
        }
        if ( pending && ! text.empty ()) text += ' ';
        pending = false;
        text += raw [i];
    }

    return text;
}

size_t ListProgram ( const cProgramImage &image, const sListOptions &options, tListing &listing )
{
    FUNCTION_ENTRY ( NULL, "ListProgram", true );

    const tByteList &body = image.Body ();

    size_t size = body.size ();
    size_t off  = options.SkipBytes;
    size_t base = listing.size ();

    for ( int count = 0; count < options.MaxLines; count++ ) {

        // Written so a huge skip count can't wrap around
        if (( off > size ) || ( size - off < 4 )) break;

        const UINT8 *ptr = &body [off];

        UINT16 next = GetUINT16LE ( ptr );
        if ( next == 0 ) break;

        const UINT8 *start = ptr + 4;
        const UINT8 *eol   = ( const UINT8 * ) memchr ( start, 0, size - ( off + 4 ));
        if ( eol == NULL ) {
            DBG_EVENT ( "Line at offset " << off << " is not terminated" );
            break;
        }

        sListingLine line;
        line.LineNumber = GetUINT16LE ( ptr + 2 );
        line.Text       = DetokenizeLine ( start, eol - start );
        listing.push_back ( line );

        if ( options.Traversal == TRAVERSE_TERMINATOR ) {
            off = ( eol - &body [0] ) + 1;
            continue;
        }

        long target = ( long ) next - ( long ) image.LoadAddress ();
        if (( target <= ( long ) off ) || ( target > ( long ) size )) {
            DBG_EVENT ( "Line " << line.LineNumber << " links to $" << hex << next << dec << " - stopping" );
            break;
        }
        off = ( size_t ) target;
    }

    return listing.size () - base;
}

std::string FormatLine ( const sListingLine &line )
{
    char buffer [16];
    sprintf ( buffer, "%u ", ( unsigned ) line.LineNumber );

    return buffer + line.Text;
}

std::string FormatListing ( const tListing &listing )
{
    std::string text;

    for ( size_t i = 0; i < listing.size (); i++ ) {
        if ( i > 0 ) text += '\n';
        text += FormatLine ( listing [i] );
    }

    return text + '\n';
}
