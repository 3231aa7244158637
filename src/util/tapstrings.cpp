//----------------------------------------------------------------------------
//
// File:        tapstrings.cpp
// Date:        19-Oct-2026
// Programmer:  Marc Rousseau
//
// Description: Dump the printable strings found in a raw cassette capture
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
#include "common.hpp"
#include "logger.hpp"
#include "option.hpp"
#include "support.hpp"
#include "recerror.hpp"
#include "recovery.hpp"
#include "textscan.hpp"

DBG_REGISTER ( __FILE__ );

void PrintUsage ()
{
    FUNCTION_ENTRY ( NULL, "PrintUsage", true );

    fprintf ( stdout, "Usage: tapstrings [options] file.tap\n" );
    fprintf ( stdout, "\n" );
}

int main ( int argc, char *argv [] )
{
    FUNCTION_ENTRY ( NULL, "main", true );

    const char *outFile = "all_strings.txt";
    const char *groupFile = NULL;
    size_t minLength    = 2;

    sOption optList [] = {
        { 'g', "group=file",    OPT_VALUE_PARSE_STR,            0,      &groupFile,     NULL,       "Also write the strings grouped by location to file" },
        { 'm', "minlen=n",      OPT_VALUE_PARSE_COUNT,          1,      &minLength,     NULL,       "Ignore strings shorter than n characters" },
        { 'o', "out=file",      OPT_VALUE_PARSE_STR,            0,      &outFile,       NULL,       "Write the strings to file" },
        { 'v', "verbose*=n",    OPT_VALUE_PARSE_INT,            1,      &verbose,       NULL,       "Display extra information" }
    };

    if ( argc == 1 ) {
        PrintHelp ( SIZE ( optList ), optList );
        return 0;
    }

    int index = 1;
    index = ParseArgs ( index, argc, argv, SIZE ( optList ), optList );

    if ( index >= argc ) {
        fprintf ( stderr, "No input file specified\n" );
        return -1;
    }

    const char *fileName = LocateFile ( argv [index], ".tap" );
    if ( fileName == NULL ) {
        fprintf ( stderr, "Unable to open file \"%s\"\n", argv [index] );
        return -1;
    }

    tStringList strings;

    try {

        cTapFile tap;
        if ( tap.Load ( fileName ) == false ) {
            fprintf ( stderr, "Unable to read file \"%s\"\n", fileName );
            return -1;
        }

        sDecodedCapture capture;
        DecodeCapture ( tap, &capture );

        fprintf ( stdout, "Pulse centers (S/M/L): %.2f / %.2f / %.2f\n", capture.Centers.Center [ CAT_SHORT ], capture.Centers.Center [ CAT_MEDIUM ], capture.Centers.Center [ CAT_LONG ] );
        fprintf ( stdout, "Decoded bytes: %u\n", ( unsigned ) capture.Bytes.size ());

        const UINT8 *data = capture.Bytes.empty () ? NULL : &capture.Bytes [0];
        std::string text = BytesToText ( data, capture.Bytes.size ());

        size_t found = ExtractStrings ( text, minLength, strings );
        UniqueStrings ( strings );

        if ( verbose > 0 ) {
            fprintf ( stdout, "Strings found: %u (%u repeats)\n", ( unsigned ) found, ( unsigned ) ( found - strings.size ()));
        }
    }
    catch ( const cRecoveryError &error ) {
        fprintf ( stderr, "**ERROR**: %s\n", error.what ());
        return ( error.Kind () == RECOVERY_FORMAT ) ? 2 : 1;
    }

    std::string output;
    for ( size_t i = 0; i < strings.size (); i++ ) {
        output += strings [i];
        output += '\n';
    }

    if ( SaveFile ( outFile, output ) == false ) {
        fprintf ( stderr, "Unable to write file \"%s\"\n", outFile );
        return -1;
    }

    fprintf ( stdout, "Strings written: %u -> %s\n", ( unsigned ) strings.size (), outFile );

    if ( groupFile != NULL ) {
        tStringGroupList groups;
        size_t count = GroupByLocation ( strings, groups );
        if ( SaveFile ( groupFile, FormatGroups ( groups )) == false ) {
            fprintf ( stderr, "Unable to write file \"%s\"\n", groupFile );
            return -1;
        }
        fprintf ( stdout, "Groups written: %u -> %s\n", ( unsigned ) count, groupFile );
    }

    return 0;
}
