//----------------------------------------------------------------------------
//
// File:        prglist.cpp
// Date:        19-Oct-2026
// Programmer:  Marc Rousseau
//
// Description: List a tokenized Commodore BASIC program image
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
#include "prgimage.hpp"
#include "detokenize.hpp"

DBG_REGISTER ( __FILE__ );

void PrintUsage ()
{
    FUNCTION_ENTRY ( NULL, "PrintUsage", true );

    fprintf ( stdout, "Usage: prglist [options] file.prg\n" );
    fprintf ( stdout, "\n" );
}

int main ( int argc, char *argv [] )
{
    FUNCTION_ENTRY ( NULL, "main", true );

    const char *outFile     = NULL;
    size_t skip             = 0;
    bool followPointers     = false;

    sOption optList [] = {
        { 'f', "follow-pointers",       OPT_VALUE_SET | OPT_SIZE_BOOL,  true,   &followPointers,    NULL,       "List by following the line link pointers" },
        { 'o', "out=file",              OPT_VALUE_PARSE_STR,            0,      &outFile,           NULL,       "Write the listing to file instead of stdout" },
        { 's', "skip=n",                OPT_VALUE_PARSE_COUNT,          0,      &skip,              NULL,       "Skip n bytes of the program before listing" },
        { 'v', "verbose*=n",            OPT_VALUE_PARSE_INT,            1,      &verbose,           NULL,       "Display extra information" }
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

    const char *fileName = LocateFile ( argv [index], ".prg" );
    if ( fileName == NULL ) {
        fprintf ( stderr, "Unable to open file \"%s\"\n", argv [index] );
        return -1;
    }

    cProgramImage image;
    if ( image.Load ( fileName ) == false ) {
        fprintf ( stderr, "The file \"%s\" is too small to be a program\n", fileName );
        return -1;
    }

    sListOptions options;
    options.SkipBytes = skip;
    options.Traversal = followPointers ? TRAVERSE_POINTER : TRAVERSE_TERMINATOR;

    tListing listing;
    ListProgram ( image, options, listing );

    std::string text = FormatListing ( listing );

    if ( outFile == NULL ) {
        fputs ( text.c_str (), stdout );
        return 0;
    }

    if ( SaveFile ( outFile, text ) == false ) {
        fprintf ( stderr, "Unable to write file \"%s\"\n", outFile );
        return -1;
    }

    if ( verbose > 0 ) {
        fprintf ( stdout, "Load address: $%04X\n", image.LoadAddress ());
        fprintf ( stdout, "Program size: %u bytes\n", ( unsigned ) image.Body ().size ());
        fprintf ( stdout, "Lines listed: %u\n", ( unsigned ) listing.size ());
        fprintf ( stdout, "Wrote: %s\n", outFile );
    }

    return 0;
}
