//----------------------------------------------------------------------------
//
// File:        detokenize.hpp
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

#ifndef DETOKENIZE_HPP_
#define DETOKENIZE_HPP_

#include <string>
#include <vector>

class cProgramImage;

const int MAX_LISTING_LINES = 20000;

enum eTraversal {
    TRAVERSE_TERMINATOR,        // Next line follows the 00 terminator
    TRAVERSE_POINTER            // Next line is where the link pointer says
};

struct sListOptions {
    eTraversal  Traversal;
    size_t      SkipBytes;      // Leading body bytes to ignore
    int         MaxLines;

    sListOptions ();
};

struct sListingLine {
    UINT16      LineNumber;
    std::string Text;
};

typedef std::vector<sListingLine> tListing;

// Returns NULL if the byte isn't a BASIC V2 token
const char *FindToken ( UINT8 token );

char PetsciiToText ( UINT8 ch );

std::string DetokenizeLine ( const UINT8 *body, size_t length );

size_t ListProgram ( const cProgramImage &image, const sListOptions &options, tListing &listing );

std::string FormatLine ( const sListingLine &line );
std::string FormatListing ( const tListing &listing );

#endif
