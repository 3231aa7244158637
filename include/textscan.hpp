//----------------------------------------------------------------------------
//
// File:        textscan.hpp
// Date:        19-Oct-2026
// Programmer:  Marc Rousseau
//
// Description: Printable string extraction from decoded tape data
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

#ifndef TEXTSCAN_HPP_
#define TEXTSCAN_HPP_

#include <string>
#include <vector>

typedef std::vector<std::string> tStringList;

// CR/LF become newlines, anything unprintable becomes '\0'
std::string BytesToText ( const UINT8 *data, size_t size );

// Appends runs that start with a letter or digit and are at least minLength long
size_t ExtractStrings ( const std::string &text, size_t minLength, tStringList &strings );

// Removes repeats, keeping the first occurrence of each string
size_t UniqueStrings ( tStringList &strings );

//
//  Adventure style games print a location description that starts with one
//  of a few fixed phrases, followed by the things found there.  Grouping the
//  strings under those phrases makes a dump much easier to read.
//

struct sStringGroup {
    bool            Global;             // Text seen before the first location
    std::string     Header;
    tStringList     Lines;
};

typedef std::vector<sStringGroup> tStringGroupList;

// Folds doubled quotes, collapses whitespace and drops a stray closing quote
std::string LightlyClean ( const std::string &text );

bool IsLocationHeader ( const std::string &text );

// Returns the number of groups appended
size_t GroupByLocation ( const tStringList &strings, tStringGroupList &groups );

std::string FormatGroups ( const tStringGroupList &groups );

#endif
