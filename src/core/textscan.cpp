//----------------------------------------------------------------------------
//
// File:        textscan.cpp
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

#include <ctype.h>
#include <string.h>
#include <set>
#include "common.hpp"
#include "logger.hpp"
#include "textscan.hpp"

DBG_REGISTER ( __FILE__ );

static inline bool IsLeadChar ( char ch )
{
    return (( ch >= 'A' ) && ( ch <= 'Z' )) || (( ch >= 'a' ) && ( ch <= 'z' )) || (( ch >= '0' ) && ( ch <= '9' ));
}

static inline bool IsTextChar ( char ch )
{
    return IsLeadChar ( ch ) || (( ch != '\0' ) && ( strchr ( " -_,.!?'\"", ch ) != NULL ));
}

std::string BytesToText ( const UINT8 *data, size_t size )
{
    std::string text ( size, '\0' );

    for ( size_t i = 0; i < size; i++ ) {
        UINT8 ch = data [i];
        if (( ch == 10 ) || ( ch == 13 )) {
            text [i] = '\n';
        } else if ( ch == 0xA0 ) {
            text [i] = ' ';
        } else if (( ch >= 32 ) && ( ch <= 126 )) {
            text [i] = ( char ) ch;
        }
    }

    return text;
}

size_t ExtractStrings ( const std::string &text, size_t minLength, tStringList &strings )
{
    FUNCTION_ENTRY ( NULL, "ExtractStrings", true );

    size_t count = 0;
    size_t size  = text.size ();
    size_t i     = 0;

    while ( i < size ) {

        // Need a lead character and at least one more
        if (( IsLeadChar ( text [i] ) == false ) || ( i + 1 >= size ) || ( IsTextChar ( text [i + 1] ) == false )) {
            i++;
            continue;
        }

        size_t end = i + 1;
        while (( end < size ) && IsTextChar ( text [end] )) end++;

        std::string run;
        bool pending = false;
        for ( size_t j = i; j < end; j++ ) {
            if ( text [j] == ' ' ) {
                pending = true;
                continue;
            }
            if ( pending && ! run.empty ()) run += ' ';
            pending = false;
            run += text [j];
        }

        if ( run.size () >= minLength ) {
            strings.push_back ( run );
            count++;
        }

        i = end;
    }

    DBG_STATUS ( count << " strings found" );

    return count;
}

size_t UniqueStrings ( tStringList &strings )
{
    FUNCTION_ENTRY ( NULL, "UniqueStrings", true );

    std::set<std::string> seen;
    tStringList unique;

    for ( size_t i = 0; i < strings.size (); i++ ) {
        if ( seen.insert ( strings [i] ).second == true ) {
            unique.push_back ( strings [i] );
        }
    }

    strings.swap ( unique );

    return strings.size ();
}

static const char *locationPhrases [] = {
    "YOU ARE ",
    "YOU HAVE ENTERED",
    "YOU ARE IN "
};

std::string LightlyClean ( const std::string &text )
{
    std::string folded;

    for ( size_t i = 0; i < text.size (); i++ ) {
        folded += text [i];
        if (( text [i] == '"' ) && ( i + 1 < text.size ()) && ( text [i + 1] == '"' )) i++;
    }

    std::string clean;
    bool pending = false;

    for ( size_t i = 0; i < folded.size (); i++ ) {
        if ( isspace (( unsigned char ) folded [i] )) {
            pending = true;
            continue;
        }
        if ( pending && ! clean.empty ()) clean += ' ';
        pending = false;
        clean += folded [i];
    }

    size_t size = clean.size ();

    // 'GO NORTH."' loses the quote, '"WAIT..."' keeps it
    if (( size >= 2 ) && ( clean.compare ( size - 2, 2, ".\"" ) == 0 )) {
        if (( size < 4 ) || ( clean.compare ( size - 4, 4, "...\"" ) != 0 )) {
            clean.erase ( size - 1 );
        }
    }

    return clean;
}

bool IsLocationHeader ( const std::string &text )
{
    for ( unsigned i = 0; i < SIZE ( locationPhrases ); i++ ) {
        const char *phrase = locationPhrases [i];
        size_t length = strlen ( phrase );
        if (( text.size () >= length ) && ( strnicmp ( text.c_str (), phrase, length ) == 0 )) {
            return true;
        }
    }

    return false;
}

size_t GroupByLocation ( const tStringList &strings, tStringGroupList &groups )
{
    FUNCTION_ENTRY ( NULL, "GroupByLocation", true );

    size_t base = groups.size ();

    for ( size_t i = 0; i < strings.size (); i++ ) {

        std::string line = LightlyClean ( strings [i] );
        if ( line.empty ()) continue;

        if ( IsLocationHeader ( line ) == true ) {
            sStringGroup group;
            group.Global = false;
            group.Header = line;
            groups.push_back ( group );
            continue;
        }

        // Anything before the first location goes in one global group
        if ( groups.size () == base ) {
            sStringGroup group;
            group.Global = true;
            groups.push_back ( group );
        }

        groups.back ().Lines.push_back ( line );
    }

    DBG_STATUS ( groups.size () - base << " groups from " << strings.size () << " strings" );

    return groups.size () - base;
}

std::string FormatGroups ( const tStringGroupList &groups )
{
    std::string text;

    for ( size_t i = 0; i < groups.size (); i++ ) {
        const sStringGroup &group = groups [i];
        text += group.Global ? "GLOBAL / SYSTEM TEXT" : group.Header;
        text += '\n';
        for ( size_t j = 0; j < group.Lines.size (); j++ ) {
            text += "  " + group.Lines [j] + '\n';
        }
        text += '\n';
    }

    return text;
}
