//----------------------------------------------------------------------------
//
// File:        bitdecode.cpp
// Date:        19-Oct-2026
// Programmer:  Marc Rousseau
//
// Description: Pulse category stream to byte stream demodulator
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
#include "logger.hpp"
#include "pulses.hpp"
#include "bitdecode.hpp"

DBG_REGISTER ( __FILE__ );

static inline bool IsByteMarker ( const eCategory *ptr )
{
    return (( ptr [0] == CAT_LONG ) && (( ptr [1] == CAT_SHORT ) || ( ptr [1] == CAT_MEDIUM ))) ? true : false;
}

static bool ReadByte ( const eCategory *ptr, UINT8 *value )
{
    int data = 0;

    for ( int bit = 0; bit < BITS_PER_BYTE; bit++ ) {
        eCategory first  = ptr [ 2 * bit ];
        eCategory second = ptr [ 2 * bit + 1 ];
        if (( first == CAT_MEDIUM ) && ( second == CAT_SHORT )) {
            data |= 1 << bit;
        } else if (( first != CAT_SHORT ) || ( second != CAT_MEDIUM )) {
            return false;
        }
    }

    *value = ( UINT8 ) data;

    return true;
}

size_t DecodeBytes ( const tCategoryList &categories, std::vector<UINT8> &bytes, sDecodeStats *stats )
{
    FUNCTION_ENTRY ( NULL, "DecodeBytes", true );

    size_t count    = categories.size ();
    size_t start    = bytes.size ();
    size_t sync     = 0;
    size_t rejected = 0;

    size_t i = 0;

    while ( i + BYTE_FRAME_SYMBOLS <= count ) {
        const eCategory *ptr = &categories [i];
        if ( IsByteMarker ( ptr ) == false ) {
            i++;
            continue;
        }
        sync++;
        UINT8 value;
        if ( ReadByte ( ptr + BYTE_MARKER_SYMBOLS, &value ) == false ) {
            rejected++;
            i++;
            continue;
        }
        bytes.push_back ( value );
        i += BYTE_FRAME_SYMBOLS;
    }

    if ( stats != NULL ) {
        stats->SyncCandidates = sync;
        stats->Rejected       = rejected;
    }

    DBG_STATUS ( bytes.size () - start << " bytes decoded, " << rejected << " of " << sync << " markers rejected" );

    return bytes.size () - start;
}
