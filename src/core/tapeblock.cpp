//----------------------------------------------------------------------------
//
// File:        tapeblock.cpp
// Date:        19-Oct-2026
// Programmer:  Marc Rousseau
//
// Description: Countdown framed tape blocks
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

#include <string.h>
#include "common.hpp"
#include "logger.hpp"
#include "recerror.hpp"
#include "tapeblock.hpp"

DBG_REGISTER ( __FILE__ );

static const UINT8 CountdownA [ COUNTDOWN_SIZE ] = { 0x89, 0x88, 0x87, 0x86, 0x85, 0x84, 0x83, 0x82, 0x81 };
static const UINT8 CountdownB [ COUNTDOWN_SIZE ] = { 0x09, 0x08, 0x07, 0x06, 0x05, 0x04, 0x03, 0x02, 0x01 };

UINT8 XorChecksum ( const UINT8 *data, size_t length )
{
    UINT8 sum = 0;

    for ( size_t i = 0; i < length; i++ ) {
        sum ^= data [i];
    }

    return sum;
}

size_t FindBlocks ( const std::vector<UINT8> &data, tBlockList &blocks )
{
    FUNCTION_ENTRY ( NULL, "FindBlocks", true );

    size_t length = data.size ();
    size_t found  = 0;
    size_t bad    = 0;

    size_t i = 0;

    while ( i + BLOCK_FRAME_SIZE <= length ) {

        const UINT8 *ptr = &data [i];

        eBlockCopy copy;
        if ( memcmp ( ptr, CountdownA, COUNTDOWN_SIZE ) == 0 ) {
            copy = BLOCK_COPY_A;
        } else if ( memcmp ( ptr, CountdownB, COUNTDOWN_SIZE ) == 0 ) {
            copy = BLOCK_COPY_B;
        } else {
            i++;
            continue;
        }

        sTapeBlock block;
        memcpy ( block.Payload, ptr + COUNTDOWN_SIZE, BLOCK_PAYLOAD_SIZE );
        block.Checksum = ptr [ COUNTDOWN_SIZE + BLOCK_PAYLOAD_SIZE ];
        block.Copy     = copy;
        block.Offset   = i + COUNTDOWN_SIZE;

        if ( block.ChecksumOK () == false ) {
            DBG_EVENT ( "Checksum mismatch in block at offset " << block.Offset );
            bad++;
        }

        blocks.push_back ( block );
        found++;

        i += BLOCK_FRAME_SIZE;
    }

    DBG_STATUS ( found << " blocks found (" << bad << " with bad checksums)" );

    return found;
}

eBlockCopy SelectBlocks ( const tBlockList &blocks, eCopySelect select, tBlockList &selected )
{
    FUNCTION_ENTRY ( NULL, "SelectBlocks", true );

    eBlockCopy copy = BLOCK_COPY_A;

    switch ( select ) {
        case COPY_PRIMARY :
            copy = BLOCK_COPY_A;
            break;
        case COPY_DUPLICATE :
            copy = BLOCK_COPY_B;
            break;
        case COPY_AUTO :
        default :
            copy = ( CountBlocks ( blocks, BLOCK_COPY_A ) > 0 ) ? BLOCK_COPY_A : BLOCK_COPY_B;
            break;
    }

    selected.clear ();

    for ( size_t i = 0; i < blocks.size (); i++ ) {
        if ( blocks [i].Copy == copy ) selected.push_back ( blocks [i] );
    }

    if ( selected.empty ()) {
        if ( blocks.empty ()) {
            throw cRecoveryError ( RECOVERY_EXHAUSTED, "blocks", "No countdown blocks found in decoded byte stream" );
        }
        throw cRecoveryError ( RECOVERY_EXHAUSTED, "blocks", "No blocks available for selected copy stream" );
    }

    return copy;
}

size_t CountBlocks ( const tBlockList &blocks, eBlockCopy copy )
{
    size_t count = 0;

    for ( size_t i = 0; i < blocks.size (); i++ ) {
        if ( blocks [i].Copy == copy ) count++;
    }

    return count;
}

size_t CountChecksumMatches ( const tBlockList &blocks, size_t sample )
{
    size_t limit = ( blocks.size () < sample ) ? blocks.size () : sample;
    size_t good  = 0;

    for ( size_t i = 0; i < limit; i++ ) {
        if ( blocks [i].ChecksumOK ()) good++;
    }

    return good;
}

void ParseHeader ( const UINT8 *payload, sTapeHeader *header )
{
    header->FileType     = payload [0];
    header->StartAddress = GetUINT16LE ( payload + 1 );
    header->EndAddress   = GetUINT16LE ( payload + 3 );
    memcpy ( header->RawName, payload + HEADER_NAME_OFFSET, HEADER_NAME_SIZE );
}

std::string HeaderName ( const sTapeHeader &header )
{
    int length = HEADER_NAME_SIZE;
    while (( length > 0 ) && ( header.RawName [ length - 1 ] == 0x20 )) length--;

    std::string name;

    for ( int i = 0; i < length; i++ ) {
        UINT8 ch = header.RawName [i];
        name += (( ch >= 0x20 ) && ( ch <= 0x7E )) ? ( char ) ch : '.';
    }

    return name;
}
