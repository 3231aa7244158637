//----------------------------------------------------------------------------
//
// File:        tapfile.cpp
// Date:        19-Oct-2026
// Programmer:  Marc Rousseau
//
// Description: Raw cassette capture (C64-TAPE-RAW) pulse reader
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
#include "recerror.hpp"
#include "support.hpp"
#include "tapfile.hpp"

DBG_REGISTER ( __FILE__ );

cTapFile::cTapFile () :
    m_Version ( 0 ),
    m_DeclaredLength ( 0 ),
    m_StreamLength ( 0 ),
    m_ExtendedCount ( 0 ),
    m_Pulses ()
{
    FUNCTION_ENTRY ( this, "cTapFile ctor", true );
}

void cTapFile::Parse ( const UINT8 *data, size_t size )
{
    FUNCTION_ENTRY ( this, "cTapFile::Parse", true );

    m_Pulses.clear ();
    m_Version        = 0;
    m_DeclaredLength = 0;
    m_StreamLength   = 0;
    m_ExtendedCount  = 0;

    if (( size < ( size_t ) TAP_HEADER_SIZE ) || ( memcmp ( data, TAP_SIGNATURE, TAP_SIGNATURE_SIZE ) != 0 )) {
        throw cRecoveryError ( RECOVERY_FORMAT, "read", "Not a TAP file with C64-TAPE-RAW signature" );
    }

    m_Version = data [ TAP_VERSION_OFFSET ];
    if ( m_Version != TAP_SUPPORTED_VERSION ) {
        char buffer [80];
        snprintf ( buffer, sizeof ( buffer ), "Unsupported TAP version %d (expect %d)", m_Version, TAP_SUPPORTED_VERSION );
        throw cRecoveryError ( RECOVERY_FORMAT, "read", buffer );
    }

    m_DeclaredLength = GetUINT32LE ( data + TAP_LENGTH_OFFSET );

    size_t available = size - TAP_HEADER_SIZE;
    m_StreamLength = ( m_DeclaredLength < available ) ? m_DeclaredLength : ( UINT32 ) available;

    if ( m_StreamLength < m_DeclaredLength ) {
        DBG_WARNING ( "Capture is truncated: " << m_StreamLength << " of " << m_DeclaredLength << " bytes present" );
    }

    const UINT8 *ptr = data + TAP_HEADER_SIZE;
    const UINT8 *end = ptr + m_StreamLength;

    m_Pulses.reserve ( m_StreamLength );

    while ( ptr < end ) {
        if ( *ptr != 0 ) {
            m_Pulses.push_back ( *ptr++ );
            continue;
        }
        // A partial extended record at the very end is just dropped
        if ( end - ptr < 4 ) break;
        m_Pulses.push_back ( GetUINT24LE ( ptr + 1 ));
        m_ExtendedCount++;
        ptr += 4;
    }

    DBG_STATUS ( m_Pulses.size () << " pulses (" << m_ExtendedCount << " extended)" );
}

bool cTapFile::Load ( const char *filename )
{
    FUNCTION_ENTRY ( this, "cTapFile::Load", true );

    std::vector<UINT8> buffer;
    if ( LoadFile ( filename, buffer ) == false ) {
        return false;
    }

    // An empty file still has to be reported as a bad capture
    static const UINT8 empty [1] = { 0 };

    Parse ( buffer.empty () ? empty : &buffer [0], buffer.size ());

    return true;
}
