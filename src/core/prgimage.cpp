//----------------------------------------------------------------------------
//
// File:        prgimage.cpp
// Date:        19-Oct-2026
// Programmer:  Marc Rousseau
//
// Description: Load-address prefixed program images
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
#include "recerror.hpp"
#include "support.hpp"
#include "tapeblock.hpp"
#include "prgimage.hpp"

DBG_REGISTER ( __FILE__ );

cProgramImage::cProgramImage () :
    m_LoadAddress ( 0 ),
    m_Body ()
{
    FUNCTION_ENTRY ( this, "cProgramImage ctor", true );
}

cProgramImage::cProgramImage ( UINT16 load, const tByteList &body ) :
    m_LoadAddress ( load ),
    m_Body ( body )
{
    FUNCTION_ENTRY ( this, "cProgramImage ctor", true );
}

bool cProgramImage::Parse ( const UINT8 *data, size_t size )
{
    FUNCTION_ENTRY ( this, "cProgramImage::Parse", true );

    if ( size < ( size_t ) PRG_HEADER_SIZE ) {
        DBG_WARNING ( "Image is too small (" << size << " bytes)" );
        return false;
    }

    m_LoadAddress = GetUINT16LE ( data );
    m_Body.assign ( data + PRG_HEADER_SIZE, data + size );

    return true;
}

bool cProgramImage::Load ( const char *filename )
{
    FUNCTION_ENTRY ( this, "cProgramImage::Load", true );

    tByteList buffer;
    if ( LoadFile ( filename, buffer ) == false ) return false;

    return buffer.empty () ? false : Parse ( &buffer [0], buffer.size ());
}

bool cProgramImage::Save ( const char *filename ) const
{
    FUNCTION_ENTRY ( this, "cProgramImage::Save", true );

    tByteList data;
    Serialize ( data );

    return SaveFile ( filename, &data [0], data.size ());
}

void cProgramImage::Serialize ( tByteList &data ) const
{
    data.resize ( PRG_HEADER_SIZE );
    PutUINT16LE ( &data [0], m_LoadAddress );
    data.insert ( data.end (), m_Body.begin (), m_Body.end ());
}

sAssembleResult AssembleProgram ( const sTapeHeader &header, const tChunkList &chunks, cProgramImage *image, int ceiling )
{
    FUNCTION_ENTRY ( NULL, "AssembleProgram", true );

    int length = header.Length ();

    if (( length <= 0 ) || ( length > ceiling )) {
        char buffer [120];
        snprintf ( buffer, sizeof ( buffer ), "Implausible program length %d ($%04X-$%04X)", length, header.StartAddress, header.EndAddress );
        throw cRecoveryError ( RECOVERY_EXHAUSTED, "assemble", buffer );
    }

    tByteList body;

    for ( size_t i = 0; i < chunks.size (); i++ ) {
        body.insert ( body.end (), chunks [i].begin (), chunks [i].end ());
    }

    sAssembleResult result;
    result.Requested = length;
    result.Available = body.size ();
    result.Shortfall = 0;

    if ( body.size () < ( size_t ) length ) {
        result.Shortfall = length - body.size ();
        DBG_WARNING ( "Need " << length << " bytes but only assembled " << body.size ());
    } else {
        body.resize ( length );
    }

    *image = cProgramImage ( header.StartAddress, body );

    return result;
}
