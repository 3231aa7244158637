//----------------------------------------------------------------------------
//
// File:        prgimage.hpp
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

#ifndef PRGIMAGE_HPP_
#define PRGIMAGE_HPP_

#include <vector>

const int PRG_HEADER_SIZE       = 2;

// Anything larger than this can't have come from a real header
const int MAX_PROGRAM_LENGTH    = 1000000;

typedef std::vector<UINT8> tByteList;
typedef std::vector<tByteList> tChunkList;

struct sTapeHeader;

class cProgramImage {

    UINT16      m_LoadAddress;
    tByteList   m_Body;

public:

    cProgramImage ();
    cProgramImage ( UINT16 load, const tByteList &body );

    // Returns false if there isn't even a load address
    bool Parse ( const UINT8 *data, size_t size );
    bool Load ( const char *filename );
    bool Save ( const char *filename ) const;

    void Serialize ( tByteList &data ) const;

    UINT16 LoadAddress () const;
    const tByteList &Body () const;
    size_t Size () const;

};

inline UINT16 cProgramImage::LoadAddress () const       { return m_LoadAddress; }
inline const tByteList &cProgramImage::Body () const    { return m_Body; }
inline size_t cProgramImage::Size () const              { return PRG_HEADER_SIZE + m_Body.size (); }

struct sAssembleResult {
    size_t      Requested;
    size_t      Available;
    size_t      Shortfall;              // 0 if the chunks covered the declared length
};

// Throws cRecoveryError ( RECOVERY_EXHAUSTED ) if the declared length is implausible
sAssembleResult AssembleProgram ( const sTapeHeader &header, const tChunkList &chunks, cProgramImage *image, int ceiling = MAX_PROGRAM_LENGTH );

#endif
