//----------------------------------------------------------------------------
//
// File:        tapfile.hpp
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

#ifndef TAPFILE_HPP_
#define TAPFILE_HPP_

#include <vector>

//
//  Container layout:
//
//   Offset  Size  Contents
//   ------  ----  -----------------------------------------
//     0      12   "C64-TAPE-RAW"
//    12       1   Version (only 1 is supported)
//    13       3   Reserved
//    16       4   Length of the pulse stream (little-endian)
//    20       n   Pulse stream
//
//  Each non-zero byte in the stream is one pulse of that many ticks.  A zero
//  byte is followed by a 24-bit little-endian duration for pulses that don't
//  fit in a byte (leader, gaps).
//

const char TAP_SIGNATURE []       = "C64-TAPE-RAW";
const int  TAP_SIGNATURE_SIZE     = 12;
const int  TAP_VERSION_OFFSET     = 12;
const int  TAP_LENGTH_OFFSET      = 16;
const int  TAP_HEADER_SIZE        = 20;
const int  TAP_SUPPORTED_VERSION  = 1;

typedef std::vector<UINT32> tPulseList;

class cTapFile {

    UINT8       m_Version;
    UINT32      m_DeclaredLength;
    UINT32      m_StreamLength;
    UINT32      m_ExtendedCount;
    tPulseList  m_Pulses;

public:

    cTapFile ();

    // Throws cRecoveryError ( RECOVERY_FORMAT ) if the image isn't a usable capture
    void Parse ( const UINT8 *data, size_t size );

    // Returns false if the file can't be read
    bool Load ( const char *filename );

    UINT8 Version () const;
    UINT32 DeclaredLength () const;
    UINT32 StreamLength () const;
    UINT32 ExtendedCount () const;
    bool IsTruncated () const;

    const tPulseList &Pulses () const;

};

inline UINT8 cTapFile::Version () const                 { return m_Version; }
inline UINT32 cTapFile::DeclaredLength () const         { return m_DeclaredLength; }
inline UINT32 cTapFile::StreamLength () const           { return m_StreamLength; }
inline UINT32 cTapFile::ExtendedCount () const          { return m_ExtendedCount; }
inline bool cTapFile::IsTruncated () const              { return ( m_StreamLength < m_DeclaredLength ) ? true : false; }
inline const tPulseList &cTapFile::Pulses () const      { return m_Pulses; }

#endif
