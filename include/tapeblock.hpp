//----------------------------------------------------------------------------
//
// File:        tapeblock.hpp
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

#ifndef TAPEBLOCK_HPP_
#define TAPEBLOCK_HPP_

#include <string>
#include <vector>

//
//  Every block is written twice.  The first copy is preceded by the countdown
//  89 88 87 .. 81 and the repeat by 09 08 07 .. 01:
//
//   +-----------+----------------------+----------+
//   | countdown |   192 payload bytes  | checksum |
//   |  9 bytes  |                      |  XOR     |
//   +-----------+----------------------+----------+
//
//  The header block payload looks like:
//
//   Offset  Size  Contents
//     0      1    File type
//     1      2    Start address
//     3      2    End address
//     5     16    File name (padded with spaces)
//

const int COUNTDOWN_SIZE        = 9;
const int BLOCK_PAYLOAD_SIZE    = 192;
const int BLOCK_FRAME_SIZE      = COUNTDOWN_SIZE + BLOCK_PAYLOAD_SIZE + 1;

const int HEADER_NAME_OFFSET    = 5;
const int HEADER_NAME_SIZE      = 16;

enum eBlockCopy {
    BLOCK_COPY_A,
    BLOCK_COPY_B
};

enum eCopySelect {
    COPY_AUTO,
    COPY_PRIMARY,
    COPY_DUPLICATE
};

struct sTapeBlock {
    UINT8       Payload [ BLOCK_PAYLOAD_SIZE ];
    UINT8       Checksum;
    eBlockCopy  Copy;
    size_t      Offset;                 // Position of Payload [0] in the decoded stream

    bool ChecksumOK () const;
};

typedef std::vector<sTapeBlock> tBlockList;

struct sTapeHeader {
    UINT8       FileType;
    UINT16      StartAddress;
    UINT16      EndAddress;
    UINT8       RawName [ HEADER_NAME_SIZE ];

    int Length () const;
};

inline int sTapeHeader::Length () const     { return ( int ) EndAddress - ( int ) StartAddress; }

UINT8 XorChecksum ( const UINT8 *data, size_t length );

inline bool sTapeBlock::ChecksumOK () const { return ( XorChecksum ( Payload, BLOCK_PAYLOAD_SIZE ) == Checksum ) ? true : false; }

// Appends every framed block found in 'data' to 'blocks' and returns the number found
size_t FindBlocks ( const std::vector<UINT8> &data, tBlockList &blocks );

// Throws cRecoveryError ( RECOVERY_EXHAUSTED ) if the selection is empty
eBlockCopy SelectBlocks ( const tBlockList &blocks, eCopySelect select, tBlockList &selected );

size_t CountBlocks ( const tBlockList &blocks, eBlockCopy copy );
size_t CountChecksumMatches ( const tBlockList &blocks, size_t sample );

void ParseHeader ( const UINT8 *payload, sTapeHeader *header );
std::string HeaderName ( const sTapeHeader &header );

#endif
