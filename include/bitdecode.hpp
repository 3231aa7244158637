//----------------------------------------------------------------------------
//
// File:        bitdecode.hpp
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

#ifndef BITDECODE_HPP_
#define BITDECODE_HPP_

#include <vector>

//
//  Each byte on tape is framed like this:
//
//     L  S|M  b0a b0b  b1a b1b  ...  b7a b7b
//
//  A bit pair of (M,S) is a 1 and (S,M) is a 0, least significant bit first.
//

const int BYTE_MARKER_SYMBOLS   = 2;
const int BITS_PER_BYTE         = 8;
const int BYTE_FRAME_SYMBOLS    = BYTE_MARKER_SYMBOLS + 2 * BITS_PER_BYTE;

struct sDecodeStats {
    size_t      SyncCandidates;
    size_t      Rejected;
};

// Returns the number of bytes appended to 'bytes'
size_t DecodeBytes ( const tCategoryList &categories, std::vector<UINT8> &bytes, sDecodeStats *stats = NULL );

#endif
