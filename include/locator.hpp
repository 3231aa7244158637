//----------------------------------------------------------------------------
//
// File:        locator.hpp
// Date:        19-Oct-2026
// Programmer:  Marc Rousseau
//
// Description: Locate a tokenized BASIC program in a decoded tape stream
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

#ifndef LOCATOR_HPP_
#define LOCATOR_HPP_

#include <vector>
#include "tapeblock.hpp"

//
//  None of these numbers come from anywhere but experience with real (bad)
//  captures.  They're grouped here so they can be tuned without touching the
//  scanner itself.
//

enum eHeaderPolicy {
    HEADER_ELECT,               // Score every block, best one wins
    HEADER_FIRST_BLOCK          // The first selected block is the header
};

struct sLocatorSettings {

    // Byte stream scan
    UINT16      MinLoadAddress;         // 0x0400
    UINT16      MaxLoadAddress;         // 0x4000
    UINT16      CanonicalLoadAddress;   // 0x1001
    int         MinLines;               // 3
    int         MaxRecords;             // 5000
    int         MaxLineNumber;          // 63999
    int         MaxLineLength;          // 512
    int         LineWeight;             // 50
    int         ClosenessLimit;         // 40
    int         ClosenessScale;         // 16
    int         DecreasingLinePenalty;  // 10
    int         MismatchLimit;          // 64
    int         MismatchPenalty;        // 25
    int         MismatchDivisor;        // 4
    int         BackwardPointerPenalty; // 15
    int         MaxPenalty;             // 400
    size_t      TailReserve;            // 0

    // Header block scoring
    eHeaderPolicy HeaderPolicy;         // HEADER_ELECT
    UINT16      MinHeaderStart;         // 0x0200
    UINT16      MaxHeaderStart;         // 0x8000
    int         MinHeaderLength;        // 512
    int         MaxHeaderLength;        // 32768
    UINT16      WindowStart;            // 0x0F00
    UINT16      WindowEnd;              // 0x2000
    int         WindowBonus;            // 20
    int         ProximityLimit;         // 20
    int         ProximityScale;         // 32
    int         SizeScale;              // 512
    int         SizeBonusLimit;         // 40

    sLocatorSettings ();
};

struct sCandidate {
    size_t      Offset;                 // Position of the load address
    size_t      EndOffset;              // Just past the terminating 00 00 record
    UINT16      LoadAddress;
    int         Lines;
    int         Penalty;
    int         Score;
};

struct sHeaderElection {
    int         Index;                  // Index of the header in the selected blocks
    int         Score;
    bool        Elected;                // false if we fell back to the first block
    sTapeHeader Header;
};

// Stateless - returns true if a plausible program starts at 'offset'
bool EvaluateCandidate ( const UINT8 *data, size_t size, size_t offset, const sLocatorSettings &settings, sCandidate *candidate );

// Best candidate with offset in [first,last).  Returns false if there isn't one.
bool ScanRange ( const UINT8 *data, size_t size, size_t first, size_t last, const sLocatorSettings &settings, sCandidate *best );

// Throws cRecoveryError ( RECOVERY_EXHAUSTED ) if nothing plausible is found
sCandidate LocateProgram ( const std::vector<UINT8> &data, const sLocatorSettings &settings, int threads = 1 );

bool ScoreHeader ( const UINT8 *payload, const sLocatorSettings &settings, sTapeHeader *header, int *score );

// Returns -1 if no block looks like a header
int ElectHeader ( const tBlockList &blocks, const sLocatorSettings &settings, int *score );

// Throws cRecoveryError ( RECOVERY_EXHAUSTED ) if no usable header can be found
void LocateHeader ( const tBlockList &blocks, const sLocatorSettings &settings, sHeaderElection *election );

#endif
