//----------------------------------------------------------------------------
//
// File:        recovery.hpp
// Date:        19-Oct-2026
// Programmer:  Marc Rousseau
//
// Description: Capture to BASIC listing recovery pipeline
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

#ifndef RECOVERY_HPP_
#define RECOVERY_HPP_

#include <string>
#include "tapfile.hpp"
#include "pulses.hpp"
#include "bitdecode.hpp"
#include "tapeblock.hpp"
#include "locator.hpp"
#include "prgimage.hpp"
#include "detokenize.hpp"

const size_t DEFAULT_CHECKSUM_SAMPLE = 200;

enum eRecoveryMode {
    MODE_AUTO,                  // Blocks first, scan if the blocks are unusable
    MODE_BLOCKS,                // Use the tape block structure
    MODE_SCAN                   // Search the raw decoded bytes
};

struct sRecoveryOptions {
    eRecoveryMode       Mode;
    eCopySelect         Copy;
    size_t              ChecksumSample;
    int                 Threads;
    sLocatorSettings    Locator;
    sListOptions        Listing;

    sRecoveryOptions ();
};

struct sDecodedCapture {
    size_t              PulseCount;
    size_t              ClusterableCount;
    sClusterCenters     Centers;
    sDecodeStats        Stats;
    tByteList           Bytes;
};

struct sRecoveryReport {

    eRecoveryMode       Mode;                   // The strategy that produced the image

    // Set when MODE_AUTO gave up on the blocks
    bool                FellBack;
    std::string         FallbackReason;

    // Block mode
    size_t              BlockCount [2];         // Indexed by eBlockCopy
    eBlockCopy          CopyUsed;
    size_t              SelectedBlocks;
    size_t              ChecksumMatches;
    size_t              ChecksumSampled;
    sHeaderElection     Header;
    sAssembleResult     Assembly;

    // Scan mode
    sCandidate          Candidate;

    cProgramImage       Image;
    tListing            Listing;

    sRecoveryReport ();
};

// Throws cRecoveryError ( RECOVERY_EXHAUSTED ) if the pulses can't be classified
void DecodeCapture ( const cTapFile &tap, sDecodedCapture *capture );

// Both throw cRecoveryError ( RECOVERY_EXHAUSTED ) when nothing usable is found
void RecoverFromBlocks ( const tByteList &bytes, const sRecoveryOptions &options, sRecoveryReport *report );
void RecoverByScan ( const tByteList &bytes, const sRecoveryOptions &options, sRecoveryReport *report );

// MODE_AUTO retries with a scan when the blocks or their header are unusable
void RecoverProgram ( const tByteList &bytes, const sRecoveryOptions &options, sRecoveryReport *report );

#endif
