//----------------------------------------------------------------------------
//
// File:        recovery.cpp
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

#include <string.h>
#include "common.hpp"
#include "logger.hpp"
#include "recerror.hpp"
#include "recovery.hpp"

DBG_REGISTER ( __FILE__ );

sRecoveryOptions::sRecoveryOptions () :
    Mode ( MODE_AUTO ),
    Copy ( COPY_AUTO ),
    ChecksumSample ( DEFAULT_CHECKSUM_SAMPLE ),
    Threads ( 1 ),
    Locator (),
    Listing ()
{
}

sRecoveryReport::sRecoveryReport () :
    Mode ( MODE_BLOCKS ),
    FellBack ( false ),
    FallbackReason (),
    CopyUsed ( BLOCK_COPY_A ),
    SelectedBlocks ( 0 ),
    ChecksumMatches ( 0 ),
    ChecksumSampled ( 0 ),
    Image (),
    Listing ()
{
    BlockCount [ BLOCK_COPY_A ] = 0;
    BlockCount [ BLOCK_COPY_B ] = 0;

    Header.Index   = -1;
    Header.Score   = 0;
    Header.Elected = false;

    Assembly.Requested = 0;
    Assembly.Available = 0;
    Assembly.Shortfall = 0;

    Candidate.Offset      = 0;
    Candidate.EndOffset   = 0;
    Candidate.LoadAddress = 0;
    Candidate.Lines       = 0;
    Candidate.Penalty     = 0;
    Candidate.Score       = 0;
}

void DecodeCapture ( const cTapFile &tap, sDecodedCapture *capture )
{
    FUNCTION_ENTRY ( NULL, "DecodeCapture", true );

    const tPulseList &pulses = tap.Pulses ();

    cPulseClassifier classifier;
    classifier.Train ( pulses );

    tCategoryList categories;
    classifier.Classify ( pulses, categories );

    capture->PulseCount       = pulses.size ();
    capture->ClusterableCount = classifier.ClusterableCount ();
    capture->Centers          = classifier.Centers ();

    capture->Bytes.clear ();
    DecodeBytes ( categories, capture->Bytes, &capture->Stats );
}

void RecoverFromBlocks ( const tByteList &bytes, const sRecoveryOptions &options, sRecoveryReport *report )
{
    FUNCTION_ENTRY ( NULL, "RecoverFromBlocks", true );

    report->Mode = MODE_BLOCKS;

    tBlockList blocks;
    FindBlocks ( bytes, blocks );

    report->BlockCount [ BLOCK_COPY_A ] = CountBlocks ( blocks, BLOCK_COPY_A );
    report->BlockCount [ BLOCK_COPY_B ] = CountBlocks ( blocks, BLOCK_COPY_B );

    tBlockList selected;
    report->CopyUsed        = SelectBlocks ( blocks, options.Copy, selected );
    report->SelectedBlocks  = selected.size ();
    report->ChecksumMatches = CountChecksumMatches ( selected, options.ChecksumSample );
    report->ChecksumSampled = ( selected.size () < options.ChecksumSample ) ? selected.size () : options.ChecksumSample;

    LocateHeader ( selected, options.Locator, &report->Header );

    // Everything after the header is program data
    tChunkList chunks;
    for ( size_t i = ( size_t ) report->Header.Index + 1; i < selected.size (); i++ ) {
        chunks.push_back ( tByteList ( selected [i].Payload, selected [i].Payload + BLOCK_PAYLOAD_SIZE ));
    }

    report->Assembly = AssembleProgram ( report->Header.Header, chunks, &report->Image );

    report->Listing.clear ();
    ListProgram ( report->Image, options.Listing, report->Listing );
}

void RecoverByScan ( const tByteList &bytes, const sRecoveryOptions &options, sRecoveryReport *report )
{
    FUNCTION_ENTRY ( NULL, "RecoverByScan", true );

    report->Mode = MODE_SCAN;

    report->Candidate = LocateProgram ( bytes, options.Locator, options.Threads );

    const sCandidate &best = report->Candidate;

    if ( report->Image.Parse ( &bytes [ best.Offset ], best.EndOffset - best.Offset ) == false ) {
        throw cRecoveryError ( RECOVERY_EXHAUSTED, "locate", "Candidate program is empty" );
    }

    report->Listing.clear ();
    ListProgram ( report->Image, options.Listing, report->Listing );
}

void RecoverProgram ( const tByteList &bytes, const sRecoveryOptions &options, sRecoveryReport *report )
{
    FUNCTION_ENTRY ( NULL, "RecoverProgram", true );

    report->FellBack = false;
    report->FallbackReason.clear ();

    switch ( options.Mode ) {
        case MODE_SCAN :
            RecoverByScan ( bytes, options, report );
            return;
        case MODE_BLOCKS :
            RecoverFromBlocks ( bytes, options, report );
            return;
        case MODE_AUTO :
        default :
            break;
    }

    try {
        RecoverFromBlocks ( bytes, options, report );
        return;
    }
    catch ( const cRecoveryError &error ) {
        // Only a missing block structure is a reason to try the scan
        bool structural = (( strcmp ( error.Stage (), "blocks" ) == 0 ) || ( strcmp ( error.Stage (), "header" ) == 0 )) ? true : false;
        if (( error.Kind () != RECOVERY_EXHAUSTED ) || ( structural == false )) throw;
        report->FellBack       = true;
        report->FallbackReason = error.what ();
    }

    DBG_EVENT ( "Block recovery failed (" << report->FallbackReason << ") - scanning the decoded bytes" );

    // Start the second attempt from a clean report
    std::string reason = report->FallbackReason;
    *report = sRecoveryReport ();
    report->FellBack       = true;
    report->FallbackReason = reason;

    RecoverByScan ( bytes, options, report );
}
