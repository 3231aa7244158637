//----------------------------------------------------------------------------
//
// File:        locator.cpp
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

#include <stdio.h>
#include <stdlib.h>
#include <string.h>
#include "SDL.h"
#include "SDL_thread.h"
#include "common.hpp"
#include "logger.hpp"
#include "recerror.hpp"
#include "tapeblock.hpp"
#include "prgimage.hpp"
#include "locator.hpp"

DBG_REGISTER ( __FILE__ );

// Below this many offsets per thread it isn't worth starting one
const size_t MIN_OFFSETS_PER_THREAD = 4096;

sLocatorSettings::sLocatorSettings () :
    MinLoadAddress ( 0x0400 ),
    MaxLoadAddress ( 0x4000 ),
    CanonicalLoadAddress ( 0x1001 ),
    MinLines ( 3 ),
    MaxRecords ( 5000 ),
    MaxLineNumber ( 63999 ),
    MaxLineLength ( 512 ),
    LineWeight ( 50 ),
    ClosenessLimit ( 40 ),
    ClosenessScale ( 16 ),
    DecreasingLinePenalty ( 10 ),
    MismatchLimit ( 64 ),
    MismatchPenalty ( 25 ),
    MismatchDivisor ( 4 ),
    BackwardPointerPenalty ( 15 ),
    MaxPenalty ( 400 ),
    TailReserve ( 0 ),
    HeaderPolicy ( HEADER_ELECT ),
    MinHeaderStart ( 0x0200 ),
    MaxHeaderStart ( 0x8000 ),
    MinHeaderLength ( 512 ),
    MaxHeaderLength ( 32768 ),
    WindowStart ( 0x0F00 ),
    WindowEnd ( 0x2000 ),
    WindowBonus ( 20 ),
    ProximityLimit ( 20 ),
    ProximityScale ( 32 ),
    SizeScale ( 512 ),
    SizeBonusLimit ( 40 )
{
}

//----------------------------------------------------------------------------
//
//  A BASIC program in memory is a chain of line records:
//
//     +------+------+------------------+----+
//     | next | line |  tokenized text  | 00 |
//     +------+------+------------------+----+
//
//  terminated by a record with a next pointer of 0.  Bytes dropped or
//  inserted by the demodulator make the pointers lie, so we walk the chain
//  using the terminators and only use the pointers to judge how much we
//  should trust what we found.
//
//----------------------------------------------------------------------------

bool EvaluateCandidate ( const UINT8 *data, size_t size, size_t offset, const sLocatorSettings &settings, sCandidate *candidate )
{
    if ( offset + 10 >= size ) return false;

    UINT16 load = GetUINT16LE ( data + offset );
    if (( load < settings.MinLoadAddress ) || ( load > settings.MaxLoadAddress )) return false;

    size_t p        = offset + 2;
    int    lines    = 0;
    int    penalty  = 0;
    long   lastLine = -1;
    UINT16 lastNext = load;

    for ( int record = 0; record < settings.MaxRecords; record++ ) {

        if ( p + 4 >= size ) break;

        UINT16 next   = GetUINT16LE ( data + p );
        UINT16 number = GetUINT16LE ( data + p + 2 );

        if ( next == 0 ) {
            if ( lines < settings.MinLines ) break;
            int distance  = abs (( int ) load - ( int ) settings.CanonicalLoadAddress ) / settings.ClosenessScale;
            int closeness = ( distance < settings.ClosenessLimit ) ? settings.ClosenessLimit - distance : 0;
            candidate->Offset      = offset;
            candidate->EndOffset   = p + 4;
            candidate->LoadAddress = load;
            candidate->Lines       = lines;
            candidate->Penalty     = penalty;
            candidate->Score       = lines * settings.LineWeight + closeness - penalty;
            return true;
        }

        if ( number > settings.MaxLineNumber ) break;
        if (( lines > 0 ) && ( number < lastLine )) penalty += settings.DecreasingLinePenalty;

        size_t limit = size - ( p + 4 );
        if ( limit > ( size_t ) settings.MaxLineLength ) limit = settings.MaxLineLength;

        const UINT8 *eol = ( const UINT8 * ) memchr ( data + p + 4, 0, limit );
        if ( eol == NULL ) break;

        long expected = ( long ) offset + 2 + (( long ) next - ( long ) load );
        long actual   = ( long ) ( eol - data ) + 1;
        long mismatch = labs ( expected - actual );

        if ( mismatch > settings.MismatchLimit ) {
            penalty += settings.MismatchPenalty;
        } else if ( mismatch > 0 ) {
            penalty += ( int ) ( mismatch / settings.MismatchDivisor );
        }

        if ( next <= lastNext ) penalty += settings.BackwardPointerPenalty;

        lastLine = number;
        lastNext = next;
        p        = ( size_t ) actual;
        lines++;

        if ( penalty > settings.MaxPenalty ) break;
    }

    return false;
}

bool ScanRange ( const UINT8 *data, size_t size, size_t first, size_t last, const sLocatorSettings &settings, sCandidate *best )
{
    FUNCTION_ENTRY ( NULL, "ScanRange", true );

    bool found = false;

    for ( size_t offset = first; offset < last; offset++ ) {
        sCandidate candidate;
        if ( EvaluateCandidate ( data, size, offset, settings, &candidate ) == false ) continue;
        // Ties go to the earliest offset
        if (( found == false ) || ( candidate.Score > best->Score )) {
            *best = candidate;
            found = true;
        }
    }

    return found;
}

struct sScanJob {
    const UINT8            *Data;
    size_t                  Size;
    size_t                  First;
    size_t                  Last;
    const sLocatorSettings *Settings;
    SDL_Thread             *Thread;
    bool                    Found;
    sCandidate              Best;
};

static int ScanThreadProc ( void *arg )
{
    sScanJob *job = static_cast<sScanJob *>( arg );

    job->Found = ScanRange ( job->Data, job->Size, job->First, job->Last, *job->Settings, &job->Best );

    return 0;
}

static bool ParallelScan ( const UINT8 *data, size_t size, size_t limit, const sLocatorSettings &settings, int threads, sCandidate *best )
{
    FUNCTION_ENTRY ( NULL, "ParallelScan", true );

    std::vector<sScanJob> jobs ( threads );

    size_t chunk = ( limit + threads - 1 ) / threads;

    for ( int i = 0; i < threads; i++ ) {
        sScanJob &job = jobs [i];
        job.Data     = data;
        job.Size     = size;
        job.First    = ( i * chunk < limit ) ? i * chunk : limit;
        job.Last     = ( job.First + chunk < limit ) ? job.First + chunk : limit;
        job.Settings = &settings;
        job.Found    = false;
        job.Thread   = SDL_CreateThread ( ScanThreadProc, &job );
        if ( job.Thread == NULL ) {
            DBG_WARNING ( "Unable to start scan thread: " << SDL_GetError ());
            ScanThreadProc ( &job );
        }
    }

    bool found = false;

    // Reduce in offset order so the winner doesn't depend on scheduling
    for ( int i = 0; i < threads; i++ ) {
        sScanJob &job = jobs [i];
        if ( job.Thread != NULL ) {
            SDL_WaitThread ( job.Thread, NULL );
        }
        if ( job.Found == false ) continue;
        if (( found == false ) || ( job.Best.Score > best->Score )) {
            *best = job.Best;
            found = true;
        }
    }

    return found;
}

sCandidate LocateProgram ( const std::vector<UINT8> &data, const sLocatorSettings &settings, int threads )
{
    FUNCTION_ENTRY ( NULL, "LocateProgram", true );

    size_t size  = data.size ();
    size_t limit = ( size > settings.TailReserve ) ? size - settings.TailReserve : 0;

    if (( threads > 1 ) && ( limit / threads < MIN_OFFSETS_PER_THREAD )) {
        threads = ( int ) ( limit / MIN_OFFSETS_PER_THREAD );
    }

    sCandidate best;
    bool found = false;

    if ( limit > 0 ) {
        if ( threads > 1 ) {
            DBG_STATUS ( "Scanning " << limit << " offsets on " << threads << " threads" );
            found = ParallelScan ( &data [0], size, limit, settings, threads, &best );
        } else {
            found = ScanRange ( &data [0], size, 0, limit, settings, &best );
        }
    }

    if ( found == false ) {
        throw cRecoveryError ( RECOVERY_EXHAUSTED, "locate",
                               "Could not find a plausible BASIC program in the decoded bytes - "
                               "the byte decoder is too lossy for structural recovery" );
    }

    DBG_STATUS ( "Best candidate at " << best.Offset << " score " << best.Score );

    return best;
}

bool ScoreHeader ( const UINT8 *payload, const sLocatorSettings &settings, sTapeHeader *header, int *score )
{
    ParseHeader ( payload, header );

    int start  = header->StartAddress;
    int length = header->Length ();

    if (( start < settings.MinHeaderStart ) || ( start > settings.MaxHeaderStart )) return false;
    if (( length < settings.MinHeaderLength ) || ( length > settings.MaxHeaderLength )) return false;

    int printable = 0;
    int nonspace  = 0;

    for ( int i = 0; i < HEADER_NAME_SIZE; i++ ) {
        UINT8 ch = header->RawName [i];
        if ( ch != 0x20 ) nonspace++;
        if ((( ch >= 0x20 ) && ( ch <= 0x5A )) || (( ch >= 0x61 ) && ( ch <= 0x7A )) || ( ch == 0x5F )) printable++;
    }

    if ( nonspace == 0 ) return false;

    int total = 0;

    if (( start >= settings.WindowStart ) && ( start <= settings.WindowEnd )) {
        int proximity = settings.ProximityLimit - abs ( start - ( int ) settings.CanonicalLoadAddress ) / settings.ProximityScale;
        total += settings.WindowBonus + (( proximity > 0 ) ? proximity : 0 );
    }

    int size = length / settings.SizeScale;

    total += printable;
    total += ( size < settings.SizeBonusLimit ) ? size : settings.SizeBonusLimit;

    *score = total;

    return true;
}

int ElectHeader ( const tBlockList &blocks, const sLocatorSettings &settings, int *score )
{
    FUNCTION_ENTRY ( NULL, "ElectHeader", true );

    int best = -1;

    for ( size_t i = 0; i < blocks.size (); i++ ) {
        sTapeHeader header;
        int value;
        if ( ScoreHeader ( blocks [i].Payload, settings, &header, &value ) == false ) continue;
        DBG_TRACE ( "Block " << i << " scores " << value << " as a header" );
        if (( best == -1 ) || ( value > *score )) {
            best   = ( int ) i;
            *score = value;
        }
    }

    return best;
}

void LocateHeader ( const tBlockList &blocks, const sLocatorSettings &settings, sHeaderElection *election )
{
    FUNCTION_ENTRY ( NULL, "LocateHeader", true );

    if ( blocks.empty ()) {
        throw cRecoveryError ( RECOVERY_EXHAUSTED, "header", "No blocks to take a header from" );
    }

    int score = 0;
    int index = ( settings.HeaderPolicy == HEADER_ELECT ) ? ElectHeader ( blocks, settings, &score ) : -1;

    if ( index >= 0 ) {
        election->Index   = index;
        election->Score   = score;
        election->Elected = true;
        ParseHeader ( blocks [index].Payload, &election->Header );
        return;
    }

    if ( settings.HeaderPolicy == HEADER_ELECT ) {
        DBG_WARNING ( "No block scored as a header - using the first block" );
    }

    election->Index   = 0;
    election->Score   = 0;
    election->Elected = false;
    ParseHeader ( blocks [0].Payload, &election->Header );

    int length = election->Header.Length ();

    if (( length <= 0 ) || ( length > MAX_PROGRAM_LENGTH )) {
        char buffer [160];
        snprintf ( buffer, sizeof ( buffer ), "No plausible header block found (first block declares %d bytes at $%04X) - "
                   "the TAP polarity may be wrong or the byte decoding isn't stable enough", length, election->Header.StartAddress );
        throw cRecoveryError ( RECOVERY_EXHAUSTED, "header", buffer );
    }
}
