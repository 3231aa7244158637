//----------------------------------------------------------------------------
//
// File:        tap2bas.cpp
// Date:        19-Oct-2026
// Programmer:  Marc Rousseau
//
// Description: Recover a BASIC program listing from a raw cassette capture
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
#include "common.hpp"
#include "logger.hpp"
#include "option.hpp"
#include "support.hpp"
#include "recerror.hpp"
#include "recovery.hpp"

DBG_REGISTER ( __FILE__ );

static const char *DEFAULT_DECODED_FILE = "decoded_bytes.bin";

static const int MAX_SCAN_THREADS   = 64;
static const int MAX_SCAN_PENALTY   = 1000000;

bool ParseMode ( const char *arg, void *ptr )
{
    FUNCTION_ENTRY ( NULL, "ParseMode", true );

    if ( arg == NULL ) return false;

    if ( stricmp ( arg, "auto" ) == 0 ) {
        * ( eRecoveryMode * ) ptr = MODE_AUTO;
    } else if ( stricmp ( arg, "blocks" ) == 0 ) {
        * ( eRecoveryMode * ) ptr = MODE_BLOCKS;
    } else if ( stricmp ( arg, "scan" ) == 0 ) {
        * ( eRecoveryMode * ) ptr = MODE_SCAN;
    } else {
        fprintf ( stderr, "Unknown recovery mode '%s' (expect auto, blocks or scan)\n", arg );
        return false;
    }

    return true;
}

bool ParseCopy ( const char *arg, void *ptr )
{
    FUNCTION_ENTRY ( NULL, "ParseCopy", true );

    if ( arg == NULL ) return false;

    if ( stricmp ( arg, "A" ) == 0 ) {
        * ( eCopySelect * ) ptr = COPY_PRIMARY;
    } else if ( stricmp ( arg, "B" ) == 0 ) {
        * ( eCopySelect * ) ptr = COPY_DUPLICATE;
    } else if ( stricmp ( arg, "AUTO" ) == 0 ) {
        * ( eCopySelect * ) ptr = COPY_AUTO;
    } else {
        fprintf ( stderr, "Unknown block copy '%s' (expect A, B or AUTO)\n", arg );
        return false;
    }

    return true;
}

static void PrintCapture ( const cTapFile &tap, const sDecodedCapture &capture )
{
    FUNCTION_ENTRY ( NULL, "PrintCapture", true );

    if ( verbose > 0 ) {
        fprintf ( stdout, "Pulses: %u (%u extended), %u in range\n", ( unsigned ) capture.PulseCount, tap.ExtendedCount (), ( unsigned ) capture.ClusterableCount );
    }

    fprintf ( stdout, "Pulse centers (S/M/L): %.2f / %.2f / %.2f\n", capture.Centers.Center [ CAT_SHORT ], capture.Centers.Center [ CAT_MEDIUM ], capture.Centers.Center [ CAT_LONG ] );
    fprintf ( stdout, "Decoded byte stream length: %u\n", ( unsigned ) capture.Bytes.size ());

    if ( verbose > 0 ) {
        fprintf ( stdout, "Byte markers rejected: %u of %u\n", ( unsigned ) capture.Stats.Rejected, ( unsigned ) capture.Stats.SyncCandidates );
    }
}

static void PrintBlockReport ( const sRecoveryReport &report, const sRecoveryOptions &options )
{
    FUNCTION_ENTRY ( NULL, "PrintBlockReport", true );

    size_t countA = report.BlockCount [ BLOCK_COPY_A ];
    size_t countB = report.BlockCount [ BLOCK_COPY_B ];

    fprintf ( stdout, "Countdown blocks found (A/B/total): %u %u %u\n", ( unsigned ) countA, ( unsigned ) countB, ( unsigned ) ( countA + countB ));
    fprintf ( stdout, "Using copy: %c blocks: %u\n", ( report.CopyUsed == BLOCK_COPY_A ) ? 'A' : 'B', ( unsigned ) report.SelectedBlocks );
    fprintf ( stdout, "Checksum matches in first %u used blocks: %u / %u\n", ( unsigned ) report.ChecksumSampled, ( unsigned ) report.ChecksumMatches, ( unsigned ) report.ChecksumSampled );

    const sHeaderElection &election = report.Header;
    const sTapeHeader &header = election.Header;

    if ( election.Elected == true ) {
        fprintf ( stdout, "Selected header block index: %d score: %d\n", election.Index, election.Score );
    } else if ( options.Locator.HeaderPolicy == HEADER_FIRST_BLOCK ) {
        fprintf ( stdout, "Using the first block as the header\n" );
    } else {
        fprintf ( stdout, "WARNING: No block looks like a header - using the first block\n" );
    }

    fprintf ( stdout, "Header: type=$%02X start=$%04X end=$%04X len=%d name=\"%s\"\n", header.FileType, header.StartAddress, header.EndAddress, header.Length (), HeaderName ( header ).c_str ());

    if ( report.Assembly.Shortfall > 0 ) {
        fprintf ( stdout, "WARNING: Need %u bytes but only assembled %u bytes from blocks.\n", ( unsigned ) report.Assembly.Requested, ( unsigned ) report.Assembly.Available );
    }

    fprintf ( stdout, "Assembled payload bytes: %u\n", ( unsigned ) report.Image.Body ().size ());
}

static void PrintScanReport ( const sRecoveryReport &report )
{
    FUNCTION_ENTRY ( NULL, "PrintScanReport", true );

    const sCandidate &best = report.Candidate;

    fprintf ( stdout, "Best BASIC candidate at decoded offset: %u\n", ( unsigned ) best.Offset );
    fprintf ( stdout, "Candidate load address: $%04X\n", best.LoadAddress );
    fprintf ( stdout, "Candidate PRG length: %u\n", ( unsigned ) ( best.EndOffset - best.Offset ));
    fprintf ( stdout, "Candidate line count: %d\n", best.Lines );
    fprintf ( stdout, "Candidate score: %d", best.Score );

    if ( verbose > 0 ) {
        fprintf ( stdout, " (penalty %d)", best.Penalty );
    }

    fprintf ( stdout, "\n" );
}

static bool WriteOutput ( const char *fileName, const void *data, size_t size )
{
    FUNCTION_ENTRY ( NULL, "WriteOutput", true );

    if ( SaveFile ( fileName, data, size ) == false ) {
        fprintf ( stderr, "Unable to write file \"%s\"\n", fileName );
        return false;
    }

    fprintf ( stdout, "Wrote: %s\n", fileName );

    return true;
}

void PrintUsage ()
{
    FUNCTION_ENTRY ( NULL, "PrintUsage", true );

    fprintf ( stdout, "Usage: tap2bas [options] file.tap\n" );
    fprintf ( stdout, "\n" );
}

int main ( int argc, char *argv [] )
{
    FUNCTION_ENTRY ( NULL, "main", true );

    sRecoveryOptions options;

    const char *prgFile     = "recovered.prg";
    const char *basFile     = "recovered.bas.txt";
    const char *decodedFile = NULL;
    bool followPointers     = false;
    bool firstHeader        = false;
    size_t skip             = 0;
    size_t threads          = 1;
    size_t sample           = DEFAULT_CHECKSUM_SAMPLE;
    size_t minLines         = options.Locator.MinLines;
    size_t maxPenalty       = options.Locator.MaxPenalty;
    size_t tail             = options.Locator.TailReserve;

    sOption optList [] = {
        { 'b', "bas=file",              OPT_VALUE_PARSE_STR,            0,      &basFile,           NULL,       "Write the listing to file" },
        { 'c', "copy=A|B|AUTO",         OPT_NONE,                       0,      &options.Copy,      ParseCopy,  "Select which tape block copy to use" },
        { 'd', "decoded=file",          OPT_VALUE_PARSE_STR,            0,      &decodedFile,       NULL,       "Write the raw decoded bytes to file" },
        { 'f', "follow-pointers",       OPT_VALUE_SET | OPT_SIZE_BOOL,  true,   &followPointers,    NULL,       "List by following the line link pointers" },
        {  0,  "first-header",          OPT_VALUE_SET | OPT_SIZE_BOOL,  true,   &firstHeader,       NULL,       "Take the first block as the header instead of scoring them" },
        {  0,  "max-penalty=n",         OPT_VALUE_PARSE_COUNT,          0,      &maxPenalty,        NULL,       "Abandon scan candidates above this penalty" },
        {  0,  "min-lines=n",           OPT_VALUE_PARSE_COUNT,          1,      &minLines,          NULL,       "Minimum lines for a scan candidate" },
        { 'm', "mode=auto|blocks|scan", OPT_NONE,                       0,      &options.Mode,      ParseMode,  "Recover from tape blocks, by scanning, or both" },
        { 'p', "prg=file",              OPT_VALUE_PARSE_STR,            0,      &prgFile,           NULL,       "Write the program image to file" },
        {  0,  "sample=n",              OPT_VALUE_PARSE_COUNT,          0,      &sample,            NULL,       "Number of blocks to check checksums on" },
        { 's', "skip=n",                OPT_VALUE_PARSE_COUNT,          0,      &skip,              NULL,       "Skip n bytes of the program before listing" },
        {  0,  "tail=n",                OPT_VALUE_PARSE_COUNT,          0,      &tail,              NULL,       "Don't scan the last n decoded bytes" },
        { 't', "threads=n",             OPT_VALUE_PARSE_COUNT,          1,      &threads,           NULL,       "Number of threads used to scan" },
        { 'v', "verbose*=n",            OPT_VALUE_PARSE_INT,            1,      &verbose,           NULL,       "Display extra information" }
    };

    if ( argc == 1 ) {
        PrintHelp ( SIZE ( optList ), optList );
        return 0;
    }

    fprintf ( stdout, "Commodore BASIC Tape Recovery Utility\n\n" );

    int index = 1;
    index = ParseArgs ( index, argc, argv, SIZE ( optList ), optList );

    if ( index >= argc ) {
        fprintf ( stderr, "No input file specified\n" );
        return -1;
    }

    if (( threads > ( size_t ) MAX_SCAN_THREADS ) || ( minLines > ( size_t ) options.Locator.MaxRecords ) || ( maxPenalty > ( size_t ) MAX_SCAN_PENALTY )) {
        fprintf ( stderr, "Numeric option out of range (threads <= %d, min-lines <= %d, max-penalty <= %d)\n", MAX_SCAN_THREADS, options.Locator.MaxRecords, MAX_SCAN_PENALTY );
        return -1;
    }

    options.ChecksumSample        = sample;
    options.Threads               = ( int ) threads;
    options.Locator.MinLines      = ( int ) minLines;
    options.Locator.MaxPenalty    = ( int ) maxPenalty;
    options.Locator.TailReserve   = tail;
    options.Listing.SkipBytes     = skip;
    options.Listing.Traversal     = followPointers ? TRAVERSE_POINTER : TRAVERSE_TERMINATOR;
    options.Locator.HeaderPolicy  = firstHeader ? HEADER_FIRST_BLOCK : HEADER_ELECT;

    const char *fileName = LocateFile ( argv [index], ".tap" );
    if ( fileName == NULL ) {
        fprintf ( stderr, "Unable to open file \"%s\"\n", argv [index] );
        return -1;
    }

    if ( threads > 1 ) {
        if ( SDL_Init ( SDL_INIT_NOPARACHUTE ) < 0 ) {
            fprintf ( stderr, "Couldn't initialize SDL: %s\n", SDL_GetError ());
            return -1;
        }
        atexit ( SDL_Quit );
    }

    // The raw dump is the only way to look at a failed scan
    if (( options.Mode == MODE_SCAN ) && ( decodedFile == NULL )) {
        decodedFile = DEFAULT_DECODED_FILE;
    }

    fprintf ( stdout, "File \"%s\"\n", fileName );

    try {

        cTapFile tap;
        if ( tap.Load ( fileName ) == false ) {
            fprintf ( stderr, "Unable to read file \"%s\"\n", fileName );
            return -1;
        }

        if ( tap.IsTruncated () == true ) {
            fprintf ( stdout, "WARNING: Capture declares %u bytes but only %u are present\n", tap.DeclaredLength (), tap.StreamLength ());
        }

        sDecodedCapture capture;
        DecodeCapture ( tap, &capture );

        PrintCapture ( tap, capture );

        if ( decodedFile != NULL ) {
            const UINT8 *data = capture.Bytes.empty () ? NULL : &capture.Bytes [0];
            if ( WriteOutput ( decodedFile, data, capture.Bytes.size ()) == false ) return -1;
        }

        sRecoveryReport report;
        RecoverProgram ( capture.Bytes, options, &report );

        if ( report.FellBack == true ) {
            fprintf ( stdout, "WARNING: Block recovery failed (%s) - scanned the decoded bytes instead\n", report.FallbackReason.c_str ());
            // Keep the bytes the scan worked from
            if ( decodedFile == NULL ) {
                const UINT8 *data = capture.Bytes.empty () ? NULL : &capture.Bytes [0];
                if ( WriteOutput ( DEFAULT_DECODED_FILE, data, capture.Bytes.size ()) == false ) return -1;
            }
        }

        fprintf ( stdout, "Recovery strategy: %s\n", ( report.Mode == MODE_BLOCKS ) ? "blocks" : "scan" );

        if ( report.Mode == MODE_BLOCKS ) {
            PrintBlockReport ( report, options );
        } else {
            PrintScanReport ( report );
        }

        fprintf ( stdout, "Listing lines: %u\n", ( unsigned ) report.Listing.size ());

        std::string listing = FormatListing ( report.Listing );

        if ( verbose > 1 ) {
            fprintf ( stdout, "\n%s\n", listing.c_str ());
        }

        tByteList prg;
        report.Image.Serialize ( prg );

        if ( WriteOutput ( prgFile, &prg [0], prg.size ()) == false ) return -1;
        if ( WriteOutput ( basFile, listing.data (), listing.size ()) == false ) return -1;
    }
    catch ( const cRecoveryError &error ) {
        fprintf ( stderr, "**ERROR**: %s\n", error.what ());
        if ( error.Kind () == RECOVERY_FORMAT ) {
            return 2;
        }
        fprintf ( stderr, "The capture decoded, but nothing usable was found.  Try converting the recording\n" );
        fprintf ( stderr, "to TAP again with the opposite polarity.\n" );
        return 1;
    }

    return 0;
}
