//----------------------------------------------------------------------------
//
// File:        test-pipeline.cpp
// Date:        19-Oct-2026
// Programmer:  Marc Rousseau
//
// Description: End to end recovery tests
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

#include "common.hpp"
#include "recerror.hpp"
#include "recovery.hpp"
#include "testing.hpp"

static const UINT8 CountdownA [] = { 0x89, 0x88, 0x87, 0x86, 0x85, 0x84, 0x83, 0x82, 0x81 };
static const UINT8 CountdownB [] = { 0x09, 0x08, 0x07, 0x06, 0x05, 0x04, 0x03, 0x02, 0x01 };

static void AppendBothCopies ( std::vector<UINT8> &stream, const UINT8 *payload )
{
    UINT8 checksum = XorChecksum ( payload, BLOCK_PAYLOAD_SIZE );

    stream.insert ( stream.end (), CountdownA, CountdownA + COUNTDOWN_SIZE );
    stream.insert ( stream.end (), payload, payload + BLOCK_PAYLOAD_SIZE );
    stream.push_back ( checksum );

    stream.insert ( stream.end (), CountdownB, CountdownB + COUNTDOWN_SIZE );
    stream.insert ( stream.end (), payload, payload + BLOCK_PAYLOAD_SIZE );
    stream.push_back ( checksum );
}

static const sTestLine hello [] = {
    { 10, "\x99\"HELLO\"" },
    { 20, "\x89" "10" }
};

static const sTestLine counter [] = {
    { 10, "I" "\xB2" "1" },
    { 20, "\x99" "I" },
    { 30, "I" "\xB2" "I" "\xAA" "1" },
    { 40, "\x8B" "I" "\xB3" "5" "\xA7" "20" }
};

static const int DATA_BLOCKS = 3;

// Header plus three data blocks, each written twice
static std::vector<UINT8> BuildBlockStream ()
{
    std::vector<UINT8> body = BuildProgramBody ( 0x1001, hello, 2 );
    body.resize ( DATA_BLOCKS * BLOCK_PAYLOAD_SIZE, 0 );

    UINT8 header [ BLOCK_PAYLOAD_SIZE ];
    memset ( header, 0x20, sizeof ( header ));
    header [0] = 0x01;
    PutUINT16LE ( header + 1, 0x1001 );
    PutUINT16LE ( header + 3, ( UINT16 ) ( 0x1001 + body.size ()));
    memcpy ( header + HEADER_NAME_OFFSET, "HELLO", 5 );

    std::vector<UINT8> stream ( 16, 0x00 );

    AppendBothCopies ( stream, header );
    for ( int i = 0; i < DATA_BLOCKS; i++ ) {
        AppendBothCopies ( stream, &body [ i * BLOCK_PAYLOAD_SIZE ] );
    }

    return stream;
}

static void TestDecodeSingleByte ()
{
    std::vector<UINT8> bytes ( 1, 0xA5 );
    std::vector<UINT8> image = BuildTap ( BytesToPulses ( bytes ));

    cTapFile tap;
    tap.Parse ( &image [0], image.size ());
    CHECK ( tap.Pulses ().size () == BYTE_FRAME_SYMBOLS );

    sDecodedCapture capture;
    DecodeCapture ( tap, &capture );

    CHECK ( capture.PulseCount == BYTE_FRAME_SYMBOLS );
    CHECK ( capture.ClusterableCount == BYTE_FRAME_SYMBOLS );
    CHECK ( capture.Bytes.size () == 1 );
    CHECK (( capture.Bytes.size () == 1 ) && ( capture.Bytes [0] == 0xA5 ));
}

static void TestDecodeSilence ()
{
    // Nothing but long gaps
    std::vector<UINT32> pulses ( 8, 0x012345 );
    std::vector<UINT8> image = BuildTap ( pulses );

    cTapFile tap;
    tap.Parse ( &image [0], image.size ());
    CHECK ( tap.ExtendedCount () == 8 );

    sDecodedCapture capture;
    CHECK_THROWS ( DecodeCapture ( tap, &capture ), RECOVERY_EXHAUSTED, "classify" );
}

static void TestBlockRecovery ()
{
    std::vector<UINT8> stream = BuildBlockStream ();

    // Leader and gaps around the data the way a real capture has them
    std::vector<UINT32> pulses ( 4, 0x3000 );
    std::vector<UINT32> data = BytesToPulses ( stream );
    pulses.insert ( pulses.end (), data.begin (), data.end ());
    pulses.push_back ( 0x3000 );

    std::vector<UINT8> image = BuildTap ( pulses );

    cTapFile tap;
    tap.Parse ( &image [0], image.size ());

    sDecodedCapture capture;
    DecodeCapture ( tap, &capture );

    CHECK ( capture.Bytes == stream );

    sRecoveryOptions options;
    sRecoveryReport report;
    RecoverProgram ( capture.Bytes, options, &report );

    CHECK ( report.Mode == MODE_BLOCKS );
    CHECK ( report.BlockCount [ BLOCK_COPY_A ] == 1 + DATA_BLOCKS );
    CHECK ( report.BlockCount [ BLOCK_COPY_B ] == 1 + DATA_BLOCKS );
    CHECK ( report.SelectedBlocks == 1 + DATA_BLOCKS );
    CHECK ( report.ChecksumMatches == 1 + DATA_BLOCKS );
    CHECK ( report.ChecksumSampled == 1 + DATA_BLOCKS );

    CHECK ( report.Header.Elected == true );
    CHECK ( report.Header.Index == 0 );
    CHECK ( HeaderName ( report.Header.Header ) == "HELLO" );

    CHECK ( report.Assembly.Requested == DATA_BLOCKS * BLOCK_PAYLOAD_SIZE );
    CHECK ( report.Assembly.Shortfall == 0 );
    CHECK ( report.Image.LoadAddress () == 0x1001 );
    CHECK ( report.Image.Body ().size () == DATA_BLOCKS * BLOCK_PAYLOAD_SIZE );

    CHECK ( FormatListing ( report.Listing ) == "10 PRINT\"HELLO\"\n20 GOTO10\n" );

    // The repeat copy carries the same program
    options.Copy = COPY_DUPLICATE;
    sRecoveryReport repeat;
    RecoverProgram ( capture.Bytes, options, &repeat );

    CHECK ( repeat.CopyUsed == BLOCK_COPY_B );
    CHECK ( FormatListing ( repeat.Listing ) == "10 PRINT\"HELLO\"\n20 GOTO10\n" );
}

static void TestBlockRecoveryShortfall ()
{
    std::vector<UINT8> stream = BuildBlockStream ();

    // Drop the last data block (both copies)
    stream.resize ( stream.size () - 2 * BLOCK_FRAME_SIZE );

    sRecoveryOptions options;
    sRecoveryReport report;
    RecoverFromBlocks ( stream, options, &report );

    CHECK ( report.Assembly.Available == ( DATA_BLOCKS - 1 ) * BLOCK_PAYLOAD_SIZE );
    CHECK ( report.Assembly.Shortfall == BLOCK_PAYLOAD_SIZE );

    // The program itself fits in the first data block
    CHECK ( report.Listing.size () == 2 );
}

static void TestBlockRecoveryFailures ()
{
    sRecoveryOptions options;
    sRecoveryReport report;

    std::vector<UINT8> empty ( 4096, 0x00 );
    CHECK_THROWS ( RecoverFromBlocks ( empty, options, &report ), RECOVERY_EXHAUSTED, "blocks" );

    // Blocks are present but none of them is a header
    UINT8 payload [ BLOCK_PAYLOAD_SIZE ];
    memset ( payload, 0x00, sizeof ( payload ));

    std::vector<UINT8> headless;
    AppendBothCopies ( headless, payload );
    AppendBothCopies ( headless, payload );

    CHECK_THROWS ( RecoverFromBlocks ( headless, options, &report ), RECOVERY_EXHAUSTED, "header" );
}

static void TestScanRecovery ()
{
    std::vector<UINT8> prg = BuildProgram ( 0x1001, counter, 4 );

    std::vector<UINT8> bytes ( 300, 0xFF );
    bytes.insert ( bytes.end (), prg.begin (), prg.end ());
    bytes.insert ( bytes.end (), 100, 0xFF );

    sRecoveryOptions options;
    options.Mode = MODE_SCAN;

    sRecoveryReport report;
    RecoverProgram ( bytes, options, &report );

    CHECK ( report.Mode == MODE_SCAN );
    CHECK ( report.Candidate.Offset == 300 );
    // The end record is followed by two more bytes
    CHECK ( report.Candidate.EndOffset == 300 + prg.size () + 2 );
    CHECK ( report.Candidate.LoadAddress == 0x1001 );
    CHECK ( report.Candidate.Lines == 4 );
    CHECK ( report.Candidate.Penalty == 0 );

    CHECK ( report.Image.LoadAddress () == 0x1001 );
    CHECK ( report.Image.Size () == prg.size () + 2 );

    CHECK ( FormatListing ( report.Listing ) == "10 I=1\n20 PRINTI\n30 I=I+1\n40 IFI<5THEN20\n" );
}

static void TestScanRecoveryFailure ()
{
    std::vector<UINT8> bytes ( 2048, 0xFF );

    sRecoveryOptions options;
    options.Mode = MODE_SCAN;

    sRecoveryReport report;
    CHECK_THROWS ( RecoverProgram ( bytes, options, &report ), RECOVERY_EXHAUSTED, "locate" );
}

static void TestAutoFallsBackToScan ()
{
    std::vector<UINT8> prg = BuildProgram ( 0x1001, counter, 3 );

    // No countdown blocks at all
    std::vector<UINT8> bytes ( 200, 0xFF );
    bytes.insert ( bytes.end (), prg.begin (), prg.end ());
    bytes.insert ( bytes.end (), 50, 0xFF );

    sRecoveryOptions options;
    CHECK ( options.Mode == MODE_AUTO );

    sRecoveryReport report;
    RecoverProgram ( bytes, options, &report );

    CHECK ( report.Mode == MODE_SCAN );
    CHECK ( report.FellBack == true );
    CHECK ( report.FallbackReason.compare ( 0, 7, "blocks:" ) == 0 );
    CHECK ( report.Candidate.Offset == 200 );
    CHECK ( report.Listing.size () == 3 );
    CHECK ( FormatListing ( report.Listing ) == "10 I=1\n20 PRINTI\n30 I=I+1\n" );

    // Asking for blocks explicitly still fails
    options.Mode = MODE_BLOCKS;
    sRecoveryReport blocksOnly;
    CHECK_THROWS ( RecoverProgram ( bytes, options, &blocksOnly ), RECOVERY_EXHAUSTED, "blocks" );
}

static void TestAutoFallsBackWithoutHeader ()
{
    // Blocks are there but none of them is a believable header
    UINT8 payload [ BLOCK_PAYLOAD_SIZE ];
    memset ( payload, 0x00, sizeof ( payload ));

    std::vector<UINT8> bytes;
    AppendBothCopies ( bytes, payload );
    AppendBothCopies ( bytes, payload );

    size_t offset = bytes.size ();
    std::vector<UINT8> prg = BuildProgram ( 0x1001, counter, 4 );
    bytes.insert ( bytes.end (), prg.begin (), prg.end ());
    bytes.insert ( bytes.end (), 16, 0xFF );

    sRecoveryOptions options;
    sRecoveryReport report;
    RecoverProgram ( bytes, options, &report );

    CHECK ( report.Mode == MODE_SCAN );
    CHECK ( report.FellBack == true );
    CHECK ( report.FallbackReason.compare ( 0, 7, "header:" ) == 0 );
    CHECK ( report.Candidate.Offset == offset );
    CHECK ( report.Listing.size () == 4 );
}

static void TestAutoPrefersBlocks ()
{
    std::vector<UINT8> stream = BuildBlockStream ();

    sRecoveryOptions options;
    sRecoveryReport report;
    RecoverProgram ( stream, options, &report );

    CHECK ( report.Mode == MODE_BLOCKS );
    CHECK ( report.FellBack == false );
    CHECK ( report.FallbackReason.empty ());
    CHECK ( FormatListing ( report.Listing ) == "10 PRINT\"HELLO\"\n20 GOTO10\n" );
}

static void TestAutoBothStrategiesFail ()
{
    std::vector<UINT8> bytes ( 2048, 0xFF );

    sRecoveryOptions options;
    sRecoveryReport report;
    CHECK_THROWS ( RecoverProgram ( bytes, options, &report ), RECOVERY_EXHAUSTED, "locate" );
}

int main ()
{
    RUN_TEST ( TestDecodeSingleByte );
    RUN_TEST ( TestDecodeSilence );
    RUN_TEST ( TestBlockRecovery );
    RUN_TEST ( TestBlockRecoveryShortfall );
    RUN_TEST ( TestBlockRecoveryFailures );
    RUN_TEST ( TestScanRecovery );
    RUN_TEST ( TestScanRecoveryFailure );
    RUN_TEST ( TestAutoFallsBackToScan );
    RUN_TEST ( TestAutoFallsBackWithoutHeader );
    RUN_TEST ( TestAutoPrefersBlocks );
    RUN_TEST ( TestAutoBothStrategiesFail );

    return TestSummary ( "test-pipeline" );
}
