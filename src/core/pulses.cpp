//----------------------------------------------------------------------------
//
// File:        pulses.cpp
// Date:        19-Oct-2026
// Programmer:  Marc Rousseau
//
// Description: Short/Medium/Long pulse classification
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

#include <algorithm>
#include <math.h>
#include <stdio.h>
#include "common.hpp"
#include "logger.hpp"
#include "recerror.hpp"
#include "pulses.hpp"

DBG_REGISTER ( __FILE__ );

//----------------------------------------------------------------------------
//
//  The tape encodes everything with three pulse widths, but the absolute
//  widths depend on the motor speed of the drive that wrote the tape and the
//  one that read it back.  Rather than assume fixed thresholds, we let the
//  capture tell us where the three bands are.
//
//  Typical capture (ticks):
//
//     Short  ~ 0x30    Medium ~ 0x42    Long ~ 0x56
//
//----------------------------------------------------------------------------

static int NearestCenter ( double value, const double *centers, int k )
{
    int best = 0;
    double bestDistance = fabs ( value - centers [0] );

    // Ties go to the lowest index
    for ( int i = 1; i < k; i++ )
    {
        double distance = fabs ( value - centers [i] );
        if ( distance < bestDistance )
        {
            bestDistance = distance;
            best = i;
        }
    }

    return best;
}

void KMeans1D ( const std::vector<UINT32> &values, int k, int rounds, double *centers )
{
    FUNCTION_ENTRY ( NULL, "KMeans1D", true );

    size_t n = values.size ();

    std::vector<UINT32> sorted ( values );
    std::sort ( sorted.begin (), sorted.end ());

    for ( int i = 0; i < k; i++ )
    {
        centers [i] = sorted [ ( size_t ) ( i + 1 ) * n / ( k + 1 ) ];
    }

    std::vector<double> sum ( k );
    std::vector<size_t> count ( k );

    for ( int round = 0; round < rounds; round++ )
    {
        std::fill ( sum.begin (), sum.end (), 0.0 );
        std::fill ( count.begin (), count.end (), 0 );

        for ( size_t i = 0; i < n; i++ )
        {
            int j = NearestCenter ( values [i], centers, k );
            sum [j] += values [i];
            count [j]++;
        }

        bool converged = true;

        for ( int i = 0; i < k; i++ )
        {
            // An empty bucket keeps its old center
            double center = ( count [i] > 0 ) ? sum [i] / count [i] : centers [i];
            if ( fabs ( center - centers [i] ) >= KMEANS_CONVERGENCE ) converged = false;
            centers [i] = center;
        }

        DBG_TRACE ( "round " << round << ": " << centers [0] << " " << centers [1] << " " << centers [2] );

        if ( converged == true ) break;
    }

    std::sort ( centers, centers + k );
}

cPulseClassifier::cPulseClassifier () :
    m_Clusterable ( 0 ),
    m_Trained ( false )
{
    FUNCTION_ENTRY ( this, "cPulseClassifier ctor", true );

    for ( int i = 0; i < CLUSTER_COUNT; i++ )
    {
        m_Centers.Center [i] = 0.0;
    }
}

void cPulseClassifier::Train ( const std::vector<UINT32> &pulses )
{
    FUNCTION_ENTRY ( this, "cPulseClassifier::Train", true );

    std::vector<UINT32> usable;
    usable.reserve ( pulses.size ());

    for ( size_t i = 0; i < pulses.size (); i++ )
    {
        if ( IsClusterable ( pulses [i] )) usable.push_back ( pulses [i] );
    }

    m_Clusterable = usable.size ();

    if ( usable.empty ())
    {
        char buffer [80];
        snprintf ( buffer, sizeof ( buffer ), "No clusterable pulses found (%u..%u)", MIN_CLUSTER_PULSE, MAX_CLUSTER_PULSE );
        throw cRecoveryError ( RECOVERY_EXHAUSTED, "classify", buffer );
    }

    KMeans1D ( usable, CLUSTER_COUNT, MAX_KMEANS_ROUNDS, m_Centers.Center );

    m_Trained = true;

    DBG_STATUS ( "S/M/L = " << m_Centers.Center [0] << " / " << m_Centers.Center [1] << " / " << m_Centers.Center [2] );
}

eCategory cPulseClassifier::Classify ( UINT32 pulse ) const
{
    if (( m_Trained == false ) || ( IsClusterable ( pulse ) == false )) return CAT_UNKNOWN;

    return ( eCategory ) NearestCenter ( pulse, m_Centers.Center, CLUSTER_COUNT );
}

void cPulseClassifier::Classify ( const std::vector<UINT32> &pulses, tCategoryList &categories ) const
{
    FUNCTION_ENTRY ( this, "cPulseClassifier::Classify", true );

    categories.resize ( pulses.size ());

    for ( size_t i = 0; i < pulses.size (); i++ )
    {
        categories [i] = Classify ( pulses [i] );
    }
}
