//----------------------------------------------------------------------------
//
// File:        pulses.hpp
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

#ifndef PULSES_HPP_
#define PULSES_HPP_

#include <vector>

enum eCategory {
    CAT_SHORT   = 0,
    CAT_MEDIUM  = 1,
    CAT_LONG    = 2,
    CAT_UNKNOWN = 3
};

typedef std::vector<eCategory> tCategoryList;

// Anything outside this range is silence or noise and never trains the clusters
const UINT32 MIN_CLUSTER_PULSE   = 10;
const UINT32 MAX_CLUSTER_PULSE   = 250;

const int    CLUSTER_COUNT       = 3;
const int    MAX_KMEANS_ROUNDS   = 40;
const double KMEANS_CONVERGENCE  = 1e-6;

struct sClusterCenters {
    double      Center [ CLUSTER_COUNT ];
};

inline bool IsClusterable ( UINT32 pulse )
{
    return (( pulse >= MIN_CLUSTER_PULSE ) && ( pulse <= MAX_CLUSTER_PULSE )) ? true : false;
}

// 1-D k-means with fractile seeding.  The result is sorted ascending.
void KMeans1D ( const std::vector<UINT32> &values, int k, int rounds, double *centers );

class cPulseClassifier {

    sClusterCenters     m_Centers;
    size_t              m_Clusterable;
    bool                m_Trained;

public:

    cPulseClassifier ();

    // Throws cRecoveryError ( RECOVERY_EXHAUSTED ) if no pulse is in range
    void Train ( const std::vector<UINT32> &pulses );

    eCategory Classify ( UINT32 pulse ) const;
    void Classify ( const std::vector<UINT32> &pulses, tCategoryList &categories ) const;

    const sClusterCenters &Centers () const;
    size_t ClusterableCount () const;

};

inline const sClusterCenters &cPulseClassifier::Centers () const  { return m_Centers; }
inline size_t cPulseClassifier::ClusterableCount () const         { return m_Clusterable; }

#endif
