//----------------------------------------------------------------------------
//
// File:        recerror.cpp
// Date:        19-Oct-2026
// Programmer:  Marc Rousseau
//
// Description: Fatal errors raised by the tape recovery pipeline
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
#include "logger.hpp"
#include "recerror.hpp"

DBG_REGISTER ( __FILE__ );

cRecoveryError::cRecoveryError ( eRecoveryError kind, const char *stage, const std::string &message ) :
    m_Kind ( kind ),
    m_Stage ( stage ),
    m_Message ( message ),
    m_What ()
{
    FUNCTION_ENTRY ( this, "cRecoveryError ctor", true );

    m_What = m_Stage + ": " + m_Message;

    DBG_ERROR ( m_What );
}

cRecoveryError::~cRecoveryError () throw ()
{
}

const char *cRecoveryError::what () const throw ()
{
    return m_What.c_str ();
}
