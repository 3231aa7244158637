//----------------------------------------------------------------------------
//
// File:        recerror.hpp
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

#ifndef RECERROR_HPP_
#define RECERROR_HPP_

#include <exception>
#include <string>

//
// Only two conditions stop the pipeline.  Everything else (bad bit pairs,
// checksum mismatches, broken line pointers, short payloads) is absorbed by
// the stage that sees it.
//
enum eRecoveryError {
    RECOVERY_FORMAT,            // Not a capture we understand - nothing was decoded
    RECOVERY_EXHAUSTED          // Decoded, but nothing usable was found
};

class cRecoveryError : public std::exception {

    eRecoveryError  m_Kind;
    std::string     m_Stage;
    std::string     m_Message;
    std::string     m_What;

public:

    cRecoveryError ( eRecoveryError kind, const char *stage, const std::string &message );
    virtual ~cRecoveryError () throw ();

    eRecoveryError Kind () const;
    const char *Stage () const;
    const char *Message () const;

    virtual const char *what () const throw ();

};

inline eRecoveryError cRecoveryError::Kind () const     { return m_Kind; }
inline const char *cRecoveryError::Stage () const       { return m_Stage.c_str (); }
inline const char *cRecoveryError::Message () const     { return m_Message.c_str (); }

#endif
