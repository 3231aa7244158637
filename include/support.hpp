//----------------------------------------------------------------------------
//
// File:        support.hpp
// Date:        15-Jan-2003
// Programmer:  Marc Rousseau
//
// Description: File helpers shared by the tape utilities
//
// Copyright (c) 2000-2026 Marc Rousseau, All Rights Reserved.
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
//   19-Oct-2026    Replaced the emulator search paths with whole-file I/O
//
//----------------------------------------------------------------------------

#ifndef SUPPORT_HPP_
#define SUPPORT_HPP_

#include <string>
#include <vector>

bool IsWriteable ( const char *filename );

// Returns filename, or filename + extension if only that exists
const char *LocateFile ( const char *filename, const char *extension = NULL );

bool LoadFile ( const char *filename, std::vector<UINT8> &buffer );
bool SaveFile ( const char *filename, const void *data, size_t size );
bool SaveFile ( const char *filename, const std::string &text );

#endif
