//----------------------------------------------------------------------------
//
// File:        common.hpp
// Date:        19-Oct-2026
// Programmer:  Marc Rousseau
//
// Description: Common types and helpers shared by the tape utilities
//
// Copyright (c) 1994-2026 Marc Rousseau, All Rights Reserved.
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
//   19-Oct-2026    Added little-endian accessors for tape/PRG images
//                  Folded the platform detection in from platform.hpp
//
//----------------------------------------------------------------------------

#ifndef COMMON_HPP_
#define COMMON_HPP_

//----------------------------------------------------------------------------
// Determine platform & OS
//----------------------------------------------------------------------------

#if defined ( _MSC_VER )
    #define OS_WINDOWS
#endif

#if defined ( _DEBUG ) && ! defined ( DEBUG )
    #define DEBUG
#endif

#include <stddef.h>

//----------------------------------------------------------------------------
// Generic definitions
//----------------------------------------------------------------------------

template <typename T, size_t N> char ( &ArraySizeHelper ( T (&array) [N] )) [N];

#define SIZE(x)		( sizeof ( ArraySizeHelper ( x )))
#define EVER		;;

#if defined( _MSC_VER )
    typedef unsigned char      UINT8;
    typedef unsigned short     UINT16;
    typedef unsigned int       UINT32;
#else
    #include <stdint.h>
    typedef uint8_t            UINT8;
    typedef uint16_t           UINT16;
    typedef uint32_t           UINT32;
#endif

#ifdef max
    #undef max
#endif
#ifdef min
    #undef min
#endif

//----------------------------------------------------------------------------
// Tape and PRG images are always little-endian, regardless of the host
//----------------------------------------------------------------------------

inline UINT16 GetUINT16LE ( const UINT8 *ptr )
{
    return ( UINT16 ) ( ptr [0] | ( ptr [1] << 8 ));
}

inline UINT32 GetUINT24LE ( const UINT8 *ptr )
{
    return ( UINT32 ) ptr [0] | (( UINT32 ) ptr [1] << 8 ) | (( UINT32 ) ptr [2] << 16 );
}

inline UINT32 GetUINT32LE ( const UINT8 *ptr )
{
    return GetUINT24LE ( ptr ) | (( UINT32 ) ptr [3] << 24 );
}

inline void PutUINT16LE ( UINT8 *ptr, UINT16 value )
{
    ptr [0] = ( UINT8 ) ( value & 0xFF );
    ptr [1] = ( UINT8 ) ( value >> 8 );
}

//----------------------------------------------------------------------------
// Platform specific definitions
//----------------------------------------------------------------------------

#if defined ( OS_WINDOWS )

    #define SEPERATOR	'\\'

    #define snprintf _snprintf
    #pragma warning ( disable : 4996 )  // 'function' was declared deprecated

#else

    #define SEPERATOR	'/'

    #include <strings.h>

    #define stricmp strcasecmp
    #define strnicmp strncasecmp

#endif

#endif
