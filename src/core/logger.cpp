//----------------------------------------------------------------------------
//
// File:        logger.cpp
// Date:        15-Apr-1998
// Programmer:  Marc Rousseau
//
// Description: Error Logger object
//
// Copyright (c) 1998-2026 Marc Rousseau, All Rights Reserved.
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
//   19-Oct-2026    Records are written to stderr and filtered by g_LogLevel
//
//----------------------------------------------------------------------------

#include <stdio.h>
#include <string.h>
#include "common.hpp"
#include "logger.hpp"

#if defined ( LOGGER )

LOG_FLAGS g_LogFlags = { false };

int g_LogLevel = _WARNING_;

static const char *levelName [ LOG_TYPE_MAX ] = {
    "TRACE",
    "STATUS",
    "EVENT",
    "WARNING",
    "ERROR",
    "FATAL"
};

static const int MAX_FILES = 64;

static const char *fileList [ MAX_FILES ];
static int         fileCount;

dbgString::dbgString ( char *buffer, size_t size ) :
    m_Base ( 10 ),
    m_Ptr ( buffer ),
    m_Buffer ( buffer ),
    m_Size ( size )
{
    m_Buffer [0] = '\0';
}

dbgString::operator const char * () const
{
    return m_Buffer;
}

void dbgString::flush ()
{
    m_Base   = 10;
    m_Ptr    = m_Buffer;
    *m_Ptr   = '\0';
}

void dbgString::Append ( const char *text )
{
    size_t used = m_Ptr - m_Buffer;
    size_t left = m_Size - used - 1;
    size_t len  = strlen ( text );
    if ( len > left ) len = left;
    memcpy ( m_Ptr, text, len );
    m_Ptr += len;
    *m_Ptr = '\0';
}

dbgString &dbgString::operator << ( const std::string &text )
{
    Append ( text.c_str ());
    return *this;
}

dbgString &dbgString::operator << ( const char *text )
{
    Append (( text != NULL ) ? text : "(null)" );
    return *this;
}

dbgString &dbgString::operator << ( char ch )
{
    char buffer [2] = { ch, '\0' };
    Append ( buffer );
    return *this;
}

dbgString &dbgString::operator << ( unsigned char value )
{
    return *this << ( unsigned long long ) value;
}

dbgString &dbgString::operator << ( short value )
{
    return *this << ( long long ) value;
}

dbgString &dbgString::operator << ( unsigned short value )
{
    return *this << ( unsigned long long ) value;
}

dbgString &dbgString::operator << ( int value )
{
    return *this << ( long long ) value;
}

dbgString &dbgString::operator << ( unsigned int value )
{
    return *this << ( unsigned long long ) value;
}

dbgString &dbgString::operator << ( long value )
{
    return *this << ( long long ) value;
}

dbgString &dbgString::operator << ( unsigned long value )
{
    return *this << ( unsigned long long ) value;
}

dbgString &dbgString::operator << ( long long value )
{
    char buffer [32];
    if ( m_Base == 16 ) {
        sprintf ( buffer, "%llX", ( unsigned long long ) value );
    } else {
        sprintf ( buffer, "%lld", value );
    }
    Append ( buffer );
    return *this;
}

dbgString &dbgString::operator << ( unsigned long long value )
{
    char buffer [32];
    sprintf ( buffer, ( m_Base == 16 ) ? "%llX" : "%llu", value );
    Append ( buffer );
    return *this;
}

dbgString &dbgString::operator << ( double value )
{
    char buffer [64];
    sprintf ( buffer, "%g", value );
    Append ( buffer );
    return *this;
}

dbgString &dbgString::operator << ( const void *ptr )
{
    char buffer [32];
    sprintf ( buffer, "%p", ptr );
    Append ( buffer );
    return *this;
}

dbgString &dbgString::operator << ( dbgString &(*f) ( dbgString & ))
{
    return f ( *this );
}

dbgString &hex ( dbgString &str )
{
    str.m_Base = 16;
    return str;
}

dbgString &dec ( dbgString &str )
{
    str.m_Base = 10;
    return str;
}

dbgString &dbg_Stream ()
{
    static char buffer [ 1024 ];
    static dbgString stream ( buffer, sizeof ( buffer ));

    stream.flush ();

    return stream;
}

int dbg_RegisterFile ( const char *name )
{
    const char *ptr = strrchr ( name, SEPERATOR );
    if ( ptr != NULL ) name = ptr + 1;

    for ( int i = 0; i < fileCount; i++ ) {
        if ( strcmp ( fileList [i], name ) == 0 ) return i;
    }

    if ( fileCount >= MAX_FILES ) return MAX_FILES - 1;

    fileList [fileCount] = name;

    return fileCount++;
}

static const char *FileName ( int file )
{
    return (( file >= 0 ) && ( file < fileCount )) ? fileList [file] : "?";
}

int dbg_Assert ( int file, int line, const char *function, const void *object, const char *text )
{
    fprintf ( stderr, "ASSERT: %s(%d) %s [%p]: %s\n", FileName ( file ), line, function, object, text );

    return 0;
}

void dbg_Record ( int type, int file, int line, const char *function, const void *object, const char *text )
{
    if ( type < g_LogLevel ) return;

    if (( type < 0 ) || ( type >= LOG_TYPE_MAX )) type = _FATAL_;

    if ( object != NULL ) {
        fprintf ( stderr, "%-7s %s(%d) %s [%p]: %s\n", levelName [type], FileName ( file ), line, function, object, text );
    } else {
        fprintf ( stderr, "%-7s %s(%d) %s: %s\n", levelName [type], FileName ( file ), line, function, text );
    }
}

void dbg_Record ( int type, int file, int line, const char *function, const void *object, dbgString &text )
{
    dbg_Record ( type, file, line, function, object, ( const char * ) text );
}

#endif
