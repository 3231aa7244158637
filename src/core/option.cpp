//----------------------------------------------------------------------------
//
// File:        option.cpp
// Date:        16-Jul-2001
// Programmer:  Marc Rousseau
//
// Description: A simple set of option parsing routines (similar to libpopt)
//
// Copyright (c) 2001-2026 Marc Rousseau, All Rights Reserved.
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
//   19-Oct-2026    Callbacks now receive the text following '='
//                  Added OPT_VALUE_PARSE_STR for file name options
//                  Added OPT_VALUE_PARSE_COUNT with a lower bound
//                  Dropped the bitwise OR/AND/NOT/XOR value types
//
//----------------------------------------------------------------------------

#include <ctype.h>
#include <errno.h>
#include <stdlib.h>
#include <stdio.h>
#include <string.h>
#include "common.hpp"
#include "logger.hpp"
#include "option.hpp"

DBG_REGISTER ( __FILE__ );

// Common global to several applications
int verbose;

bool ParseCount ( const char *text, size_t *value )
{
    if (( text == NULL ) || ( isdigit (( unsigned char ) *text ) == 0 )) return false;

    errno = 0;

    char *end = NULL;
    unsigned long number = strtoul ( text, &end, 10 );

    if (( errno != 0 ) || ( *end != '\0' )) return false;

    *value = ( size_t ) number;

    return true;
}

void PrintHelp ( int count, const sOption *optList )
{
    FUNCTION_ENTRY ( NULL, "PrintHelp", true );

    PrintUsage ();

    if ( count == 0 ) return;

    fprintf ( stdout, "Options:\n" );

    for ( int i = 0; i < count; i++ ) {
        char buffer [80];
        char *ptr = buffer;
        *ptr = '\0';
        if ( optList->Short ) {
            ptr += sprintf ( ptr, " -%c", optList->Short );
            if ( optList->Long ) ptr += sprintf ( ptr, "," );
        }
        if ( optList->Long ) {
            sprintf ( ptr, " --%s", optList->Long );
            ptr = strchr ( buffer, '*' );
            if ( ptr != NULL ) memmove ( ptr, ptr + 1, strlen ( ptr ));
        }
        if (( optList->Flags == OPT_VALUE_PARSE_COUNT ) && ( optList->Value > 0 )) {
            fprintf ( stdout, "  %-25.25s  %s (at least %d)\n", buffer, optList->Help, optList->Value );
        } else {
            fprintf ( stdout, "  %-25.25s  %s\n", buffer, optList->Help );
        }

        optList++;
    }

    fprintf ( stdout, "\n" );
}

static sOption *FindOption ( const char *arg, int count, sOption *optList )
{
    if ( *arg != '-' ) {
        for ( int i = 0; i < count; i++ ) {
            if ( optList [i].Short == *arg ) {
                bool ok = ( arg[1] == '\0' ) ? true : false;
                if (( ok == false ) && ( arg[1] == '=' )) {
                    ok = (( optList [i].Func != NULL ) || (( optList [i].Flags & OPT_VALUE_PARSE ) != 0 )) ? true : false;
                }
                if ( ok == false ) {
                    fprintf ( stderr, "Illegal option '-%s'\n", arg );
                    return NULL;
                }
                return &optList [i];
            }
        }
    } else {
        for ( int i = 0; i < count; i++ ) {
            const char *longname = optList [i].Long;
            if ( longname == NULL ) continue;
            const char *ptr = strchr ( longname, '*' );
            size_t max = ( ptr == NULL ) ? strcspn ( longname, "=" ) : ( size_t ) ( ptr - longname );
            if ( strncmp ( arg + 1, longname, max ) == 0 ) {
                if (( ptr != NULL ) || ( arg [ max + 1 ] == '\0' ) || ( arg [ max + 1 ] == '=' )) {
                    return &optList [i];
                }
            }
        }
    }

    return NULL;
}

static bool ParseOption ( const char *arg, sOption *opt )
{
    FUNCTION_ENTRY ( NULL, "ParseOption", true );

    const char *ptr = strchr ( arg, '=' );
    const char *value = ( ptr != NULL ) ? ptr + 1 : NULL;

    if ( opt->Func != NULL ) {
        if ( opt->Func ( value, opt->Arg ) == false ) {
            fprintf ( stderr, "Invalid option '%s'\n", arg );
            return false;
        }
        return true;
    }

    switch ( opt->Flags ) {
        case OPT_VALUE_PARSE_INT :
            if ( value == NULL ) {
                * ( int * ) opt->Arg = opt->Value;
            } else if ( *value == '\0' ) {
                fprintf ( stderr, "Expected '=X' after option '%s'\n", arg );
                return false;
            } else {
                * ( int * ) opt->Arg = atoi ( value );
            }
            break;
        case OPT_VALUE_PARSE_COUNT : {
                size_t count = 0;
                if ( ParseCount ( value, &count ) == false ) {
                    fprintf ( stderr, "Expected '=n' (a whole number) after option '%s'\n", arg );
                    return false;
                }
                if ( count < ( size_t ) opt->Value ) {
                    fprintf ( stderr, "Option '%s' must be at least %d\n", arg, opt->Value );
                    return false;
                }
                * ( size_t * ) opt->Arg = count;
            }
            break;
        case OPT_VALUE_PARSE_STR :
            if (( value == NULL ) || ( *value == '\0' )) {
                fprintf ( stderr, "Expected '=name' after option '%s'\n", arg );
                return false;
            }
            * ( const char ** ) opt->Arg = value;
            break;
        case OPT_VALUE_SET | OPT_SIZE_BOOL :
            * ( bool * ) opt->Arg = ( opt->Value != 0 ) ? true : false;
            break;
        default :
            DBG_FATAL ( "Unsupported option flags " << hex << opt->Flags << " for '" << arg << "'" );
            return false;
    }

    return true;
}

int ParseArgs ( int index, int argc, const char * const argv [], int count, sOption *optList )
{
    FUNCTION_ENTRY ( NULL, "ParseArgs", true );

    sOption optHelp = { 'h', "help", OPT_NONE, 0, 0, NULL, NULL };

    while (( index < argc ) && ( argv [index][0] == '-' )) {
        if ( FindOption ( argv [index] + 1, 1, &optHelp ) != NULL ) {
            PrintHelp ( count, optList );
            exit ( 0 );
        }
        sOption *opt = FindOption ( argv [index] + 1, count, optList );
        if ( opt == NULL ) {
            fprintf ( stderr, "Unrecognized option '%s'\n", argv [index] );
            exit ( -1 );
        }

        if ( ParseOption ( argv [index], opt ) == false ) {
            exit ( -1 );
        }

        index++;
    }

    return index;
}
