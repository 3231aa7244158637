//----------------------------------------------------------------------------
//
// File:        option.hpp
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

#ifndef OPTION_HPP_
#define OPTION_HPP_

// Called with the text after '=' (NULL if there was none)
typedef bool (*optFunc) ( const char *, void * );

#define OPT_NONE            0x00000000
#define OPT_VALUE_PARSE     0x00000001
#define OPT_VALUE_SET       0x00000002

#define OPT_SIZE_BOOL       0x00000100
#define OPT_SIZE_INT        0x00000200
#define OPT_SIZE_STRING     0x00000400
#define OPT_SIZE_COUNT      0x00000800

// 'verbose' style: the value is optional and defaults to sOption::Value
#define OPT_VALUE_PARSE_INT     ( OPT_VALUE_PARSE | OPT_VALUE_SET | OPT_SIZE_INT )

// Arg points to a 'const char *' that is left pointing into argv
#define OPT_VALUE_PARSE_STR     ( OPT_VALUE_PARSE | OPT_SIZE_STRING )

// Arg points to a size_t, sOption::Value is the smallest value accepted
#define OPT_VALUE_PARSE_COUNT   ( OPT_VALUE_PARSE | OPT_SIZE_COUNT )

struct sOption {
    char        Short;
    const char *Long;
    int         Flags;
    int         Value;
    void       *Arg;
    optFunc     Func;
    const char *Help;
};

// Common global to several applications
extern int verbose;

// This must be provided by the application
extern void PrintUsage ();

bool ParseCount ( const char *text, size_t *value );

void PrintHelp ( int count, const sOption *optList );
int ParseArgs ( int index, int argc, const char * const argv [], int count, sOption *optList );

#endif
