/******************************************************************************\
* Copyright (c) 2016, Robert van Engelen, Genivia Inc. All rights reserved.    *
*                                                                              *
* Redistribution and use in source and binary forms, with or without           *
* modification, are permitted provided that the following conditions are met:  *
*                                                                              *
*   (1) Redistributions of source code must retain the above copyright notice, *
*       this list of conditions and the following disclaimer.                  *
*                                                                              *
*   (2) Redistributions in binary form must reproduce the above copyright      *
*       notice, this list of conditions and the following disclaimer in the    *
*       documentation and/or other materials provided with the distribution.   *
*                                                                              *
*   (3) The name of the author may not be used to endorse or promote products  *
*       derived from this software without specific prior written permission.  *
*                                                                              *
* THIS SOFTWARE IS PROVIDED BY THE AUTHOR ``AS IS'' AND ANY EXPRESS OR IMPLIED *
* WARRANTIES, INCLUDING, BUT NOT LIMITED TO, THE IMPLIED WARRANTIES OF         *
* MERCHANTABILITY AND FITNESS FOR A PARTICULAR PURPOSE ARE DISCLAIMED. IN NO   *
* EVENT SHALL THE AUTHOR BE LIABLE FOR ANY DIRECT, INDIRECT, INCIDENTAL,       *
* SPECIAL, EXEMPLARY, OR CONSEQUENTIAL DAMAGES (INCLUDING, BUT NOT LIMITED TO, *
* PROCUREMENT OF SUBSTITUTE GOODS OR SERVICES; LOSS OF USE, DATA, OR PROFITS;  *
* OR BUSINESS INTERRUPTION) HOWEVER CAUSED AND ON ANY THEORY OF LIABILITY,     *
* WHETHER IN CONTRACT, STRICT LIABILITY, OR TORT (INCLUDING NEGLIGENCE OR      *
* OTHERWISE) ARISING IN ANY WAY OUT OF THE USE OF THIS SOFTWARE, EVEN IF       *
* ADVISED OF THE POSSIBILITY OF SUCH DAMAGE.                                   *
\******************************************************************************/

/**
@file      debug.h
@brief     recompose debug logs
@copyright (c) BSD-3 License - see LICENSE.txt

Debug logging is compiled in only when macro DEBUG is defined, so release
builds carry no logging code at all.

| Source files compiled with	| DBGLOG(...) entry added to	|
| ----------------------------- | ----------------------------- |
| `c++ -DDEBUG`			| `DEBUG.log`			|
| `c++ -DDEBUG=FLAVOR`		| `FLAVOR.log`			|
| `c++ -DDEBUG= `		| `stderr`			|

The CMake option `RECOMPOSE_DEBUG` compiles the library with `-DDEBUG`.

`DBGLOG(format, ...)` creates a timestamped log entry with a printf-formatted
message.

Example
-------

~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~{.cpp}
    #include <recompose/debug.h>

    recompose::Rewrite r = flavor.apply(tree);
    DBGLOG("apply %s: %s", flavor.name().c_str(), r.ok() ? "ok" : "failed");
~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~

Compiled with `-DDEBUG` a log entry in `DEBUG.log` looks like:

~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~{.txt}
    261018/104512.311093     flavor.cpp:88   apply Legacy Ruby: ok
~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~
*/

#ifndef RECOMPOSE_DEBUG_H
#define RECOMPOSE_DEBUG_H

#include <cstdio>

#undef DBGLOG

extern FILE *RECOMPOSE_DBGFD_;

extern "C" void RECOMPOSE_DBGOUT_(const char *log, const char *file, int line);

#define DBGXIFY(S) DBGIFY_(S)
#define DBGIFY_(S) #S
#if DEBUG + 0
# define DBGFILE "DEBUG.log"
#else
# define DBGFILE DBGXIFY(DEBUG) ".log"
#endif
#define _DBGLOG(...) \
( RECOMPOSE_DBGOUT_(DBGFILE, __FILE__, __LINE__), ::fprintf(RECOMPOSE_DBGFD_, "" __VA_ARGS__), ::fflush(RECOMPOSE_DBGFD_))

#ifdef DEBUG
#define DBGLOG _DBGLOG
#else
#define DBGLOG(...) (void)0
#endif

#endif
