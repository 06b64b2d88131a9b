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
@file      debug.cpp
@brief     recompose debug logs
@copyright (c) BSD-3 License - see LICENSE.txt

See `debug.h` for details.
*/

#include <stdio.h>
#include <cstring>

FILE *RECOMPOSE_DBGFD_ = NULL;

// file name without its directory path
static const char *basename_of(const char *file)
{
  const char *name = file;
  for (const char *s = file; *s != '\0'; ++s)
    if (*s == '/' || *s == '\\')
      name = s + 1;
  return name;
}

extern "C" {

#if (defined(__WIN32__) || defined(_WIN32) || defined(WIN32) || defined(_WIN64) || defined(__BORLANDC__)) && !defined(__CYGWIN__)

#include <windows.h>
void RECOMPOSE_DBGOUT_(const char *log, const char *file, int line)
{
  SYSTEMTIME tm;
  if (RECOMPOSE_DBGFD_ == NULL && (log[0] == '.' || ::fopen_s(&RECOMPOSE_DBGFD_, log, "a")))
    RECOMPOSE_DBGFD_ = stderr;
  GetLocalTime(&tm);
  ::fprintf(RECOMPOSE_DBGFD_, "\n%02d%02d%02d/%02d%02d%02d.%03d%14.14s:%-5d", tm.wYear%100, tm.wMonth, tm.wDay, tm.wHour, tm.wMinute, tm.wSecond, tm.wMilliseconds, basename_of(file), line);
}

#else

#include <time.h>
#include <sys/time.h>
void RECOMPOSE_DBGOUT_(const char *log, const char *file, int line)
{
  struct timeval tv;
  struct tm tm;
  // an empty DEBUG value logs to stderr, its file name is just ".log"
  if (RECOMPOSE_DBGFD_ == NULL && (log[0] == '.' || (RECOMPOSE_DBGFD_ = ::fopen(log, "a")) == NULL))
    RECOMPOSE_DBGFD_ = stderr;
  gettimeofday(&tv, NULL);
  localtime_r(&tv.tv_sec, &tm);
  ::fprintf(RECOMPOSE_DBGFD_, "\n%02d%02d%02d/%02d%02d%02d.%06ld%14.14s:%-5d", tm.tm_year%100, tm.tm_mon+1, tm.tm_mday, tm.tm_hour, tm.tm_min, tm.tm_sec, static_cast<long>(tv.tv_usec), basename_of(file), line);
}

#endif

}
