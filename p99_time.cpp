/* p99_time.cpp: builds the (JDE, centuries-from-J2000) time references
the Pluto99 engine runs on

Copyright (C) 2026, Project Pluto

This program is free software; you can redistribute it and/or
modify it under the terms of the GNU General Public License
as published by the Free Software Foundation; either version 2
of the License, or (at your option) any later version.

This program is distributed in the hope that it will be useful,
but WITHOUT ANY WARRANTY; without even the implied warranty of
MERCHANTABILITY or FITNESS FOR A PARTICULAR PURPOSE. See the
GNU General Public License for more details.

You should have received a copy of the GNU General Public License
along with this program; if not, write to the Free Software
Foundation, Inc., 51 Franklin Street, Fifth Floor, Boston, MA
02110-1301, USA. */

#include <stdio.h>
#include <stdbool.h>
#include "watdefs.h"
#include "afuncs.h"
#include "date.h"
#include "pluto99.h"
#include "constant.h"

int debug_printf( const char *format, ...)                 /* miscell.cpp */
#ifdef __GNUC__
         __attribute__ (( format( printf, 1, 2)))
#endif
;
extern int debug_level;

void pluto99_time_from_jde( PLUTO99_TIME *t, const double jde)
{
   t->jde = jde;
   t->t_cen = (jde - J2000) / DAYS_PER_CENTURY;
}

   /* td_minus_utc() includes leap seconds where they're known,  and  */
   /* the usual Delta-T extrapolations before 1972 and in the future. */

void pluto99_time_from_utc( PLUTO99_TIME *t, const double jd_utc)
{
   pluto99_time_from_jde( t, jd_utc + td_minus_utc( jd_utc) / seconds_per_day);
}

/* Accepts anything get_time_from_string() does:  "1992 Oct 13",
"2000-01-01T12:00",  "JD 2448908.5",  and so on.  Times flagged as UTC
get corrected to TT;  others are taken to be TT already. */

int pluto99_time_from_string( PLUTO99_TIME *t, const char *date_str)
{
   int is_ut;
   const double jd = get_time_from_string( 0., date_str,
                     FULL_CTIME_YMD | CALENDAR_JULIAN_GREGORIAN, &is_ut);

   if( jd == 0. || is_ut < 0)
      {
      if( debug_level)
         debug_printf( "Couldn't parse date '%s'\n", date_str);
      return( PLUTO99_ERR_BAD_DATE);
      }
   if( is_ut)
      pluto99_time_from_utc( t, jd);
   else
      pluto99_time_from_jde( t, jd);
   return( 0);
}

char *pluto99_format_time( char *buff, const PLUTO99_TIME *t)
{
   full_ctime( buff, t->jde, FULL_CTIME_YMD | CALENDAR_JULIAN_GREGORIAN
                          | FULL_CTIME_HUNDREDTH_SEC);
   return( buff);
}
