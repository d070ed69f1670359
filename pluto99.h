/* pluto99.h: heliocentric J2000 ecliptic positions of Pluto from the
'Pluto99' form of series

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

#ifndef PLUTO99_H_INCLUDED
#define PLUTO99_H_INCLUDED

#include <stddef.h>

   /* The series were fitted over JDE 626150.5 to 2811150.5,  i.e.,  */
   /* -2998 Apr 23 to +2984 Jul 26.  Outside that,  you get silent     */
   /* extrapolation unless PLUTO99_STRICT_RANGE is set (see below).   */
#define PLUTO99_JDE_START        626150.5
#define PLUTO99_JDE_END         2811150.5
#define PLUTO99_JDE_SPAN        (PLUTO99_JDE_END - PLUTO99_JDE_START)

#define PLUTO99_N_DEGREES        3
#define PLUTO99_N_AXES           3
#define PLUTO99_X                0
#define PLUTO99_Y                1
#define PLUTO99_Z                2

      /* Error codes.  The first three are 'invalid argument' errors;  */
      /* OUT_OF_RANGE is only ever returned in strict range mode.       */
#define PLUTO99_ERR_NULL_TIME           -1
#define PLUTO99_ERR_BAD_SERIES          -2
#define PLUTO99_ERR_BAD_AXIS            -3
#define PLUTO99_ERR_OUT_OF_RANGE        -4
#define PLUTO99_ERR_BAD_DATE            -5
#define PLUTO99_ERR_FILE_NOT_FOUND      -6
#define PLUTO99_ERR_FILE_FORMAT         -7
#define PLUTO99_ERR_NO_MEMORY           -8

#define PLUTO99_TERM struct pluto99_term

PLUTO99_TERM
   {
   double amplitude;       /* AU */
   double freq;            /* radians per Julian century */
   double phase;           /* radians */
   };

/* One series per axis.  terms[0] are summed as-is,  terms[1] are
multiplied by X,  terms[2] by X^2 (X = normalized time,  -1 to 1 over
the fitted span).  A degree can be empty (n_terms == 0,  terms NULL). */

#define PLUTO99_SERIES struct pluto99_series

PLUTO99_SERIES
   {
   const PLUTO99_TERM *terms[PLUTO99_N_DEGREES];
   size_t n_terms[PLUTO99_N_DEGREES];
   };

#define PLUTO99_TIME struct pluto99_time

PLUTO99_TIME
   {
   double jde;          /* Julian Ephemeris Day (TT) */
   double t_cen;        /* Julian centuries from J2000 = 2451545.0 TT */
   };

typedef int (*pluto99_evaluator_t)( const PLUTO99_SERIES *series,
                  const double x_norm, const double t_cen, double *result);

      /* 'fresh' bits;  a clear bit means the value must be recomputed */
#define PLUTO99_FRESH_X_NORM     0x01
#define PLUTO99_FRESH_T_CEN      0x02
#define PLUTO99_FRESH_AXIS( axis)    (0x04 << (axis))

      /* engine 'flags' */
#define PLUTO99_STRICT_RANGE     0x01

/* The engine.  It owns a copy of its epoch and caches everything derived
from it.  There is no locking;  if you share one between threads,  guard
pluto99_set_epoch() and all reads with a mutex of your own. */

#define PLUTO99 struct pluto99

PLUTO99
   {
   PLUTO99_TIME epoch;
   double x_norm, t_cen, xyz[PLUTO99_N_AXES];
   unsigned fresh, flags;
   const PLUTO99_SERIES *series[PLUTO99_N_AXES];
   pluto99_evaluator_t evaluate;
   };

extern const PLUTO99_SERIES pluto99_default_series[PLUTO99_N_AXES];
extern const double pluto99_axis_offset[PLUTO99_N_AXES];     /* p99_data.cpp */
extern const double pluto99_axis_slope[PLUTO99_N_AXES];

double pluto99_normalize( const double jde);                 /* pluto99.cpp */
bool pluto99_in_range( const double jde);
int pluto99_evaluate( const PLUTO99_SERIES *series, const double x_norm,
                           const double t_cen, double *result);
double pluto99_axis_value( const double series_sum, const double offset,
                           const double slope, const double x_norm);
int pluto99_check_series( const PLUTO99_SERIES *series);

int pluto99_init( PLUTO99 *p, const PLUTO99_TIME *epoch,
                                          const unsigned flags);
int pluto99_set_epoch( PLUTO99 *p, const PLUTO99_TIME *epoch);
const PLUTO99_TIME *pluto99_get_epoch( const PLUTO99 *p);
int pluto99_set_series( PLUTO99 *p, const int axis,
                                          const PLUTO99_SERIES *series);
double pluto99_get_x_norm( PLUTO99 *p);
double pluto99_get_t_cen( PLUTO99 *p);
int pluto99_coord( PLUTO99 *p, const int axis, double *value);
int pluto99_vector( PLUTO99 *p, double *xyz);

void pluto99_time_from_jde( PLUTO99_TIME *t, const double jde);  /* p99_time */
void pluto99_time_from_utc( PLUTO99_TIME *t, const double jd_utc);
int pluto99_time_from_string( PLUTO99_TIME *t, const char *date_str);
char *pluto99_format_time( char *buff, const PLUTO99_TIME *t);

int pluto99_load_tables( const char *filename,               /* p99_load.cpp */
                                          PLUTO99_SERIES *series);
void pluto99_free_tables( PLUTO99_SERIES *series);
#endif
