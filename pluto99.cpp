/* pluto99.cpp: evaluates the Pluto99-form series,  caching per epoch

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

#include <math.h>
#include <stdio.h>
#include <stdbool.h>
#include "pluto99.h"

int debug_printf( const char *format, ...)                 /* miscell.cpp */
#ifdef __GNUC__
         __attribute__ (( format( printf, 1, 2)))
#endif
;
extern int debug_level;

/* The series are fitted against X,  which runs linearly from -1 at the
start of the fitted span to +1 at the end.  No range check here;  values
outside -1 to 1 just extrapolate (badly,  the further out you go).  */

double pluto99_normalize( const double jde)
{
   return( -1. + 2. * (jde - PLUTO99_JDE_START) / PLUTO99_JDE_SPAN);
}

bool pluto99_in_range( const double jde)
{
   return( jde >= PLUTO99_JDE_START && jde <= PLUTO99_JDE_END);
}

int pluto99_check_series( const PLUTO99_SERIES *series)
{
   size_t i;

   if( !series)
      return( PLUTO99_ERR_BAD_SERIES);
   for( i = 0; i < PLUTO99_N_DEGREES; i++)
      if( series->n_terms[i] && !series->terms[i])
         return( PLUTO99_ERR_BAD_SERIES);
   return( 0);
}

/* For each degree i,  sum amplitude * sin( freq * t + phase) over the
terms,  then weight the sums by 1, X, X^2.  NaNs and infinities in
X or t are not caught;  they just come out the other end. */

int pluto99_evaluate( const PLUTO99_SERIES *series, const double x_norm,
                           const double t_cen, double *result)
{
   const double x_power[PLUTO99_N_DEGREES] = { 1., x_norm, x_norm * x_norm };
   const int err_code = pluto99_check_series( series);
   double rval = 0.;
   size_t i, j;

   if( err_code)
      return( err_code);
   for( i = 0; i < PLUTO99_N_DEGREES; i++)
      {
      const PLUTO99_TERM *tptr = series->terms[i];
      double sum = 0.;

      for( j = series->n_terms[i]; j; j--, tptr++)
         sum += tptr->amplitude * sin( tptr->freq * t_cen + tptr->phase);
      rval += sum * x_power[i];
      }
   *result = rval;
   return( 0);
}

double pluto99_axis_value( const double series_sum, const double offset,
                           const double slope, const double x_norm)
{
   return( series_sum + offset + slope * x_norm);
}

static int check_epoch( const PLUTO99 *p, const PLUTO99_TIME *epoch)
{
   if( !epoch)
      return( PLUTO99_ERR_NULL_TIME);
   if( !pluto99_in_range( epoch->jde))
      {
      if( debug_level)
         debug_printf( "Pluto99: JDE %f is outside the fitted span\n",
                     epoch->jde);
      if( p->flags & PLUTO99_STRICT_RANGE)
         return( PLUTO99_ERR_OUT_OF_RANGE);
      }
   return( 0);
}

int pluto99_init( PLUTO99 *p, const PLUTO99_TIME *epoch,
                                          const unsigned flags)
{
   size_t i;
   int err_code;

   p->flags = flags;
   p->fresh = 0;
   p->epoch.jde = p->epoch.t_cen = 0.;
   p->evaluate = pluto99_evaluate;
   for( i = 0; i < PLUTO99_N_AXES; i++)
      p->series[i] = pluto99_default_series + i;
   err_code = check_epoch( p, epoch);
   if( !err_code)
      p->epoch = *epoch;
   return( err_code);
}

/* Everything cached belongs to the old epoch,  so it all goes stale in
the same call that adopts the new one.  On failure,  nothing changes. */

int pluto99_set_epoch( PLUTO99 *p, const PLUTO99_TIME *epoch)
{
   const int err_code = check_epoch( p, epoch);

   if( !err_code)
      {
      p->fresh = 0;
      p->epoch = *epoch;
      if( debug_level > 1)
         debug_printf( "Pluto99: epoch now JDE %f\n", epoch->jde);
      }
   return( err_code);
}

const PLUTO99_TIME *pluto99_get_epoch( const PLUTO99 *p)
{
   return( &p->epoch);
}

int pluto99_set_series( PLUTO99 *p, const int axis,
                                          const PLUTO99_SERIES *series)
{
   int err_code;

   if( axis < 0 || axis >= PLUTO99_N_AXES)
      return( PLUTO99_ERR_BAD_AXIS);
   err_code = pluto99_check_series( series);
   if( !err_code)
      {
      p->series[axis] = series;
      p->fresh &= ~PLUTO99_FRESH_AXIS( axis);
      }
   return( err_code);
}

double pluto99_get_x_norm( PLUTO99 *p)
{
   if( !(p->fresh & PLUTO99_FRESH_X_NORM))
      {
      p->x_norm = pluto99_normalize( p->epoch.jde);
      p->fresh |= PLUTO99_FRESH_X_NORM;
      }
   return( p->x_norm);
}

double pluto99_get_t_cen( PLUTO99 *p)
{
   if( !(p->fresh & PLUTO99_FRESH_T_CEN))
      {
      p->t_cen = p->epoch.t_cen;
      p->fresh |= PLUTO99_FRESH_T_CEN;
      }
   return( p->t_cen);
}

int pluto99_coord( PLUTO99 *p, const int axis, double *value)
{
   if( axis < 0 || axis >= PLUTO99_N_AXES)
      return( PLUTO99_ERR_BAD_AXIS);
   if( !(p->fresh & PLUTO99_FRESH_AXIS( axis)))
      {
      const double x_norm = pluto99_get_x_norm( p);
      double sum;
      const int err_code = p->evaluate( p->series[axis], x_norm,
                                 pluto99_get_t_cen( p), &sum);

      if( err_code)
         return( err_code);
      p->xyz[axis] = pluto99_axis_value( sum, pluto99_axis_offset[axis],
                                 pluto99_axis_slope[axis], x_norm);
      p->fresh |= PLUTO99_FRESH_AXIS( axis);
      if( debug_level > 2)
         debug_printf( "Pluto99: JDE %f axis %d = %.9f\n",
                     p->epoch.jde, axis, p->xyz[axis]);
      }
   *value = p->xyz[axis];
   return( 0);
}

/* Fills xyz[0..2] with a snapshot;  it won't follow later epoch changes. */

int pluto99_vector( PLUTO99 *p, double *xyz)
{
   double tvect[PLUTO99_N_AXES];
   int i, err_code = 0;

   for( i = 0; !err_code && i < PLUTO99_N_AXES; i++)
      err_code = pluto99_coord( p, i, tvect + i);
   if( !err_code)
      for( i = 0; i < PLUTO99_N_AXES; i++)
         xyz[i] = tvect[i];
   return( err_code);
}
