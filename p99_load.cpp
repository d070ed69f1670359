/* p99_load.cpp: reads replacement Pluto99 coefficient tables from text

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
#include <stdlib.h>
#include <string.h>
#include <stdbool.h>
#include "pluto99.h"

FILE *fopen_ext( const char *filename, const char *permits);   /* miscell.cpp */
char *fgets_trimmed( char *buff, size_t max_bytes, FILE *ifile); /* miscell.c */
int debug_printf( const char *format, ...)                 /* miscell.cpp */
#ifdef __GNUC__
         __attribute__ (( format( printf, 1, 2)))
#endif
;
extern int debug_level;

   /* Term storage comes from here;  replaceable so allocation failures */
   /* can be exercised. */
void *(*p99_table_calloc)( size_t n_elements, size_t elem_size) = calloc;

/* The built-in tables in 'p99_data.cpp' can be replaced with a text file
laid out one term per line :

; comment lines start with ';' or '#'
x 0   36.7808319484    2.5343542995  5.7479904765
x 0    4.4871424447    5.0687085989  5.9957583060
...
z 2    0.0000123456   12.6717714973  0.1234567890

   i.e.,  axis (x, y, or z);  degree (0 = constant weight,  1 = times X,
2 = times X^2);  amplitude in AU;  frequency in radians per Julian
century;  phase in radians.  Terms for a given axis and degree needn't
be contiguous.  Every axis must get at least one term.

   'series' must point to PLUTO99_N_AXES series.  On success,  they get
heap-allocated terms that pluto99_free_tables() releases;  on failure,
they're left empty.  */

static int parse_term_line( const char *buff, int *axis, int *degree,
                                          PLUTO99_TERM *term)
{
   char axis_char, degree_char, extra;
   const int n_scanned = sscanf( buff, " %c %c %lf %lf %lf %c",
            &axis_char, &degree_char, &term->amplitude, &term->freq,
            &term->phase, &extra);

   if( n_scanned != 5 || !axis_char || !strchr( "xyz", axis_char)
                     || degree_char < '0' || degree_char > '2')
      return( PLUTO99_ERR_FILE_FORMAT);
   *axis = axis_char - 'x';
   *degree = degree_char - '0';
   return( 0);
}

static bool is_skippable_line( const char *buff)
{
   while( *buff == ' ' || *buff == '\t')
      buff++;
   return( !*buff || *buff == ';' || *buff == '#');
}

static void clear_tables( PLUTO99_SERIES *series)
{
   size_t i, j;

   for( i = 0; i < PLUTO99_N_AXES; i++)
      for( j = 0; j < PLUTO99_N_DEGREES; j++)
         {
         series[i].terms[j] = NULL;
         series[i].n_terms[j] = 0;
         }
}

void pluto99_free_tables( PLUTO99_SERIES *series)
{
   size_t i, j;

   for( i = 0; i < PLUTO99_N_AXES; i++)
      for( j = 0; j < PLUTO99_N_DEGREES; j++)
         free( (void *)series[i].terms[j]);
   clear_tables( series);
}

int pluto99_load_tables( const char *filename, PLUTO99_SERIES *series)
{
   FILE *ifile = fopen_ext( filename, "clrb");
   PLUTO99_TERM *terms[PLUTO99_N_AXES][PLUTO99_N_DEGREES];
   size_t counts[PLUTO99_N_AXES][PLUTO99_N_DEGREES];
   char buff[200];
   int axis, degree, line_no = 0, rval = 0;
   PLUTO99_TERM term;

   clear_tables( series);
   if( !ifile)
      {
      if( debug_level)
         debug_printf( "Coefficient tables '%s' not found\n", filename);
      return( PLUTO99_ERR_FILE_NOT_FOUND);
      }
   memset( counts, 0, sizeof( counts));
   while( !rval && fgets_trimmed( buff, sizeof( buff), ifile))
      {
      line_no++;
      if( !is_skippable_line( buff))
         {
         rval = parse_term_line( buff, &axis, &degree, &term);
         if( rval)
            {
            if( debug_level)
               debug_printf( "%s, line %d: bad term '%s'\n",
                              filename, line_no, buff);
            }
         else
            counts[axis][degree]++;
         }
      }
   for( axis = 0; !rval && axis < PLUTO99_N_AXES; axis++)
      if( !counts[axis][0] && !counts[axis][1] && !counts[axis][2])
         {
         if( debug_level)
            debug_printf( "%s: no terms for axis %c\n", filename, 'x' + axis);
         rval = PLUTO99_ERR_FILE_FORMAT;
         }
   if( rval)
      {
      fclose( ifile);
      return( rval);
      }

   for( axis = 0; axis < PLUTO99_N_AXES; axis++)
      for( degree = 0; degree < PLUTO99_N_DEGREES; degree++)
         {
         terms[axis][degree] = (counts[axis][degree] ? (PLUTO99_TERM *)
               p99_table_calloc( counts[axis][degree], sizeof( PLUTO99_TERM)) : NULL);
         series[axis].terms[degree] = terms[axis][degree];
         if( counts[axis][degree] && !terms[axis][degree])
            rval = PLUTO99_ERR_NO_MEMORY;
         }
   if( rval)
      {
      pluto99_free_tables( series);
      fclose( ifile);
      return( rval);
      }
   fseek( ifile, 0L, SEEK_SET);
   while( fgets_trimmed( buff, sizeof( buff), ifile))
      if( !is_skippable_line( buff)
                  && !parse_term_line( buff, &axis, &degree, &term))
         terms[axis][degree][series[axis].n_terms[degree]++] = term;
   fclose( ifile);
   if( debug_level)
      debug_printf( "Coefficient tables loaded from '%s': %d lines\n",
                              filename, line_no);
   return( 0);
}
