/* plutopos.cpp: command-line heliocentric J2000 ecliptic positions of
Pluto from Pluto99-form series

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
#include <ctype.h>
#include "watdefs.h"
#include "afuncs.h"
#include "pluto99.h"

const char *get_environment_ptr( const char *env_ptr);     /* miscell.cpp */
int load_environment_file( const char *filename);          /* miscell.cpp */
int debug_printf( const char *format, ...)                 /* miscell.cpp */
#ifdef __GNUC__
         __attribute__ (( format( printf, 1, 2)))
#endif
;
int ensure_config_directory_exists( void);                 /* miscell.cpp */
extern int debug_level;
extern int use_config_directory;

static void error_exit( void)
{
   printf(
      "plutopos computes heliocentric J2000 ecliptic positions of Pluto,\n"
      "in AU,  from Pluto99-form series.  The built-in tables are a fit to a\n"
      "Keplerian orbit (good to a few thousandths of an AU near the present);\n"
      "use -t to load published Pluto99 coefficients instead.  Usage :\n\n"
      "plutopos (options) date (date...)\n\n"
      "Dates can be in any form the 'lunar' date parser takes:  '1992 Oct 13',\n"
      "'JD 2448908.5',  '2000-01-01T12:00',  '-2000 Jan 1',  etc.  Options are :\n\n"
      "   -d(n)      Set debug level (output to '~/.pluto99/debug.txt')\n"
      "   -D(file)   Read settings from 'file' instead of 'pluto99.dat'\n"
      "   -t(file)   Read coefficient tables from 'file'\n"
      "   -s         Reject dates outside -2998 Apr 23 to +2984 Jul 26\n");
   exit( -1);
}

/* Option arguments can be glued to the option ('-d3') or be the next
argument ('-d 3').  In the latter case,  'consumed' is set so the
argument isn't also taken to be a date.  Only call this for options
that actually take an argument. */

static const char *get_arg( const int argc, const char **argv, const int idx,
                                          bool *consumed)
{
   const char *rval;

   argv += idx;
   *consumed = false;
   if( argv[0][2] || idx == argc - 1)
      rval = argv[0] + 2;
   else
      {
      if( argv[1][0] == '-')
         rval = "";
      else
         {
         rval = argv[1];
         *consumed = true;
         }
      }
   return( rval);
}

/* '-2000 Jan 1' is a date,  not an option. */

static bool is_option( const char *arg)
{
   return( arg[0] == '-' && arg[1] && !isdigit( (unsigned char)arg[1]));
}

static bool is_all_digits( const char *arg)
{
   return( *arg && strspn( arg, "0123456789") == strlen( arg));
}

static void show_position( PLUTO99 *p)
{
   char time_buff[80];
   double xyz[PLUTO99_N_AXES];
   const int err_code = pluto99_vector( p, xyz);

   if( err_code)
      {
      fprintf( stderr, "Error %d computing position\n", err_code);
      return;
      }
   pluto99_format_time( time_buff, pluto99_get_epoch( p));
   printf( "%s TT  JDE %.6f  X %+.9f  t %+.9f\n", time_buff,
               pluto99_get_epoch( p)->jde, pluto99_get_x_norm( p),
               pluto99_get_t_cen( p));
   printf( "   x %14.9f   y %14.9f   z %14.9f   r %13.9f\n",
               xyz[0], xyz[1], xyz[2], vector3_length( xyz));
   if( !pluto99_in_range( pluto99_get_epoch( p)->jde))
      printf( "   (outside the fitted span;  extrapolated)\n");
}

int main( const int argc, const char **argv)
{
   PLUTO99 p;
   PLUTO99_SERIES loaded[PLUTO99_N_AXES];
   const char *table_file_name = NULL;
   bool strict_range = false, have_tables = false, initialized = false;
   bool *is_option_arg = (bool *)calloc( argc + 1, sizeof( bool));
   int i, n_dates = 0, rval = 0, debug_option = -1;

#ifndef _WIN32
   use_config_directory = true;
   if( ensure_config_directory_exists( ))
      use_config_directory = false;    /* can't make ~/.pluto99;  use local */
#endif

   for( i = 1; i < argc; i++)
      if( is_option( argv[i]) && !is_option_arg[i])
         {
         bool consumed = false;
         const char *arg;

         is_option_arg[i] = true;
         switch( argv[i][1])
            {
            case 'd':
               arg = get_arg( argc, argv, i, &consumed);
               if( consumed && !is_all_digits( arg))
                  {           /* '-d' followed by a date,  not a level */
                  consumed = false;
                  arg = "";
                  }
               debug_option = atoi( arg);
               if( !debug_option)
                  debug_option = 1;
               break;
            case 'D':
               arg = get_arg( argc, argv, i, &consumed);
               if( load_environment_file( arg))
                  {
                  fprintf( stderr, "Couldn't load environment file '%s'\n", arg);
                  free( is_option_arg);
                  return( -1);
                  }
               break;
            case 's':
               strict_range = true;
               break;
            case 't':
               table_file_name = get_arg( argc, argv, i, &consumed);
               break;
            default:
               printf( "Option '%s' not recognized\n\n", argv[i]);
               error_exit( );
               break;
            }
         is_option_arg[i + 1] |= consumed;
         }
   if( debug_option >= 0)
      debug_level = debug_option;
   else
      debug_level = atoi( get_environment_ptr( "DEBUG_LEVEL"));
   if( debug_level)
      debug_printf( "plutopos: debug_level = %d; %s %s\n",
                           debug_level, __DATE__, __TIME__);
   if( atoi( get_environment_ptr( "PLUTO99_STRICT_RANGE")))
      strict_range = true;
   if( !table_file_name && *get_environment_ptr( "PLUTO99_TABLES"))
      table_file_name = get_environment_ptr( "PLUTO99_TABLES");

   if( table_file_name)
      {
      const int err_code = pluto99_load_tables( table_file_name, loaded);

      if( err_code)
         {
         fprintf( stderr, "Couldn't load tables from '%s' (error %d)\n",
                              table_file_name, err_code);
         free( is_option_arg);
         return( -1);
         }
      have_tables = true;
      }

   for( i = 1; i < argc; i++)
      if( !is_option_arg[i])
         {
         PLUTO99_TIME t;
         int err_code = pluto99_time_from_string( &t, argv[i]);

         n_dates++;
         if( err_code)
            fprintf( stderr, "Couldn't parse '%s' as a date\n", argv[i]);
         else if( !initialized)
            {
            int axis;

            err_code = pluto99_init( &p, &t,
                           (strict_range ? PLUTO99_STRICT_RANGE : 0));
            for( axis = 0; !err_code && have_tables && axis < PLUTO99_N_AXES;
                              axis++)
               err_code = pluto99_set_series( &p, axis, loaded + axis);
            initialized = !err_code;
            }
         else
            err_code = pluto99_set_epoch( &p, &t);
         if( err_code == PLUTO99_ERR_OUT_OF_RANGE)
            fprintf( stderr, "'%s' is outside the fitted span\n", argv[i]);
         else if( !err_code)
            show_position( &p);
         if( err_code)
            rval = err_code;
         }
   if( !n_dates)
      error_exit( );
   if( have_tables)
      pluto99_free_tables( loaded);
   free( is_option_arg);
   get_environment_ptr( NULL);
   return( rval ? 1 : 0);
}
