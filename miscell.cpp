/* miscell.cpp: debug logging,  config-directory file access,  and the
'environment' (configuration) store

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
#include <stdarg.h>
#include <stdbool.h>
#include <errno.h>
#include <time.h>
#ifdef _WIN32
   #include <direct.h>        /* for _mkdir() definition */
#else
   #include <sys/stat.h>
   #include <sys/types.h>
#endif

FILE *fopen_ext( const char *filename, const char *permits);   /* miscell.cpp */
char *make_config_dir_name( char *oname, const char *iname);  /* miscell.cpp */
int ensure_config_directory_exists( void);                 /* miscell.cpp */
char *fgets_trimmed( char *buff, size_t max_bytes, FILE *ifile);
int debug_printf( const char *format, ...)                 /* miscell.cpp */
#ifdef __GNUC__
         __attribute__ (( format( printf, 1, 2)))
#endif
;
const char *get_environment_ptr( const char *env_ptr);     /* miscell.cpp */
void set_environment_ptr( const char *env_ptr, const char *new_value);
int load_environment_file( const char *filename);          /* miscell.cpp */

int debug_level = 0;
int use_config_directory = false;
const char *alt_config_directory;

char *fgets_trimmed( char *buff, size_t max_bytes, FILE *ifile)
{
   char *rval = fgets( buff, (int)max_bytes, ifile);

   if( rval)
      {
      int i;

      for( i = 0; buff[i] && buff[i] != 10 && buff[i] != 13; i++)
         ;
      buff[i] = '\0';
      }
   return( rval);
}

/* Users may specify files such as ~/this/that.txt on non-Windows boxes.
The following function replaces ~ with the home directory. */

static FILE *fopen_tilde( const char *filename, const char *permits)
{
#ifdef _WIN32
   return( fopen( filename, permits));
#else
   const char *home_ptr = getenv( "HOME");

   if( *filename != '~' || filename[1] != '/' || !home_ptr)
      return( fopen( filename, permits));
   else
      {
      char fullname[255];

      snprintf( fullname, sizeof( fullname), "%s%s", home_ptr, filename + 1);
      return( fopen( fullname, permits));
      }
#endif
}

char *make_config_dir_name( char *oname, const char *iname)
{
#ifndef _WIN32
   const char *home_ptr = getenv( "HOME");
#endif

   if( alt_config_directory && *alt_config_directory)
      {
      strcpy( oname, alt_config_directory);
      strcat( oname, iname);
      return( oname);
      }
#ifdef _WIN32
   strcpy( oname, iname);
#else
   if( home_ptr)
      {
      strcpy( oname, home_ptr);
      strcat( oname, "/.pluto99/");
      }
   else
      *oname = '\0';
   strcat( oname, iname);
#endif
   return( oname);
}

/* Makes the config directory (~/.pluto99/,  or 'alt_config_directory')
if it's in use and isn't there yet.  Returns -1 if it can't be made. */

int ensure_config_directory_exists( void)
{
   char dir_name[255];
   size_t len;
   int rval;

   if( !use_config_directory)
      return( 0);
   make_config_dir_name( dir_name, "");
   len = strlen( dir_name);
   if( len > 1 && dir_name[len - 1] == '/')
      dir_name[len - 1] = '\0';
   if( !*dir_name)
      return( 0);
#ifdef _WIN32
   rval = _mkdir( dir_name);
#else
   rval = mkdir( dir_name, 0777);
#endif
   if( rval && errno != EEXIST)
      {
      if( debug_level)
         debug_printf( "Couldn't create '%s': %s\n", dir_name, strerror( errno));
      return( -1);
      }
   return( 0);
}

/* 'permits' are the usual fopen() ones,  optionally preceded by :

   'c' : look in the config directory (~/.pluto99) first...
   'cl': ...and if it's not there,  try the local (current) directory.
   'lc': try local first,  then the config directory.

   Without the config directory in use,  'c' and 'l' are ignored and
only the local directory is tried.  A filename containing a '/' is taken
as-is,  never looked for in the config directory.  */

FILE *fopen_ext( const char *filename, const char *permits)
{
   FILE *rval = NULL;
   bool try_local = true;

   if( !use_config_directory)
      while( *permits == 'l' || *permits == 'c')
         permits++;
   if( *permits == 'c' && strchr( filename, '/'))
      permits++;              /* not really in the config directory */
   if( permits[0] == 'l' && permits[1] == 'c')
      {     /* try local,  then config version */
      permits++;
      rval = fopen_tilde( filename, permits + 1);
      try_local = false;
      }
   if( !rval && *permits == 'c')
      {
      char tname[255];

      make_config_dir_name( tname, filename);
      permits++;
      if( *permits == 'l')       /* permits are 'cl' = check both */
         permits++;
      else                       /* check config version only */
         try_local = false;
      rval = fopen_tilde( tname, permits);
      }
   if( try_local && !rval)
      rval = fopen_tilde( filename, permits);
   return( rval);
}

int debug_printf( const char *format, ...)
{
   const char *debug_file_name = "debug.txt";
   FILE *ofile = fopen_ext( debug_file_name, "ca");

   if( ofile)
      {
      va_list argptr;
      const time_t t0 = time( NULL);
      const long max_debug_file_size = 10000000;  /* 10 MBytes should be enough */

      if( ftell( ofile) > max_debug_file_size)
         {
         fclose( ofile);
         ofile = fopen_ext( debug_file_name, "cw");
         if( !ofile)
            return( -1);
         }
      fprintf( ofile, "%02d:%02d:%02d ",
               ((int)t0 / 3600) % 24, ((int)t0 / 60) % 60, (int)t0 % 60);
      va_start( argptr, format);
      vfprintf( ofile, format, argptr);
      va_end( argptr);
      if( *format && format[strlen( format) - 1] != '\n')
         fprintf( ofile, "\n");     /* ensure a line break */
      fclose( ofile);
      }
   return( 0);
}

/* Configuration is a set of KEY=value lines,  read from 'pluto99.dat'
(or,  failing that,  the shipped defaults in 'pluto99.def').  They're
kept sorted so get_environment_ptr() can do a binary search.  Keys not
present come back as an empty string,  never NULL. */

static const char *default_environment_file = "pluto99.dat";
static char **edata = NULL;
static size_t n_lines = 0, n_lines_allocated = 0;
static bool default_load_tried = false;

static size_t get_environment_ptr_index( const char *env_ptr, bool *got_it)
{
   size_t i = 0, n = n_lines;
   const size_t len = strlen( env_ptr);

   *got_it = false;
   while( !*got_it && n)
      {
      size_t j = 0, mid = i + n / 2;

      while( j < len && env_ptr[j] == edata[mid][j])
         j++;
      if( j == len && edata[mid][j] == '=')
         {
         *got_it = true;
         i = mid;
         }
      else if( j < len && edata[mid][j] > env_ptr[j])
         n /= 2;
      else
         {
         n -= n / 2 + 1;
         i = mid + 1;
         }
      }
   return( i);
}

static int load_default_environment_file( void)
{
   int rval = load_environment_file( default_environment_file);

   if( rval)
      rval = load_environment_file( "pluto99.def");
   if( rval && debug_level)
      debug_printf( "No configuration file found;  using built-in defaults\n");
   return( rval);
}

/* Passing NULL frees the store;  the next lookup reloads the default file.
If neither default file exists,  that's only tried once (until freed). */

const char *get_environment_ptr( const char *env_ptr)
{
   size_t i;
   bool got_it;

   if( !env_ptr)
      {
      if( edata)
         {
         for( i = 0; i < n_lines; i++)
            free( edata[i]);
         free( edata);
         }
      edata = NULL;
      n_lines = n_lines_allocated = 0;
      default_load_tried = false;
      return( NULL);
      }
   if( !edata && !default_load_tried)
      {
      default_load_tried = true;
      load_default_environment_file( );
      }
   i = get_environment_ptr_index( env_ptr, &got_it);
   if( !got_it)
      return( "");
   else
      return( edata[i] + strlen( env_ptr) + 1);
}

void set_environment_ptr( const char *env_ptr, const char *new_value)
{
   bool got_it;
   const size_t idx = get_environment_ptr_index( env_ptr, &got_it);

   if( !got_it && n_lines == n_lines_allocated)       /* need to expand array */
      {
      n_lines_allocated *= 2;
      if( !n_lines_allocated)
         n_lines_allocated = 8;
      edata = (char **)realloc( edata, n_lines_allocated * sizeof( char *));
      }
   if( !got_it)
      {
      memmove( edata + idx + 1, edata + idx, (n_lines - idx) * sizeof( edata[0]));
      n_lines++;
      edata[idx] = NULL;
      }
   edata[idx] = (char *)realloc( edata[idx],
                        strlen( env_ptr) + strlen( new_value) + 2);
   strcpy( edata[idx], env_ptr);
   strcat( edata[idx], "=");
   strcat( edata[idx], new_value);
}

/* Lines that start with a space,  or lack an '=',  are comments.  Values
from a later file replace those from an earlier one. */

int load_environment_file( const char *filename)
{
   FILE *ifile = fopen_ext( filename, "clrb");
   char buff[300], *tptr;

   if( !ifile)
      return( -1);
   while( fgets_trimmed( buff, sizeof( buff), ifile))
      if( *buff != ' ' && *buff != ';' && (tptr = strchr( buff, '=')) != NULL)
         {
         *tptr = '\0';
         set_environment_ptr( buff, tptr + 1);
         }
   fclose( ifile);
   if( debug_level)
      debug_printf( "Configuration read from '%s'\n", filename);
   return( 0);
}
