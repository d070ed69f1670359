/* Miscellaneous constants used throughout the Pluto99 code */

#define J2000 2451545.
#define DAYS_PER_CENTURY 36525.

#define PI 3.1415926535897932384626433832795028841971693993751058209749445923078
