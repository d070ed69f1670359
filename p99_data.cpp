/* p99_data.cpp: coefficient tables for the Pluto99-form series

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

#include <stddef.h>
#include "pluto99.h"

/* Each axis is the sum of terms of the form

   amplitude * sin( freq * t_cen + phase)

   where t_cen = (JDE - 2451545) / 36525 = centuries from J2000.  The
'x0' terms are used as-is,  'x1' are multiplied by X and 'x2' by X^2,
with X = -1 + 2 * (JDE - 626150.5) / 2185000.  Then a linear term,
offset + slope * X,  is added (see the bottom of this file).  Coordinates
are heliocentric J2000 ecliptic,  in AU.

   The tables below are a least-squares fit in exactly that form,  made
over 4000 evenly spaced dates spanning JDE 626150.5 to 2811150.5,  to
a Keplerian orbit built from Standish's (1992) mean elements for Pluto,
with their linear rates.  The frequencies are multiples of Pluto's
mean motion,  145.20780515 degrees/century = 2.5343542995 radians/cy;
terms with amplitude below 2e-6 AU were dropped.  The fit matches that
Keplerian orbit to 4.4e-5 AU everywhere in the span.  It does _not_
match DE406 that well,  since Standish's elements are really only meant
for 1800 to 2050.  Near the present,  it's within about .003 AU of
Meeus' example 37.a (1992 Oct 13).  A full published Pluto99 table can
be swapped in at run time;  see 'p99_load.cpp'.

   Frequency-zero terms have phase pi/2 (to ten places,  close enough
that the sine rounds to exactly 1),  so they're just constants.  */

static const PLUTO99_TERM x0_terms[] = {
 {    -0.0790014262,    0.0000000000,  1.5707963268 },
 {    36.7808319484,    2.5343542995,  5.7479904765 },
 {     4.4871424447,    5.0687085989,  5.9957583060 },
 {     0.8211149973,    7.6030628984,  6.2422233189 },
 {     0.1780825596,   10.1374171978,  0.2049755806 },
 {     0.0424315805,   12.6717714973,  0.4506480730 },
 {     0.0107336919,   15.2061257968,  0.6961730167 },
 {     0.0028301489,   17.7404800962,  0.9416276423 },
 {     0.0007692095,   20.2748343957,  1.1871221611 },
 {     0.0002138836,   22.8091886952,  1.4329285996 },
 {     0.0000604185,   25.3435429946,  1.6797883460 } };

static const PLUTO99_TERM x1_terms[] = {
 {     0.1194246435,    0.0000000000,  1.5707963268 },
 {     0.0215559162,    2.5343542995,  3.1885635021 },
 {     0.0970073968,    5.0687085989,  1.0288736785 },
 {     0.0358556065,    7.6030628984,  1.2650796329 },
 {     0.0117007348,   10.1374171978,  1.5073692610 },
 {     0.0037222377,   12.6717714973,  1.7511633144 },
 {     0.0011776858,   15.2061257968,  1.9955122923 },
 {     0.0003726764,   17.7404800962,  2.2400363176 },
 {     0.0001181024,   20.2748343957,  2.4846216295 },
 {     0.0000373275,   22.8091886952,  2.7296112066 },
 {     0.0000112626,   25.3435429946,  2.9712564285 } };

static const PLUTO99_TERM x2_terms[] = {
 {    -0.0010027822,    0.0000000000,  1.5707963268 },
 {     0.0002777978,    2.5343542995,  0.3692635087 },
 {     0.0011234742,    5.0687085989,  2.3653308538 },
 {     0.0008109814,    7.6030628984,  2.5876038355 },
 {     0.0003933254,   10.1374171978,  2.8216057595 },
 {     0.0001657697,   12.6717714973,  3.0609160207 },
 {     0.0000650156,   15.2061257968,  3.3044218771 },
 {     0.0000241857,   17.7404800962,  3.5552712302 },
 {     0.0000083368,   20.2748343957,  3.8215424641 },
 {     0.0000022633,   22.8091886952,  4.1134189317 } };

static const PLUTO99_TERM y0_terms[] = {
 {     0.1329310463,    0.0000000000,  1.5707963268 },
 {    38.0594044492,    2.5343542995,  4.1635122641 },
 {     4.6432107202,    5.0687085989,  4.4060031279 },
 {     0.8496823748,    7.6030628984,  4.6497966597 },
 {     0.1842792588,   10.1374171978,  4.8941179235 },
 {     0.0439082321,   12.6717714973,  5.1387060981 },
 {     0.0111072855,   15.2061257968,  5.3834515801 },
 {     0.0029286986,   17.7404800962,  5.6283173947 },
 {     0.0007960377,   20.2748343957,  5.8733633062 },
 {     0.0002213757,   22.8091886952,  6.1188977528 },
 {     0.0000625483,   25.3435429946,  0.0826723753 } };

static const PLUTO99_TERM y1_terms[] = {
 {    -0.2217532260,    0.0000000000,  1.5707963268 },
 {     0.0326454465,    2.5343542995,  0.6574427424 },
 {     0.1028034272,    5.0687085989,  5.7325143990 },
 {     0.0375400706,    7.6030628984,  5.9583979906 },
 {     0.0122019948,   10.1374171978,  6.1971756377 },
 {     0.0038739875,   12.6717714973,  0.1560176571 },
 {     0.0012241721,   15.2061257968,  0.3992919008 },
 {     0.0003870358,   17.7404800962,  0.6430233944 },
 {     0.0001225836,   20.2748343957,  0.8868727321 },
 {     0.0000387609,   22.8091886952,  1.1314810648 },
 {     0.0000117328,   25.3435429946,  1.3761781970 } };

static const PLUTO99_TERM y2_terms[] = {
 {    -0.0036053486,    0.0000000000,  1.5707963268 },
 {     0.0003404711,    2.5343542995,  1.7494658732 },
 {     0.0012379428,    5.0687085989,  0.8321748996 },
 {     0.0008616620,    7.6030628984,  1.0074971371 },
 {     0.0004137895,   10.1374171978,  1.2314826969 },
 {     0.0001736680,   12.6717714973,  1.4666672707 },
 {     0.0000680815,   15.2061257968,  1.7080037291 },
 {     0.0000254624,   17.7404800962,  1.9599105207 },
 {     0.0000089237,   20.2748343957,  2.2393378642 },
 {     0.0000025335,   22.8091886952,  2.5939364500 } };

static const PLUTO99_TERM z0_terms[] = {
 {     0.0067420563,    0.0000000000,  1.5707963268 },
 {    11.3393307799,    2.5343542995,  2.2347452430 },
 {     1.3808795559,    5.0687085989,  2.4818387394 },
 {     0.2524608217,    7.6030628984,  2.7279650510 },
 {     0.0547231925,   10.1374171978,  2.9736984690 },
 {     0.0130340145,   12.6717714973,  3.2192339692 },
 {     0.0032962740,   15.2061257968,  3.4646601254 },
 {     0.0008689609,   17.7404800962,  3.7100424597 },
 {     0.0002361445,   20.2748343957,  3.9554974632 },
 {     0.0000656552,   22.8091886952,  4.2013321144 },
 {     0.0000185432,   25.3435429946,  4.4483253262 } };

static const PLUTO99_TERM z1_terms[] = {
 {    -0.0080233087,    0.0000000000,  1.5707963268 },
 {     0.0710682152,    2.5343542995,  3.8540580393 },
 {     0.0386899979,    5.0687085989,  3.8492502860 },
 {     0.0126246816,    7.6030628984,  4.0634905205 },
 {     0.0039406078,   10.1374171978,  4.2967127451 },
 {     0.0012252343,   12.6717714973,  4.5355885632 },
 {     0.0003822782,   15.2061257968,  4.7768341178 },
 {     0.0001198405,   17.7404800962,  5.0191793398 },
 {     0.0000377296,   20.2748343957,  5.2621711309 },
 {     0.0000118742,   22.8091886952,  5.5064410756 },
 {     0.0000035785,   25.3435429946,  5.7504182498 } };

static const PLUTO99_TERM z2_terms[] = {
 {     0.0002861336,    0.0000000000,  1.5707963268 },
 {     0.0002368608,    2.5343542995,  5.2490642304 },
 {     0.0005709917,    5.0687085989,  5.2296955510 },
 {     0.0003253175,    7.6030628984,  5.4111218776 },
 {     0.0001448266,   10.1374171978,  5.6287673844 },
 {     0.0000584320,   12.6717714973,  5.8588912882 },
 {     0.0000223538,   15.2061257968,  6.0969264669 },
 {     0.0000082067,   17.7404800962,  0.0632852571 },
 {     0.0000028200,   20.2748343957,  0.3366678961 } };

#define N_TERMS( table)  (sizeof( table) / sizeof( table[0]))

const PLUTO99_SERIES pluto99_default_series[PLUTO99_N_AXES] = {
   { { x0_terms, x1_terms, x2_terms },
     { N_TERMS( x0_terms), N_TERMS( x1_terms), N_TERMS( x2_terms) } },
   { { y0_terms, y1_terms, y2_terms },
     { N_TERMS( y0_terms), N_TERMS( y1_terms), N_TERMS( y2_terms) } },
   { { z0_terms, z1_terms, z2_terms },
     { N_TERMS( z0_terms), N_TERMS( z1_terms), N_TERMS( z2_terms) } } };

   /* Linear corrections,  offset + slope * X,  in AU.  These take up a */
   /* residual drift the trig series alone don't capture.               */

const double pluto99_axis_offset[PLUTO99_N_AXES] =
                  {  9.922274, 10.016090, -3.947474 };
const double pluto99_axis_slope[PLUTO99_N_AXES] =
                  {  0.154154,  0.064073, -0.042746 };
