/*
Copyright (C) 1997-2001 Id Software, Inc.

This program is free software; you can redistribute it and/or
modify it under the terms of the GNU General Public License
as published by the Free Software Foundation; either version 2
of the License, or (at your option) any later version.

This program is distributed in the hope that it will be useful,
but WITHOUT ANY WARRANTY; without even the implied warranty of
MERCHANTABILITY or FITNESS FOR A PARTICULAR PURPOSE.

See the GNU General Public License for more details.

You should have received a copy of the GNU General Public License
along with this program; if not, write to the Free Software
Foundation, Inc., 59 Temple Place - Suite 330, Boston, MA  02111-1307, USA.

*/

#include "q_math.h"

#include <cstring>

void Matrix3_Identity( mat3_t m ) {
	VectorSet( &m[AXIS_FORWARD], 1, 0, 0 );
	VectorSet( &m[AXIS_RIGHT], 0, 1, 0 );
	VectorSet( &m[AXIS_UP], 0, 0, 1 );
}

void Matrix3_Copy( const mat3_t m1, mat3_t m2 ) {
	std::memcpy( m2, m1, sizeof( mat3_t ) );
}

void Matrix3_Multiply( const mat3_t m1, const mat3_t m2, mat3_t out ) {
	out[0] = m1[0] * m2[0] + m1[1] * m2[3] + m1[2] * m2[6];
	out[1] = m1[0] * m2[1] + m1[1] * m2[4] + m1[2] * m2[7];
	out[2] = m1[0] * m2[2] + m1[1] * m2[5] + m1[2] * m2[8];
	out[3] = m1[3] * m2[0] + m1[4] * m2[3] + m1[5] * m2[6];
	out[4] = m1[3] * m2[1] + m1[4] * m2[4] + m1[5] * m2[7];
	out[5] = m1[3] * m2[2] + m1[4] * m2[5] + m1[5] * m2[8];
	out[6] = m1[6] * m2[0] + m1[7] * m2[3] + m1[8] * m2[6];
	out[7] = m1[6] * m2[1] + m1[7] * m2[4] + m1[8] * m2[7];
	out[8] = m1[6] * m2[2] + m1[7] * m2[5] + m1[8] * m2[8];
}

void Matrix3_FromAngles( const vec3_t angles, mat3_t m ) {
	AngleVectors( angles, &m[AXIS_FORWARD], &m[AXIS_RIGHT], &m[AXIS_UP] );
	VectorInverse( &m[AXIS_RIGHT] );
}

void NormalVectorToUpAxis( const vec3_t normal, mat3_t axis ) {
	float *const forward = &axis[AXIS_FORWARD];
	float *const left    = &axis[AXIS_RIGHT];
	float *const up      = &axis[AXIS_UP];

	VectorCopy( normal, up );
	// Pick a helper direction that is not close to the normal
	vec3_t helper;
	if( std::fabs( normal[2] ) < 0.999f ) {
		VectorSet( helper, 0, 0, 1 );
	} else {
		VectorSet( helper, 1, 0, 0 );
	}

	CrossProduct( up, helper, left );
	VectorNormalize( left );
	CrossProduct( left, up, forward );
	VectorNormalize( forward );
}
