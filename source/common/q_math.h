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

#ifndef SFX_72fa25e3_8e30_463e_a361_045ca705cf90_H
#define SFX_72fa25e3_8e30_463e_a361_045ca705cf90_H

#include <cmath>

//==============================================================
//
//MATHLIB
//
//==============================================================

enum {
	PITCH = 0,      // up / down
	YAW = 1,        // left / right
	ROLL = 2        // fall over
};

// Rows of an axis matrix. Note that the second row points to the left.
enum {
	AXIS_FORWARD = 0,
	AXIS_RIGHT = 3,
	AXIS_UP = 6
};

typedef float vec_t;
typedef vec_t vec3_t[3];

typedef vec_t mat3_t[9];

#ifndef M_PI
#define M_PI       3.14159265358979323846   // matches value in gcc v2 math.h
#endif

#define DotProduct( x, y )     ( ( x )[0] * ( y )[0] + ( x )[1] * ( y )[1] + ( x )[2] * ( y )[2] )
#define CrossProduct( v1, v2, cross ) ( ( cross )[0] = ( v1 )[1] * ( v2 )[2] - ( v1 )[2] * ( v2 )[1], ( cross )[1] = ( v1 )[2] * ( v2 )[0] - ( v1 )[0] * ( v2 )[2], ( cross )[2] = ( v1 )[0] * ( v2 )[1] - ( v1 )[1] * ( v2 )[0] )

#define VectorCopy( a, b )     ( ( b )[0] = ( a )[0], ( b )[1] = ( a )[1], ( b )[2] = ( a )[2] )
#define VectorSet( v, x, y, z )   ( ( v )[0] = ( x ), ( v )[1] = ( y ), ( v )[2] = ( z ) )
#define VectorMA( a, b, c, d )       ( ( d )[0] = ( a )[0] + ( b ) * ( c )[0], ( d )[1] = ( a )[1] + ( b ) * ( c )[1], ( d )[2] = ( a )[2] + ( b ) * ( c )[2] )
#define VectorCompare( v1, v2 )    ( ( v1 )[0] == ( v2 )[0] && ( v1 )[1] == ( v2 )[1] && ( v1 )[2] == ( v2 )[2] )
#define VectorLengthSquared( v )    ( DotProduct( ( v ), ( v ) ) )
#define VectorLength( v )     ( std::sqrt( VectorLengthSquared( v ) ) )
#define VectorInverse( v )    ( ( v )[0] = -( v )[0], ( v )[1] = -( v )[1], ( v )[2] = -( v )[2] )

#define DistanceSquared( v1, v2 ) ( ( ( v1 )[0] - ( v2 )[0] ) * ( ( v1 )[0] - ( v2 )[0] ) + ( ( v1 )[1] - ( v2 )[1] ) * ( ( v1 )[1] - ( v2 )[1] ) + ( ( v1 )[2] - ( v2 )[2] ) * ( ( v1 )[2] - ( v2 )[2] ) )

inline float VectorNormalize( float *v ) {
	const float length = std::sqrt( DotProduct( v, v ) );
	if( length != 0.0f ) {
		const float ilength = 1.0f / length;
		v[0] *= ilength;
		v[1] *= ilength;
		v[2] *= ilength;
	}
	return length;
}

inline void AngleVectors( const vec3_t angles, vec3_t forward, vec3_t right, vec3_t up ) {
	constexpr float deg2Rad = (float)( M_PI ) / 180.0f;

	const float yaw     = deg2Rad * angles[YAW];
	const float sinYaw  = std::sin( yaw );
	const float cosYaw  = std::cos( yaw );

	const float pitch    = deg2Rad * angles[PITCH];
	const float sinPitch = std::sin( pitch );
	const float cosPitch = std::cos( pitch );

	const bool calcRight = right != nullptr;
	const bool calcUp    = up != nullptr;

	float sinRoll = 0.0f;
	float cosRoll = 1.0f;
	if( const float rollDegrees = angles[ROLL]; rollDegrees != 0.0f ) {
		if( calcRight | calcUp ) {
			const float roll = deg2Rad * rollDegrees;
			sinRoll = std::sin( roll );
			cosRoll = std::cos( roll );
		}
	}

	if( forward ) {
		forward[0] = cosPitch * cosYaw;
		forward[1] = cosPitch * sinYaw;
		forward[2] = -sinPitch;
	}

	if( calcRight ) {
		const float t = sinRoll * sinPitch;
		right[0] = ( -1 * t * cosYaw + -1 * cosRoll * -sinYaw );
		right[1] = ( -1 * t * sinYaw + -1 * cosRoll * cosYaw );
		right[2] = -1 * sinRoll * cosPitch;
	}

	if( calcUp ) {
		const float t = cosRoll * sinPitch;
		up[0] = ( t * cosYaw + -sinRoll * -sinYaw );
		up[1] = ( t * sinYaw + -sinRoll * cosYaw );
		up[2] = cosRoll * cosPitch;
	}
}

void Matrix3_Identity( mat3_t m );
void Matrix3_Copy( const mat3_t m1, mat3_t m2 );
void Matrix3_Multiply( const mat3_t m1, const mat3_t m2, mat3_t out );
void Matrix3_FromAngles( const vec3_t angles, mat3_t m );

/// Builds an orthonormal axis which up row is the given normal.
/// The normal is assumed to be of unit length.
void NormalVectorToUpAxis( const vec3_t normal, mat3_t axis );

#endif
