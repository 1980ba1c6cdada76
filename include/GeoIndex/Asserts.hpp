// Copyright 2024-2025 Ivan Kolev
//
// Distributed under the Boost Software License, Version 1.0.
// (See accompanying file LICENSE.txt or copy at http://www.boost.org/LICENSE_1_0.txt)

#pragma once

#include <stdexcept>

#ifndef MAKE_STRING
#	define MAKE_STRING( x ) MAKE_STRING_2( x )
#	define MAKE_STRING_2( x ) #x
#endif

namespace GeoIndex
{
	constexpr auto IsReleaseBuild =
#if defined( NDEBUG )
		true;
#else
		false;
#endif

	// Contract violations are programming errors, they are reported by throwing TException and are not meant to be recovered from
	template <class TException = std::logic_error>
	constexpr void Assert(bool condition, char const* message)
	{
		if (!condition)
		{
			throw TException{ message };
		}
	}
}

#ifndef ASSERT
#	define ASSERT( condition, ... ) \
		GeoIndex::Assert<__VA_ARGS__>( condition, "Assertion failed: " #condition " at " __FILE__ ":" MAKE_STRING( __LINE__ ) )
#endif

#if !defined( DEBUG_ASSERT )
#	if defined( NDEBUG )
#		define DEBUG_ASSERT( x, ... )	(void)0
#	else
#		define DEBUG_ASSERT( x, ... )	ASSERT( x, __VA_ARGS__ )
#	endif
#endif
