// Copyright 2024-2025 Ivan Kolev
//
// Distributed under the Boost Software License, Version 1.0.
// (See accompanying file LICENSE.txt or copy at http://www.boost.org/LICENSE_1_0.txt)

#pragma once

#include "GeoIndex/GeometryTools.hpp"

#include <cmath>

namespace GeoIndex
{
	// Conversions between planar index coordinates and distances on the Earth's surface.
	// Locations are Vector2{ longitude, latitude } in degrees, the index itself knows nothing about this

	static constexpr auto EarthRadiusKm = 6371.0;

	// Rough length of one degree, used to size search boxes
	static constexpr auto KmPerDegree = 111.0;

	static constexpr auto Pi = 3.14159265358979323846;

	[[nodiscard]] constexpr double DegreesToRadians(double degrees) noexcept
	{
		return degrees * Pi / 180;
	}

	[[nodiscard]] constexpr double KilometersToDegrees(double km) noexcept
	{
		return km / KmPerDegree;
	}

	[[nodiscard]] constexpr double DegreesToKilometers(double degrees) noexcept
	{
		return degrees * KmPerDegree;
	}

	// Haversine formula
	[[nodiscard]] inline double GetHaversineDistanceKm(Vector2 const& a, Vector2 const& b)
	{
		auto const latitudeA = DegreesToRadians(a[1]);
		auto const latitudeB = DegreesToRadians(b[1]);
		auto const deltaLatitude = latitudeB - latitudeA;
		auto const deltaLongitude = DegreesToRadians(b[0] - a[0]);

		auto const h = Square(std::sin(deltaLatitude / 2)) + std::cos(latitudeA) * std::cos(latitudeB) * Square(std::sin(deltaLongitude / 2));
		auto const c = 2 * std::atan2(std::sqrt(h), std::sqrt(1 - h));
		return EarthRadiusKm * c;
	}
}
