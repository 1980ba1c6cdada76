// Copyright 2024-2025 Ivan Kolev
//
// Distributed under the Boost Software License, Version 1.0.
// (See accompanying file LICENSE.txt or copy at http://www.boost.org/LICENSE_1_0.txt)

#pragma once

#include "GeoIndex/GeometryTools.hpp"
#include "GeoIndex/KdTree.hpp"

#include <list>
#include <optional>
#include <ostream>
#include <string>
#include <string_view>
#include <vector>

namespace GeoIndex
{
	struct Place
	{
		std::string name;
		std::string category;
		Vector2 location{};	// longitude, latitude
		std::string address;
	};

	std::ostream& operator<<(std::ostream&, Place const&);

	struct PlaceDistance
	{
		Place const* place = nullptr;
		double distanceKm = 0;
	};

	// Places on a map, indexed by location. Distances reported to the caller are great-circle kilometres,
	// the index itself works on raw longitude / latitude
	class PlaceCatalog
	{
		// A list keeps the addresses stable, the index refers to the places by pointer
		std::list<Place> places_;

		KdTree<Place const*> index_;

	public:

		// Krasnoyarsk city center
		static constexpr Vector2 DefaultCenter{ 92.8725860, 56.0091173 };

		PlaceCatalog() = default;

		PlaceCatalog(PlaceCatalog const&) = delete;
		PlaceCatalog& operator=(PlaceCatalog const&) = delete;
		PlaceCatalog(PlaceCatalog&&) = default;
		PlaceCatalog& operator=(PlaceCatalog&&) = default;

		Place const& Add(Place place);

		// Removes one place at exactly this location, returns false if there is none
		bool Remove(Vector2 const& location);

		void Clear() noexcept;

		[[nodiscard]] bool IsEmpty() const noexcept
		{
			return places_.empty();
		}

		[[nodiscard]] int GetSize() const noexcept
		{
			return int(places_.size());
		}

		[[nodiscard]] std::list<Place> const& GetPlaces() const noexcept
		{
			return places_;
		}

		[[nodiscard]] KdTree<Place const*> const& GetIndex() const noexcept
		{
			return index_;
		}

		// Sorted, without duplicates
		[[nodiscard]] std::vector<std::string> GetCategories() const;

		[[nodiscard]] std::vector<Place const*> FilterByCategory(std::string_view category) const;

		// An empty category means any
		[[nodiscard]] std::optional<PlaceDistance> FindNearest(Vector2 const& location, std::string_view category = {}) const;

		// Places within radiusKm of center, closest first. An empty category means any
		[[nodiscard]] std::vector<PlaceDistance> SearchInArea(Vector2 const& center, double radiusKm, std::string_view category = {}) const;

		void LoadSampleData();
	};
}
