// Copyright 2024-2025 Ivan Kolev
//
// Distributed under the Boost Software License, Version 1.0.
// (See accompanying file LICENSE.txt or copy at http://www.boost.org/LICENSE_1_0.txt)

#include "GeoIndex/Places.hpp"

#include "GeoIndex/GeoDistance.hpp"
#include "GeoIndex/StlExtensions.hpp"

#include <algorithm>
#include <cmath>

using namespace std;

namespace
{
	// Longitude degrees shrink towards the poles, this bounds the widening of the search box
	constexpr auto MinimumLatitudeCosine = 0.01;
}

namespace GeoIndex
{
	std::ostream& operator<<(std::ostream& stream, Place const& place)
	{
		stream << place.name << " (" << place.category << ") at " << place.location;
		if (!place.address.empty())
		{
			stream << ", " << place.address;
		}

		return stream;
	}

	Place const& PlaceCatalog::Add(Place place)
	{
		auto const& added = places_.emplace_back(std::move(place));
		index_.Insert(added.location, &added);
		return added;
	}

	bool PlaceCatalog::Remove(Vector2 const& location)
	{
		auto const removed = index_.Extract(location);
		if (!removed.has_value())
		{
			return false;
		}

		auto const position = find_if(places_.begin(), places_.end(), [place = *removed](Place const& p) { return &p == place; });
		ASSERT(position != places_.end());
		places_.erase(position);
		return true;
	}

	void PlaceCatalog::Clear() noexcept
	{
		index_.Clear();
		places_.clear();
	}

	std::vector<std::string> PlaceCatalog::GetCategories() const
	{
		auto result = Transform(places_, [](Place const& place) { return place.category; });
		sort(result.begin(), result.end());
		result.erase(unique(result.begin(), result.end()), result.end());
		return result;
	}

	std::vector<Place const*> PlaceCatalog::FilterByCategory(std::string_view category) const
	{
		std::vector<Place const*> result;
		for (auto const& place : places_)
		{
			if (place.category == category)
			{
				result.push_back(&place);
			}
		}

		return result;
	}

	std::optional<PlaceDistance> PlaceCatalog::FindNearest(Vector2 const& location, std::string_view category) const
	{
		optional<KdTree<Place const*>::NearestResult> nearest;
		if (category.empty())
		{
			nearest = index_.QueryNearest(location);
		}
		else
		{
			// A separate index of just this category, the nearest place of any category may be of the wrong one
			KdTree<Place const*> categoryIndex;
			for (auto const* place : FilterByCategory(category))
			{
				categoryIndex.Insert(place->location, place);
			}

			nearest = categoryIndex.QueryNearest(location);
		}

		if (!nearest.has_value())
		{
			return nullopt;
		}

		return PlaceDistance{ nearest->payload, GetHaversineDistanceKm(location, nearest->point) };
	}

	std::vector<PlaceDistance> PlaceCatalog::SearchInArea(Vector2 const& center, double radiusKm, std::string_view category) const
	{
		std::vector<PlaceDistance> result;
		if (!(radiusKm >= 0))
		{
			return result;
		}

		auto const latitudeRadius = KilometersToDegrees(radiusKm);
		auto const longitudeRadius = latitudeRadius / std::max(std::cos(DegreesToRadians(center[1])), MinimumLatitudeCosine);
		Vector2 const min{ center[0] - longitudeRadius, center[1] - latitudeRadius };
		Vector2 const max{ center[0] + longitudeRadius, center[1] + latitudeRadius };

		index_.QueryRange(min, max, [&](Vector2 const& point, Place const* place)
			{
				if (!category.empty() && place->category != category)
				{
					return;
				}

				auto const distance = GetHaversineDistanceKm(center, point);
				if (distance <= radiusKm)
				{
					result.push_back(PlaceDistance{ place, distance });
				}
			});

		stable_sort(result.begin(), result.end(), [](PlaceDistance const& a, PlaceDistance const& b) { return a.distanceKm < b.distanceKm; });
		return result;
	}

	void PlaceCatalog::LoadSampleData()
	{
		Add({ "Grocery store", "shop", { 92.85, 56.01 }, "10 Lenina St" });
		Add({ "Cafe Uyutnoe", "cafe", { 92.88, 56.02 }, "15 Sovetskaya St" });
		Add({ "Hospital No. 1", "hospital", { 92.90, 56.03 }, "25 Mira Ave" });
		Add({ "Cafe Romantika", "cafe", { 92.87, 56.04 }, "5 Pushkina St" });
		Add({ "Supermarket", "shop", { 92.89, 56.00 }, "30 Kirova St" });
		Add({ "Pharmacy", "pharmacy", { 92.88, 56.01 }, "12 Gagarina St" });
		Add({ "Restaurant Lyubimy", "restaurant", { 92.86, 56.02 }, "8 Lermontova St" });
		Add({ "Hair salon", "beauty salon", { 92.87, 56.03 }, "20 Mayakovskogo St" });
	}
}
