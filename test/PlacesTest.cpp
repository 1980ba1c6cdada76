// Copyright 2024-2025 Ivan Kolev
//
// Distributed under the Boost Software License, Version 1.0.
// (See accompanying file LICENSE.txt or copy at http://www.boost.org/LICENSE_1_0.txt)

#include "GeoIndex/Places.hpp"

#include <catch2/catch_test_macros.hpp>
#include <catch2/matchers/catch_matchers_floating_point.hpp>

#include <sstream>
#include <string>
#include <vector>

using namespace GeoIndex;
using namespace std;
using Catch::Matchers::WithinAbs;

namespace
{
	vector<string> GetNames(vector<PlaceDistance> const& found)
	{
		return Transform(found, [](PlaceDistance const& p) { return p.place->name; });
	}
}

TEST_CASE("PlaceCatalog sample data")
{
	PlaceCatalog catalog;
	REQUIRE(catalog.IsEmpty());

	catalog.LoadSampleData();
	REQUIRE(catalog.GetSize() == 8);
	REQUIRE(catalog.GetIndex().GetSize() == 8);
	REQUIRE(catalog.GetIndex().CheckInvariant());

	REQUIRE(catalog.GetCategories() == vector<string>{ "beauty salon", "cafe", "hospital", "pharmacy", "restaurant", "shop" });

	auto const cafes = catalog.FilterByCategory("cafe");
	REQUIRE(cafes.size() == 2);
	REQUIRE(cafes[0]->name == "Cafe Uyutnoe");
	REQUIRE(cafes[1]->name == "Cafe Romantika");
	REQUIRE(catalog.FilterByCategory("zoo").empty());

	SECTION("Nearest")
	{
		auto const nearest = catalog.FindNearest(PlaceCatalog::DefaultCenter);
		REQUIRE(nearest.has_value());
		REQUIRE(nearest->place->name == "Pharmacy");
		REQUIRE_THAT(nearest->distanceKm, WithinAbs(0.4712, 1e-3));

		auto const nearestCafe = catalog.FindNearest(PlaceCatalog::DefaultCenter, "cafe");
		REQUIRE(nearestCafe.has_value());
		REQUIRE(nearestCafe->place->name == "Cafe Uyutnoe");
		REQUIRE_THAT(nearestCafe->distanceKm, WithinAbs(1.2949, 1e-3));

		REQUIRE_FALSE(catalog.FindNearest(PlaceCatalog::DefaultCenter, "zoo").has_value());

		auto const exact = catalog.FindNearest({ 92.90, 56.03 });
		REQUIRE(exact->place->name == "Hospital No. 1");
		REQUIRE(exact->distanceKm == 0.0);
	}

	SECTION("Area")
	{
		REQUIRE(GetNames(catalog.SearchInArea(PlaceCatalog::DefaultCenter, 1.0)) == vector<string>{ "Pharmacy" });

		auto const found = catalog.SearchInArea(PlaceCatalog::DefaultCenter, 2.0);
		REQUIRE(GetNames(found) == vector<string>{ "Pharmacy", "Cafe Uyutnoe", "Grocery store", "Restaurant Lyubimy", "Supermarket" });
		for (auto const& [place, distance] : found)
		{
			REQUIRE(distance <= 2.0);
		}

		REQUIRE(GetNames(catalog.SearchInArea(PlaceCatalog::DefaultCenter, 2.0, "cafe")) == vector<string>{ "Cafe Uyutnoe" });
		REQUIRE(catalog.SearchInArea(PlaceCatalog::DefaultCenter, 2.0, "hospital").empty());
		REQUIRE(catalog.SearchInArea(PlaceCatalog::DefaultCenter, 5.0).size() == 8);

		REQUIRE(GetNames(catalog.SearchInArea({ 92.88, 56.01 }, 0.0)) == vector<string>{ "Pharmacy" });
		REQUIRE(catalog.SearchInArea(PlaceCatalog::DefaultCenter, -1.0).empty());
	}

	SECTION("Remove")
	{
		REQUIRE(catalog.Remove({ 92.88, 56.01 }));
		REQUIRE(catalog.GetSize() == 7);
		REQUIRE(catalog.GetIndex().GetSize() == 7);
		REQUIRE(catalog.GetIndex().CheckInvariant());
		REQUIRE(catalog.FindNearest(PlaceCatalog::DefaultCenter)->place->name == "Cafe Uyutnoe");
		REQUIRE(catalog.GetCategories() == vector<string>{ "beauty salon", "cafe", "hospital", "restaurant", "shop" });

		REQUIRE_FALSE(catalog.Remove({ 92.88, 56.01 }));
		REQUIRE(catalog.GetSize() == 7);
	}

	SECTION("Clear")
	{
		catalog.Clear();
		REQUIRE(catalog.IsEmpty());
		REQUIRE(catalog.GetIndex().IsEmpty());
		REQUIRE_FALSE(catalog.FindNearest(PlaceCatalog::DefaultCenter).has_value());
		REQUIRE(catalog.GetCategories().empty());
	}
}

TEST_CASE("PlaceCatalog places at the same location")
{
	PlaceCatalog catalog;
	auto const& first = catalog.Add({ "First", "shop", { 10, 20 }, {} });
	catalog.Add({ "Second", "cafe", { 10, 20 }, {} });
	catalog.Add({ "Elsewhere", "cafe", { 11, 20 }, {} });
	REQUIRE(&catalog.GetPlaces().front() == &first);

	REQUIRE(catalog.SearchInArea({ 10, 20 }, 0.0).size() == 2);
	REQUIRE(catalog.FindNearest({ 10, 20 }, "cafe")->place->name == "Second");

	REQUIRE(catalog.Remove({ 10, 20 }));
	REQUIRE(catalog.GetSize() == 2);

	// The remaining entry at that location is still indexed and still points at a live place
	auto const remaining = catalog.SearchInArea({ 10, 20 }, 0.0);
	REQUIRE(remaining.size() == 1);
	REQUIRE(Contains(vector<string>{ "First", "Second" }, remaining.front().place->name));
	REQUIRE(catalog.GetPlaces().size() == 2);

	REQUIRE(catalog.Remove({ 10, 20 }));
	REQUIRE(catalog.SearchInArea({ 10, 20 }, 0.0).empty());
	REQUIRE(catalog.GetPlaces().front().name == "Elsewhere");
}

TEST_CASE("Place printing")
{
	ostringstream stream;
	stream << Place{ "Pharmacy", "pharmacy", { 92.88, 56.01 }, "12 Gagarina St" };
	REQUIRE(stream.str() == "Pharmacy (pharmacy) at 92.88 56.01, 12 Gagarina St");

	stream.str({});
	stream << Place{ "Somewhere", "place", { 1, 2 }, {} };
	REQUIRE(stream.str() == "Somewhere (place) at 1 2");
}
