// Copyright 2024-2025 Ivan Kolev
//
// Distributed under the Boost Software License, Version 1.0.
// (See accompanying file LICENSE.txt or copy at http://www.boost.org/LICENSE_1_0.txt)

#include "GeoIndex/ShapeFile.hpp"

#include <catch2/catch_test_macros.hpp>

#include <filesystem>
#include <string>
#include <vector>

using namespace GeoIndex;
using namespace std;

namespace
{
	filesystem::path GetOutputPath()
	{
		filesystem::path const result{ GEOINDEX_TEST_OUTPUT_DIR };
		filesystem::create_directories(result);
		return result;
	}
}

TEST_CASE("ShapeFile missing")
{
	ShapeFile const shapeFile{ GetOutputPath() / "does_not_exist.shp" };
	REQUIRE_FALSE(shapeFile.IsOpen());
	REQUIRE(shapeFile.GetObjectCount() == 0);
	REQUIRE_FALSE(shapeFile.SupportsPoints());
	REQUIRE(shapeFile.GetBounds().IsEmpty());
	REQUIRE(shapeFile.GetPoints().empty());
	REQUIRE(shapeFile.ReadPlaces("place").empty());
}

TEST_CASE("ShapeFile places")
{
	auto const path = GetOutputPath() / "places.shp";

	PlaceCatalog catalog;
	catalog.LoadSampleData();
	catalog.Add({ "Nameless", {}, { 92.95, 56.05 }, {} });
	REQUIRE(ShapeFile::Write(path, catalog));

	ShapeFile const shapeFile{ path };
	REQUIRE(shapeFile.IsOpen());
	REQUIRE(shapeFile.HasAttributes());
	REQUIRE(shapeFile.GetShapeType() == ShapeType::Point);
	REQUIRE(shapeFile.SupportsPoints());
	REQUIRE(shapeFile.GetObjectCount() == 9);
	REQUIRE(shapeFile.GetBounds() == Box2({ 92.85, 56.00 }, { 92.95, 56.05 }));

	auto const places = shapeFile.ReadPlaces("unknown");
	REQUIRE(places.size() == 9);

	auto expected = catalog.GetPlaces().begin();
	for (auto const& place : places)
	{
		REQUIRE(place.name == expected->name);
		REQUIRE(place.location == expected->location);
		REQUIRE(place.address == expected->address);
		REQUIRE(place.category == (expected->category.empty() ? "unknown" : expected->category));
		++expected;
	}

	REQUIRE(shapeFile.GetPoints(3) == vector<Vector2>{ { 92.85, 56.01 }, { 92.88, 56.02 }, { 92.90, 56.03 } });
	REQUIRE(shapeFile.ReadPlaces({}, 2).size() == 2);

	SECTION("Reloaded places are indexed")
	{
		PlaceCatalog reloaded;
		for (auto const& place : places)
		{
			reloaded.Add(place);
		}

		REQUIRE(reloaded.FindNearest(PlaceCatalog::DefaultCenter)->place->name == "Pharmacy");
		REQUIRE(reloaded.GetIndex().CheckInvariant());
	}
}

TEST_CASE("ShapeFile points only")
{
	auto const path = GetOutputPath() / "points.shp";
	vector<Vector2> const points{ { 0, 0 }, { 1, 2 }, { -3, 4.5 } };
	REQUIRE(ShapeFile::Write(path, points));

	ShapeFile const shapeFile{ path };
	REQUIRE(shapeFile.IsOpen());
	REQUIRE_FALSE(shapeFile.HasAttributes());
	REQUIRE(shapeFile.GetPoints() == points);

	auto const places = shapeFile.ReadPlaces("point");
	REQUIRE(places.size() == 3);
	REQUIRE(places[2].location == Vector2{ -3, 4.5 });
	REQUIRE(places[2].category == "point");
	REQUIRE(places[2].name.empty());
}
