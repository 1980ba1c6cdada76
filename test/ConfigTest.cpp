// Copyright 2024-2025 Ivan Kolev
//
// Distributed under the Boost Software License, Version 1.0.
// (See accompanying file LICENSE.txt or copy at http://www.boost.org/LICENSE_1_0.txt)

#include "GeoIndex/Config.hpp"

#include <catch2/catch_test_macros.hpp>

#include <filesystem>
#include <fstream>
#include <string>

using namespace GeoIndex;
using namespace std;

TEST_CASE("Config values")
{
	Config config;
	config.AddKvp("command=nearest");
	config.AddKvp("  category =  beauty salon ");
	config.AddKvp("x=92.87");
	config.AddKvp("limit=25");
	config.AddKvp("# commented=out");
	config.AddKvp("; also=out");
	config.AddKvp("no value here");
	config.AddKvp("empty=");

	REQUIRE(config.GetValue("command") == "nearest");
	REQUIRE(config.GetValue("category") == "beauty salon");
	REQUIRE(config.HasValue("x"));

	REQUIRE_FALSE(config.HasValue("# commented"));
	REQUIRE_FALSE(config.HasValue("; also"));
	REQUIRE_FALSE(config.HasValue("no value here"));
	REQUIRE_FALSE(config.HasValue("empty"));
	REQUIRE(config.GetValue("GeoIndexMissingKey", "fallback") == "fallback");

	SECTION("Typed")
	{
		REQUIRE(config.GetValue("x", 0.0) == 92.87);
		REQUIRE(config.GetValue("limit", -1) == 25);
		REQUIRE(config.GetValue("limit", 0.0) == 25.0);

		// Malformed numbers give the fallback
		REQUIRE(config.GetValue("x", -1) == -1);
		REQUIRE(config.GetValue("command", 1.5) == 1.5);
		REQUIRE(config.GetValue("GeoIndexMissingKey", 7) == 7);
	}

	SECTION("Overwrite")
	{
		config.AddKvp("command=area", false);
		REQUIRE(config.GetValue("command") == "nearest");

		config.AddKvp("command=area");
		REQUIRE(config.GetValue("command") == "area");
	}

	SECTION("Command line")
	{
		char const* const argv[] = { "geoindex", "command=types", "radius=2.5" };
		config.AddCommandLine(3, argv);
		REQUIRE(config.GetValue("command") == "types");
		REQUIRE(config.GetValue("radius", 0.0) == 2.5);
		REQUIRE_FALSE(config.HasValue("geoindex"));
	}
}

TEST_CASE("Config environment")
{
	Config config;
	REQUIRE(config.HasValue("PATH"));
	REQUIRE_FALSE(config.GetValue("PATH").empty());

	config.AddKvp("PATH=overridden");
	REQUIRE(config.GetValue("PATH") == "overridden");
}

TEST_CASE("Config file")
{
	auto const path = filesystem::temp_directory_path() / "GeoIndexConfigTest.cfg";
	{
		ofstream file{ path };
		file << "# Search settings\n";
		file << "command = area\n";
		file << "radius = 1.5\n";
		file << "\n";
		file << "; category = cafe\n";
	}

	Config config;
	config.AddKvp("command=nearest");

	SECTION("Overwrite")
	{
		REQUIRE(config.ReadFile(path));
		REQUIRE(config.GetValue("command") == "area");
		REQUIRE(config.GetValue("radius", 0.0) == 1.5);
		REQUIRE_FALSE(config.HasValue("category"));
	}

	SECTION("Keep existing values")
	{
		REQUIRE(config.ReadFile(path, false));
		REQUIRE(config.GetValue("command") == "nearest");
		REQUIRE(config.GetValue("radius", 0.0) == 1.5);
	}

	filesystem::remove(path);

	REQUIRE_FALSE(config.ReadFile(path));
}
