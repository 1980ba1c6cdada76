// Copyright 2024-2025 Ivan Kolev
//
// Distributed under the Boost Software License, Version 1.0.
// (See accompanying file LICENSE.txt or copy at http://www.boost.org/LICENSE_1_0.txt)

#include "GeoIndex/Config.hpp"
#include "GeoIndex/Places.hpp"
#include "GeoIndex/Profiling.hpp"

#ifdef ENABLE_SHAPELIB
#include "GeoIndex/ShapeFile.hpp"
#endif

#include <cmath>
#include <exception>
#include <functional>
#include <iomanip>
#include <iostream>
#include <limits>
#include <map>
#include <stdexcept>
#include <string>

using namespace GeoIndex;
using namespace std;


namespace
{
	constexpr auto UsageExitCode = 1;

	constexpr auto ErrorExitCode = 2;

	constexpr auto DefaultRadiusKm = 2.0;

	constexpr auto Usage =
		"Usage: geoindex command=<nearest|area|range|types|list|erase> [key=value ...]\n"
		"  nearest  x= y= [category=]          nearest place and its distance in km\n"
		"  area     x= y= [radius=] [category=] places within radius km, closest first\n"
		"  range    minX= minY= maxX= maxY=      places in the longitude / latitude rectangle\n"
		"  types                                 place categories\n"
		"  list                                  all places\n"
		"  erase    x= y=                        remove the place at exactly this location\n"
		"Options:\n"
		"  config=file.cfg  more key=value settings, command line values take precedence\n"
		"  load=points.shp  read places from a shapefile, category= is used where the file has none\n"
		"  sample=1         add the sample places, the default when nothing is loaded\n"
		"  save=out.shp     write the places to a shapefile after the command\n"
		"  verbose=1        print timings\n";

	// Thrown for missing or malformed parameters, reported with the usage text
	class UsageError : public runtime_error
	{
	public:

		using runtime_error::runtime_error;
	};

	double GetRequiredValue(Config& config, string const& key)
	{
		auto const value = config.GetValue(key, numeric_limits<double>::quiet_NaN());
		if (isnan(value))
		{
			throw UsageError{ "missing or invalid value for '" + key + "'" };
		}

		return value;
	}

	Vector2 GetRequiredPoint(Config& config, string const& xKey = "x", string const& yKey = "y")
	{
		return { GetRequiredValue(config, xKey), GetRequiredValue(config, yKey) };
	}

	void PrintPlace(Place const& place, int index = 0)
	{
		cout << (index > 0 ? to_string(index) + ". " : string{}) << place.name << " (" << place.category << ")\n";
		if (!place.address.empty())
		{
			cout << "   Address: " << place.address << '\n';
		}

		cout << "   Location: " << fixed << setprecision(6) << place.location[0] << ", " << place.location[1] << '\n';
	}

	void PrintDistance(double distanceKm)
	{
		cout << "   Distance: " << fixed << setprecision(2) << distanceKm << " km\n";
	}

	bool LoadPlaces(Config& config, PlaceCatalog& catalog)
	{
		auto const loadPath = config.GetValue("load");
		if (!loadPath.empty())
		{
#ifdef ENABLE_SHAPELIB
			ShapeFile const shapeFile{ loadPath };
			if (!shapeFile.IsOpen())
			{
				cerr << "Cannot open " << loadPath << '\n';
				return false;
			}

			if (!shapeFile.SupportsPoints())
			{
				cerr << loadPath << " does not contain points\n";
				return false;
			}

			for (auto& place : shapeFile.ReadPlaces(config.GetValue("category", "place")))
			{
				catalog.Add(std::move(place));
			}

			cout << "Loaded " << catalog.GetSize() << " places from " << shapeFile.GetFilePath().string() << '\n';
#else
			cerr << "Cannot load " << loadPath << ", shapefile support not enabled\n";
			return false;
#endif
		}

		if (loadPath.empty() || config.GetValue("sample", 0) != 0)
		{
			catalog.LoadSampleData();
		}

		return true;
	}

	bool SavePlaces(Config& config, PlaceCatalog const& catalog)
	{
		auto const savePath = config.GetValue("save");
		if (savePath.empty())
		{
			return true;
		}

#ifdef ENABLE_SHAPELIB
		if (!ShapeFile::Write(savePath, catalog))
		{
			cerr << "Cannot write " << savePath << '\n';
			return false;
		}

		cout << "Saved " << catalog.GetSize() << " places to " << savePath << '\n';
		return true;
#else
		cerr << "Cannot save " << savePath << ", shapefile support not enabled\n";
		return false;
#endif
	}

	void RunNearest(Config& config, PlaceCatalog& catalog)
	{
		auto const target = GetRequiredPoint(config);
		auto const category = config.GetValue("category");
		auto const nearest = catalog.FindNearest(target, category);
		if (!nearest.has_value())
		{
			cout << "No places found\n";
			return;
		}

		PrintPlace(*nearest->place);
		PrintDistance(nearest->distanceKm);
	}

	void RunArea(Config& config, PlaceCatalog& catalog)
	{
		auto const center = GetRequiredPoint(config);
		auto const radius = config.GetValue("radius", DefaultRadiusKm);
		if (!(radius >= 0))
		{
			throw UsageError{ "radius must not be negative" };
		}

		auto const found = catalog.SearchInArea(center, radius, config.GetValue("category"));
		cout << "Found " << found.size() << " places\n";
		auto index = 0;
		for (auto const& [place, distance] : found)
		{
			PrintPlace(*place, ++index);
			PrintDistance(distance);
		}
	}

	void RunRange(Config& config, PlaceCatalog& catalog)
	{
		auto const min = GetRequiredPoint(config, "minX", "minY");
		auto const max = GetRequiredPoint(config, "maxX", "maxY");
		auto const found = catalog.GetIndex().QueryRange(min, max);
		cout << "Found " << found.size() << " places\n";
		auto index = 0;
		for (auto const& entry : found)
		{
			PrintPlace(*entry.payload, ++index);
		}
	}

	void RunTypes(Config&, PlaceCatalog& catalog)
	{
		auto index = 0;
		for (auto const& category : catalog.GetCategories())
		{
			cout << ++index << ". " << category << '\n';
		}
	}

	void RunList(Config&, PlaceCatalog& catalog)
	{
		auto index = 0;
		for (auto const& place : catalog.GetPlaces())
		{
			PrintPlace(place, ++index);
		}
	}

	void RunErase(Config& config, PlaceCatalog& catalog)
	{
		auto const location = GetRequiredPoint(config);
		cout << (catalog.Remove(location) ? "Removed" : "Not found") << ", " << catalog.GetSize() << " places left\n";
	}

	map<string, function<void(Config&, PlaceCatalog&)>> const Commands{
		{ "nearest", RunNearest },
		{ "area", RunArea },
		{ "range", RunRange },
		{ "types", RunTypes },
		{ "list", RunList },
		{ "erase", RunErase },
	};
}


int main(int argc, char* argv[])
{
	Config config;
	config.AddCommandLine(argc, argv);

	auto const configPath = config.GetValue("config");
	if (!configPath.empty() && !config.ReadFile(configPath, false))
	{
		cerr << "Cannot read " << configPath << '\n';
		return UsageExitCode;
	}

	auto const command = Commands.find(config.GetValue("command"));
	if (command == Commands.end())
	{
		cerr << Usage;
		return UsageExitCode;
	}

	try
	{
		ostream* const timingStream = config.GetValue("verbose", 0) != 0 ? &cout : nullptr;

		PlaceCatalog catalog;
		{
			ScopeTimer const timer{ timingStream, "Load" };
			if (!LoadPlaces(config, catalog))
			{
				return ErrorExitCode;
			}
		}

		{
			ScopeTimer const timer{ timingStream, command->first };
			command->second(config, catalog);
		}

		return SavePlaces(config, catalog) ? 0 : ErrorExitCode;
	}
	catch (UsageError const& e)
	{
		cerr << e.what() << '\n' << Usage;
		return UsageExitCode;
	}
	catch (exception const& e)
	{
		cerr << "Error: " << e.what() << '\n';
		return ErrorExitCode;
	}
}
