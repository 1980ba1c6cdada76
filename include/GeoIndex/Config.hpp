// Copyright 2024 Ivan Kolev
//
// Distributed under the Boost Software License, Version 1.0.
// (See accompanying file LICENSE.txt or copy at http://www.boost.org/LICENSE_1_0.txt)

#pragma once

#include <filesystem>
#include <map>
#include <string>
#include <string_view>

namespace GeoIndex
{
	// Key=value settings from the command line, files and environment variables.
	// A key missing from the explicitly added values is looked up as an environment variable of the same name
	class Config
	{
		std::map<std::string, std::string> values_;

	public:

		void AddKvp(std::string_view kvp, bool overwrite = true);

		void AddCommandLine(int argc, char const* const* argv, bool overwrite = true);

		// Returns false if the file can't be opened
		bool ReadFile(std::filesystem::path const&, bool overwrite = true);

		[[nodiscard]] bool HasValue(std::string const& key);

		std::string GetValue(std::string const& key, std::string const& fallback = {});

		// The fallback is also returned when the value is not a valid number
		int GetValue(std::string const& key, int fallback);

		double GetValue(std::string const& key, double fallback);
	};
}
