// Copyright 2024 Ivan Kolev
//
// Distributed under the Boost Software License, Version 1.0.
// (See accompanying file LICENSE.txt or copy at http://www.boost.org/LICENSE_1_0.txt)

#include "GeoIndex/Config.hpp"

#include "GeoIndex/StlExtensions.hpp"

#include <fstream>

using namespace std;

namespace
{
	pair<string_view, string_view> SplitKvp(string_view kvp)
	{
		auto const pos = kvp.find('=');
		if (pos == string_view::npos)
		{
			return {};
		}

		return { GeoIndex::Trim(kvp.substr(0, pos)), GeoIndex::Trim(kvp.substr(pos + 1)) };
	}
}

namespace GeoIndex
{
	constexpr string_view CommentChars = ";#";

	void Config::AddKvp(std::string_view kvp, bool overwrite)
	{
		auto const [key, value] = SplitKvp(kvp);
		auto stringKey = string{ key };
		if (!value.empty() && !key.empty() && !Contains(CommentChars, key[0]) && (overwrite || values_.count(stringKey) == 0))
		{
			values_[stringKey] = value;
		}
	}

	void Config::AddCommandLine(int argc, char const* const* argv, bool overwrite)
	{
		// argv[0] is the program
		for (auto i = 1; i < argc; ++i)
		{
			AddKvp(argv[i], overwrite);
		}
	}

	bool Config::ReadFile(filesystem::path const& filepath, bool overwrite)
	{
		ifstream file(filepath);
		if (!file)
		{
			return false;
		}

		string line;
		while (getline(file, line))
		{
			AddKvp(line, overwrite);
		}

		return true;
	}

	bool Config::HasValue(std::string const& key)
	{
		return !GetValue(key).empty();
	}

	std::string Config::GetValue(std::string const& key, std::string const& fallback)
	{
		auto const location = values_.find(key);
		if (location != values_.end())
		{
			return location->second;
		}

		auto value = GetEnvironmentVariable(key.c_str());
		if (!value.empty())
		{
			values_.insert(pair{ key, value });
			return value;
		}

		return fallback;
	}

	int Config::GetValue(std::string const& key, int fallback)
	{
		auto const text = GetValue(key);
		auto value = fallback;
		return !text.empty() && ParseNumber(text, value) ? value : fallback;
	}

	double Config::GetValue(std::string const& key, double fallback)
	{
		auto const text = GetValue(key);
		auto value = fallback;
		return !text.empty() && ParseNumber(text, value) ? value : fallback;
	}
}
