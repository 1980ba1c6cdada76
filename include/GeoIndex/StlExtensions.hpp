// Copyright 2024-2025 Ivan Kolev
//
// Distributed under the Boost Software License, Version 1.0.
// (See accompanying file LICENSE.txt or copy at http://www.boost.org/LICENSE_1_0.txt)

#pragma once

#include <algorithm>
#include <charconv>
#include <cstddef>
#include <cstdint>
#include <cstdlib>
#include <iterator>
#include <string>
#include <string_view>
#include <vector>

namespace GeoIndex
{
	// Traits

	struct Identity
	{
		template <class T>
		constexpr T&& operator()(T&& t) const noexcept
		{
			return std::forward<T>(t);
		}
	};


	// Algorithm wrappers

	template <typename T>
	constexpr T Square(T x)
	{
		return x * x;
	}

	template <class TContainer, typename T>
	[[nodiscard]] constexpr auto Find(TContainer& container, T const& value)
	{
		using std::begin;
		using std::end;
		return std::find(begin(container), end(container), value);
	}

	template <class TContainer, typename T>
	[[nodiscard]] constexpr bool Contains(TContainer const& container, T const& value)
	{
		using std::end;
		return Find(container, value) != end(container);
	}

	template <class TContainerA, class TContainerB, class TPredicate>
	[[nodiscard]] constexpr bool AllOf(TContainerA& containerA, TContainerB& containerB, TPredicate predicate)
	{
		using std::begin;
		using std::end;
		for (
			auto iteratorA = begin(containerA), iteratorB = begin(containerB);
			iteratorA != end(containerA) && iteratorB != end(containerB);
			++iteratorA, ++iteratorB)
		{
			if (!predicate(*iteratorA, *iteratorB))
			{
				return false;
			}
		}

		return true;
	}

	// C++20 std::ssize
	template <class TContainer>
	[[nodiscard]] std::ptrdiff_t Size(TContainer const& container) noexcept
	{
		return static_cast<std::ptrdiff_t>(std::size(container));
	}

	template <typename TContainer, typename TFunctor>
	[[nodiscard]] auto Transform(TContainer const& container, TFunctor functor) -> std::vector<std::decay_t<decltype(functor(*std::begin(container)))>>
	{
		std::vector<std::decay_t<decltype(functor(*std::begin(container)))>> result;
		result.reserve(container.size());
		std::transform(container.begin(), container.end(), std::back_inserter(result), std::move(functor));
		return result;
	}

	template <typename TContainer, class TPredicate>
	[[nodiscard]] TContainer CopyIf(TContainer const& container, TPredicate predicate)
	{
		TContainer result;
		std::copy_if(container.begin(), container.end(), std::back_inserter(result), std::move(predicate));
		return result;
	}


	// Strings

	[[nodiscard]] inline std::string_view Trim(std::string_view text) noexcept
	{
		constexpr std::string_view Whitespace = " \t\r\n";
		auto const first = text.find_first_not_of(Whitespace);
		if (first == std::string_view::npos)
		{
			return {};
		}

		return text.substr(first, text.find_last_not_of(Whitespace) - first + 1);
	}

	template <typename T>
	bool ParseNumber(std::string_view text, T& value) noexcept
	{
		auto const end = text.data() + text.size();
		auto const [position, error] = std::from_chars(text.data(), end, value);
		return error == std::errc{} && position == end;
	}

	// std::from_chars for floating point is not available in every C++17 standard library
	inline bool ParseNumber(std::string_view text, double& value)
	{
		if (text.empty())
		{
			return false;
		}

		auto const buffer = std::string{ text };
		char* end = nullptr;
		auto const parsed = std::strtod(buffer.c_str(), &end);
		if (end != buffer.c_str() + buffer.size())
		{
			return false;
		}

		value = parsed;
		return true;
	}


	// System

	inline std::string GetEnvironmentVariable(char const* name, std::string const& fallback = {})
	{
		char const* value = std::getenv(name);
		return value != nullptr ? std::string(value) : fallback;
	}
}
