// Copyright 2024-2025 Ivan Kolev
//
// Distributed under the Boost Software License, Version 1.0.
// (See accompanying file LICENSE.txt or copy at http://www.boost.org/LICENSE_1_0.txt)

#pragma once

#include <chrono>
#include <cstdint>
#include <ostream>
#include <string>
#include <utility>

namespace GeoIndex
{
	template <typename T>
	T DoNotOptimize(T value)
	{
		static T volatile zero = 0;
		return value + zero;
	}

	class Stopwatch
	{
		using TimePoint = std::chrono::time_point<std::chrono::high_resolution_clock>;

		TimePoint start_;
		bool isRunning_ = false;

	public:

		explicit Stopwatch(bool start = true) noexcept
		{
			if (start)
			{
				Start();
			}
		}

		void Start() noexcept
		{
			start_ = std::chrono::high_resolution_clock::now();
			isRunning_ = true;
		}

		[[nodiscard]] int64_t ElapsedMicroseconds() const noexcept
		{
			using namespace std::chrono;
			return isRunning_ ? int64_t(duration_cast<microseconds>(high_resolution_clock::now() - start_).count()) : 0;
		}
	};


	static constexpr auto Kilo = 1'000;

	inline std::string PrintMicroSeconds(double us)
	{
		if (us < Kilo)
		{
			return std::to_string(us) + "us";
		}

		if (us < Kilo * Kilo)
		{
			return std::to_string(us / Kilo) + "ms";
		}

		return std::to_string(us / (Kilo * Kilo)) + "s";
	}

	inline std::string PrintMicroSeconds(int64_t us)
	{
		return PrintMicroSeconds(double(us));
	}


	// Prints the time spent in its scope to stream, does nothing if stream is null
	class ScopeTimer
	{
		std::ostream* stream_;
		std::string label_;
		Stopwatch stopwatch_;

	public:

		ScopeTimer(std::ostream* stream, std::string label)
			: stream_{ stream }
			, label_{ std::move(label) }
		{
		}

		ScopeTimer(ScopeTimer const&) = delete;
		ScopeTimer& operator=(ScopeTimer const&) = delete;

		~ScopeTimer()
		{
			if (stream_ != nullptr)
			{
				*stream_ << label_ << ": " << PrintMicroSeconds(stopwatch_.ElapsedMicroseconds()) << '\n';
			}
		}
	};
}
