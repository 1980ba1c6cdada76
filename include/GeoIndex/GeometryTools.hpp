// Copyright 2024-2025 Ivan Kolev
//
// Distributed under the Boost Software License, Version 1.0.
// (See accompanying file LICENSE.txt or copy at http://www.boost.org/LICENSE_1_0.txt)

#pragma once

#include "Asserts.hpp"
#include "StlExtensions.hpp"

#include <algorithm>
#include <array>
#include <cmath>
#include <functional>
#include <limits>
#include <ostream>
#include <utility>

namespace GeoIndex
{
	// Vectors are plain arrays of coordinates, axis 0 is x (longitude), axis 1 is y (latitude)

	template <typename TScalar, size_t NDimensions>
	using Vector = std::array<TScalar, NDimensions>;

	using Vector2 = Vector<double, 2>;

	namespace Detail
	{
		template <typename TScalar, size_t NDimensions, class TBinaryOp, std::size_t... Indices>
		constexpr Vector<TScalar, NDimensions> ComponentApplyImpl(Vector<TScalar, NDimensions> const& a, Vector<TScalar, NDimensions> const& b, TBinaryOp binaryOp, std::index_sequence<Indices...>)
		{
			return { binaryOp(a[Indices], b[Indices]) ... };
		}
	}

	template <typename TScalar, size_t NDimensions, class TBinaryOp>
	constexpr Vector<TScalar, NDimensions> ComponentApply(Vector<TScalar, NDimensions> const& a, Vector<TScalar, NDimensions> const& b, TBinaryOp binaryOp)
	{
		return Detail::ComponentApplyImpl(a, b, binaryOp, std::make_index_sequence<NDimensions>());
	}

	template <typename TScalar, size_t NDimensions>
	constexpr Vector<TScalar, NDimensions> operator+(Vector<TScalar, NDimensions> const& a, Vector<TScalar, NDimensions> const& b)
	{
		return ComponentApply(a, b, [](auto x, auto y) { return x + y; });
	}

	template <typename TScalar, size_t NDimensions>
	constexpr Vector<TScalar, NDimensions> operator-(Vector<TScalar, NDimensions> const& a, Vector<TScalar, NDimensions> const& b)
	{
		return ComponentApply(a, b, [](auto x, auto y) { return x - y; });
	}

	template <typename TScalar, size_t NDimensions>
	constexpr Vector<TScalar, NDimensions> Flat(TScalar value)
	{
		Vector<TScalar, NDimensions> result{};
		for (size_t i = 0; i < NDimensions; ++i)
		{
			result[i] = value;
		}

		return result;
	}

	template <typename TScalar, size_t NDimensions>
	constexpr Vector<TScalar, NDimensions> Min(Vector<TScalar, NDimensions> const& a, Vector<TScalar, NDimensions> const& b)
	{
		return ComponentApply(a, b, [](auto x, auto y) { return std::min(x, y); });
	}

	template <typename TScalar, size_t NDimensions>
	constexpr Vector<TScalar, NDimensions> Max(Vector<TScalar, NDimensions> const& a, Vector<TScalar, NDimensions> const& b)
	{
		return ComponentApply(a, b, [](auto x, auto y) { return std::max(x, y); });
	}

	template <typename TScalar, size_t NDimensions>
	[[nodiscard]] TScalar GetDistanceSquared(Vector<TScalar, NDimensions> const& a, Vector<TScalar, NDimensions> const& b)
	{
		auto result = TScalar(0);
		for (size_t i = 0; i < NDimensions; ++i)
		{
			result += Square(a[i] - b[i]);
		}

		return result;
	}

	template <typename TScalar, size_t NDimensions>
	[[nodiscard]] TScalar GetDistance(Vector<TScalar, NDimensions> const& a, Vector<TScalar, NDimensions> const& b)
	{
		return std::sqrt(GetDistanceSquared(a, b));
	}


	// Closed axis-aligned box

	template <class TVector>
	struct Box
	{
		using VectorType = TVector;

		using ScalarType = typename TVector::value_type;

	private:

		std::array<VectorType, 2> ends_;

	public:

		// Empty box, NaN corners
		constexpr Box() noexcept
			: ends_{ Flat<ScalarType, std::tuple_size_v<TVector>>(std::numeric_limits<ScalarType>::quiet_NaN()), Flat<ScalarType, std::tuple_size_v<TVector>>(std::numeric_limits<ScalarType>::quiet_NaN()) }
		{
		}

		explicit constexpr Box(VectorType point) noexcept
			: ends_{ point, point }
		{
		}

		constexpr Box(VectorType min, VectorType max) noexcept(IsReleaseBuild)
			: ends_{ min, max }
		{
			DEBUG_ASSERT(AllOf(ends_[0], ends_[1], std::less_equal<>()));
		}

		static constexpr Box Bound(VectorType a, VectorType b)
		{
			return Box{ GeoIndex::Min(a, b), GeoIndex::Max(a, b) };
		}

		static constexpr Box FromCenterAndRadius(VectorType center, ScalarType radius)
		{
			auto const offset = Flat<ScalarType, std::tuple_size_v<TVector>>(radius < 0 ? -radius : radius);
			return Box{ center - offset, center + offset };
		}

		[[nodiscard]] constexpr VectorType const& Min() const noexcept
		{
			return ends_[0];
		}

		[[nodiscard]] constexpr VectorType const& Max() const noexcept
		{
			return ends_[1];
		}

		[[nodiscard]] constexpr VectorType Center() const noexcept
		{
			return ComponentApply(ends_[0], ends_[1], [](auto x, auto y) { return (x + y) / 2; });
		}

		[[nodiscard]] constexpr VectorType Sizes() const noexcept
		{
			return ends_[1] - ends_[0];
		}

		[[nodiscard]] constexpr bool IsEmpty() const noexcept
		{
			// std::isnan got constexpr only in C++23
			return ends_[0][0] != ends_[0][0];
		}

		Box& Add(VectorType const& point)
		{
			// Can't use std::min/max here, this must work for empty boxes that use nan coordinates
			ends_[0] = ComponentApply(ends_[0], point, [](auto x, auto y) { return !(x <= y) ? y : x; });
			ends_[1] = ComponentApply(ends_[1], point, [](auto x, auto y) { return !(x >= y) ? y : x; });
			return *this;
		}

		friend constexpr bool operator==(Box const& a, Box const& b)
		{
			return (a.IsEmpty() && b.IsEmpty())
				|| (AllOf(a.ends_[0], b.ends_[0], std::equal_to<>()) && AllOf(a.ends_[1], b.ends_[1], std::equal_to<>()));
		}

		friend constexpr bool operator!=(Box const& a, Box const& b)
		{
			return !(a == b);
		}
	};

	using Box2 = Box<Vector2>;

	// Inclusive on all sides. The corners are not required to be ordered, an inverted range contains nothing
	template <typename TScalar, size_t NDimensions>
	[[nodiscard]] bool Overlap(Vector<TScalar, NDimensions> const& min, Vector<TScalar, NDimensions> const& max, Vector<TScalar, NDimensions> const& point) noexcept
	{
		for (size_t i = 0; i < NDimensions; ++i)
		{
			if (point[i] < min[i] || point[i] > max[i])
			{
				return false;
			}
		}

		return true;
	}

	// An empty box contains nothing
	template <class TVector>
	[[nodiscard]] bool Overlap(Box<TVector> const& box, TVector const& point) noexcept
	{
		return !box.IsEmpty() && Overlap(box.Min(), box.Max(), point);
	}

	template <class TIterable, class TGetPointFunc>
	[[nodiscard]] auto Bound(TIterable const& elements, TGetPointFunc getPointFunc)
	{
		Box<std::decay_t<decltype(getPointFunc(*elements.begin()))>> result;
		for (auto const& element : elements)
		{
			result.Add(getPointFunc(element));
		}

		return result;
	}

	template <class TIterable>
	[[nodiscard]] auto Bound(TIterable const& elements)
	{
		return Bound(elements, Identity{});
	}

	inline std::ostream& operator<<(std::ostream& stream, Vector2 const& point)
	{
		stream << point[0] << ' ' << point[1];
		return stream;
	}
}
