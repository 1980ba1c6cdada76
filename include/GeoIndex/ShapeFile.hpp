// Copyright 2024-2025 Ivan Kolev
//
// Distributed under the Boost Software License, Version 1.0.
// (See accompanying file LICENSE.txt or copy at http://www.boost.org/LICENSE_1_0.txt)

#pragma once

#include "GeoIndex/GeometryTools.hpp"
#include "GeoIndex/Places.hpp"

#include <array>
#include <filesystem>
#include <memory>
#include <string>
#include <vector>

struct tagSHPObject;

namespace GeoIndex
{
	struct ShapeFileDeleter
	{
		void operator()(void* shapeFile) const;
	};

	struct AttributeFileDeleter
	{
		void operator()(void* attributeFile) const;
	};

	struct ShapeObjectDeleter
	{
		void operator()(tagSHPObject* obj) const;
	};

	enum class ShapeType
	{
		Null = 0,
		Point = 1,
		Arc = 3,
		Polygon = 5,
		MultiPoint = 8,

		PointZ = 11,
		ArcZ = 13,
		PolygonZ = 15,
		MultiPointZ = 18,

		PointM = 21,
		ArcM = 23,
		PolygonM = 25,
		MultiPointM = 28,

		MultiPatch = 31,
	};

	// Point sets stored as an ESRI shapefile: geometry in the .shp, place attributes in the .dbf next to it.
	// The index is not stored, it's rebuilt by inserting the loaded places
	class ShapeFile
	{
		using ShapeFilePtr = std::unique_ptr<void, ShapeFileDeleter>;
		using AttributeFilePtr = std::unique_ptr<void, AttributeFileDeleter>;
		using ShapeObjectPtr = std::unique_ptr<tagSHPObject, ShapeObjectDeleter>;

		std::filesystem::path filePath_;
		ShapeFilePtr shapeFile_;
		AttributeFilePtr attributeFile_;
		int objectCount_ = 0;
		ShapeType shapeType_ = ShapeType::Null;
		std::array<double, 4> minBounds_{};
		std::array<double, 4> maxBounds_{};

	public:

		static constexpr auto NameField = "NAME";
		static constexpr auto CategoryField = "CATEGORY";
		static constexpr auto AddressField = "ADDRESS";

		// A missing or unreadable file gives an empty shape file, check IsOpen()
		explicit ShapeFile(std::filesystem::path filePath);

		static bool Write(std::filesystem::path const& filePath, std::vector<Vector2> const& points);

		static bool Write(std::filesystem::path const& filePath, PlaceCatalog const& places);

		[[nodiscard]] bool IsOpen() const noexcept
		{
			return shapeFile_ != nullptr;
		}

		[[nodiscard]] bool HasAttributes() const noexcept
		{
			return attributeFile_ != nullptr;
		}

		[[nodiscard]] std::filesystem::path const& GetFilePath() const noexcept
		{
			return filePath_;
		}

		[[nodiscard]] int GetObjectCount() const noexcept
		{
			return objectCount_;
		}

		[[nodiscard]] ShapeType GetShapeType() const noexcept
		{
			return shapeType_;
		}

		[[nodiscard]] bool SupportsPoints() const noexcept
		{
			return Contains(
				std::array{ ShapeType::Point, ShapeType::PointM, ShapeType::PointZ, ShapeType::MultiPoint, ShapeType::MultiPointM, ShapeType::MultiPointZ },
				GetShapeType());
		}

		[[nodiscard]] Box2 GetBounds() const;

		// Objects without vertices are skipped
		[[nodiscard]] std::vector<Vector2> GetPoints(int limit = -1) const;

		// Missing attributes are left empty, a missing category gets defaultCategory
		[[nodiscard]] std::vector<Place> ReadPlaces(std::string const& defaultCategory = {}, int limit = -1) const;

	private:

		[[nodiscard]] ShapeObjectPtr GetObject(int index) const;

		[[nodiscard]] std::string ReadAttribute(int index, int field) const;

		[[nodiscard]] int GetFieldIndex(char const* name) const;
	};
}
