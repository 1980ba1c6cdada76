// Copyright 2024-2025 Ivan Kolev
//
// Distributed under the Boost Software License, Version 1.0.
// (See accompanying file LICENSE.txt or copy at http://www.boost.org/LICENSE_1_0.txt)

#include "GeoIndex/ShapeFile.hpp"

#include <shapefil.h>

#include <algorithm>
#include <string>

namespace
{
	constexpr auto AttributeWidth = 254;

	SHPHandle ToShapeHandle(void* handle)
	{
		return static_cast<SHPHandle>(handle);
	}

	DBFHandle ToAttributeHandle(void* handle)
	{
		return static_cast<DBFHandle>(handle);
	}
}

namespace GeoIndex
{
	void ShapeFileDeleter::operator()(void* shapeFile) const
	{
		SHPClose(ToShapeHandle(shapeFile));
	}

	void AttributeFileDeleter::operator()(void* attributeFile) const
	{
		DBFClose(ToAttributeHandle(attributeFile));
	}

	void ShapeObjectDeleter::operator()(SHPObject* obj) const
	{
		SHPDestroyObject(obj);
	}

	ShapeFile::ShapeFile(std::filesystem::path filePath)
		: filePath_{ std::move(filePath) }
		, shapeFile_{ SHPOpen(filePath_.string().c_str(), "rb") }
	{
		if (shapeFile_ != nullptr)
		{
			auto shapeType = SHPT_NULL;
			SHPGetInfo(ToShapeHandle(shapeFile_.get()), &objectCount_, &shapeType, minBounds_.data(), maxBounds_.data());
			shapeType_ = ShapeType(shapeType);

			// The .dbf is optional, its rows follow the order of the shapes
			attributeFile_.reset(DBFOpen(filePath_.string().c_str(), "rb"));
			if (attributeFile_ != nullptr && DBFGetRecordCount(ToAttributeHandle(attributeFile_.get())) != objectCount_)
			{
				attributeFile_.reset();
			}
		}
	}

	Box2 ShapeFile::GetBounds() const
	{
		if (objectCount_ == 0)
		{
			return {};
		}

		return Box2::Bound({ minBounds_[0], minBounds_[1] }, { maxBounds_[0], maxBounds_[1] });
	}

	auto ShapeFile::GetObject(int index) const -> ShapeObjectPtr
	{
		return index < objectCount_ ? ShapeObjectPtr(SHPReadObject(ToShapeHandle(shapeFile_.get()), index)) : nullptr;
	}

	int ShapeFile::GetFieldIndex(char const* name) const
	{
		return attributeFile_ != nullptr ? DBFGetFieldIndex(ToAttributeHandle(attributeFile_.get()), name) : -1;
	}

	std::string ShapeFile::ReadAttribute(int index, int field) const
	{
		if (field < 0)
		{
			return {};
		}

		auto const* value = DBFReadStringAttribute(ToAttributeHandle(attributeFile_.get()), index, field);
		return value != nullptr ? std::string{ Trim(value) } : std::string{};
	}

	std::vector<Vector2> ShapeFile::GetPoints(int limit) const
	{
		std::vector<Vector2> result;
		limit = limit < 0 ? objectCount_ : std::min(objectCount_, limit);
		for (auto index = 0; index < limit; ++index)
		{
			auto const object = GetObject(index);
			if (object == nullptr || object->nVertices < 1)
			{
				continue;
			}

			result.push_back({ object->padfX[0], object->padfY[0] });
		}

		return result;
	}

	std::vector<Place> ShapeFile::ReadPlaces(std::string const& defaultCategory, int limit) const
	{
		std::vector<Place> result;
		if (!SupportsPoints())
		{
			return result;
		}

		auto const nameField = GetFieldIndex(NameField);
		auto const categoryField = GetFieldIndex(CategoryField);
		auto const addressField = GetFieldIndex(AddressField);

		limit = limit < 0 ? objectCount_ : std::min(objectCount_, limit);
		for (auto index = 0; index < limit; ++index)
		{
			auto const object = GetObject(index);
			if (object == nullptr || object->nVertices < 1)
			{
				continue;
			}

			auto category = ReadAttribute(index, categoryField);
			result.push_back(Place{
				ReadAttribute(index, nameField),
				!category.empty() ? std::move(category) : defaultCategory,
				{ object->padfX[0], object->padfY[0] },
				ReadAttribute(index, addressField) });
		}

		return result;
	}

	bool ShapeFile::Write(std::filesystem::path const& filePath, std::vector<Vector2> const& points)
	{
		ShapeFilePtr const shapeFile{ SHPCreate(filePath.string().c_str(), SHPT_POINT) };
		if (shapeFile == nullptr)
		{
			return false;
		}

		for (auto const& p : points)
		{
			ShapeObjectPtr const obj{ SHPCreateSimpleObject(SHPT_POINT, 1, &p[0], &p[1], nullptr) };
			if (obj == nullptr || SHPWriteObject(ToShapeHandle(shapeFile.get()), -1, obj.get()) < 0)
			{
				return false;
			}
		}

		return true;
	}

	bool ShapeFile::Write(std::filesystem::path const& filePath, PlaceCatalog const& places)
	{
		ShapeFilePtr const shapeFile{ SHPCreate(filePath.string().c_str(), SHPT_POINT) };
		AttributeFilePtr const attributeFile{ DBFCreate(filePath.string().c_str()) };
		if (shapeFile == nullptr || attributeFile == nullptr)
		{
			return false;
		}

		auto* const attributes = ToAttributeHandle(attributeFile.get());
		auto const nameField = DBFAddField(attributes, NameField, FTString, AttributeWidth, 0);
		auto const categoryField = DBFAddField(attributes, CategoryField, FTString, AttributeWidth, 0);
		auto const addressField = DBFAddField(attributes, AddressField, FTString, AttributeWidth, 0);
		if (nameField < 0 || categoryField < 0 || addressField < 0)
		{
			return false;
		}

		for (auto const& place : places.GetPlaces())
		{
			ShapeObjectPtr const obj{ SHPCreateSimpleObject(SHPT_POINT, 1, &place.location[0], &place.location[1], nullptr) };
			if (obj == nullptr)
			{
				return false;
			}

			auto const index = SHPWriteObject(ToShapeHandle(shapeFile.get()), -1, obj.get());
			if (index < 0
				|| !DBFWriteStringAttribute(attributes, index, nameField, place.name.c_str())
				|| !DBFWriteStringAttribute(attributes, index, categoryField, place.category.c_str())
				|| !DBFWriteStringAttribute(attributes, index, addressField, place.address.c_str()))
			{
				return false;
			}
		}

		return true;
	}
}
