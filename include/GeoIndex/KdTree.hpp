// Copyright 2024-2025 Ivan Kolev
//
// Distributed under the Boost Software License, Version 1.0.
// (See accompanying file LICENSE.txt or copy at http://www.boost.org/LICENSE_1_0.txt)

#pragma once

#include "GeoIndex/Asserts.hpp"
#include "GeoIndex/GeometryTools.hpp"
#include "GeoIndex/StlExtensions.hpp"

#include <array>
#include <cmath>
#include <cstddef>
#include <initializer_list>
#include <limits>
#include <memory>
#include <optional>
#include <type_traits>
#include <utility>
#include <vector>

namespace GeoIndex
{
	// A dynamic 2-dimensional k-d tree of points with an attached payload.
	// The splitting axis of a node is not stored, it is depth % 2 (x at the root). For a node at depth d with axis a,
	// all points in the left subtree have point[a] < node.point[a] and all points in the right subtree have point[a] >= node.point[a].
	// There is no rebalancing, sorted insertion orders degrade the tree into a list.
	template <typename TPayload>
	class KdTree
	{
		static_assert(std::is_move_constructible_v<TPayload> && std::is_move_assignable_v<TPayload>);

		struct Node;

		using NodePtr = std::unique_ptr<Node>;

		NodePtr root_;

		std::ptrdiff_t size_ = 0;

	public:

		static constexpr auto Dimensions = 2;

		using PayloadType = TPayload;
		using VectorType = Vector2;
		using ScalarType = double;
		using BoxType = Box2;

		struct Entry
		{
			VectorType point;
			PayloadType payload;
		};

		struct NearestResult
		{
			VectorType point;
			PayloadType payload;
			ScalarType distance;
		};


		[[nodiscard]] static constexpr int GetAxis(int depth) noexcept
		{
			return depth % Dimensions;
		}

		KdTree() = default;

		KdTree(KdTree const&) = delete;
		KdTree& operator=(KdTree const&) = delete;

		KdTree(KdTree&& other) noexcept
			: root_{ std::move(other.root_) }
			, size_{ std::exchange(other.size_, 0) }
		{
		}

		KdTree& operator=(KdTree&& other) noexcept
		{
			if (this != &other)
			{
				Clear();
				root_ = std::move(other.root_);
				size_ = std::exchange(other.size_, 0);
			}

			return *this;
		}

		~KdTree()
		{
			Clear();
		}

		[[nodiscard]] bool IsEmpty() const noexcept
		{
			return root_ == nullptr;
		}

		[[nodiscard]] std::ptrdiff_t GetSize() const noexcept
		{
			return size_;
		}

		[[nodiscard]] int GetHeight() const;

		void Clear() noexcept;

		// Duplicates are allowed, a point equal to an existing one along the splitting axis goes to the right
		void Insert(VectorType const& point, PayloadType payload);

		// Removes one node with exactly this point, the first one found on the search path. Returns false if there is none
		bool Erase(VectorType const& point)
		{
			return Extract(point).has_value();
		}

		// Same as Erase, but hands back the payload of the removed node
		std::optional<PayloadType> Extract(VectorType const& point);

		// All entries with min <= point <= max on both axes. An inverted range finds nothing
		[[nodiscard]] std::vector<Entry> QueryRange(VectorType const& min, VectorType const& max) const
		{
			std::vector<Entry> result;
			QueryRange(min, max, [&result](VectorType const& point, PayloadType const& payload)
				{
					result.push_back(Entry{ point, payload });
				});

			return result;
		}

		[[nodiscard]] std::vector<Entry> QueryRange(BoxType const& range) const
		{
			if (range.IsEmpty())
			{
				return {};
			}

			return QueryRange(range.Min(), range.Max());
		}

		// Calls visitor(point, payload) for each entry in the range, in pre-order
		template <class TVisitor>
		void QueryRange(VectorType const& min, VectorType const& max, TVisitor&& visitor) const;

		// The closest entry by Euclidean distance, nullopt if the tree is empty
		[[nodiscard]] std::optional<NearestResult> QueryNearest(VectorType const& target) const;

		// Calls visitor(point, payload, depth) for each node, in pre-order
		template <class TVisitor>
		void ForEachNode(TVisitor&& visitor) const;

		// Verifies the splitting rule for every node against all of its ancestors
		[[nodiscard]] bool CheckInvariant() const;

	private:

		static Node* FindMinimum(Node* node, int depth, int axis);

		static void RemoveNode(NodePtr& node, int depth);

		static void EraseNode(NodePtr& subtree, Node const* target, int depth);

		void QueryNearest(Node const* node, VectorType const& target, int depth, Node const*& best, ScalarType& bestDistance2) const;
	};

	template <typename TPayload>
	struct KdTree<TPayload>::Node
	{
		VectorType point;
		PayloadType payload;
		NodePtr left;
		NodePtr right;

		Node(VectorType const& p, PayloadType&& data)
			: point{ p }
			, payload{ std::move(data) }
		{
		}

		[[nodiscard]] bool IsLeaf() const noexcept
		{
			return left == nullptr && right == nullptr;
		}
	};


	template <typename TPayload>
	int KdTree<TPayload>::GetHeight() const
	{
		auto height = 0;
		ForEachNode([&height](VectorType const&, PayloadType const&, int depth)
			{
				height = std::max(height, depth + 1);
			});

		return height;
	}

	template <typename TPayload>
	void KdTree<TPayload>::Clear() noexcept
	{
		// Rotate left children up until the root has none, then drop the root. The default recursive destruction would overflow the stack on a degenerate tree
		while (root_ != nullptr)
		{
			if (root_->left != nullptr)
			{
				auto left = std::move(root_->left);
				root_->left = std::move(left->right);
				left->right = std::move(root_);
				root_ = std::move(left);
			}
			else
			{
				root_ = std::move(root_->right);
			}
		}

		size_ = 0;
	}

	template <typename TPayload>
	void KdTree<TPayload>::Insert(VectorType const& point, PayloadType payload)
	{
		auto* slot = &root_;
		for (auto depth = 0; *slot != nullptr; ++depth)
		{
			auto const axis = GetAxis(depth);
			slot = point[axis] < (*slot)->point[axis] ? &(*slot)->left : &(*slot)->right;
		}

		*slot = std::make_unique<Node>(point, std::move(payload));
		++size_;
	}

	template <typename TPayload>
	auto KdTree<TPayload>::Extract(VectorType const& point) -> std::optional<PayloadType>
	{
		auto* slot = &root_;
		for (auto depth = 0; *slot != nullptr; ++depth)
		{
			if ((*slot)->point == point)
			{
				std::optional<PayloadType> result{ std::move((*slot)->payload) };
				RemoveNode(*slot, depth);
				--size_;
				return result;
			}

			auto const axis = GetAxis(depth);
			slot = point[axis] < (*slot)->point[axis] ? &(*slot)->left : &(*slot)->right;
		}

		return std::nullopt;
	}

	// The node with the smallest coordinate along axis in the subtree of node, which is at the given depth.
	// Where the node splits along the same axis only the left side can hold smaller values, otherwise both sides must be searched
	template <typename TPayload>
	auto KdTree<TPayload>::FindMinimum(Node* node, int depth, int axis) -> Node*
	{
		ASSERT(node != nullptr);

		if (GetAxis(depth) == axis)
		{
			return node->left != nullptr ? FindMinimum(node->left.get(), depth + 1, axis) : node;
		}

		auto* minimum = node;
		for (auto* child : { node->left.get(), node->right.get() })
		{
			if (child != nullptr)
			{
				auto* const candidate = FindMinimum(child, depth + 1, axis);
				if (candidate->point[axis] < minimum->point[axis])
				{
					minimum = candidate;
				}
			}
		}

		return minimum;
	}

	// Removes the content of node, which is at the given depth. A leaf is detached, an inner node takes over the point and payload
	// of the minimum along its splitting axis from the right subtree, which is then removed from there in turn.
	// A node without a right subtree gets its left subtree moved to the right first: everything in it is >= its own minimum,
	// so it can only stay valid on the right side
	template <typename TPayload>
	void KdTree<TPayload>::RemoveNode(NodePtr& node, int depth)
	{
		if (node->IsLeaf())
		{
			node.reset();
			return;
		}

		if (node->right == nullptr)
		{
			node->right = std::move(node->left);
		}

		auto* const minimum = FindMinimum(node->right.get(), depth + 1, GetAxis(depth));
		node->point = minimum->point;
		node->payload = std::move(minimum->payload);
		EraseNode(node->right, minimum, depth + 1);
	}

	// Removes exactly the target node, found by following the search path of its point. Matching by identity
	// rather than by point value keeps the right one when the subtree holds duplicates of that point
	template <typename TPayload>
	void KdTree<TPayload>::EraseNode(NodePtr& subtree, Node const* target, int depth)
	{
		auto* slot = &subtree;
		for (; slot->get() != target; ++depth)
		{
			ASSERT(*slot != nullptr);
			auto const axis = GetAxis(depth);
			slot = target->point[axis] < (*slot)->point[axis] ? &(*slot)->left : &(*slot)->right;
		}

		RemoveNode(*slot, depth);
	}

	template <typename TPayload>
	template <class TVisitor>
	void KdTree<TPayload>::QueryRange(VectorType const& min, VectorType const& max, TVisitor&& visitor) const
	{
		if (root_ == nullptr)
		{
			return;
		}

		std::vector<std::pair<Node const*, int>> pending;
		pending.reserve(32);
		pending.emplace_back(root_.get(), 0);

		while (!pending.empty())
		{
			auto const [node, depth] = pending.back();
			pending.pop_back();

			if (Overlap(min, max, node->point))
			{
				visitor(node->point, node->payload);
			}

			// Left holds points strictly below the split, right holds the rest, either side may still be out of range
			auto const axis = GetAxis(depth);
			if (node->right != nullptr && node->point[axis] <= max[axis])
			{
				pending.emplace_back(node->right.get(), depth + 1);
			}

			if (node->left != nullptr && min[axis] <= node->point[axis])
			{
				pending.emplace_back(node->left.get(), depth + 1);
			}
		}
	}

	template <typename TPayload>
	auto KdTree<TPayload>::QueryNearest(VectorType const& target) const -> std::optional<NearestResult>
	{
		if (root_ == nullptr)
		{
			return std::nullopt;
		}

		Node const* best = nullptr;
		auto bestDistance2 = std::numeric_limits<ScalarType>::infinity();
		QueryNearest(root_.get(), target, 0, best, bestDistance2);

		ASSERT(best != nullptr);
		return NearestResult{ best->point, best->payload, std::sqrt(bestDistance2) };
	}

	template <typename TPayload>
	void KdTree<TPayload>::QueryNearest(Node const* node, VectorType const& target, int depth, Node const*& best, ScalarType& bestDistance2) const
	{
		if (node == nullptr)
		{
			return;
		}

		auto const distance2 = GetDistanceSquared(node->point, target);
		if (distance2 < bestDistance2)
		{
			best = node;
			bestDistance2 = distance2;
		}

		auto const axis = GetAxis(depth);
		auto const offset = target[axis] - node->point[axis];
		auto const* nearChild = offset < 0 ? node->left.get() : node->right.get();
		auto const* farChild = offset < 0 ? node->right.get() : node->left.get();

		QueryNearest(nearChild, target, depth + 1, best, bestDistance2);

		// The far side can only hold a closer point if the splitting line itself is closer than the best so far
		if (Square(offset) < bestDistance2)
		{
			QueryNearest(farChild, target, depth + 1, best, bestDistance2);
		}
	}

	template <typename TPayload>
	template <class TVisitor>
	void KdTree<TPayload>::ForEachNode(TVisitor&& visitor) const
	{
		if (root_ == nullptr)
		{
			return;
		}

		std::vector<std::pair<Node const*, int>> pending;
		pending.emplace_back(root_.get(), 0);

		while (!pending.empty())
		{
			auto const [node, depth] = pending.back();
			pending.pop_back();

			visitor(node->point, node->payload, depth);

			if (node->right != nullptr)
			{
				pending.emplace_back(node->right.get(), depth + 1);
			}

			if (node->left != nullptr)
			{
				pending.emplace_back(node->left.get(), depth + 1);
			}
		}
	}

	template <typename TPayload>
	bool KdTree<TPayload>::CheckInvariant() const
	{
		if (root_ == nullptr)
		{
			return size_ == 0;
		}

		// Every node is checked against the half-open interval [low, high) per axis that its ancestors impose on it.
		// An axis has no upper bound until a left turn on it, so that +infinity coordinates on the right are valid
		struct Bounds
		{
			Node const* node;
			int depth;
			VectorType low;
			VectorType high;
			std::array<bool, Dimensions> hasHigh;
		};

		constexpr auto Infinity = std::numeric_limits<ScalarType>::infinity();

		std::vector<Bounds> pending;
		pending.push_back(Bounds{ root_.get(), 0, Flat<ScalarType, Dimensions>(-Infinity), Flat<ScalarType, Dimensions>(Infinity), {} });
		std::ptrdiff_t count = 0;

		while (!pending.empty())
		{
			auto const current = pending.back();
			pending.pop_back();
			++count;

			auto const& point = current.node->point;
			for (auto axis = 0; axis < Dimensions; ++axis)
			{
				if (point[axis] < current.low[axis] || (current.hasHigh[axis] && !(point[axis] < current.high[axis])))
				{
					return false;
				}
			}

			auto const axis = GetAxis(current.depth);
			if (current.node->left != nullptr)
			{
				auto high = current.high;
				auto hasHigh = current.hasHigh;
				high[axis] = std::min(high[axis], point[axis]);
				hasHigh[axis] = true;
				pending.push_back(Bounds{ current.node->left.get(), current.depth + 1, current.low, high, hasHigh });
			}

			if (current.node->right != nullptr)
			{
				auto low = current.low;
				low[axis] = std::max(low[axis], point[axis]);
				pending.push_back(Bounds{ current.node->right.get(), current.depth + 1, low, current.high, current.hasHigh });
			}
		}

		return count == size_;
	}
}
