/**
 * Copyright (C) 2023 Intel Corporation
 *
 * SPDX-License-Identifier: Apache-2.0
 */

#include "Passes.h"

#include "Logger/Logger.h"

#include <algorithm>
#include <limits>

namespace lqe {

using namespace ir;

namespace {

// Offset and length of rows required from the beginning of a node output.
using SliceSpec = std::optional<std::pair<size_t, size_t>>;

/**
 * Moves slices with non-negative offsets through order preserving operators.
 * A slice is fused into a sort (top-k), copied into union inputs as a head and
 * turned into a scan hint. Operators which change the number of rows depending
 * on the rows content stop the slice.
 */
class SlicePushdown {
 public:
  explicit SlicePushdown(QueryDag& dag) : dag_(dag), arena_(dag.exprs()) {}

  NodeId push(NodeId id, SliceSpec slice) {
    if (!slice) {
      auto it = visited_.find(id);
      if (it != visited_.end()) {
        return it->second;
      }
      auto res = pushNode(dag_.node(id), slice);
      visited_.emplace(id, res);
      return res;
    }
    return pushNode(dag_.node(id), slice);
  }

 private:
  NodeId pushNode(const Node* node, SliceSpec slice) {
    switch (node->kind()) {
      case NodeKind::kScan: {
        auto scan = node->as<Scan>();
        auto hints = scan->hints();
        if (!slice || hints.predicate != kInvalidExprId || hints.slice) {
          return applySlice(scan->id(), slice);
        }
        VLOG(2) << "Pushed slice (" << slice->first << ", " << slice->second
                << ") into " << scan->label();
        hints.slice = slice;
        return dag_.addNode(scan->withHints(dag_, std::move(hints)));
      }
      case NodeKind::kSlice:
        return pushSlice(node->as<Slice>(), slice);
      case NodeKind::kProject: {
        auto& exprs = node->as<Project>()->projections();
        bool elementwise = std::all_of(exprs.begin(), exprs.end(), [&](ExprId id) {
          return isElementwise(arena_, id);
        });
        bool has_columns = std::any_of(exprs.begin(), exprs.end(), [&](ExprId id) {
          return !referencedColumns(arena_, id).empty();
        });
        if (elementwise && has_columns) {
          return rebuildNode(dag_, node, {push(node->input(0), slice)});
        }
        return barrier(node, slice);
      }
      case NodeKind::kSort: {
        auto sort = node->as<Sort>();
        auto new_sort = rebuildNode(dag_, sort, {push(sort->input(0), std::nullopt)});
        if (!slice || sort->limit()) {
          return applySlice(new_sort, slice);
        }
        VLOG(2) << "Fused slice into " << sort->label();
        return dag_.addNode(dag_.node(new_sort)->as<Sort>()->withLimit(
            dag_, slice->second, slice->first));
      }
      case NodeKind::kUnion: {
        if (!slice) {
          return barrier(node, slice);
        }
        SliceSpec head = std::make_pair(size_t(0), slice->first + slice->second);
        NodeIdList inputs;
        for (auto input : node->inputs()) {
          inputs.push_back(push(input, head));
        }
        return applySlice(rebuildNode(dag_, node, std::move(inputs)), slice);
      }
      case NodeKind::kFilter:
      case NodeKind::kAggregate:
      case NodeKind::kJoin:
      case NodeKind::kDistinct:
      case NodeKind::kExplode:
      case NodeKind::kMelt:
      case NodeKind::kUpsample:
        return barrier(node, slice);
    }
    UNREACHABLE() << "Unsupported node " << node->label();
    return kInvalidNodeId;
  }

  NodeId pushSlice(const Slice* slice_node, SliceSpec slice) {
    if (slice_node->offset() < 0) {
      return applySlice(
          rebuildNode(dag_, slice_node, {push(slice_node->input(0), std::nullopt)}),
          slice);
    }
    size_t offset = static_cast<size_t>(slice_node->offset());
    size_t length = slice_node->length();
    if (slice) {
      // Slice of a slice.
      length = slice->first >= length ? 0 : std::min(slice->second, length - slice->first);
      offset += slice->first;
    }
    // Keeps offset + length representable.
    length = std::min(length, std::numeric_limits<size_t>::max() - offset);
    return push(slice_node->input(0), std::make_pair(offset, length));
  }

  NodeId barrier(const Node* node, SliceSpec slice) {
    NodeIdList inputs;
    for (auto input : node->inputs()) {
      inputs.push_back(push(input, std::nullopt));
    }
    return applySlice(rebuildNode(dag_, node, std::move(inputs)), slice);
  }

  NodeId applySlice(NodeId id, SliceSpec slice) {
    if (!slice) {
      return id;
    }
    return dag_.makeNode<Slice>(static_cast<int64_t>(slice->first), slice->second, id);
  }

  QueryDag& dag_;
  ExprArena& arena_;
  std::unordered_map<NodeId, NodeId> visited_;
};

}  // namespace

NodeId pushDownSlices(QueryDag& dag, NodeId root) {
  return SlicePushdown(dag).push(root, std::nullopt);
}

}  // namespace lqe
