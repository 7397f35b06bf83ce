// Copyright (c) 2024-2025 chenmou. All rights reserved.
// Licensed under the MIT License. See LICENSE file in the project root.

/// @file value_fwd.h
/// @brief Forward declarations for the graph value model
///
/// Lets headers such as type_descriptor.h name Value, Object and the
/// comparison context in signatures without pulling in value.h.

#pragma once

#include <memory>

namespace struct_delta {

struct Value;
struct Object;
struct Sequence;
struct FrozenSequence;
struct Map;
struct FrozenMap;
struct MultiArray;
class Opaque;

class TypeDescriptor;
class ComparisonContext;
class TypeRegistry;

using ObjectPtr         = std::shared_ptr<Object>;
using SequencePtr       = std::shared_ptr<Sequence>;
using FrozenSequencePtr = std::shared_ptr<const FrozenSequence>;
using MapPtr            = std::shared_ptr<Map>;
using FrozenMapPtr      = std::shared_ptr<const FrozenMap>;
using ArrayPtr          = std::shared_ptr<MultiArray>;
using OpaquePtr         = std::shared_ptr<const Opaque>;
using TypeDescriptorPtr = std::shared_ptr<const TypeDescriptor>;

} // namespace struct_delta
