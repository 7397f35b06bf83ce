// Copyright (c) 2024 chenmou. All rights reserved.
// Licensed under the MIT License. See LICENSE file in the project root.

/// @file builders.h
/// @brief Fluent builders for descriptors and graph nodes.
///
/// - TypeBuilder: build a TypeDescriptor member by member
/// - ObjectBuilder: fill an Object by member name
/// - SequenceBuilder / FrozenSequenceBuilder: build lists
/// - MapBuilder / FrozenMapBuilder: build maps
/// - ArrayBuilder: build a fixed-rank array from row-major cells
///
/// Usage:
/// @code
///   auto person = TypeBuilder("Person")
///       .member("Name")
///       .member("Age")
///       .finish();
///
///   Value ann = ObjectBuilder(person)
///       .set("Name", "Ann")
///       .set("Age", 41)
///       .finish();
///
///   Value tags = SequenceBuilder()
///       .push_back("red")
///       .push_back("blue")
///       .finish();
/// @endcode

#pragma once

#include "type_descriptor.h"
#include "value.h"

#include <immer/flex_vector_transient.hpp>
#include <immer/map_transient.hpp>

#include <memory>
#include <stdexcept>

namespace struct_delta {

// ============================================================
// TypeBuilder
// ============================================================

class TypeBuilder {
public:
    explicit TypeBuilder(std::string name) : name_(std::move(name)) {}

    /// Deep member with every policy left at its default
    TypeBuilder& member(std::string name) {
        MemberDescriptor m;
        m.name = std::move(name);
        members_.push_back(std::move(m));
        return *this;
    }

    TypeBuilder& member(std::string name, MemberKind kind) {
        MemberDescriptor m;
        m.name = std::move(name);
        m.kind = kind;
        members_.push_back(std::move(m));
        return *this;
    }

    TypeBuilder& member(MemberDescriptor m) {
        members_.push_back(std::move(m));
        return *this;
    }

    /// Order-insensitive collection member, keyed when key_members is not empty
    TypeBuilder& unordered(std::string name, std::vector<std::string> key_members = {}) {
        MemberDescriptor m;
        m.name = std::move(name);
        m.order_insensitive = true;
        m.key_members = std::move(key_members);
        members_.push_back(std::move(m));
        return *this;
    }

    /// Collection member that keeps positional comparison whatever the defaults
    TypeBuilder& ordered(std::string name) {
        MemberDescriptor m;
        m.name = std::move(name);
        m.order_insensitive = false;
        members_.push_back(std::move(m));
        return *this;
    }

    TypeBuilder& polymorphic(std::string name) {
        MemberDescriptor m;
        m.name = std::move(name);
        m.polymorphic = true;
        members_.push_back(std::move(m));
        return *this;
    }

    TypeBuilder& dynamic(std::string name) {
        MemberDescriptor m;
        m.name = std::move(name);
        m.dynamic = true;
        members_.push_back(std::move(m));
        return *this;
    }

    TypeBuilder& custom(std::string name, MemberComparer comparer) {
        MemberDescriptor m;
        m.name = std::move(name);
        m.comparer = std::move(comparer);
        members_.push_back(std::move(m));
        return *this;
    }

    TypeBuilder& default_kind(MemberKind kind) {
        options_.default_kind = kind;
        return *this;
    }

    TypeBuilder& order_insensitive_collections(bool value = true) {
        options_.order_insensitive_collections = value;
        return *this;
    }

    TypeBuilder& index_mode(IndexMode mode) {
        options_.index_mode = mode;
        return *this;
    }

    TypeBuilder& delta_enabled(bool value) {
        options_.delta_enabled = value;
        return *this;
    }

    TypeBuilder& native_equals(NativeEquals fn) {
        options_.native_equals = std::move(fn);
        return *this;
    }

    [[nodiscard]] std::size_t size() const { return members_.size(); }

    /// @throws std::invalid_argument when the member list is invalid
    [[nodiscard]] TypeDescriptorPtr finish() {
        return std::make_shared<const TypeDescriptor>(std::move(name_), std::move(members_), std::move(options_));
    }

private:
    std::string name_;
    std::vector<MemberDescriptor> members_;
    TypeOptions options_;
};

// ============================================================
// ObjectBuilder
// ============================================================

class ObjectBuilder {
public:
    explicit ObjectBuilder(TypeDescriptorPtr type) : object_(Object::make(std::move(type))) {}

    ObjectBuilder(ObjectBuilder&&) noexcept = default;
    ObjectBuilder& operator=(ObjectBuilder&&) noexcept = default;
    ObjectBuilder(const ObjectBuilder&) = delete;
    ObjectBuilder& operator=(const ObjectBuilder&) = delete;

    /// @throws std::out_of_range if the type has no such member
    ObjectBuilder& set(std::string_view member, Value val) {
        object_->set(member, std::move(val));
        return *this;
    }

    [[nodiscard]] ObjectPtr finish_ptr() { return std::move(object_); }
    [[nodiscard]] Value finish() { return Value{std::move(object_)}; }

private:
    ObjectPtr object_;
};

// ============================================================
// Sequence builders
// ============================================================

class SequenceBuilder {
public:
    SequenceBuilder() = default;

    SequenceBuilder& push_back(Value val) {
        items_.push_back(std::move(val));
        return *this;
    }

    [[nodiscard]] std::size_t size() const { return items_.size(); }

    [[nodiscard]] SequencePtr finish_ptr() { return Sequence::make(std::move(items_)); }
    [[nodiscard]] Value finish() { return Value{finish_ptr()}; }

private:
    std::vector<Value> items_;
};

/// O(n) construction through immer's transient API
class FrozenSequenceBuilder {
public:
    FrozenSequenceBuilder() : transient_(immer::flex_vector<Value>{}.transient()) {}

    FrozenSequenceBuilder(FrozenSequenceBuilder&&) noexcept = default;
    FrozenSequenceBuilder& operator=(FrozenSequenceBuilder&&) noexcept = default;

    // Copy operations (disabled - transient sharing is dangerous)
    FrozenSequenceBuilder(const FrozenSequenceBuilder&) = delete;
    FrozenSequenceBuilder& operator=(const FrozenSequenceBuilder&) = delete;

    FrozenSequenceBuilder& push_back(Value val) {
        transient_.push_back(std::move(val));
        return *this;
    }

    [[nodiscard]] std::size_t size() const { return transient_.size(); }

    [[nodiscard]] Value finish() { return Value{FrozenSequence::make(transient_.persistent())}; }

private:
    immer::flex_vector<Value>::transient_type transient_;
};

// ============================================================
// Map builders
// ============================================================

class MapBuilder {
public:
    MapBuilder() : map_(Map::make()) {}

    MapBuilder& set(Value key, Value val) {
        map_->entries.insert_or_assign(std::move(key), std::move(val));
        return *this;
    }

    [[nodiscard]] bool contains(const Value& key) const { return map_->entries.count(key) > 0; }
    [[nodiscard]] std::size_t size() const { return map_->entries.size(); }

    [[nodiscard]] MapPtr finish_ptr() { return std::move(map_); }
    [[nodiscard]] Value finish() { return Value{std::move(map_)}; }

private:
    MapPtr map_;
};

class FrozenMapBuilder {
public:
    FrozenMapBuilder() : transient_(FrozenMapStorage{}.transient()) {}

    FrozenMapBuilder(FrozenMapBuilder&&) noexcept = default;
    FrozenMapBuilder& operator=(FrozenMapBuilder&&) noexcept = default;
    FrozenMapBuilder(const FrozenMapBuilder&) = delete;
    FrozenMapBuilder& operator=(const FrozenMapBuilder&) = delete;

    FrozenMapBuilder& set(Value key, Value val) {
        transient_.set(std::move(key), std::move(val));
        return *this;
    }

    [[nodiscard]] std::size_t size() const { return transient_.size(); }

    [[nodiscard]] Value finish() { return Value{FrozenMap::make(transient_.persistent())}; }

private:
    FrozenMapStorage::transient_type transient_;
};

// ============================================================
// ArrayBuilder - cells are pushed in row-major order
// ============================================================

class ArrayBuilder {
public:
    explicit ArrayBuilder(std::vector<std::size_t> shape) : array_(MultiArray::make(std::move(shape))) {}

    ArrayBuilder& push_back(Value val) {
        if (next_ >= array_->cells.size()) {
            detail::log_index_error("ArrayBuilder::push_back", next_, "exceeds array capacity");
            throw std::out_of_range("ArrayBuilder: more cells than the shape holds");
        }
        array_->cells[next_++] = std::move(val);
        return *this;
    }

    ArrayBuilder& set(const std::vector<std::size_t>& index, Value val) {
        array_->at(index) = std::move(val);
        return *this;
    }

    [[nodiscard]] ArrayPtr finish_ptr() { return std::move(array_); }
    [[nodiscard]] Value finish() { return Value{std::move(array_)}; }

private:
    ArrayPtr array_;
    std::size_t next_ = 0;
};

} // namespace struct_delta
