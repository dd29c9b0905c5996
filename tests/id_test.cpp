/*
 * AEVUMDB COMMUNITY LICENSE
 * Version 1.0, February 2026
 *
 * Copyright (c) 2026 Ananda Firmansyah.
 * Official Organization: AevumDB (https://github.com/aevumdb)
 *
 * This source code is licensed under the AevumDB Community License.
 * You may not use this file except in compliance with the License.
 */

/**
 * @file id_test.cpp
 * @brief Unit tests for identifier derivation, equality, ordering and display.
 *
 * @details
 * Several tests pin exact digests. They guard the FNV-1a field order and the
 * little-endian byte encoding: any change there silently renumbers every
 * identifier ever generated.
 */

#include "lineage/core/id.hpp"
#include "framework.hpp"

#include <algorithm>
#include <cstdint>
#include <functional>
#include <sstream>
#include <string>
#include <unordered_set>
#include <vector>

using lineage::make_u128;
using lineage::u128;
using lineage::core::Id;

/**
 * @brief The root is the all-zero constant.
 */
void test_root_is_constant()
{
    Id root = Id::root();
    ASSERT_EQ(root.value(), static_cast<u128>(0));
    ASSERT_EQ(root.parent_value(), static_cast<u128>(0));
    ASSERT_EQ(root.depth(), static_cast<uint32_t>(0));
    ASSERT_EQ(root.num_children(), static_cast<uint32_t>(0));
    ASSERT_EQ(root.local(), static_cast<uint64_t>(0));

    // A default-constructed id is the same root.
    ASSERT_EQ(Id(), root);
    static_assert(Id::root().value() == 0, "root value must be a compile-time zero");
}

/**
 * @brief Two children from the root: counters, depth, linkage, distinct values.
 */
void test_root_children()
{
    Id root = Id::root();
    Id c1 = root.derive_child();
    Id c2 = root.derive_child();

    ASSERT_EQ(root.num_children(), static_cast<uint32_t>(2));
    ASSERT_EQ(c1.depth(), static_cast<uint32_t>(1));
    ASSERT_EQ(c2.depth(), static_cast<uint32_t>(1));
    ASSERT_EQ(c1.parent_value(), static_cast<u128>(0));
    ASSERT_EQ(c2.parent_value(), static_cast<u128>(0));
    ASSERT_NE(c1.value(), c2.value());

    // Children start with an empty generation counter.
    ASSERT_EQ(c1.num_children(), static_cast<uint32_t>(0));
    ASSERT_EQ(c2.num_children(), static_cast<uint32_t>(0));
}

/**
 * @brief Grandchildren link to the child's value and sit at depth 2.
 */
void test_grandchild()
{
    Id root = Id::root();
    Id c1 = root.derive_child();
    Id gc = c1.derive_child();

    ASSERT_EQ(gc.depth(), static_cast<uint32_t>(2));
    ASSERT_EQ(gc.parent_value(), c1.value());
    ASSERT_EQ(c1.num_children(), static_cast<uint32_t>(1));
    ASSERT_EQ(root.num_children(), static_cast<uint32_t>(1));
}

/**
 * @brief Pins the first derivations from the root to fixed FNV-1a outputs.
 */
void test_known_answer_vectors()
{
    Id root = Id::root();
    Id c1 = root.derive_child();
    Id c2 = root.derive_child();
    Id gc = c1.derive_child();
    Id ggc = gc.derive_child();

    ASSERT_EQ(c1.local(), static_cast<uint64_t>(0x6c87646ff7553914ULL));
    ASSERT_EQ(c1.value(), static_cast<u128>(0xd90ec8dfeeaa7228ULL));

    ASSERT_EQ(c2.local(), static_cast<uint64_t>(0x4c776888f9f66ec7ULL));
    ASSERT_EQ(c2.value(), static_cast<u128>(0x98eed111f3ecdd8eULL));

    ASSERT_EQ(gc.local(), static_cast<uint64_t>(0x710c809e58cc7e82ULL));
    ASSERT_EQ(gc.parent_value(), static_cast<u128>(0xd90ec8dfeeaa7228ULL));
    ASSERT_EQ(gc.value(), make_u128(0x1, 0xf806d8c5233225feULL));

    ASSERT_EQ(ggc.local(), static_cast<uint64_t>(0xf9a890861c5a531bULL));
    ASSERT_EQ(ggc.parent_value(), make_u128(0x1, 0xf806d8c5233225feULL));
    ASSERT_EQ(ggc.depth(), static_cast<uint32_t>(3));
    ASSERT_EQ(ggc.value(), make_u128(0x4, 0x06b9210cfda1db94ULL));
}

/**
 * @brief The derived value follows `(depth + 1) * (parent ^ local)` with wrapping.
 */
void test_value_formula_wraps()
{
    Id id = Id::from_parts(0x5, make_u128(0x3, 0x0), 1, 0);
    ASSERT_EQ(id.value(), make_u128(0x6, 0xa));

    // 2 * 2^127 wraps to zero.
    Id top = Id::from_parts(0, make_u128(0x8000000000000000ULL, 0), 1, 0);
    ASSERT_EQ(top.value(), static_cast<u128>(0));

    // depth = UINT32_MAX multiplies by 2^32 without wrapping the multiplier.
    Id deep = Id::from_parts(1, 0, UINT32_MAX, 0);
    ASSERT_EQ(deep.value(), make_u128(0, 0x100000000ULL));
}

/**
 * @brief Deriving more children never changes the parent's value.
 */
void test_parent_linkage_survives_more_children()
{
    Id root = Id::root();
    Id c1 = root.derive_child();
    Id gc1 = c1.derive_child();
    const u128 c1_value = c1.value();

    for (int i = 0; i < 50; ++i) {
        Id sibling = c1.derive_child();
        ASSERT_EQ(sibling.parent_value(), c1_value);
    }

    ASSERT_EQ(c1.value(), c1_value);
    ASSERT_EQ(gc1.parent_value(), c1.value());
    ASSERT_EQ(c1.num_children(), static_cast<uint32_t>(51));
}

/**
 * @brief After n derivations the counter reads n.
 */
void test_generation_counting()
{
    Id root = Id::root();
    for (uint32_t n = 1; n <= 1000; ++n) {
        Id child = root.derive_child();
        ASSERT_EQ(root.num_children(), n);
        ASSERT_EQ(child.depth(), root.depth() + 1);
    }
}

/**
 * @brief The counter wraps to zero after 2^32 children instead of failing.
 */
void test_generation_counter_wraps()
{
    Id saturated = Id::from_parts(0, 0, 0, UINT32_MAX);
    Id child = saturated.derive_child();

    ASSERT_EQ(saturated.num_children(), static_cast<uint32_t>(0));
    ASSERT_EQ(child.local(), static_cast<uint64_t>(0x0c8210784d8af5a5ULL));
    ASSERT_EQ(child.depth(), static_cast<uint32_t>(1));

    // The next child reuses the hash input of the root's first child.
    Id again = saturated.derive_child();
    ASSERT_EQ(again.local(), static_cast<uint64_t>(0x6c87646ff7553914ULL));
}

/**
 * @brief Depth wraps the same way as the counter.
 */
void test_depth_wraps()
{
    Id deepest = Id::from_parts(7, 9, UINT32_MAX, 0);
    Id child = deepest.derive_child();
    ASSERT_EQ(child.depth(), static_cast<uint32_t>(0));
    ASSERT_EQ(child.parent_value(), deepest.value());
}

/**
 * @brief Identical call sequences produce bit-identical trees.
 */
void test_determinism()
{
    auto walk = []() {
        std::vector<Id> out;
        Id root = Id::root();
        for (int i = 0; i < 8; ++i) {
            Id child = root.derive_child();
            for (int j = 0; j < 4; ++j) {
                out.push_back(child.derive_child());
            }
            out.push_back(child);
        }
        out.push_back(root);
        return out;
    };

    std::vector<Id> first = walk();
    std::vector<Id> second = walk();
    ASSERT_EQ(first.size(), second.size());

    for (std::size_t i = 0; i < first.size(); ++i) {
        ASSERT_EQ(first[i].local(), second[i].local());
        ASSERT_EQ(first[i].parent_value(), second[i].parent_value());
        ASSERT_EQ(first[i].depth(), second[i].depth());
        ASSERT_EQ(first[i].num_children(), second[i].num_children());
        ASSERT_EQ(first[i].value(), second[i].value());
    }
}

/**
 * @brief Siblings differ because the post-increment counter is hashed.
 */
void test_sibling_distinctness()
{
    Id root = Id::root();
    Id child = root.derive_child();

    std::unordered_set<uint64_t> locals;
    for (int i = 0; i < 5000; ++i) {
        locals.insert(child.derive_child().local());
    }
    ASSERT_EQ(locals.size(), static_cast<std::size_t>(5000));
}

/**
 * @brief Ordering compares depth only, so equal-depth ids are equivalent.
 */
void test_depth_only_ordering()
{
    Id root = Id::root();
    Id c1 = root.derive_child();
    Id c2 = root.derive_child();
    Id gc = c2.derive_child();

    ASSERT_TRUE(root < c1);
    ASSERT_TRUE(c1 < gc);
    ASSERT_TRUE(gc > root);
    ASSERT_TRUE(root <= c1);
    ASSERT_TRUE(gc >= c1);

    // Same depth, different values: neither is less than the other.
    ASSERT_NE(c1, c2);
    ASSERT_FALSE(c1 < c2);
    ASSERT_FALSE(c2 < c1);
    ASSERT_TRUE(c1 <= c2);
    ASSERT_TRUE(c2 <= c1);

    // A huge value at a shallow depth still sorts before a deeper id.
    Id big = Id::from_parts(UINT64_MAX, ~static_cast<u128>(0) >> 1, 0, 0);
    ASSERT_TRUE(big < gc);

    std::vector<Id> ids = {gc, c1, root, c2};
    std::stable_sort(ids.begin(), ids.end());
    ASSERT_EQ(ids[0].depth(), static_cast<uint32_t>(0));
    ASSERT_EQ(ids[1], c1);
    ASSERT_EQ(ids[2], c2);
    ASSERT_EQ(ids[3].depth(), static_cast<uint32_t>(2));
}

/**
 * @brief Equality and hashing follow the derived value, not the raw fields.
 */
void test_equality_and_hash_use_value()
{
    // (1 + 1) * (0 ^ 3) == (0 + 1) * (0 ^ 6)
    Id a = Id::from_parts(3, 0, 1, 0);
    Id b = Id::from_parts(6, 0, 0, 9);
    ASSERT_EQ(a.value(), b.value());
    ASSERT_TRUE(a == b);
    ASSERT_EQ(std::hash<Id>{}(a), std::hash<Id>{}(b));

    Id root = Id::root();
    Id c1 = root.derive_child();
    ASSERT_TRUE(c1 != root);
    ASSERT_EQ(lineage::core::hash_value(root), static_cast<uint64_t>(0x88201fb960ff6465ULL));
    ASSERT_EQ(lineage::core::hash_value(c1), static_cast<uint64_t>(0x6afdb637a781dd25ULL));

    std::unordered_set<Id> set;
    set.insert(a);
    ASSERT_FALSE(set.insert(b).second);
    ASSERT_TRUE(set.insert(c1).second);
}

/**
 * @brief Text form is `0x` plus the unpadded lowercase hex of the value.
 */
void test_display()
{
    Id root = Id::root();
    ASSERT_EQ(root.to_string(), std::string("0x0"));

    Id c1 = root.derive_child();
    ASSERT_EQ(c1.to_string(), std::string("0xd90ec8dfeeaa7228"));

    Id gc = c1.derive_child();
    std::ostringstream os;
    os << gc;
    ASSERT_EQ(os.str(), std::string("0x1f806d8c5233225fe"));
}

/**
 * @brief Copies are independent: deriving from one does not touch the other.
 */
void test_copies_are_independent()
{
    Id root = Id::root();
    Id copy = root;

    Id a = root.derive_child();
    ASSERT_EQ(copy.num_children(), static_cast<uint32_t>(0));

    Id b = copy.derive_child();
    ASSERT_EQ(a, b);
    ASSERT_EQ(a.local(), b.local());
}
