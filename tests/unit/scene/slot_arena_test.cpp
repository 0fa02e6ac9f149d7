#include <gtest/gtest.h>

#include <memory>
#include <string>
#include <unordered_set>

#include "ark/scene/slot_arena.hpp"

using namespace ark::scene;

namespace {

struct Item {
    explicit Item(int v) : value(v) {}
    int value;
};

struct ItemTag {};
using ItemArena = SlotArena<Item, ItemTag>;

} // namespace

TEST(HandleTest, PacksIndexAndVersion) {
    Handle<ItemTag> h(42, 3);
    EXPECT_EQ(h.index(), 42u);
    EXPECT_EQ(h.version(), 3u);
    EXPECT_TRUE(h.isValid());
}

TEST(HandleTest, DefaultIsInvalid) {
    Handle<ItemTag> h;
    EXPECT_FALSE(h.isValid());
    EXPECT_EQ(h, Handle<ItemTag>::invalid());
}

TEST(HandleTest, Hashable) {
    std::unordered_set<Handle<ItemTag>> set;
    set.insert(Handle<ItemTag>(1, 0));
    set.insert(Handle<ItemTag>(1, 1));
    set.insert(Handle<ItemTag>(1, 0));
    EXPECT_EQ(set.size(), 2u);
}

TEST(SlotArenaTest, InsertAndGet) {
    ItemArena arena;
    auto h = arena.Insert(std::make_unique<Item>(5));
    ASSERT_NE(arena.Get(h), nullptr);
    EXPECT_EQ(arena.Get(h)->value, 5);
    EXPECT_EQ(arena.Count(), 1u);
}

TEST(SlotArenaTest, ReleaseReturnsOwnershipAndInvalidatesHandle) {
    ItemArena arena;
    auto h = arena.Insert(std::make_unique<Item>(9));

    auto owned = arena.Release(h);
    ASSERT_NE(owned, nullptr);
    EXPECT_EQ(owned->value, 9);
    EXPECT_FALSE(arena.IsAlive(h));
    EXPECT_EQ(arena.Get(h), nullptr);
    EXPECT_EQ(arena.Count(), 0u);
}

TEST(SlotArenaTest, DoubleReleaseIsHarmless) {
    ItemArena arena;
    auto h = arena.Insert(std::make_unique<Item>(1));
    EXPECT_NE(arena.Release(h), nullptr);
    EXPECT_EQ(arena.Release(h), nullptr);
}

TEST(SlotArenaTest, RecycledSlotGetsNewVersion) {
    ItemArena arena;
    auto first = arena.Insert(std::make_unique<Item>(1));
    (void)arena.Release(first);

    auto second = arena.Insert(std::make_unique<Item>(2));
    EXPECT_EQ(second.index(), first.index());
    EXPECT_NE(second.version(), first.version());

    // The stale handle never reaches the new occupant.
    EXPECT_EQ(arena.Get(first), nullptr);
    EXPECT_EQ(arena.Get(second)->value, 2);
    EXPECT_EQ(arena.Capacity(), 1u);
}

TEST(SlotArenaTest, FreeSlotsAreReusedOldestFirst) {
    ItemArena arena;
    auto a = arena.Insert(std::make_unique<Item>(1));
    auto b = arena.Insert(std::make_unique<Item>(2));
    (void)arena.Insert(std::make_unique<Item>(3));

    (void)arena.Release(b);
    (void)arena.Release(a);

    EXPECT_EQ(arena.Insert(std::make_unique<Item>(4)).index(), b.index());
    EXPECT_EQ(arena.Insert(std::make_unique<Item>(5)).index(), a.index());
}

TEST(SlotArenaTest, InvalidHandleIsNotAlive) {
    ItemArena arena;
    EXPECT_FALSE(arena.IsAlive(Handle<ItemTag>::invalid()));
    EXPECT_FALSE(arena.IsAlive(Handle<ItemTag>(7, 0)));
}
