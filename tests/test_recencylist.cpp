// test/test_recencylist.cpp
#include <string>
#include <vector>

#include "gtest/gtest.h"

#include "../src/cache/RecencyList.hpp"

using List = RecencyList<std::string, int>;
using Entry = CacheEntry<std::string, int>;

namespace {

std::vector<std::string> keysOf(const List& list) {
    std::vector<std::string> keys;
    list.forEach([&keys](const Entry& entry) { keys.push_back(entry.key); });
    return keys;
}

} // namespace

TEST(RecencyListTest, EmptyList) {
    List list;
    EXPECT_TRUE(list.empty());
    EXPECT_EQ(list.front(), kNoSlot);
    EXPECT_EQ(list.back(), kNoSlot);
    EXPECT_EQ(list.slotCount(), 0u);
}

TEST(RecencyListTest, PushFrontOrdersNewestFirst) {
    List list;
    Slot a = list.pushFront(Entry{"A", 1, std::nullopt});
    list.pushFront(Entry{"B", 2, std::nullopt});
    Slot c = list.pushFront(Entry{"C", 3, std::nullopt});

    EXPECT_EQ(list.size(), 3u);
    EXPECT_EQ(list.front(), c);
    EXPECT_EQ(list.back(), a);
    EXPECT_EQ(keysOf(list), (std::vector<std::string>{"C", "B", "A"}));
}

TEST(RecencyListTest, MoveToFrontFromBackAndMiddle) {
    List list;
    Slot a = list.pushFront(Entry{"A", 1, std::nullopt});
    Slot b = list.pushFront(Entry{"B", 2, std::nullopt});
    list.pushFront(Entry{"C", 3, std::nullopt});

    list.moveToFront(a);
    EXPECT_EQ(keysOf(list), (std::vector<std::string>{"A", "C", "B"}));
    EXPECT_EQ(list.back(), b);

    list.moveToFront(list.front());
    EXPECT_EQ(keysOf(list), (std::vector<std::string>{"A", "C", "B"}));
}

TEST(RecencyListTest, EraseRelinksNeighbours) {
    List list;
    Slot a = list.pushFront(Entry{"A", 1, std::nullopt});
    Slot b = list.pushFront(Entry{"B", 2, std::nullopt});
    Slot c = list.pushFront(Entry{"C", 3, std::nullopt});

    list.erase(b);
    EXPECT_EQ(keysOf(list), (std::vector<std::string>{"C", "A"}));
    EXPECT_FALSE(list.occupied(b));

    list.erase(c);
    list.erase(a);
    EXPECT_TRUE(list.empty());
    EXPECT_EQ(list.front(), kNoSlot);
    EXPECT_EQ(list.back(), kNoSlot);
}

TEST(RecencyListTest, ErasedSlotIsReused) {
    List list;
    list.pushFront(Entry{"A", 1, std::nullopt});
    Slot b = list.pushFront(Entry{"B", 2, std::nullopt});
    list.erase(b);

    Slot d = list.pushFront(Entry{"D", 4, std::nullopt});
    EXPECT_EQ(d, b);
    EXPECT_EQ(list.slotCount(), 2u);
    EXPECT_EQ(list.entry(d).key, "D");
}

TEST(RecencyListTest, ClearReleasesArena) {
    List list;
    list.pushFront(Entry{"A", 1, std::nullopt});
    list.pushFront(Entry{"B", 2, std::nullopt});
    list.clear();

    EXPECT_TRUE(list.empty());
    EXPECT_EQ(list.slotCount(), 0u);
    Slot a = list.pushFront(Entry{"A", 1, std::nullopt});
    EXPECT_EQ(a, 0u);
    EXPECT_EQ(list.back(), a);
}

TEST(RecencyListTest, EntryExpiryRule) {
    const auto now = CacheClock::now();
    Entry permanent{"p", 1, std::nullopt};
    Entry due{"d", 2, now};
    Entry later{"l", 3, now + std::chrono::seconds(1)};

    EXPECT_FALSE(permanent.isExpired(now));
    EXPECT_TRUE(due.isExpired(now));
    EXPECT_FALSE(later.isExpired(now));
}
