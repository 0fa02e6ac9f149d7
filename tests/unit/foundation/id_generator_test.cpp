#include <gtest/gtest.h>

#include <cctype>
#include <set>
#include <string>

#include "ark/foundation/id_generator.hpp"

using namespace ark::foundation;

TEST(SequenceIdGeneratorTest, StartsAtOneAndIncrements) {
    SequenceIdGenerator ids;
    EXPECT_EQ(ids.peek(), 1u);
    EXPECT_EQ(ids.next(), 1u);
    EXPECT_EQ(ids.next(), 2u);
    EXPECT_EQ(ids.peek(), 3u);
}

TEST(PersistentIdGeneratorTest, IdsAreSixteenHexDigits) {
    PersistentIdGenerator ids(42);
    auto id = ids.next();
    ASSERT_EQ(id.size(), 16u);
    for (char c : id) {
        EXPECT_TRUE(std::isxdigit(static_cast<unsigned char>(c))) << id;
    }
    EXPECT_TRUE(ids.contains(id));
}

TEST(PersistentIdGeneratorTest, IdsAreUnique) {
    PersistentIdGenerator ids;
    std::set<std::string> seen;
    for (int i = 0; i < 1000; ++i) {
        EXPECT_TRUE(seen.insert(ids.next()).second);
    }
}

TEST(PersistentIdGeneratorTest, SameSeedSameSequence) {
    PersistentIdGenerator a(7);
    PersistentIdGenerator b(7);
    EXPECT_EQ(a.next(), b.next());
}

TEST(PersistentIdGeneratorTest, ReserveRejectsDuplicates) {
    PersistentIdGenerator ids(1);
    EXPECT_TRUE(ids.reserve("00000000000000ff"));
    EXPECT_FALSE(ids.reserve("00000000000000ff"));
    EXPECT_TRUE(ids.contains("00000000000000ff"));
}

TEST(UuidTest, CanonicalVersionFourForm) {
    auto uuid = generateUuid();
    ASSERT_EQ(uuid.size(), 36u);
    EXPECT_EQ(uuid[8], '-');
    EXPECT_EQ(uuid[13], '-');
    EXPECT_EQ(uuid[18], '-');
    EXPECT_EQ(uuid[23], '-');
    EXPECT_EQ(uuid[14], '4');
    EXPECT_NE(std::string("89ab").find(uuid[19]), std::string::npos);
    EXPECT_NE(generateUuid(), uuid);
}
