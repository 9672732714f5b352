#include <gtest/gtest.h>
#include <gmock/gmock.h>

#include "hash_index.hpp"

#include <algorithm>

namespace {

using doppel::Fingerprint;
using doppel::HashIndex;
using ::testing::ElementsAre;
using ::testing::UnorderedElementsAre;

const Fingerprint A(0x1111111111111111ULL);
const Fingerprint B(0x2222222222222222ULL);
const Fingerprint C(0x3333333333333333ULL);

TEST(HashIndexTest, Empty_ByDefault) {
    HashIndex index;
    EXPECT_TRUE(index.empty());
    EXPECT_EQ(index.size(), 0u);
    EXPECT_EQ(index.pathCount(), 0u);
    EXPECT_EQ(index.find(A), nullptr);
    EXPECT_FALSE(index.contains(A));
}

TEST(HashIndexTest, Insert_GroupsPathsByFingerprint) {
    HashIndex index;
    EXPECT_TRUE(index.insert(A, "x/1.png"));
    EXPECT_TRUE(index.insert(A, "x/2.png"));
    EXPECT_TRUE(index.insert(B, "y/3.png"));

    EXPECT_EQ(index.size(), 2u);
    EXPECT_EQ(index.pathCount(), 3u);
    ASSERT_NE(index.find(A), nullptr);
    EXPECT_THAT(*index.find(A), ElementsAre("x/1.png", "x/2.png"));
    EXPECT_THAT(*index.find(B), ElementsAre("y/3.png"));
}

TEST(HashIndexTest, Insert_DuplicatePathIsIgnored) {
    HashIndex index;
    EXPECT_TRUE(index.insert(A, "same.png"));
    EXPECT_FALSE(index.insert(A, "same.png"));
    EXPECT_EQ(index.pathCount(), 1u);
}

TEST(HashIndexTest, Insert_SamePathUnderTwoFingerprintsIsKeptTwice) {
    HashIndex index;
    index.insert(A, "p.png");
    index.insert(B, "p.png");
    EXPECT_EQ(index.size(), 2u);
    EXPECT_EQ(index.pathCount(), 2u);
}

TEST(HashIndexTest, Merge_UnionsPathSetsPerKey) {
    HashIndex left;
    left.insert(A, "1");
    left.insert(B, "2");

    HashIndex right;
    right.insert(A, "3");
    right.insert(A, "1");
    right.insert(C, "4");

    left.merge(right);

    EXPECT_EQ(left.size(), 3u);
    EXPECT_THAT(*left.find(A), ElementsAre("1", "3"));
    EXPECT_THAT(*left.find(B), ElementsAre("2"));
    EXPECT_THAT(*left.find(C), ElementsAre("4"));
    // Copy merge leaves the source untouched
    EXPECT_EQ(right.pathCount(), 3u);
}

TEST(HashIndexTest, Merge_MoveMatchesCopyMerge) {
    HashIndex base;
    base.insert(A, "1");
    base.insert(B, "2");

    HashIndex extra;
    extra.insert(A, "3");
    extra.insert(C, "4");

    HashIndex viaCopy = base;
    viaCopy.merge(extra);

    HashIndex viaMove = base;
    viaMove.merge(std::move(extra));

    EXPECT_EQ(viaCopy, viaMove);
}

TEST(HashIndexTest, Merge_IntoEmptyTakesEverything) {
    HashIndex source;
    source.insert(A, "1");
    source.insert(A, "2");

    HashIndex target;
    target.merge(std::move(source));
    EXPECT_EQ(target.pathCount(), 2u);
}

TEST(HashIndexTest, Merge_IsCommutativeAndIdempotent) {
    HashIndex x;
    x.insert(A, "1");
    x.insert(B, "2");
    HashIndex y;
    y.insert(B, "3");
    y.insert(C, "4");

    HashIndex xy = x;
    xy.merge(y);
    HashIndex yx = y;
    yx.merge(x);
    EXPECT_EQ(xy, yx);

    HashIndex twice = xy;
    twice.merge(y);
    EXPECT_EQ(twice, xy);
}

TEST(HashIndexTest, RemovePath_DropsEntryWithLastPath) {
    HashIndex index;
    index.insert(A, "1");
    index.insert(A, "2");

    EXPECT_TRUE(index.removePath(A, "1"));
    EXPECT_TRUE(index.contains(A));
    EXPECT_TRUE(index.removePath(A, "2"));
    EXPECT_FALSE(index.contains(A));
    EXPECT_TRUE(index.empty());
}

TEST(HashIndexTest, RemovePath_UnknownReturnsFalse) {
    HashIndex index;
    index.insert(A, "1");
    EXPECT_FALSE(index.removePath(A, "missing"));
    EXPECT_FALSE(index.removePath(B, "1"));
    EXPECT_EQ(index.pathCount(), 1u);
}

TEST(HashIndexTest, Fingerprints_ListsDistinctKeys) {
    HashIndex index;
    index.insert(A, "1");
    index.insert(A, "2");
    index.insert(C, "3");
    EXPECT_THAT(index.fingerprints(), UnorderedElementsAre(A, C));
}

TEST(HashIndexTest, Iteration_VisitsEveryEntry) {
    HashIndex index;
    index.insert(A, "1");
    index.insert(B, "2");
    std::size_t seen = 0;
    for (const auto& [fp, paths] : index) {
        EXPECT_FALSE(paths.empty());
        ++seen;
    }
    EXPECT_EQ(seen, 2u);
}

} // namespace
