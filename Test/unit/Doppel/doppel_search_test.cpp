#include <gtest/gtest.h>
#include <gmock/gmock.h>

#include "cancellation.hpp"
#include "doppel_search.hpp"
#include "errors.hpp"

#include <random>
#include <stdexcept>
#include <vector>

namespace {

using doppel::CancellationToken;
using doppel::DoppelSearch;
using doppel::Fingerprint;
using doppel::HashIndex;
using doppel::ProgressInfo;
using doppel::ProgressStage;
using ::testing::ElementsAre;
using ::testing::IsEmpty;
using ::testing::Key;

const Fingerprint A(0x0000000000000000ULL);
const Fingerprint A1(0x0000000000000001ULL); // distance 1 from A
const Fingerprint B(0xffffffff00000000ULL);  // distance 32 from A

TEST(DoppelSearchTest, ExactDistance_GroupsPathsBySharedFingerprint) {
    HashIndex reference;
    reference.insert(A, "ref/a1.png");
    reference.insert(A, "ref/a2.png");
    reference.insert(B, "ref/b.png");

    HashIndex target;
    target.insert(A, "tgt/x.png");
    target.insert(A, "tgt/y.png");

    const auto result = doppel::findDoppelgaenger(reference, target, 0);

    EXPECT_THAT(result, ElementsAre(Key("ref/a1.png"), Key("ref/a2.png")));
    EXPECT_THAT(result.at("ref/a1.png"), ElementsAre("tgt/x.png", "tgt/y.png"));
    EXPECT_EQ(result.at("ref/a1.png"), result.at("ref/a2.png"));
}

TEST(DoppelSearchTest, ExactDistance_ThreeDistinctTargets) {
    const Fingerprint C(0x00000000ffffffffULL);

    HashIndex reference;
    reference.insert(A, "ref/a1.png");
    reference.insert(A, "ref/a2.png");
    reference.insert(B, "ref/b.png");

    HashIndex target;
    target.insert(A, "tgt/a.png");
    target.insert(B, "tgt/b.png");
    target.insert(C, "tgt/c.png");

    const auto result = doppel::findDoppelgaenger(reference, target, 0);
    ASSERT_EQ(result.size(), 3u);
    EXPECT_THAT(result.at("ref/a1.png"), ElementsAre("tgt/a.png"));
    EXPECT_THAT(result.at("ref/a2.png"), ElementsAre("tgt/a.png"));
    EXPECT_THAT(result.at("ref/b.png"), ElementsAre("tgt/b.png"));

    // Without an exact counterpart for B its path drops out
    ASSERT_TRUE(target.removePath(B, "tgt/b.png"));
    const auto withoutB = doppel::findDoppelgaenger(reference, target, 0);
    EXPECT_THAT(withoutB, ElementsAre(Key("ref/a1.png"), Key("ref/a2.png")));
}

TEST(DoppelSearchTest, DistanceIsInclusive) {
    HashIndex reference;
    reference.insert(A, "ref.png");
    HashIndex target;
    target.insert(A1, "near.png");
    target.insert(B, "far.png");

    EXPECT_THAT(doppel::findDoppelgaenger(reference, target, 0), IsEmpty());

    const auto one = doppel::findDoppelgaenger(reference, target, 1);
    EXPECT_THAT(one.at("ref.png"), ElementsAre("near.png"));

    const auto all = doppel::findDoppelgaenger(reference, target, 32);
    EXPECT_THAT(all.at("ref.png"), ElementsAre("far.png", "near.png"));
}

TEST(DoppelSearchTest, EmptyTargetOrReference_GivesEmptyResult) {
    HashIndex filled;
    filled.insert(A, "a.png");

    EXPECT_THAT(doppel::findDoppelgaenger(filled, HashIndex{}, 64), IsEmpty());
    EXPECT_THAT(doppel::findDoppelgaenger(HashIndex{}, filled, 64), IsEmpty());
}

TEST(DoppelSearchTest, SelfComparison_MapsEachPathToItsGroup) {
    HashIndex index;
    index.insert(A, "a.png");
    index.insert(A, "a-copy.png");
    index.insert(B, "b.png");

    const auto result = doppel::findDoppelgaenger(index, index, 0);
    EXPECT_THAT(result.at("a.png"), ElementsAre("a-copy.png", "a.png"));
    EXPECT_THAT(result.at("b.png"), ElementsAre("b.png"));
}

TEST(DoppelSearchTest, NegativeDistanceThrows) {
    HashIndex index;
    index.insert(A, "a.png");
    DoppelSearch search(index);
    EXPECT_THROW(search.find(index, -1), std::invalid_argument);
    EXPECT_THROW(search.matches(A, -5), std::invalid_argument);
}

TEST(DoppelSearchTest, Matches_ReportsDistances) {
    HashIndex target;
    target.insert(A1, "near.png");
    target.insert(B, "far.png");
    DoppelSearch search(target);

    EXPECT_EQ(search.targetSize(), 2u);
    const auto hits = search.matches(A, 1);
    ASSERT_EQ(hits.size(), 1u);
    EXPECT_EQ(hits[0].distance, 1);
    EXPECT_EQ(hits[0].fingerprint, A1);
}

TEST(DoppelSearchTest, CancelledTokenAbortsSearch) {
    HashIndex index;
    index.insert(A, "a.png");

    CancellationToken token;
    token.requestCancel();
    EXPECT_THROW(doppel::findDoppelgaenger(index, index, 0, &token), doppel::OperationCancelled);
}

TEST(DoppelSearchTest, ProgressCallbackReportsCompletion) {
    HashIndex reference;
    reference.insert(A, "a.png");
    reference.insert(B, "b.png");
    HashIndex target;
    target.insert(A, "x.png");

    std::vector<ProgressInfo> reports;
    (void)doppel::findDoppelgaenger(reference, target, 0, nullptr,
                                    [&reports](const ProgressInfo& info) { reports.push_back(info); });

    ASSERT_FALSE(reports.empty());
    EXPECT_EQ(reports.back().stage, ProgressStage::Search);
    EXPECT_EQ(reports.back().total, 2u);
    EXPECT_EQ(reports.back().completed, 2u);
    EXPECT_TRUE(reports.back().finished());
}

TEST(DoppelSearchTest, AgreesWithExhaustiveComparison) {
    std::mt19937_64 rng(17);
    HashIndex reference;
    HashIndex target;
    const std::uint64_t base = rng();
    for (int i = 0; i < 150; ++i) {
        reference.insert(Fingerprint(base ^ (rng() & rng() & rng())), "r" + std::to_string(i));
        target.insert(Fingerprint(base ^ (rng() & rng() & rng())), "t" + std::to_string(i));
    }

    for (int d : { 0, 4, 10, 20 }) {
        doppel::DoppelgaengerResult expected;
        for (const auto& [rfp, rpaths] : reference) {
            for (const auto& [tfp, tpaths] : target) {
                if (rfp.distance(tfp) > d) continue;
                for (const auto& rp : rpaths) expected[rp].insert(tpaths.begin(), tpaths.end());
            }
        }
        EXPECT_EQ(doppel::findDoppelgaenger(reference, target, d), expected) << "distance " << d;
    }
}

} // namespace
