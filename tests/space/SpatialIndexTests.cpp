/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#define BOOST_TEST_MODULE SpatialIndexTests
#include <boost/test/unit_test.hpp>

#include "space/SpatialIndex.hpp"
#include <cstdint>
#include <vector>

using namespace GridForge;

namespace {

std::vector<uint64_t> values(const std::vector<EntityId>& ids) {
    std::vector<uint64_t> out;
    for (const EntityId& id : ids) {
        out.push_back(id.value());
    }
    return out;
}

std::vector<uint64_t> queryValues(const SpatialIndex& index, const Region& area) {
    std::vector<EntityId> ids;
    index.query(area, ids);
    return values(ids);
}

} // anonymous namespace

struct SpatialIndexFixture {
    SpatialIndex index{Bounds(10, 10)};
};

BOOST_FIXTURE_TEST_SUITE(SpatialIndexTests, SpatialIndexFixture)

BOOST_AUTO_TEST_CASE(TestInsertAndQuery) {
    index.insert(EntityId{3}, Region{1, 1, 2, 2});
    index.insert(EntityId{1}, Region::single(Position{5, 5}));
    index.insert(EntityId{2}, Region::single(Position{2, 2}));

    BOOST_CHECK_EQUAL(index.size(), 3);
    BOOST_CHECK_EQUAL(index.cellCount(), 5);

    const std::vector<uint64_t> expected{2, 3};
    BOOST_CHECK(queryValues(index, Region{2, 2, 1, 1}) == expected);

    const std::vector<uint64_t> all{1, 2, 3};
    BOOST_CHECK(queryValues(index, Region{0, 0, 10, 10}) == all);
}

BOOST_AUTO_TEST_CASE(TestQueryResultIsUnique) {
    index.insert(EntityId{7}, Region{0, 0, 3, 3});
    const std::vector<uint64_t> expected{7};
    BOOST_CHECK(queryValues(index, Region{0, 0, 2, 2}) == expected);
}

BOOST_AUTO_TEST_CASE(TestQueryClearsOutput) {
    index.insert(EntityId{1}, Region::single(Position{0, 0}));
    std::vector<EntityId> out{EntityId{99}};
    index.query(Region::single(Position{9, 9}), out);
    BOOST_CHECK(out.empty());
}

BOOST_AUTO_TEST_CASE(TestMoveUpdatesCells) {
    index.insert(EntityId{1}, Region{0, 0, 2, 1});
    index.move(EntityId{1}, Region{4, 4, 2, 1});

    BOOST_CHECK(!index.isOccupied(Position{0, 0}));
    BOOST_CHECK(index.isOccupied(Position{5, 4}));
    BOOST_REQUIRE(index.footprintOf(EntityId{1}).has_value());
    BOOST_CHECK(*index.footprintOf(EntityId{1}) == (Region{4, 4, 2, 1}));
    BOOST_CHECK_EQUAL(index.cellCount(), 2);
}

BOOST_AUTO_TEST_CASE(TestRemove) {
    index.insert(EntityId{1}, Region{0, 0, 2, 2});
    BOOST_CHECK(index.remove(EntityId{1}));
    BOOST_CHECK(!index.remove(EntityId{1}));
    BOOST_CHECK(!index.contains(EntityId{1}));
    BOOST_CHECK_EQUAL(index.cellCount(), 0);
    BOOST_CHECK(!index.footprintOf(EntityId{1}).has_value());
}

BOOST_AUTO_TEST_CASE(TestOccupantsAreSorted) {
    index.insert(EntityId{9}, Region::single(Position{3, 3}));
    index.insert(EntityId{4}, Region::single(Position{3, 3}));
    index.insert(EntityId{6}, Region{2, 2, 2, 2});

    const std::vector<uint64_t> expected{4, 6, 9};
    BOOST_CHECK(values(index.occupants(Position{3, 3})) == expected);
    BOOST_CHECK(index.occupants(Position{0, 0}).empty());
}

BOOST_AUTO_TEST_CASE(TestOverlapsOtherIgnoresSelf) {
    index.insert(EntityId{1}, Region{0, 0, 2, 2});
    BOOST_CHECK(!index.overlapsOther(Region{1, 1, 1, 1}, EntityId{1}));
    BOOST_CHECK(index.overlapsOther(Region{1, 1, 1, 1}, EntityId{2}));
    BOOST_CHECK(!index.overlapsOther(Region{2, 2, 1, 1}, EntityId{}));
}

BOOST_AUTO_TEST_CASE(TestClear) {
    index.insert(EntityId{1}, Region{0, 0, 2, 2});
    index.clear();
    BOOST_CHECK_EQUAL(index.size(), 0);
    BOOST_CHECK_EQUAL(index.cellCount(), 0);
}

BOOST_AUTO_TEST_SUITE_END()

BOOST_AUTO_TEST_SUITE(ToroidalIndexTests)

BOOST_AUTO_TEST_CASE(TestFootprintWrapsAcrossEdges) {
    SpatialIndex index(Bounds(4, 4, Topology::Toroidal));
    index.insert(EntityId{1}, Region{3, 3, 2, 2});

    BOOST_CHECK(index.isOccupied(Position{3, 3}));
    BOOST_CHECK(index.isOccupied(Position{0, 0}));
    BOOST_CHECK(index.isOccupied(Position{0, 3}));
    BOOST_CHECK(index.isOccupied(Position{-1, -1}));
    BOOST_CHECK(!index.isOccupied(Position{1, 1}));
}

BOOST_AUTO_TEST_CASE(TestUnwrappedQueryFindsWrappedEntities) {
    SpatialIndex index(Bounds(5, 5, Topology::Toroidal));
    index.insert(EntityId{1}, Region::single(Position{4, 0}));
    index.insert(EntityId{2}, Region::single(Position{2, 2}));

    // Dense walk over the area
    const std::vector<uint64_t> expected{1};
    BOOST_CHECK(queryValues(index, Region{-1, 0, 1, 1}) == expected);

    // Area larger than the occupied set takes the sparse path
    const std::vector<uint64_t> both{1, 2};
    BOOST_CHECK(queryValues(index, Region{-2, -2, 5, 5}) == both);
    const std::vector<uint64_t> onlyFirst{1};
    BOOST_CHECK(queryValues(index, Region{-2, -2, 3, 3}) == onlyFirst);
}

BOOST_AUTO_TEST_CASE(TestUnboundedIndex) {
    SpatialIndex index;
    index.insert(EntityId{1}, Region::single(Position{-500, 1200}));
    BOOST_CHECK(index.isOccupied(Position{-500, 1200}));
    const std::vector<uint64_t> expected{1};
    BOOST_CHECK(queryValues(index, Region{-501, 1199, 3, 3}) == expected);
}

BOOST_AUTO_TEST_SUITE_END()
