#include <gtest/gtest.h>
#include "circuit/column_occupancy.hpp"

using namespace plonkish;

class ColumnOccupancyTest : public ::testing::Test {
protected:
    // Measure a region that writes rows [0, rows) of every column in columns
    static RegionShape shape_of(RegionIndex index, const std::vector<AdviceColumn>& columns, size_t rows) {
        RegionShape shape(index);
        Region region(shape);
        for (const auto& column : columns) {
            for (size_t row = 0; row < rows; ++row) {
                region.assign_advice("cell", column, row, ValueFn());
            }
        }
        return shape;
    }

    AdviceColumn x_{0};
    AdviceColumn y_{1};
    AdviceColumn z_{2};
};

TEST_F(ColumnOccupancyTest, SharedColumnPushesSecondRegionDown) {
    ColumnOccupancy occupancy;
    EXPECT_EQ(occupancy.place(shape_of(0, {x_, y_}, 3)), 0u);
    EXPECT_EQ(occupancy.place(shape_of(1, {y_, z_}, 2)), 3u);

    EXPECT_EQ(occupancy.frontier(RegionColumn(Column(x_))), 3u);
    EXPECT_EQ(occupancy.frontier(RegionColumn(Column(y_))), 5u);
    EXPECT_EQ(occupancy.frontier(RegionColumn(Column(z_))), 5u);
}

TEST_F(ColumnOccupancyTest, DisjointRegionsShareRows) {
    ColumnOccupancy occupancy;
    EXPECT_EQ(occupancy.place(shape_of(0, {x_}, 4)), 0u);
    EXPECT_EQ(occupancy.place(shape_of(1, {y_}, 2)), 0u);
    EXPECT_EQ(occupancy.place(shape_of(2, {x_, y_}, 1)), 4u);
    EXPECT_EQ(occupancy.max_frontier(), 5u);
}

TEST_F(ColumnOccupancyTest, UnseenColumnsAreFree) {
    ColumnOccupancy occupancy;
    EXPECT_EQ(occupancy.frontier(RegionColumn(Column(z_))), 0u);
    EXPECT_EQ(occupancy.frontier(RegionColumn(Selector(4, true))), 0u);
}

TEST_F(ColumnOccupancyTest, NoTwoRegionsOverlapOnASharedColumn) {
    ColumnOccupancy occupancy;
    struct Placed { size_t start; size_t rows; std::vector<AdviceColumn> columns; };
    std::vector<Placed> placed;

    const std::vector<std::vector<AdviceColumn>> patterns = {{x_}, {x_, y_}, {z_}, {y_, z_}, {x_, z_}, {y_}};
    for (size_t i = 0; i < 24; ++i) {
        const auto& columns = patterns[i % patterns.size()];
        const size_t rows = 1 + (i * 7) % 5;
        placed.push_back({occupancy.place(shape_of(i, columns, rows)), rows, columns});
    }

    for (size_t i = 0; i < placed.size(); ++i) {
        for (size_t j = i + 1; j < placed.size(); ++j) {
            bool shared = false;
            for (const auto& c : placed[i].columns) {
                for (const auto& d : placed[j].columns) {
                    shared = shared || c == d;
                }
            }
            if (!shared) {
                continue;
            }
            // Later regions start at or after the end of earlier ones on shared columns
            EXPECT_GE(placed[j].start, placed[i].start + placed[i].rows) << i << " vs " << j;
        }
    }
}

TEST_F(ColumnOccupancyTest, FrontiersNeverMoveBackward) {
    ColumnOccupancy occupancy;
    occupancy.place(shape_of(0, {x_}, 6));
    occupancy.place(shape_of(1, {y_}, 1));
    // Spans both; x is already at 6, so y jumps to 7
    occupancy.place(shape_of(2, {x_, y_}, 1));
    EXPECT_EQ(occupancy.frontier(RegionColumn(Column(y_))), 7u);
    occupancy.place(shape_of(3, {y_}, 0));
    EXPECT_EQ(occupancy.frontier(RegionColumn(Column(y_))), 7u);
}

TEST_F(ColumnOccupancyTest, TakeRowAdvancesCursor) {
    ColumnOccupancy occupancy;
    RegionColumn constants(Column(0, ColumnType::Fixed));
    EXPECT_EQ(occupancy.take_row(constants), 0u);
    EXPECT_EQ(occupancy.take_row(constants), 1u);
    EXPECT_EQ(occupancy.frontier(constants), 2u);
}
