// =============================================================================
// SubcellGrid Tests
// =============================================================================

#include <gtest/gtest.h>
#include "nbp/error.hpp"
#include "nbp/subcell_grid.hpp"

#include <cmath>
#include <limits>

using namespace nbp;

TEST(SubcellGridTest, SmallestRowCountWithinSkin) {
    auto grid = SubcellGrid::compute(10.0, 3.4);
    EXPECT_EQ(grid.subcells_per_row(), 3);
    EXPECT_DOUBLE_EQ(grid.subcell_length(), 10.0 / 3.0);
    EXPECT_EQ(grid.num_cells(), 27u);

    auto fine = SubcellGrid::compute(20.0, 4.0);
    EXPECT_EQ(fine.subcells_per_row(), 5);
    EXPECT_DOUBLE_EQ(fine.subcell_length(), 4.0);
    EXPECT_LE(fine.subcell_length(), 4.0);
}

TEST(SubcellGridTest, RejectsDegenerateGrid) {
    // 10 / 2 = 5 <= 5 stops at two subcells per row
    EXPECT_THROW(SubcellGrid::compute(10.0, 5.0), ConfigurationError);
    EXPECT_THROW(SubcellGrid::compute(10.0, 7.0), ConfigurationError);
}

TEST(SubcellGridTest, RejectsSkinNotSmallerThanBox) {
    EXPECT_THROW(SubcellGrid::compute(10.0, 10.0), ConfigurationError);
    EXPECT_THROW(SubcellGrid::compute(10.0, 12.0), ConfigurationError);
}

TEST(SubcellGridTest, RejectsInvalidInputs) {
    EXPECT_THROW(SubcellGrid::compute(0.0, 1.0), ConfigurationError);
    EXPECT_THROW(SubcellGrid::compute(10.0, 0.0), ConfigurationError);
    EXPECT_THROW(SubcellGrid::compute(10.0, -1.0), ConfigurationError);
    EXPECT_THROW(SubcellGrid::compute(std::nan(""), 1.0), ConfigurationError);
}

TEST(SubcellGridTest, CellCoordinatesAndLinearId) {
    auto grid = SubcellGrid::compute(10.0, 3.4);
    auto c = grid.cell_coords(Vec3(9.99, 0.0, 5.0));
    EXPECT_EQ(c[0], 2);
    EXPECT_EQ(c[1], 0);
    EXPECT_EQ(c[2], 1);
    EXPECT_EQ(grid.cell_id(Vec3(9.99, 0.0, 5.0)), 2 + 0 * 3 + 1 * 9);
    EXPECT_EQ(grid.linear_id(2, 2, 2), 26);
}

TEST(SubcellGridTest, CoordinateJustBelowBoxMapsToLastCell) {
    auto grid = SubcellGrid::compute(10.0, 3.4);
    const double x = std::nextafter(10.0, 0.0);
    auto c = grid.cell_coords(Vec3(x, x, x));
    EXPECT_EQ(c[0], 2);
    EXPECT_EQ(c[1], 2);
    EXPECT_EQ(c[2], 2);
}

TEST(SubcellGridTest, OutOfRangeCoordinatesRaiseBoundsError) {
    auto grid = SubcellGrid::compute(10.0, 3.4);
    EXPECT_THROW(grid.cell_coords(Vec3(-0.1, 0.0, 0.0)), BoundsError);
    EXPECT_THROW(grid.cell_coords(Vec3(0.0, 10.5, 0.0)), BoundsError);
    EXPECT_THROW(grid.cell_coords(Vec3(0.0, 0.0, std::nan(""))), BoundsError);
    EXPECT_THROW(grid.cell_coords(Vec3(std::numeric_limits<double>::infinity(), 0.0, 0.0)), BoundsError);
}

TEST(SubcellGridTest, WrapCoord) {
    auto grid = SubcellGrid::compute(20.0, 4.0);
    EXPECT_EQ(grid.wrap_coord(-1), 4);
    EXPECT_EQ(grid.wrap_coord(5), 0);
    EXPECT_EQ(grid.wrap_coord(3), 3);
}

TEST(SubcellGridTest, LargestSupportedGrid) {
    // 1024 / 256 = 4 <= 4 stops exactly at the row limit
    auto grid = SubcellGrid::compute(1024.0, 4.0);
    EXPECT_EQ(grid.subcells_per_row(), SubcellGrid::kMaxSubcellsPerRow);
    EXPECT_EQ(grid.num_cells(), size_t(256) * 256 * 256);
    EXPECT_EQ(grid.linear_id(255, 255, 255), 256 * 256 * 256 - 1);
}

TEST(SubcellGridTest, RejectsGridTooLargeToIndex) {
    EXPECT_THROW(SubcellGrid::compute(1028.0, 4.0), ConfigurationError);
    // 2500 rows per axis would overflow a 32-bit cell count
    EXPECT_THROW(SubcellGrid::compute(10000.0, 4.0), ConfigurationError);
    EXPECT_THROW(SubcellGrid::compute(1.0e12, 1.0e-3), ConfigurationError);
}
