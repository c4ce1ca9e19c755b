// Tests for the airport lookup via the spatial index of the navigation database

#include <gtest/gtest.h>
#include "Logbook.h"

class NavDataTest : public ::testing::Test {
protected:
    NavDataTy navdata;
    
    void SetUp() override {
        navdata.Open(":memory:", NavDataTy::NAV_CREATE);
        navdata.Exec("create table airport ("
                     "airport_id integer primary key, ident varchar(4), "
                     "laty double, lonx double, "
                     "left_lonx double, right_lonx double, bottom_laty double, top_laty double)");
        navdata.Exec("insert into airport values "
                     "(1, 'LCPH', 34.717778, 32.485556, 32.47, 32.50, 34.70, 34.73),"
                     "(2, 'LCLK', 34.875,    33.624722, 33.60, 33.65, 34.86, 34.89),"
                     "(3, 'XBIG', 34.5,      32.5,      32.00, 33.00, 34.00, 35.00)");
    }
};

TEST_F(NavDataTest, IndexIsFilledOnce) {
    EXPECT_EQ(3, navdata.CreateSpatialIndex());
    EXPECT_EQ(0, navdata.CreateSpatialIndex());
    
    navdata.Exec("insert into airport values (4, 'LCRA', 34.59, 32.99, 32.97, 33.01, 34.57, 34.61)");
    EXPECT_EQ(1, navdata.CreateSpatialIndex());
}

TEST_F(NavDataTest, FindContaining) {
    navdata.CreateSpatialIndex();
    
    // Paphos lies within LCPH and within the larger XBIG: the smaller box wins
    std::optional<AirportTy> apt = navdata.FindContaining(latLonTy(34.717778, 32.485556));
    ASSERT_TRUE(apt.has_value());
    EXPECT_EQ("LCPH", apt->ident);
    EXPECT_EQ(1, apt->id);
    EXPECT_NEAR(34.717778, apt->pos.lat, 1e-9);
    EXPECT_TRUE(apt->bounds.contains(latLonTy(34.717778, 32.485556)));
    
    apt = navdata.FindContaining(latLonTy(34.875, 33.624722));
    ASSERT_TRUE(apt.has_value());
    EXPECT_EQ("LCLK", apt->ident);
    
    // only within the large box
    apt = navdata.FindContaining(latLonTy(34.2, 32.2));
    ASSERT_TRUE(apt.has_value());
    EXPECT_EQ("XBIG", apt->ident);
    
    // open sea
    EXPECT_FALSE(navdata.FindContaining(latLonTy(33.5, 31.0)).has_value());
}

TEST_F(NavDataTest, EqualBoxesPreferLowerId) {
    navdata.Exec("insert into airport values (9, 'LCP2', 34.717778, 32.485556, 32.47, 32.50, 34.70, 34.73)");
    navdata.CreateSpatialIndex();
    const std::optional<AirportTy> apt = navdata.FindContaining(latLonTy(34.717778, 32.485556));
    ASSERT_TRUE(apt.has_value());
    EXPECT_EQ("LCPH", apt->ident);
}

TEST_F(NavDataTest, BoxAcrossAntimeridian) {
    // Chatham Islands style box from 179.9 east to -179.9 west
    navdata.Exec("insert into airport values (5, 'NZCI', -43.81, -179.95, 179.90, -179.90, -43.85, -43.77)");
    EXPECT_EQ(4, navdata.CreateSpatialIndex());
    
    std::optional<AirportTy> apt = navdata.FindContaining(latLonTy(-43.81, 179.95));
    ASSERT_TRUE(apt.has_value());
    EXPECT_EQ("NZCI", apt->ident);
    EXPECT_DOUBLE_EQ(179.90, apt->bounds.left);
    EXPECT_DOUBLE_EQ(-179.90, apt->bounds.right);
    
    apt = navdata.FindContaining(latLonTy(-43.81, -179.95));
    ASSERT_TRUE(apt.has_value());
    EXPECT_EQ("NZCI", apt->ident);
    
    // same latitude, but outside the narrow box
    EXPECT_FALSE(navdata.FindContaining(latLonTy(-43.81, 179.5)).has_value());
    EXPECT_FALSE(navdata.FindContaining(latLonTy(-43.81, -179.5)).has_value());
}

TEST_F(NavDataTest, LookupWithoutIndexFails) {
    EXPECT_THROW(navdata.FindContaining(latLonTy(34.7, 32.4)), LBError);
}

TEST(NavDataOpenTest, MissingFileFails) {
    NavDataTy navdata;
    EXPECT_THROW(navdata.Open("does/not/exist.sqlite", NavDataTy::NAV_READ_ONLY), LBError);
    EXPECT_FALSE(navdata.isOpen());
}
