// Tests for the geodesic functions on WGS84 and the coordinate helper types

#include <gtest/gtest.h>
#include "Logbook.h"

namespace {

const latLonTy LCPH (34.717778, 32.485556);     // Paphos
const latLonTy LCLK (34.875,    33.624722);     // Larnaca

double roundDec (double v, int dec)
{
    const double m = std::pow(10.0, dec);
    return std::round(v * m) / m;
}

}

TEST(CoordCalcTest, DistancePaphosLarnaca) {
    EXPECT_EQ(105698.0, std::round(CoordDistance(LCPH, LCLK)));
}

TEST(CoordCalcTest, DistanceIsSymmetric) {
    EXPECT_NEAR(CoordDistance(LCPH, LCLK), CoordDistance(LCLK, LCPH), 1e-6);
}

TEST(CoordCalcTest, DistanceToSelfIsZero) {
    double dist = -1.0, azi = -1.0;
    ASSERT_TRUE(CoordInverse(LCPH, LCPH, dist, azi));
    EXPECT_EQ(0.0, dist);
}

TEST(CoordCalcTest, SphereIsCloseToEllipsoid) {
    // haversine differs by less than 0.5% at this latitude
    const double dSphere = CoordDistanceSphere(LCPH.lat, LCPH.lon, LCLK.lat, LCLK.lon);
    EXPECT_NEAR(CoordDistance(LCPH, LCLK), dSphere, 0.005 * dSphere);
}

TEST(CoordCalcTest, Destination120NM) {
    const double dist = 120.0 * M_per_NM;
    const latLonTy dest = CoordPlusVector(LCPH, 54.0, dist);
    EXPECT_EQ(35.9, roundDec(dest.lat, 1));
    EXPECT_EQ(34.5, roundDec(dest.lon, 1));
    EXPECT_EQ(std::round(dist), std::round(CoordDistance(LCPH, dest)));
}

TEST(CoordCalcTest, BearingRoundTrip) {
    const double azi = CoordAngle(LCPH, LCLK);
    EXPECT_GE(azi, 0.0);
    EXPECT_LT(azi, 360.0);
    const latLonTy dest = CoordPlusVector(LCPH, azi, CoordDistance(LCPH, LCLK));
    EXPECT_NEAR(LCLK.lat, dest.lat, 1e-7);
    EXPECT_NEAR(LCLK.lon, dest.lon, 1e-7);
}

TEST(CoordCalcTest, DestinationAcrossAntimeridian) {
    const latLonTy dest = CoordPlusVector(latLonTy(0.0, 179.99), 90.0, 10000.0);
    EXPECT_LT(dest.lon, -179.0);
    EXPECT_GE(dest.lon, -180.0);
}

TEST(CoordCalcTest, RoundTripAcrossAntimeridian) {
    const latLonTy a(-17.0, 179.9);
    const latLonTy dest = CoordPlusVector(a, 90.0, 100000.0);
    EXPECT_LT(dest.lon, -179.0);
    
    // solved on the ellipsoid, not by the spherical fallback
    double dist = NAN, azi = NAN;
    ASSERT_TRUE(CoordInverse(a, dest, dist, azi));
    EXPECT_NEAR(100000.0, dist, 1.0);
    EXPECT_NEAR(90.0, azi, 1e-6);
    EXPECT_NEAR(100000.0, CoordDistance(a, dest), 1.0);
    EXPECT_NEAR(100000.0, CoordDistance(dest, a), 1.0);
}

TEST(CoordCalcTest, RoundTripAcrossPole) {
    struct { double lat, lon, heading; } cases[] = {
        {  89.5,  30.0,   0.0 },
        {  89.9,   0.0,  10.0 },
        { -89.9, -45.0, 172.5 },
        {  77.6, 120.0,   7.5 },
    };
    for (const auto& c: cases) {
        const latLonTy a(c.lat, c.lon);
        const latLonTy dest = CoordPlusVector(a, c.heading, 100000.0);
        double dist = NAN, azi = NAN;
        ASSERT_TRUE(CoordInverse(a, dest, dist, azi)) << "from " << a.dbgTxt();
        EXPECT_NEAR(100000.0, dist, 1.0) << "from " << a.dbgTxt();
        EXPECT_NEAR(100000.0, CoordDistance(a, dest), 1.0) << "from " << a.dbgTxt();
    }
    
    // a long line passing the pole
    const latLonTy a(77.6, 120.0);
    const latLonTy dest = CoordPlusVector(a, 7.5, 5000000.0);
    EXPECT_NEAR(5000000.0, CoordDistance(a, dest), 1.0);
}

TEST(CoordCalcTest, DistanceXYAcrossAntimeridian) {
    const latLonTy a(-17.0, 179.9);
    const ptTy east = CoordDistanceXY(a, CoordPlusVector(a, 90.0, 100000.0));
    EXPECT_NEAR(100000.0, east.x, 1.0);
    EXPECT_NEAR(0.0, east.y, 1.0);
    
    const latLonTy b(10.0, -179.95);
    const ptTy west = CoordDistanceXY(b, CoordPlusVector(b, 270.0, 50000.0));
    EXPECT_NEAR(-50000.0, west.x, 1.0);
    EXPECT_NEAR(0.0, west.y, 1.0);
}

TEST(CoordCalcTest, DistanceXYQuadrants) {
    struct { double heading, x, y; } cases[] = {
        {   0.0,   0.0,  10.0 },
        {  45.0,   7.0,   7.0 },
        {  90.0,  10.0,   0.0 },
        { 180.0,   0.0, -10.0 },
        { 270.0, -10.0,   0.0 },
    };
    for (const auto& c: cases) {
        const ptTy xy = CoordDistanceXY(LCPH, CoordPlusVector(LCPH, c.heading, 10.0));
        EXPECT_EQ(c.x, std::round(xy.x)) << "heading " << c.heading;
        EXPECT_EQ(c.y, std::round(xy.y)) << "heading " << c.heading;
    }
}

TEST(CoordCalcTest, HeadingToPoint) {
    EXPECT_NEAR(0.0, HeadingToPoint(0.0).x, 1e-12);
    EXPECT_NEAR(1.0, HeadingToPoint(0.0).y, 1e-12);
    EXPECT_NEAR(1.0, HeadingToPoint(90.0).x, 1e-12);
    EXPECT_NEAR(-1.0, HeadingToPoint(180.0).y, 1e-12);
    EXPECT_NEAR(-1.0, HeadingToPoint(270.0).x, 1e-12);
}

TEST(CoordCalcTest, DMS) {
    const dmsTy lat = dmsTy::FromLatitude(-34.5);
    EXPECT_EQ(34u, lat.deg);
    EXPECT_EQ(30u, lat.min);
    EXPECT_NEAR(0.0, lat.sec, 1e-9);
    EXPECT_EQ(CARD_S, lat.card);
    EXPECT_EQ("34°30'0.00\"S", std::string(lat));
    EXPECT_DOUBLE_EQ(-34.5, lat.ToDegrees());
    
    const latLonTy back = latLonTy::FromDMS(dmsTy::FromLatitude(LCPH.lat),
                                            dmsTy::FromLongitude(LCPH.lon));
    EXPECT_NEAR(LCPH.lat, back.lat, 1e-9);
    EXPECT_NEAR(LCPH.lon, back.lon, 1e-9);
}

TEST(CoordCalcTest, FromRadians) {
    const latLonTy pos = latLonTy::FromRadians(deg2rad(LCPH.lat), deg2rad(LCPH.lon));
    EXPECT_NEAR(LCPH.lat, pos.lat, 1e-12);
    EXPECT_NEAR(LCPH.lon, pos.lon, 1e-12);
}

TEST(CoordCalcTest, BoundingBoxContains) {
    const boundingBoxTy box(32.47, 32.50, 34.70, 34.73);
    EXPECT_TRUE(box.contains(LCPH));
    EXPECT_TRUE(box & latLonTy(34.70, 32.47));      // edges included
    EXPECT_FALSE(box.contains(LCLK));
    
    // box crossing the antimeridian
    const boundingBoxTy am(179.0, -179.0, -1.0, 1.0);
    EXPECT_TRUE(am.contains(latLonTy(0.0, 179.5)));
    EXPECT_TRUE(am.contains(latLonTy(0.0, -179.5)));
    EXPECT_FALSE(am.contains(latLonTy(0.0, 0.0)));
}
