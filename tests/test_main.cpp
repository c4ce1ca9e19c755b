// Tests for the processing of simulator messages by the main loop

#include <gtest/gtest.h>
#include "Logbook.h"

class MainLoopTest : public ::testing::Test {
protected:
    NavDataTy navdata;
    FlightTracker tracker;
    std::string path;
    std::unique_ptr<Logbook> logbook;
    
    void SetUp() override {
        navdata.Open(":memory:", NavDataTy::NAV_CREATE);
        navdata.Exec("create table airport ("
                     "airport_id integer primary key, ident varchar(4), "
                     "laty double, lonx double, "
                     "left_lonx double, right_lonx double, bottom_laty double, top_laty double)");
        navdata.Exec("insert into airport values "
                     "(1, 'LCPH', 34.717778, 32.485556, 32.47, 32.50, 34.70, 34.73),"
                     "(2, 'LCLK', 34.875,    33.624722, 33.60, 33.65, 34.86, 34.89)");
        navdata.CreateSpatialIndex();
        
        path = ::testing::TempDir() + "logbook_main_" +
               ::testing::UnitTest::GetInstance()->current_test_info()->name() + ".csv";
        std::remove(path.c_str());
        logbook.reset(new Logbook(path));
    }
    
    void TearDown() override {
        logbook.reset();
        std::remove(path.c_str());
    }
    
    bool Process (const SimMessageTy& msg) {
        return LBMainProcessMsg(msg, SIM_NAME_XP12, navdata, tracker, *logbook);
    }
    
    static SimMessageTy Telemetry (const latLonTy& pos, bool bEngineOn, bool bOnGround) {
        AircraftTy ac;
        ac.title = "Cessna Skyhawk";
        ac.icao = "C172";
        ac.registration = "N172SP";
        ac.pos = pos;
        ac.enginesOn = { bEngineOn };
        ac.bOnGround = bOnGround;
        return SimMessageTy(ac);
    }
    
    size_t NumLines () const {
        std::ifstream f(path, std::ios_base::binary);
        size_t n = 0;
        std::string ln;
        while (safeGetline(f, ln) && !ln.empty())
            n++;
        return n;
    }
};

TEST_F(MainLoopTest, FlightIsLogged) {
    const latLonTy lcph(34.717778, 32.485556), lclk(34.875, 33.624722);
    const latLonTy sea(34.8, 33.0);
    
    EXPECT_TRUE(Process(SimMessageTy(SIM_MSG_OPEN)));
    EXPECT_TRUE(Process(Telemetry(lcph, false, true)));
    EXPECT_TRUE(Process(Telemetry(lcph, true, true)));
    EXPECT_TRUE(Process(SimMessageTy(SIM_MSG_WAITING)));
    EXPECT_TRUE(Process(Telemetry(lcph, true, false)));
    EXPECT_TRUE(Process(Telemetry(sea, true, false)));
    EXPECT_TRUE(Process(SimMessageTy(SIM_MSG_UNKNOWN)));
    EXPECT_TRUE(Process(Telemetry(lclk, true, true)));
    ASSERT_TRUE(tracker.HasFlight());
    ASSERT_TRUE(tracker.GetFlight()->departure.has_value());
    EXPECT_EQ("LCPH", tracker.GetFlight()->departure->apt.ident);
    EXPECT_EQ("LCLK", tracker.GetFlight()->arrival->apt.ident);
    
    EXPECT_TRUE(Process(Telemetry(lclk, false, true)));
    EXPECT_FALSE(tracker.HasFlight());
    EXPECT_EQ(2u, NumLines());                  // header and one flight
    
    EXPECT_FALSE(Process(SimMessageTy(SIM_MSG_QUIT)));
}

TEST_F(MainLoopTest, QuitDropsFlightInProgress) {
    const latLonTy lcph(34.717778, 32.485556);
    EXPECT_TRUE(Process(Telemetry(lcph, true, true)));
    ASSERT_TRUE(tracker.HasFlight());
    
    EXPECT_FALSE(Process(SimMessageTy(SIM_MSG_QUIT)));
    EXPECT_FALSE(tracker.HasFlight());
    EXPECT_EQ(1u, NumLines());                  // header only
}

TEST_F(MainLoopTest, TakeoffAwayFromAirportWaits) {
    const latLonTy sea(34.8, 33.0);
    Process(Telemetry(sea, true, true));
    Process(Telemetry(sea, true, false));
    ASSERT_TRUE(tracker.HasFlight());
    EXPECT_EQ(FS_TAXI, tracker.GetFlight()->state);
}
