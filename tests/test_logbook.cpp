// Tests for the CSV logbook file

#include <gtest/gtest.h>
#include "Logbook.h"
#include <sstream>

class LogbookTest : public ::testing::Test {
protected:
    std::string path;
    
    void SetUp() override {
        path = ::testing::TempDir() + "logbook_test_" +
               ::testing::UnitTest::GetInstance()->current_test_info()->name() + ".csv";
        std::remove(path.c_str());
    }
    
    void TearDown() override {
        std::remove(path.c_str());
    }
    
    std::vector<std::string> ReadLines () const {
        std::ifstream f(path, std::ios_base::binary);
        std::vector<std::string> lines;
        std::string ln;
        while (safeGetline(f, ln) && !ln.empty())
            lines.push_back(ln);
        return lines;
    }
    
    static FlightTy MakeFlight (const std::string& title) {
        AircraftTy ac;
        ac.title = title;
        ac.icao = "C172";
        ac.registration = "N172SP";
        FlightTy flight(ac);
        flight.state = FS_COMPLETE;
        flight.taxiOut = 1700000060;
        AirportTy apt;
        apt.ident = "LCPH";
        flight.departure = airportEventTy{ apt, 1700000120 };
        apt.ident = "LCLK";
        flight.arrival = airportEventTy{ apt, 1700001800 };
        flight.shutdown = 1700001900;
        return flight;
    }
};

static const char* HEADER_LINE =
    "Aircraft Name,Aircraft ICAO,Registration,Taxi Time,Departure ICAO,"
    "Departure Time,Arrival ICAO,Arrival Time,Shutdown Time";

TEST_F(LogbookTest, HeaderWrittenOnce) {
    {
        Logbook lb(path);
        lb.Log(MakeFlight("Cessna Skyhawk"));
    }
    {
        Logbook lb(path);
        lb.Log(MakeFlight("Cessna Skyhawk"));
    }
    const std::vector<std::string> lines = ReadLines();
    ASSERT_EQ(3u, lines.size());
    EXPECT_EQ(HEADER_LINE, lines[0]);
    const std::string rec =
        "Cessna Skyhawk,C172,N172SP,2023-11-14 22:14:20,LCPH,2023-11-14 22:15:20,"
        "LCLK,2023-11-14 22:43:20,2023-11-14 22:45:00";
    EXPECT_EQ(rec, lines[1]);
    EXPECT_EQ(rec, lines[2]);
}

TEST_F(LogbookTest, EmptyLogbookHasHeaderOnly) {
    {
        Logbook lb(path);
        EXPECT_EQ(path, lb.GetPath());
    }
    const std::vector<std::string> lines = ReadLines();
    ASSERT_EQ(1u, lines.size());
    EXPECT_EQ(HEADER_LINE, lines[0]);
}

TEST_F(LogbookTest, FieldsAreQuoted) {
    {
        Logbook lb(path);
        lb.Log(MakeFlight("Boeing 737-800, \"Ryanair\" livery"));
    }
    const std::vector<std::string> lines = ReadLines();
    ASSERT_EQ(2u, lines.size());
    EXPECT_EQ(0u, lines[1].find("\"Boeing 737-800, \"\"Ryanair\"\" livery\",C172,"));
}

TEST(CsvTest, Field) {
    EXPECT_EQ("plain", Logbook::CsvField("plain"));
    EXPECT_EQ("", Logbook::CsvField(""));
    EXPECT_EQ("\"a,b\"", Logbook::CsvField("a,b"));
    EXPECT_EQ("\"say \"\"hi\"\"\"", Logbook::CsvField("say \"hi\""));
    EXPECT_EQ("\"two\nlines\"", Logbook::CsvField("two\nlines"));
}

TEST(CsvTest, Line) {
    EXPECT_EQ("a,,\"b,c\"", Logbook::CsvLine({ "a", "", "b,c" }));
}

TEST(LogbookOpenTest, UnwritablePathFails) {
    EXPECT_THROW(Logbook("does/not/exist/logbook.csv"), LBError);
}
