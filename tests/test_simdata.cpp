// Tests for the telemetry record codec and the stream framing

#include <gtest/gtest.h>
#include "Logbook.h"

namespace {

SimDataTy MakeC172 ()
{
    SimDataTy sd;
    sd.icao         = "C172";
    sd.name         = "Cessna Skyhawk";
    sd.registration = "N172SP";
    sd.lat          = 34.717778;
    sd.lon          = 32.485556;
    sd.bEngineOn    = true;
    sd.bOnGround    = false;
    return sd;
}

}

TEST(SimDataTest, EncodeDecode) {
    const SimDataTy sd = MakeC172();
    const std::string csv = sd.ToCSV();
    EXPECT_EQ("C172,Cessna Skyhawk,N172SP,34.717778,32.485556,true,false", csv);
    EXPECT_EQ(sd, SimDataTy::FromCSV(csv));
}

TEST(SimDataTest, DecodeKeepsExactValues) {
    SimDataTy sd = MakeC172();
    sd.lat = 0.1 + 0.2;             // needs 17 digits
    sd.lon = -179.99999999999997;
    EXPECT_EQ(sd, SimDataTy::FromCSV(sd.ToCSV()));
}

TEST(SimDataTest, DecodeEmptyStrings) {
    const SimDataTy sd = SimDataTy::FromCSV(",,,1.5,-2.5,false,true");
    EXPECT_TRUE(sd.icao.empty());
    EXPECT_TRUE(sd.name.empty());
    EXPECT_TRUE(sd.registration.empty());
    EXPECT_EQ(1.5, sd.lat);
    EXPECT_EQ(-2.5, sd.lon);
    EXPECT_FALSE(sd.bEngineOn);
    EXPECT_TRUE(sd.bOnGround);
}

TEST(SimDataTest, DecodeIgnoresExtraFields) {
    EXPECT_NO_THROW(SimDataTy::FromCSV("A320,Airbus,D-AIPA,50,8,true,true,extra"));
}

TEST(SimDataTest, DecodeTooFewFields) {
    EXPECT_THROW(SimDataTy::FromCSV("C172,Cessna,N172SP,34.7,32.4,true"), MalformedRecord);
    EXPECT_THROW(SimDataTy::FromCSV(""), MalformedRecord);
}

TEST(SimDataTest, DecodeBadFields) {
    EXPECT_THROW(SimDataTy::FromCSV("C172,Cessna,N172SP,north,32.4,true,false"), MalformedRecord);
    EXPECT_THROW(SimDataTy::FromCSV("C172,Cessna,N172SP,34.7,32.4x,true,false"), MalformedRecord);
    EXPECT_THROW(SimDataTy::FromCSV("C172,Cessna,N172SP,34.7,32.4,yes,false"), MalformedRecord);
    EXPECT_THROW(SimDataTy::FromCSV("C172,Cessna,N172SP,34.7,32.4,true,TRUE"), MalformedRecord);
}

TEST(SimDataTest, DecodeNonFiniteOrHex) {
    EXPECT_THROW(SimDataTy::FromCSV("a,b,c,nan,inf,true,true"), MalformedRecord);
    EXPECT_THROW(SimDataTy::FromCSV("a,b,c,34.7,-inf,true,true"), MalformedRecord);
    EXPECT_THROW(SimDataTy::FromCSV("a,b,c,INFINITY,32.4,true,true"), MalformedRecord);
    EXPECT_THROW(SimDataTy::FromCSV("a,b,c,0x1p3,32.4,true,true"), MalformedRecord);
    EXPECT_NO_THROW(SimDataTy::FromCSV("a,b,c,1e1,-3.5E-1,true,true"));
}

TEST(SimDataTest, EncodeReplacesCommasInText) {
    SimDataTy sd = MakeC172();
    sd.name         = "Cessna 172SP, G1000";
    sd.registration = "N1,72";
    const std::string csv = sd.ToCSV();
    EXPECT_EQ("C172,Cessna 172SP; G1000,N1;72,34.717778,32.485556,true,false", csv);
    
    const SimDataTy back = SimDataTy::FromCSV(csv);
    EXPECT_EQ("Cessna 172SP; G1000", back.name);
    EXPECT_EQ("N1;72", back.registration);
    EXPECT_DOUBLE_EQ(sd.lat, back.lat);
    EXPECT_DOUBLE_EQ(sd.lon, back.lon);
    EXPECT_TRUE(back.bEngineOn);
    EXPECT_FALSE(back.bOnGround);
}

TEST(SimDataTest, AircraftFromRecord) {
    const AircraftTy ac(MakeC172());
    EXPECT_EQ("Cessna Skyhawk", ac.title);
    EXPECT_EQ("C172", ac.icao);
    EXPECT_EQ("N172SP", ac.registration);
    EXPECT_DOUBLE_EQ(34.717778, ac.pos.lat);
    ASSERT_EQ(1u, ac.enginesOn.size());
    EXPECT_TRUE(ac.AnyEngineOn());
    EXPECT_FALSE(ac.bOnGround);
}

TEST(SimDataTest, AircraftEngines) {
    AircraftTy ac;
    EXPECT_TRUE(ac.AllEnginesOff());        // no engines at all
    ac.enginesOn = { false, false, true, false };
    EXPECT_TRUE(ac.AnyEngineOn());
    ac.enginesOn[2] = false;
    EXPECT_TRUE(ac.AllEnginesOff());
}

TEST(FramingTest, EncodeFrame) {
    const std::string frame = EncodeFrame("abc");
    ASSERT_EQ(5u, frame.size());
    EXPECT_EQ(3, frame[0]);
    EXPECT_EQ(0, frame[1]);
    EXPECT_EQ("abc", frame.substr(2));
    
    EXPECT_EQ(std::string(2, '\0'), EncodeFrame(""));
    EXPECT_NO_THROW(EncodeFrame(std::string(FRAME_MAX_LEN, 'x')));
    EXPECT_THROW(EncodeFrame(std::string(FRAME_MAX_LEN + 1, 'x')), std::length_error);
}

TEST(FramingTest, PartialFrameWaitsForRemainder) {
    // announces 10 bytes (0x0A00), only 5 are there yet
    const char head[] = { 0x0A, 0x00, 'h', 'e', 'l', 'l', 'o' };
    FrameReader reader;
    std::string rec;
    reader.Append(head, sizeof(head));
    EXPECT_FALSE(reader.NextFrame(rec));
    EXPECT_EQ(sizeof(head), reader.BufferedBytes());
    
    reader.Append("world", 5);
    ASSERT_TRUE(reader.NextFrame(rec));
    EXPECT_EQ("helloworld", rec);
    EXPECT_EQ(0u, reader.BufferedBytes());
}

TEST(FramingTest, SplitLengthPrefix) {
    const std::string frame = EncodeFrame(MakeC172().ToCSV());
    FrameReader reader;
    std::string rec;
    reader.Append(frame.data(), 1);
    EXPECT_FALSE(reader.NextFrame(rec));
    reader.Append(frame.data() + 1, frame.size() - 1);
    ASSERT_TRUE(reader.NextFrame(rec));
    EXPECT_EQ(MakeC172(), SimDataTy::FromCSV(rec));
}

TEST(FramingTest, SeveralFramesInOneChunk) {
    const std::string data = EncodeFrame("one") + EncodeFrame("") + EncodeFrame("three");
    FrameReader reader;
    reader.Append(data.data(), data.size());
    std::string rec;
    ASSERT_TRUE(reader.NextFrame(rec));
    EXPECT_EQ("one", rec);
    ASSERT_TRUE(reader.NextFrame(rec));
    EXPECT_EQ("", rec);
    ASSERT_TRUE(reader.NextFrame(rec));
    EXPECT_EQ("three", rec);
    EXPECT_FALSE(reader.NextFrame(rec));
}
