// Tests for the native record decoder and the polling connection with a scripted dispatch source

#include <gtest/gtest.h>
#include "Logbook.h"
#include <deque>

namespace {

/// Appends a double in little-endian byte order
void PutF64 (std::vector<unsigned char>& rec, double d)
{
    uint64_t u = 0;
    memcpy(&u, &d, sizeof(u));
    for (int i = 0; i < 8; ++i)
        rec.push_back((unsigned char)((u >> (8*i)) & 0xFF));
}

/// Appends a string zero-padded to the field length
void PutStr (std::vector<unsigned char>& rec, const std::string& s, size_t len)
{
    std::vector<unsigned char> field(len, 0);
    memcpy(field.data(), s.data(), std::min(s.size(), len));
    rec.insert(rec.end(), field.begin(), field.end());
}

std::vector<unsigned char> MakeRecord (const std::string& title,
                                       std::array<double,4> combustion,
                                       double latDeg, double lonDeg, bool bOnGround,
                                       const std::string& atcId)
{
    std::vector<unsigned char> rec;
    PutStr(rec, title, MSFS_TITLE_LEN);
    for (double c: combustion)
        PutF64(rec, c);
    PutF64(rec, deg2rad(latDeg));
    PutF64(rec, deg2rad(lonDeg));
    PutF64(rec, bOnGround ? 1.0 : 0.0);
    PutStr(rec, atcId, MSFS_ATC_ID_LEN);
    return rec;
}

/// Dispatch source returning scripted messages, then nothing
msfsDispatchFnTy Script (std::deque<msfsDispatchTy> msgs)
{
    auto q = std::make_shared<std::deque<msfsDispatchTy>>(std::move(msgs));
    return [q]() {
        if (q->empty())
            return msfsDispatchTy();
        msfsDispatchTy d = q->front();
        q->pop_front();
        return d;
    };
}

msfsDispatchTy Disp (msfsDispatchE type)
{
    msfsDispatchTy d;
    d.type = type;
    return d;
}

msfsDispatchTy DataDisp (std::vector<unsigned char> rec, unsigned defineId = MSFS_DEFINE_ID)
{
    msfsDispatchTy d;
    d.type = MSFS_DISP_DATA;
    d.defineId = defineId;
    d.data = std::move(rec);
    return d;
}

}

TEST(MsfsDecodeTest, RecordLength) {
    EXPECT_EQ(216u, MSFS_RECORD_LEN);
    EXPECT_EQ(MSFS_RECORD_LEN, MakeRecord("x", {0,0,0,0}, 0, 0, false, "y").size());
}

TEST(MsfsDecodeTest, DecodeAllFields) {
    const std::vector<unsigned char> rec =
        MakeRecord("Airbus A320neo", {0.0, 1.0, 0.0, 0.0}, 34.717778, 32.485556, true, "D-AINA");
    const AircraftTy ac = MsfsDecodeRecord(rec.data(), rec.size());
    EXPECT_EQ("Airbus A320neo", ac.title);
    EXPECT_EQ(MSFS_ICAO_UNKNOWN, ac.icao);
    EXPECT_EQ("D-AINA", ac.registration);
    EXPECT_NEAR(34.717778, ac.pos.lat, 1e-9);
    EXPECT_NEAR(32.485556, ac.pos.lon, 1e-9);
    EXPECT_TRUE(ac.bOnGround);
    ASSERT_EQ(4u, ac.enginesOn.size());
    EXPECT_FALSE(ac.enginesOn[0]);
    EXPECT_TRUE(ac.enginesOn[1]);
    EXPECT_TRUE(ac.AnyEngineOn());
}

TEST(MsfsDecodeTest, AllEnginesOff) {
    const std::vector<unsigned char> rec =
        MakeRecord("Cessna", {0.0, 0.0, 0.0, 0.0}, 0.0, 0.0, false, "N1");
    EXPECT_TRUE(MsfsDecodeRecord(rec.data(), rec.size()).AllEnginesOff());
}

TEST(MsfsDecodeTest, ShortRecordRejected) {
    std::vector<unsigned char> rec = MakeRecord("Cessna", {1,1,1,1}, 0, 0, false, "N1");
    rec.pop_back();
    EXPECT_THROW(MsfsDecodeRecord(rec.data(), rec.size()), MalformedRecord);
    EXPECT_THROW(MsfsDecodeRecord(nullptr, 0), MalformedRecord);
}

TEST(MsfsDecodeTest, UnterminatedStringRejected) {
    std::vector<unsigned char> rec = MakeRecord("", {1,1,1,1}, 0, 0, false, "N1");
    std::fill(rec.begin(), rec.begin() + MSFS_TITLE_LEN, 'A');
    EXPECT_THROW(MsfsDecodeRecord(rec.data(), rec.size()), MalformedRecord);
}

TEST(MsfsConnectionTest, ScriptedSession) {
    MsfsConnection conn(Script({
        Disp(MSFS_DISP_OPEN),
        Disp(MSFS_DISP_NONE),
        DataDisp(MakeRecord("Cessna", {1,0,0,0}, 34.7, 32.4, true, "N1")),
        Disp(MSFS_DISP_OTHER),
        DataDisp(MakeRecord("Cessna", {1,0,0,0}, 34.7, 32.4, true, "N1"), MSFS_DEFINE_ID + 1),
        DataDisp(std::vector<unsigned char>(100, 0)),
        Disp(MSFS_DISP_QUIT),
    }), 100);
    
    EXPECT_EQ(SIM_MSG_OPEN, conn.NextMessage().type);
    
    // the empty dispatch is skipped within the polling interval
    const SimMessageTy msg = conn.NextMessage();
    ASSERT_EQ(SIM_MSG_TELEMETRY, msg.type);
    EXPECT_EQ("Cessna", msg.ac.title);
    EXPECT_EQ("N1", msg.ac.registration);
    
    EXPECT_EQ(SIM_MSG_UNKNOWN, conn.NextMessage().type);    // other message
    EXPECT_EQ(SIM_MSG_UNKNOWN, conn.NextMessage().type);    // foreign definition
    EXPECT_EQ(SIM_MSG_UNKNOWN, conn.NextMessage().type);    // undecodable record
    EXPECT_EQ(SIM_MSG_QUIT, conn.NextMessage().type);
}

TEST(MsfsConnectionTest, WaitingAfterPollingInterval) {
    MsfsConnection conn(Script({}), 100);
    const auto t0 = std::chrono::steady_clock::now();
    EXPECT_EQ(SIM_MSG_WAITING, conn.NextMessage().type);
    const auto dt = std::chrono::steady_clock::now() - t0;
    EXPECT_GE(dt, std::chrono::milliseconds(100));
    EXPECT_LT(dt, std::chrono::milliseconds(1000));
}

TEST(MsfsConnectionTest, ThroughSimConnection) {
    SimConnection conn(MsfsConnection(Script({ Disp(MSFS_DISP_OPEN) }), 100));
    EXPECT_STREQ(SIM_NAME_MSFS, conn.Name());
    EXPECT_EQ(SIM_MSG_OPEN, conn.NextMessage().type);
    EXPECT_EQ(SIM_MSG_WAITING, conn.NextMessage().type);
}

#if !IBM
TEST(MsfsConnectionTest, SimConnectUnavailable) {
    EXPECT_THROW(MsfsConnection::ConnectSimConnect(LOGBOOK), LBError);
}
#endif
