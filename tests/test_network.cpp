// Tests for the TCP socket classes over the loopback interface

#include <gtest/gtest.h>
#include "Logbook.h"

namespace {

/// Retries `AcceptNew` until the expected number of clients is connected
bool WaitForClients (TCPBroadcaster& bc, int n)
{
    for (int i = 0; i < 100 && bc.NumClients() < n; ++i) {
        bc.AcceptNew();
        if (bc.NumClients() < n)
            std::this_thread::sleep_for(std::chrono::milliseconds(10));
    }
    return bc.NumClients() == n;
}

/// Reads from the client until `len` bytes are there or nothing more arrives
std::string ReadBytes (TCPClient& client, size_t len)
{
    std::string data;
    while (data.size() < len) {
        const long n = client.timedRecv(1000);
        if (n <= 0) break;
        data.append(client.getBuf(), size_t(n));
    }
    return data;
}

}

TEST(NetworkTest, ListenOnAnyPortReportsRealPort) {
    TCPBroadcaster bc;
    bc.Listen("127.0.0.1", 0);
    EXPECT_TRUE(bc.isOpen());
    EXPECT_GT(bc.getPort(), 0);
    bc.Close();
    EXPECT_FALSE(bc.isOpen());
}

TEST(NetworkTest, ProducerAddressServesLocalClients) {
    TCPBroadcaster bc;
    bc.Listen(XP_LISTEN_ADDR, 0);
    ASSERT_TRUE(bc.isOpen());
    EXPECT_EQ(std::string("127.0.0.1"), XP_LISTEN_ADDR);
    
    TCPClient client(XP_LISTEN_ADDR, bc.getPort(), NET_BUF_SIZE, 1000);
    EXPECT_TRUE(client.isOpen());
    EXPECT_TRUE(WaitForClients(bc, 1));
}

TEST(NetworkTest, ConnectFailsWithoutServer) {
    // find a port nobody listens on
    int port = 0;
    {
        TCPBroadcaster bc;
        bc.Listen("127.0.0.1", 0);
        port = bc.getPort();
    }
    EXPECT_THROW(TCPClient("127.0.0.1", port, NET_BUF_SIZE), NetRuntimeError);
}

TEST(NetworkTest, BroadcastReachesAllClients) {
    TCPBroadcaster bc;
    bc.Listen("127.0.0.1", 0);
    EXPECT_EQ(0, bc.AcceptNew());
    
    TCPClient c1("127.0.0.1", bc.getPort(), NET_BUF_SIZE);
    TCPClient c2("127.0.0.1", bc.getPort(), NET_BUF_SIZE);
    ASSERT_TRUE(WaitForClients(bc, 2));
    
    const std::string frame = EncodeFrame("C172,Cessna,N172SP,34.7,32.4,true,false");
    EXPECT_EQ(2, bc.SendAll(frame));
    EXPECT_EQ(frame, ReadBytes(c1, frame.size()));
    EXPECT_EQ(frame, ReadBytes(c2, frame.size()));
}

TEST(NetworkTest, BroadcasterDropsGoneClients) {
    TCPBroadcaster bc;
    bc.Listen("127.0.0.1", 0);
    {
        TCPClient c1("127.0.0.1", bc.getPort(), NET_BUF_SIZE);
        ASSERT_TRUE(WaitForClients(bc, 1));
    }
    // the first send after the peer closed may still succeed,
    // at the latest a following one fails
    const std::string frame = EncodeFrame("x");
    for (int i = 0; i < 50 && bc.NumClients() > 0; ++i) {
        bc.SendAll(frame);
        std::this_thread::sleep_for(std::chrono::milliseconds(10));
    }
    EXPECT_EQ(0, bc.NumClients());
}

TEST(NetworkTest, TimedRecvTimesOut) {
    TCPBroadcaster bc;
    bc.Listen("127.0.0.1", 0);
    TCPClient client("127.0.0.1", bc.getPort(), NET_BUF_SIZE);
    ASSERT_TRUE(WaitForClients(bc, 1));
    
    EXPECT_EQ(-1, client.timedRecv(50));
    EXPECT_TRUE(SocketNetworking::IsErrWouldBlock(SocketNetworking::GetLastErrNo()));
}
