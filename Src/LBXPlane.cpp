/// @file       LBXPlane.cpp
/// @brief      Connection to X-Plane 12 via the Logbook plugin's TCP stream
/// @author     Logbook authors
/// @copyright  (c) 2024 Logbook authors
/// @copyright  Permission is hereby granted, free of charge, to any person obtaining a
///             copy of this software and associated documentation files (the "Software"),
///             to deal in the Software without restriction, including without limitation
///             the rights to use, copy, modify, merge, publish, distribute, sublicense,
///             and/or sell copies of the Software, and to permit persons to whom the
///             Software is furnished to do so, subject to the following conditions:\n
///             The above copyright notice and this permission notice shall be included in
///             all copies or substantial portions of the Software.\n
///             THE SOFTWARE IS PROVIDED "AS IS", WITHOUT WARRANTY OF ANY KIND, EXPRESS OR
///             IMPLIED, INCLUDING BUT NOT LIMITED TO THE WARRANTIES OF MERCHANTABILITY,
///             FITNESS FOR A PARTICULAR PURPOSE AND NONINFRINGEMENT. IN NO EVENT SHALL THE
///             AUTHORS OR COPYRIGHT HOLDERS BE LIABLE FOR ANY CLAIM, DAMAGES OR OTHER
///             LIABILITY, WHETHER IN AN ACTION OF CONTRACT, TORT OR OTHERWISE, ARISING FROM,
///             OUT OF OR IN CONNECTION WITH THE SOFTWARE OR THE USE OR OTHER DEALINGS IN
///             THE SOFTWARE.

#include "Logbook.h"

// Connects to the producer
XPlaneConnection::XPlaneConnection (const std::string& _host, int _port, int _timeout_ms) :
host(_host), port(_port), timeout_ms(_timeout_ms)
{
    LOG_MSG(logINFO, MSG_SIM_CONNECTING, Name(),
            (host + ':' + std::to_string(port)).c_str());
    sock.reset(new TCPClient(host, port, NET_BUF_SIZE));
}

// Closes the stream
void XPlaneConnection::Close ()
{
    if (sock)
        sock->Close();
    sock.reset();
    frames.Clear();
}

// Returns the next message
/// @details Complete frames already buffered are served first.
///          Only if none is left we read from the socket, once per loop,
///          and stop waiting when the timeout has passed in total.
SimMessageTy XPlaneConnection::NextMessage ()
{
    if (!bOpenReported) {
        bOpenReported = true;
        return SimMessageTy(SIM_MSG_OPEN);
    }
    if (!isOpen())
        return SimMessageTy(SIM_MSG_QUIT);
    
    // monotonic clock, so that wall clock adjustments don't stretch the wait
    const auto tEnd = std::chrono::steady_clock::now() +
                      std::chrono::milliseconds(timeout_ms);
    for (;;)
    {
        // serve buffered frames first
        std::string rec;
        while (frames.NextFrame(rec)) {
            try {
                return SimMessageTy(AircraftTy(SimDataTy::FromCSV(rec)));
            }
            catch (const MalformedRecord& e) {
                ++nMalformed;
                LOG_MSG(logDEBUG, ERR_RECORD_MALFORMED, Name(), e.what());
            }
        }
        
        // wait for more data
        const auto tRemain = std::chrono::duration_cast<std::chrono::milliseconds>
                             (tEnd - std::chrono::steady_clock::now());
        if (tRemain.count() <= 0)
            return SimMessageTy(SIM_MSG_WAITING);
        const long n = sock->timedRecv(int(tRemain.count()));
        if (n > 0) {
            LOG_MSG(logDEBUG, DBG_RECEIVED_BYTES, Name(), n);
            frames.Append(sock->getBuf(), size_t(n));
            continue;
        }
        
        // orderly shutdown by the producer
        if (n == 0) {
            Close();
            return SimMessageTy(SIM_MSG_QUIT);
        }
        
        const int err = SocketNetworking::GetLastErrNo();
        if (SocketNetworking::IsErrWouldBlock(err))
            return SimMessageTy(SIM_MSG_WAITING);
        if (SocketNetworking::IsErrConnLost(err)) {
            Close();
            return SimMessageTy(SIM_MSG_QUIT);
        }
        throw NetRuntimeError("Receiving telemetry failed");
    }
}
