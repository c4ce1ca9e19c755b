/// @file       LBClientBench.cpp
/// @brief      Load test for the X-Plane producer plugin
/// @details    Opens a number of parallel streaming connections and counts\n
///             received and malformed records per connection.\n
///             Usage: logbook-bench [host] [port] [clients] [seconds]
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

/// Result of one client
struct benchResultTy {
    long nFrames    = 0;
    long nMalformed = 0;
    std::string err;            ///< set if the client failed
};

/// Reads from one connection until `tEnd`
static void BenchClient (const std::string& host, int port, double tEnd,
                         benchResultTy& res)
{
    try {
        XPlaneConnection conn(host, port, XP_TIMEOUT_MS);
        while (GetSysTime() < tEnd) {
            const SimMessageTy msg = conn.NextMessage();
            if (msg.type == SIM_MSG_TELEMETRY)
                res.nFrames++;
            else if (msg.type == SIM_MSG_QUIT)
                break;
        }
        res.nMalformed = conn.GetNumMalformed();
    }
    catch (const std::exception& e) {
        res.err = e.what();
    }
}

int main (int argc, const char* argv[])
{
    const std::string host  = argc > 1 ? argv[1] : "127.0.0.1";
    const int port          = argc > 2 ? atoi(argv[2]) : XP_DEFAULT_PORT;
    const int nClients      = argc > 3 ? atoi(argv[3]) : 10;
    const int secs          = argc > 4 ? atoi(argv[4]) : 10;
    if (port <= 0 || nClients <= 0 || secs <= 0) {
        fprintf(stderr, "USAGE: %s [host] [port] [clients] [seconds]\n", argv[0]);
        return 1;
    }
    
    const double tEnd = GetSysTime() + secs;
    std::vector<benchResultTy> results((size_t)nClients);
    std::vector<std::thread> threads;
    for (benchResultTy& res: results)
        threads.emplace_back(BenchClient, host, port, tEnd, std::ref(res));
    for (std::thread& t: threads)
        t.join();
    
    int ret = 0;
    for (size_t i = 0; i < results.size(); i++) {
        if (!results[i].err.empty()) {
            LOG_MSG(logERR, "Client %d: %s", int(i), results[i].err.c_str());
            ret = 1;
        }
        LOG_MSG(logMSG, MSG_BENCH_RESULT, int(i), results[i].nFrames, results[i].nMalformed);
    }
    return ret;
}
