/// @file       LBMain.cpp
/// @brief      Main loop: reads simulator messages and logs completed flights
/// @details    Opens navigation data, logbook, and simulator connection,\n
///             then processes one simulator message per loop
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

//
// MARK: Message processing
//

// Processes one simulator message
bool LBMainProcessMsg (const SimMessageTy& msg, const std::string& connName,
                       NavDataTy& navdata, FlightTracker& tracker, Logbook& logbook)
{
    switch (msg.type)
    {
        case SIM_MSG_OPEN:
            LOG_MSG(logINFO, MSG_SIM_OPEN, connName.c_str());
            return true;
            
        case SIM_MSG_WAITING:
            return true;
            
        case SIM_MSG_UNKNOWN:
            LOG_MSG(logDEBUG, DBG_SIM_UNKNOWN, connName.c_str());
            return true;
            
        case SIM_MSG_TELEMETRY:
        {
            const std::optional<AirportTy> apt = navdata.FindContaining(msg.ac.pos);
            const std::optional<FlightTy> done = tracker.Update(msg.ac, apt, time(nullptr));
            if (done)
                logbook.Log(*done);
            return true;
        }
            
        case SIM_MSG_QUIT:
            LOG_MSG(logINFO, MSG_SIM_QUIT, connName.c_str());
            if (const FlightTy* pFlight = tracker.GetFlight()) {
                LOG_MSG(logWARN, MSG_FLIGHT_DROPPED,
                        pFlight->ac.dbgTxt().c_str(), FlightStateText(pFlight->state));
                tracker.Reset();
            }
            return false;
    }
    return true;
}

//
// MARK: Main loop
//

// Runs Logbook until the simulator quits
int LBMainRun (const LBConfig& cfg)
{
    // navigation data with its spatial airport index
    NavDataTy navdata(cfg.GetNavdataPath(),
                      cfg.ShallBuildAptIndex() ? NavDataTy::NAV_READ_WRITE : NavDataTy::NAV_READ_ONLY);
    if (cfg.ShallBuildAptIndex())
        navdata.CreateSpatialIndex();
    
    Logbook logbook(cfg.GetLogbookPath());
    FlightTracker tracker;
    SimConnection conn = SimConnection::Create(cfg);
    const std::string connName = conn.Name();
    
    while (LBMainProcessMsg(conn.NextMessage(), connName, navdata, tracker, logbook))
        ;
    return 0;
}
