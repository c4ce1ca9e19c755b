/// @file       LBFlight.cpp
/// @brief      Flight lifecycle: a flight's milestones and the state machine driving them
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

// Text for flight state
const char* FlightStateText (flightStateE s)
{
    switch (s) {
        case FS_PREFLIGHT:  return "Preflight";
        case FS_TAXI:       return "Taxi";
        case FS_EN_ROUTE:   return "EnRoute";
        case FS_LANDED:     return "Landed";
        case FS_COMPLETE:   return "Complete";
    }
    return "?";
}

//
// MARK: FlightTy
//

/// formats an optional timestamp, empty if not set
static std::string optTs2string (const std::optional<time_t>& t)
{
    return t ? ts2string(*t) : std::string();
}

// The logbook record
std::vector<std::string> FlightTy::ToRecord () const
{
    return {
        ac.title,
        ac.icao,
        ac.registration,
        optTs2string(taxiOut),
        departure ? departure->apt.ident : "",
        departure ? ts2string(departure->t) : "",
        arrival ? arrival->apt.ident : "",
        arrival ? ts2string(arrival->t) : "",
        optTs2string(shutdown),
    };
}

std::string FlightTy::dbgTxt () const
{
    std::string s = ac.dbgTxt();
    s += ' ';
    s += departure ? departure->apt.ident : "----";
    s += " -> ";
    s += arrival ? arrival->apt.ident : "----";
    s += " [";
    s += FlightStateText(state);
    s += ']';
    return s;
}

//
// MARK: FlightTracker
//

// Processes one telemetry sample
std::optional<FlightTy> FlightTracker::Update (const AircraftTy& ac,
                                               const std::optional<AirportTy>& apt,
                                               time_t now)
{
    // start a new flight if none is in progress
    if (!flight) {
        flight.emplace(ac);
        bWarnedApt = bWarnedIdent = false;
        LOG_MSG(logINFO, MSG_FLIGHT_NEW, ac.dbgTxt().c_str());
    }
    // identity is kept from the first sample
    else if (!bWarnedIdent && !flight->ac.SameIdentity(ac)) {
        LOG_MSG(logWARN, ERR_FLIGHT_IDENT_CHANGE,
                flight->ac.dbgTxt().c_str(), ac.dbgTxt().c_str());
        bWarnedIdent = true;
    }
    
    // at most one transition per sample
    switch (flight->state) {
        case FS_PREFLIGHT:
            if (ac.AnyEngineOn()) {
                flight->taxiOut = now;
                SetState(FS_TAXI);
            }
            break;
            
        case FS_TAXI:
            if (!ac.bOnGround) {
                // without a departure airport we stay and try again next time
                if (!apt) {
                    WarnNoAirport(ac);
                    break;
                }
                flight->departure = airportEventTy{ *apt, now };
                LOG_MSG(logINFO, MSG_FLIGHT_DEPARTED, apt->ident.c_str(), ts2string(now).c_str());
                SetState(FS_EN_ROUTE);
            }
            break;
            
        case FS_EN_ROUTE:
            if (ac.bOnGround) {
                if (!apt) {
                    WarnNoAirport(ac);
                    break;
                }
                flight->arrival = airportEventTy{ *apt, now };
                LOG_MSG(logINFO, MSG_FLIGHT_ARRIVED, apt->ident.c_str(), ts2string(now).c_str());
                SetState(FS_LANDED);
            }
            break;
            
        case FS_LANDED:
            // touch-and-go: the arrival stays as recorded, might be overwritten by the next landing
            if (!ac.bOnGround)
                SetState(FS_EN_ROUTE);
            else if (ac.AllEnginesOff()) {
                flight->shutdown = now;
                SetState(FS_COMPLETE);
            }
            break;
            
        case FS_COMPLETE:
            break;
    }
    
    // hand out a completed flight, we are empty afterwards
    std::optional<FlightTy> ret;
    if (flight->state == FS_COMPLETE) {
        ret = std::move(flight);
        Reset();
    }
    return ret;
}

// Drops the flight in progress
void FlightTracker::Reset ()
{
    flight.reset();
    bWarnedApt = bWarnedIdent = false;
}

// Switches the state, logs the change
void FlightTracker::SetState (flightStateE s)
{
    LOG_ASSERT(flight);
    LOG_MSG(logINFO, MSG_FLIGHT_STATE, flight->ac.title.c_str(),
            FlightStateText(flight->state), FlightStateText(s));
    flight->state = s;
    bWarnedApt = false;
}

// Reports a missing airport once per state
void FlightTracker::WarnNoAirport (const AircraftTy& ac)
{
    if (bWarnedApt)
        return;
    LOG_MSG(logWARN, ERR_APT_NOT_FOUND, ac.title.c_str(),
            std::string(ac.pos).c_str(), FlightStateText(flight->state));
    bWarnedApt = true;
}
