/// @file       LBFlight.h
/// @brief      Flight lifecycle: a flight's milestones and the state machine driving them
/// @details    Preflight -> Taxi -> EnRoute -> Landed -> Complete,
///             with Landed -> EnRoute for touch-and-go.
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

#ifndef LBFlight_h
#define LBFlight_h

/// States of a flight
enum flightStateE {
    FS_PREFLIGHT = 0,       ///< engines off, waiting for start up
    FS_TAXI,                ///< engine(s) running on the ground
    FS_EN_ROUTE,            ///< airborne
    FS_LANDED,              ///< back on the ground
    FS_COMPLETE,            ///< engines shut down after landing
};

/// Text for flight state
const char* FlightStateText (flightStateE s);

/// An airport together with the time the aircraft left or reached it
struct airportEventTy {
    AirportTy   apt;
    time_t      t = 0;
};

/// One flight with its milestones
struct FlightTy {
    AircraftTy                      ac;             ///< identity as captured when the flight was created
    flightStateE                    state = FS_PREFLIGHT;
    std::optional<time_t>           taxiOut;        ///< engine start
    std::optional<airportEventTy>   departure;      ///< takeoff
    std::optional<airportEventTy>   arrival;        ///< last landing
    std::optional<time_t>           shutdown;       ///< engines off after landing
    
    FlightTy () {}
    explicit FlightTy (const AircraftTy& _ac) : ac(_ac) {}
    
    /// @brief The logbook record
    /// @details title, icao, registration, taxi time, departure ident, departure time,
    ///          arrival ident, arrival time, shutdown time. Unset values are empty.
    std::vector<std::string> ToRecord () const;
    
    /// short text for logging
    std::string dbgTxt () const;
};

/// @brief Tracks at most one flight, driven by telemetry samples
class FlightTracker
{
protected:
    std::optional<FlightTy> flight;         ///< the flight in progress, if any
    bool bWarnedApt = false;                ///< missing airport already reported for current state?
    bool bWarnedIdent = false;              ///< identity change already reported?

public:
    /// @brief Processes one telemetry sample
    /// @param ac Latest telemetry
    /// @param apt The airport at the aircraft's position, if any
    /// @param now Timestamp of the sample
    /// @return The flight, if it completed with this sample. The tracker is empty afterwards.
    std::optional<FlightTy> Update (const AircraftTy& ac,
                                    const std::optional<AirportTy>& apt,
                                    time_t now);
    
    /// Is a flight in progress?
    bool HasFlight () const { return flight.has_value(); }
    /// The flight in progress, `nullptr` if none
    const FlightTy* GetFlight () const { return flight ? &*flight : nullptr; }
    /// Drops the flight in progress
    void Reset ();
    
protected:
    /// Switches the state, logs the change
    void SetState (flightStateE s);
    /// Reports a missing airport once per state
    void WarnNoAirport (const AircraftTy& ac);
};

#endif /* LBFlight_h */
