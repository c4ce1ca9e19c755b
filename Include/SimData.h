/// @file       SimData.h
/// @brief      Telemetry records: CSV codec, wire framing, and the engine's aircraft snapshot
/// @details    A record is `icao,name,registration,latitude,longitude,engine_on,on_ground`.\n
///             On the wire each record is preceded by its length as 2-byte little-endian integer.
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

#ifndef SimData_h
#define SimData_h

/// Raised when a telemetry record cannot be decoded
class MalformedRecord : public std::runtime_error
{
public:
    MalformedRecord (const std::string& w) : std::runtime_error(w) {}
};

/// One telemetry sample as exchanged over the wire
struct SimDataTy {
    std::string icao;               ///< ICAO aircraft type designator
    std::string name;               ///< aircraft's title as shown in the simulator
    std::string registration;       ///< tail number
    double      lat = NAN;          ///< [°] latitude
    double      lon = NAN;          ///< [°] longitude
    bool        bEngineOn = false;  ///< any engine running?
    bool        bOnGround = false;  ///< any gear on the ground?
    
    /// @brief Decodes a CSV record
    /// @exception MalformedRecord if fewer than 7 fields or a typed field doesn't parse
    static SimDataTy FromCSV (const std::string& csv);
    /// @brief Encodes as CSV record
    /// @details Commas in `icao`, `name`, and `registration` are replaced
    ///          by semicolons so that the record always has 7 fields.
    std::string ToCSV () const;
    
    bool operator== (const SimDataTy& o) const;
    bool operator!= (const SimDataTy& o) const { return !operator==(o); }
};

/// The aircraft's state as consumed by the flight tracker
struct AircraftTy {
    std::string         title;          ///< aircraft's title as shown in the simulator
    std::string         icao;           ///< ICAO aircraft type designator
    std::string         registration;   ///< tail number or ATC id
    latLonTy            pos;            ///< current position
    std::vector<bool>   enginesOn;      ///< running state per engine
    bool                bOnGround = false;
    
    AircraftTy () {}
    /// Converts a wire record, which knows one combined engine flag only
    explicit AircraftTy (const SimDataTy& sd);
    
    /// is any engine running?
    bool AnyEngineOn () const;
    /// are all engines off?
    bool AllEnginesOff () const { return !AnyEngineOn(); }
    /// Does `o` describe the same aircraft (title, type, registration)?
    bool SameIdentity (const AircraftTy& o) const;
    /// short text for logging: "title (icao, registration)"
    std::string dbgTxt () const;
};

//
// MARK: Simulator messages
//

/// Types of messages a simulator connection delivers
enum simMsgE {
    SIM_MSG_OPEN = 0,       ///< connection to the simulator established
    SIM_MSG_QUIT,           ///< simulator closed the connection
    SIM_MSG_TELEMETRY,      ///< a new telemetry sample
    SIM_MSG_WAITING,        ///< nothing new within the timeout, poll again
    SIM_MSG_UNKNOWN,        ///< anything else, to be ignored
};

/// Text for message type
const char* SimMsgText (simMsgE t);

/// One message from a simulator connection
struct SimMessageTy {
    simMsgE     type = SIM_MSG_UNKNOWN;
    AircraftTy  ac;                 ///< telemetry, only valid with SIM_MSG_TELEMETRY
    
    SimMessageTy () {}
    explicit SimMessageTy (simMsgE _type) : type(_type) {}
    explicit SimMessageTy (const AircraftTy& _ac) : type(SIM_MSG_TELEMETRY), ac(_ac) {}
};

//
// MARK: Framing
//

/// @brief Prefixes the record with its 2-byte little-endian length
/// @exception std::length_error if the record is longer than FRAME_MAX_LEN
std::string EncodeFrame (const std::string& rec);

/// @brief Collects stream data and returns complete frames only
/// @details Partial frames stay in the buffer until the remaining bytes arrive.
class FrameReader
{
protected:
    std::string buf;                ///< received, not yet consumed bytes
public:
    /// Add received bytes
    void Append (const char* data, size_t len) { buf.append(data, len); }
    /// @brief Removes the next complete frame from the buffer
    /// @param[out] rec the frame's payload
    /// @return `false` if no complete frame is available yet
    bool NextFrame (std::string& rec);
    /// Number of buffered bytes
    size_t BufferedBytes () const { return buf.size(); }
    /// Discard buffered data
    void Clear () { buf.clear(); }
};

#endif /* SimData_h */
