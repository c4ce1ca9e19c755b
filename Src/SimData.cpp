/// @file       SimData.cpp
/// @brief      Telemetry records: CSV codec, wire framing, and the engine's aircraft snapshot
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
// MARK: SimDataTy
//

/// Parses `true`/`false`
static bool ParseBool (const char* szField, const std::string& s)
{
    if (s == CSV_TRUE)  return true;
    if (s == CSV_FALSE) return false;
    char buf[200];
    snprintf(buf, sizeof(buf), ERR_RECORD_FIELD, szField, s.c_str());
    throw MalformedRecord(buf);
}

/// Parses a floating point number, which must consume the entire field
static double ParseDouble (const char* szField, const std::string& s)
{
    double d = NAN;
    if (!str_todouble(s, d)) {
        char buf[200];
        snprintf(buf, sizeof(buf), ERR_RECORD_FIELD, szField, s.c_str());
        throw MalformedRecord(buf);
    }
    return d;
}

// Decodes a CSV record
SimDataTy SimDataTy::FromCSV (const std::string& csv)
{
    const std::vector<std::string> f = str_tokenize(csv, ",", false);
    if (f.size() < (size_t)SIM_DATA_NUM_FIELDS) {
        char buf[100];
        snprintf(buf, sizeof(buf), ERR_RECORD_FIELDS, SIM_DATA_NUM_FIELDS, (unsigned long)f.size());
        throw MalformedRecord(buf);
    }
    
    SimDataTy sd;
    sd.icao         = f[0];
    sd.name         = f[1];
    sd.registration = f[2];
    sd.lat          = ParseDouble("latitude",  f[3]);
    sd.lon          = ParseDouble("longitude", f[4]);
    sd.bEngineOn    = ParseBool("engine_on",   f[5]);
    sd.bOnGround    = ParseBool("on_ground",   f[6]);
    return sd;
}

/// Replaces the field separator in a text field
static std::string CSVText (std::string s)
{
    std::replace(s.begin(), s.end(), ',', CSV_COMMA_REPL);
    return s;
}

// Encodes as CSV record
std::string SimDataTy::ToCSV () const
{
    return str_concat({
        CSVText(icao), CSVText(name), CSVText(registration),
        dbl2string(lat), dbl2string(lon),
        bEngineOn ? CSV_TRUE : CSV_FALSE,
        bOnGround ? CSV_TRUE : CSV_FALSE
    }, ",");
}

bool SimDataTy::operator== (const SimDataTy& o) const
{
    return
    icao == o.icao && name == o.name && registration == o.registration &&
    lat == o.lat && lon == o.lon &&
    bEngineOn == o.bEngineOn && bOnGround == o.bOnGround;
}

//
// MARK: AircraftTy
//

AircraftTy::AircraftTy (const SimDataTy& sd) :
title(sd.name), icao(sd.icao), registration(sd.registration),
pos(sd.lat, sd.lon),
enginesOn(1, sd.bEngineOn),
bOnGround(sd.bOnGround)
{}

// is any engine running?
bool AircraftTy::AnyEngineOn () const
{
    return std::any_of(enginesOn.cbegin(), enginesOn.cend(),
                       [](bool b){ return b; });
}

bool AircraftTy::SameIdentity (const AircraftTy& o) const
{
    return title == o.title && icao == o.icao && registration == o.registration;
}

std::string AircraftTy::dbgTxt () const
{
    return title + " (" + icao + ", " + registration + ")";
}

//
// MARK: Simulator messages
//

// Text for message type
const char* SimMsgText (simMsgE t)
{
    switch (t) {
        case SIM_MSG_OPEN:      return "Open";
        case SIM_MSG_QUIT:      return "Quit";
        case SIM_MSG_TELEMETRY: return "Telemetry";
        case SIM_MSG_WAITING:   return "Waiting";
        case SIM_MSG_UNKNOWN:   return "Unknown";
    }
    return "?";
}

//
// MARK: Framing
//

// Prefixes the record with its 2-byte little-endian length
std::string EncodeFrame (const std::string& rec)
{
    if (rec.size() > FRAME_MAX_LEN) {
        char buf[100];
        snprintf(buf, sizeof(buf), ERR_FRAME_TOO_LONG, (unsigned long)rec.size());
        throw std::length_error(buf);
    }
    std::string frame;
    frame.reserve(rec.size() + 2);
    frame.push_back(char(rec.size() & 0xFF));
    frame.push_back(char((rec.size() >> 8) & 0xFF));
    frame += rec;
    return frame;
}

// Removes the next complete frame from the buffer
bool FrameReader::NextFrame (std::string& rec)
{
    if (buf.size() < 2)
        return false;
    const size_t len = size_t((unsigned char)buf[0]) |
                       (size_t((unsigned char)buf[1]) << 8);
    if (buf.size() < len + 2)
        return false;
    rec = buf.substr(2, len);
    buf.erase(0, len + 2);
    return true;
}
