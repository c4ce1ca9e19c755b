/// @file       LBLogbook.cpp
/// @brief      The logbook: completed flights appended to a CSV file
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

// Opens the file for appending, writes the header if the file is new
Logbook::Logbook (const std::string& _path) :
path(_path)
{
    const bool bNew = !FileExists(path);
    f.open(path, std::ios_base::out | std::ios_base::app | std::ios_base::binary);
    if (!f) {
        char sErr[SERR_LEN];
        strerror_s(sErr, sizeof(sErr), errno);
        THROW_ERROR(logFATAL, ERR_LOGBOOK_OPEN, path.c_str(), sErr);
    }
    if (bNew)
        WriteLine(LOGBOOK_CSV_HEADER);
    LOG_MSG(logINFO, MSG_LOGBOOK_OPEN, path.c_str());
}

// Appends the flight's record
void Logbook::Log (const FlightTy& flight)
{
    WriteLine(flight.ToRecord());
    LOG_MSG(logMSG, MSG_FLIGHT_LOGGED, flight.dbgTxt().c_str());
}

// Quotes a CSV field if needed
std::string Logbook::CsvField (const std::string& s)
{
    if (s.find_first_of(",\"\r\n") == std::string::npos)
        return s;
    std::string q = "\"";
    for (const char c: s) {
        if (c == '"')
            q += '"';               // quotes are doubled
        q += c;
    }
    q += '"';
    return q;
}

// Joins fields to one CSV line
std::string Logbook::CsvLine (const std::vector<std::string>& fields)
{
    std::vector<std::string> q;
    q.reserve(fields.size());
    for (const std::string& s: fields)
        q.push_back(CsvField(s));
    return str_concat(q, ",");
}

// writes one line and flushes
void Logbook::WriteLine (const std::vector<std::string>& fields)
{
    f << CsvLine(fields) << '\n';
    f.flush();
    if (!f) {
        char sErr[SERR_LEN];
        strerror_s(sErr, sizeof(sErr), errno);
        THROW_ERROR(logFATAL, ERR_LOGBOOK_WRITE, path.c_str(), sErr);
    }
}
