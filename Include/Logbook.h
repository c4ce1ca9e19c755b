/// @file       Logbook.h
/// @brief      Common header for all Logbook modules
/// @details    Collects all includes, so that each implementation file only needs to include this one\n
///             Declares string, time and file utility functions
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

#ifndef Logbook_h
#define Logbook_h

// MARK: Includes
// Standard C
#include <sys/stat.h>
#include <cstdio>
#include <cstdarg>
#include <cmath>
#include <cstring>
#include <ctime>
#include <cassert>
#include <cerrno>

// Windows
#if IBM
#include <winsock2.h>
#include <windows.h>
// we prefer std::max/min of <algorithm>
#undef max
#undef min
#endif

// C++
#include <climits>
#include <cstdint>
#include <utility>
#include <string>
#include <array>
#include <vector>
#include <list>
#include <optional>
#include <variant>
#include <functional>
#include <memory>
#include <fstream>
#include <mutex>
#include <thread>
#include <algorithm>
#include <chrono>

// Logbook Includes
#include "Constants.h"
#include "LBConfig.h"
#include "TextIO.h"
#include "CoordCalc.h"
#include "SimData.h"
#include "Network.h"
#include "LBApt.h"
#include "LBFlight.h"
#include "LBLogbook.h"
#include "LBXPlane.h"
#include "LBMsfs.h"
#include "LBChannel.h"

// MARK: Global Control functions

/// @brief Runs Logbook with the given configuration until the simulator quits
/// @return Process exit code
int LBMainRun (const LBConfig& cfg);

/// @brief Processes one simulator message: lookup, state machine, logbook
/// @return `false` if the loop shall end (simulator quit)
bool LBMainProcessMsg (const SimMessageTy& msg, const std::string& connName,
                       NavDataTy& navdata, FlightTracker& tracker, Logbook& logbook);

// MARK: File helpers

/// @brief Read a text line from file, no matter if ended by CRLF or LF
std::istream& safeGetline(std::istream& is, std::string& t);

/// Does the file (or directory) exist?
bool FileExists (const std::string& path);

// MARK: String/Text Functions

// change a std::string to uppercase
std::string& str_toupper(std::string& s);
/// return a std::string copy converted to uppercase
std::string str_toupper_c(const std::string& s);

// trimming of string
// https://stackoverflow.com/questions/216823/whats-the-best-way-to-trim-stdstring
// trim from end of string (right)
inline std::string& rtrim(std::string& s, const char* t = WHITESPACE)
{
    s.erase(s.find_last_not_of(t) + 1);
    return s;
}
// trim from beginning of string (left)
inline std::string& ltrim(std::string& s, const char* t = WHITESPACE)
{
    s.erase(0, s.find_first_not_of(t));
    return s;
}
// trim from both ends of string (right then left)
inline std::string& trim(std::string& s, const char* t = WHITESPACE)
{
    return ltrim(rtrim(s, t), t);
}

// separates string into tokens
std::vector<std::string> str_tokenize (const std::string& s,
                                       const std::string& tokens,
                                       bool bSkipEmpty = true);
/// concatenates a vector of strings into one string (reverse of str_tokenize)
std::string str_concat (const std::vector<std::string>& vs, const std::string& separator);

/// @brief Converts a text fully into a finite double
/// @return `false` if `s` is empty, contains anything but the number,
///         or is `nan`, `inf`, or a hex float
bool str_todouble (const std::string& s, double& d);

/// @brief Formats a double with the fewest digits that still read back as the identical value
std::string dbl2string (double d);

// MARK: Time Functions

/// System time in seconds with fractionals
inline double GetSysTime ()
{   return
    // system time in microseconds
    double(std::chrono::duration_cast<std::chrono::microseconds>(std::chrono::system_clock::now().time_since_epoch()).count())
    // divided by 1000000 to create seconds with fractionals
    / 1000000.0; }

// format timestamp
std::string ts2string (time_t t);

/// Converts an epoch timestamp to a Zulu time string incl. 10th of seconds
std::string ts2string (double _zt, int secDecimals=1);

// MARK: Other Utility Functions

/// Is value `lo <= v <= hi`?
template<class T>
constexpr bool between( const T& v, const T& lo, const T& hi )
{
    assert( !(hi < lo) );
    return (lo <= v) && (v <= hi);
}

// comparing 2 doubles for near-equality
bool dequal ( const double d1, const double d2 );

// MARK: Compiler differences

#if APL == 1 || LIN == 1
// these simulate the VC++ version, not the C standard versions!
inline struct tm *gmtime_s(struct tm * result, const time_t * time)
{ return gmtime_r(time, result); }
#endif

// XCode/Linux don't provide the _s functions, not even with __STDC_WANT_LIB_EXT1__ 1
#if APL
inline int strerror_s( char *buf, size_t bufsz, int errnum )
{ return strerror_r(errnum, buf, bufsz); }
#elif LIN
// glibc's strerror_r may return a static text instead of filling `buf`
inline int strerror_s( char *buf, size_t bufsz, int errnum )
{
    const char* s = strerror_r(errnum, buf, bufsz);
    if (s != buf) {
        strncpy(buf, s, bufsz);
        buf[bufsz-1] = 0;
    }
    return 0;
}
#endif

#endif /* Logbook_h */
