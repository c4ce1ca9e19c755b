/// @file       LBMsfs.h
/// @brief      Connection to Microsoft Flight Simulator via SimConnect
/// @details    Polls a dispatch function for messages and decodes the\n
///             fixed-layout native data record into an AircraftTy
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

#ifndef LBMsfs_h
#define LBMsfs_h

/// What one native dispatch call delivered
enum msfsDispatchE {
    MSFS_DISP_NONE = 0,     ///< nothing pending
    MSFS_DISP_OPEN,         ///< connection established
    MSFS_DISP_QUIT,         ///< simulator is shutting down
    MSFS_DISP_DATA,         ///< a data record for one of our definitions
    MSFS_DISP_OTHER,        ///< any other message
};

/// One native dispatch result
struct msfsDispatchTy {
    msfsDispatchE               type     = MSFS_DISP_NONE;
    unsigned                    defineId = 0;   ///< data definition id with MSFS_DISP_DATA
    unsigned                    msgId    = 0;   ///< native message id with MSFS_DISP_OTHER
    std::vector<unsigned char>  data;           ///< record bytes with MSFS_DISP_DATA
};

/// Function returning the next pending native message, must not block
typedef std::function<msfsDispatchTy()> msfsDispatchFnTy;

/// @brief Decodes the native data record field by field
/// @details Layout, all little-endian: title char[128], 4 x f64 engine combustion,
///          f64 latitude [rad], f64 longitude [rad], f64 on ground, ATC id char[32]
/// @exception MalformedRecord if the record is too short or a string is not zero-terminated
AircraftTy MsfsDecodeRecord (const unsigned char* data, size_t len);

/// @brief Polling connection to SimConnect
/// @details Each call to NextMessage() polls the dispatch function
///          for at most the polling interval and returns the first
///          relevant message, or `Waiting`.
class MsfsConnection
{
protected:
    msfsDispatchFnTy    fnDispatch;
    int                 pollIntvl_ms = MSFS_POLL_INTVL_MS;
    
public:
    /// Constructor takes the dispatch source, which owns any native handle
    MsfsConnection (msfsDispatchFnTy _fnDispatch,
                    int _pollIntvl_ms = MSFS_POLL_INTVL_MS);
    
    /// @brief Opens SimConnect and requests our data record once per second
    /// @exception LBError if SimConnect is not available or refuses the connection
    static MsfsConnection ConnectSimConnect (const std::string& appName,
                                             int _pollIntvl_ms = MSFS_POLL_INTVL_MS);
    
    /// Returns the next message, `Waiting` if nothing arrived within the polling interval
    SimMessageTy NextMessage ();
    /// Connection's name for logging
    const char* Name () const { return SIM_NAME_MSFS; }
};

#endif /* LBMsfs_h */
