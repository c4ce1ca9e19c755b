/// @file       LBXPlane.h
/// @brief      Connection to X-Plane 12 via the Logbook plugin's TCP stream
/// @details    Connects as a client to the plugin, reads length-prefixed frames,\n
///             and converts each CSV record into an AircraftTy
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

#ifndef LBXPlane_h
#define LBXPlane_h

/// @brief Streaming connection to the X-Plane 12 producer plugin
/// @details Delivers `Open` once after connecting, then one telemetry
///          sample per call as frames arrive. Malformed records are skipped.
///          Never blocks longer than the configured timeout.
class XPlaneConnection
{
protected:
    std::string                 host;
    int                         port        = XP_DEFAULT_PORT;
    int                         timeout_ms  = XP_TIMEOUT_MS;
    std::unique_ptr<TCPClient>  sock;                   ///< the stream, `nullptr` after closing
    FrameReader                 frames;                 ///< collects partial frames
    bool                        bOpenReported = false;
    long                        nMalformed  = 0;        ///< number of skipped records

public:
    /// @brief Connects to the producer
    /// @exception NetRuntimeError if the producer cannot be reached
    XPlaneConnection (const std::string& _host, int _port, int _timeout_ms);
    
    /// Returns the next message, `Waiting` if nothing arrived within the timeout
    SimMessageTy NextMessage ();
    /// Connection's name for logging
    const char* Name () const { return SIM_NAME_XP12; }
    
    /// Stream still open?
    bool isOpen () const { return sock && sock->isOpen(); }
    /// Closes the stream, subsequent calls to NextMessage() return `Quit`
    void Close ();
    /// Number of records skipped because they could not be decoded
    long GetNumMalformed () const { return nMalformed; }
};

#endif /* LBXPlane_h */
