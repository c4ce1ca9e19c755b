/// @file       LBChannel.h
/// @brief      Simulator connection, one of the supported variants
/// @details    SimConnection holds either an XPlaneConnection or an MsfsConnection,\n
///             chosen at startup from the configuration
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

#ifndef LBChannel_h
#define LBChannel_h

/// A connection to the simulator selected at startup
class SimConnection
{
public:
    /// the supported connection types
    typedef std::variant<XPlaneConnection, MsfsConnection> connTy;
    
protected:
    connTy conn;
    
public:
    explicit SimConnection (XPlaneConnection&& c) : conn(std::move(c)) {}
    explicit SimConnection (MsfsConnection&& c) : conn(std::move(c)) {}
    
    /// @brief Connects to the simulator named in the configuration
    /// @exception LBError if no or an unsupported simulator is configured
    /// @exception NetRuntimeError if the streaming producer cannot be reached
    static SimConnection Create (const LBConfig& cfg);
    
    /// Returns the next message from the simulator
    SimMessageTy NextMessage ();
    /// Connection's name for logging
    const char* Name () const;
};

#endif /* LBChannel_h */
