/// @file       Network.h
/// @brief      Low-level network communications, especially for TCP
/// @details    SocketNetworking wraps a socket and its receive buffer\n
///             TCPClient connects to a remote server\n
///             TCPBroadcaster serves any number of counterparties without blocking
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

#ifndef Network_h
#define Network_h

#include <sys/types.h>
#if IBM
#include <winsock2.h>
#else
#include <sys/socket.h>
#include <netinet/in.h>
#include <netdb.h>
typedef int SOCKET;             ///< Windows defines SOCKET, so we define it for non-Windows manually
constexpr SOCKET INVALID_SOCKET = -1;
#endif
#include <stdexcept>

/// @brief Exception raised by SocketNetworking objects
/// @details This exception is raised when the address
///          and port combinaison cannot be resolved, if the socket cannot be
///          opened, or if a receive operation fails unexpectedly.
class NetRuntimeError : public std::runtime_error
{
public:
    std::string errTxt;             ///< OS text for what `errno` says, output of strerror_s()
    std::string fullWhat;           ///< combines `w` and `errTxt`
    NetRuntimeError(const char *w); ///< Constructor sets the above texts
    /// Return the full message, ie. `fullWhat`
    const char* what() const noexcept override { return fullWhat.c_str(); }
};

/// Base class for any socket-based networking
class SocketNetworking
{
protected:
    SOCKET              f_socket        = INVALID_SOCKET;
    int                 f_port          = 0;
    std::string         f_addr;
    
    // the data receive buffer
    char*               buf             = NULL;
    size_t              bufSize         = 512;

public:
    /// Default constructor is not doing anything
    SocketNetworking() {}
    /// Destructor makes sure the socket is closed
    virtual ~SocketNetworking();
    
    // sockets and buffer are owned exclusively
    SocketNetworking (const SocketNetworking&) = delete;
    SocketNetworking& operator = (const SocketNetworking&) = delete;

    /// Creates a socket and binds it to the given local address
    virtual void Open(const std::string& _addr, int _port, size_t _bufSize = 512,
                      unsigned _timeOut_ms = 0);
    /// Creates a socket and connects it to the given remote server
    virtual void Connect(const std::string& _addr, int _port, size_t _bufSize,
                         unsigned _timeOut_ms = 0);
    /// Thread-safely close the connection(s) and frees the buffer
    virtual void Close();
    /// Is a socket open?
    inline bool isOpen() const { return (f_socket != INVALID_SOCKET); }
    /// (Re)Sets the buffer size (or clears it if `_bufSize==0`)
    void SetBufSize (size_t _bufSize);
    /// Returns a human-readable text for the last error
    static std::string GetLastErr();
    /// Returns the last socket error number (`errno` or `WSAGetLastError()`)
    static int GetLastErrNo();
    /// Did the last operation fail only because no data was there (yet)?
    static bool IsErrWouldBlock (int err);
    /// Did the last operation fail because the counterparty went away?
    static bool IsErrConnLost (int err);
    
    // attribute access
    int          getPort() const     { return f_port; }     ///< the port

    /// returna the buffer
    const char* getBuf () const  { return buf ? buf : ""; }
    
    /// Waits to receive a message, ensures zero-termination in the buffer
    long                recv();
    /// Waits to receive a message with timeout, ensures zero-termination in the buffer
    long                timedRecv(int max_wait_ms);
    
    /// Convert addresses to string
    static std::string GetAddrString (const struct sockaddr* addr);
    
protected:
    /// Subclass to tell which addresses to look for
    virtual void GetAddrHints (struct addrinfo& hints) = 0;
    /// Sets the receive timeout on `f_socket`
    void SetRcvTimeout (unsigned _timeOut_ms);
    /// Switches a socket to non-blocking mode
    static void SetNonBlocking (SOCKET s);
    /// Sends all data on the given socket, `false` if failed
    bool sendAll (SOCKET s, const char* data, size_t len, bool bLogErr = true);
    /// Closes the given socket and sets it to INVALID_SOCKET
    static void CloseSocket (SOCKET& s);
};


/// Connects to a TCP server
class TCPClient : public SocketNetworking
{
public:
    /// Default constructor is not doing anything
    TCPClient() : SocketNetworking() {}
    /// Constructor connects to the given server
    TCPClient(const std::string& _addr, int _port, size_t _bufSize = 512,
              unsigned _timeOut_ms = 0)
    { Connect(_addr, _port, _bufSize, _timeOut_ms); }
    
protected:
    /// Sets flags to AF_INET, SOCK_STREAM, IPPROTO_TCP
    void GetAddrHints (struct addrinfo& hints) override;
};


/// @brief Listens to TCP connections and sends the same data to all connected counterparties
/// @details Neither accepting nor sending blocks. A counterparty,
///          which cannot take a complete message right away, is dropped.
class TCPBroadcaster : public SocketNetworking
{
protected:
    std::vector<SOCKET> f_sessions;     ///< session sockets of all connected counterparties

public:
    /// Default constructor is not doing anything
    TCPBroadcaster() : SocketNetworking() {}
    /// Destructor closes all sessions
    ~TCPBroadcaster() override { Close(); }
    
    /// Opens the listening socket and starts listening
    void Listen (const std::string& _addr, int _port, int backlog = 16);
    /// Closes all sessions and the listener
    void Close() override;
    
    /// Accepts all pending connections, returns number of newly accepted ones
    int AcceptNew ();
    /// Sends the data to all counterparties, returns number of counterparties reached
    int SendAll (const char* data, size_t len);
    /// Sends the string to all counterparties
    int SendAll (const std::string& s) { return SendAll(s.data(), s.size()); }
    /// Number of connected counterparties
    int NumClients () const { return (int)f_sessions.size(); }

protected:
    void GetAddrHints (struct addrinfo& hints) override;
};

#endif /* Network_h */
