/// @file       Network.cpp
/// @brief      Low-level network communications, especially for TCP
/// @details    Socket wrapper with buffer management, client connect,
///             single session listener, and non-blocking multi-session broadcaster
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

// All includes are collected in one header
#include "Logbook.h"
#include <fcntl.h>
#if IBM
#include <winsock2.h>
#include <ws2tcpip.h>
#define close closesocket
typedef USHORT in_port_t;
#else
#include <unistd.h>
#include <arpa/inet.h>
#endif

// Don't get killed by SIGPIPE when the counterparty went away
#if LIN
constexpr int LB_SEND_FLAGS = MSG_NOSIGNAL;
#else
constexpr int LB_SEND_FLAGS = 0;
#endif

//
// MARK: SocketNetworking
//

NetRuntimeError::NetRuntimeError(const char *w) :
std::runtime_error(w)
{
    // make network error available
    errTxt = SocketNetworking::GetLastErr();
    fullWhat = w;
    fullWhat += " (";
    fullWhat += errTxt;
    fullWhat += ")";
}

// cleanup: make sure the socket is closed and all memory cleanup up
SocketNetworking::~SocketNetworking()
{
    // Close() is virtual, but in the destructor only our own version is called,
    // subclasses with more sockets close them in their destructors
    SocketNetworking::Close();
}

void SocketNetworking::Open(const std::string& _addr, int _port,
                       size_t _bufSize, unsigned _timeOut_ms)
{
    struct addrinfo *   addrinfo      = NULL;
    try {
        // store member values
        f_port = _port;
        f_addr = _addr;
        const std::string decimal_port(std::to_string(f_port));

        // get a valid address based on inAddr/port
        struct addrinfo hints;
        memset(&hints, 0, sizeof(hints));
        GetAddrHints(hints);            // ask subclasses
        
        int r = getaddrinfo(f_addr.c_str(), decimal_port.c_str(), &hints, &addrinfo);
        if(r != 0 || addrinfo == NULL)
            throw NetRuntimeError(("invalid address or port for socket: \"" + f_addr + ":" + decimal_port + "\"").c_str());
        
        // get a socket
        f_socket = socket(addrinfo->ai_family, addrinfo->ai_socktype, addrinfo->ai_protocol);
        if(f_socket == INVALID_SOCKET)
            throw NetRuntimeError(("could not create socket for: \"" + f_addr + ":" + decimal_port + "\"").c_str());
        
        // Reuse address to allow quick restarts
        int setToVal = 1;
#if IBM
        if (setsockopt(f_socket, SOL_SOCKET, SO_REUSEADDR, (char*)&setToVal, sizeof(setToVal)) < 0)
            throw NetRuntimeError(("could not setsockopt SO_REUSEADDR for: \"" + f_addr + ":" + decimal_port + "\"").c_str());
#else
        if (setsockopt(f_socket, SOL_SOCKET, SO_REUSEADDR, &setToVal, sizeof(setToVal)) < 0)
            throw NetRuntimeError(("could not setsockopt SO_REUSEADDR for: \"" + f_addr + ":" + decimal_port + "\"").c_str());
#endif

        // define receive timeout
        SetRcvTimeout(_timeOut_ms);

        // bind the socket to the address:port
        r = bind(f_socket, addrinfo->ai_addr, (int)addrinfo->ai_addrlen);
        if(r != 0)
            throw NetRuntimeError(("could not bind socket with: \"" + f_addr + ":" + decimal_port + "\"").c_str());
        
        // if bound to any port then find out which one we got
        if (f_port == 0) {
            struct sockaddr_in sin;
            socklen_t sinLen = sizeof(sin);
            if (getsockname(f_socket, (struct sockaddr*)&sin, &sinLen) == 0)
                f_port = ntohs(sin.sin_port);
        }

        // free adress info
        freeaddrinfo(addrinfo);
        addrinfo = NULL;

        // reserve receive buffer
        SetBufSize(_bufSize);
    }
    catch (...) {
        // free adress info
        if (addrinfo) {
            freeaddrinfo(addrinfo);
            addrinfo = NULL;
        }
        // make sure everything is closed
        Close();
        // re-throw
        throw;
    }
}

// Creates a socket and connects it to the given remote server
void SocketNetworking::Connect(const std::string& _addr, int _port,
                               size_t _bufSize, unsigned _timeOut_ms)
{
    struct addrinfo *   addrinfo      = NULL;
    try {
        // store member values
        f_port = _port;
        f_addr = _addr;
        const std::string decimal_port(std::to_string(f_port));

        // get a valid address based on inAddr/port
        struct addrinfo hints;
        memset(&hints, 0, sizeof(hints));
        GetAddrHints(hints);            // ask subclasses
        hints.ai_flags &= ~AI_PASSIVE;  // we look for a remote address
        
        int r = getaddrinfo(f_addr.c_str(), decimal_port.c_str(), &hints, &addrinfo);
        if(r != 0 || addrinfo == NULL)
            throw NetRuntimeError(("invalid address or port for socket: \"" + f_addr + ":" + decimal_port + "\"").c_str());
        
        // get a socket
        f_socket = socket(addrinfo->ai_family, addrinfo->ai_socktype, addrinfo->ai_protocol);
        if(f_socket == INVALID_SOCKET)
            throw NetRuntimeError(("could not create socket for: \"" + f_addr + ":" + decimal_port + "\"").c_str());
        
        // define receive timeout
        SetRcvTimeout(_timeOut_ms);
        
        // connect to the server
        r = ::connect(f_socket, addrinfo->ai_addr, (int)addrinfo->ai_addrlen);
        if (r != 0)
            throw NetRuntimeError(("could not connect to: \"" + f_addr + ":" + decimal_port + "\"").c_str());
        
        // free adress info
        freeaddrinfo(addrinfo);
        addrinfo = NULL;

        // reserve receive buffer
        SetBufSize(_bufSize);
    }
    catch (...) {
        if (addrinfo) {
            freeaddrinfo(addrinfo);
            addrinfo = NULL;
        }
        Close();
        throw;
    }
}

// Sets the receive timeout on `f_socket`
void SocketNetworking::SetRcvTimeout (unsigned _timeOut_ms)
{
#if IBM
    DWORD wsTimeout = _timeOut_ms;
    if (setsockopt(f_socket, SOL_SOCKET, SO_RCVTIMEO, (char*)&wsTimeout, sizeof(wsTimeout)) < 0)
        throw NetRuntimeError(("could not setsockopt SO_RCVTIMEO for: \"" + f_addr + ":" + std::to_string(f_port) + "\"").c_str());
#else
    struct timeval timeout;
    timeout.tv_sec = _timeOut_ms / 1000;
    timeout.tv_usec = (_timeOut_ms % 1000) * 1000;
    if (setsockopt(f_socket, SOL_SOCKET, SO_RCVTIMEO, &timeout, sizeof(timeout)) < 0)
        throw NetRuntimeError(("could not setsockopt SO_RCVTIMEO for: \"" + f_addr + ":" + std::to_string(f_port) + "\"").c_str());
#endif
#if APL
    // MacOS knows no MSG_NOSIGNAL, but a socket option
    int setToVal = 1;
    setsockopt(f_socket, SOL_SOCKET, SO_NOSIGPIPE, &setToVal, sizeof(setToVal));
#endif
}

// Switches a socket to non-blocking mode
void SocketNetworking::SetNonBlocking (SOCKET s)
{
#if IBM
    u_long mode = 1;
    if (ioctlsocket(s, FIONBIO, &mode) != 0)
#else
    const int flags = fcntl(s, F_GETFL, 0);
    if (flags < 0 || fcntl(s, F_SETFL, flags | O_NONBLOCK) < 0)
#endif
        throw NetRuntimeError("could not set socket to non-blocking mode");
}

/** \brief Clean up the socket.
 *
 // Close: This function frees the buffer and closes the socket.
 */
void SocketNetworking::Close()
{
    CloseSocket(f_socket);
    
    // release buffer
    SetBufSize(0);
}

// Closes the given socket and sets it to INVALID_SOCKET
void SocketNetworking::CloseSocket (SOCKET& s)
{
    if (s != INVALID_SOCKET) {
        close(s);
        s = INVALID_SOCKET;
    }
}

// allocates the receiving buffer
void SocketNetworking::SetBufSize(size_t _bufSize)
{
    // remove existing buffer
    if (buf) {
        delete[] buf;
        buf = NULL;
        bufSize = 0;
    }
    
    // create a new one
    if (_bufSize > 0) {
        buf = new char[bufSize=_bufSize];
        memset(buf, 0, bufSize);
    }
}

// updates the error text and returns it
std::string SocketNetworking::GetLastErr()
{
    char sErr[SERR_LEN];
#if IBM
    FormatMessage(FORMAT_MESSAGE_FROM_SYSTEM | FORMAT_MESSAGE_IGNORE_INSERTS,   // flags
        NULL,                                                                   // lpsource
        WSAGetLastError(),                                                      // message id
        MAKELANGID(LANG_NEUTRAL, SUBLANG_DEFAULT),                              // languageid
        sErr,                                                                   // output buffer
        sizeof(sErr),                                                           // size of msgbuf, bytes
        NULL);
#else
    strerror_s(sErr, sizeof(sErr), errno);
#endif
    return std::string(sErr);
}

// Returns the last socket error number
int SocketNetworking::GetLastErrNo()
{
#if IBM
    return WSAGetLastError();
#else
    return errno;
#endif
}

// Did the last operation fail only because no data was there (yet)?
bool SocketNetworking::IsErrWouldBlock (int err)
{
#if IBM
    return err == WSAEWOULDBLOCK || err == WSAETIMEDOUT;
#else
    return err == EAGAIN || err == EWOULDBLOCK || err == ETIMEDOUT || err == EINTR;
#endif
}

// Did the last operation fail because the counterparty went away?
bool SocketNetworking::IsErrConnLost (int err)
{
#if IBM
    return err == WSAECONNRESET || err == WSAECONNABORTED || err == WSAESHUTDOWN;
#else
    return err == ECONNRESET || err == ECONNABORTED || err == EPIPE;
#endif
}


/** \brief Wait on a message.
 *
 * This function waits until a message is received on this socket
 * or until the receive timeout (if any) expires.
 *
 * \return The number of bytes read, 0 if the counterparty closed the
 *         connection, or -1 if an error occurs.
 */
long SocketNetworking::recv()
{
    if (!buf) {
#if IBM
        WSASetLastError(WSA_NOT_ENOUGH_MEMORY);
#else
        errno = ENOMEM;
#endif
        return -1;
    }
    
    long ret = ::recv(f_socket, buf, (int)bufSize-1, 0);
    if (ret >= 0)  {                    // we did receive something
        buf[ret] = 0;                   // zero-termination
    } else {
        buf[0] = 0;                     // empty string
    }
    return ret;
}

/** \brief Wait for data to come in.
 *
 * This function waits for a given amount of time for data to come in. If
 * no data comes in after max_wait_ms, the function returns with -1 and
 * errno set to EAGAIN.
 *
 * This function blocks for a maximum amount of time as defined by
 * max_wait_ms. It may return sooner with an error or a message.
 *
 * \param[in] max_wait_ms  The maximum number of milliseconds to wait for a message.
 *
 * \return -1 if an error occurs or the function timed out, the number of bytes received otherwise.
 */
long SocketNetworking::timedRecv(int max_wait_ms)
{
    fd_set sRead, sErr;
    struct timeval timeout;

    FD_ZERO(&sRead);
    FD_SET(f_socket, &sRead);           // check our socket
    FD_ZERO(&sErr);                     // also for errors
    FD_SET(f_socket, &sErr);

    timeout.tv_sec = max_wait_ms / 1000;
    timeout.tv_usec = (max_wait_ms % 1000) * 1000;
    int retval = select((int)f_socket + 1, &sRead, NULL, &sErr, &timeout);
    if(retval == -1)
    {
        // select() set errno accordingly
        if (buf) buf[0] = 0;            // empty string
        return -1;
    }
    if(retval > 0)
    {
        // our socket has data, or an error, in which case recv() tells
        if (FD_ISSET(f_socket, &sRead) || FD_ISSET(f_socket,&sErr))
            return recv();
    }
    
    // our socket has no data
    if (buf) buf[0] = 0;                // empty string
#if IBM
    WSASetLastError(WSAEWOULDBLOCK);
#else
    errno = EAGAIN;
#endif
    return -1;
}

// Sends all data on the given socket
bool SocketNetworking::sendAll (SOCKET s, const char* data, size_t len, bool bLogErr)
{
    size_t index=0;
    while (index<len) {
        long count = (long)::send(s, data + index, (int)(len - index), LB_SEND_FLAGS);
        if (count<0) {
            if (GetLastErrNo()==EINTR) continue;
            if (bLogErr)
                LOG_MSG(logERR, "%s (%s)",
                        ("send failed: \"" + f_addr + ":" + std::to_string(f_port) + "\"").c_str(),
                        GetLastErr().c_str());
            return false;
        } else {
            index+=size_t(count);
        }
    }
    return true;
}


// return a string for a IPv4 and IPv6 address
std::string SocketNetworking::GetAddrString (const struct sockaddr* addr)
{
    char s[std::max(INET_ADDRSTRLEN,INET6_ADDRSTRLEN)] = "";
    
    switch(addr->sa_family) {
        case AF_INET: {
            struct sockaddr_in *addr_in = (struct sockaddr_in *)addr;
            inet_ntop(AF_INET, &(addr_in->sin_addr), s, sizeof(s));
            break;
        }
        case AF_INET6: {
            struct sockaddr_in6 *addr_in6 = (struct sockaddr_in6 *)addr;
            inet_ntop(AF_INET6, &(addr_in6->sin6_addr), s, sizeof(s));
            break;
        }
        default:
            break;
    }
    
    return std::string(s);
}

//
// MARK: TCPClient
//

// TCP only allows TCP
void TCPClient::GetAddrHints (struct addrinfo& hints)
{
    hints.ai_flags = 0;
    hints.ai_family = AF_INET;
    hints.ai_socktype = SOCK_STREAM;
    hints.ai_protocol = IPPROTO_TCP;
}

//
// MARK: TCPBroadcaster
//

// Opens the listening socket and starts listening
void TCPBroadcaster::Listen (const std::string& _addr, int _port, int backlog)
{
    Open(_addr, _port, 0);
    if (::listen(f_socket, backlog) < 0) {
        NetRuntimeError e(("can't listen on socket: \"" + f_addr + ":" + std::to_string(f_port) + "\"").c_str());
        Close();
        throw e;
    }
    SetNonBlocking(f_socket);
}

// Closes all sessions and the listener
void TCPBroadcaster::Close()
{
    for (SOCKET& s: f_sessions)
        CloseSocket(s);
    f_sessions.clear();
    SocketNetworking::Close();
}

// Accepts all pending connections
int TCPBroadcaster::AcceptNew ()
{
    if (!isOpen())
        return 0;
    
    int n = 0;
    for (;;) {
        struct sockaddr_in addr;
        socklen_t addrLen = sizeof(addr);
        memset (&addr, 0, sizeof(addr));
        SOCKET s = ::accept(f_socket, (struct sockaddr*)&addr, &addrLen);
        if (s == INVALID_SOCKET) {
            const int err = GetLastErrNo();
            if (!IsErrWouldBlock(err) && !IsErrConnLost(err))
                LOG_MSG(logERR, "%s (%s)",
                        ("accept failed: \"" + f_addr + ":" + std::to_string(f_port) + "\"").c_str(),
                        GetLastErr().c_str());
            break;
        }
        try {
            SetNonBlocking(s);
        }
        catch (const NetRuntimeError& e) {
            LOG_MSG(logERR, "%s", e.what());
            CloseSocket(s);
            continue;
        }
#if APL
        int setToVal = 1;
        setsockopt(s, SOL_SOCKET, SO_NOSIGPIPE, &setToVal, sizeof(setToVal));
#endif
        f_sessions.push_back(s);
        n++;
        LOG_MSG(logINFO, MSG_XP_CLIENT_NEW,
                GetAddrString((struct sockaddr*)&addr).c_str(), NumClients());
    }
    return n;
}

// Sends the data to all counterparties
int TCPBroadcaster::SendAll (const char* data, size_t len)
{
    int n = 0;
    for (auto iter = f_sessions.begin(); iter != f_sessions.end(); )
    {
        // a partial send would corrupt the stream, so the counterparty is dropped
        if (sendAll(*iter, data, len, false)) {
            ++iter;
            ++n;
        } else {
            CloseSocket(*iter);
            iter = f_sessions.erase(iter);
            LOG_MSG(logINFO, MSG_XP_CLIENT_GONE, NumClients());
        }
    }
    return n;
}

// TCP only allows TCP
void TCPBroadcaster::GetAddrHints (struct addrinfo& hints)
{
    hints.ai_flags = AI_PASSIVE;
    hints.ai_family = AF_INET;
    hints.ai_socktype = SOCK_STREAM;
    hints.ai_protocol = IPPROTO_TCP;
}
