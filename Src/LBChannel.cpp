/// @file       LBChannel.cpp
/// @brief      Simulator connection, one of the supported variants
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

// Connects to the simulator named in the configuration
SimConnection SimConnection::Create (const LBConfig& cfg)
{
    switch (cfg.GetSim()) {
        case SIM_XP12:
            return SimConnection(XPlaneConnection(cfg.GetXPHost(),
                                                  cfg.GetXPPort(),
                                                  cfg.GetXPTimeout()));
        case SIM_MSFS:
            return SimConnection(MsfsConnection::ConnectSimConnect(LOGBOOK,
                                                                   cfg.GetMsfsPollIntvl()));
        case SIM_NONE:
            break;
    }
    THROW_ERROR(logFATAL, ERR_CFG_UNKNOWN_SIM, LBConfig::SimName(cfg.GetSim()));
}

// Returns the next message from the simulator
SimMessageTy SimConnection::NextMessage ()
{
    return std::visit([](auto& c) { return c.NextMessage(); }, conn);
}

// Connection's name
const char* SimConnection::Name () const
{
    return std::visit([](const auto& c) { return c.Name(); }, conn);
}
