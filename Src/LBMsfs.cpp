/// @file       LBMsfs.cpp
/// @brief      Connection to Microsoft Flight Simulator via SimConnect
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

#if IBM
#include <SimConnect.h>
#endif

//
// MARK: Native record decoding
//

namespace {

/// Reads a little-endian 8-byte float, independent of host byte order
double readF64LE (const unsigned char* p)
{
    uint64_t u = 0;
    for (int i = 7; i >= 0; --i)
        u = (u << 8) | uint64_t(p[i]);
    double d = 0.0;
    memcpy(&d, &u, sizeof(d));
    return d;
}

/// Reads a zero-terminated string from a fixed-size field
std::string readCStr (const unsigned char* p, size_t fieldLen, const char* szField)
{
    const void* pNul = memchr(p, 0, fieldLen);
    if (!pNul) {
        char buf[SERR_LEN];
        snprintf(buf, sizeof(buf), ERR_MSFS_RECORD_STR, szField);
        throw MalformedRecord(buf);
    }
    return std::string(reinterpret_cast<const char*>(p),
                       size_t(static_cast<const unsigned char*>(pNul) - p));
}

}

// Decodes the native data record field by field
AircraftTy MsfsDecodeRecord (const unsigned char* data, size_t len)
{
    if (!data || len < MSFS_RECORD_LEN) {
        char buf[SERR_LEN];
        snprintf(buf, sizeof(buf), ERR_MSFS_RECORD_LEN,
                 (unsigned long)len, (unsigned long)MSFS_RECORD_LEN);
        throw MalformedRecord(buf);
    }
    
    const unsigned char* p = data;
    AircraftTy ac;
    ac.title = readCStr(p, MSFS_TITLE_LEN, "title");
    p += MSFS_TITLE_LEN;
    
    ac.enginesOn.reserve(MSFS_NUM_ENGINES);
    for (size_t i = 0; i < MSFS_NUM_ENGINES; ++i, p += sizeof(double))
        ac.enginesOn.push_back(readF64LE(p) != 0.0);
    
    const double latRad = readF64LE(p);     p += sizeof(double);
    const double lonRad = readF64LE(p);     p += sizeof(double);
    ac.pos = latLonTy::FromRadians(latRad, lonRad);
    ac.bOnGround = readF64LE(p) != 0.0;     p += sizeof(double);
    
    ac.registration = readCStr(p, MSFS_ATC_ID_LEN, "atc_id");
    ac.icao = MSFS_ICAO_UNKNOWN;
    return ac;
}

//
// MARK: MsfsConnection
//

MsfsConnection::MsfsConnection (msfsDispatchFnTy _fnDispatch, int _pollIntvl_ms) :
fnDispatch(std::move(_fnDispatch)), pollIntvl_ms(_pollIntvl_ms)
{}

// Returns the next relevant message
SimMessageTy MsfsConnection::NextMessage ()
{
    const auto tEnd = std::chrono::steady_clock::now() +
                      std::chrono::milliseconds(pollIntvl_ms);
    for (;;)
    {
        msfsDispatchTy disp = fnDispatch();
        switch (disp.type)
        {
            case MSFS_DISP_OPEN:
                return SimMessageTy(SIM_MSG_OPEN);
            case MSFS_DISP_QUIT:
                return SimMessageTy(SIM_MSG_QUIT);
            case MSFS_DISP_DATA:
                if (disp.defineId != MSFS_DEFINE_ID)
                    return SimMessageTy(SIM_MSG_UNKNOWN);
                try {
                    return SimMessageTy(MsfsDecodeRecord(disp.data.data(), disp.data.size()));
                }
                catch (const MalformedRecord& e) {
                    LOG_MSG(logWARN, ERR_RECORD_MALFORMED, Name(), e.what());
                    return SimMessageTy(SIM_MSG_UNKNOWN);
                }
            case MSFS_DISP_OTHER:
                LOG_MSG(logDEBUG, ERR_MSFS_UNHANDLED, Name(), disp.msgId);
                return SimMessageTy(SIM_MSG_UNKNOWN);
            case MSFS_DISP_NONE:
                break;
        }
        
        // nothing pending: wait a bit, but not beyond the polling interval
        if (std::chrono::steady_clock::now() >= tEnd)
            return SimMessageTy(SIM_MSG_WAITING);
        std::this_thread::sleep_for(std::chrono::milliseconds(MSFS_IDLE_SLEEP_MS));
    }
}

//
// MARK: SimConnect binding
//

#if IBM

// Opens SimConnect and requests our data record once per second
MsfsConnection MsfsConnection::ConnectSimConnect (const std::string& appName,
                                                  int _pollIntvl_ms)
{
    LOG_MSG(logINFO, MSG_SIM_CONNECTING, SIM_NAME_MSFS, "SimConnect");
    HANDLE h = NULL;
    HRESULT hr = SimConnect_Open(&h, appName.c_str(), NULL, 0, 0, 0);
    if (FAILED(hr))
        THROW_ERROR(logFATAL, ERR_MSFS_CONNECT, (unsigned long)hr);
    
    // the handle is owned by the dispatch function from here on
    std::shared_ptr<void> hSim(h, [](void* p){ SimConnect_Close((HANDLE)p); });
    
    // data definition, order defines the record layout
    static const struct {
        const char*         szVar;
        const char*         szUnit;
        SIMCONNECT_DATATYPE type;
    } DEFS[] = {
        { "TITLE",                  NULL,       SIMCONNECT_DATATYPE_STRING128 },
        { "ENG COMBUSTION:1",       "Boolean",  SIMCONNECT_DATATYPE_FLOAT64 },
        { "ENG COMBUSTION:2",       "Boolean",  SIMCONNECT_DATATYPE_FLOAT64 },
        { "ENG COMBUSTION:3",       "Boolean",  SIMCONNECT_DATATYPE_FLOAT64 },
        { "ENG COMBUSTION:4",       "Boolean",  SIMCONNECT_DATATYPE_FLOAT64 },
        { "PLANE LATITUDE",         "Radians",  SIMCONNECT_DATATYPE_FLOAT64 },
        { "PLANE LONGITUDE",        "Radians",  SIMCONNECT_DATATYPE_FLOAT64 },
        { "SIM ON GROUND",          "Boolean",  SIMCONNECT_DATATYPE_FLOAT64 },
        { "ATC ID",                 NULL,       SIMCONNECT_DATATYPE_STRING32 },
    };
    for (const auto& def: DEFS) {
        hr = SimConnect_AddToDataDefinition(h, MSFS_DEFINE_ID, def.szVar, def.szUnit, def.type);
        if (FAILED(hr))
            THROW_ERROR(logFATAL, ERR_MSFS_DEFINE, def.szVar, (unsigned long)hr);
    }
    hr = SimConnect_RequestDataOnSimObject(h, MSFS_DEFINE_ID, MSFS_DEFINE_ID,
                                           SIMCONNECT_OBJECT_ID_USER,
                                           SIMCONNECT_PERIOD_SECOND);
    if (FAILED(hr))
        THROW_ERROR(logFATAL, ERR_MSFS_DEFINE, "request", (unsigned long)hr);
    
    return MsfsConnection([hSim]()
    {
        msfsDispatchTy disp;
        SIMCONNECT_RECV* pRecv = NULL;
        DWORD cbData = 0;
        if (FAILED(SimConnect_GetNextDispatch((HANDLE)hSim.get(), &pRecv, &cbData)) || !pRecv)
            return disp;
        switch (pRecv->dwID) {
            case SIMCONNECT_RECV_ID_OPEN:
                disp.type = MSFS_DISP_OPEN;
                break;
            case SIMCONNECT_RECV_ID_QUIT:
                disp.type = MSFS_DISP_QUIT;
                break;
            case SIMCONNECT_RECV_ID_SIMOBJECT_DATA: {
                const SIMCONNECT_RECV_SIMOBJECT_DATA* pObj = (const SIMCONNECT_RECV_SIMOBJECT_DATA*)pRecv;
                const unsigned char* pBegin = (const unsigned char*)&pObj->dwData;
                const size_t hdrLen = size_t(pBegin - (const unsigned char*)pRecv);
                disp.type = MSFS_DISP_DATA;
                disp.defineId = (unsigned)pObj->dwDefineID;
                if (cbData > hdrLen)
                    disp.data.assign(pBegin, pBegin + (cbData - hdrLen));
                break;
            }
            default:
                disp.type = MSFS_DISP_OTHER;
                disp.msgId = (unsigned)pRecv->dwID;
        }
        return disp;
    }, _pollIntvl_ms);
}

#else

// SimConnect exists on Windows only
MsfsConnection MsfsConnection::ConnectSimConnect (const std::string&, int)
{
    THROW_ERROR(logFATAL, ERR_MSFS_UNAVAIL);
}

#endif
