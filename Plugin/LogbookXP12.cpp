/// @file       LogbookXP12.cpp
/// @brief      X-Plane 12 plugin publishing the user's aircraft to Logbook clients
/// @details    Once per second reads the user aircraft's dataRefs, encodes them\n
///             as CSV record, and sends the length-prefixed frame to all\n
///             connected TCP clients
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

#include "XPLMPlugin.h"
#include "XPLMDataAccess.h"
#include "XPLMProcessing.h"
#include "XPLMUtilities.h"

//
// MARK: dataRefs
//

/// dataRefs we read, order must match DATA_REFS_XP
enum dataRefsXP {
    DR_ACF_ICAO = 0,
    DR_ACF_UI_NAME,
    DR_ACF_TAILNUM,
    DR_LAT,
    DR_LON,
    DR_ENGN_RUNNING,
    DR_ON_GROUND_ANY,
    DR_IS_IN_REPLAY,
    CNT_DATAREFS_XP
};

static const char* DATA_REFS_XP[CNT_DATAREFS_XP] = {
    "sim/aircraft/view/acf_ICAO",
    "sim/aircraft/view/acf_ui_name",
    "sim/aircraft/view/acf_tailnum",
    "sim/flightmodel/position/latitude",
    "sim/flightmodel/position/longitude",
    "sim/flightmodel/engine/ENGN_running",
    "sim/flightmodel/failures/onground_any",
    "sim/time/is_in_replay",
};

static XPLMDataRef adrXP[CNT_DATAREFS_XP];

/// Finds all dataRefs, `false` if any is missing
static bool FindDataRefs ()
{
    for (int i = 0; i < CNT_DATAREFS_XP; i++) {
        if ((adrXP[i] = XPLMFindDataRef(DATA_REFS_XP[i])) == NULL) {
            LOG_MSG(logFATAL, ERR_DATAREF_FIND, DATA_REFS_XP[i]);
            return false;
        }
    }
    return true;
}

/// Reads a byte-array dataRef as string
static std::string GetDataStr (dataRefsXP dr)
{
    char buf[256];
    memset(buf, 0, sizeof(buf));
    XPLMGetDatab(adrXP[dr], buf, 0, sizeof(buf)-1);
    return std::string(buf);
}

/// Reads the user's aircraft into a wire record
static SimDataTy ReadUserAircraft ()
{
    SimDataTy sd;
    sd.icao         = GetDataStr(DR_ACF_ICAO);
    sd.name         = GetDataStr(DR_ACF_UI_NAME);
    sd.registration = GetDataStr(DR_ACF_TAILNUM);
    sd.lat          = XPLMGetDatad(adrXP[DR_LAT]);
    sd.lon          = XPLMGetDatad(adrXP[DR_LON]);
    
    int engn[XP_MAX_ENGINES];
    const int nEngn = XPLMGetDatavi(adrXP[DR_ENGN_RUNNING], engn, 0, XP_MAX_ENGINES);
    sd.bEngineOn = std::any_of(engn, engn + std::clamp(nEngn, 0, XP_MAX_ENGINES),
                               [](int e){ return e != 0; });
    sd.bOnGround    = XPLMGetDatai(adrXP[DR_ON_GROUND_ANY]) != 0;
    return sd;
}

//
// MARK: Publishing
//

/// All connected clients
static TCPBroadcaster gBroadcaster;

/// Flight loop callback: accept new clients, publish the current state
static float LoopCBPublish (float, float, int, void*)
{
    try {
        gBroadcaster.AcceptNew();
        if (gBroadcaster.NumClients() > 0 &&
            XPLMGetDatai(adrXP[DR_IS_IN_REPLAY]) == 0)
        {
            const std::string frame = EncodeFrame(ReadUserAircraft().ToCSV());
            const int n = gBroadcaster.SendAll(frame);
            LOG_MSG(logDEBUG, DBG_FRAME_SENT, (unsigned long)frame.size(), n);
        }
    }
    catch (const std::exception& e) {
        LOG_MSG(logERR, ERR_TOP_LEVEL_EXCEPTION, e.what());
    }
    return XP_FLIGHT_LOOP_INTVL;
}

//
// MARK: Plugin entry points
//

PLUGIN_API int XPluginStart(char* outName, char* outSig, char* outDesc)
{
    // all log output goes to X-Plane's Log.txt
    LogSetOutput(XPLMDebugString);
    
    snprintf(outName, 255, "%s %u.%u.%u", LOGBOOK_XP,
             LOGBOOK_VER_MAJOR, LOGBOOK_VER_MINOR, LOGBOOK_VER_PATCH);
    snprintf(outSig,  255, "%s", LOGBOOK_XP_SIG);
    snprintf(outDesc, 255, "%s", LOGBOOK_XP_DESCRIPTION);
    
    XPLMEnableFeature("XPLM_USE_NATIVE_PATHS",1);
    LOG_MSG(logMSG, MSG_STARTUP, LOGBOOK_VERSION);
    
    return FindDataRefs() ? 1 : 0;
}

PLUGIN_API int XPluginEnable(void)
{
    try {
        gBroadcaster.Listen(XP_LISTEN_ADDR, XP_DEFAULT_PORT);
        LOG_MSG(logINFO, MSG_XP_LISTENING, XP_LISTEN_ADDR, XP_DEFAULT_PORT);
        XPLMRegisterFlightLoopCallback(LoopCBPublish, XP_FLIGHT_LOOP_INTVL, NULL);
        return 1;
    }
    catch (const NetRuntimeError& e) {
        LOG_MSG(logERR, ERR_TCP_LISTENACCEPT, LOGBOOK_XP, XP_LISTEN_ADDR, XP_DEFAULT_PORT, e.what());
        gBroadcaster.Close();
        return 0;
    }
}

PLUGIN_API void XPluginReceiveMessage(XPLMPluginID, int, void*)
{}

PLUGIN_API void XPluginDisable(void)
{
    XPLMUnregisterFlightLoopCallback(LoopCBPublish, NULL);
    gBroadcaster.Close();
}

PLUGIN_API void XPluginStop(void)
{
    LogSetOutput(nullptr);
}
