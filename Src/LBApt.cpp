/// @file       LBApt.cpp
/// @brief      Airport proximity lookup in the navigation database
/// @details    Bounding box containment query against the `airport_coords` R-tree\n
///             Bootstrap of the R-tree from the `airport` table
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
#include <sqlite3.h>

//
// MARK: SQL
//

/// Creates the R-tree of airport bounding boxes
static const char* SQL_CREATE_IDX =
    "create virtual table if not exists airport_coords using rtree("
        "airport_id, left_lonx, right_lonx, bottom_laty, top_laty)";

/// @brief Adds all airports, which are not yet indexed
/// @details The R-tree requires min <= max, so for boxes crossing the
///          antimeridian (left > right) the east edge is stored plus 360
static const char* SQL_FILL_IDX =
    "insert or ignore into airport_coords "
        "select airport_id, left_lonx, "
               "case when right_lonx < left_lonx then right_lonx + 360 else right_lonx end, "
               "bottom_laty, top_laty from airport";

/// @brief Finds airports by position (?1 = lon, ?2 = lat), smallest box first
/// @details `?1 + 360` finds boxes, which cross the antimeridian, west of it.
///          Bounds are returned as stored in `airport`.
static const char* SQL_FIND_CONTAINING =
    "select a.airport_id, a.ident, a.laty, a.lonx, "
           "a.left_lonx, a.right_lonx, a.bottom_laty, a.top_laty "
    "from airport_coords c join airport a on a.airport_id = c.airport_id "
    "where ((c.left_lonx <= ?1 and c.right_lonx >= ?1) or "
           "(c.left_lonx <= ?1 + 360 and c.right_lonx >= ?1 + 360)) "
      "and c.bottom_laty <= ?2 and c.top_laty >= ?2 "
    "order by (c.right_lonx - c.left_lonx) * (c.top_laty - c.bottom_laty), a.airport_id "
    "limit 1";

//
// MARK: AirportTy
//

std::string AirportTy::dbgTxt () const
{
    return ident + " (" + pos.dbgTxt() + ")";
}

//
// MARK: NavDataTy
//

// Opens the database
void NavDataTy::Open (const std::string& _path, openModeE mode)
{
    Close();
    path = _path;
    int flags = SQLITE_OPEN_READONLY;
    switch (mode) {
        case NAV_READ_ONLY:     flags = SQLITE_OPEN_READONLY; break;
        case NAV_READ_WRITE:    flags = SQLITE_OPEN_READWRITE; break;
        case NAV_CREATE:        flags = SQLITE_OPEN_READWRITE | SQLITE_OPEN_CREATE; break;
    }
    
    if (sqlite3_open_v2(path.c_str(), &db, flags, nullptr) != SQLITE_OK) {
        // even in case of errors there usually is a handle, which carries the message
        const std::string err = db ? sqlite3_errmsg(db) : "out of memory";
        Close();
        THROW_ERROR(logFATAL, ERR_NAVDATA_OPEN, path.c_str(), err.c_str());
    }
    LOG_MSG(logINFO, MSG_NAVDATA_OPEN, path.c_str());
}

// Closes the database
void NavDataTy::Close ()
{
    if (stmtFind) {
        sqlite3_finalize(stmtFind);
        stmtFind = nullptr;
    }
    if (db) {
        sqlite3_close(db);
        db = nullptr;
    }
}

// throws LBError with the database's last error
void NavDataTy::ThrowSqlError (const char* szWhat) const
{
    THROW_ERROR(logFATAL, ERR_NAVDATA_SQL, path.c_str(), szWhat,
                db ? sqlite3_errmsg(db) : "not open");
}

// Executes SQL statements without result
void NavDataTy::Exec (const char* sql)
{
    char* szErr = nullptr;
    if (!db || sqlite3_exec(db, sql, nullptr, nullptr, &szErr) != SQLITE_OK) {
        const std::string err = szErr ? szErr : "not open";
        sqlite3_free(szErr);
        THROW_ERROR(logFATAL, ERR_NAVDATA_SQL, path.c_str(), sql, err.c_str());
    }
}

// Creates the airport R-tree if missing and adds missing airports to it
int NavDataTy::CreateSpatialIndex ()
{
    // a prepared statement might refer to an outdated schema
    if (stmtFind) {
        sqlite3_finalize(stmtFind);
        stmtFind = nullptr;
    }
    
    Exec(SQL_CREATE_IDX);
    Exec(SQL_FILL_IDX);
    const int n = sqlite3_changes(db);
    LOG_MSG(logINFO, MSG_NAVDATA_INDEX, n);
    return n;
}

// Finds the airport, whose bounding box contains `pos`
std::optional<AirportTy> NavDataTy::FindContaining (const latLonTy& pos)
{
    if (!db)
        ThrowSqlError("lookup");
    
    // prepare the statement once, then reuse it
    if (!stmtFind) {
        if (sqlite3_prepare_v2(db, SQL_FIND_CONTAINING, -1, &stmtFind, nullptr) != SQLITE_OK) {
            stmtFind = nullptr;
            ThrowSqlError("prepare");
        }
    } else {
        sqlite3_reset(stmtFind);
    }
    
    if (sqlite3_bind_double(stmtFind, 1, pos.lon) != SQLITE_OK ||
        sqlite3_bind_double(stmtFind, 2, pos.lat) != SQLITE_OK)
        ThrowSqlError("bind");
    
    std::optional<AirportTy> ret;
    switch (sqlite3_step(stmtFind)) {
        case SQLITE_ROW: {
            AirportTy apt;
            apt.id = sqlite3_column_int64(stmtFind, 0);
            const unsigned char* szIdent = sqlite3_column_text(stmtFind, 1);
            apt.ident = szIdent ? reinterpret_cast<const char*>(szIdent) : "";
            apt.pos = latLonTy(sqlite3_column_double(stmtFind, 2),
                               sqlite3_column_double(stmtFind, 3));
            apt.bounds = boundingBoxTy(sqlite3_column_double(stmtFind, 4),
                                       sqlite3_column_double(stmtFind, 5),
                                       sqlite3_column_double(stmtFind, 6),
                                       sqlite3_column_double(stmtFind, 7));
            LOG_MSG(logDEBUG, DBG_APT_FOUND, apt.ident.c_str(), pos.dbgTxt().c_str());
            ret = std::move(apt);
            break;
        }
        case SQLITE_DONE:
            break;
        default:
            ThrowSqlError("lookup");
    }
    sqlite3_reset(stmtFind);
    return ret;
}
