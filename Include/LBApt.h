/// @file       LBApt.h
/// @brief      Airport proximity lookup in the navigation database
/// @details    The navigation database is an sqlite3 file with an `airport` table
///             (airport_id, ident, laty, lonx, left_lonx, right_lonx, bottom_laty, top_laty).
///             An R-tree `airport_coords` indexes the airports' bounding boxes.
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

#ifndef LBApt_h
#define LBApt_h

struct sqlite3;             // see sqlite3.h
struct sqlite3_stmt;

/// An airport as found in the navigation database
struct AirportTy {
    long long       id = 0;         ///< airport_id
    std::string     ident;          ///< ICAO ident
    latLonTy        pos;            ///< airport reference point
    boundingBoxTy   bounds;         ///< the box the airport was found by
    
    /// "ident (lat, lon)"
    std::string dbgTxt () const;
};

/// Access to the navigation database
class NavDataTy
{
public:
    /// How to open the database
    enum openModeE {
        NAV_READ_ONLY = 0,      ///< lookups only
        NAV_READ_WRITE,         ///< lookups and index bootstrap, file must exist
        NAV_CREATE,             ///< also create the database if missing (tests, `:memory:`)
    };
    
protected:
    std::string     path;                   ///< database path
    sqlite3*        db = nullptr;           ///< open database connection
    sqlite3_stmt*   stmtFind = nullptr;     ///< prepared lookup statement, created on first use

public:
    NavDataTy () {}
    /// Opens the database
    NavDataTy (const std::string& _path, openModeE mode = NAV_READ_WRITE)
    { Open(_path, mode); }
    /// Closes the database
    ~NavDataTy () { Close(); }
    
    // the database connection is owned exclusively
    NavDataTy (const NavDataTy&) = delete;
    NavDataTy& operator = (const NavDataTy&) = delete;
    
    /// @brief Opens the database
    /// @exception LBError if the database cannot be opened
    void Open (const std::string& _path, openModeE mode = NAV_READ_WRITE);
    /// Closes the database
    void Close ();
    /// Is the database open?
    bool isOpen () const { return db != nullptr; }
    const std::string& GetPath () const { return path; }
    
    /// @brief Executes one or more SQL statements without result
    /// @exception LBError on SQL errors
    void Exec (const char* sql);
    
    /// @brief Creates the airport R-tree if missing and adds missing airports to it
    /// @return Number of airports added to the index
    /// @exception LBError on SQL errors
    int CreateSpatialIndex ();
    
    /// @brief Finds the airport, whose bounding box contains `pos`
    /// @details If several boxes contain `pos` the smallest box wins,
    ///          equal sizes are decided by the lower airport_id.
    /// @exception LBError on SQL errors
    std::optional<AirportTy> FindContaining (const latLonTy& pos);
    
protected:
    /// throws LBError with the database's last error
    [[noreturn]] void ThrowSqlError (const char* szWhat) const;
};

#endif /* LBApt_h */
