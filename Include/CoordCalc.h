/// @file       CoordCalc.h
/// @brief      Geodesic calculations on the WGS84 ellipsoid, DMS conversions
/// @details    Distance/bearing (inverse) and destination point (direct) by Vincenty's formulae\n
///             Local east/north projection of the distance between two positions\n
///             Degree/minute/second representation of coordinates\n
///             Lon/lat bounding box
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

#ifndef CoordCalc_h
#define CoordCalc_h

// positions and angles are in degrees
// distances are in meters

//
// MARK: Mathematical helper functions
//
/// Square, ie. a^2
template <class T>
inline T sqr (T a) { return a*a; }

/// Pythagoras square, ie. a^2 + b^2
template <class T>
inline T pyth2 (T a, T b) { return sqr(a) + sqr(b); }

//
//MARK: Degree/Radian conversion
//

/// Converts degree to radians
constexpr inline double deg2rad (const double deg)
{ return (deg * PI / 180.0); }

/// Converts radians to degree
constexpr inline double rad2deg (const double rad)
{ return (rad * 180.0 / PI); }

/// Converts radians [-π...+2π] to degree [0..360]
constexpr inline double rad2deg360 (const double rad)
{ return ((rad >= 0.0 ? rad : rad+PI+PI) * 180.0 / PI); }

/// Normaize a heading to the value range [0..360)
double HeadingNormalize (double h);

//
//MARK: Point, DMS, Coordinate
//

/// A simple two-dimensional point, used for local east (x) / north (y) offsets in meters
struct ptTy {
    double x, y;
    ptTy () : x(NAN), y(NAN) {}
    ptTy (double _x, double _y) : x(_x), y(_y) {}
    ptTy operator + (const ptTy& _o) const { return ptTy ( x+_o.x, y+_o.y); }   ///< scalar sum
    ptTy operator - (const ptTy& _o) const { return ptTy ( x-_o.x, y-_o.y); }   ///< scalar difference
    bool operator== (const ptTy& _o) const;                                     ///< equality based on dequal() (ie. 'nearly' equal)
    bool operator!= (const ptTy& _o) const { return !operator==(_o); }          ///< unequality bases on `not equal`
    
    std::string dbgTxt () const;                                                ///< returns a string "y, x" for the point/position
};
inline ptTy operator * (double d, ptTy pt) { return ptTy ( d * pt.x, d * pt.y); }   ///< scalar multiplication

/// Cardinal direction of a DMS value
enum cardinalE : unsigned char {
    CARD_NONE = 0,          ///< plain value, no direction
    CARD_N,
    CARD_S,
    CARD_E,
    CARD_W,
};

/// Degree, minute, second representation of an angle
struct dmsTy {
    unsigned    deg = 0;                ///< whole degrees
    unsigned    min = 0;                ///< whole minutes
    double      sec = 0.0;              ///< seconds incl. fractions
    cardinalE   card = CARD_NONE;       ///< cardinal direction, if any
    
    dmsTy () {}
    dmsTy (unsigned _d, unsigned _m, double _s, cardinalE _c = CARD_NONE) :
    deg(_d), min(_m), sec(_s), card(_c) {}
    
    /// @brief Splits degrees into d/m/s, each step truncates, sign is dropped
    static dmsTy FromDegrees (double d);
    /// Splits a latitude, cardinal N or S
    static dmsTy FromLatitude (double lat);
    /// Splits a longitude, cardinal E or W
    static dmsTy FromLongitude (double lon);
    
    /// Combines back to degrees, negative for S or W
    double ToDegrees () const;
    
    /// `D°M'S.SS"C`
    operator std::string() const;
};

/// A coordinate: latitude/longitude in degrees
struct latLonTy {
    double lat = NAN;
    double lon = NAN;
    
    latLonTy () {}
    latLonTy (double _lat, double _lon) : lat(_lat), lon(_lon) {}
    
    /// Create from latitude/longitude given in radians
    static latLonTy FromRadians (double latRad, double lonRad)
    { return latLonTy(rad2deg(latRad), rad2deg(lonRad)); }
    /// Create from two DMS values
    static latLonTy FromDMS (const dmsTy& dmsLat, const dmsTy& dmsLon)
    { return latLonTy(dmsLat.ToDegrees(), dmsLon.ToDegrees()); }
    
    double latRad () const { return deg2rad(lat); }    ///< latitude in radians
    double lonRad () const { return deg2rad(lon); }    ///< longitude in radians
    /// latitude and longitude as DMS with cardinal directions
    std::pair<dmsTy,dmsTy> ToDMS () const
    { return std::make_pair(dmsTy::FromLatitude(lat), dmsTy::FromLongitude(lon)); }
    
    /// "lat, lon" with 5 decimals
    std::string dbgTxt () const;
    /// DMS format like `34°43'4.00"N 32°29'8.00"E`
    operator std::string() const;
};

//
//MARK: Functions on coordinates
//

/// @brief Inverse geodesic problem on WGS84 (Vincenty)
/// @param[out] dist Distance in meters
/// @param[out] azi1 Initial azimuth at `from` in degrees [0..360)
/// @param[out] azi2 Final azimuth at `to` in degrees [0..360), optional
/// @return `false` if the iteration did not converge (near-antipodal points)
bool CoordInverse (const latLonTy& from, const latLonTy& to,
                   double& dist, double& azi1, double* azi2 = nullptr);

/// @brief Direct geodesic problem on WGS84 (Vincenty)
/// @param from Start position
/// @param azi Initial azimuth in degrees
/// @param dist Distance in meters
/// @param[out] azi2 Final azimuth in degrees, optional
/// @return Destination position
latLonTy CoordDirect (const latLonTy& from, double azi, double dist,
                      double* azi2 = nullptr);

/// distance between two locations on the spherical earth [meter]
double CoordDistanceSphere (double lat1, double lon1, double lat2, double lon2);
/// angle between two locations on the spherical earth [degree]
double CoordAngleSphere (double lat1, double lon1, double lat2, double lon2);

/// distance between two coordinates on WGS84 [meter]
double CoordDistance (const latLonTy& pos1, const latLonTy& pos2);
/// initial bearing from one coordinate to the other [degree, 0..360)
double CoordAngle (const latLonTy& pos1, const latLonTy& pos2);
/// destination point given a starting point, bearing [degree], and distance [meter]
latLonTy CoordPlusVector (const latLonTy& pos, double angle, double dist);
/// local offset (x = east, y = north) [meter] of `to` as seen from `from`
ptTy CoordDistanceXY (const latLonTy& from, const latLonTy& to);

/// @brief The unit vector pointing into the given heading
/// @details North (0,1) rotated clockwise, so that 90° is east (1,0)
inline ptTy HeadingToPoint (double heading)
{ return ptTy(std::sin(deg2rad(heading)), std::cos(deg2rad(heading))); }

//
//MARK: Bounding Box
//

/// An axis-aligned rectangle in lon/lat space
struct boundingBoxTy {
    double left   = NAN;        ///< west edge (longitude)
    double right  = NAN;        ///< east edge (longitude)
    double bottom = NAN;        ///< south edge (latitude)
    double top    = NAN;        ///< north edge (latitude)
    
    boundingBoxTy () {}
    boundingBoxTy (double _left, double _right, double _bottom, double _top) :
    left(_left), right(_right), bottom(_bottom), top(_top) {}
    
    // standard string for any output purposes
    operator std::string() const;
    
    // is position within bounding box? (edges included)
    bool contains (const latLonTy& pos ) const;
    bool operator & (const latLonTy& pos ) const { return contains(pos); }
};

#endif /* CoordCalc_h */
