/// @file       CoordCalc.cpp
/// @brief      Geodesic calculations on the WGS84 ellipsoid, DMS conversions
/// @details    Vincenty's inverse and direct formulae\n
///             Spherical great circle formulae as fallback\n
///             DMS formatting, bounding box
/// @see        T. Vincenty, "Direct and Inverse Solutions of Geodesics on the Ellipsoid
///             with application of nested equations", Survey Review XXIII, 1975
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

//
// MARK: ptTy
//

bool ptTy::operator== (const ptTy& _o) const
{
    return dequal(x, _o.x) && dequal(y, _o.y);
}


std::string ptTy::dbgTxt () const
{
    char buf[100];
    snprintf(buf, sizeof(buf), "%7.5f, %7.5f", y, x);
    return std::string(buf);
}

// Normaize a heading to the value range [0..360)
double HeadingNormalize (double h)
{
    // Rarely will ever more than one statement be executed:
    while (h < 0.0)    h += 360.0;          // make sure it's non-negative
    while (h >= 360.0) h -= 360.0;          // make sure it's less than 360
    return h;
}

//
// MARK: dmsTy
//

// Splits degrees into d/m/s, each step truncates
dmsTy dmsTy::FromDegrees (double d)
{
    const double a = std::abs(d);
    const double deg = std::floor(a);
    const double min = std::floor((a - deg) * 60.0);
    return dmsTy(unsigned(deg), unsigned(min),
                 (a - deg - min / 60.0) * 3600.0);
}

dmsTy dmsTy::FromLatitude (double lat)
{
    dmsTy ret = FromDegrees(lat);
    ret.card = lat < 0.0 ? CARD_S : CARD_N;
    return ret;
}

dmsTy dmsTy::FromLongitude (double lon)
{
    dmsTy ret = FromDegrees(lon);
    ret.card = lon < 0.0 ? CARD_W : CARD_E;
    return ret;
}

// Combines back to degrees, negative for S or W
double dmsTy::ToDegrees () const
{
    const double d = double(deg) + double(min) / 60.0 + sec / 3600.0;
    return (card == CARD_S || card == CARD_W) ? -d : d;
}

dmsTy::operator std::string() const
{
    static const char* CARD_TXT[] = { "", "N", "S", "E", "W" };
    char buf[50];
    snprintf(buf, sizeof(buf), "%u°%u'%.2f\"%s",
             deg, min, sec, CARD_TXT[card]);
    return std::string(buf);
}

//
// MARK: latLonTy
//

std::string latLonTy::dbgTxt () const
{
    char buf[100];
    snprintf(buf, sizeof(buf), "%7.5f, %7.5f", lat, lon);
    return std::string(buf);
}

latLonTy::operator std::string() const
{
    const std::pair<dmsTy,dmsTy> dms = ToDMS();
    return std::string(dms.first) + ' ' + std::string(dms.second);
}

//
// MARK: Vincenty's formulae
//

/// Correction term Δσ, shared by inverse and direct solution
static double VincentyDeltaSigma (double B, double sinSigma, double cosSigma, double cos2SigmaM)
{
    return B * sinSigma * (cos2SigmaM + B / 4.0 *
                           (cosSigma * (-1.0 + 2.0 * sqr(cos2SigmaM)) -
                            B / 6.0 * cos2SigmaM * (-3.0 + 4.0 * sqr(sinSigma)) *
                            (-3.0 + 4.0 * sqr(cos2SigmaM))));
}

/// Computes Vincenty's A and B from u²
static void VincentyAB (double uSq, double& A, double& B)
{
    A = 1.0 + uSq / 16384.0 * (4096.0 + uSq * (-768.0 + uSq * (320.0 - 175.0 * uSq)));
    B = uSq / 1024.0 * (256.0 + uSq * (-128.0 + uSq * (74.0 - 47.0 * uSq)));
}

// Inverse geodesic problem
bool CoordInverse (const latLonTy& from, const latLonTy& to,
                   double& dist, double& azi1, double* azi2)
{
    using namespace std;
    // longitude difference normalized to [-180..180)
    const double L = deg2rad(HeadingNormalize(to.lon - from.lon + 180.0) - 180.0);
    // lines across a pole or to the far side of the globe let λ exceed π
    const bool bAntipodal = abs(L) > PI/2.0 ||
                            abs(to.latRad() - from.latRad()) > PI/2.0;
    const double U1 = atan((1.0 - WGS84_F) * tan(from.latRad()));
    const double U2 = atan((1.0 - WGS84_F) * tan(to.latRad()));
    const double sinU1 = sin(U1), cosU1 = cos(U1);
    const double sinU2 = sin(U2), cosU2 = cos(U2);
    
    double lambda = L, lambdaP = 0.0;
    double sinLambda = 0.0, cosLambda = 0.0;
    double sinSigma = 0.0, cosSigma = 0.0, sigma = 0.0;
    double cosSqAlpha = 0.0, cos2SigmaM = 0.0;
    int iter = 0;
    do {
        sinLambda = sin(lambda);
        cosLambda = cos(lambda);
        sinSigma = sqrt(pyth2(cosU2 * sinLambda,
                              cosU1 * sinU2 - sinU1 * cosU2 * cosLambda));
        // coincident points
        if (sinSigma == 0.0) {
            dist = 0.0;
            azi1 = 0.0;
            if (azi2) *azi2 = 0.0;
            return true;
        }
        cosSigma = sinU1 * sinU2 + cosU1 * cosU2 * cosLambda;
        sigma = atan2(sinSigma, cosSigma);
        const double sinAlpha = cosU1 * cosU2 * sinLambda / sinSigma;
        cosSqAlpha = 1.0 - sqr(sinAlpha);
        // on the equator cos²α is 0
        cos2SigmaM = cosSqAlpha != 0.0 ? cosSigma - 2.0 * sinU1 * sinU2 / cosSqAlpha : 0.0;
        const double C = WGS84_F / 16.0 * cosSqAlpha * (4.0 + WGS84_F * (4.0 - 3.0 * cosSqAlpha));
        lambdaP = lambda;
        lambda = L + (1.0 - C) * WGS84_F * sinAlpha *
                 (sigma + C * sinSigma * (cos2SigmaM + C * cosSigma * (-1.0 + 2.0 * sqr(cos2SigmaM))));
        if ((bAntipodal ? abs(lambda) - PI : abs(lambda)) > PI)
            return false;
    } while (abs(lambda - lambdaP) > VINCENTY_EPS && ++iter < VINCENTY_MAX_ITER);
    
    if (iter >= VINCENTY_MAX_ITER)
        return false;
    
    const double uSq = cosSqAlpha * (sqr(WGS84_A) - sqr(WGS84_B)) / sqr(WGS84_B);
    double A = 0.0, B = 0.0;
    VincentyAB(uSq, A, B);
    
    dist = WGS84_B * A * (sigma - VincentyDeltaSigma(B, sinSigma, cosSigma, cos2SigmaM));
    azi1 = HeadingNormalize(rad2deg(atan2(cosU2 * sinLambda,
                                          cosU1 * sinU2 - sinU1 * cosU2 * cosLambda)));
    if (azi2)
        *azi2 = HeadingNormalize(rad2deg(atan2(cosU1 * sinLambda,
                                               -sinU1 * cosU2 + cosU1 * sinU2 * cosLambda)));
    return true;
}

// Direct geodesic problem
latLonTy CoordDirect (const latLonTy& from, double azi, double dist,
                      double* azi2)
{
    using namespace std;
    const double alpha1 = deg2rad(azi);
    const double sinAlpha1 = sin(alpha1), cosAlpha1 = cos(alpha1);
    
    const double tanU1 = (1.0 - WGS84_F) * tan(from.latRad());
    const double cosU1 = 1.0 / sqrt(1.0 + sqr(tanU1));
    const double sinU1 = tanU1 * cosU1;
    const double sigma1 = atan2(tanU1, cosAlpha1);
    const double sinAlpha = cosU1 * sinAlpha1;
    const double cosSqAlpha = 1.0 - sqr(sinAlpha);
    const double uSq = cosSqAlpha * (sqr(WGS84_A) - sqr(WGS84_B)) / sqr(WGS84_B);
    double A = 0.0, B = 0.0;
    VincentyAB(uSq, A, B);
    
    double sigma = dist / (WGS84_B * A), sigmaP = 0.0;
    double sinSigma = 0.0, cosSigma = 0.0, cos2SigmaM = 0.0;
    int iter = 0;
    do {
        cos2SigmaM = cos(2.0 * sigma1 + sigma);
        sinSigma = sin(sigma);
        cosSigma = cos(sigma);
        sigmaP = sigma;
        sigma = dist / (WGS84_B * A) + VincentyDeltaSigma(B, sinSigma, cosSigma, cos2SigmaM);
    } while (abs(sigma - sigmaP) > VINCENTY_EPS && ++iter < VINCENTY_MAX_ITER);
    
    // values of the final sigma
    cos2SigmaM = cos(2.0 * sigma1 + sigma);
    sinSigma = sin(sigma);
    cosSigma = cos(sigma);
    
    const double tmp = sinU1 * sinSigma - cosU1 * cosSigma * cosAlpha1;
    const double lat2 = atan2(sinU1 * cosSigma + cosU1 * sinSigma * cosAlpha1,
                              (1.0 - WGS84_F) * sqrt(pyth2(sinAlpha, tmp)));
    const double lambda = atan2(sinSigma * sinAlpha1,
                                cosU1 * cosSigma - sinU1 * sinSigma * cosAlpha1);
    const double C = WGS84_F / 16.0 * cosSqAlpha * (4.0 + WGS84_F * (4.0 - 3.0 * cosSqAlpha));
    const double L = lambda - (1.0 - C) * WGS84_F * sinAlpha *
                     (sigma + C * sinSigma * (cos2SigmaM + C * cosSigma * (-1.0 + 2.0 * sqr(cos2SigmaM))));
    
    // longitude normalized to [-180..180)
    double lon2 = from.lon + rad2deg(L);
    lon2 = HeadingNormalize(lon2 + 180.0) - 180.0;
    
    if (azi2)
        *azi2 = HeadingNormalize(rad2deg(atan2(sinAlpha, -tmp)));
    return latLonTy(rad2deg(lat2), lon2);
}

//
// MARK: Spherical earth
//      (as per stackoverflow post, adapted)
//

double CoordAngleSphere (double lat1, double lon1, double lat2, double lon2)
{
    lat1 *= PI; lat1 /= 180.0;              // in-place degree-to-rad conversion
    lon1 *= PI; lon1 /= 180.0;
    lat2 *= PI; lat2 /= 180.0;
    lon2 *= PI; lon2 /= 180.0;
    const double longitudeDifference = lon2 - lon1;
    
    using namespace std;
    const double x = (cos(lat1) * sin(lat2)) -
                     (sin(lat1) * cos(lat2) * cos(longitudeDifference));
    const double y = sin(longitudeDifference) * cos(lat2);
    
    return rad2deg360(atan2(y, x));
}

double CoordDistanceSphere (double lat1, double lon1, double lat2, double lon2)
{
    lat1 *= PI; lat1 /= 180.0;              // in-place degree-to-rad conversion
    lon1 *= PI; lon1 /= 180.0;
    lat2 *= PI; lat2 /= 180.0;
    lon2 *= PI; lon2 /= 180.0;

    using namespace std;
    const double x = sin((lat2 - lat1) / 2);
    const double y = sin((lon2 - lon1) / 2);
    return EARTH_D_M * asin(sqrt((x * x) + (cos(lat1) * cos(lat2) * y * y)));
}

//
// MARK: Coordinate Calc
//

double CoordDistance (const latLonTy& p1, const latLonTy& p2)
{
    double dist = NAN, azi = NAN;
    if (CoordInverse(p1, p2, dist, azi))
        return dist;
    // Vincenty doesn't converge for nearly antipodal points
    return CoordDistanceSphere(p1.lat, p1.lon, p2.lat, p2.lon);
}

double CoordAngle (const latLonTy& p1, const latLonTy& p2)
{
    double dist = NAN, azi = NAN;
    if (CoordInverse(p1, p2, dist, azi))
        return azi;
    return CoordAngleSphere(p1.lat, p1.lon, p2.lat, p2.lon);
}

latLonTy CoordPlusVector (const latLonTy& pos, double angle, double dist)
{
    return CoordDirect(pos, angle, dist);
}

// local offset of `to` as seen from `from`
ptTy CoordDistanceXY (const latLonTy& from, const latLonTy& to)
{
    double dist = NAN, azi = NAN;
    if (!CoordInverse(from, to, dist, azi)) {
        dist = CoordDistanceSphere(from.lat, from.lon, to.lat, to.lon);
        azi  = CoordAngleSphere(from.lat, from.lon, to.lat, to.lon);
    }
    return dist * HeadingToPoint(azi);
}

//
//MARK: Bounding Box
//

boundingBoxTy::operator std::string() const
{
    char buf[120];
    snprintf(buf, sizeof(buf), "lon %.5f..%.5f, lat %.5f..%.5f",
             left, right, bottom, top);
    return std::string(buf);
}

// is position within bounding box?
bool boundingBoxTy::contains (const latLonTy& pos ) const
{
    if (!between(pos.lat, bottom, top))
        return false;
    // a box crossing the antimeridian has left > right
    if (left <= right)
        return between(pos.lon, left, right);
    return pos.lon >= left || pos.lon <= right;
}
