#include "geo.hpp"
#include <cmath>
#include <algorithm>

double haversine_km(double lat1, double lon1, double lat2, double lon2)
{
    const double PI = std::acos(-1.0);
    auto to_rad = [PI](double degree) { return degree * PI / 180.0; };

    double phi1 = to_rad(lat1);
    double phi2 = to_rad(lat2);
    double dlat = to_rad(lat2 - lat1);
    double dlon = to_rad(lon2 - lon1);

    double a = std::sin(dlat / 2.0) * std::sin(dlat / 2.0) +
               std::cos(phi1) * std::cos(phi2) *
               std::sin(dlon / 2.0) * std::sin(dlon / 2.0);
    a = std::min(1.0, std::max(0.0, a));
    return 2.0 * EARTH_RADIUS_KM * std::asin(std::sqrt(a));
}
