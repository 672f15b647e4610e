#pragma once

constexpr double EARTH_RADIUS_KM = 6371.0;

// Great-circle distance in km between two lat/lon points given in degrees.
double haversine_km(double lat1, double lon1, double lat2, double lon2);
