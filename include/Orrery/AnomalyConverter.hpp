#pragma once

// Conversions between the anomalies and the focal distance of an ellipse.
// All angles in radians; valid for 0 <= e < 1.
namespace Orrery::AnomalyConverter {

// True anomaly from eccentric anomaly (half-angle form, stable near e -> 1).
double trueAnomaly(double eccentricAnomaly, double eccentricity);

// Distance from the focus: r = a(1 - e cos E).
double radius(double semiMajorAxis, double eccentricity, double eccentricAnomaly);

// Orbit equation: r = a(1 - e^2) / (1 + e cos nu).
double radiusAtTrueAnomaly(double semiMajorAxis, double eccentricity, double trueAnomaly);

// Mean anomaly M = L - varpi from mean longitude and longitude of periapsis, in [0, 2*pi).
double meanLongitudeToMeanAnomaly(double meanLongitude, double longitudeOfPeriapsis);

} // namespace Orrery::AnomalyConverter
