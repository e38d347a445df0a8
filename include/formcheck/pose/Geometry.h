#pragma once
#include <opencv2/core.hpp>
#include "Types.h"

namespace formcheck {

/*  几何特征库 Geometric feature library
*
*   Pure functions over landmarks. Every call checks the landmarks it reads
*   against GeometryOptions::min_visibility first and reports
*   INSUFFICIENT_CONFIDENCE instead of a number when one is below it.
*/

struct GeometryOptions {
    float min_visibility = 0.5f;
    CoordinateFrame frame = CoordinateFrame::IMAGE;
};

// Scalar feature
struct Measurement {
    MeasureStatus status = MeasureStatus::OK;
    float value = 0.f;

    bool ok() const { return status == MeasureStatus::OK; }
    static Measurement of(float v) { return Measurement{MeasureStatus::OK, v}; }
    static Measurement unusable(MeasureStatus s) { return Measurement{s, 0.f}; }
};

// Boolean feature, value carries the underlying measurement
struct Check {
    MeasureStatus status = MeasureStatus::OK;
    bool holds = false;
    float value = 0.f;

    bool ok() const { return status == MeasureStatus::OK; }
    static Check of(bool h, float v) { return Check{MeasureStatus::OK, h, v}; }
    static Check unusable(MeasureStatus s) { return Check{s, false, 0.f}; }
};

// Height of a point: y in CARTESIAN, -y in IMAGE (larger = higher)
float heightOf(const cv::Point2f& p, CoordinateFrame frame);

// Midpoint of two landmarks, visibility = min of both
Landmark midpoint(const Landmark& p, const Landmark& q);

// Euclidean distance in the x/y plane
Measurement distance(const Landmark& p, const Landmark& q, const GeometryOptions& opt);

// Angle at vertex b formed by rays b->a and b->c, degrees in [0, 180]
// DEGENERATE when a or c coincides with b
Measurement angle(const Landmark& a, const Landmark& b, const Landmark& c, const GeometryOptions& opt);

// height(p) - height(q): positive when p is above q
Measurement verticalOffset(const Landmark& p, const Landmark& q, const GeometryOptions& opt);

// p.x - q.x
Measurement horizontalOffset(const Landmark& p, const Landmark& q, const GeometryOptions& opt);

// Deviation of line p-q from horizontal, degrees in [0, 90]
Measurement tiltDegrees(const Landmark& p, const Landmark& q, const GeometryOptions& opt);

// tilt(p, q) < tolerance_deg
Check isLevel(const Landmark& p, const Landmark& q, float tolerance_deg, const GeometryOptions& opt);

// Perpendicular distance from joint to the infinite line through line_a/line_b
Measurement lineDistance(const Landmark& joint, const Landmark& line_a, const Landmark& line_b,
                         const GeometryOptions& opt);

// lineDistance(joint, line_a, line_b) <= max_distance
Check nearBody(const Landmark& joint, const Landmark& line_a, const Landmark& line_b,
               float max_distance, const GeometryOptions& opt);

} // namespace formcheck
