#include "formcheck/pose/Geometry.h"
#include <algorithm>
#include <cmath>
#include <initializer_list>

namespace formcheck {

// 小于该长度的向量视为零向量
static const float kMinSegment = 1e-6f;

static bool usable(std::initializer_list<const Landmark*> lms, float min_visibility) {
    for (const Landmark* lm : lms) {
        if (!(lm->visibility >= min_visibility)) return false;   // NaN counts as unusable
    }
    return true;
}

static float toDegrees(double rad) {
    return static_cast<float>(rad * 180.0 / CV_PI);
}

float heightOf(const cv::Point2f& p, CoordinateFrame frame) {
    return frame == CoordinateFrame::CARTESIAN ? p.y : -p.y;
}

Landmark midpoint(const Landmark& p, const Landmark& q) {
    Landmark m;
    m.pos = (p.pos + q.pos) * 0.5f;
    m.visibility = std::min(p.visibility, q.visibility);
    return m;
}

Measurement distance(const Landmark& p, const Landmark& q, const GeometryOptions& opt) {
    if (!usable({&p, &q}, opt.min_visibility))
        return Measurement::unusable(MeasureStatus::INSUFFICIENT_CONFIDENCE);
    return Measurement::of(static_cast<float>(cv::norm(p.xy() - q.xy())));
}

Measurement angle(const Landmark& a, const Landmark& b, const Landmark& c, const GeometryOptions& opt) {
    if (!usable({&a, &b, &c}, opt.min_visibility))
        return Measurement::unusable(MeasureStatus::INSUFFICIENT_CONFIDENCE);

    cv::Point2f v1 = a.xy() - b.xy();
    cv::Point2f v2 = c.xy() - b.xy();
    if (cv::norm(v1) < kMinSegment || cv::norm(v2) < kMinSegment)
        return Measurement::unusable(MeasureStatus::DEGENERATE);

    // atan2(|cross|, dot) stays accurate near 0 and 180 where acos does not
    double cross = std::abs(static_cast<double>(v1.cross(v2)));
    double dot = static_cast<double>(v1.dot(v2));
    return Measurement::of(toDegrees(std::atan2(cross, dot)));
}

Measurement verticalOffset(const Landmark& p, const Landmark& q, const GeometryOptions& opt) {
    if (!usable({&p, &q}, opt.min_visibility))
        return Measurement::unusable(MeasureStatus::INSUFFICIENT_CONFIDENCE);
    return Measurement::of(heightOf(p.xy(), opt.frame) - heightOf(q.xy(), opt.frame));
}

Measurement horizontalOffset(const Landmark& p, const Landmark& q, const GeometryOptions& opt) {
    if (!usable({&p, &q}, opt.min_visibility))
        return Measurement::unusable(MeasureStatus::INSUFFICIENT_CONFIDENCE);
    return Measurement::of(p.pos.x - q.pos.x);
}

Measurement tiltDegrees(const Landmark& p, const Landmark& q, const GeometryOptions& opt) {
    if (!usable({&p, &q}, opt.min_visibility))
        return Measurement::unusable(MeasureStatus::INSUFFICIENT_CONFIDENCE);

    cv::Point2f d = q.xy() - p.xy();
    if (cv::norm(d) < kMinSegment)
        return Measurement::unusable(MeasureStatus::DEGENERATE);
    return Measurement::of(toDegrees(std::atan2(std::abs(d.y), std::abs(d.x))));
}

Check isLevel(const Landmark& p, const Landmark& q, float tolerance_deg, const GeometryOptions& opt) {
    Measurement tilt = tiltDegrees(p, q, opt);
    if (!tilt.ok()) return Check::unusable(tilt.status);
    return Check::of(tilt.value < tolerance_deg, tilt.value);
}

Measurement lineDistance(const Landmark& joint, const Landmark& line_a, const Landmark& line_b,
                         const GeometryOptions& opt) {
    if (!usable({&joint, &line_a, &line_b}, opt.min_visibility))
        return Measurement::unusable(MeasureStatus::INSUFFICIENT_CONFIDENCE);

    cv::Point2f dir = line_b.xy() - line_a.xy();
    double len = cv::norm(dir);
    if (len < kMinSegment)
        return Measurement::unusable(MeasureStatus::DEGENERATE);

    cv::Point2f rel = joint.xy() - line_a.xy();
    return Measurement::of(static_cast<float>(std::abs(static_cast<double>(dir.cross(rel))) / len));
}

Check nearBody(const Landmark& joint, const Landmark& line_a, const Landmark& line_b,
               float max_distance, const GeometryOptions& opt) {
    Measurement d = lineDistance(joint, line_a, line_b, opt);
    if (!d.ok()) return Check::unusable(d.status);
    return Check::of(d.value <= max_distance, d.value);
}

} // namespace formcheck
