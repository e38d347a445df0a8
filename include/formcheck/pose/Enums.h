#pragma once
#include <string>

namespace formcheck {

// Enumeration: supported exercises.
enum class Exercise {
    BICEP_CURL = 0,
    LATERAL_RAISE
};

// Enumeration: tracked body side.
enum class Side {
    LEFT = 0,
    RIGHT
};

// 坐标系: IMAGE -> y 向下 (detector pixels), CARTESIAN -> y 向上
enum class CoordinateFrame {
    IMAGE = 0,
    CARTESIAN
};

// Outcome of a single geometric computation.
enum class MeasureStatus {
    OK = 0,
    INSUFFICIENT_CONFIDENCE,   // a landmark's visibility is below threshold
    DEGENERATE                 // coincident points, zero-length reference line
};

// Tri-state rule outcome.
enum class VerdictStatus {
    PASS = 0,
    FAIL,
    UNKNOWN
};

// Per-frame overall outcome.
enum class FrameStatus {
    PASS = 0,
    FAIL,
    UNKNOWN,
    UNDETECTED      // required landmark absent from the frame
};

inline std::string toString(Exercise e) {
    switch (e) {
        case Exercise::BICEP_CURL:    return "bicep_curl";
        case Exercise::LATERAL_RAISE: return "lateral_raise";
    }
    return "unknown";
}

inline std::string toString(Side s) {
    return s == Side::LEFT ? "left" : "right";
}

inline std::string toString(CoordinateFrame f) {
    return f == CoordinateFrame::IMAGE ? "image" : "cartesian";
}

inline std::string toString(MeasureStatus s) {
    switch (s) {
        case MeasureStatus::OK:                      return "OK";
        case MeasureStatus::INSUFFICIENT_CONFIDENCE: return "INSUFFICIENT_CONFIDENCE";
        case MeasureStatus::DEGENERATE:              return "DEGENERATE";
    }
    return "UNKNOWN";
}

inline std::string toString(VerdictStatus s) {
    switch (s) {
        case VerdictStatus::PASS: return "PASS";
        case VerdictStatus::FAIL: return "FAIL";
        default:                  return "UNKNOWN";
    }
}

inline std::string toString(FrameStatus s) {
    switch (s) {
        case FrameStatus::PASS:       return "PASS";
        case FrameStatus::FAIL:       return "FAIL";
        case FrameStatus::UNDETECTED: return "UNDETECTED";
        default:                      return "UNKNOWN";
    }
}

} // namespace formcheck
