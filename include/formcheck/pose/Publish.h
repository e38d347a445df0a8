#pragma once
#include "Types.h"
#include <functional>
#include <utility>

namespace formcheck {

// Hands every FrameReport to the annotation / display collaborator
using ReportCallback = std::function<void(const FrameReport&)>;

class ReportPublisher {
public:
    void setCallback(ReportCallback cb) { cb_ = std::move(cb); }
    void publish(const FrameReport& report) {
        if (cb_) cb_(report);
    }
private:
    ReportCallback cb_;
};

} // namespace formcheck
