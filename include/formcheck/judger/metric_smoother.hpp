#ifndef FORMCHECK_METRIC_SMOOTHER_HPP
#define FORMCHECK_METRIC_SMOOTHER_HPP

#include <vector>

namespace formcheck {

struct SmoothingOptions {
    int window = 5;       // 偶数自动 +1
    int polyorder = 2;    // clamped to window - 1
};

/*  Savitzky-Golay smoothing of a per-frame metric series
*
*   Interior samples use the least-squares polynomial fit of the centred window.
*   The first and last window/2 samples are evaluated on the polynomial fitted to
*   the first / last full window. Series no longer than the window are returned as-is.
*/
std::vector<double> savgolSmooth(const std::vector<double>& series, const SmoothingOptions& opt);

} // namespace formcheck

#endif
