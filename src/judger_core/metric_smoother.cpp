#include "formcheck/judger/metric_smoother.hpp"

#include <opencv2/core.hpp>
#include <algorithm>

namespace formcheck {

std::vector<double> savgolSmooth(const std::vector<double>& series, const SmoothingOptions& opt) {
    int window = std::max(1, opt.window);
    if (window % 2 == 0) window += 1;

    const int n = static_cast<int>(series.size());
    if (n <= window || window < 3) return series;

    const int order = std::min(std::max(0, opt.polyorder), window - 1);
    const int half = window / 2;

    // Vandermonde over t = -half..half, pinv row 0 = centre-point filter
    cv::Mat A(window, order + 1, CV_64F);
    for (int i = 0; i < window; ++i) {
        double t = static_cast<double>(i - half);
        double p = 1.0;
        for (int j = 0; j <= order; ++j) {
            A.at<double>(i, j) = p;
            p *= t;
        }
    }
    cv::Mat pinv;
    cv::invert(A, pinv, cv::DECOMP_SVD);    // (order+1) x window

    std::vector<double> out(series.size(), 0.0);
    for (int i = half; i < n - half; ++i) {
        double acc = 0.0;
        for (int k = 0; k < window; ++k) acc += pinv.at<double>(0, k) * series[i - half + k];
        out[i] = acc;
    }

    // edges: evaluate the fit of the first / last full window
    auto fitEdge = [&](int start, int from, int to) {
        cv::Mat y(window, 1, CV_64F);
        for (int k = 0; k < window; ++k) y.at<double>(k) = series[start + k];
        cv::Mat coef = pinv * y;
        for (int i = from; i < to; ++i) {
            double t = static_cast<double>(i - (start + half));
            double p = 1.0, acc = 0.0;
            for (int j = 0; j <= order; ++j) {
                acc += coef.at<double>(j) * p;
                p *= t;
            }
            out[i] = acc;
        }
    };
    fitEdge(0, 0, half);
    fitEdge(n - window, n - half, n);

    return out;
}

} // namespace formcheck
