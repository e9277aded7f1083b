#pragma once

#include <opencv2/core.hpp>
#include <opencv2/imgproc.hpp>
#include <string>
#include <algorithm>

namespace vs {
    inline int interp_from_str(const std::string& s) {
        if (s == "nearest") return cv::INTER_NEAREST;
        if (s == "cubic") return cv::INTER_CUBIC;
        if (s == "area") return cv::INTER_AREA;
        return cv::INTER_LINEAR;
    }

    // Converts gray/BGRA/non-8-bit input to 8-bit BGR. Returns false for layouts it cannot map.
    inline bool to_bgr8(cv::Mat& img) {
        if (img.empty()) return false;

        if (img.depth() != CV_8U) {
            cv::Mat tmp;
            const double scale = (img.depth() == CV_32F || img.depth() == CV_64F) ? 255.0 : 1.0;
            img.convertTo(tmp, CV_8U, scale);
            img = tmp;
        }

        if (img.channels() == 1) {
            cv::Mat tmp;
            cv::cvtColor(img, tmp, cv::COLOR_GRAY2BGR);
            img = tmp;
        } else if (img.channels() == 4) {
            cv::Mat tmp;
            cv::cvtColor(img, tmp, cv::COLOR_BGRA2BGR);
            img = tmp;
        }
        return img.type() == CV_8UC3;
    }

    // Scales src into a target_w x target_h canvas. With keep_aspect the image is
    // letterboxed on black, so the output size is always exactly the target.
    inline cv::Mat resize_frame(
        const cv::Mat& src,
        int target_w,
        int target_h,
        bool keep_aspect,
        int interp
    ) {
        if (target_w <= 0 || target_h <= 0) return src;
        if (src.cols == target_w && src.rows == target_h) return src;

        if (!keep_aspect) {
            cv::Mat dst;
            cv::resize(src, dst, {target_w, target_h}, 0, 0, interp);
            return dst;
        }

        const float sx = float(target_w) / float(src.cols);
        const float sy = float(target_h) / float(src.rows);
        const float s = std::min(sx, sy);

        const int new_w = std::clamp(int(src.cols * s), 1, target_w);
        const int new_h = std::clamp(int(src.rows * s), 1, target_h);

        cv::Mat resized;
        cv::resize(src, resized, {new_w, new_h}, 0, 0, interp);

        cv::Mat out(target_h, target_w, src.type(), cv::Scalar::all(0));
        const int x = (target_w - new_w) / 2;
        const int y = (target_h - new_h) / 2;
        resized.copyTo(out(cv::Rect(x, y, new_w, new_h)));
        return out;
    }
}
