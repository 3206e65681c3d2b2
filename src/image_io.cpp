#include "image_io.hpp"
#include <opencv2/imgcodecs.hpp>
#include <opencv2/imgproc.hpp>
#include <algorithm>
#include <cmath>
#include <iostream>
#include <vector>

namespace crtmix {

namespace {

std::string png_sibling(const std::string& path) {
    const size_t slash = path.find_last_of("/\\");
    const size_t dot = path.find_last_of('.');
    if (dot == std::string::npos || (slash != std::string::npos && dot < slash)) {
        return path + ".png";
    }
    return path.substr(0, dot) + ".png";
}

bool try_write(const std::string& path, const cv::Mat& bgr, std::string& reason) {
    try {
        if (cv::imwrite(path, bgr)) return true;
        reason = "writer rejected output";
    } catch (const cv::Exception& e) {
        reason = e.what();
    }
    return false;
}

} // namespace

cv::Mat to_mat(const PixelBuffer& img) {
    cv::Mat bgr(img.height(), img.width(), CV_8UC3);
    for (int y = 0; y < img.height(); ++y) {
        const Rgb* s = img.row(y);
        uint8_t* d = bgr.ptr<uint8_t>(y);
        for (int x = 0; x < img.width(); ++x) {
            d[3 * x + 0] = s[x].b;
            d[3 * x + 1] = s[x].g;
            d[3 * x + 2] = s[x].r;
        }
    }
    return bgr;
}

PixelBuffer from_mat(const cv::Mat& src) {
    if (src.empty() || src.depth() != CV_8U) {
        throw Error(ErrorKind::InvalidImage, "expected a non-empty 8-bit image");
    }
    cv::Mat bgr;
    switch (src.channels()) {
    case 1: cv::cvtColor(src, bgr, cv::COLOR_GRAY2BGR); break;
    case 3: bgr = src; break;
    case 4: cv::cvtColor(src, bgr, cv::COLOR_BGRA2BGR); break;
    default:
        throw Error(ErrorKind::InvalidImage,
                    "unsupported channel count " + std::to_string(src.channels()));
    }

    PixelBuffer out(bgr.cols, bgr.rows);
    for (int y = 0; y < bgr.rows; ++y) {
        const uint8_t* s = bgr.ptr<uint8_t>(y);
        Rgb* d = out.row(y);
        for (int x = 0; x < bgr.cols; ++x) {
            d[x].b = s[3 * x + 0];
            d[x].g = s[3 * x + 1];
            d[x].r = s[3 * x + 2];
        }
    }
    return out;
}

PixelBuffer load_image(const std::string& path) {
    cv::Mat bgr;
    try {
        bgr = cv::imread(path, cv::IMREAD_COLOR);
    } catch (const cv::Exception& e) {
        throw Error(ErrorKind::InvalidImage, "cannot decode " + path + ": " + e.what());
    }
    if (bgr.empty()) {
        throw Error(ErrorKind::InvalidImage, "cannot decode " + path);
    }
    if (bgr.cols > kLargeImageDimension || bgr.rows > kLargeImageDimension) {
        std::cerr << "[ImageIO] LARGE_IMAGE_WARNING path=" << path << " size=" << bgr.cols << "x" << bgr.rows
                  << " recommended_max=" << kLargeImageDimension << "x" << kLargeImageDimension << "\n";
    }
    if (verbose()) std::cout << "[ImageIO] LOADED path=" << path << " size=" << bgr.cols << "x" << bgr.rows << "\n";
    return from_mat(bgr);
}

std::string save_image(const std::string& path, const PixelBuffer& img) {
    if (img.empty()) {
        throw Error(ErrorKind::EncodeFailure, "refusing to write an empty image to " + path);
    }
    cv::Mat bgr = to_mat(img);

    std::string reason;
    if (try_write(path, bgr, reason)) {
        if (verbose()) std::cout << "[ImageIO] SAVED path=" << path << "\n";
        return path;
    }

    const std::string fallback = png_sibling(path);
    if (fallback != path) {
        std::cerr << "[ImageIO] ENCODE_RETRY path=" << path << " reason=" << reason << " fallback=" << fallback << "\n";
        if (try_write(fallback, bgr, reason)) {
            if (verbose()) std::cout << "[ImageIO] SAVED path=" << fallback << "\n";
            return fallback;
        }
    }
    throw Error(ErrorKind::EncodeFailure, "cannot write " + path + ": " + reason);
}

PixelBuffer downscale_to_fit(const PixelBuffer& img, int max_dim) {
    if (max_dim < 1) {
        throw Error(ErrorKind::UnsupportedParameter, "max dimension must be positive");
    }
    const int w = img.width();
    const int h = img.height();
    if (w <= max_dim && h <= max_dim) return img;

    const double scale = std::min(static_cast<double>(max_dim) / w, static_cast<double>(max_dim) / h);
    const int nw = std::max(1, static_cast<int>(std::round(w * scale)));
    const int nh = std::max(1, static_cast<int>(std::round(h * scale)));

    cv::Mat small;
    cv::resize(to_mat(img), small, cv::Size(std::min(nw, max_dim), std::min(nh, max_dim)), 0, 0, cv::INTER_LANCZOS4);
    return from_mat(small);
}

} // namespace crtmix
