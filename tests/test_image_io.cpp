#include "image_io.hpp"
#include <cassert>
#include <cstdio>
#include <fstream>
#include <iostream>

using namespace crtmix;

static bool fails_with(ErrorKind kind, const std::string& path) {
    try {
        load_image(path);
    } catch (const Error& e) {
        return e.kind() == kind;
    }
    return false;
}

int main() {
    set_verbose(false);

    PixelBuffer img(5, 3);
    for (int y = 0; y < 3; ++y)
        for (int x = 0; x < 5; ++x)
            img.at(x, y) = Rgb{static_cast<uint8_t>(x * 50), static_cast<uint8_t>(y * 100), 7};

    // channel order survives the OpenCV bridge
    cv::Mat bgr = to_mat(img);
    assert(bgr.at<cv::Vec3b>(1, 4)[2] == 200 && bgr.at<cv::Vec3b>(1, 4)[1] == 100 && bgr.at<cv::Vec3b>(1, 4)[0] == 7);
    assert(from_mat(bgr) == img);

    cv::Mat grey(2, 2, CV_8UC1, cv::Scalar(42));
    PixelBuffer g = from_mat(grey);
    assert(g.at(1, 1) == (Rgb{42, 42, 42}));

    // lossless file round trip
    const std::string png = "crtmix_io_test.png";
    assert(save_image(png, img) == png);
    assert(load_image(png) == img);
    std::remove(png.c_str());

    // unknown extension falls back to a PNG beside it
    const std::string odd = "crtmix_io_test.notaformat";
    const std::string written = save_image(odd, img);
    assert(written == "crtmix_io_test.png");
    assert(load_image(written) == img);
    std::remove(written.c_str());

    assert(fails_with(ErrorKind::InvalidImage, "does_not_exist.png"));
    {
        std::ofstream junk("crtmix_io_junk.png");
        junk << "not an image";
    }
    assert(fails_with(ErrorKind::InvalidImage, "crtmix_io_junk.png"));
    std::remove("crtmix_io_junk.png");

    bool caught = false;
    try {
        save_image("empty.png", PixelBuffer());
    } catch (const Error& e) {
        caught = e.kind() == ErrorKind::EncodeFailure;
    }
    assert(caught);

    PixelBuffer wide(1000, 500);
    PixelBuffer small = downscale_to_fit(wide, 800);
    assert(small.width() == 800 && small.height() == 400);
    assert(downscale_to_fit(img, 800) == img);

    std::cout << "ImageIO test PASSED\n";
    return 0;
}
