// Viewport mapping, crop planning, rasterization and greyscale conversion.
//
// Verifies:
//   1. Zoom clamping stays in [10, 200] and is idempotent.
//   2. Forward and inverse mapping undo each other.
//   3. Crop plans for full, partial, zoomed and off-image viewports.
//   4. The rasterizer always returns 300x400, filling uncovered area white.
//   5. Greyscale weights, rounding, idempotence and alpha handling.

#include "test_harness.h"

#include "ColorTransform/Greyscale.h"
#include "Cropping/ViewportCropper.h"
#include "Viewport/ViewportTransform.h"

#include <opencv2/core.hpp>

#include <array>
#include <climits>
#include <cstdlib>
#include <cstdio>

static const std::array<Resampling, 3> ALL_MODES{
    Resampling::Nearest, Resampling::Bilinear, Resampling::Area
};

/// Helper: source whose pixel values encode their own coordinates.
static SourceImage gradient_source(int w, int h) {
    SourceImage src;
    src.name = "gradient.png";
    src.data.create(h, w, CV_8UC3);
    for (int y = 0; y < h; ++y) {
        for (int x = 0; x < w; ++x) {
            src.data.at<cv::Vec3b>(y, x) = cv::Vec3b(
                static_cast<uchar>(x % 256),
                static_cast<uchar>(y % 256),
                static_cast<uchar>((x + y) % 256));
        }
    }
    return src;
}

static SourceImage solid_source(int w, int h, cv::Scalar bgr) {
    SourceImage src;
    src.name = "solid.png";
    src.data = cv::Mat(h, w, CV_8UC3, bgr);
    return src;
}

static bool is_white(const cv::Mat& img, int x, int y) {
    return img.at<cv::Vec3b>(y, x) == cv::Vec3b(255, 255, 255);
}

static int count_white(const cv::Mat& img) {
    int n = 0;
    for (int y = 0; y < img.rows; ++y)
        for (int x = 0; x < img.cols; ++x)
            if (is_white(img, x, y)) ++n;
    return n;
}

static ViewportTransform make_transform(int zoom, double pan_x, double pan_y) {
    ViewportTransform t;
    t.zoom_percent = zoom;
    t.pan          = { pan_x, pan_y };
    t.is_greyscale = false;
    return t;
}

// -----------------------------------------------------------------------
// Test 1: zoom clamping
// -----------------------------------------------------------------------
static void test_zoom_clamp(TestResults& results) {
    std::printf("  test_zoom_clamp...\n");

    TEST_ASSERT_EQ(results, clamp_zoom(5), 10, "below range clamps to 10");
    TEST_ASSERT_EQ(results, clamp_zoom(-300), 10, "negative clamps to 10");
    TEST_ASSERT_EQ(results, clamp_zoom(500), 200, "above range clamps to 200");
    TEST_ASSERT_EQ(results, clamp_zoom(137), 137, "in range is unchanged");

    for (int z = -50; z <= 400; z += 7) {
        TEST_ASSERT_EQ(results, clamp_zoom(clamp_zoom(z)), clamp_zoom(z), "clamp is idempotent");
    }

    ViewportUpdate u;
    u.zoom_percent = 1000;
    ViewportTransform t = apply_update(ViewportTransform{}, u);
    TEST_ASSERT_EQ(results, t.zoom_percent, 200, "absolute zoom request is clamped");

    ViewportUpdate d;
    d.zoom_delta = -500;
    t = apply_update(t, d);
    TEST_ASSERT_EQ(results, t.zoom_percent, 10, "zoom delta result is clamped");

    std::printf("  test_zoom_clamp: PASS\n");
}

// -----------------------------------------------------------------------
// Test 2: viewport updates
// -----------------------------------------------------------------------
static void test_apply_update(TestResults& results) {
    std::printf("  test_apply_update...\n");

    ViewportTransform t = make_transform(100, 10.0, 20.0);
    t.is_greyscale = true;

    ViewportUpdate u;
    u.pan_delta        = cv::Point2d(-5.0, 7.5);
    u.zoom_delta       = 15;
    u.toggle_greyscale = true;
    t = apply_update(t, u);

    TEST_ASSERT_EQ(results, t.zoom_percent, 115, "zoom delta applied");
    TEST_ASSERT_NEAR(results, t.pan.x, 5.0, 1e-12, "pan x delta applied");
    TEST_ASSERT_NEAR(results, t.pan.y, 27.5, 1e-12, "pan y delta applied");
    TEST_ASSERT(results, !t.is_greyscale, "greyscale toggled off");

    ViewportUpdate abs;
    abs.pan       = cv::Point2d(-3000.0, 0.0);
    abs.greyscale = true;
    t = apply_update(t, abs);
    TEST_ASSERT_NEAR(results, t.pan.x, -3000.0, 1e-12, "pan is never clamped");
    TEST_ASSERT(results, t.is_greyscale, "greyscale set explicitly");

    // Extreme deltas saturate instead of wrapping around.
    ViewportUpdate huge_in;
    huge_in.zoom_delta = INT_MAX;
    TEST_ASSERT_EQ(results, apply_update(make_transform(150, 0, 0), huge_in).zoom_percent, 200,
                   "INT_MAX delta lands on 200");
    TEST_ASSERT_EQ(results, apply_update(make_transform(200, 0, 0), huge_in).zoom_percent, 200,
                   "INT_MAX delta from the top bound");

    ViewportUpdate huge_out;
    huge_out.zoom_delta = INT_MIN;
    TEST_ASSERT_EQ(results, apply_update(make_transform(150, 0, 0), huge_out).zoom_percent, 10,
                   "INT_MIN delta lands on 10");
    TEST_ASSERT_EQ(results, apply_update(make_transform(10, 0, 0), huge_out).zoom_percent, 10,
                   "INT_MIN delta from the bottom bound");

    std::printf("  test_apply_update: PASS\n");
}

// -----------------------------------------------------------------------
// Test 3: forward then inverse returns the original point
// -----------------------------------------------------------------------
static void test_forward_inverse(TestResults& results) {
    std::printf("  test_forward_inverse...\n");

    const std::array<int, 5> zooms{ 10, 33, 100, 157, 200 };
    const std::array<cv::Point2d, 4> pans{
        cv::Point2d(0, 0), cv::Point2d(-266.0, -186.88), cv::Point2d(1234.5, -0.25), cv::Point2d(-1e5, 1e5)
    };
    const std::array<cv::Point2d, 4> points{
        cv::Point2d(0, 0), cv::Point2d(400, 372), cv::Point2d(-17.3, 9999.9), cv::Point2d(0.001, 1e4)
    };

    for (int z : zooms) {
        for (const auto& pan : pans) {
            const ViewportTransform t = make_transform(z, pan.x, pan.y);
            for (const auto& p : points) {
                const cv::Point2d back = to_source(t, to_output(t, p));
                TEST_ASSERT_NEAR(results, back.x, p.x, 1e-6, "round trip x");
                TEST_ASSERT_NEAR(results, back.y, p.y, 1e-6, "round trip y");
            }
        }
    }

    const ViewportTransform t = make_transform(50, 10.0, -20.0);
    const cv::Point2d out = to_output(t, { 100.0, 100.0 });
    TEST_ASSERT_NEAR(results, out.x, 60.0, 1e-12, "display = source*zoom + pan (x)");
    TEST_ASSERT_NEAR(results, out.y, 30.0, 1e-12, "display = source*zoom + pan (y)");

    std::printf("  test_forward_inverse: PASS\n");
}

// -----------------------------------------------------------------------
// Test 4: crop plans
// -----------------------------------------------------------------------
static void test_plan_top_left(TestResults& results) {
    std::printf("  test_plan_top_left...\n");

    const CropPlan p = plan_crop(make_transform(100, 0, 0), 1000, 1000);
    TEST_ASSERT_NEAR(results, p.visible_src.x, 0.0, 1e-12, "visible x");
    TEST_ASSERT_NEAR(results, p.visible_src.y, 0.0, 1e-12, "visible y");
    TEST_ASSERT_NEAR(results, p.visible_src.width, 300.0, 1e-12, "visible width");
    TEST_ASSERT_NEAR(results, p.visible_src.height, 400.0, 1e-12, "visible height");
    TEST_ASSERT(results, p.clamped_src == p.visible_src, "nothing clamped");
    TEST_ASSERT(results, p.dest_px == cv::Rect(0, 0, 300, 400), "destination is the whole frame");

    std::printf("  test_plan_top_left: PASS\n");
}

static void test_plan_off_image(TestResults& results) {
    std::printf("  test_plan_off_image...\n");

    const CropPlan p = plan_crop(make_transform(100, -2000, 0), 1000, 1000);
    TEST_ASSERT_NEAR(results, p.visible_src.x, 2000.0, 1e-12, "visible rect starts past the image");
    TEST_ASSERT(results, p.clamped_src.area() <= 0.0, "clamped rect is empty");
    TEST_ASSERT(results, p.empty(), "plan is empty");

    const CropPlan below = plan_crop(make_transform(50, 0, 900), 1000, 1000);
    TEST_ASSERT(results, below.empty(), "image entirely below the frame");

    std::printf("  test_plan_off_image: PASS\n");
}

static void test_plan_partial_overlap(TestResults& results) {
    std::printf("  test_plan_partial_overlap...\n");

    // 200x200 image placed at (50,100) in the frame.
    const CropPlan p = plan_crop(make_transform(100, 50, 100), 200, 200);
    TEST_ASSERT_NEAR(results, p.visible_src.x, -50.0, 1e-12, "visible x");
    TEST_ASSERT_NEAR(results, p.visible_src.y, -100.0, 1e-12, "visible y");
    TEST_ASSERT(results, p.clamped_src == cv::Rect2d(0, 0, 200, 200), "clamped to the image");
    TEST_ASSERT(results, p.dest == cv::Rect2d(50, 100, 200, 200), "destination offset by the clamp");
    TEST_ASSERT(results, p.dest_px == cv::Rect(50, 100, 200, 200), "pixel destination");

    // Zoomed in 2x with the image shifted up-left: only the top-left 150x200
    // of the source region is visible and it fills the frame.
    const CropPlan z = plan_crop(make_transform(200, -100, -100), 1000, 1000);
    TEST_ASSERT(results, z.clamped_src == cv::Rect2d(50, 50, 150, 200), "zoomed visible region");
    TEST_ASSERT(results, z.dest_px == cv::Rect(0, 0, 300, 400), "zoomed destination fills frame");

    // Zoomed out with a right/bottom overhang.
    const CropPlan h = plan_crop(make_transform(50, 0, 0), 400, 400);
    TEST_ASSERT(results, h.clamped_src == cv::Rect2d(0, 0, 400, 400), "whole image visible");
    TEST_ASSERT(results, h.dest_px == cv::Rect(0, 0, 200, 200), "scaled to half size");

    std::printf("  test_plan_partial_overlap: PASS\n");
}

// -----------------------------------------------------------------------
// Test 5: rasterizer
// -----------------------------------------------------------------------
static void test_rasterize_full_coverage(TestResults& results) {
    std::printf("  test_rasterize_full_coverage...\n");

    const SourceImage src = gradient_source(1000, 1000);
    for (Resampling mode : ALL_MODES) {
        const ViewportCropper cropper(mode);
        const cv::Mat out = cropper.rasterize(src, make_transform(100, 0, 0));

        TEST_ASSERT_EQ(results, out.cols, OUTPUT_WIDTH, "output width");
        TEST_ASSERT_EQ(results, out.rows, OUTPUT_HEIGHT, "output height");
        TEST_ASSERT_EQ(results, out.type(), CV_8UC3, "output type");

        const cv::Mat expected = src.data(cv::Rect(0, 0, 300, 400));
        TEST_ASSERT(results, cv::norm(out, expected, cv::NORM_INF) == 0.0,
                    "1:1 top-left crop copies source pixels exactly");
    }

    std::printf("  test_rasterize_full_coverage: PASS\n");
}

static void test_rasterize_off_image(TestResults& results) {
    std::printf("  test_rasterize_off_image...\n");

    const SourceImage src = solid_source(1000, 1000, cv::Scalar(10, 20, 30));
    for (Resampling mode : ALL_MODES) {
        const ViewportCropper cropper(mode);
        const cv::Mat out = cropper.rasterize(src, make_transform(100, -2000, 0));

        TEST_ASSERT_EQ(results, out.cols, OUTPUT_WIDTH, "output width");
        TEST_ASSERT_EQ(results, out.rows, OUTPUT_HEIGHT, "output height");
        TEST_ASSERT_EQ(results, count_white(out), OUTPUT_WIDTH * OUTPUT_HEIGHT,
                       "off-image viewport is pure background");
    }

    std::printf("  test_rasterize_off_image: PASS\n");
}

static void test_rasterize_partial(TestResults& results) {
    std::printf("  test_rasterize_partial...\n");

    const SourceImage src = solid_source(200, 200, cv::Scalar(0, 0, 0));
    for (Resampling mode : ALL_MODES) {
        const ViewportCropper cropper(mode);
        const cv::Mat out = cropper.rasterize(src, make_transform(100, 50, 100));

        TEST_ASSERT(results, is_white(out, 10, 10), "left/top margin is background");
        TEST_ASSERT(results, !is_white(out, 50, 100), "content starts at dest corner");
        TEST_ASSERT(results, !is_white(out, 249, 299), "content ends at dest corner");
        TEST_ASSERT(results, is_white(out, 250, 150), "right of content is background");
        TEST_ASSERT(results, is_white(out, 100, 300), "below content is background");
        TEST_ASSERT_EQ(results, count_white(out), OUTPUT_WIDTH * OUTPUT_HEIGHT - 200 * 200,
                       "exactly the destination rect is covered");
    }

    std::printf("  test_rasterize_partial: PASS\n");
}

static void test_rasterize_tiny_source(TestResults& results) {
    std::printf("  test_rasterize_tiny_source...\n");

    const SourceImage src = solid_source(1, 1, cv::Scalar(40, 80, 120));
    for (Resampling mode : ALL_MODES) {
        const ViewportCropper cropper(mode);
        const cv::Mat out = cropper.rasterize(src, make_transform(200, 0, 0));

        TEST_ASSERT(results, out.at<cv::Vec3b>(0, 0) == cv::Vec3b(40, 80, 120), "pixel (0,0) from source");
        TEST_ASSERT(results, out.at<cv::Vec3b>(1, 1) == cv::Vec3b(40, 80, 120), "pixel (1,1) from source");
        TEST_ASSERT(results, is_white(out, 2, 2), "pixel (2,2) background");
        TEST_ASSERT_EQ(results, count_white(out), OUTPUT_WIDTH * OUTPUT_HEIGHT - 4, "2x2 covered");
    }

    std::printf("  test_rasterize_tiny_source: PASS\n");
}

static void test_rasterize_deterministic(TestResults& results) {
    std::printf("  test_rasterize_deterministic...\n");

    const SourceImage src = gradient_source(640, 480);
    const ViewportTransform t = make_transform(73, -123.4, 56.7);
    for (Resampling mode : ALL_MODES) {
        const ViewportCropper cropper(mode);
        const cv::Mat a = cropper.rasterize(src, t);
        const cv::Mat b = cropper.rasterize(src, t);
        TEST_ASSERT(results, cv::norm(a, b, cv::NORM_INF) == 0.0, "identical inputs, identical output");
    }

    std::printf("  test_rasterize_deterministic: PASS\n");
}

static void test_rasterize_empty_source(TestResults& results) {
    std::printf("  test_rasterize_empty_source...\n");

    const SourceImage empty;
    const cv::Mat out = ViewportCropper().rasterize(empty, ViewportTransform{});
    TEST_ASSERT_EQ(results, out.cols, OUTPUT_WIDTH, "output width");
    TEST_ASSERT_EQ(results, out.rows, OUTPUT_HEIGHT, "output height");
    TEST_ASSERT_EQ(results, count_white(out), OUTPUT_WIDTH * OUTPUT_HEIGHT, "background only");

    std::printf("  test_rasterize_empty_source: PASS\n");
}

/// Source that is black left of edge_x and solid colour from edge_x on.
static SourceImage edge_source(int w, int h, int edge_x) {
    SourceImage src = solid_source(w, h, cv::Scalar(30, 60, 90));
    src.data(cv::Rect(0, 0, edge_x, h)).setTo(cv::Scalar(0, 0, 0));
    return src;
}

static void test_rasterize_area_enlarge_fractional_pan(TestResults& results) {
    std::printf("  test_rasterize_area_enlarge_fractional_pan...\n");

    // display = 2 * source + 1, so the edge between source columns 59 and 60
    // falls between output columns 119 and 121.
    const SourceImage src = edge_source(300, 400, 60);
    const ViewportTransform t = make_transform(200, 1.0, 0.0);

    const cv::Mat area     = ViewportCropper(Resampling::Area).rasterize(src, t);
    const cv::Mat bilinear = ViewportCropper(Resampling::Bilinear).rasterize(src, t);

    TEST_ASSERT(results, area.at<cv::Vec3b>(200, 118) == cv::Vec3b(0, 0, 0), "left of edge is black");
    TEST_ASSERT(results, area.at<cv::Vec3b>(200, 122) == cv::Vec3b(30, 60, 90), "right of edge is colour");
    TEST_ASSERT(results, cv::norm(area, bilinear, cv::NORM_INF) == 0.0,
                "enlarging matches bilinear exactly");

    std::printf("  test_rasterize_area_enlarge_fractional_pan: PASS\n");
}

static void test_rasterize_area_shrink_fractional_pan(TestResults& results) {
    std::printf("  test_rasterize_area_shrink_fractional_pan...\n");

    // display = source / 2 + 0.5, so the edge at source x = 199.5 lands at
    // output x = 100.25.
    const SourceImage src = edge_source(600, 800, 200);
    const ViewportTransform t = make_transform(50, 0.5, 0.0);

    const cv::Mat area     = ViewportCropper(Resampling::Area).rasterize(src, t);
    const cv::Mat bilinear = ViewportCropper(Resampling::Bilinear).rasterize(src, t);

    TEST_ASSERT(results, area.at<cv::Vec3b>(200, 98) == cv::Vec3b(0, 0, 0), "left of edge is black");
    TEST_ASSERT(results, area.at<cv::Vec3b>(200, 102) == cv::Vec3b(30, 60, 90), "right of edge is colour");

    // Away from the edge both modes see flat colour; near it they agree on position.
    for (int x = 90; x <= 110; ++x) {
        const int a = area.at<cv::Vec3b>(200, x)[2];
        const int b = bilinear.at<cv::Vec3b>(200, x)[2];
        TEST_ASSERT(results, std::abs(a - b) <= 45, "edge position agrees with bilinear");
    }

    std::printf("  test_rasterize_area_shrink_fractional_pan: PASS\n");
}

// -----------------------------------------------------------------------
// Test 6: greyscale
// -----------------------------------------------------------------------
static void test_greyscale_weights(TestResults& results) {
    std::printf("  test_greyscale_weights...\n");

    cv::Mat img(1, 4, CV_8UC3);
    img.at<cv::Vec3b>(0, 0) = cv::Vec3b(0, 0, 255);     // red
    img.at<cv::Vec3b>(0, 1) = cv::Vec3b(0, 255, 0);     // green
    img.at<cv::Vec3b>(0, 2) = cv::Vec3b(255, 0, 0);     // blue
    img.at<cv::Vec3b>(0, 3) = cv::Vec3b(255, 255, 255); // white

    TEST_ASSERT(results, to_greyscale_inplace(img), "BGR is supported");
    TEST_ASSERT(results, img.at<cv::Vec3b>(0, 0) == cv::Vec3b(76, 76, 76), "0.299 * 255 rounds to 76");
    TEST_ASSERT(results, img.at<cv::Vec3b>(0, 1) == cv::Vec3b(150, 150, 150), "0.587 * 255 rounds to 150");
    TEST_ASSERT(results, img.at<cv::Vec3b>(0, 2) == cv::Vec3b(29, 29, 29), "0.114 * 255 rounds to 29");
    TEST_ASSERT(results, img.at<cv::Vec3b>(0, 3) == cv::Vec3b(255, 255, 255), "white stays white");

    std::printf("  test_greyscale_weights: PASS\n");
}

static void test_greyscale_idempotent(TestResults& results) {
    std::printf("  test_greyscale_idempotent...\n");

    const cv::Mat colour = gradient_source(257, 131).data;
    const cv::Mat once   = to_greyscale(colour);
    const cv::Mat twice  = to_greyscale(once);

    TEST_ASSERT(results, is_greyscale(once), "R=G=B after one pass");
    TEST_ASSERT(results, cv::norm(once, twice, cv::NORM_INF) == 0.0, "second pass changes nothing");
    TEST_ASSERT(results, !is_greyscale(colour), "copying variant leaves the input alone");

    std::printf("  test_greyscale_idempotent: PASS\n");
}

static void test_greyscale_alpha(TestResults& results) {
    std::printf("  test_greyscale_alpha...\n");

    cv::Mat bgra(2, 2, CV_8UC4, cv::Scalar(0, 0, 255, 77));
    TEST_ASSERT(results, to_greyscale_inplace(bgra), "BGRA is supported");
    TEST_ASSERT(results, bgra.at<cv::Vec4b>(1, 1) == cv::Vec4b(76, 76, 76, 77), "alpha unchanged");

    cv::Mat mono(2, 2, CV_8UC1, cv::Scalar(9));
    TEST_ASSERT(results, !to_greyscale_inplace(mono), "single channel is rejected");
    TEST_ASSERT_EQ(results, static_cast<int>(mono.at<uchar>(0, 0)), 9, "rejected buffer untouched");
    TEST_ASSERT(results, to_greyscale(mono).empty(), "copying variant returns empty on rejection");

    std::printf("  test_greyscale_alpha: PASS\n");
}

// -----------------------------------------------------------------------
// Main
// -----------------------------------------------------------------------
int main() {
    std::printf("Running viewport / rasterizer tests...\n\n");

    TestResults results;

    test_zoom_clamp(results);
    test_apply_update(results);
    test_forward_inverse(results);
    test_plan_top_left(results);
    test_plan_off_image(results);
    test_plan_partial_overlap(results);
    test_rasterize_full_coverage(results);
    test_rasterize_off_image(results);
    test_rasterize_partial(results);
    test_rasterize_tiny_source(results);
    test_rasterize_deterministic(results);
    test_rasterize_empty_source(results);
    test_rasterize_area_enlarge_fractional_pan(results);
    test_rasterize_area_shrink_fractional_pan(results);
    test_greyscale_weights(results);
    test_greyscale_idempotent(results);
    test_greyscale_alpha(results);

    return test_summary(results);
}
