/**
 * Unit tests for the crack detection pipeline
 */

#include <gtest/gtest.h>
#include "crack_detector.hpp"
#include "errors.hpp"
#include "test_helpers.hpp"

using namespace crackscan;
using crackscan::testutil::surface;

class CrackDetectorTest : public ::testing::Test
{
protected:
    // 100 x 100 bright wall with a 1 px wide dark horizontal line of length 50
    cv::Mat lineImage() const
    {
        cv::Mat img = surface(100, 100, 200);
        img(cv::Rect(20, 40, 50, 1)).setTo(30);
        return img;
    }

    // bright wall with a compact 10 x 10 dark blob
    cv::Mat blobImage() const
    {
        cv::Mat img = surface(60, 60, 220);
        img(cv::Rect(25, 25, 10, 10)).setTo(20);
        return img;
    }
};

TEST_F(CrackDetectorTest, UniformBrightImageHasNoCracks)
{
    DefectReport report = detect(surface(40, 40, 255));
    EXPECT_TRUE(report.empty());
    EXPECT_EQ(report.damaged_pixels, 0);
    EXPECT_EQ(cv::countNonZero(report.mask), 0);
}

TEST_F(CrackDetectorTest, AllZeroImageHasNoCracks)
{
    DefectReport report = detect(surface(40, 40, 0));
    EXPECT_TRUE(report.empty());
    // automatic cutoff sits below the only gray level
    EXPECT_EQ(report.threshold_used, -1);
    EXPECT_EQ(cv::countNonZero(report.mask), 0);
}

TEST_F(CrackDetectorTest, SingleLineWithDefaults)
{
    DefectReport report = detect(lineImage());

    ASSERT_EQ(report.size(), 1u);
    const Crack &crack = report.cracks[0];
    EXPECT_EQ(crack.component.pixel_count, 50);
    EXPECT_GT(crack.features.elongation, CrackConfig().min_elongation_ratio);
    EXPECT_EQ(crack.component.bounding_box.rect(), cv::Rect(20, 40, 50, 1));
    EXPECT_GE(report.threshold_used, 30);
    EXPECT_LT(report.threshold_used, 200);
    EXPECT_DOUBLE_EQ(report.damaged_fraction, 50.0 / 10000.0);
    EXPECT_DOUBLE_EQ(crack.length_mm, 0.0); // no calibration
}

TEST_F(CrackDetectorTest, BlobFilteredByMaxElongation)
{
    CrackConfig config;
    config.threshold = 100;
    config.min_elongation_ratio = 0.25;
    config.max_elongation_ratio = 0.5;

    EXPECT_TRUE(detect(blobImage(), config).empty());
}

TEST_F(CrackDetectorTest, BlobKeptWhenRangeIncludesOne)
{
    CrackConfig config;
    config.threshold = 100;
    config.min_elongation_ratio = 1.0;
    config.max_elongation_ratio = 2.0;

    DefectReport report = detect(blobImage(), config);
    ASSERT_EQ(report.size(), 1u);
    EXPECT_EQ(report.cracks[0].component.pixel_count, 100);
    EXPECT_DOUBLE_EQ(report.cracks[0].features.elongation, 1.0);
}

TEST_F(CrackDetectorTest, DefaultElongationRejectsBlob)
{
    CrackConfig config;
    config.threshold = 100;
    EXPECT_TRUE(detect(blobImage(), config).empty());
}

TEST_F(CrackDetectorTest, FullyDarkImageIsOneComponent)
{
    // fixed threshold equal to the only intensity marks every pixel
    CrackConfig config;
    config.threshold = 50;
    config.min_elongation_ratio = 1.0;

    DefectReport report = detect(surface(8, 32, 50), config);
    ASSERT_EQ(report.size(), 1u);
    EXPECT_EQ(report.cracks[0].component.pixel_count, 256);
    EXPECT_DOUBLE_EQ(report.damaged_fraction, 1.0);
}

TEST_F(CrackDetectorTest, SortedBySizeAndSmallOnesDropped)
{
    cv::Mat img = surface(60, 80, 210);
    img(cv::Rect(2, 5, 20, 1)).setTo(10);  // 20 px
    img(cv::Rect(2, 15, 40, 1)).setTo(10); // 40 px
    img(cv::Rect(50, 2, 1, 30)).setTo(10); // 30 px, vertical
    img(cv::Rect(70, 50, 5, 1)).setTo(10); // 5 px, below min size

    CrackConfig config;
    config.threshold = 100;
    DefectReport report = detect(img, config);

    ASSERT_EQ(report.size(), 3u);
    EXPECT_EQ(report.cracks[0].component.pixel_count, 40);
    EXPECT_EQ(report.cracks[1].component.pixel_count, 30);
    EXPECT_EQ(report.cracks[2].component.pixel_count, 20);
    EXPECT_NEAR(report.cracks[1].features.orientation, 90.0, 1e-6);
    EXPECT_EQ(report.damaged_pixels, 90);
}

TEST_F(CrackDetectorTest, OpeningRemovesThinNoise)
{
    cv::Mat img = surface(50, 50, 200);
    img(cv::Rect(5, 10, 40, 3)).setTo(20); // 3 px thick crack
    img.at<uchar>(30, 30) = 20;            // isolated speck
    img(cv::Rect(10, 40, 30, 1)).setTo(20); // hairline, thinner than the kernel

    CrackConfig config;
    config.threshold = 100;
    config.min_component_size = 1;
    config.morphology_kernel_size = 3;

    DefectReport report = detect(img, config);
    ASSERT_EQ(report.size(), 1u);
    EXPECT_EQ(report.cracks[0].component.pixel_count, 120);
}

TEST_F(CrackDetectorTest, CalibratedMeasures)
{
    CrackConfig config;
    config.threshold = 100;
    DefectReport report = detect(lineImage(), config, Calibration::fromScale(0.5));

    ASSERT_EQ(report.size(), 1u);
    EXPECT_DOUBLE_EQ(report.cracks[0].length_mm, 25.0);
    EXPECT_DOUBLE_EQ(report.cracks[0].area_mm2, 12.5);
}

TEST_F(CrackDetectorTest, AutomaticThresholdMethods)
{
    for (ThresholdMethod method : {ThresholdMethod::MeanStdDev, ThresholdMethod::KMeans, ThresholdMethod::HistogramPeaks})
    {
        CrackConfig config;
        config.threshold_method = method;
        DefectReport report = detect(lineImage(), config);
        ASSERT_EQ(report.size(), 1u) << toString(method);
        EXPECT_EQ(report.cracks[0].component.pixel_count, 50) << toString(method);
    }
}

TEST_F(CrackDetectorTest, ImageOverload)
{
    Image gray(lineImage(), SampleKind::Grayscale);
    EXPECT_EQ(detect(gray).size(), 1u);

    Image binary(lineImage(), SampleKind::Binary);
    EXPECT_THROW(detect(binary), InvalidInput);
}

TEST_F(CrackDetectorTest, RepeatedCallsAgree)
{
    DefectReport a = detect(lineImage());
    DefectReport b = detect(lineImage());
    ASSERT_EQ(a.size(), b.size());
    EXPECT_EQ(a.threshold_used, b.threshold_used);
    EXPECT_EQ(cv::countNonZero(a.mask != b.mask), 0);
}

TEST_F(CrackDetectorTest, RejectsEmptyImage)
{
    EXPECT_THROW(detect(cv::Mat()), InvalidInput);
    EXPECT_THROW(detect(cv::Mat(5, 5, CV_8UC3, cv::Scalar(0, 0, 0))), InvalidInput);
}

TEST_F(CrackDetectorTest, RejectsThresholdOutsideIntensityRange)
{
    CrackConfig above;
    above.threshold = 250; // image max is 200
    EXPECT_THROW(detect(lineImage(), above), InvalidConfiguration);

    CrackConfig below;
    below.threshold = 10; // image min is 30
    EXPECT_THROW(detect(lineImage(), below), InvalidConfiguration);

    CrackConfig huge;
    huge.threshold = 300;
    EXPECT_THROW(detect(lineImage(), huge), InvalidConfiguration);
}

TEST_F(CrackDetectorTest, RejectsNegativeThreshold)
{
    CrackConfig negative;
    negative.threshold = -5;
    EXPECT_THROW(validateConfig(negative), InvalidConfiguration);
    EXPECT_THROW(detect(lineImage(), negative), InvalidConfiguration);

    CrackConfig minus_one;
    minus_one.threshold = -1;
    EXPECT_THROW(detect(lineImage(), minus_one), InvalidConfiguration);
}

TEST_F(CrackDetectorTest, UnsetThresholdIsAutomatic)
{
    CrackConfig config;
    EXPECT_FALSE(config.threshold.has_value());
    EXPECT_NO_THROW(validateConfig(config));
}

TEST_F(CrackDetectorTest, RejectsBadConfiguration)
{
    CrackConfig even;
    even.morphology_kernel_size = 4;
    EXPECT_THROW(detect(lineImage(), even), InvalidConfiguration);

    CrackConfig zero;
    zero.morphology_kernel_size = 0;
    EXPECT_THROW(detect(lineImage(), zero), InvalidConfiguration);

    CrackConfig connectivity;
    connectivity.connectivity = 6;
    EXPECT_THROW(detect(lineImage(), connectivity), InvalidConfiguration);

    CrackConfig swapped;
    swapped.min_elongation_ratio = 5.0;
    swapped.max_elongation_ratio = 2.0;
    EXPECT_THROW(detect(lineImage(), swapped), InvalidConfiguration);

    CrackConfig negative;
    negative.min_component_size = -1;
    EXPECT_THROW(detect(lineImage(), negative), InvalidConfiguration);

    CrackConfig factor;
    factor.stddev_factor = -1.0;
    EXPECT_THROW(detect(lineImage(), factor), InvalidConfiguration);
}

TEST_F(CrackDetectorTest, EmptyImageReportedBeforeConfiguration)
{
    CrackConfig config;
    config.connectivity = 6;
    EXPECT_THROW(detect(cv::Mat(), config), InvalidInput);
}
