/**
 * 10/19/2026
 *
 * Crack detection on grayscale surface images
 * Pipeline: threshold (dark = crack) -> morphological opening -> labeling -> shape filter
 */

#include <algorithm>
#include <cmath>
#include <cstdio>
#include "crack_detector.hpp"
#include "morphology.hpp"
#include "errors.hpp"

namespace crackscan
{

namespace
{

// Comparator for sorting cracks (descending order by pixel count, then label)
bool compareCracksBySize(const Crack &a, const Crack &b)
{
    if (a.component.pixel_count != b.component.pixel_count)
        return a.component.pixel_count > b.component.pixel_count;
    return a.component.label < b.component.label;
}

int automaticThreshold(const cv::Mat &gray, const CrackConfig &config)
{
    switch (config.threshold_method)
    {
    case ThresholdMethod::KMeans:
        return kmeansThreshold(gray);
    case ThresholdMethod::HistogramPeaks:
        return histogramPeakThreshold(gray);
    case ThresholdMethod::MeanStdDev:
    default:
        return meanStdDevThreshold(gray, config.stddev_factor);
    }
}

// Picks the threshold and checks a fixed one against the intensity range
int resolveThreshold(const cv::Mat &gray, const CrackConfig &config)
{
    std::pair<int, int> range = intensityRange(gray);

    if (config.threshold)
    {
        const int fixed = *config.threshold;
        if (fixed < range.first || fixed > range.second)
            throw InvalidConfiguration("threshold " + std::to_string(fixed) +
                                       " is outside the image intensity range [" +
                                       std::to_string(range.first) + ", " + std::to_string(range.second) + "]");
        return fixed;
    }

    // an automatic cutoff always leaves the brightest level as surface
    // so a uniform image never turns into one big crack (gives -1 when the max is 0)
    return std::min(automaticThreshold(gray, config), range.second - 1);
}

} // namespace

const char *toString(ThresholdMethod method)
{
    switch (method)
    {
    case ThresholdMethod::MeanStdDev:
        return "mean-stddev";
    case ThresholdMethod::KMeans:
        return "kmeans";
    case ThresholdMethod::HistogramPeaks:
        return "histogram-peaks";
    }
    return "unknown";
}

void validateConfig(const CrackConfig &config)
{
    checkConnectivity(config.connectivity);
    checkKernelSize(config.morphology_kernel_size);

    if (config.threshold && (*config.threshold < 0 || *config.threshold > 255))
        throw InvalidConfiguration("threshold must be within 0-255, got " + std::to_string(*config.threshold));
    if (config.min_component_size < 0)
        throw InvalidConfiguration("min component size must not be negative");
    if (!(config.stddev_factor >= 0.0) || std::isinf(config.stddev_factor))
        throw InvalidConfiguration("stddev factor must be a finite non-negative number");
    if (!(config.min_elongation_ratio > 0.0) || !(config.max_elongation_ratio > 0.0))
        throw InvalidConfiguration("elongation ratio bounds must be positive");
    if (config.min_elongation_ratio > config.max_elongation_ratio)
        throw InvalidConfiguration("min elongation ratio is larger than max elongation ratio");
}

DefectReport detect(const cv::Mat &gray, const CrackConfig &config, const Calibration &calibration)
{
    // all checks run before any processing so a failure leaves no partial result
    checkImage(gray, "grayscale image");
    validateConfig(config);
    const int threshold = resolveThreshold(gray, config);

    DefectReport report;
    report.threshold_used = threshold;

    // 1. dark pixels become the crack mask
    cv::Mat bin = binarizeDark(gray, threshold);

    // 2. remove specks smaller than the kernel
    report.mask = openMask(bin, config.morphology_kernel_size);

    // 3. label the cleaned mask
    LabelResult labeled = label(report.mask, config.connectivity);

    if (config.debug)
    {
        printf("Threshold: %d (%s)\n", threshold, config.threshold ? "fixed" : toString(config.threshold_method));
        printf("Foreground pixels: %d before opening, %d after\n", cv::countNonZero(bin), cv::countNonZero(report.mask));
        printf("Labeled %zu regions\n", labeled.components.size());
    }

    // 4. shape filter: cracks are thin and long, not compact blobs
    for (const auto &c : labeled.components)
    {
        double ratio = elongationRatio(c.bounding_box);
        if (c.pixel_count < config.min_component_size ||
            ratio < config.min_elongation_ratio || ratio > config.max_elongation_ratio)
        {
            if (config.debug)
                printf("  rejected region %d: %d px, elongation %.2f\n", c.label, c.pixel_count, ratio);
            continue;
        }

        Crack crack;
        crack.component = c;
        crack.features = computeRegionFeatures(labeled, c);
        if (calibration.isValid())
        {
            int longest = std::max(c.bounding_box.width(), c.bounding_box.height());
            crack.length_mm = calibration.toMillimetres(longest);
            crack.area_mm2 = calibration.toSquareMillimetres(c.pixel_count);
        }

        report.damaged_pixels += c.pixel_count;
        report.cracks.push_back(crack);
    }

    // 5. largest crack first
    std::sort(report.cracks.begin(), report.cracks.end(), compareCracksBySize);
    report.damaged_fraction = (double)report.damaged_pixels / ((double)gray.rows * gray.cols);

    if (config.debug)
        printf("Kept %zu cracks covering %.2f%% of the image\n", report.cracks.size(), report.damaged_fraction * 100.0);

    return report;
}

DefectReport detect(const Image &image, const CrackConfig &config, const Calibration &calibration)
{
    if (image.kind() != SampleKind::Grayscale)
        throw InvalidInput("crack detection needs a grayscale image");
    return detect(image.mat(), config, calibration);
}

} // namespace crackscan
