/**
 * 10/19/2026
 *
 * Crack detection on grayscale surface images
 * Pipeline: threshold (dark = crack) -> morphological opening -> labeling -> shape filter
 * Surviving regions are returned largest first as a DefectReport
 */

#pragma once
#include <limits>
#include <optional>
#include <string>
#include <vector>
#include "opencv2/core.hpp"
#include "image.hpp"
#include "labeling.hpp"
#include "features.hpp"
#include "calibration.hpp"

namespace crackscan
{

// How the threshold is picked when CrackConfig::threshold is not set
enum class ThresholdMethod
{
    MeanStdDev,    // mean - k * stddev
    KMeans,        // midpoint of the two histogram means
    HistogramPeaks // midpoint of the two most frequent gray levels
};

const char *toString(ThresholdMethod method);

struct CrackConfig
{
    std::optional<int> threshold; // fixed intensity cutoff, unset = automatic
    ThresholdMethod threshold_method = ThresholdMethod::MeanStdDev;
    double stddev_factor = 2.0; // k for ThresholdMethod::MeanStdDev
    int min_component_size = 10;
    double min_elongation_ratio = 3.0;
    double max_elongation_ratio = std::numeric_limits<double>::infinity();
    int morphology_kernel_size = 1; // odd, 1 = no opening
    int connectivity = 8;
    bool debug = false; // print stage summaries
};

// A region that passed the shape filter
struct Crack
{
    Component component;
    RegionFeatures features;
    double length_mm = 0.0; // longest bounding box side, 0 without calibration
    double area_mm2 = 0.0;
};

struct DefectReport
{
    std::vector<Crack> cracks; // descending pixel count
    int threshold_used = -1;   // -1 when no pixel can qualify (automatic cutoff on an image whose max is 0)
    cv::Mat mask;              // thresholded and opened mask that was labeled
    long damaged_pixels = 0;   // sum of the crack pixel counts
    double damaged_fraction = 0.0;

    bool empty() const { return cracks.empty(); }
    size_t size() const { return cracks.size(); }
};

// Throws InvalidConfiguration for any value outside its valid range
// The threshold is checked against the image in detect()
void validateConfig(const CrackConfig &config);

/**
 * Runs the crack detection pipeline on a grayscale image
 * Throws InvalidInput for an empty or non 8-bit single channel image
 * Throws InvalidConfiguration for a bad config or a fixed threshold outside the image's intensity range
 * An image without dark structures gives an empty report
 */
DefectReport detect(const cv::Mat &gray, const CrackConfig &config = CrackConfig(),
                    const Calibration &calibration = Calibration());

// Throws InvalidInput unless the image holds grayscale samples
DefectReport detect(const Image &image, const CrackConfig &config = CrackConfig(),
                    const Calibration &calibration = Calibration());

} // namespace crackscan
