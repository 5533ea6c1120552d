/**
 * 10/19/2026
 *
 * Functions to binarize a grayscale surface image and describe the regions found in it
 * Dark pixels (cracks) become foreground using a fixed or an automatically computed threshold
 * Shape features are computed from the moments of each labeled region
 */

#pragma once
#include <utility>
#include "opencv2/core.hpp"
#include "labeling.hpp"

namespace crackscan
{

// A struct to hold computed features
struct RegionFeatures
{
    double orientation;    // Angle of the major axis in degrees [0-180)
    double elongation;     // Bounding box long side / short side (>= 1)
    double percent_filled; // Ratio of region area to bounding box area
    double major_axis;     // Axis lengths of the ellipse with the same second moments
    double minor_axis;
    int perimeter;         // Region pixels with a 4-neighbor outside the region
};

// Lowest and highest intensity of a grayscale image
std::pair<int, int> intensityRange(const cv::Mat &gray);

// Creates a binary image using the greyscale input and the threshold value
// Pixels at or below the threshold become 255 (crack), everything else 0
// A negative threshold gives an empty mask
cv::Mat binarizeDark(const cv::Mat &gray, int threshold);

// Global statistic: mean - k * stddev of the intensities (clamped to 0-255)
int meanStdDevThreshold(const cv::Mat &gray, double k);

// Uses the histogram of intensity values to find the 2 means (foreground and background)
// Threshold is defined as the average of the 2 means
int kmeansThreshold(const cv::Mat &gray);

// Midpoint of the two most frequent intensities
// Returns the only intensity if the image has a single gray level
int histogramPeakThreshold(const cv::Mat &gray);

// Elongation of a bounding box (long side / short side)
double elongationRatio(const BoundingBox &box);

/**
 * Computes features for one labeled region
 * Moments are taken over the region's bounding box only
 */
RegionFeatures computeRegionFeatures(const LabelResult &result, const Component &component);

} // namespace crackscan
