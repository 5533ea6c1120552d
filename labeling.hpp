/**
 * 10/19/2026
 *
 * Connected Components Analysis (CCA) on binary images
 * Two raster passes with a union-find table of provisional labels
 * Labels are compacted to 1..N in the order their first pixel appears (0 is background)
 */

#pragma once
#include <vector>
#include "opencv2/core.hpp"
#include "image.hpp"

namespace crackscan
{

// Inclusive pixel bounds of a region
struct BoundingBox
{
    int min_row;
    int min_col;
    int max_row;
    int max_col;

    int width() const { return max_col - min_col + 1; }
    int height() const { return max_row - min_row + 1; }
    cv::Rect rect() const { return cv::Rect(min_col, min_row, width(), height()); }
};

// A struct to hold the statistics of one labeled region
struct Component
{
    int label;               // 1..N, raster order of the first pixel
    int pixel_count;
    BoundingBox bounding_box;
    cv::Point2d centroid;    // x = mean column, y = mean row
};

struct LabelResult
{
    cv::Mat labels;                     // CV_32S, same size as the input, 0 = background
    std::vector<Component> components;  // ascending label
};

/**
 * Labels every maximal 4- or 8-connected foreground region (nonzero pixels)
 * Throws InvalidInput for an empty or non 8-bit single channel image
 * Throws InvalidConfiguration if connectivity is not 4 or 8
 */
LabelResult label(const cv::Mat &binary_img, int connectivity = 8);
LabelResult label(const Image &image, int connectivity = 8);

// Throws InvalidConfiguration unless connectivity is 4 or 8
void checkConnectivity(int connectivity);

// Binary mask (0/255) of the pixels carrying the given label
cv::Mat labelMask(const LabelResult &result, int id);

} // namespace crackscan
