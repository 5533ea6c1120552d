/**
 * 10/19/2026
 *
 * Functions to binarize a grayscale surface image and describe the regions found in it
 * Dark pixels (cracks) become foreground using a fixed or an automatically computed threshold
 * Shape features are computed from the moments of each labeled region
 */

#include <algorithm>
#include <cmath>
#include "opencv2/imgproc.hpp"
#include "features.hpp"
#include "image.hpp"

namespace crackscan
{

namespace
{

// create histogram of 256 intensity values
void histogram(const cv::Mat &gray, int hist[256])
{
    std::fill(hist, hist + 256, 0);
    for (int i = 0; i < gray.rows; i++)
    {
        const uchar *ptr = gray.ptr<uchar>(i);
        for (int j = 0; j < gray.cols; j++)
        {
            hist[ptr[j]]++;
        }
    }
}

} // namespace

std::pair<int, int> intensityRange(const cv::Mat &gray)
{
    checkImage(gray, "grayscale image");

    double lo = 0.0, hi = 0.0;
    cv::minMaxLoc(gray, &lo, &hi);
    return std::make_pair((int)lo, (int)hi);
}

cv::Mat binarizeDark(const cv::Mat &gray, int threshold)
{
    checkImage(gray, "grayscale image");

    // create a dst image the same type and size as src
    cv::Mat dst(gray.size(), CV_8UC1);

    for (int i = 0; i < dst.rows; i++)
    {
        const uchar *sPtr = gray.ptr<uchar>(i); // row pointer for src image
        uchar *dPtr = dst.ptr<uchar>(i);        // row pointer for dst image
        for (int j = 0; j < dst.cols; j++)
        {
            // crack is white and surface is black (inverted)
            dPtr[j] = (int)sPtr[j] <= threshold ? 255 : 0;
        }
    }

    return dst;
}

int meanStdDevThreshold(const cv::Mat &gray, double k)
{
    checkImage(gray, "grayscale image");

    cv::Scalar mean, stdev;
    cv::meanStdDev(gray, mean, stdev);

    double t = mean[0] - k * stdev[0];
    t = std::min(255.0, std::max(0.0, t)); // clamp values
    return (int)std::floor(t);
}

int kmeansThreshold(const cv::Mat &gray)
{
    checkImage(gray, "grayscale image");

    int hist[256];
    histogram(gray, hist);

    // with k = 2 in one dimension a bin joins the nearer mean,
    // so the clusters are simply the bins on either side of the midpoint
    double dark = 0.0;
    double bright = 255.0;
    double cut = (dark + bright) / 2.0;

    for (int iter = 0; iter < 20; iter++)
    {
        long below = 0, above = 0;
        double sum_below = 0.0, sum_above = 0.0;
        for (int v = 0; v < 256; v++)
        {
            if (v < cut)
            {
                below += hist[v];
                sum_below += (double)v * hist[v];
            }
            else
            {
                above += hist[v];
                sum_above += (double)v * hist[v];
            }
        }

        // an empty side keeps its previous mean
        if (below > 0)
            dark = sum_below / below;
        if (above > 0)
            bright = sum_above / above;

        double next = (dark + bright) / 2.0;
        bool settled = std::abs(next - cut) < 0.5;
        cut = next;
        if (settled)
            break;
    }

    return (int)cut;
}

int histogramPeakThreshold(const cv::Mat &gray)
{
    checkImage(gray, "grayscale image");

    int hist[256];
    histogram(gray, hist);

    // most frequent bin, ties go to the darker intensity
    int first = 0;
    for (int j = 1; j < 256; j++)
    {
        if (hist[j] > hist[first])
            first = j;
    }

    int second = -1;
    for (int j = 0; j < 256; j++)
    {
        if (j == first || hist[j] == 0)
            continue;
        if (second < 0 || hist[j] > hist[second])
            second = j;
    }

    if (second < 0)
        return first; // single gray level

    return (first + second) / 2;
}

double elongationRatio(const BoundingBox &box)
{
    int w = box.width();
    int h = box.height();
    return (double)std::max(w, h) / (double)std::min(w, h);
}

RegionFeatures computeRegionFeatures(const LabelResult &result, const Component &component)
{
    RegionFeatures features;
    const cv::Rect roi = component.bounding_box.rect();

    // mask of this region inside its bounding box
    cv::Mat region_mask = (result.labels(roi) == component.label);

    // calculate moments
    // true = binary image (treat non-zero pixels as 1)
    cv::Moments m = cv::moments(region_mask, true);

    // calculate orientation (axis of least central moment)
    // 0.5 * atan2(2 * mu11, mu20 - mu02)
    double theta = 0.5 * std::atan2(2 * m.mu11, m.mu20 - m.mu02);
    double degrees = theta * (180.0 / CV_PI);
    if (degrees < 0)
        degrees += 180.0;
    if (degrees >= 180.0)
        degrees -= 180.0;
    features.orientation = degrees;

    // eigenvalues of the normalized covariance matrix give the ellipse axes
    double area = (m.m00 > 0) ? m.m00 : 1.0;
    double a = m.mu20 / area;
    double c = m.mu02 / area;
    double b = m.mu11 / area;
    double root = std::sqrt(4 * b * b + (a - c) * (a - c));
    double l1 = (a + c + root) / 2.0;
    double l2 = std::max(0.0, (a + c - root) / 2.0);
    features.major_axis = 4.0 * std::sqrt(l1);
    features.minor_axis = 4.0 * std::sqrt(l2);

    features.elongation = elongationRatio(component.bounding_box);

    // calculate % filled (region area / bbox area)
    double box_area = (double)roi.width * roi.height;
    features.percent_filled = component.pixel_count / box_area;

    // boundary pixels: any 4-neighbor outside the region (or outside the box)
    int perimeter = 0;
    for (int i = 0; i < region_mask.rows; i++)
    {
        const uchar *ptr = region_mask.ptr<uchar>(i);
        const uchar *up = (i > 0) ? region_mask.ptr<uchar>(i - 1) : nullptr;
        const uchar *down = (i + 1 < region_mask.rows) ? region_mask.ptr<uchar>(i + 1) : nullptr;
        for (int j = 0; j < region_mask.cols; j++)
        {
            if (ptr[j] == 0)
                continue;

            bool inner = up && up[j] && down && down[j] &&
                         j > 0 && ptr[j - 1] && j + 1 < region_mask.cols && ptr[j + 1];
            if (!inner)
                perimeter++;
        }
    }
    features.perimeter = perimeter;

    return features;
}

} // namespace crackscan
