/**
 * 10/19/2026
 *
 * Binary morphology with a square structuring element
 * Each operation is an explicit min/max reduction over a kernel_size x kernel_size window
 * Pixels outside the image are ignored by the window (they neither erode nor dilate)
 */

#pragma once
#include "opencv2/core.hpp"

namespace crackscan
{

// Throws InvalidConfiguration unless kernel_size is positive and odd
void checkKernelSize(int kernel_size);

// All functions take a CV_8UC1 mask (nonzero = foreground) and return a 0/255 mask of the same size
// kernel_size 1 leaves the mask unchanged
cv::Mat erodeMask(const cv::Mat &mask, int kernel_size);
cv::Mat dilateMask(const cv::Mat &mask, int kernel_size);

// erosion then dilation: removes specks smaller than the kernel
cv::Mat openMask(const cv::Mat &mask, int kernel_size);

// dilation then erosion: fills gaps smaller than the kernel
cv::Mat closeMask(const cv::Mat &mask, int kernel_size);

} // namespace crackscan
