/**
 * 10/19/2026
 *
 * Validated single channel image used by the labeler and the crack detector
 * Wraps an 8-bit cv::Mat and records whether the samples are grayscale intensities or a binary mask
 */

#pragma once
#include <vector>
#include "opencv2/core.hpp"

namespace crackscan
{

enum class SampleKind
{
    Grayscale, // 0-255 intensities
    Binary     // 0 = background, 255 = foreground
};

class Image
{
public:
    // Deep copies src (must be non-empty CV_8UC1)
    // Binary images are normalized so every nonzero sample becomes 255
    Image(const cv::Mat &src, SampleKind kind);

    // Builds an image from nested rows, every row must have the same length
    static Image fromRows(const std::vector<std::vector<uchar>> &rows, SampleKind kind);

    int width() const { return data_.cols; }
    int height() const { return data_.rows; }
    SampleKind kind() const { return kind_; }
    const cv::Mat &mat() const { return data_; }

    uchar at(int row, int col) const { return data_.at<uchar>(row, col); }

private:
    cv::Mat data_;
    SampleKind kind_;
};

// Throws InvalidInput unless img is a non-empty single channel 8-bit matrix
// what names the argument in the error message
void checkImage(const cv::Mat &img, const char *what);

} // namespace crackscan
