/**
 * 10/19/2026
 *
 * Binary morphology with a square structuring element
 * A square window is separable, so every reduction runs as a horizontal pass followed by a vertical pass
 */

#include <algorithm>
#include <string>
#include "morphology.hpp"
#include "image.hpp"
#include "errors.hpp"

namespace crackscan
{

namespace
{

// Min (erosion) or max (dilation) over a (2r+1) x (2r+1) window clipped to the image
cv::Mat windowReduce(const cv::Mat &src, int radius, bool take_min)
{
    cv::Mat tmp(src.size(), CV_8UC1);
    cv::Mat dst(src.size(), CV_8UC1);

    // horizontal pass
    for (int i = 0; i < src.rows; i++)
    {
        const uchar *sPtr = src.ptr<uchar>(i);
        uchar *tPtr = tmp.ptr<uchar>(i);
        for (int j = 0; j < src.cols; j++)
        {
            int lo = std::max(0, j - radius);
            int hi = std::min(src.cols - 1, j + radius);
            uchar val = sPtr[lo];
            for (int k = lo + 1; k <= hi; k++)
                val = take_min ? std::min(val, sPtr[k]) : std::max(val, sPtr[k]);
            tPtr[j] = val;
        }
    }

    // vertical pass
    for (int i = 0; i < src.rows; i++)
    {
        int lo = std::max(0, i - radius);
        int hi = std::min(src.rows - 1, i + radius);
        uchar *dPtr = dst.ptr<uchar>(i);
        tmp.row(lo).copyTo(dst.row(i));

        for (int k = lo + 1; k <= hi; k++)
        {
            const uchar *tPtr = tmp.ptr<uchar>(k);
            for (int j = 0; j < src.cols; j++)
                dPtr[j] = take_min ? std::min(dPtr[j], tPtr[j]) : std::max(dPtr[j], tPtr[j]);
        }
    }

    return dst;
}

cv::Mat reduce(const cv::Mat &mask, int kernel_size, bool take_min)
{
    checkImage(mask, "mask");
    checkKernelSize(kernel_size);

    cv::Mat fg = (mask != 0); // normalize to 0/255
    if (kernel_size == 1)
        return fg;
    return windowReduce(fg, kernel_size / 2, take_min);
}

} // namespace

void checkKernelSize(int kernel_size)
{
    if (kernel_size <= 0)
        throw InvalidConfiguration("kernel size must be positive, got " + std::to_string(kernel_size));
    if (kernel_size % 2 == 0)
        throw InvalidConfiguration("kernel size must be odd, got " + std::to_string(kernel_size));
}

cv::Mat erodeMask(const cv::Mat &mask, int kernel_size)
{
    return reduce(mask, kernel_size, true);
}

cv::Mat dilateMask(const cv::Mat &mask, int kernel_size)
{
    return reduce(mask, kernel_size, false);
}

cv::Mat openMask(const cv::Mat &mask, int kernel_size)
{
    return dilateMask(erodeMask(mask, kernel_size), kernel_size);
}

cv::Mat closeMask(const cv::Mat &mask, int kernel_size)
{
    return erodeMask(dilateMask(mask, kernel_size), kernel_size);
}

} // namespace crackscan
