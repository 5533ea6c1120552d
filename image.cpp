/**
 * 10/19/2026
 *
 * Validated single channel image used by the labeler and the crack detector
 */

#include "image.hpp"
#include "errors.hpp"

namespace crackscan
{

void checkImage(const cv::Mat &img, const char *what)
{
    if (img.empty() || img.rows <= 0 || img.cols <= 0)
        throw InvalidInput(std::string(what) + " is empty");
    if (img.type() != CV_8UC1)
        throw InvalidInput(std::string(what) + " must be a single channel 8-bit image");
}

Image::Image(const cv::Mat &src, SampleKind kind) : kind_(kind)
{
    checkImage(src, "image");

    if (kind == SampleKind::Binary)
        data_ = (src != 0); // 0 or 255
    else
        data_ = src.clone();
}

Image Image::fromRows(const std::vector<std::vector<uchar>> &rows, SampleKind kind)
{
    if (rows.empty() || rows[0].empty())
        throw InvalidInput("image has zero width or height");

    const size_t width = rows[0].size();
    cv::Mat mat((int)rows.size(), (int)width, CV_8UC1);

    for (int i = 0; i < mat.rows; i++)
    {
        if (rows[i].size() != width)
            throw InvalidInput("row " + std::to_string(i) + " has " + std::to_string(rows[i].size()) +
                               " samples, expected " + std::to_string(width));

        uchar *dPtr = mat.ptr<uchar>(i); // row pointer for dst image
        for (int j = 0; j < mat.cols; j++)
        {
            dPtr[j] = rows[i][j];
        }
    }

    return Image(mat, kind);
}

} // namespace crackscan
