/**
 * 10/19/2026
 *
 * Pixel to millimetre scale taken from a reference marker of known size
 * The marker itself is located elsewhere, only its pixel bounding box is needed here
 */

#pragma once
#include "opencv2/core.hpp"

namespace crackscan
{

// Real size of the reference sheet used on the inspected walls (26 x 36 cm)
constexpr double kReferenceWidthMm = 260.0;
constexpr double kReferenceHeightMm = 360.0;

class Calibration
{
public:
    // Uncalibrated: physical measures stay at 0
    Calibration() : mm_per_pixel_(0.0) {}

    // Throws InvalidConfiguration if mm_per_pixel is not positive
    static Calibration fromScale(double mm_per_pixel);

    // Averages the horizontal and vertical scale of the marker box
    // Throws InvalidConfiguration for an empty box or non-positive real sizes
    static Calibration fromReference(const cv::Rect &marker_px,
                                     double width_mm = kReferenceWidthMm,
                                     double height_mm = kReferenceHeightMm);

    bool isValid() const { return mm_per_pixel_ > 0.0; }
    double mmPerPixel() const { return mm_per_pixel_; }

    double toMillimetres(double pixels) const { return pixels * mm_per_pixel_; }
    double toSquareMillimetres(double pixel_area) const { return pixel_area * mm_per_pixel_ * mm_per_pixel_; }

private:
    explicit Calibration(double mm_per_pixel) : mm_per_pixel_(mm_per_pixel) {}

    double mm_per_pixel_;
};

} // namespace crackscan
