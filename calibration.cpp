/**
 * 10/19/2026
 *
 * Pixel to millimetre scale taken from a reference marker of known size
 */

#include <cmath>
#include <string>
#include "calibration.hpp"
#include "errors.hpp"

namespace crackscan
{

Calibration Calibration::fromScale(double mm_per_pixel)
{
    if (!(mm_per_pixel > 0.0) || !std::isfinite(mm_per_pixel))
        throw InvalidConfiguration("mm per pixel must be positive, got " + std::to_string(mm_per_pixel));
    return Calibration(mm_per_pixel);
}

Calibration Calibration::fromReference(const cv::Rect &marker_px, double width_mm, double height_mm)
{
    if (marker_px.width <= 0 || marker_px.height <= 0)
        throw InvalidConfiguration("reference marker box is empty");
    if (!(width_mm > 0.0) || !(height_mm > 0.0))
        throw InvalidConfiguration("reference marker size must be positive");

    double sx = width_mm / marker_px.width;
    double sy = height_mm / marker_px.height;
    return fromScale((sx + sy) / 2.0);
}

} // namespace crackscan
