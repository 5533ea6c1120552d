/**
 * 10/19/2026
 *
 * Utility functions to append crack reports to a csv file and read them back
 * One row per crack: image_id,label,pixels,min_row,min_col,max_row,max_col,cx,cy,elongation,orientation,length_mm,area_mm2
 */

#pragma once
#include <string>
#include <vector>
#include "crack_detector.hpp"

namespace crackscan
{

// A struct to hold one row of a saved report
struct CsvRow
{
    std::string image_id;
    Component component;
    double elongation;
    double orientation;
    double length_mm;
    double area_mm2;
};

// Save (append) every crack of the report to a csv
// Returns false if the file could not be opened or image_id contains a comma or line break
bool saveReport(const std::string &filename, const std::string &image_id, const DefectReport &report);

// Load all rows of a report csv
// A missing file gives an empty vector, a malformed row throws InvalidInput
std::vector<CsvRow> loadReport(const std::string &filename);

} // namespace crackscan
