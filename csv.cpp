/**
 * 10/19/2026
 *
 * Utility functions to append crack reports to a csv file and read them back
 */

#include <cstdio>
#include <fstream>
#include <iomanip>
#include <limits>
#include <sstream>
#include "csv.hpp"
#include "errors.hpp"

namespace crackscan
{

namespace
{

const int kNumFields = 13;

double toNumber(const std::string &field, const std::string &line)
{
    try
    {
        size_t used = 0;
        double val = std::stod(field, &used);
        if (used != field.size())
            throw InvalidInput("bad number '" + field + "' in csv row: " + line);
        return val;
    }
    catch (const std::logic_error &)
    {
        // std::invalid_argument / std::out_of_range from stod
        throw InvalidInput("bad number '" + field + "' in csv row: " + line);
    }
}

int toInteger(const std::string &field, const std::string &line)
{
    try
    {
        size_t used = 0;
        int val = std::stoi(field, &used);
        if (used != field.size())
            throw InvalidInput("bad integer '" + field + "' in csv row: " + line);
        return val;
    }
    catch (const std::logic_error &)
    {
        // std::invalid_argument / std::out_of_range from stoi
        throw InvalidInput("bad integer '" + field + "' in csv row: " + line);
    }
}

} // namespace

bool saveReport(const std::string &filename, const std::string &image_id, const DefectReport &report)
{
    // the id is written unquoted, a separator in it would corrupt the whole file
    if (image_id.find_first_of(",\r\n") != std::string::npos)
    {
        printf("Error: Image id '%s' must not contain commas or line breaks\n", image_id.c_str());
        return false;
    }

    std::ofstream file;
    // open file in append mode ("app") to avoid overwriting previous reports
    file.open(filename, std::ios_base::app);

    if (!file.is_open())
    {
        printf("Error: Could not open report file %s\n", filename.c_str());
        return false;
    }

    // enough digits for every double to read back unchanged
    file << std::setprecision(std::numeric_limits<double>::max_digits10);

    for (const auto &crack : report.cracks)
    {
        const Component &c = crack.component;
        file << image_id << ",";
        file << c.label << "," << c.pixel_count << ",";
        file << c.bounding_box.min_row << "," << c.bounding_box.min_col << ",";
        file << c.bounding_box.max_row << "," << c.bounding_box.max_col << ",";
        file << c.centroid.x << "," << c.centroid.y << ",";
        file << crack.features.elongation << "," << crack.features.orientation << ",";
        file << crack.length_mm << "," << crack.area_mm2 << "\n";
    }

    file.close();
    printf("Saved %zu cracks for '%s' to %s\n", report.cracks.size(), image_id.c_str(), filename.c_str());
    return true;
}

std::vector<CsvRow> loadReport(const std::string &filename)
{
    std::vector<CsvRow> rows;
    std::ifstream file(filename);
    std::string line;

    if (!file.is_open())
    {
        printf("No report found at %s\n", filename.c_str());
        return rows;
    }

    while (std::getline(file, line))
    {
        if (line.empty())
            continue;

        std::stringstream ss(line); // turns every line in the csv into a stream
        std::string segment;
        std::vector<std::string> fields;
        while (std::getline(ss, segment, ','))
        {
            fields.push_back(segment);
        }

        if ((int)fields.size() != kNumFields)
            throw InvalidInput("expected " + std::to_string(kNumFields) + " fields in csv row: " + line);

        CsvRow row;
        row.image_id = fields[0];
        row.component.label = toInteger(fields[1], line);
        row.component.pixel_count = toInteger(fields[2], line);
        row.component.bounding_box.min_row = toInteger(fields[3], line);
        row.component.bounding_box.min_col = toInteger(fields[4], line);
        row.component.bounding_box.max_row = toInteger(fields[5], line);
        row.component.bounding_box.max_col = toInteger(fields[6], line);
        row.component.centroid = cv::Point2d(toNumber(fields[7], line), toNumber(fields[8], line));
        row.elongation = toNumber(fields[9], line);
        row.orientation = toNumber(fields[10], line);
        row.length_mm = toNumber(fields[11], line);
        row.area_mm2 = toNumber(fields[12], line);

        rows.push_back(row);
    }

    printf("Loaded %zu crack rows from %s\n", rows.size(), filename.c_str());
    return rows;
}

} // namespace crackscan
