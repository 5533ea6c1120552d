/**
 * 10/19/2026
 *
 * Connected Components Analysis (CCA) on binary images
 * First pass assigns provisional labels and records equivalences in a disjoint set
 * Second pass resolves every provisional label to its root, compacts the roots and gathers stats
 */

#include <algorithm>
#include <string>
#include "labeling.hpp"
#include "errors.hpp"

namespace crackscan
{

namespace
{

// Disjoint set over provisional labels (path compression + union by rank)
class DisjointSet
{
public:
    int makeSet()
    {
        int id = (int)parent_.size();
        parent_.push_back(id);
        rank_.push_back(0);
        return id;
    }

    int find(int x)
    {
        int root = x;
        while (parent_[root] != root)
            root = parent_[root];

        // point every node on the path straight at the root
        while (parent_[x] != root)
        {
            int next = parent_[x];
            parent_[x] = root;
            x = next;
        }
        return root;
    }

    void unite(int a, int b)
    {
        a = find(a);
        b = find(b);
        if (a == b)
            return;

        if (rank_[a] < rank_[b])
            std::swap(a, b);
        parent_[b] = a;
        if (rank_[a] == rank_[b])
            rank_[a]++;
    }

    int size() const { return (int)parent_.size(); }

private:
    std::vector<int> parent_;
    std::vector<int> rank_;
};

// Accumulates coordinates while the second pass walks a component
struct ComponentStats
{
    int label = 0;
    int count = 0;
    int min_row = 0, min_col = 0, max_row = 0, max_col = 0;
    double sum_row = 0.0;
    double sum_col = 0.0;
};

} // namespace

void checkConnectivity(int connectivity)
{
    if (connectivity != 4 && connectivity != 8)
        throw InvalidConfiguration("connectivity must be 4 or 8, got " + std::to_string(connectivity));
}

LabelResult label(const cv::Mat &binary_img, int connectivity)
{
    // validate everything before touching the pixels
    checkImage(binary_img, "binary image");
    checkConnectivity(connectivity);

    const int rows = binary_img.rows;
    const int cols = binary_img.cols;

    LabelResult result;
    result.labels = cv::Mat::zeros(binary_img.size(), CV_32S);
    DisjointSet sets;

    // first pass: provisional labels are stored as set id + 1 so 0 stays background
    for (int i = 0; i < rows; i++)
    {
        const uchar *sPtr = binary_img.ptr<uchar>(i);
        int *lPtr = result.labels.ptr<int>(i);
        const int *upPtr = (i > 0) ? result.labels.ptr<int>(i - 1) : nullptr;

        for (int j = 0; j < cols; j++)
        {
            if (sPtr[j] == 0)
                continue;

            // already visited neighbors in raster order
            int neighbors[4];
            int n = 0;
            if (j > 0 && lPtr[j - 1])
                neighbors[n++] = lPtr[j - 1]; // left
            if (upPtr)
            {
                if (upPtr[j])
                    neighbors[n++] = upPtr[j]; // up
                if (connectivity == 8)
                {
                    if (j > 0 && upPtr[j - 1])
                        neighbors[n++] = upPtr[j - 1]; // up-left
                    if (j + 1 < cols && upPtr[j + 1])
                        neighbors[n++] = upPtr[j + 1]; // up-right
                }
            }

            if (n == 0)
            {
                lPtr[j] = sets.makeSet() + 1;
                continue;
            }

            int smallest = *std::min_element(neighbors, neighbors + n);
            lPtr[j] = smallest;
            for (int k = 0; k < n; k++)
                sets.unite(smallest - 1, neighbors[k] - 1);
        }
    }

    // second pass: resolve roots, compact in order of first appearance and collect stats
    std::vector<int> final_label(sets.size(), 0); // indexed by root
    std::vector<ComponentStats> stats;

    for (int i = 0; i < rows; i++)
    {
        int *lPtr = result.labels.ptr<int>(i);
        for (int j = 0; j < cols; j++)
        {
            if (lPtr[j] == 0)
                continue;

            int root = sets.find(lPtr[j] - 1);
            if (final_label[root] == 0)
            {
                ComponentStats s;
                s.label = (int)stats.size() + 1;
                s.min_row = s.max_row = i;
                s.min_col = s.max_col = j;
                stats.push_back(s);
                final_label[root] = s.label;
            }

            int id = final_label[root];
            lPtr[j] = id;

            ComponentStats &s = stats[id - 1];
            s.count++;
            s.min_row = std::min(s.min_row, i);
            s.max_row = std::max(s.max_row, i);
            s.min_col = std::min(s.min_col, j);
            s.max_col = std::max(s.max_col, j);
            s.sum_row += i;
            s.sum_col += j;
        }
    }

    result.components.reserve(stats.size());
    for (const auto &s : stats)
    {
        Component c;
        c.label = s.label;
        c.pixel_count = s.count;
        c.bounding_box = {s.min_row, s.min_col, s.max_row, s.max_col};
        c.centroid = cv::Point2d(s.sum_col / s.count, s.sum_row / s.count);
        result.components.push_back(c);
    }

    return result;
}

LabelResult label(const Image &image, int connectivity)
{
    return label(image.mat(), connectivity);
}

cv::Mat labelMask(const LabelResult &result, int id)
{
    // creates a binary image where only pixels with matching label are white (on a black background)
    return result.labels == id;
}

} // namespace crackscan
