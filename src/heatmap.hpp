#ifndef PAIRWISE_HEATMAP_HEATMAP_H
#define PAIRWISE_HEATMAP_HEATMAP_H

#include "canvas.hpp"

#include <Eigen/Dense>

#include <string>
#include <vector>

namespace pairwise_heatmap {

/// Geometry of an annotated heatmap figure, in points from the top left
struct HeatmapLayout {
    double width, height;
    /// Matrix area
    double left, top, cellWidth, cellHeight;
    /// Colour bar
    double barLeft, barWidth;
    double tickLength;
    double labelSize, annotationSize;
    size_t n;

    double right() const { return left + n * cellWidth; }
    double bottom() const { return top + n * cellHeight; }
    double barRight() const { return barLeft + barWidth; }
};

/// Tick values on the colour bar
std::vector<double> colorBarTicks();

/// \brief Compute the figure geometry for a matrix labelled with labels.
///
/// Default size is 10 x 8 inches.
/// \throws ReportError if labels is empty
HeatmapLayout layoutHeatmap(const std::vector<std::string>& labels,
                            const double width = 720,
                            const double height = 576);

/// Draw cells, cell annotations, axis labels and the colour bar
void drawHeatmap(Canvas& canvas,
                 const Eigen::MatrixXd& matrix,
                 const std::vector<std::string>& labels,
                 const HeatmapLayout& layout);

/// \brief Render the heatmap once per format into outputDir/heatmap.<ext>.
/// \return paths written, in the order of formats
std::vector<std::string> writeHeatmaps(const Eigen::MatrixXd& matrix,
                                       const std::vector<std::string>& labels,
                                       const std::string& outputDir,
                                       const std::vector<ImageFormat>& formats);

}

#endif
