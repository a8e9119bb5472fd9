#include "heatmap.hpp"
#include "errors.hpp"

#include <boost/filesystem.hpp>
#include <boost/format.hpp>

#include <algorithm>

namespace fs = boost::filesystem;

namespace pairwise_heatmap {

namespace {

const double PADDING = 8;
const double BASELINE_OFFSET = 0.35;
const size_t BAR_STEPS = 256;
const std::string BAR_TITLE = "Identity Percentage";

}

std::vector<double> colorBarTicks()
{
    std::vector<double> ticks;
    for(double v = SCALE_MIN; v <= SCALE_MAX + 1e-9; v += 5)
        ticks.push_back(v);
    return ticks;
}

HeatmapLayout layoutHeatmap(const std::vector<std::string>& labels,
                            const double width,
                            const double height)
{
    if(labels.empty())
        throw ReportError("Cannot draw a heatmap with no sequences");

    HeatmapLayout l;
    l.width = width;
    l.height = height;
    l.n = labels.size();
    l.tickLength = 3.5;
    l.labelSize = std::min(10.0, std::max(4.0, 0.6 * height / l.n));

    double labelWidth = 0;
    for(const std::string& s : labels)
        labelWidth = std::max(labelWidth, textWidth(s, l.labelSize));
    labelWidth = std::min(labelWidth, 0.35 * std::min(width, height));

    const double labelSpace = labelWidth + l.tickLength + 2;
    l.left = PADDING + labelSpace;
    l.top = 2 * PADDING;
    l.barWidth = 0.025 * width;

    const double barGap = 0.03 * width;
    const double rightReserve = barGap + l.barWidth + l.tickLength + 2
        + textWidth("100", l.labelSize) + 6 + l.labelSize + PADDING;
    const double axesRight = width - rightReserve;
    const double axesBottom = height - PADDING - labelSpace;

    l.cellWidth = (axesRight - l.left) / l.n;
    l.cellHeight = (axesBottom - l.top) / l.n;
    l.barLeft = axesRight + barGap;
    l.annotationSize = std::min(10.0, std::min(0.45 * l.cellHeight,
                                               0.9 * l.cellWidth / textWidth("100.0", 1)));
    return l;
}

void drawHeatmap(Canvas& canvas,
                 const Eigen::MatrixXd& matrix,
                 const std::vector<std::string>& labels,
                 const HeatmapLayout& l)
{
    if(static_cast<size_t>(matrix.rows()) != l.n || static_cast<size_t>(matrix.cols()) != l.n)
        throw ReportError("Matrix size does not match the number of labels");

    for(size_t i = 0; i < l.n; i++) {
        const double y = l.top + i * l.cellHeight;
        for(size_t j = 0; j < l.n; j++) {
            const double x = l.left + j * l.cellWidth;
            const Color fill = identityColor(matrix(i, j));
            canvas.fillRect(x, y, l.cellWidth, l.cellHeight, fill);
            canvas.text(x + l.cellWidth / 2, y + l.cellHeight / 2 + BASELINE_OFFSET * l.annotationSize,
                        (boost::format("%.1f") % matrix(i, j)).str(), l.annotationSize,
                        Anchor::Middle, false, annotationColor(fill));
        }
    }

    // Row labels, horizontal
    for(size_t i = 0; i < l.n; i++) {
        const double cy = l.top + (i + 0.5) * l.cellHeight;
        canvas.line(l.left - l.tickLength, cy, l.left, cy, 0.8, BLACK);
        canvas.text(l.left - l.tickLength - 2, cy + BASELINE_OFFSET * l.labelSize, labels[i],
                    l.labelSize, Anchor::End, false, BLACK);
    }

    // Column labels, rotated to read upwards
    for(size_t j = 0; j < l.n; j++) {
        const double cx = l.left + (j + 0.5) * l.cellWidth;
        canvas.line(cx, l.bottom(), cx, l.bottom() + l.tickLength, 0.8, BLACK);
        canvas.text(cx + BASELINE_OFFSET * l.labelSize, l.bottom() + l.tickLength + 2, labels[j],
                    l.labelSize, Anchor::End, true, BLACK);
    }

    // Colour bar, low values at the bottom
    const double barHeight = l.bottom() - l.top;
    const double step = barHeight / BAR_STEPS;
    for(size_t k = 0; k < BAR_STEPS; k++) {
        const double y = l.bottom() - (k + 1) * step;
        // Overlap strips slightly so rasterisers leave no seams
        canvas.fillRect(l.barLeft, y, l.barWidth, step * 1.5, coolwarm((k + 0.5) / BAR_STEPS));
    }

    const double tickLabelX = l.barRight() + l.tickLength + 2;
    for(const double v : colorBarTicks()) {
        const double y = l.bottom() - barHeight * (v - SCALE_MIN) / (SCALE_MAX - SCALE_MIN);
        canvas.line(l.barRight(), y, l.barRight() + l.tickLength, y, 0.8, BLACK);
        canvas.text(tickLabelX, y + BASELINE_OFFSET * l.labelSize, (boost::format("%g") % v).str(),
                    l.labelSize, Anchor::Start, false, BLACK);
    }
    canvas.text(tickLabelX + textWidth("100", l.labelSize) + 6 + l.labelSize, l.top + barHeight / 2,
                BAR_TITLE, l.labelSize, Anchor::Middle, true, BLACK);
}

std::vector<std::string> writeHeatmaps(const Eigen::MatrixXd& matrix,
                                       const std::vector<std::string>& labels,
                                       const std::string& outputDir,
                                       const std::vector<ImageFormat>& formats)
{
    const HeatmapLayout layout = layoutHeatmap(labels);
    std::vector<std::string> written;
    for(const ImageFormat format : formats) {
        const std::string path = (fs::path(outputDir) / ("heatmap." + extension(format))).string();
        std::unique_ptr<Canvas> canvas = makeCanvas(format, layout.width, layout.height);
        drawHeatmap(*canvas, matrix, labels, layout);
        canvas->save(path);
        written.push_back(path);
    }
    return written;
}

}
