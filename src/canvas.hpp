#ifndef PAIRWISE_HEATMAP_CANVAS_H
#define PAIRWISE_HEATMAP_CANVAS_H

#include "color_map.hpp"

#include <memory>
#include <sstream>
#include <string>

namespace pairwise_heatmap {

enum class ImageFormat { PDF, SVG };

/// Parse "pdf" or "svg" (case-insensitive)
/// \throws ReportError for anything else
ImageFormat formatForName(const std::string& name);
/// File extension without the dot
std::string extension(const ImageFormat format);

enum class Anchor { Start, Middle, End };

/// Advance width of s in Helvetica at the given size, in points
double textWidth(const std::string& s, const double size);

/// \brief A drawing surface measured in points, origin at the top left.
///
/// Text y coordinates are baselines. Vertical text reads bottom to top.
class Canvas
{
public:
    Canvas(const double width, const double height) : width_(width), height_(height) {}
    virtual ~Canvas() {}

    double width() const { return width_; }
    double height() const { return height_; }

    virtual void fillRect(const double x, const double y, const double w, const double h, const Color& color) = 0;
    virtual void line(const double x1, const double y1, const double x2, const double y2,
                      const double lineWidth, const Color& color) = 0;
    virtual void text(const double x, const double y, const std::string& s, const double size,
                      const Anchor anchor, const bool vertical, const Color& color) = 0;

    /// \throws ReportError if the file cannot be written
    virtual void save(const std::string& path) = 0;
protected:
    double width_, height_;
};

class SvgCanvas : public Canvas
{
public:
    SvgCanvas(const double width, const double height);

    void fillRect(const double x, const double y, const double w, const double h, const Color& color) override;
    void line(const double x1, const double y1, const double x2, const double y2,
              const double lineWidth, const Color& color) override;
    void text(const double x, const double y, const std::string& s, const double size,
              const Anchor anchor, const bool vertical, const Color& color) override;
    void save(const std::string& path) override;

    void write(std::ostream& out) const;
private:
    std::ostringstream body_;
};

/// Single-page PDF using the standard Helvetica font
class PdfCanvas : public Canvas
{
public:
    PdfCanvas(const double width, const double height);

    void fillRect(const double x, const double y, const double w, const double h, const Color& color) override;
    void line(const double x1, const double y1, const double x2, const double y2,
              const double lineWidth, const Color& color) override;
    void text(const double x, const double y, const std::string& s, const double size,
              const Anchor anchor, const bool vertical, const Color& color) override;
    void save(const std::string& path) override;

    void write(std::ostream& out) const;
private:
    std::ostringstream content_;
};

std::unique_ptr<Canvas> makeCanvas(const ImageFormat format, const double width, const double height);

}

#endif
