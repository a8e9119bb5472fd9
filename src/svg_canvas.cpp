#include "canvas.hpp"
#include "errors.hpp"

#include <boost/format.hpp>

#include <fstream>

namespace pairwise_heatmap {

namespace {

std::string escapeXml(const std::string& s)
{
    std::string result;
    result.reserve(s.size());
    for(const char c : s) {
        switch(c) {
            case '&': result += "&amp;"; break;
            case '<': result += "&lt;"; break;
            case '>': result += "&gt;"; break;
            case '"': result += "&quot;"; break;
            case '\'': result += "&apos;"; break;
            default: result += c; break;
        }
    }
    return result;
}

const char* anchorName(const Anchor anchor)
{
    switch(anchor) {
        case Anchor::Start: return "start";
        case Anchor::Middle: return "middle";
        case Anchor::End: return "end";
    }
    return "start";
}

}

SvgCanvas::SvgCanvas(const double width, const double height) :
    Canvas(width, height)
{
}

void SvgCanvas::fillRect(const double x, const double y, const double w, const double h, const Color& color)
{
    body_ << boost::format("<rect x=\"%.2f\" y=\"%.2f\" width=\"%.2f\" height=\"%.2f\" fill=\"%s\"/>\n")
        % x % y % w % h % color.hex();
}

void SvgCanvas::line(const double x1, const double y1, const double x2, const double y2,
                     const double lineWidth, const Color& color)
{
    body_ << boost::format("<line x1=\"%.2f\" y1=\"%.2f\" x2=\"%.2f\" y2=\"%.2f\" stroke=\"%s\" stroke-width=\"%.2f\"/>\n")
        % x1 % y1 % x2 % y2 % color.hex() % lineWidth;
}

void SvgCanvas::text(const double x, const double y, const std::string& s, const double size,
                     const Anchor anchor, const bool vertical, const Color& color)
{
    body_ << boost::format("<text x=\"%.2f\" y=\"%.2f\" font-size=\"%.2f\" text-anchor=\"%s\" fill=\"%s\"")
        % x % y % size % anchorName(anchor) % color.hex();
    if(vertical)
        body_ << boost::format(" transform=\"rotate(-90 %.2f %.2f)\"") % x % y;
    body_ << '>' << escapeXml(s) << "</text>\n";
}

void SvgCanvas::write(std::ostream& out) const
{
    out << "<?xml version=\"1.0\" encoding=\"UTF-8\"?>\n"
        << boost::format("<svg xmlns=\"http://www.w3.org/2000/svg\" width=\"%.2fpt\" height=\"%.2fpt\" "
                         "viewBox=\"0 0 %.2f %.2f\" font-family=\"Helvetica, Arial, sans-serif\">\n")
           % width_ % height_ % width_ % height_
        << boost::format("<rect x=\"0\" y=\"0\" width=\"%.2f\" height=\"%.2f\" fill=\"%s\"/>\n")
           % width_ % height_ % WHITE.hex()
        << body_.str()
        << "</svg>\n";
}

void SvgCanvas::save(const std::string& path)
{
    std::ofstream out(path, std::ios::out | std::ios::binary);
    if(!out)
        throw ReportError("Cannot open " + path + " for writing");
    write(out);
    if(!out)
        throw ReportError("Failed writing " + path);
}

}
