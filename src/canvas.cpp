#include "canvas.hpp"
#include "errors.hpp"

#include <boost/algorithm/string/case_conv.hpp>

namespace pairwise_heatmap {

namespace {

// Helvetica advance widths (1/1000 em) for ' ' through '~'
const short HELVETICA_WIDTHS[] = {
    278, 278, 355, 556, 556, 889, 667, 191, 333, 333, 389, 584, 278, 333, 278, 278,
    556, 556, 556, 556, 556, 556, 556, 556, 556, 556, 278, 278, 584, 584, 584, 556,
    1015, 667, 667, 722, 722, 667, 611, 778, 722, 278, 500, 667, 556, 833, 722, 778,
    667, 778, 722, 667, 611, 722, 667, 944, 667, 667, 611, 278, 278, 278, 469, 556,
    333, 556, 556, 500, 556, 556, 278, 556, 556, 222, 222, 500, 222, 833, 556, 556,
    556, 556, 333, 500, 278, 556, 500, 722, 500, 500, 500, 334, 260, 334, 584
};

}

ImageFormat formatForName(const std::string& name)
{
    const std::string lower = boost::algorithm::to_lower_copy(name);
    if(lower == "pdf")
        return ImageFormat::PDF;
    else if(lower == "svg")
        return ImageFormat::SVG;
    throw ReportError("Unknown image format: " + name);
}

std::string extension(const ImageFormat format)
{
    switch(format) {
        case ImageFormat::PDF: return "pdf";
        case ImageFormat::SVG: return "svg";
    }
    return "";
}

double textWidth(const std::string& s, const double size)
{
    double units = 0;
    for(const char c : s) {
        const unsigned char u = static_cast<unsigned char>(c);
        if(u >= 32 && u <= 126)
            units += HELVETICA_WIDTHS[u - 32];
        else if((u & 0xC0) == 0x80)
            continue;   // UTF-8 continuation byte
        else
            units += 556;
    }
    return units * size / 1000.0;
}

std::unique_ptr<Canvas> makeCanvas(const ImageFormat format, const double width, const double height)
{
    using p = std::unique_ptr<Canvas>;
    switch(format) {
        case ImageFormat::PDF: return p(new PdfCanvas(width, height));
        case ImageFormat::SVG: return p(new SvgCanvas(width, height));
    }
    throw ReportError("Unsupported image format");
}

}
