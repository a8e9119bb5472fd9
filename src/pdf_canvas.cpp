#include "canvas.hpp"
#include "errors.hpp"

#include <boost/format.hpp>

#include <fstream>
#include <vector>

namespace pairwise_heatmap {

namespace {

/// Literal string operand in WinAnsiEncoding. UTF-8 input in the Latin-1
/// range is kept; other characters become '?'.
std::string pdfString(const std::string& s)
{
    std::string result = "(";
    for(size_t i = 0; i < s.size(); i++) {
        const unsigned char u = static_cast<unsigned char>(s[i]);
        if(u < 0x80) {
            if(s[i] == '(' || s[i] == ')' || s[i] == '\\') {
                result += '\\';
                result += s[i];
            } else if(u < 32 || u == 127) {
                result += '?';
            } else {
                result += s[i];
            }
            continue;
        }

        size_t length = 1;
        if((u & 0xE0) == 0xC0)
            length = 2;
        else if((u & 0xF0) == 0xE0)
            length = 3;
        else if((u & 0xF8) == 0xF0)
            length = 4;

        unsigned int codePoint = 0;
        bool valid = length == 2 && i + 1 < s.size() && (static_cast<unsigned char>(s[i + 1]) & 0xC0) == 0x80;
        if(valid)
            codePoint = ((u & 0x1F) << 6) | (static_cast<unsigned char>(s[i + 1]) & 0x3F);
        if(valid && codePoint >= 0xA0)
            result += (boost::format("\\%03o") % codePoint).str();
        else
            result += '?';

        // Skip the rest of the sequence
        for(size_t k = 1; k < length && i + 1 < s.size()
                && (static_cast<unsigned char>(s[i + 1]) & 0xC0) == 0x80; k++)
            i++;
    }
    return result + ")";
}

std::string rgb(const Color& c)
{
    return (boost::format("%.4f %.4f %.4f") % (c.r / 255.0) % (c.g / 255.0) % (c.b / 255.0)).str();
}

}

PdfCanvas::PdfCanvas(const double width, const double height) :
    Canvas(width, height)
{
}

void PdfCanvas::fillRect(const double x, const double y, const double w, const double h, const Color& color)
{
    content_ << rgb(color) << " rg\n"
             << boost::format("%.2f %.2f %.2f %.2f re f\n") % x % (height_ - y - h) % w % h;
}

void PdfCanvas::line(const double x1, const double y1, const double x2, const double y2,
                     const double lineWidth, const Color& color)
{
    content_ << rgb(color) << " RG\n"
             << boost::format("%.2f w %.2f %.2f m %.2f %.2f l S\n")
                % lineWidth % x1 % (height_ - y1) % x2 % (height_ - y2);
}

void PdfCanvas::text(const double x, const double y, const std::string& s, const double size,
                     const Anchor anchor, const bool vertical, const Color& color)
{
    double shift = 0;
    if(anchor == Anchor::Middle)
        shift = textWidth(s, size) / 2;
    else if(anchor == Anchor::End)
        shift = textWidth(s, size);

    content_ << "BT\n" << rgb(color) << " rg\n"
             << boost::format("/F1 %.2f Tf\n") % size;
    if(vertical)
        content_ << boost::format("0 1 -1 0 %.2f %.2f Tm\n") % x % (height_ - y - shift);
    else
        content_ << boost::format("1 0 0 1 %.2f %.2f Tm\n") % (x - shift) % (height_ - y);
    content_ << pdfString(s) << " Tj\nET\n";
}

void PdfCanvas::write(std::ostream& out) const
{
    const std::string content = content_.str();
    std::vector<std::string> objects {
        "<< /Type /Catalog /Pages 2 0 R >>",
        "<< /Type /Pages /Kids [3 0 R] /Count 1 >>",
        (boost::format("<< /Type /Page /Parent 2 0 R /MediaBox [0 0 %.2f %.2f] "
                       "/Resources << /Font << /F1 5 0 R >> >> /Contents 4 0 R >>") % width_ % height_).str(),
        (boost::format("<< /Length %d >>\nstream\n") % content.size()).str() + content + "endstream",
        "<< /Type /Font /Subtype /Type1 /BaseFont /Helvetica /Encoding /WinAnsiEncoding >>"
    };

    std::ostringstream doc;
    doc << "%PDF-1.4\n";
    std::vector<size_t> offsets;
    for(size_t i = 0; i < objects.size(); i++) {
        offsets.push_back(doc.str().size());
        doc << i + 1 << " 0 obj\n" << objects[i] << "\nendobj\n";
    }

    const size_t xref = doc.str().size();
    doc << "xref\n0 " << objects.size() + 1 << '\n'
        << "0000000000 65535 f \n";
    for(const size_t offset : offsets)
        doc << boost::format("%010d 00000 n \n") % offset;
    doc << "trailer\n<< /Size " << objects.size() + 1 << " /Root 1 0 R >>\n"
        << "startxref\n" << xref << "\n%%EOF\n";

    out << doc.str();
}

void PdfCanvas::save(const std::string& path)
{
    std::ofstream out(path, std::ios::out | std::ios::binary);
    if(!out)
        throw ReportError("Cannot open " + path + " for writing");
    write(out);
    if(!out)
        throw ReportError("Failed writing " + path);
}

}
