#include "../../include/pdf_document_builder.hpp"
#include "../../include/errors.hpp"
#include "../../include/file_utils.hpp"
#include "../../include/logger.hpp"
#include <qpdf/Buffer.hh>
#include <qpdf/QPDF.hh>
#include <qpdf/QPDFLogger.hh>
#include <qpdf/QPDFObjectHandle.hh>
#include <qpdf/QPDFPageDocumentHelper.hh>
#include <qpdf/QPDFPageObjectHelper.hh>
#include <qpdf/QPDFWriter.hh>
#include <locale>
#include <sstream>
#include <stdexcept>

namespace {

// helper: custom streambuf to redirect qpdf messages into our logger
struct LoggerStreamBuf final : std::stringbuf {
    ming::LogLevel level;
    std::string module;
    LoggerStreamBuf(const ming::LogLevel lvl, const char* mod) : level(lvl), module(mod) {}
    int sync() override {
        std::string s = str();
        if (!s.empty()) {
            ming::Logger::log(level, s, module);
            str("");
        }
        return 0;
    }
    ~LoggerStreamBuf() override { LoggerStreamBuf::sync(); }
};

constexpr double kPointsPerMm = 72.0 / 25.4;

std::string format_number(const double v) {
    std::ostringstream oss;
    oss.imbue(std::locale::classic());
    oss.setf(std::ios::fixed);
    oss.precision(4);
    oss << v;
    return oss.str();
}

} // namespace

namespace ming {

struct PdfDocumentBuilder::Impl {
    LoggerStreamBuf warn_buf{LogLevel::Warning, "qpdf"};
    LoggerStreamBuf err_buf{LogLevel::Error, "qpdf"};
    std::ostream warn_os{&warn_buf};
    std::ostream err_os{&err_buf};

    QPDF pdf;
    QPDFObjectHandle current_page;
    double page_height_pt = 0;
    std::size_t pages = 0;
    int images_on_page = 0;
    std::string title;

    Impl() {
        auto qlogger = QPDFLogger::create();
        qlogger->setOutputStreams(&warn_os, &err_os);
        pdf.setLogger(qlogger);
        pdf.emptyPDF();
    }
};

PdfDocumentBuilder::PdfDocumentBuilder() : impl_(std::make_unique<Impl>()) {}
PdfDocumentBuilder::~PdfDocumentBuilder() = default;
PdfDocumentBuilder::PdfDocumentBuilder(PdfDocumentBuilder&&) noexcept = default;
PdfDocumentBuilder& PdfDocumentBuilder::operator=(PdfDocumentBuilder&&) noexcept = default;

void PdfDocumentBuilder::new_page(const PageOrientation orientation) {
    double w = kA4WidthMm * kPointsPerMm;
    double h = kA4HeightMm * kPointsPerMm;
    if (orientation == PageOrientation::Landscape) {
        std::swap(w, h);
    }

    QPDFObjectHandle page = impl_->pdf.makeIndirectObject(QPDFObjectHandle::newDictionary());
    page.replaceKey("/Type", QPDFObjectHandle::newName("/Page"));
    page.replaceKey("/MediaBox", QPDFObjectHandle::newFromRectangle(QPDFObjectHandle::Rectangle(0, 0, w, h)));
    page.replaceKey("/Resources",
                    QPDFObjectHandle::parse("<< /ProcSet [/PDF /ImageC] /XObject << >> >>"));

    QPDFPageDocumentHelper(impl_->pdf).addPage(QPDFPageObjectHelper(page), false);

    impl_->current_page = page;
    impl_->page_height_pt = h;
    impl_->images_on_page = 0;
    ++impl_->pages;
}

void PdfDocumentBuilder::place_image(const DecodedImage& image,
                                     const double x, const double y,
                                     const double w, const double h) {
    if (!impl_->current_page.isInitialized()) {
        throw std::logic_error("PdfDocumentBuilder::place_image called before new_page");
    }

    QPDF& pdf = impl_->pdf;
    QPDFObjectHandle xobject = QPDFObjectHandle::newStream(&pdf);
    QPDFObjectHandle dict = xobject.getDict();
    dict.replaceKey("/Type", QPDFObjectHandle::newName("/XObject"));
    dict.replaceKey("/Subtype", QPDFObjectHandle::newName("/Image"));
    dict.replaceKey("/Width", QPDFObjectHandle::newInteger(image.width));
    dict.replaceKey("/Height", QPDFObjectHandle::newInteger(image.height));
    dict.replaceKey("/ColorSpace", QPDFObjectHandle::newName("/DeviceRGB"));
    dict.replaceKey("/BitsPerComponent", QPDFObjectHandle::newInteger(8));
    xobject.replaceStreamData(
        std::string(reinterpret_cast<const char*>(image.jpeg.data()), image.jpeg.size()),
        QPDFObjectHandle::newName("/DCTDecode"),
        QPDFObjectHandle::newNull());

    const std::string name = "/Im" + std::to_string(++impl_->images_on_page);
    impl_->current_page.getKey("/Resources").getKey("/XObject").replaceKey(name, xobject);

    // pdf user space has its origin at the bottom-left corner
    const double w_pt = w * kPointsPerMm;
    const double h_pt = h * kPointsPerMm;
    const double x_pt = x * kPointsPerMm;
    const double y_pt = impl_->page_height_pt - (y * kPointsPerMm) - h_pt;

    const std::string content = "q " + format_number(w_pt) + " 0 0 " + format_number(h_pt) + " " +
                                format_number(x_pt) + " " + format_number(y_pt) + " cm " +
                                name + " Do Q\n";
    QPDFPageObjectHelper(impl_->current_page).addPageContents(QPDFObjectHandle::newStream(&pdf, content), false);
}

PageSpec PdfDocumentBuilder::add_image_page(const DecodedImage& image) {
    const PageSpec spec = compute_a4_layout(image.width, image.height);
    new_page(spec.orientation);
    place_image(image, spec.x, spec.y, spec.width, spec.height);
    return spec;
}

std::size_t PdfDocumentBuilder::page_count() const noexcept {
    return impl_->pages;
}

void PdfDocumentBuilder::set_title(const std::string& title) {
    impl_->title = title;
}

std::vector<unsigned char> PdfDocumentBuilder::serialize() {
    try {
        QPDFObjectHandle trailer = impl_->pdf.getTrailer();
        QPDFObjectHandle info = impl_->pdf.makeIndirectObject(QPDFObjectHandle::newDictionary());
        info.replaceKey("/Producer", QPDFObjectHandle::newString("ming"));
        info.replaceKey("/Creator", QPDFObjectHandle::newString("ming image to pdf converter"));
        if (!impl_->title.empty()) {
            info.replaceKey("/Title", QPDFObjectHandle::newUnicodeString(impl_->title));
        }
        trailer.replaceKey("/Info", info);

        QPDFWriter writer(impl_->pdf);
        writer.setOutputMemory();
        writer.setCompressStreams(true);
        writer.write();

        const std::shared_ptr<Buffer> buf = writer.getBufferSharedPointer();
        return {buf->getBuffer(), buf->getBuffer() + buf->getSize()};
    } catch (const std::exception& e) {
        Logger::log(LogLevel::Error, std::string("PDF serialization failed: ") + e.what(), "pdf_builder");
        throw WriteError(std::string("PDF serialization failed: ") + e.what());
    }
}

void PdfDocumentBuilder::write(const std::filesystem::path& path) {
    const auto bytes = serialize();
    write_file_durably(path, bytes);
    Logger::log(LogLevel::Debug,
                "Wrote " + std::to_string(bytes.size()) + " bytes, " + std::to_string(impl_->pages) +
                " page(s) to " + path.string(),
                "pdf_builder");
}

} // namespace ming
