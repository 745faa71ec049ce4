/**
 * @file pdf_document_builder.hpp
 * @brief Accumulates image pages into one PDF document (qpdf).
 */

#ifndef MING_PDF_DOCUMENT_BUILDER_HPP
#define MING_PDF_DOCUMENT_BUILDER_HPP

#include "image_codec.hpp"
#include "page_layout.hpp"
#include <cstddef>
#include <filesystem>
#include <memory>
#include <string>
#include <vector>

namespace ming {

/**
 * @brief Builds a single PDF with one placed JPEG per page.
 *
 * @details Pages are A4 in the requested orientation. Coordinates passed to
 * place_image() are millimetres from the top-left corner, the same system
 * compute_a4_layout() produces; the builder converts them to PDF points.
 * JPEG data is embedded as-is with /DCTDecode.
 *
 * One instance corresponds to exactly one output document. qpdf types are
 * hidden behind a PIMPL.
 */
class PdfDocumentBuilder {
public:
    PdfDocumentBuilder();
    ~PdfDocumentBuilder();

    PdfDocumentBuilder(const PdfDocumentBuilder&) = delete;
    PdfDocumentBuilder& operator=(const PdfDocumentBuilder&) = delete;
    PdfDocumentBuilder(PdfDocumentBuilder&&) noexcept;
    PdfDocumentBuilder& operator=(PdfDocumentBuilder&&) noexcept;

    /**
     * @brief Append an A4 page in the given orientation; it becomes current.
     */
    void new_page(PageOrientation orientation);

    /**
     * @brief Draw a JPEG into the current page.
     * @param image Encoded image and its pixel size.
     * @param x Left edge, mm from the page's left side.
     * @param y Top edge, mm from the page's top side.
     * @param w Drawn width in mm.
     * @param h Drawn height in mm.
     * @throws std::logic_error if no page has been added yet.
     */
    void place_image(const DecodedImage& image, double x, double y, double w, double h);

    /**
     * @brief Convenience: compute_a4_layout + new_page + place_image.
     * @return The layout used for the page.
     */
    PageSpec add_image_page(const DecodedImage& image);

    /// Number of pages added so far.
    [[nodiscard]] std::size_t page_count() const noexcept;

    /// Sets the document /Title entry.
    void set_title(const std::string& title);

    /**
     * @brief Serialize the document.
     * @throws WriteError if qpdf fails.
     */
    [[nodiscard]] std::vector<unsigned char> serialize();

    /**
     * @brief Serialize and durably write the document to @p path.
     * @throws WriteError on serialization or I/O failure.
     */
    void write(const std::filesystem::path& path);

private:
    struct Impl;
    std::unique_ptr<Impl> impl_;
};

} // namespace ming

#endif // MING_PDF_DOCUMENT_BUILDER_HPP
