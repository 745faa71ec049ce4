/**
 * @file page_layout.hpp
 * @brief Page orientation and image placement for one image per page.
 */

#ifndef MING_PAGE_LAYOUT_HPP
#define MING_PAGE_LAYOUT_HPP

namespace ming {

enum class PageOrientation {
    Portrait,
    Landscape
};

/// A4 portrait width in millimetres.
inline constexpr double kA4WidthMm = 210.0;
/// A4 portrait height in millimetres.
inline constexpr double kA4HeightMm = 297.0;
/// Blank border kept around every image, in millimetres.
inline constexpr double kPageMarginMm = 10.0;

/**
 * @brief Geometry of one page. Lengths share the unit of the page size
 * passed to compute_layout (millimetres for A4); x/y are measured from
 * the top-left corner of the page.
 */
struct PageSpec {
    int image_width = 0;   ///< source pixels
    int image_height = 0;  ///< source pixels
    PageOrientation orientation = PageOrientation::Portrait;
    double page_width = 0;  ///< oriented page width
    double page_height = 0; ///< oriented page height
    double x = 0;
    double y = 0;
    double width = 0;   ///< scaled image width
    double height = 0;  ///< scaled image height
};

/**
 * @brief Orientation of a page holding an image of the given size.
 * Landscape iff img_w > img_h; square images are portrait.
 */
[[nodiscard]] constexpr PageOrientation orientation_for(const int img_w, const int img_h) noexcept {
    return img_w > img_h ? PageOrientation::Landscape : PageOrientation::Portrait;
}

/**
 * @brief Computes orientation, scale and centered placement.
 *
 * @param page_width Portrait page width.
 * @param page_height Portrait page height.
 * @param margin Border on every side.
 * @param img_w Image width in pixels, > 0.
 * @param img_h Image height in pixels, > 0.
 *
 * The page is swapped to landscape when the image is wider than tall. The
 * image is scaled by min((W-2m)/img_w, (H-2m)/img_h) on the oriented page,
 * which keeps the aspect ratio and may upscale small images, then centered.
 */
[[nodiscard]] PageSpec compute_layout(double page_width, double page_height, double margin,
                                      int img_w, int img_h);

/**
 * @brief compute_layout on an A4 page with the standard margin.
 */
[[nodiscard]] PageSpec compute_a4_layout(int img_w, int img_h);

} // namespace ming

#endif // MING_PAGE_LAYOUT_HPP
