#include "../../include/page_layout.hpp"
#include <algorithm>
#include <utility>

namespace ming {

PageSpec compute_layout(const double page_width, const double page_height, const double margin,
                        const int img_w, const int img_h) {
    PageSpec spec;
    spec.image_width = img_w;
    spec.image_height = img_h;
    spec.orientation = orientation_for(img_w, img_h);

    spec.page_width = std::min(page_width, page_height);
    spec.page_height = std::max(page_width, page_height);
    if (spec.orientation == PageOrientation::Landscape) {
        std::swap(spec.page_width, spec.page_height);
    }

    const double max_w = spec.page_width - 2 * margin;
    const double max_h = spec.page_height - 2 * margin;
    const double ratio = std::min(max_w / img_w, max_h / img_h);

    spec.width = img_w * ratio;
    spec.height = img_h * ratio;
    spec.x = (spec.page_width - spec.width) / 2;
    spec.y = (spec.page_height - spec.height) / 2;
    return spec;
}

PageSpec compute_a4_layout(const int img_w, const int img_h) {
    return compute_layout(kA4WidthMm, kA4HeightMm, kPageMarginMm, img_w, img_h);
}

} // namespace ming
