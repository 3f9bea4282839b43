#ifndef MIRAGE_COVER_FIT_HPP
#define MIRAGE_COVER_FIT_HPP

namespace mirage {

    // Placement of a source scaled to cover a target rectangle.
    // Offsets are <= 0: the overflow is cropped evenly on both sides.
    struct CoverDimensions {
        double width = 0;
        double height = 0;
        double x = 0;
        double y = 0;
    };

    // All four arguments must be positive; the caller guards zero sizes.
    CoverDimensions computeCoverDimensions(int srcWidth, int srcHeight,
                                           int targetWidth, int targetHeight);

}

#endif // MIRAGE_COVER_FIT_HPP
