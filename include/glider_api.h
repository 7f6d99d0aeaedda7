#pragma once

#include <stdint.h>

#ifdef __cplusplus
extern "C" {
#endif

/// Flat result for callers without exceptions
typedef enum GliderResponse {
    GLIDER_FAILURE = 0x00,
    GLIDER_SUCCESS = 0x55,
} GliderResponse;

/// Values are the firmware mode codes
typedef enum GliderMode {
    GLIDER_MODE_MANUAL_LUT_NO_DITHER = 0,
    GLIDER_MODE_MANUAL_LUT_ERROR_DIFFUSION = 1,
    GLIDER_MODE_FAST_MONO_NO_DITHER = 2,
    GLIDER_MODE_FAST_MONO_BAYER = 3,
    GLIDER_MODE_FAST_MONO_BLUE_NOISE = 4,
    GLIDER_MODE_FAST_GREY = 5,
    GLIDER_MODE_AUTO_NO_DITHER = 6,
    GLIDER_MODE_AUTO_ERROR_DIFFUSION = 7,
} GliderMode;

typedef struct GliderRect {
    int16_t x0;
    int16_t y0;
    int16_t x1;
    int16_t y1;
} GliderRect;

typedef struct GliderDisplay GliderDisplay;

/// Connect to the display. On success *out owns a handle for glider_destroy_display.
GliderResponse glider_create_display(GliderDisplay** out);

void glider_destroy_display(GliderDisplay* display);

/// Set the mode for a region. This always redraws the region.
GliderResponse glider_set_mode(GliderDisplay* display, GliderMode mode, GliderRect area);

/// Force a redraw of the region (black/white flash to clear ghosting)
GliderResponse glider_redraw(GliderDisplay* display, GliderRect area);

#ifdef __cplusplus
}
#endif
