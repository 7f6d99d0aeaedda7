#include "glider_api.h"
#include "glider_api_internal.hpp"
#include "glider_error.hpp"

#include <iostream>
#include <memory>
#include <stdexcept>
#include <utility>

static Rect to_rect(GliderRect area) {
    return {area.x0, area.y0, area.x1, area.y1};
}

// No exception may cross the C boundary
template <typename Fn>
static GliderResponse guarded(const char* what, Fn&& fn) {
    try {
        fn();
        return GLIDER_SUCCESS;
    } catch (const std::exception& e) {
        std::cerr << what << ": " << e.what() << std::endl;
        return GLIDER_FAILURE;
    }
}

template <typename Make>
static GliderResponse connect_handle(Make&& make, GliderDisplay** out) {
    if (!out) return GLIDER_FAILURE;
    *out = nullptr;
    return guarded("glider_create_display", [&] {
        std::unique_ptr<GliderDisplay> handle = make();
        handle->display.connect();
        *out = handle.release();
    });
}

GliderResponse glider_create_display(GliderDisplay** out) {
    return connect_handle([] {
        return std::make_unique<GliderDisplay>(TransportOptions{});
    }, out);
}

GliderResponse glider_create_display_with(std::unique_ptr<HidTransport> transport,
                                          GliderDisplay** out) {
    return connect_handle([&transport] {
        return std::make_unique<GliderDisplay>(std::move(transport));
    }, out);
}

void glider_destroy_display(GliderDisplay* display) {
    delete display;
}

GliderResponse glider_set_mode(GliderDisplay* display, GliderMode mode, GliderRect area) {
    if (!display) return GLIDER_FAILURE;
    return guarded("glider_set_mode", [&] {
        display->display.set_mode(mode_from_code(static_cast<int16_t>(mode)), to_rect(area));
    });
}

GliderResponse glider_redraw(GliderDisplay* display, GliderRect area) {
    if (!display) return GLIDER_FAILURE;
    return guarded("glider_redraw", [&] {
        display->display.redraw(to_rect(area));
    });
}
