#pragma once

#include "Types.hpp"

namespace DnD::Config {

#ifdef DND_LIST_MARGIN
static constexpr floating list_margin = DND_LIST_MARGIN;
#else
static constexpr floating list_margin = 4.0F;
#endif

#ifdef DND_MARKER_THICKNESS
static constexpr floating marker_thickness = DND_MARKER_THICKNESS;
#else
static constexpr floating marker_thickness = 2.0F;
#endif

#ifdef DND_PREVIEW_ALPHA
static constexpr floating preview_alpha = DND_PREVIEW_ALPHA;
#else
static constexpr floating preview_alpha = 0.85F;
#endif

#ifdef DND_DRAW_DROP_PREVIEW
static constexpr bool draw_drop_preview = DND_DRAW_DROP_PREVIEW;
#else
static constexpr bool draw_drop_preview = true;
#endif

#ifdef DND_STORE_IDLE_FRAMES
static constexpr i32 store_idle_frames = DND_STORE_IDLE_FRAMES;
#else
static constexpr i32 store_idle_frames = 120;
#endif

#ifdef DND_MIN_IMAGE_COUNT
static constexpr u32 min_image_count = DND_MIN_IMAGE_COUNT;
#else
static constexpr u32 min_image_count = 2;
#endif

#ifdef DND_WINDOW_WIDTH
static constexpr u32 window_width = DND_WINDOW_WIDTH;
#else
static constexpr u32 window_width = 1280;
#endif

#ifdef DND_WINDOW_HEIGHT
static constexpr u32 window_height = DND_WINDOW_HEIGHT;
#else
static constexpr u32 window_height = 720;
#endif

} // namespace DnD::Config
