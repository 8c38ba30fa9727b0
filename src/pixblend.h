/**
 * @file pixblend.h
 * @brief Main header for pixblend - per-pixel blend mode compositing
 *
 * Include this header to use all pixblend functionality.
 *
 * @example
 * #include <pixblend.h>
 *
 * using namespace pixblend;
 *
 * // 2枚の画像を Multiply で合成
 * ImageBuffer dst(64, 64, PixelFormatIDs::RGBA16);
 * ImageBuffer src(Rect(16, 16, 80, 80), PixelFormatIDs::RGBA16);
 * composite::onto(dst.viewRef(), src.view(), BlendModeID::Multiply);
 */

#ifndef PIXBLEND_H
#define PIXBLEND_H

// Common definitions
#include "pixblend/core/common.h"
#include "pixblend/core/types.h"

// Color conversion
#include "pixblend/color/color.h"

// Image types
#include "pixblend/image/pixel_format.h"
#include "pixblend/image/viewport.h"
#include "pixblend/image/image_buffer.h"

// Blend modes and compositing
#include "pixblend/operations/channel_blend.h"
#include "pixblend/operations/blend_mode.h"
#include "pixblend/operations/composite.h"

#endif // PIXBLEND_H
