/**
 * @file common.h
 * @brief Common definitions for pixblend library
 */

#ifndef PIXBLEND_COMMON_H
#define PIXBLEND_COMMON_H

// Namespace definition (types.h より前に必要)
#ifndef PIXBLEND_NAMESPACE
#define PIXBLEND_NAMESPACE pixblend
#endif

#include "types.h"

// Version information
#define PIXBLEND_VERSION_MAJOR 1
#define PIXBLEND_VERSION_MINOR 0
#define PIXBLEND_VERSION_PATCH 0

// ========================================================================
// 内部不変条件チェック
// ========================================================================
//
// PIXBLEND_DEBUG 定義時のみ有効。入力値の検証には使わないこと
// （入力エラーは各関数の戻り値で通知する）。
//
#ifdef PIXBLEND_DEBUG
#include <cassert>
#define PIXBLEND_ASSERT(cond, msg) assert((cond) && (msg))
#else
#define PIXBLEND_ASSERT(cond, msg) ((void)0)
#endif

#endif // PIXBLEND_COMMON_H
