#ifndef PIXBLEND_OPERATIONS_COMPOSITE_H
#define PIXBLEND_OPERATIONS_COMPOSITE_H

#include "../core/common.h"
#include "../core/types.h"
#include "../image/viewport.h"
#include "../image/image_buffer.h"
#include "blend_mode.h"

namespace PIXBLEND_NAMESPACE {

// ========================================================================
// CompositeStatus - 合成結果
// ========================================================================
//
// 成功 = 0、エラー = 正の値。
// エラー時は画素を一切書き換えない（事前条件は走査前に全て確認する）。
// 共通部分が空の場合はエラーではなく Ok（何もしない / dst のコピー）。
//

enum class CompositeStatus : int {
    Ok = 0,                      // 成功
    IncompatibleColorModel = 1,  // dst と src のカラーモデル（フォーマット）が異なる
    InvalidImage = 2,            // 無効な画像（データなし、サイズ0）
    AllocationFailed = 3,        // 出力画像のメモリ確保に失敗
    InvalidBlendMode = 4,        // 範囲外の BlendModeID
};

// ステータスの説明文字列
const char* toString(CompositeStatus status);

inline bool isOk(CompositeStatus status) { return status == CompositeStatus::Ok; }

namespace composite {

// ========================================================================
// 画像合成（純関数）
// ========================================================================
//
// dst（下層）と src（上層）のバウンディング矩形の共通部分にのみ
// ブレンドモードを適用します。src が dst に完全に含まれている必要はありません。
//

// ------------------------------------------------------------------------
// onto - dst への直接合成（破壊的）
// ------------------------------------------------------------------------
//
// 共通部分のピクセルのみ上書きします。それ以外のピクセルには触れません。
// 呼び出し中、dst への排他的な書き込み権限が必要です。
//
CompositeStatus onto(ViewPort& dst, const ViewPort& src, const BlendMode& mode);
// 範囲外の ID は InvalidBlendMode（画素は変更しない）
CompositeStatus onto(ViewPort& dst, const ViewPort& src, BlendModeID mode);

// ------------------------------------------------------------------------
// toNewImage - 新規画像への合成（非破壊）
// ------------------------------------------------------------------------
//
// dst と同じバウンディング矩形・フォーマットの画像を out に生成します。
// 共通部分はブレンド結果、それ以外は dst のピクセルをそのままコピーします。
// dst / src は変更されません。エラー時 out は変更されません。
//
CompositeStatus toNewImage(ImageBuffer& out, const ViewPort& dst, const ViewPort& src,
                           const BlendMode& mode);
// 範囲外の ID は InvalidBlendMode（out は変更しない）
CompositeStatus toNewImage(ImageBuffer& out, const ViewPort& dst, const ViewPort& src,
                           BlendModeID mode);

} // namespace composite
} // namespace PIXBLEND_NAMESPACE

#endif // PIXBLEND_OPERATIONS_COMPOSITE_H
