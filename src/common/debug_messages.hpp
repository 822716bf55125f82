#pragma once

// デバッグメッセージ統合ヘッダ
// 各ステージのメッセージを一括インクルード

#include "debug/conv.hpp"
#include "debug/walk.hpp"
#include "debug/xform.hpp"

// 使用例:
// debug::walk::log(debug::walk::Id::Candidate, path.string());
// debug::conv::log(debug::conv::Id::FilterRejected, token, debug::Level::Trace);
// debug::xform::log(debug::Stage::Clean, debug::xform::Id::LinesCleaned, "3");
