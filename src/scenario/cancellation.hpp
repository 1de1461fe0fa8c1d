// =============================================================================
// CancellationToken — 処理パスの協調キャンセル
// =============================================================================
// コピーはフラグを共有する。cancel() は任意スレッドから呼べる。
// 処理側は安全点（条件チェック後・不一致イベント後）でのみ参照する。
// =============================================================================
#pragma once

#include <atomic>
#include <memory>

namespace autoscene {

class CancellationToken {
public:
    CancellationToken() : flag_(std::make_shared<std::atomic<bool>>(false)) {}

    void cancel() { flag_->store(true, std::memory_order_release); }
    void reset() { flag_->store(false, std::memory_order_release); }
    bool isCancelled() const { return flag_->load(std::memory_order_acquire); }

private:
    std::shared_ptr<std::atomic<bool>> flag_;
};

} // namespace autoscene
