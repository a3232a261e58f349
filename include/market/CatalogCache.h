#pragma once

#include <condition_variable>
#include <memory>
#include <mutex>
#include <set>
#include <string>

#include "market/IMarketDataSource.h"

namespace coinlens {
namespace market {

// 거래쌍 카탈로그 캐시
// - 첫 호출 시 한 번만 로드 (single-flight: 동시 호출자는 진행 중인 로드 결과를 기다림)
// - 이후에는 네트워크 없이 메모이즈된 집합 반환
// - 로드 실패 시 빈 집합 (loadFailed() == true), refresh() 전까지 유지
class CatalogCache {
public:
    using Catalog = std::set<std::string>;

    explicit CatalogCache(std::shared_ptr<ICatalogSource> source);

    std::shared_ptr<const Catalog> getCatalog();

    // 명시적 재로드. 진행 중인 로드가 있으면 그 결과를 공유한다.
    std::shared_ptr<const Catalog> refresh();

    bool isPopulated() const;
    bool loadFailed() const;
    int fetchCount() const;

private:
    enum class State { EMPTY, LOADING, READY };

    std::shared_ptr<ICatalogSource> source_;
    mutable std::mutex mutex_;
    std::condition_variable cv_;
    State state_ = State::EMPTY;
    std::shared_ptr<const Catalog> catalog_;
    bool load_failed_ = false;
    int fetch_count_ = 0;
    unsigned long generation_ = 0;

    std::shared_ptr<const Catalog> populate(std::unique_lock<std::mutex>& lock);
};

} // namespace market
} // namespace coinlens
