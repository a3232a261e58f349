#include "market/CatalogCache.h"
#include "common/Logger.h"

namespace coinlens {
namespace market {

CatalogCache::CatalogCache(std::shared_ptr<ICatalogSource> source)
    : source_(std::move(source))
    , catalog_(std::make_shared<const Catalog>())
{
}

std::shared_ptr<const CatalogCache::Catalog> CatalogCache::getCatalog() {
    std::unique_lock<std::mutex> lock(mutex_);

    if (state_ == State::READY) {
        return catalog_;
    }
    return populate(lock);
}

std::shared_ptr<const CatalogCache::Catalog> CatalogCache::refresh() {
    std::unique_lock<std::mutex> lock(mutex_);
    LOG_INFO("Catalog refresh requested ({})", source_->name());
    if (state_ == State::READY) {
        state_ = State::EMPTY;
    }
    return populate(lock);
}

bool CatalogCache::isPopulated() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return state_ == State::READY;
}

bool CatalogCache::loadFailed() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return load_failed_;
}

int CatalogCache::fetchCount() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return fetch_count_;
}

std::shared_ptr<const CatalogCache::Catalog> CatalogCache::populate(std::unique_lock<std::mutex>& lock) {
    if (state_ == State::LOADING) {
        const auto waiting_for = generation_;
        cv_.wait(lock, [&] { return state_ == State::READY || generation_ != waiting_for; });
        return catalog_;
    }

    state_ = State::LOADING;
    fetch_count_++;

    // 네트워크 호출 중에는 락을 풀어서 다른 호출자가 LOADING 상태를 보고 대기하게 함
    lock.unlock();
    std::optional<Catalog> loaded;
    try {
        loaded = source_->fetchCatalog();
    } catch (const std::exception& e) {
        LOG_ERROR("Error getting catalog from {}: {}", source_->name(), e.what());
    }
    lock.lock();

    if (loaded) {
        catalog_ = std::make_shared<const Catalog>(std::move(*loaded));
        load_failed_ = false;
        LOG_INFO("Catalog loaded from {}: {} identifiers", source_->name(), catalog_->size());
    } else {
        catalog_ = std::make_shared<const Catalog>();
        load_failed_ = true;
        LOG_WARN("Catalog unavailable from {}, symbol normalization disabled", source_->name());
    }

    state_ = State::READY;
    generation_++;
    cv_.notify_all();
    return catalog_;
}

} // namespace market
} // namespace coinlens
