#pragma once

#include "ports/output/IEventPublisher.hpp"
#include <atomic>
#include <iostream>
#include <mutex>

namespace inventory::adapters::secondary {

/**
 * @brief Публикация аудит-событий в stdout
 *
 * Используется по умолчанию (INVENTORY_AUDIT_SINK=log).
 */
class LoggingEventPublisher : public ports::output::IEventPublisher {
public:
    void publish(const std::string& routingKey, const std::string& message) override {
        std::lock_guard<std::mutex> lock(mutex_);
        ++published_;
        std::cout << "[Audit] " << routingKey << " " << message << std::endl;
    }

    size_t publishedCount() const {
        return published_.load();
    }

private:
    std::mutex mutex_;
    std::atomic<size_t> published_{0};
};

} // namespace inventory::adapters::secondary
