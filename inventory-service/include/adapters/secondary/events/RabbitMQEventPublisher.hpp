// include/adapters/secondary/events/RabbitMQEventPublisher.hpp
#pragma once

#include "ports/output/IEventPublisher.hpp"
#include "settings/RabbitMQSettings.hpp"
#include <amqpcpp.h>
#include <amqpcpp/libboostasio.h>
#include <boost/asio.hpp>
#include <atomic>
#include <deque>
#include <iostream>
#include <memory>
#include <thread>
#include <utility>

namespace inventory::adapters::secondary {

/**
 * @brief Аудит-события движка в RabbitMQ
 *
 * Exchange: topic (inventory.events), durable.
 * Routing keys: stock.moved, stock.reserved, stock.released,
 * transfer.<status>, purchase_order.<status>, sales_order.<status>.
 *
 * Все обращения к AMQP идут из одного потока с io_context.
 * publish() только ставит задачу через boost::asio::post.
 *
 * Пока exchange не объявлен, события копятся в backlog
 * (не больше kMaxBacklog); после объявления backlog сбрасывается.
 * Сообщения уходят persistent (delivery mode 2), content-type application/json.
 */
class RabbitMQEventPublisher : public ports::output::IEventPublisher {
public:
    static constexpr size_t kMaxBacklog = 10000;

    explicit RabbitMQEventPublisher(std::shared_ptr<settings::RabbitMQSettings> settings)
        : settings_(std::move(settings))
        , exchange_(settings_->getExchange())
        , workGuard_(boost::asio::make_work_guard(io_))
        , amqpHandler_(io_)
    {
        ioThread_ = std::thread([this]() { runLoop(); });
        std::cout << "[RabbitMQEventPublisher] Audit bus "
                  << settings_->getHost() << ":" << settings_->getPort()
                  << " exchange=" << exchange_ << std::endl;
    }

    ~RabbitMQEventPublisher() override {
        shutdown();
    }

    void publish(const std::string& routingKey, const std::string& message) override {
        if (closed_) {
            ++dropped_;
            std::cerr << "[RabbitMQEventPublisher] Closed, dropped " << routingKey << std::endl;
            return;
        }
        boost::asio::post(io_, [this, routingKey, message]() {
            if (exchangeReady_) {
                send(routingKey, message);
            } else {
                enqueue(routingKey, message);
            }
        });
    }

    /**
     * @brief Остановить io-поток; события из backlog теряются
     */
    void shutdown() {
        if (closed_.exchange(true)) return;

        workGuard_.reset();
        io_.stop();
        if (ioThread_.joinable()) {
            ioThread_.join();
        }
        if (!backlog_.empty()) {
            dropped_ += backlog_.size();
            std::cerr << "[RabbitMQEventPublisher] " << backlog_.size()
                      << " events left unsent" << std::endl;
            backlog_.clear();
        }
        channel_.reset();
        connection_.reset();
        std::cout << "[RabbitMQEventPublisher] Closed, published=" << published_
                  << " dropped=" << dropped_ << std::endl;
    }

    size_t publishedCount() const { return published_; }
    size_t droppedCount() const { return dropped_; }

private:
    void runLoop() {
        try {
            open();
            io_.run();
        } catch (const std::exception& e) {
            std::cerr << "[RabbitMQEventPublisher] IO thread stopped: " << e.what() << std::endl;
        }
    }

    void open() {
        AMQP::Address address(settings_->getHost(),
                              static_cast<uint16_t>(settings_->getPort()),
                              AMQP::Login(settings_->getUser(), settings_->getPassword()),
                              settings_->getVhost());
        connection_ = std::make_unique<AMQP::TcpConnection>(&amqpHandler_, address);
        channel_ = std::make_unique<AMQP::TcpChannel>(connection_.get());

        channel_->onError([this](const char* reason) {
            exchangeReady_ = false;
            std::cerr << "[RabbitMQEventPublisher] Channel error: " << reason << std::endl;
        });

        channel_->declareExchange(exchange_, AMQP::topic, AMQP::durable)
            .onSuccess([this]() {
                exchangeReady_ = true;
                std::cout << "[RabbitMQEventPublisher] Exchange ready, flushing "
                          << backlog_.size() << " events" << std::endl;
                flush();
            })
            .onError([this](const char* reason) {
                std::cerr << "[RabbitMQEventPublisher] declareExchange " << exchange_
                          << ": " << reason << std::endl;
            });
    }

    // Только из io-потока
    void enqueue(const std::string& routingKey, const std::string& message) {
        if (backlog_.size() >= kMaxBacklog) {
            ++dropped_;
            std::cerr << "[RabbitMQEventPublisher] Backlog full, dropped " << routingKey << std::endl;
            return;
        }
        backlog_.emplace_back(routingKey, message);
    }

    void flush() {
        while (exchangeReady_ && channel_ && channel_->usable() && !backlog_.empty()) {
            auto [routingKey, message] = std::move(backlog_.front());
            backlog_.pop_front();
            send(routingKey, message);
        }
    }

    void send(const std::string& routingKey, const std::string& message) {
        if (!channel_ || !channel_->usable()) {
            enqueue(routingKey, message);
            return;
        }
        AMQP::Envelope envelope(message.data(), message.size());
        envelope.setDeliveryMode(2);
        envelope.setContentType("application/json");
        if (channel_->publish(exchange_, routingKey, envelope)) {
            ++published_;
        } else {
            ++dropped_;
            std::cerr << "[RabbitMQEventPublisher] publish " << routingKey << " rejected" << std::endl;
        }
    }

    std::shared_ptr<settings::RabbitMQSettings> settings_;
    std::string exchange_;

    boost::asio::io_context io_;
    boost::asio::executor_work_guard<boost::asio::io_context::executor_type> workGuard_;
    AMQP::LibBoostAsioHandler amqpHandler_;
    std::unique_ptr<AMQP::TcpConnection> connection_;
    std::unique_ptr<AMQP::TcpChannel> channel_;
    std::thread ioThread_;

    std::deque<std::pair<std::string, std::string>> backlog_;
    bool exchangeReady_ = false;

    std::atomic<bool> closed_{false};
    std::atomic<size_t> published_{0};
    std::atomic<size_t> dropped_{0};
};

} // namespace inventory::adapters::secondary
