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

namespace ledger::adapters::secondary {

/**
 * @brief Публикация событий транзакций в RabbitMQ
 *
 * Exchange ledger.events (topic), routing keys transaction.committed
 * и transaction.failed. Сообщения уходят persistent (deliveryMode 2),
 * content-type application/json.
 *
 * Канал AMQP-CPP живёт в одном потоке: publish() только ставит задачу
 * в io_context. Пока exchange не объявлен, события копятся в pending_
 * (не больше RABBITMQ_PENDING_LIMIT, старые вытесняются) и уходят
 * после onSuccess. Коммит в леджере от брокера не зависит.
 */
class RabbitMQAdapter : public ports::output::IEventPublisher {
public:
    explicit RabbitMQAdapter(std::shared_ptr<settings::RabbitMQSettings> settings)
        : settings_(std::move(settings))
        , workGuard_(boost::asio::make_work_guard(ioContext_))
        , asioHandler_(ioContext_)
    {
        std::cout << "[RabbitMQAdapter] Created for " << settings_->getHost() << ":" << settings_->getPort()
                  << " exchange=" << settings_->getExchange()
                  << " pendingLimit=" << settings_->getPendingLimit() << std::endl;
    }

    ~RabbitMQAdapter() override {
        stop();
    }

    void publish(const std::string& routingKey, const std::string& message) override {
        if (!running_) {
            std::cerr << "[RabbitMQAdapter] Not started, event " << routingKey << " dropped" << std::endl;
            return;
        }

        boost::asio::post(ioContext_, [this, routingKey, message]() {
            if (!exchangeReady_) {
                enqueue(routingKey, message);
                return;
            }
            send(routingKey, message);
        });
    }

    void start() {
        if (running_.exchange(true)) {
            return;
        }

        worker_ = std::thread([this]() {
            try {
                openChannel();
                ioContext_.run();
            } catch (const std::exception& e) {
                std::cerr << "[RabbitMQAdapter] Worker stopped: " << e.what() << std::endl;
            }
        });
        std::cout << "[RabbitMQAdapter] Started" << std::endl;
    }

    void stop() {
        if (!running_.exchange(false)) {
            return;
        }

        workGuard_.reset();
        ioContext_.stop();
        if (worker_.joinable()) {
            worker_.join();
        }

        if (!pending_.empty()) {
            std::cerr << "[RabbitMQAdapter] " << pending_.size()
                      << " events were not delivered before shutdown" << std::endl;
        }
        channel_.reset();
        connection_.reset();
        std::cout << "[RabbitMQAdapter] Stopped" << std::endl;
    }

private:
    using PendingEvent = std::pair<std::string, std::string>;

    void openChannel() {
        connection_ = std::make_unique<AMQP::TcpConnection>(
            &asioHandler_, AMQP::Address(settings_->getAddress()));
        channel_ = std::make_unique<AMQP::TcpChannel>(connection_.get());

        channel_->onError([this](const char* reason) {
            exchangeReady_ = false;
            std::cerr << "[RabbitMQAdapter] Channel error: " << reason << std::endl;
        });

        const std::string exchange = settings_->getExchange();
        channel_->declareExchange(exchange, AMQP::topic, AMQP::durable)
            .onSuccess([this, exchange]() {
                exchangeReady_ = true;
                std::cout << "[RabbitMQAdapter] Exchange " << exchange << " ready, flushing "
                          << pending_.size() << " pending events" << std::endl;
                flushPending();
            })
            .onError([exchange](const char* reason) {
                std::cerr << "[RabbitMQAdapter] Cannot declare " << exchange << ": " << reason << std::endl;
            });
    }

    void send(const std::string& routingKey, const std::string& message) {
        AMQP::Envelope envelope(message.data(), message.size());
        envelope.setContentType("application/json");
        envelope.setDeliveryMode(2);

        if (!channel_->publish(settings_->getExchange(), routingKey, envelope)) {
            std::cerr << "[RabbitMQAdapter] Channel refused " << routingKey << ", keeping it pending" << std::endl;
            enqueue(routingKey, message);
            return;
        }
        std::cout << "[RabbitMQAdapter] Published " << routingKey << " (" << message.size() << " bytes)" << std::endl;
    }

    void enqueue(const std::string& routingKey, const std::string& message) {
        if (pending_.size() >= settings_->getPendingLimit()) {
            std::cerr << "[RabbitMQAdapter] Pending buffer full, dropping oldest "
                      << pending_.front().first << std::endl;
            pending_.pop_front();
        }
        pending_.emplace_back(routingKey, message);
    }

    void flushPending() {
        std::deque<PendingEvent> batch;
        batch.swap(pending_);
        for (const auto& [routingKey, message] : batch) {
            send(routingKey, message);
        }
    }

    std::shared_ptr<settings::RabbitMQSettings> settings_;

    std::atomic<bool> running_{false};
    bool exchangeReady_ = false;

    boost::asio::io_context ioContext_;
    boost::asio::executor_work_guard<boost::asio::io_context::executor_type> workGuard_;
    AMQP::LibBoostAsioHandler asioHandler_;
    std::unique_ptr<AMQP::TcpConnection> connection_;
    std::unique_ptr<AMQP::TcpChannel> channel_;

    // Только из потока io_context (и из stop() после join)
    std::deque<PendingEvent> pending_;

    std::thread worker_;
};

} // namespace ledger::adapters::secondary
