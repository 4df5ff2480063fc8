#pragma once

#include "ports/output/IEventPublisher.hpp"
#include "ports/output/IEventConsumer.hpp"
#include "settings/RabbitMQSettings.hpp"
#include <amqpcpp.h>
#include <amqpcpp/libboostasio.h>
#include <boost/asio.hpp>
#include <memory>
#include <thread>
#include <atomic>
#include <mutex>
#include <unordered_map>
#include <iostream>

namespace ledger::adapters::secondary {

/**
 * @brief RabbitMQ адаптер журнала
 *
 * Реализует IEventPublisher и IEventConsumer поверх одного topic exchange (ledger.events):
 * - слушает документы: sales.invoiced, purchase.approved, payment.recorded;
 * - публикует: journal.posted, journal.reversed.
 *
 * Очередь durable и именованная (RABBITMQ_QUEUE), чтобы события не терялись
 * между перезапусками. ack отправляется после того, как обработчик принял
 * событие (поставил задачу в JournalPostingQueue).
 *
 * subscribe() нужно вызвать до start(): привязки создаются при подключении.
 */
class RabbitMQAdapter : public ports::output::IEventPublisher,
                        public ports::output::IEventConsumer {
public:
    explicit RabbitMQAdapter(std::shared_ptr<settings::RabbitMQSettings> settings)
        : settings_(std::move(settings))
        , running_(false)
        , ready_(false)
        , ioContext_()
        , handler_(ioContext_)
    {
        exchangeName_ = settings_->getExchange();
        queueName_ = settings_->getQueue();
        std::cout << "[RabbitMQAdapter] Created for "
                  << settings_->getHost() << ":" << settings_->getPort()
                  << " exchange=" << exchangeName_ << " queue=" << queueName_ << std::endl;
    }

    ~RabbitMQAdapter() override {
        stop();
    }

    // =========================================================================
    // IEventPublisher
    // =========================================================================

    /**
     * @brief Опубликовать событие
     *
     * Вызывается из рабочих потоков движка, поэтому публикация
     * переносится в поток io_context.
     */
    void publish(const std::string& routingKey, const std::string& message) override {
        if (!running_ || !ready_) {
            std::cerr << "[RabbitMQAdapter] Cannot publish " << routingKey << ": not connected" << std::endl;
            return;
        }

        boost::asio::post(ioContext_, [this, routingKey, message]() {
            if (!channel_) return;
            channel_->publish(exchangeName_, routingKey, message);
            std::cout << "[RabbitMQAdapter] Published " << routingKey
                      << ": " << message.substr(0, 100) << "..." << std::endl;
        });
    }

    // =========================================================================
    // IEventConsumer
    // =========================================================================

    void subscribe(const std::vector<std::string>& routingKeys,
                   ports::output::EventHandler handler) override {
        std::lock_guard<std::mutex> lock(handlersMutex_);

        for (const auto& key : routingKeys) {
            handlers_[key].push_back(handler);
            pendingBindings_.push_back(key);
        }
    }

    void start() override {
        if (running_.exchange(true)) return;

        workerThread_ = std::thread([this]() {
            try {
                connect();
                ioContext_.run();
            } catch (const std::exception& e) {
                std::cerr << "[RabbitMQAdapter] Worker error: " << e.what() << std::endl;
            }
        });

        std::cout << "[RabbitMQAdapter] Started" << std::endl;
    }

    void stop() override {
        if (!running_.exchange(false)) return;

        ready_ = false;
        ioContext_.stop();

        if (workerThread_.joinable()) {
            workerThread_.join();
        }

        channel_.reset();
        connection_.reset();

        std::cout << "[RabbitMQAdapter] Stopped" << std::endl;
    }

private:
    void connect() {
        std::string connStr = "amqp://" + settings_->getUser() + ":" +
                              settings_->getPassword() + "@" +
                              settings_->getHost() + ":" +
                              std::to_string(settings_->getPort()) + "/";

        connection_ = std::make_unique<AMQP::TcpConnection>(&handler_,
            AMQP::Address(connStr));
        channel_ = std::make_unique<AMQP::TcpChannel>(connection_.get());

        channel_->onError([](const char* msg) {
            std::cerr << "[RabbitMQAdapter] Channel error: " << msg << std::endl;
        });

        channel_->declareExchange(exchangeName_, AMQP::topic, AMQP::durable)
            .onSuccess([this]() {
                std::cout << "[RabbitMQAdapter] Exchange declared: " << exchangeName_ << std::endl;
                ready_ = true;
                setupBindings();
            })
            .onError([](const char* msg) {
                std::cerr << "[RabbitMQAdapter] Exchange error: " << msg << std::endl;
            });
    }

    void setupBindings() {
        channel_->declareQueue(queueName_, AMQP::durable)
            .onSuccess([this](const std::string& name, uint32_t messages, uint32_t) {
                std::cout << "[RabbitMQAdapter] Queue declared: " << name
                          << " (" << messages << " pending)" << std::endl;

                std::lock_guard<std::mutex> lock(handlersMutex_);
                for (const auto& key : pendingBindings_) {
                    channel_->bindQueue(exchangeName_, queueName_, key);
                    std::cout << "[RabbitMQAdapter] Bound: " << key << std::endl;
                }
                pendingBindings_.clear();

                startConsuming();
            })
            .onError([](const char* msg) {
                std::cerr << "[RabbitMQAdapter] Queue error: " << msg << std::endl;
            });
    }

    void startConsuming() {
        channel_->consume(queueName_)
            .onReceived([this](const AMQP::Message& msg, uint64_t tag, bool) {
                std::string routingKey = msg.routingkey();
                std::string body(msg.body(), msg.bodySize());

                std::cout << "[RabbitMQAdapter] Received " << routingKey << std::endl;

                std::lock_guard<std::mutex> lock(handlersMutex_);
                auto it = handlers_.find(routingKey);
                if (it != handlers_.end()) {
                    for (const auto& handler : it->second) {
                        try {
                            handler(routingKey, body);
                        } catch (const std::exception& e) {
                            std::cerr << "[RabbitMQAdapter] Handler error: " << e.what() << std::endl;
                        }
                    }
                }

                channel_->ack(tag);
            })
            .onError([](const char* msg) {
                std::cerr << "[RabbitMQAdapter] Consume error: " << msg << std::endl;
            });
    }

    std::shared_ptr<settings::RabbitMQSettings> settings_;
    std::string exchangeName_;
    std::string queueName_;

    std::atomic<bool> running_;
    std::atomic<bool> ready_;
    boost::asio::io_context ioContext_;
    AMQP::LibBoostAsioHandler handler_;

    std::unique_ptr<AMQP::TcpConnection> connection_;
    std::unique_ptr<AMQP::TcpChannel> channel_;

    std::thread workerThread_;

    std::mutex handlersMutex_;
    std::unordered_map<std::string, std::vector<ports::output::EventHandler>> handlers_;
    std::vector<std::string> pendingBindings_;
};

} // namespace ledger::adapters::secondary
