#include "flagrun/scheduler.h"
#include "flagrun/settings.h"

#include <json/json.h>

#include <future>
#include <iostream>

namespace flagrun {

// ============================================================================
// SubmitHandler
// ============================================================================

SubmitHandler::SubmitHandler(const SchedulerConfig& config, MessagePublisher& publisher,
                             PendingResults& pending)
    : signature_key_(config.signature_key),
      settings_ttl_seconds_(config.settings_ttl_seconds),
      execution_timeout_(config.execution_timeout_seconds),
      task_queue_(config.broker.task_queue),
      publisher_(publisher),
      pending_(pending) {
    if (!config.encryption_key.empty()) {
        try {
            cipher_ = std::make_unique<FernetCipher>(config.encryption_key);
        } catch (const std::invalid_argument& e) {
            std::cerr << "[Scheduler] ENCRYPTION_KEY rejected: " << e.what() << std::endl;
        }
    }
}

HttpResponse SubmitHandler::handle(const HttpRequest& req) const {
    if (!keys_configured()) {
        return HttpResponse::error(500, "Server encryption and signature keys are not configured");
    }
    if (!publisher_.is_open()) {
        return HttpResponse::error(503, "Task queue is unavailable");
    }

    Json::Value body;
    if (!parse_json(req.body, body) || !body.isObject()) {
        return HttpResponse::error(400, "Request body must be a JSON object");
    }

    const Json::Value& code = body["code"];
    const Json::Value& language = body["language"];
    if (!code.isString() || code.asString().empty() ||
        !language.isString() || language.asString().empty()) {
        return HttpResponse::error(400, "Fields 'code' and 'language' must be non-empty strings");
    }

    TaskMessage task;
    task.code = code.asString();
    task.language = language.asString();

    const Json::Value& settings = body["settings"];
    if (!settings.isNull()) {
        if (!settings.isString()) {
            return HttpResponse::error(400, "Field 'settings' must be a string");
        }
        try {
            task.overrides = decrypt_settings(*cipher_, settings.asString(), settings_ttl_seconds_);
        } catch (const SettingsError& e) {
            switch (e.kind()) {
                case SettingsError::Kind::INVALID_TOKEN:
                    return HttpResponse::error(400, "Invalid settings token");
                case SettingsError::Kind::INVALID_JSON:
                    return HttpResponse::error(400, "Decrypted settings are not valid JSON");
                case SettingsError::Kind::NOT_AN_OBJECT:
                    return HttpResponse::error(400, "Decrypted settings must be a JSON object");
            }
            return HttpResponse::error(400, e.what());
        }
    }

    task.job_id = random_uuid();

    // Register before publishing so a fast result is never missed
    std::future<ResultMessage> result_future;
    try {
        result_future = pending_.insert(task.job_id);
    } catch (const CompletionCancelled&) {
        return HttpResponse::error(503, "Scheduler is shutting down");
    }
    try {
        publisher_.publish(task_queue_, task.to_json());
    } catch (const std::exception& e) {
        pending_.cancel(task.job_id);
        std::cerr << "[Scheduler] Job " << task.job_id << ": publish failed: " << e.what() << std::endl;
        return HttpResponse::error(503, "Failed to queue task");
    }
    std::cout << "[Scheduler] Job " << task.job_id << ": queued (" << task.language << ")" << std::endl;

    if (result_future.wait_for(execution_timeout_) != std::future_status::ready) {
        // A result may land between the timeout and the cancel
        if (pending_.cancel(task.job_id)) {
            std::cerr << "[Scheduler] Job " << task.job_id << ": no result after "
                      << execution_timeout_.count() << "s" << std::endl;
            return HttpResponse::error(504, "Execution timed out");
        }
    }

    ResultMessage result;
    try {
        result = result_future.get();
    } catch (const CompletionCancelled&) {
        std::cerr << "[Scheduler] Job " << task.job_id << ": abandoned at shutdown" << std::endl;
        return HttpResponse::error(503, "Scheduler is shutting down");
    }
    std::cout << "[Scheduler] Job " << task.job_id << ": " << result.status << std::endl;

    Json::Value out;
    out["flag"] = generate_flag(signature_key_, result.stdout_text.value_or(""));
    HttpResponse resp;
    resp.body = write_json(out);
    return resp;
}

// ============================================================================
// ResultConsumer
// ============================================================================

void ResultConsumer::handle(const Delivery& delivery, DeliveryAcknowledger& acker) const {
    try {
        ResultMessage result = ResultMessage::from_json(delivery.body);
        if (!result.job_id) {
            std::cerr << "[ResultConsumer] Dropping result without job_id (status "
                      << result.status << ")" << std::endl;
        } else if (!pending_.resolve(*result.job_id, result)) {
            std::cerr << "[ResultConsumer] Job " << *result.job_id
                      << ": no submission waiting, result dropped" << std::endl;
        }
    } catch (const MessageFormatError& e) {
        std::cerr << "[ResultConsumer] Dropping malformed result: " << e.what() << std::endl;
    }
    acker.ack(delivery.delivery_tag);
}

void ResultConsumer::run(const BrokerConfig& config, const std::atomic<bool>& stop) const {
    while (!stop) {
        AmqpConnection connection(config);
        try {
            retry_with_backoff("ResultConsumer", "Broker connection", config.connect_attempts,
                               [&] { connection.open(); }, &stop);
        } catch (const std::exception&) {
            if (!stop) {
                std::cerr << "[ResultConsumer] Broker still unreachable, continuing to retry" << std::endl;
            }
            continue;
        }

        try {
            auto channel = connection.open_channel();
            channel->declare_queue(config.results_queue, true);
            channel->consume(config.results_queue);
            std::cout << "[ResultConsumer] Consuming '" << config.results_queue << "'" << std::endl;

            while (!stop) {
                auto delivery = channel->next_delivery(std::chrono::milliseconds(500));
                if (delivery) {
                    handle(*delivery, *channel);
                }
            }
        } catch (const AmqpError& e) {
            if (!stop) {
                std::cerr << "[ResultConsumer] Broker connection lost: " << e.what()
                          << ", reconnecting" << std::endl;
            }
        }
    }
}

// ============================================================================
// BrokerPublisher
// ============================================================================

BrokerPublisher::BrokerPublisher(const BrokerConfig& config) : config_(config) {}

BrokerPublisher::~BrokerPublisher() {
    stop();
}

void BrokerPublisher::start() {
    stopping_ = false;
    supervisor_ = std::thread(&BrokerPublisher::supervise, this);
}

void BrokerPublisher::stop() {
    stopping_ = true;
    if (supervisor_.joinable()) {
        supervisor_.join();
    }
    std::lock_guard<std::mutex> lock(mutex_);
    session_.reset();
}

std::shared_ptr<BrokerPublisher::Session> BrokerPublisher::connect() const {
    auto session = std::make_shared<Session>();
    session->connection = std::make_unique<AmqpConnection>(config_);
    session->connection->open();
    session->channel = session->connection->open_channel();
    session->channel->declare_queue(config_.task_queue, true);
    session->channel->declare_queue(config_.results_queue, true);
    session->channel->enable_confirms();
    return session;
}

std::shared_ptr<BrokerPublisher::Session> BrokerPublisher::current() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return session_;
}

void BrokerPublisher::supervise() {
    while (!stopping_) {
        auto session = current();
        if (!session || !session->channel->is_open()) {
            if (session) {
                std::cerr << "[Scheduler] Task publisher lost its broker connection" << std::endl;
                std::lock_guard<std::mutex> lock(mutex_);
                session_.reset();
            }
            session.reset();

            std::shared_ptr<Session> fresh;
            try {
                retry_with_backoff("Scheduler", "Broker connection", config_.connect_attempts,
                                   [&] { fresh = connect(); }, &stopping_);
            } catch (const std::exception&) {
                if (!stopping_) {
                    std::cerr << "[Scheduler] Broker still unreachable, submissions get 503 "
                              << "until it is back" << std::endl;
                }
                continue;
            }

            std::lock_guard<std::mutex> lock(mutex_);
            session_ = fresh;
            std::cout << "[Scheduler] Task publisher connected" << std::endl;
        }
        std::this_thread::sleep_for(std::chrono::milliseconds(200));
    }
}

bool BrokerPublisher::is_open() const {
    auto session = current();
    return session && session->channel->is_open();
}

void BrokerPublisher::publish(const std::string& queue, const std::string& body) {
    auto session = current();
    if (!session || !session->channel->is_open()) {
        throw AmqpError("Broker is not connected");
    }
    session->channel->publish(queue, body);
}

// ============================================================================
// Scheduler
// ============================================================================

Scheduler::Scheduler(const SchedulerConfig& config)
    : config_(config),
      publisher_(config_.broker),
      handler_(config_, publisher_, pending_),
      consumer_(pending_),
      server_(config_.port) {
    server_.route("POST", "/submit", [this](const HttpRequest& req) {
        return handler_.handle(req);
    });

    server_.route("GET", "/health", [this](const HttpRequest&) {
        Json::Value health;
        health["status"] = "ok";
        health["broker"] = publisher_.is_open();
        health["pending"] = static_cast<Json::UInt64>(pending_.size());
        HttpResponse resp;
        resp.body = write_json(health);
        return resp;
    });
}

Scheduler::~Scheduler() {
    stop();
}

void Scheduler::run() {
    if (!handler_.keys_configured()) {
        std::cerr << "⚠️  ENCRYPTION_KEY or SIGNATURE_KEY missing or invalid: "
                  << "every submission will be answered with 500" << std::endl;
    }

    {
        std::lock_guard<std::mutex> lock(lifecycle_mutex_);
        if (stopping_) return;
        publisher_.start();
        consumer_thread_ = std::thread([this] { consumer_.run(config_.broker, stopping_); });
    }

    // Returns at once when stop() already ran
    server_.start();
}

void Scheduler::stop() {
    stopping_ = true;
    server_.stop();

    size_t abandoned = pending_.cancel_all("Scheduler is shutting down");
    if (abandoned > 0) {
        std::cout << "[Scheduler] Released " << abandoned << " waiting submission(s)" << std::endl;
    }

    std::lock_guard<std::mutex> lock(lifecycle_mutex_);
    publisher_.stop();
    if (consumer_thread_.joinable()) {
        consumer_thread_.join();
    }
}

} // namespace flagrun
