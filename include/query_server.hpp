#ifndef QUERY_SERVER_HPP
#define QUERY_SERVER_HPP

#include "json_codec.hpp"
#include "prediction_service.hpp"
#include <boost/asio/ip/tcp.hpp>
#include <boost/beast/core.hpp>
#include <boost/beast/websocket.hpp>
#include <nlohmann/json.hpp>
#include <boost/asio/post.hpp>
#include <atomic>
#include <functional>
#include <iostream>
#include <memory>
#include <mutex>
#include <optional>
#include <stdexcept>
#include <string>
#include <thread>

namespace matchcast {

namespace beast = boost::beast;
namespace websocket = beast::websocket;
namespace net = boost::asio;
using tcp = net::ip::tcp;

// ============================================================================
// Query Handler (JSON command -> service call -> JSON reply)
// ============================================================================
// Request:  {"command": "...", ...arguments}
// Reply:    {"command": "...", "result": ...}
//        or {"command": "...", "error": "<ErrorCode>", "message": "..."}

class QueryHandler {
public:
    explicit QueryHandler(PredictionService& service) : service_(service) {}

    std::string handle(const std::string& message) {
        json request = json::parse(message, nullptr, false);
        if (request.is_discarded() || !request.is_object()) {
            return error_reply("", "BadRequest", "message is not a JSON object").dump();
        }
        return handle(request).dump();
    }

    json handle(const json& request) {
        const std::string cmd = request.value("command", "");
        try {
            return json{{"command", cmd}, {"result", dispatch(cmd, request)}};
        } catch (const PredictionError& e) {
            return error_reply(cmd, to_string(e.code()), e.what());
        } catch (const json::exception& e) {
            return error_reply(cmd, "BadRequest", e.what());
        } catch (const std::invalid_argument& e) {
            return error_reply(cmd, "BadRequest", e.what());
        } catch (const std::exception& e) {
            std::cerr << "query handler: " << cmd << " failed: " << e.what() << "\n";
            return error_reply(cmd, "Internal", e.what());
        }
    }

    // Handles the message on the service's request pool and hands the reply
    // to on_reply from a pool thread
    void handle_async(std::string message, std::function<void(std::string)> on_reply) {
        service_.post([this, message = std::move(message), on_reply = std::move(on_reply)]() {
            on_reply(handle(message));
        });
    }

private:
    json dispatch(const std::string& cmd, const json& req) {
        if (cmd == "get_market_probabilities") {
            return service_.get_market_probabilities(req.at("fixture_id").get<std::string>(),
                                                     req.at("device_id").get<std::string>());
        }
        if (cmd == "get_arbitrage_opportunities") {
            std::optional<FixtureId> fixture;
            if (req.contains("fixture_id") && !req.at("fixture_id").is_null()) {
                fixture = req.at("fixture_id").get<std::string>();
            }
            return service_.get_arbitrage_opportunities(fixture);
        }
        if (cmd == "compare_odds") {
            auto cmp = service_.compare_odds(req.at("fixture_id").get<std::string>(),
                                             req.value("market", std::string("1X2")));
            return cmp ? json(*cmp) : json(nullptr);
        }
        if (cmd == "upsert_quote") {
            return service_.upsert_quote(quote_from_json(req, matchcast::now()));
        }
        if (cmd == "promote_model") {
            return service_.promote_model(req.at("version_id").get<ModelVersionId>());
        }
        if (cmd == "promote_model_if") {
            auto promoted = service_.promote_model_if(req.at("version_id").get<ModelVersionId>(),
                                                      req.at("expected_revision").get<uint64_t>());
            return json{{"applied", promoted.has_value()},
                        {"model", promoted ? json(*promoted) : json(nullptr)},
                        {"revision", service_.registry_revision()}};
        }
        if (cmd == "get_registry_revision") {
            return service_.registry_revision();
        }
        if (cmd == "rollback_model") {
            return service_.rollback_model(req.value("name", service_.config().model_name));
        }
        if (cmd == "get_active_model") {
            return service_.get_active_model(req.value("name", service_.config().model_name));
        }
        if (cmd == "set_canary") {
            service_.set_canary(req.at("version_id").get<ModelVersionId>(),
                                req.at("percentage").get<double>());
            return true;
        }
        if (cmd == "set_canary_percentage") {
            service_.set_canary_percentage(req.at("percentage").get<double>());
            return true;
        }
        if (cmd == "clear_canary") {
            service_.clear_canary();
            return true;
        }
        if (cmd == "get_daily_calibration") {
            return service_.get_daily_calibration(req.at("version_id").get<ModelVersionId>(),
                                                  req.at("from_day").get<DayIndex>(),
                                                  req.at("to_day").get<DayIndex>());
        }
        if (cmd == "settle") {
            auto outcome = parse_outcome(req.at("outcome").get<std::string>());
            if (!outcome) {
                throw PredictionError(ErrorCode::InvalidSignal, "outcome must be H, D or A");
            }
            return service_.settle(req.at("fixture_id").get<std::string>(), *outcome);
        }
        if (cmd == "get_metrics") {
            json j = service_.metrics().snapshot();
            j["history"] = service_.metrics().get_recent_snapshots(req.value("history", size_t{0}));
            return j;
        }
        throw std::invalid_argument("unknown command '" + cmd + "'");
    }

    static json error_reply(const std::string& cmd, const std::string& code, const std::string& message) {
        return json{{"command", cmd}, {"error", code}, {"message", message}};
    }

    PredictionService& service_;
};

// ============================================================================
// WebSocket session for each connected client
// ============================================================================
class QuerySession : public std::enable_shared_from_this<QuerySession> {
public:
    QuerySession(tcp::socket socket, QueryHandler& handler)
        : ws_(std::move(socket)), handler_(handler) {}

    void run() {
        ws_.async_accept([self = shared_from_this()](beast::error_code ec) {
            if (!ec) {
                self->read_message();
            }
        });
    }

private:
    void read_message() {
        ws_.async_read(
            buffer_,
            [self = shared_from_this()](beast::error_code ec, std::size_t) {
                if (ec) {
                    if (ec != websocket::error::closed) {
                        std::cerr << "query session: " << ec.message() << "\n";
                    }
                    return;
                }
                self->handle_message();
            }
        );
    }

    void handle_message() {
        std::string msg = beast::buffers_to_string(buffer_.data());
        buffer_.consume(buffer_.size());

        // Requests run on the service pool; the write goes back through the
        // session's executor. One reply in flight per session, the next read
        // starts after the write.
        handler_.handle_async(std::move(msg), [self = shared_from_this()](std::string reply) {
            net::post(self->ws_.get_executor(),
                      [self, reply = std::make_shared<std::string>(std::move(reply))]() {
                          self->write_reply(reply);
                      });
        });
    }

    void write_reply(const std::shared_ptr<std::string>& reply) {
        ws_.text(true);
        ws_.async_write(
            net::buffer(*reply),
            [self = shared_from_this(), reply](beast::error_code ec, std::size_t) {
                if (ec) {
                    std::cerr << "query session: write failed: " << ec.message() << "\n";
                    return;
                }
                self->read_message();
            }
        );
    }

    websocket::stream<tcp::socket> ws_;
    QueryHandler& handler_;
    beast::flat_buffer buffer_;
};

// ============================================================================
// WebSocket query server
// ============================================================================
class QueryServer {
public:
    QueryServer(PredictionService& service, int port = 8090)
        : handler_(service),
          ioc_(),
          acceptor_(ioc_, tcp::endpoint(tcp::v4(), static_cast<unsigned short>(port))),
          running_(false) {}

    ~QueryServer() {
        stop();
    }

    void start() {
        if (running_.exchange(true, std::memory_order_acq_rel)) {
            return;
        }
        server_thread_ = std::thread([this]() {
            accept_connection();
            ioc_.run();
        });

        std::cout << "Query server listening on ws://0.0.0.0:"
                  << acceptor_.local_endpoint().port() << std::endl;
    }

    void stop() {
        if (!running_.exchange(false, std::memory_order_acq_rel)) {
            return;
        }
        ioc_.stop();
        if (server_thread_.joinable()) server_thread_.join();
    }

    unsigned short port() const { return acceptor_.local_endpoint().port(); }

    QueryHandler& handler() { return handler_; }

private:
    void accept_connection() {
        acceptor_.async_accept([this](beast::error_code ec, tcp::socket socket) {
            if (!ec) {
                std::make_shared<QuerySession>(std::move(socket), handler_)->run();
            } else {
                std::cerr << "query server: accept failed: " << ec.message() << "\n";
            }

            if (running_.load(std::memory_order_acquire)) {
                accept_connection();
            }
        });
    }

    QueryHandler handler_;
    net::io_context ioc_;
    tcp::acceptor acceptor_;
    std::atomic<bool> running_;
    std::thread server_thread_;
};

} // namespace matchcast

#endif // QUERY_SERVER_HPP
