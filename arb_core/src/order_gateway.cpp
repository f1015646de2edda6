#include "order_gateway.hpp"
#include <iostream>
#include <chrono>
#include <sstream>
#include <iomanip>
#include <utility>
#include <ixwebsocket/IXNetSystem.h>

std::string wire_decimal(double value, int decimals) {
    std::ostringstream ss;
    ss << std::fixed << std::setprecision(decimals) << value;
    std::string out = ss.str();
    if (out.find('.') != std::string::npos) {
        out.erase(out.find_last_not_of('0') + 1);
        if (out.back() == '.') out.pop_back();
    }
    if (out == "-0") out = "0";
    return out;
}

nlohmann::ordered_json order_action(const OrderRequest& request, int asset, int price_decimals, int size_decimals) {
    nlohmann::ordered_json order;
    order["a"] = asset;
    order["b"] = request.is_buy;
    order["p"] = wire_decimal(request.limit_price, price_decimals);
    order["s"] = wire_decimal(request.size, size_decimals);
    order["r"] = request.reduce_only;
    order["t"]["limit"]["tif"] = request.time_in_force == TimeInForce::IOC ? "Ioc" : "Gtc";

    nlohmann::ordered_json action;
    action["type"] = "order";
    action["orders"] = nlohmann::ordered_json::array({order});
    action["grouping"] = "na";
    return action;
}

static long long now_ms() {
    auto now = std::chrono::system_clock::now();
    return std::chrono::duration_cast<std::chrono::milliseconds>(now.time_since_epoch()).count();
}

OrderGateway::OrderGateway(GatewaySettings settings, std::shared_ptr<const IActionSigner> signer)
    : settings_(std::move(settings)), signer_(std::move(signer))
{
    ix::initNetSystem();

    webSocket.setUrl(settings_.url);
    webSocket.setPingInterval(settings_.ping_interval_s);

    webSocket.setOnMessageCallback([this](const ix::WebSocketMessagePtr& msg) {
        this->on_message(msg);
    });
}

OrderGateway::~OrderGateway() {
    stop();
    ix::uninitNetSystem();
}

void OrderGateway::connect() {
    std::cout << "[C++] OrderGateway connecting to " << settings_.url << "..." << std::endl;
    webSocket.start();
}

void OrderGateway::stop() {
    webSocket.stop();
}

bool OrderGateway::wait_ready(std::chrono::seconds timeout) {
    std::unique_lock<std::mutex> lock(pending_mutex_);
    return pending_cv_.wait_for(lock, timeout, [this] { return open_.load(); });
}

nlohmann::ordered_json OrderGateway::signed_payload(const nlohmann::ordered_json& action, long long nonce) const {
    if (!signer_) {
        throw GatewayError("cannot sign action, no signer configured");
    }

    nlohmann::ordered_json payload;
    payload["action"] = action;
    payload["nonce"] = nonce;
    try {
        payload["signature"] = signer_->sign_action(action, nonce);
    } catch (const SignerError& e) {
        throw GatewayError(std::string("signing failed: ") + e.what());
    }
    payload["vaultAddress"] = nullptr;
    return payload;
}

int OrderGateway::asset_for(const std::string& symbol) {
    {
        std::lock_guard<std::mutex> lock(assets_mutex_);
        auto it = assets_.find(symbol);
        if (it != assets_.end()) return it->second;
    }

    int asset = 0;
    if (is_spot_symbol(symbol)) {
        asset = symbol[0] == '@' ? parse_spot_asset(nlohmann::json::object(), symbol)
                                 : parse_spot_asset(info({{"type", "spotMeta"}}), symbol);
    } else {
        asset = parse_perp_asset(info({{"type", "meta"}}), symbol);
    }

    std::lock_guard<std::mutex> lock(assets_mutex_);
    assets_[symbol] = asset;
    return asset;
}

nlohmann::json OrderGateway::post(const std::string& type, const nlohmann::ordered_json& payload) {
    if (!open_) {
        throw GatewayError("trade stream not connected");
    }

    long long id = next_id_++;

    nlohmann::ordered_json msg;
    msg["method"] = "post";
    msg["id"] = id;
    msg["request"] = {{"type", type}, {"payload", payload}};

    {
        std::lock_guard<std::mutex> lock(pending_mutex_);
        waiting_.insert(id);
    }

    ix::WebSocketSendInfo sent = webSocket.send(msg.dump());
    if (!sent.success) {
        std::lock_guard<std::mutex> lock(pending_mutex_);
        waiting_.erase(id);
        throw GatewayError("send failed for request " + std::to_string(id));
    }

    std::unique_lock<std::mutex> lock(pending_mutex_);
    bool answered = pending_cv_.wait_for(lock, std::chrono::seconds(settings_.request_timeout_s), [&] {
        return responses_.count(id) > 0 || !open_;
    });

    waiting_.erase(id);
    auto it = responses_.find(id);
    if (it == responses_.end()) {
        throw GatewayError(answered ? "trade stream closed while waiting for request " + std::to_string(id)
                                    : "timeout waiting for request " + std::to_string(id));
    }

    nlohmann::json response = std::move(it->second);
    responses_.erase(it);

    if (response.contains("type") && response["type"] == "error") {
        throw GatewayError("exchange error: " + response.value("payload", nlohmann::json()).dump());
    }
    return response;
}

nlohmann::json OrderGateway::info(const nlohmann::ordered_json& request) {
    nlohmann::json response = post("info", request);
    const nlohmann::json& payload = response.at("payload");
    if (payload.is_object() && payload.contains("data")) {
        return payload["data"];
    }
    return payload;
}

Fill OrderGateway::place_order(const OrderRequest& request) {
    if (!signer_) {
        throw GatewayError("cannot send order, no signer configured");
    }

    int asset = asset_for(request.symbol);

    std::cout << "[C++] OrderGateway " << (request.is_buy ? "BUY " : "SELL ") << request.size
              << " " << request.symbol << " (asset " << asset << ") @ " << request.limit_price
              << (request.reduce_only ? " reduce-only" : "") << std::endl;

    nlohmann::ordered_json action = order_action(request, asset, settings_.price_decimals, settings_.size_decimals);
    nlohmann::json response = post("action", signed_payload(action, now_ms()));
    return parse_order_response(response.at("payload"), settings_.taker_fee_rate);
}

double OrderGateway::funding_rate(const std::string& perp_symbol) {
    return parse_funding_rate(info({{"type", "metaAndAssetCtxs"}}), perp_symbol);
}

double OrderGateway::available_margin() {
    return parse_available_margin(info({{"type", "clearinghouseState"}, {"user", settings_.account_address}}));
}

void OrderGateway::on_message(const ix::WebSocketMessagePtr& msg) {
    if (msg->type == ix::WebSocketMessageType::Open) {
        {
            std::lock_guard<std::mutex> lock(pending_mutex_);
            open_ = true;
        }
        pending_cv_.notify_all();
        std::cout << "[C++] Trade Stream Connected" << (signer_ ? "" : " (read-only)") << std::endl;
    }
    else if (msg->type == ix::WebSocketMessageType::Message) {
        nlohmann::json j = nlohmann::json::parse(msg->str, nullptr, false);
        if (j.is_discarded() || !j.is_object()) {
            std::cerr << "[C++] OrderGateway bad frame: " << msg->str << std::endl;
            return;
        }

        if (j.contains("channel") && j["channel"] == "post" && j.contains("data")) {
            const auto& data = j["data"];
            if (!data.contains("id") || !data["id"].is_number_integer() || !data.contains("response")) {
                std::cerr << "[C++] OrderGateway post frame without id: " << msg->str << std::endl;
                return;
            }
            long long id = data["id"].get<long long>();
            {
                std::lock_guard<std::mutex> lock(pending_mutex_);
                if (waiting_.count(id) == 0) return; // caller already gave up
                responses_[id] = data["response"];
            }
            pending_cv_.notify_all();
        }
    }
    else if (msg->type == ix::WebSocketMessageType::Close) {
        {
            std::lock_guard<std::mutex> lock(pending_mutex_);
            open_ = false;
        }
        pending_cv_.notify_all();
        std::cerr << "[C++] Trade Stream closed: " << msg->closeInfo.reason << std::endl;
    }
    else if (msg->type == ix::WebSocketMessageType::Error) {
        std::cerr << "[C++] OrderGateway WS Error: " << msg->errorInfo.reason << std::endl;
    }
}
