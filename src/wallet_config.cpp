#include "wallet_config.hpp"
#include "logging.hpp"

namespace zeldwallet {

void to_json(nlohmann::json& j, const CustomPaths& paths) {
    j = nlohmann::json::object();
    if (paths.payment) {
        j["payment"] = *paths.payment;
    }
    if (paths.ordinals) {
        j["ordinals"] = *paths.ordinals;
    }
}

void from_json(const nlohmann::json& j, CustomPaths& paths) {
    if (j.contains("payment") && !j["payment"].is_null()) {
        paths.payment = j["payment"].get<std::string>();
    }
    if (j.contains("ordinals") && !j["ordinals"].is_null()) {
        paths.ordinals = j["ordinals"].get<std::string>();
    }
}

std::string WalletConfig::serialize() const {
    nlohmann::json j = {{"network", to_string(network)}};
    if (custom_paths && !custom_paths->empty()) {
        j["customPaths"] = *custom_paths;
    }
    return j.dump();
}

std::optional<WalletConfig> WalletConfig::parse(const std::string& text) {
    WalletConfig config;
    try {
        auto j = nlohmann::json::parse(text);
        auto network = network_from_string(j.at("network").get<std::string>());
        if (!network) {
            LogPrintWallet(WARN, "Stored config names an unknown network");
            return std::nullopt;
        }
        config.network = *network;
        if (j.contains("customPaths") && j["customPaths"].is_object()) {
            CustomPaths paths = j["customPaths"].get<CustomPaths>();
            if (!paths.empty()) {
                config.custom_paths = paths;
            }
        }
    } catch (const nlohmann::json::exception& e) {
        LogPrintWallet(WARN, "Ignoring malformed wallet config: %s", e.what());
        return std::nullopt;
    }
    return config;
}

} // namespace zeldwallet
