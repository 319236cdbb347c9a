#include "default_wallet.hpp"

namespace zeldwallet {

std::mutex& DefaultWallet::mutex() {
    static std::mutex instance_mutex;
    return instance_mutex;
}

WalletOptions& DefaultWallet::options() {
    static WalletOptions default_options;
    return default_options;
}

std::unique_ptr<Wallet>& DefaultWallet::slot() {
    static std::unique_ptr<Wallet> wallet;
    return wallet;
}

void DefaultWallet::configure(WalletOptions wallet_options) {
    std::lock_guard<std::mutex> guard(mutex());
    options() = std::move(wallet_options);
}

Wallet& DefaultWallet::instance() {
    std::lock_guard<std::mutex> guard(mutex());
    auto& wallet = slot();
    if (!wallet) {
        wallet = std::make_unique<Wallet>(options());
    }
    return *wallet;
}

void DefaultWallet::reset() {
    std::lock_guard<std::mutex> guard(mutex());
    slot().reset();
}

} // namespace zeldwallet
