// zeldwallet command-line tool
//
// A thin front end over the Wallet session: every invocation opens the
// wallet file, unlocks it when the command needs keys, performs one
// operation and exits. The wallet file is the JSON document written by
// FileStorageBackend; a passwordless wallet keeps its device key next to it
// in "<file>.key".
//
// Usage:
//   zeldwallet [--wallet <file>] [--testnet] [--password <pw>]
//              [--passphrase <bip39 passphrase>] [--log-level <level>]
//              <command> [arguments]
//
// Commands:
//   create                                   new wallet, prints the mnemonic
//   restore <mnemonic>                       wallet from an existing mnemonic
//   addresses                                payment and ordinals addresses
//   sign-message <address> <message> [ecdsa|bip322-simple]
//   sign-psbt <base64> <index>[:<path>]... [--finalize]
//   export-backup <backup-password>
//   import-backup <backup> <backup-password> [--overwrite]
//   set-network <mainnet|testnet>
//   destroy

#include "logging.hpp"
#include "wallet.hpp"
#include <algorithm>
#include <iostream>
#include <optional>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>

namespace {

constexpr auto DEFAULT_WALLET_FILE = "zeldwallet.json";

struct CliOptions {
    std::string wallet_file = DEFAULT_WALLET_FILE;
    bool testnet = false;
    std::optional<std::string> password;
    std::optional<std::string> passphrase;
    bool finalize = false;
    bool overwrite = false;
    std::vector<std::string> args;
};

void print_usage() {
    std::cerr << "Usage: zeldwallet [--wallet <file>] [--testnet] [--password <pw>]\n"
              << "                  [--passphrase <pp>] [--log-level error|warn|info|debug]\n"
              << "                  <command> [arguments]\n\n"
              << "Commands:\n"
              << "  create\n"
              << "  restore <mnemonic>\n"
              << "  addresses\n"
              << "  sign-message <address> <message> [ecdsa|bip322-simple]\n"
              << "  sign-psbt <base64> <index>[:<path>]... [--finalize]\n"
              << "  export-backup <backup-password>\n"
              << "  import-backup <backup> <backup-password> [--overwrite]\n"
              << "  set-network <mainnet|testnet>\n"
              << "  destroy\n";
}

std::string require_value(int argc, char* argv[], int& i, const std::string& flag) {
    if (i + 1 >= argc) {
        throw std::invalid_argument(flag + " needs a value");
    }
    return argv[++i];
}

CliOptions parse_args(int argc, char* argv[]) {
    CliOptions options;
    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];
        if (arg == "--wallet") {
            options.wallet_file = require_value(argc, argv, i, arg);
        } else if (arg == "--testnet") {
            options.testnet = true;
        } else if (arg == "--password") {
            options.password = require_value(argc, argv, i, arg);
        } else if (arg == "--passphrase") {
            options.passphrase = require_value(argc, argv, i, arg);
        } else if (arg == "--log-level") {
            std::string name = require_value(argc, argv, i, arg);
            zeldwallet::LogLevel level;
            if (!zeldwallet::Logger::parse_level(name, level)) {
                throw std::invalid_argument("Unknown log level " + name);
            }
            zeldwallet::Logger::instance().set_level(level);
        } else if (arg == "--finalize") {
            options.finalize = true;
        } else if (arg == "--overwrite") {
            options.overwrite = true;
        } else {
            options.args.push_back(arg);
        }
    }
    return options;
}

void expect_args(const CliOptions& options, size_t min, size_t max) {
    size_t count = options.args.size() - 1;
    if (count < min || count > max) {
        throw std::invalid_argument("Wrong number of arguments for " + options.args[0]);
    }
}

nlohmann::json addresses_json(const std::vector<zeldwallet::AddressInfo>& addresses) {
    nlohmann::json out = nlohmann::json::array();
    for (const auto& info : addresses) {
        out.push_back({
            {"purpose", zeldwallet::to_string(info.purpose)},
            {"addressType", zeldwallet::to_string(info.address_type)},
            {"address", info.address},
            {"publicKey", info.public_key},
            {"derivationPath", info.derivation_path}
        });
    }
    return out;
}

// "<index>" or "<index>:<path>"
zeldwallet::SignInputRequest parse_input_request(const std::string& arg, bool finalize) {
    zeldwallet::SignInputRequest request;
    auto colon = arg.find(':');
    std::string index = arg.substr(0, colon);
    size_t consumed = 0;
    unsigned long value = std::stoul(index, &consumed);
    if (consumed != index.size()) {
        throw std::invalid_argument("Bad input index " + index);
    }
    request.index = value;
    if (colon != std::string::npos) {
        request.derivation_path = arg.substr(colon + 1);
    }
    request.finalize = finalize;
    return request;
}

const std::vector<zeldwallet::AddressPurpose> ALL_PURPOSES = {
    zeldwallet::AddressPurpose::Payment,
    zeldwallet::AddressPurpose::Ordinals
};

const std::vector<std::string> UNLOCKED_COMMANDS = {
    "addresses", "sign-message", "sign-psbt", "export-backup", "set-network"
};

int run(const CliOptions& options) {
    zeldwallet::WalletOptions wallet_options;
    wallet_options.wallet_file = options.wallet_file;
    wallet_options.network = options.testnet ? zeldwallet::Network::Testnet : zeldwallet::Network::Mainnet;
    zeldwallet::Wallet wallet(std::move(wallet_options));

    const std::string& command = options.args[0];

    if (command == "create") {
        expect_args(options, 0, 0);
        std::string mnemonic = wallet.create(options.password, options.passphrase);
        std::cout << "Write down this mnemonic and keep it offline:" << std::endl;
        std::cout << mnemonic << std::endl;
        zeldwallet::secure_wipe(mnemonic);
        std::cout << addresses_json(wallet.get_addresses(ALL_PURPOSES)).dump(2) << std::endl;
        return 0;
    }

    if (command == "restore") {
        expect_args(options, 1, 1);
        wallet.restore(options.args[1], options.password, options.passphrase);
        wallet.mark_backup_completed();
        std::cout << addresses_json(wallet.get_addresses(ALL_PURPOSES)).dump(2) << std::endl;
        return 0;
    }

    if (command == "import-backup") {
        expect_args(options, 2, 2);
        if (!options.password) {
            throw std::invalid_argument("import-backup needs --password for the new wallet");
        }
        wallet.import_backup(options.args[1], options.args[2], *options.password,
                             zeldwallet::ImportBackupOptions{options.overwrite});
        std::cout << addresses_json(wallet.get_addresses(ALL_PURPOSES)).dump(2) << std::endl;
        return 0;
    }

    if (command == "destroy") {
        expect_args(options, 0, 0);
        wallet.destroy();
        std::cout << "Wallet destroyed" << std::endl;
        return 0;
    }

    // Everything else works on an existing wallet
    if (std::find(UNLOCKED_COMMANDS.begin(), UNLOCKED_COMMANDS.end(), command) == UNLOCKED_COMMANDS.end()) {
        print_usage();
        return 2;
    }
    wallet.unlock(options.password, options.passphrase);

    if (command == "addresses") {
        expect_args(options, 0, 0);
        std::cout << addresses_json(wallet.get_addresses(ALL_PURPOSES)).dump(2) << std::endl;
    } else if (command == "sign-message") {
        expect_args(options, 2, 3);
        std::optional<zeldwallet::MessageProtocol> protocol;
        if (options.args.size() == 4) {
            protocol = zeldwallet::message_protocol_from_string(options.args[3]);
            if (!protocol) {
                throw std::invalid_argument("Unknown protocol " + options.args[3]);
            }
        }
        std::cout << wallet.sign_message(options.args[2], options.args[1], protocol) << std::endl;
    } else if (command == "sign-psbt") {
        if (options.args.size() < 3) {
            throw std::invalid_argument("sign-psbt needs a PSBT and at least one input");
        }
        std::vector<zeldwallet::SignInputRequest> requests;
        for (size_t i = 2; i < options.args.size(); ++i) {
            requests.push_back(parse_input_request(options.args[i], options.finalize));
        }
        std::cout << wallet.sign_psbt(options.args[1], requests) << std::endl;
    } else if (command == "export-backup") {
        expect_args(options, 1, 1);
        std::cout << wallet.export_backup(options.args[1]) << std::endl;
    } else if (command == "set-network") {
        expect_args(options, 1, 1);
        auto network = zeldwallet::network_from_string(options.args[1]);
        if (!network) {
            throw std::invalid_argument("Unknown network " + options.args[1]);
        }
        wallet.set_network(*network);
        std::cout << "Network set to " << zeldwallet::to_string(*network) << std::endl;
    }

    wallet.lock();
    return 0;
}

} // namespace

int main(int argc, char* argv[]) {
    try {
        CliOptions options = parse_args(argc, argv);
        if (options.args.empty()) {
            print_usage();
            return 2;
        }
        return run(options);
    } catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << std::endl;
        return 1;
    }
}
