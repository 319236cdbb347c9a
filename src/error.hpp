#pragma once

#include <stdexcept>
#include <string>

namespace zeldwallet {

// Errors raised by the derivation engine (seed handling, BIP32 paths,
// address construction and reverse lookup).
class KeyError : public std::runtime_error {
public:
    enum class ErrorType {
        WalletLocked,
        InvalidSeedPhrase,
        DerivedInvalidPublicKey,
        UnsupportedDerivationPurpose,
        InvalidDerivationPath,
        InvalidLookupConfig,
        InvalidAddress,
        DerivationFailure
    };

    KeyError(ErrorType type, const std::string& message = "")
        : std::runtime_error(message.empty() ? "Key error" : message)
        , type_(type)
    {}

    ErrorType type() const { return type_; }

private:
    ErrorType type_;
};

// Errors raised while producing message signatures or signing PSBTs.
class SigningError : public std::runtime_error {
public:
    enum class ErrorType {
        AddressNotFound,
        CannotDetermineScript,
        TaprootScriptPathUnsupported,
        TaprootMultiSighashUnsupported,
        PsbtInputMismatch,
        TaprootRequiresBip322,
        Bip322RequiresTaproot,
        SighashNotAllowed,
        InvalidPsbt,
        InputNotFound,
        SigningFailure
    };

    SigningError(ErrorType type, const std::string& message = "")
        : std::runtime_error(message.empty() ? "Signing error" : message)
        , type_(type)
    {}

    ErrorType type() const { return type_; }

private:
    ErrorType type_;
};

// Errors raised by the encrypted store and the backup envelope codec.
class StorageError : public std::runtime_error {
public:
    enum class ErrorType {
        PasswordRequired,
        WrongPassword,
        DecryptionFailed,
        BackupIntegrityFailure,
        BackupFormatInvalid,
        BackupRequiresPassword,
        NoWallet,
        WalletExists,
        PasswordAlreadySet,
        PasswordNotSet,
        StorageClosed,
        StorageFailure
    };

    StorageError(ErrorType type, const std::string& message = "")
        : std::runtime_error(message.empty() ? "Storage error" : message)
        , type_(type)
    {}

    ErrorType type() const { return type_; }

private:
    ErrorType type_;
};

// Errors raised by the wallet session layer.
class WalletError : public std::runtime_error {
public:
    enum class ErrorType {
        WalletLocked,
        WalletBusy,
        WeakPassword,
        PassphraseMismatch,
        NetworkPersistFailure,
        InvalidArgument
    };

    WalletError(ErrorType type, const std::string& message = "")
        : std::runtime_error(message.empty() ? "Wallet error" : message)
        , type_(type)
    {}

    ErrorType type() const { return type_; }

private:
    ErrorType type_;
};

} // namespace zeldwallet
