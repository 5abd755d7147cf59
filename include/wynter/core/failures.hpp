#pragma once
#include <string>
#include <string_view>
namespace wynter::relay {
enum class SodiumFailureType {
    InitializationFailed,
    BufferTooSmall,
    BufferTooLarge,
    SecureWipeFailed,
    AllocationFailed,
    InvalidOperation
};
enum class RelayFailureType {
    EntropyUnavailable,
    InvalidKeyFormat,
    AuthenticationFailed,
    MalformedMessage,
    StaleEnvelope,
    MisroutedEnvelope,
    ReplayDetected,
    InvalidState,
    InvalidInput,
    DeriveKey,
    Encode,
    Transport
};
class SodiumFailure {
public:
    SodiumFailureType type;
    std::string message;
    SodiumFailure(const SodiumFailureType t, std::string msg)
        : type(t), message(std::move(msg)) {}
    static SodiumFailure InitializationFailed(std::string msg) {
        return {SodiumFailureType::InitializationFailed, std::move(msg)};
    }
    static SodiumFailure BufferTooSmall(std::string msg) {
        return {SodiumFailureType::BufferTooSmall, std::move(msg)};
    }
    static SodiumFailure BufferTooLarge(std::string msg) {
        return {SodiumFailureType::BufferTooLarge, std::move(msg)};
    }
    static SodiumFailure SecureWipeFailed(std::string msg) {
        return {SodiumFailureType::SecureWipeFailed, std::move(msg)};
    }
    static SodiumFailure AllocationFailed(std::string msg) {
        return {SodiumFailureType::AllocationFailed, std::move(msg)};
    }
    static SodiumFailure InvalidOperation(std::string msg) {
        return {SodiumFailureType::InvalidOperation, std::move(msg)};
    }
};
class RelayFailure {
public:
    RelayFailureType type;
    std::string message;
    RelayFailure(const RelayFailureType t, std::string msg)
        : type(t), message(std::move(msg)) {}
    static RelayFailure EntropyUnavailable(std::string msg) {
        return {RelayFailureType::EntropyUnavailable, std::move(msg)};
    }
    static RelayFailure InvalidKeyFormat(std::string msg) {
        return {RelayFailureType::InvalidKeyFormat, std::move(msg)};
    }
    static RelayFailure AuthenticationFailed(std::string msg) {
        return {RelayFailureType::AuthenticationFailed, std::move(msg)};
    }
    static RelayFailure MalformedMessage(std::string msg) {
        return {RelayFailureType::MalformedMessage, std::move(msg)};
    }
    static RelayFailure StaleEnvelope(std::string msg) {
        return {RelayFailureType::StaleEnvelope, std::move(msg)};
    }
    static RelayFailure MisroutedEnvelope(std::string msg) {
        return {RelayFailureType::MisroutedEnvelope, std::move(msg)};
    }
    static RelayFailure ReplayDetected(std::string msg) {
        return {RelayFailureType::ReplayDetected, std::move(msg)};
    }
    static RelayFailure InvalidState(std::string msg) {
        return {RelayFailureType::InvalidState, std::move(msg)};
    }
    static RelayFailure InvalidInput(std::string msg) {
        return {RelayFailureType::InvalidInput, std::move(msg)};
    }
    static RelayFailure DeriveKey(std::string msg) {
        return {RelayFailureType::DeriveKey, std::move(msg)};
    }
    static RelayFailure Encode(std::string msg) {
        return {RelayFailureType::Encode, std::move(msg)};
    }
    static RelayFailure Transport(std::string msg) {
        return {RelayFailureType::Transport, std::move(msg)};
    }
    /// Secure memory failures surface as EntropyUnavailable.
    static RelayFailure FromSodiumFailure(const SodiumFailure& sf) {
        return EntropyUnavailable(sf.message);
    }
};
[[nodiscard]] constexpr std::string_view ToString(const RelayFailureType type) noexcept {
    switch (type) {
        case RelayFailureType::EntropyUnavailable: return "EntropyUnavailable";
        case RelayFailureType::InvalidKeyFormat: return "InvalidKeyFormat";
        case RelayFailureType::AuthenticationFailed: return "AuthenticationFailed";
        case RelayFailureType::MalformedMessage: return "MalformedMessage";
        case RelayFailureType::StaleEnvelope: return "StaleEnvelope";
        case RelayFailureType::MisroutedEnvelope: return "MisroutedEnvelope";
        case RelayFailureType::ReplayDetected: return "ReplayDetected";
        case RelayFailureType::InvalidState: return "InvalidState";
        case RelayFailureType::InvalidInput: return "InvalidInput";
        case RelayFailureType::DeriveKey: return "DeriveKey";
        case RelayFailureType::Encode: return "Encode";
        case RelayFailureType::Transport: return "Transport";
    }
    return "Unknown";
}
}
