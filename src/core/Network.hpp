#pragma once

#include <string>
#include <string_view>
#include <vector>
#include <memory>
#include <expected>
#include <unordered_map>
#include <cstdint>

#include "Errors.hpp"

using Bytes = std::vector<uint8_t>;

// One signature scheme plus one address encoding, selected by the `network` string.
class INetworkScheme {
  public:
    virtual ~INetworkScheme() = default;

    virtual std::string                      name() const = 0;

    // decodes the address into the key the signature verifies against
    virtual std::expected<Bytes, eAuthError> deriveVerifyingKey(const std::string& address) const = 0;

    // wire encoding -> raw signature bytes
    virtual std::expected<Bytes, eAuthError> decodeSignature(const std::string& signature) const = 0;

    // verifies over the exact bytes of message
    virtual bool                             verifySignature(const Bytes& key, const std::string& message, const Bytes& signature) const = 0;
};

// Solana: base58 Ed25519 public key, raw message signed, base58 signature.
class CSolanaScheme : public INetworkScheme {
  public:
    CSolanaScheme(const std::string& cluster);

    virtual std::string                      name() const override;
    virtual std::expected<Bytes, eAuthError> deriveVerifyingKey(const std::string& address) const override;
    virtual std::expected<Bytes, eAuthError> decodeSignature(const std::string& signature) const override;
    virtual bool                             verifySignature(const Bytes& key, const std::string& message, const Bytes& signature) const override;

  private:
    std::string m_cluster;
};

// Stellar: StrKey "G..." account id, SEP-53 message hash signed, base64 signature.
class CStellarScheme : public INetworkScheme {
  public:
    CStellarScheme(const std::string& network);

    virtual std::string                      name() const override;
    virtual std::expected<Bytes, eAuthError> deriveVerifyingKey(const std::string& address) const override;
    virtual std::expected<Bytes, eAuthError> decodeSignature(const std::string& signature) const override;
    virtual bool                             verifySignature(const Bytes& key, const std::string& message, const Bytes& signature) const override;

    static std::string                       encodeAddress(const Bytes& publicKey);
    static Bytes                             signedPayload(const std::string& message);

  private:
    std::string m_network;
};

class CNetworkRegistry {
  public:
    CNetworkRegistry() = default;

    void                     registerScheme(std::unique_ptr<INetworkScheme>&& scheme);

    // nullptr if the network is unknown or disabled
    const INetworkScheme*    get(const std::string& network) const;
    std::vector<std::string> supported() const;

    static std::vector<std::string>          knownNetworks();
    static std::unique_ptr<INetworkScheme>   makeScheme(const std::string& network);
    static std::shared_ptr<CNetworkRegistry> fromNames(const std::vector<std::string>& networks);

  private:
    std::unordered_map<std::string, std::unique_ptr<INetworkScheme>> m_schemes;
};
