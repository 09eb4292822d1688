#pragma once

/**
 * @file onchain.hpp
 * @brief Authoritative on-chain bytecode CID per contract address
 */

#include "cverify/common.hpp"

#include <filesystem>
#include <map>
#include <mutex>
#include <string>

namespace cverify::onchain {

/**
 * @brief Indexer view of the chain (external collaborator)
 *
 * Error codes: "NotFound" when the address has no registered bytecode,
 * "InfrastructureError" when the indexer cannot be reached (retryable).
 */
class OnChainCidSource
{
public:
    virtual ~OnChainCidSource() = default;

    [[nodiscard]] virtual cverify::Result<std::string> fetch(const std::string& address) = 0;
};

/// JSON index file {"<address>": "<cid>", ...}, re-read on every fetch
class FileOnChainCidSource final : public OnChainCidSource
{
public:
    explicit FileOnChainCidSource(std::filesystem::path index_path);

    [[nodiscard]] cverify::Result<std::string> fetch(const std::string& address) override;

private:
    std::filesystem::path m_index_path;
};

/// Fixed address -> CID table, for tests and offline runs
class StaticOnChainCidSource final : public OnChainCidSource
{
public:
    void set(std::string address, std::string cid);

    [[nodiscard]] cverify::Result<std::string> fetch(const std::string& address) override;

private:
    std::mutex m_mutex;
    std::map<std::string, std::string> m_cids;
};

}  // namespace cverify::onchain
