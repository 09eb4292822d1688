/**
 * @file onchain.cpp
 * @brief On-chain CID sources
 */

#include "cverify/onchain.hpp"

#include <format>
#include <fstream>
#include <utility>

#include <nlohmann/json.hpp>

namespace cverify::onchain {

FileOnChainCidSource::FileOnChainCidSource(std::filesystem::path index_path)
    : m_index_path(std::move(index_path))
{}

cverify::Result<std::string> FileOnChainCidSource::fetch(const std::string& address)
{
    std::ifstream in(m_index_path);
    if (!in) {
        return std::unexpected(
            Error::make("InfrastructureError", "On-chain index unavailable: " + m_index_path.string()));
    }
    nlohmann::json index;
    try {
        in >> index;
    } catch (const std::exception& ex) {
        return std::unexpected(Error::make(
            "InfrastructureError",
            std::format("Failed to parse on-chain index {}: {}", m_index_path.string(), ex.what())));
    }
    if (!index.is_object()) {
        return std::unexpected(
            Error::make("InfrastructureError", "On-chain index is not an object: " + m_index_path.string()));
    }
    auto it = index.find(address);
    if (it == index.end() || !it->is_string()) {
        return std::unexpected(Error::make("NotFound", "No bytecode registered on-chain for " + address));
    }
    return it->get<std::string>();
}

void StaticOnChainCidSource::set(std::string address, std::string cid)
{
    std::lock_guard lock(m_mutex);
    m_cids.insert_or_assign(std::move(address), std::move(cid));
}

cverify::Result<std::string> StaticOnChainCidSource::fetch(const std::string& address)
{
    std::lock_guard lock(m_mutex);
    auto it = m_cids.find(address);
    if (it == m_cids.end()) {
        return std::unexpected(Error::make("NotFound", "No bytecode registered on-chain for " + address));
    }
    return it->second;
}

}  // namespace cverify::onchain
