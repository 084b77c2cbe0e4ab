#pragma once

#include <cstddef>
#include <cstdint>
#include <random>
#include <string>
#include <vector>

namespace graphlink {

// Picks one address out of a routing pool
class ServerSelector {
public:
    virtual ~ServerSelector() = default;

    ServerSelector(const ServerSelector&) = delete;
    ServerSelector& operator=(const ServerSelector&) = delete;

    // Index into a pool of poolSize entries; poolSize is never zero
    virtual size_t pick(size_t poolSize) = 0;

    // Throws RoutingExhaustedError for an empty pool or an out-of-range pick
    const std::string& select(const std::vector<std::string>& pool);

protected:
    ServerSelector() = default;
};

// Uniform pick over [0, poolSize)
class RandomServerSelector : public ServerSelector {
public:
    RandomServerSelector();
    explicit RandomServerSelector(uint32_t seed);

    size_t pick(size_t poolSize) override;

private:
    std::mt19937 m_rng;
};

}  // namespace graphlink
