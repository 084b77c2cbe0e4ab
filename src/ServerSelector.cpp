#include "ServerSelector.hpp"
#include "ErrorHandler.hpp"

namespace graphlink {

const std::string& ServerSelector::select(const std::vector<std::string>& pool) {
    if (pool.empty()) {
        throw RoutingExhaustedError("No server available in routing pool");
    }
    size_t index = pick(pool.size());
    if (index >= pool.size()) {
        throw RoutingExhaustedError("Server selector picked index " + std::to_string(index) +
                                    " from a pool of " + std::to_string(pool.size()));
    }
    return pool[index];
}

RandomServerSelector::RandomServerSelector()
    : m_rng(std::random_device{}()) {
}

RandomServerSelector::RandomServerSelector(uint32_t seed)
    : m_rng(seed) {
}

size_t RandomServerSelector::pick(size_t poolSize) {
    std::uniform_int_distribution<size_t> dist(0, poolSize - 1);
    return dist(m_rng);
}

}  // namespace graphlink
