#pragma once
#include <mutex>
#include <set>
#include <string>
#include <vector>
#include "transport.hpp"

// Pushes the local hash set only when its membership changed since the last delivered push.
class InventoryReporter {
public:
    explicit InventoryReporter(Transport& transport);

    // True when a push was transmitted. A failed delivery leaves the last-sent set unchanged
    // so the next call retries.
    bool push(const std::vector<std::string>& hashes);

private:
    std::mutex mtx_;
    Transport& transport_;
    std::set<std::string> last_sent_;
    bool has_sent_{false};
};
