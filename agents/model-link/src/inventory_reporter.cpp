#include "../include/inventory_reporter.hpp"
#include "../include/log.hpp"
#include "../include/text_util.hpp"

InventoryReporter::InventoryReporter(Transport& transport) : transport_(transport) {}

bool InventoryReporter::push(const std::vector<std::string>& hashes) {
    std::set<std::string> next;
    for (const auto& h : hashes) {
        if (!h.empty()) next.insert(to_lower(h));
    }

    std::lock_guard<std::mutex> lock(mtx_);
    if (has_sent_ && next == last_sent_) return false;

    std::vector<std::string> payload(next.begin(), next.end());
    if (!transport_.send(make_inventory(payload))) {
        log_warn("Inventory push not delivered; will retry on next change check");
        return false;
    }
    last_sent_ = std::move(next);
    has_sent_ = true;
    log_info("Inventory pushed: " + std::to_string(last_sent_.size()) + " hashes");
    return true;
}
