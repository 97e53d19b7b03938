#include "exec_kernel/catalog.h"

#include <spdlog/spdlog.h>

#include <ctime>
#include <stdexcept>
#include <utility>

namespace exec_kernel {

std::string utc_timestamp() {
    std::time_t now = std::time(nullptr);
    std::tm tm{};
    gmtime_r(&now, &tm);
    char buf[32];
    std::strftime(buf, sizeof(buf), "%Y-%m-%dT%H:%M:%SZ", &tm);
    return buf;
}

RegisterStatus InMemoryCatalog::add(CatalogEntry entry) {
    if (entry.name.empty()) throw std::invalid_argument("server name must not be empty");

    std::lock_guard<std::mutex> lock(mu_);
    if (!names_.insert(entry.name).second) {
        spdlog::info("catalog: '{}' already registered", entry.name);
        return RegisterStatus::AlreadyExists;
    }
    entry.registered_at = utc_timestamp();
    spdlog::info("catalog: registered '{}'", entry.name);
    entries_.push_back(std::move(entry));
    return RegisterStatus::Ok;
}

std::vector<CatalogEntry> InMemoryCatalog::list() const {
    std::lock_guard<std::mutex> lock(mu_);
    return entries_;
}

} // namespace exec_kernel
