#pragma once

#include <map>
#include <mutex>
#include <string>
#include <unordered_set>
#include <vector>

namespace exec_kernel {

struct CatalogEntry {
    std::string name;
    std::string description;
    std::string url;
    std::map<std::string, std::string> metadata;
    std::string registered_at;   // ISO-8601 UTC, filled in by the store
};

enum class RegisterStatus {
    Ok,
    AlreadyExists,
};

/// Storage for registered tool servers. Injected into the service layer;
/// the execution engine does not use it.
class CatalogStore {
public:
    virtual ~CatalogStore() = default;

    /// Throws std::invalid_argument for an empty name.
    virtual RegisterStatus add(CatalogEntry entry) = 0;

    /// Entries in registration order.
    virtual std::vector<CatalogEntry> list() const = 0;
};

class InMemoryCatalog : public CatalogStore {
public:
    RegisterStatus add(CatalogEntry entry) override;
    std::vector<CatalogEntry> list() const override;

private:
    mutable std::mutex mu_;
    std::vector<CatalogEntry> entries_;
    std::unordered_set<std::string> names_;
};

/// Current time as "YYYY-MM-DDTHH:MM:SSZ".
std::string utc_timestamp();

} // namespace exec_kernel
