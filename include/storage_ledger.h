#pragma once

#include <cstdint>
#include <vector>

#include "resource.h"
#include "sim_status.h"

struct DepositResult {
    SimStatus status;
    double deposited = 0.0;
    double overflow = 0.0; // part of this deposit sitting above capacity, not yet disposed
};

struct OverflowReport {
    ResourceAmounts dumped{};
    double totalDumped = 0.0;

    bool occurred() const { return totalDumped > 0.0; }
};

struct StorageStats {
    double capacity = 0.0;
    double totalStored = 0.0;
    double availableSpace = 0.0;
    double utilization = 0.0; // 0..1
    double lifetimeProduced = 0.0;
    double lifetimeConsumed = 0.0;
    double lifetimeDumped = 0.0;
    std::uint64_t overflowEvents = 0;
};

// One shared capacity across every resource type. Amounts never go negative;
// the total can exceed capacity only between a deposit batch and resolveOverflow().
class StorageLedger {
public:
    StorageLedger(double capacity, const ResourceAmounts& unitValues);

    DepositResult deposit(Resource::Type type, double amount);
    double withdraw(Resource::Type type, double amount);

    bool canAfford(const ResourceAmounts& cost) const;
    // All-or-nothing; leaves the ledger untouched on shortfall.
    SimStatus withdrawAll(const ResourceAmounts& cost);

    OverflowReport resolveOverflow();

    void increaseCapacity(double amount);
    void setCapacity(double capacity);
    SimStatus restore(const ResourceAmounts& amounts, double capacity);

    double getAmount(Resource::Type type) const;
    double getCapacity() const { return m_capacity; }
    double getTotalStored() const;
    double getAvailableSpace() const;
    ResourceAmounts amounts() const { return m_amounts; }
    const ResourceAmounts& unitValues() const { return m_unitValues; }

    // Lowest unit value first; ties keep enum order.
    std::vector<Resource::Type> dumpOrder() const;
    StorageStats stats() const;

    void setWarningsEnabled(bool enabled) { m_warningsEnabled = enabled; }

private:
    double m_capacity = 0.0;
    ResourceAmounts m_unitValues{};
    ResourceAmounts m_amounts{};

    double m_lifetimeProduced = 0.0;
    double m_lifetimeConsumed = 0.0;
    double m_lifetimeDumped = 0.0;
    std::uint64_t m_overflowEvents = 0;
    bool m_warningsEnabled = true;
};
