#include "storage_ledger.h"

#include <algorithm>
#include <cmath>
#include <iomanip>
#include <iostream>
#include <sstream>

namespace {

constexpr double kEps = 1.0e-9;

size_t slot(Resource::Type type) {
    return static_cast<size_t>(Resource::index(type));
}

bool validAmount(double amount) {
    return std::isfinite(amount) && amount >= 0.0;
}

} // namespace

StorageLedger::StorageLedger(double capacity, const ResourceAmounts& unitValues)
    : m_capacity(validAmount(capacity) ? capacity : 0.0),
      m_unitValues(unitValues),
      m_amounts(zeroAmounts()) {}

DepositResult StorageLedger::deposit(Resource::Type type, double amount) {
    DepositResult out;
    if (!validAmount(amount)) {
        std::ostringstream oss;
        oss << "cannot deposit " << amount << " " << Resource::name(type);
        out.status = SimStatus::failure(SimErrorCode::InvalidAmount, oss.str());
        return out;
    }
    const double before = getTotalStored();
    m_amounts[slot(type)] += amount;
    const double after = before + amount;
    m_lifetimeProduced += amount;

    out.deposited = amount;
    out.overflow = std::max(0.0, after - m_capacity) - std::max(0.0, before - m_capacity);
    return out;
}

double StorageLedger::withdraw(Resource::Type type, double amount) {
    if (!validAmount(amount)) {
        return 0.0;
    }
    double& current = m_amounts[slot(type)];
    const double taken = std::min(amount, current);
    current -= taken;
    if (current < kEps) {
        current = 0.0;
    }
    m_lifetimeConsumed += taken;
    return taken;
}

bool StorageLedger::canAfford(const ResourceAmounts& cost) const {
    for (Resource::Type type : Resource::kAllTypes) {
        if (m_amounts[slot(type)] + kEps < cost[slot(type)]) {
            return false;
        }
    }
    return true;
}

SimStatus StorageLedger::withdrawAll(const ResourceAmounts& cost) {
    for (Resource::Type type : Resource::kAllTypes) {
        if (!validAmount(cost[slot(type)])) {
            return SimStatus::failure(SimErrorCode::InvalidAmount,
                                      std::string("invalid cost for ") + Resource::name(type));
        }
    }
    if (!canAfford(cost)) {
        std::ostringstream oss;
        oss << "insufficient resources:";
        for (Resource::Type type : Resource::kAllTypes) {
            const double need = cost[slot(type)];
            const double have = m_amounts[slot(type)];
            if (have + kEps < need) {
                oss << " " << Resource::name(type) << " " << have << "/" << need;
            }
        }
        return SimStatus::failure(SimErrorCode::InsufficientResources, oss.str());
    }
    for (Resource::Type type : Resource::kAllTypes) {
        withdraw(type, cost[slot(type)]);
    }
    return SimStatus::success();
}

std::vector<Resource::Type> StorageLedger::dumpOrder() const {
    std::vector<Resource::Type> order(Resource::kAllTypes.begin(), Resource::kAllTypes.end());
    std::stable_sort(order.begin(), order.end(), [this](Resource::Type a, Resource::Type b) {
        return m_unitValues[slot(a)] < m_unitValues[slot(b)];
    });
    return order;
}

OverflowReport StorageLedger::resolveOverflow() {
    OverflowReport report;
    report.dumped = zeroAmounts();

    double excess = getTotalStored() - m_capacity;
    if (excess <= kEps) {
        return report;
    }

    for (Resource::Type type : dumpOrder()) {
        if (excess <= kEps) {
            break;
        }
        double& current = m_amounts[slot(type)];
        const double take = std::min(current, excess);
        if (take <= 0.0) {
            continue;
        }
        current -= take;
        if (current < kEps) {
            current = 0.0;
        }
        excess -= take;
        report.dumped[slot(type)] += take;
        report.totalDumped += take;
    }

    m_lifetimeDumped += report.totalDumped;
    ++m_overflowEvents;

    if (m_warningsEnabled) {
        std::ostringstream oss;
        oss << std::fixed << std::setprecision(2);
        oss << "[Storage] Overflow: dumped " << report.totalDumped << " (capacity " << m_capacity << ";";
        for (Resource::Type type : Resource::kAllTypes) {
            if (report.dumped[slot(type)] > 0.0) {
                oss << " " << Resource::name(type) << "=" << report.dumped[slot(type)];
            }
        }
        oss << ")\n";
        std::cerr << oss.str();
    }
    return report;
}

void StorageLedger::increaseCapacity(double amount) {
    if (!validAmount(amount)) {
        return;
    }
    m_capacity += amount;
}

void StorageLedger::setCapacity(double capacity) {
    m_capacity = validAmount(capacity) ? capacity : 0.0;
}

SimStatus StorageLedger::restore(const ResourceAmounts& amounts, double capacity) {
    if (!validAmount(capacity)) {
        return SimStatus::failure(SimErrorCode::InvalidAmount, "restored capacity is negative or non-finite");
    }
    for (Resource::Type type : Resource::kAllTypes) {
        if (!validAmount(amounts[slot(type)])) {
            return SimStatus::failure(SimErrorCode::InvalidAmount,
                                      std::string("restored amount invalid for ") + Resource::name(type));
        }
    }
    m_amounts = amounts;
    m_capacity = capacity;
    return SimStatus::success();
}

double StorageLedger::getAmount(Resource::Type type) const {
    return m_amounts[slot(type)];
}

double StorageLedger::getTotalStored() const {
    return totalOf(m_amounts);
}

double StorageLedger::getAvailableSpace() const {
    return std::max(0.0, m_capacity - getTotalStored());
}

StorageStats StorageLedger::stats() const {
    StorageStats s;
    s.capacity = m_capacity;
    s.totalStored = getTotalStored();
    s.availableSpace = getAvailableSpace();
    s.utilization = (m_capacity > 0.0) ? std::min(1.0, s.totalStored / m_capacity) : 0.0;
    s.lifetimeProduced = m_lifetimeProduced;
    s.lifetimeConsumed = m_lifetimeConsumed;
    s.lifetimeDumped = m_lifetimeDumped;
    s.overflowEvents = m_overflowEvents;
    return s;
}
