#pragma once

#include <cstdint>
#include <string>

namespace evtoll {

// One completed trip as reported by the simulator. Absent measurements are 0.
struct TripRecord {
    std::string vehicle_type_hint;
    double co2_abs_mg = 0.0;
    double electricity_abs_wh = 0.0;
};

enum class TripClass : std::uint8_t {
    ICE,
    EV,
    Unclassified,
};

// Measured quantities win over the declared type:
//   co2 > 0 -> ICE; else electricity > 0 -> EV; else "ICE"/"EV" substring
//   of the hint; else unclassified.
TripClass classifyTrip(const TripRecord& record);

struct TripTotals {
    double total_co2_mg = 0.0;
    double total_energy_wh = 0.0;
    std::uint64_t ice_count = 0;
    std::uint64_t ev_count = 0;
    std::uint64_t unclassified_count = 0;
};

// Running reduction over a trip stream. Constant memory.
class TripAggregator {
public:
    void add(const TripRecord& record);
    void reset() { totals_ = TripTotals{}; }
    const TripTotals& totals() const { return totals_; }

private:
    TripTotals totals_{};
};

enum class AggregateStatus : std::uint8_t {
    Ok,
    MissingArtifact,
    MalformedInput,
};

const char* aggregateStatusName(AggregateStatus status);

// Totals are zeroed unless status == Ok.
struct AggregateOutcome {
    AggregateStatus status = AggregateStatus::Ok;
    TripTotals totals{};
    std::string message;
};

// Stream a tripinfo document (<tripinfo vType=..><emissions CO2_abs=..
// electricity_abs=../></tripinfo>) through a TripAggregator.
AggregateOutcome aggregateTripinfoFile(const std::string& path);
AggregateOutcome aggregateTripinfoDocument(const std::string& xml);

struct KpiResult {
    double toll_eur = 0.0;
    double ev_share = 0.0;
    double total_co2_kg = 0.0;
    double total_energy_kwh = 0.0;
    double grid_cost_eur = 0.0;
    double toll_revenue_eur = 0.0;
    std::uint64_t total_vehicles = 0;
};

KpiResult computeKpi(double toll_eur, double grid_cost_eur_per_kwh, const TripTotals& totals);

} // namespace evtoll
