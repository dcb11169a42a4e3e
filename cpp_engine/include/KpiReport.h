#pragma once

#include <iosfwd>
#include <string>
#include <vector>

#include "TripAggregator.h"

namespace evtoll {

// Column order of the KPI table, shared by the CSV and Markdown writers.
//   toll_price_eur, ev_share, total_co2_kg, total_energy_kwh,
//   grid_cost_eur, toll_revenue_eur, total_vehicles
void writeKpiCsv(std::ostream& out, const std::vector<KpiResult>& rows);
void writeKpiMarkdown(std::ostream& out, const std::vector<KpiResult>& rows);

bool exportKpiCsv(const std::string& filename, const std::vector<KpiResult>& rows);
bool exportKpiMarkdown(const std::string& filename, const std::vector<KpiResult>& rows);

// Reads a table produced by writeKpiCsv(). Returns false on a missing header
// or a row with the wrong column count; rows parsed so far are kept.
bool readKpiCsv(std::istream& in, std::vector<KpiResult>& rows);
bool importKpiCsv(const std::string& filename, std::vector<KpiResult>& rows);

} // namespace evtoll
