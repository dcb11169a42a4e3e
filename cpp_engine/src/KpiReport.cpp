#include "KpiReport.h"

#include <cstdlib>
#include <fstream>
#include <iomanip>
#include <sstream>

namespace evtoll {

namespace {
const char* const kCsvHeader =
    "toll_price_eur,ev_share,total_co2_kg,total_energy_kwh,grid_cost_eur,toll_revenue_eur,total_vehicles";

bool parseDouble(const std::string& text, double& out) {
    char* end = nullptr;
    out = std::strtod(text.c_str(), &end);
    return !text.empty() && end != nullptr && *end == '\0';
}
} // namespace

void writeKpiCsv(std::ostream& out, const std::vector<KpiResult>& rows) {
    out << kCsvHeader << '\n';
    out << std::fixed << std::setprecision(6);
    for (const auto& r : rows) {
        out << r.toll_eur << ','
            << r.ev_share << ','
            << r.total_co2_kg << ','
            << r.total_energy_kwh << ','
            << r.grid_cost_eur << ','
            << r.toll_revenue_eur << ','
            << r.total_vehicles << '\n';
    }
}

void writeKpiMarkdown(std::ostream& out, const std::vector<KpiResult>& rows) {
    out << "# Simulation Results\n\n";
    if (rows.empty()) {
        out << "No scenario produced results.\n";
        return;
    }
    out << "| Toll Price (EUR) | EV Share | Total CO2 (kg) | Energy (kWh) | Grid Cost (EUR) "
           "| Toll Revenue (EUR) | Total Vehicles |\n"
        << "|---:|---:|---:|---:|---:|---:|---:|\n";
    out << std::fixed;
    for (const auto& r : rows) {
        out << "| " << std::setprecision(1) << r.toll_eur
            << " | " << std::setprecision(2) << (r.ev_share * 100.0) << "%"
            << " | " << std::setprecision(3) << r.total_co2_kg
            << " | " << std::setprecision(3) << r.total_energy_kwh
            << " | " << std::setprecision(2) << r.grid_cost_eur
            << " | " << std::setprecision(2) << r.toll_revenue_eur
            << " | " << r.total_vehicles << " |\n";
    }
}

bool exportKpiCsv(const std::string& filename, const std::vector<KpiResult>& rows) {
    std::ofstream out(filename);
    if (!out.is_open()) {
        return false;
    }
    writeKpiCsv(out, rows);
    return static_cast<bool>(out);
}

bool exportKpiMarkdown(const std::string& filename, const std::vector<KpiResult>& rows) {
    std::ofstream out(filename);
    if (!out.is_open()) {
        return false;
    }
    writeKpiMarkdown(out, rows);
    return static_cast<bool>(out);
}

bool readKpiCsv(std::istream& in, std::vector<KpiResult>& rows) {
    std::string line;
    if (!std::getline(in, line) || line.rfind("toll_price_eur", 0) != 0) {
        return false;
    }
    while (std::getline(in, line)) {
        if (line.empty()) continue;
        std::istringstream fields(line);
        std::string cell;
        double v[7];
        int n = 0;
        while (n < 7 && std::getline(fields, cell, ',')) {
            if (!parseDouble(cell, v[n])) return false;
            ++n;
        }
        if (n != 7 || std::getline(fields, cell, ',')) {
            return false;
        }
        KpiResult r;
        r.toll_eur = v[0];
        r.ev_share = v[1];
        r.total_co2_kg = v[2];
        r.total_energy_kwh = v[3];
        r.grid_cost_eur = v[4];
        r.toll_revenue_eur = v[5];
        r.total_vehicles = v[6] > 0.0 ? static_cast<std::uint64_t>(v[6]) : 0u;
        rows.push_back(r);
    }
    return true;
}

bool importKpiCsv(const std::string& filename, std::vector<KpiResult>& rows) {
    std::ifstream in(filename);
    if (!in.is_open()) {
        return false;
    }
    return readKpiCsv(in, rows);
}

} // namespace evtoll
