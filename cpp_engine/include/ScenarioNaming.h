#pragma once

#include <optional>
#include <string>

namespace evtoll {

// Filename-safe toll tokens: one decimal, '.' replaced by '_'.
//   0.0 -> "0_0", 1.5 -> "1_5", 2 -> "2_0"
// Prices with more than one significant decimal do not round-trip;
// use tollRoundTrips() to check a grid before running it.
std::string encodeTollToken(double toll_eur);
std::optional<double> decodeTollToken(const std::string& token);
bool tollRoundTrips(double toll_eur);

std::string scenarioName(double toll_eur);       // "toll_1_5"
std::string routesFileName(double toll_eur);     // "routes_toll_1_5.xml"
std::string configFileName(double toll_eur);     // "config_toll_1_5.sumo.cfg"
std::string tripinfoFileName(double toll_eur);   // "tripinfo_toll_1_5.xml"

// Inverse of tripinfoFileName(); nullopt for any other name.
std::optional<double> tollFromTripinfoFileName(const std::string& filename);

} // namespace evtoll
