#include "ScenarioNaming.h"

#include <cctype>
#include <cmath>
#include <cstdio>
#include <cstdlib>

namespace evtoll {

namespace {
const char* const kScenarioPrefix = "toll_";
const char* const kTripinfoPrefix = "tripinfo_toll_";
const char* const kXmlSuffix = ".xml";

bool startsWith(const std::string& s, const std::string& prefix) {
    return s.size() >= prefix.size() && s.compare(0, prefix.size(), prefix) == 0;
}

bool endsWith(const std::string& s, const std::string& suffix) {
    return s.size() >= suffix.size() &&
           s.compare(s.size() - suffix.size(), suffix.size(), suffix) == 0;
}
} // namespace

std::string encodeTollToken(double toll_eur) {
    if (!std::isfinite(toll_eur)) {
        return "nan";
    }
    char buf[64];
    std::snprintf(buf, sizeof(buf), "%.1f", toll_eur);
    std::string token(buf);
    for (char& c : token) {
        if (c == '.') c = '_';
    }
    return token;
}

std::optional<double> decodeTollToken(const std::string& token) {
    // Accepted form: digits '_' digits. Signs, exponents and a second
    // separator are rejected.
    const std::size_t sep = token.find('_');
    if (sep == std::string::npos || sep == 0 || sep + 1 >= token.size()) {
        return std::nullopt;
    }
    std::string text = token;
    for (std::size_t i = 0; i < text.size(); ++i) {
        if (i == sep) {
            text[i] = '.';
        } else if (!std::isdigit(static_cast<unsigned char>(text[i]))) {
            return std::nullopt;
        }
    }
    char* end = nullptr;
    const double value = std::strtod(text.c_str(), &end);
    if (end == nullptr || *end != '\0' || !std::isfinite(value)) {
        return std::nullopt;
    }
    return value;
}

bool tollRoundTrips(double toll_eur) {
    if (!std::isfinite(toll_eur) || toll_eur < 0.0) return false;
    const auto decoded = decodeTollToken(encodeTollToken(toll_eur));
    return decoded && *decoded == toll_eur;
}

std::string scenarioName(double toll_eur) {
    return std::string(kScenarioPrefix) + encodeTollToken(toll_eur);
}

std::string routesFileName(double toll_eur) {
    return "routes_" + scenarioName(toll_eur) + kXmlSuffix;
}

std::string configFileName(double toll_eur) {
    return "config_" + scenarioName(toll_eur) + ".sumo.cfg";
}

std::string tripinfoFileName(double toll_eur) {
    return "tripinfo_" + scenarioName(toll_eur) + kXmlSuffix;
}

std::optional<double> tollFromTripinfoFileName(const std::string& filename) {
    if (!startsWith(filename, kTripinfoPrefix) || !endsWith(filename, kXmlSuffix)) {
        return std::nullopt;
    }
    const std::size_t begin = std::string(kTripinfoPrefix).size();
    const std::size_t len = filename.size() - begin - std::string(kXmlSuffix).size();
    return decodeTollToken(filename.substr(begin, len));
}

} // namespace evtoll
