#include "TripAggregator.h"

#include "XercesSupport.h"

#include <filesystem>
#include <system_error>

#include <xercesc/sax/SAXException.hpp>
#include <xercesc/sax/SAXParseException.hpp>

namespace evtoll {

TripClass classifyTrip(const TripRecord& record) {
    if (record.co2_abs_mg > 0.0) return TripClass::ICE;
    if (record.electricity_abs_wh > 0.0) return TripClass::EV;
    if (record.vehicle_type_hint.find("ICE") != std::string::npos) return TripClass::ICE;
    if (record.vehicle_type_hint.find("EV") != std::string::npos) return TripClass::EV;
    return TripClass::Unclassified;
}

void TripAggregator::add(const TripRecord& record) {
    switch (classifyTrip(record)) {
        case TripClass::ICE:
            ++totals_.ice_count;
            // Only measured CO2 is accumulated; a label-only ICE adds nothing.
            if (record.co2_abs_mg > 0.0) totals_.total_co2_mg += record.co2_abs_mg;
            break;
        case TripClass::EV:
            ++totals_.ev_count;
            if (record.electricity_abs_wh > 0.0) totals_.total_energy_wh += record.electricity_abs_wh;
            break;
        case TripClass::Unclassified:
            ++totals_.unclassified_count;
            break;
    }
}

const char* aggregateStatusName(AggregateStatus status) {
    switch (status) {
        case AggregateStatus::Ok: return "ok";
        case AggregateStatus::MissingArtifact: return "missing simulator output";
        case AggregateStatus::MalformedInput: return "malformed trip records";
    }
    return "unknown";
}

namespace {

// SAX handler: one TripRecord is live at a time and folded into the
// aggregator on </tripinfo>.
class TripinfoHandler : public xercesc::DefaultHandler {
public:
    explicit TripinfoHandler(TripAggregator& aggregator)
        : aggregator_(aggregator),
          tag_tripinfo_("tripinfo"),
          tag_emissions_("emissions"),
          attr_vtype_("vType"),
          attr_co2_("CO2_abs"),
          attr_electricity_("electricity_abs") {}

    void startElement(const XMLCh* const /*uri*/,
                      const XMLCh* const /*localname*/,
                      const XMLCh* const qname,
                      const xercesc::Attributes& attrs) override {
        if (xercesc::XMLString::equals(qname, tag_tripinfo_.get())) {
            in_trip_ = true;
            current_ = TripRecord{};
            current_.vehicle_type_hint = xml::attribute(attrs, attr_vtype_);
        } else if (in_trip_ && xercesc::XMLString::equals(qname, tag_emissions_.get())) {
            bool ok = true;
            current_.co2_abs_mg = xml::numericAttribute(attrs, attr_co2_, 0.0, &ok);
            current_.electricity_abs_wh = xml::numericAttribute(attrs, attr_electricity_, 0.0, &ok);
            if (!ok) {
                throw xercesc::SAXException("non-numeric emissions attribute");
            }
        }
    }

    void endElement(const XMLCh* const /*uri*/,
                    const XMLCh* const /*localname*/,
                    const XMLCh* const qname) override {
        if (in_trip_ && xercesc::XMLString::equals(qname, tag_tripinfo_.get())) {
            aggregator_.add(current_);
            in_trip_ = false;
        }
    }

    void fatalError(const xercesc::SAXParseException& e) override {
        throw e;
    }

private:
    TripAggregator& aggregator_;
    xml::XStr tag_tripinfo_;
    xml::XStr tag_emissions_;
    xml::XStr attr_vtype_;
    xml::XStr attr_co2_;
    xml::XStr attr_electricity_;
    TripRecord current_{};
    bool in_trip_ = false;
};

template <typename ParseFn>
AggregateOutcome runTripinfoParse(ParseFn&& parse) {
    AggregateOutcome outcome;
    xml::PlatformScope platform;
    if (!platform.ok()) {
        outcome.status = AggregateStatus::MalformedInput;
        outcome.message = platform.error();
        return outcome;
    }

    TripAggregator aggregator;
    std::string error;
    bool parsed = false;
    {
        TripinfoHandler handler(aggregator);
        auto reader = xml::makeReader(handler);
        parsed = parse(*reader, &error);
    }
    if (!parsed) {
        outcome.status = AggregateStatus::MalformedInput;
        outcome.message = error;
        return outcome;
    }
    outcome.totals = aggregator.totals();
    return outcome;
}

} // namespace

AggregateOutcome aggregateTripinfoFile(const std::string& path) {
    std::error_code ec;
    if (!std::filesystem::is_regular_file(path, ec)) {
        AggregateOutcome outcome;
        outcome.status = AggregateStatus::MissingArtifact;
        outcome.message = "no such file: " + path;
        return outcome;
    }
    AggregateOutcome outcome = runTripinfoParse([&](xercesc::SAX2XMLReader& reader, std::string* error) {
        return xml::parseFile(reader, path, error);
    });
    if (outcome.status == AggregateStatus::MalformedInput) {
        outcome.message = path + ": " + outcome.message;
    }
    return outcome;
}

AggregateOutcome aggregateTripinfoDocument(const std::string& document) {
    return runTripinfoParse([&](xercesc::SAX2XMLReader& reader, std::string* error) {
        return xml::parseBuffer(reader, document, error);
    });
}

KpiResult computeKpi(double toll_eur, double grid_cost_eur_per_kwh, const TripTotals& totals) {
    KpiResult kpi;
    kpi.toll_eur = toll_eur;
    kpi.total_co2_kg = totals.total_co2_mg / 1.0e6;
    kpi.total_energy_kwh = totals.total_energy_wh / 1.0e3;
    kpi.grid_cost_eur = kpi.total_energy_kwh * grid_cost_eur_per_kwh;
    kpi.toll_revenue_eur = static_cast<double>(totals.ice_count) * toll_eur;
    kpi.total_vehicles = totals.ice_count + totals.ev_count;
    kpi.ev_share = (kpi.total_vehicles > 0)
        ? static_cast<double>(totals.ev_count) / static_cast<double>(kpi.total_vehicles)
        : 0.0;
    return kpi;
}

} // namespace evtoll
