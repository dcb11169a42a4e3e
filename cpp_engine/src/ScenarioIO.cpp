#include "ScenarioIO.h"

#include "XercesSupport.h"

#include <cstdio>
#include <fstream>
#include <map>
#include <utility>
#include <ostream>
#include <sstream>

#include <xercesc/sax/SAXException.hpp>
#include <xercesc/sax/SAXParseException.hpp>

namespace evtoll {

namespace {

std::string firstToken(const std::string& edges) {
    std::istringstream in(edges);
    std::string token;
    in >> token;
    return token;
}

std::string lastToken(const std::string& edges) {
    std::istringstream in(edges);
    std::string token;
    std::string last;
    while (in >> token) last = token;
    return last;
}

std::string formatSeconds(double s) {
    char buf[64];
    std::snprintf(buf, sizeof(buf), "%.2f", s);
    return buf;
}

class DemandHandler : public xercesc::DefaultHandler {
public:
    explicit DemandHandler(std::vector<VehicleRecord>& out)
        : out_(out),
          tag_trip_("trip"),
          tag_vehicle_("vehicle"),
          tag_route_("route"),
          tag_flow_("flow"),
          attr_id_("id"),
          attr_from_("from"),
          attr_to_("to"),
          attr_depart_("depart"),
          attr_edges_("edges"),
          attr_route_("route") {}

    void startElement(const XMLCh* const, const XMLCh* const, const XMLCh* const qname,
                      const xercesc::Attributes& attrs) override {
        if (xercesc::XMLString::equals(qname, tag_trip_.get())) {
            VehicleRecord rec = readCommon(attrs);
            rec.from_edge = xml::attribute(attrs, attr_from_);
            rec.to_edge = xml::attribute(attrs, attr_to_);
            if (rec.from_edge.empty() || rec.to_edge.empty()) {
                fail("trip '" + rec.id + "' has no from/to edge");
            }
            out_.push_back(std::move(rec));
        } else if (xercesc::XMLString::equals(qname, tag_vehicle_.get())) {
            current_ = readCommon(attrs);
            in_vehicle_ = true;
            const std::string route_ref = xml::attribute(attrs, attr_route_);
            if (!route_ref.empty()) {
                const auto it = routes_.find(route_ref);
                if (it == routes_.end()) {
                    fail("vehicle '" + current_.id + "' references unknown route '" + route_ref + "'");
                }
                setRoute(it->second);
            }
        } else if (xercesc::XMLString::equals(qname, tag_route_.get())) {
            const std::string edges = xml::attribute(attrs, attr_edges_);
            if (in_vehicle_) {
                setRoute(edges);
            } else {
                // Named route, referenced later through <vehicle route="...">.
                const std::string id = xml::attribute(attrs, attr_id_);
                if (id.empty()) fail("top-level route without id");
                routes_[id] = edges;
            }
        } else if (xercesc::XMLString::equals(qname, tag_flow_.get())) {
            fail("flow '" + xml::attribute(attrs, attr_id_) + "' cannot be labeled per vehicle; "
                 "expand flows into trips or vehicles first");
        }
    }

    void endElement(const XMLCh* const, const XMLCh* const, const XMLCh* const qname) override {
        if (in_vehicle_ && xercesc::XMLString::equals(qname, tag_vehicle_.get())) {
            if (current_.route_edges.empty()) {
                fail("vehicle '" + current_.id + "' has no route");
            }
            out_.push_back(std::move(current_));
            current_ = VehicleRecord{};
            in_vehicle_ = false;
        }
    }

    void fatalError(const xercesc::SAXParseException& e) override {
        throw e;
    }

private:
    [[noreturn]] static void fail(const std::string& message) {
        throw xercesc::SAXException(message.c_str());
    }

    void setRoute(const std::string& edges) {
        current_.route_edges = edges;
        current_.from_edge = firstToken(edges);
        current_.to_edge = lastToken(edges);
    }

    VehicleRecord readCommon(const xercesc::Attributes& attrs) const {
        VehicleRecord rec;
        rec.id = xml::attribute(attrs, attr_id_);
        if (rec.id.empty()) {
            throw xercesc::SAXException("demand entry without id");
        }
        bool ok = true;
        rec.depart_s = xml::numericAttribute(attrs, attr_depart_, 0.0, &ok);
        if (!ok) {
            throw xercesc::SAXException("non-numeric depart time");
        }
        return rec;
    }

    std::vector<VehicleRecord>& out_;
    xml::XStr tag_trip_;
    xml::XStr tag_vehicle_;
    xml::XStr tag_route_;
    xml::XStr tag_flow_;
    xml::XStr attr_id_;
    xml::XStr attr_from_;
    xml::XStr attr_to_;
    xml::XStr attr_depart_;
    xml::XStr attr_edges_;
    xml::XStr attr_route_;
    std::map<std::string, std::string> routes_;
    VehicleRecord current_{};
    bool in_vehicle_ = false;
};

template <typename ParseFn>
DemandLoadResult loadDemand(ParseFn&& parse) {
    DemandLoadResult result;
    xml::PlatformScope platform;
    if (!platform.ok()) {
        result.message = platform.error();
        return result;
    }
    std::string error;
    {
        DemandHandler handler(result.vehicles);
        auto reader = xml::makeReader(handler);
        result.ok = parse(*reader, &error);
    }
    if (!result.ok) {
        result.vehicles.clear();
        result.message = error;
    }
    return result;
}

template <typename WriteFn>
bool writeToFile(const std::string& path, std::string* error, WriteFn&& write) {
    std::ofstream out(path);
    if (!out.is_open()) {
        if (error) *error = "cannot open " + path + " for writing";
        return false;
    }
    write(out);
    out.flush();
    if (!out) {
        if (error) *error = "write failed: " + path;
        return false;
    }
    return true;
}

void writeProfile(std::ostream& out, const VehicleTypeProfile& p) {
    out << "    <vType id=\"" << vehicleTypeId(p.type) << "\""
        << " emissionClass=\"" << escapeXmlAttribute(p.emission_class) << "\""
        << " color=\"" << escapeXmlAttribute(p.color) << "\">\n"
        << "        <param key=\"device.emissions.probability\" value=\""
        << p.emissions_device_probability << "\"/>\n"
        << "    </vType>\n";
}

} // namespace

DemandLoadResult loadDemandFile(const std::string& path) {
    DemandLoadResult result = loadDemand([&](xercesc::SAX2XMLReader& reader, std::string* error) {
        return xml::parseFile(reader, path, error);
    });
    if (!result.ok) result.message = path + ": " + result.message;
    return result;
}

DemandLoadResult loadDemandDocument(const std::string& document) {
    return loadDemand([&](xercesc::SAX2XMLReader& reader, std::string* error) {
        return xml::parseBuffer(reader, document, error);
    });
}

std::string escapeXmlAttribute(const std::string& text) {
    std::string out;
    out.reserve(text.size());
    for (char c : text) {
        switch (c) {
            case '&': out += "&amp;"; break;
            case '<': out += "&lt;"; break;
            case '>': out += "&gt;"; break;
            case '"': out += "&quot;"; break;
            case '\'': out += "&apos;"; break;
            default: out += c; break;
        }
    }
    return out;
}

void writeRoutes(std::ostream& out, const ScenarioArtifact& artifact) {
    out << "<?xml version=\"1.0\" encoding=\"UTF-8\"?>\n"
        << "<routes xmlns:xsi=\"http://www.w3.org/2001/XMLSchema-instance\""
        << " xsi:noNamespaceSchemaLocation=\"http://sumo.dlr.de/xsd/routes_file.xsd\">\n";
    for (const auto& profile : artifact.profiles) {
        writeProfile(out, profile);
    }
    for (const auto& labeled : artifact.vehicles) {
        const VehicleRecord& v = labeled.vehicle;
        const char* type = vehicleTypeId(labeled.type);
        if (!v.route_edges.empty()) {
            out << "    <vehicle id=\"" << escapeXmlAttribute(v.id) << "\" type=\"" << type
                << "\" depart=\"" << formatSeconds(v.depart_s) << "\">\n"
                << "        <route edges=\"" << escapeXmlAttribute(v.route_edges) << "\"/>\n"
                << "    </vehicle>\n";
        } else {
            out << "    <trip id=\"" << escapeXmlAttribute(v.id) << "\" type=\"" << type
                << "\" depart=\"" << formatSeconds(v.depart_s)
                << "\" from=\"" << escapeXmlAttribute(v.from_edge)
                << "\" to=\"" << escapeXmlAttribute(v.to_edge) << "\"/>\n";
        }
    }
    out << "</routes>\n";
}

void writeSimulationConfig(std::ostream& out, const ScenarioArtifact& artifact, const ConfigPaths& paths) {
    const SimulationWindow& w = artifact.window;
    out << "<?xml version=\"1.0\" encoding=\"UTF-8\"?>\n"
        << "<configuration xmlns:xsi=\"http://www.w3.org/2001/XMLSchema-instance\""
        << " xsi:noNamespaceSchemaLocation=\"http://sumo.dlr.de/xsd/sumoConfiguration.xsd\">\n"
        << "    <input>\n"
        << "        <net-file value=\"" << escapeXmlAttribute(paths.net_file) << "\"/>\n"
        << "        <route-files value=\"" << escapeXmlAttribute(paths.routes_file) << "\"/>\n"
        << "    </input>\n"
        << "    <time>\n"
        << "        <begin value=\"" << w.begin_s << "\"/>\n"
        << "        <end value=\"" << w.end_s << "\"/>\n"
        << "        <step-length value=\"" << w.step_length_s << "\"/>\n"
        << "    </time>\n"
        << "    <output>\n"
        << "        <tripinfo-output value=\"" << escapeXmlAttribute(paths.tripinfo_file) << "\"/>\n"
        << "    </output>\n"
        << "    <report>\n"
        << "        <no-step-log value=\"true\"/>\n"
        << "    </report>\n"
        << "</configuration>\n";
}

void writeTrips(std::ostream& out, const std::vector<VehicleRecord>& trips) {
    out << "<?xml version=\"1.0\" encoding=\"UTF-8\"?>\n"
        << "<routes xmlns:xsi=\"http://www.w3.org/2001/XMLSchema-instance\""
        << " xsi:noNamespaceSchemaLocation=\"http://sumo.dlr.de/xsd/routes_file.xsd\">\n";
    for (const auto& t : trips) {
        out << "    <trip id=\"" << escapeXmlAttribute(t.id)
            << "\" depart=\"" << formatSeconds(t.depart_s)
            << "\" from=\"" << escapeXmlAttribute(t.from_edge)
            << "\" to=\"" << escapeXmlAttribute(t.to_edge) << "\"/>\n";
    }
    out << "</routes>\n";
}

bool writeRoutesFile(const ScenarioArtifact& artifact, const std::string& path, std::string* error) {
    return writeToFile(path, error, [&](std::ostream& out) { writeRoutes(out, artifact); });
}

bool writeSimulationConfigFile(const ScenarioArtifact& artifact,
                               const ConfigPaths& paths,
                               const std::string& path,
                               std::string* error) {
    return writeToFile(path, error, [&](std::ostream& out) { writeSimulationConfig(out, artifact, paths); });
}

bool writeTripsFile(const std::vector<VehicleRecord>& trips, const std::string& path, std::string* error) {
    return writeToFile(path, error, [&](std::ostream& out) { writeTrips(out, trips); });
}

} // namespace evtoll
