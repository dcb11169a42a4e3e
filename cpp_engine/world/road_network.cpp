// world/road_network.cpp

#include "road_network.h"

#include "XercesSupport.h"

#include <algorithm>
#include <unordered_set>

#include <xercesc/sax/SAXParseException.hpp>

namespace evtoll {
namespace world {

namespace {

class EdgeHandler : public xercesc::DefaultHandler {
public:
    explicit EdgeHandler(std::vector<std::string>& out)
        : out_(out), tag_edge_("edge"), attr_id_("id"), attr_function_("function") {}

    void startElement(const XMLCh* const, const XMLCh* const, const XMLCh* const qname,
                      const xercesc::Attributes& attrs) override {
        if (!xercesc::XMLString::equals(qname, tag_edge_.get())) return;

        const std::string id = xml::attribute(attrs, attr_id_);
        if (id.empty() || id[0] == ':') return;
        if (xml::attribute(attrs, attr_function_) == "internal") return;
        if (seen_.insert(id).second) {
            out_.push_back(id);
        }
    }

    void fatalError(const xercesc::SAXParseException& e) override {
        throw e;
    }

private:
    std::vector<std::string>& out_;
    std::unordered_set<std::string> seen_;
    xml::XStr tag_edge_;
    xml::XStr attr_id_;
    xml::XStr attr_function_;
};

template <typename ParseFn>
bool loadEdges(std::vector<std::string>& edges, std::string& error, ParseFn&& parse) {
    edges.clear();
    error.clear();
    xml::PlatformScope platform;
    if (!platform.ok()) {
        error = platform.error();
        return false;
    }
    bool ok = false;
    {
        EdgeHandler handler(edges);
        auto reader = xml::makeReader(handler);
        ok = parse(*reader, &error);
    }
    if (!ok) edges.clear();
    return ok;
}

} // namespace

bool RoadNetwork::loadFile(const std::string& path) {
    valid_ = loadEdges(edges_, error_, [&](xercesc::SAX2XMLReader& reader, std::string* err) {
        return xml::parseFile(reader, path, err);
    });
    if (!valid_) error_ = path + ": " + error_;
    return valid_;
}

bool RoadNetwork::loadDocument(const std::string& document) {
    valid_ = loadEdges(edges_, error_, [&](xercesc::SAX2XMLReader& reader, std::string* err) {
        return xml::parseBuffer(reader, document, err);
    });
    return valid_;
}

bool RoadNetwork::hasEdge(const std::string& id) const {
    return std::find(edges_.begin(), edges_.end(), id) != edges_.end();
}

} // namespace world
} // namespace evtoll
