#include "XercesSupport.h"

#include <cerrno>
#include <cstdlib>
#include <sstream>

#include <xercesc/framework/MemBufInputSource.hpp>
#include <xercesc/sax/SAXException.hpp>
#include <xercesc/sax/SAXParseException.hpp>
#include <xercesc/sax2/XMLReaderFactory.hpp>
#include <xercesc/util/PlatformUtils.hpp>
#include <xercesc/util/XMLException.hpp>
#include <xercesc/util/XMLUni.hpp>

namespace evtoll {
namespace xml {

PlatformScope::PlatformScope() {
    try {
        xercesc::XMLPlatformUtils::Initialize();
        ok_ = true;
    } catch (const xercesc::XMLException& e) {
        error_ = "Xerces initialisation failed: " + toNative(e.getMessage());
    }
}

PlatformScope::~PlatformScope() {
    if (ok_) {
        xercesc::XMLPlatformUtils::Terminate();
    }
}

XStr::XStr(const char* text) : text_(xercesc::XMLString::transcode(text)) {}

XStr::~XStr() {
    xercesc::XMLString::release(&text_);
}

std::string toNative(const XMLCh* text) {
    if (text == nullptr) return std::string();
    char* native = xercesc::XMLString::transcode(text);
    std::string out(native != nullptr ? native : "");
    xercesc::XMLString::release(&native);
    return out;
}

std::string attribute(const xercesc::Attributes& attrs, const XStr& name) {
    return toNative(attrs.getValue(name.get()));
}

double numericAttribute(const xercesc::Attributes& attrs, const XStr& name, double fallback, bool* ok) {
    const XMLCh* raw = attrs.getValue(name.get());
    if (raw == nullptr) return fallback;
    const std::string text = toNative(raw);
    char* end = nullptr;
    errno = 0;
    const double value = std::strtod(text.c_str(), &end);
    if (text.empty() || end == text.c_str() || *end != '\0' || errno == ERANGE) {
        if (ok) *ok = false;
        return fallback;
    }
    return value;
}

std::unique_ptr<xercesc::SAX2XMLReader> makeReader(xercesc::DefaultHandler& handler) {
    std::unique_ptr<xercesc::SAX2XMLReader> reader(xercesc::XMLReaderFactory::createXMLReader());
    reader->setFeature(xercesc::XMLUni::fgSAX2CoreValidation, false);
    reader->setFeature(xercesc::XMLUni::fgSAX2CoreNameSpaces, false);
    reader->setFeature(xercesc::XMLUni::fgXercesSchema, false);
    reader->setFeature(xercesc::XMLUni::fgXercesLoadExternalDTD, false);
    reader->setContentHandler(&handler);
    reader->setErrorHandler(&handler);
    return reader;
}

namespace {
template <typename ParseFn>
bool guardedParse(ParseFn&& fn, std::string* error) {
    try {
        fn();
        return true;
    } catch (const xercesc::SAXParseException& e) {
        if (error) {
            std::ostringstream msg;
            msg << "line " << e.getLineNumber() << ", column " << e.getColumnNumber()
                << ": " << toNative(e.getMessage());
            *error = msg.str();
        }
    } catch (const xercesc::SAXException& e) {
        if (error) *error = toNative(e.getMessage());
    } catch (const xercesc::XMLException& e) {
        if (error) *error = toNative(e.getMessage());
    }
    return false;
}
} // namespace

bool parseFile(xercesc::SAX2XMLReader& reader, const std::string& path, std::string* error) {
    return guardedParse([&]() { reader.parse(path.c_str()); }, error);
}

bool parseBuffer(xercesc::SAX2XMLReader& reader, const std::string& document, std::string* error) {
    xercesc::MemBufInputSource source(reinterpret_cast<const XMLByte*>(document.data()),
                                      static_cast<XMLSize_t>(document.size()),
                                      "in-memory document");
    return guardedParse([&]() { reader.parse(source); }, error);
}

} // namespace xml
} // namespace evtoll
