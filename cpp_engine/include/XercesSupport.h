#pragma once

// Thin helpers over Xerces-C++ SAX2: platform init scope, XMLCh <-> UTF-8
// conversion and attribute lookup by a pre-transcoded name.

#include <memory>
#include <string>

#include <xercesc/sax2/Attributes.hpp>
#include <xercesc/sax2/DefaultHandler.hpp>
#include <xercesc/sax2/SAX2XMLReader.hpp>
#include <xercesc/util/XMLString.hpp>

namespace evtoll {
namespace xml {

// XMLPlatformUtils::Initialize/Terminate pair. Xerces reference-counts
// initialisation, so nested scopes are fine.
class PlatformScope {
public:
    PlatformScope();
    ~PlatformScope();

    PlatformScope(const PlatformScope&) = delete;
    PlatformScope& operator=(const PlatformScope&) = delete;

    bool ok() const { return ok_; }
    const std::string& error() const { return error_; }

private:
    bool ok_ = false;
    std::string error_;
};

// Owned XMLCh copy of a narrow string (element/attribute names).
class XStr {
public:
    explicit XStr(const char* text);
    ~XStr();

    XStr(const XStr&) = delete;
    XStr& operator=(const XStr&) = delete;

    const XMLCh* get() const { return text_; }

private:
    XMLCh* text_ = nullptr;
};

std::string toNative(const XMLCh* text);

// Attribute value as UTF-8; empty string when absent.
std::string attribute(const xercesc::Attributes& attrs, const XStr& name);

// Numeric attribute; absent => fallback. Sets *ok=false on unparsable text.
double numericAttribute(const xercesc::Attributes& attrs, const XStr& name, double fallback, bool* ok);

// Non-validating SAX2 reader with external DTD/schema loading disabled.
std::unique_ptr<xercesc::SAX2XMLReader> makeReader(xercesc::DefaultHandler& handler);

// Parse a file or an in-memory document. Returns false and fills *error on
// any parser or handler exception.
bool parseFile(xercesc::SAX2XMLReader& reader, const std::string& path, std::string* error);
bool parseBuffer(xercesc::SAX2XMLReader& reader, const std::string& document, std::string* error);

} // namespace xml
} // namespace evtoll
