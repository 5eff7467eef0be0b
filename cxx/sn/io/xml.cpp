#include "xml.hpp"

#include "../log/log.hpp"

#include <libxml/parser.h>

namespace sn {
namespace XML {

namespace {
auto Cast(std::string const &s) -> xmlChar const * { return reinterpret_cast<xmlChar const *>(s.c_str()); }
} // namespace

Document::Document(xmlDoc *doc)
  : doc_{doc, xmlFreeDoc}
{
}

Document::Document(std::string const &rootName, std::string const &ns)
  : doc_{xmlNewDoc(Cast("1.0")), xmlFreeDoc}
{
  if (!doc_) { throw Log::Failure("XML", "Could not create document"); }
  Node root = xmlNewNode(nullptr, Cast(rootName));
  if (!ns.empty()) { xmlSetNs(root, xmlNewNs(root, Cast(ns), nullptr)); }
  xmlDocSetRootElement(doc_.get(), root);
}

auto Document::Parse(std::string const &text) -> Document
{
  xmlDoc *doc = xmlReadMemory(text.c_str(), text.size(), nullptr, nullptr, XML_PARSE_NONET | XML_PARSE_NOBLANKS);
  if (!doc) {
    xmlError const *err = xmlGetLastError();
    throw Log::Failure("XML", "Could not parse document: {}", err && err->message ? err->message : "unknown error");
  }
  Document d(doc);
  if (!d.root()) { throw Log::Failure("XML", "Document has no root element"); }
  return d;
}

auto Document::root() const -> Node { return xmlDocGetRootElement(doc_.get()); }

auto Document::toString() const -> std::string
{
  xmlChar *buffer = nullptr;
  int      size = 0;
  xmlDocDumpFormatMemoryEnc(doc_.get(), &buffer, &size, "UTF-8", 1);
  if (!buffer) { throw Log::Failure("XML", "Could not serialize document"); }
  std::string const s(reinterpret_cast<char const *>(buffer), size);
  xmlFree(buffer);
  return s;
}

auto Name(Node n) -> std::string { return reinterpret_cast<char const *>(n->name); }

auto Text(Node n) -> std::string
{
  xmlChar *content = xmlNodeGetContent(n);
  if (!content) { return ""; }
  std::string const s(reinterpret_cast<char const *>(content));
  xmlFree(content);
  auto const b = s.find_first_not_of(" \t\r\n");
  if (b == std::string::npos) { return ""; }
  auto const e = s.find_last_not_of(" \t\r\n");
  return s.substr(b, e - b + 1);
}

auto Children(Node parent) -> std::vector<Node>
{
  std::vector<Node> nodes;
  for (Node c = parent->children; c; c = c->next) {
    if (c->type == XML_ELEMENT_NODE) { nodes.push_back(c); }
  }
  return nodes;
}

auto Children(Node parent, std::string const &name) -> std::vector<Node>
{
  auto nodes = Children(parent);
  std::erase_if(nodes, [&name](Node n) { return Name(n) != name; });
  return nodes;
}

auto Child(Node parent, std::string const &name) -> Node
{
  for (Node c = parent->children; c; c = c->next) {
    if (c->type == XML_ELEMENT_NODE && Name(c) == name) { return c; }
  }
  return nullptr;
}

auto Find(Node parent, std::vector<std::string> const &path) -> Node
{
  Node n = parent;
  for (auto const &step : path) {
    n = Child(n, step);
    if (!n) { return nullptr; }
  }
  return n;
}

auto AddChild(Node parent, std::string const &name, std::string const &text) -> Node
{
  // xmlNewTextChild escapes reserved characters, xmlNewChild does not
  Node n = xmlNewTextChild(parent, parent->ns, Cast(name), text.empty() ? nullptr : Cast(text));
  if (!n) { throw Log::Failure("XML", "Could not add element {}", name); }
  return n;
}

} // namespace XML
} // namespace sn
