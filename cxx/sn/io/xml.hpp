#pragma once

#include <libxml/tree.h>

#include <memory>
#include <string>
#include <vector>

namespace sn {
namespace XML {

using Node = xmlNode *;

/*
 * Owns a libxml2 document. Nodes handed out by the helpers below are only valid while it lives.
 */
struct Document
{
  Document(std::string const &rootName, std::string const &ns = "");
  static auto Parse(std::string const &text) -> Document;

  auto root() const -> Node;
  auto toString() const -> std::string;

private:
  Document(xmlDoc *doc);
  std::unique_ptr<xmlDoc, void (*)(xmlDoc *)> doc_;
};

auto Name(Node n) -> std::string;
auto Text(Node n) -> std::string;
auto Child(Node parent, std::string const &name) -> Node; // nullptr if absent
auto Children(Node parent) -> std::vector<Node>;          // Element children only
auto Children(Node parent, std::string const &name) -> std::vector<Node>;
auto Find(Node parent, std::vector<std::string> const &path) -> Node; // nullptr if any step is absent
auto AddChild(Node parent, std::string const &name, std::string const &text = "") -> Node;

} // namespace XML
} // namespace sn
