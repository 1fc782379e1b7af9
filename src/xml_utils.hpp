#pragma once

#include "exception.hpp"

#include <libxml/parser.h>
#include <libxml/tree.h>

#include <filesystem>
#include <memory>
#include <optional>
#include <string>
#include <vector>

struct XmlDocDeleter {
    void operator()(xmlDoc* doc) const {
        if (doc) {
            xmlFreeDoc(doc);
        }
    }
};

using XmlDocument = std::unique_ptr<xmlDoc, XmlDocDeleter>;

// Parses `path`; failures are reported with `error_kind`.
XmlDocument xml_read_file(const std::filesystem::path& path, ErrorKind error_kind);
// `origin` names the source in error messages.
XmlDocument xml_read_memory(const std::string& content, const std::string& origin, ErrorKind error_kind);
// Serializes `doc` with indentation and atomically replaces `path`.
void xml_write_file(xmlDoc* doc, const std::filesystem::path& path);

std::string xml_node_name(const xmlNode* node);
std::optional<std::string> xml_property(const xmlNode* node, const char* name);
std::string xml_content(const xmlNode* node);
// First element child named `name`, or nullptr.
xmlNode* xml_child(const xmlNode* node, const char* name);
std::vector<xmlNode*> xml_children(const xmlNode* node, const char* name);
// Text of child element `name`, falling back to attribute `name`.
std::string xml_field(const xmlNode* node, const char* name);

xmlNode* xml_add_child(xmlNode* parent, const char* name, const std::string& text = "");
void xml_set_property(xmlNode* node, const char* name, const std::string& value);
