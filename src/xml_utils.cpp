#include "xml_utils.hpp"
#include "localization.hpp"
#include "utils.hpp"

#include <string_view>

namespace fs = std::filesystem;

namespace {
    const xmlChar* to_xml(const char* s) {
        return reinterpret_cast<const xmlChar*>(s);
    }

    std::string last_xml_error() {
        const xmlError* err = xmlGetLastError();
        if (!err || !err->message) {
            return get_string("error.unknown");
        }
        std::string msg = err->message;
        while (!msg.empty() && (msg.back() == '\n' || msg.back() == '\r')) msg.pop_back();
        return msg;
    }
}

XmlDocument xml_read_file(const fs::path& path, ErrorKind error_kind) {
    return xml_read_memory(read_file(path), path.string(), error_kind);
}

XmlDocument xml_read_memory(const std::string& content, const std::string& origin, ErrorKind error_kind) {
    xmlResetLastError();
    xmlDocPtr document = xmlReadMemory(content.data(), static_cast<int>(content.size()), origin.c_str(), nullptr,
                                       XML_PARSE_NONET | XML_PARSE_NOERROR | XML_PARSE_NOWARNING | XML_PARSE_NOBLANKS);
    if (document == nullptr) {
        throw PackgetException(error_kind, string_format("error.xml_parse_failed", origin, last_xml_error()));
    }
    XmlDocument doc(document);
    if (xmlDocGetRootElement(doc.get()) == nullptr) {
        throw PackgetException(error_kind, string_format("error.xml_parse_failed", origin, get_string("error.xml_no_root")));
    }
    return doc;
}

void xml_write_file(xmlDoc* doc, const fs::path& path) {
    xmlChar* buffer = nullptr;
    int size = 0;
    xmlDocDumpFormatMemoryEnc(doc, &buffer, &size, "UTF-8", 1);
    if (buffer == nullptr) {
        throw PackgetException(ErrorKind::FileSystem, string_format("error.write_file_failed", path.string()));
    }
    std::string content(reinterpret_cast<const char*>(buffer), static_cast<size_t>(size));
    xmlFree(buffer);
    write_file_atomic(path, content);
}

std::string xml_node_name(const xmlNode* node) {
    return node && node->name ? reinterpret_cast<const char*>(node->name) : "";
}

std::optional<std::string> xml_property(const xmlNode* node, const char* name) {
    xmlChar* value = xmlGetProp(node, to_xml(name));
    if (value == nullptr) {
        return std::nullopt;
    }
    std::string result = reinterpret_cast<const char*>(value);
    xmlFree(value);
    return result;
}

std::string xml_content(const xmlNode* node) {
    xmlChar* data = xmlNodeGetContent(node);
    if (data == nullptr) {
        return "";
    }
    std::string result = reinterpret_cast<const char*>(data);
    xmlFree(data);

    const auto first = result.find_first_not_of(" \t\r\n");
    if (first == std::string::npos) return "";
    const auto last = result.find_last_not_of(" \t\r\n");
    return result.substr(first, last - first + 1);
}

xmlNode* xml_child(const xmlNode* node, const char* name) {
    for (xmlNode* child = node->children; child != nullptr; child = child->next) {
        if (child->type == XML_ELEMENT_NODE && xml_node_name(child) == name) {
            return child;
        }
    }
    return nullptr;
}

std::vector<xmlNode*> xml_children(const xmlNode* node, const char* name) {
    std::vector<xmlNode*> result;
    for (xmlNode* child = node->children; child != nullptr; child = child->next) {
        if (child->type == XML_ELEMENT_NODE && xml_node_name(child) == name) {
            result.push_back(child);
        }
    }
    return result;
}

std::string xml_field(const xmlNode* node, const char* name) {
    if (const xmlNode* child = xml_child(node, name)) {
        return xml_content(child);
    }
    return xml_property(node, name).value_or("");
}

xmlNode* xml_add_child(xmlNode* parent, const char* name, const std::string& text) {
    return xmlNewTextChild(parent, nullptr, to_xml(name), text.empty() ? nullptr : to_xml(text.c_str()));
}

void xml_set_property(xmlNode* node, const char* name, const std::string& value) {
    xmlSetProp(node, to_xml(name), to_xml(value.c_str()));
}
