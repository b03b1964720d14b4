#include "veilrelay/sdk/Json.hpp"
#include <boost/property_tree/json_parser.hpp>
#include <cstdio>
#include <sstream>

namespace veilrelay {
namespace sdk {
namespace json {

namespace pt = boost::property_tree;

Result<Tree> parse(const std::string& text) {
    try {
        std::istringstream iss(text);
        Tree tree;
        pt::read_json(iss, tree);
        return tree;
    } catch (const pt::json_parser_error& e) {
        return {ErrorCode::MALFORMED_RESPONSE, std::string("Invalid JSON: ") + e.message()};
    }
}

std::string quote(const std::string& value) {
    std::string out;
    out.reserve(value.size() + 2);
    out += '"';
    for (unsigned char c : value) {
        switch (c) {
            case '"': out += "\\\""; break;
            case '\\': out += "\\\\"; break;
            case '\n': out += "\\n"; break;
            case '\r': out += "\\r"; break;
            case '\t': out += "\\t"; break;
            case '\b': out += "\\b"; break;
            case '\f': out += "\\f"; break;
            default:
                if (c < 0x20) {
                    char buf[8];
                    std::snprintf(buf, sizeof(buf), "\\u%04x", c);
                    out += buf;
                } else {
                    out += static_cast<char>(c);
                }
        }
    }
    out += '"';
    return out;
}

std::string serialize(const Tree& tree) {
    std::ostringstream oss;
    pt::write_json(oss, tree, false);
    std::string text = oss.str();
    while (!text.empty() && (text.back() == '\n' || text.back() == ' ')) {
        text.pop_back();
    }
    return text;
}

bool is_null(const Tree& node) {
    return node.empty() && node.data() == "null";
}

std::string get_string(const Tree& node, const std::string& path) {
    auto child = node.get_child_optional(path);
    if (!child || is_null(*child)) {
        return "";
    }
    return child->data();
}

Result<uint64_t> get_u64(const Tree& node, const std::string& path) {
    auto child = node.get_child_optional(path);
    if (!child || is_null(*child) || !child->empty()) {
        return {ErrorCode::MALFORMED_RESPONSE, "Missing numeric field: " + path};
    }

    const std::string& text = child->data();
    if (text.empty() || text.find_first_not_of("0123456789") != std::string::npos) {
        return {ErrorCode::MALFORMED_RESPONSE, "Field is not an unsigned integer: " + path};
    }

    try {
        return static_cast<uint64_t>(std::stoull(text));
    } catch (const std::out_of_range&) {
        return {ErrorCode::MALFORMED_RESPONSE, "Field out of range: " + path};
    }
}

} // namespace json
} // namespace sdk
} // namespace veilrelay
