#pragma once

#include "veilrelay/sdk/types.hpp"
#include <boost/property_tree/ptree.hpp>
#include <string>

namespace veilrelay {
namespace sdk {

/**
 * @brief JSON helpers on top of Boost.PropertyTree
 *
 * property_tree writes every value as a string, so request bodies that need
 * numbers or booleans, or that embed provider JSON verbatim, are composed as
 * text with quote(). Parsing goes through read_json. Literals null, true and
 * false parse to the strings "null", "true" and "false".
 */
namespace json {

using Tree = boost::property_tree::ptree;

Result<Tree> parse(const std::string& text);

// Quoted and escaped JSON string literal
std::string quote(const std::string& value);

// Serialize a tree, e.g. a provider payload kept for a later request
std::string serialize(const Tree& tree);

bool is_null(const Tree& node);

// Child value as text, empty when absent or null
std::string get_string(const Tree& node, const std::string& path);

// Numeric child that may arrive as a JSON number or a decimal string
Result<uint64_t> get_u64(const Tree& node, const std::string& path);

} // namespace json

} // namespace sdk
} // namespace veilrelay
