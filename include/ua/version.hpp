#pragma once
#include <string_view>

namespace ua {

constexpr std::string_view LIBRARY_VERSION       = "0.1.0";
constexpr std::string_view OPCUA_VERSION         = "1.05";

/// Namespace index 0 of every namespace table.
constexpr std::string_view OPCUA_NAMESPACE_URI   = "http://opcfoundation.org/UA/";
/// Target namespace of the built-in XML schema.
constexpr std::string_view XML_TYPES_NAMESPACE   = "http://opcfoundation.org/UA/2008/02/Types.xsd";

} // namespace ua
