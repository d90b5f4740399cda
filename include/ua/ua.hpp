#pragma once

/// Umbrella header for the uacodec OPC UA type-system codec library.

#include "version.hpp"
#include "error.hpp"
#include "builtin_types.hpp"
#include "variant.hpp"
#include "encodeable.hpp"
#include "type_registry.hpp"
#include "limits.hpp"
#include "context.hpp"
#include "encoder.hpp"
#include "binary_codec.hpp"
#include "xml_codec.hpp"
#include "json_codec.hpp"
#include "codec.hpp"
