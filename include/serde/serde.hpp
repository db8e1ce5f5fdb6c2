#pragma once

// Data model and protocol
#include "error.hpp"
#include "log.hpp"
#include "contract.hpp"
#include "any_value.hpp"
#include "protocol.hpp"

// Formats
#include "json.hpp"
#include "yaml.hpp"

// Polymorphic values
#include "typetag.hpp"
