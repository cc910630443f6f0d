//! # Wire Library
//!
//! Umbrella header for the wire value tree, its parser and its errors.

#pragma once

#include "wire/wire_error.hpp"
#include "wire/wire_parser.hpp"
#include "wire/wire_value.hpp"
