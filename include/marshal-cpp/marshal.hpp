/// @file marshal.hpp
/// @brief Umbrella header for the marshal-cpp library.
///
/// Include this single header for access to all public types:
/// decode/encode, Document and Graph, Value, Table, the schema layer,
/// the RGSS records, Registry, batch decode, JSON export, Logger and Error.

#pragma once

#include <marshal-cpp/batch.hpp>
#include <marshal-cpp/codec.hpp>
#include <marshal-cpp/error.hpp>
#include <marshal-cpp/graph.hpp>
#include <marshal-cpp/json.hpp>
#include <marshal-cpp/logger.hpp>
#include <marshal-cpp/registry.hpp>
#include <marshal-cpp/rgss.hpp>
#include <marshal-cpp/schema.hpp>
#include <marshal-cpp/table.hpp>
#include <marshal-cpp/value.hpp>
