/// @file json-crdt.hpp
/// @brief Umbrella header for the json-crdt-cpp library.
///
/// Include this single header for access to all public types:
/// Model, Patch, PatchBuilder, the operation structs, the patch codecs,
/// JsonCrdtDiff, the clocks, and Error.

#pragma once

#include <json-crdt-cpp/clock.hpp>
#include <json-crdt-cpp/codec.hpp>
#include <json-crdt-cpp/diff.hpp>
#include <json-crdt-cpp/error.hpp>
#include <json-crdt-cpp/logging.hpp>
#include <json-crdt-cpp/model.hpp>
#include <json-crdt-cpp/nodes.hpp>
#include <json-crdt-cpp/op.hpp>
#include <json-crdt-cpp/patch.hpp>
#include <json-crdt-cpp/patch_builder.hpp>
#include <json-crdt-cpp/rga.hpp>
#include <json-crdt-cpp/types.hpp>
#include <json-crdt-cpp/value.hpp>
