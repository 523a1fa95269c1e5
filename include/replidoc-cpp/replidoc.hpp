/// @file replidoc.hpp
/// @brief Umbrella header for the replidoc-cpp library.
///
/// Include this single header for access to all public types:
/// Document, Context, ObjectStore, ActorId, ObjectId, InputValue, Op,
/// Change, Patch, and MutationError.

#pragma once

#include <replidoc-cpp/change.hpp>
#include <replidoc-cpp/context.hpp>
#include <replidoc-cpp/document.hpp>
#include <replidoc-cpp/error.hpp>
#include <replidoc-cpp/object_store.hpp>
#include <replidoc-cpp/op.hpp>
#include <replidoc-cpp/patch.hpp>
#include <replidoc-cpp/patch_applier.hpp>
#include <replidoc-cpp/types.hpp>
#include <replidoc-cpp/value.hpp>
