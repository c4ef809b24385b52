/// @file jsonverse.hpp
/// @brief Umbrella header for jsonverse-cpp.

#pragma once

#include <jsonverse-cpp/backend.hpp>
#include <jsonverse-cpp/diff.hpp>
#include <jsonverse-cpp/document.hpp>
#include <jsonverse-cpp/document_store.hpp>
#include <jsonverse-cpp/error.hpp>
#include <jsonverse-cpp/json.hpp>
#include <jsonverse-cpp/merge.hpp>
#include <jsonverse-cpp/options.hpp>
#include <jsonverse-cpp/patch.hpp>
#include <jsonverse-cpp/repository.hpp>
#include <jsonverse-cpp/save_coordinator.hpp>
#include <jsonverse-cpp/tree.hpp>
#include <jsonverse-cpp/types.hpp>
#include <jsonverse-cpp/version.hpp>
#include <jsonverse-cpp/version_store.hpp>
