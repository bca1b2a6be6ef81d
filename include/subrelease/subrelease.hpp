#pragma once

/// @file subrelease.hpp
/// @brief Main header for the subrelease C++ library
///
/// This is the unified include for all subrelease functionality.

#include <subrelease/config.hpp>
#include <subrelease/errors.hpp>
#include <subrelease/filename/filename.hpp>
#include <subrelease/language/language.hpp>
#include <subrelease/matching/matching.hpp>
#include <subrelease/release/release.hpp>
#include <subrelease/release/tags.hpp>

/// @namespace subrelease
/// @brief The subrelease library namespace
///
/// Extracts release names from subtitle filenames and pairs subtitles with
/// the videos they belong to.
namespace subrelease {

/// Library version string
constexpr const char* kVersion = "1.0.0";

/// Library version as integers
constexpr int kVersionMajor = 1;
constexpr int kVersionMinor = 0;
constexpr int kVersionPatch = 0;

}  // namespace subrelease
