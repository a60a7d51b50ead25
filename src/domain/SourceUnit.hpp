/**
 * @file SourceUnit.hpp
 * @brief A single submitted source file after upstream extraction.
 */

#pragma once
#include <string>

namespace codegrader::domain {

/**
 * @struct SourceUnit
 * @brief Immutable (name, source text) pair handed to the grading pipeline.
 */
struct SourceUnit {
    std::string name; ///< Original filename (e.g. "bubble_sort.py").
    std::string text; ///< Decoded source text.
};

} // namespace codegrader::domain
