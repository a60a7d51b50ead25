/**
 * @file SyntaxFeatureExtractor.hpp
 * @brief Single-pass structural feature extraction over a syntax tree.
 */

#pragma once
#include "domain/FeatureRecord.hpp"
#include "domain/SyntaxTree.hpp"

namespace codegrader::application {

/**
 * @class SyntaxFeatureExtractor
 * @brief Pre-order walk that tallies loops, branches, definitions, data structures
 * and algorithm hints, and records the node-type token stream used for fingerprints.
 *
 * Stateless; the same tree always yields an identical FeatureRecord.
 */
class SyntaxFeatureExtractor {
public:
    /// @throws std::runtime_error when the tree is deeper than domain::kMaxSyntaxDepth.
    domain::FeatureRecord extract(const domain::SyntaxNode& root) const;
};

} // namespace codegrader::application
