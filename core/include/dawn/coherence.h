#pragma once

#include "dawn/json_mini.h"

#include <string>

namespace dawn {

struct CoherenceScore {
    double score{0.0};   // 0.0 .. 1.0
    std::string evidence;
};

// Compares a produced representation against the project's original intent.
// Implementations must be deterministic for a given pair of documents.
class ICoherenceScorer {
public:
    virtual ~ICoherenceScorer() = default;
    virtual const char* name() const = 0;
    // Either document may be null.
    virtual CoherenceScore score(json_object* current, json_object* baseline) const = 0;
};

// Fraction of baseline node names still present in current.nodes[].
// Halved when the number of new nodes exceeds twice the baseline count.
class StructuralCoherenceScorer : public ICoherenceScorer {
public:
    const char* name() const override { return "structural"; }
    CoherenceScore score(json_object* current, json_object* baseline) const override;
};

// Jaccard overlap of the node-name sets of two IR-like documents.
// Returns -1 when either side has no nodes[] array.
double node_set_overlap(json_object* a, json_object* b);

} // namespace dawn
