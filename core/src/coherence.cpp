#include "dawn/coherence.h"

#include <algorithm>
#include <set>

namespace dawn {

namespace {

json_object* nodes_of(json_object* doc) {
    json_object* n = json_mini::get(doc, "nodes");
    return json_mini::is_array(n) ? n : nullptr;
}

std::set<std::string> node_names(json_object* nodes) {
    std::set<std::string> out;
    const size_t n = nodes ? json_object_array_length(nodes) : 0;
    for (size_t i = 0; i < n; i++) {
        auto name = json_mini::get_string(json_object_array_get_idx(nodes, i), "name");
        if (name) out.insert(*name);
    }
    return out;
}

} // namespace

CoherenceScore StructuralCoherenceScorer::score(json_object* current, json_object* baseline) const {
    if (!json_mini::is_object(current) || !json_mini::is_object(baseline)) {
        return {0.0, "Missing IR for comparison"};
    }

    json_object* orig = nodes_of(baseline);
    json_object* curr = nodes_of(current);
    const size_t orig_n = orig ? json_object_array_length(orig) : 0;
    if (orig_n == 0) return {1.0, "No original nodes to compare against"};

    const std::set<std::string> orig_names = node_names(orig);
    size_t overlap = 0;
    const size_t curr_n = curr ? json_object_array_length(curr) : 0;
    for (size_t i = 0; i < curr_n; i++) {
        auto name = json_mini::get_string(json_object_array_get_idx(curr, i), "name");
        if (name && orig_names.count(*name)) overlap++;
    }

    CoherenceScore s;
    s.score = (double)overlap / (double)orig_n;
    s.evidence = "Preserved " + std::to_string(overlap) + " out of " + std::to_string(orig_n) + " original nodes.";

    const size_t added = curr_n - overlap;
    if (added > orig_n * 2) {
        s.score *= 0.5;
        s.evidence += " Warning: high entropy with " + std::to_string(added) + " new nodes.";
    }
    s.score = std::max(0.0, std::min(1.0, s.score));
    return s;
}

double node_set_overlap(json_object* a, json_object* b) {
    json_object* na = nodes_of(a);
    json_object* nb = nodes_of(b);
    if (!na || !nb) return -1.0;

    const auto sa = node_names(na);
    const auto sb = node_names(nb);
    if (sa.empty() && sb.empty()) return 1.0;

    size_t inter = 0;
    for (const auto& s : sa) inter += sb.count(s);
    const size_t uni = sa.size() + sb.size() - inter;
    return (double)inter / (double)uni;
}

} // namespace dawn
