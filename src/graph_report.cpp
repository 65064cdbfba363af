/*
  Graph::textual_report: multi-line diagnostic summary.
*/
#include "ensgraph/core/graph.hpp"

#include <algorithm>
#include <iomanip>
#include <sstream>
#include <string>
#include <vector>

namespace ensgraph::core {

namespace {

// "name (count)" for the most frequent types, at most `limit` of them.
std::string describe_types(const TypeAssignments& types, std::size_t limit) {
  const auto counts = types.type_counts();
  std::vector<std::size_t> order(counts.size());
  for (std::size_t i = 0; i < order.size(); ++i) order[i] = i;
  std::stable_sort(order.begin(), order.end(), [&](std::size_t a, std::size_t b) { return counts[a] > counts[b]; });
  std::ostringstream os;
  for (std::size_t i = 0; i < order.size() && i < limit; ++i) {
    if (i > 0) os << ", ";
    os << types.vocabulary().translate(static_cast<std::uint16_t>(order[i])) << " (" << counts[order[i]] << ")";
  }
  if (order.size() > limit) os << ", ... " << order.size() - limit << " more";
  return os.str();
}

} // namespace

std::string Graph::textual_report() const {
  std::ostringstream os;
  os << std::setprecision(4);
  os << "Graph '" << name_ << "' is " << (directed_ ? "directed" : "undirected") << (has_edge_weights() ? ", weighted" : "")
     << (num_selfloops_ > 0 ? ", with self-loops" : "") << ".\n";
  os << "Nodes: " << num_nodes() << " (" << num_singletons_ << " singletons, " << num_traps_ << " traps)\n";
  os << "Edges: " << num_edges() << " (" << num_directed_edges() << " directed, " << num_selfloops_
     << " self-loops)\n";
  os << "Density: " << density() << "\n";
  os << "Degree: min " << min_degree_ << ", max " << max_degree_ << ", mean " << mean_degree() << ", median "
     << median_degree() << "\n";
  if (weights_ && !weights_->empty()) {
    const auto [lo, hi] = std::minmax_element(weights_->begin(), weights_->end());
    double total = 0.0;
    for (auto w : *weights_) total += w;
    os << "Weights: min " << *lo << ", max " << *hi << ", mean " << total / static_cast<double>(weights_->size())
       << "\n";
  }
  if (node_types_) {
    os << "Node types: " << node_types_->num_types() << (node_types_->is_multilabel() ? " (multi-label)" : "")
       << ", " << node_types_->num_untyped() << " untyped nodes: " << describe_types(*node_types_, 10) << "\n";
  }
  if (edge_types_) {
    os << "Edge types: " << edge_types_->num_types() << ", " << edge_types_->num_untyped()
       << " untyped directed edges: " << describe_types(*edge_types_, 10) << "\n";
  }
  return os.str();
}

} // namespace ensgraph::core
