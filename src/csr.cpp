/*
  Csr: read-side queries over the offset/destination arrays.

  Edge existence and edge-id lookups binary-search the sorted destination
  slice of the source node; in a multigraph the lower bound is the first of
  the parallel edges.
*/
#include "ensgraph/core/csr.hpp"

#include <algorithm>
#include <istream>
#include <ostream>
#include <stdexcept>
#include <string>

#include "ensgraph/core/error.hpp"

namespace ensgraph::core {

namespace {
constexpr std::uint64_t kDumpMagic = 0x3152534347534e45ULL; // "ENSGCSR1"

template <typename T>
void write_vector(std::ostream& os, const std::vector<T>& v) {
  auto n = static_cast<std::uint64_t>(v.size());
  os.write(reinterpret_cast<const char*>(&n), sizeof(n));
  os.write(reinterpret_cast<const char*>(v.data()), static_cast<std::streamsize>(n * sizeof(T)));
}

// Elements read per chunk; a declared length is never trusted for allocation.
constexpr std::uint64_t kReadChunk = std::uint64_t {1} << 16;

template <typename T>
std::vector<T> read_vector(std::istream& is) {
  std::uint64_t n = 0;
  if (!is.read(reinterpret_cast<char*>(&n), sizeof(n))) {
    throw MalformedInput("truncated CSR dump: missing array length");
  }
  std::vector<T> v;
  if (n > v.max_size() / sizeof(T)) {
    throw MalformedInput("CSR dump declares an array of " + std::to_string(n) + " elements");
  }
  while (v.size() < n) {
    const auto done = static_cast<std::uint64_t>(v.size());
    const auto chunk = std::min<std::uint64_t>(kReadChunk, n - done);
    v.resize(static_cast<std::size_t>(done + chunk));
    if (!is.read(reinterpret_cast<char*>(v.data() + done), static_cast<std::streamsize>(chunk * sizeof(T)))) {
      throw MalformedInput("truncated CSR dump: array shorter than its declared length");
    }
  }
  return v;
}
} // namespace

Csr::Csr(std::vector<EdgeId> offsets, std::vector<NodeId> destinations)
    : offsets_(std::move(offsets)), destinations_(std::move(destinations)) {
  if (offsets_.empty()) offsets_.push_back(0);
}

NodeId Csr::get_unchecked_source(EdgeId edge) const noexcept {
  // Last node whose first edge is <= edge.
  auto it = std::upper_bound(offsets_.begin(), offsets_.end(), edge);
  return static_cast<NodeId>((it - offsets_.begin()) - 1);
}

EdgeId Csr::get_unchecked_edge_id_lower_bound(NodeId src, NodeId dst) const noexcept {
  auto neigh = get_unchecked_neighbours(src);
  auto it = std::lower_bound(neigh.begin(), neigh.end(), dst);
  return offsets_[src] + static_cast<EdgeId>(it - neigh.begin());
}

void Csr::check_node(NodeId node) const {
  if (node >= num_nodes()) throw InvalidNodeId(node, num_nodes());
}

EdgeId Csr::degree(NodeId src) const {
  check_node(src);
  return get_unchecked_degree(src);
}

std::span<const NodeId> Csr::neighbours(NodeId src) const {
  check_node(src);
  return get_unchecked_neighbours(src);
}

NodePair Csr::endpoints(EdgeId edge) const {
  if (edge >= num_edges()) throw InvalidEdgeId(edge, num_edges());
  return {get_unchecked_source(edge), get_unchecked_destination(edge)};
}

std::optional<EdgeId> Csr::find_edge(NodeId src, NodeId dst) const {
  check_node(src);
  check_node(dst);
  EdgeId e = get_unchecked_edge_id_lower_bound(src, dst);
  if (e < offsets_[src + 1] && destinations_[static_cast<std::size_t>(e)] == dst) return e;
  return std::nullopt;
}

bool Csr::has_edge(NodeId src, NodeId dst) const {
  return find_edge(src, dst).has_value();
}

void Csr::dump(std::ostream& os) const {
  os.write(reinterpret_cast<const char*>(&kDumpMagic), sizeof(kDumpMagic));
  write_vector(os, offsets_);
  write_vector(os, destinations_);
  if (!os) throw std::runtime_error("failed to write CSR dump");
}

Csr Csr::load(std::istream& is) {
  std::uint64_t magic = 0;
  if (!is.read(reinterpret_cast<char*>(&magic), sizeof(magic)) || magic != kDumpMagic) {
    throw MalformedInput("stream does not hold a CSR dump");
  }
  auto offsets = read_vector<EdgeId>(is);
  auto destinations = read_vector<NodeId>(is);
  if (offsets.empty() || offsets.front() != 0 || offsets.back() != destinations.size()) {
    throw MalformedInput("CSR dump offsets do not match the destinations array");
  }
  const auto n = offsets.size() - 1;
  for (std::size_t i = 0; i < n; ++i) {
    if (offsets[i] > offsets[i + 1]) throw MalformedInput("CSR dump offsets are not monotone");
  }
  for (std::size_t i = 0; i < n; ++i) {
    for (auto e = offsets[i]; e < offsets[i + 1]; ++e) {
      const auto d = destinations[static_cast<std::size_t>(e)];
      if (d >= n) throw MalformedInput("CSR dump destination " + std::to_string(d) + " is out of range");
      if (e > offsets[i] && destinations[static_cast<std::size_t>(e - 1)] > d) {
        throw MalformedInput("CSR dump neighbours of node " + std::to_string(i) + " are not sorted");
      }
    }
  }
  return Csr(std::move(offsets), std::move(destinations));
}

std::uint64_t Csr::hash() const noexcept {
  std::uint64_t h = offsets_.size();
  for (auto o : offsets_) hash_combine(h, o);
  for (auto d : destinations_) hash_combine(h, d);
  return h;
}

} // namespace ensgraph::core
