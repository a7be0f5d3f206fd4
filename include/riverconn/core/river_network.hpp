/* River network: reaches (vertices) joined by confluence and barrier links. */
#pragma once

#include <cstdint>
#include <map>
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <vector>

#include "riverconn/core/types.hpp"

namespace riverconn::core {

// Notes on orientation:
// - A link (from, to) is stored exactly as given. Once directionality has been
//   assigned (see directionality.hpp), from -> to is the downstream direction.
// - Symmetric computations ignore orientation entirely.
//
// Numeric attributes are stored per reach or per link as float64 columns;
// a missing value is NaN (the equivalent of NA in tabular tools).
class RiverNetwork {
public:
  [[nodiscard]] static RiverNetwork from_arrays(
      std::int32_t num_reaches,
      std::span<const ReachId> from,
      std::span<const ReachId> to,
      std::span<const LinkType> type);

  // Attribute setters; values.size() must match the number of reaches/links.
  void set_reach_attribute(std::string name, std::vector<double> values);
  void set_link_attribute(std::string name, std::vector<double> values);
  void set_reach_labels(std::vector<std::string> labels);
  // Empty strings mean "no barrier id" (confluences normally have none).
  void set_barrier_ids(std::vector<std::string> ids);

  [[nodiscard]] std::int32_t num_reaches() const noexcept { return num_reaches_; }
  [[nodiscard]] std::int32_t num_links() const noexcept { return static_cast<std::int32_t>(from_.size()); }

  [[nodiscard]] std::span<const ReachId> link_from_view() const noexcept { return from_; }
  [[nodiscard]] std::span<const ReachId> link_to_view() const noexcept { return to_; }
  [[nodiscard]] std::span<const LinkType> link_type_view() const noexcept { return type_; }
  [[nodiscard]] const std::vector<std::string>& barrier_ids() const noexcept { return barrier_ids_; }
  [[nodiscard]] const std::vector<std::string>& reach_labels() const noexcept { return labels_; }

  [[nodiscard]] bool has_reach_attribute(std::string_view name) const;
  [[nodiscard]] bool has_link_attribute(std::string_view name) const;
  // Throws InvalidAttribute naming the field when it does not exist.
  [[nodiscard]] std::span<const double> reach_attribute(std::string_view name) const;
  [[nodiscard]] std::span<const double> link_attribute(std::string_view name) const;
  [[nodiscard]] std::vector<std::string> reach_attribute_names() const;
  [[nodiscard]] std::vector<std::string> link_attribute_names() const;

  // Links carrying the given barrier id (empty if none).
  [[nodiscard]] std::vector<LinkId> links_of_barrier(std::string_view barrier_id) const;

  // Undirected incidence in CSR form: for reach v, entries
  // [incident_offsets[v], incident_offsets[v+1]) list (neighbor, link).
  [[nodiscard]] std::span<const std::int32_t> incident_offsets_view() const noexcept { return inc_offsets_; }
  [[nodiscard]] std::span<const ReachId> incident_reach_view() const noexcept { return inc_reach_; }
  [[nodiscard]] std::span<const LinkId> incident_link_view() const noexcept { return inc_link_; }

private:
  void build_incidence();

  std::int32_t num_reaches_ {0};
  std::vector<ReachId> from_ {};
  std::vector<ReachId> to_ {};
  std::vector<LinkType> type_ {};
  std::vector<std::string> barrier_ids_ {};
  std::vector<std::string> labels_ {};
  std::map<std::string, std::vector<double>, std::less<>> reach_attrs_ {};
  std::map<std::string, std::vector<double>, std::less<>> link_attrs_ {};

  std::vector<std::int32_t> inc_offsets_ {};
  std::vector<ReachId> inc_reach_ {};
  std::vector<LinkId> inc_link_ {};
};

} // namespace riverconn::core
