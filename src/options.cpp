#include "riverconn/core/options.hpp"

namespace riverconn::core {

IndexOptions with_fields(IndexOptions opts, const FieldNames& fields) {
  opts.weight_field = fields.weight;
  opts.dispersal.distance_field = fields.distance;
  opts.fragmentation.pass_u_field = fields.pass_u;
  opts.fragmentation.pass_d_field = fields.pass_d;
  return opts;
}

} // namespace riverconn::core
