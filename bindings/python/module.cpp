/*
  Pybind11 module exposing the riverconn core to Python.

  Notes:
    - Accepts NumPy arrays (C-contiguous) for link endpoints, link types and
      attribute columns; attribute columns are copied into the network.
    - Matrices are returned as float64 (n, n) arrays, M[i, j] describing the
      movement from reach j to reach i.
    - Library errors surface as ValueError subclasses (InvalidAttribute,
      InvalidParameter, InvalidConfiguration).
*/
#include <pybind11/pybind11.h>
#include <pybind11/eigen.h>
#include <pybind11/numpy.h>
#include <pybind11/stl.h>
#include <algorithm>
#include <span>

#include "riverconn/core/directionality.hpp"
#include "riverconn/core/engine.hpp"
#include "riverconn/core/error.hpp"
#include "riverconn/core/river_network.hpp"
#include "riverconn/core/types.hpp"

namespace py = pybind11;
using namespace riverconn::core;

// Helpers to check NumPy arrays
template <typename T>
static std::span<const T> as_span(const py::array& arr, const char* name) {
  if (!py::isinstance<py::array_t<T>>(arr)) {
    throw py::type_error(std::string(name) + ": expected numpy array of correct dtype");
  }
  if (!(arr.flags() & py::array::c_style)) {
    throw py::type_error(std::string(name) + ": array must be C-contiguous (use np.ascontiguousarray)");
  }
  auto buf = arr.request();
  if (buf.ndim != 1) {
    throw py::type_error(std::string(name) + ": expected a 1-D array");
  }
  return std::span<const T>(static_cast<const T*>(buf.ptr), static_cast<std::size_t>(buf.size));
}

using ColumnArray = py::array_t<double, py::array::c_style | py::array::forcecast>;

static std::vector<double> to_column(const ColumnArray& arr, const char* name) {
  auto buf = arr.request();
  if (buf.ndim != 1) throw py::type_error(std::string(name) + ": expected a 1-D array");
  const auto* p = static_cast<const double*>(buf.ptr);
  return std::vector<double>(p, p + buf.size);
}

static py::array_t<double> to_array(std::span<const double> s) {
  py::array_t<double> arr(s.size());
  std::copy(s.begin(), s.end(), arr.mutable_data());
  return arr;
}

PYBIND11_MODULE(_riverconn_core, m) {
  m.doc() = "riverconn C++ bindings";

  auto base_error = py::register_exception<Error>(m, "RiverConnError", PyExc_ValueError);
  py::register_exception<InvalidAttribute>(m, "InvalidAttribute", base_error.ptr());
  py::register_exception<InvalidParameter>(m, "InvalidParameter", base_error.ptr());
  py::register_exception<InvalidConfiguration>(m, "InvalidConfiguration", base_error.ptr());
  py::register_exception<ScenarioFailure>(m, "ScenarioFailure", base_error.ptr());

  py::enum_<LinkType>(m, "LinkType")
      .value("CONFLUENCE", LinkType::Confluence)
      .value("BARRIER", LinkType::Barrier);

  py::enum_<Directionality>(m, "Directionality")
      .value("SYMMETRIC", Directionality::Symmetric)
      .value("ASYMMETRIC", Directionality::Asymmetric);

  py::enum_<DispersalKernel>(m, "DispersalKernel")
      .value("EXPONENTIAL", DispersalKernel::Exponential)
      .value("THRESHOLD", DispersalKernel::Threshold)
      .value("LEPTOKURTIC", DispersalKernel::Leptokurtic);

  py::enum_<ConfluenceRule>(m, "ConfluenceRule")
      .value("ONCE_PER_TRAVERSAL", ConfluenceRule::OncePerTraversal)
      .value("AS_BARRIER", ConfluenceRule::AsBarrier);

  py::enum_<IndexScale>(m, "IndexScale")
      .value("FULL", IndexScale::Full)
      .value("REACH", IndexScale::Reach)
      .value("SUM", IndexScale::Sum);

  py::enum_<IndexMode>(m, "IndexMode")
      .value("TO", IndexMode::To)
      .value("FROM", IndexMode::From);

  py::enum_<PrioritizationMode>(m, "PrioritizationMode")
      .value("LEAVE_ONE_OUT", PrioritizationMode::LeaveOneOut)
      .value("ADD_ONE", PrioritizationMode::AddOne);

  py::class_<FieldNames>(m, "FieldNames")
      .def(py::init<>())
      .def_readwrite("distance", &FieldNames::distance)
      .def_readwrite("weight", &FieldNames::weight)
      .def_readwrite("pass_u", &FieldNames::pass_u)
      .def_readwrite("pass_d", &FieldNames::pass_d);

  py::class_<DispersalOptions>(m, "DispersalOptions")
      .def(py::init<>())
      .def_readwrite("kernel", &DispersalOptions::kernel)
      .def_readwrite("directionality", &DispersalOptions::directionality)
      .def_readwrite("param", &DispersalOptions::param)
      .def_readwrite("param_u", &DispersalOptions::param_u)
      .def_readwrite("param_d", &DispersalOptions::param_d)
      .def_readwrite("param_l", &DispersalOptions::param_l)
      .def_readwrite("distance_field", &DispersalOptions::distance_field);

  py::class_<StructuralOptions>(m, "StructuralOptions")
      .def(py::init<>())
      .def_readwrite("directionality", &StructuralOptions::directionality)
      .def_readwrite("pass_confluence", &StructuralOptions::pass_confluence)
      .def_readwrite("confluence_rule", &StructuralOptions::confluence_rule)
      .def_readwrite("pass_u_field", &StructuralOptions::pass_u_field)
      .def_readwrite("pass_d_field", &StructuralOptions::pass_d_field);

  py::class_<IndexOptions>(m, "IndexOptions")
      .def(py::init<>())
      .def_readwrite("structural", &IndexOptions::structural)
      .def_readwrite("functional", &IndexOptions::functional)
      .def_readwrite("scale", &IndexOptions::scale)
      .def_readwrite("mode", &IndexOptions::mode)
      .def_readwrite("weight_field", &IndexOptions::weight_field)
      .def_readwrite("fragmentation", &IndexOptions::fragmentation)
      .def_readwrite("dispersal", &IndexOptions::dispersal)
      .def("with_fields", [](const IndexOptions& o, const FieldNames& f){ return with_fields(o, f); });

  py::class_<PrioritizationOptions>(m, "PrioritizationOptions")
      .def(py::init<>())
      .def_readwrite("index", &PrioritizationOptions::index)
      .def_readwrite("mode", &PrioritizationOptions::mode)
      .def_readwrite("workers", &PrioritizationOptions::workers);

  py::class_<RiverNetwork>(m, "RiverNetwork")
      .def_static(
          "from_arrays",
          [](std::int32_t num_reaches, py::array from, py::array to, py::array type) {
            auto from_s = as_span<std::int32_t>(from, "from");
            auto to_s = as_span<std::int32_t>(to, "to");
            auto type_s = as_span<std::int32_t>(type, "type");
            if (from_s.size() != to_s.size() || from_s.size() != type_s.size()) {
              throw py::type_error("from, to and type must have the same length");
            }
            std::vector<LinkType> types;
            types.reserve(type_s.size());
            for (auto t : type_s) {
              if (t != static_cast<std::int32_t>(LinkType::Confluence) &&
                  t != static_cast<std::int32_t>(LinkType::Barrier)) {
                throw py::value_error("type values must be LinkType.CONFLUENCE (1) or LinkType.BARRIER (2)");
              }
              types.push_back(static_cast<LinkType>(t));
            }
            return RiverNetwork::from_arrays(num_reaches, from_s, to_s, types);
          },
          py::arg("num_reaches"), py::arg("from_"), py::arg("to"), py::arg("type"))
      .def("num_reaches", &RiverNetwork::num_reaches)
      .def("num_links", &RiverNetwork::num_links)
      .def("set_reach_attribute", [](RiverNetwork& net, std::string name, ColumnArray values){
        net.set_reach_attribute(std::move(name), to_column(values, "values"));
      }, py::arg("name"), py::arg("values"))
      .def("set_link_attribute", [](RiverNetwork& net, std::string name, ColumnArray values){
        net.set_link_attribute(std::move(name), to_column(values, "values"));
      }, py::arg("name"), py::arg("values"))
      .def("set_reach_labels", &RiverNetwork::set_reach_labels, py::arg("labels"))
      .def("set_barrier_ids", &RiverNetwork::set_barrier_ids, py::arg("ids"))
      .def("reach_attribute", [](const RiverNetwork& net, const std::string& name){
        return to_array(net.reach_attribute(name));
      })
      .def("link_attribute", [](const RiverNetwork& net, const std::string& name){
        return to_array(net.link_attribute(name));
      })
      .def("reach_attribute_names", &RiverNetwork::reach_attribute_names)
      .def("link_attribute_names", &RiverNetwork::link_attribute_names)
      .def_property_readonly("reach_labels", &RiverNetwork::reach_labels)
      .def_property_readonly("barrier_ids", &RiverNetwork::barrier_ids)
      .def("link_from", [](const RiverNetwork& net){
        auto s = net.link_from_view();
        py::array_t<std::int32_t> arr(s.size());
        std::copy(s.begin(), s.end(), arr.mutable_data());
        return arr;
      })
      .def("link_to", [](const RiverNetwork& net){
        auto s = net.link_to_view();
        py::array_t<std::int32_t> arr(s.size());
        std::copy(s.begin(), s.end(), arr.mutable_data());
        return arr;
      });

  m.def("orient_towards_outlet", &orient_towards_outlet, py::arg("net"), py::arg("outlet"));

  py::class_<IndexValue>(m, "IndexValue")
      .def_readonly("index", &IndexValue::index)
      .def_readonly("numerator", &IndexValue::numerator)
      .def_readonly("denominator", &IndexValue::denominator);

  py::class_<IndexResult>(m, "IndexResult")
      .def_readonly("scale", &IndexResult::scale)
      .def_readonly("mode", &IndexResult::mode)
      .def_readonly("values", &IndexResult::values)
      .def("index", [](const IndexResult& r){
        py::array_t<double> arr(r.values.size());
        auto* out = arr.mutable_data();
        for (std::size_t i = 0; i < r.values.size(); ++i) out[i] = r.values[i].index;
        return arr;
      });

  py::class_<BarrierScenario>(m, "BarrierScenario")
      .def(py::init([](std::string barrier_id, double pass_u, double pass_d){
        return BarrierScenario{std::move(barrier_id), pass_u, pass_d};
      }), py::arg("barrier_id"), py::arg("pass_u") = 1.0, py::arg("pass_d") = 1.0)
      .def_readwrite("barrier_id", &BarrierScenario::barrier_id)
      .def_readwrite("pass_u", &BarrierScenario::pass_u)
      .def_readwrite("pass_d", &BarrierScenario::pass_d);

  py::class_<ScenarioResult>(m, "ScenarioResult")
      .def_readonly("barrier_id", &ScenarioResult::barrier_id)
      .def_readonly("values", &ScenarioResult::values)
      .def_readonly("d_index", &ScenarioResult::d_index)
      .def_readonly("failure", &ScenarioResult::failure)
      .def("ok", &ScenarioResult::ok);

  py::class_<PrioritizationResult>(m, "PrioritizationResult")
      .def_readonly("baseline", &PrioritizationResult::baseline)
      .def_readonly("scenarios", &PrioritizationResult::scenarios);

  py::class_<Engine>(m, "Engine")
      .def(py::init<>())
      .def("functional_matrix", [](const Engine& e, const RiverNetwork& net, const DispersalOptions& opts){
        py::gil_scoped_release release;
        auto b = e.functional_matrix(net, opts);
        py::gil_scoped_acquire acquire;
        return b;
      }, py::arg("net"), py::arg("opts"))
      .def("structural_matrix", [](const Engine& e, const RiverNetwork& net, const StructuralOptions& opts){
        py::gil_scoped_release release;
        auto c = e.structural_matrix(net, opts);
        py::gil_scoped_acquire acquire;
        return c;
      }, py::arg("net"), py::arg("opts"))
      .def("dispersal_probability", [](const Engine& e, const RiverNetwork& net, const IndexOptions& opts){
        py::gil_scoped_release release;
        auto i = e.dispersal_probability(net, opts);
        py::gil_scoped_acquire acquire;
        return i;
      }, py::arg("net"), py::arg("opts"))
      .def("index", [](const Engine& e, const RiverNetwork& net, const IndexOptions& opts){
        py::gil_scoped_release release;
        auto r = e.index(net, opts);
        py::gil_scoped_acquire acquire;
        return r;
      }, py::arg("net"), py::arg("opts"))
      .def("prioritize", [](const Engine& e, const RiverNetwork& net,
                            const std::vector<BarrierScenario>& scenarios, const PrioritizationOptions& opts){
        py::gil_scoped_release release;
        auto r = e.prioritize(net, scenarios, opts);
        py::gil_scoped_acquire acquire;
        return r;
      }, py::arg("net"), py::arg("scenarios"), py::arg("opts"));
}
