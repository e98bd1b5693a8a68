/*
  Pybind11 module exposing Balancer-Core C++ APIs to Python.

  Notes:
    - Flow lists are accepted as Python sequences of ints and converted to
      std::vector<int64_t>.
    - Graph nodes/edges are returned as lists of tuples; the graph object
      itself is immutable.
    - InfeasibleFlowError is raised as balancer InfeasibleFlowError, a
      subclass of ValueError carrying input_total/output_total.
*/
#include <pybind11/gil_safe_call_once.h>
#include <pybind11/pybind11.h>
#include <pybind11/stl.h>

#include <exception>
#include <string>
#include <utility>
#include <vector>

#include "balancer/core/audit.hpp"
#include "balancer/core/balancer.hpp"
#include "balancer/core/balancer_graph.hpp"
#include "balancer/core/dot_writer.hpp"
#include "balancer/core/embedding.hpp"
#include "balancer/core/error.hpp"
#include "balancer/core/flow_assignment.hpp"
#include "balancer/core/options.hpp"
#include "balancer/core/quantize.hpp"
#include "balancer/core/types.hpp"

namespace py = pybind11;
using namespace balancer::core;

PYBIND11_MODULE(_balancer_core, m) {
  m.doc() = "Balancer-Core C++ bindings";

  // Translators run newest first, so the specific InfeasibleFlowError one is
  // registered after the generic ValueError/RuntimeError ones.
  py::register_exception<ValueError>(m, "BalancerValueError", PyExc_ValueError);
  py::register_exception<RuntimeError>(m, "BalancerRuntimeError", PyExc_RuntimeError);
  // Type object held in gil_safe_call_once_and_store, not a plain static.
  PYBIND11_CONSTINIT static py::gil_safe_call_once_and_store<py::object> infeasible_type;
  infeasible_type.call_once_and_store_result([&m]() -> py::object {
    return py::exception<InfeasibleFlowError>(m, "InfeasibleFlowError", PyExc_ValueError);
  });
  py::register_exception_translator([](std::exception_ptr p) {
    try {
      if (p) std::rethrow_exception(p);
    } catch (const InfeasibleFlowError& e) {
      const py::object& type = infeasible_type.get_stored();
      py::object exc = type(e.what());
      exc.attr("input_total") = e.input_total();
      exc.attr("output_total") = e.output_total();
      PyErr_SetObject(type.ptr(), exc.ptr());
    }
  });

  py::enum_<NodeKind>(m, "NodeKind")
      .value("INPUT", NodeKind::Input)
      .value("OUTPUT", NodeKind::Output)
      .value("SPLITTER", NodeKind::Splitter)
      .value("MERGER", NodeKind::Merger);

  py::enum_<ZeroFlowPolicy>(m, "ZeroFlowPolicy")
      .value("OMIT", ZeroFlowPolicy::Omit)
      .value("REJECT", ZeroFlowPolicy::Reject);

  py::class_<DotOptions>(m, "DotOptions")
      .def(py::init<>())
      .def_readwrite("graph_name", &DotOptions::graph_name)
      .def_readwrite("rankdir", &DotOptions::rankdir)
      .def_readwrite("input_color", &DotOptions::input_color)
      .def_readwrite("output_color", &DotOptions::output_color)
      .def_readwrite("splitter_color", &DotOptions::splitter_color)
      .def_readwrite("merger_color", &DotOptions::merger_color)
      .def_readwrite("edge_label_prefix", &DotOptions::edge_label_prefix);

  py::class_<EmbedMapping>(m, "EmbedMapping")
      .def(py::init([](std::string device_prefix, std::vector<std::string> input_ids,
                       std::vector<std::string> output_ids) {
             return EmbedMapping{std::move(device_prefix), std::move(input_ids), std::move(output_ids)};
           }),
           py::arg("device_prefix") = "", py::arg("input_ids") = std::vector<std::string>{},
           py::arg("output_ids") = std::vector<std::string>{})
      .def_readwrite("device_prefix", &EmbedMapping::device_prefix)
      .def_readwrite("input_ids", &EmbedMapping::input_ids)
      .def_readwrite("output_ids", &EmbedMapping::output_ids);

  py::class_<BalancerGraph>(m, "BalancerGraph")
      .def("num_nodes", &BalancerGraph::num_nodes)
      .def("num_edges", &BalancerGraph::num_edges)
      .def("num_inputs", &BalancerGraph::num_inputs)
      .def("num_outputs", &BalancerGraph::num_outputs)
      .def("count", &BalancerGraph::count, py::arg("kind"))
      .def("find", &BalancerGraph::find, py::arg("id"))
      .def("inflow", &BalancerGraph::inflow, py::arg("node"))
      .def("outflow", &BalancerGraph::outflow, py::arg("node"))
      .def("input_node", &BalancerGraph::input_node, py::arg("index"))
      .def("output_node", &BalancerGraph::output_node, py::arg("index"))
      // (id, kind, label, rate) per node
      .def_property_readonly("nodes", [](const BalancerGraph& g) {
        py::list out;
        for (const auto& n : g.nodes()) out.append(py::make_tuple(n.id, n.kind, n.label, n.rate));
        return out;
      })
      // (src_id, dst_id, flow) per edge, in creation order
      .def_property_readonly("edges", [](const BalancerGraph& g) {
        py::list out;
        for (const auto& e : g.edges()) out.append(py::make_tuple(g.node(e.src).id, g.node(e.dst).id, e.flow));
        return out;
      })
      .def_property_readonly("source", [](const BalancerGraph& g) { return to_dot(g); })
      .def("to_dot", [](const BalancerGraph& g, const DotOptions& opts) { return to_dot(g, opts); },
           py::arg("options") = DotOptions{});

  m.def("design_balancer",
        [](const std::vector<Flow>& inputs, const std::vector<Flow>& outputs, ZeroFlowPolicy zero_flow) {
          DesignOptions opts;
          opts.zero_flow = zero_flow;
          py::gil_scoped_release rel;
          return design_balancer(inputs, outputs, opts);
        },
        py::arg("inputs"), py::arg("outputs"), py::kw_only(), py::arg("zero_flow") = ZeroFlowPolicy::Omit);

  m.def("assign_flows",
        [](const std::vector<Flow>& inputs, const std::vector<Flow>& outputs) {
          auto mat = assign_flows(inputs, outputs);
          py::dict out;
          for (InputIndex i = 0; i < mat.num_inputs(); ++i) {
            py::dict row;
            for (auto const& [j, f] : mat.row(i)) row[py::int_(j)] = f;
            out[py::int_(i)] = row;
          }
          return out;
        },
        py::arg("inputs"), py::arg("outputs"));

  m.def("quantize_flows",
        [](const std::vector<double>& rates, Flow target_total) { return quantize_flows(rates, target_total); },
        py::arg("rates"), py::arg("target_total"));

  m.def("audit_network", &audit_network, py::arg("graph"));

  m.def("to_dot", [](const BalancerGraph& g, const DotOptions& opts) { return to_dot(g, opts); },
        py::arg("graph"), py::arg("options") = DotOptions{});

  // Merge several material fragments into one diagram.
  m.def("embed",
        [](const std::vector<std::pair<BalancerGraph, EmbedMapping>>& fragments) {
          GraphBuilder host;
          for (auto const& [g, mapping] : fragments) splice(host, g, mapping);
          return std::move(host).finish();
        },
        py::arg("fragments"));
}
