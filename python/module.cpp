#include <pybind11/pybind11.h>
#include <pybind11/chrono.h>
#include <pybind11/gil_safe_call_once.h>

#include <chrono>
#include <cstdint>
#include <memory>
#include <optional>
#include <string>

#include "ledgertail/tail.hpp"

namespace py = pybind11;

// ---------- helpers ----------
static py::bytes to_bytes(const lt::Record& rec) {
    return py::bytes(reinterpret_cast<const char*>(rec.data()), rec.size());
}

static lt::Record next_blocking(lt::TailReader& r) {
    py::gil_scoped_release release;
    return r.next_record();
}

// ---------- module ----------
PYBIND11_MODULE(pyledgertail, m) {
    m.doc() = "Blocking tail reader over fixed-length record ledger files";

    PYBIND11_CONSTINIT static py::gil_safe_call_once_and_store<py::object> tail_error;
    tail_error.call_once_and_store_result([&]() {
        return py::object(py::exception<lt::TailError>(m, "TailError"));
    });
    py::register_exception_translator([](std::exception_ptr p) {
        try {
            if (p) std::rethrow_exception(p);
        } catch (const lt::TailError& e) {
            const py::object& type = tail_error.get_stored();
            py::object exc = type(py::str(e.what()));
            exc.attr("kind")   = std::string(lt::to_string(e.kind));
            exc.attr("offset") = e.offset;
            PyErr_SetObject(type.ptr(), exc.ptr());
        }
    });

    py::class_<lt::TailReader>(m, "TailReader")
        .def(py::init([](const std::string& path, std::size_t record_length,
                         std::uint64_t start_offset, int poll_ms, bool wait_for_file) {
                 lt::TailOptions opt;
                 opt.poll_ms = poll_ms;
                 opt.wait_for_file = wait_for_file;
                 return std::make_unique<lt::TailReader>(path, record_length, start_offset, opt);
             }),
             py::arg("path"), py::arg("record_length"), py::arg("start_offset") = 0,
             py::arg("poll_ms") = 200, py::arg("wait_for_file") = false)

        // blocks until a full record exists; GIL released meanwhile
        .def("next_record", [](lt::TailReader& r) { return to_bytes(next_blocking(r)); })

        // bytes, or None when timeout_ms passes without a full record
        .def("next_record_for", [](lt::TailReader& r, int timeout_ms) -> py::object {
            std::optional<lt::Record> rec;
            {
                py::gil_scoped_release release;
                rec = r.next_record_for(std::chrono::milliseconds(timeout_ms));
            }
            if (!rec) return py::none();
            return to_bytes(*rec);
        }, py::arg("timeout_ms"))

        .def("close", &lt::TailReader::close)
        .def("__iter__", [](py::object self) { return self; })
        .def("__next__", [](lt::TailReader& r) {
            if (r.state() == lt::TailReader::State::Closed) throw py::stop_iteration();
            return to_bytes(next_blocking(r));
        })
        .def("__enter__", [](py::object self) { return self; })
        .def("__exit__", [](lt::TailReader& r, py::object, py::object, py::object) { r.close(); })

        .def_property_readonly("path",              &lt::TailReader::path)
        .def_property_readonly("record_length",     &lt::TailReader::record_length)
        .def_property_readonly("read_cursor",       &lt::TailReader::read_cursor)
        .def_property_readonly("known_safe_length", &lt::TailReader::known_safe_length)
        .def_property_readonly("records_read",      &lt::TailReader::records_read)
        .def_property_readonly("length_queries",    &lt::TailReader::length_queries)
        .def_property_readonly("poll_interval",     &lt::TailReader::poll_interval)
        .def_property_readonly("state", [](const lt::TailReader& r) {
            return std::string(lt::to_string(r.state()));
        });
}
