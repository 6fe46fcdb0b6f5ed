#include <pybind11/pybind11.h>
#include <pybind11/stl.h>

#include "vecpart/collection/vector_collection.hpp"
#include "vecpart/columnar/allocator.hpp"
#include "vecpart/columnar/type_traits.hpp"
#include "vecpart/columnar/vector.hpp"
#include "vecpart/common/error.hpp"
#include "vecpart/ops/aggregate.hpp"
#include "vecpart/partition/codec.hpp"
#include "vecpart/partition/vector_partition.hpp"

#include <string>
#include <type_traits>

namespace py = pybind11;
using namespace vecpart;

namespace {

using columnar::BufferAllocator;
using columnar::MinorType;
using partition::VectorPartition;

// Builds a vector of `type` from a Python list
std::unique_ptr<columnar::ValueVector> vector_from_list(
    MinorType type,
    const py::list& values,
    std::shared_ptr<BufferAllocator> allocator
) {
    return columnar::dispatch_minor_type(type, [&](auto traits) -> std::unique_ptr<columnar::ValueVector> {
        using Traits = decltype(traits);
        using ValueType = typename Traits::ValueType;

        auto vector = std::make_unique<typename Traits::VectorType>("vector", allocator);
        vector->allocate_new(values.size());
        for (size_t i = 0; i < values.size(); ++i) {
            if constexpr (std::is_same_v<ValueType, columnar::Bytes>) {
                std::string raw = values[i].cast<py::bytes>();
                vector->set_safe(i, std::string_view(raw));
            } else {
                vector->set_safe(i, values[i].cast<ValueType>());
            }
        }
        vector->set_value_count(values.size());
        return vector;
    });
}

py::list partition_to_list(const VectorPartition& p) {
    py::list out;
    if (!p.has_vector()) {
        return out;
    }
    p.visit([&](const auto& vector) {
        using VectorType = std::decay_t<decltype(vector)>;
        for (size_t i = 0; i < vector.value_count(); ++i) {
            if constexpr (std::is_same_v<typename VectorType::value_type, columnar::Bytes>) {
                std::string_view view = vector.get_view(i);
                out.append(py::bytes(view.data(), view.size()));
            } else {
                out.append(vector.get(i));
            }
        }
    });
    return out;
}

py::bytes to_py_bytes(const std::vector<uint8_t>& bytes) {
    return py::bytes(std::string(bytes.begin(), bytes.end()));
}

std::vector<uint8_t> from_py_bytes(const py::bytes& bytes) {
    std::string raw = bytes;
    return std::vector<uint8_t>(raw.begin(), raw.end());
}

} // namespace

PYBIND11_MODULE(pyvecpart, m) {
    m.doc() = "vecpart - typed columnar vector partitions with explicit externalization";

    py::register_exception<Error>(m, "VecPartError");

    py::enum_<ErrorKind>(m, "ErrorKind")
        .value("UNSUPPORTED_TYPE", ErrorKind::UNSUPPORTED_TYPE)
        .value("STREAM_CORRUPTION", ErrorKind::STREAM_CORRUPTION)
        .value("TYPE_MISMATCH", ErrorKind::TYPE_MISMATCH)
        .value("ALLOCATION_FAILURE", ErrorKind::ALLOCATION_FAILURE);

    // Columnar module
    auto m_columnar = m.def_submodule("columnar", "Columnar vectors");

    py::enum_<MinorType>(m_columnar, "MinorType")
        .value("INT", MinorType::INT)
        .value("BIGINT", MinorType::BIGINT)
        .value("VARBINARY", MinorType::VARBINARY)
        .value("VARCHAR", MinorType::VARCHAR);

    py::class_<BufferAllocator, std::shared_ptr<BufferAllocator>>(m_columnar, "BufferAllocator")
        .def(py::init([](std::string name, size_t limit) {
                 return BufferAllocator::create(std::move(name), limit);
             }),
             py::arg("name") = "root", py::arg("limit") = columnar::kDefaultAllocatorLimit)
        .def("allocated_bytes", &BufferAllocator::allocated_bytes)
        .def("peak_bytes", &BufferAllocator::peak_bytes)
        .def("limit", &BufferAllocator::limit)
        .def("name", &BufferAllocator::name);

    // Partition module
    auto m_partition = m.def_submodule("partition", "Vector partitions");

    py::class_<VectorPartition>(m_partition, "VectorPartition")
        .def(py::init([](int64_t collection_id, int32_t index, MinorType type,
                         const py::list& values, std::shared_ptr<BufferAllocator> allocator) {
                 return VectorPartition(collection_id, index, vector_from_list(type, values, allocator));
             }),
             py::arg("collection_id"), py::arg("index"), py::arg("type"),
             py::arg("values"), py::arg("allocator"))
        .def("collection_id", &VectorPartition::collection_id)
        .def("index", &VectorPartition::index)
        .def("value_count", &VectorPartition::value_count)
        .def("minor_type", [](const VectorPartition& p) { return p.vector().minor_type(); })
        .def("to_list", &partition_to_list)
        .def("serialize", [](const VectorPartition& p) {
            return to_py_bytes(partition::serialize_partition(p));
        })
        .def_static("deserialize", [](const py::bytes& bytes, std::shared_ptr<BufferAllocator> allocator) {
            return partition::deserialize_partition(from_py_bytes(bytes), std::move(allocator));
        })
        .def("__eq__", [](const VectorPartition& a, const VectorPartition& b) { return a == b; })
        .def("__hash__", &VectorPartition::hash)
        .def("__repr__", &VectorPartition::describe);

    // Collection module
    auto m_collection = m.def_submodule("collection", "Partitioned vector collections");

    py::enum_<ops::AggregateFunction>(m_collection, "AggregateFunction")
        .value("SUM", ops::AggregateFunction::SUM)
        .value("MIN", ops::AggregateFunction::MIN)
        .value("MAX", ops::AggregateFunction::MAX)
        .value("COUNT", ops::AggregateFunction::COUNT);

    py::class_<collection::VectorCollection>(m_collection, "VectorCollection")
        .def(py::init([](MinorType type, const py::list& values, size_t num_partitions,
                         std::shared_ptr<BufferAllocator> allocator) {
                 std::vector<std::unique_ptr<columnar::ValueVector>> vectors;
                 vectors.push_back(vector_from_list(type, values, allocator));
                 return collection::VectorCollection(std::move(vectors), num_partitions, allocator);
             }),
             py::arg("type"), py::arg("values"), py::arg("num_partitions"), py::arg("allocator"))
        .def("id", &collection::VectorCollection::id)
        .def("num_partitions", &collection::VectorCollection::num_partitions)
        .def("total_values", &collection::VectorCollection::total_values)
        .def("partition_values", [](const collection::VectorCollection& c, size_t index) {
            return partition_to_list(c.get_partition(index));
        })
        .def("ship", [](const collection::VectorCollection& c, size_t index) {
            return to_py_bytes(c.ship(index));
        })
        .def("receive", [](const collection::VectorCollection& c, const py::bytes& bytes) {
            return c.receive(from_py_bytes(bytes));
        })
        .def("aggregate", &collection::VectorCollection::aggregate);

    // Utility functions
    m.def("version", []() { return "0.1.0"; });
}
