#include <pybind11/pybind11.h>
#include <pybind11/stl.h>
#include <pybind11/numpy.h>
#include "../include/common.hpp"
#include "../include/config.hpp"
#include "../include/native/shared_library.hpp"
#include "../include/extractor/native_feature_extractor.hpp"
#include <memory>
#include <string>
#include <utility>

namespace py = pybind11;

namespace {

// Library handle shared by the module-level functions, loaded once at import
std::unique_ptr<dg::NativeFeatureExtractor> default_extractor;

dg::ExtractResult extract_without_gil(const dg::NativeFeatureExtractor& extractor,
                                      const std::string& sgf) {
    py::gil_scoped_release release;
    return extractor.extract(sgf);
}

py::array_t<float> features_to_numpy(const std::vector<float>& features) {
    return py::array_t<float>(static_cast<py::ssize_t>(features.size()), features.data());
}

// Trainer-facing dict; features are the raw float32 bytes
py::object example_to_dict(const dg::ExtractResult& result) {
    if (!result.example) {
        return py::none();
    }

    const dg::Example& example = *result.example;
    py::dict out;
    out["features"] = py::bytes(reinterpret_cast<const char*>(example.features.data()),
                                example.features.size() * sizeof(float));
    out["color"] = example.color;
    out["index"] = example.index;
    out["policy"] = py::bytes(example.policy);
    out["winner"] = example.winner;
    out["number"] = example.number;
    return std::move(out);
}

} // namespace

PYBIND11_MODULE(dg_go, m) {
    m.doc() = "Training example extraction backed by the native Go engine library";

    py::register_exception<dg::LibraryNotFound>(m, "LibraryNotFound", PyExc_OSError);

    // Example struct
    py::class_<dg::Example>(m, "Example")
        .def(py::init<>())
        .def_property_readonly("features",
             [](const dg::Example& e) { return features_to_numpy(e.features); },
             "Feature planes (num_features × 361 float32)")
        .def_readonly("index", &dg::Example::index, "Move index within the game record")
        .def_readonly("color", &dg::Example::color, "Side to move")
        .def_property_readonly("policy",
             [](const dg::Example& e) { return py::bytes(e.policy); },
             "Encoded policy distribution")
        .def_readonly("winner", &dg::Example::winner, "Game outcome")
        .def_readonly("number", &dg::Example::number, "Move number");

    // NativeFeatureExtractor - explicit library paths, raises instead of exiting
    py::class_<dg::NativeFeatureExtractor>(m, "NativeFeatureExtractor")
        .def(py::init([](std::vector<std::string> candidates, bool verbose) {
                 dg::LoaderConfig config;
                 config.candidates = std::move(candidates);
                 config.verbose = verbose;
                 return std::make_unique<dg::NativeFeatureExtractor>(config);
             }),
             py::arg("candidates"),
             py::arg("verbose") = false,
             "Load the first loadable library from the candidate paths")
        .def("get_num_features", &dg::NativeFeatureExtractor::num_features,
             "Number of feature planes")
        .def("extract_example",
             [](const dg::NativeFeatureExtractor& self, const std::string& line) {
                 dg::ExtractResult result = extract_without_gil(self, line);
                 return std::make_pair(result.status, std::move(result.example));
             },
             py::arg("line"),
             "Extract one example from an SGF record")
        .def_property_readonly("library_path", &dg::NativeFeatureExtractor::library_path);

    const dg::LoaderConfig config = dg::LoaderConfig::from_environment();
    default_extractor = std::make_unique<dg::NativeFeatureExtractor>(
        dg::load_or_exit(config.candidates, config.verbose));

    // Queried from the library once at import; the entry point is deterministic
    m.def("get_num_features", []() { return default_extractor->num_features(); },
          "Number of feature planes the Go engine produces");

    m.def("get_single_example",
          [](const std::string& line) {
              dg::ExtractResult result = extract_without_gil(*default_extractor, line);
              return py::make_tuple(result.status, example_to_dict(result));
          },
          py::arg("line"),
          "Extract one example from an SGF record as (status, dict or None)");

    m.def("extract_example",
          [](const std::string& line) {
              dg::ExtractResult result = extract_without_gil(*default_extractor, line);
              return std::make_pair(result.status, std::move(result.example));
          },
          py::arg("line"),
          "Extract one example from an SGF record as (status, Example or None)");

    m.attr("BOARD_POINTS") = dg::kBoardPoints;
    m.attr("POLICY_SIZE") = dg::kPolicySize;
    m.attr("FEATURE_SIZE") = default_extractor->layout().feature_bytes();

    m.attr("__version__") = "0.1.0";
}
