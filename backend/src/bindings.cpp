#include <pybind11/pybind11.h>
#include <pybind11/stl.h>
#include "ComboErrors.hpp"
#include "ComboService.hpp"
#include "ServiceConfig.hpp"

namespace py = pybind11;

namespace {

SuggestOptions make_options(int beam_width, int max_candidates, bool keep_order, bool trace) {
    SuggestOptions options;
    options.beam_width = beam_width;
    options.max_results = max_candidates;
    options.keep_order = keep_order;
    options.trace = trace;
    return options;
}

} // namespace

// Python entry point used by tool-protocol adapters. Every call returns a JSON string
PYBIND11_MODULE(mnemo, m) {
    m.doc() = "Initial-letter word combination search over a Korean lexicon";

    py::register_exception<InvalidParameterError>(m, "InvalidParameter", PyExc_ValueError);
    py::register_exception<EmptyTargetError>(m, "EmptyTarget", PyExc_ValueError);
    py::register_exception<UnsupportedCharacterError>(m, "UnsupportedCharacter", PyExc_ValueError);
    py::register_exception<DuplicateSourceConflictError>(m, "DuplicateSourceConflict", PyExc_RuntimeError);

    py::class_<ComboService>(m, "ComboService")
        .def(py::init([](const std::string& lexicon_path, const std::string& config_path) {
                 ServiceConfig config;
                 if (!config_path.empty() && !config.load_from_json(config_path)) {
                     throw std::runtime_error("could not load config " + config_path);
                 }
                 config.apply_environment();
                 if (!lexicon_path.empty()) config.lexicon_path = lexicon_path;
                 return new ComboService(config);
             }),
             py::arg("lexicon_path") = "", py::arg("config_path") = "")
        .def("suggest",
             [](ComboService& self, const std::vector<std::string>& initials,
                int beam_width, int max_candidates, bool keep_order, bool trace) {
                 py::gil_scoped_release release;
                 return self.suggest(initials, make_options(beam_width, max_candidates, keep_order, trace));
             },
             py::arg("initials"), py::arg("beam_width") = 64, py::arg("max_candidates") = 20,
             py::arg("keep_order") = true, py::arg("trace") = false,
             "Ranked initial-letter combinations for a list of initials")
        .def("from_words",
             [](ComboService& self, const std::vector<std::string>& words,
                int beam_width, int max_candidates, bool keep_order, bool trace) {
                 py::gil_scoped_release release;
                 return self.suggest_from_words(words, make_options(beam_width, max_candidates, keep_order, trace));
             },
             py::arg("words"), py::arg("beam_width") = 64, py::arg("max_candidates") = 20,
             py::arg("keep_order") = true, py::arg("trace") = false,
             "Takes the first syllable of each word, then suggests combinations")
        .def("check_word", &ComboService::check_word, py::arg("word"))
        .def("words_starting_with", &ComboService::words_starting_with,
             py::arg("letter"), py::arg("limit") = 50, py::arg("with_metadata") = false)
        .def("stats", &ComboService::stats);
}
