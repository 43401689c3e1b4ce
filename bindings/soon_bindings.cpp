/**
 * @file soon_bindings.cpp
 * @brief Python bindings for the SOON codec using pybind11
 *
 * Exposes decode/encode/validate, JSON conversion and the incremental
 * StreamParser. Values map onto plain Python objects: None, bool, int/float,
 * str, bytes, list and dict. Dates come back as ISO-8601 strings.
 */

#include <pybind11/pybind11.h>
#include <pybind11/stl.h>
#include <pybind11/functional.h>
#include "soon/soon.h"
#include "soon/json_interop.h"

#include <cmath>

namespace py = pybind11;
using namespace soon;

namespace {

// =============================================================================
// Value <-> Python conversion
// =============================================================================

py::object to_python(const Value& value) {
    switch (value.type()) {
        case ValueType::Null:
            return py::none();
        case ValueType::Bool:
            return py::bool_(value.as_bool());
        case ValueType::Number: {
            double number = value.as_number();
            if (std::isfinite(number) && std::trunc(number) == number &&
                std::fabs(number) <= 9007199254740992.0) {
                return py::int_(static_cast<long long>(number));
            }
            return py::float_(number);
        }
        case ValueType::String:
            return py::str(value.as_string());
        case ValueType::Date:
            return py::str(value.as_date().to_iso_string());
        case ValueType::Binary: {
            const Binary& bytes = value.as_binary();
            return py::bytes(reinterpret_cast<const char*>(bytes.data()), bytes.size());
        }
        case ValueType::Array: {
            py::list items;
            for (const auto& item : value.as_array()) {
                items.append(to_python(item));
            }
            return items;
        }
        case ValueType::Object: {
            py::dict record;
            for (const auto& entry : value.as_object()) {
                record[py::str(entry.first)] = to_python(entry.second);
            }
            return record;
        }
    }
    return py::none();
}

Value from_python(const py::handle& obj) {
    if (obj.is_none()) {
        return Value();
    }
    // bool before int: Python bools are ints
    if (py::isinstance<py::bool_>(obj)) {
        return Value(obj.cast<bool>());
    }
    if (py::isinstance<py::int_>(obj)) {
        return Value(obj.cast<double>());
    }
    if (py::isinstance<py::float_>(obj)) {
        return Value(obj.cast<double>());
    }
    if (py::isinstance<py::str>(obj)) {
        return Value(obj.cast<std::string>());
    }
    if (py::isinstance<py::bytes>(obj)) {
        std::string raw = obj.cast<std::string>();
        return Value(Binary(raw.begin(), raw.end()));
    }
    if (py::isinstance<py::dict>(obj)) {
        Object record;
        for (auto item : obj.cast<py::dict>()) {
            record.set(py::str(item.first).cast<std::string>(), from_python(item.second));
        }
        return Value(std::move(record));
    }
    if (py::isinstance<py::list>(obj) || py::isinstance<py::tuple>(obj)) {
        Array items;
        for (auto item : obj) {
            items.push_back(from_python(item));
        }
        return Value(std::move(items));
    }

    py::object datetime_type = py::module_::import("datetime").attr("datetime");
    if (py::isinstance(obj, datetime_type)) {
        std::string iso = obj.attr("isoformat")().cast<std::string>();
        auto date = DateTime::parse(iso);
        if (!date) {
            throw SOONTypeError(ErrorCode::InvalidDate, "Unsupported datetime: " + iso);
        }
        return Value(*date);
    }

    throw SOONTypeError(ErrorCode::TypeMismatch,
                        "Cannot convert Python " +
                        py::str(obj.get_type().attr("__name__")).cast<std::string>() +
                        " to a SOON value");
}

ParserOptions make_parser_options(bool allow_duplicate_keys, int max_depth, bool strict) {
    ParserOptions options;
    options.allow_duplicate_keys = allow_duplicate_keys;
    options.max_depth = max_depth;
    options.strict = strict;
    return options;
}

SerializerOptions make_serializer_options(int indent, bool sort_keys, bool compact) {
    SerializerOptions options;
    options.indent = indent;
    options.sort_keys = sort_keys;
    options.compact = compact;
    return options;
}

py::dict error_to_python(const SOONError& e) {
    py::dict info;
    info["code"] = error_code_name(e.code());
    info["message"] = e.message();
    info["line"] = e.line();
    info["column"] = e.column();
    return info;
}

} // anonymous namespace

/**
 * Python-facing wrapper for StreamParser
 *
 * Callbacks run on the calling thread with the GIL held; an exception raised
 * by a callback propagates out of write() or end().
 */
class PyStreamParser {
private:
    StreamParser stream_;

public:
    PyStreamParser(bool allow_duplicate_keys, int max_depth, bool strict, bool verbose)
        : stream_(make_stream_options(allow_duplicate_keys, max_depth, strict, verbose)) {}

    void on_chunk(py::function callback) {
        stream_.on_chunk([callback](const Chunk& chunk) {
            callback(chunk.id, to_python(chunk.value));
        });
    }

    void on_error(py::function callback) {
        stream_.on_error([callback](const DecodeError& e) {
            callback(error_to_python(e));
        });
    }

    void on_end(py::function callback) {
        stream_.on_end([callback]() { callback(); });
    }

    void write(const std::string& data) { stream_.write(data); }
    void end() { stream_.end(); }

    bool is_ended() const { return stream_.is_ended(); }
    std::string state() const { return stream_state_name(stream_.state()); }
    size_t buffered_size() const { return stream_.buffered_size(); }
    uint64_t chunks_emitted() const { return stream_.chunks_emitted(); }
    uint64_t errors_emitted() const { return stream_.errors_emitted(); }

private:
    static StreamOptions make_stream_options(bool allow_duplicate_keys, int max_depth,
                                             bool strict, bool verbose) {
        StreamOptions options;
        options.parser = make_parser_options(allow_duplicate_keys, max_depth, strict);
        options.verbose = verbose;
        return options;
    }
};

PYBIND11_MODULE(soon_bindings, m) {
    m.doc() = R"pbdoc(
        SOON codec - Python bindings

        Indentation-structured text format for the JSON value model plus
        dates and binary data.

        Example:
            >>> import soon_bindings as soon
            >>> soon.decode("name John\nage 30")
            {'name': 'John', 'age': 30}
            >>> soon.encode({"x": 10, "y": 20}, compact=True)
            'x:10 y:20'
    )pbdoc";

    // Base classes first: later registrations are tried first
    auto& soon_error = py::register_exception<SOONError>(m, "SOONError", PyExc_ValueError);
    auto& decode_error = py::register_exception<DecodeError>(m, "DecodeError", soon_error.ptr());
    py::register_exception<LexError>(m, "LexError", decode_error.ptr());
    py::register_exception<ParseError>(m, "ParseError", decode_error.ptr());
    py::register_exception<EvalError>(m, "EvalError", decode_error.ptr());
    py::register_exception<EncodeError>(m, "EncodeError", soon_error.ptr());
    py::register_exception<SOONTypeError>(m, "SOONTypeError", soon_error.ptr());
    py::register_exception<StreamError>(m, "StreamError", soon_error.ptr());
    py::register_exception<JsonError>(m, "JsonError", soon_error.ptr());

    m.def("decode",
          [](const std::string& text, bool allow_duplicate_keys, int max_depth, bool strict) {
              Value value;
              {
                  // Release GIL during C++ parsing
                  py::gil_scoped_release release;
                  value = decode(text, make_parser_options(allow_duplicate_keys, max_depth, strict));
              }
              return to_python(value);
          },
          py::arg("text"),
          py::arg("allow_duplicate_keys") = false,
          py::arg("max_depth") = 100,
          py::arg("strict") = false,
          R"pbdoc(
            Parse SOON text into Python objects

            Raises:
                DecodeError (LexError, ParseError or EvalError) on malformed input
          )pbdoc");

    m.def("encode",
          [](const py::object& obj, int indent, bool sort_keys, bool compact) {
              Value value = from_python(obj);
              py::gil_scoped_release release;
              return encode(value, make_serializer_options(indent, sort_keys, compact));
          },
          py::arg("value"),
          py::arg("indent") = 2,
          py::arg("sort_keys") = false,
          py::arg("compact") = false,
          R"pbdoc(
            Render Python objects as SOON text

            Raises:
                EncodeError for NaN/infinity and out-of-range dates
                SOONTypeError for objects with no SOON equivalent
          )pbdoc");

    m.def("validate",
          [](const std::string& text, bool allow_duplicate_keys, int max_depth, bool strict) {
              ValidationResult result;
              {
                  py::gil_scoped_release release;
                  result = validate(text, make_parser_options(allow_duplicate_keys, max_depth, strict));
              }
              py::dict info;
              info["valid"] = result.valid;
              if (!result.valid) {
                  info["code"] = error_code_name(result.code);
                  info["message"] = result.message;
                  info["line"] = result.line;
                  info["column"] = result.column;
                  info["details"] = result.details;
              }
              return info;
          },
          py::arg("text"),
          py::arg("allow_duplicate_keys") = false,
          py::arg("max_depth") = 100,
          py::arg("strict") = false,
          "Check whether text decodes; returns a dict with 'valid' and error details");

    m.def("to_json",
          [](const std::string& text, int indent) {
              py::gil_scoped_release release;
              return to_json(text, ParserOptions{}, indent);
          },
          py::arg("text"),
          py::arg("indent") = 2,
          "Convert SOON text to JSON text (indent < 0 for a single line)");

    m.def("from_json",
          [](const std::string& json_text, int indent, bool sort_keys, bool compact) {
              py::gil_scoped_release release;
              return from_json(json_text, make_serializer_options(indent, sort_keys, compact));
          },
          py::arg("json_text"),
          py::arg("indent") = 2,
          py::arg("sort_keys") = false,
          py::arg("compact") = false,
          "Convert JSON text to SOON text");

    py::class_<PyStreamParser>(m, "StreamParser", R"pbdoc(
        Incremental decoder for |id| delimited chunk streams

        Example:
            >>> chunks = []
            >>> p = soon.StreamParser()
            >>> p.on_chunk(lambda cid, value: chunks.append((cid, value)))
            >>> p.write("|c1|\nname John")
            >>> p.write("|c2|\nage 30")
            >>> p.end()
            >>> chunks
            [('c1', {'name': 'John'}), ('c2', {'age': 30})]
    )pbdoc")
        .def(py::init<bool, int, bool, bool>(),
             py::arg("allow_duplicate_keys") = false,
             py::arg("max_depth") = 100,
             py::arg("strict") = false,
             py::arg("verbose") = false)
        .def("on_chunk", &PyStreamParser::on_chunk, py::arg("callback"),
             "Register callback(id, value) for each decoded chunk")
        .def("on_error", &PyStreamParser::on_error, py::arg("callback"),
             "Register callback(error_dict) for chunks that fail to decode")
        .def("on_end", &PyStreamParser::on_end, py::arg("callback"),
             "Register callback() run once the stream has ended")
        .def("write", &PyStreamParser::write, py::arg("data"),
             "Append text and emit every chunk it completes")
        .def("end", &PyStreamParser::end,
             "Flush the trailing chunk and finish the stream")
        .def_property_readonly("ended", &PyStreamParser::is_ended)
        .def_property_readonly("state", &PyStreamParser::state)
        .def_property_readonly("buffered_size", &PyStreamParser::buffered_size)
        .def_property_readonly("chunks_emitted", &PyStreamParser::chunks_emitted)
        .def_property_readonly("errors_emitted", &PyStreamParser::errors_emitted);

    // Module version info
    m.attr("__version__") = VERSION;
}
