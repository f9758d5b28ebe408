#include <pybind11/pybind11.h>
#include <pybind11/stl.h>

#include <cstdint>

#include <optional>
#include <string>

#include "kazu_api.hpp"

namespace py = pybind11;

// =============================================================================
// pybind11 模块定义
// =============================================================================
//
// 编码越界时抛出的 std::out_of_range 由 pybind11 转换为 IndexError。
//

PYBIND11_MODULE(_kazu, m) {
    m.doc() = "Kazu - Japanese/English numeral core Python bindings";

    // =========================================================================
    // 枚举类型
    // =========================================================================

    py::enum_<Kazu::Language>(m, "Language", "Numeral language")
        .value("JA", Kazu::Language::JA, "Japanese (man/oku/cho grouping)")
        .value("EN", Kazu::Language::EN, "English (thousand grouping)")
        .export_values();

    py::enum_<Kazu::MatchMethod>(m, "MatchMethod", "Validation tier that decided the result")
        .value("EXACT", Kazu::MatchMethod::EXACT, "Normalized text is identical")
        .value("NUMERIC", Kazu::MatchMethod::NUMERIC, "Parsed number is identical")
        .value("FUZZY", Kazu::MatchMethod::FUZZY, "Similarity reached the threshold")
        .value("VARIANT", Kazu::MatchMethod::VARIANT, "Japanese spacing variant reached the threshold")
        .value("REJECTED", Kazu::MatchMethod::REJECTED, "Answer is wrong")
        .export_values();

    py::enum_<Kazu::MistakeKind>(m, "MistakeKind", "Why an answer was rejected")
        .value("NONE", Kazu::MistakeKind::NONE)
        .value("NOT_RECOGNIZED", Kazu::MistakeKind::NOT_RECOGNIZED)
        .value("VERY_CLOSE", Kazu::MistakeKind::VERY_CLOSE)
        .value("FEWER_DIGITS", Kazu::MistakeKind::FEWER_DIGITS)
        .value("MORE_DIGITS", Kazu::MistakeKind::MORE_DIGITS)
        .value("WRONG_PLACE", Kazu::MistakeKind::WRONG_PLACE)
        .value("TRY_AGAIN", Kazu::MistakeKind::TRY_AGAIN)
        .export_values();

    // =========================================================================
    // EngineConfig - 配置结构
    // =========================================================================

    py::class_<Kazu::EngineConfig>(m, "EngineConfig", "Numeral engine configuration")
        .def(py::init<>(), "Create default configuration")

        .def_readwrite("fuzzy_threshold", &Kazu::EngineConfig::fuzzy_threshold,
            "Fuzzy match threshold [0, 1]")
        .def_readwrite("exact_confidence", &Kazu::EngineConfig::exact_confidence,
            "Confidence reported for exact matches")
        .def_readwrite("numeric_confidence", &Kazu::EngineConfig::numeric_confidence,
            "Confidence reported for numeric matches")
        .def_readwrite("enable_variants", &Kazu::EngineConfig::enable_variants,
            "Try Japanese spacing variants")
        .def_readwrite("verbose", &Kazu::EngineConfig::verbose,
            "Trace validation tiers to stderr")

        .def_static("Default", &Kazu::EngineConfig::Default, "Create default configuration")
        .def_static("Strict", &Kazu::EngineConfig::Strict, "Threshold 0.95, variants disabled")
        .def_static("Lenient", &Kazu::EngineConfig::Lenient, "Threshold 0.70")

        .def("withThreshold", &Kazu::EngineConfig::withThreshold,
            py::arg("threshold"), "Set fuzzy threshold (chainable)")
        .def("withVariants", &Kazu::EngineConfig::withVariants,
            py::arg("enabled"), "Enable or disable variants (chainable)")
        .def("withVerbose", &Kazu::EngineConfig::withVerbose,
            py::arg("enabled"), "Enable or disable tracing (chainable)")

        .def("__repr__", [](const Kazu::EngineConfig& config) {
            return "<EngineConfig threshold=" + std::to_string(config.fuzzy_threshold) +
                " variants=" + (config.enable_variants ? "true" : "false") + ">";
        });

    // =========================================================================
    // ValidationResult / MistakeAnalysis
    // =========================================================================

    py::class_<Kazu::ValidationResult>(m, "ValidationResult", "Answer validation result")
        .def(py::init<>())
        .def_readwrite("is_correct", &Kazu::ValidationResult::is_correct)
        .def_readwrite("confidence", &Kazu::ValidationResult::confidence)
        .def_readwrite("method", &Kazu::ValidationResult::method)
        .def_readwrite("user_answer", &Kazu::ValidationResult::user_answer)
        .def_readwrite("user_number", &Kazu::ValidationResult::user_number)
        .def_readwrite("user_parsed", &Kazu::ValidationResult::user_parsed)
        .def_readwrite("correct_answer", &Kazu::ValidationResult::correct_answer)
        .def_readwrite("correct_number", &Kazu::ValidationResult::correct_number)

        .def("__bool__", [](const Kazu::ValidationResult& r) {
            return r.is_correct;
        }, "True when the answer was accepted")
        .def("__repr__", [](const Kazu::ValidationResult& r) {
            return "<ValidationResult " +
                std::string(r.is_correct ? "correct" : "wrong") +
                " method=" + Kazu::matchMethodName(r.method) +
                " confidence=" + std::to_string(r.confidence) + ">";
        });

    py::class_<Kazu::MistakeAnalysis>(m, "MistakeAnalysis", "Explanation of a rejected answer")
        .def(py::init<>())
        .def_readwrite("kind", &Kazu::MistakeAnalysis::kind)
        .def_readwrite("user_digits", &Kazu::MistakeAnalysis::user_digits)
        .def_readwrite("correct_digits", &Kazu::MistakeAnalysis::correct_digits)
        .def_readwrite("place", &Kazu::MistakeAnalysis::place)
        .def_readwrite("difference", &Kazu::MistakeAnalysis::difference)

        .def("__repr__", [](const Kazu::MistakeAnalysis& a) {
            return std::string("<MistakeAnalysis ") + Kazu::mistakeKindName(a.kind) + ">";
        });

    // =========================================================================
    // NumeralEngine - 主引擎
    // =========================================================================

    py::class_<Kazu::NumeralEngine>(m, "NumeralEngine", "Numeral encoder, decoder and validator")
        .def(py::init<const Kazu::EngineConfig&>(),
            py::arg("config") = Kazu::EngineConfig(),
            "Create engine with configuration")

        .def("encode_spoken", &Kazu::NumeralEngine::EncodeSpoken,
            py::arg("value"), py::arg("language"),
            "Spoken form of a number")
        .def("encode_grouped", &Kazu::NumeralEngine::EncodeGrouped,
            py::arg("value"), py::arg("language"),
            "Grouped digit form of a number")
        .def("decode", &Kazu::NumeralEngine::Decode,
            py::arg("text"), py::arg("language"),
            "Parse spoken, digit or mixed text; None when nothing is recognized")

        .def("validate", &Kazu::NumeralEngine::Validate,
            py::arg("user_answer"), py::arg("correct_answer"),
            py::arg("language"), py::arg("correct_number"),
            "Validate an answer against the expected text and number")
        .def("validate_number", &Kazu::NumeralEngine::ValidateNumber,
            py::arg("user_answer"), py::arg("language"), py::arg("correct_number"),
            "Validate an answer against the spoken form of a number")
        .def("explain_mistake", &Kazu::NumeralEngine::ExplainMistake,
            py::arg("result"),
            "Explain why an answer was rejected")

        .def("set_threshold", &Kazu::NumeralEngine::SetThreshold,
            py::arg("threshold"),
            "Set fuzzy threshold [0, 1]; returns False if out of range")
        .def("set_verbose", &Kazu::NumeralEngine::SetVerbose,
            py::arg("verbose"),
            "Trace validation tiers to stderr")
        .def("get_config", &Kazu::NumeralEngine::GetConfig,
            "Get current configuration")

        .def("is_config_valid", &Kazu::NumeralEngine::IsConfigValid,
            "Whether the construction config was valid")
        .def("get_max_value", &Kazu::NumeralEngine::GetMaxValue,
            py::arg("language"),
            "Largest supported value for a language")
        .def("get_supported_languages", &Kazu::NumeralEngine::GetSupportedLanguages,
            "Supported languages")

        .def("__repr__", [](const Kazu::NumeralEngine& engine) {
            return "<NumeralEngine threshold=" +
                std::to_string(engine.GetConfig().fuzzy_threshold) + ">";
        });

    // =========================================================================
    // 便捷函数
    // =========================================================================

    m.def("encode_spoken", &Kazu::encodeSpoken,
        py::arg("value"), py::arg("language"));
    m.def("encode_grouped", &Kazu::encodeGrouped,
        py::arg("value"), py::arg("language"));
    m.def("decode", &Kazu::decode,
        py::arg("text"), py::arg("language"));
    m.def("validate", &Kazu::validate,
        py::arg("user_answer"), py::arg("correct_answer"),
        py::arg("language"), py::arg("correct_number"));
    m.def("explain_mistake", &Kazu::explainMistake,
        py::arg("result"));

    // =========================================================================
    // 模块级属性
    // =========================================================================

    m.attr("__version__") = "1.0.0";
}
