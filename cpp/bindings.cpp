#include <pybind11/chrono.h>
#include <pybind11/functional.h>
#include <pybind11/pybind11.h>
#include <pybind11/stl.h>
#include "engine.h"
#include "errors.h"
#include "features.h"
#include "fusion.h"
#include "log.h"
#include "rules.h"
#include "scorer.h"

namespace py = pybind11;

namespace {

using txguard::FeatureVector;

std::shared_ptr<const txguard::Scorer> wrap_scorer(py::object fn) {
    if (fn.is_none()) return nullptr;
    auto callable = fn.cast<std::function<double(const FeatureVector&)>>();
    return std::make_shared<txguard::FunctionScorer>(std::move(callable));
}

} // namespace

PYBIND11_MODULE(txguard_core, m) {
    m.doc() = "Hybrid transaction decision engine: velocity rules + model score fusion";

    auto base = py::register_exception<txguard::Error>(m, "EngineError", PyExc_RuntimeError);
    py::register_exception<txguard::InvalidTransaction>(m, "InvalidTransaction", PyExc_ValueError);
    py::register_exception<txguard::ConfigError>(m, "ConfigError", PyExc_ValueError);
    py::register_exception<txguard::StateUnavailable>(m, "StateUnavailable", base.ptr());
    py::register_exception<txguard::ScorerUnavailable>(m, "ScorerUnavailable", base.ptr());
    py::register_exception<txguard::ScorerContractViolation>(m, "ScorerContractViolation", base.ptr());
    py::register_exception<txguard::Timeout>(m, "Timeout", base.ptr());
    py::register_exception<txguard::Overloaded>(m, "Overloaded", base.ptr());

    py::enum_<txguard::Action>(m, "Action")
        .value("ALLOW", txguard::Action::Allow)
        .value("FLAG", txguard::Action::Flag)
        .value("BLOCK", txguard::Action::Block);

    py::enum_<txguard::Severity>(m, "Severity")
        .value("LOW", txguard::Severity::Low)
        .value("MEDIUM", txguard::Severity::Medium)
        .value("HIGH", txguard::Severity::High);

    py::enum_<txguard::FailurePolicy>(m, "FailurePolicy")
        .value("FAIL_OPEN", txguard::FailurePolicy::FailOpen)
        .value("FAIL_CLOSED", txguard::FailurePolicy::FailClosed);

    py::class_<txguard::Transaction>(m, "Transaction")
        .def(py::init<>())
        .def(py::init([](std::string user_id, std::string transaction_id, double amount,
                         std::string location_country, std::string transaction_time) {
                 return txguard::Transaction{std::move(user_id), std::move(transaction_id), amount,
                                             std::move(location_country), std::move(transaction_time)};
             }),
             py::arg("user_id"), py::arg("transaction_id"), py::arg("amount"),
             py::arg("location_country"), py::arg("transaction_time"))
        .def_readwrite("user_id", &txguard::Transaction::user_id)
        .def_readwrite("transaction_id", &txguard::Transaction::transaction_id)
        .def_readwrite("amount", &txguard::Transaction::amount)
        .def_readwrite("location_country", &txguard::Transaction::location_country)
        .def_readwrite("transaction_time", &txguard::Transaction::transaction_time);

    py::class_<FeatureVector>(m, "FeatureVector")
        .def(py::init<>())
        .def_readwrite("transaction_count_in_window", &FeatureVector::transaction_count_in_window)
        .def_readwrite("distinct_countries_in_window", &FeatureVector::distinct_countries_in_window)
        .def_readwrite("amount_zscore_vs_recent_avg", &FeatureVector::amount_zscore_vs_recent_avg)
        .def_readwrite("seconds_since_last_txn", &FeatureVector::seconds_since_last_txn)
        .def_readwrite("hour_of_day", &FeatureVector::hour_of_day)
        .def_readwrite("is_new_country_for_user", &FeatureVector::is_new_country_for_user)
        .def_readwrite("amount", &FeatureVector::amount)
        .def("to_list", &txguard::to_array, "Feature values in feature_names() order.");

    m.def("feature_names", &txguard::feature_names);

    py::class_<txguard::RuleHit>(m, "RuleHit")
        .def_readonly("rule_name", &txguard::RuleHit::rule_name)
        .def_readonly("severity", &txguard::RuleHit::severity)
        .def_readonly("message", &txguard::RuleHit::message);

    py::class_<txguard::Verdict>(m, "Verdict")
        .def_readonly("user_id", &txguard::Verdict::user_id)
        .def_readonly("transaction_id", &txguard::Verdict::transaction_id)
        .def_readonly("action", &txguard::Verdict::action)
        .def_readonly("reason", &txguard::Verdict::reason)
        .def_readonly("risk_score", &txguard::Verdict::risk_score)
        .def_readonly("anomaly_score", &txguard::Verdict::anomaly_score)
        .def_readonly("rule_hits", &txguard::Verdict::rule_hits)
        .def_readonly("features", &txguard::Verdict::features)
        .def_readonly("degraded", &txguard::Verdict::degraded)
        .def_readonly("warnings", &txguard::Verdict::warnings);

    py::class_<txguard::RuleConfig>(m, "RuleConfig")
        .def(py::init<>())
        .def_readwrite("velocity_threshold", &txguard::RuleConfig::velocity_threshold)
        .def_readwrite("geo_enabled", &txguard::RuleConfig::geo_enabled)
        .def_readwrite("amount_zscore_threshold", &txguard::RuleConfig::amount_zscore_threshold)
        .def_readwrite("night_start_hour", &txguard::RuleConfig::night_start_hour)
        .def_readwrite("night_end_hour", &txguard::RuleConfig::night_end_hour);

    py::class_<txguard::FusionConfig>(m, "FusionConfig")
        .def(py::init<>())
        .def_readwrite("block_threshold", &txguard::FusionConfig::block_threshold)
        .def_readwrite("flag_threshold", &txguard::FusionConfig::flag_threshold)
        .def_readwrite("anomaly_threshold", &txguard::FusionConfig::anomaly_threshold);

    py::class_<txguard::DriftConfig>(m, "DriftConfig")
        .def(py::init<>())
        .def_readwrite("means", &txguard::DriftConfig::means)
        .def_readwrite("stds", &txguard::DriftConfig::stds)
        .def_readwrite("z_threshold", &txguard::DriftConfig::z_threshold);

    py::class_<txguard::EngineConfig>(m, "EngineConfig")
        .def(py::init<>())
        .def_property(
            "window",
            [](const txguard::EngineConfig& c) { return c.velocity.window; },
            [](txguard::EngineConfig& c, std::chrono::milliseconds w) { c.velocity.window = w; })
        .def_property(
            "sweep_interval",
            [](const txguard::EngineConfig& c) { return c.velocity.sweep_interval; },
            [](txguard::EngineConfig& c, std::size_t n) { c.velocity.sweep_interval = n; })
        .def_readwrite("rules", &txguard::EngineConfig::rules)
        .def_readwrite("fusion", &txguard::EngineConfig::fusion)
        .def_readwrite("drift", &txguard::EngineConfig::drift)
        .def_readwrite("store_timeout", &txguard::EngineConfig::store_timeout)
        .def_readwrite("scorer_timeout", &txguard::EngineConfig::scorer_timeout)
        .def_readwrite("failure_policy", &txguard::EngineConfig::failure_policy)
        .def_readwrite("max_future_skew", &txguard::EngineConfig::max_future_skew)
        .def_readwrite("max_in_flight_calls", &txguard::EngineConfig::max_in_flight_calls)
        .def_readwrite("replay_capacity", &txguard::EngineConfig::replay_capacity)
        .def_readwrite("journal_capacity", &txguard::EngineConfig::journal_capacity)
        .def("validate", [](const txguard::EngineConfig& c) { txguard::validate(c); })
        .def("__repr__", [](const txguard::EngineConfig& c) { return txguard::describe(c); });

    py::class_<txguard::EngineStats>(m, "EngineStats")
        .def_readonly("decisions", &txguard::EngineStats::decisions)
        .def_readonly("replays", &txguard::EngineStats::replays)
        .def_readonly("invalid", &txguard::EngineStats::invalid)
        .def_readonly("degraded", &txguard::EngineStats::degraded)
        .def_readonly("allowed", &txguard::EngineStats::allowed)
        .def_readonly("flagged", &txguard::EngineStats::flagged)
        .def_readonly("blocked", &txguard::EngineStats::blocked);

    py::class_<txguard::DecisionEngine>(m, "Engine")
        .def(py::init([](const txguard::EngineConfig& config, py::object risk_scorer, py::object anomaly_scorer) {
                 return new txguard::DecisionEngine(config, wrap_scorer(risk_scorer), wrap_scorer(anomaly_scorer));
             }),
             py::arg("config"), py::arg("risk_scorer") = py::none(), py::arg("anomaly_scorer") = py::none(),
             "Scorers are callables taking a FeatureVector and returning a float in [0,1].")
        .def("decide", &txguard::DecisionEngine::decide, py::arg("transaction"),
             py::call_guard<py::gil_scoped_release>())
        .def("recent_decisions", &txguard::DecisionEngine::recent_decisions, py::arg("limit") = 50)
        .def("stats", &txguard::DecisionEngine::stats);

    m.def(
        "evaluate_rules",
        [](const txguard::RuleConfig& config, const FeatureVector& features) {
            return txguard::evaluate_rules(config, features);
        },
        py::arg("config"), py::arg("features"),
        "Evaluate the deterministic rules against a feature vector."
    );

    m.def(
        "fuse",
        [](const txguard::FusionConfig& config, const std::vector<txguard::RuleHit>& hits,
           double risk_score, double anomaly_score) {
            const auto r = txguard::fuse(config, hits, risk_score, anomaly_score);
            return py::make_tuple(r.action, r.reason);
        },
        py::arg("config"), py::arg("hits"), py::arg("risk_score"), py::arg("anomaly_score"),
        "Return (action, reason) from the fusion decision table."
    );

    m.def(
        "ood_warnings",
        &txguard::ood_warnings,
        py::arg("features"),
        py::arg("drift"),
        "Return list of OOD warnings based on z-score threshold."
    );

    m.def(
        "set_log_level",
        [](const std::string& name) {
            txguard::log::Level level;
            if (!txguard::log::parse_level(name, level)) throw py::value_error("unknown log level: " + name);
            txguard::log::set_level(level);
        },
        py::arg("level")
    );
}
